#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "test_support.h"
#include "../../procvisor/daemon/command_registry.h"
#include "../../procvisor/daemon/supervisor.h"
#include "../../procvisor/shared/errors.h"

static nlohmann::json reply(const char* text)
{
    return {{"success", true}, {"message", text}};
}

TEST_CASE("command_registry registration")
{
    temp_dir dir;
    supervisor sv(test_config(dir.path()));

    SUBCASE("override replaces the handler")
    {
        command_registry reg(overwrite_policy::override_existing);
        CHECK(reg.register_command("greet", [](supervisor&, const std::vector<std::string>&) { return reply("first"); },
                                   "Say hi", nullptr, command_origin::builtin));
        CHECK(reg.register_command("greet", [](supervisor&, const std::vector<std::string>&) { return reply("second"); },
                                   "Say hi again"));

        CHECK(reg.size() == 1);
        CHECK(reg.dispatch(sv, "greet", {})["message"] == "second");
        CHECK(reg.find("greet")->help == "Say hi again");
        CHECK(reg.find("greet")->origin == command_origin::plugin);
    }

    SUBCASE("reject keeps the first handler")
    {
        command_registry reg(overwrite_policy::reject);
        CHECK(reg.register_command("greet", [](supervisor&, const std::vector<std::string>&) { return reply("first"); }, "Say hi"));
        CHECK_FALSE(reg.register_command("greet", [](supervisor&, const std::vector<std::string>&) { return reply("second"); }, "x"));

        CHECK(reg.dispatch(sv, "greet", {})["message"] == "first");
    }

    SUBCASE("missing help gets a default")
    {
        command_registry reg;
        reg.register_command("quiet", [](supervisor&, const std::vector<std::string>&) { return reply("ok"); }, "");
        CHECK(reg.find("quiet")->help == "Command: quiet");
    }

    SUBCASE("list is sorted")
    {
        command_registry reg;
        auto h = [](supervisor&, const std::vector<std::string>&) { return reply("ok"); };
        reg.register_command("zz", h, "last");
        reg.register_command("aa", h, "first");

        auto l = reg.list();
        REQUIRE(l.size() == 2);
        CHECK(l[0].first == "aa");
        CHECK(l[0].second == "first");
        CHECK(l[1].first == "zz");
    }
}

TEST_CASE("command_registry dispatch")
{
    temp_dir dir;
    supervisor sv(test_config(dir.path()));
    command_registry reg;

    reg.register_command("boom", [](supervisor&, const std::vector<std::string>&) -> nlohmann::json {
        throw std::runtime_error("kaboom");
    }, "Always fails");

    reg.register_command("odd-throw", [](supervisor&, const std::vector<std::string>&) -> nlohmann::json {
        throw 42;
    }, "Throws a non-exception type");

    reg.register_command("echo", [](supervisor&, const std::vector<std::string>& args) -> nlohmann::json {
        return {{"args", args}};
    }, "Echo arguments");

    reg.register_command("scalar", [](supervisor&, const std::vector<std::string>&) -> nlohmann::json {
        return 42;
    }, "Returns a number");

    SUBCASE("unknown command throws")
    {
        CHECK_THROWS_AS(reg.dispatch(sv, "bogus", {}), unknown_command_error);
        try
        {
            reg.dispatch(sv, "bogus", {});
        }
        catch (const unknown_command_error& e)
        {
            CHECK(std::string(e.what()) == "Unknown command: bogus");
        }
    }

    SUBCASE("handler exception becomes a failure response")
    {
        auto r = reg.dispatch(sv, "boom", {});
        CHECK(r["success"] == false);
        CHECK(r["error"] == "kaboom");
    }

    SUBCASE("non-standard exception becomes a failure response")
    {
        nlohmann::json r;
        CHECK_NOTHROW(r = reg.dispatch(sv, "odd-throw", {}));
        CHECK(r["success"] == false);
        CHECK(r["error"] == "Command 'odd-throw' failed with an unknown exception");
    }

    SUBCASE("missing success is filled in")
    {
        auto r = reg.dispatch(sv, "echo", {"a", "b"});
        CHECK(r["success"] == true);
        CHECK(r["args"].size() == 2);
    }

    SUBCASE("non-object result is a failure")
    {
        auto r = reg.dispatch(sv, "scalar", {});
        CHECK(r["success"] == false);
        CHECK(r.contains("error"));
    }
}
