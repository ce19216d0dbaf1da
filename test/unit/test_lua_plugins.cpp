#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "test_support.h"
#include "../../procvisor/daemon/lua_plugin.h"
#include "../../procvisor/daemon/supervisor.h"
#include "../../procvisor/shared/errors.h"

#include <chrono>

using namespace std::chrono_literals;

TEST_CASE("lua plugins are discovered and dispatched")
{
    temp_dir dir;
    auto cfg = test_config(dir.path());

    dir.write("commands/say_hello.lua", R"(
help = "Greet someone"

function schema()
    return {
        { name = "who", help = "Who to greet", required = false },
        { name = "--shout", short = "-s", help = "Use capitals", flag = true },
    }
end

function command(supervisor, args)
    local who = args[1] or "world"
    return { success = true, message = "hello " .. who, count = #args, pid = supervisor.pid() }
end
)");

    dir.write("commands/broken.lua", "function command(supervisor, args) return 'oops' end");
    dir.write("commands/raises.lua", "function command(supervisor, args) error('bad things') end");
    dir.write("commands/syntax.lua", "function command(");
    dir.write("commands/no_command.lua", "help = 'nothing here'");
    dir.write("commands/_private.lua", "function command() return { success = true } end");
    dir.write("commands/status.lua",
              "function command() return { success = true, message = 'plugin status' } end");
    dir.write("commands/notes.txt", "not a plugin");

    SUBCASE("default policy lets a plugin override a built-in")
    {
        supervisor sv(cfg);
        sv.register_commands();

        auto r = sv.execute({"say-hello", {"lua"}});
        CHECK(r["success"] == true);
        CHECK(r["message"] == "hello lua");
        CHECK(r["count"] == 1);
        CHECK(r["pid"] == getpid());

        auto help = sv.execute({"help", {"say-hello"}});
        std::string text = help["help"];
        CHECK(text.rfind("Greet someone", 0) == 0);
        CHECK(text.find("-s, --shout") != std::string::npos);

        CHECK(sv.execute({"status", {}})["message"] == "plugin status");

        auto bad = sv.execute({"broken", {}});
        CHECK(bad["success"] == false);
        CHECK(bad["error"] == "Command 'broken' must return a table");

        auto raised = sv.execute({"raises", {}});
        CHECK(raised["success"] == false);
        CHECK(raised["error"].get<std::string>().find("bad things") != std::string::npos);

        CHECK_FALSE(sv.commands().contains("syntax"));
        CHECK_FALSE(sv.commands().contains("no-command"));
        CHECK_FALSE(sv.commands().contains("_private"));
        CHECK_FALSE(sv.commands().contains("-private"));
        CHECK(sv.commands().find("say-hello")->origin == command_origin::script);
    }

    SUBCASE("reject policy keeps the built-in")
    {
        cfg.command_overwrite = overwrite_policy::reject;
        supervisor sv(cfg);
        sv.register_commands();

        auto r = sv.execute({"status", {}});
        CHECK(r["success"] == true);
        CHECK(r.contains("processes"));
        CHECK(sv.commands().contains("say-hello"));
    }
}

TEST_CASE("lua plugins manage processes")
{
    temp_dir dir;
    auto cfg = test_config(dir.path());

    dir.write("commands/worker.lua", R"(
help = "Start, tag, list and stop a worker"

function command(supervisor, args)
    local action = args[1]
    if action == "start" then
        local p = supervisor.start("sleep 30", "worker")
        supervisor.update(p.name, { owner = "lua", attempts = 2 })
        return { success = true, name = p.name, pid = p.pid }
    elseif action == "list" then
        local names = {}
        for i, p in ipairs(supervisor.processes("worker")) do
            names[i] = p.name .. ":" .. p.metadata.owner
        end
        return { success = true, names = names }
    elseif action == "stop" then
        supervisor.stop(args[2])
        return { success = true }
    elseif action == "status" then
        local s = supervisor.status()
        local n = 0
        for _ in pairs(s.processes) do n = n + 1 end
        return { success = true, count = n }
    end
    return { success = false, error = "unknown action" }
end
)");

    supervisor sv(cfg);
    sv.register_commands();

    auto started = sv.execute({"worker", {"start"}});
    REQUIRE(started["success"] == true);
    std::string name = started["name"];
    CHECK(name.rfind("worker-", 0) == 0);

    auto rec = sv.processes().get(name);
    REQUIRE(rec);
    CHECK(rec->kind == "worker");
    CHECK(rec->metadata["owner"] == "lua");
    CHECK(rec->metadata["attempts"] == 2);

    auto listed = sv.execute({"worker", {"list"}});
    REQUIRE(listed["names"].is_array());
    CHECK(listed["names"][0] == name + ":lua");

    CHECK(sv.execute({"worker", {"status"}})["count"] == 1);

    CHECK(sv.execute({"worker", {"stop", name}})["success"] == true);
    CHECK_FALSE(sv.processes().contains(name));

    auto again = sv.execute({"worker", {"stop", name}});
    CHECK(again["success"] == false);

    CHECK(sv.execute({"worker", {"bogus"}})["error"] == "unknown action");
}

TEST_CASE("lua and json conversion")
{
    sol::state lua;
    lua.open_libraries(sol::lib::base);

    auto j = nlohmann::json::parse(R"({"a":[1,2,3],"b":{"c":"d"},"e":true,"f":1.5,"g":null})");
    lua["value"] = json_to_lua(lua, j);

    CHECK(lua.script("return value.a[2]").get<int>() == 2);
    CHECK(lua.script("return value.b.c").get<std::string>() == "d");

    sol::object back = lua["value"];
    auto round = lua_to_json(back);
    CHECK(round["a"] == nlohmann::json::array({1, 2, 3}));
    CHECK(round["b"]["c"] == "d");
    CHECK(round["e"] == true);
    CHECK(round["f"] == 1.5);
    CHECK_FALSE(round.contains("g"));

    sol::object empty = lua.script("return {}");
    CHECK(lua_to_json(empty) == nlohmann::json::object());

    sol::object holes = lua.script("return {[1]='a', [3]='c'}");
    CHECK(lua_to_json(holes).is_object());

    lua.script("cyclic = {}; cyclic.self = cyclic");
    sol::object cyclic = lua["cyclic"];
    CHECK_THROWS_AS(lua_to_json(cyclic), procvisor_error);
}
