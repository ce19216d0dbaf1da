#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "test_support.h"
#include "../../procvisor/daemon/supervisor.h"
#include "../../procvisor/shared/errors.h"
#include "../../procvisor/shared/pid_file.h"

#include <atomic>
#include <chrono>
#include <iterator>
#include <thread>
#include <sys/socket.h>

using namespace std::chrono_literals;

// Runs one connection through handle_connection on a socketpair.
class loopback
{
public:
    explicit loopback(supervisor& sv)
    {
        int fds[2];
        REQUIRE(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0);
        m_client.reset(fds[0]);
        m_client.set_io_timeout(10s);
        m_server = std::thread([&sv, fd = fds[1]] { sv.handle_connection(scoped_fd(fd)); });
    }

    ~loopback()
    {
        m_client.reset();
        if (m_server.joinable())
            m_server.join();
    }

    int fd() const { return m_client.get(); }

    nlohmann::json framed(const request& req)
    {
        framed_codec codec(fd(), default_max_message_size);
        codec.write_message(serialize(to_json(req)));
        return nlohmann::json::parse(codec.read_message());
    }

    // Legacy responses are delimited by the server closing the connection.
    std::string read_to_eof()
    {
        std::string out;
        char buf[4096];
        ssize_t n;
        while ((n = recv(fd(), buf, sizeof(buf), 0)) > 0)
            out.append(buf, static_cast<size_t>(n));
        m_server.join();
        return out;
    }

private:
    scoped_fd m_client;
    std::thread m_server;
};

static bool wait_for_text(const std::filesystem::path& file, const std::string& text)
{
    for (int i = 0; i < 250; ++i)
    {
        std::ifstream in(file);
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (content.find(text) != std::string::npos)
            return true;
        std::this_thread::sleep_for(20ms);
    }
    return false;
}

TEST_CASE("supervisor over the wire")
{
    temp_dir dir;
    supervisor sv(test_config(dir.path()));
    sv.register_commands();

    SUBCASE("status with no processes")
    {
        loopback c(sv);
        auto r = c.framed({"status", {}});
        CHECK(r.dump() == R"({"processes":{},"success":true})");
    }

    SUBCASE("unknown command")
    {
        loopback c(sv);
        auto r = c.framed({"bogus", {}});
        CHECK(r["success"] == false);
        CHECK(r["error"] == "Unknown command: bogus");
    }

    SUBCASE("handler throwing a non-exception type")
    {
        sv.commands().register_command("throws-int", [](supervisor&, const std::vector<std::string>&) -> nlohmann::json {
            throw 7;
        }, "Throws an int");

        loopback c(sv);
        auto r = c.framed({"throws-int", {}});
        CHECK(r["success"] == false);
        CHECK(r["error"] == "Command 'throws-int' failed with an unknown exception");

        loopback after(sv);
        CHECK(after.framed({"status", {}})["success"] == true);
    }

    SUBCASE("legacy client")
    {
        loopback c(sv);
        write_all(c.fd(), R"({"command":"status","args":[]})");
        auto r = nlohmann::json::parse(c.read_to_eof());
        CHECK(r["success"] == true);
        CHECK(r["processes"].empty());
    }

    SUBCASE("framed garbage gets a framed error")
    {
        loopback c(sv);
        framed_codec codec(c.fd(), default_max_message_size);
        codec.write_message("this is not json");
        auto r = nlohmann::json::parse(codec.read_message());
        CHECK(r["success"] == false);
        CHECK(r["error"] == "request is not valid JSON");
    }

    SUBCASE("short write then half-close")
    {
        loopback c(sv);
        write_all(c.fd(), "{\"co");
        shutdown(c.fd(), SHUT_WR);
        auto r = nlohmann::json::parse(c.read_to_eof());
        CHECK(r["success"] == false);
    }

    SUBCASE("client that connects and leaves")
    {
        {
            loopback c(sv);
        }
        loopback c(sv);
        CHECK(c.framed({"status", {}})["success"] == true);
    }
}

TEST_CASE("supervisor built-in commands")
{
    temp_dir dir;
    supervisor sv(test_config(dir.path()));
    sv.register_commands();

    SUBCASE("list-commands")
    {
        auto r = sv.execute({"list-commands", {}});
        CHECK(r["success"] == true);
        for (const char* name : {"status", "list-commands", "help", "shutdown", "restart-manager",
                                 "bash", "bash-status", "bash-stop", "bash-watch",
                                 "runner", "runner-status", "pid", "tokens", "streamfile"})
        {
            CAPTURE(name);
            CHECK(r["commands"].contains(name));
        }
    }

    SUBCASE("help")
    {
        CHECK(sv.execute({"help", {}})["error"] == "Please specify a command name");
        CHECK(sv.execute({"help", {"bogus"}})["error"] == "Unknown command: bogus");

        auto r = sv.execute({"help", {"bash"}});
        CHECK(r["success"] == true);
        std::string text = r["help"];
        CHECK(text.find("usage: procvisor bash") != std::string::npos);
        CHECK(r["schema"]["prog"] == "procvisor bash");

        // built-ins have no schema
        CHECK_FALSE(sv.execute({"help", {"status"}}).contains("schema"));
    }

    SUBCASE("restart-manager without a launcher parent")
    {
        auto r = sv.execute({"restart-manager", {}});
        CHECK(r["success"] == false);
        CHECK(r["error"].get<std::string>().find("launch.sh") != std::string::npos);
    }

    SUBCASE("pid")
    {
        CHECK(sv.execute({"pid", {}})["success"] == false);

        REQUIRE(write_pid_file(sv.config().pid_file));
        auto r = sv.execute({"pid", {}});
        CHECK(r["success"] == true);
        CHECK(r["message"] == std::to_string(getpid()));

        auto j = sv.execute({"pid", {"--json"}});
        CHECK(nlohmann::json::parse(j["message"].get<std::string>())["pid"] == getpid());

        remove_pid_file(sv.config().pid_file);
    }

    SUBCASE("shutdown stops everything")
    {
        auto started = sv.execute({"bash", {"sleep 30", "--no-log"}});
        REQUIRE(started["success"] == true);
        CHECK(sv.processes().size() == 1);

        auto r = sv.execute({"shutdown", {}});
        CHECK(r["message"] == "Shutdown initiated");
        CHECK_FALSE(sv.running());
        CHECK(sv.processes().size() == 0);
    }
}

TEST_CASE("supervisor process lifecycle")
{
    temp_dir dir;
    supervisor sv(test_config(dir.path()));
    sv.register_commands();

    SUBCASE("status reports running and exited processes")
    {
        REQUIRE(sv.execute({"bash", {"exit 4", "--name", "quick"}})["success"] == true);
        REQUIRE(sv.execute({"bash", {"sleep 30", "--name", "slow"}})["success"] == true);

        auto quick = sv.processes().list_all([](const process_record& r) { return r.name.rfind("quick-", 0) == 0; });
        REQUIRE(quick.size() == 1);
        REQUIRE(sv.processes().handle(quick[0].name)->wait_for(5s));

        auto r = sv.execute({"status", {}});
        REQUIRE(r["processes"].size() == 2);
        for (auto it = r["processes"].begin(); it != r["processes"].end(); ++it)
        {
            const auto& p = it.value();
            if (it.key().rfind("quick-", 0) == 0)
            {
                CHECK(p["status"] == "stopped");
                CHECK(p["return_code"] == 4);
            }
            else
            {
                CHECK(p["status"] == "running");
                CHECK(p["command"] == "sleep 30");
            }
        }
    }

    SUBCASE("stop escalates to SIGKILL and removes the entry")
    {
        auto r = sv.execute({"bash", {"trap '' TERM; echo ready; sleep 30", "--name", "stubborn"}});
        REQUIRE(r["success"] == true);
        std::string name = r["name"];

        auto log_file = sv.processes().get(name)->metadata["log_file"].get<std::string>();
        REQUIRE(wait_for_text(log_file, "\nready\n"));

        auto handle = sv.processes().handle(name);
        auto start = std::chrono::steady_clock::now();
        CHECK(sv.stop_process(name));
        CHECK(std::chrono::steady_clock::now() - start < 5s);

        CHECK_FALSE(sv.processes().contains(name));
        CHECK_FALSE(handle->running());
        CHECK_THROWS_AS(sv.stop_process(name), not_found_error);
    }

    SUBCASE("concurrent adoption under one name")
    {
        auto a = child_process::spawn({"/bin/sleep", "30"});
        auto b = child_process::spawn({"/bin/sleep", "30"});
        std::atomic<int> ok{0};
        std::atomic<int> dup{0};

        auto adopt = [&](std::shared_ptr<child_process> h) {
            try
            {
                sv.adopt_process("shared-name", h, "bash", {{"command", "sleep 30"}});
                ++ok;
            }
            catch (const duplicate_name_error&)
            {
                ++dup;
            }
        };

        std::thread t1(adopt, a);
        std::thread t2(adopt, b);
        t1.join();
        t2.join();

        CHECK(ok == 1);
        CHECK(dup == 1);
        CHECK(sv.processes().size() == 1);

        auto winner = sv.processes().handle("shared-name");
        auto loser = winner == a ? b : a;
        CHECK(winner->running());
        CHECK_FALSE(loser->running());
    }

    SUBCASE("concurrent clients racing for one name")
    {
        sv.commands().register_command("adopt-fixed", [](supervisor& s, const std::vector<std::string>&) -> nlohmann::json {
            auto h = child_process::spawn({"/bin/sleep", "30"});
            s.adopt_process("fixed-name", h, "bash", {{"command", "sleep 30"}});
            return {{"success", true}, {"pid", h->pid()}};
        }, "Adopts a child under a fixed name");

        loopback c1(sv);
        loopback c2(sv);
        nlohmann::json r1, r2;

        std::thread t1([&] { r1 = c1.framed({"adopt-fixed", {}}); });
        std::thread t2([&] { r2 = c2.framed({"adopt-fixed", {}}); });
        t1.join();
        t2.join();

        REQUIRE(r1["success"].is_boolean());
        REQUIRE(r2["success"].is_boolean());
        CHECK(r1["success"] != r2["success"]);

        const auto& lost = r1["success"] == true ? r2 : r1;
        CHECK(lost["error"].get<std::string>().rfind("Process name already registered", 0) == 0);

        CHECK(sv.processes().size() == 1);
        CHECK(sv.processes().contains("fixed-name"));
        CHECK(sv.processes().handle("fixed-name")->running());
    }
}
