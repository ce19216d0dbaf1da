#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "test_support.h"
#include "../../procvisor/commands/log_tail.h"
#include "../../procvisor/commands/shell_launcher.h"
#include "../../procvisor/daemon/supervisor.h"

#include <chrono>
#include <iterator>
#include <thread>

using namespace std::chrono_literals;

static std::string read_file(const std::filesystem::path& p)
{
    std::ifstream in(p);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static bool wait_for_text(const std::filesystem::path& file, const std::string& text)
{
    for (int i = 0; i < 250; ++i)
    {
        if (read_file(file).find(text) != std::string::npos)
            return true;
        std::this_thread::sleep_for(20ms);
    }
    return false;
}

static bool starts_with(const std::string& s, const std::string& prefix)
{
    return s.rfind(prefix, 0) == 0;
}

TEST_CASE("tail_lines")
{
    temp_dir dir;

    auto f = dir.write("a.log", "one\ntwo\n\nfour\nfive\n");
    CHECK((tail_lines(f, 2) == std::vector<std::string>{"four", "five"}));
    CHECK((tail_lines(f, 3) == std::vector<std::string>{"", "four", "five"}));
    CHECK(tail_lines(f, 100).size() == 5);
    CHECK(tail_lines(f, 0).empty());

    auto g = dir.write("b.log", "no newline at end");
    CHECK((tail_lines(g, 5) == std::vector<std::string>{"no newline at end"}));

    CHECK(tail_lines(dir.path() / "missing.log", 5).empty());

    std::string big;
    for (int i = 0; i < 20000; ++i)
        big += "line " + std::to_string(i) + "\n";
    auto h = dir.write("big.log", big);
    auto last = tail_lines(h, 3);
    CHECK((last == std::vector<std::string>{"line 19997", "line 19998", "line 19999"}));
}

TEST_CASE("default_base_name")
{
    CHECK(default_base_name("bash", "sleep 30") == "bash-sleep");
    CHECK(default_base_name("bash", "  /usr/bin/python3-something x.py") == "bash-python3-so");
    CHECK(default_base_name("bash", "") == "bash");
}

TEST_CASE("bash command")
{
    temp_dir dir;
    supervisor sv(test_config(dir.path()));
    sv.register_commands();

    SUBCASE("missing command is a usage error")
    {
        auto r = sv.execute({"bash", {}});
        CHECK(r["success"] == false);
        std::string err = r["error"];
        CHECK(starts_with(err, "Invalid arguments: the following arguments are required: command"));
        CHECK(err.find("procvisor help bash") != std::string::npos);
    }

    SUBCASE("blank command")
    {
        auto r = sv.execute({"bash", {"   "}});
        CHECK(r["error"] == "Failed to start process: No command specified");
    }

    SUBCASE("start writes a log with a header")
    {
        auto r = sv.execute({"bash", {"echo hello"}});
        REQUIRE(r["success"] == true);

        std::string name = r["name"];
        int pid = r["pid"];
        CHECK(name == "bash-echo-" + std::to_string(pid));
        CHECK(r["message"].get<std::string>().find("Started bash process \"" + name + "\" with PID") == 0);

        auto rec = sv.processes().get(name);
        REQUIRE(rec);
        CHECK(rec->kind == "bash");
        CHECK(rec->metadata["type"] == "bash");
        CHECK(rec->metadata["base_name"] == "bash-echo");

        std::filesystem::path log = rec->metadata["log_file"].get<std::string>();
        CHECK(log.parent_path() == sv.config().log_dir / "bash");
        CHECK(log.filename().string().find("_" + name + ".log") != std::string::npos);
        CHECK(r["message"].get<std::string>().find("Log file: " + log.filename().string()) != std::string::npos);

        REQUIRE(sv.processes().handle(name)->wait_for(5s) == 0);
        std::string text = read_file(log);
        CHECK(starts_with(text, "=== Process: " + name + " ===\nCommand: echo hello\n"));
        CHECK(text.find(std::string(50, '=') + "\nhello\n") != std::string::npos);
    }

    SUBCASE("no-log")
    {
        auto r = sv.execute({"bash", {"true", "--no-log", "-n", "quiet"}});
        REQUIRE(r["success"] == true);
        CHECK(starts_with(r["name"].get<std::string>(), "quiet-"));
        CHECK(r["message"].get<std::string>().find("Log file") == std::string::npos);
        CHECK(sv.processes().get(r["name"].get<std::string>())->metadata["log_file"].is_null());
    }
}

TEST_CASE("bash-status")
{
    temp_dir dir;
    supervisor sv(test_config(dir.path()));
    sv.register_commands();

    CHECK(sv.execute({"bash-status", {}})["output"] == "No bash processes found");
    CHECK(sv.execute({"bash-status", {"ghost"}})["error"] == "No bash process found with name: ghost");
    CHECK(sv.execute({"bash-status", {"ghost", "--all"}})["error"] == "No process found with name: ghost");

    std::string ok = sv.execute({"bash", {"exit 0", "-n", "ok"}})["name"];
    std::string bad = sv.execute({"bash", {"exit 3", "-n", "bad"}})["name"];
    std::string slow = sv.execute({"bash", {"sleep 30", "-n", "slow"}})["name"];
    REQUIRE(sv.processes().handle(ok)->wait_for(5s));
    REQUIRE(sv.processes().handle(bad)->wait_for(5s));

    auto r = sv.execute({"bash-status", {}});
    REQUIRE(r["success"] == true);
    std::string out = r["output"];
    CHECK(out.find("[" + ok + "] SUCCESS (") != std::string::npos);
    CHECK(out.find("[" + bad + "] FAILED (3) (") != std::string::npos);
    CHECK(out.find("[" + slow + "] RUNNING (pid: ") != std::string::npos);
    CHECK(out.find("  Log: ") != std::string::npos);

    CHECK(r["processes"][bad]["status"] == "exited");
    CHECK(r["processes"][bad]["exit_code"] == 3);
    CHECK(r["processes"][slow]["status"] == "running");

    // exit is recorded in the table metadata on first observation
    CHECK(sv.processes().get(bad)->metadata["exit_code"] == 3);

    auto one = sv.execute({"bash-status", {slow}});
    CHECK(one["processes"].size() == 1);
}

TEST_CASE("bash-stop")
{
    temp_dir dir;
    supervisor sv(test_config(dir.path()));
    sv.register_commands();

    CHECK(sv.execute({"bash-stop", {}})["error"] == "No process name specified");
    CHECK(sv.execute({"bash-stop", {"ghost"}})["error"] == "Process \"ghost\" not found");

    sv.adopt_process("agent-1", child_process::spawn({"/bin/sleep", "30"}), "claude", {});
    CHECK(sv.execute({"bash-stop", {"agent-1"}})["error"] == "\"agent-1\" is not a bash process");
    CHECK(sv.processes().contains("agent-1"));

    std::string name = sv.execute({"bash", {"sleep 30"}})["name"];
    auto r = sv.execute({"bash-stop", {name}});
    CHECK(r["success"] == true);
    CHECK(starts_with(r["message"].get<std::string>(), "Stopped bash process \"" + name + "\""));
    CHECK_FALSE(sv.processes().contains(name));
}

TEST_CASE("bash-watch")
{
    temp_dir dir;
    supervisor sv(test_config(dir.path()));
    sv.register_commands();

    CHECK(sv.execute({"bash-watch", {"ghost"}})["error"] == "Process \"ghost\" not found");

    SUBCASE("running process shows output without the header")
    {
        std::string name = sv.execute({"bash", {"echo line1; echo line2; sleep 30"}})["name"];
        auto log = sv.processes().get(name)->metadata["log_file"].get<std::string>();
        REQUIRE(wait_for_text(log, "line2\n"));

        auto r = sv.execute({"bash-watch", {name}});
        CHECK(r["output"] == "=== Output from " + name + " (last 2 lines) ===\nline1\nline2");

        auto one = sv.execute({"bash-watch", {name, "--lines", "1"}});
        CHECK(one["output"] == "=== Output from " + name + " (last 1 lines) ===\nline2");

        CHECK(sv.execute({"bash-watch", {name, "-l", "0"}})["success"] == false);
    }

    SUBCASE("running process without output yet")
    {
        std::string name = sv.execute({"bash", {"sleep 30"}})["name"];
        CHECK(sv.execute({"bash-watch", {name}})["output"] == "No output yet from process \"" + name + "\"");
    }

    SUBCASE("stopped process reports its exit code")
    {
        std::string name = sv.execute({"bash", {"exit 5"}})["name"];
        REQUIRE(sv.processes().handle(name)->wait_for(5s));
        CHECK(sv.execute({"bash-watch", {name}})["output"] ==
              "Process \"" + name + "\" has stopped with return code 5");
    }

    SUBCASE("process started without a log")
    {
        std::string name = sv.execute({"bash", {"sleep 30", "--no-log"}})["name"];
        CHECK(sv.execute({"bash-watch", {name}})["success"] == false);
    }
}
