#include "cli.h"
#include "ipc_client.h"
#include "../daemon/daemon.h"
#include "../shared/config.h"
#include "../shared/paths.h"
#include "../shared/string_util.h"

#include <algorithm>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

static std::filesystem::path g_socket_path;

static void print_usage()
{
    std::cerr << "usage: procvisor [--json] <command> [args...]\n"
                 "       procvisor daemon\n"
                 "       procvisor list-commands\n"
                 "       procvisor help <command>\n";
}

static bool ensure_daemon()
{
    if (socket_accepts(g_socket_path))
        return true;

    pid_t pid = fork();
    if (pid < 0)
        return false;

    if (pid == 0)
    {
        // Child: become daemon
        setsid();

        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0)
        {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > 2)
                close(devnull);
        }

        char self_exe[4096];
        ssize_t len = readlink("/proc/self/exe", self_exe, sizeof(self_exe) - 1);
        if (len > 0)
        {
            self_exe[len] = '\0';
            execl(self_exe, self_exe, "daemon", nullptr);
        }
        _exit(1);
    }

    for (int i = 0; i < 50; ++i)   // 50 * 20ms = 1s max
    {
        usleep(20000);
        if (socket_accepts(g_socket_path))
            return true;
    }

    return false;
}

int cli_daemon()
{
    return daemon_start();
}

int cli_dispatch(int argc, char** argv)
{
    int first = 1;
    bool raw_json = false;

    for (; first < argc; ++first)
    {
        std::string_view arg = argv[first];
        if (arg == "--json")
            raw_json = true;
        else if (arg == "--version" || arg == "-V")
        {
            std::cout << "procvisor " << PROCVISOR_VERSION << "\n";
            return 0;
        }
        else if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return 0;
        }
        else
            break;
    }

    if (first >= argc)
    {
        print_usage();
        return 1;
    }

    if (std::string_view(argv[first]) == "daemon")
        return cli_daemon();

    auto paths = procvisor_paths::resolve();
    g_socket_path = load_config(paths.config_path, paths).socket_path;

    // All other commands need the daemon, auto-start if not running
    if (!ensure_daemon())
    {
        std::cerr << "failed to start daemon on " << g_socket_path.string() << "\n";
        return 2;
    }

    return cli_forward(argc, argv, first, raw_json);
}

static void print_text(std::ostream& out, const nlohmann::json& value)
{
    std::string text = value.is_string() ? value.get<std::string>() : value.dump(2);
    out << text;
    if (text.empty() || text.back() != '\n')
        out << '\n';
}

int cli_forward(int argc, char** argv, int first, bool raw_json)
{
    request req;
    req.command = argv[first];
    for (int i = first + 1; i < argc; ++i)
        req.args.emplace_back(argv[i]);

    nlohmann::json response;
    std::string error;
    if (ipc_send(g_socket_path, req, response, error) < 0)
    {
        std::cerr << "failed to talk to daemon: " << error << "\n";
        return 2;
    }

    bool ok = response.value("success", false);

    if (raw_json)
    {
        std::cout << response.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return ok ? 0 : 1;
    }

    if (!ok)
    {
        if (response.contains("error"))
            print_text(std::cerr, response["error"]);
        else if (response.contains("message"))
            print_text(std::cerr, response["message"]);
        else
            std::cerr << "command failed\n";
        return 1;
    }

    for (const char* key : {"output", "message", "help"})
    {
        if (response.contains(key))
        {
            print_text(std::cout, response[key]);
            return 0;
        }
    }

    if (response.contains("commands") && response["commands"].is_object())
    {
        for (auto it = response["commands"].begin(); it != response["commands"].end(); ++it)
        {
            std::string name = it.key();
            name.resize(std::max<size_t>(name.size(), 20), ' ');
            std::cout << "  " << name << "  "
                      << (it.value().is_string() ? it.value().get<std::string>() : "") << "\n";
        }
        return 0;
    }

    std::cout << response.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return 0;
}
