#include "daemon.h"
#include "supervisor.h"
#include "../cli/ipc_client.h"
#include "../shared/config.h"
#include "../shared/event_loop.h"
#include "../shared/logging.h"
#include "../shared/paths.h"
#include "../shared/pid_file.h"
#include "../shared/time_format.h"

#include <csignal>
#include <unistd.h>

static int g_signal_write_fd = -1;

static void signal_handler(int)
{
    if (g_signal_write_fd >= 0)
    {
        char c = 1;
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-result"
        write(g_signal_write_fd, &c, 1);
#pragma GCC diagnostic pop
    }
}

static void open_log_file(const supervisor_config& cfg)
{
    if (!cfg.log_to_file)
        return;

    std::error_code ec;
    std::filesystem::create_directories(cfg.log_dir, ec);

    auto path = cfg.log_dir / ("procvisor_" + file_timestamp(std::chrono::system_clock::now()) + ".log");
    if (logger::open_file(path.string()))
        LOG_INFO("logging to " + path.string());
    else
        LOG_WARN("could not open log file " + path.string());
}

static bool already_running(const supervisor_config& cfg)
{
    if (auto pid = read_pid_file(cfg.pid_file); pid && *pid != getpid())
    {
        LOG_INFO("supervisor already running (pid " + std::to_string(*pid) + ")");
        return true;
    }

    if (socket_accepts(cfg.socket_path))
    {
        LOG_INFO("supervisor already listening on " + cfg.socket_path.string());
        return true;
    }

    return false;
}

int daemon_start()
{
    auto paths = procvisor_paths::resolve();

    // Config first: it sets the log level for everything after
    supervisor_config cfg = load_config(paths.config_path, paths);
    logger::g_level = cfg.level;

    // A second instance exits quietly
    if (already_running(cfg))
        return 0;

    open_log_file(cfg);

    event_loop loop;
    if (!loop.init())
    {
        LOG_ERROR("failed to init event loop");
        logger::close_file();
        return 1;
    }

    {
        supervisor sv(std::move(cfg));
        sv.register_commands();

        if (!sv.setup(loop))
        {
            LOG_ERROR("failed to setup ipc socket");
            logger::close_file();
            return 1;
        }

        g_signal_write_fd = loop.wake_fd();

        // Broken connections surface as EPIPE from send(MSG_NOSIGNAL)
        signal(SIGPIPE, SIG_IGN);

        struct sigaction sa{};
        sa.sa_handler = signal_handler;
        sigemptyset(&sa.sa_mask);

        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
        sigaction(SIGHUP, &sa, nullptr);

        LOG_INFO("daemon started (pid " + std::to_string(getpid()) + ")");

        sv.run();
        sv.teardown();

        g_signal_write_fd = -1;
    }

    LOG_INFO("daemon stopped");
    logger::close_file();

    return 0;
}
