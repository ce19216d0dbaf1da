#include "shell_launcher.h"
#include "../daemon/supervisor.h"
#include "../shared/errors.h"
#include "../shared/logging.h"
#include "../shared/string_util.h"
#include "../shared/time_format.h"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

std::string default_base_name(const std::string& kind, const std::string& command)
{
    std::string program(basename_of(first_word(command)));
    if (program.size() > 10)
        program.resize(10);
    return program.empty() ? kind : kind + "-" + program;
}

static void write_fd(int fd, const std::string& text)
{
    size_t off = 0;
    while (off < text.size())
    {
        ssize_t n = ::write(fd, text.data() + off, text.size() - off);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_WARN(std::string("launcher: log header write failed: ") + std::strerror(errno));
            return;
        }
        off += static_cast<size_t>(n);
    }
}

// The log is opened before the pid (and so the final name) is known.
static scoped_fd open_pending_log(const fs::path& dir, const std::string& stamp, fs::path& out)
{
    static std::atomic<uint32_t> s_counter{0};

    std::error_code ec;
    fs::create_directories(dir, ec);

    for (int attempt = 0; attempt < 16; ++attempt)
    {
        out = dir / (stamp + "_pending_" + std::to_string(getpid()) + "_" +
                     std::to_string(s_counter.fetch_add(1)) + ".log");
        int fd = open(out.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_APPEND | O_CLOEXEC, 0644);
        if (fd >= 0)
            return scoped_fd(fd);
        if (errno != EEXIST)
            break;
    }

    throw process_error("cannot create log file in " + dir.string() + ": " + std::strerror(errno));
}

launch_result launch_shell(supervisor& sv, const launch_request& req)
{
    if (first_word(req.command).empty())
        throw process_error("No command specified");

    const auto& cfg = sv.config();
    auto started = std::chrono::system_clock::now();
    std::string stamp = file_timestamp(started);

    scoped_fd out;
    fs::path log_path;
    if (req.log_output)
    {
        out = open_pending_log(cfg.log_dir / req.kind, stamp, log_path);
    }
    else
    {
        out.reset(open("/dev/null", O_WRONLY | O_CLOEXEC));
        if (!out)
            throw process_error(std::string("cannot open /dev/null: ") + std::strerror(errno));
    }

    spawn_options opts;
    opts.stdout_fd = out.get();
    opts.merge_stderr = true;

    std::shared_ptr<child_process> child;
    try
    {
        child = child_process::spawn_shell(req.command, opts);
    }
    catch (const process_error&)
    {
        std::error_code ec;
        if (!log_path.empty())
            fs::remove(log_path, ec);
        throw;
    }

    launch_result res;
    res.pid = child->pid();
    std::string base = req.base_name.empty() ? default_base_name(req.kind, req.command) : req.base_name;
    res.name = base + "-" + std::to_string(res.pid);

    if (req.log_output)
    {
        fs::path final_path = log_path.parent_path() / (stamp + "_" + res.name + ".log");
        std::error_code ec;
        fs::rename(log_path, final_path, ec);
        if (ec)
            LOG_WARN("launcher: could not rename " + log_path.string() + ": " + ec.message());
        else
            log_path = final_path;

        write_fd(out.get(),
                 "=== Process: " + res.name + " ===\n"
                 "Command: " + req.command + "\n"
                 "Started: " + iso_timestamp(started) + "\n"
                 "PID: " + std::to_string(res.pid) + "\n" +
                 std::string(50, '=') + "\n");
        res.log_file = log_path;
    }

    nlohmann::json meta = {
        {"command", req.command},
        {"started", iso_timestamp(started)},
        {"type", req.kind},
        {"pid", res.pid},
        {"base_name", base},
        {"log_file", res.log_file.empty() ? nlohmann::json(nullptr) : nlohmann::json(res.log_file.string())}
    };

    sv.adopt_process(res.name, child, req.kind, std::move(meta));
    return res;
}
