#include "pid_file.h"
#include "logging.h"

#include <cerrno>
#include <charconv>
#include <csignal>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

bool process_alive(pid_t pid)
{
    if (pid <= 0)
        return false;
    // EPERM still means the pid exists
    return kill(pid, 0) == 0 || errno == EPERM;
}

bool write_pid_file(const fs::path& path)
{
    std::error_code ec;
    if (path.has_parent_path())
        fs::create_directories(path.parent_path(), ec);

    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out)
            return false;
        out << getpid() << '\n';
        if (!out.flush())
            return false;
    }

    fs::rename(tmp, path, ec);
    if (ec)
    {
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

static std::optional<pid_t> parse_pid(const fs::path& path)
{
    std::ifstream in(path);
    if (!in)
        return std::nullopt;

    std::string text;
    std::getline(in, text);

    pid_t pid = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), pid);
    if (ec != std::errc() || pid <= 0)
        return std::nullopt;
    return pid;
}

std::optional<pid_t> read_pid_file(const fs::path& path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
        return std::nullopt;

    auto pid = parse_pid(path);
    if (pid && process_alive(*pid))
        return pid;

    LOG_DEBUG("removing stale pid file " + path.string());
    fs::remove(path, ec);
    return std::nullopt;
}

void remove_pid_file(const fs::path& path)
{
    auto pid = parse_pid(path);
    if (pid && *pid != getpid())
    {
        LOG_WARN("pid file " + path.string() + " belongs to pid " + std::to_string(*pid) + ", leaving it");
        return;
    }

    std::error_code ec;
    fs::remove(path, ec);
}
