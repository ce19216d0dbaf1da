#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "logging.h"
#include "paths.h"

// What happens when a command name is registered twice (e.g. a plugin
// shadowing a built-in).
enum class overwrite_policy : uint8_t
{
    override_existing,
    reject
};

struct supervisor_config
{
    std::filesystem::path socket_path;
    std::filesystem::path pid_file;
    std::filesystem::path state_dir;
    std::filesystem::path log_dir;
    std::filesystem::path plugin_dir;
    std::filesystem::path agent_home;

    std::chrono::milliseconds socket_timeout{1000};        // accept loop poll interval
    std::chrono::milliseconds detect_timeout{100};         // protocol detection peek
    std::chrono::milliseconds read_timeout{5000};          // steady-state socket I/O
    std::chrono::milliseconds termination_timeout{5000};   // SIGTERM -> SIGKILL grace

    uint64_t max_message_size = 10'000'000;

    log_level level = log_info;
    bool log_to_file = true;

    overwrite_policy command_overwrite = overwrite_policy::override_existing;

    std::string launcher_name = "launch.sh";
    std::string agent_command = "claude";
    bool agent_skip_permissions = true;

    static supervisor_config defaults(const procvisor_paths& paths);
};

// Evaluates config.lua on top of the defaults. Never fails: a missing file
// yields the defaults, a broken file or a mistyped key is logged and the
// affected values keep their defaults.
supervisor_config load_config(const std::filesystem::path& path, const procvisor_paths& paths);
