#pragma once
#include <filesystem>
#include <string>

struct procvisor_paths
{
    std::filesystem::path socket_path;
    std::filesystem::path pid_file;
    std::filesystem::path state_dir;     // pid file and logs/
    std::filesystem::path log_dir;       // daemon log + per-process logs
    std::filesystem::path plugin_dir;    // *.lua command plugins
    std::filesystem::path config_path;   // config.lua
    std::filesystem::path agent_home;    // ~/.claude: agent session transcripts

    static procvisor_paths resolve();
};
