#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include "../../procvisor/shared/config.h"

// mkdtemp-backed directory removed with everything in it on scope exit
class temp_dir
{
public:
    temp_dir()
    {
        std::string tmpl = (std::filesystem::temp_directory_path() / "procvisor-test-XXXXXX").string();
        char* p = mkdtemp(tmpl.data());
        if (p)
            m_path = p;
    }

    ~temp_dir()
    {
        std::error_code ec;
        if (!m_path.empty())
            std::filesystem::remove_all(m_path, ec);
    }

    temp_dir(const temp_dir&) = delete;
    temp_dir& operator=(const temp_dir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    std::filesystem::path write(const std::string& name, const std::string& content) const
    {
        auto file = m_path / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream(file) << content;
        return file;
    }

private:
    std::filesystem::path m_path;
};

inline supervisor_config test_config(const std::filesystem::path& root)
{
    procvisor_paths paths;
    paths.state_dir = root;
    paths.log_dir = root / "logs";
    paths.pid_file = root / "procvisor.pid";
    paths.plugin_dir = root / "commands";
    paths.socket_path = root / "procvisor.sock";
    paths.agent_home = root / "agent";

    supervisor_config cfg = supervisor_config::defaults(paths);
    cfg.termination_timeout = std::chrono::milliseconds(500);
    cfg.detect_timeout = std::chrono::milliseconds(100);
    cfg.read_timeout = std::chrono::milliseconds(2000);
    cfg.socket_timeout = std::chrono::milliseconds(100);
    cfg.log_to_file = false;
    cfg.level = log_error;
    return cfg;
}
