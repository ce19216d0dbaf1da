#include "config.h"
#include "errors.h"
#include "string_util.h"

#include <fstream>
#include <limits>
#include <sol/sol.hpp>

supervisor_config supervisor_config::defaults(const procvisor_paths& paths)
{
    supervisor_config cfg;
    cfg.socket_path = paths.socket_path;
    cfg.pid_file    = paths.pid_file;
    cfg.state_dir   = paths.state_dir;
    cfg.log_dir     = paths.log_dir;
    cfg.plugin_dir  = paths.plugin_dir;
    cfg.agent_home  = paths.agent_home;
    return cfg;
}

namespace {

// Millisecond values end up in poll(2) and timespec fields as int.
constexpr int64_t max_millis = std::numeric_limits<int32_t>::max();
constexpr uint64_t max_size = uint64_t(1) << 40;

class config_reader
{
public:
    explicit config_reader(sol::table table) : m_table(std::move(table)) {}

    void read_string(const char* key, std::string& out)
    {
        sol::object obj = m_table[key];
        if (!obj.valid())
            return;
        if (obj.get_type() != sol::type::string)
            return type_mismatch(key, "string");
        out = obj.as<std::string>();
    }

    void read_path(const char* key, std::filesystem::path& out)
    {
        std::string value;
        read_string(key, value);
        if (!value.empty())
            out = value;
    }

    void read_bool(const char* key, bool& out)
    {
        sol::object obj = m_table[key];
        if (!obj.valid())
            return;
        if (obj.get_type() != sol::type::boolean)
            return type_mismatch(key, "boolean");
        out = obj.as<bool>();
    }

    void read_millis(const char* key, std::chrono::milliseconds& out)
    {
        sol::object obj = m_table[key];
        if (!obj.valid())
            return;
        if (obj.get_type() != sol::type::number)
            return type_mismatch(key, "number");
        auto ms = obj.as<double>();
        if (!(ms > 0))
            throw config_error(std::string("config: ") + key + " must be positive");
        if (ms > max_millis)
            throw config_error(std::string("config: ") + key + " must not exceed " + std::to_string(max_millis));
        out = std::chrono::milliseconds(static_cast<int64_t>(ms));
    }

    void read_size(const char* key, uint64_t& out)
    {
        sol::object obj = m_table[key];
        if (!obj.valid())
            return;
        if (obj.get_type() != sol::type::number)
            return type_mismatch(key, "number");
        auto n = obj.as<double>();
        if (!(n >= 1))
            throw config_error(std::string("config: ") + key + " must be at least 1");
        if (n > static_cast<double>(max_size))
            throw config_error(std::string("config: ") + key + " must not exceed " + std::to_string(max_size));
        out = static_cast<uint64_t>(n);
    }

private:
    [[noreturn]] static void type_mismatch(const char* key, const char* expected)
    {
        throw config_error(std::string("config: ") + key + " must be a " + expected);
    }

    sol::table m_table;
};

}

supervisor_config load_config(const std::filesystem::path& path, const procvisor_paths& paths)
{
    supervisor_config cfg = supervisor_config::defaults(paths);

    if (path.empty())
        return cfg;

    std::ifstream check(path);
    if (!check.good())
        return cfg;
    check.close();

    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::os);

    auto result = lua.safe_script_file(path.string(), sol::script_pass_on_error);
    if (!result.valid())
    {
        sol::error err = result;
        LOG_WARN(std::string("config: error loading ") + path.string() + ": " + err.what() +
                 " (using defaults)");
        return cfg;
    }

    sol::optional<sol::table> table = lua["config"];
    if (!table)
    {
        LOG_WARN("config: no 'config' table defined, using defaults");
        return cfg;
    }

    config_reader reader(*table);

    // A bad value only costs that one key its override.
    auto guarded = [](auto&& read)
    {
        try
        {
            read();
        }
        catch (const config_error& e)
        {
            LOG_WARN(std::string(e.what()) + ", keeping default");
        }
    };

    guarded([&] { reader.read_path("socket_path", cfg.socket_path); });
    guarded([&] { reader.read_path("pid_file", cfg.pid_file); });
    guarded([&] { reader.read_path("plugin_dir", cfg.plugin_dir); });
    guarded([&] { reader.read_path("agent_home", cfg.agent_home); });

    std::filesystem::path state_dir;
    guarded([&] { reader.read_path("state_dir", state_dir); });
    if (!state_dir.empty())
    {
        // pid file and logs follow the state dir unless set explicitly
        bool default_pid = cfg.pid_file == paths.pid_file;
        cfg.state_dir = state_dir;
        cfg.log_dir = state_dir / "logs";
        if (default_pid)
            cfg.pid_file = state_dir / "procvisor.pid";
    }

    guarded([&] { reader.read_millis("socket_timeout_ms", cfg.socket_timeout); });
    guarded([&] { reader.read_millis("detect_timeout_ms", cfg.detect_timeout); });
    guarded([&] { reader.read_millis("read_timeout_ms", cfg.read_timeout); });
    guarded([&] { reader.read_millis("termination_timeout_ms", cfg.termination_timeout); });
    guarded([&] { reader.read_size("max_message_size", cfg.max_message_size); });

    std::string level;
    guarded([&] { reader.read_string("log_level", level); });
    if (!level.empty() && !parse_log_level(level, cfg.level))
        LOG_WARN("config: unknown log_level '" + level + "', keeping default");

    guarded([&] { reader.read_bool("log_to_file", cfg.log_to_file); });

    std::string overwrite;
    guarded([&] { reader.read_string("command_overwrite", overwrite); });
    switch (fnv1a(overwrite))
    {
        case fnv1a(""):
            break;
        case fnv1a("override"):
            cfg.command_overwrite = overwrite_policy::override_existing;
            break;
        case fnv1a("reject"):
            cfg.command_overwrite = overwrite_policy::reject;
            break;
        default:
            LOG_WARN("config: command_overwrite must be 'override' or 'reject', keeping default");
            break;
    }

    guarded([&] { reader.read_string("launcher_name", cfg.launcher_name); });
    guarded([&] { reader.read_string("agent_command", cfg.agent_command); });
    guarded([&] { reader.read_bool("agent_skip_permissions", cfg.agent_skip_permissions); });

    return cfg;
}
