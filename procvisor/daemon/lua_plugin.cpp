#include "lua_plugin.h"
#include "supervisor.h"
#include "../commands/arg_schema.h"
#include "../commands/shell_launcher.h"
#include "../shared/errors.h"
#include "../shared/logging.h"
#include "../shared/string_util.h"
#include "../shared/time_format.h"

#include <algorithm>
#include <cmath>
#include <unistd.h>

namespace fs = std::filesystem;

constexpr int max_table_depth = 32;

// ─── conversion ───

nlohmann::json lua_to_json(const sol::object& obj, int depth)
{
    if (depth > max_table_depth)
        throw procvisor_error("table nesting too deep (cycle?)");

    switch (obj.get_type())
    {
        case sol::type::lua_nil:
        case sol::type::none:
            return nullptr;

        case sol::type::boolean:
            return obj.as<bool>();

        case sol::type::number:
        {
            double d = obj.as<double>();
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e15)
                return static_cast<int64_t>(d);
            return d;
        }

        case sol::type::string:
            return obj.as<std::string>();

        case sol::type::table:
        {
            sol::table t = obj.as<sol::table>();

            // 1..n with no holes is an array; anything else is an object
            size_t count = 0;
            bool sequence = true;
            t.for_each([&](sol::object k, sol::object) {
                ++count;
                if (k.get_type() != sol::type::number)
                    sequence = false;
            });
            if (sequence && count > 0)
            {
                for (size_t i = 1; i <= count; ++i)
                {
                    sol::object v = t[i];
                    if (!v.valid() || v.get_type() == sol::type::lua_nil)
                    {
                        sequence = false;
                        break;
                    }
                }
            }

            if (sequence && count > 0)
            {
                nlohmann::json arr = nlohmann::json::array();
                for (size_t i = 1; i <= count; ++i)
                {
                    sol::object v = t[i];
                    arr.push_back(lua_to_json(v, depth + 1));
                }
                return arr;
            }

            nlohmann::json out = nlohmann::json::object();
            t.for_each([&](sol::object k, sol::object v) {
                std::string key;
                if (k.get_type() == sol::type::string)
                    key = k.as<std::string>();
                else if (k.get_type() == sol::type::number)
                    key = lua_to_json(k, depth + 1).dump();
                else
                    return;
                out[key] = lua_to_json(v, depth + 1);
            });
            return out;
        }

        default:
            // functions, userdata and threads have no JSON form
            return nullptr;
    }
}

sol::object json_to_lua(sol::state_view lua, const nlohmann::json& j)
{
    switch (j.type())
    {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return sol::make_object(lua, sol::lua_nil);
        case nlohmann::json::value_t::boolean:
            return sol::make_object(lua, j.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return sol::make_object(lua, j.get<int64_t>());
        case nlohmann::json::value_t::number_unsigned:
            return sol::make_object(lua, static_cast<double>(j.get<uint64_t>()));
        case nlohmann::json::value_t::number_float:
            return sol::make_object(lua, j.get<double>());
        case nlohmann::json::value_t::string:
            return sol::make_object(lua, j.get<std::string>());
        case nlohmann::json::value_t::array:
        {
            sol::table t = lua.create_table(static_cast<int>(j.size()), 0);
            int i = 1;
            for (const auto& v : j)
                t[i++] = json_to_lua(lua, v);
            return t;
        }
        case nlohmann::json::value_t::object:
        {
            sol::table t = lua.create_table(0, static_cast<int>(j.size()));
            for (auto it = j.begin(); it != j.end(); ++it)
                t[it.key()] = json_to_lua(lua, it.value());
            return t;
        }
        default:
            return sol::make_object(lua, sol::lua_nil);
    }
}

// ─── plugin ───

lua_plugin::lua_plugin(fs::path path, std::string name)
    : m_path(std::move(path)), m_name(std::move(name))
{
}

std::unique_ptr<lua_plugin> lua_plugin::load(const fs::path& path, supervisor& sv)
{
    std::unique_ptr<lua_plugin> p(new lua_plugin(path, command_name_from_stem(path.stem().string())));

    p->m_lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::table,
                            sol::lib::math, sol::lib::os);
    p->register_bindings(sv);

    auto result = p->m_lua.safe_script_file(path.string(), sol::script_pass_on_error);
    if (!result.valid())
    {
        sol::error err = result;
        throw plugin_load_error(path.filename().string() + ": " + err.what());
    }

    sol::object fn = p->m_lua["command"];
    if (fn.get_type() != sol::type::function)
        throw plugin_load_error(path.filename().string() + ": no command(supervisor, args) function");
    p->m_command = fn.as<sol::protected_function>();

    sol::optional<std::string> help = p->m_lua["help"];
    p->m_help = help && !help->empty() ? *help : "Command: " + p->m_name;

    p->read_schema();
    return p;
}

void lua_plugin::read_schema()
{
    sol::object fn = m_lua["schema"];
    if (fn.get_type() != sol::type::function)
        return;

    sol::protected_function schema_fn = fn.as<sol::protected_function>();
    sol::protected_function_result r = schema_fn();
    if (!r.valid())
    {
        sol::error err = r;
        LOG_WARN("lua: " + m_name + ": schema() failed: " + err.what());
        return;
    }

    sol::object ret = r.get<sol::object>();
    if (ret.get_type() != sol::type::table)
    {
        LOG_WARN("lua: " + m_name + ": schema() must return a table");
        return;
    }

    auto schema = std::make_shared<arg_schema>("procvisor " + m_name, m_help);
    sol::table entries = ret.as<sol::table>();
    for (size_t i = 1; i <= entries.size(); ++i)
    {
        sol::optional<sol::table> e = entries[i];
        if (!e)
            continue;

        std::string name = e->get_or<std::string>("name", "");
        std::string help = e->get_or<std::string>("help", "");
        std::string short_name = e->get_or<std::string>("short", "");
        if (name.empty())
            continue;

        if (name[0] != '-')
            schema->positional(name, help, e->get_or("required", true));
        else if (e->get_or("flag", false))
            schema->flag(name, short_name, help);
        else
            schema->option(name, short_name, help, e->get_or<std::string>("default", ""));
    }
    m_schema = std::move(schema);
}

void lua_plugin::register_bindings(supervisor& sv)
{
    sol::table t = m_lua.create_table();
    const std::string tag = "lua:" + m_name;

    t["log"] = [tag](std::string msg) {
        LOG_INFO(tag + ": " + msg);
    };

    t["pid"] = []() -> int {
        return static_cast<int>(getpid());
    };

    // supervisor.status() → same payload as the status command
    t["status"] = [&sv, this]() -> sol::object {
        return json_to_lua(m_lua, sv.execute(request{"status", {}}));
    };

    // supervisor.processes(kind?) → array of {name, kind, pid, running, exit_code, metadata}
    t["processes"] = [&sv, this](sol::optional<std::string> kind) -> sol::table {
        sol::table out = m_lua.create_table();
        auto records = kind ? sv.processes().list_all(process_table::of_kind(*kind))
                            : sv.processes().list_all();
        int i = 1;
        for (const auto& r : records)
        {
            nlohmann::json j = {
                {"name", r.name}, {"kind", r.kind}, {"pid", r.pid}, {"running", r.running()},
                {"started", iso_timestamp(r.started)}, {"metadata", r.metadata}
            };
            if (r.exit_code)
                j["exit_code"] = *r.exit_code;
            out[i++] = json_to_lua(m_lua, j);
        }
        return out;
    };

    // supervisor.start(command, name?, kind?) → {name, pid, log_file}
    t["start"] = [&sv, this](std::string command, sol::optional<std::string> name,
                             sol::optional<std::string> kind) -> sol::table {
        launch_request req;
        req.command = std::move(command);
        req.base_name = name.value_or("");
        req.kind = kind.value_or(m_name);
        launch_result res = launch_shell(sv, req);

        sol::table out = m_lua.create_table();
        out["name"] = res.name;
        out["pid"] = static_cast<int>(res.pid);
        if (!res.log_file.empty())
            out["log_file"] = res.log_file.string();
        return out;
    };

    // supervisor.stop(name) → true if it had to be killed
    t["stop"] = [&sv](std::string name) -> bool {
        return sv.stop_process(name);
    };

    // supervisor.update(name, table) merges into the process metadata
    t["update"] = [&sv](std::string name, sol::table patch) {
        sv.processes().update_metadata(name, lua_to_json(patch));
    };

    m_supervisor = t;
    m_lua["supervisor"] = t;
}

nlohmann::json lua_plugin::invoke(supervisor&, const std::vector<std::string>& args)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    sol::table arg_table = m_lua.create_table(static_cast<int>(args.size()), 0);
    for (size_t i = 0; i < args.size(); ++i)
        arg_table[i + 1] = args[i];

    sol::protected_function_result r = m_command(m_supervisor, arg_table);
    if (!r.valid())
    {
        sol::error err = r;
        throw procvisor_error(std::string("Lua error in ") + m_name + ": " + err.what());
    }

    sol::object ret = r.get<sol::object>();
    if (ret.get_type() != sol::type::table)
        throw procvisor_error("Command '" + m_name + "' must return a table");

    return lua_to_json(ret);
}

std::vector<std::unique_ptr<lua_plugin>> load_lua_plugins(const fs::path& dir, supervisor& sv)
{
    std::vector<std::unique_ptr<lua_plugin>> out;

    std::error_code ec;
    if (dir.empty() || !fs::is_directory(dir, ec))
    {
        LOG_DEBUG("lua: no plugin directory at " + dir.string());
        return out;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir, ec))
    {
        const fs::path& p = entry.path();
        if (p.extension() != ".lua" || !entry.is_regular_file(ec))
            continue;
        if (p.filename().string().rfind('_', 0) == 0)
            continue;
        files.push_back(p);
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files)
    {
        try
        {
            out.push_back(lua_plugin::load(file, sv));
        }
        catch (const plugin_load_error& e)
        {
            LOG_WARN(std::string("lua: skipping plugin ") + e.what());
        }
        catch (const sol::error& e)
        {
            LOG_WARN("lua: skipping plugin " + file.filename().string() + ": " + e.what());
        }
    }

    return out;
}
