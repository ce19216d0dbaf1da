#pragma once

#include <sol/sol.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class supervisor;
class arg_schema;

// A command implemented by a Lua file in the plugin directory. Each file
// gets its own interpreter; calls into it are serialized.
//
//   help = "Say hello"
//   function schema() return { {name = "who", help = "Who to greet"} } end
//   function command(supervisor, args)
//       return { success = true, message = "hello " .. (args[1] or "world") }
//   end
class lua_plugin
{
public:
    // Throws plugin_load_error.
    static std::unique_ptr<lua_plugin> load(const std::filesystem::path& path, supervisor& sv);

    const std::string& name() const { return m_name; }
    const std::string& help() const { return m_help; }
    const std::filesystem::path& path() const { return m_path; }
    std::shared_ptr<const arg_schema> schema() const { return m_schema; }

    // Throws procvisor_error on a Lua error or a non-table result.
    nlohmann::json invoke(supervisor& sv, const std::vector<std::string>& args);

private:
    lua_plugin(std::filesystem::path path, std::string name);

    void register_bindings(supervisor& sv);
    void read_schema();

    std::filesystem::path m_path;
    std::string m_name;
    std::string m_help;
    std::shared_ptr<const arg_schema> m_schema;

    std::mutex m_mutex;
    sol::state m_lua;
    sol::protected_function m_command;
    sol::table m_supervisor;
};

// Loads every *.lua in dir (files starting with '_' are skipped). A file that
// fails to load is logged and skipped.
std::vector<std::unique_ptr<lua_plugin>> load_lua_plugins(const std::filesystem::path& dir, supervisor& sv);

nlohmann::json lua_to_json(const sol::object& obj, int depth = 0);
sol::object json_to_lua(sol::state_view lua, const nlohmann::json& j);
