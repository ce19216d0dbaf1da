#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../shared/config.h"

class supervisor;
class arg_schema;

// Every command, built-in or plugin, is called the same way.
using command_handler = std::function<nlohmann::json(supervisor&, const std::vector<std::string>&)>;

enum class command_origin : uint8_t
{
    builtin,
    plugin,     // compiled in
    script      // Lua file from the plugin directory
};

const char* origin_name(command_origin origin);

struct command_entry
{
    command_handler handler;
    std::string help;
    std::shared_ptr<const arg_schema> schema;
    command_origin origin = command_origin::plugin;
};

// Populated once at startup, read-only afterwards; lookups take no lock.
class command_registry
{
public:
    explicit command_registry(overwrite_policy policy = overwrite_policy::override_existing);

    // false when the name exists and the policy is reject.
    bool register_command(std::string name, command_handler handler, std::string help,
                          std::shared_ptr<const arg_schema> schema = nullptr,
                          command_origin origin = command_origin::plugin);

    // Throws unknown_command_error. Anything the handler throws comes back as
    // {"success": false, "error": what()}.
    nlohmann::json dispatch(supervisor& sv, std::string_view name,
                            const std::vector<std::string>& args) const;

    const command_entry* find(std::string_view name) const;
    bool contains(std::string_view name) const { return find(name) != nullptr; }

    // name -> help, sorted by name
    std::vector<std::pair<std::string, std::string>> list() const;
    size_t size() const { return m_commands.size(); }

    overwrite_policy policy() const { return m_policy; }
    void set_policy(overwrite_policy policy) { m_policy = policy; }

private:
    overwrite_policy m_policy;
    std::map<std::string, command_entry, std::less<>> m_commands;
};
