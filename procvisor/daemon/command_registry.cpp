#include "command_registry.h"
#include "../shared/errors.h"
#include "../shared/logging.h"
#include "../shared/wire_codec.h"

const char* origin_name(command_origin origin)
{
    switch (origin)
    {
        case command_origin::builtin: return "builtin";
        case command_origin::plugin:  return "plugin";
        case command_origin::script:  return "script";
    }
    return "unknown";
}

command_registry::command_registry(overwrite_policy policy)
    : m_policy(policy)
{
}

bool command_registry::register_command(std::string name, command_handler handler, std::string help,
                                        std::shared_ptr<const arg_schema> schema, command_origin origin)
{
    if (name.empty() || !handler)
        return false;

    auto it = m_commands.find(name);
    if (it != m_commands.end())
    {
        if (m_policy == overwrite_policy::reject)
        {
            LOG_WARN("command '" + name + "' already registered (" + origin_name(it->second.origin) +
                     "), rejecting " + origin_name(origin) + " registration");
            return false;
        }
        LOG_WARN("command '" + name + "' (" + origin_name(it->second.origin) + ") overridden by " +
                 origin_name(origin) + " registration");
    }

    if (help.empty())
        help = "Command: " + name;

    m_commands[std::move(name)] = command_entry{std::move(handler), std::move(help), std::move(schema), origin};
    return true;
}

nlohmann::json command_registry::dispatch(supervisor& sv, std::string_view name,
                                          const std::vector<std::string>& args) const
{
    const command_entry* entry = find(name);
    if (!entry)
        throw unknown_command_error(name);

    nlohmann::json result;
    try
    {
        result = entry->handler(sv, args);
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("command '" + std::string(name) + "' failed: " + e.what());
        return make_error(e.what());
    }
    catch (...)
    {
        LOG_ERROR("command '" + std::string(name) + "' threw a non-standard exception");
        return make_error("Command '" + std::string(name) + "' failed with an unknown exception");
    }

    if (!result.is_object())
    {
        LOG_ERROR("command '" + std::string(name) + "' returned a non-object result");
        return make_error("Command '" + std::string(name) + "' returned an invalid response");
    }

    if (!result.contains("success") || !result["success"].is_boolean())
        result["success"] = !result.contains("error");

    return result;
}

const command_entry* command_registry::find(std::string_view name) const
{
    auto it = m_commands.find(name);
    return it == m_commands.end() ? nullptr : &it->second;
}

std::vector<std::pair<std::string, std::string>> command_registry::list() const
{
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(m_commands.size());
    for (const auto& [name, entry] : m_commands)
        out.emplace_back(name, entry.help);
    return out;
}
