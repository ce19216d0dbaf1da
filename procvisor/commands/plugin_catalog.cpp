#include "command_plugin.h"
#include "../shared/errors.h"

std::vector<command_plugin> compiled_plugins()
{
    std::vector<command_plugin> out;
    for (auto* group : {&bash_plugins, &runner_plugins, &pid_plugins, &session_plugins})
    {
        for (auto& p : (*group)())
            out.push_back(std::move(p));
    }
    return out;
}

parsed_command parse_plugin_args(const arg_schema& schema, const std::vector<std::string>& args)
{
    try
    {
        return schema.parse(args);
    }
    catch (const usage_error& e)
    {
        std::string cmd = schema.prog();
        if (auto sp = cmd.find(' '); sp != std::string::npos)
            cmd = cmd.substr(sp + 1);
        throw usage_error(std::string("Invalid arguments: ") + e.what() +
                          ". Use \"procvisor help " + cmd + "\" for usage.");
    }
}
