#include "command_plugin.h"
#include "../daemon/supervisor.h"
#include "../shared/pid_file.h"

namespace {

std::shared_ptr<const arg_schema> pid_schema()
{
    auto s = std::make_shared<arg_schema>("procvisor pid", "Show the PID of the running supervisor");
    s->flag("--json", "", "Output in JSON format");
    return s;
}

nlohmann::json cmd_pid(supervisor& sv, const std::vector<std::string>& args)
{
    static const auto schema = pid_schema();
    auto parsed = parse_plugin_args(*schema, args);

    auto pid = read_pid_file(sv.config().pid_file);
    if (!pid)
        return make_error("No supervisor PID found or supervisor not running");

    if (parsed.flag("json"))
        return {{"success", true}, {"pid", *pid}, {"message", nlohmann::json{{"pid", *pid}}.dump(2)}};

    return {{"success", true}, {"pid", *pid}, {"message", std::to_string(*pid)}};
}

}

std::vector<command_plugin> pid_plugins()
{
    return {
        {"pid", "Show the PID of the running supervisor", pid_schema(), &cmd_pid},
    };
}
