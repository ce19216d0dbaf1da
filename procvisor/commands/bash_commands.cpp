#include "command_plugin.h"
#include "log_tail.h"
#include "shell_launcher.h"
#include "../daemon/supervisor.h"
#include "../shared/errors.h"
#include "../shared/string_util.h"
#include "../shared/time_format.h"

#include <algorithm>
#include <chrono>

namespace {

constexpr const char* separator_line = "==================================================";

std::shared_ptr<const arg_schema> bash_schema()
{
    auto s = std::make_shared<arg_schema>("procvisor bash", "Execute a shell command as a managed process");
    s->positional("command", "Shell command to execute")
      .option("--name", "-n", "Process name (auto-generated if not specified)")
      .flag("--no-log", "", "Disable logging to file");
    return s;
}

std::shared_ptr<const arg_schema> bash_status_schema()
{
    auto s = std::make_shared<arg_schema>("procvisor bash-status", "Check status of bash processes");
    s->positional("name", "Name of the process (optional, shows all if omitted)", false)
      .flag("--all", "-a", "Show all processes, not just bash");
    return s;
}

std::shared_ptr<const arg_schema> bash_stop_schema()
{
    auto s = std::make_shared<arg_schema>("procvisor bash-stop", "Stop a running bash process by name");
    s->positional("name", "Name of the process to stop");
    return s;
}

std::shared_ptr<const arg_schema> bash_watch_schema()
{
    auto s = std::make_shared<arg_schema>("procvisor bash-watch", "Watch output from a bash process");
    s->positional("name", "Name of the process to watch")
      .option("--lines", "-l", "Number of lines to show (default: 50)", "50");
    return s;
}

nlohmann::json cmd_bash(supervisor& sv, const std::vector<std::string>& args)
{
    static const auto schema = bash_schema();
    auto parsed = parse_plugin_args(*schema, args);

    launch_request req;
    req.command = parsed.value_or("command", "");
    req.base_name = parsed.value_or("name", "");
    req.kind = "bash";
    req.log_output = !parsed.flag("no-log");

    launch_result res;
    try
    {
        res = launch_shell(sv, req);
    }
    catch (const process_error& e)
    {
        return make_error(std::string("Failed to start process: ") + e.what());
    }

    std::string message = "Started bash process \"" + res.name + "\" with PID " + std::to_string(res.pid);
    if (!res.log_file.empty())
        message += "\nLog file: " + res.log_file.filename().string();

    return {{"success", true}, {"pid", res.pid}, {"name", res.name}, {"message", message}};
}

nlohmann::json cmd_bash_status(supervisor& sv, const std::vector<std::string>& args)
{
    static const auto schema = bash_status_schema();
    auto parsed = parse_plugin_args(*schema, args);

    std::string target = parsed.value_or("name", "");
    bool show_all = parsed.flag("all");
    const char* scope = show_all ? "" : "bash ";

    sv.processes().refresh_exit_states();
    auto records = show_all ? sv.processes().list_all()
                            : sv.processes().list_all(process_table::of_kind("bash"));

    nlohmann::json status = nlohmann::json::object();
    std::vector<std::string> lines;
    auto now = std::chrono::system_clock::now();

    for (const auto& r : records)
    {
        if (!target.empty() && r.name != target)
            continue;

        std::string base = metadata_string(r.metadata, "base_name");
        std::string log_file = metadata_string(r.metadata, "log_file");

        nlohmann::json p = {
            {"command", metadata_string(r.metadata, "command")},
            {"started", iso_timestamp(r.started)},
            {"base_name", base.empty() ? r.name : base},
            {"log_file", log_file.empty() ? nlohmann::json(nullptr) : nlohmann::json(log_file)}
        };

        if (r.running())
        {
            std::string duration = format_elapsed(r.started, now);
            p["status"] = "running";
            p["pid"] = r.pid;
            p["duration"] = duration;
            lines.push_back("[" + r.name + "] RUNNING (pid: " + std::to_string(r.pid) + ", " + duration + ")");
        }
        else
        {
            auto ended = r.ended.value_or(now);
            std::string duration = format_elapsed(r.started, ended);
            int code = *r.exit_code;
            p["status"] = "exited";
            p["exit_code"] = code;
            p["ended"] = iso_timestamp(ended);
            p["duration"] = duration;
            std::string outcome = code == 0 ? "SUCCESS" : "FAILED (" + std::to_string(code) + ")";
            lines.push_back("[" + r.name + "] " + outcome + " (" + duration + ")");
        }

        if (!log_file.empty())
            lines.push_back("  Log: " + std::string(basename_of(log_file)));

        status[r.name] = std::move(p);
    }

    if (!target.empty() && status.empty())
        return make_error(std::string("No ") + scope + "process found with name: " + target);

    if (status.empty())
        return {{"success", true}, {"output", std::string("No ") + scope + "processes found"}};

    return {{"success", true}, {"output", join(lines, "\n")}, {"processes", std::move(status)}};
}

nlohmann::json cmd_bash_stop(supervisor& sv, const std::vector<std::string>& args)
{
    if (args.empty())
        return make_error("No process name specified");

    const std::string& name = args[0];
    auto record = sv.processes().get(name);
    if (!record)
        return make_error("Process \"" + name + "\" not found");
    if (record->kind != "bash")
        return make_error("\"" + name + "\" is not a bash process");

    bool killed = sv.stop_process(name);

    std::string message = "Stopped bash process \"" + name + "\"";
    if (killed)
        message += " (killed after ignoring SIGTERM)";
    return make_success(message);
}

nlohmann::json cmd_bash_watch(supervisor& sv, const std::vector<std::string>& args)
{
    static const auto schema = bash_watch_schema();
    auto parsed = parse_plugin_args(*schema, args);

    std::string name = parsed.value_or("name", "");
    long long count = parsed.get_int("lines", 50);
    if (count <= 0)
        return make_error("--lines must be a positive number");

    auto record = sv.processes().get(name);
    if (!record)
        return make_error("Process \"" + name + "\" not found");

    if (!record->running())
    {
        return {{"success", true},
                {"output", "Process \"" + name + "\" has stopped with return code " +
                           std::to_string(*record->exit_code)}};
    }

    std::string log_file = metadata_string(record->metadata, "log_file");
    if (log_file.empty())
        return make_error("Process \"" + name + "\" was started without a log file");

    // one extra line so a log still inside its header can be detected
    auto lines = tail_lines(log_file, static_cast<size_t>(count) + 1);
    auto sep = std::find(lines.begin(), lines.end(), separator_line);
    if (sep != lines.end())
        lines.erase(lines.begin(), sep + 1);
    if (lines.size() > static_cast<size_t>(count))
        lines.erase(lines.begin(), lines.end() - count);

    if (lines.empty())
        return {{"success", true}, {"output", "No output yet from process \"" + name + "\""}};

    return {{"success", true},
            {"output", "=== Output from " + name + " (last " + std::to_string(lines.size()) + " lines) ===\n" +
                       join(lines, "\n")}};
}

}

std::vector<command_plugin> bash_plugins()
{
    return {
        {"bash", "Execute a bash command as a managed process", bash_schema(), &cmd_bash},
        {"bash-status", "Check status of bash processes", bash_status_schema(), &cmd_bash_status},
        {"bash-stop", "Stop a bash process", bash_stop_schema(), &cmd_bash_stop},
        {"bash-watch", "Watch output of a bash process", bash_watch_schema(), &cmd_bash_watch},
    };
}
