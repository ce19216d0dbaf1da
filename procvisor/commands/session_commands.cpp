#include "command_plugin.h"
#include "session_files.h"
#include "../daemon/supervisor.h"
#include "../shared/time_format.h"

#include <chrono>

namespace fs = std::filesystem;

namespace {

std::shared_ptr<const arg_schema> tokens_schema()
{
    auto s = std::make_shared<arg_schema>("procvisor tokens",
        "Show context window usage of the latest agent conversation for a directory");
    s->flag("--json", "", "Output in JSON format");
    s->option("--dir", "-d", "Project directory (default: the supervisor's working directory)");
    return s;
}

std::shared_ptr<const arg_schema> streamfile_schema()
{
    auto s = std::make_shared<arg_schema>("procvisor streamfile",
        "Show agent conversation transcript paths for a directory");
    s->flag("--all", "", "Show all transcripts with timestamps");
    s->option("--dir", "-d", "Project directory (default: the supervisor's working directory)");
    return s;
}

fs::path project_dir_arg(const parsed_command& parsed)
{
    if (auto dir = parsed.get("dir"))
        return fs::absolute(*dir);
    return fs::current_path();
}

nlohmann::json cmd_tokens(supervisor& sv, const std::vector<std::string>& args)
{
    static const auto schema = tokens_schema();
    auto parsed = parse_plugin_args(*schema, args);

    auto files = list_session_files(session_project_dir(sv.config().agent_home, project_dir_arg(parsed)));
    if (files.empty())
        return make_error("No Claude Code conversation found for this directory");

    auto usage = last_usage(files.back().path);
    if (!usage)
        return make_success("No token usage data found for current conversation.");

    auto stats = context_usage::from_usage(*usage);
    nlohmann::json out = make_success(parsed.flag("json") ? stats.to_json().dump(2) : stats.render());
    out["usage"] = stats.to_json();
    out["stream_file"] = files.back().path.string();
    return out;
}

nlohmann::json cmd_streamfile(supervisor& sv, const std::vector<std::string>& args)
{
    static const auto schema = streamfile_schema();
    auto parsed = parse_plugin_args(*schema, args);

    auto files = list_session_files(session_project_dir(sv.config().agent_home, project_dir_arg(parsed)));
    if (files.empty())
        return make_error("No Claude Code stream files found for this directory");

    if (!parsed.flag("all"))
        return make_success(fs::absolute(files.back().path).string());

    std::string out;
    for (const auto& f : files)
    {
        if (!out.empty())
            out += '\n';
        out += format_local_time(std::chrono::system_clock::from_time_t(f.modified), "%Y-%m-%d %H:%M:%S");
        out += '\t';
        out += fs::absolute(f.path).string();
    }
    return make_success(out);
}

}

std::vector<command_plugin> session_plugins()
{
    return {
        {"tokens", "Show token usage for the latest agent conversation", tokens_schema(), &cmd_tokens},
        {"streamfile", "Show agent conversation stream file paths", streamfile_schema(), &cmd_streamfile},
    };
}
