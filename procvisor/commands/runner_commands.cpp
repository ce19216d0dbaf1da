#include "agent_stream.h"
#include "command_plugin.h"
#include "log_tail.h"
#include "../daemon/supervisor.h"
#include "../shared/errors.h"
#include "../shared/logging.h"
#include "../shared/string_util.h"
#include "../shared/time_format.h"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* runner_kind = "claude";

std::shared_ptr<const arg_schema> runner_schema()
{
    auto s = std::make_shared<arg_schema>("procvisor runner", "Execute the agent CLI as a managed process");
    s->positional("prompt", "The prompt to send to the agent")
      .option("--context-file", "-c", "File to prepend to the prompt")
      .option("--report", "-r", "Request the agent to write a report to this file")
      .option("--name", "-n", "Process name (auto-generated if not specified)")
      .option("--model", "-m", "Model to use")
      .flag("--no-permissions", "", "Disable --dangerously-skip-permissions flag");
    return s;
}

std::shared_ptr<const arg_schema> runner_status_schema()
{
    auto s = std::make_shared<arg_schema>("procvisor runner-status", "Show detailed status of agent runner processes");
    s->option("--name", "", "Show status for specific runner only")
      .flag("--json", "", "Output in JSON format");
    return s;
}

nlohmann::json optional_string(const std::optional<std::string>& v)
{
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

// ─── stream reader ───

struct runner_job
{
    std::string name;
    std::shared_ptr<child_process> handle;
    scoped_fd output;
    fs::path stream_log;
    fs::path report_log;
    nlohmann::json report;
    std::chrono::milliseconds exit_wait;
};

void publish(supervisor& sv, const std::string& name, const nlohmann::json& patch)
{
    try
    {
        sv.processes().update_metadata(name, patch);
    }
    catch (const not_found_error&)
    {
        // stopped and removed while the stream was still draining
    }
}

void write_report(const runner_job& job, const nlohmann::json& report)
{
    std::ofstream out(job.report_log, std::ios::trunc);
    if (!out)
    {
        LOG_WARN("runner: cannot write report " + job.report_log.string());
        return;
    }
    out << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

void read_stream(supervisor& sv, runner_job& job)
{
    std::ofstream log(job.stream_log, std::ios::app);
    if (!log)
        LOG_WARN("runner: cannot open stream log " + job.stream_log.string());

    stream_stats stats;
    std::string pending;
    char buf[8192];
    auto start = std::chrono::steady_clock::now();

    while (true)
    {
        ssize_t n = ::read(job.output.get(), buf, sizeof(buf));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_WARN("runner: " + job.name + ": read failed: " + std::strerror(errno));
            break;
        }
        if (n == 0)
            break;

        if (log)
        {
            log.write(buf, n);
            log.flush();
        }

        pending.append(buf, static_cast<size_t>(n));

        bool changed = false;
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos)
        {
            changed |= stats.feed(std::string_view(pending).substr(0, pos));
            pending.erase(0, pos + 1);
        }
        if (changed)
            publish(sv, job.name, stats.metadata_patch());
    }

    if (!pending.empty())
        stats.feed(pending);

    job.output.reset();

    auto code = job.handle->wait_for(job.exit_wait);

    nlohmann::json patch = stats.metadata_patch();
    if (!stats.finished)
        patch["status"] = code && *code == 0 ? "completed" : "stopped";
    publish(sv, job.name, patch);

    nlohmann::json report = job.report;
    report.update(stats.to_json());
    report["status"] = patch["status"];
    report["ended"] = iso_timestamp(std::chrono::system_clock::now());
    report["return_code"] = code ? nlohmann::json(*code) : nlohmann::json(nullptr);
    report["duration"] = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    write_report(job, report);

    LOG_INFO("runner: " + job.name + " finished, report in " + job.report_log.string());
}

// ─── commands ───

nlohmann::json cmd_runner(supervisor& sv, const std::vector<std::string>& args)
{
    static const auto schema = runner_schema();
    auto parsed = parse_plugin_args(*schema, args);
    const auto& cfg = sv.config();

    std::string user_prompt = parsed.value_or("prompt", "");
    std::string prompt = user_prompt;

    auto context_file = parsed.get("context-file");
    if (context_file)
    {
        std::error_code ec;
        if (!fs::exists(*context_file, ec))
            return make_error("Context file not found: " + *context_file);
        prompt = "@" + *context_file + "\n" + prompt;
    }

    auto report_file = parsed.get("report");
    if (report_file)
        prompt += "\n\nPlease write a full report to " + *report_file;

    auto model = parsed.get("model");

    std::vector<std::string> argv = {cfg.agent_command, "-p", prompt, "--verbose", "--output-format", "stream-json"};
    if (model)
    {
        argv.push_back("--model");
        argv.push_back(*model);
    }
    if (cfg.agent_skip_permissions && !parsed.flag("no-permissions"))
        argv.push_back("--dangerously-skip-permissions");

    std::vector<std::string> quoted;
    for (const auto& a : argv)
        quoted.push_back(shell_quote(a));
    std::string command_line = join(quoted, " ");

    fs::path log_dir = cfg.log_dir / runner_kind;
    std::error_code ec;
    fs::create_directories(log_dir, ec);

    auto started = std::chrono::system_clock::now();
    std::string stamp = file_timestamp(started);

    spawn_options opts;
    opts.search_path = true;
    opts.merge_stderr = true;

    std::shared_ptr<child_process> child;
    try
    {
        child = child_process::spawn(argv, opts);
    }
    catch (const process_error& e)
    {
        return make_error(std::string("Failed to start agent runner: ") + e.what());
    }

    pid_t pid = child->pid();
    std::string name = parsed.value_or("name", runner_kind) + "-" + std::to_string(pid);

    runner_job job;
    job.name = name;
    job.handle = child;
    job.output = child->take_stdout();
    job.stream_log = log_dir / (stamp + "_" + name + "_stream.jsonl");
    job.report_log = log_dir / (stamp + "_" + name + "_report.json");
    job.exit_wait = cfg.termination_timeout;
    job.report = {
        {"process_name", name},
        {"pid", pid},
        {"started", iso_timestamp(started)},
        {"prompt", user_prompt},
        {"context_file", optional_string(context_file)},
        {"report_file", optional_string(report_file)},
        {"model", optional_string(model)},
        {"command", command_line}
    };

    {
        std::ofstream log(job.stream_log, std::ios::trunc);
        if (log)
            log << "[DEBUG] Command: " << command_line << "\n"
                << "[DEBUG] Started at: " << iso_timestamp(started) << "\n";
    }

    nlohmann::json meta = {
        {"command", command_line},
        {"started", iso_timestamp(started)},
        {"type", runner_kind},
        {"pid", pid},
        {"prompt", user_prompt},
        {"context_file", optional_string(context_file)},
        {"report_file", optional_string(report_file)},
        {"model", optional_string(model)},
        {"stream_log", job.stream_log.string()},
        {"report_log", job.report_log.string()},
        {"status", "running"}
    };

    sv.adopt_process(name, child, runner_kind, std::move(meta));

    std::string stream_name = job.stream_log.filename().string();
    std::string report_name = job.report_log.filename().string();

    try
    {
        std::thread([&sv, guard = supervisor::task_guard(sv), job = std::move(job)]() mutable {
            try
            {
                read_stream(sv, job);
            }
            catch (const std::exception& e)
            {
                LOG_ERROR("runner: " + job.name + ": " + e.what());
            }
        }).detach();
    }
    catch (const std::system_error& e)
    {
        LOG_ERROR(std::string("runner: could not start stream reader: ") + e.what());
    }

    return {{"success", true},
            {"pid", pid},
            {"name", name},
            {"message", "Started agent runner \"" + name + "\" with PID " + std::to_string(pid) + "\n" +
                        "Stream log: " + stream_name + "\n" +
                        "Report log: " + report_name}};
}

std::string format_cost(double cost)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "$%.4f", cost);
    return buf;
}

nlohmann::json cmd_runner_status(supervisor& sv, const std::vector<std::string>& args)
{
    static const auto schema = runner_status_schema();
    auto parsed = parse_plugin_args(*schema, args);

    std::string prefix = parsed.value_or("name", "");
    bool as_json = parsed.flag("json");

    sv.processes().refresh_exit_states();
    auto now = std::chrono::system_clock::now();

    nlohmann::json runners = nlohmann::json::object();
    for (const auto& r : sv.processes().list_all(process_table::of_kind(runner_kind)))
    {
        if (!prefix.empty() && r.name.compare(0, prefix.size(), prefix) != 0)
            continue;

        const auto& m = r.metadata;
        double duration = std::chrono::duration<double>(r.ended.value_or(now) - r.started).count();

        std::string status = "running";
        if (!r.running())
        {
            status = metadata_string(m, "status");
            if (status.empty() || status == "running")
                status = "stopped";
        }

        nlohmann::json info = {
            {"pid", r.pid},
            {"status", status},
            {"duration", duration},
            {"duration_formatted", format_duration_precise(duration)},
            {"started", iso_timestamp(r.started)},
            {"prompt", m.value("prompt", std::string("N/A"))},
            {"context_file", m.value("context_file", nlohmann::json(nullptr))},
            {"report_file", m.value("report_file", nlohmann::json(nullptr))},
            {"model", m.value("model", nlohmann::json(nullptr))},
            {"tool_counts", m.value("tool_counts", nlohmann::json::object())},
            {"total_tokens", m.value("total_tokens", uint64_t(0))},
            {"input_tokens", m.value("total_input_tokens", uint64_t(0))},
            {"output_tokens", m.value("total_output_tokens", uint64_t(0))},
            {"cost_usd", m.value("cost_usd", 0.0)},
            {"is_error", m.value("is_error", false)},
            {"return_code", r.exit_code ? nlohmann::json(*r.exit_code) : nlohmann::json(nullptr)},
            {"stream_log", m.value("stream_log", nlohmann::json(nullptr))},
            {"report_log", m.value("report_log", nlohmann::json(nullptr))}
        };
        info["tool_counts_formatted"] = format_tool_counts(info["tool_counts"]);

        runners[r.name] = std::move(info);
    }

    if (as_json)
        return {{"success", true}, {"runners", std::move(runners)}};

    if (runners.empty())
        return make_success("No Claude runners found");

    std::vector<std::string> lines = {"=== Claude Runner Status ===", ""};

    for (auto it = runners.begin(); it != runners.end(); ++it)
    {
        const std::string& name = it.key();
        nlohmann::json& info = it.value();
        bool running = info["status"] == "running";
        lines.push_back(std::string(running ? "\xE2\x97\x8F " : "\xE2\x97\x8B ") + name +
                        (info["is_error"].get<bool>() ? " [ERROR]" : ""));
        lines.push_back("  Status: " + info["status"].get<std::string>() +
                        " (PID: " + std::to_string(info["pid"].get<int>()) + ")");
        lines.push_back("  Duration: " + info["duration_formatted"].get<std::string>());
        lines.push_back("  Model: " + (info["model"].is_string() ? info["model"].get<std::string>() : "N/A"));

        std::string prompt = info["prompt"].is_string() ? info["prompt"].get<std::string>() : "N/A";
        if (prompt.size() > 100)
            prompt = prompt.substr(0, 100) + "...";
        for (char& c : prompt)
        {
            if (c == '\n')
                c = ' ';
        }
        lines.push_back("  Prompt: " + prompt);

        if (info["context_file"].is_string())
            lines.push_back("  Context: " + info["context_file"].get<std::string>());
        if (info["report_file"].is_string())
            lines.push_back("  Report: " + info["report_file"].get<std::string>());

        if (!info["tool_counts"].empty())
            lines.push_back("  Tools: " + info["tool_counts_formatted"].get<std::string>());

        auto total = info["total_tokens"].get<uint64_t>();
        if (total > 0)
        {
            lines.push_back("  Tokens: " + with_thousands(total) +
                            " (in: " + with_thousands(info["input_tokens"].get<uint64_t>()) +
                            ", out: " + with_thousands(info["output_tokens"].get<uint64_t>()) + ")");
        }

        double cost = info["cost_usd"].get<double>();
        if (cost > 0)
            lines.push_back("  Cost: " + format_cost(cost));

        std::string stream_log = info["stream_log"].is_string() ? info["stream_log"].get<std::string>() : "";
        if (running && !stream_log.empty())
        {
            auto last = tail_lines(stream_log, 1);
            if (!last.empty() && !last.back().empty())
                lines.push_back("  Last activity: " + describe_stream_line(last.back()));

            std::error_code ec;
            auto mtime = fs::last_write_time(stream_log, ec);
            if (!ec)
            {
                auto ago = std::chrono::duration<double>(fs::file_time_type::clock::now() - mtime).count();
                lines.push_back("  Last update: " + format_duration_precise(ago) + " ago");
            }
        }

        if (!stream_log.empty())
            lines.push_back("  Stream log: " + std::string(basename_of(stream_log)));
        if (info["report_log"].is_string())
            lines.push_back("  Report log: " + std::string(basename_of(info["report_log"].get<std::string>())));

        lines.push_back("");
    }

    return make_success(join(lines, "\n"));
}

}

std::vector<command_plugin> runner_plugins()
{
    return {
        {"runner", "Execute the agent CLI as a managed process with streaming output", runner_schema(), &cmd_runner},
        {"runner-status", "Show detailed status of agent runner processes", runner_status_schema(), &cmd_runner_status},
    };
}
