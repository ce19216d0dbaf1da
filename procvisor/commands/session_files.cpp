#include "session_files.h"
#include "agent_stream.h"
#include "log_tail.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sys/stat.h>

namespace fs = std::filesystem;

std::string project_dir_component(std::string_view path)
{
    std::string out;
    out.reserve(path.size());
    for (char c : path)
    {
        if (std::isalnum(static_cast<unsigned char>(c)))
            out += c;
        else if (out.empty() || out.back() != '-')
            out += '-';
    }
    return out;
}

fs::path session_project_dir(const fs::path& agent_home, const fs::path& cwd)
{
    return agent_home / "projects" / project_dir_component(cwd.string());
}

std::vector<session_file> list_session_files(const fs::path& dir)
{
    std::vector<session_file> files;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
        return files;

    for (const auto& entry : it)
    {
        if (entry.path().extension() != ".jsonl")
            continue;

        struct stat st{};
        if (::stat(entry.path().c_str(), &st) != 0 || !S_ISREG(st.st_mode))
            continue;
        files.push_back({entry.path(), st.st_mtime});
    }

    std::sort(files.begin(), files.end(), [](const session_file& a, const session_file& b) {
        if (a.modified != b.modified)
            return a.modified < b.modified;
        return a.path < b.path;
    });
    return files;
}

std::optional<nlohmann::json> last_usage(const fs::path& transcript)
{
    auto lines = tail_lines(transcript, 1);
    if (lines.empty())
        return std::nullopt;

    auto j = nlohmann::json::parse(lines.back(), nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;

    auto msg = j.find("message");
    if (msg == j.end() || !msg->is_object())
        return std::nullopt;
    auto usage = msg->find("usage");
    if (usage == msg->end() || !usage->is_object())
        return std::nullopt;
    return *usage;
}

context_usage context_usage::from_usage(const nlohmann::json& usage)
{
    auto count = [&usage](const char* key) -> int64_t {
        auto it = usage.find(key);
        return it != usage.end() && it->is_number_integer() ? it->get<int64_t>() : 0;
    };

    context_usage u;
    u.input_tokens = count("input_tokens");
    u.cache_creation_tokens = count("cache_creation_input_tokens");
    u.cache_read_tokens = count("cache_read_input_tokens");
    u.output_tokens = count("output_tokens");
    return u;
}

nlohmann::json context_usage::to_json() const
{
    double used = usage_percentage();
    return {
        {"input_tokens", input_tokens},
        {"cache_creation_tokens", cache_creation_tokens},
        {"cache_read_tokens", cache_read_tokens},
        {"output_tokens", output_tokens},
        {"total_context_tokens", total_context()},
        {"context_window", context_window},
        {"claude_code_cutoff", compact_cutoff},
        {"remaining_tokens", remaining()},
        {"usage_percentage", used},
        {"remaining_percentage", 100.0 - used},
    };
}

static std::string signed_thousands(int64_t n)
{
    if (n < 0)
        return "-" + with_thousands(static_cast<uint64_t>(-n));
    return with_thousands(static_cast<uint64_t>(n));
}

std::string context_usage::render() const
{
    auto row = [](const char* label, const std::string& value) {
        char buf[128];
        std::snprintf(buf, sizeof(buf), "%-28s%s\n", label, value.c_str());
        return std::string(buf);
    };
    auto percent = [](double v) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f%%", v);
        return std::string(buf);
    };

    std::string rule(40, '=');
    std::string out = "Token Usage\n" + rule + "\n";
    out += row("Input tokens (current):", signed_thousands(input_tokens));
    out += row("Cache creation tokens:", signed_thousands(cache_creation_tokens));
    out += row("Cache read tokens:", signed_thousands(cache_read_tokens));
    out += row("Output tokens:", signed_thousands(output_tokens));
    out += row("Total context tokens:", signed_thousands(total_context()));
    out += "\nContext Window\n" + rule + "\n";
    out += row("Model context window:", signed_thousands(context_window));
    out += row("Compaction cutoff:", signed_thousands(compact_cutoff));
    out += row("Remaining tokens:", signed_thousands(remaining()));
    out += row("Usage:", percent(usage_percentage()));
    out += row("Remaining:", percent(100.0 - usage_percentage()));
    out.pop_back();
    return out;
}
