#pragma once
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

// The agent keeps one transcript directory per working directory under
// <agent_home>/projects/, named after the path with every non-alphanumeric
// run collapsed to a single '-'.
std::string project_dir_component(std::string_view path);
std::filesystem::path session_project_dir(const std::filesystem::path& agent_home,
                                          const std::filesystem::path& cwd);

struct session_file
{
    std::filesystem::path path;
    std::time_t modified;
};

// *.jsonl transcripts in dir, oldest first. Empty when dir is missing.
std::vector<session_file> list_session_files(const std::filesystem::path& dir);

// message.usage of the transcript's last line, if it has one.
std::optional<nlohmann::json> last_usage(const std::filesystem::path& transcript);

struct context_usage
{
    static constexpr int64_t context_window = 200'000;
    static constexpr int64_t compact_cutoff = 190'000;

    int64_t input_tokens = 0;
    int64_t cache_creation_tokens = 0;
    int64_t cache_read_tokens = 0;
    int64_t output_tokens = 0;

    static context_usage from_usage(const nlohmann::json& usage);

    int64_t total_context() const { return input_tokens + cache_creation_tokens + cache_read_tokens; }
    int64_t remaining() const { return compact_cutoff - total_context(); }
    double usage_percentage() const { return 100.0 * static_cast<double>(total_context()) / compact_cutoff; }

    nlohmann::json to_json() const;
    std::string render() const;
};
