#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

// Running totals folded out of an agent's stream-json output, one JSON object
// per line.
struct stream_stats
{
    std::string session_id;
    std::string model;
    std::vector<std::string> tools_available;
    std::map<std::string, uint64_t> tool_counts;
    uint64_t input_tokens = 0;      // includes cache creation and cache reads
    uint64_t output_tokens = 0;
    std::vector<std::string> stderr_lines;

    bool finished = false;          // a "result" event was seen
    std::string status;
    std::string result;
    double cost_usd = 0.0;
    double total_cost = 0.0;
    uint64_t duration_ms = 0;
    uint64_t duration_api_ms = 0;
    uint64_t num_turns = 0;
    bool is_error = false;

    // Feeds one line. Returns true when the line was a JSON event; anything
    // else is kept as stderr text.
    bool feed(std::string_view line);

    uint64_t total_tokens() const { return input_tokens + output_tokens; }

    // Fields merged into the process metadata while the agent runs.
    nlohmann::json metadata_patch() const;
    // Everything, for the final report file.
    nlohmann::json to_json() const;
};

// "12,345"
std::string with_thousands(uint64_t n);

// "3 Bash, 1 Read" in name order, "none" when empty.
std::string format_tool_counts(const nlohmann::json& counts);

// One-line summary of the most recent stream event for status displays.
std::string describe_stream_line(std::string_view line);
