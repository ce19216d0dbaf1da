#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "child_process.h"

// Transparent hash for heterogeneous lookup (avoids string copies on find)
struct process_name_hash
{
    using is_transparent = void;

    size_t operator()(std::string_view sv) const noexcept
    {
        return std::hash<std::string_view>{}(sv);
    }

    size_t operator()(const std::string& s) const noexcept
    {
        return std::hash<std::string_view>{}(s);
    }
};

struct process_name_equal
{
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept
    {
        return lhs == rhs;
    }
};

// Point-in-time copy of one table entry. Never aliases table storage.
struct process_record
{
    std::string name;
    std::string kind;
    pid_t pid = 0;
    std::chrono::system_clock::time_point started;
    std::optional<int> exit_code;
    std::optional<std::chrono::system_clock::time_point> ended;
    nlohmann::json metadata = nlohmann::json::object();

    bool running() const { return !exit_code.has_value(); }
};

// Metadata is open-ended; a missing or non-string field reads as "".
inline std::string metadata_string(const nlohmann::json& metadata, const char* key)
{
    auto it = metadata.find(key);
    return it != metadata.end() && it->is_string() ? it->get<std::string>() : std::string();
}

class process_table
{
public:
    using predicate = std::function<bool(const process_record&)>;

    static predicate of_kind(std::string kind);

    // Throws duplicate_name_error if the name is taken.
    void register_process(std::string name, std::shared_ptr<child_process> handle,
                          std::string kind, nlohmann::json metadata = nlohmann::json::object());

    std::optional<process_record> get(std::string_view name) const;
    std::shared_ptr<child_process> handle(std::string_view name) const;
    bool contains(std::string_view name) const;

    // Shallow merge of patch's keys into the record's metadata.
    // Throws not_found_error if absent.
    void update_metadata(std::string_view name, const nlohmann::json& patch);

    // Drops both the handle and the metadata. false if absent.
    bool remove(std::string_view name);

    // Snapshot of every record accepted by the predicate, ordered by name.
    // Each call re-reads the table, so the result can be requested again.
    std::vector<process_record> list_all(const predicate& pred = {}) const;

    // Records exit_code/ended/duration in the metadata of every process whose
    // exit has not been recorded yet. Returns how many were newly recorded.
    size_t refresh_exit_states();

    std::vector<std::string> names() const;
    size_t size() const;

private:
    struct entry
    {
        std::shared_ptr<child_process> handle;
        std::string kind;
        nlohmann::json metadata;
    };

    using entry_map = std::unordered_map<std::string, entry, process_name_hash, process_name_equal>;

    static process_record snapshot(const std::string& name, const entry& e);

    mutable std::shared_mutex m_mutex;
    entry_map m_entries;
};
