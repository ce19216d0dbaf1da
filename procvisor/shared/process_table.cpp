#include "process_table.h"
#include "errors.h"
#include "time_format.h"

#include <algorithm>
#include <mutex>

process_table::predicate process_table::of_kind(std::string kind)
{
    return [kind = std::move(kind)](const process_record& r) { return r.kind == kind; };
}

void process_table::register_process(std::string name, std::shared_ptr<child_process> handle,
                                     std::string kind, nlohmann::json metadata)
{
    if (name.empty())
        throw process_error("process name must not be empty");
    if (!handle)
        throw process_error("no process handle for " + name);
    if (!metadata.is_object())
        metadata = nlohmann::json::object();

    std::unique_lock lock(m_mutex);

    if (m_entries.find(std::string_view(name)) != m_entries.end())
        throw duplicate_name_error(name);

    m_entries.emplace(std::move(name), entry{std::move(handle), std::move(kind), std::move(metadata)});
}

process_record process_table::snapshot(const std::string& name, const entry& e)
{
    process_record r;
    r.name = name;
    r.kind = e.kind;
    r.pid = e.handle->pid();
    r.started = e.handle->started();
    r.exit_code = e.handle->poll();
    if (r.exit_code)
        r.ended = e.handle->ended();
    r.metadata = e.metadata;
    return r;
}

std::optional<process_record> process_table::get(std::string_view name) const
{
    std::shared_lock lock(m_mutex);

    auto it = m_entries.find(name);
    if (it == m_entries.end())
        return std::nullopt;
    return snapshot(it->first, it->second);
}

std::shared_ptr<child_process> process_table::handle(std::string_view name) const
{
    std::shared_lock lock(m_mutex);

    auto it = m_entries.find(name);
    if (it == m_entries.end())
        return nullptr;
    return it->second.handle;
}

bool process_table::contains(std::string_view name) const
{
    std::shared_lock lock(m_mutex);
    return m_entries.find(name) != m_entries.end();
}

void process_table::update_metadata(std::string_view name, const nlohmann::json& patch)
{
    std::unique_lock lock(m_mutex);

    auto it = m_entries.find(name);
    if (it == m_entries.end())
        throw not_found_error(name);

    if (patch.is_object())
        it->second.metadata.update(patch);
}

bool process_table::remove(std::string_view name)
{
    std::shared_ptr<child_process> released;
    {
        std::unique_lock lock(m_mutex);

        auto it = m_entries.find(name);
        if (it == m_entries.end())
            return false;

        released = std::move(it->second.handle);
        m_entries.erase(it);
    }
    // handle destructor may reap; keep it outside the lock
    return true;
}

std::vector<process_record> process_table::list_all(const predicate& pred) const
{
    std::vector<process_record> out;
    {
        std::shared_lock lock(m_mutex);
        out.reserve(m_entries.size());
        for (const auto& [name, e] : m_entries)
        {
            process_record r = snapshot(name, e);
            if (!pred || pred(r))
                out.push_back(std::move(r));
        }
    }

    std::sort(out.begin(), out.end(),
              [](const process_record& a, const process_record& b) { return a.name < b.name; });
    return out;
}

size_t process_table::refresh_exit_states()
{
    std::unique_lock lock(m_mutex);

    size_t recorded = 0;
    for (auto& [name, e] : m_entries)
    {
        if (e.metadata.contains("exit_code"))
            continue;

        auto code = e.handle->poll();
        if (!code)
            continue;

        auto ended = e.handle->ended().value_or(std::chrono::system_clock::now());
        e.metadata["exit_code"] = *code;
        e.metadata["ended"] = iso_timestamp(ended);
        e.metadata["duration"] = format_elapsed(e.handle->started(), ended);
        ++recorded;
    }
    return recorded;
}

std::vector<std::string> process_table::names() const
{
    std::vector<std::string> out;
    {
        std::shared_lock lock(m_mutex);
        out.reserve(m_entries.size());
        for (const auto& [name, _] : m_entries)
            out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

size_t process_table::size() const
{
    std::shared_lock lock(m_mutex);
    return m_entries.size();
}
