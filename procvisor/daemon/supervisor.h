#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <linux/time_types.h>

#include <nlohmann/json.hpp>

#include "command_registry.h"
#include "../shared/config.h"
#include "../shared/event_loop_definitions.h"
#include "../shared/process_table.h"
#include "../shared/scoped_fd.h"
#include "../shared/wire_codec.h"

class event_loop;
class lua_plugin;

// Owns the listening socket, the process table and the command registry.
// The accept loop runs on the event loop thread; every accepted connection
// is served by its own detached worker thread.
class supervisor : public io_handler
{
public:
    // Keeps run() and the destructor from returning while a worker or a
    // plugin-owned reader thread still uses the supervisor.
    class task_guard
    {
    public:
        explicit task_guard(supervisor& sv);
        ~task_guard();

        task_guard(task_guard&& other) noexcept;
        task_guard(const task_guard&) = delete;
        task_guard& operator=(const task_guard&) = delete;
        task_guard& operator=(task_guard&&) = delete;

    private:
        supervisor* m_sv;
    };

    explicit supervisor(supervisor_config config);
    ~supervisor() override;

    supervisor(const supervisor&) = delete;
    supervisor& operator=(const supervisor&) = delete;

    // Built-ins, then compiled-in plugins, then Lua plugins from plugin_dir.
    void register_commands();

    // Binds the socket and writes the pid file. false on failure (logged).
    bool setup(event_loop& loop);
    // Returns after shutdown, once managed processes are stopped and every
    // in-flight connection has completed.
    void run();
    void teardown();

    void on_cqe(struct io_uring_cqe* cqe) override;

    // Serves one connection on the calling thread. Never throws.
    void handle_connection(scoped_fd fd);
    // Dispatch with unknown commands reported as failure responses. Never throws.
    nlohmann::json execute(const request& req);

    // Registers a freshly spawned child. On a name collision the child is
    // terminated and duplicate_name_error propagates.
    void adopt_process(const std::string& name, std::shared_ptr<child_process> handle,
                       const std::string& kind, nlohmann::json metadata);
    // Graceful stop with escalation; the entry is removed even when
    // termination fails. Returns true if SIGKILL was needed.
    // Throws not_found_error, or process_error after removing the entry.
    bool stop_process(std::string_view name);
    void stop_all_processes();

    void request_shutdown();
    bool running() const { return m_running.load(std::memory_order_acquire); }

    process_table& processes() { return m_processes; }
    const process_table& processes() const { return m_processes; }
    command_registry& commands() { return m_commands; }
    const command_registry& commands() const { return m_commands; }
    const supervisor_config& config() const { return m_config; }

    size_t active_tasks() const;
    void wait_for_tasks();

private:
    void register_builtins();
    void load_script_plugins();

    nlohmann::json cmd_status(const std::vector<std::string>& args);
    nlohmann::json cmd_list_commands(const std::vector<std::string>& args);
    nlohmann::json cmd_help(const std::vector<std::string>& args);
    nlohmann::json cmd_shutdown(const std::vector<std::string>& args);
    nlohmann::json cmd_restart_manager(const std::vector<std::string>& args);

    bool bind_socket();
    void spawn_worker(scoped_fd fd);
    void handle_accept(struct io_uring_cqe* cqe);
    void handle_tick(struct io_uring_cqe* cqe);
    void submit_tick();

    void begin_task();
    void end_task();

    supervisor_config m_config;
    process_table m_processes;
    command_registry m_commands;
    std::vector<std::unique_ptr<lua_plugin>> m_scripts;

    std::atomic<bool> m_running{true};
    event_loop* m_loop = nullptr;
    scoped_fd m_listen;
    bool m_pid_written = false;

    io_request m_accept_req{};
    io_request m_tick_req{};
    struct __kernel_timespec m_tick_ts{};

    mutable std::mutex m_task_mutex;
    std::condition_variable m_task_cv;
    size_t m_active_tasks = 0;
};
