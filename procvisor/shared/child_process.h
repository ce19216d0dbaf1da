#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

#include "scoped_fd.h"

struct spawn_options
{
    // Where stdout goes: a descriptor owned by the caller, or -1 to create a
    // pipe whose read end is handed out through take_stdout().
    int stdout_fd = -1;
    bool merge_stderr = true;
    // Extra "KEY=VALUE" entries appended to the inherited environment.
    std::vector<std::string> env;
    // Resolve argv[0] through PATH.
    bool search_path = false;
};

// Owner of one forked child. The child runs in its own process group so
// termination reaches everything it started. Reaping is serialized by an
// internal mutex: status pollers, output readers and stop() may race.
class child_process
{
public:
    ~child_process();

    child_process(const child_process&) = delete;
    child_process& operator=(const child_process&) = delete;

    // Throws process_error when fork or exec fails.
    static std::shared_ptr<child_process> spawn(const std::vector<std::string>& argv,
                                                spawn_options options = {});
    static std::shared_ptr<child_process> spawn_shell(const std::string& command,
                                                      spawn_options options = {});

    pid_t pid() const { return m_pid; }
    std::chrono::system_clock::time_point started() const { return m_started; }

    // Non-blocking. nullopt while running; otherwise the exit status, with
    // signal deaths reported as -signo.
    std::optional<int> poll();
    bool running() { return !poll().has_value(); }
    std::optional<std::chrono::system_clock::time_point> ended();

    // Polls until exit or timeout; nullopt on timeout.
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    // SIGTERM the group, wait up to grace, then SIGKILL and reap.
    // Returns true when SIGKILL was needed.
    bool terminate(std::chrono::milliseconds grace);

    scoped_fd take_stdout();

private:
    child_process(pid_t pid, scoped_fd stdout_pipe);

    void record_exit(int status);

    pid_t m_pid;
    std::chrono::system_clock::time_point m_started;
    scoped_fd m_stdout;

    std::mutex m_mutex;
    std::optional<int> m_exit_code;
    std::optional<std::chrono::system_clock::time_point> m_ended;
};
