#include "child_process.h"
#include "errors.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;

namespace {

constexpr auto poll_interval = std::chrono::milliseconds(20);
constexpr auto kill_reap_timeout = std::chrono::seconds(5);

std::string errno_text(const char* what, int err)
{
    return std::string(what) + ": " + std::strerror(err);
}

std::string_view env_key(std::string_view entry)
{
    auto eq = entry.find('=');
    return eq == std::string_view::npos ? entry : entry.substr(0, eq);
}

// Inherited environment minus any key the caller overrides, plus the overrides.
std::vector<char*> build_envp(const std::vector<std::string>& extra)
{
    std::vector<char*> envp;
    for (char** e = environ; e && *e; ++e)
    {
        bool overridden = false;
        for (const auto& x : extra)
        {
            if (env_key(*e) == env_key(x))
            {
                overridden = true;
                break;
            }
        }
        if (!overridden)
            envp.push_back(*e);
    }
    for (const auto& x : extra)
        envp.push_back(const_cast<char*>(x.c_str()));
    envp.push_back(nullptr);
    return envp;
}

}

child_process::child_process(pid_t pid, scoped_fd stdout_pipe)
    : m_pid(pid), m_started(std::chrono::system_clock::now()), m_stdout(std::move(stdout_pipe))
{
}

child_process::~child_process()
{
    // Reap if it already exited; a live child is left alone.
    if (!m_exit_code)
    {
        int status;
        if (waitpid(m_pid, &status, WNOHANG) == m_pid)
            record_exit(status);
    }
}

std::shared_ptr<child_process> child_process::spawn(const std::vector<std::string>& argv,
                                                    spawn_options options)
{
    if (argv.empty() || argv[0].empty())
        throw process_error("empty command line");

    // Everything the child touches is prepared before fork(): only
    // async-signal-safe calls are allowed between fork and exec.
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& a : argv)
        c_argv.push_back(const_cast<char*>(a.c_str()));
    c_argv.push_back(nullptr);

    std::vector<char*> envp = build_envp(options.env);

    scoped_fd out_read, out_write;
    if (options.stdout_fd < 0)
    {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) < 0)
            throw process_error(errno_text("pipe", errno));
        out_read.reset(fds[0]);
        out_write.reset(fds[1]);
    }

    // exec failures are reported through a close-on-exec pipe: EOF means exec succeeded
    int err_fds[2];
    if (pipe2(err_fds, O_CLOEXEC) < 0)
        throw process_error(errno_text("pipe", errno));
    scoped_fd err_read(err_fds[0]);
    scoped_fd err_write(err_fds[1]);

    scoped_fd devnull(open("/dev/null", O_RDONLY | O_CLOEXEC));

    int out_fd = options.stdout_fd >= 0 ? options.stdout_fd : out_write.get();

    pid_t pid = fork();
    if (pid < 0)
        throw process_error(errno_text("fork", errno));

    if (pid == 0)
    {
        setpgid(0, 0);

        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGHUP, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        if (devnull)
            dup2(devnull.get(), STDIN_FILENO);
        dup2(out_fd, STDOUT_FILENO);
        if (options.merge_stderr)
            dup2(out_fd, STDERR_FILENO);

        if (options.search_path)
            execvpe(c_argv[0], c_argv.data(), envp.data());
        else
            execve(c_argv[0], c_argv.data(), envp.data());

        int err = errno;
        if (::write(err_write.get(), &err, sizeof(err)) < 0) {}
        _exit(127);
    }

    // Also set from the parent so a terminate() issued right away cannot
    // race the child's own setpgid.
    setpgid(pid, pid);

    err_write.reset();
    out_write.reset();

    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(err_read.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0)
    {
        int status;
        waitpid(pid, &status, 0);
        throw process_error(errno_text(("exec " + argv[0]).c_str(), child_errno));
    }

    return std::shared_ptr<child_process>(new child_process(pid, std::move(out_read)));
}

std::shared_ptr<child_process> child_process::spawn_shell(const std::string& command,
                                                          spawn_options options)
{
    options.search_path = false;
    return spawn({"/bin/sh", "-c", command}, std::move(options));
}

void child_process::record_exit(int status)
{
    if (WIFEXITED(status))
        m_exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        m_exit_code = -WTERMSIG(status);
    else
        m_exit_code = -1;
    m_ended = std::chrono::system_clock::now();
}

std::optional<int> child_process::poll()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_exit_code)
        return m_exit_code;

    int status;
    pid_t r = waitpid(m_pid, &status, WNOHANG);
    if (r == m_pid)
    {
        record_exit(status);
    }
    else if (r < 0 && errno == ECHILD)
    {
        // Reaped elsewhere; the real status is lost.
        m_exit_code = -1;
        m_ended = std::chrono::system_clock::now();
    }

    return m_exit_code;
}

std::optional<std::chrono::system_clock::time_point> child_process::ended()
{
    poll();
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ended;
}

std::optional<int> child_process::wait_for(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto code = poll())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(poll_interval);
    }
}

bool child_process::terminate(std::chrono::milliseconds grace)
{
    if (poll())
        return false;

    if (kill(-m_pid, SIGTERM) < 0 && errno != ESRCH)
        throw process_error(errno_text("SIGTERM", errno));

    if (wait_for(grace))
        return false;

    if (kill(-m_pid, SIGKILL) < 0 && errno != ESRCH)
        throw process_error(errno_text("SIGKILL", errno));

    if (!wait_for(kill_reap_timeout))
        throw process_error("process " + std::to_string(m_pid) + " survived SIGKILL");

    return true;
}

scoped_fd child_process::take_stdout()
{
    return std::move(m_stdout);
}
