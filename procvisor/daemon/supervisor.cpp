#include "supervisor.h"
#include "connection_handler.h"
#include "lua_plugin.h"
#include "../commands/arg_schema.h"
#include "../commands/command_plugin.h"
#include "../shared/errors.h"
#include "../shared/event_loop.h"
#include "../shared/logging.h"
#include "../shared/pid_file.h"
#include "../shared/time_format.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>

// ─── task_guard ───

supervisor::task_guard::task_guard(supervisor& sv)
    : m_sv(&sv)
{
    m_sv->begin_task();
}

supervisor::task_guard::task_guard(task_guard&& other) noexcept
    : m_sv(other.m_sv)
{
    other.m_sv = nullptr;
}

supervisor::task_guard::~task_guard()
{
    if (m_sv)
        m_sv->end_task();
}

// ─── lifecycle ───

supervisor::supervisor(supervisor_config config)
    : m_config(std::move(config)), m_commands(m_config.command_overwrite)
{
}

supervisor::~supervisor()
{
    m_running.store(false, std::memory_order_release);
    stop_all_processes();
    wait_for_tasks();
    teardown();
}

void supervisor::register_commands()
{
    register_builtins();

    for (auto& plugin : compiled_plugins())
    {
        m_commands.register_command(plugin.name, std::move(plugin.handler), plugin.help,
                                    std::move(plugin.schema), command_origin::plugin);
    }

    load_script_plugins();

    LOG_INFO("supervisor: " + std::to_string(m_commands.size()) + " commands registered");
}

void supervisor::register_builtins()
{
    m_commands.register_command("status",
        [](supervisor& sv, const std::vector<std::string>& args) { return sv.cmd_status(args); },
        "Show status of all managed processes", nullptr, command_origin::builtin);

    m_commands.register_command("restart-manager",
        [](supervisor& sv, const std::vector<std::string>& args) { return sv.cmd_restart_manager(args); },
        "Restart the supervisor through its launcher", nullptr, command_origin::builtin);

    m_commands.register_command("shutdown",
        [](supervisor& sv, const std::vector<std::string>& args) { return sv.cmd_shutdown(args); },
        "Shut down the supervisor and all managed processes", nullptr, command_origin::builtin);

    m_commands.register_command("list-commands",
        [](supervisor& sv, const std::vector<std::string>& args) { return sv.cmd_list_commands(args); },
        "List all available commands with descriptions", nullptr, command_origin::builtin);

    m_commands.register_command("help",
        [](supervisor& sv, const std::vector<std::string>& args) { return sv.cmd_help(args); },
        "Show help for a specific command", nullptr, command_origin::builtin);
}

void supervisor::load_script_plugins()
{
    m_scripts = load_lua_plugins(m_config.plugin_dir, *this);

    for (auto& script : m_scripts)
    {
        lua_plugin* p = script.get();
        bool ok = m_commands.register_command(p->name(),
            [p](supervisor& sv, const std::vector<std::string>& args) { return p->invoke(sv, args); },
            p->help(), p->schema(), command_origin::script);
        if (ok)
            LOG_INFO("supervisor: loaded command " + p->name() + " from " + p->path().string());
    }
}

bool supervisor::bind_socket()
{
    const std::string path = m_config.socket_path.string();

    struct sockaddr_un addr{};
    if (path.empty() || path.size() >= sizeof(addr.sun_path))
    {
        LOG_ERROR("supervisor: socket path unusable: '" + path + "'");
        return false;
    }

    std::error_code ec;
    if (m_config.socket_path.has_parent_path())
        std::filesystem::create_directories(m_config.socket_path.parent_path(), ec);

    // stale socket from a previous instance
    unlink(path.c_str());

    scoped_fd fd(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd)
    {
        LOG_ERROR(std::string("supervisor: socket: ") + std::strerror(errno));
        return false;
    }

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(fd.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        LOG_ERROR("supervisor: bind " + path + ": " + std::strerror(errno));
        return false;
    }

    // Owner only: whoever can open the socket can run commands.
    chmod(path.c_str(), 0600);

    if (listen(fd.get(), 64) < 0)
    {
        LOG_ERROR(std::string("supervisor: listen: ") + std::strerror(errno));
        unlink(path.c_str());
        return false;
    }

    m_listen = std::move(fd);
    return true;
}

bool supervisor::setup(event_loop& loop)
{
    m_loop = &loop;

    if (!bind_socket())
        return false;

    if (write_pid_file(m_config.pid_file))
        m_pid_written = true;
    else
        LOG_WARN("supervisor: could not write pid file " + m_config.pid_file.string());

    m_accept_req = { this, nullptr, m_listen.get(), 0, op_accept };
    m_tick_req = { this, nullptr, -1, 0, op_timeout };

    auto ms = m_config.socket_timeout.count();
    m_tick_ts.tv_sec = ms / 1000;
    m_tick_ts.tv_nsec = (ms % 1000) * 1000000;

    m_loop->submit_accept(m_listen.get(), &m_accept_req);
    submit_tick();

    LOG_INFO("supervisor: listening on " + m_config.socket_path.string());
    return true;
}

void supervisor::run()
{
    if (m_loop && m_running.load(std::memory_order_acquire))
    {
        m_loop->flush();
        m_loop->run();
    }

    m_running.store(false, std::memory_order_release);
    LOG_INFO("supervisor: stopping, " + std::to_string(m_processes.size()) + " managed processes");

    stop_all_processes();

    if (size_t n = active_tasks(); n > 0)
        LOG_INFO("supervisor: waiting for " + std::to_string(n) + " in-flight tasks");
    wait_for_tasks();
}

void supervisor::teardown()
{
    if (m_listen)
    {
        m_listen.reset();
        unlink(m_config.socket_path.c_str());
    }

    if (m_pid_written)
    {
        remove_pid_file(m_config.pid_file);
        m_pid_written = false;
    }
}

void supervisor::request_shutdown()
{
    m_running.store(false, std::memory_order_release);
    if (m_loop)
        m_loop->request_stop();
}

// ─── event loop ───

void supervisor::on_cqe(struct io_uring_cqe* cqe)
{
    auto* req = static_cast<io_request*>(io_uring_cqe_get_data(cqe));
    if (!req)
        return;

    switch (req->type)
    {
        case op_accept:
            handle_accept(cqe);
            break;
        case op_timeout:
            handle_tick(cqe);
            break;
        default:
            break;
    }
}

void supervisor::handle_accept(struct io_uring_cqe* cqe)
{
    int client_fd = cqe->res;

    if (client_fd >= 0)
    {
        scoped_fd fd(client_fd);
        if (running())
            spawn_worker(std::move(fd));
    }
    else if (client_fd != -ECANCELED)
    {
        LOG_WARN(std::string("supervisor: accept failed: ") + std::strerror(-client_fd));
    }

    if (running())
        m_loop->submit_accept(m_listen.get(), &m_accept_req);
}

void supervisor::handle_tick(struct io_uring_cqe*)
{
    if (!running())
    {
        m_loop->request_stop();
        return;
    }

    // reaps children that exited on their own so they do not linger as zombies
    if (size_t n = m_processes.refresh_exit_states(); n > 0)
        LOG_DEBUG("supervisor: " + std::to_string(n) + " managed processes exited");

    submit_tick();
}

void supervisor::submit_tick()
{
    m_loop->submit_timeout(&m_tick_ts, &m_tick_req);
}

// ─── connections ───

void supervisor::spawn_worker(scoped_fd fd)
{
    try
    {
        std::thread([this, guard = task_guard(*this), conn = std::move(fd)]() mutable {
            handle_connection(std::move(conn));
        }).detach();
    }
    catch (const std::system_error& e)
    {
        LOG_ERROR(std::string("supervisor: could not start connection thread: ") + e.what());
    }
}

void supervisor::handle_connection(scoped_fd fd)
{
    connection_handler conn(*this, std::move(fd));
    conn.run();
}

nlohmann::json supervisor::execute(const request& req)
{
    try
    {
        return m_commands.dispatch(*this, req.command, req.args);
    }
    catch (const dispatch_error& e)
    {
        return make_error(e.what());
    }
}

// ─── processes ───

void supervisor::adopt_process(const std::string& name, std::shared_ptr<child_process> handle,
                               const std::string& kind, nlohmann::json metadata)
{
    try
    {
        m_processes.register_process(name, handle, kind, std::move(metadata));
    }
    catch (const duplicate_name_error&)
    {
        LOG_WARN("supervisor: name collision on " + name + ", terminating pid " + std::to_string(handle->pid()));
        try
        {
            handle->terminate(m_config.termination_timeout);
        }
        catch (const process_error& e)
        {
            LOG_ERROR(std::string("supervisor: ") + e.what());
        }
        throw;
    }

    LOG_INFO("supervisor: managing " + kind + " process " + name + " (pid " + std::to_string(handle->pid()) + ")");
}

bool supervisor::stop_process(std::string_view name)
{
    auto handle = m_processes.handle(name);
    if (!handle)
        throw not_found_error(name);

    bool killed = false;
    try
    {
        killed = handle->terminate(m_config.termination_timeout);
    }
    catch (const process_error& e)
    {
        m_processes.remove(name);
        LOG_ERROR("supervisor: stopping " + std::string(name) + ": " + e.what());
        throw;
    }

    m_processes.remove(name);

    if (killed)
        LOG_WARN("supervisor: " + std::string(name) + " ignored SIGTERM for " +
                 std::to_string(m_config.termination_timeout.count()) + "ms, killed");
    else
        LOG_INFO("supervisor: stopped " + std::string(name));

    return killed;
}

void supervisor::stop_all_processes()
{
    for (const auto& name : m_processes.names())
    {
        try
        {
            stop_process(name);
        }
        catch (const procvisor_error& e)
        {
            LOG_WARN(std::string("supervisor: ") + e.what());
        }
    }
}

// ─── task accounting ───

void supervisor::begin_task()
{
    std::lock_guard<std::mutex> lock(m_task_mutex);
    ++m_active_tasks;
}

void supervisor::end_task()
{
    {
        std::lock_guard<std::mutex> lock(m_task_mutex);
        --m_active_tasks;
    }
    m_task_cv.notify_all();
}

size_t supervisor::active_tasks() const
{
    std::lock_guard<std::mutex> lock(m_task_mutex);
    return m_active_tasks;
}

void supervisor::wait_for_tasks()
{
    std::unique_lock<std::mutex> lock(m_task_mutex);
    m_task_cv.wait(lock, [this] { return m_active_tasks == 0; });
}

// ─── built-in commands ───

nlohmann::json supervisor::cmd_status(const std::vector<std::string>&)
{
    nlohmann::json procs = nlohmann::json::object();

    for (const auto& r : m_processes.list_all())
    {
        nlohmann::json p = {
            {"status", r.running() ? "running" : "stopped"},
            {"pid", r.pid},
            {"kind", r.kind},
            {"command", metadata_string(r.metadata, "command")},
            {"started", iso_timestamp(r.started)}
        };
        if (!r.running())
        {
            p["return_code"] = *r.exit_code;
            if (r.ended)
                p["ended"] = iso_timestamp(*r.ended);
        }
        procs[r.name] = std::move(p);
    }

    return {{"success", true}, {"processes", std::move(procs)}};
}

nlohmann::json supervisor::cmd_list_commands(const std::vector<std::string>&)
{
    nlohmann::json cmds = nlohmann::json::object();
    for (const auto& [name, help] : m_commands.list())
        cmds[name] = help;
    return {{"success", true}, {"commands", std::move(cmds)}};
}

nlohmann::json supervisor::cmd_help(const std::vector<std::string>& args)
{
    if (args.empty())
        return make_error("Please specify a command name");

    const std::string& name = args[0];
    const command_entry* entry = m_commands.find(name);
    if (!entry)
        return make_error("Unknown command: " + name);

    std::string text = entry->help;
    nlohmann::json out = {{"success", true}, {"command", name}};

    if (entry->schema)
    {
        text += "\n\n" + entry->schema->render();
        out["schema"] = entry->schema->to_json();
    }

    out["help"] = std::move(text);
    return out;
}

nlohmann::json supervisor::cmd_shutdown(const std::vector<std::string>&)
{
    LOG_INFO("supervisor: shutdown requested");
    stop_all_processes();
    request_shutdown();
    return make_success("Shutdown initiated");
}

static std::string read_cmdline(pid_t pid)
{
    std::ifstream in("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
    if (!in)
        return {};

    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    for (char& c : raw)
    {
        if (c == '\0')
            c = ' ';
    }
    return raw;
}

nlohmann::json supervisor::cmd_restart_manager(const std::vector<std::string>&)
{
    const std::string& launcher = m_config.launcher_name;
    pid_t parent = getppid();

    std::string cmdline = parent > 1 ? read_cmdline(parent) : std::string();
    if (cmdline.empty() || cmdline.find(launcher) == std::string::npos)
    {
        return make_error("Could not find " + launcher + " parent process.\n\n"
                          "To manually restart the supervisor:\n"
                          "1. Find the " + launcher + " process: ps aux | grep " + launcher + "\n"
                          "2. Send SIGHUP: kill -HUP <pid>\n"
                          "3. Or restart the " + launcher + " process in your terminal");
    }

    if (kill(parent, SIGHUP) < 0)
    {
        return make_error(std::string("Failed to send restart signal: ") + std::strerror(errno) +
                          "\n\nTo manually restart the supervisor, send SIGHUP to the " + launcher +
                          " process (pid " + std::to_string(parent) + ").");
    }

    LOG_INFO("supervisor: restart requested, sent SIGHUP to " + launcher + " (pid " + std::to_string(parent) + ")");
    return make_success("Supervisor restart requested via SIGHUP. The supervisor should restart automatically.");
}
