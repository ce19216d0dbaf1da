#include "paths.h"
#include <unistd.h>
#include <pwd.h>
#include <cstdlib>

namespace fs = std::filesystem;

static fs::path get_home()
{
    const char* home = std::getenv("HOME");
    if (home && home[0])
        return home;

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir)
        return pw->pw_dir;

    return {};
}

static fs::path env_path(const char* name)
{
    const char* value = std::getenv(name);
    if (value && value[0])
        return value;
    return {};
}

procvisor_paths procvisor_paths::resolve()
{
    procvisor_paths p;
    std::string uid = std::to_string(getuid());

    fs::path home = get_home();
    if (!home.empty())
    {
        p.state_dir   = home / ".local" / "share" / "procvisor";
        p.plugin_dir  = home / ".config" / "procvisor" / "commands";
        p.config_path = home / ".config" / "procvisor" / "config.lua";
        p.agent_home  = home / ".claude";
    }
    else
    {
        p.state_dir  = "/tmp/procvisor-" + uid;
        p.plugin_dir = p.state_dir / "commands";
        p.config_path.clear();
    }

    if (fs::path dir = env_path("PROCVISOR_STATE_DIR"); !dir.empty())
        p.state_dir = dir;

    p.log_dir  = p.state_dir / "logs";
    p.pid_file = p.state_dir / "procvisor.pid";

    if (fs::path sock = env_path("PROCVISOR_SOCKET"); !sock.empty())
        p.socket_path = sock;
    else if (fs::path run = env_path("XDG_RUNTIME_DIR"); !run.empty())
        p.socket_path = run / "procvisor.sock";
    else
        p.socket_path = "/tmp/procvisor-" + uid + ".sock";

    if (fs::path cfg = env_path("PROCVISOR_CONFIG"); !cfg.empty())
        p.config_path = cfg;

    std::error_code ec;
    fs::create_directories(p.log_dir, ec);

    return p;
}
