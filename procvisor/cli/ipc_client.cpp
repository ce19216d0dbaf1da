#include "ipc_client.h"
#include "../shared/errors.h"
#include "../shared/scoped_fd.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

static scoped_fd connect_socket(const std::filesystem::path& socket_path, std::string& error)
{
    const std::string path = socket_path.string();

    struct sockaddr_un addr{};
    if (path.empty() || path.size() >= sizeof(addr.sun_path))
    {
        error = "socket path unusable: '" + path + "'";
        return {};
    }

    scoped_fd fd(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd)
    {
        error = std::string("socket: ") + std::strerror(errno);
        return {};
    }

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        error = "connect " + path + ": " + std::strerror(errno);
        return {};
    }

    return fd;
}

bool socket_accepts(const std::filesystem::path& socket_path)
{
    std::string ignored;
    return static_cast<bool>(connect_socket(socket_path, ignored));
}

int ipc_send(const std::filesystem::path& socket_path, const request& req,
             nlohmann::json& response, std::string& error,
             std::chrono::milliseconds timeout)
{
    scoped_fd fd = connect_socket(socket_path, error);
    if (!fd)
        return -1;

    fd.set_io_timeout(timeout);

    try
    {
        framed_codec codec(fd.get(), default_max_message_size);
        codec.write_message(serialize(to_json(req)));

        std::string payload = codec.read_message();
        response = nlohmann::json::parse(payload, nullptr, false);
        if (response.is_discarded() || !response.is_object())
        {
            error = "daemon sent a malformed response";
            return -1;
        }
    }
    catch (const protocol_error& e)
    {
        error = e.what();
        return -1;
    }

    return 0;
}
