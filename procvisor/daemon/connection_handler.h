#pragma once
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../shared/scoped_fd.h"
#include "../shared/wire_codec.h"

class supervisor;
struct supervisor_config;

enum class connection_state : uint8_t
{
    detect,
    read_request,
    dispatch,
    write_response,
    error,
    close
};

const char* state_name(connection_state s);

// One request/response exchange on an accepted socket. run() never throws:
// every failure ends in a best-effort error response and the socket closing.
class connection_handler
{
public:
    connection_handler(supervisor& sv, scoped_fd fd);

    void run() noexcept;

    connection_state state() const { return m_state; }
    std::optional<wire_protocol> protocol() const;

private:
    void step();
    void on_detect();
    void on_read_request();
    void on_dispatch();
    void on_write_response();
    void on_error();

    void fail(std::string message);
    std::string encode_response();

    supervisor& m_sv;
    const supervisor_config& m_config;
    scoped_fd m_fd;
    connection_state m_state = connection_state::detect;

    std::unique_ptr<message_codec> m_codec;
    std::optional<request> m_request;
    nlohmann::json m_response;
    std::string m_error;
    bool m_write_attempted = false;
};
