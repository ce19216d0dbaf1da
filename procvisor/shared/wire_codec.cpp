#include "wire_codec.h"
#include "errors.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <poll.h>
#include <sys/socket.h>

namespace {

constexpr size_t write_chunk = 64 * 1024;

std::string errno_text(const char* what)
{
    return std::string(what) + ": " + std::strerror(errno);
}

}

const char* protocol_name(wire_protocol p)
{
    switch (p)
    {
        case wire_protocol::framed: return "framed";
        case wire_protocol::legacy: return "legacy";
    }
    return "unknown";
}

request parse_request(std::string_view payload)
{
    nlohmann::json j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded())
        throw protocol_error("request is not valid JSON");
    if (!j.is_object())
        throw protocol_error("request must be a JSON object");

    request req;

    auto cmd = j.find("command");
    if (cmd == j.end() || !cmd->is_string())
        throw protocol_error("request has no command");
    req.command = cmd->get<std::string>();

    auto args = j.find("args");
    if (args != j.end() && !args->is_null())
    {
        if (!args->is_array())
            throw protocol_error("request args must be an array");
        req.args.reserve(args->size());
        for (const auto& a : *args)
        {
            if (a.is_string())
                req.args.push_back(a.get<std::string>());
            else
                req.args.push_back(a.dump());
        }
    }

    return req;
}

nlohmann::json to_json(const request& req)
{
    return nlohmann::json{{"command", req.command}, {"args", req.args}};
}

std::string serialize(const nlohmann::json& j)
{
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json make_success(std::string_view message)
{
    nlohmann::json j = {{"success", true}};
    if (!message.empty())
        j["message"] = std::string(message);
    return j;
}

nlohmann::json make_error(std::string_view message)
{
    return {{"success", false}, {"error", std::string(message)}};
}

void encode_length(uint64_t n, char out[frame_header_size])
{
    for (size_t i = 0; i < frame_header_size; ++i)
        out[i] = static_cast<char>((n >> (8 * (frame_header_size - 1 - i))) & 0xFF);
}

uint64_t decode_length(const char in[frame_header_size])
{
    uint64_t n = 0;
    for (size_t i = 0; i < frame_header_size; ++i)
        n = (n << 8) | static_cast<uint8_t>(in[i]);
    return n;
}

bool plausible_length(uint64_t n, uint64_t max_message_size)
{
    return n > 0 && n < max_message_size;
}

std::string frame_payload(std::string_view payload)
{
    std::string frame(frame_header_size, '\0');
    encode_length(payload.size(), frame.data());
    frame.append(payload);
    return frame;
}

std::string unframe_payload(std::string_view frame, uint64_t max_message_size)
{
    if (frame.size() < frame_header_size)
        throw protocol_error("frame shorter than its header");

    uint64_t len = decode_length(frame.data());
    if (!plausible_length(len, max_message_size))
        throw protocol_error("frame length " + std::to_string(len) + " out of bounds");
    if (frame.size() - frame_header_size != len)
        throw protocol_error("frame length " + std::to_string(len) + " does not match payload of " +
                             std::to_string(frame.size() - frame_header_size) + " bytes");

    return std::string(frame.substr(frame_header_size));
}

void read_exact(int fd, char* buf, size_t len)
{
    size_t got = 0;
    while (got < len)
    {
        ssize_t n = ::recv(fd, buf + got, len - got, 0);
        if (n > 0)
        {
            got += static_cast<size_t>(n);
            continue;
        }
        if (n == 0)
            throw protocol_error("peer closed after " + std::to_string(got) + " of " +
                                 std::to_string(len) + " bytes");
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            throw protocol_error("read timed out");
        throw protocol_error(errno_text("recv"));
    }
}

void write_all(int fd, std::string_view data)
{
    size_t sent = 0;
    while (sent < data.size())
    {
        size_t chunk = std::min(write_chunk, data.size() - sent);
        ssize_t n = ::send(fd, data.data() + sent, chunk, MSG_NOSIGNAL);
        if (n >= 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            throw protocol_error("write timed out");
        throw protocol_error(errno_text("send"));
    }
}

// ─── framed ───

framed_codec::framed_codec(int fd, uint64_t max_message_size)
    : m_fd(fd), m_max(max_message_size)
{
}

std::string framed_codec::read_message()
{
    char header[frame_header_size];
    read_exact(m_fd, header, sizeof(header));

    uint64_t len = decode_length(header);
    if (!plausible_length(len, m_max))
        throw protocol_error("frame length " + std::to_string(len) + " out of bounds");

    std::string payload(len, '\0');
    read_exact(m_fd, payload.data(), payload.size());
    return payload;
}

void framed_codec::write_message(std::string_view payload)
{
    char header[frame_header_size];
    encode_length(payload.size(), header);
    write_all(m_fd, std::string_view(header, sizeof(header)));
    write_all(m_fd, payload);
}

// ─── legacy ───

legacy_codec::legacy_codec(int fd, uint64_t max_message_size)
    : m_fd(fd), m_max(max_message_size)
{
}

static bool ends_like_object(const std::string& buf)
{
    auto pos = buf.find_last_not_of(" \t\r\n");
    return pos != std::string::npos && buf[pos] == '}';
}

std::string legacy_codec::read_message()
{
    std::string buf;
    char chunk[read_chunk];

    while (true)
    {
        ssize_t n = ::recv(m_fd, chunk, sizeof(chunk), 0);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                throw protocol_error("read timed out");
            throw protocol_error(errno_text("recv"));
        }

        if (n == 0)
        {
            if (buf.empty())
                throw peer_closed_error("connection closed before a request arrived");
            if (nlohmann::json::accept(buf))
                return buf;
            throw protocol_error("connection closed before a complete request");
        }

        buf.append(chunk, static_cast<size_t>(n));
        if (buf.size() >= m_max)
            throw protocol_error("request exceeds " + std::to_string(m_max) + " bytes");

        if (ends_like_object(buf) && nlohmann::json::accept(buf))
            return buf;
    }
}

void legacy_codec::write_message(std::string_view payload)
{
    write_all(m_fd, payload);
}

// ─── detection ───

wire_protocol detect_protocol(int fd, std::chrono::milliseconds timeout, uint64_t max_message_size)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char peek[frame_header_size];
    ssize_t last = -1;

    while (true)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return wire_protocol::legacy;

        struct pollfd pfd{fd, POLLIN | POLLRDHUP, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0 && errno == EINTR)
            continue;
        if (ready <= 0)
            return wire_protocol::legacy;

        ssize_t n = ::recv(fd, peek, sizeof(peek), MSG_PEEK | MSG_DONTWAIT);
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                continue;
            return wire_protocol::legacy;
        }
        if (n == 0)
            return wire_protocol::legacy;

        if (static_cast<size_t>(n) == frame_header_size)
        {
            return plausible_length(decode_length(peek), max_message_size) ? wire_protocol::framed
                                                                           : wire_protocol::legacy;
        }

        // Partial header: the socket stays readable, so wait for more bytes
        // instead of spinning on the same peek.
        if (n == last)
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        last = n;

        // A peer that half-closed after a short write will never complete the header.
        if (pfd.revents & (POLLHUP | POLLRDHUP))
            return wire_protocol::legacy;
    }
}

std::unique_ptr<message_codec> make_codec(wire_protocol protocol, int fd, uint64_t max_message_size)
{
    if (protocol == wire_protocol::framed)
        return std::make_unique<framed_codec>(fd, max_message_size);
    return std::make_unique<legacy_codec>(fd, max_message_size);
}
