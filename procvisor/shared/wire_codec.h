#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

// Framed messages: 8-byte big-endian payload length, then UTF-8 JSON.
// Legacy messages: raw JSON, no prefix, delimited by the JSON value itself.

constexpr size_t frame_header_size = 8;
constexpr uint64_t default_max_message_size = 10'000'000;

enum class wire_protocol : uint8_t
{
    framed,
    legacy
};

const char* protocol_name(wire_protocol p);

struct request
{
    std::string command;
    std::vector<std::string> args;

    bool operator==(const request&) const = default;
};

// Throws protocol_error when the payload is not a request object.
request parse_request(std::string_view payload);
nlohmann::json to_json(const request& req);

// Never throws: invalid UTF-8 inside strings is replaced.
std::string serialize(const nlohmann::json& j);

nlohmann::json make_success(std::string_view message = {});
nlohmann::json make_error(std::string_view message);

void encode_length(uint64_t n, char out[frame_header_size]);
uint64_t decode_length(const char in[frame_header_size]);
bool plausible_length(uint64_t n, uint64_t max_message_size);

std::string frame_payload(std::string_view payload);
// Throws protocol_error on a short buffer, an implausible length or a length
// that disagrees with the buffer.
std::string unframe_payload(std::string_view frame, uint64_t max_message_size = default_max_message_size);

// Blocking socket helpers. Both throw protocol_error on EOF, timeout or error.
void read_exact(int fd, char* buf, size_t len);
void write_all(int fd, std::string_view data);

// One request/response exchange over a connected stream socket.
class message_codec
{
public:
    virtual ~message_codec() = default;

    virtual wire_protocol protocol() const = 0;
    // Throws protocol_error.
    virtual std::string read_message() = 0;
    virtual void write_message(std::string_view payload) = 0;
};

class framed_codec : public message_codec
{
public:
    framed_codec(int fd, uint64_t max_message_size);

    wire_protocol protocol() const override { return wire_protocol::framed; }
    std::string read_message() override;
    void write_message(std::string_view payload) override;

private:
    int m_fd;
    uint64_t m_max;
};

class legacy_codec : public message_codec
{
public:
    legacy_codec(int fd, uint64_t max_message_size);

    wire_protocol protocol() const override { return wire_protocol::legacy; }
    std::string read_message() override;
    void write_message(std::string_view payload) override;

private:
    static constexpr size_t read_chunk = 4096;

    int m_fd;
    uint64_t m_max;
};

// Peeks (without consuming) up to 8 bytes for at most timeout. A plausible
// big-endian length selects framed; anything else, EOF or a timeout selects legacy.
wire_protocol detect_protocol(int fd, std::chrono::milliseconds timeout,
                              uint64_t max_message_size = default_max_message_size);

std::unique_ptr<message_codec> make_codec(wire_protocol protocol, int fd,
                                          uint64_t max_message_size = default_max_message_size);
