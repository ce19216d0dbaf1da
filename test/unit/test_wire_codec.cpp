#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../procvisor/shared/wire_codec.h"
#include "../../procvisor/shared/errors.h"
#include "../../procvisor/shared/scoped_fd.h"

#include <chrono>
#include <thread>
#include <sys/socket.h>

using namespace std::chrono_literals;

struct socket_pair
{
    scoped_fd a;
    scoped_fd b;

    socket_pair()
    {
        int fds[2];
        REQUIRE(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0);
        a.reset(fds[0]);
        b.reset(fds[1]);
    }
};

TEST_CASE("parse_request")
{
    SUBCASE("command with args")
    {
        auto r = parse_request(R"({"command":"bash","args":["sleep 5","--name","x"]})");
        CHECK(r.command == "bash");
        REQUIRE(r.args.size() == 3);
        CHECK(r.args[0] == "sleep 5");
        CHECK(r.args[2] == "x");
    }

    SUBCASE("args may be absent or null")
    {
        CHECK(parse_request(R"({"command":"status"})").args.empty());
        CHECK(parse_request(R"({"command":"status","args":null})").args.empty());
    }

    SUBCASE("non-string args are stringified")
    {
        auto r = parse_request(R"({"command":"bash-watch","args":["job",50,true]})");
        REQUIRE(r.args.size() == 3);
        CHECK(r.args[1] == "50");
        CHECK(r.args[2] == "true");
    }

    SUBCASE("malformed requests")
    {
        CHECK_THROWS_AS(parse_request("not json"), protocol_error);
        CHECK_THROWS_AS(parse_request("[1,2]"), protocol_error);
        CHECK_THROWS_AS(parse_request(R"({"args":[]})"), protocol_error);
        CHECK_THROWS_AS(parse_request(R"({"command":5})"), protocol_error);
        CHECK_THROWS_AS(parse_request(R"({"command":"x","args":"y"})"), protocol_error);
    }

    SUBCASE("round trip through to_json")
    {
        request req{"help", {"bash"}};
        CHECK(parse_request(serialize(to_json(req))) == req);
    }
}

TEST_CASE("response helpers")
{
    CHECK((make_success() == nlohmann::json{{"success", true}}));
    CHECK(make_success("ok")["message"] == "ok");

    auto err = make_error("Unknown command: bogus");
    CHECK(err["success"] == false);
    CHECK(err["error"] == "Unknown command: bogus");

    // invalid UTF-8 never makes serialize throw
    nlohmann::json j = {{"output", std::string("bad \xff byte")}};
    CHECK_NOTHROW(serialize(j));
}

TEST_CASE("length prefix")
{
    char buf[frame_header_size];

    encode_length(0x0102030405060708ULL, buf);
    CHECK(static_cast<uint8_t>(buf[0]) == 0x01);
    CHECK(static_cast<uint8_t>(buf[7]) == 0x08);
    CHECK(decode_length(buf) == 0x0102030405060708ULL);

    CHECK_FALSE(plausible_length(0, default_max_message_size));
    CHECK(plausible_length(1, default_max_message_size));
    CHECK(plausible_length(default_max_message_size - 1, default_max_message_size));
    CHECK_FALSE(plausible_length(default_max_message_size, default_max_message_size));

    std::string frame = frame_payload(R"({"command":"status"})");
    CHECK(frame.size() == frame_header_size + 20);
    CHECK(unframe_payload(frame) == R"({"command":"status"})");

    CHECK_THROWS_AS(unframe_payload("abc"), protocol_error);
    CHECK_THROWS_AS(unframe_payload(frame.substr(0, frame.size() - 1)), protocol_error);
}

TEST_CASE("framed codec carries a 2 MB payload")
{
    socket_pair sp;
    std::string big(2 * 1024 * 1024, 'x');
    std::string payload = "{\"output\":\"" + big + "\"}";

    std::thread writer([&] {
        framed_codec out(sp.a.get(), default_max_message_size);
        out.write_message(payload);
    });

    framed_codec in(sp.b.get(), default_max_message_size);
    std::string got = in.read_message();
    writer.join();

    CHECK(got.size() == payload.size());
    CHECK(got == payload);
}

TEST_CASE("framed codec rejects an oversized length")
{
    socket_pair sp;
    char header[frame_header_size];
    encode_length(default_max_message_size + 1, header);
    write_all(sp.a.get(), std::string_view(header, frame_header_size));

    framed_codec in(sp.b.get(), default_max_message_size);
    CHECK_THROWS_AS(in.read_message(), protocol_error);
}

TEST_CASE("protocol detection")
{
    socket_pair sp;

    SUBCASE("length prefix selects framed")
    {
        write_all(sp.a.get(), frame_payload(R"({"command":"status"})"));
        CHECK(detect_protocol(sp.b.get(), 200ms) == wire_protocol::framed);

        // detection consumed nothing
        auto codec = make_codec(wire_protocol::framed, sp.b.get());
        CHECK(parse_request(codec->read_message()).command == "status");
    }

    SUBCASE("raw JSON selects legacy")
    {
        write_all(sp.a.get(), R"({"command":"status","args":[]})");
        CHECK(detect_protocol(sp.b.get(), 200ms) == wire_protocol::legacy);

        auto codec = make_codec(wire_protocol::legacy, sp.b.get());
        CHECK(parse_request(codec->read_message()).command == "status");
    }

    SUBCASE("short write then close falls back to legacy")
    {
        write_all(sp.a.get(), "{\"co");
        shutdown(sp.a.get(), SHUT_WR);

        wire_protocol p = wire_protocol::framed;
        CHECK_NOTHROW(p = detect_protocol(sp.b.get(), 200ms));
        CHECK(p == wire_protocol::legacy);
    }

    SUBCASE("silence times out to legacy")
    {
        auto start = std::chrono::steady_clock::now();
        CHECK(detect_protocol(sp.b.get(), 50ms) == wire_protocol::legacy);
        CHECK(std::chrono::steady_clock::now() - start < 2s);
    }
}

TEST_CASE("legacy codec")
{
    socket_pair sp;

    SUBCASE("message split across writes")
    {
        std::thread writer([&] {
            write_all(sp.a.get(), R"({"command":"bash",)");
            std::this_thread::sleep_for(20ms);
            write_all(sp.a.get(), R"("args":["echo }"]})");
        });

        legacy_codec in(sp.b.get(), default_max_message_size);
        auto r = parse_request(in.read_message());
        writer.join();

        CHECK(r.command == "bash");
        REQUIRE(r.args.size() == 1);
        CHECK(r.args[0] == "echo }");
    }

    SUBCASE("peer closes before sending anything")
    {
        sp.a.reset();
        legacy_codec in(sp.b.get(), default_max_message_size);
        CHECK_THROWS_AS(in.read_message(), peer_closed_error);
    }

    SUBCASE("peer closes mid-message")
    {
        write_all(sp.a.get(), R"({"command":"sta)");
        sp.a.reset();
        legacy_codec in(sp.b.get(), default_max_message_size);
        CHECK_THROWS_AS(in.read_message(), protocol_error);
    }

    SUBCASE("message over the limit")
    {
        std::string big = "{\"command\":\"" + std::string(10000, 'a') + "\"}";
        std::thread writer([&] {
            try
            {
                write_all(sp.a.get(), big);
            }
            catch (const protocol_error&)
            {
            }
        });

        legacy_codec in(sp.b.get(), 1000);
        CHECK_THROWS_AS(in.read_message(), protocol_error);

        sp.b.reset();
        writer.join();
    }

    SUBCASE("responses are written without a prefix")
    {
        legacy_codec out(sp.a.get(), default_max_message_size);
        out.write_message(R"({"success":true})");
        sp.a.reset();

        char buf[64];
        ssize_t n = recv(sp.b.get(), buf, sizeof(buf), 0);
        CHECK(std::string(buf, n) == R"({"success":true})");
    }
}
