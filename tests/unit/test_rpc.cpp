#include <catch2/catch.hpp>
#include <streamecho/rpc/rpc.hpp>
#include <streamecho/echo/messages.hpp>

#include "../test_helpers.hpp"

#include <sys/socket.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace streamecho::rpc;
using streamecho::echo::EchoRequest;
using streamecho::echo::EchoResponse;

// ============================================================================
// Test message types
// ============================================================================

struct SimpleMessage {
    int32_t id;
    std::string name;

    STREAMECHO_RPC_FIELDS(SimpleMessage, id, name)
};

namespace {

// Connected pair of stream sockets wrapped as tcp_streams
struct stream_pair {
    streamecho::net::tcp_stream a{-1};
    streamecho::net::tcp_stream b{-1};

    stream_pair() {
        int fds[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        a = streamecho::net::tcp_stream(fds[0]);
        b = streamecho::net::tcp_stream(fds[1]);
    }
};

message_buffer to_message(buffer_writer writer) {
    return message_buffer(writer.take());
}

message_buffer bytes(size_t n) {
    return message_buffer(std::vector<uint8_t>(n, 'x'));
}

// Queue data on fd until the kernel refuses more
void fill_send_buffer(int fd) {
    char chunk[4096] = {};
    for (size_t size : {sizeof(chunk), size_t{1}}) {
        while (::send(fd, chunk, size, MSG_DONTWAIT) > 0) {
        }
    }
}

} // namespace

// ============================================================================
// Buffer tests
// ============================================================================

TEST_CASE("buffer_writer basic operations", "[rpc][buffer]") {
    buffer_writer writer;

    SECTION("write primitive types") {
        writer.write(int32_t{42});
        writer.write(int64_t{12345678901234LL});
        writer.write(double{3.14159});
        REQUIRE(writer.size() == sizeof(int32_t) + sizeof(int64_t) + sizeof(double));
    }

    SECTION("write string") {
        writer.write_string("Hello, World!");
        // 4 bytes length prefix + 13 bytes string
        REQUIRE(writer.size() == 4 + 13);
    }

    SECTION("read back through a view") {
        writer.write(int32_t{42});
        writer.write_string("test");
        writer.write(uint8_t{7});

        buffer_view view = writer.view();
        REQUIRE(view.read<int32_t>() == 42);
        REQUIRE(view.read_string() == "test");
        REQUIRE(view.read<uint8_t>() == 7);
        REQUIRE(view.remaining() == 0);
    }
}

TEST_CASE("buffer error handling", "[rpc][buffer]") {
    SECTION("read past end") {
        buffer_writer writer;
        writer.write(int16_t{1});
        buffer_view view = writer.view();
        REQUIRE_THROWS_AS(view.read<int32_t>(), serialization_error);
    }

    SECTION("string length beyond buffer") {
        buffer_writer writer;
        writer.write(uint32_t{1000});
        writer.write_bytes("abc", 3);
        buffer_view view = writer.view();
        REQUIRE_THROWS_AS(view.read_string(), serialization_error);
    }

}

// ============================================================================
// Serialization tests
// ============================================================================

TEST_CASE("serialize echo messages", "[rpc][serialize]") {
    EchoRequest request{"hello stream"};
    auto writer = serialize(request);
    auto decoded = deserialize_message<EchoRequest>(writer.data(), writer.size());
    REQUIRE(decoded.message == "hello stream");

    SECTION("empty message") {
        auto empty = serialize(EchoResponse{""});
        REQUIRE(empty.size() == 4);
        REQUIRE(deserialize_message<EchoResponse>(empty.data(), empty.size()).message.empty());
    }

    SECTION("trailing bytes are rejected") {
        writer.write(uint8_t{0});
        REQUIRE_THROWS_AS(deserialize_message<EchoRequest>(writer.data(), writer.size()),
                          serialization_error);
    }

    SECTION("truncated payload is rejected") {
        REQUIRE_THROWS_AS(deserialize_message<EchoRequest>(writer.data(), writer.size() - 1),
                          serialization_error);
    }
}

TEST_CASE("serialize field-listed struct", "[rpc][serialize]") {
    SimpleMessage msg{-7, "seven"};
    auto writer = serialize(msg);
    // int32 id, then the length-prefixed name, in declaration order
    REQUIRE(writer.size() == sizeof(int32_t) + 4 + 5);

    buffer_view view = writer.view();
    REQUIRE(view.read<int32_t>() == -7);
    REQUIRE(view.read_string() == "seven");

    auto decoded = deserialize_message<SimpleMessage>(writer.data(), writer.size());
    REQUIRE(decoded.id == -7);
    REQUIRE(decoded.name == "seven");
}

// ============================================================================
// Method and status tests
// ============================================================================

TEST_CASE("echo method descriptors", "[rpc][methods]") {
    using namespace streamecho::echo;
    STATIC_REQUIRE(EchoClientStream::id == 1);
    STATIC_REQUIRE(EchoServerStream::id == 2);
    STATIC_REQUIRE(EchoBidirectionalStreamSync::id == 3);
    STATIC_REQUIRE(EchoBidirectionalStreamAsync::id == 4);
    STATIC_REQUIRE(EchoClientStream::kind == call_kind::client_streaming);
    STATIC_REQUIRE(EchoServerStream::kind == call_kind::server_streaming);
    STATIC_REQUIRE(EchoBidirectionalStreamAsync::kind == call_kind::bidi_streaming);
    REQUIRE(std::string(call_kind_str(call_kind::bidi_streaming)) == "bidi-streaming");
}

TEST_CASE("status for cancel reasons", "[rpc][status]") {
    using streamecho::sync::cancel_reason;
    REQUIRE(status_for(cancel_reason::none) == status_code::ok);
    REQUIRE(status_for(cancel_reason::peer_cancelled) == status_code::cancelled);
    REQUIRE(status_for(cancel_reason::peer_disconnected) == status_code::cancelled);
    REQUIRE(status_for(cancel_reason::server_shutdown) == status_code::cancelled);
    REQUIRE(status_for(cancel_reason::deadline_exceeded) == status_code::deadline_exceeded);
    REQUIRE(status_for(cancel_reason::processing_fault) == status_code::internal);
    REQUIRE(status_for(cancel_reason::transport_fault) == status_code::unavailable);
}

TEST_CASE("rpc_result", "[rpc][result]") {
    SECTION("success") {
        rpc_result<int> result(42);
        REQUIRE(result.ok());
        REQUIRE(static_cast<bool>(result));
        REQUIRE(result.value() == 42);
        REQUIRE(*result == 42);
    }

    SECTION("failure") {
        rpc_result<int> result(rpc_status{status_code::unavailable, "connection lost"});
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.code() == status_code::unavailable);
        REQUIRE(result.status().detail == "connection lost");
        REQUIRE_THROWS_AS(result.value(), stream_error);
    }
}

// ============================================================================
// Protocol tests
// ============================================================================

TEST_CASE("frame header serialization", "[rpc][protocol]") {
    frame_header original;
    original.stream_id = 12345;
    original.type = frame_type::status;
    original.flags = frame_flags::has_timeout;
    original.method_id = 4;
    original.payload_length = 1024;

    auto bytes = original.to_bytes();
    REQUIRE(bytes.size() == frame_header_size);
    // "SECH" on the wire
    REQUIRE(bytes[0] == 'S');
    REQUIRE(bytes[1] == 'E');
    REQUIRE(bytes[2] == 'C');
    REQUIRE(bytes[3] == 'H');

    auto parsed = frame_header::from_bytes(bytes.data());
    REQUIRE(parsed.magic == protocol_magic);
    REQUIRE(parsed.stream_id == 12345);
    REQUIRE(parsed.type == frame_type::status);
    REQUIRE(has_flag(parsed.flags, frame_flags::has_timeout));
    REQUIRE(parsed.method_id == 4);
    REQUIRE(parsed.payload_length == 1024);
}

TEST_CASE("frame header validation", "[rpc][protocol]") {
    frame_header header;
    header.payload_length = 100;
    REQUIRE(header.is_valid(default_max_message_size));

    SECTION("bad magic") {
        header.magic = 0xDEADBEEF;
        REQUIRE_FALSE(header.is_valid(default_max_message_size));
    }

    SECTION("oversized payload") {
        REQUIRE_FALSE(header.is_valid(50));
    }

    SECTION("unknown frame type") {
        header.type = static_cast<frame_type>(42);
        REQUIRE_FALSE(header.is_valid(default_max_message_size));
    }
}

TEST_CASE("open frame carries an optional timeout", "[rpc][protocol]") {
    SECTION("with timeout") {
        auto [header, payload] = build_open(7, 4, 2500u);
        REQUIRE(header.type == frame_type::open);
        REQUIRE(header.method_id == 4);
        REQUIRE(header.payload_length == sizeof(uint32_t));
        REQUIRE(parse_open(to_message(payload), header.flags) == std::optional<uint32_t>(2500));
    }

    SECTION("without timeout") {
        auto [header, payload] = build_open(7, 4);
        REQUIRE(header.payload_length == 0);
        REQUIRE_FALSE(parse_open(to_message(payload), header.flags).has_value());
    }
}

TEST_CASE("status frame", "[rpc][protocol]") {
    auto [header, payload] = build_status(9, {status_code::internal, "processing failed"});
    REQUIRE(header.type == frame_type::status);
    REQUIRE(header.stream_id == 9);

    auto status = parse_status(to_message(payload));
    REQUIRE(status.code == status_code::internal);
    REQUIRE(status.detail == "processing failed");
}

TEST_CASE("control frames have no payload", "[rpc][protocol]") {
    REQUIRE(build_half_close(3).type == frame_type::half_close);
    REQUIRE(build_cancel(3).type == frame_type::cancel);
    REQUIRE(build_ping(5).type == frame_type::ping);
    REQUIRE(build_pong(5).type == frame_type::pong);
    REQUIRE(build_pong(5).stream_id == 5);
    REQUIRE(build_cancel(3).payload_length == 0);
}

TEST_CASE("stream ids are unique", "[rpc][protocol]") {
    stream_id_generator ids;
    auto first = ids.next();
    auto second = ids.next();
    REQUIRE(first != 0);
    REQUIRE(second != first);
}

TEST_CASE("frames over a stream socket", "[rpc][protocol]") {
    stream_pair pair;

    SECTION("message frame round trip") {
        auto [header, payload] = build_message(11, EchoRequest{"over the wire"});
        REQUIRE(write_frame(pair.a, header, payload));

        auto f = read_frame(pair.b, default_max_message_size);
        REQUIRE(f.has_value());
        REQUIRE(f->header.type == frame_type::message);
        REQUIRE(f->header.stream_id == 11);
        REQUIRE(parse_message<EchoRequest>(f->payload).message == "over the wire");
    }

    SECTION("several frames stay in order") {
        REQUIRE(write_frame(pair.a, build_ping(1), nullptr, 0));
        REQUIRE(write_frame(pair.a, build_half_close(2), nullptr, 0));

        auto first = read_frame(pair.b, default_max_message_size);
        auto second = read_frame(pair.b, default_max_message_size);
        REQUIRE(first->header.type == frame_type::ping);
        REQUIRE(second->header.type == frame_type::half_close);
        REQUIRE(second->header.stream_id == 2);
    }

    SECTION("clean close between frames") {
        pair.a.close();
        auto f = read_frame(pair.b, default_max_message_size);
        REQUIRE_FALSE(f.has_value());
        REQUIRE(f.error() == read_failure::end_of_stream);
    }

    SECTION("oversized frame is rejected") {
        auto [header, payload] = build_message(1, EchoRequest{std::string(200, 'x')});
        REQUIRE(write_frame(pair.a, header, payload));
        auto f = read_frame(pair.b, 64);
        REQUIRE_FALSE(f.has_value());
        REQUIRE(f.error() == read_failure::bad_frame);
    }

    SECTION("truncated frame is an io error") {
        auto bytes = build_ping(1).to_bytes();
        REQUIRE(pair.a.write_all(bytes.data(), 10).has_value());
        pair.a.close();
        auto f = read_frame(pair.b, default_max_message_size);
        REQUIRE_FALSE(f.has_value());
        REQUIRE(f.error() == read_failure::io_error);
    }
}

TEST_CASE("bounded frame writes", "[rpc][protocol]") {
    using namespace std::chrono_literals;
    using streamecho::test::scaled_ms;
    stream_pair pair;
    auto [header, payload] = build_message(3, EchoRequest{"bounded"});

    SECTION("written when there is room") {
        auto outcome = write_frame_until(pair.a, header, payload.data(), payload.size(),
                                         10ms, 100ms, [] { return true; });
        REQUIRE(outcome == frame_write::written);
        auto f = read_frame(pair.b, default_max_message_size);
        REQUIRE(f.has_value());
        REQUIRE(parse_message<EchoRequest>(f->payload).message == "bounded");
    }

    SECTION("stopped before the first byte when the caller gives up") {
        fill_send_buffer(pair.a.fd());
        std::atomic<bool> cancelled{false};
        std::thread canceller([&cancelled] {
            std::this_thread::sleep_for(50ms);
            cancelled.store(true);
        });

        auto start = std::chrono::steady_clock::now();
        auto outcome = write_frame_until(pair.a, header, payload.data(), payload.size(),
                                         10ms, 10s, [&cancelled] { return !cancelled.load(); });
        auto elapsed = std::chrono::steady_clock::now() - start;
        canceller.join();

        REQUIRE(outcome == frame_write::stopped);
        REQUIRE(elapsed < scaled_ms(1000));
    }

    SECTION("failed once the peer takes nothing for the stall timeout") {
        fill_send_buffer(pair.a.fd());
        auto start = std::chrono::steady_clock::now();
        auto outcome = write_frame_until(pair.a, header, payload.data(), payload.size(),
                                         10ms, 100ms, [] { return true; });
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(outcome == frame_write::failed);
        REQUIRE(elapsed >= 100ms);
        REQUIRE(elapsed < scaled_ms(1000));
    }
}

// ============================================================================
// Server call inbox
// ============================================================================

TEST_CASE("server call inbox holds the connection reader back", "[rpc][server]") {
    using namespace std::chrono_literals;
    using streamecho::test::scaled_ms;
    using streamecho::test::wait_until;

    server_config cfg;
    cfg.poll_interval = 20ms;
    cfg.inbox_messages = 2;
    cfg.inbox_bytes = 1024;
    auto call = std::make_shared<server_call>(nullptr, 1, 4, "Inbox", std::nullopt, cfg);

    std::atomic<bool> delivered{false};
    auto deliver_later = [&](size_t size) {
        return std::thread([&, size] {
            call->deliver(bytes(size));
            delivered.store(true);
        });
    };

    SECTION("by message count") {
        call->deliver(bytes(8));
        call->deliver(bytes(8));
        auto reader = deliver_later(8);
        std::this_thread::sleep_for(100ms);
        REQUIRE_FALSE(delivered.load());
        REQUIRE(call->inbox_size() == 2);

        REQUIRE(call->read_payload().has_value());
        REQUIRE(wait_until([&] { return delivered.load(); }, scaled_ms(1000)));
        reader.join();
        REQUIRE(call->inbox_size() == 2);
        REQUIRE(call->inbox_stalls() == 1);
    }

    SECTION("by byte budget") {
        // A payload over budget still gets in when the inbox is empty
        call->deliver(bytes(2000));
        auto reader = deliver_later(8);
        std::this_thread::sleep_for(100ms);
        REQUIRE_FALSE(delivered.load());

        auto first = call->read_payload();
        REQUIRE(first.has_value());
        REQUIRE(first->size() == 2000);
        REQUIRE(wait_until([&] { return delivered.load(); }, scaled_ms(1000)));
        reader.join();
        REQUIRE(call->inbox_size() == 1);
    }

    SECTION("cancel releases a waiting reader and drops its payload") {
        call->deliver(bytes(8));
        call->deliver(bytes(8));
        auto reader = deliver_later(8);
        std::this_thread::sleep_for(50ms);
        call->cancel(streamecho::sync::cancel_reason::peer_cancelled);

        REQUIRE(wait_until([&] { return delivered.load(); }, scaled_ms(1000)));
        reader.join();
        REQUIRE(call->inbox_size() == 2);
        REQUIRE_FALSE(call->read_payload().has_value());
    }
}

TEST_CASE("port numbers are range checked", "[net]") {
    using streamecho::net::parse_port;
    REQUIRE(parse_port("8080") == std::expected<uint16_t, int>(8080));
    REQUIRE(parse_port("0") == std::expected<uint16_t, int>(0));
    REQUIRE(parse_port("65535") == std::expected<uint16_t, int>(65535));

    REQUIRE_FALSE(parse_port("65536").has_value());
    REQUIRE_FALSE(parse_port("70000").has_value());
    REQUIRE_FALSE(parse_port("").has_value());
    REQUIRE_FALSE(parse_port("-1").has_value());
    REQUIRE_FALSE(parse_port("80x").has_value());
    REQUIRE_FALSE(parse_port("99999999999").has_value());
}
