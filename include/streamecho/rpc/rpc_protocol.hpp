#pragma once

/// @file rpc_protocol.hpp
/// @brief Wire protocol for multiplexed streaming calls
///
/// Every frame is a fixed header followed by its payload. Many calls share
/// one connection and are told apart by stream id.
///
/// Wire Format (all little-endian):
/// +----------+-------------+--------+---------+-----------+--------+
/// | magic(4) | stream_id(4)| type(1)| flags(1)| method(4) | len(4) |
/// +----------+-------------+--------+---------+-----------+--------+
/// | payload (len bytes)                                            |
/// +----------------------------------------------------------------+
///
/// Total header size: 18 bytes
///
/// A call's life on the wire:
///   client: open, message*, half_close        (or cancel at any point)
///   server: message*, status                  (status is always last)

#include "rpc_buffer.hpp"
#include "rpc_types.hpp"

#include <streamecho/log/macros.hpp>
#include <streamecho/net/tcp.hpp>

#include <sys/uio.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <expected>
#include <optional>
#include <string_view>
#include <utility>

namespace streamecho::rpc {

// ============================================================================
// Protocol constants
// ============================================================================

/// Protocol magic number, "SECH" in ASCII
constexpr uint32_t protocol_magic = 0x48434553;

constexpr size_t frame_header_size = 18;

// ============================================================================
// Frame types
// ============================================================================

enum class frame_type : uint8_t {
    open = 0,         ///< Start a call (client -> server)
    message = 1,      ///< One serialized message, either direction
    half_close = 2,   ///< Client finished sending
    status = 3,       ///< Terminal status (server -> client)
    cancel = 4,       ///< Client abandons the call
    ping = 5,         ///< Keepalive ping
    pong = 6,         ///< Keepalive pong
};

constexpr const char* frame_type_str(frame_type t) noexcept {
    switch (t) {
        case frame_type::open: return "open";
        case frame_type::message: return "message";
        case frame_type::half_close: return "half_close";
        case frame_type::status: return "status";
        case frame_type::cancel: return "cancel";
        case frame_type::ping: return "ping";
        case frame_type::pong: return "pong";
        default: return "unknown";
    }
}

enum class frame_flags : uint8_t {
    none = 0,
    has_timeout = 1 << 0,    ///< Open payload carries a timeout in ms
};

inline frame_flags operator|(frame_flags a, frame_flags b) {
    return static_cast<frame_flags>(
        static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool has_flag(frame_flags flags, frame_flags flag) {
    return (static_cast<uint8_t>(flags) & static_cast<uint8_t>(flag)) != 0;
}

// ============================================================================
// Frame header
// ============================================================================

struct frame_header {
    uint32_t magic = protocol_magic;
    uint32_t stream_id = 0;
    frame_type type = frame_type::message;
    frame_flags flags = frame_flags::none;
    method_id_t method_id = 0;        ///< Only meaningful on open frames
    uint32_t payload_length = 0;

    bool is_valid(size_t max_payload) const noexcept {
        return magic == protocol_magic &&
               static_cast<uint8_t>(type) <= static_cast<uint8_t>(frame_type::pong) &&
               payload_length <= max_payload;
    }

    std::array<uint8_t, frame_header_size> to_bytes() const {
        std::array<uint8_t, frame_header_size> bytes;
        uint8_t* p = bytes.data();
        std::memcpy(p, &magic, 4); p += 4;
        std::memcpy(p, &stream_id, 4); p += 4;
        *p++ = static_cast<uint8_t>(type);
        *p++ = static_cast<uint8_t>(flags);
        std::memcpy(p, &method_id, 4); p += 4;
        std::memcpy(p, &payload_length, 4);
        return bytes;
    }

    static frame_header from_bytes(const uint8_t* data) {
        frame_header h;
        const uint8_t* p = data;
        std::memcpy(&h.magic, p, 4); p += 4;
        std::memcpy(&h.stream_id, p, 4); p += 4;
        h.type = static_cast<frame_type>(*p++);
        h.flags = static_cast<frame_flags>(*p++);
        std::memcpy(&h.method_id, p, 4); p += 4;
        std::memcpy(&h.payload_length, p, 4);
        return h;
    }
};

static_assert(frame_header_size == 18, "Header size mismatch");

/// Status frame payload
struct status_payload {
    uint32_t code = 0;
    std::string detail;

    STREAMECHO_RPC_FIELDS(status_payload, code, detail)
};

/// Thread-safe stream id generator
class stream_id_generator {
public:
    uint32_t next() noexcept {
        return counter_.fetch_add(1, std::memory_order_relaxed);
    }

private:
    std::atomic<uint32_t> counter_{1};
};

// ============================================================================
// Framing over a blocking stream
// ============================================================================

/// Outcome of read_frame when no frame was produced
enum class read_failure {
    end_of_stream,    ///< Peer closed between frames
    io_error,         ///< Socket error or truncated frame
    bad_frame,        ///< Header failed validation
};

struct frame {
    frame_header header;
    message_buffer payload;
};

/// Read one complete frame.
inline std::expected<frame, read_failure> read_frame(net::tcp_stream& stream, size_t max_payload) {
    std::array<uint8_t, frame_header_size> header_buf;
    auto n = stream.read_exact(header_buf.data(), frame_header_size);
    if (!n) {
        return std::unexpected(read_failure::io_error);
    }
    if (*n == 0) {
        return std::unexpected(read_failure::end_of_stream);
    }
    if (*n < frame_header_size) {
        return std::unexpected(read_failure::io_error);
    }

    frame result{frame_header::from_bytes(header_buf.data()), {}};
    if (!result.header.is_valid(max_payload)) {
        STREAMECHO_LOG_ERROR("Invalid frame header: magic={:08x}, type={}, len={}",
                             result.header.magic,
                             static_cast<unsigned>(result.header.type),
                             result.header.payload_length);
        return std::unexpected(read_failure::bad_frame);
    }

    if (result.header.payload_length > 0) {
        result.payload.resize(result.header.payload_length);
        n = stream.read_exact(result.payload.data(), result.header.payload_length);
        if (!n || *n < result.header.payload_length) {
            return std::unexpected(read_failure::io_error);
        }
    }
    return result;
}

/// Outcome of write_frame_until
enum class frame_write {
    written,    ///< The whole frame went out
    stopped,    ///< Gave up before the first byte; the stream is still in step
    failed,     ///< Socket error, stall, or stopped part-way; the stream is unusable
};

namespace detail {

inline int frame_iovecs(iovec (&iov)[2], std::array<uint8_t, frame_header_size>& header_bytes,
                        const void* payload_data, size_t payload_size) {
    iov[0].iov_base = header_bytes.data();
    iov[0].iov_len = frame_header_size;
    if (payload_size == 0) {
        return 1;
    }
    iov[1].iov_base = const_cast<void*>(payload_data);
    iov[1].iov_len = payload_size;
    return 2;
}

} // namespace detail

/// Write a frame with a single scatter-gather send. Callers serialise
/// writers sharing a stream.
inline bool write_frame(net::tcp_stream& stream, const frame_header& header,
                        const void* payload_data, size_t payload_size) {
    auto header_bytes = header.to_bytes();
    iovec iovecs[2];
    int iov_count = detail::frame_iovecs(iovecs, header_bytes, payload_data, payload_size);

    auto result = stream.writev_all(iovecs, iov_count);
    if (!result) {
        STREAMECHO_LOG_DEBUG("write_frame failed: errno={}", result.error());
        return false;
    }
    return true;
}

/// Write a frame without blocking past wait at a time; see
/// tcp_stream::writev_bounded for how keep_going and stall_timeout apply.
template<typename KeepGoing>
frame_write write_frame_until(net::tcp_stream& stream, const frame_header& header,
                              const void* payload_data, size_t payload_size,
                              std::chrono::milliseconds wait,
                              std::chrono::milliseconds stall_timeout,
                              KeepGoing&& keep_going) {
    auto header_bytes = header.to_bytes();
    iovec iovecs[2];
    int iov_count = detail::frame_iovecs(iovecs, header_bytes, payload_data, payload_size);

    size_t sent = 0;
    auto result = stream.writev_bounded(iovecs, iov_count, wait, stall_timeout,
                                        std::forward<KeepGoing>(keep_going), sent);
    if (result) {
        return frame_write::written;
    }
    if (result.error() == ECANCELED && sent == 0) {
        return frame_write::stopped;
    }
    if (result.error() == ETIMEDOUT) {
        STREAMECHO_LOG_WARNING("write_frame: peer took nothing for {}ms", stall_timeout.count());
    } else {
        STREAMECHO_LOG_DEBUG("write_frame stopped after {} of {} bytes: errno={}",
                             sent, frame_header_size + payload_size, result.error());
    }
    return frame_write::failed;
}

inline bool write_frame(net::tcp_stream& stream, const frame_header& header,
                        const buffer_writer& payload) {
    return write_frame(stream, header, payload.data(), payload.size());
}

// ============================================================================
// Frame builders
// ============================================================================

inline frame_header make_header(uint32_t stream_id, frame_type type, size_t payload_size = 0) {
    frame_header header;
    header.stream_id = stream_id;
    header.type = type;
    header.payload_length = static_cast<uint32_t>(payload_size);
    return header;
}

/// Build an open frame, optionally carrying the client's timeout
inline std::pair<frame_header, buffer_writer> build_open(
    uint32_t stream_id,
    method_id_t method_id,
    std::optional<uint32_t> timeout_ms = std::nullopt)
{
    buffer_writer payload;
    frame_header header = make_header(stream_id, frame_type::open);
    if (timeout_ms) {
        header.flags = frame_flags::has_timeout;
        payload.write(*timeout_ms);
    }
    header.method_id = method_id;
    header.payload_length = static_cast<uint32_t>(payload.size());
    return {header, std::move(payload)};
}

template<typename Message>
std::pair<frame_header, buffer_writer> build_message(uint32_t stream_id, const Message& msg) {
    buffer_writer payload;
    serialize(payload, msg);
    return {make_header(stream_id, frame_type::message, payload.size()), std::move(payload)};
}

inline std::pair<frame_header, buffer_writer> build_status(uint32_t stream_id,
                                                           const rpc_status& status) {
    buffer_writer payload;
    serialize(payload, status_payload{static_cast<uint32_t>(status.code), status.detail});
    return {make_header(stream_id, frame_type::status, payload.size()), std::move(payload)};
}

inline frame_header build_half_close(uint32_t stream_id) {
    return make_header(stream_id, frame_type::half_close);
}

inline frame_header build_cancel(uint32_t stream_id) {
    return make_header(stream_id, frame_type::cancel);
}

inline frame_header build_ping(uint32_t ping_id) {
    return make_header(ping_id, frame_type::ping);
}

inline frame_header build_pong(uint32_t ping_id) {
    return make_header(ping_id, frame_type::pong);
}

// ============================================================================
// Payload parsing
// ============================================================================

/// Timeout carried by an open frame, if any
inline std::optional<uint32_t> parse_open(const message_buffer& payload, frame_flags flags) {
    if (!has_flag(flags, frame_flags::has_timeout)) {
        return std::nullopt;
    }
    buffer_view reader = payload.view();
    return reader.read<uint32_t>();
}

inline rpc_status parse_status(const message_buffer& payload) {
    auto parsed = deserialize_message<status_payload>(payload.data(), payload.size());
    return rpc_status{static_cast<status_code>(parsed.code), std::move(parsed.detail)};
}

template<typename Message>
Message parse_message(const message_buffer& payload) {
    return deserialize_message<Message>(payload.data(), payload.size());
}

} // namespace streamecho::rpc
