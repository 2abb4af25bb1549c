#pragma once

/// @file rpc_types.hpp
/// @brief Message schema, method descriptors and call status types
///
/// Messages are plain structs that list their wire fields:
/// @code
/// struct EchoRequest {
///     std::string message;
///     STREAMECHO_RPC_FIELDS(EchoRequest, message)
/// };
/// @endcode

#include "rpc_buffer.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace streamecho::rpc {

// ============================================================================
// Wire codecs
// ============================================================================

/// Encoder/decoder pair for one type. Specialized below for arithmetic and
/// enum values, strings and field-listed structs.
template<typename T>
struct wire_codec;

template<typename T>
void serialize(buffer_writer& writer, const T& value) {
    wire_codec<T>::encode(writer, value);
}

template<typename T>
void deserialize(buffer_view& reader, T& value) {
    wire_codec<T>::decode(reader, value);
}

/// A struct declared with STREAMECHO_RPC_FIELDS
template<typename T>
concept wire_struct = requires(T& mut, const T& ro) {
    mut.streamecho_wire_tie();
    ro.streamecho_wire_tie();
};

template<typename T>
requires std::is_arithmetic_v<T> || std::is_enum_v<T>
struct wire_codec<T> {
    static void encode(buffer_writer& w, T v) { w.write(v); }
    static void decode(buffer_view& r, T& v) { v = r.read<T>(); }
};

template<>
struct wire_codec<std::string> {
    static void encode(buffer_writer& w, const std::string& v) { w.write_string(v); }

    static void decode(buffer_view& r, std::string& v) {
        v = std::string(r.read_string());
    }
};

/// Fields go out in declaration order with no tags or padding
template<wire_struct T>
struct wire_codec<T> {
    static void encode(buffer_writer& w, const T& v) {
        std::apply([&w](const auto&... field) { (serialize(w, field), ...); },
                   v.streamecho_wire_tie());
    }

    static void decode(buffer_view& r, T& v) {
        std::apply([&r](auto&... field) { (deserialize(r, field), ...); },
                   v.streamecho_wire_tie());
    }
};

/// Encode into a fresh buffer
template<typename T>
buffer_writer serialize(const T& value) {
    buffer_writer writer;
    serialize(writer, value);
    return writer;
}

/// Decode a complete payload; trailing bytes are an error
template<typename T>
T deserialize_message(const void* data, size_t size) {
    buffer_view reader(data, size);
    T value{};
    deserialize(reader, value);
    if (reader.remaining() != 0) {
        throw serialization_error("trailing bytes after message");
    }
    return value;
}

/// List a message struct's wire fields, in order:
/// STREAMECHO_RPC_FIELDS(EchoRequest, message)
#define STREAMECHO_RPC_FIELDS(ClassName, ...)                                   \
    auto streamecho_wire_tie() { return std::tie(__VA_ARGS__); }                \
    auto streamecho_wire_tie() const { return std::tie(__VA_ARGS__); }

// ============================================================================
// Methods
// ============================================================================

using method_id_t = uint32_t;

/// Shape of a streaming call
enum class call_kind : uint8_t {
    client_streaming = 1,   ///< stream Request -> Response
    server_streaming = 2,   ///< Request -> stream Response
    bidi_streaming = 3,     ///< stream Request <-> stream Response
};

constexpr const char* call_kind_str(call_kind kind) noexcept {
    switch (kind) {
        case call_kind::client_streaming: return "client-streaming";
        case call_kind::server_streaming: return "server-streaming";
        case call_kind::bidi_streaming: return "bidi-streaming";
        default: return "unknown";
    }
}

/// Compile-time method descriptor
template<method_id_t MethodId, typename Request, typename Response, call_kind Kind>
struct method_descriptor {
    static constexpr method_id_t id = MethodId;
    static constexpr call_kind kind = Kind;
    using request_type = Request;
    using response_type = Response;
};

// ============================================================================
// Call status
// ============================================================================

/// Terminal status of a call
enum class status_code : uint32_t {
    ok = 0,
    cancelled = 1,
    unknown = 2,
    invalid_argument = 3,
    deadline_exceeded = 4,
    resource_exhausted = 8,
    internal = 13,
    unavailable = 14,
    unimplemented = 12,
};

constexpr const char* status_code_str(status_code code) noexcept {
    switch (code) {
        case status_code::ok: return "OK";
        case status_code::cancelled: return "CANCELLED";
        case status_code::unknown: return "UNKNOWN";
        case status_code::invalid_argument: return "INVALID_ARGUMENT";
        case status_code::deadline_exceeded: return "DEADLINE_EXCEEDED";
        case status_code::resource_exhausted: return "RESOURCE_EXHAUSTED";
        case status_code::internal: return "INTERNAL";
        case status_code::unavailable: return "UNAVAILABLE";
        case status_code::unimplemented: return "UNIMPLEMENTED";
        default: return "UNKNOWN";
    }
}

/// Status code plus human-readable detail
struct rpc_status {
    status_code code = status_code::ok;
    std::string detail;

    bool ok() const noexcept { return code == status_code::ok; }

    static rpc_status success() { return {}; }
};

/// Transport or protocol fault on a stream
class stream_error : public std::runtime_error {
public:
    stream_error(status_code code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    status_code code() const noexcept { return code_; }

private:
    status_code code_;
};

/// Status a call ends with when e stops it: the error's own code, never OK
inline status_code error_status(const stream_error& e) noexcept {
    return e.code() == status_code::ok ? status_code::internal : e.code();
}

/// Value or failure status
template<typename T>
class rpc_result {
public:
    rpc_result() = default;

    explicit rpc_result(T value)
        : value_(std::move(value)) {}

    explicit rpc_result(rpc_status status)
        : status_(std::move(status)) {}

    bool ok() const noexcept { return status_.ok(); }
    explicit operator bool() const noexcept { return ok(); }

    const rpc_status& status() const noexcept { return status_; }

    status_code code() const noexcept { return status_.code; }

    T& value() & {
        if (!ok()) throw stream_error(status_.code, status_.detail);
        return value_;
    }
    const T& value() const& {
        if (!ok()) throw stream_error(status_.code, status_.detail);
        return value_;
    }

    T* operator->() { return &value_; }
    const T* operator->() const { return &value_; }
    T& operator*() & { return value_; }
    const T& operator*() const& { return value_; }

private:
    T value_{};
    rpc_status status_;
};

} // namespace streamecho::rpc
