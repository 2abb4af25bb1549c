#pragma once

/// @file rpc_buffer.hpp
/// @brief Byte buffers behind the stream payload encoding
///
/// Encoding rules, shared by every message on the wire:
///   - fixed-size values are copied in host order (little-endian hosts only)
///   - strings start with a uint32 byte count
///
/// buffer_writer builds outgoing payloads, message_buffer owns an incoming
/// one and buffer_view walks either without copying.

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace streamecho::rpc {

/// Largest payload accepted in a single frame unless configured otherwise
inline constexpr size_t default_max_message_size = size_t{50} << 20;

/// Raised when a payload cannot be decoded or encoded
class serialization_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Forward-only decoder over bytes it does not own
class buffer_view {
public:
    buffer_view() noexcept = default;

    buffer_view(const void* bytes, size_t length) noexcept
        : begin_(static_cast<const uint8_t*>(bytes))
        , cursor_(begin_)
        , end_(begin_ + length) {}

    const uint8_t* data() const noexcept { return begin_; }
    size_t size() const noexcept { return static_cast<size_t>(end_ - begin_); }
    bool empty() const noexcept { return begin_ == end_; }

    size_t position() const noexcept { return static_cast<size_t>(cursor_ - begin_); }
    size_t remaining() const noexcept { return static_cast<size_t>(end_ - cursor_); }

    template<typename T>
    requires std::is_trivially_copyable_v<T>
    T read() {
        T value;
        std::memcpy(&value, consume(sizeof(T), "value"), sizeof(T));
        return value;
    }

    /// The returned view points into the underlying payload
    std::string_view read_string() {
        auto length = read<uint32_t>();
        auto* chars = reinterpret_cast<const char*>(consume(length, "string"));
        return {chars, length};
    }

private:
    const uint8_t* consume(size_t n, const char* what) {
        if (n > remaining()) {
            throw serialization_error(std::string("truncated payload reading ") + what);
        }
        const uint8_t* at = cursor_;
        cursor_ += n;
        return at;
    }

    const uint8_t* begin_ = nullptr;
    const uint8_t* cursor_ = nullptr;
    const uint8_t* end_ = nullptr;
};

/// Append-only encoder
class buffer_writer {
public:
    explicit buffer_writer(size_t reserve = 256) {
        bytes_.reserve(reserve);
    }

    const uint8_t* data() const noexcept { return bytes_.data(); }
    size_t size() const noexcept { return bytes_.size(); }
    bool empty() const noexcept { return bytes_.empty(); }

    template<typename T>
    requires std::is_trivially_copyable_v<T>
    void write(const T& value) {
        write_bytes(&value, sizeof(T));
    }

    void write_bytes(const void* src, size_t n) {
        if (n == 0) {
            return;
        }
        auto* p = static_cast<const uint8_t*>(src);
        bytes_.insert(bytes_.end(), p, p + n);
    }

    void write_string(std::string_view text) {
        write(checked_count(text.size()));
        write_bytes(text.data(), text.size());
    }

    buffer_view view() const noexcept {
        return {bytes_.data(), bytes_.size()};
    }

    /// Hand the encoded bytes over, leaving the writer empty
    std::vector<uint8_t> take() noexcept {
        return std::exchange(bytes_, {});
    }

private:
    static uint32_t checked_count(size_t n) {
        if (n > std::numeric_limits<uint32_t>::max()) {
            throw serialization_error("field longer than 4 GiB");
        }
        return static_cast<uint32_t>(n);
    }

    std::vector<uint8_t> bytes_;
};

/// Payload of one received frame
class message_buffer {
public:
    message_buffer() = default;

    explicit message_buffer(size_t length) : bytes_(length) {}

    explicit message_buffer(std::vector<uint8_t> bytes) noexcept
        : bytes_(std::move(bytes)) {}

    uint8_t* data() noexcept { return bytes_.data(); }
    const uint8_t* data() const noexcept { return bytes_.data(); }
    size_t size() const noexcept { return bytes_.size(); }
    bool empty() const noexcept { return bytes_.empty(); }

    /// Sized before the frame body is read into it
    void resize(size_t length) { bytes_.resize(length); }

    buffer_view view() const noexcept {
        return {bytes_.data(), bytes_.size()};
    }

private:
    std::vector<uint8_t> bytes_;
};

} // namespace streamecho::rpc
