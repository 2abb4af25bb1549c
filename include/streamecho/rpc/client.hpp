#pragma once

/// @file client.hpp
/// @brief Streaming RPC client
///
/// A stream_client owns one connection and a reader thread that routes
/// inbound frames to calls by stream id. Calls on the same client may run
/// concurrently from different threads.
///
/// Usage:
/// @code
/// auto client = rpc::stream_client::connect("localhost", 8080);
/// if (!client) return;
///
/// auto call = (*client)->open<EchoBidi>();
/// call.write(EchoRequest{"hello"});
/// call.writes_done();
/// while (auto resp = call.read()) {
///     print(resp->message);
/// }
/// rpc::rpc_status status = call.finish();
/// @endcode

#include "rpc_protocol.hpp"

#include <streamecho/log/macros.hpp>
#include <streamecho/net/tcp.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace streamecho::rpc {

struct client_config {
    size_t max_message_size = default_max_message_size;
    net::tcp_options tcp;
};

namespace detail {

/// Per-call state shared between the reader thread and the caller
struct client_call_state {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<message_buffer> inbox;
    std::optional<rpc_status> status;

    void deliver(message_buffer payload) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (status) {
                return;
            }
            inbox.push_back(std::move(payload));
        }
        cv.notify_all();
    }

    /// First status wins
    void complete(rpc_status s) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (status) {
                return;
            }
            status = std::move(s);
        }
        cv.notify_all();
    }

    bool is_complete() {
        std::lock_guard<std::mutex> lock(mutex);
        return status.has_value();
    }
};

} // namespace detail

template<typename Method>
class client_call;

class stream_client : public std::enable_shared_from_this<stream_client> {
public:
    using ptr = std::shared_ptr<stream_client>;

    /// Connect and start the reader thread
    static std::expected<ptr, int> connect(std::string_view host, uint16_t port,
                                           const client_config& config = {}) {
        auto addr = net::ipv4_address::resolve(host, port);
        if (!addr) {
            return std::unexpected(addr.error());
        }
        auto stream = net::tcp_connect(*addr, config.tcp);
        if (!stream) {
            STREAMECHO_LOG_ERROR("Failed to connect to {}: {}", addr->to_string(), std::strerror(stream.error()));
            return std::unexpected(stream.error());
        }
        ptr client(new stream_client(std::move(*stream), config));
        client->reader_ = std::thread([raw = client.get()] { raw->run(); });
        STREAMECHO_LOG_INFO("Connected to {}", addr->to_string());
        return client;
    }

    ~stream_client() {
        close();
    }

    stream_client(const stream_client&) = delete;
    stream_client& operator=(const stream_client&) = delete;

    /// Start a call. With a timeout the server ends the call with
    /// DEADLINE_EXCEEDED once it elapses.
    template<typename Method>
    client_call<Method> open(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Close the connection; calls in flight end with UNAVAILABLE
    void close() {
        stream_.shutdown();
        if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
            reader_.join();
        }
    }

    bool is_connected() const noexcept {
        return connected_.load(std::memory_order_acquire);
    }

    /// Round-trip a ping frame.
    /// @return true if the pong arrived within timeout
    bool ping(std::chrono::milliseconds timeout) {
        uint32_t id = ids_.next();
        {
            std::lock_guard<std::mutex> lock(pong_mutex_);
            pending_pings_.insert(id);
        }
        bool answered = false;
        if (send(build_ping(id), nullptr, 0)) {
            std::unique_lock<std::mutex> lock(pong_mutex_);
            answered = pong_cv_.wait_for(lock, timeout, [this, id] {
                return !pending_pings_.contains(id) || !is_connected();
            }) && !pending_pings_.contains(id);
        }
        std::lock_guard<std::mutex> lock(pong_mutex_);
        pending_pings_.erase(id);
        return answered;
    }

    size_t max_message_size() const noexcept { return config_.max_message_size; }

private:
    template<typename Method>
    friend class client_call;

    stream_client(net::tcp_stream stream, const client_config& config)
        : stream_(std::move(stream))
        , config_(config) {}

    bool send(const frame_header& header, const void* data, size_t size) {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (!connected_.load(std::memory_order_acquire)) {
            return false;
        }
        return write_frame(stream_, header, data, size);
    }

    bool send(const frame_header& header, const buffer_writer& payload) {
        return send(header, payload.data(), payload.size());
    }

    std::shared_ptr<detail::client_call_state> register_call(uint32_t stream_id) {
        auto state = std::make_shared<detail::client_call_state>();
        std::lock_guard<std::mutex> lock(calls_mutex_);
        if (!connected_.load(std::memory_order_acquire)) {
            state->complete({status_code::unavailable, "not connected"});
            return state;
        }
        calls_[stream_id] = state;
        return state;
    }

    void forget_call(uint32_t stream_id) {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        calls_.erase(stream_id);
    }

    std::shared_ptr<detail::client_call_state> find_call(uint32_t stream_id) {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        auto it = calls_.find(stream_id);
        return it == calls_.end() ? nullptr : it->second;
    }

    void run() {
        for (;;) {
            auto f = read_frame(stream_, config_.max_message_size);
            if (!f) {
                if (f.error() == read_failure::bad_frame) {
                    STREAMECHO_LOG_ERROR("Protocol error from server, closing connection");
                }
                break;
            }

            auto& header = f->header;
            switch (header.type) {
                case frame_type::message:
                    if (auto state = find_call(header.stream_id)) {
                        state->deliver(std::move(f->payload));
                    }
                    break;

                case frame_type::status:
                    if (auto state = find_call(header.stream_id)) {
                        try {
                            state->complete(parse_status(f->payload));
                        } catch (const serialization_error& e) {
                            state->complete({status_code::internal,
                                             std::string("malformed status: ") + e.what()});
                        }
                        forget_call(header.stream_id);
                    }
                    break;

                case frame_type::ping:
                    send(build_pong(header.stream_id), nullptr, 0);
                    break;

                case frame_type::pong:
                    {
                        std::lock_guard<std::mutex> lock(pong_mutex_);
                        pending_pings_.erase(header.stream_id);
                    }
                    pong_cv_.notify_all();
                    break;

                default:
                    STREAMECHO_LOG_WARNING("Unexpected {} frame from server", frame_type_str(header.type));
                    break;
            }
        }

        {
            std::lock_guard<std::mutex> lock(send_mutex_);
            connected_.store(false, std::memory_order_release);
        }
        std::unordered_map<uint32_t, std::shared_ptr<detail::client_call_state>> orphaned;
        {
            std::lock_guard<std::mutex> lock(calls_mutex_);
            orphaned.swap(calls_);
        }
        for (auto& [id, state] : orphaned) {
            state->complete({status_code::unavailable, "connection lost"});
        }
        { std::lock_guard<std::mutex> lock(pong_mutex_); }
        pong_cv_.notify_all();
        STREAMECHO_LOG_DEBUG("Client reader exiting, {} calls orphaned", orphaned.size());
    }

    net::tcp_stream stream_;
    const client_config config_;
    std::thread reader_;
    std::atomic<bool> connected_{true};
    stream_id_generator ids_;

    std::mutex send_mutex_;

    std::mutex calls_mutex_;
    std::unordered_map<uint32_t, std::shared_ptr<detail::client_call_state>> calls_;

    std::mutex pong_mutex_;
    std::condition_variable pong_cv_;
    std::unordered_set<uint32_t> pending_pings_;
};

/// Client side of one call
template<typename Method>
class client_call {
public:
    using request_type = typename Method::request_type;
    using response_type = typename Method::response_type;

    client_call(client_call&&) noexcept = default;
    client_call& operator=(client_call&&) noexcept = default;

    client_call(const client_call&) = delete;
    client_call& operator=(const client_call&) = delete;

    /// A call dropped before its status arrived is cancelled
    ~client_call() {
        if (state_ && !state_->is_complete()) {
            cancel();
            client_->forget_call(stream_id_);
        }
    }

    /// Send one request. Returns false if the call is already over.
    bool write(const request_type& request) {
        if (state_->is_complete()) {
            return false;
        }
        auto [header, payload] = build_message(stream_id_, request);
        if (payload.size() > client_->max_message_size()) {
            STREAMECHO_LOG_ERROR("{} stream {}: request of {} bytes exceeds limit",
                                 Method::name, stream_id_, payload.size());
            return false;
        }
        return client_->send(header, payload);
    }

    /// Signal that no more requests follow
    bool writes_done() {
        if (half_closed_) {
            return true;
        }
        half_closed_ = true;
        return client_->send(build_half_close(stream_id_), nullptr, 0);
    }

    /// Next response; nullopt once the status arrived and every response
    /// before it was read.
    std::optional<response_type> read() {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [this] { return !state_->inbox.empty() || state_->status.has_value(); });
        if (state_->inbox.empty()) {
            return std::nullopt;
        }
        message_buffer payload = std::move(state_->inbox.front());
        state_->inbox.pop_front();
        lock.unlock();

        try {
            ++responses_read_;
            return parse_message<response_type>(payload);
        } catch (const serialization_error& e) {
            STREAMECHO_LOG_ERROR("{} stream {}: malformed response: {}", Method::name, stream_id_, e.what());
            cancel();
            state_->complete({status_code::internal, e.what()});
            return std::nullopt;
        }
    }

    /// For calls answered by exactly one message: read it and finish.
    /// A call that ended OK without a response fails with internal.
    rpc_result<response_type> finish_with_response() {
        auto response = read();
        auto status = finish();
        if (!status.ok()) {
            return rpc_result<response_type>(std::move(status));
        }
        if (!response) {
            return rpc_result<response_type>(rpc_status{status_code::internal, "call ended without a response"});
        }
        return rpc_result<response_type>(std::move(*response));
    }

    /// Wait for the terminal status. Unread responses are discarded.
    rpc_status finish() {
        rpc_status status;
        {
            std::unique_lock<std::mutex> lock(state_->mutex);
            state_->cv.wait(lock, [this] { return state_->status.has_value(); });
            status = *state_->status;
            state_->inbox.clear();
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_);
        if (status.ok()) {
            STREAMECHO_LOG_DEBUG("{} stream {}: finished OK after {} responses in {}ms",
                                 Method::name, stream_id_, responses_read_, elapsed.count());
        } else {
            STREAMECHO_LOG_INFO("{} stream {}: finished {} ({}) in {}ms",
                                Method::name, stream_id_, status_code_str(status.code),
                                status.detail, elapsed.count());
        }
        return status;
    }

    /// Ask the server to abandon the call
    void cancel() {
        if (!cancel_sent_ && !state_->is_complete()) {
            cancel_sent_ = true;
            client_->send(build_cancel(stream_id_), nullptr, 0);
        }
    }

    uint32_t stream_id() const noexcept { return stream_id_; }

private:
    friend class stream_client;

    client_call(stream_client::ptr client, uint32_t stream_id,
                std::shared_ptr<detail::client_call_state> state)
        : client_(std::move(client))
        , stream_id_(stream_id)
        , state_(std::move(state))
        , started_(std::chrono::steady_clock::now()) {}

    stream_client::ptr client_;
    uint32_t stream_id_ = 0;
    std::shared_ptr<detail::client_call_state> state_;
    std::chrono::steady_clock::time_point started_;
    size_t responses_read_ = 0;
    bool half_closed_ = false;
    bool cancel_sent_ = false;
};

template<typename Method>
client_call<Method> stream_client::open(std::optional<std::chrono::milliseconds> timeout) {
    uint32_t id = ids_.next();
    auto state = register_call(id);

    std::optional<uint32_t> timeout_ms;
    if (timeout) {
        timeout_ms = static_cast<uint32_t>(timeout->count());
    }
    auto [header, payload] = build_open(id, Method::id, timeout_ms);
    if (!send(header, payload)) {
        state->complete({status_code::unavailable, "failed to open call"});
        forget_call(id);
    }
    STREAMECHO_LOG_DEBUG("{} stream {}: opened", Method::name, id);
    return client_call<Method>(shared_from_this(), id, std::move(state));
}

} // namespace streamecho::rpc
