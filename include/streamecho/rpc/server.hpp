#pragma once

/// @file server.hpp
/// @brief Streaming RPC server
///
/// One accept thread, one reader thread per connection, and a bounded pool
/// of workers on which call handlers run. A call holds a worker for its whole
/// life; calls that cannot be admitted are refused with RESOURCE_EXHAUSTED.
///
/// Usage:
/// @code
/// rpc::stream_server server(cfg);
/// server.register_bidi_streaming<EchoBidi>(
///     [](rpc::server_stream<EchoRequest, EchoResponse>& stream) {
///         while (auto req = stream.read()) {
///             stream.write(EchoResponse{req->message});
///         }
///     });
/// auto bound = server.start(net::ipv4_address(8080));
/// @endcode

#include "rpc_protocol.hpp"
#include "server_stream.hpp"

#include <streamecho/log/macros.hpp>
#include <streamecho/net/tcp.hpp>
#include <streamecho/runtime/worker_pool.hpp>
#include <streamecho/sync/cancel_token.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace streamecho::rpc {

/// Server tuning knobs
struct server_config {
    size_t num_workers = 10;                          ///< Calls served concurrently
    size_t max_pending_calls = 0;                     ///< Admitted but waiting (0 = num_workers * 4)
    size_t max_message_size = default_max_message_size;
    std::chrono::milliseconds shutdown_grace{5000};   ///< Wait for live calls on stop()
    std::chrono::milliseconds poll_interval{100};     ///< Upper bound on any blocking wait
    std::chrono::milliseconds write_timeout{5000};    ///< Drop a peer that takes no bytes for this long
    size_t inbox_messages = 16;                       ///< Per call; a full inbox pauses the connection reader
    size_t inbox_bytes = size_t{4} << 20;             ///< Per call inbox byte budget
    net::tcp_options tcp;

    size_t pending_limit() const noexcept {
        return max_pending_calls != 0 ? max_pending_calls : num_workers * 4;
    }
};

/// Status reported for a call that ended because its signal was raised
constexpr status_code status_for(sync::cancel_reason reason) noexcept {
    switch (reason) {
        case sync::cancel_reason::none: return status_code::ok;
        case sync::cancel_reason::deadline_exceeded: return status_code::deadline_exceeded;
        case sync::cancel_reason::processing_fault: return status_code::internal;
        case sync::cancel_reason::transport_fault: return status_code::unavailable;
        default: return status_code::cancelled;
    }
}

class server_connection;

// ============================================================================
// Server call
// ============================================================================

/// Untyped server-side state of one call
class server_call {
public:
    using ptr = std::shared_ptr<server_call>;
    using clock = std::chrono::steady_clock;

    server_call(std::shared_ptr<server_connection> conn,
                uint32_t stream_id,
                method_id_t method_id,
                const char* method_name,
                std::optional<clock::time_point> deadline,
                const server_config& config)
        : conn_(std::move(conn))
        , stream_id_(stream_id)
        , method_id_(method_id)
        , method_name_(method_name)
        , deadline_(deadline)
        , poll_interval_(config.poll_interval)
        , inbox_messages_(std::max<size_t>(config.inbox_messages, 1))
        , inbox_bytes_limit_(config.inbox_bytes) {}

    server_call(const server_call&) = delete;
    server_call& operator=(const server_call&) = delete;

    uint32_t stream_id() const noexcept { return stream_id_; }
    method_id_t method_id() const noexcept { return method_id_; }
    const char* method_name() const noexcept { return method_name_; }

    // --- connection reader side ---

    /// Queue one inbound payload. While the inbox is full this blocks the
    /// connection reader, so the socket is not read and the peer's sends
    /// back up. A payload that arrives after the call ended is dropped.
    void deliver(message_buffer payload) {
        auto token = cancel_.get_token();
        auto wake = token.on_cancel([this] { notify_inbox(); });
        std::unique_lock<std::mutex> lock(inbox_mutex_);
        if (half_closed_ || finished_.load(std::memory_order_acquire)) {
            STREAMECHO_LOG_WARNING("stream {}: message after half-close dropped", stream_id_);
            return;
        }
        if (inbox_full()) {
            ++inbox_stalls_;
            STREAMECHO_LOG_DEBUG("stream {}: inbox full ({} messages, {} bytes), pausing reads",
                                 stream_id_, inbox_.size(), inbox_bytes_);
            while (inbox_full() && !token.is_cancelled()) {
                space_cv_.wait_for(lock, poll_interval_);
            }
            if (token.is_cancelled()) {
                return;
            }
        }
        inbox_bytes_ += payload.size();
        inbox_.push_back(std::move(payload));
        lock.unlock();
        inbox_cv_.notify_one();
    }

    void half_close() {
        {
            std::lock_guard<std::mutex> lock(inbox_mutex_);
            half_closed_ = true;
        }
        inbox_cv_.notify_all();
    }

    /// Raise the call's signal. Returns true for the raise that won.
    bool cancel(sync::cancel_reason why) {
        return cancel_.cancel(why);
    }

    bool deadline_passed(clock::time_point now) const noexcept {
        return deadline_ && now >= *deadline_;
    }

    // --- handler side ---

    /// Next inbound payload; nullopt at end of input or once inactive
    std::optional<message_buffer> read_payload() {
        auto token = cancel_.get_token();
        auto wake = token.on_cancel([this] { notify_inbox(); });
        std::unique_lock<std::mutex> lock(inbox_mutex_);
        for (;;) {
            if (token.is_cancelled()) {
                return std::nullopt;
            }
            if (!inbox_.empty()) {
                message_buffer payload = std::move(inbox_.front());
                inbox_.pop_front();
                inbox_bytes_ -= payload.size();
                space_cv_.notify_one();
                return payload;
            }
            if (half_closed_) {
                return std::nullopt;
            }
            inbox_cv_.wait_for(lock, poll_interval_);
        }
    }

    /// Send one serialized message. Throws stream_error.
    void write_payload(const buffer_writer& payload);

    bool is_active() const noexcept {
        return !cancel_.is_cancelled() && !finished_.load(std::memory_order_acquire);
    }

    sync::cancel_token token() const noexcept {
        return cancel_.get_token();
    }

    void abort(status_code code, std::string_view detail) {
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            if (!abort_status_) {
                abort_status_ = rpc_status{code, std::string(detail)};
            }
        }
        cancel_.cancel(code == status_code::deadline_exceeded
                           ? sync::cancel_reason::deadline_exceeded
                           : sync::cancel_reason::requested);
    }

    std::optional<rpc_status> abort_status() const {
        std::lock_guard<std::mutex> lock(status_mutex_);
        return abort_status_;
    }

    /// Status the call ends with when its handler returned normally
    rpc_status final_status() const {
        if (auto aborted = abort_status()) {
            return *aborted;
        }
        auto reason = cancel_.reason();
        if (reason != sync::cancel_reason::none) {
            return rpc_status{status_for(reason), sync::cancel_reason_str(reason)};
        }
        return rpc_status::success();
    }

    /// Send the terminal status frame. Only the first call has any effect.
    /// @return true if this call wrote the status
    bool finish(const rpc_status& status);

    bool is_finished() const noexcept {
        return finished_.load(std::memory_order_acquire);
    }

    const std::shared_ptr<server_connection>& connection() const noexcept { return conn_; }

    size_t inbox_size() const {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        return inbox_.size();
    }

    /// Times deliver() had to wait for room
    size_t inbox_stalls() const {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        return inbox_stalls_;
    }

private:
    bool inbox_full() const noexcept {
        return inbox_.size() >= inbox_messages_ || (!inbox_.empty() && inbox_bytes_ >= inbox_bytes_limit_);
    }

    void notify_inbox() {
        { std::lock_guard<std::mutex> lock(inbox_mutex_); }
        inbox_cv_.notify_all();
        space_cv_.notify_all();
    }

    std::shared_ptr<server_connection> conn_;
    const uint32_t stream_id_;
    const method_id_t method_id_;
    const char* method_name_;
    const std::optional<clock::time_point> deadline_;
    const std::chrono::milliseconds poll_interval_;
    const size_t inbox_messages_;
    const size_t inbox_bytes_limit_;

    sync::cancel_source cancel_;
    std::atomic<bool> finished_{false};

    mutable std::mutex inbox_mutex_;
    std::condition_variable inbox_cv_;
    std::condition_variable space_cv_;
    std::deque<message_buffer> inbox_;
    size_t inbox_bytes_ = 0;
    size_t inbox_stalls_ = 0;
    bool half_closed_ = false;

    mutable std::mutex status_mutex_;
    std::optional<rpc_status> abort_status_;
};

// ============================================================================
// Server connection
// ============================================================================

/// One accepted client connection carrying any number of calls
class server_connection : public std::enable_shared_from_this<server_connection> {
public:
    using ptr = std::shared_ptr<server_connection>;

    /// Invoked on the reader thread for every open frame
    using open_handler_t = std::function<void(const ptr& conn,
                                              const frame_header& header,
                                              std::optional<uint32_t> timeout_ms)>;

    /// How a frame write on behalf of a call ended
    enum class send_result {
        sent,
        stopped,    ///< The call was cancelled before any byte went out
        failed,     ///< The connection is no longer writable
    };

    static ptr create(net::tcp_stream stream, const server_config& config, open_handler_t on_open) {
        return ptr(new server_connection(std::move(stream), config, std::move(on_open)));
    }

    ~server_connection() {
        // The reader may hold the last reference to its own connection.
        if (reader_.joinable()) {
            if (reader_.get_id() == std::this_thread::get_id()) {
                reader_.detach();
            } else {
                reader_.join();
            }
        }
    }

    server_connection(const server_connection&) = delete;
    server_connection& operator=(const server_connection&) = delete;

    void start() {
        reader_ = std::thread([self = shared_from_this()] { self->run(); });
    }

    /// Write one frame; false once the connection is unusable. Bounded by
    /// write_timeout when the peer stops reading.
    bool send(const frame_header& header, const void* data, size_t size) {
        return send_frame(header, data, size, [] { return true; }) == send_result::sent;
    }

    /// Write one message frame for a call, giving up as soon as token is
    /// cancelled. Only a write abandoned part-way costs the connection.
    send_result send_for(const sync::cancel_token& token, const frame_header& header,
                         const buffer_writer& payload) {
        return send_frame(header, payload.data(), payload.size(),
                          [&token] { return !token.is_cancelled(); });
    }

    bool send(const frame_header& header, const buffer_writer& payload) {
        return send(header, payload.data(), payload.size());
    }

    bool send_status(uint32_t stream_id, const rpc_status& status) {
        auto [header, payload] = build_status(stream_id, status);
        return send(header, payload);
    }

    bool add_call(const server_call::ptr& call) {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        if (closed_.load(std::memory_order_acquire)) {
            return false;
        }
        return calls_.emplace(call->stream_id(), call).second;
    }

    void remove_call(uint32_t stream_id) {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        calls_.erase(stream_id);
    }

    server_call::ptr find_call(uint32_t stream_id) const {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        auto it = calls_.find(stream_id);
        return it == calls_.end() ? nullptr : it->second;
    }

    std::vector<server_call::ptr> live_calls() const {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        std::vector<server_call::ptr> result;
        result.reserve(calls_.size());
        for (const auto& [id, call] : calls_) {
            result.push_back(call);
        }
        return result;
    }

    void cancel_all(sync::cancel_reason why) {
        for (auto& call : live_calls()) {
            call->cancel(why);
        }
    }

    /// Wake the reader thread by shutting the socket down
    void shutdown() noexcept {
        stream_.shutdown();
    }

    void join() {
        if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
            reader_.join();
        }
    }

    bool is_closed() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }

    bool is_writable() const noexcept {
        return writable_.load(std::memory_order_acquire);
    }

    size_t max_message_size() const noexcept { return config_.max_message_size; }

    const std::string& peer() const noexcept { return peer_; }

private:
    server_connection(net::tcp_stream stream, const server_config& config, open_handler_t on_open)
        : stream_(std::move(stream))
        , peer_(stream_.peer_address().to_string())
        , config_(config)
        , on_open_(std::move(on_open)) {}

    template<typename KeepGoing>
    send_result send_frame(const frame_header& header, const void* data, size_t size,
                           KeepGoing&& keep_going) {
        send_result result;
        {
            std::unique_lock<std::timed_mutex> lock(send_mutex_, std::defer_lock);
            while (!lock.try_lock_for(config_.poll_interval)) {
                if (!is_writable()) {
                    return send_result::failed;
                }
                if (!keep_going()) {
                    return send_result::stopped;
                }
            }
            result = write_locked(header, data, size, keep_going);
        }
        flush_pongs();
        return result;
    }

    // Caller holds send_mutex_
    template<typename KeepGoing>
    send_result write_locked(const frame_header& header, const void* data, size_t size,
                             KeepGoing&& keep_going) {
        if (!is_writable()) {
            return send_result::failed;
        }
        auto outcome = write_frame_until(stream_, header, data, size,
                                         config_.poll_interval, config_.write_timeout,
                                         [&] { return is_writable() && keep_going(); });
        switch (outcome) {
            case frame_write::written:
                return send_result::sent;
            case frame_write::stopped:
                return send_result::stopped;
            case frame_write::failed:
                break;
        }
        // A torn or stalled frame leaves nothing usable; the reader wakes on
        // the shutdown and cancels every call on the connection.
        if (writable_.exchange(false, std::memory_order_acq_rel)) {
            STREAMECHO_LOG_WARNING("connection {}: write failed, closing", peer_);
            stream_.shutdown();
        }
        return send_result::failed;
    }

    /// Pongs never wait for the send lock. A pong queued while a writer holds
    /// it goes out when that writer lets go.
    void queue_pong(uint32_t stream_id) {
        {
            std::lock_guard<std::mutex> lock(pong_mutex_);
            pending_pongs_.push_back(stream_id);
        }
        pongs_pending_.store(true, std::memory_order_release);
        flush_pongs();
    }

    void flush_pongs() {
        while (pongs_pending_.load(std::memory_order_acquire)) {
            std::unique_lock<std::timed_mutex> lock(send_mutex_, std::try_to_lock);
            if (!lock.owns_lock()) {
                return;
            }
            std::vector<uint32_t> ids;
            {
                std::lock_guard<std::mutex> pongs(pong_mutex_);
                ids.swap(pending_pongs_);
                pongs_pending_.store(false, std::memory_order_release);
            }
            for (uint32_t id : ids) {
                // No room for 18 bytes means the peer is not reading; skip it.
                if (write_locked(build_pong(id), nullptr, 0, [] { return false; }) == send_result::stopped) {
                    STREAMECHO_LOG_DEBUG("connection {}: pong for {} skipped, peer not reading", peer_, id);
                }
            }
        }
    }

    void run() {
        auto self = shared_from_this();
        STREAMECHO_LOG_DEBUG("connection {}: reader started", peer_);

        for (;;) {
            auto f = read_frame(stream_, config_.max_message_size);
            if (!f) {
                if (f.error() == read_failure::bad_frame) {
                    STREAMECHO_LOG_ERROR("connection {}: protocol error, closing", peer_);
                } else if (f.error() == read_failure::io_error) {
                    STREAMECHO_LOG_DEBUG("connection {}: read failed", peer_);
                }
                break;
            }
            handle_frame(self, f->header, std::move(f->payload));
        }

        {
            std::lock_guard<std::mutex> lock(calls_mutex_);
            closed_.store(true, std::memory_order_release);
        }
        writable_.store(false, std::memory_order_release);
        cancel_all(sync::cancel_reason::peer_disconnected);
        STREAMECHO_LOG_INFO("Connection from {} closed", peer_);
    }

    void handle_frame(const ptr& self, const frame_header& header, message_buffer payload) {
        switch (header.type) {
            case frame_type::open: {
                std::optional<uint32_t> timeout_ms;
                try {
                    timeout_ms = parse_open(payload, header.flags);
                } catch (const serialization_error& e) {
                    STREAMECHO_LOG_WARNING("connection {}: malformed open frame: {}", peer_, e.what());
                    send_status(header.stream_id, {status_code::invalid_argument, e.what()});
                    break;
                }
                on_open_(self, header, timeout_ms);
                break;
            }

            case frame_type::message:
                if (auto call = find_call(header.stream_id)) {
                    call->deliver(std::move(payload));
                } else {
                    STREAMECHO_LOG_DEBUG("connection {}: message for unknown stream {}",
                                         peer_, header.stream_id);
                }
                break;

            case frame_type::half_close:
                if (auto call = find_call(header.stream_id)) {
                    call->half_close();
                }
                break;

            case frame_type::cancel:
                if (auto call = find_call(header.stream_id)) {
                    if (call->cancel(sync::cancel_reason::peer_cancelled)) {
                        STREAMECHO_LOG_INFO("{} stream {}: cancelled by client",
                                            call->method_name(), header.stream_id);
                    }
                }
                break;

            case frame_type::ping:
                queue_pong(header.stream_id);
                break;

            case frame_type::pong:
                break;

            default:
                STREAMECHO_LOG_WARNING("connection {}: unexpected {} frame",
                                       peer_, frame_type_str(header.type));
                break;
        }
    }

    net::tcp_stream stream_;
    const std::string peer_;
    const server_config config_;
    open_handler_t on_open_;
    std::thread reader_;
    std::atomic<bool> closed_{false};

    std::timed_mutex send_mutex_;
    std::atomic<bool> writable_{true};

    std::mutex pong_mutex_;
    std::vector<uint32_t> pending_pongs_;
    std::atomic<bool> pongs_pending_{false};

    mutable std::mutex calls_mutex_;
    std::unordered_map<uint32_t, server_call::ptr> calls_;
};

inline void server_call::write_payload(const buffer_writer& payload) {
    if (auto aborted = abort_status()) {
        throw stream_error(aborted->code, "write after abort");
    }
    if (cancel_.is_cancelled()) {
        auto reason = cancel_.reason();
        throw stream_error(status_for(reason),
                           fmt::format("call is no longer active: {}", sync::cancel_reason_str(reason)));
    }
    if (finished_.load(std::memory_order_acquire)) {
        throw stream_error(status_code::internal, "write after finish");
    }
    if (payload.size() > conn_->max_message_size()) {
        throw stream_error(status_code::resource_exhausted,
                           fmt::format("message of {} bytes exceeds limit", payload.size()));
    }
    auto token = cancel_.get_token();
    switch (conn_->send_for(token, make_header(stream_id_, frame_type::message, payload.size()), payload)) {
        case server_connection::send_result::sent:
            return;
        case server_connection::send_result::failed:
            if (cancel_.cancel(sync::cancel_reason::transport_fault)) {
                throw stream_error(status_code::unavailable, "failed to write to peer");
            }
            break;
        case server_connection::send_result::stopped:
            break;
    }
    auto reason = cancel_.reason();
    throw stream_error(status_for(reason),
                       fmt::format("write stopped, call is no longer active: {}",
                                   sync::cancel_reason_str(reason)));
}

inline bool server_call::finish(const rpc_status& status) {
    bool expected = false;
    if (!finished_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return false;
    }
    bool sent = conn_->send_status(stream_id_, status);
    conn_->remove_call(stream_id_);
    // Anything still holding the token sees the call as over.
    cancel_.cancel(sync::cancel_reason::call_inactive);
    notify_inbox();
    return sent;
}

// ============================================================================
// Typed adapter
// ============================================================================

/// server_stream over a server_call, encoding and decoding messages
template<typename Request, typename Response>
class call_stream final : public server_stream<Request, Response> {
public:
    explicit call_stream(server_call& call) : call_(call) {}

    std::optional<Request> read() override {
        auto payload = call_.read_payload();
        if (!payload) {
            return std::nullopt;
        }
        try {
            return parse_message<Request>(*payload);
        } catch (const serialization_error& e) {
            throw stream_error(status_code::invalid_argument,
                               fmt::format("malformed request: {}", e.what()));
        }
    }

    void write(const Response& response) override {
        buffer_writer payload;
        serialize(payload, response);
        call_.write_payload(payload);
    }

    bool is_active() const override { return call_.is_active(); }

    sync::cancel_token token() const override { return call_.token(); }

    void abort(status_code code, std::string_view detail) override {
        call_.abort(code, detail);
    }

    method_id_t method() const override { return call_.method_id(); }

    uint32_t stream_id() const override { return call_.stream_id(); }

private:
    server_call& call_;
};

// ============================================================================
// Server
// ============================================================================

class stream_server {
public:
    explicit stream_server(server_config config = {})
        : config_(config)
        , pool_(config_.num_workers, config_.pending_limit()) {}

    ~stream_server() {
        stop();
    }

    stream_server(const stream_server&) = delete;
    stream_server& operator=(const stream_server&) = delete;

    /// Register a client-streaming handler: void(server_stream<Req, Resp>&).
    /// The handler writes its single response before returning.
    template<typename Method, typename Handler>
    void register_client_streaming(Handler handler) {
        static_assert(Method::kind == call_kind::client_streaming);
        using Request = typename Method::request_type;
        using Response = typename Method::response_type;
        add_method<Method>([h = std::move(handler)](server_call& call) {
            call_stream<Request, Response> stream(call);
            h(stream);
        });
    }

    /// Register a server-streaming handler: void(const Req&, server_stream<Req, Resp>&)
    template<typename Method, typename Handler>
    void register_server_streaming(Handler handler) {
        static_assert(Method::kind == call_kind::server_streaming);
        using Request = typename Method::request_type;
        using Response = typename Method::response_type;
        add_method<Method>([h = std::move(handler)](server_call& call) {
            call_stream<Request, Response> stream(call);
            auto request = stream.read();
            if (!request) {
                if (call.is_active()) {
                    stream.abort(status_code::invalid_argument, "missing request message");
                }
                return;
            }
            h(*request, stream);
        });
    }

    /// Register a bidirectional handler: void(server_stream<Req, Resp>&)
    template<typename Method, typename Handler>
    void register_bidi_streaming(Handler handler) {
        static_assert(Method::kind == call_kind::bidi_streaming);
        using Request = typename Method::request_type;
        using Response = typename Method::response_type;
        add_method<Method>([h = std::move(handler)](server_call& call) {
            call_stream<Request, Response> stream(call);
            h(stream);
        });
    }

    /// Bind, start the workers and the accept thread.
    /// @return The bound address (with the real port when 0 was requested)
    std::expected<net::ipv4_address, int> start(const net::ipv4_address& addr) {
        if (running_.load(std::memory_order_acquire)) {
            return std::unexpected(EALREADY);
        }
        auto listener = net::tcp_listener::bind(addr, config_.tcp);
        if (!listener) {
            STREAMECHO_LOG_ERROR("Failed to bind {}: {}", addr.to_string(), std::strerror(listener.error()));
            return std::unexpected(listener.error());
        }
        listener_ = std::move(*listener);
        pool_.start();
        running_.store(true, std::memory_order_release);
        accept_thread_ = std::thread([this] { accept_loop(); });

        STREAMECHO_LOG_INFO("Stream server listening on {} ({} workers, {} pending calls max)",
                            listener_->local_address().to_string(),
                            config_.num_workers, config_.pending_limit());
        return listener_->local_address();
    }

    /// Stop accepting, cancel live calls, wait up to the grace period.
    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        STREAMECHO_LOG_INFO("Stream server stopping, {} calls in flight", active_calls());

        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        if (listener_) {
            listener_->close();
        }

        std::vector<server_connection::ptr> conns;
        {
            std::lock_guard<std::mutex> lock(conns_mutex_);
            conns.swap(connections_);
        }
        for (auto& conn : conns) {
            conn->cancel_all(sync::cancel_reason::server_shutdown);
        }

        {
            std::unique_lock<std::mutex> lock(calls_mutex_);
            if (!calls_cv_.wait_for(lock, config_.shutdown_grace, [this] { return active_calls_ == 0; })) {
                STREAMECHO_LOG_WARNING("{} calls still running after {}ms grace period",
                                       active_calls_, config_.shutdown_grace.count());
            }
        }

        for (auto& conn : conns) {
            conn->shutdown();
        }
        for (auto& conn : conns) {
            conn->join();
        }
        pool_.shutdown();
        STREAMECHO_LOG_INFO("Stream server stopped: {} calls served, {} rejected",
                            calls_started_.load(), calls_rejected_.load());
    }

    bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    size_t active_calls() const {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        return active_calls_;
    }

    size_t connection_count() const {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        return connections_.size();
    }

    uint64_t calls_started() const noexcept { return calls_started_.load(std::memory_order_relaxed); }

    uint64_t calls_rejected() const noexcept { return calls_rejected_.load(std::memory_order_relaxed); }

    const server_config& config() const noexcept { return config_; }

private:
    struct method_entry {
        const char* name;
        call_kind kind;
        std::function<void(server_call&)> invoke;
    };

    template<typename Method>
    void add_method(std::function<void(server_call&)> invoke) {
        if (running_.load(std::memory_order_acquire)) {
            throw std::logic_error("methods must be registered before start()");
        }
        methods_[Method::id] = method_entry{Method::name, Method::kind, std::move(invoke)};
    }

    void accept_loop() {
        while (running_.load(std::memory_order_acquire)) {
            auto stream = listener_->accept(config_.poll_interval);
            if (stream) {
                STREAMECHO_LOG_INFO("Accepted connection from {}", stream->peer_address().to_string());
                auto conn = server_connection::create(
                    std::move(*stream), config_,
                    [this](const server_connection::ptr& c, const frame_header& h,
                           std::optional<uint32_t> timeout_ms) {
                        on_open(c, h, timeout_ms);
                    });
                {
                    std::lock_guard<std::mutex> lock(conns_mutex_);
                    connections_.push_back(conn);
                }
                conn->start();
            } else if (stream.error() != ETIMEDOUT && running_.load(std::memory_order_acquire)) {
                STREAMECHO_LOG_ERROR("Accept failed: {}", std::strerror(stream.error()));
            }

            expire_deadlines();
            reap_connections();
        }
    }

    void on_open(const server_connection::ptr& conn, const frame_header& header,
                 std::optional<uint32_t> timeout_ms) {
        auto it = methods_.find(header.method_id);
        if (it == methods_.end()) {
            STREAMECHO_LOG_WARNING("Unknown method {} on stream {}", header.method_id, header.stream_id);
            conn->send_status(header.stream_id,
                              {status_code::unimplemented, fmt::format("method {} not found", header.method_id)});
            return;
        }
        if (!running_.load(std::memory_order_acquire)) {
            conn->send_status(header.stream_id, {status_code::unavailable, "server is shutting down"});
            return;
        }

        std::optional<server_call::clock::time_point> deadline;
        if (timeout_ms) {
            deadline = server_call::clock::now() + std::chrono::milliseconds(*timeout_ms);
        }
        auto call = std::make_shared<server_call>(conn, header.stream_id, header.method_id,
                                                  it->second.name, deadline, config_);
        if (!conn->add_call(call)) {
            STREAMECHO_LOG_WARNING("Rejecting open for stream {}: id in use or connection closing",
                                   header.stream_id);
            conn->send_status(header.stream_id, {status_code::invalid_argument, "stream id in use"});
            return;
        }

        {
            std::lock_guard<std::mutex> lock(calls_mutex_);
            ++active_calls_;
        }
        const method_entry* entry = &it->second;
        if (!pool_.submit([this, call, entry] { run_call(call, *entry); })) {
            calls_rejected_.fetch_add(1, std::memory_order_relaxed);
            STREAMECHO_LOG_WARNING("{} stream {}: rejected, server at capacity", entry->name, header.stream_id);
            call->finish({status_code::resource_exhausted, "too many concurrent calls"});
            call_done();
        }
    }

    void run_call(const server_call::ptr& call, const method_entry& entry) {
        calls_started_.fetch_add(1, std::memory_order_relaxed);
        auto started = std::chrono::steady_clock::now();
        STREAMECHO_LOG_INFO("{} stream {}: call started ({}, peer {})",
                            entry.name, call->stream_id(), call_kind_str(entry.kind),
                            call->connection()->peer());

        rpc_status status;
        try {
            entry.invoke(*call);
            status = call->final_status();
        } catch (const stream_error& e) {
            status = call->abort_status().value_or(rpc_status{e.code(), e.what()});
        } catch (const std::exception& e) {
            STREAMECHO_LOG_ERROR("{} stream {}: handler threw: {}", entry.name, call->stream_id(), e.what());
            status = rpc_status{status_code::internal, e.what()};
        }

        bool delivered = call->finish(status);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (status.ok()) {
            STREAMECHO_LOG_INFO("{} stream {}: call finished OK in {}ms",
                                entry.name, call->stream_id(), elapsed.count());
        } else {
            STREAMECHO_LOG_WARNING("{} stream {}: call finished {} ({}) in {}ms{}",
                                   entry.name, call->stream_id(), status_code_str(status.code),
                                   status.detail, elapsed.count(),
                                   delivered ? "" : ", peer gone");
        }
        call_done();
    }

    void call_done() {
        {
            std::lock_guard<std::mutex> lock(calls_mutex_);
            --active_calls_;
        }
        calls_cv_.notify_all();
    }

    void expire_deadlines() {
        std::vector<server_connection::ptr> conns;
        {
            std::lock_guard<std::mutex> lock(conns_mutex_);
            conns = connections_;
        }
        auto now = server_call::clock::now();
        for (auto& conn : conns) {
            for (auto& call : conn->live_calls()) {
                if (call->deadline_passed(now) && call->cancel(sync::cancel_reason::deadline_exceeded)) {
                    STREAMECHO_LOG_WARNING("{} stream {}: deadline exceeded",
                                           call->method_name(), call->stream_id());
                }
            }
        }
    }

    void reap_connections() {
        std::vector<server_connection::ptr> finished;
        {
            std::lock_guard<std::mutex> lock(conns_mutex_);
            auto split = std::partition(connections_.begin(), connections_.end(),
                [](const server_connection::ptr& c) { return !c->is_closed(); });
            finished.assign(std::make_move_iterator(split), std::make_move_iterator(connections_.end()));
            connections_.erase(split, connections_.end());
        }
        for (auto& conn : finished) {
            conn->join();
        }
    }

    const server_config config_;
    runtime::worker_pool pool_;
    std::unordered_map<method_id_t, method_entry> methods_;

    std::optional<net::tcp_listener> listener_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex conns_mutex_;
    std::vector<server_connection::ptr> connections_;

    mutable std::mutex calls_mutex_;
    std::condition_variable calls_cv_;
    size_t active_calls_ = 0;

    std::atomic<uint64_t> calls_started_{0};
    std::atomic<uint64_t> calls_rejected_{0};
};

} // namespace streamecho::rpc
