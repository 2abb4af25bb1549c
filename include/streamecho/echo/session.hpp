#pragma once

#include <streamecho/log/macros.hpp>
#include <streamecho/sync/cancel_token.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>

namespace streamecho::echo {

/// Lifecycle of one call on the echo service.
///
///   created -> active -> draining -> closed
///                  \          \
///                   +----------+--> cancelled | errored
enum class session_state : uint8_t {
    created,
    active,      ///< Reading input
    draining,    ///< Input ended, output still flowing
    closed,      ///< Normal end
    cancelled,   ///< Peer went away, call inactive, deadline or shutdown
    errored,     ///< Transport or processing fault
};

constexpr const char* session_state_str(session_state s) noexcept {
    switch (s) {
        case session_state::created: return "created";
        case session_state::active: return "active";
        case session_state::draining: return "draining";
        case session_state::closed: return "closed";
        case session_state::cancelled: return "cancelled";
        case session_state::errored: return "errored";
        default: return "unknown";
    }
}

constexpr bool is_terminal(session_state s) noexcept {
    return s == session_state::closed || s == session_state::cancelled || s == session_state::errored;
}

/// Message counters. Each has a single writer.
struct session_counters {
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> responses{0};
};

/// Per-call record owned by the handler.
///
/// The session's cancel source is linked to the call's token, so a peer
/// cancel or disconnect raises it without any polling. Activities receive a
/// copy of the source (to observe and raise) and the shared counters, never
/// the session itself, so they cannot outlive what they reference.
class stream_session {
public:
    stream_session(const char* method, uint32_t stream_id, const sync::cancel_token& call_token)
        : method_(method)
        , stream_id_(stream_id)
        , cancel_(call_token)
        , counters_(std::make_shared<session_counters>())
        , started_(std::chrono::steady_clock::now()) {}

    ~stream_session() {
        auto s = state();
        if (!is_terminal(s)) {
            STREAMECHO_LOG_ERROR("{} stream {}: session destroyed in state {}",
                                 method_, stream_id_, session_state_str(s));
        }
    }

    stream_session(const stream_session&) = delete;
    stream_session& operator=(const stream_session&) = delete;

    /// created -> active
    bool activate() {
        return transition({session_state::created}, session_state::active);
    }

    /// active -> draining
    bool begin_draining() {
        return transition({session_state::active}, session_state::draining);
    }

    /// draining -> closed
    bool close() {
        return transition({session_state::draining}, session_state::closed);
    }

    /// active|draining -> cancelled, raising the signal if nobody has
    bool cancel(sync::cancel_reason why) {
        cancel_.cancel(why);
        return transition({session_state::active, session_state::draining}, session_state::cancelled);
    }

    /// active|draining -> errored, raising the signal and recording detail
    bool fail(sync::cancel_reason why, std::string detail) {
        cancel_.cancel(why);
        if (!transition({session_state::active, session_state::draining}, session_state::errored)) {
            return false;
        }
        std::lock_guard<std::mutex> lock(detail_mutex_);
        detail_ = std::move(detail);
        return true;
    }

    session_state state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    bool is_cancelled() const noexcept {
        return cancel_.is_cancelled();
    }

    sync::cancel_reason cancel_reason() const noexcept {
        return cancel_.reason();
    }

    sync::cancel_token token() const noexcept {
        return cancel_.get_token();
    }

    /// Observe-and-raise capability handed to activities
    sync::cancel_source source() const noexcept {
        return cancel_;
    }

    const std::shared_ptr<session_counters>& counters() const noexcept {
        return counters_;
    }

    uint64_t request_count() const noexcept {
        return counters_->requests.load(std::memory_order_relaxed);
    }

    uint64_t response_count() const noexcept {
        return counters_->responses.load(std::memory_order_relaxed);
    }

    void count_request() noexcept {
        counters_->requests.fetch_add(1, std::memory_order_relaxed);
    }

    void count_response() noexcept {
        counters_->responses.fetch_add(1, std::memory_order_relaxed);
    }

    std::string detail() const {
        std::lock_guard<std::mutex> lock(detail_mutex_);
        return detail_;
    }

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_);
    }

    const char* method() const noexcept { return method_; }

    uint32_t stream_id() const noexcept { return stream_id_; }

private:
    bool transition(std::initializer_list<session_state> from, session_state to) {
        session_state current = state_.load(std::memory_order_acquire);
        for (;;) {
            bool allowed = false;
            for (auto s : from) {
                allowed = allowed || s == current;
            }
            if (!allowed) {
                if (is_terminal(to) && is_terminal(current)) {
                    STREAMECHO_LOG_ERROR("{} stream {}: already {}, refusing transition to {}",
                                         method_, stream_id_, session_state_str(current),
                                         session_state_str(to));
                } else {
                    STREAMECHO_LOG_DEBUG("{} stream {}: no transition {} -> {}",
                                         method_, stream_id_, session_state_str(current),
                                         session_state_str(to));
                }
                return false;
            }
            if (state_.compare_exchange_weak(current, to, std::memory_order_acq_rel)) {
                STREAMECHO_LOG_DEBUG("{} stream {}: {} -> {}", method_, stream_id_,
                                     session_state_str(current), session_state_str(to));
                return true;
            }
        }
    }

    const char* method_;
    const uint32_t stream_id_;
    sync::cancel_source cancel_;
    std::shared_ptr<session_counters> counters_;
    const std::chrono::steady_clock::time_point started_;
    std::atomic<session_state> state_{session_state::created};

    mutable std::mutex detail_mutex_;
    std::string detail_;
};

} // namespace streamecho::echo
