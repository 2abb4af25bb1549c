#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace streamecho::sync {

/// Why a cancellation signal was raised. Only the first raise is recorded.
enum class cancel_reason : uint8_t {
    none = 0,            ///< Not cancelled
    requested,           ///< Explicit cancel() without a more specific cause
    peer_cancelled,      ///< Peer sent a cancel frame
    peer_disconnected,   ///< Connection to the peer was lost
    call_inactive,       ///< The call context reported inactivity
    deadline_exceeded,   ///< Client-supplied deadline passed
    processing_fault,    ///< The processing stage failed
    transport_fault,     ///< Reading from or writing to the stream failed
    server_shutdown,     ///< Server is stopping
};

constexpr const char* cancel_reason_str(cancel_reason reason) noexcept {
    switch (reason) {
        case cancel_reason::none: return "none";
        case cancel_reason::requested: return "requested";
        case cancel_reason::peer_cancelled: return "peer cancelled";
        case cancel_reason::peer_disconnected: return "peer disconnected";
        case cancel_reason::call_inactive: return "call inactive";
        case cancel_reason::deadline_exceeded: return "deadline exceeded";
        case cancel_reason::processing_fault: return "processing fault";
        case cancel_reason::transport_fault: return "transport fault";
        case cancel_reason::server_shutdown: return "server shutdown";
        default: return "unknown";
    }
}

namespace detail {

/// Shared cancellation state
struct cancel_state {
    std::atomic<bool> cancelled{false};
    std::atomic<cancel_reason> reason{cancel_reason::none};
    std::mutex mutex;
    std::mutex invoke_mutex;  // held while callbacks run; see remove_callback
    std::condition_variable cv;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;
    uint64_t next_id = 1;

    /// Returns 0 when the state was already cancelled; the callback has then
    /// run synchronously on the calling thread.
    uint64_t add_callback(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!cancelled.load(std::memory_order_relaxed)) {
                uint64_t id = next_id++;
                callbacks.emplace_back(id, std::move(cb));
                return id;
            }
        }
        cb();
        return 0;
    }

    /// Once this returns the callback is neither running nor pending.
    void remove_callback(uint64_t id) {
        std::lock_guard<std::mutex> invoke_lock(invoke_mutex);
        std::lock_guard<std::mutex> lock(mutex);
        callbacks.erase(
            std::remove_if(callbacks.begin(), callbacks.end(),
                [id](const auto& p) { return p.first == id; }),
            callbacks.end()
        );
    }

    /// Raise the signal. Returns true only for the raise that won.
    bool trigger(cancel_reason why) {
        std::vector<std::function<void()>> to_invoke;
        std::lock_guard<std::mutex> invoke_lock(invoke_mutex);
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled.load(std::memory_order_relaxed)) {
                return false;
            }
            reason.store(why, std::memory_order_relaxed);
            cancelled.store(true, std::memory_order_release);
            for (auto& [id, cb] : callbacks) {
                to_invoke.push_back(std::move(cb));
            }
            callbacks.clear();
        }
        cv.notify_all();
        for (auto& cb : to_invoke) {
            cb();
        }
        return true;
    }
};

} // namespace detail

/// Keeps one on_cancel callback registered. Dropping or reset()ing it
/// removes the callback and waits out a run already in progress.
class cancel_registration {
public:
    cancel_registration() = default;

    cancel_registration(cancel_registration&& other) noexcept
        : state_(std::move(other.state_))
        , id_(std::exchange(other.id_, 0)) {}

    cancel_registration& operator=(cancel_registration&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    ~cancel_registration() { unregister(); }

    cancel_registration(const cancel_registration&) = delete;
    cancel_registration& operator=(const cancel_registration&) = delete;

    void unregister() {
        auto state = std::exchange(state_, nullptr);
        if (auto id = std::exchange(id_, 0); state && id != 0) {
            state->remove_callback(id);
        }
    }

private:
    friend class cancel_token;

    cancel_registration(std::shared_ptr<detail::cancel_state> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::cancel_state> state_;
    uint64_t id_ = 0;  ///< 0: nothing registered (absent or already fired)
};

/// Read side of a cancellation signal.
///
/// Tokens are cheap to copy and may be handed to any number of threads. A
/// default-constructed token is never cancelled.
///
/// Example:
/// ```cpp
/// void pump(cancel_token token) {
///     while (!token.is_cancelled()) {
///         if (token.wait_for(100ms)) break;   // woke because of cancel
///     }
/// }
/// ```
class cancel_token {
public:
    using registration = cancel_registration;

    cancel_token() = default;

    bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    /// True if NOT cancelled
    explicit operator bool() const noexcept {
        return !is_cancelled();
    }

    cancel_reason reason() const noexcept {
        if (!is_cancelled()) {
            return cancel_reason::none;
        }
        return state_->reason.load(std::memory_order_relaxed);
    }

    /// Block the calling thread until cancellation or timeout.
    /// @return true if the token is cancelled on return
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        if (!state_) {
            std::this_thread::sleep_for(timeout);
            return false;
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this] {
            return state_->cancelled.load(std::memory_order_acquire);
        });
    }

    /// Register a callback invoked once on cancellation (immediately if the
    /// token is already cancelled). The callback runs on the cancelling
    /// thread and must neither block nor unregister callbacks on this token.
    template<typename F>
    [[nodiscard]] registration on_cancel(F&& callback) const {
        if (!state_) {
            return registration{};
        }
        return registration{state_, state_->add_callback(std::forward<F>(callback))};
    }

private:
    friend class cancel_source;

    explicit cancel_token(std::shared_ptr<detail::cancel_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancel_state> state_;
};

/// Write side of a cancellation signal.
///
/// Copies share the same state, so an activity given a copy may raise the
/// signal it observes. A source created from a parent token is cancelled
/// automatically (with the parent's reason) when the parent is.
class cancel_source {
public:
    cancel_source()
        : state_(std::make_shared<detail::cancel_state>()) {}

    explicit cancel_source(const cancel_token& parent)
        : state_(std::make_shared<detail::cancel_state>()) {
        std::weak_ptr<detail::cancel_state> weak = state_;
        std::weak_ptr<detail::cancel_state> weak_parent = parent.state_;
        parent_link_ = std::make_shared<cancel_registration>(
            parent.on_cancel([weak, weak_parent]() {
                auto state = weak.lock();
                auto parent_state = weak_parent.lock();
                if (state && parent_state) {
                    state->trigger(parent_state->reason.load(std::memory_order_relaxed));
                }
            }));
    }

    cancel_token get_token() const noexcept {
        return cancel_token{state_};
    }

    /// Raise the signal. Idempotent; returns true only for the first raise.
    bool cancel(cancel_reason why = cancel_reason::requested) {
        return state_->trigger(why);
    }

    bool is_cancelled() const noexcept {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    cancel_reason reason() const noexcept {
        return get_token().reason();
    }

private:
    std::shared_ptr<detail::cancel_state> state_;
    // Shared so copies of a linked source keep the link alive together.
    std::shared_ptr<cancel_registration> parent_link_;
};

} // namespace streamecho::sync
