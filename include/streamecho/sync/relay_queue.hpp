#pragma once

/// @file relay_queue.hpp
/// @brief Bounded single-producer/single-consumer hand-off between threads
///
/// A relay queue carries messages from one execution context to another and
/// signals backpressure by blocking the producer while the queue is full.
/// End of stream travels through the queue as an explicit variant
/// alternative, so every consumer has to handle it:
///
/// @code
/// relay_queue<std::string> q(10);
/// q.put("hello", stop);
/// q.close();
///
/// while (auto item = q.take(stop)) {
///     if (is_end_of_stream(*item)) break;
///     use(std::get<std::string>(*item));
/// }
/// @endcode
///
/// Every blocking call takes a cancel_token and wakes as soon as it is
/// cancelled; the poll interval only bounds how long a waiter sleeps before
/// re-checking its predicate.

#include "cancel_token.hpp"

#include <streamecho/log/macros.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <variant>

namespace streamecho::sync {

/// End-of-stream marker (the Sentinel)
struct end_of_stream {
    bool operator==(const end_of_stream&) const noexcept = default;
};

/// Element type observed by consumers: a message or the end marker
template<typename T>
using relay_item = std::variant<T, end_of_stream>;

template<typename T>
constexpr bool is_end_of_stream(const relay_item<T>& item) noexcept {
    return std::holds_alternative<end_of_stream>(item);
}

/// Outcome of a put
enum class queue_status {
    ok,        ///< Item enqueued
    full,      ///< try_put only: no room
    stopped,   ///< The stop token fired while waiting for room
    closed,    ///< Queue already closed or its consumer detached
};

constexpr const char* queue_status_str(queue_status s) noexcept {
    switch (s) {
        case queue_status::ok: return "ok";
        case queue_status::full: return "full";
        case queue_status::stopped: return "stopped";
        case queue_status::closed: return "closed";
        default: return "unknown";
    }
}

/// Default interval after which a blocked waiter re-checks its predicate
inline constexpr std::chrono::milliseconds default_poll_interval{100};

/// Bounded FIFO relay with an end-of-stream marker.
///
/// At most capacity() messages are held at once. The marker does not take
/// a slot: close() never blocks, and once the queue has drained every
/// take() keeps reporting end_of_stream.
template<typename T>
class relay_queue {
public:
    explicit relay_queue(size_t capacity,
                         std::chrono::milliseconds poll_interval = default_poll_interval)
        : capacity_(capacity == 0 ? 1 : capacity)
        , poll_interval_(poll_interval) {}

    relay_queue(const relay_queue&) = delete;
    relay_queue& operator=(const relay_queue&) = delete;

    /// Append value, blocking while the queue is full.
    queue_status put(T value, const cancel_token& stop) {
        auto wake = stop.on_cancel([this] { notify_all(); });
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            if (closed_ || consumer_detached_) {
                return queue_status::closed;
            }
            if (items_.size() < capacity_) {
                break;
            }
            if (stop.is_cancelled()) {
                return queue_status::stopped;
            }
            ++producer_waits_;
            not_full_.wait_for(lock, poll_interval_);
        }
        push_locked(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return queue_status::ok;
    }

    /// Append value without blocking.
    queue_status try_put(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || consumer_detached_) {
                return queue_status::closed;
            }
            if (items_.size() >= capacity_) {
                return queue_status::full;
            }
            push_locked(std::move(value));
        }
        not_empty_.notify_one();
        return queue_status::ok;
    }

    /// Enqueue the end marker. The producer's last action; a second call is
    /// a defect and is refused.
    bool close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                STREAMECHO_LOG_ERROR("relay_queue: end marker already enqueued, refusing a second one");
                return false;
            }
            closed_ = true;
        }
        notify_all();
        return true;
    }

    /// Remove and return the head message, or end_of_stream once the queue
    /// is closed and drained. Returns nullopt if stop fired first.
    std::optional<relay_item<T>> take(const cancel_token& stop) {
        auto wake = stop.on_cancel([this] { notify_all(); });
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            if (!items_.empty()) {
                relay_item<T> item{std::in_place_index<0>, std::move(items_.front())};
                items_.pop_front();
                lock.unlock();
                not_full_.notify_one();
                return item;
            }
            if (closed_) {
                ++sentinels_observed_;
                return relay_item<T>{end_of_stream{}};
            }
            if (stop.is_cancelled()) {
                return std::nullopt;
            }
            not_empty_.wait_for(lock, poll_interval_);
        }
    }

    /// Mark the consumer as gone. Pending items are discarded and later
    /// puts fail fast with queue_status::closed.
    size_t detach_consumer() {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            consumer_detached_ = true;
            dropped = items_.size();
            items_.clear();
        }
        notify_all();
        return dropped;
    }

    size_t capacity() const noexcept { return capacity_; }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool is_consumer_detached() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return consumer_detached_;
    }

    /// Largest number of messages held at any moment
    size_t high_water_mark() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return high_water_mark_;
    }

    /// Number of times a producer had to wait for room
    size_t producer_waits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return producer_waits_;
    }

    /// Number of take() calls that returned end_of_stream
    size_t sentinels_observed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sentinels_observed_;
    }

private:
    void push_locked(T value) {
        items_.push_back(std::move(value));
        if (items_.size() > high_water_mark_) {
            high_water_mark_ = items_.size();
        }
    }

    void notify_all() {
        // Taking the lock orders the notification after the waiter's
        // predicate check, so the wake-up cannot be lost.
        { std::lock_guard<std::mutex> lock(mutex_); }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    const size_t capacity_;
    const std::chrono::milliseconds poll_interval_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_ = false;
    bool consumer_detached_ = false;
    size_t high_water_mark_ = 0;
    size_t producer_waits_ = 0;
    size_t sentinels_observed_ = 0;
};

} // namespace streamecho::sync
