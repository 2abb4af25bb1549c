#pragma once

#include <streamecho/log/macros.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace streamecho::runtime {

/// A named execution context owned by a single call.
///
/// Unlike std::thread, an activity can be joined with a deadline. If the
/// body has not finished by then the thread is detached, so anything the
/// body touches must be kept alive through shared ownership captured by the
/// body itself.
class activity {
public:
    activity() = default;

    /// Start body on a new thread.
    template<typename F>
    static activity spawn(std::string name, F&& body) {
        activity a;
        a.name_ = std::move(name);
        a.state_ = std::make_shared<completion>();
        a.thread_ = std::thread(
            [state = a.state_, fn = std::function<void()>(std::forward<F>(body)),
             label = a.name_]() mutable {
                try {
                    fn();
                } catch (const std::exception& e) {
                    STREAMECHO_LOG_ERROR("activity '{}' terminated by exception: {}", label, e.what());
                }
                state->mark_done();
            });
        return a;
    }

    activity(activity&&) noexcept = default;
    activity& operator=(activity&& other) noexcept {
        if (this != &other) {
            abandon();
            name_ = std::move(other.name_);
            state_ = std::move(other.state_);
            thread_ = std::move(other.thread_);
        }
        return *this;
    }

    activity(const activity&) = delete;
    activity& operator=(const activity&) = delete;

    ~activity() {
        abandon();
    }

    /// Wait up to timeout for the body to finish.
    /// @return true if it finished and the thread was joined; false if it
    ///         is still running, in which case it has been detached.
    template<typename Rep, typename Period>
    bool join_for(std::chrono::duration<Rep, Period> timeout) {
        if (!thread_.joinable()) {
            return true;
        }
        if (state_->wait_for(timeout)) {
            thread_.join();
            return true;
        }
        STREAMECHO_LOG_ERROR("activity '{}' did not finish within {}ms, detaching",
                             name_,
                             std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
        thread_.detach();
        return false;
    }

    bool is_finished() const noexcept {
        return !state_ || state_->is_done();
    }

    bool joinable() const noexcept {
        return thread_.joinable();
    }

    const std::string& name() const noexcept {
        return name_;
    }

private:
    struct completion {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;

        void mark_done() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                done = true;
            }
            cv.notify_all();
        }

        bool is_done() {
            std::lock_guard<std::mutex> lock(mutex);
            return done;
        }

        template<typename Rep, typename Period>
        bool wait_for(std::chrono::duration<Rep, Period> timeout) {
            std::unique_lock<std::mutex> lock(mutex);
            return cv.wait_for(lock, timeout, [this] { return done; });
        }
    };

    // An activity destroyed without a join is detached, never terminated.
    void abandon() {
        if (thread_.joinable()) {
            STREAMECHO_LOG_WARNING("activity '{}' destroyed without join, detaching", name_);
            thread_.detach();
        }
    }

    std::string name_;
    std::shared_ptr<completion> state_;
    std::thread thread_;
};

} // namespace streamecho::runtime
