#pragma once

#include <streamecho/log/macros.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace streamecho::runtime {

/// Fixed-size pool of worker threads fed from one bounded job queue.
///
/// The pool size is fixed at start(). submit() refuses work once
/// max_pending jobs are waiting, which is how the server applies its call
/// admission limit.
class worker_pool {
public:
    using job = std::function<void()>;

    /// @param num_threads Number of worker threads (0 = hardware concurrency)
    /// @param max_pending Jobs allowed to wait for a free worker (0 = unbounded)
    explicit worker_pool(size_t num_threads, size_t max_pending = 0)
        : num_threads_(num_threads == 0 ? default_thread_count() : num_threads)
        , max_pending_(max_pending) {}

    ~worker_pool() {
        shutdown();
    }

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;
    worker_pool(worker_pool&&) = delete;
    worker_pool& operator=(worker_pool&&) = delete;

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back([this, i] { run(i); });
        }
        STREAMECHO_LOG_DEBUG("worker_pool started with {} threads", num_threads_);
    }

    /// Stop accepting work, finish queued jobs, join every worker.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            running_ = false;
        }
        work_available_.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) {
                t.join();
            }
        }
        workers_.clear();
        STREAMECHO_LOG_DEBUG("worker_pool stopped after {} jobs", jobs_executed());
    }

    /// Queue a job. Returns false if the pool is stopped or saturated.
    [[nodiscard]] bool submit(job j) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return false;
            }
            if (max_pending_ > 0 && pending_.size() >= max_pending_) {
                return false;
            }
            pending_.push_back(std::move(j));
        }
        work_available_.notify_one();
        return true;
    }

    [[nodiscard]] size_t num_threads() const noexcept { return num_threads_; }

    [[nodiscard]] size_t max_pending() const noexcept { return max_pending_; }

    [[nodiscard]] size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    [[nodiscard]] size_t busy() const noexcept {
        return busy_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] size_t jobs_executed() const noexcept {
        return jobs_executed_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

private:
    static size_t default_thread_count() noexcept {
        auto n = std::thread::hardware_concurrency();
        return n == 0 ? 4 : n;
    }

    void run(size_t worker_id) {
        for (;;) {
            job next;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                work_available_.wait(lock, [this] {
                    return !pending_.empty() || !running_;
                });
                if (pending_.empty()) {
                    return;  // stopped and drained
                }
                next = std::move(pending_.front());
                pending_.pop_front();
            }

            busy_.fetch_add(1, std::memory_order_relaxed);
            try {
                next();
            } catch (const std::exception& e) {
                STREAMECHO_LOG_ERROR("worker {}: job threw: {}", worker_id, e.what());
            }
            busy_.fetch_sub(1, std::memory_order_relaxed);
            jobs_executed_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    const size_t num_threads_;
    const size_t max_pending_;

    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::deque<job> pending_;
    std::vector<std::thread> workers_;
    bool running_ = false;

    std::atomic<size_t> busy_{0};
    std::atomic<size_t> jobs_executed_{0};
};

} // namespace streamecho::runtime
