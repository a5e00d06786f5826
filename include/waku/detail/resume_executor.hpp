// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file resume_executor.hpp
 * @brief Worker pool that resumes coroutines woken by engine callbacks
 *
 * This is an internal header - not part of the public API.
 */

#ifndef WAKU_DETAIL_RESUME_EXECUTOR_HPP
#define WAKU_DETAIL_RESUME_EXECUTOR_HPP

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace waku::detail {

/**
 * FIFO job queue drained by a fixed set of worker threads
 *
 * Engine callbacks only enqueue here. Resumed coroutines therefore run on
 * a worker, never on the engine's callback thread, and may issue further
 * engine calls or block.
 *
 * Jobs must not throw. Thread-safe.
 */
class ResumeExecutor {
  public:
    using Job = std::function<void()>;

    explicit ResumeExecutor(unsigned workers) {
        workers = std::max(workers, 1u);
        threads_.reserve(workers);
        for (unsigned i = 0; i < workers; i++) {
            threads_.emplace_back([this] { run(); });
        }
    }

    ResumeExecutor(const ResumeExecutor &) = delete;
    ResumeExecutor &operator=(const ResumeExecutor &) = delete;

    /// Runs every queued job, then joins the workers
    ~ResumeExecutor() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto &t : threads_) {
            if (t.get_id() == std::this_thread::get_id()) {
                t.detach();
            } else {
                t.join();
            }
        }
    }

    void post(Job job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.push_back(std::move(job));
            outstanding_++;
        }
        cv_.notify_one();
    }

    /**
     * Block until the queue is empty and no job is running
     *
     * Jobs posted by running jobs are waited for too. Must not be called
     * from a worker.
     */
    void drain() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
    }

    /// True when called from one of this executor's workers
    [[nodiscard]] bool on_worker_thread() const noexcept {
        auto self = std::this_thread::get_id();
        return std::any_of(threads_.begin(), threads_.end(),
                           [self](const std::thread &t) { return t.get_id() == self; });
    }

    [[nodiscard]] size_t worker_count() const noexcept { return threads_.size(); }

  private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return; // stopping
            }
            Job job = std::move(jobs_.front());
            jobs_.pop_front();
            lock.unlock();
            job();
            job = nullptr; // Release captures before reporting idle
            lock.lock();
            if (--outstanding_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    size_t outstanding_ = 0;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

/// Between 2 and 4 workers, following the hardware
[[nodiscard]] inline unsigned default_resume_workers() noexcept {
    unsigned hw = std::thread::hardware_concurrency();
    return std::clamp(hw, 2u, 4u);
}

/// Process-wide executor shared by every node.
/// Never destroyed: engine threads may deliver callbacks during static destruction.
[[nodiscard]] inline ResumeExecutor &resume_executor() {
    static ResumeExecutor *executor = new ResumeExecutor(default_resume_workers());
    return *executor;
}

} // namespace waku::detail

#endif // WAKU_DETAIL_RESUME_EXECUTOR_HPP
