/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool that hosts concurrent invocations.
 * @author Dimitris Kafetzis
 *
 * Workers spend almost all of their time blocked on a child process, so the
 * pool is not sized for the core count. By default it grows whenever a job
 * would otherwise wait in the queue, which lets every task of a tier start
 * at once however wide the tier is. Idle workers are kept for later runs.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace tier_gate {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 *
 * Jobs already queued when the pool is destroyed still run, so no future
 * handed out by submit() is ever left with a broken promise.
 */
class ThreadPool {
public:
    enum class Growth : uint8_t {
        OnDemand,   ///< Start a worker for any job no idle worker can take
        Fixed       ///< Never exceed the initial worker count
    };

    /// @param num_threads Workers started up front; 0 = hardware_concurrency.
    explicit ThreadPool(size_t num_threads = 0, Growth growth = Growth::OnDemand);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution. Exceptions surface through the future.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);
    void spawn_worker_locked();

    const Growth growth_;
    std::vector<std::jthread> workers_;                ///< Guarded by queue_mutex_
    std::queue<std::function<void()>> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    size_t idle_workers_ = 0;                          ///< Guarded by queue_mutex_
    std::atomic<size_t> active_jobs_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(func));
    auto future = task->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        job_queue_.push([task] { (*task)(); });
        if (growth_ == Growth::OnDemand && job_queue_.size() > idle_workers_) {
            spawn_worker_locked();
        }
    }
    queue_cv_.notify_one();
    return future;
}

}  // namespace tier_gate
