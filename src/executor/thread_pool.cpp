/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

namespace tier_gate {

ThreadPool::ThreadPool(size_t num_threads, Growth growth) : growth_(growth) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    std::lock_guard lock(queue_mutex_);
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        spawn_worker_locked();
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        for (auto& worker : workers_) {
            worker.request_stop();
        }
    }
    queue_cv_.notify_all();
    // Workers drain the queue first. Joined here, while the queue and its
    // mutex are still alive.
    for (auto& worker : workers_) {
        worker.join();
    }
}

void ThreadPool::spawn_worker_locked() {
    // Counted idle from the start: it will take a queued job as soon as it runs.
    ++idle_workers_;
    workers_.emplace_back([this](std::stop_token stop) {
        worker_loop(stop);
    });
}

void ThreadPool::worker_loop(std::stop_token stop) {
    std::unique_lock lock(queue_mutex_);
    while (true) {
        queue_cv_.wait(lock, stop, [this] { return !job_queue_.empty(); });

        if (job_queue_.empty()) {
            if (stop.stop_requested()) {
                --idle_workers_;
                return;
            }
            continue;
        }

        auto job = std::move(job_queue_.front());
        job_queue_.pop();
        --idle_workers_;
        ++active_jobs_;

        lock.unlock();
        job();
        lock.lock();

        --active_jobs_;
        ++idle_workers_;
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_jobs_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return job_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return workers_.size();
}

}  // namespace tier_gate
