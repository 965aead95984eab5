/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool and settle_all.
 */

#include "executor/settle_all.hpp"
#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tier_gate;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);

    ThreadPool automatic(0);
    EXPECT_GT(automatic.thread_count(), 0u);
}

TEST(ThreadPoolTest, GrowsSoEveryJobStartsAtOnce) {
    ThreadPool pool(2);
    std::atomic<int> started{0};
    std::vector<std::future<bool>> futures;

    // Each job only succeeds if all eight are running at the same time.
    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool.submit([&started] {
            started.fetch_add(1);
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (started.load() < 8) {
                if (std::chrono::steady_clock::now() >= deadline) return false;
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return true;
        }));
    }

    for (auto& f : futures) EXPECT_TRUE(f.get());
    EXPECT_GE(pool.thread_count(), 8u);
}

TEST(ThreadPoolTest, IdleWorkersAreReused) {
    ThreadPool pool(2);
    for (int round = 0; round < 10; ++round) {
        pool.submit([] { return 0; }).get();
        // Let the worker return to the idle set before the next submit.
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(pool.thread_count(), 2u);
}

TEST(ThreadPoolTest, FixedPoolKeepsItsWidth) {
    ThreadPool pool(2, ThreadPool::Growth::Fixed);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool.submit([&active, &peak] {
            int now = active.fetch_add(1) + 1;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            active.fetch_sub(1);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(pool.thread_count(), 2u);
    EXPECT_LE(peak.load(), 2);
}

TEST(ThreadPoolTest, ExceptionSurfacesThroughFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, QueuedJobsRunBeforeShutdown) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    {
        ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            futures.push_back(pool.submit([&counter] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                counter.fetch_add(1);
            }));
        }
    }
    EXPECT_EQ(counter.load(), 20);
    for (auto& f : futures) EXPECT_NO_THROW(f.get());
}

// ── settle_all ──────────────────────────────

TEST(SettleAllTest, WaitsForEveryFutureDespiteFailures) {
    ThreadPool pool(4);
    std::atomic<int> finished{0};
    std::vector<std::future<int>> futures;

    futures.push_back(pool.submit([]() -> int { throw std::runtime_error("first fails"); }));
    for (int i = 1; i < 4; ++i) {
        futures.push_back(pool.submit([i, &finished] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            finished.fetch_add(1);
            return i;
        }));
    }

    auto settled = settle_all(futures);

    ASSERT_EQ(settled.size(), 4u);
    EXPECT_EQ(finished.load(), 3);
    EXPECT_FALSE(settled[0].fulfilled());
    EXPECT_TRUE(settled[0].error != nullptr);
    for (int i = 1; i < 4; ++i) {
        ASSERT_TRUE(settled[i].fulfilled());
        EXPECT_EQ(*settled[i].value, i);
    }
}

TEST(SettleAllTest, EmptyBatch) {
    std::vector<std::future<int>> futures;
    EXPECT_TRUE(settle_all(futures).empty());
}
