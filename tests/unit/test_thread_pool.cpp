/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace print_scheduler;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([](std::stop_token) { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i](std::stop_token) { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, AcceptsMoveOnlyTasks) {
    ThreadPool pool(1);
    auto value = std::make_unique<int>(7);
    auto future = pool.submit([v = std::move(value)](std::stop_token) { return *v * 6; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, ExceptionSurfacesThroughFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([](std::stop_token) -> int {
        throw std::runtime_error("solver crashed");
    });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, TasksSeeCancellation) {
    std::stop_source cancel;
    ThreadPool pool(1, cancel.get_token());

    auto before = pool.submit([](std::stop_token t) { return t.stop_requested(); });
    EXPECT_FALSE(before.get());

    cancel.request_stop();
    auto after = pool.submit([](std::stop_token t) { return t.stop_requested(); });
    EXPECT_TRUE(after.get());
}

TEST(ThreadPoolTest, DestructorDrainsQueue) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    {
        ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            futures.push_back(pool.submit([&counter](std::stop_token) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                counter.fetch_add(1, std::memory_order_relaxed);
            }));
        }
    }
    EXPECT_EQ(counter.load(), 20);
    for (auto& f : futures) {
        EXPECT_EQ(f.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    }
}

TEST(ThreadPoolTest, CountsCompletedTasks) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(pool.submit([](std::stop_token) {}));
    }
    for (auto& f : futures) f.get();

    // The counter is bumped after the future is satisfied.
    for (int i = 0; i < 200 && pool.completed_count() < 5; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(pool.completed_count(), 5u);
    EXPECT_EQ(pool.queued_count(), 0u);
    EXPECT_EQ(pool.active_count(), 0u);
}

TEST(ThreadPoolTest, CountsRunningTasks) {
    ThreadPool pool(2);
    std::atomic<bool> started{false};
    std::promise<void> release;
    auto gate = release.get_future().share();

    auto future = pool.submit([&started, gate](std::stop_token) {
        started = true;
        gate.wait();
    });
    for (int i = 0; i < 1000 && !started; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_TRUE(started);
    EXPECT_EQ(pool.active_count(), 1u);

    release.set_value();
    future.get();
    for (int i = 0; i < 200 && pool.active_count() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(pool.active_count(), 0u);
}
