/**
 * @file thread_pool.hpp
 * @brief Worker pool for concurrent batch solves, aware of run cancellation.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace print_scheduler {

/**
 * @brief Fixed-size pool of std::jthread workers.
 *
 * Every task is invoked with the run's cancellation token so it can decide
 * how to wind down; the pool itself never drops queued work. The destructor
 * drains the queue before joining, so every returned future becomes ready.
 */
class ThreadPool {
public:
    /// `num_threads == 0` uses the hardware concurrency.
    explicit ThreadPool(size_t num_threads = 0, std::stop_token cancel = {});
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue `func(cancel_token)`; exceptions surface through the future.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit(F&& func);

    [[nodiscard]] size_t active_count() const noexcept { return active_.load(); }
    [[nodiscard]] size_t completed_count() const noexcept { return completed_.load(); }
    [[nodiscard]] size_t queued_count() const;
    [[nodiscard]] size_t thread_count() const noexcept { return workers_.size(); }

private:
    void worker_loop(std::stop_token shutdown);

    std::stop_token cancel_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable_any wake_;
    std::atomic<size_t> active_{0};
    std::atomic<size_t> completed_{0};
    std::vector<std::jthread> workers_;   // last: joined before the queue goes away
};

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit(F&& func) {
    using R = std::invoke_result_t<F, std::stop_token>;

    // std::function needs a copyable target
    auto task = std::make_shared<std::packaged_task<R(std::stop_token)>>(std::forward<F>(func));
    auto future = task->get_future();
    {
        std::lock_guard lock(mutex_);
        queue_.emplace_back([task, token = cancel_] { (*task)(token); });
    }
    wake_.notify_one();
    return future;
}

}  // namespace print_scheduler
