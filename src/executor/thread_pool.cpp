/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

#include <algorithm>

namespace print_scheduler {

ThreadPool::ThreadPool(size_t num_threads, std::stop_token cancel)
    : cancel_(std::move(cancel)) {
    if (num_threads == 0) {
        num_threads = std::max(2u, std::thread::hardware_concurrency());
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token shutdown) { worker_loop(shutdown); });
    }
}

ThreadPool::~ThreadPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    wake_.notify_all();
    workers_.clear();
}

void ThreadPool::worker_loop(std::stop_token shutdown) {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            wake_.wait(lock, shutdown, [this] { return !queue_.empty(); });
            // Shutdown only ends the loop once the queue is drained
            if (queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        ++active_;
        task();
        --active_;
        ++completed_;
    }
}

size_t ThreadPool::queued_count() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

}  // namespace print_scheduler
