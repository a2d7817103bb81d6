/**
 * @file thread_pool.cpp
 * @brief Implementation of the worker pool
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/thread_pool.hpp"
#include "lanshare/utilities.hpp"

namespace lanshare {

ThreadPool::ThreadPool(size_t num_threads, size_t max_queue_size)
    : max_queue_size_(max_queue_size)
    , stop_(false)
{
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 4;
        }
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this, i]() {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock<std::mutex> lock(queue_mutex_);
                    condition_.wait(lock, [this]() {
                        return stop_.load(std::memory_order_acquire) || !tasks_.empty();
                    });

                    if (stop_.load(std::memory_order_acquire) && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                // packaged_task stores task exceptions in its future; anything
                // escaping here comes from the wrapper itself
                try {
                    task();
                    tasks_completed_.fetch_add(1, std::memory_order_relaxed);
                } catch (const std::exception& e) {
                    utilities::log_error("ThreadPool: Worker " + std::to_string(i) +
                                         " caught exception: " + std::string(e.what()));
                }
            }
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
    wait_for_completion();
}

void ThreadPool::shutdown() {
    {
        // Under the lock so a worker between predicate check and wait sees it
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_.store(true, std::memory_order_release);
    }
    condition_.notify_all();
}

void ThreadPool::wait_for_completion() {
    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace lanshare
