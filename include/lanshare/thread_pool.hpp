/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool for bounded concurrency
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Used to cap in-flight health probes and inbound connection handlers.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace lanshare {

/**
 * @brief ThreadPool - Runs queued tasks on a fixed set of worker threads
 *
 * Usage:
 *   ThreadPool pool(4);
 *   auto future = pool.enqueue([](){ return 42; });
 *   int result = future.get();
 *   pool.shutdown();             // Stop accepting new tasks
 *   pool.wait_for_completion();  // Drain queue and join workers
 */
class ThreadPool {
public:
    /**
     * @brief Create pool
     * @param num_threads Number of worker threads (0 = hardware concurrency)
     * @param max_queue_size Maximum queued tasks (0 = unlimited)
     */
    explicit ThreadPool(size_t num_threads = 0, size_t max_queue_size = 0);

    /**
     * @brief Stops accepting tasks and waits for queued ones to finish
     */
    ~ThreadPool();

    // Disable copy and move
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * @brief Enqueue a task
     * @return Future receiving the task's result or exception
     * @throws std::runtime_error if the pool is stopped or the queue is full
     */
    template <class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    /**
     * @brief Stop accepting new tasks (queued tasks still run)
     */
    void shutdown();

    /**
     * @brief Join all workers; call after shutdown()
     */
    void wait_for_completion();

    size_t size() const { return workers_.size(); }

    size_t pending_tasks() const {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return tasks_.size();
    }

    bool is_stopped() const {
        return stop_.load(std::memory_order_acquire);
    }

    size_t tasks_completed() const {
        return tasks_completed_.load(std::memory_order_relaxed);
    }

private:
    std::vector<std::thread> workers_;

    std::queue<std::function<void()>> tasks_;
    size_t max_queue_size_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;

    std::atomic<size_t> tasks_completed_{0};
};

template <class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));

    std::future<return_type> result = task->get_future();
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (stop_.load(std::memory_order_acquire)) {
            throw std::runtime_error("ThreadPool: enqueue on stopped pool");
        }
        if (max_queue_size_ > 0 && tasks_.size() >= max_queue_size_) {
            throw std::runtime_error("ThreadPool: queue full");
        }

        tasks_.emplace([task]() { (*task)(); });
    }
    condition_.notify_one();
    return result;
}

} // namespace lanshare
