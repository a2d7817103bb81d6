/**
 * @file periodic_task.hpp
 * @brief Background loop with deterministic start/stop
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace lanshare {

/**
 * @brief PeriodicTask - Runs a callback on a fixed interval in its own thread
 *
 * The first tick runs immediately after start(). stop() wakes the thread
 * and joins it; a tick in progress finishes first. Exceptions from a tick
 * are logged and the loop continues.
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> tick);
    ~PeriodicTask();

    // Disable copy and move
    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;
    PeriodicTask(PeriodicTask&&) = delete;
    PeriodicTask& operator=(PeriodicTask&&) = delete;

    /**
     * @return false if already running
     */
    bool start();

    void stop();

    bool is_running() const;

private:
    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> tick_;

    std::atomic<bool> running_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wake_;

    void run();
};

} // namespace lanshare
