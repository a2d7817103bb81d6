/**
 * @file periodic_task.cpp
 * @brief Implementation of the periodic background loop
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/periodic_task.hpp"
#include "lanshare/utilities.hpp"

namespace lanshare {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> tick)
    : name_(std::move(name))
    , interval_(interval)
    , tick_(std::move(tick))
    , running_(false)
{
}

PeriodicTask::~PeriodicTask() {
    stop();
}

bool PeriodicTask::start() {
    if (running_.exchange(true)) {
        return false;
    }
    thread_ = std::thread([this]() { run(); });
    return true;
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

bool PeriodicTask::is_running() const {
    return running_.load();
}

void PeriodicTask::run() {
    while (running_.load()) {
        try {
            tick_();
        } catch (const std::exception& e) {
            utilities::log_error(name_ + ": Tick failed: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, interval_, [this]() { return !running_.load(); });
    }
}

} // namespace lanshare
