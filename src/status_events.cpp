/**
 * @file status_events.cpp
 * @brief Implementation of the status event stream
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/status_events.hpp"
#include <algorithm>

namespace lanshare {

std::string to_string(StatusEventType type) {
    switch (type) {
        case StatusEventType::DeviceDiscovered:  return "DeviceDiscovered";
        case StatusEventType::DeviceOnline:      return "DeviceOnline";
        case StatusEventType::DeviceOffline:     return "DeviceOffline";
        case StatusEventType::DeviceRemoved:     return "DeviceRemoved";
        case StatusEventType::TransferStarted:   return "TransferStarted";
        case StatusEventType::TransferProgress:  return "TransferProgress";
        case StatusEventType::TransferCompleted: return "TransferCompleted";
        case StatusEventType::TransferAborted:   return "TransferAborted";
    }
    return "Unknown";
}

StatusEventType status_event_type(RegistryEvent event) {
    switch (event) {
        case RegistryEvent::Discovered: return StatusEventType::DeviceDiscovered;
        case RegistryEvent::Online:     return StatusEventType::DeviceOnline;
        case RegistryEvent::Offline:    return StatusEventType::DeviceOffline;
        case RegistryEvent::Removed:    return StatusEventType::DeviceRemoved;
    }
    return StatusEventType::DeviceDiscovered;
}

// ============================================================================
// StatusSubscription
// ============================================================================

std::optional<StatusEvent> StatusSubscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; });

    if (queue_.empty()) {
        return std::nullopt;
    }
    StatusEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<StatusEvent> StatusSubscription::try_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    StatusEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void StatusSubscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool StatusSubscription::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t StatusSubscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void StatusSubscription::push(const StatusEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        queue_.push_back(event);
    }
    cv_.notify_one();
}

// ============================================================================
// EventBus
// ============================================================================

std::shared_ptr<StatusSubscription> EventBus::subscribe() {
    auto subscription = std::make_shared<StatusSubscription>();
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(subscription);
    return subscription;
}

void EventBus::publish(const StatusEvent& event) {
    std::vector<std::shared_ptr<StatusSubscription>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Drop subscriptions whose consumer went away
        subscribers_.erase(
            std::remove_if(subscribers_.begin(), subscribers_.end(),
                           [](const std::weak_ptr<StatusSubscription>& s) { return s.expired(); }),
            subscribers_.end());

        for (const auto& weak : subscribers_) {
            if (auto subscription = weak.lock()) {
                targets.push_back(std::move(subscription));
            }
        }
    }

    for (const auto& subscription : targets) {
        subscription->push(event);
    }
}

void EventBus::publish_device(RegistryEvent event, const Device& device) {
    StatusEvent status;
    status.type = status_event_type(event);
    status.timestamp = Clock::now();
    status.device = device;
    publish(status);
}

void EventBus::publish_transfer(StatusEventType type, const TransferSession& session) {
    StatusEvent status;
    status.type = type;
    status.timestamp = Clock::now();
    status.transfer = session;
    publish(status);
}

void EventBus::close_all() {
    std::vector<std::shared_ptr<StatusSubscription>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& weak : subscribers_) {
            if (auto subscription = weak.lock()) {
                targets.push_back(std::move(subscription));
            }
        }
        subscribers_.clear();
    }

    for (const auto& subscription : targets) {
        subscription->close();
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
        [](const std::weak_ptr<StatusSubscription>& s) { return !s.expired(); }));
}

} // namespace lanshare
