/**
 * @file status_events.hpp
 * @brief Status-change event stream for UI collaborators
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every subscriber owns an unbounded queue. Publishing never blocks on a
 * slow consumer; closing the subscription or the bus ends the sequence.
 */

#pragma once

#include "lanshare/device_registry.hpp"
#include "lanshare/transfer_engine.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanshare {

enum class StatusEventType {
    DeviceDiscovered,
    DeviceOnline,
    DeviceOffline,
    DeviceRemoved,
    TransferStarted,
    TransferProgress,
    TransferCompleted,
    TransferAborted
};

std::string to_string(StatusEventType type);

/**
 * @brief One status change; exactly one of device or transfer is set
 */
struct StatusEvent {
    StatusEventType type = StatusEventType::DeviceDiscovered;
    TimePoint timestamp{};
    std::optional<Device> device;
    std::optional<TransferSession> transfer;
};

/**
 * @brief Map a registry event to its status event type
 */
StatusEventType status_event_type(RegistryEvent event);

/**
 * @brief StatusSubscription - Consumer end of the event stream
 */
class StatusSubscription {
public:
    StatusSubscription() = default;

    // Disable copy and move
    StatusSubscription(const StatusSubscription&) = delete;
    StatusSubscription& operator=(const StatusSubscription&) = delete;
    StatusSubscription(StatusSubscription&&) = delete;
    StatusSubscription& operator=(StatusSubscription&&) = delete;

    /**
     * @brief Wait for the next event
     * @return std::nullopt on timeout or once closed and drained
     */
    std::optional<StatusEvent> next(std::chrono::milliseconds timeout);

    /**
     * @brief Take the next event without waiting
     */
    std::optional<StatusEvent> try_next();

    /**
     * @brief End the sequence; queued events remain readable
     */
    void close();

    bool is_closed() const;

    size_t pending() const;

private:
    friend class EventBus;

    void push(const StatusEvent& event);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StatusEvent> queue_;
    bool closed_ = false;
};

/**
 * @brief EventBus - Fans status events out to every live subscription
 */
class EventBus {
public:
    EventBus() = default;

    // Disable copy and move
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    std::shared_ptr<StatusSubscription> subscribe();

    void publish(const StatusEvent& event);

    void publish_device(RegistryEvent event, const Device& device);

    void publish_transfer(StatusEventType type, const TransferSession& session);

    /**
     * @brief Close every subscription (node shutdown)
     */
    void close_all();

    size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<StatusSubscription>> subscribers_;
};

} // namespace lanshare
