/**
 * @file device_registry.hpp
 * @brief Authoritative in-memory table of known peer devices
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Discovery, health monitoring and the session manager all read and write
 * device state through this registry:
 * - Single writer at a time, many concurrent readers
 * - Readers get immutable point-in-time snapshots, never torn updates
 * - No I/O under the lock; change callbacks run after the lock is released
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace lanshare {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Reachability of a device
 */
enum class DeviceStatus {
    Online,
    Offline,
    Unknown
};

std::string to_string(DeviceStatus status);

/**
 * @brief A peer device
 */
struct Device {
    std::string id;                        ///< Stable device identifier
    std::string display_name;              ///< Human-readable name
    std::string address;                   ///< IP address
    uint16_t port = 0;                     ///< TCP transfer port
    DeviceStatus status = DeviceStatus::Unknown;
    TimePoint last_seen{};                 ///< Last announcement or successful probe
    bool trusted = false;                  ///< Paired explicitly; never evicted
    uint32_t consecutive_misses = 0;       ///< Failed probes since last success
    std::optional<TimePoint> offline_since;  ///< When the device went Offline
};

/**
 * @brief Kinds of registry change reported to the change callback
 */
enum class RegistryEvent {
    Discovered,  ///< New device id inserted
    Online,      ///< Existing device became Online
    Offline,     ///< Device became Offline
    Removed      ///< Device removed
};

using RegistryCallback = std::function<void(RegistryEvent event, const Device& device)>;

/**
 * @brief Immutable point-in-time view of the registry
 *
 * Holding a snapshot keeps its devices alive; later registry updates
 * produce new tables and never modify this one. Iteration yields devices
 * ordered by id.
 */
class DeviceSnapshot {
public:
    using DeviceMap = std::map<std::string, Device>;

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Device;
        using difference_type = std::ptrdiff_t;
        using pointer = const Device*;
        using reference = const Device&;

        const_iterator() = default;
        explicit const_iterator(DeviceMap::const_iterator it) : it_(it) {}

        reference operator*() const { return it_->second; }
        pointer operator->() const { return &it_->second; }
        const_iterator& operator++() { ++it_; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++it_; return tmp; }
        bool operator==(const const_iterator& other) const { return it_ == other.it_; }
        bool operator!=(const const_iterator& other) const { return it_ != other.it_; }

    private:
        DeviceMap::const_iterator it_;
    };

    explicit DeviceSnapshot(std::shared_ptr<const DeviceMap> devices);

    const_iterator begin() const;
    const_iterator end() const;
    size_t size() const;
    bool empty() const;

    /**
     * @brief Look up a device within this snapshot
     */
    std::optional<Device> find(const std::string& id) const;

    /**
     * @brief Materialize the snapshot
     */
    std::vector<Device> to_vector() const;

private:
    std::shared_ptr<const DeviceMap> devices_;
};

/**
 * @brief DeviceRegistry - Synchronized table of known devices
 *
 * Writers copy the current table, apply their change and publish the new
 * table; readers only copy a shared pointer. Thread-safe.
 */
class DeviceRegistry {
public:
    DeviceRegistry();

    // Disable copy and move
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;
    DeviceRegistry(DeviceRegistry&&) = delete;
    DeviceRegistry& operator=(DeviceRegistry&&) = delete;

    /**
     * @brief Insert or merge a device by id
     *
     * When the incoming record is at least as recent as the stored one its
     * address, port, name and status win; otherwise the stored fields are
     * kept. last_seen never moves backward and trusted is sticky.
     *
     * @param device Incoming record
     * @return true if a new device was inserted, false if merged
     */
    bool upsert(const Device& device);

    /**
     * @brief Get a copy of a device
     */
    std::optional<Device> get(const std::string& id) const;

    /**
     * @brief Point-in-time snapshot of all devices
     */
    DeviceSnapshot list_all() const;

    /**
     * @brief Remove a device
     * @return true if it existed
     */
    bool remove(const std::string& id);

    /**
     * @brief Atomically read-modify-write one device
     *
     * The mutator runs under the writer lock and must not block. Changes to
     * the id and backward moves of last_seen are discarded.
     *
     * @return false if the device does not exist
     */
    bool update(const std::string& id, const std::function<void(Device&)>& mutator);

    size_t size() const;

    /**
     * @brief Set callback for device changes (invoked outside the lock)
     */
    void set_event_callback(RegistryCallback callback);

private:
    using DeviceMap = DeviceSnapshot::DeviceMap;

    /// Current published table
    std::shared_ptr<const DeviceMap> devices_;

    /// Guards devices_ (shared for readers, exclusive for the writer)
    mutable std::shared_mutex mutex_;

    RegistryCallback event_callback_;
    mutable std::mutex callback_mutex_;

    void emit(const std::vector<std::pair<RegistryEvent, Device>>& events);

    static void collect_status_events(
        const Device* before,
        const Device& after,
        std::vector<std::pair<RegistryEvent, Device>>& events
    );
};

} // namespace lanshare
