/**
 * @file device_registry.cpp
 * @brief Implementation of the device registry
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/device_registry.hpp"
#include "lanshare/utilities.hpp"

namespace lanshare {

std::string to_string(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Online:  return "Online";
        case DeviceStatus::Offline: return "Offline";
        case DeviceStatus::Unknown: return "Unknown";
    }
    return "Unknown";
}

// ============================================================================
// DeviceSnapshot
// ============================================================================

DeviceSnapshot::DeviceSnapshot(std::shared_ptr<const DeviceMap> devices)
    : devices_(devices ? std::move(devices) : std::make_shared<const DeviceMap>())
{
}

DeviceSnapshot::const_iterator DeviceSnapshot::begin() const {
    return const_iterator(devices_->begin());
}

DeviceSnapshot::const_iterator DeviceSnapshot::end() const {
    return const_iterator(devices_->end());
}

size_t DeviceSnapshot::size() const {
    return devices_->size();
}

bool DeviceSnapshot::empty() const {
    return devices_->empty();
}

std::optional<Device> DeviceSnapshot::find(const std::string& id) const {
    auto it = devices_->find(id);
    if (it == devices_->end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Device> DeviceSnapshot::to_vector() const {
    std::vector<Device> result;
    result.reserve(devices_->size());
    for (const auto& [id, device] : *devices_) {
        result.push_back(device);
    }
    return result;
}

// ============================================================================
// DeviceRegistry
// ============================================================================

DeviceRegistry::DeviceRegistry()
    : devices_(std::make_shared<const DeviceMap>())
{
}

bool DeviceRegistry::upsert(const Device& device) {
    if (device.id.empty()) {
        utilities::log_warn("Registry: Ignoring device without id");
        return false;
    }

    std::vector<std::pair<RegistryEvent, Device>> events;
    bool inserted = false;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto next = std::make_shared<DeviceMap>(*devices_);

        auto it = next->find(device.id);
        if (it == next->end()) {
            Device stored = device;
            if (stored.status == DeviceStatus::Offline && !stored.offline_since) {
                stored.offline_since = stored.last_seen;
            }
            next->emplace(stored.id, stored);
            events.emplace_back(RegistryEvent::Discovered, stored);
            inserted = true;
        } else {
            Device before = it->second;
            Device& merged = it->second;

            if (device.last_seen >= merged.last_seen) {
                merged.address = device.address;
                merged.port = device.port;
                if (!device.display_name.empty()) {
                    merged.display_name = device.display_name;
                }
                merged.last_seen = device.last_seen;

                if (device.status == DeviceStatus::Online) {
                    merged.status = DeviceStatus::Online;
                    merged.consecutive_misses = 0;
                    merged.offline_since.reset();
                } else if (device.status == DeviceStatus::Offline && merged.status != DeviceStatus::Offline) {
                    merged.status = DeviceStatus::Offline;
                    merged.offline_since = device.offline_since ? device.offline_since : device.last_seen;
                }
            }
            merged.trusted = merged.trusted || device.trusted;

            collect_status_events(&before, merged, events);
        }

        devices_ = std::move(next);
    }

    emit(events);
    return inserted;
}

std::optional<Device> DeviceRegistry::get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_->find(id);
    if (it == devices_->end()) {
        return std::nullopt;
    }
    return it->second;
}

DeviceSnapshot DeviceRegistry::list_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return DeviceSnapshot(devices_);
}

bool DeviceRegistry::remove(const std::string& id) {
    std::vector<std::pair<RegistryEvent, Device>> events;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = devices_->find(id);
        if (it == devices_->end()) {
            return false;
        }
        events.emplace_back(RegistryEvent::Removed, it->second);

        auto next = std::make_shared<DeviceMap>(*devices_);
        next->erase(id);
        devices_ = std::move(next);
    }

    emit(events);
    return true;
}

bool DeviceRegistry::update(const std::string& id, const std::function<void(Device&)>& mutator) {
    std::vector<std::pair<RegistryEvent, Device>> events;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (devices_->find(id) == devices_->end()) {
            return false;
        }

        auto next = std::make_shared<DeviceMap>(*devices_);
        Device& device = next->at(id);
        Device before = device;

        mutator(device);

        device.id = before.id;
        if (device.last_seen < before.last_seen) {
            device.last_seen = before.last_seen;
        }
        if (device.status == DeviceStatus::Offline && before.status != DeviceStatus::Offline &&
            !device.offline_since) {
            device.offline_since = Clock::now();
        }
        if (device.status != DeviceStatus::Offline) {
            device.offline_since.reset();
        }

        collect_status_events(&before, device, events);
        devices_ = std::move(next);
    }

    emit(events);
    return true;
}

size_t DeviceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_->size();
}

void DeviceRegistry::set_event_callback(RegistryCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    event_callback_ = std::move(callback);
}

// ============================================================================
// Private Methods
// ============================================================================

void DeviceRegistry::collect_status_events(
    const Device* before,
    const Device& after,
    std::vector<std::pair<RegistryEvent, Device>>& events
) {
    if (before && before->status == after.status) {
        return;
    }
    if (after.status == DeviceStatus::Online) {
        events.emplace_back(RegistryEvent::Online, after);
    } else if (after.status == DeviceStatus::Offline) {
        events.emplace_back(RegistryEvent::Offline, after);
    }
}

void DeviceRegistry::emit(const std::vector<std::pair<RegistryEvent, Device>>& events) {
    if (events.empty()) {
        return;
    }

    RegistryCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = event_callback_;
    }
    if (!callback) {
        return;
    }

    for (const auto& [event, device] : events) {
        try {
            callback(event, device);
        } catch (const std::exception& e) {
            utilities::log_error("Registry: Callback error: " + std::string(e.what()));
        }
    }
}

} // namespace lanshare
