/**
 * @file health_monitor.hpp
 * @brief Periodic reachability probing of known devices
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Each round:
 * - Probes every Online or Unknown device with bounded concurrency
 * - Success: Online, last_seen refreshed, miss counter reset
 * - Failure: miss counter incremented; Offline once it reaches the limit
 * - Evicts non-trusted devices Offline for longer than the retention
 */

#pragma once

#include "lanshare/codec.hpp"
#include "lanshare/device_registry.hpp"
#include "lanshare/periodic_task.hpp"
#include "lanshare/thread_pool.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace lanshare {

/**
 * @brief Reachability check for one device
 */
class Prober {
public:
    virtual ~Prober() = default;

    /**
     * @return true if the device answered as itself
     */
    virtual bool probe(const Device& device) = 0;
};

/**
 * @brief TcpProber - PROBE / PROBE_ACK exchange on the transfer port
 */
class TcpProber : public Prober {
public:
    explicit TcpProber(std::chrono::milliseconds timeout);

    bool probe(const Device& device) override;

    /**
     * @brief Run one probe exchange
     * @return The answering device's id and name, or std::nullopt on any failure
     */
    static std::optional<ProbeAckMessage> exchange(
        const std::string& address,
        uint16_t port,
        std::chrono::milliseconds timeout
    );

private:
    std::chrono::milliseconds timeout_;
};

struct HealthOptions {
    std::chrono::milliseconds interval = std::chrono::seconds(10);
    uint32_t max_consecutive_misses = 3;
    std::chrono::seconds stale_retention = std::chrono::hours(24);
    size_t max_concurrent_probes = 8;
};

using ClockFunction = std::function<TimePoint()>;

/**
 * @brief HealthMonitor - Drives device status transitions from probe results
 */
class HealthMonitor {
public:
    /**
     * @param registry Registry to read and update
     * @param prober Probe implementation
     * @param options Interval, limits and pool size
     * @param clock Time source (system clock by default)
     * @throws std::invalid_argument if prober is null
     */
    HealthMonitor(
        DeviceRegistry& registry,
        std::shared_ptr<Prober> prober,
        HealthOptions options,
        ClockFunction clock = nullptr
    );

    ~HealthMonitor();

    // Disable copy and move
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;
    HealthMonitor(HealthMonitor&&) = delete;
    HealthMonitor& operator=(HealthMonitor&&) = delete;

    bool start();
    void stop();
    bool is_running() const;

    /**
     * @brief Run one probe round followed by eviction
     */
    void check_now();

    /**
     * @brief Remove non-trusted devices Offline beyond the retention
     * @return Number of devices removed
     */
    size_t evict_stale();

private:
    DeviceRegistry& registry_;
    std::shared_ptr<Prober> prober_;
    HealthOptions options_;
    ClockFunction clock_;
    ThreadPool pool_;
    PeriodicTask task_;

    /// Serializes rounds (periodic tick vs. check_now)
    std::mutex round_mutex_;

    void record_success(const std::string& device_id);
    void record_miss(const std::string& device_id);
};

} // namespace lanshare
