/**
 * @file health_monitor.cpp
 * @brief Implementation of device health probing
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/health_monitor.hpp"
#include "lanshare/errors.hpp"
#include "lanshare/tcp_stream.hpp"
#include "lanshare/utilities.hpp"
#include <future>
#include <stdexcept>
#include <vector>

namespace lanshare {

// ============================================================================
// TcpProber
// ============================================================================

TcpProber::TcpProber(std::chrono::milliseconds timeout)
    : timeout_(timeout)
{
}

bool TcpProber::probe(const Device& device) {
    auto ack = exchange(device.address, device.port, timeout_);
    if (!ack) {
        return false;
    }
    if (ack->device_id != device.id) {
        // Someone else now answers at this address
        utilities::log_warn("Health: " + device.address + ":" + std::to_string(device.port) +
                            " answered as " + ack->device_id + ", expected " + device.id);
        return false;
    }
    return true;
}

std::optional<ProbeAckMessage> TcpProber::exchange(
    const std::string& address,
    uint16_t port,
    std::chrono::milliseconds timeout
) {
    try {
        auto stream = TcpStream::connect(address, port, timeout);
        codec::write_frame(*stream, FrameKind::Probe, {}, timeout);

        Frame frame = codec::read_frame(*stream, timeout);
        stream->close();

        if (frame.kind != FrameKind::ProbeAck) {
            utilities::log_debug("Health: Unexpected probe answer from " + address);
            return std::nullopt;
        }
        return ProbeAckMessage::from_bytes(frame.body);

    } catch (const LanshareError& e) {
        utilities::log_debug("Health: Probe of " + address + ":" + std::to_string(port) +
                             " failed: " + std::string(e.what()));
        return std::nullopt;
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

HealthMonitor::HealthMonitor(
    DeviceRegistry& registry,
    std::shared_ptr<Prober> prober,
    HealthOptions options,
    ClockFunction clock
)
    : registry_(registry)
    , prober_(std::move(prober))
    , options_(options)
    , clock_(clock ? std::move(clock) : ClockFunction([]() { return Clock::now(); }))
    , pool_(options.max_concurrent_probes == 0 ? 1 : options.max_concurrent_probes)
    , task_("Health", std::chrono::duration_cast<std::chrono::milliseconds>(options.interval),
            [this]() { check_now(); })
{
    if (!prober_) {
        throw std::invalid_argument("HealthMonitor: prober cannot be null");
    }
}

HealthMonitor::~HealthMonitor() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool HealthMonitor::start() {
    if (!task_.start()) {
        return false;
    }
    utilities::log_info("Health: Monitoring every " +
                        std::to_string(options_.interval.count()) + " ms");
    return true;
}

void HealthMonitor::stop() {
    task_.stop();
}

bool HealthMonitor::is_running() const {
    return task_.is_running();
}

// ============================================================================
// Probe Rounds
// ============================================================================

void HealthMonitor::check_now() {
    std::lock_guard<std::mutex> lock(round_mutex_);

    // Probe against a snapshot; results are applied by id afterwards
    DeviceSnapshot snapshot = registry_.list_all();

    std::vector<std::pair<std::string, std::future<bool>>> probes;
    for (const Device& device : snapshot) {
        if (device.status == DeviceStatus::Offline) {
            continue;
        }
        Device target = device;
        probes.emplace_back(device.id, pool_.enqueue([this, target]() {
            return prober_->probe(target);
        }));
    }

    for (auto& [device_id, result] : probes) {
        bool reachable = false;
        try {
            reachable = result.get();
        } catch (const std::exception& e) {
            utilities::log_warn("Health: Probe of " + device_id + " raised: " + std::string(e.what()));
        }

        if (reachable) {
            record_success(device_id);
        } else {
            record_miss(device_id);
        }
    }

    evict_stale();
}

size_t HealthMonitor::evict_stale() {
    TimePoint now = clock_();
    DeviceSnapshot snapshot = registry_.list_all();

    size_t removed = 0;
    for (const Device& device : snapshot) {
        if (device.trusted || device.status != DeviceStatus::Offline) {
            continue;
        }

        TimePoint since = device.offline_since.value_or(device.last_seen);
        if (now - since > options_.stale_retention) {
            if (registry_.remove(device.id)) {
                utilities::log_info("Health: Evicted stale device " + device.id);
                removed++;
            }
        }
    }
    return removed;
}

// ============================================================================
// Private Methods
// ============================================================================

void HealthMonitor::record_success(const std::string& device_id) {
    TimePoint now = clock_();
    registry_.update(device_id, [now](Device& device) {
        device.status = DeviceStatus::Online;
        device.consecutive_misses = 0;
        device.last_seen = now;
    });
}

void HealthMonitor::record_miss(const std::string& device_id) {
    TimePoint now = clock_();
    uint32_t limit = options_.max_consecutive_misses;
    bool went_offline = false;

    registry_.update(device_id, [now, limit, &went_offline](Device& device) {
        // Marked offline concurrently
        if (device.status == DeviceStatus::Offline) {
            return;
        }
        device.consecutive_misses++;
        if (device.consecutive_misses >= limit) {
            device.status = DeviceStatus::Offline;
            device.offline_since = now;
            went_offline = true;
        }
    });

    if (went_offline) {
        utilities::log_info("Health: " + device_id + " is offline after " +
                            std::to_string(limit) + " missed probes");
    }
}

} // namespace lanshare
