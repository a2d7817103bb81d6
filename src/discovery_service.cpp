/**
 * @file discovery_service.cpp
 * @brief Implementation of UDP broadcast-based peer discovery
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/discovery_service.hpp"
#include "lanshare/utilities.hpp"
#include <future>
#include <stdexcept>

namespace lanshare {

// ============================================================================
// Constructor / Destructor
// ============================================================================

DiscoveryService::DiscoveryService(
    std::shared_ptr<DeviceIdentity> identity,
    DeviceRegistry& registry,
    asio::io_context& io_context,
    DiscoveryOptions options
)
    : identity_(std::move(identity))
    , registry_(registry)
    , io_context_(io_context)
    , strand_(asio::make_strand(io_context))
    , socket_(strand_)
    , announce_timer_(strand_)
    , retry_timer_(strand_)
    , options_(std::move(options))
    , running_(false)
    , local_port_(0)
    , announcements_sent_(0)
    , announcements_received_(0)
{
    if (!identity_) {
        throw std::invalid_argument("DiscoveryService: identity cannot be null");
    }
}

DiscoveryService::~DiscoveryService() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool DiscoveryService::start() {
    if (running_.load()) {
        return true;  // Already running
    }

    try {
        socket_.open(asio::ip::udp::v4());
        socket_.set_option(asio::socket_base::broadcast(true));
        socket_.set_option(asio::socket_base::reuse_address(true));
        socket_.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), options_.listen_port));
        local_port_.store(socket_.local_endpoint().port());

        running_.store(true);

        asio::post(strand_, [this]() {
            start_receive();
            send_announcement();
            schedule_announce();
        });

        utilities::log_info("Discovery: Listening on UDP port " + std::to_string(local_port_.load()));
        return true;

    } catch (const std::exception& e) {
        utilities::log_error("Discovery: Failed to start listener: " + std::string(e.what()));
        asio::error_code ec;
        socket_.close(ec);
        running_.store(false);
        return false;
    }
}

void DiscoveryService::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (io_context_.stopped()) {
        close_socket();
    } else {
        auto closed = std::make_shared<std::promise<void>>();
        auto future = closed->get_future();
        asio::post(strand_, [this, closed]() {
            close_socket();
            closed->set_value();
        });
        if (future.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            utilities::log_warn("Discovery: io_context did not process shutdown, closing directly");
            close_socket();
        }
    }

    utilities::log_info("Discovery: Stopped");
}

bool DiscoveryService::is_running() const {
    return running_.load();
}

bool DiscoveryService::announce_presence() {
    if (!running_.load()) {
        return false;
    }
    asio::post(strand_, [this]() { send_announcement(); });
    return true;
}

uint16_t DiscoveryService::local_port() const {
    return local_port_.load();
}

uint64_t DiscoveryService::get_announcements_sent() const {
    return announcements_sent_.load();
}

uint64_t DiscoveryService::get_announcements_received() const {
    return announcements_received_.load();
}

// ============================================================================
// Presence Handling
// ============================================================================

bool DiscoveryService::handle_presence(const PresenceRecord& record, const std::string& sender_address) {
    // No self-registration
    if (record.device_id == identity_->get_device_id()) {
        return false;
    }

    Device device;
    device.id = record.device_id;
    device.display_name = record.display_name;
    device.address = sender_address;
    device.port = record.port;
    device.status = DeviceStatus::Online;
    device.last_seen = Clock::now();

    if (registry_.upsert(device)) {
        utilities::log_info("Discovery: Discovered " + record.device_id + " (" + record.display_name +
                            ") at " + sender_address + ":" + std::to_string(record.port));
    } else {
        utilities::log_debug("Discovery: Refreshed " + record.device_id);
    }
    return true;
}

// ============================================================================
// Private Methods - Network Operations
// ============================================================================

void DiscoveryService::start_receive() {
    if (!running_.load()) {
        return;
    }

    socket_.async_receive_from(
        asio::buffer(recv_buffer_),
        sender_endpoint_,
        [this](const asio::error_code& error, size_t bytes_transferred) {
            handle_receive(error, bytes_transferred);
        }
    );
}

void DiscoveryService::handle_receive(const asio::error_code& error, size_t bytes_transferred) {
    if (!running_.load() || error == asio::error::operation_aborted) {
        return;
    }

    if (error) {
        // Interface down or similar; try again shortly
        utilities::log_warn("Discovery: Receive error: " + error.message());
        retry_timer_.expires_after(security::DISCOVERY_RETRY_DELAY);
        retry_timer_.async_wait([this](const asio::error_code& wait_error) {
            if (!wait_error) {
                start_receive();
            }
        });
        return;
    }

    announcements_received_++;

    std::string payload(recv_buffer_.begin(), recv_buffer_.begin() + bytes_transferred);
    auto record = PresenceRecord::from_json(payload);
    if (!record) {
        utilities::log_debug("Discovery: Ignoring malformed datagram from " +
                             sender_endpoint_.address().to_string());
    } else {
        handle_presence(*record, sender_endpoint_.address().to_string());
    }

    start_receive();
}

void DiscoveryService::schedule_announce() {
    if (!running_.load()) {
        return;
    }

    announce_timer_.expires_after(options_.announce_interval);
    announce_timer_.async_wait([this](const asio::error_code& error) {
        if (error || !running_.load()) {
            return;
        }
        send_announcement();
        schedule_announce();
    });
}

void DiscoveryService::send_announcement() {
    if (!running_.load()) {
        return;
    }

    PresenceRecord record;
    record.device_id = identity_->get_device_id();
    record.display_name = identity_->get_display_name();
    record.port = options_.transfer_port;

    std::string payload = record.to_json();
    if (payload.size() > security::MAX_UDP_PACKET_SIZE) {
        utilities::log_error("Discovery: Announcement too large to send");
        return;
    }

    asio::error_code ec;
    auto address = asio::ip::make_address(options_.announce_address, ec);
    if (ec) {
        utilities::log_error("Discovery: Invalid announce address " + options_.announce_address);
        return;
    }

    // Failures are retried on the next announce tick
    socket_.send_to(asio::buffer(payload), asio::ip::udp::endpoint(address, options_.announce_port), 0, ec);
    if (ec) {
        utilities::log_warn("Discovery: Failed to send announcement: " + ec.message());
        return;
    }

    announcements_sent_++;
    utilities::log_debug("Discovery: Announced presence");
}

void DiscoveryService::close_socket() {
    asio::error_code ec;
    announce_timer_.cancel();
    retry_timer_.cancel();
    if (socket_.is_open()) {
        socket_.close(ec);
    }
}

} // namespace lanshare
