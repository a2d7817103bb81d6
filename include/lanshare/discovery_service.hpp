/**
 * @file discovery_service.hpp
 * @brief UDP broadcast presence announcement and listening
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Zero-configuration peer discovery on the local segment:
 * - Announces {id, displayName, port} every announce interval
 * - Listens for announcements and upserts peers as Online
 * - Ignores its own announcements
 * - Receive errors are logged and the receive re-armed after a delay
 */

#pragma once

#include "lanshare/codec.hpp"
#include "lanshare/device_identity.hpp"
#include "lanshare/device_registry.hpp"
#include "lanshare/security_config.hpp"
#include <asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace lanshare {

/**
 * @brief Discovery socket and timing settings
 */
struct DiscoveryOptions {
    uint16_t listen_port = security::DEFAULT_DISCOVERY_PORT;    ///< UDP port to bind (0 = ephemeral)
    uint16_t announce_port = security::DEFAULT_DISCOVERY_PORT;  ///< Destination port of announcements
    std::string announce_address = "255.255.255.255";           ///< Broadcast or unicast destination
    std::chrono::milliseconds announce_interval = std::chrono::seconds(30);
    uint16_t transfer_port = security::DEFAULT_TRANSFER_PORT;   ///< Advertised TCP port
};

/**
 * @brief DiscoveryService - Feeds announced peers into the device registry
 *
 * All socket and timer handlers run on a strand of the caller's
 * io_context, so the io_context may be run by several threads.
 */
class DiscoveryService {
public:
    /**
     * @brief Create discovery service
     * @param identity Local device identity (announced id and name)
     * @param registry Registry receiving discovered peers
     * @param io_context ASIO io_context driving the socket
     * @param options Ports, destination and interval
     * @throws std::invalid_argument if identity is null
     */
    DiscoveryService(
        std::shared_ptr<DeviceIdentity> identity,
        DeviceRegistry& registry,
        asio::io_context& io_context,
        DiscoveryOptions options
    );

    ~DiscoveryService();

    // Disable copy and move
    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;
    DiscoveryService(DiscoveryService&&) = delete;
    DiscoveryService& operator=(DiscoveryService&&) = delete;

    /**
     * @brief Bind the socket and start the listen and announce loops
     * @return true if successful, false if the socket could not be bound
     */
    bool start();

    /**
     * @brief Cancel both loops and close the socket
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Send one announcement now (in addition to the periodic ones)
     * @return false if the service is not running
     */
    bool announce_presence();

    /**
     * @brief Apply a received presence record
     * @param record Decoded record
     * @param sender_address Source address of the datagram
     * @return true if the record was upserted, false if ignored
     */
    bool handle_presence(const PresenceRecord& record, const std::string& sender_address);

    /**
     * @brief Bound UDP port (valid after start)
     */
    uint16_t local_port() const;

    uint64_t get_announcements_sent() const;
    uint64_t get_announcements_received() const;

private:
    std::shared_ptr<DeviceIdentity> identity_;
    DeviceRegistry& registry_;
    asio::io_context& io_context_;
    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::udp::socket socket_;
    asio::steady_timer announce_timer_;
    asio::steady_timer retry_timer_;
    DiscoveryOptions options_;

    std::array<uint8_t, security::MAX_UDP_PACKET_SIZE> recv_buffer_;
    asio::ip::udp::endpoint sender_endpoint_;

    std::atomic<bool> running_;
    std::atomic<uint16_t> local_port_;
    std::atomic<uint64_t> announcements_sent_;
    std::atomic<uint64_t> announcements_received_;

    void start_receive();
    void handle_receive(const asio::error_code& error, size_t bytes_transferred);
    void schedule_announce();
    void send_announcement();
    void close_socket();
};

} // namespace lanshare
