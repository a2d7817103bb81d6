/**
 * @file lanshare_node.hpp
 * @brief Node orchestrator - integrates presence and transfer subsystems
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * LanshareNode coordinates all subsystems:
 * - Device identity and trust store
 * - Discovery announcements and health probing
 * - Transfer listener, secure channels and session manager
 * - Shared folder browsing and downloads for trusted peers
 * - Status event stream for UI collaborators
 */

#pragma once

#include "lanshare/config.hpp"
#include "lanshare/device_identity.hpp"
#include "lanshare/device_registry.hpp"
#include "lanshare/discovery_service.hpp"
#include "lanshare/health_monitor.hpp"
#include "lanshare/session_manager.hpp"
#include "lanshare/status_events.hpp"
#include "lanshare/transfer_engine.hpp"
#include "lanshare/transfer_listener.hpp"
#include "lanshare/trust_store.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lanshare {

/**
 * @brief What a peer needs to add this device manually
 */
struct ConnectionInfo {
    std::string device_id;
    std::string display_name;
    std::vector<std::string> addresses;     ///< Non-loopback IPv4 addresses
    uint16_t port = 0;                      ///< TCP transfer port
    std::string pairing_code;               ///< XXXX-XXXX
};

/**
 * @brief LanshareNode - Process-wide lifecycle for one device
 */
class LanshareNode {
public:
    /**
     * @brief Construct node with configuration
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit LanshareNode(NodeConfig config);

    /**
     * @brief Destructor - graceful shutdown
     */
    ~LanshareNode();

    // Disable copy and move
    LanshareNode(const LanshareNode&) = delete;
    LanshareNode& operator=(const LanshareNode&) = delete;
    LanshareNode(LanshareNode&&) = delete;
    LanshareNode& operator=(LanshareNode&&) = delete;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Load identity and trust store, then start all loops
     * @return true if started successfully, false otherwise
     */
    bool start();

    /**
     * @brief Cancel transfers, stop all loops and close all sockets
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Device ID (valid after start)
     */
    std::string get_device_id() const;

    /**
     * @brief Bound TCP transfer port (valid after start)
     */
    uint16_t get_port() const;

    /**
     * @brief Bound UDP discovery port, 0 when discovery is disabled
     */
    uint16_t get_discovery_port() const;

    // ========================================================================
    // Devices
    // ========================================================================

    std::vector<Device> list_devices() const;

    std::optional<Device> get_device(const std::string& device_id) const;

    /**
     * @brief Add a device by address, learning its id with a probe
     * @return The added device, or std::nullopt if it did not answer
     */
    std::optional<Device> add_device(const std::string& address, uint16_t port);

    /**
     * @brief Mark a known device trusted and persist it
     */
    bool trust_device(const std::string& device_id);

    /**
     * @brief Remove a device from the registry and the trust store
     */
    bool forget_device(const std::string& device_id);

    /**
     * @brief Send a presence announcement now
     */
    bool announce();

    /**
     * @brief Run one health probe round now
     */
    void check_health();

    // ========================================================================
    // Transfers
    // ========================================================================

    /**
     * @brief Send a file to a device
     * @return Session ID
     * @throws NetworkError if the device is not Online
     * @throws ResourceError if the file is unreadable or limits are reached
     */
    std::string send(const std::string& peer_id, const std::string& file_path);

    bool cancel(const std::string& session_id);

    std::optional<TransferSession> transfer_status(const std::string& session_id) const;

    /**
     * @brief Unfinished sessions
     */
    std::vector<TransferSession> list_transfers() const;

    /**
     * @brief Recently finished sessions, oldest first
     */
    std::vector<TransferSession> transfer_history() const;

    /**
     * @brief Subscribe to device and transfer status changes
     */
    std::shared_ptr<StatusSubscription> subscribe_status();

    /**
     * @brief Consent callback consulted when auto_accept is off
     */
    void set_accept_callback(AcceptCallback callback);

    // ========================================================================
    // Shared Folders
    // ========================================================================

    /**
     * @brief List a directory in a device's shared folder
     * @param peer_id Device to browse
     * @param path Path relative to the peer's shared root ("" for the root)
     * @throws NetworkError if the device is not Online or unreachable
     * @throws RejectedError if the peer does not share with this device
     * @throws ResourceError if the path does not exist on the peer
     */
    DirListingMessage list_remote_dir(const std::string& peer_id, const std::string& path = "");

    /**
     * @brief Pull a file from a device's shared folder into downloads_dir
     * @return Session ID
     * @throws NetworkError if the device is not Online
     * @throws ResourceError if limits are reached
     */
    std::string download(const std::string& peer_id, const std::string& remote_path);

    // ========================================================================
    // Pairing and Status
    // ========================================================================

    ConnectionInfo connection_info() const;

    /**
     * @brief Short code derived from id, address and port: XXXX-XXXX
     */
    std::string pairing_code() const;

    /**
     * @brief Print status to console
     */
    void print_status() const;

private:
    NodeConfig config_;

    /// Running flag
    std::atomic<bool> running_;

    /// Start time
    std::chrono::steady_clock::time_point start_time_;

    /// ASIO I/O context (discovery and accept loops)
    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> worker_threads_;

    std::shared_ptr<DeviceIdentity> identity_;
    DeviceRegistry registry_;
    EventBus events_;

    std::unique_ptr<TrustStore> trust_store_;
    std::unique_ptr<SessionManager> sessions_;
    std::unique_ptr<TransferListener> listener_;
    std::unique_ptr<DiscoveryService> discovery_;
    std::unique_ptr<HealthMonitor> health_;

    AcceptCallback accept_callback_;
    mutable std::mutex callback_mutex_;

    // ========================================================================
    // Private Methods
    // ========================================================================

    bool initialize_data_directory();
    bool initialize_identity();
    bool initialize_subsystems();

    /**
     * @brief Put trusted devices from the store into the registry as Unknown
     */
    void load_trusted_devices();

    /**
     * @brief Serve one inbound connection (probe or transfer)
     */
    void handle_connection(std::shared_ptr<TcpStream> stream);

    /**
     * @brief Accept policy for incoming offers
     */
    bool accept_offer(const std::string& peer_id, const HeaderMessage& header);

    /**
     * @brief Shared folder access: configured and the peer is trusted
     */
    bool may_browse(const std::string& peer_id) const;

    /**
     * @brief Map a peer-supplied relative path into the shared folder
     * @return std::nullopt if it escapes the shared root
     */
    std::optional<std::filesystem::path> resolve_shared(const std::string& relative) const;

    void serve_listing(SecureChannel& channel, const std::string& peer_id, const ListDirMessage& request);

    void serve_download(std::unique_ptr<SecureChannel> channel, const std::string& peer_id,
                        const DownloadMessage& request);

    /**
     * @brief Dial a device and run the initiator handshake
     */
    std::unique_ptr<SecureChannel> open_channel(const Device& device);

    TransferOptions transfer_options() const;

    void shutdown_subsystems();
};

} // namespace lanshare
