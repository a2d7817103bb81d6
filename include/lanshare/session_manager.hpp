/**
 * @file session_manager.hpp
 * @brief Registry of concurrent transfer sessions
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Each session runs its TransferEngine on its own worker thread. The
 * manager enforces the per-peer concurrency cap, forwards engine updates
 * to the event bus and keeps the terminal records of recent sessions.
 */

#pragma once

#include "lanshare/device_registry.hpp"
#include "lanshare/secure_channel.hpp"
#include "lanshare/status_events.hpp"
#include "lanshare/transfer_engine.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lanshare {

/**
 * @brief Dials a device and completes the channel handshake
 * @throws NetworkError, ProtocolViolation or AuthenticationError
 */
using ChannelFactory = std::function<std::unique_ptr<SecureChannel>(const Device& device)>;

/**
 * @brief SessionManager - Starts, tracks and cancels transfer sessions
 */
class SessionManager {
public:
    /**
     * @brief Create session manager
     * @param registry Device registry (online check for sends)
     * @param channel_factory Outbound connection factory
     * @param options Transfer settings applied to every session
     * @param events Bus receiving transfer events
     * @param max_per_peer Concurrent sessions allowed per device
     */
    SessionManager(
        DeviceRegistry& registry,
        ChannelFactory channel_factory,
        TransferOptions options,
        EventBus& events,
        uint32_t max_per_peer
    );

    /**
     * @brief Destructor - cancels and joins all sessions
     */
    ~SessionManager();

    // Disable copy and move
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
    SessionManager(SessionManager&&) = delete;
    SessionManager& operator=(SessionManager&&) = delete;

    /**
     * @brief Start sending a file; the connection is made on the session thread
     * @param peer_id Target device
     * @param file_path File to send
     * @return Session ID
     * @throws NetworkError if the device is unknown or not Online
     * @throws ResourceError if the file is unreadable, the per-peer cap is
     *         reached or the manager is shut down
     */
    std::string start_send(const std::string& peer_id, const std::filesystem::path& file_path);

    /**
     * @brief Run the receive side on an authenticated inbound channel
     * @param channel Channel after a completed handshake
     * @param accept_callback Consent decision (null accepts)
     * @param offer Header the caller already read from the channel, if any
     * @return Session ID
     * @throws ResourceError if the manager is shut down
     */
    std::string accept_incoming(
        std::unique_ptr<SecureChannel> channel,
        AcceptCallback accept_callback,
        std::optional<HeaderMessage> offer = std::nullopt
    );

    /**
     * @brief Pull a file from a device's shared folder
     *
     * The session thread dials, sends the download request and then runs
     * the receive side; the peer's header is accepted without consent.
     * @param peer_id Device to pull from
     * @param remote_path Path relative to the peer's shared root
     * @return Session ID
     * @throws NetworkError if the device is unknown or not Online
     * @throws ResourceError if the per-peer cap is reached or the manager is shut down
     */
    std::string start_download(const std::string& peer_id, const std::string& remote_path);

    /**
     * @brief Answer a peer's download request by sending a local file
     * @param channel Channel the request arrived on
     * @param file_path Resolved file inside the shared folder
     * @return Session ID
     * @throws ResourceError if the per-peer cap is reached or the manager is
     *         shut down; the peer is told and the channel closed
     */
    std::string serve_download(std::unique_ptr<SecureChannel> channel, const std::filesystem::path& file_path);

    /**
     * @brief Cancel a running session
     * @return false if the session is unknown or already finished
     */
    bool cancel(const std::string& session_id);

    /**
     * @brief Snapshot of an active or recently finished session
     */
    std::optional<TransferSession> status(const std::string& session_id) const;

    /**
     * @brief Snapshots of all sessions that have not finished
     */
    std::vector<TransferSession> list_active() const;

    /**
     * @brief Terminal records, oldest first
     */
    std::vector<TransferSession> list_history() const;

    /**
     * @brief Number of unfinished sessions with a device
     */
    size_t active_count(const std::string& peer_id) const;

    /**
     * @brief Cancel every session and wait for the workers to exit
     */
    void shutdown();

private:
    struct ActiveSession {
        std::string session_id;
        std::string peer_id;
        TransferSession pending;                    ///< Record until the engine exists
        std::shared_ptr<TransferEngine> engine;
        bool cancel_requested = false;
        std::thread worker;
    };

    DeviceRegistry& registry_;
    ChannelFactory channel_factory_;
    TransferOptions options_;
    EventBus& events_;
    uint32_t max_per_peer_;

    std::map<std::string, std::shared_ptr<ActiveSession>> active_;
    std::deque<TransferSession> history_;
    std::vector<std::thread> finished_workers_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::atomic<bool> shut_down_;

    void run_send(std::shared_ptr<ActiveSession> entry, Device device, std::filesystem::path file_path);
    void run_receive(std::shared_ptr<ActiveSession> entry);
    void run_download(std::shared_ptr<ActiveSession> entry, Device device, std::string remote_path);
    void run_serve(std::shared_ptr<ActiveSession> entry, std::unique_ptr<SecureChannel> channel,
                   std::filesystem::path file_path);

    /**
     * @brief Online device for an outbound session
     * @throws NetworkError if unknown or not Online
     */
    Device require_online(const std::string& peer_id) const;

    /**
     * @brief Connect on the session thread; records the failure and returns null
     */
    std::unique_ptr<SecureChannel> dial(const std::shared_ptr<ActiveSession>& entry, const Device& device);

    /**
     * @brief End a session that never got an engine
     */
    void fail(const std::shared_ptr<ActiveSession>& entry, ErrorKind kind, const std::string& reason);

    /**
     * @brief Attach, run and record an engine on the session thread
     */
    void run_engine(const std::shared_ptr<ActiveSession>& entry, std::shared_ptr<TransferEngine> engine);

    /**
     * @brief Attach the engine, publish its events and honor an early cancel
     */
    void attach(const std::shared_ptr<ActiveSession>& entry, const std::shared_ptr<TransferEngine>& engine);

    /**
     * @brief Move a session to the terminal history
     */
    void finish(const std::shared_ptr<ActiveSession>& entry, const TransferSession& result, bool publish);

    size_t active_count_locked(const std::string& peer_id) const;

    /**
     * @brief Join worker threads that have exited
     */
    void reap();
};

} // namespace lanshare
