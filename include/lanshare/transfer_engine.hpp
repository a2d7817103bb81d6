/**
 * @file transfer_engine.hpp
 * @brief Send and receive state machines for one file transfer
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * States: Negotiating -> Transferring -> Verifying -> Completed, with
 * Aborted reachable from every non-terminal state.
 *
 * - Negotiating: header offer, accept or reject with a reason code
 * - Transferring: strictly sequential chunks, one in flight; a checksum
 *   mismatch is answered with one retransmit request for that index
 * - Verifying: SHA-256 of the received file against the declared digest
 * - Completed: the temporary file is renamed to its final name
 * - Aborted: partial output is deleted
 */

#pragma once

#include "lanshare/codec.hpp"
#include "lanshare/device_registry.hpp"
#include "lanshare/errors.hpp"
#include "lanshare/secure_channel.hpp"
#include "lanshare/security_config.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace lanshare {

enum class TransferDirection {
    Send,
    Receive
};

enum class TransferState {
    Negotiating,
    Transferring,
    Verifying,
    Completed,
    Aborted
};

std::string to_string(TransferDirection direction);
std::string to_string(TransferState state);

inline bool is_terminal(TransferState state) {
    return state == TransferState::Completed || state == TransferState::Aborted;
}

/**
 * @brief Status record of one transfer attempt
 */
struct TransferSession {
    std::string session_id;
    TransferDirection direction = TransferDirection::Send;
    std::string peer_id;
    std::string file_name;                  ///< Name offered on the wire
    uint64_t file_size = 0;
    uint32_t chunk_size = 0;
    uint64_t bytes_transferred = 0;         ///< Bytes sent (send) or applied (receive)
    TransferState state = TransferState::Negotiating;
    std::string integrity_digest;           ///< Hex SHA-256, once known
    uint32_t chunks_transferred = 0;        ///< Chunk messages sent or applied
    uint32_t retransmits = 0;               ///< Retransmit requests sent or honored
    std::optional<ErrorKind> error;         ///< Set when Aborted
    std::string reason;                     ///< Reject or abort reason
    std::filesystem::path local_path;       ///< Source file, or final destination once completed
    TimePoint started_at{};
    std::optional<TimePoint> finished_at;
};

/**
 * @brief Per-transfer settings
 */
struct TransferOptions {
    uint32_t chunk_size = security::DEFAULT_CHUNK_SIZE;
    std::chrono::milliseconds negotiation_timeout = std::chrono::seconds(30);
    std::chrono::milliseconds verification_timeout = std::chrono::seconds(60);
    std::chrono::milliseconds io_timeout = std::chrono::seconds(30);
    bool precompute_digest = true;          ///< Put the digest in the header (send)
    std::filesystem::path downloads_dir;    ///< Destination directory (receive)
};

/**
 * @brief Consent decision for an incoming offer
 * @return true to accept
 */
using AcceptCallback = std::function<bool(const std::string& peer_id, const HeaderMessage& header)>;

/**
 * @brief Receives a session snapshot on every state change and progress step
 */
using TransferObserver = std::function<void(const TransferSession& session)>;

/**
 * @brief TransferEngine - Runs one TransferSession to a terminal state
 *
 * run() executes on a dedicated thread; cancel(), snapshot() and
 * set_observer() may be called from any thread.
 */
class TransferEngine {
public:
    /**
     * @brief Create the sending side
     * @param session_id Unique session ID
     * @param channel Established channel to the receiver
     * @param source File to send
     * @param options Chunk size, timeouts and digest mode
     */
    static std::unique_ptr<TransferEngine> create_sender(
        const std::string& session_id,
        std::unique_ptr<SecureChannel> channel,
        const std::filesystem::path& source,
        TransferOptions options
    );

    /**
     * @brief Create the receiving side
     * @param accept_callback Consent decision; null accepts every valid offer
     * @param offer Header already read from the channel, if any
     */
    static std::unique_ptr<TransferEngine> create_receiver(
        const std::string& session_id,
        std::unique_ptr<SecureChannel> channel,
        TransferOptions options,
        AcceptCallback accept_callback,
        std::optional<HeaderMessage> offer = std::nullopt
    );

    ~TransferEngine();

    // Disable copy and move
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;
    TransferEngine(TransferEngine&&) = delete;
    TransferEngine& operator=(TransferEngine&&) = delete;

    /**
     * @brief Run the state machine to completion (never throws)
     * @return Terminal session record
     */
    TransferSession run();

    /**
     * @brief Request cancellation; observed at the next I/O or chunk boundary
     */
    void cancel();

    TransferSession snapshot() const;

    void set_observer(TransferObserver observer);

    const std::string& session_id() const;

private:
    TransferEngine(
        const std::string& session_id,
        TransferDirection direction,
        std::unique_ptr<SecureChannel> channel,
        TransferOptions options
    );

    std::unique_ptr<SecureChannel> channel_;
    TransferOptions options_;
    AcceptCallback accept_callback_;
    std::optional<HeaderMessage> offer_;
    std::string session_id_;

    TransferSession session_;
    mutable std::mutex session_mutex_;

    TransferObserver observer_;
    std::mutex observer_mutex_;

    std::atomic<bool> cancelled_;

    /// Peer ended the session (cancel or error message); nothing to notify
    bool peer_terminated_;

    /// Receive side output
    std::ofstream output_;
    std::filesystem::path temp_path_;

    void run_sender();
    void run_receiver();

    /**
     * @brief Apply a mutation to the session record and notify the observer
     */
    void update(const std::function<void(TransferSession&)>& mutator);

    void set_state(TransferState state);

    void abort(ErrorKind kind, const std::string& reason);

    /**
     * @brief Handle a message that is never valid in the current state
     * @throws CancelledError, LanshareError or ProtocolViolation
     */
    [[noreturn]] void unexpected(const ChannelMessage& message, const char* context);

    void check_cancelled() const;

    std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point deadline) const;

    void discard_partial_output();
};

} // namespace lanshare
