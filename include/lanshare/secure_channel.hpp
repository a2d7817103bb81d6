/**
 * @file secure_channel.hpp
 * @brief Mutually authenticated, sealed message channel over a byte stream
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Handshake:
 * 1. Both sides send HELLO {algorithm, ephemeral X25519 key, Ed25519
 *    identity key, device id, display name} in clear
 * 2. crypto_kx derives one key per direction
 * 3. Each side sends a sealed confirm carrying an Ed25519 signature over
 *    role || BLAKE2b(initiator HELLO || responder HELLO)
 * 4. The peer's identity key is checked against (or pinned into) the
 *    trust store; a mismatch fails closed
 *
 * After the handshake every message is sealed with ChaCha20-Poly1305 under
 * a per-direction sequence number. Any sequence gap, replay or failed
 * authentication closes the connection.
 */

#pragma once

#include "lanshare/codec.hpp"
#include "lanshare/device_crypto.hpp"
#include "lanshare/device_identity.hpp"
#include "lanshare/stream.hpp"
#include "lanshare/trust_store.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace lanshare {

enum class ChannelRole {
    Initiator,  ///< Dialed the connection
    Responder   ///< Accepted the connection
};

/**
 * @brief Authenticated identity of the remote end
 */
struct ChannelPeer {
    std::string device_id;
    std::string display_name;
    IdentityKey identity_key{};
    std::string address;
};

/**
 * @brief Key material and counters for one connection; never persisted
 */
struct SecureChannelState {
    AeadKey tx_key{};
    AeadKey rx_key{};
    uint64_t tx_sequence = 0;   ///< Next outbound sequence
    uint64_t rx_sequence = 0;   ///< Next expected inbound sequence
};

/**
 * @brief SecureChannel - Crypto channel for one TCP connection
 *
 * Owned by exactly one transfer engine. send() and receive() may run on
 * different threads; close() may be called from any thread.
 */
class SecureChannel {
public:
    /**
     * @brief Run the initiator side of the handshake
     * @param stream Connected transport
     * @param identity Local identity
     * @param trust Trust store for pinning
     * @param expected_peer_id Device id that was dialed (empty to accept any)
     * @param timeout Per-operation timeout
     * @throws NetworkError, ProtocolViolation, AuthenticationError
     */
    static std::unique_ptr<SecureChannel> initiate(
        std::shared_ptr<ByteStream> stream,
        const DeviceIdentity& identity,
        TrustStore& trust,
        const std::string& expected_peer_id,
        std::chrono::milliseconds timeout
    );

    /**
     * @brief Run the responder side after the peer's HELLO frame was read
     * @throws NetworkError, ProtocolViolation, AuthenticationError
     */
    static std::unique_ptr<SecureChannel> accept(
        std::shared_ptr<ByteStream> stream,
        const Frame& hello_frame,
        const DeviceIdentity& identity,
        TrustStore& trust,
        std::chrono::milliseconds timeout
    );

    ~SecureChannel();

    // Disable copy and move
    SecureChannel(const SecureChannel&) = delete;
    SecureChannel& operator=(const SecureChannel&) = delete;
    SecureChannel(SecureChannel&&) = delete;
    SecureChannel& operator=(SecureChannel&&) = delete;

    /**
     * @brief Seal and send one message
     * @throws NetworkError on transport failure
     */
    void send(const ChannelMessage& message, std::chrono::milliseconds timeout);

    /**
     * @brief Send only if no other send is in progress
     * @return false if another thread is sending
     * @throws NetworkError on transport failure
     */
    bool try_send(const ChannelMessage& message, std::chrono::milliseconds timeout);

    /**
     * @brief Receive and open the next message
     * @throws NetworkError on transport failure
     * @throws AuthenticationError on sequence or tag failure (connection closed)
     * @throws ProtocolViolation on a malformed message (connection closed)
     */
    ChannelMessage receive(std::chrono::milliseconds timeout);

    /**
     * @brief Receive a message only if one has started arriving
     * @return std::nullopt when nothing is pending
     */
    std::optional<ChannelMessage> poll(std::chrono::milliseconds timeout);

    /**
     * @brief Close the underlying stream (thread-safe)
     */
    void close();

    bool is_open() const;

    const ChannelPeer& peer() const;

    ChannelRole role() const;

private:
    SecureChannel(
        std::shared_ptr<ByteStream> stream,
        ChannelRole role,
        ChannelPeer peer,
        const SessionKeys& keys
    );

    std::shared_ptr<ByteStream> stream_;
    ChannelRole role_;
    ChannelPeer peer_;
    SecureChannelState state_;
    std::mutex send_mutex_;
    std::mutex receive_mutex_;

    void send_locked(const ChannelMessage& message, std::chrono::milliseconds timeout);

    /**
     * @brief Exchange and verify confirmations, then check the pin
     */
    void confirm(
        const DeviceIdentity& identity,
        TrustStore& trust,
        const std::vector<uint8_t>& transcript,
        std::chrono::milliseconds timeout
    );
};

} // namespace lanshare
