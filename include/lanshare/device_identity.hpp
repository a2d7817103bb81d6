/**
 * @file device_identity.hpp
 * @brief Persistent device identity with signing keys
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Manages this device's identity:
 * - Stable device ID (hostname plus random suffix, fixed at creation)
 * - Display name
 * - Ed25519 signature keypair authenticating handshakes
 * - Persistent JSON storage with owner-only permissions
 */

#pragma once

#include "lanshare/device_crypto.hpp"
#include <string>
#include <filesystem>
#include <optional>
#include <vector>

namespace lanshare {

/**
 * @brief DeviceIdentity - Cryptographic identity of the local device
 *
 * The device ID is what peers pin. Ephemeral key-exchange keys are never
 * part of the identity; they are generated per connection.
 */
class DeviceIdentity {
public:
    /**
     * @brief Create new identity with a freshly generated signing key
     * @param device_id Unique device identifier
     * @param display_name Human-readable name
     * @throws std::invalid_argument if the identifier or name is invalid
     */
    DeviceIdentity(const std::string& device_id, const std::string& display_name);

    /**
     * @brief Load identity from a JSON identity file
     * @param identity_file Path to identity.json
     * @return DeviceIdentity if successful, std::nullopt if missing or corrupt
     */
    static std::optional<DeviceIdentity> load(const std::filesystem::path& identity_file);

    /**
     * @brief Save identity to a JSON identity file (mode 0600)
     * @return true if successful, false otherwise
     */
    bool save(const std::filesystem::path& identity_file) const;

    /**
     * @brief Generate a device ID from a hostname: "<host>-<8 hex chars>"
     */
    static std::string generate_device_id(const std::string& hostname);

    // ========================================================================
    // Identity Information
    // ========================================================================

    const std::string& get_device_id() const;

    const std::string& get_display_name() const;

    /**
     * @brief Change display name (the device ID never changes)
     * @return false if the name is invalid
     */
    bool set_display_name(const std::string& display_name);

    const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& get_signature_public_key() const;

    std::string get_signature_public_key_b64() const;

    // ========================================================================
    // Cryptographic Operations
    // ========================================================================

    /**
     * @brief Sign message with Ed25519 private key
     * @param message Message to sign
     * @return Signature (64 bytes)
     */
    std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const;

    /**
     * @brief Verify signature from another device
     * @param message Original message
     * @param signature Signature to verify
     * @param peer_public_key Peer's Ed25519 public key
     * @return true if signature is valid, false otherwise
     */
    static bool verify(
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature,
        const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& peer_public_key
    );

    // ========================================================================
    // Serialization
    // ========================================================================

    /**
     * @brief Export identity to JSON (includes private key - SENSITIVE!)
     */
    std::string to_json() const;

    /**
     * @brief Import identity from JSON
     * @return DeviceIdentity if successful, std::nullopt if invalid
     */
    static std::optional<DeviceIdentity> from_json(const std::string& json);

private:
    std::string device_id_;
    std::string display_name_;
    SignatureKeyPair signature_keypair_;

    DeviceIdentity(
        const std::string& device_id,
        const std::string& display_name,
        const SignatureKeyPair& sig_keypair
    );
};

} // namespace lanshare
