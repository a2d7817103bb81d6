/**
 * @file trust_store.hpp
 * @brief Persistent store of paired devices and pinned identity keys
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * SQLite-backed record of:
 * - Devices paired explicitly ("Add Device" or trust action)
 * - The Ed25519 identity key pinned for each peer on first handshake
 */

#pragma once

#include "lanshare/security_config.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanshare {

using IdentityKey = std::array<uint8_t, security::ED25519_PUBKEY_SIZE>;

/**
 * @brief One row of the devices table
 */
struct TrustedDevice {
    std::string device_id;              ///< Peer device ID (primary key)
    std::string display_name;           ///< Last known name
    std::string address;                ///< Last known address
    uint16_t port = 0;                  ///< Last known transfer port
    std::optional<IdentityKey> identity_key;  ///< Pinned key, absent until first handshake
    bool trusted = false;               ///< Explicitly paired
    uint64_t paired_at = 0;             ///< Unix timestamp of pairing (0 when only pinned)
    uint64_t last_seen = 0;             ///< Unix timestamp
};

/**
 * @brief Outcome of checking a handshake identity against the store
 */
enum class PinResult {
    Pinned,     ///< First contact; key recorded
    Matched,    ///< Key equals the pinned key
    Mismatch,   ///< Key differs from the pinned key
    Failed      ///< Database error
};

/**
 * @brief TrustStore - SQLite persistence for pairing and key pinning
 *
 * Thread-safe: all database access is serialized.
 */
class TrustStore {
public:
    /**
     * @brief Open (or create) the store
     * @param database_path SQLite file path, or ":memory:"
     * @throws std::runtime_error if the database cannot be opened
     */
    explicit TrustStore(const std::string& database_path);

    ~TrustStore();

    // Disable copy and move
    TrustStore(const TrustStore&) = delete;
    TrustStore& operator=(const TrustStore&) = delete;
    TrustStore(TrustStore&&) = delete;
    TrustStore& operator=(TrustStore&&) = delete;

    /**
     * @brief Insert or update a device row
     *
     * A pinned identity key already stored is never replaced here; an
     * absent key in the argument keeps the stored one.
     *
     * @return true if successful, false otherwise
     */
    bool save_device(const TrustedDevice& device);

    std::optional<TrustedDevice> get_device(const std::string& device_id);

    /**
     * @brief All devices marked trusted, ordered by ID
     */
    std::vector<TrustedDevice> list_trusted();

    /**
     * @brief Forget a device entirely, including its pinned key
     * @return true if a row was removed
     */
    bool remove_device(const std::string& device_id);

    /**
     * @brief Verify a peer's identity key, pinning it on first use
     * @param device_id Peer device ID from its HELLO
     * @param identity_key Key the peer authenticated with
     * @param display_name Name to record for a newly pinned peer
     */
    PinResult check_and_pin(
        const std::string& device_id,
        const IdentityKey& identity_key,
        const std::string& display_name
    );

    std::optional<IdentityKey> get_pinned_key(const std::string& device_id);

private:
    std::string database_path_;
    void* db_connection_;  ///< SQLite database connection (opaque pointer)
    std::mutex db_mutex_;

    bool initialize_database();
    std::optional<TrustedDevice> load_device_locked(const std::string& device_id);
};

} // namespace lanshare
