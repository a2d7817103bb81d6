/**
 * @file security_config.hpp
 * @brief Protocol constants, limits and input validation
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string>
#include <filesystem>

namespace lanshare {
namespace security {

// ============================================================================
// Network Configuration
// ============================================================================

/// Default TCP transfer port
constexpr uint16_t DEFAULT_TRANSFER_PORT = 52637;

/// Default UDP discovery port
constexpr uint16_t DEFAULT_DISCOVERY_PORT = 52638;

/// Maximum UDP presence datagram accepted
constexpr size_t MAX_UDP_PACKET_SIZE = 2048;

/// Maximum TCP frame length (kind byte + body)
constexpr size_t MAX_FRAME_SIZE = 8 * 1024 * 1024;

/// Maximum JSON control message size
constexpr size_t MAX_JSON_SIZE = 64 * 1024;

// ============================================================================
// Transfer Limits
// ============================================================================

constexpr uint32_t DEFAULT_CHUNK_SIZE = 64 * 1024;
constexpr uint32_t MIN_CHUNK_SIZE = 1024;
constexpr uint32_t MAX_CHUNK_SIZE = 4 * 1024 * 1024;

/// Terminal session records kept for status queries
constexpr size_t TERMINAL_HISTORY_LIMIT = 256;

/// Maximum identifier length (device ID, session ID)
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

/// Maximum display name length
constexpr size_t MAX_DISPLAY_NAME_LENGTH = 128;

/// Maximum filename length
constexpr size_t MAX_FILENAME_LENGTH = 255;

/// Entries returned for one shared directory listing
constexpr size_t MAX_LISTING_ENTRIES = 1000;

// ============================================================================
// Timeouts
// ============================================================================

/// TCP connection establishment timeout
constexpr auto CONNECTION_TIMEOUT = std::chrono::seconds(5);

/// Delay before re-arming a failed discovery receive
constexpr auto DISCOVERY_RETRY_DELAY = std::chrono::seconds(1);

// ============================================================================
// Cryptographic Configuration
// ============================================================================

/// Handshake algorithm identifier carried in HELLO
constexpr const char* CHANNEL_ALGORITHM = "x25519-chacha20poly1305-ed25519";

/// Full-file digest algorithm identifier carried in the header
constexpr const char* DIGEST_ALGORITHM = "sha256";

/// Ed25519 signature size
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

/// Ed25519 public key size
constexpr size_t ED25519_PUBKEY_SIZE = 32;

/// X25519 public key size
constexpr size_t X25519_PUBKEY_SIZE = 32;

/// ChaCha20-Poly1305 nonce size
constexpr size_t CHACHA20_NONCE_SIZE = 12;

/// ChaCha20-Poly1305 tag size
constexpr size_t CHACHA20_TAG_SIZE = 16;

/// Per-chunk BLAKE2b checksum size
constexpr size_t CHUNK_CHECKSUM_SIZE = 16;

/// Handshake transcript hash size
constexpr size_t TRANSCRIPT_HASH_SIZE = 32;

// ============================================================================
// Data Directories
// ============================================================================

/**
 * @brief Get LanShare data directory
 *
 * LANSHARE_DATA_DIR wins; otherwise $HOME/.lanshare, or /tmp/lanshare
 * when HOME is unset. The directory is created if missing.
 *
 * @return Filesystem path to data directory
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get received files directory under a data directory
 */
std::filesystem::path get_received_directory(const std::filesystem::path& data_dir);

/**
 * @brief Get database directory under a data directory
 */
std::filesystem::path get_database_directory(const std::filesystem::path& data_dir);

/**
 * @brief Get log directory under a data directory
 */
std::filesystem::path get_log_directory(const std::filesystem::path& data_dir);

// ============================================================================
// Input Validation
// ============================================================================

/**
 * @brief Validate identifier (alphanumeric plus '_', '-' and '.')
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

/**
 * @brief Validate a human-readable display name (no control characters)
 */
bool validate_display_name(const std::string& name, size_t max_length = MAX_DISPLAY_NAME_LENGTH);

/**
 * @brief Sanitize a peer-supplied filename to prevent path traversal
 *
 * Strips directory components, control characters and leading dots and
 * replaces reserved characters with underscores.
 *
 * @param filename Peer-provided filename
 * @return Sanitized filename, or empty string if nothing usable remains
 */
std::string sanitize_filename(const std::string& filename);

/**
 * @brief Check if path is safe (no traversal, within allowed directory)
 * @param path Path to validate
 * @param base_dir Base directory that path must be within
 * @return true if safe, false if path traversal detected
 */
bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir);

} // namespace security
} // namespace lanshare
