/**
 * @file codec.hpp
 * @brief Wire message schema and framing for LanShare
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Message families:
 * - Presence records (UDP, plaintext JSON)
 * - Frames on the TCP transfer port: HELLO, SEALED, PROBE, PROBE_ACK
 * - Channel messages carried inside SEALED frames: confirm, header,
 *   headerAck, chunk, cancel, retransmit, complete, error, and the
 *   shared-folder requests listDir, dirListing, download
 *
 * Every TCP frame is [u32 BE length][u8 kind][body]; the length covers
 * the kind byte and the body.
 */

#pragma once

#include "lanshare/errors.hpp"
#include "lanshare/security_config.hpp"
#include "lanshare/stream.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lanshare {

// ============================================================================
// Frames
// ============================================================================

/**
 * @brief Frame kinds on the TCP transfer port
 */
enum class FrameKind : uint8_t {
    Hello = 0x01,     ///< Plaintext handshake JSON
    Sealed = 0x02,    ///< [u64 BE sequence][AEAD ciphertext]
    Probe = 0x03,     ///< Health probe, empty body
    ProbeAck = 0x04   ///< Probe answer JSON
};

struct Frame {
    FrameKind kind;
    std::vector<uint8_t> body;
};

// ============================================================================
// Plaintext Messages
// ============================================================================

/**
 * @brief Presence record broadcast by the discovery service
 */
struct PresenceRecord {
    std::string device_id;      ///< Announcing device
    std::string display_name;   ///< Human-readable name
    uint16_t port = 0;          ///< TCP transfer port

    std::string to_json() const;

    /**
     * @brief Parse and validate a presence datagram
     * @return Record or std::nullopt if malformed
     */
    static std::optional<PresenceRecord> from_json(const std::string& json);
};

/**
 * @brief Key-agreement message sent in clear by both sides
 */
struct HelloMessage {
    std::string algorithm;                                           ///< Channel algorithm id
    std::array<uint8_t, security::X25519_PUBKEY_SIZE> ephemeral_key{}; ///< Per-connection X25519 key
    std::array<uint8_t, security::ED25519_PUBKEY_SIZE> identity_key{}; ///< Long-term Ed25519 key
    std::string device_id;
    std::string display_name;

    std::vector<uint8_t> to_bytes() const;

    /**
     * @throws ProtocolViolation if malformed
     */
    static HelloMessage from_bytes(const std::vector<uint8_t>& body);
};

/**
 * @brief Answer to a health probe
 */
struct ProbeAckMessage {
    std::string device_id;
    std::string display_name;

    std::vector<uint8_t> to_bytes() const;
    static std::optional<ProbeAckMessage> from_bytes(const std::vector<uint8_t>& body);
};

// ============================================================================
// Channel Messages (sealed)
// ============================================================================

/// Channel confirmation: signature over role || transcript hash
struct ConfirmMessage {
    std::vector<uint8_t> signature;
};

/// Transfer offer
struct HeaderMessage {
    std::string file_name;
    uint64_t file_size = 0;
    uint32_t chunk_size = 0;
    std::string digest_algorithm;
    std::optional<std::string> digest;   ///< Hex digest when pre-computed
};

/// Offer answer
struct HeaderAckMessage {
    bool accept = false;
    std::optional<std::string> reason;
};

/// One slice of file content
struct ChunkMessage {
    uint32_t index = 0;
    std::vector<uint8_t> payload;
    std::array<uint8_t, security::CHUNK_CHECKSUM_SIZE> checksum{};
};

struct CancelMessage {};

struct RetransmitMessage {
    uint32_t index = 0;
};

/// End of data (sender) or successful verification (receiver)
struct CompleteMessage {
    std::optional<std::string> digest;
};

struct ErrorMessage {
    std::string reason;
};

/// One entry of a shared directory
struct DirEntry {
    std::string name;
    bool is_dir = false;
    uint64_t size = 0;          ///< 0 for directories
};

/// Request for a listing; path is relative to the peer's shared root
struct ListDirMessage {
    std::string path;
};

/// Listing answer, sorted by name
struct DirListingMessage {
    std::string path;
    std::vector<DirEntry> entries;
    bool truncated = false;     ///< Entries were cut to fit one message
};

/// Request for the peer to send a shared file on this channel
struct DownloadMessage {
    std::string path;
};

using ChannelMessage = std::variant<
    ConfirmMessage,
    HeaderMessage,
    HeaderAckMessage,
    ChunkMessage,
    CancelMessage,
    RetransmitMessage,
    CompleteMessage,
    ErrorMessage,
    ListDirMessage,
    DirListingMessage,
    DownloadMessage
>;

namespace codec {

/// Sealed payload tags
constexpr uint8_t TAG_CONTROL = 0x01;
constexpr uint8_t TAG_CHUNK = 0x02;

// Reason codes carried in error messages
constexpr const char* ERROR_INTEGRITY = "integrity";
constexpr const char* ERROR_RESOURCE = "resource";
constexpr const char* ERROR_PROTOCOL = "protocol-violation";
constexpr const char* ERROR_NOT_FOUND = "not-found";
constexpr const char* ERROR_FORBIDDEN = "forbidden";

/// Longest relative path accepted in listDir and download requests
constexpr size_t MAX_REMOTE_PATH_LENGTH = 4096;

// ============================================================================
// Integer Helpers (big-endian)
// ============================================================================

void put_u32(std::vector<uint8_t>& out, uint32_t value);
void put_u64(std::vector<uint8_t>& out, uint64_t value);
uint32_t get_u32(const uint8_t* data);
uint64_t get_u64(const uint8_t* data);

// ============================================================================
// Framing
// ============================================================================

/**
 * @brief Build a length-prefixed frame
 * @throws ProtocolViolation if the frame would exceed MAX_FRAME_SIZE
 */
std::vector<uint8_t> encode_frame(FrameKind kind, const std::vector<uint8_t>& body);

/**
 * @brief Write one frame
 * @throws NetworkError, ProtocolViolation
 */
void write_frame(
    ByteStream& stream,
    FrameKind kind,
    const std::vector<uint8_t>& body,
    std::chrono::milliseconds timeout
);

/**
 * @brief Read one frame
 * @throws NetworkError on I/O failure
 * @throws ProtocolViolation on bad length or unknown kind
 */
Frame read_frame(ByteStream& stream, std::chrono::milliseconds timeout);

// ============================================================================
// Channel Messages
// ============================================================================

/**
 * @brief Encode a channel message to its sealed payload form
 */
std::vector<uint8_t> encode_message(const ChannelMessage& message);

/**
 * @brief Decode and validate a sealed payload
 * @throws ProtocolViolation on unknown tag or type, or bad fields
 */
ChannelMessage decode_message(const std::vector<uint8_t>& payload);

/**
 * @brief Unkeyed BLAKE2b-128 checksum of a chunk payload
 */
std::array<uint8_t, security::CHUNK_CHECKSUM_SIZE> chunk_checksum(const uint8_t* data, size_t size);

/**
 * @brief Build a chunk message with its checksum filled in
 */
ChunkMessage make_chunk(uint32_t index, std::vector<uint8_t> payload);

/**
 * @brief Check a chunk's checksum against its payload
 */
bool verify_chunk(const ChunkMessage& chunk);

/**
 * @brief Wire "type" name of a channel message, for logging
 */
std::string message_type_name(const ChannelMessage& message);

/**
 * @brief Failure class for a reason code received in an error message
 *
 * Unknown codes map to ProtocolViolation.
 */
ErrorKind error_kind_from_reason(const std::string& reason);

} // namespace codec
} // namespace lanshare
