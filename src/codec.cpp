/**
 * @file codec.cpp
 * @brief Implementation of LanShare message serialization
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/codec.hpp"
#include "lanshare/device_crypto.hpp"
#include "lanshare/errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <limits>

using json = nlohmann::json;

namespace lanshare {

namespace {

// ============================================================================
// JSON Field Helpers
// ============================================================================

const json& require_field(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end()) {
        throw ProtocolViolation(std::string("Codec: missing field '") + name + "'");
    }
    return *it;
}

std::string require_string(const json& j, const char* name) {
    const json& value = require_field(j, name);
    if (!value.is_string()) {
        throw ProtocolViolation(std::string("Codec: field '") + name + "' must be a string");
    }
    return value.get<std::string>();
}

uint64_t require_unsigned(const json& j, const char* name, uint64_t max_value) {
    const json& value = require_field(j, name);
    if (!value.is_number_unsigned()) {
        throw ProtocolViolation(std::string("Codec: field '") + name + "' must be a non-negative integer");
    }
    uint64_t result = value.get<uint64_t>();
    if (result > max_value) {
        throw ProtocolViolation(std::string("Codec: field '") + name + "' out of range");
    }
    return result;
}

/// Absent and null both mean "no value"
std::optional<std::string> optional_string(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ProtocolViolation(std::string("Codec: field '") + name + "' must be a string or null");
    }
    return it->get<std::string>();
}

json parse_object(const uint8_t* data, size_t size) {
    if (size > security::MAX_JSON_SIZE) {
        throw ProtocolViolation("Codec: JSON message too large");
    }
    json j = json::parse(data, data + size, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ProtocolViolation("Codec: malformed JSON message");
    }
    return j;
}

template <size_t N>
std::array<uint8_t, N> decode_key(const json& j, const char* name) {
    auto bytes = DeviceCrypto::base64_to_bytes(require_string(j, name));
    if (!bytes || bytes->size() != N) {
        throw ProtocolViolation(std::string("Codec: field '") + name + "' is not a valid key");
    }
    std::array<uint8_t, N> key;
    std::copy(bytes->begin(), bytes->end(), key.begin());
    return key;
}

template <size_t N>
std::string encode_key(const std::array<uint8_t, N>& key) {
    return DeviceCrypto::bytes_to_base64(std::vector<uint8_t>(key.begin(), key.end()));
}

std::vector<uint8_t> control_payload(const json& j) {
    // File names from disk are not guaranteed to be valid UTF-8
    std::string text = j.dump(-1, ' ', false, json::error_handler_t::replace);
    std::vector<uint8_t> out;
    out.reserve(text.size() + 1);
    out.push_back(codec::TAG_CONTROL);
    out.insert(out.end(), text.begin(), text.end());
    return out;
}

json digest_value(const std::optional<std::string>& digest) {
    return digest ? json(*digest) : json(nullptr);
}

/// Serializes each alternative of ChannelMessage
struct MessageEncoder {
    std::vector<uint8_t> operator()(const ConfirmMessage& m) const {
        return control_payload({
            {"type", "confirm"},
            {"signature", DeviceCrypto::bytes_to_base64(m.signature)}
        });
    }

    std::vector<uint8_t> operator()(const HeaderMessage& m) const {
        return control_payload({
            {"type", "header"},
            {"fileName", m.file_name},
            {"fileSize", m.file_size},
            {"chunkSize", m.chunk_size},
            {"digestAlgorithm", m.digest_algorithm},
            {"digest", digest_value(m.digest)}
        });
    }

    std::vector<uint8_t> operator()(const HeaderAckMessage& m) const {
        return control_payload({
            {"type", "headerAck"},
            {"accept", m.accept},
            {"reason", digest_value(m.reason)}
        });
    }

    std::vector<uint8_t> operator()(const ChunkMessage& m) const {
        std::vector<uint8_t> out;
        out.reserve(1 + 8 + m.payload.size() + m.checksum.size());
        out.push_back(codec::TAG_CHUNK);
        codec::put_u32(out, m.index);
        codec::put_u32(out, static_cast<uint32_t>(m.payload.size()));
        out.insert(out.end(), m.payload.begin(), m.payload.end());
        out.insert(out.end(), m.checksum.begin(), m.checksum.end());
        return out;
    }

    std::vector<uint8_t> operator()(const CancelMessage&) const {
        return control_payload({{"type", "cancel"}});
    }

    std::vector<uint8_t> operator()(const RetransmitMessage& m) const {
        return control_payload({{"type", "retransmit"}, {"index", m.index}});
    }

    std::vector<uint8_t> operator()(const CompleteMessage& m) const {
        json j = {{"type", "complete"}};
        if (m.digest) {
            j["digest"] = *m.digest;
        }
        return control_payload(j);
    }

    std::vector<uint8_t> operator()(const ErrorMessage& m) const {
        return control_payload({{"type", "error"}, {"reason", m.reason}});
    }

    std::vector<uint8_t> operator()(const ListDirMessage& m) const {
        return control_payload({{"type", "listDir"}, {"path", m.path}});
    }

    std::vector<uint8_t> operator()(const DirListingMessage& m) const {
        json entries = json::array();
        for (const DirEntry& entry : m.entries) {
            entries.push_back({{"name", entry.name}, {"isDir", entry.is_dir}, {"size", entry.size}});
        }
        return control_payload({
            {"type", "dirListing"},
            {"path", m.path},
            {"entries", entries},
            {"truncated", m.truncated}
        });
    }

    std::vector<uint8_t> operator()(const DownloadMessage& m) const {
        return control_payload({{"type", "download"}, {"path", m.path}});
    }
};

std::string require_remote_path(const json& j) {
    std::string path = require_string(j, "path");
    if (path.size() > codec::MAX_REMOTE_PATH_LENGTH || path.find('\0') != std::string::npos) {
        throw ProtocolViolation("Codec: invalid remote path");
    }
    return path;
}

bool require_bool(const json& j, const char* name) {
    const json& value = require_field(j, name);
    if (!value.is_boolean()) {
        throw ProtocolViolation(std::string("Codec: field '") + name + "' must be a boolean");
    }
    return value.get<bool>();
}

DirListingMessage decode_listing(const json& j) {
    DirListingMessage m;
    m.path = require_remote_path(j);

    const json& entries = require_field(j, "entries");
    if (!entries.is_array()) {
        throw ProtocolViolation("Codec: field 'entries' must be an array");
    }
    for (const json& item : entries) {
        if (!item.is_object()) {
            throw ProtocolViolation("Codec: malformed directory entry");
        }
        DirEntry entry;
        entry.name = require_string(item, "name");
        if (entry.name.empty() || entry.name.find_first_of("/\\") != std::string::npos ||
            entry.name == "." || entry.name == "..") {
            throw ProtocolViolation("Codec: invalid directory entry name");
        }
        entry.is_dir = require_bool(item, "isDir");
        entry.size = require_unsigned(item, "size", std::numeric_limits<uint64_t>::max());
        m.entries.push_back(std::move(entry));
    }

    auto truncated = j.find("truncated");
    if (truncated != j.end() && !truncated->is_null()) {
        m.truncated = require_bool(j, "truncated");
    }
    return m;
}

ChannelMessage decode_control(const uint8_t* data, size_t size) {
    json j = parse_object(data, size);
    std::string type = require_string(j, "type");

    if (type == "header") {
        HeaderMessage m;
        m.file_name = require_string(j, "fileName");
        m.file_size = require_unsigned(j, "fileSize", std::numeric_limits<uint64_t>::max());
        m.chunk_size = static_cast<uint32_t>(
            require_unsigned(j, "chunkSize", std::numeric_limits<uint32_t>::max()));
        m.digest_algorithm = require_string(j, "digestAlgorithm");
        m.digest = optional_string(j, "digest");
        return m;
    }

    if (type == "headerAck") {
        HeaderAckMessage m;
        m.accept = require_bool(j, "accept");
        m.reason = optional_string(j, "reason");
        return m;
    }

    if (type == "cancel") {
        return CancelMessage{};
    }

    if (type == "retransmit") {
        RetransmitMessage m;
        m.index = static_cast<uint32_t>(
            require_unsigned(j, "index", std::numeric_limits<uint32_t>::max()));
        return m;
    }

    if (type == "complete") {
        CompleteMessage m;
        m.digest = optional_string(j, "digest");
        return m;
    }

    if (type == "error") {
        ErrorMessage m;
        m.reason = require_string(j, "reason");
        return m;
    }

    if (type == "listDir") {
        return ListDirMessage{require_remote_path(j)};
    }

    if (type == "dirListing") {
        return decode_listing(j);
    }

    if (type == "download") {
        return DownloadMessage{require_remote_path(j)};
    }

    if (type == "confirm") {
        auto signature = DeviceCrypto::base64_to_bytes(require_string(j, "signature"));
        if (!signature || signature->size() != security::ED25519_SIGNATURE_SIZE) {
            throw ProtocolViolation("Codec: malformed confirmation signature");
        }
        ConfirmMessage m;
        m.signature = std::move(*signature);
        return m;
    }

    throw ProtocolViolation("Codec: unknown message type '" + type + "'");
}

ChannelMessage decode_chunk(const uint8_t* data, size_t size) {
    constexpr size_t fixed = 8 + security::CHUNK_CHECKSUM_SIZE;
    if (size < fixed) {
        throw ProtocolViolation("Codec: truncated chunk");
    }

    ChunkMessage m;
    m.index = codec::get_u32(data);
    uint32_t length = codec::get_u32(data + 4);
    if (static_cast<size_t>(length) != size - fixed) {
        throw ProtocolViolation("Codec: chunk length " + std::to_string(length) +
                                " disagrees with payload size " + std::to_string(size - fixed));
    }

    m.payload.assign(data + 8, data + 8 + length);
    std::copy(data + 8 + length, data + size, m.checksum.begin());
    return m;
}

} // namespace

// ============================================================================
// PresenceRecord
// ============================================================================

std::string PresenceRecord::to_json() const {
    json j;
    j["id"] = device_id;
    j["displayName"] = display_name;
    j["port"] = port;
    return j.dump();
}

std::optional<PresenceRecord> PresenceRecord::from_json(const std::string& json_str) {
    json j = json::parse(json_str, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    try {
        PresenceRecord record;
        record.device_id = j.at("id").get<std::string>();
        record.display_name = j.at("displayName").get<std::string>();

        const json& port = j.at("port");
        if (!port.is_number_unsigned()) {
            return std::nullopt;
        }
        uint64_t port_value = port.get<uint64_t>();
        if (port_value == 0 || port_value > std::numeric_limits<uint16_t>::max()) {
            return std::nullopt;
        }
        record.port = static_cast<uint16_t>(port_value);

        if (!security::validate_identifier(record.device_id) ||
            !security::validate_display_name(record.display_name)) {
            return std::nullopt;
        }
        return record;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// HelloMessage
// ============================================================================

std::vector<uint8_t> HelloMessage::to_bytes() const {
    json j;
    j["type"] = "hello";
    j["algorithm"] = algorithm;
    j["ephemeralKey"] = encode_key(ephemeral_key);
    j["identityKey"] = encode_key(identity_key);
    j["id"] = device_id;
    j["displayName"] = display_name;

    std::string text = j.dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

HelloMessage HelloMessage::from_bytes(const std::vector<uint8_t>& body) {
    json j = parse_object(body.data(), body.size());

    if (require_string(j, "type") != "hello") {
        throw ProtocolViolation("Codec: expected hello message");
    }

    HelloMessage hello;
    hello.algorithm = require_string(j, "algorithm");
    hello.ephemeral_key = decode_key<security::X25519_PUBKEY_SIZE>(j, "ephemeralKey");
    hello.identity_key = decode_key<security::ED25519_PUBKEY_SIZE>(j, "identityKey");
    hello.device_id = require_string(j, "id");
    hello.display_name = require_string(j, "displayName");

    if (!security::validate_identifier(hello.device_id)) {
        throw ProtocolViolation("Codec: invalid device id in hello");
    }
    if (!security::validate_display_name(hello.display_name)) {
        throw ProtocolViolation("Codec: invalid display name in hello");
    }
    return hello;
}

// ============================================================================
// ProbeAckMessage
// ============================================================================

std::vector<uint8_t> ProbeAckMessage::to_bytes() const {
    json j;
    j["id"] = device_id;
    j["displayName"] = display_name;

    std::string text = j.dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::optional<ProbeAckMessage> ProbeAckMessage::from_bytes(const std::vector<uint8_t>& body) {
    try {
        json j = parse_object(body.data(), body.size());

        ProbeAckMessage ack;
        ack.device_id = require_string(j, "id");
        ack.display_name = require_string(j, "displayName");

        if (!security::validate_identifier(ack.device_id) ||
            !security::validate_display_name(ack.display_name)) {
            return std::nullopt;
        }
        return ack;

    } catch (const ProtocolViolation&) {
        return std::nullopt;
    }
}

namespace codec {

// ============================================================================
// Integer Helpers
// ============================================================================

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void put_u64(std::vector<uint8_t>& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

uint32_t get_u32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

uint64_t get_u64(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

// ============================================================================
// Framing
// ============================================================================

std::vector<uint8_t> encode_frame(FrameKind kind, const std::vector<uint8_t>& body) {
    size_t length = body.size() + 1;
    if (length > security::MAX_FRAME_SIZE) {
        throw ProtocolViolation("Codec: frame too large (" + std::to_string(length) + " bytes)");
    }

    std::vector<uint8_t> frame;
    frame.reserve(4 + length);
    put_u32(frame, static_cast<uint32_t>(length));
    frame.push_back(static_cast<uint8_t>(kind));
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

void write_frame(
    ByteStream& stream,
    FrameKind kind,
    const std::vector<uint8_t>& body,
    std::chrono::milliseconds timeout
) {
    auto frame = encode_frame(kind, body);
    stream.write_all(frame.data(), frame.size(), timeout);
}

Frame read_frame(ByteStream& stream, std::chrono::milliseconds timeout) {
    uint8_t prefix[5];
    stream.read_exact(prefix, sizeof(prefix), timeout);

    uint32_t length = get_u32(prefix);
    if (length == 0 || length > security::MAX_FRAME_SIZE) {
        throw ProtocolViolation("Codec: invalid frame length " + std::to_string(length));
    }

    uint8_t kind = prefix[4];
    if (kind < static_cast<uint8_t>(FrameKind::Hello) || kind > static_cast<uint8_t>(FrameKind::ProbeAck)) {
        throw ProtocolViolation("Codec: unknown frame kind " + std::to_string(kind));
    }

    Frame frame;
    frame.kind = static_cast<FrameKind>(kind);
    frame.body.resize(length - 1);
    if (!frame.body.empty()) {
        stream.read_exact(frame.body.data(), frame.body.size(), timeout);
    }
    return frame;
}

// ============================================================================
// Channel Messages
// ============================================================================

std::vector<uint8_t> encode_message(const ChannelMessage& message) {
    return std::visit(MessageEncoder{}, message);
}

ChannelMessage decode_message(const std::vector<uint8_t>& payload) {
    if (payload.empty()) {
        throw ProtocolViolation("Codec: empty channel message");
    }

    const uint8_t* body = payload.data() + 1;
    size_t body_size = payload.size() - 1;

    switch (payload[0]) {
        case TAG_CONTROL:
            return decode_control(body, body_size);
        case TAG_CHUNK:
            return decode_chunk(body, body_size);
        default:
            throw ProtocolViolation("Codec: unknown message tag " + std::to_string(payload[0]));
    }
}

std::array<uint8_t, security::CHUNK_CHECKSUM_SIZE> chunk_checksum(const uint8_t* data, size_t size) {
    auto hash = DeviceCrypto::generic_hash(data, size, security::CHUNK_CHECKSUM_SIZE);
    std::array<uint8_t, security::CHUNK_CHECKSUM_SIZE> checksum;
    std::copy(hash.begin(), hash.end(), checksum.begin());
    return checksum;
}

ChunkMessage make_chunk(uint32_t index, std::vector<uint8_t> payload) {
    ChunkMessage chunk;
    chunk.index = index;
    chunk.payload = std::move(payload);
    chunk.checksum = chunk_checksum(chunk.payload.data(), chunk.payload.size());
    return chunk;
}

bool verify_chunk(const ChunkMessage& chunk) {
    auto expected = chunk_checksum(chunk.payload.data(), chunk.payload.size());
    return DeviceCrypto::constant_time_compare(
        std::vector<uint8_t>(expected.begin(), expected.end()),
        std::vector<uint8_t>(chunk.checksum.begin(), chunk.checksum.end())
    );
}

std::string message_type_name(const ChannelMessage& message) {
    static const char* names[] = {
        "confirm", "header", "headerAck", "chunk", "cancel", "retransmit", "complete", "error",
        "listDir", "dirListing", "download"
    };
    return names[message.index()];
}

ErrorKind error_kind_from_reason(const std::string& reason) {
    if (reason == ERROR_INTEGRITY) {
        return ErrorKind::Integrity;
    }
    if (reason == ERROR_RESOURCE || reason == ERROR_NOT_FOUND) {
        return ErrorKind::Resource;
    }
    if (reason == ERROR_FORBIDDEN) {
        return ErrorKind::Rejected;
    }
    return ErrorKind::ProtocolViolation;
}

} // namespace codec
} // namespace lanshare
