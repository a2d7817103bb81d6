/**
 * @file errors.hpp
 * @brief Error taxonomy for LanShare sessions and channels
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every failure that ends a transfer or a connection carries an ErrorKind,
 * so the status interface can tell a network blip from an integrity
 * failure or a possible impersonation.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace lanshare {

/**
 * @brief Classification of session and connection failures
 */
enum class ErrorKind {
    Network,            ///< Connection refused, reset or timed out
    ProtocolViolation,  ///< Malformed or out-of-sequence message
    Integrity,          ///< Chunk checksum or file digest mismatch
    Authentication,     ///< Handshake, sealing or identity pinning failure
    Resource,           ///< Disk full, permission denied, limits exceeded
    Rejected,           ///< Peer declined the transfer offer
    Cancelled           ///< Explicit cancellation by either side
};

/**
 * @brief Stable name for an ErrorKind
 */
inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Network:           return "NetworkError";
        case ErrorKind::ProtocolViolation: return "ProtocolViolation";
        case ErrorKind::Integrity:         return "IntegrityError";
        case ErrorKind::Authentication:    return "AuthenticationError";
        case ErrorKind::Resource:          return "ResourceError";
        case ErrorKind::Rejected:          return "Rejected";
        case ErrorKind::Cancelled:         return "Cancelled";
    }
    return "UnknownError";
}

/**
 * @brief Base exception for classified LanShare failures
 */
class LanshareError : public std::runtime_error {
public:
    LanshareError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {
    }

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class NetworkError : public LanshareError {
public:
    explicit NetworkError(const std::string& message)
        : LanshareError(ErrorKind::Network, message) {}
};

class ProtocolViolation : public LanshareError {
public:
    explicit ProtocolViolation(const std::string& message)
        : LanshareError(ErrorKind::ProtocolViolation, message) {}
};

class IntegrityError : public LanshareError {
public:
    explicit IntegrityError(const std::string& message)
        : LanshareError(ErrorKind::Integrity, message) {}
};

class AuthenticationError : public LanshareError {
public:
    explicit AuthenticationError(const std::string& message)
        : LanshareError(ErrorKind::Authentication, message) {}
};

class ResourceError : public LanshareError {
public:
    explicit ResourceError(const std::string& message)
        : LanshareError(ErrorKind::Resource, message) {}
};

class RejectedError : public LanshareError {
public:
    explicit RejectedError(const std::string& message)
        : LanshareError(ErrorKind::Rejected, message) {}
};

class CancelledError : public LanshareError {
public:
    explicit CancelledError(const std::string& message)
        : LanshareError(ErrorKind::Cancelled, message) {}
};

} // namespace lanshare
