/**
 * @file utilities.hpp
 * @brief Common utility functions for LanShare
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout LanShare:
 * - Logging and error reporting
 * - Time and size formatting
 * - File I/O and SHA-256 content digests
 * - Host and network helpers
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <optional>

namespace lanshare {
namespace utilities {

/**
 * @brief Log levels for LanShare logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return Parsed level, or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Format a wall-clock time point as ISO 8601 string
 * @return Formatted string (e.g., "2025-11-10T15:30:45Z")
 */
std::string format_time_point(std::chrono::system_clock::time_point time);

/**
 * @brief Convert a wall-clock time point to Unix seconds
 */
uint64_t to_unix_seconds(std::chrono::system_clock::time_point time);

/**
 * @brief Convert Unix seconds to a wall-clock time point
 */
std::chrono::system_clock::time_point from_unix_seconds(uint64_t seconds);

/**
 * @brief Format file size in human-readable format
 * @param size Size in bytes
 * @return Formatted string (e.g., "1.5 MB", "3.2 GB")
 */
std::string format_file_size(uint64_t size);

/**
 * @brief Format duration in human-readable format
 * @param seconds Duration in seconds
 * @return Formatted string (e.g., "2h 15m 30s")
 */
std::string format_duration(uint64_t seconds);

/**
 * @brief Read entire file into string
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Write string to file, creating parent directories
 * @param file_path Path to file
 * @param content Content to write
 * @return true if successful, false otherwise
 */
bool write_file(const std::string& file_path, const std::string& content);

/**
 * @brief Incremental SHA-256 digest (OpenSSL EVP)
 *
 * Used for full-file content digests, which are computed while chunks
 * are written so the receiver never re-reads the file.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    /**
     * @brief Feed bytes into the digest
     * @return false if the digest context failed
     */
    bool update(const uint8_t* data, size_t size);

    /**
     * @brief Finish the digest
     * @return Lowercase hex digest, or std::nullopt on failure
     */
    std::optional<std::string> finalize_hex();

private:
    struct Context;
    std::unique_ptr<Context> context_;
    bool finalized_;
};

/**
 * @brief Calculate SHA-256 hash of file, streaming in fixed blocks
 * @param file_path Path to file
 * @return SHA-256 hash as lowercase hex string, or std::nullopt if error
 */
std::optional<std::string> calculate_file_hash(const std::string& file_path);

/**
 * @brief Calculate SHA-256 hash of a string
 * @return Lowercase hex digest
 */
std::string sha256_hex(const std::string& data);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Convert string to uppercase
 */
std::string to_uppercase(const std::string& str);

/**
 * @brief Get hostname of current machine
 * @return Hostname or "unknown" if unable to determine
 */
std::string get_hostname();

/**
 * @brief Get non-loopback IPv4 addresses of current machine
 * @return Vector of IP address strings
 */
std::vector<std::string> get_local_ip_addresses();

/**
 * @brief Generate UUID v4 string
 * @return UUID string (e.g., "550e8400-e29b-41d4-a716-446655440000")
 */
std::string generate_uuid();

} // namespace utilities
} // namespace lanshare
