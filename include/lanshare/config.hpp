/**
 * @file config.hpp
 * @brief Node configuration with JSON persistence
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * All tunables of a node live in NodeConfig. The daemon loads it from
 * config.json in the data directory; keys absent from the file keep
 * their defaults.
 */

#pragma once

#include "lanshare/security_config.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace lanshare {

/**
 * @brief Complete node configuration
 */
struct NodeConfig {
    std::string device_name;                        ///< Display name (hostname when empty)
    std::filesystem::path data_dir;                 ///< Identity, database and logs
    std::filesystem::path downloads_dir;            ///< Completed incoming files
    std::filesystem::path shared_dir;               ///< Browsable by trusted peers (empty = not shared)

    uint16_t port = security::DEFAULT_TRANSFER_PORT;            ///< TCP transfer port (0 = ephemeral)
    uint16_t discovery_port = security::DEFAULT_DISCOVERY_PORT; ///< UDP presence port
    std::string announce_address = "255.255.255.255";           ///< Presence destination
    bool discovery_enabled = true;                  ///< Run announce and listen loops

    bool auto_accept = true;                        ///< Accept offers without asking

    uint32_t announce_interval_seconds = 30;
    uint32_t health_check_interval_seconds = 10;
    uint32_t max_consecutive_misses = 3;
    uint64_t stale_retention_seconds = 24 * 60 * 60;
    uint32_t max_concurrent_probes = 8;
    uint32_t max_concurrent_per_peer = 2;
    uint32_t max_concurrent_handshakes = 8;         ///< Listener threads for inbound connections

    uint32_t chunk_size = security::DEFAULT_CHUNK_SIZE;
    uint32_t negotiation_timeout_seconds = 30;
    uint32_t verification_timeout_seconds = 60;
    uint32_t io_timeout_seconds = 30;
    uint32_t probe_timeout_ms = 2000;

    std::string log_level = "info";
    std::string log_file;                           ///< Empty for stdout only

    std::chrono::seconds announce_interval() const { return std::chrono::seconds(announce_interval_seconds); }
    std::chrono::seconds health_check_interval() const { return std::chrono::seconds(health_check_interval_seconds); }
    std::chrono::seconds stale_retention() const { return std::chrono::seconds(stale_retention_seconds); }
    std::chrono::milliseconds probe_timeout() const { return std::chrono::milliseconds(probe_timeout_ms); }

    /**
     * @brief Check value ranges
     * @param error Receives a description of the first invalid field
     * @return true if the configuration is usable
     */
    bool validate(std::string* error = nullptr) const;

    /**
     * @brief Serialize to a pretty-printed JSON document
     */
    std::string to_json() const;
};

/**
 * @brief Default configuration rooted at a data directory
 * @param data_dir Data directory (downloads and log file are placed under it)
 */
NodeConfig default_config(const std::filesystem::path& data_dir);

/**
 * @brief Load configuration from a JSON file
 *
 * A missing file yields the defaults. Malformed JSON is logged and also
 * yields the defaults; individual keys of the wrong type are ignored.
 *
 * @param config_path Path to config.json
 * @param data_dir Data directory used for defaults
 * @return Loaded configuration
 */
NodeConfig load_config(const std::filesystem::path& config_path, const std::filesystem::path& data_dir);

/**
 * @brief Write configuration as JSON
 * @return true if successful, false otherwise
 */
bool save_config(const NodeConfig& config, const std::filesystem::path& config_path);

} // namespace lanshare
