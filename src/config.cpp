/**
 * @file config.cpp
 * @brief Implementation of node configuration loading and saving
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/config.hpp"
#include "lanshare/utilities.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lanshare {

namespace {
    // Copy a key into a field when present with a compatible type
    template <typename T>
    void read_key(const json& j, const char* key, T& field) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return;
        }
        try {
            field = it->get<T>();
        } catch (const json::exception& e) {
            utilities::log_warn("Config: Ignoring invalid value for '" + std::string(key) + "': " + e.what());
        }
    }

    void read_path(const json& j, const char* key, std::filesystem::path& field) {
        std::string value;
        read_key(j, key, value);
        if (!value.empty()) {
            field = value;
        }
    }
}

// ============================================================================
// NodeConfig
// ============================================================================

bool NodeConfig::validate(std::string* error) const {
    auto fail = [error](const std::string& message) {
        if (error) {
            *error = message;
        }
        return false;
    };

    if (discovery_enabled && discovery_port == 0) {
        return fail("discovery_port must be non-zero");
    }
    if (chunk_size < security::MIN_CHUNK_SIZE || chunk_size > security::MAX_CHUNK_SIZE) {
        return fail("chunk_size must be between " + std::to_string(security::MIN_CHUNK_SIZE) +
                    " and " + std::to_string(security::MAX_CHUNK_SIZE));
    }
    if (announce_interval_seconds == 0 || health_check_interval_seconds == 0) {
        return fail("intervals must be non-zero");
    }
    if (max_consecutive_misses == 0) {
        return fail("max_consecutive_misses must be non-zero");
    }
    if (max_concurrent_probes == 0 || max_concurrent_per_peer == 0 || max_concurrent_handshakes == 0) {
        return fail("concurrency limits must be non-zero");
    }
    if (negotiation_timeout_seconds == 0 || verification_timeout_seconds == 0 || io_timeout_seconds == 0) {
        return fail("timeouts must be non-zero");
    }
    if (!device_name.empty() && !security::validate_display_name(device_name)) {
        return fail("device_name contains invalid characters");
    }
    if (!utilities::parse_log_level(log_level)) {
        return fail("unknown log_level '" + log_level + "'");
    }
    return true;
}

std::string NodeConfig::to_json() const {
    json j;
    j["device_name"] = device_name;
    j["data_dir"] = data_dir.string();
    j["downloads_dir"] = downloads_dir.string();
    j["shared_dir"] = shared_dir.string();
    j["port"] = port;
    j["discovery_port"] = discovery_port;
    j["announce_address"] = announce_address;
    j["discovery_enabled"] = discovery_enabled;
    j["auto_accept"] = auto_accept;
    j["announce_interval_seconds"] = announce_interval_seconds;
    j["health_check_interval_seconds"] = health_check_interval_seconds;
    j["max_consecutive_misses"] = max_consecutive_misses;
    j["stale_retention_seconds"] = stale_retention_seconds;
    j["max_concurrent_probes"] = max_concurrent_probes;
    j["max_concurrent_per_peer"] = max_concurrent_per_peer;
    j["max_concurrent_handshakes"] = max_concurrent_handshakes;
    j["chunk_size"] = chunk_size;
    j["negotiation_timeout_seconds"] = negotiation_timeout_seconds;
    j["verification_timeout_seconds"] = verification_timeout_seconds;
    j["io_timeout_seconds"] = io_timeout_seconds;
    j["probe_timeout_ms"] = probe_timeout_ms;
    j["log_level"] = log_level;
    j["log_file"] = log_file;
    return j.dump(2);
}

// ============================================================================
// Loading and Saving
// ============================================================================

NodeConfig default_config(const std::filesystem::path& data_dir) {
    NodeConfig config;
    config.data_dir = data_dir;
    config.downloads_dir = data_dir / "received";
    config.log_file = (data_dir / "logs" / "lanshare.log").string();
    return config;
}

NodeConfig load_config(const std::filesystem::path& config_path, const std::filesystem::path& data_dir) {
    NodeConfig config = default_config(data_dir);

    auto content = utilities::read_file(config_path.string());
    if (!content) {
        utilities::log_info("Config: No configuration at " + config_path.string() + ", using defaults");
        return config;
    }

    json j = json::parse(*content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        utilities::log_error("Config: Malformed configuration " + config_path.string() + ", using defaults");
        return config;
    }

    read_key(j, "device_name", config.device_name);
    read_path(j, "data_dir", config.data_dir);
    read_path(j, "downloads_dir", config.downloads_dir);
    read_path(j, "shared_dir", config.shared_dir);
    read_key(j, "port", config.port);
    read_key(j, "discovery_port", config.discovery_port);
    read_key(j, "announce_address", config.announce_address);
    read_key(j, "discovery_enabled", config.discovery_enabled);
    read_key(j, "auto_accept", config.auto_accept);
    read_key(j, "announce_interval_seconds", config.announce_interval_seconds);
    read_key(j, "health_check_interval_seconds", config.health_check_interval_seconds);
    read_key(j, "max_consecutive_misses", config.max_consecutive_misses);
    read_key(j, "stale_retention_seconds", config.stale_retention_seconds);
    read_key(j, "max_concurrent_probes", config.max_concurrent_probes);
    read_key(j, "max_concurrent_per_peer", config.max_concurrent_per_peer);
    read_key(j, "max_concurrent_handshakes", config.max_concurrent_handshakes);
    read_key(j, "chunk_size", config.chunk_size);
    read_key(j, "negotiation_timeout_seconds", config.negotiation_timeout_seconds);
    read_key(j, "verification_timeout_seconds", config.verification_timeout_seconds);
    read_key(j, "io_timeout_seconds", config.io_timeout_seconds);
    read_key(j, "probe_timeout_ms", config.probe_timeout_ms);
    read_key(j, "log_level", config.log_level);
    read_key(j, "log_file", config.log_file);

    utilities::log_info("Config: Loaded " + config_path.string());
    return config;
}

bool save_config(const NodeConfig& config, const std::filesystem::path& config_path) {
    if (!utilities::write_file(config_path.string(), config.to_json() + "\n")) {
        utilities::log_error("Config: Failed to save " + config_path.string());
        return false;
    }
    return true;
}

} // namespace lanshare
