/**
 * @file trust_store.cpp
 * @brief Implementation of the SQLite trust store
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/trust_store.hpp"
#include "lanshare/utilities.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <stdexcept>

namespace lanshare {

namespace {

std::string column_text(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<IdentityKey> column_key(sqlite3_stmt* stmt, int column) {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    const void* blob = sqlite3_column_blob(stmt, column);
    int size = sqlite3_column_bytes(stmt, column);
    if (!blob || size != static_cast<int>(security::ED25519_PUBKEY_SIZE)) {
        return std::nullopt;
    }
    IdentityKey key;
    const uint8_t* bytes = static_cast<const uint8_t*>(blob);
    std::copy(bytes, bytes + size, key.begin());
    return key;
}

TrustedDevice read_row(sqlite3_stmt* stmt) {
    TrustedDevice device;
    device.device_id = column_text(stmt, 0);
    device.display_name = column_text(stmt, 1);
    device.address = column_text(stmt, 2);
    device.port = static_cast<uint16_t>(sqlite3_column_int(stmt, 3));
    device.identity_key = column_key(stmt, 4);
    device.trusted = sqlite3_column_int(stmt, 5) != 0;
    device.paired_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
    device.last_seen = static_cast<uint64_t>(sqlite3_column_int64(stmt, 7));
    return device;
}

constexpr const char* SELECT_COLUMNS =
    "SELECT device_id, display_name, address, port, identity_key, trusted, paired_at, last_seen "
    "FROM devices";

uint64_t now_seconds() {
    return utilities::to_unix_seconds(std::chrono::system_clock::now());
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

TrustStore::TrustStore(const std::string& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw std::runtime_error("Failed to open trust store database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);

    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw std::runtime_error("Failed to initialize trust store schema");
    }
}

TrustStore::~TrustStore() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool TrustStore::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    const char* create_devices_table = R"(
        CREATE TABLE IF NOT EXISTS devices (
            device_id TEXT PRIMARY KEY,
            display_name TEXT NOT NULL DEFAULT '',
            address TEXT NOT NULL DEFAULT '',
            port INTEGER NOT NULL DEFAULT 0,
            identity_key BLOB,
            trusted INTEGER NOT NULL DEFAULT 0,
            paired_at INTEGER NOT NULL DEFAULT 0,
            last_seen INTEGER NOT NULL DEFAULT 0
        );

        CREATE INDEX IF NOT EXISTS idx_devices_trusted ON devices(trusted);
    )";

    int rc = sqlite3_exec(db, create_devices_table, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            utilities::log_error("TrustStore: Failed to create devices table: " + std::string(error_msg));
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Device Records
// ============================================================================

bool TrustStore::save_device(const TrustedDevice& device) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    if (!security::validate_identifier(device.device_id)) {
        utilities::log_error("TrustStore: Invalid device ID");
        return false;
    }

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT INTO devices (device_id, display_name, address, port, identity_key, trusted, paired_at, last_seen)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(device_id) DO UPDATE SET
            display_name = excluded.display_name,
            address = excluded.address,
            port = excluded.port,
            identity_key = COALESCE(devices.identity_key, excluded.identity_key),
            trusted = excluded.trusted,
            paired_at = CASE WHEN devices.paired_at = 0 THEN excluded.paired_at ELSE devices.paired_at END,
            last_seen = MAX(devices.last_seen, excluded.last_seen)
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        utilities::log_error("TrustStore: Failed to prepare save: " + std::string(sqlite3_errmsg(db)));
        return false;
    }

    sqlite3_bind_text(stmt, 1, device.device_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, device.display_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, device.address.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, device.port);
    if (device.identity_key) {
        sqlite3_bind_blob(stmt, 5, device.identity_key->data(),
                          static_cast<int>(device.identity_key->size()), SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 5);
    }
    sqlite3_bind_int(stmt, 6, device.trusted ? 1 : 0);
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(device.paired_at));
    sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(device.last_seen));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        utilities::log_error("TrustStore: Failed to save device " + device.device_id);
        return false;
    }
    return true;
}

std::optional<TrustedDevice> TrustStore::get_device(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return load_device_locked(device_id);
}

std::vector<TrustedDevice> TrustStore::list_trusted() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<TrustedDevice> devices;
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    std::string sql = std::string(SELECT_COLUMNS) + " WHERE trusted = 1 ORDER BY device_id";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        utilities::log_error("TrustStore: Failed to prepare list: " + std::string(sqlite3_errmsg(db)));
        return devices;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        devices.push_back(read_row(stmt));
    }

    sqlite3_finalize(stmt);
    return devices;
}

bool TrustStore::remove_device(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    const char* sql = "DELETE FROM devices WHERE device_id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, device_id.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE && sqlite3_changes(db) > 0;
}

// ============================================================================
// Identity Pinning
// ============================================================================

PinResult TrustStore::check_and_pin(
    const std::string& device_id,
    const IdentityKey& identity_key,
    const std::string& display_name
) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    auto existing = load_device_locked(device_id);
    if (existing && existing->identity_key) {
        if (*existing->identity_key == identity_key) {
            return PinResult::Matched;
        }
        utilities::log_warn("TrustStore: Identity key mismatch for " + device_id);
        return PinResult::Mismatch;
    }

    const char* sql = R"(
        INSERT INTO devices (device_id, display_name, identity_key, last_seen)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(device_id) DO UPDATE SET
            identity_key = excluded.identity_key,
            last_seen = MAX(devices.last_seen, excluded.last_seen)
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        utilities::log_error("TrustStore: Failed to prepare pin: " + std::string(sqlite3_errmsg(db)));
        return PinResult::Failed;
    }

    sqlite3_bind_text(stmt, 1, device_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, display_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 3, identity_key.data(), static_cast<int>(identity_key.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(now_seconds()));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        utilities::log_error("TrustStore: Failed to pin identity for " + device_id);
        return PinResult::Failed;
    }

    utilities::log_info("TrustStore: Pinned identity key for " + device_id);
    return PinResult::Pinned;
}

std::optional<IdentityKey> TrustStore::get_pinned_key(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    auto device = load_device_locked(device_id);
    if (!device) {
        return std::nullopt;
    }
    return device->identity_key;
}

// ============================================================================
// Private Methods
// ============================================================================

std::optional<TrustedDevice> TrustStore::load_device_locked(const std::string& device_id) {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    std::string sql = std::string(SELECT_COLUMNS) + " WHERE device_id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, device_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<TrustedDevice> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_row(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

} // namespace lanshare
