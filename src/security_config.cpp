/**
 * @file security_config.cpp
 * @brief Implementation of data directory and validation functions
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanshare/security_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace lanshare {
namespace security {

namespace {
    std::filesystem::path ensure_directory(const std::filesystem::path& dir) {
        if (!std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }
        return dir;
    }
}

// ============================================================================
// Data Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    const char* env_data_dir = std::getenv("LANSHARE_DATA_DIR");
    if (env_data_dir != nullptr && std::strlen(env_data_dir) > 0) {
        return ensure_directory(std::filesystem::path(env_data_dir));
    }

    const char* home = std::getenv("HOME");
    if (home != nullptr && std::strlen(home) > 0) {
        return ensure_directory(std::filesystem::path(home) / ".lanshare");
    }

    return ensure_directory(std::filesystem::temp_directory_path() / "lanshare");
}

std::filesystem::path get_received_directory(const std::filesystem::path& data_dir) {
    return ensure_directory(data_dir / "received");
}

std::filesystem::path get_database_directory(const std::filesystem::path& data_dir) {
    return ensure_directory(data_dir / "db");
}

std::filesystem::path get_log_directory(const std::filesystem::path& data_dir) {
    return ensure_directory(data_dir / "logs");
}

// ============================================================================
// Input Validation
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }

    return true;
}

bool validate_display_name(const std::string& name, size_t max_length) {
    if (name.empty() || name.length() > max_length) {
        return false;
    }

    // UTF-8 bytes >= 0x80 are allowed; ASCII control characters are not
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) {
            return false;
        }
    }

    return true;
}

std::string sanitize_filename(const std::string& filename) {
    // Keep only the last path component
    std::string sanitized = filename;
    auto separator = sanitized.find_last_of("/\\");
    if (separator != std::string::npos) {
        sanitized = sanitized.substr(separator + 1);
    }

    // Remove control characters, including null bytes
    sanitized.erase(
        std::remove_if(sanitized.begin(), sanitized.end(),
            [](char c) {
                unsigned char uc = static_cast<unsigned char>(c);
                return uc < 0x20 || uc == 0x7f;
            }),
        sanitized.end()
    );

    // Replace reserved characters with underscores
    const std::string reserved_chars = "<>:\"|?*";
    for (char& c : sanitized) {
        if (reserved_chars.find(c) != std::string::npos) {
            c = '_';
        }
    }

    // Leading dots would hide the file or name a parent directory
    auto start = sanitized.find_first_not_of(" .");
    if (start == std::string::npos) {
        return "";
    }
    auto end = sanitized.find_last_not_of(" ");
    sanitized = sanitized.substr(start, end - start + 1);

    // Truncate to the maximum length, keeping the extension when possible
    if (sanitized.length() > MAX_FILENAME_LENGTH) {
        auto dot = sanitized.find_last_of('.');
        std::string extension;
        if (dot != std::string::npos && sanitized.length() - dot <= 16) {
            extension = sanitized.substr(dot);
        }
        sanitized = sanitized.substr(0, MAX_FILENAME_LENGTH - extension.length()) + extension;
    }

    return sanitized;
}

bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir) {
    try {
        // Resolve to canonical paths (resolves .., symlinks, etc.)
        std::filesystem::path canonical_path = std::filesystem::weakly_canonical(path);
        std::filesystem::path canonical_base = std::filesystem::weakly_canonical(base_dir);

        std::string path_str = canonical_path.string();
        std::string base_str = canonical_base.string();

        if (!base_str.empty() && base_str.back() != std::filesystem::path::preferred_separator) {
            base_str += std::filesystem::path::preferred_separator;
        }

        if (path_str.find(base_str) != 0) {
            return false;
        }

        auto relative = std::filesystem::relative(canonical_path, canonical_base);
        if (!relative.empty() && relative.string().find("..") == 0) {
            return false;
        }

        return true;

    } catch (const std::filesystem::filesystem_error&) {
        // If path resolution fails, consider it unsafe
        return false;
    }
}

} // namespace security
} // namespace lanshare
