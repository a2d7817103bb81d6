/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for LanShare
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <random>
#include <stdexcept>

#include <unistd.h>
#include <sys/socket.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <ifaddrs.h>

// OpenSSL for SHA-256
#include <openssl/evp.h>

namespace lanshare {
namespace utilities {

namespace {
    // Global logger instance
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_logger_mutex;

    // Convert LogLevel to spdlog level
    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
            default:                 return spdlog::level::info;
        }
    }

    std::string to_hex(const unsigned char* data, size_t size) {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < size; ++i) {
            oss << std::setw(2) << static_cast<int>(data[i]);
        }
        return oss.str();
    }

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        return g_logger;
    }
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored)
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        sinks.push_back(console_sink);

        // File sink (rotating, 10MB per file, 3 files max)
        if (!log_file.empty()) {
            std::filesystem::path path(log_file);
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);
            file_sink->set_level(to_spdlog_level(level));
            sinks.push_back(file_sink);
        }

        auto new_logger = std::make_shared<spdlog::logger>("lanshare", sinks.begin(), sinks.end());
        new_logger->set_level(to_spdlog_level(level));
        new_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        {
            std::lock_guard<std::mutex> lock(g_logger_mutex);
            g_logger = new_logger;
        }

        spdlog::set_default_logger(new_logger);

    } catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        fprintf(stderr, "Log directory creation failed: %s\n", ex.what());
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = to_lowercase(trim_string(name));
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    auto current = logger();
    if (!current) {
        initialize_logging();
        current = logger();
        if (!current) {
            fprintf(stderr, "%s\n", message.c_str());
            return;
        }
    }

    switch (level) {
        case LogLevel::DEBUG:    current->debug(message); break;
        case LogLevel::INFO:     current->info(message); break;
        case LogLevel::WARN:     current->warn(message); break;
        case LogLevel::ERROR:    current->error(message); break;
        case LogLevel::CRITICAL: current->critical(message); break;
    }
}

void log_debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void log_warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void log_critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

// ============================================================================
// TIME/SIZE FORMATTING FUNCTIONS
// ============================================================================

std::string format_time_point(std::chrono::system_clock::time_point time) {
    std::time_t seconds = static_cast<std::time_t>(to_unix_seconds(time));
    std::tm tm_buf;
    gmtime_r(&seconds, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

uint64_t to_unix_seconds(std::chrono::system_clock::time_point time) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    return seconds < 0 ? 0 : static_cast<uint64_t>(seconds);
}

std::chrono::system_clock::time_point from_unix_seconds(uint64_t seconds) {
    return std::chrono::system_clock::time_point(
        std::chrono::seconds(static_cast<std::chrono::seconds::rep>(seconds)));
}

std::string format_file_size(uint64_t size) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size_d = static_cast<double>(size);

    while (size_d >= 1024.0 && unit_index < 4) {
        size_d /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size_d << " " << units[unit_index];
    return oss.str();
}

std::string format_duration(uint64_t seconds) {
    uint64_t hours = seconds / 3600;
    uint64_t minutes = (seconds % 3600) / 60;
    uint64_t secs = seconds % 60;

    std::ostringstream oss;
    bool has_output = false;

    if (hours > 0) {
        oss << hours << "h";
        has_output = true;
    }
    if (minutes > 0 || (has_output && secs > 0)) {
        if (has_output) oss << " ";
        oss << minutes << "m";
        has_output = true;
    }
    if (secs > 0 || !has_output) {
        if (has_output) oss << " ";
        oss << secs << "s";
    }

    return oss.str();
}

// ============================================================================
// FILE I/O FUNCTIONS
// ============================================================================

std::optional<std::string> read_file(const std::string& file_path) {
    try {
        std::ifstream file(file_path, std::ios::in);
        if (!file.is_open()) {
            log_debug("Failed to open file for reading: " + file_path);
            return std::nullopt;
        }

        std::ostringstream content;
        content << file.rdbuf();
        return content.str();

    } catch (const std::exception& ex) {
        log_error("Exception reading file " + file_path + ": " + ex.what());
        return std::nullopt;
    }
}

bool write_file(const std::string& file_path, const std::string& content) {
    try {
        // Create parent directories if needed
        std::filesystem::path path(file_path);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(file_path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            log_error("Failed to open file for writing: " + file_path);
            return false;
        }

        file << content;
        file.flush();
        return file.good();

    } catch (const std::exception& ex) {
        log_error("Exception writing file " + file_path + ": " + ex.what());
        return false;
    }
}

// ============================================================================
// SHA-256 DIGESTS
// ============================================================================

struct Sha256::Context {
    EVP_MD_CTX* ctx = nullptr;
};

Sha256::Sha256()
    : context_(std::make_unique<Context>())
    , finalized_(false)
{
    context_->ctx = EVP_MD_CTX_new();
    if (!context_->ctx || EVP_DigestInit_ex(context_->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Sha256: failed to initialize digest context");
    }
}

Sha256::~Sha256() {
    if (context_ && context_->ctx) {
        EVP_MD_CTX_free(context_->ctx);
    }
}

bool Sha256::update(const uint8_t* data, size_t size) {
    if (finalized_) {
        return false;
    }
    if (size == 0) {
        return true;
    }
    return EVP_DigestUpdate(context_->ctx, data, size) == 1;
}

std::optional<std::string> Sha256::finalize_hex() {
    if (finalized_) {
        return std::nullopt;
    }
    finalized_ = true;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(context_->ctx, hash, &hash_len) != 1) {
        return std::nullopt;
    }
    return to_hex(hash, hash_len);
}

std::optional<std::string> calculate_file_hash(const std::string& file_path) {
    try {
        std::ifstream file(file_path, std::ios::binary);
        if (!file.is_open()) {
            log_error("Failed to open file for hashing: " + file_path);
            return std::nullopt;
        }

        Sha256 digest;
        std::vector<char> buffer(64 * 1024);
        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto count = file.gcount();
            if (count > 0 &&
                !digest.update(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<size_t>(count))) {
                return std::nullopt;
            }
        }
        if (file.bad()) {
            log_error("Read error while hashing: " + file_path);
            return std::nullopt;
        }

        return digest.finalize_hex();

    } catch (const std::exception& ex) {
        log_error("Exception calculating file hash for " + file_path + ": " + ex.what());
        return std::nullopt;
    }
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr);
    return to_hex(hash, hash_len);
}

// ============================================================================
// STRING MANIPULATION FUNCTIONS
// ============================================================================

std::string trim_string(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });

    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string to_lowercase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string to_uppercase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::toupper(c); });
    return result;
}

// ============================================================================
// ENVIRONMENT/NETWORK FUNCTIONS
// ============================================================================

std::string get_hostname() {
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        return "unknown";
    }
    hostname[sizeof(hostname) - 1] = '\0';
    return std::string(hostname);
}

std::vector<std::string> get_local_ip_addresses() {
    std::vector<std::string> addresses;
    struct ifaddrs *ifaddr, *ifa;

    if (getifaddrs(&ifaddr) == -1) {
        return addresses;
    }

    for (ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        char host[NI_MAXHOST];
        int result = getnameinfo(ifa->ifa_addr, sizeof(struct sockaddr_in),
            host, NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);

        if (result == 0) {
            std::string address(host);
            if (address.rfind("127.", 0) != 0) {
                addresses.push_back(address);
            }
        }
    }

    freeifaddrs(ifaddr);
    return addresses;
}

std::string generate_uuid() {
    static std::mutex generator_mutex;
    static std::random_device rd;
    static std::mt19937 generator(rd());
    static std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFFFF);

    uint32_t data[4];
    {
        std::lock_guard<std::mutex> lock(generator_mutex);
        for (int i = 0; i < 4; ++i) {
            data[i] = dist(generator);
        }
    }

    // Set version (4) and variant bits according to RFC 4122
    data[1] = (data[1] & 0xFFFF0FFF) | 0x00004000;
    data[2] = (data[2] & 0x3FFFFFFF) | 0x80000000;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    oss << std::setw(8) << data[0] << "-";
    oss << std::setw(4) << (data[1] >> 16) << "-";
    oss << std::setw(4) << (data[1] & 0xFFFF) << "-";
    oss << std::setw(4) << (data[2] >> 16) << "-";
    oss << std::setw(4) << (data[2] & 0xFFFF);
    oss << std::setw(8) << data[3];

    return oss.str();
}

} // namespace utilities
} // namespace lanshare
