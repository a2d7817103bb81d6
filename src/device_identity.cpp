/**
 * @file device_identity.cpp
 * @brief Implementation of device identity management
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanshare/device_identity.hpp"
#include "lanshare/security_config.hpp"
#include "lanshare/utilities.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

namespace lanshare {

// ============================================================================
// Constructors
// ============================================================================

DeviceIdentity::DeviceIdentity(const std::string& device_id, const std::string& display_name)
    : DeviceIdentity(device_id, display_name, DeviceCrypto::generate_signature_keypair())
{
}

DeviceIdentity::DeviceIdentity(
    const std::string& device_id,
    const std::string& display_name,
    const SignatureKeyPair& sig_keypair
)
    : device_id_(device_id)
    , display_name_(display_name)
    , signature_keypair_(sig_keypair)
{
    if (!security::validate_identifier(device_id_)) {
        throw std::invalid_argument("DeviceIdentity: invalid device ID: " + device_id_);
    }
    if (!security::validate_display_name(display_name_)) {
        throw std::invalid_argument("DeviceIdentity: invalid display name");
    }
}

std::string DeviceIdentity::generate_device_id(const std::string& hostname) {
    std::string host;
    for (char c : hostname) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') {
            host += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        // Drop the domain part of a fully qualified name
        if (c == '.') {
            break;
        }
    }
    if (host.empty()) {
        host = "device";
    }

    std::string suffix = DeviceCrypto::bytes_to_hex(DeviceCrypto::generate_random_bytes(4));
    size_t max_host = security::MAX_IDENTIFIER_LENGTH - suffix.length() - 1;
    if (host.length() > max_host) {
        host = host.substr(0, max_host);
    }
    return host + "-" + suffix;
}

// ============================================================================
// Persistent Storage
// ============================================================================

std::optional<DeviceIdentity> DeviceIdentity::load(const std::filesystem::path& identity_file) {
    if (!std::filesystem::exists(identity_file)) {
        return std::nullopt;
    }

    auto content = utilities::read_file(identity_file.string());
    if (!content) {
        return std::nullopt;
    }

    auto identity = from_json(*content);
    if (!identity) {
        utilities::log_error("Identity: Corrupt identity file " + identity_file.string());
    }
    return identity;
}

bool DeviceIdentity::save(const std::filesystem::path& identity_file) const {
    try {
        if (!utilities::write_file(identity_file.string(), to_json())) {
            return false;
        }

        // Owner read/write only
        std::filesystem::permissions(identity_file,
            std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
            std::filesystem::perm_options::replace);

        return true;

    } catch (const std::filesystem::filesystem_error& e) {
        utilities::log_error("Identity: Failed to protect identity file: " + std::string(e.what()));
        return false;
    }
}

// ============================================================================
// Identity Information
// ============================================================================

const std::string& DeviceIdentity::get_device_id() const {
    return device_id_;
}

const std::string& DeviceIdentity::get_display_name() const {
    return display_name_;
}

bool DeviceIdentity::set_display_name(const std::string& display_name) {
    if (!security::validate_display_name(display_name)) {
        return false;
    }
    display_name_ = display_name;
    return true;
}

const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& DeviceIdentity::get_signature_public_key() const {
    return signature_keypair_.public_key;
}

std::string DeviceIdentity::get_signature_public_key_b64() const {
    std::vector<uint8_t> key_vec(
        signature_keypair_.public_key.begin(),
        signature_keypair_.public_key.end()
    );
    return DeviceCrypto::bytes_to_base64(key_vec);
}

// ============================================================================
// Cryptographic Operations
// ============================================================================

std::vector<uint8_t> DeviceIdentity::sign(const std::vector<uint8_t>& message) const {
    return DeviceCrypto::sign_message(message, signature_keypair_.secret_key);
}

bool DeviceIdentity::verify(
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature,
    const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& peer_public_key
) {
    return DeviceCrypto::verify_signature(message, signature, peer_public_key);
}

// ============================================================================
// Serialization
// ============================================================================

std::string DeviceIdentity::to_json() const {
    std::vector<uint8_t> secret(signature_keypair_.secret_key.begin(), signature_keypair_.secret_key.end());

    json j;
    j["device_id"] = device_id_;
    j["display_name"] = display_name_;
    j["sign_public"] = get_signature_public_key_b64();
    j["sign_secret"] = DeviceCrypto::bytes_to_base64(secret);

    DeviceCrypto::secure_zero(secret.data(), secret.size());
    return j.dump(2);
}

std::optional<DeviceIdentity> DeviceIdentity::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        std::string device_id = j.at("device_id").get<std::string>();
        std::string display_name = j.at("display_name").get<std::string>();

        auto public_opt = DeviceCrypto::base64_to_bytes(j.at("sign_public").get<std::string>());
        auto secret_opt = DeviceCrypto::base64_to_bytes(j.at("sign_secret").get<std::string>());
        if (!public_opt || !secret_opt ||
            public_opt->size() != crypto_sign_PUBLICKEYBYTES ||
            secret_opt->size() != crypto_sign_SECRETKEYBYTES) {
            return std::nullopt;
        }

        SignatureKeyPair keypair;
        std::copy(public_opt->begin(), public_opt->end(), keypair.public_key.begin());
        std::copy(secret_opt->begin(), secret_opt->end(), keypair.secret_key.begin());
        DeviceCrypto::secure_zero(secret_opt->data(), secret_opt->size());

        // The public half must belong to the secret half
        std::array<uint8_t, crypto_sign_PUBLICKEYBYTES> derived;
        crypto_sign_ed25519_sk_to_pk(derived.data(), keypair.secret_key.data());
        if (derived != keypair.public_key) {
            return std::nullopt;
        }

        return DeviceIdentity(device_id, display_name, keypair);

    } catch (const json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

} // namespace lanshare
