/**
 * @file device_crypto.cpp
 * @brief Implementation of cryptographic primitives for LanShare devices
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Ed25519: Device identity signatures
 * - X25519 (crypto_kx): Per-connection, per-direction session keys
 * - ChaCha20-Poly1305: AEAD cipher
 * - BLAKE2b: Handshake transcripts and chunk checksums
 */

#include "lanshare/device_crypto.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lanshare {

// ============================================================================
// Initialization
// ============================================================================

bool DeviceCrypto::initialize() {
    // Safe to call multiple times
    return sodium_init() >= 0;
}

// ============================================================================
// Key Generation
// ============================================================================

SignatureKeyPair DeviceCrypto::generate_signature_keypair() {
    SignatureKeyPair keypair;
    crypto_sign_keypair(keypair.public_key.data(), keypair.secret_key.data());
    return keypair;
}

KeyExchangeKeyPair DeviceCrypto::generate_key_exchange_keypair() {
    KeyExchangeKeyPair keypair;
    crypto_kx_keypair(keypair.public_key.data(), keypair.secret_key.data());
    return keypair;
}

// ============================================================================
// Digital Signatures (Ed25519)
// ============================================================================

std::vector<uint8_t> DeviceCrypto::sign_message(
    const std::vector<uint8_t>& message,
    const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
) {
    std::vector<uint8_t> signature(crypto_sign_BYTES);

    unsigned long long signature_len = 0;
    crypto_sign_detached(
        signature.data(),
        &signature_len,
        message.data(),
        message.size(),
        secret_key.data()
    );

    signature.resize(signature_len);
    return signature;
}

bool DeviceCrypto::verify_signature(
    const std::vector<uint8_t>& message,
    const std::vector<uint8_t>& signature,
    const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& public_key
) {
    if (signature.size() != crypto_sign_BYTES) {
        return false;
    }

    return crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    ) == 0;
}

// ============================================================================
// Key Exchange (X25519 via crypto_kx)
// ============================================================================

std::optional<SessionKeys> DeviceCrypto::client_session_keys(
    const KeyExchangeKeyPair& own,
    const std::array<uint8_t, crypto_kx_PUBLICKEYBYTES>& server_public_key
) {
    SessionKeys keys;
    int result = crypto_kx_client_session_keys(
        keys.rx.data(),
        keys.tx.data(),
        own.public_key.data(),
        own.secret_key.data(),
        server_public_key.data()
    );

    if (result != 0) {
        return std::nullopt;
    }
    return keys;
}

std::optional<SessionKeys> DeviceCrypto::server_session_keys(
    const KeyExchangeKeyPair& own,
    const std::array<uint8_t, crypto_kx_PUBLICKEYBYTES>& client_public_key
) {
    SessionKeys keys;
    int result = crypto_kx_server_session_keys(
        keys.rx.data(),
        keys.tx.data(),
        own.public_key.data(),
        own.secret_key.data(),
        client_public_key.data()
    );

    if (result != 0) {
        return std::nullopt;
    }
    return keys;
}

// ============================================================================
// Sealing (ChaCha20-Poly1305 IETF AEAD)
// ============================================================================

AeadNonce DeviceCrypto::nonce_for_sequence(uint64_t sequence) {
    AeadNonce nonce{};
    for (int i = 0; i < 8; ++i) {
        nonce[4 + i] = static_cast<uint8_t>(sequence >> (56 - 8 * i));
    }
    return nonce;
}

std::vector<uint8_t> DeviceCrypto::seal(
    const std::vector<uint8_t>& plaintext,
    const AeadKey& key,
    const AeadNonce& nonce,
    const std::vector<uint8_t>& associated_data
) {
    std::vector<uint8_t> ciphertext(plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);

    unsigned long long ciphertext_len = 0;
    int result = crypto_aead_chacha20poly1305_ietf_encrypt(
        ciphertext.data(),
        &ciphertext_len,
        plaintext.data(),
        plaintext.size(),
        associated_data.data(),
        associated_data.size(),
        nullptr,  // No secret nonce
        nonce.data(),
        key.data()
    );

    if (result != 0) {
        throw std::runtime_error("DeviceCrypto: AEAD encryption failed");
    }

    ciphertext.resize(ciphertext_len);
    return ciphertext;
}

std::optional<std::vector<uint8_t>> DeviceCrypto::open(
    const std::vector<uint8_t>& ciphertext,
    const AeadKey& key,
    const AeadNonce& nonce,
    const std::vector<uint8_t>& associated_data
) {
    if (ciphertext.size() < crypto_aead_chacha20poly1305_ietf_ABYTES) {
        return std::nullopt;
    }

    std::vector<uint8_t> plaintext(ciphertext.size() - crypto_aead_chacha20poly1305_ietf_ABYTES);

    unsigned long long plaintext_len = 0;
    int result = crypto_aead_chacha20poly1305_ietf_decrypt(
        plaintext.data(),
        &plaintext_len,
        nullptr,  // No secret nonce
        ciphertext.data(),
        ciphertext.size(),
        associated_data.data(),
        associated_data.size(),
        nonce.data(),
        key.data()
    );

    if (result != 0) {
        // Tag mismatch: tampered, replayed under another nonce, or wrong key
        return std::nullopt;
    }

    plaintext.resize(plaintext_len);
    return plaintext;
}

// ============================================================================
// Hashing (BLAKE2b)
// ============================================================================

std::vector<uint8_t> DeviceCrypto::generic_hash(const uint8_t* data, size_t size, size_t output_size) {
    if (output_size < crypto_generichash_BYTES_MIN || output_size > crypto_generichash_BYTES_MAX) {
        throw std::invalid_argument("DeviceCrypto: unsupported hash length");
    }

    std::vector<uint8_t> hash(output_size);
    crypto_generichash(hash.data(), hash.size(), data, size, nullptr, 0);
    return hash;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<uint8_t> DeviceCrypto::generate_random_bytes(size_t size) {
    std::vector<uint8_t> bytes(size);
    randombytes_buf(bytes.data(), size);
    return bytes;
}

bool DeviceCrypto::constant_time_compare(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b
) {
    if (a.size() != b.size()) {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string DeviceCrypto::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

std::string DeviceCrypto::bytes_to_base64(const std::vector<uint8_t>& bytes) {
    size_t base64_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    std::vector<char> base64(base64_len);
    sodium_bin2base64(
        base64.data(),
        base64.size(),
        bytes.data(),
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    return std::string(base64.data());
}

std::optional<std::vector<uint8_t>> DeviceCrypto::base64_to_bytes(const std::string& base64) {
    std::vector<uint8_t> bytes(base64.length());

    size_t decoded_len = 0;
    const char* end_ptr = nullptr;
    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        base64.c_str(),
        base64.length(),
        nullptr,  // No ignore characters
        &decoded_len,
        &end_ptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    if (result != 0 || end_ptr != base64.c_str() + base64.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

void DeviceCrypto::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

} // namespace lanshare
