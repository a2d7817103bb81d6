/**
 * @file device_crypto.hpp
 * @brief Cryptographic primitives for LanShare devices
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides Ed25519 signatures, X25519 session-key exchange (crypto_kx),
 * ChaCha20-Poly1305 sealing with sequence-number nonces and BLAKE2b
 * checksums.
 */

#pragma once

#include <array>
#include <cstdint>
#include <vector>
#include <string>
#include <optional>
#include <sodium.h>

namespace lanshare {

/**
 * @brief Ed25519 signature key pair
 */
struct SignatureKeyPair {
    std::array<uint8_t, crypto_sign_PUBLICKEYBYTES> public_key;
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> secret_key;
};

/**
 * @brief Ephemeral X25519 key pair for one handshake
 */
struct KeyExchangeKeyPair {
    std::array<uint8_t, crypto_kx_PUBLICKEYBYTES> public_key;
    std::array<uint8_t, crypto_kx_SECRETKEYBYTES> secret_key;
};

/**
 * @brief Per-direction symmetric keys derived from a key exchange
 */
struct SessionKeys {
    std::array<uint8_t, crypto_kx_SESSIONKEYBYTES> rx;  ///< Opens inbound messages
    std::array<uint8_t, crypto_kx_SESSIONKEYBYTES> tx;  ///< Seals outbound messages
};

using AeadKey = std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_KEYBYTES>;
using AeadNonce = std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_NPUBBYTES>;

/**
 * @brief DeviceCrypto - Cryptographic operations for devices
 *
 * Thread-safe cryptographic primitives using libsodium.
 * All methods are stateless.
 */
class DeviceCrypto {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    // ========================================================================
    // Key Generation
    // ========================================================================

    static SignatureKeyPair generate_signature_keypair();

    static KeyExchangeKeyPair generate_key_exchange_keypair();

    // ========================================================================
    // Digital Signatures (Ed25519)
    // ========================================================================

    /**
     * @brief Sign a message with Ed25519
     * @param message Message to sign
     * @param secret_key Secret signing key
     * @return Detached signature (64 bytes)
     */
    static std::vector<uint8_t> sign_message(
        const std::vector<uint8_t>& message,
        const std::array<uint8_t, crypto_sign_SECRETKEYBYTES>& secret_key
    );

    /**
     * @brief Verify Ed25519 signature
     * @param message Original message
     * @param signature Signature to verify (64 bytes)
     * @param public_key Public key of signer
     * @return true if signature is valid, false otherwise
     */
    static bool verify_signature(
        const std::vector<uint8_t>& message,
        const std::vector<uint8_t>& signature,
        const std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>& public_key
    );

    // ========================================================================
    // Key Exchange (X25519 via crypto_kx)
    // ========================================================================

    /**
     * @brief Derive session keys on the connecting side
     * @param own Our ephemeral key pair
     * @param server_public_key Responder's ephemeral public key
     * @return SessionKeys, or std::nullopt if the peer key is unacceptable
     */
    static std::optional<SessionKeys> client_session_keys(
        const KeyExchangeKeyPair& own,
        const std::array<uint8_t, crypto_kx_PUBLICKEYBYTES>& server_public_key
    );

    /**
     * @brief Derive session keys on the accepting side
     * @param own Our ephemeral key pair
     * @param client_public_key Initiator's ephemeral public key
     * @return SessionKeys, or std::nullopt if the peer key is unacceptable
     */
    static std::optional<SessionKeys> server_session_keys(
        const KeyExchangeKeyPair& own,
        const std::array<uint8_t, crypto_kx_PUBLICKEYBYTES>& client_public_key
    );

    // ========================================================================
    // Sealing (ChaCha20-Poly1305 IETF AEAD)
    // ========================================================================

    /**
     * @brief Build the nonce for a sequence number (4 zero bytes + big-endian u64)
     */
    static AeadNonce nonce_for_sequence(uint64_t sequence);

    /**
     * @brief Encrypt and authenticate a message
     * @param plaintext Message to seal
     * @param key Direction key
     * @param nonce Unique nonce - must never be reused with the same key
     * @param associated_data Authenticated but unencrypted bytes
     * @return Ciphertext with authentication tag appended
     */
    static std::vector<uint8_t> seal(
        const std::vector<uint8_t>& plaintext,
        const AeadKey& key,
        const AeadNonce& nonce,
        const std::vector<uint8_t>& associated_data
    );

    /**
     * @brief Decrypt and verify a sealed message
     * @return Plaintext, or std::nullopt if authentication fails
     */
    static std::optional<std::vector<uint8_t>> open(
        const std::vector<uint8_t>& ciphertext,
        const AeadKey& key,
        const AeadNonce& nonce,
        const std::vector<uint8_t>& associated_data
    );

    // ========================================================================
    // Hashing (BLAKE2b)
    // ========================================================================

    /**
     * @brief Keyless BLAKE2b hash
     * @param data Input bytes
     * @param size Input length
     * @param output_size Digest length (16..64)
     */
    static std::vector<uint8_t> generic_hash(const uint8_t* data, size_t size, size_t output_size);

    // ========================================================================
    // Utility Functions
    // ========================================================================

    static std::vector<uint8_t> generate_random_bytes(size_t size);

    /**
     * @brief Constant-time comparison of byte arrays (prevents timing attacks)
     * @return true if arrays are equal, false otherwise
     */
    static bool constant_time_compare(
        const std::vector<uint8_t>& a,
        const std::vector<uint8_t>& b
    );

    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    static std::string bytes_to_base64(const std::vector<uint8_t>& bytes);

    static std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64);

    /**
     * @brief Securely zero memory (prevents compiler optimization from removing)
     */
    static void secure_zero(void* data, size_t size);
};

} // namespace lanshare
