/**
 * @file test_device_crypto.cpp
 * @brief Unit tests for DeviceCrypto
 *
 * Tests cryptographic primitives including:
 * - Key generation (Ed25519, X25519)
 * - Digital signatures
 * - crypto_kx session keys
 * - Sequence-numbered AEAD sealing
 * - BLAKE2b hashing and encoding helpers
 */

#include <gtest/gtest.h>
#include "lanshare/device_crypto.hpp"
#include <algorithm>
#include <thread>
#include <vector>

using namespace lanshare;

class DeviceCryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(DeviceCrypto::initialize());
    }

    static AeadKey random_key() {
        AeadKey key{};
        auto bytes = DeviceCrypto::generate_random_bytes(key.size());
        std::copy(bytes.begin(), bytes.end(), key.begin());
        return key;
    }
};

// ============================================================================
// Key Generation Tests
// ============================================================================

TEST_F(DeviceCryptoTest, InitializeIsIdempotent) {
    EXPECT_TRUE(DeviceCrypto::initialize());
    EXPECT_TRUE(DeviceCrypto::initialize());
}

TEST_F(DeviceCryptoTest, GenerateSignatureKeypair) {
    auto keypair = DeviceCrypto::generate_signature_keypair();

    bool public_not_zero = std::any_of(keypair.public_key.begin(), keypair.public_key.end(),
                                       [](uint8_t b) { return b != 0; });
    EXPECT_TRUE(public_not_zero);

    auto other = DeviceCrypto::generate_signature_keypair();
    EXPECT_NE(keypair.public_key, other.public_key);
}

TEST_F(DeviceCryptoTest, GenerateKeyExchangeKeypairUniqueness) {
    auto a = DeviceCrypto::generate_key_exchange_keypair();
    auto b = DeviceCrypto::generate_key_exchange_keypair();
    EXPECT_NE(a.public_key, b.public_key);
    EXPECT_NE(a.secret_key, b.secret_key);
}

// ============================================================================
// Digital Signature Tests (Ed25519)
// ============================================================================

TEST_F(DeviceCryptoTest, SignAndVerifyMessage) {
    auto keypair = DeviceCrypto::generate_signature_keypair();
    std::vector<uint8_t> message = {1, 2, 3, 4, 5};

    auto signature = DeviceCrypto::sign_message(message, keypair.secret_key);

    EXPECT_EQ(signature.size(), crypto_sign_BYTES);
    EXPECT_TRUE(DeviceCrypto::verify_signature(message, signature, keypair.public_key));
}

TEST_F(DeviceCryptoTest, VerifyModifiedMessage) {
    auto keypair = DeviceCrypto::generate_signature_keypair();
    std::vector<uint8_t> message = {1, 2, 3, 4, 5};

    auto signature = DeviceCrypto::sign_message(message, keypair.secret_key);
    message[0] ^= 0xFF;

    EXPECT_FALSE(DeviceCrypto::verify_signature(message, signature, keypair.public_key));
}

TEST_F(DeviceCryptoTest, VerifyWrongPublicKey) {
    auto keypair1 = DeviceCrypto::generate_signature_keypair();
    auto keypair2 = DeviceCrypto::generate_signature_keypair();
    std::vector<uint8_t> message = {1, 2, 3, 4, 5};

    auto signature = DeviceCrypto::sign_message(message, keypair1.secret_key);

    EXPECT_FALSE(DeviceCrypto::verify_signature(message, signature, keypair2.public_key));
}

TEST_F(DeviceCryptoTest, VerifyTruncatedSignature) {
    auto keypair = DeviceCrypto::generate_signature_keypair();
    std::vector<uint8_t> message = {9, 9, 9};

    auto signature = DeviceCrypto::sign_message(message, keypair.secret_key);
    signature.resize(signature.size() - 1);

    EXPECT_FALSE(DeviceCrypto::verify_signature(message, signature, keypair.public_key));
}

// ============================================================================
// Session Key Tests (crypto_kx)
// ============================================================================

TEST_F(DeviceCryptoTest, SessionKeysMatchAcrossRoles) {
    auto client = DeviceCrypto::generate_key_exchange_keypair();
    auto server = DeviceCrypto::generate_key_exchange_keypair();

    auto client_keys = DeviceCrypto::client_session_keys(client, server.public_key);
    auto server_keys = DeviceCrypto::server_session_keys(server, client.public_key);

    ASSERT_TRUE(client_keys.has_value());
    ASSERT_TRUE(server_keys.has_value());
    EXPECT_EQ(client_keys->tx, server_keys->rx);
    EXPECT_EQ(client_keys->rx, server_keys->tx);
    EXPECT_NE(client_keys->tx, client_keys->rx);
}

TEST_F(DeviceCryptoTest, SessionKeysDifferPerPeer) {
    auto client = DeviceCrypto::generate_key_exchange_keypair();
    auto server1 = DeviceCrypto::generate_key_exchange_keypair();
    auto server2 = DeviceCrypto::generate_key_exchange_keypair();

    auto keys1 = DeviceCrypto::client_session_keys(client, server1.public_key);
    auto keys2 = DeviceCrypto::client_session_keys(client, server2.public_key);

    ASSERT_TRUE(keys1.has_value());
    ASSERT_TRUE(keys2.has_value());
    EXPECT_NE(keys1->tx, keys2->tx);
}

// ============================================================================
// Sealing Tests (ChaCha20-Poly1305)
// ============================================================================

TEST_F(DeviceCryptoTest, NonceCarriesSequenceBigEndian) {
    auto nonce = DeviceCrypto::nonce_for_sequence(0x0102030405060708ULL);

    AeadNonce expected = {0, 0, 0, 0, 1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(nonce, expected);
}

TEST_F(DeviceCryptoTest, SealAndOpen) {
    auto key = random_key();
    auto nonce = DeviceCrypto::nonce_for_sequence(7);
    std::vector<uint8_t> ad = {0x02, 0, 0, 0, 0, 0, 0, 0, 7};
    std::vector<uint8_t> plaintext = {1, 2, 3, 4, 5, 6, 7, 8};

    auto ciphertext = DeviceCrypto::seal(plaintext, key, nonce, ad);
    EXPECT_EQ(ciphertext.size(), plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);

    auto opened = DeviceCrypto::open(ciphertext, key, nonce, ad);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, plaintext);
}

TEST_F(DeviceCryptoTest, OpenRejectsModifiedCiphertext) {
    auto key = random_key();
    auto nonce = DeviceCrypto::nonce_for_sequence(1);
    std::vector<uint8_t> plaintext = {10, 20, 30};

    auto ciphertext = DeviceCrypto::seal(plaintext, key, nonce, {});
    ciphertext[0] ^= 0x01;

    EXPECT_FALSE(DeviceCrypto::open(ciphertext, key, nonce, {}).has_value());
}

TEST_F(DeviceCryptoTest, OpenRejectsWrongSequence) {
    auto key = random_key();
    std::vector<uint8_t> plaintext = {10, 20, 30};

    auto ciphertext = DeviceCrypto::seal(plaintext, key, DeviceCrypto::nonce_for_sequence(3), {});

    EXPECT_FALSE(DeviceCrypto::open(ciphertext, key, DeviceCrypto::nonce_for_sequence(4), {}).has_value());
}

TEST_F(DeviceCryptoTest, OpenRejectsWrongAssociatedData) {
    auto key = random_key();
    auto nonce = DeviceCrypto::nonce_for_sequence(0);
    std::vector<uint8_t> plaintext = {1};

    auto ciphertext = DeviceCrypto::seal(plaintext, key, nonce, {0x02});

    EXPECT_FALSE(DeviceCrypto::open(ciphertext, key, nonce, {0x03}).has_value());
}

TEST_F(DeviceCryptoTest, OpenRejectsTruncatedCiphertext) {
    auto key = random_key();
    auto nonce = DeviceCrypto::nonce_for_sequence(0);

    std::vector<uint8_t> short_ciphertext(crypto_aead_chacha20poly1305_ietf_ABYTES - 1, 0);
    EXPECT_FALSE(DeviceCrypto::open(short_ciphertext, key, nonce, {}).has_value());
}

TEST_F(DeviceCryptoTest, SealEmptyMessage) {
    auto key = random_key();
    auto nonce = DeviceCrypto::nonce_for_sequence(0);

    auto ciphertext = DeviceCrypto::seal({}, key, nonce, {});
    auto opened = DeviceCrypto::open(ciphertext, key, nonce, {});

    ASSERT_TRUE(opened.has_value());
    EXPECT_TRUE(opened->empty());
}

// ============================================================================
// Hashing and Utility Tests
// ============================================================================

TEST_F(DeviceCryptoTest, GenericHashIsDeterministic) {
    std::vector<uint8_t> data = {1, 2, 3};

    auto a = DeviceCrypto::generic_hash(data.data(), data.size(), 16);
    auto b = DeviceCrypto::generic_hash(data.data(), data.size(), 16);
    auto c = DeviceCrypto::generic_hash(data.data(), data.size(), 32);

    EXPECT_EQ(a.size(), 16u);
    EXPECT_EQ(c.size(), 32u);
    EXPECT_EQ(a, b);

    data[2] = 4;
    EXPECT_NE(DeviceCrypto::generic_hash(data.data(), data.size(), 16), a);
}

TEST_F(DeviceCryptoTest, GenericHashRejectsBadLength) {
    std::vector<uint8_t> data = {1};
    EXPECT_THROW(DeviceCrypto::generic_hash(data.data(), data.size(), 4), std::invalid_argument);
}

TEST_F(DeviceCryptoTest, ConstantTimeCompare) {
    std::vector<uint8_t> a = {1, 2, 3};
    std::vector<uint8_t> b = {1, 2, 3};
    std::vector<uint8_t> c = {1, 2, 4};
    std::vector<uint8_t> d = {1, 2};

    EXPECT_TRUE(DeviceCrypto::constant_time_compare(a, b));
    EXPECT_FALSE(DeviceCrypto::constant_time_compare(a, c));
    EXPECT_FALSE(DeviceCrypto::constant_time_compare(a, d));
}

TEST_F(DeviceCryptoTest, BytesToHex) {
    EXPECT_EQ(DeviceCrypto::bytes_to_hex({0x00, 0xAB, 0xFF}), "00abff");
}

TEST_F(DeviceCryptoTest, Base64RoundTrip) {
    std::vector<uint8_t> data = {0, 1, 2, 250, 251, 252, 253};

    auto encoded = DeviceCrypto::bytes_to_base64(data);
    auto decoded = DeviceCrypto::base64_to_bytes(encoded);

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
    EXPECT_FALSE(DeviceCrypto::base64_to_bytes("!!not base64!!").has_value());
}

TEST_F(DeviceCryptoTest, SecureZeroMemory) {
    std::vector<uint8_t> sensitive_data(32, 0xFF);

    DeviceCrypto::secure_zero(sensitive_data.data(), sensitive_data.size());

    for (uint8_t byte : sensitive_data) {
        EXPECT_EQ(byte, 0);
    }
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(DeviceCryptoTest, ConcurrentSignAndVerify) {
    const int num_threads = 10;
    auto keypair = DeviceCrypto::generate_signature_keypair();
    std::vector<std::thread> threads;
    std::vector<int> results(num_threads, 0);

    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&keypair, &results, i]() {
            std::vector<uint8_t> message = {static_cast<uint8_t>(i)};
            auto signature = DeviceCrypto::sign_message(message, keypair.secret_key);
            results[i] = DeviceCrypto::verify_signature(message, signature, keypair.public_key) ? 1 : 0;
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    for (int result : results) {
        EXPECT_EQ(result, 1);
    }
}
