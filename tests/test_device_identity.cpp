/**
 * @file test_device_identity.cpp
 * @brief Unit tests for DeviceIdentity
 *
 * Tests identity management including:
 * - Identity creation and key generation
 * - Persistent storage (save/load)
 * - Signing and verification
 * - JSON import/export
 */

#include <gtest/gtest.h>
#include "lanshare/device_identity.hpp"
#include "lanshare/device_crypto.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <vector>

using namespace lanshare;
namespace fs = std::filesystem;

// Test fixture for device identity tests
class DeviceIdentityTest : public ::testing::Test {
protected:
    void SetUp() override {
        DeviceCrypto::initialize();
        test_dir_ = testing_support::make_temp_dir("lanshare_identity_test");
    }

    void TearDown() override {
        // Clean up test directory
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path test_dir_;
};

// ============================================================================
// Identity Creation Tests
// ============================================================================

TEST_F(DeviceIdentityTest, CreateIdentity) {
    DeviceIdentity identity("laptop-0a1b2c3d", "Laptop");

    EXPECT_EQ(identity.get_device_id(), "laptop-0a1b2c3d");
    EXPECT_EQ(identity.get_display_name(), "Laptop");
}

TEST_F(DeviceIdentityTest, CreateMultipleIdentitiesUnique) {
    DeviceIdentity identity1("device1", "One");
    DeviceIdentity identity2("device2", "Two");

    EXPECT_NE(identity1.get_signature_public_key(), identity2.get_signature_public_key());
}

TEST_F(DeviceIdentityTest, RejectInvalidDeviceId) {
    EXPECT_THROW(DeviceIdentity("", "Name"), std::invalid_argument);
    EXPECT_THROW(DeviceIdentity("bad id", "Name"), std::invalid_argument);
    EXPECT_THROW(DeviceIdentity("../etc", "Name"), std::invalid_argument);
    EXPECT_THROW(DeviceIdentity(std::string(65, 'a'), "Name"), std::invalid_argument);
}

TEST_F(DeviceIdentityTest, RejectInvalidDisplayName) {
    EXPECT_THROW(DeviceIdentity("device", ""), std::invalid_argument);
    EXPECT_THROW(DeviceIdentity("device", "line\nbreak"), std::invalid_argument);
}

TEST_F(DeviceIdentityTest, GenerateDeviceIdFromHostname) {
    std::string id = DeviceIdentity::generate_device_id("Office-PC.example.com");

    EXPECT_EQ(id.rfind("office-pc-", 0), 0u);
    EXPECT_EQ(id.length(), std::string("office-pc-").length() + 8);
    EXPECT_TRUE(security::validate_identifier(id));

    // Random suffix differs on each call
    EXPECT_NE(id, DeviceIdentity::generate_device_id("Office-PC.example.com"));
}

TEST_F(DeviceIdentityTest, GenerateDeviceIdFallsBackForEmptyHost) {
    std::string id = DeviceIdentity::generate_device_id("!!!");
    EXPECT_EQ(id.rfind("device-", 0), 0u);
}

TEST_F(DeviceIdentityTest, GenerateDeviceIdTruncatesLongHost) {
    std::string id = DeviceIdentity::generate_device_id(std::string(200, 'h'));
    EXPECT_LE(id.length(), security::MAX_IDENTIFIER_LENGTH);
    EXPECT_TRUE(security::validate_identifier(id));
}

TEST_F(DeviceIdentityTest, SetDisplayName) {
    DeviceIdentity identity("device", "Old");

    EXPECT_TRUE(identity.set_display_name("New Name"));
    EXPECT_EQ(identity.get_display_name(), "New Name");

    EXPECT_FALSE(identity.set_display_name(""));
    EXPECT_EQ(identity.get_display_name(), "New Name");
    EXPECT_EQ(identity.get_device_id(), "device");
}

// ============================================================================
// Persistent Storage Tests
// ============================================================================

TEST_F(DeviceIdentityTest, SaveAndLoadIdentity) {
    fs::path identity_file = test_dir_ / "identity.json";

    DeviceIdentity original("saved-device", "Saved");
    ASSERT_TRUE(original.save(identity_file));
    EXPECT_TRUE(fs::exists(identity_file));

    auto loaded = DeviceIdentity::load(identity_file);
    ASSERT_TRUE(loaded.has_value());

    EXPECT_EQ(loaded->get_device_id(), "saved-device");
    EXPECT_EQ(loaded->get_display_name(), "Saved");
    EXPECT_EQ(loaded->get_signature_public_key(), original.get_signature_public_key());
}

TEST_F(DeviceIdentityTest, SavedFileIsOwnerOnly) {
    fs::path identity_file = test_dir_ / "identity.json";

    DeviceIdentity identity("device", "Name");
    ASSERT_TRUE(identity.save(identity_file));

    auto perms = fs::status(identity_file).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
}

TEST_F(DeviceIdentityTest, LoadedIdentityCanSign) {
    fs::path identity_file = test_dir_ / "identity.json";

    DeviceIdentity original("device", "Name");
    ASSERT_TRUE(original.save(identity_file));
    auto loaded = DeviceIdentity::load(identity_file);
    ASSERT_TRUE(loaded.has_value());

    std::vector<uint8_t> message = {1, 2, 3};
    auto signature = loaded->sign(message);

    EXPECT_TRUE(DeviceIdentity::verify(message, signature, original.get_signature_public_key()));
}

TEST_F(DeviceIdentityTest, LoadMissingFile) {
    EXPECT_FALSE(DeviceIdentity::load(test_dir_ / "missing.json").has_value());
}

TEST_F(DeviceIdentityTest, LoadCorruptFile) {
    fs::path identity_file = test_dir_ / "identity.json";
    {
        std::ofstream out(identity_file);
        out << "{ not json";
    }
    EXPECT_FALSE(DeviceIdentity::load(identity_file).has_value());
}

// ============================================================================
// Signature Tests
// ============================================================================

TEST_F(DeviceIdentityTest, SignAndVerify) {
    DeviceIdentity identity("device", "Name");
    std::vector<uint8_t> message = {'h', 'e', 'l', 'l', 'o'};

    auto signature = identity.sign(message);

    EXPECT_EQ(signature.size(), security::ED25519_SIGNATURE_SIZE);
    EXPECT_TRUE(DeviceIdentity::verify(message, signature, identity.get_signature_public_key()));
}

TEST_F(DeviceIdentityTest, VerifyWithOtherIdentityFails) {
    DeviceIdentity signer("signer", "Signer");
    DeviceIdentity other("other", "Other");
    std::vector<uint8_t> message = {1, 2, 3};

    auto signature = signer.sign(message);

    EXPECT_FALSE(DeviceIdentity::verify(message, signature, other.get_signature_public_key()));
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST_F(DeviceIdentityTest, JsonRoundTrip) {
    DeviceIdentity original("device", "Name");

    auto restored = DeviceIdentity::from_json(original.to_json());
    ASSERT_TRUE(restored.has_value());

    EXPECT_EQ(restored->get_device_id(), original.get_device_id());
    EXPECT_EQ(restored->get_signature_public_key_b64(), original.get_signature_public_key_b64());
}

TEST_F(DeviceIdentityTest, FromJsonRejectsMismatchedKeys) {
    DeviceIdentity first("first", "First");
    DeviceIdentity second("second", "Second");

    auto j = nlohmann::json::parse(first.to_json());
    j["sign_public"] = second.get_signature_public_key_b64();

    EXPECT_FALSE(DeviceIdentity::from_json(j.dump()).has_value());
}

TEST_F(DeviceIdentityTest, FromJsonRejectsMissingFields) {
    EXPECT_FALSE(DeviceIdentity::from_json("{}").has_value());
    EXPECT_FALSE(DeviceIdentity::from_json("[]").has_value());
    EXPECT_FALSE(DeviceIdentity::from_json("").has_value());
}
