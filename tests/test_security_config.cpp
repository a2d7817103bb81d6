/**
 * @file test_security_config.cpp
 * @brief Unit tests for protocol constants and input validation
 *
 * Tests:
 * - Protocol limits and sizes
 * - Identifier and display name validation
 * - Filename sanitization against path traversal
 * - Path containment checks
 * - Data directory layout
 */

#include <gtest/gtest.h>
#include "lanshare/security_config.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <filesystem>
#include <thread>
#include <vector>

using namespace lanshare::security;
namespace fs = std::filesystem;

// Test fixture for security config tests
class SecurityConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = lanshare::testing_support::make_temp_dir("lanshare_security_test");
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
// Protocol Constants Tests
// ============================================================================

TEST_F(SecurityConfigTest, ProtocolLimits) {
    EXPECT_EQ(MAX_FRAME_SIZE, 8u * 1024 * 1024);
    EXPECT_EQ(DEFAULT_CHUNK_SIZE, 64u * 1024);
    EXPECT_LE(MIN_CHUNK_SIZE, DEFAULT_CHUNK_SIZE);
    EXPECT_LE(DEFAULT_CHUNK_SIZE, MAX_CHUNK_SIZE);
    EXPECT_EQ(TERMINAL_HISTORY_LIMIT, 256u);
}

TEST_F(SecurityConfigTest, LargestChunkFitsInFrame) {
    // kind + sequence + tag + index + length + checksum + AEAD tag
    size_t overhead = 1 + 8 + 1 + 8 + CHUNK_CHECKSUM_SIZE + CHACHA20_TAG_SIZE;
    EXPECT_LE(MAX_CHUNK_SIZE + overhead, MAX_FRAME_SIZE);
}

TEST_F(SecurityConfigTest, CryptoSizesAreCorrect) {
    EXPECT_EQ(ED25519_SIGNATURE_SIZE, 64u);
    EXPECT_EQ(ED25519_PUBKEY_SIZE, 32u);
    EXPECT_EQ(X25519_PUBKEY_SIZE, 32u);
    EXPECT_EQ(CHACHA20_NONCE_SIZE, 12u);
    EXPECT_EQ(CHACHA20_TAG_SIZE, 16u);
}

TEST_F(SecurityConfigTest, DefaultPortsDiffer) {
    EXPECT_NE(DEFAULT_TRANSFER_PORT, DEFAULT_DISCOVERY_PORT);
    EXPECT_GT(DEFAULT_TRANSFER_PORT, 1024);
}

// ============================================================================
// Identifier Validation Tests
// ============================================================================

TEST_F(SecurityConfigTest, ValidateIdentifierValid) {
    EXPECT_TRUE(validate_identifier("device"));
    EXPECT_TRUE(validate_identifier("laptop-0a1b2c3d"));
    EXPECT_TRUE(validate_identifier("my_device.local"));
    EXPECT_TRUE(validate_identifier("ABC123"));
}

TEST_F(SecurityConfigTest, ValidateIdentifierInvalid) {
    EXPECT_FALSE(validate_identifier(""));
    EXPECT_FALSE(validate_identifier("has space"));
    EXPECT_FALSE(validate_identifier("semi;colon"));
    EXPECT_FALSE(validate_identifier("slash/inside"));
    EXPECT_FALSE(validate_identifier("$(whoami)"));
}

TEST_F(SecurityConfigTest, ValidateIdentifierLength) {
    EXPECT_TRUE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH, 'a')));
    EXPECT_FALSE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH + 1, 'a')));
    EXPECT_FALSE(validate_identifier("abcdef", 5));
}

TEST_F(SecurityConfigTest, ValidateIdentifierUnicode) {
    EXPECT_FALSE(validate_identifier("g\xC3\xA9rard"));
}

// ============================================================================
// Display Name Validation Tests
// ============================================================================

TEST_F(SecurityConfigTest, ValidateDisplayNameValid) {
    EXPECT_TRUE(validate_display_name("Living Room TV"));
    EXPECT_TRUE(validate_display_name("Ana's Phone (work)"));
    EXPECT_TRUE(validate_display_name("G\xC3\xA9rard"));
}

TEST_F(SecurityConfigTest, ValidateDisplayNameInvalid) {
    EXPECT_FALSE(validate_display_name(""));
    EXPECT_FALSE(validate_display_name("tab\there"));
    EXPECT_FALSE(validate_display_name(std::string("nul\0byte", 8)));
    EXPECT_FALSE(validate_display_name("del\x7f"));
    EXPECT_FALSE(validate_display_name(std::string(MAX_DISPLAY_NAME_LENGTH + 1, 'n')));
}

// ============================================================================
// Filename Sanitization Tests
// ============================================================================

TEST_F(SecurityConfigTest, SanitizeFilenameValid) {
    EXPECT_EQ(sanitize_filename("photo.jpg"), "photo.jpg");
    EXPECT_EQ(sanitize_filename("my report v2.pdf"), "my report v2.pdf");
}

TEST_F(SecurityConfigTest, SanitizeFilenamePathTraversal) {
    EXPECT_EQ(sanitize_filename("../../etc/passwd"), "passwd");
    EXPECT_EQ(sanitize_filename("..\\..\\windows\\system.ini"), "system.ini");
}

TEST_F(SecurityConfigTest, SanitizeFilenameAbsolutePath) {
    EXPECT_EQ(sanitize_filename("/etc/shadow"), "shadow");
}

TEST_F(SecurityConfigTest, SanitizeFilenameSpecialCharacters) {
    EXPECT_EQ(sanitize_filename("a<b>c:d\"e|f?g*h"), "a_b_c_d_e_f_g_h");
}

TEST_F(SecurityConfigTest, SanitizeFilenameNothingUsable) {
    EXPECT_EQ(sanitize_filename(""), "");
    EXPECT_EQ(sanitize_filename(".."), "");
    EXPECT_EQ(sanitize_filename("dir/"), "");
    EXPECT_EQ(sanitize_filename(" . "), "");
}

TEST_F(SecurityConfigTest, SanitizeFilenameLeadingDots) {
    EXPECT_EQ(sanitize_filename(".bashrc"), "bashrc");
}

TEST_F(SecurityConfigTest, SanitizeFilenameNullBytes) {
    std::string with_null("evil\0.md", 8);
    EXPECT_EQ(sanitize_filename(with_null), "evil.md");
}

TEST_F(SecurityConfigTest, SanitizeFilenameTooLongKeepsExtension) {
    std::string name = std::string(400, 'x') + ".tar.gz";
    std::string result = sanitize_filename(name);

    EXPECT_EQ(result.length(), MAX_FILENAME_LENGTH);
    EXPECT_EQ(result.substr(result.length() - 3), ".gz");
}

// ============================================================================
// Path Safety Tests
// ============================================================================

TEST_F(SecurityConfigTest, IsSafePathWithinBase) {
    EXPECT_TRUE(is_safe_path(test_dir_ / "subdir" / "file.txt", test_dir_));
}

TEST_F(SecurityConfigTest, IsSafePathTraversalAttack) {
    EXPECT_FALSE(is_safe_path(test_dir_ / ".." / ".." / "etc" / "passwd", test_dir_));
}

TEST_F(SecurityConfigTest, IsSafePathAbsoluteOutside) {
    EXPECT_FALSE(is_safe_path("/etc/passwd", test_dir_));
}

TEST_F(SecurityConfigTest, IsSafePathSymlinkAttack) {
    fs::path subdir = test_dir_ / "subdir";
    fs::create_directories(subdir);

    fs::path symlink_path = subdir / "evil_link";
    try {
        fs::create_symlink("/etc", symlink_path);
    } catch (const fs::filesystem_error&) {
        GTEST_SKIP() << "Cannot create symlinks in test environment";
    }

    EXPECT_FALSE(is_safe_path(symlink_path / "passwd", test_dir_));
}

// ============================================================================
// Directory Layout Tests
// ============================================================================

TEST_F(SecurityConfigTest, DataDirectoryFromEnvironment) {
    const char* previous = std::getenv("LANSHARE_DATA_DIR");
    std::string saved = previous ? previous : "";

    fs::path custom = test_dir_ / "custom";
    setenv("LANSHARE_DATA_DIR", custom.c_str(), 1);
    auto data_dir = get_data_directory();

    if (previous) {
        setenv("LANSHARE_DATA_DIR", saved.c_str(), 1);
    } else {
        unsetenv("LANSHARE_DATA_DIR");
    }

    EXPECT_EQ(data_dir, custom);
    EXPECT_TRUE(fs::is_directory(custom));
}

TEST_F(SecurityConfigTest, SubdirectoriesAreCreated) {
    auto received = get_received_directory(test_dir_);
    auto db = get_database_directory(test_dir_);
    auto logs = get_log_directory(test_dir_);

    EXPECT_EQ(received, test_dir_ / "received");
    EXPECT_EQ(db, test_dir_ / "db");
    EXPECT_EQ(logs, test_dir_ / "logs");
    EXPECT_TRUE(fs::is_directory(received));
    EXPECT_TRUE(fs::is_directory(db));
    EXPECT_TRUE(fs::is_directory(logs));
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(SecurityConfigTest, ConcurrentSanitizeFilename) {
    const int num_threads = 10;
    std::vector<std::thread> threads;
    std::vector<std::string> results(num_threads);

    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&results, i]() {
            results[i] = sanitize_filename("../file_" + std::to_string(i) + ".txt");
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < num_threads; i++) {
        EXPECT_EQ(results[i], "file_" + std::to_string(i) + ".txt");
    }
}
