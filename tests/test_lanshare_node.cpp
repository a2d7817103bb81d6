/**
 * @file test_lanshare_node.cpp
 * @brief Integration tests for LanshareNode
 *
 * Two nodes run on loopback with ephemeral ports and discovery disabled;
 * devices are added manually through the probe exchange.
 * - Lifecycle and identity persistence
 * - Manual add, trust and forget
 * - End-to-end file transfer with status events
 * - Consent handling when auto-accept is off
 * - Shared folder browsing and downloads, gated by trust
 */

#include <gtest/gtest.h>
#include "lanshare/lanshare_node.hpp"
#include "lanshare/errors.hpp"
#include "test_support.hpp"
#include <atomic>
#include <regex>
#include <thread>

using namespace lanshare;
using namespace lanshare::testing_support;
namespace fs = std::filesystem;

class LanshareNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_temp_dir("lanshare_node_test");
    }

    void TearDown() override {
        for (auto& node : nodes_) {
            node->stop();
        }
        nodes_.clear();
        if (fs::exists(dir_)) {
            fs::remove_all(dir_);
        }
    }

    NodeConfig config_for(const std::string& name) {
        NodeConfig config = default_config(dir_ / name);
        config.device_name = name;
        config.port = 0;
        config.discovery_enabled = false;
        config.discovery_port = 0;
        config.chunk_size = 16 * 1024;
        config.io_timeout_seconds = 5;
        config.probe_timeout_ms = 1000;
        config.log_level = "warn";
        return config;
    }

    LanshareNode& start_node(NodeConfig config) {
        nodes_.push_back(std::make_unique<LanshareNode>(std::move(config)));
        EXPECT_TRUE(nodes_.back()->start());
        return *nodes_.back();
    }

    static std::optional<TransferSession> wait_terminal(const LanshareNode& node, const std::string& id) {
        for (int i = 0; i < 1000; i++) {
            auto session = node.transfer_status(id);
            if (session && is_terminal(session->state)) {
                return session;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return node.transfer_status(id);
    }

    static std::optional<TransferSession> wait_history(const LanshareNode& node) {
        for (int i = 0; i < 1000; i++) {
            auto history = node.transfer_history();
            if (!history.empty()) {
                return history.back();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return std::nullopt;
    }

    /// beta shares a folder with alpha; both have added each other
    void share_between(LanshareNode& alpha, LanshareNode& beta) {
        ASSERT_TRUE(alpha.add_device("127.0.0.1", beta.get_port()).has_value());
        ASSERT_TRUE(beta.add_device("127.0.0.1", alpha.get_port()).has_value());
    }

    NodeConfig sharing_config(const std::string& name) {
        NodeConfig config = config_for(name);
        config.shared_dir = dir_ / name / "share";
        fs::create_directories(config.shared_dir);
        return config;
    }

    static std::optional<ErrorKind> listing_error(LanshareNode& node, const std::string& peer_id,
                                                  const std::string& path) {
        try {
            node.list_remote_dir(peer_id, path);
        } catch (const LanshareError& e) {
            return e.kind();
        }
        return std::nullopt;
    }

    fs::path dir_;
    std::vector<std::unique_ptr<LanshareNode>> nodes_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(LanshareNodeTest, StartAndStop) {
    LanshareNode& node = start_node(config_for("alpha"));

    EXPECT_TRUE(node.is_running());
    EXPECT_NE(node.get_port(), 0);
    EXPECT_EQ(node.get_discovery_port(), 0);
    EXPECT_FALSE(node.get_device_id().empty());
    EXPECT_FALSE(node.announce());
    EXPECT_FALSE(node.start());

    EXPECT_TRUE(fs::exists(dir_ / "alpha" / "identity.json"));
    EXPECT_TRUE(fs::exists(dir_ / "alpha" / "received"));

    node.stop();
    EXPECT_FALSE(node.is_running());
    node.stop();
}

TEST_F(LanshareNodeTest, IdentitySurvivesRestart) {
    std::string first_id;
    {
        LanshareNode node(config_for("alpha"));
        ASSERT_TRUE(node.start());
        first_id = node.get_device_id();
        node.stop();
    }

    LanshareNode& again = start_node(config_for("alpha"));
    EXPECT_EQ(again.get_device_id(), first_id);
}

TEST_F(LanshareNodeTest, InvalidConfigRejected) {
    NodeConfig config = config_for("alpha");
    config.chunk_size = 1;
    EXPECT_THROW(LanshareNode node(config), std::invalid_argument);
}

TEST_F(LanshareNodeTest, PairingCodeFormat) {
    LanshareNode& node = start_node(config_for("alpha"));

    std::string code = node.pairing_code();
    EXPECT_TRUE(std::regex_match(code, std::regex("[0-9A-F]{4}-[0-9A-F]{4}"))) << code;
    EXPECT_EQ(code, node.pairing_code());

    ConnectionInfo info = node.connection_info();
    EXPECT_EQ(info.device_id, node.get_device_id());
    EXPECT_EQ(info.display_name, "alpha");
    EXPECT_EQ(info.port, node.get_port());
    EXPECT_EQ(info.pairing_code, code);
}

// ============================================================================
// Devices
// ============================================================================

TEST_F(LanshareNodeTest, AddDeviceByProbe) {
    LanshareNode& alpha = start_node(config_for("alpha"));
    LanshareNode& beta = start_node(config_for("beta"));

    auto device = alpha.add_device("127.0.0.1", beta.get_port());
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->id, beta.get_device_id());
    EXPECT_EQ(device->display_name, "beta");
    EXPECT_EQ(device->status, DeviceStatus::Online);
    EXPECT_TRUE(device->trusted);

    EXPECT_EQ(alpha.list_devices().size(), 1u);
    EXPECT_TRUE(alpha.get_device(beta.get_device_id()).has_value());
}

TEST_F(LanshareNodeTest, AddDeviceRejectsSelfAndSilence) {
    LanshareNode& alpha = start_node(config_for("alpha"));

    EXPECT_FALSE(alpha.add_device("127.0.0.1", alpha.get_port()).has_value());
    EXPECT_FALSE(alpha.add_device("127.0.0.1", 1).has_value());
    EXPECT_TRUE(alpha.list_devices().empty());
}

TEST_F(LanshareNodeTest, TrustedDevicesReloadAsUnknown) {
    std::string beta_id;
    {
        LanshareNode& beta = start_node(config_for("beta"));
        beta_id = beta.get_device_id();

        LanshareNode alpha(config_for("alpha"));
        ASSERT_TRUE(alpha.start());
        ASSERT_TRUE(alpha.add_device("127.0.0.1", beta.get_port()).has_value());
        alpha.stop();
    }

    LanshareNode& alpha = start_node(config_for("alpha"));
    auto device = alpha.get_device(beta_id);
    ASSERT_TRUE(device.has_value());
    EXPECT_TRUE(device->trusted);
    EXPECT_EQ(device->status, DeviceStatus::Unknown);

    EXPECT_TRUE(alpha.forget_device(beta_id));
    EXPECT_FALSE(alpha.get_device(beta_id).has_value());
    EXPECT_FALSE(alpha.forget_device(beta_id));
}

TEST_F(LanshareNodeTest, TrustUnknownDeviceFails) {
    LanshareNode& alpha = start_node(config_for("alpha"));
    EXPECT_FALSE(alpha.trust_device("nobody-00000000"));
}

// ============================================================================
// Transfers
// ============================================================================

TEST_F(LanshareNodeTest, SendFileEndToEnd) {
    LanshareNode& alpha = start_node(config_for("alpha"));
    LanshareNode& beta = start_node(config_for("beta"));
    auto beta_feed = beta.subscribe_status();

    ASSERT_TRUE(alpha.add_device("127.0.0.1", beta.get_port()).has_value());

    fs::path source = dir_ / "holiday.jpg";
    auto content = write_random_file(source, 200 * 1024 + 11);

    std::string id = alpha.send(beta.get_device_id(), source.string());
    auto sent = wait_terminal(alpha, id);
    ASSERT_TRUE(sent.has_value());
    ASSERT_EQ(sent->state, TransferState::Completed) << sent->reason;
    EXPECT_EQ(sent->bytes_transferred, content.size());

    auto received = wait_history(beta);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->state, TransferState::Completed);
    EXPECT_EQ(received->peer_id, alpha.get_device_id());
    EXPECT_EQ(received->integrity_digest, sent->integrity_digest);
    EXPECT_EQ(read_whole_file(dir_ / "beta" / "received" / "holiday.jpg"), content);

    // The receiver reports the whole lifecycle
    bool started = false;
    bool completed = false;
    while (auto event = beta_feed->try_next()) {
        started = started || event->type == StatusEventType::TransferStarted;
        completed = completed || event->type == StatusEventType::TransferCompleted;
    }
    EXPECT_TRUE(started);
    EXPECT_TRUE(completed);
}

TEST_F(LanshareNodeTest, SendToOfflineDeviceFailsFast) {
    LanshareNode& alpha = start_node(config_for("alpha"));
    fs::path source = dir_ / "a.txt";
    write_random_file(source, 10);

    EXPECT_THROW(alpha.send("nobody-00000000", source.string()), NetworkError);
    EXPECT_TRUE(alpha.transfer_history().empty());
}

TEST_F(LanshareNodeTest, ConsentCallbackDeclines) {
    LanshareNode& alpha = start_node(config_for("alpha"));
    NodeConfig beta_config = config_for("beta");
    beta_config.auto_accept = false;
    LanshareNode& beta = start_node(beta_config);

    std::atomic<int> asked(0);
    beta.set_accept_callback([&asked](const std::string&, const HeaderMessage& header) {
        asked++;
        return header.file_name != "secret.txt";
    });

    ASSERT_TRUE(alpha.add_device("127.0.0.1", beta.get_port()).has_value());
    fs::path source = dir_ / "secret.txt";
    write_random_file(source, 100);

    std::string id = alpha.send(beta.get_device_id(), source.string());
    auto result = wait_terminal(alpha, id);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, TransferState::Aborted);
    EXPECT_EQ(*result->error, ErrorKind::Rejected);
    EXPECT_EQ(asked.load(), 1);
    EXPECT_FALSE(fs::exists(dir_ / "beta" / "received" / "secret.txt"));
}

TEST_F(LanshareNodeTest, SendRequiresRunningNode) {
    LanshareNode node(config_for("alpha"));
    EXPECT_THROW(node.send("peer", "/tmp/x"), ResourceError);
    EXPECT_TRUE(node.list_transfers().empty());
}

TEST_F(LanshareNodeTest, SingleHandshakeWorkerServesConnections) {
    NodeConfig beta_config = config_for("beta");
    beta_config.max_concurrent_handshakes = 1;
    LanshareNode& alpha = start_node(config_for("alpha"));
    LanshareNode& beta = start_node(beta_config);

    ASSERT_TRUE(alpha.add_device("127.0.0.1", beta.get_port()).has_value());
    fs::path source = dir_ / "one.bin";
    write_random_file(source, 40 * 1024);

    for (int round = 0; round < 2; round++) {
        std::string id = alpha.send(beta.get_device_id(), source.string());
        auto result = wait_terminal(alpha, id);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result->state, TransferState::Completed) << result->reason;
    }
}

// ============================================================================
// Shared Folders
// ============================================================================

TEST_F(LanshareNodeTest, BrowseSharedFolder) {
    LanshareNode& alpha = start_node(config_for("alpha"));
    NodeConfig beta_config = sharing_config("beta");
    write_random_file(beta_config.shared_dir / "notes.txt", 10);
    fs::create_directories(beta_config.shared_dir / "sub");
    write_random_file(beta_config.shared_dir / "sub" / "deep.bin", 2048);
    LanshareNode& beta = start_node(beta_config);
    share_between(alpha, beta);

    DirListingMessage root = alpha.list_remote_dir(beta.get_device_id(), "");
    EXPECT_EQ(root.path, "");
    EXPECT_FALSE(root.truncated);
    ASSERT_EQ(root.entries.size(), 2u);
    EXPECT_EQ(root.entries[0].name, "notes.txt");
    EXPECT_FALSE(root.entries[0].is_dir);
    EXPECT_EQ(root.entries[0].size, 10u);
    EXPECT_EQ(root.entries[1].name, "sub");
    EXPECT_TRUE(root.entries[1].is_dir);

    DirListingMessage sub = alpha.list_remote_dir(beta.get_device_id(), "sub");
    ASSERT_EQ(sub.entries.size(), 1u);
    EXPECT_EQ(sub.entries[0].name, "deep.bin");
    EXPECT_EQ(sub.entries[0].size, 2048u);

    // "." and a path that comes back to the root both name the root
    EXPECT_EQ(alpha.list_remote_dir(beta.get_device_id(), ".").entries.size(), 2u);
    EXPECT_EQ(alpha.list_remote_dir(beta.get_device_id(), "sub/..").entries.size(), 2u);
}

TEST_F(LanshareNodeTest, BrowseRequiresTrustAndSharing) {
    LanshareNode& alpha = start_node(config_for("alpha"));
    LanshareNode& beta = start_node(sharing_config("beta"));
    LanshareNode& gamma = start_node(config_for("gamma"));

    // beta has never added alpha, so alpha is not trusted there
    ASSERT_TRUE(alpha.add_device("127.0.0.1", beta.get_port()).has_value());
    EXPECT_TRUE(listing_error(alpha, beta.get_device_id(), "") == ErrorKind::Rejected);

    ASSERT_TRUE(beta.add_device("127.0.0.1", alpha.get_port()).has_value());
    EXPECT_FALSE(listing_error(alpha, beta.get_device_id(), "").has_value());

    // gamma trusts alpha but shares nothing
    ASSERT_TRUE(alpha.add_device("127.0.0.1", gamma.get_port()).has_value());
    ASSERT_TRUE(gamma.add_device("127.0.0.1", alpha.get_port()).has_value());
    EXPECT_TRUE(listing_error(alpha, gamma.get_device_id(), "") == ErrorKind::Rejected);

    EXPECT_THROW(alpha.list_remote_dir("nobody-00000000", ""), NetworkError);
}

TEST_F(LanshareNodeTest, BrowseStaysInsideSharedFolder) {
    LanshareNode& alpha = start_node(config_for("alpha"));
    NodeConfig beta_config = sharing_config("beta");
    write_random_file(beta_config.shared_dir / "inside.txt", 4);
    fs::create_directories(dir_ / "beta" / "private");
    write_random_file(dir_ / "beta" / "private" / "secret.txt", 4);

    std::error_code ec;
    fs::create_directory_symlink(dir_ / "beta" / "private", beta_config.shared_dir / "escape", ec);
    bool linked = !ec;

    LanshareNode& beta = start_node(beta_config);
    share_between(alpha, beta);
    const std::string beta_id = beta.get_device_id();

    EXPECT_TRUE(listing_error(alpha, beta_id, "..") == ErrorKind::Resource);
    EXPECT_TRUE(listing_error(alpha, beta_id, "../private") == ErrorKind::Resource);
    EXPECT_TRUE(listing_error(alpha, beta_id, (dir_ / "beta" / "private").string()) == ErrorKind::Resource);
    EXPECT_TRUE(listing_error(alpha, beta_id, "missing") == ErrorKind::Resource);
    EXPECT_TRUE(listing_error(alpha, beta_id, "inside.txt") == ErrorKind::Resource);

    if (linked) {
        EXPECT_TRUE(listing_error(alpha, beta_id, "escape") == ErrorKind::Resource);
        DirListingMessage root = alpha.list_remote_dir(beta_id, "");
        ASSERT_EQ(root.entries.size(), 1u);
        EXPECT_EQ(root.entries[0].name, "inside.txt");
    }
}

TEST_F(LanshareNodeTest, DownloadFromSharedFolder) {
    LanshareNode& alpha = start_node(config_for("alpha"));
    NodeConfig beta_config = sharing_config("beta");
    fs::create_directories(beta_config.shared_dir / "docs");
    auto content = write_random_file(beta_config.shared_dir / "docs" / "manual.pdf", 100 * 1024 + 3);
    LanshareNode& beta = start_node(beta_config);
    share_between(alpha, beta);

    std::string id = alpha.download(beta.get_device_id(), "docs/manual.pdf");
    auto pulled = wait_terminal(alpha, id);

    ASSERT_TRUE(pulled.has_value());
    ASSERT_EQ(pulled->state, TransferState::Completed) << pulled->reason;
    EXPECT_EQ(pulled->direction, TransferDirection::Receive);
    EXPECT_EQ(pulled->peer_id, beta.get_device_id());
    EXPECT_EQ(read_whole_file(dir_ / "alpha" / "received" / "manual.pdf"), content);

    auto served = wait_history(beta);
    ASSERT_TRUE(served.has_value());
    EXPECT_EQ(served->direction, TransferDirection::Send);
    EXPECT_EQ(served->state, TransferState::Completed);
}

TEST_F(LanshareNodeTest, DownloadRefusals) {
    LanshareNode& alpha = start_node(config_for("alpha"));
    LanshareNode& beta = start_node(sharing_config("beta"));
    share_between(alpha, beta);

    for (const std::string& path : {std::string("absent.bin"), std::string("../identity.json"), std::string("")}) {
        SCOPED_TRACE(path);
        std::string id = alpha.download(beta.get_device_id(), path);
        auto result = wait_terminal(alpha, id);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result->state, TransferState::Aborted);
        ASSERT_TRUE(result->error.has_value());
        EXPECT_EQ(*result->error, ErrorKind::Resource);
    }
    EXPECT_TRUE(fs::is_empty(dir_ / "alpha" / "received"));
    EXPECT_TRUE(beta.transfer_history().empty());

    EXPECT_THROW(alpha.download("nobody-00000000", "absent.bin"), NetworkError);
}
