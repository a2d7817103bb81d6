/**
 * @file test_status_events.cpp
 * @brief Unit tests for EventBus and StatusSubscription
 *
 * Tests cover:
 * - Fan-out to every live subscription in publish order
 * - Registry event mapping
 * - Closing semantics and dropped subscribers
 * - Blocking waits and concurrent publishers
 */

#include <gtest/gtest.h>
#include "lanshare/status_events.hpp"
#include <map>
#include <thread>

using namespace lanshare;

namespace {

Device make_device(const std::string& id) {
    Device device;
    device.id = id;
    device.display_name = id;
    device.status = DeviceStatus::Online;
    device.last_seen = Clock::now();
    return device;
}

TransferSession make_session(const std::string& id, uint64_t bytes) {
    TransferSession session;
    session.session_id = id;
    session.peer_id = "peer";
    session.bytes_transferred = bytes;
    session.state = TransferState::Transferring;
    return session;
}

} // namespace

class StatusEventsTest : public ::testing::Test {
protected:
    EventBus bus_;
};

// ============================================================================
// Delivery
// ============================================================================

TEST_F(StatusEventsTest, EverySubscriberReceivesInOrder) {
    auto first = bus_.subscribe();
    auto second = bus_.subscribe();

    bus_.publish_transfer(StatusEventType::TransferStarted, make_session("s1", 0));
    bus_.publish_transfer(StatusEventType::TransferProgress, make_session("s1", 10));
    bus_.publish_transfer(StatusEventType::TransferCompleted, make_session("s1", 20));

    for (const auto& subscription : {first, second}) {
        ASSERT_EQ(subscription->pending(), 3u);
        auto a = subscription->try_next();
        auto b = subscription->try_next();
        auto c = subscription->try_next();
        EXPECT_EQ(a->type, StatusEventType::TransferStarted);
        EXPECT_EQ(b->type, StatusEventType::TransferProgress);
        EXPECT_EQ(b->transfer->bytes_transferred, 10u);
        EXPECT_EQ(c->type, StatusEventType::TransferCompleted);
        EXPECT_FALSE(c->device.has_value());
        EXPECT_FALSE(subscription->try_next().has_value());
    }
}

TEST_F(StatusEventsTest, LateSubscriberMissesEarlierEvents) {
    bus_.publish_device(RegistryEvent::Discovered, make_device("a"));
    auto subscription = bus_.subscribe();
    bus_.publish_device(RegistryEvent::Online, make_device("a"));

    auto event = subscription->try_next();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, StatusEventType::DeviceOnline);
    EXPECT_FALSE(subscription->try_next().has_value());
}

TEST_F(StatusEventsTest, DeviceEventsCarryDevice) {
    auto subscription = bus_.subscribe();
    bus_.publish_device(RegistryEvent::Offline, make_device("phone"));

    auto event = subscription->try_next();
    ASSERT_TRUE(event.has_value());
    ASSERT_TRUE(event->device.has_value());
    EXPECT_EQ(event->device->id, "phone");
    EXPECT_FALSE(event->transfer.has_value());
    EXPECT_NE(event->timestamp, TimePoint{});
}

TEST_F(StatusEventsTest, RegistryEventMapping) {
    EXPECT_EQ(status_event_type(RegistryEvent::Discovered), StatusEventType::DeviceDiscovered);
    EXPECT_EQ(status_event_type(RegistryEvent::Online), StatusEventType::DeviceOnline);
    EXPECT_EQ(status_event_type(RegistryEvent::Offline), StatusEventType::DeviceOffline);
    EXPECT_EQ(status_event_type(RegistryEvent::Removed), StatusEventType::DeviceRemoved);

    EXPECT_EQ(to_string(StatusEventType::TransferAborted), "TransferAborted");
    EXPECT_EQ(to_string(StatusEventType::DeviceDiscovered), "DeviceDiscovered");
}

// ============================================================================
// Closing
// ============================================================================

TEST_F(StatusEventsTest, ClosedSubscriptionDrainsThenEnds) {
    auto subscription = bus_.subscribe();
    bus_.publish_device(RegistryEvent::Discovered, make_device("a"));
    subscription->close();
    bus_.publish_device(RegistryEvent::Online, make_device("a"));

    EXPECT_TRUE(subscription->is_closed());
    auto event = subscription->next(std::chrono::milliseconds(10));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, StatusEventType::DeviceDiscovered);

    // Closed and drained returns at once instead of waiting out the timeout
    auto before = std::chrono::steady_clock::now();
    EXPECT_FALSE(subscription->next(std::chrono::seconds(5)).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(1));
}

TEST_F(StatusEventsTest, CloseAllEndsEverySubscription) {
    auto first = bus_.subscribe();
    auto second = bus_.subscribe();
    EXPECT_EQ(bus_.subscriber_count(), 2u);

    bus_.close_all();

    EXPECT_TRUE(first->is_closed());
    EXPECT_TRUE(second->is_closed());
    EXPECT_EQ(bus_.subscriber_count(), 0u);
}

TEST_F(StatusEventsTest, DroppedSubscriptionIsForgotten) {
    auto kept = bus_.subscribe();
    {
        auto dropped = bus_.subscribe();
        EXPECT_EQ(bus_.subscriber_count(), 2u);
    }
    EXPECT_EQ(bus_.subscriber_count(), 1u);

    EXPECT_NO_THROW(bus_.publish_device(RegistryEvent::Discovered, make_device("a")));
    EXPECT_EQ(kept->pending(), 1u);
}

// ============================================================================
// Blocking and Concurrency
// ============================================================================

TEST_F(StatusEventsTest, NextWaitsForPublish) {
    auto subscription = bus_.subscribe();

    std::thread publisher([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        bus_.publish_device(RegistryEvent::Removed, make_device("gone"));
    });

    auto event = subscription->next(std::chrono::seconds(5));
    publisher.join();

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, StatusEventType::DeviceRemoved);
}

TEST_F(StatusEventsTest, NextTimesOutWhenIdle) {
    auto subscription = bus_.subscribe();
    EXPECT_FALSE(subscription->next(std::chrono::milliseconds(20)).has_value());
    EXPECT_FALSE(subscription->is_closed());
}

TEST_F(StatusEventsTest, ConcurrentPublishersLoseNothing) {
    auto subscription = bus_.subscribe();
    const int publishers = 4;
    const int per_publisher = 250;

    std::vector<std::thread> threads;
    for (int p = 0; p < publishers; p++) {
        threads.emplace_back([this, p, per_publisher]() {
            for (int i = 0; i < per_publisher; i++) {
                bus_.publish_transfer(StatusEventType::TransferProgress,
                                      make_session("s" + std::to_string(p), static_cast<uint64_t>(i)));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    ASSERT_EQ(subscription->pending(), static_cast<size_t>(publishers * per_publisher));

    // Per-publisher order is preserved
    std::map<std::string, uint64_t> next_expected;
    while (auto event = subscription->try_next()) {
        const auto& session = *event->transfer;
        EXPECT_EQ(session.bytes_transferred, next_expected[session.session_id]);
        next_expected[session.session_id]++;
    }
    EXPECT_EQ(next_expected.size(), static_cast<size_t>(publishers));
}
