// tests/test_registry.cpp
#include <gtest/gtest.h>
#include "fakes.hpp"

#include <core/registry.hpp>

#include <future>
#include <memory>
#include <thread>

namespace bluetray {
namespace testing {

class ConnectionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_unique<ConnectionRegistry>(transport);
    }

    void TearDown() override {
        registry.reset();
    }

    const DeviceId headset{"A1:00:00:00:00:01"};
    const DeviceId keyboard{"B2:00:00:00:00:02"};

    FakeTransport transport;
    std::unique_ptr<ConnectionRegistry> registry;
};

TEST_F(ConnectionRegistryTest, StartsEmpty) {
    EXPECT_EQ(registry->size(), 0u);
    EXPECT_FALSE(registry->is_connected(headset));
    EXPECT_TRUE(registry->connected_ids().empty());
}

TEST_F(ConnectionRegistryTest, ConnectStoresLink) {
    ConnectResult result = registry->connect(headset);

    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.already_connected);
    EXPECT_TRUE(registry->is_connected(headset));
    EXPECT_FALSE(registry->is_connected(keyboard));
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(ConnectionRegistryTest, SecondConnectMakesNoPlatformCall) {
    ASSERT_TRUE(registry->connect(headset).ok());
    ConnectResult again = registry->connect(headset);

    EXPECT_TRUE(again.ok());
    EXPECT_TRUE(again.already_connected);
    EXPECT_EQ(transport.open_calls(headset), 1);
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(ConnectionRegistryTest, FailedConnectLeavesNoState) {
    const DeviceId unreachable("X9:00:00:00:00:09");
    transport.fail(unreachable, {ConnectErrorKind::Unreachable, "Host is down"});
    ASSERT_TRUE(registry->connect(headset).ok());

    ConnectResult result = registry->connect(unreachable);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ConnectErrorKind::Unreachable);
    EXPECT_EQ(result.error->reason, "Host is down");
    EXPECT_FALSE(registry->is_connected(unreachable));
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(ConnectionRegistryTest, FailedConnectCanBeRetried) {
    transport.fail(headset, {ConnectErrorKind::Timeout, "timed out"});
    EXPECT_FALSE(registry->connect(headset).ok());
    EXPECT_FALSE(registry->connect(headset).ok());

    EXPECT_EQ(transport.open_calls(headset), 2);
    EXPECT_EQ(registry->size(), 0u);
}

TEST_F(ConnectionRegistryTest, ClosedLinkIsRejected) {
    transport.return_closed = true;

    ConnectResult result = registry->connect(headset);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ConnectErrorKind::Transport);
    EXPECT_FALSE(registry->is_connected(headset));
}

TEST_F(ConnectionRegistryTest, ThrowingTransportReportsErrorAndReleasesReservation) {
    transport.throw_next = true;

    ConnectResult result;
    EXPECT_NO_THROW(result = registry->connect(headset));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ConnectErrorKind::Transport);
    EXPECT_FALSE(registry->is_connected(headset));
    EXPECT_EQ(registry->size(), 0u);

    // The device must not stay reserved after the failure
    auto retry = std::async(std::launch::async, [this] { return registry->connect(headset); });
    ASSERT_EQ(retry.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(retry.get().ok());
    EXPECT_TRUE(registry->is_connected(headset));
    EXPECT_EQ(transport.open_calls(headset), 2);
}

TEST_F(ConnectionRegistryTest, DisconnectReleasesAndIsIdempotent) {
    ASSERT_TRUE(registry->connect(headset).ok());

    EXPECT_TRUE(registry->disconnect(headset));
    EXPECT_FALSE(registry->is_connected(headset));
    EXPECT_EQ(transport.closes.load(), 1);

    EXPECT_FALSE(registry->disconnect(headset));
    EXPECT_EQ(transport.closes.load(), 1);
}

TEST_F(ConnectionRegistryTest, ReconnectAfterDisconnectOpensAgain) {
    ASSERT_TRUE(registry->connect(headset).ok());
    ASSERT_TRUE(registry->disconnect(headset));

    ConnectResult result = registry->connect(headset);

    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.already_connected);
    EXPECT_EQ(transport.open_calls(headset), 2);
}

TEST_F(ConnectionRegistryTest, DisconnectAllReleasesEverything) {
    ASSERT_TRUE(registry->connect(headset).ok());
    ASSERT_TRUE(registry->connect(keyboard).ok());

    EXPECT_EQ(registry->disconnect_all(), 2u);
    EXPECT_EQ(registry->size(), 0u);
    EXPECT_EQ(transport.closes.load(), 2);
    EXPECT_EQ(registry->disconnect_all(), 0u);
}

TEST_F(ConnectionRegistryTest, ConnectedIdsAreSorted) {
    ASSERT_TRUE(registry->connect(keyboard).ok());
    ASSERT_TRUE(registry->connect(headset).ok());

    std::vector<DeviceId> expected{headset, keyboard};
    EXPECT_EQ(registry->connected_ids(), expected);
}

TEST_F(ConnectionRegistryTest, DestructionReleasesLinks) {
    ASSERT_TRUE(registry->connect(headset).ok());
    ASSERT_TRUE(registry->connect(keyboard).ok());

    EXPECT_NO_THROW(registry.reset());
    EXPECT_EQ(transport.closes.load(), 2);
}

TEST_F(ConnectionRegistryTest, ConcurrentConnectsOpenOnce) {
    transport.delay = std::chrono::milliseconds(100);

    ConnectResult first, second;
    std::thread a([&] { first = registry->connect(headset); });
    std::thread b([&] { second = registry->connect(headset); });
    a.join();
    b.join();

    EXPECT_EQ(transport.open_calls(headset), 1);
    EXPECT_TRUE(first.ok());
    EXPECT_TRUE(second.ok());
    // Exactly one of them did the work
    EXPECT_NE(first.already_connected, second.already_connected);
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(ConnectionRegistryTest, ConcurrentConnectsForDifferentDevices) {
    transport.delay = std::chrono::milliseconds(50);

    std::thread a([&] { EXPECT_TRUE(registry->connect(headset).ok()); });
    std::thread b([&] { EXPECT_TRUE(registry->connect(keyboard).ok()); });
    a.join();
    b.join();

    EXPECT_EQ(transport.total_open_calls(), 2);
    EXPECT_EQ(registry->size(), 2u);
}

} // namespace testing
} // namespace bluetray
