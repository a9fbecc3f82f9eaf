// tests/test_worker.cpp
#include <gtest/gtest.h>
#include "fakes.hpp"

#include <core/worker.hpp>

#include <poll.h>

#include <memory>

namespace bluetray {
namespace testing {

static bool fd_readable(int fd) {
    pollfd pfd = {};
    pfd.fd = fd;
    pfd.events = POLLIN;
    return poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN);
}

class ConnectionWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_unique<ConnectionRegistry>(transport);
        worker = std::make_unique<ConnectionWorker>(*registry);
        worker->start();
    }

    void TearDown() override {
        worker.reset();
        registry.reset();
    }

    const DeviceId headset{"A1:00:00:00:00:01"};
    const DeviceId keyboard{"B2:00:00:00:00:02"};

    FakeTransport transport;
    std::unique_ptr<ConnectionRegistry> registry;
    std::unique_ptr<ConnectionWorker> worker;
};

TEST_F(ConnectionWorkerTest, ConnectFutureCarriesResult) {
    auto result = worker->submit_connect(headset).get();

    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(registry->is_connected(headset));
}

TEST_F(ConnectionWorkerTest, CompletionsArriveInOrder) {
    transport.fail(keyboard, {ConnectErrorKind::Unreachable, "Host is down"});

    (void)worker->submit_connect(headset);
    (void)worker->submit_connect(keyboard);
    (void)worker->submit_disconnect_all();
    (void)worker->submit_disconnect_all();
    worker->wait_idle();

    auto completions = worker->take_completions();
    ASSERT_EQ(completions.size(), 4u);

    EXPECT_EQ(completions[0].kind, RequestKind::Connect);
    EXPECT_EQ(completions[0].device, headset);
    EXPECT_TRUE(completions[0].connect.ok());

    EXPECT_EQ(completions[1].kind, RequestKind::Connect);
    EXPECT_EQ(completions[1].device, keyboard);
    ASSERT_FALSE(completions[1].connect.ok());
    EXPECT_EQ(completions[1].connect.error->kind, ConnectErrorKind::Unreachable);

    EXPECT_EQ(completions[2].kind, RequestKind::DisconnectAll);
    EXPECT_EQ(completions[2].released, 1u);

    EXPECT_EQ(completions[3].kind, RequestKind::DisconnectAll);
    EXPECT_EQ(completions[3].released, 0u);

    EXPECT_TRUE(worker->take_completions().empty());
}

TEST_F(ConnectionWorkerTest, EventFdSignalsPendingCompletions) {
    ASSERT_GE(worker->get_fd(), 0);
    EXPECT_FALSE(fd_readable(worker->get_fd()));

    (void)worker->submit_connect(headset).get();
    EXPECT_TRUE(fd_readable(worker->get_fd()));

    EXPECT_EQ(worker->take_completions().size(), 1u);
    EXPECT_FALSE(fd_readable(worker->get_fd()));
}

TEST_F(ConnectionWorkerTest, DisconnectAllFutureReportsReleaseCount) {
    ASSERT_TRUE(worker->submit_connect(headset).get().ok());

    EXPECT_EQ(worker->submit_disconnect_all().get(), 1u);
    EXPECT_EQ(worker->submit_disconnect_all().get(), 0u);
    EXPECT_EQ(transport.closes.load(), 1);
}

TEST_F(ConnectionWorkerTest, DiscoveryRunsOnWorker) {
    FakeDeviceSource source;
    source.devices = {paired("A1:00:00:00:00:01", "Headset"),
                      paired("C3:00:00:00:00:03", std::nullopt)};

    auto devices = worker->submit_discovery(source, UnnamedDevicePolicy::Skip).get();

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].name, "Headset");
    // Discovery is not a registry request
    EXPECT_TRUE(worker->take_completions().empty());
}

TEST_F(ConnectionWorkerTest, StopRunsQueuedRequests) {
    transport.delay = std::chrono::milliseconds(20);

    auto first = worker->submit_connect(headset);
    auto second = worker->submit_connect(keyboard);
    worker->stop();

    EXPECT_FALSE(worker->is_running());
    EXPECT_TRUE(first.get().ok());
    EXPECT_TRUE(second.get().ok());
    EXPECT_EQ(registry->size(), 2u);
}

TEST_F(ConnectionWorkerTest, RequestAfterStopIsDropped) {
    worker->stop();

    auto future = worker->submit_connect(headset);

    EXPECT_THROW(future.get(), std::future_error);
    EXPECT_EQ(transport.total_open_calls(), 0);
}

TEST_F(ConnectionWorkerTest, ThrowingTransportStillCompletes) {
    transport.throw_next = true;

    auto failed = worker->submit_connect(headset).get();
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error->kind, ConnectErrorKind::Transport);

    auto completions = worker->take_completions();
    ASSERT_EQ(completions.size(), 1u);
    EXPECT_FALSE(completions[0].connect.ok());

    // Worker keeps serving the same device afterwards
    auto retry = worker->submit_connect(headset);
    ASSERT_EQ(retry.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(retry.get().ok());
}

TEST_F(ConnectionWorkerTest, RepeatedConnectIsAlreadyConnected) {
    (void)worker->submit_connect(headset);
    auto again = worker->submit_connect(headset).get();

    EXPECT_TRUE(again.ok());
    EXPECT_TRUE(again.already_connected);
    EXPECT_EQ(transport.open_calls(headset), 1);
}

} // namespace testing
} // namespace bluetray
