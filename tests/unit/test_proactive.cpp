#include <gtest/gtest.h>
#include "common/mock_transport.hpp"
#include "websocket/websocket_manager.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tether::websocket;
using tether::network::ConnectionState;
using tether::network::DisconnectReason;
using tether::network::ReconnectStrategy;
using tether::testing::MockServer;
using tether::testing::wait_until;
using namespace std::chrono_literals;

class ProactiveControlTest : public ::testing::Test {
protected:
    Options make_options() {
        Options options;
        options.url = "wss://example.com/stream";
        options.reconnect_delay = 10ms;
        options.ping_interval = 5s;
        options.reconnect_check_interval = 10ms;
        options.transport_factory = server->factory();
        options.hooks.on_disconnect = [this](DisconnectReason r) {
            std::lock_guard lock(mutex);
            reasons.push_back(r);
        };
        return options;
    }

    bool saw(DisconnectReason reason) {
        std::lock_guard lock(mutex);
        return std::find(reasons.begin(), reasons.end(), reason) != reasons.end();
    }

    std::shared_ptr<MockServer> server = std::make_shared<MockServer>();
    std::mutex mutex;
    std::vector<DisconnectReason> reasons;
};

// ============================================================================
// request_disconnect
// ============================================================================

TEST_F(ProactiveControlTest, RequestDisconnectWhenDisconnectedIsNoop) {
    WebSocketManager manager(make_options());

    manager.request_disconnect();

    EXPECT_EQ(manager.state(), ConnectionState::Disconnected);
    EXPECT_EQ(manager.stats().disconnects, 0u);
    EXPECT_EQ(server->open_attempts(), 0u);
}

TEST_F(ProactiveControlTest, RequestDisconnectIsProactiveAndReconnects) {
    WebSocketManager manager(make_options());
    manager.connect();
    ASSERT_TRUE(manager.wait_connected(2s));

    manager.request_disconnect();

    EXPECT_TRUE(saw(DisconnectReason::UserRequested));
    EXPECT_TRUE(wait_until([&]() { return server->connections() == 2 && manager.is_connected(); }));

    auto stats = manager.stats();
    EXPECT_EQ(stats.disconnects, 1u);
    EXPECT_EQ(stats.proactive_disconnects, 1u);
    EXPECT_EQ(stats.reactive_disconnects, 0u);
}

TEST_F(ProactiveControlTest, RequestDisconnectPassesReasonThrough) {
    WebSocketManager manager(make_options());
    manager.connect();
    ASSERT_TRUE(manager.wait_connected(2s));

    manager.request_disconnect(DisconnectReason::ConnectionLimit);

    EXPECT_TRUE(saw(DisconnectReason::ConnectionLimit));
    EXPECT_FALSE(saw(DisconnectReason::UserRequested));
}

TEST_F(ProactiveControlTest, ReconnectAfterReplacesBackoffDelay) {
    auto options = make_options();
    options.reconnect_delay = 10s;
    options.max_reconnect_delay = 10s;
    WebSocketManager manager(std::move(options));
    manager.connect();
    ASSERT_TRUE(manager.wait_connected(2s));

    manager.request_disconnect(DisconnectReason::Scheduled, 30ms);

    EXPECT_EQ(manager.state(), ConnectionState::Reconnecting);
    EXPECT_TRUE(wait_until([&]() { return server->connections() == 2 && manager.is_connected(); }));
    EXPECT_TRUE(saw(DisconnectReason::Scheduled));
}

TEST_F(ProactiveControlTest, ReconnectAfterWorksWithoutAutoReconnect) {
    auto options = make_options();
    options.auto_reconnect = false;
    WebSocketManager manager(std::move(options));
    manager.connect();
    ASSERT_TRUE(manager.wait_connected(2s));

    manager.request_disconnect(DisconnectReason::UserRequested, 20ms);

    EXPECT_TRUE(wait_until([&]() { return server->connections() == 2 && manager.is_connected(); }));
}

TEST_F(ProactiveControlTest, WithoutReconnectAfterAutoReconnectOffStaysDown) {
    auto options = make_options();
    options.auto_reconnect = false;
    WebSocketManager manager(std::move(options));
    manager.connect();
    ASSERT_TRUE(manager.wait_connected(2s));

    manager.request_disconnect();

    EXPECT_EQ(manager.state(), ConnectionState::Disconnected);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(server->open_attempts(), 1u);
}

TEST_F(ProactiveControlTest, KilledReasonIgnoresReconnectAfter) {
    WebSocketManager manager(make_options());
    manager.connect();
    ASSERT_TRUE(manager.wait_connected(2s));

    manager.request_disconnect(DisconnectReason::Killed, 10ms);

    EXPECT_EQ(manager.state(), ConnectionState::Disconnected);
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(server->open_attempts(), 1u);
    EXPECT_EQ(manager.stats().reactive_disconnects, 1u);
}

// ============================================================================
// schedule_reconnect
// ============================================================================

TEST_F(ProactiveControlTest, ScheduleReconnectIgnoredWhenConnected) {
    WebSocketManager manager(make_options());
    manager.connect();
    ASSERT_TRUE(manager.wait_connected(2s));

    manager.schedule_reconnect(10ms);

    EXPECT_EQ(manager.state(), ConnectionState::Connected);
    std::this_thread::sleep_for(40ms);
    EXPECT_EQ(server->open_attempts(), 1u);
}

TEST_F(ProactiveControlTest, ScheduleReconnectFromDisconnected) {
    WebSocketManager manager(make_options());

    manager.schedule_reconnect(40ms);

    EXPECT_EQ(manager.state(), ConnectionState::Reconnecting);
    EXPECT_EQ(server->open_attempts(), 0u);
    EXPECT_TRUE(manager.wait_connected(2s));
    EXPECT_EQ(server->open_attempts(), 1u);
}

TEST_F(ProactiveControlTest, ScheduleReconnectAfterKill) {
    WebSocketManager manager(make_options());
    manager.connect();
    ASSERT_TRUE(manager.wait_connected(2s));
    manager.kill();
    ASSERT_EQ(manager.state(), ConnectionState::Disconnected);

    manager.schedule_reconnect(10ms);

    EXPECT_TRUE(wait_until([&]() { return server->connections() == 2 && manager.is_connected(); }));
}

TEST_F(ProactiveControlTest, ScheduleReconnectIgnoredWhenClosed) {
    WebSocketManager manager(make_options());
    manager.force_close();

    manager.schedule_reconnect(10ms);

    EXPECT_EQ(manager.state(), ConnectionState::Closed);
    std::this_thread::sleep_for(40ms);
    EXPECT_EQ(server->open_attempts(), 0u);
}

// ============================================================================
// wait_for_reconnect_window
// ============================================================================

TEST_F(ProactiveControlTest, ReconnectWindowWithoutPredicateIsFalse) {
    WebSocketManager manager(make_options());

    EXPECT_FALSE(manager.wait_for_reconnect_window(10ms));
}

TEST_F(ProactiveControlTest, ReconnectWindowOpenWhenHookAgrees) {
    auto options = make_options();
    options.hooks.should_reconnect = []() { return true; };
    WebSocketManager manager(std::move(options));

    EXPECT_TRUE(manager.wait_for_reconnect_window(1s));
}

TEST_F(ProactiveControlTest, ReconnectWindowPredicateOverridesHook) {
    auto options = make_options();
    options.hooks.should_reconnect = []() { return false; };
    WebSocketManager manager(std::move(options));

    EXPECT_TRUE(manager.wait_for_reconnect_window(1s, []() { return true; }));
}

TEST_F(ProactiveControlTest, ReconnectWindowTimesOut) {
    auto options = make_options();
    options.hooks.should_reconnect = []() { return false; };
    WebSocketManager manager(std::move(options));

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(manager.wait_for_reconnect_window(50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST_F(ProactiveControlTest, ReconnectWindowPollsUntilOpen) {
    std::atomic<int> calls{0};
    auto options = make_options();
    options.hooks.should_reconnect = [&calls]() { return ++calls >= 3; };
    WebSocketManager manager(std::move(options));

    EXPECT_TRUE(manager.wait_for_reconnect_window(1s));
    EXPECT_EQ(calls.load(), 3);
}

TEST_F(ProactiveControlTest, ReconnectWindowTreatsThrowingPredicateAsClosed) {
    WebSocketManager manager(make_options());

    EXPECT_FALSE(manager.wait_for_reconnect_window(30ms, []() -> bool {
        throw std::runtime_error("window lookup failed");
    }));
}

// ============================================================================
// CALLBACK_CONTROLLED strategy
// ============================================================================

TEST_F(ProactiveControlTest, CallbackControlledWaitsForWindow) {
    std::atomic<bool> allow{false};
    auto options = make_options();
    options.reconnect_strategy = ReconnectStrategy::CallbackControlled;
    options.hooks.should_reconnect = [&allow]() { return allow.load(); };
    WebSocketManager manager(std::move(options));
    manager.connect();
    ASSERT_TRUE(manager.wait_connected(2s));

    server->drop();

    // A closed window keeps the manager waiting rather than giving up
    EXPECT_TRUE(wait_until([&]() { return manager.state() == ConnectionState::Reconnecting; }));
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(manager.state(), ConnectionState::Reconnecting);
    EXPECT_EQ(server->open_attempts(), 1u);

    allow = true;

    EXPECT_TRUE(wait_until([&]() { return server->connections() == 2 && manager.is_connected(); }));
}

TEST_F(ProactiveControlTest, CallbackControlledConnectCutsTheWaitShort) {
    auto options = make_options();
    options.reconnect_strategy = ReconnectStrategy::CallbackControlled;
    options.hooks.should_reconnect = []() { return false; };
    WebSocketManager manager(std::move(options));
    manager.connect();
    ASSERT_TRUE(manager.wait_connected(2s));

    server->drop();
    ASSERT_TRUE(wait_until([&]() { return manager.state() == ConnectionState::Reconnecting; }));

    manager.connect();

    EXPECT_TRUE(wait_until([&]() { return server->connections() == 2 && manager.is_connected(); }));
}

// ============================================================================
// Connection age
// ============================================================================

TEST_F(ProactiveControlTest, RotatesBeforeConnectionLifetimeEnds) {
    auto options = make_options();
    options.max_connection_age = 150ms;
    options.disconnect_margin = 100ms;
    options.disconnect_check_interval = 20ms;
    WebSocketManager manager(std::move(options));
    manager.connect();
    ASSERT_TRUE(manager.wait_connected(2s));

    EXPECT_TRUE(wait_until([&]() { return saw(DisconnectReason::ConnectionLimit); }));
    EXPECT_TRUE(wait_until([&]() { return server->connections() >= 2 && manager.is_connected(); }));
    EXPECT_GE(manager.stats().proactive_disconnects, 1u);
    EXPECT_EQ(manager.stats().reactive_disconnects, 0u);
}

TEST_F(ProactiveControlTest, NoRotationWithoutLifetime) {
    auto options = make_options();
    options.disconnect_margin = 1ms;
    options.disconnect_check_interval = 10ms;
    WebSocketManager manager(std::move(options));
    manager.connect();
    ASSERT_TRUE(manager.wait_connected(2s));

    std::this_thread::sleep_for(80ms);

    EXPECT_TRUE(manager.is_connected());
    EXPECT_EQ(server->connections(), 1u);
    EXPECT_EQ(manager.stats().disconnects, 0u);
}
