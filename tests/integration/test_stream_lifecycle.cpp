#include <gtest/gtest.h>

#include "app/stream_runner.hpp"
#include "common/mock_transport.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "websocket/scoped_connection.hpp"

#include <chrono>
#include <memory>
#include <thread>

using namespace tether;
using tether::network::ConnectionState;
using tether::testing::MockServer;
using tether::testing::wait_until;
using namespace std::chrono_literals;

// ============================================================================
// StreamRunner Integration Tests
// ============================================================================

class StreamLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = Config::defaults();
        config.stream.url = "ws://localhost:9000/ws";
        config.stream.subscriptions = {"btcusdt@trade", "ethusdt@trade"};
        config.stream.reconnect_delay = 10ms;
        config.supervisor.check_interval = 100ms;
        config.output.stats_interval = 50ms;
    }

    void start() {
        runner = std::make_unique<app::StreamRunner>(config, server->factory());
        runner_thread = std::thread([this]() { runner->run(); });
        ASSERT_TRUE(wait_until([&]() {
            auto manager = runner->manager();
            return manager && manager->is_connected();
        }));
    }

    void TearDown() override {
        if (runner) {
            runner->request_shutdown();
        }
        if (runner_thread.joinable()) {
            runner_thread.join();
        }
        runner.reset();
    }

    Config config;
    std::shared_ptr<MockServer> server = std::make_shared<MockServer>();
    std::unique_ptr<app::StreamRunner> runner;
    std::thread runner_thread;
};

TEST_F(StreamLifecycleTest, SubscribesAndStreamsUntilShutdown) {
    start();

    ASSERT_TRUE(wait_until([&]() { return server->sent().size() == 2; }));
    auto sent = server->sent();
    EXPECT_EQ(sent[0], R"({"id": 1, "method": "SUBSCRIBE", "params": ["btcusdt@trade"]})");
    EXPECT_EQ(sent[1], R"({"id": 2, "method": "SUBSCRIBE", "params": ["ethusdt@trade"]})");

    for (int i = 0; i < 10; ++i) {
        server->push_text(R"({"e":"trade","t":)" + std::to_string(i) + "}");
    }

    // The consumer drains everything the server pushed
    EXPECT_TRUE(wait_until([&]() {
        auto manager = runner->manager();
        return manager->stats().messages_received == 10 && manager->queued_messages() == 0;
    }));

    runner->request_shutdown();
    runner_thread.join();

    auto manager = runner->manager();
    EXPECT_EQ(manager->state(), ConnectionState::Closed);
    EXPECT_TRUE(manager->is_shutdown());
    EXPECT_EQ(runner->rebuild_count(), 0u);
}

TEST_F(StreamLifecycleTest, ReconnectsWithoutRebuilding) {
    start();

    server->drop();

    EXPECT_TRUE(wait_until([&]() { return server->connections() == 2 && runner->manager()->is_connected(); }));
    // Subscriptions go out again on the new connection
    EXPECT_TRUE(wait_until([&]() { return server->sent().size() == 4; }));
    EXPECT_EQ(runner->rebuild_count(), 0u);
}

TEST_F(StreamLifecycleTest, SupervisorRebuildsDeadManager) {
    start();
    auto first = runner->manager();

    first->kill();

    EXPECT_TRUE(wait_until([&]() { return runner->rebuild_count() == 1; }));
    EXPECT_TRUE(wait_until([&]() {
        auto manager = runner->manager();
        return manager != first && manager->is_connected();
    }));
    EXPECT_EQ(first->state(), ConnectionState::Closed);
    EXPECT_EQ(server->connections(), 2u);

    // The replacement manager still serves the consumer
    server->push_text(R"({"after":"rebuild"})");
    EXPECT_TRUE(wait_until([&]() { return runner->manager()->stats().messages_received == 1; }));
}

TEST_F(StreamLifecycleTest, ShutdownManagerIsNotRebuilt) {
    start();

    runner->manager()->shutdown();
    std::this_thread::sleep_for(300ms);

    EXPECT_EQ(runner->rebuild_count(), 0u);
}

TEST_F(StreamLifecycleTest, RebuildLimitStopsRunner) {
    config.supervisor.max_rebuilds = 1;
    start();

    runner->manager()->kill();
    ASSERT_TRUE(wait_until([&]() { return runner->rebuild_count() == 1 && runner->manager()->is_connected(); }));

    runner->manager()->kill();

    // Second death exceeds the limit and the runner stops by itself
    EXPECT_TRUE(wait_until([&]() { return runner->shutdown_requested(); }));
    runner_thread.join();
    EXPECT_EQ(runner->rebuild_count(), 1u);
}

TEST_F(StreamLifecycleTest, ManagerOptionsFollowConfig) {
    config.stream.ping_interval = 15s;
    config.stream.queue_size = 0;
    config.mapping = nlohmann::json::parse(R"({"websocket": {"reconnect": {"max_attempts": 4}}})");
    app::StreamRunner runner(config, server->factory());

    auto options = runner.make_options();
    auto settings = websocket::resolve_settings(options);

    EXPECT_EQ(settings.url, config.stream.url);
    EXPECT_EQ(settings.ping_interval, 15s);
    EXPECT_EQ(settings.queue_size, 0u);
    EXPECT_EQ(settings.max_reconnect_attempts, 4u);
    EXPECT_EQ(settings.reconnect_delay, 10ms);
    ASSERT_TRUE(options.hooks.on_connect);
    ASSERT_TRUE(options.hooks.on_disconnect);

    // Hooks report through the runner's console reporter
    EXPECT_NO_THROW(options.hooks.on_connect());
    EXPECT_NO_THROW(options.hooks.on_disconnect(network::DisconnectReason::ConnectionLimit));
}

TEST_F(StreamLifecycleTest, ProactiveMappingReachesManagerSettings) {
    config.mapping = nlohmann::json::parse(
        R"({"websocket": {"proactive": {"disconnect_check_interval": 2, "disconnect_margin": 120}}})");
    app::StreamRunner runner(config, server->factory());

    auto settings = websocket::resolve_settings(runner.make_options());

    EXPECT_EQ(settings.disconnect_check_interval, 2s);
    EXPECT_EQ(settings.disconnect_margin, 120s);
    EXPECT_EQ(settings.reconnect_check_interval, 5s);
}

// ============================================================================
// ScopedConnection
// ============================================================================

TEST_F(StreamLifecycleTest, ScopedConnectionOpensAndCloses) {
    {
        websocket::Options options;
        options.url = config.stream.url;
        options.transport_factory = server->factory();
        websocket::ScopedConnection conn(std::move(options));

        EXPECT_TRUE(conn->is_connected());
        conn->send("hello");
        EXPECT_TRUE(wait_until([&]() { return server->sent().size() == 1; }));
    }

    EXPECT_TRUE(wait_until([&]() { return server->closes() == 1; }));
    EXPECT_EQ(server->sent()[0], "hello");
}

TEST_F(StreamLifecycleTest, ScopedConnectionFailureThrows) {
    server->accept_connections = false;
    websocket::Options options;
    options.url = config.stream.url;
    options.connection_timeout = 100ms;
    options.reconnect_delay = 10ms;
    options.transport_factory = server->factory();

    try {
        websocket::ScopedConnection conn(std::move(options));
        FAIL() << "Expected WebSocketConnectionError";
    } catch (const WebSocketConnectionError& e) {
        EXPECT_EQ(e.url(), "ws://localhost:9000/ws");
    }
}
