#include <gtest/gtest.h>
#include "websocket/settings.hpp"
#include <nlohmann/json.hpp>

using namespace tether::websocket;
using tether::network::ReconnectStrategy;
using namespace std::chrono_literals;

TEST(SettingsTest, DefaultsWhenNothingGiven) {
    Options options;
    options.url = "ws://localhost:9000";

    auto settings = resolve_settings(options);

    EXPECT_EQ(settings.url, "ws://localhost:9000");
    EXPECT_EQ(settings.ping_interval, 20s);
    EXPECT_EQ(settings.ping_timeout, 10s);
    EXPECT_EQ(settings.connection_timeout, 30s);
    EXPECT_EQ(settings.reconnect_delay, 1s);
    EXPECT_EQ(settings.max_reconnect_delay, 60s);
    EXPECT_EQ(settings.max_reconnect_attempts, 10u);
    EXPECT_EQ(settings.queue_size, 1000u);
    EXPECT_EQ(settings.reconnect_strategy, ReconnectStrategy::ExponentialBackoff);
    EXPECT_TRUE(settings.auto_reconnect);
}

TEST(SettingsTest, MappingOverridesDefaults) {
    Options options;
    options.config = nlohmann::json::parse(R"({"websocket": {"ping": {"interval": 25}, "queue": {"size": 50}}})");

    auto settings = resolve_settings(options);

    EXPECT_EQ(settings.ping_interval, 25s);
    EXPECT_EQ(settings.queue_size, 50u);
    EXPECT_EQ(settings.ping_timeout, 10s);
}

TEST(SettingsTest, ExplicitOptionsWinOverMapping) {
    Options options;
    options.config = nlohmann::json::parse(R"({"websocket": {"ping": {"interval": 25}, "reconnect": {"max_attempts": 3}}})");
    options.ping_interval = 40s;
    options.max_reconnect_attempts = 5;

    auto settings = resolve_settings(options);

    EXPECT_EQ(settings.ping_interval, 40s);
    EXPECT_EQ(settings.max_reconnect_attempts, 5u);
}

TEST(SettingsTest, ExplicitOptionsAreNotClamped) {
    Options options;
    options.config = nlohmann::json::parse(R"({"websocket": {"ping": {"interval": 1}}})");

    EXPECT_EQ(resolve_settings(options).ping_interval, 5s);

    options.ping_interval = 50ms;
    options.queue_size = 0;

    auto settings = resolve_settings(options);
    EXPECT_EQ(settings.ping_interval, 50ms);
    EXPECT_EQ(settings.queue_size, 0u);
}

TEST(SettingsTest, StrategyAndFlagsPassThrough) {
    Options options;
    options.reconnect_strategy = ReconnectStrategy::FixedDelay;
    options.reconnect_jitter = 0.25;
    options.auto_reconnect = false;

    auto settings = resolve_settings(options);

    EXPECT_EQ(settings.reconnect_strategy, ReconnectStrategy::FixedDelay);
    EXPECT_DOUBLE_EQ(settings.reconnect_jitter, 0.25);
    EXPECT_FALSE(settings.auto_reconnect);
}

TEST(SettingsTest, ProactiveIntervalsMergeLikeOtherLimits) {
    Options options;
    options.config = nlohmann::json::parse(
        R"({"websocket": {"proactive": {"disconnect_margin": 900, "reconnect_check_interval": 2}}})");
    options.disconnect_check_interval = 250ms;

    auto settings = resolve_settings(options);

    EXPECT_EQ(settings.disconnect_check_interval, 250ms);
    EXPECT_EQ(settings.reconnect_check_interval, 2s);
    EXPECT_EQ(settings.disconnect_margin, 900s);
    EXPECT_FALSE(settings.max_connection_age.has_value());
}

TEST(SettingsTest, ProactiveDefaults) {
    Options options;
    options.max_connection_age = 24h;

    auto settings = resolve_settings(options);

    EXPECT_EQ(settings.disconnect_check_interval, 10s);
    EXPECT_EQ(settings.reconnect_check_interval, 5s);
    EXPECT_EQ(settings.disconnect_margin, 300s);
    ASSERT_TRUE(settings.max_connection_age.has_value());
    EXPECT_EQ(*settings.max_connection_age, 24h);
}
