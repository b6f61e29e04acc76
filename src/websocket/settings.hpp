#pragma once

#include "codec/message.hpp"
#include "network/connection_state.hpp"
#include "network/transport.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tether::websocket {

/// Optional callbacks, each invoked on the manager's network thread
struct Hooks {
    /// Polled every ping interval; true forces a proactive reconnect
    std::function<bool()> should_disconnect;

    /// Consulted before each reconnect attempt; false stops retrying
    /// With CallbackControlled, false means "not yet" and the hook is polled
    /// again every reconnect_check_interval.
    std::function<bool()> should_reconnect;

    std::function<void()> on_connect;
    std::function<void(network::DisconnectReason)> on_disconnect;

    /// Invoked with every decoded message before it is queued
    std::function<void(const Message&)> on_message;

    /// Builds the wire request for (un)subscribing one channel
    /// method is "SUBSCRIBE" or "UNSUBSCRIBE"; defaults to MessageCodec::format_subscription
    std::function<nlohmann::json(std::string_view method, const std::string& channel,
                                 std::uint64_t request_id)> subscribe_formatter;
};

/// Constructor inputs for WebSocketManager
///
/// Unset durations and counts are taken from the configuration mapping
/// ("websocket" section) and then from the built-in defaults.
struct Options {
    std::string url;

    std::optional<std::chrono::milliseconds> ping_interval;
    std::optional<std::chrono::milliseconds> ping_timeout;
    std::optional<std::chrono::milliseconds> connection_timeout;
    std::optional<std::chrono::milliseconds> reconnect_delay;
    std::optional<std::chrono::milliseconds> max_reconnect_delay;
    std::optional<std::size_t> max_reconnect_attempts;
    std::optional<std::size_t> queue_size;   // 0 = unbounded
    std::optional<std::chrono::milliseconds> disconnect_check_interval;
    std::optional<std::chrono::milliseconds> reconnect_check_interval;
    std::optional<std::chrono::milliseconds> disconnect_margin;

    /// Server-imposed connection lifetime; the manager rotates with
    /// CONNECTION_LIMIT once a connection is within disconnect_margin of it
    std::optional<std::chrono::milliseconds> max_connection_age;

    network::ReconnectStrategy reconnect_strategy = network::ReconnectStrategy::ExponentialBackoff;
    double reconnect_jitter = 0.0;
    bool auto_reconnect = true;

    /// Nested configuration mapping, e.g. {"websocket": {"ping": {"interval": 25}}}
    nlohmann::json config = nlohmann::json::object();

    Hooks hooks;

    /// Transport source; empty selects the Boost.Beast transport
    network::TransportFactory transport_factory;
};

/// Effective manager settings after merging
struct Settings {
    std::string url;
    std::chrono::milliseconds ping_interval;
    std::chrono::milliseconds ping_timeout;
    std::chrono::milliseconds connection_timeout;
    std::chrono::milliseconds reconnect_delay;
    std::chrono::milliseconds max_reconnect_delay;
    std::size_t max_reconnect_attempts;
    std::size_t queue_size;
    std::chrono::milliseconds disconnect_check_interval;
    std::chrono::milliseconds reconnect_check_interval;
    std::chrono::milliseconds disconnect_margin;
    std::optional<std::chrono::milliseconds> max_connection_age;
    network::ReconnectStrategy reconnect_strategy;
    double reconnect_jitter;
    bool auto_reconnect;
};

/// Merge options: explicit option > configuration mapping > built-in default
/// Mapping values are clamped to the hard limits, explicit values are taken as given.
[[nodiscard]] Settings resolve_settings(const Options& options);

}  // namespace tether::websocket
