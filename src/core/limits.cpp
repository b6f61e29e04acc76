#include "core/limits.hpp"
#include <algorithm>
#include <initializer_list>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace tether {

using json = nlohmann::json;

namespace {

/// Walk a dotted path through nested objects, nullptr if any step is missing
const json* find_path(const json& root, std::initializer_list<std::string_view> path) {
    const json* node = &root;
    for (auto key : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(std::string(key));
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
    }
    return node;
}

/// Numeric value at path, nullopt if missing or not a number
std::optional<double> read_number(const json& root, std::initializer_list<std::string_view> path) {
    const json* node = find_path(root, path);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (!node->is_number()) {
        spdlog::warn("Ignoring non-numeric websocket config value: {}", node->dump());
        return std::nullopt;
    }
    return node->get<double>();
}

std::chrono::milliseconds read_seconds(
    const json& root,
    std::initializer_list<std::string_view> path,
    Seconds fallback,
    Seconds min_val,
    Seconds max_val
) {
    Seconds value = fallback;
    if (auto v = read_number(root, path)) {
        value = std::clamp(Seconds{*v}, min_val, max_val);
    }
    return to_millis(value);
}

std::size_t read_count(
    const json& root,
    std::initializer_list<std::string_view> path,
    std::size_t fallback,
    std::size_t min_val,
    std::size_t max_val
) {
    auto v = read_number(root, path);
    if (!v) {
        return fallback;
    }
    if (*v <= static_cast<double>(min_val)) {
        return min_val;
    }
    if (*v >= static_cast<double>(max_val)) {
        return max_val;
    }
    return static_cast<std::size_t>(*v);
}

}  // namespace

WebSocketLimits default_websocket_limits() {
    return WebSocketLimits{
        .ping_interval = to_millis(defaults::kPingInterval),
        .ping_timeout = to_millis(defaults::kPingTimeout),
        .connection_timeout = to_millis(defaults::kConnectionTimeout),
        .reconnect_delay = to_millis(defaults::kReconnectDelay),
        .max_reconnect_delay = to_millis(defaults::kMaxReconnectDelay),
        .max_reconnect_attempts = defaults::kMaxReconnectAttempts,
        .queue_size = defaults::kQueueSize,
        .disconnect_check_interval = to_millis(defaults::kDisconnectCheckInterval),
        .reconnect_check_interval = to_millis(defaults::kReconnectCheckInterval),
        .disconnect_margin = to_millis(defaults::kDisconnectMargin),
    };
}

WebSocketLimits get_websocket_limits(const json& config) {
    using namespace hard_limits;

    if (!config.is_object()) {
        return default_websocket_limits();
    }

    return WebSocketLimits{
        .ping_interval = read_seconds(config, {"websocket", "ping", "interval"},
                                      defaults::kPingInterval, kMinPingInterval, kMaxPingInterval),
        .ping_timeout = read_seconds(config, {"websocket", "ping", "timeout"},
                                     defaults::kPingTimeout, kMinPingTimeout, kMaxPingTimeout),
        .connection_timeout = read_seconds(config, {"websocket", "connection", "timeout"},
                                           defaults::kConnectionTimeout,
                                           kMinConnectionTimeout, kMaxConnectionTimeout),
        .reconnect_delay = read_seconds(config, {"websocket", "reconnect", "delay"},
                                        defaults::kReconnectDelay,
                                        kMinReconnectDelay, kMaxReconnectDelay),
        .max_reconnect_delay = read_seconds(config, {"websocket", "reconnect", "max_delay"},
                                            defaults::kMaxReconnectDelay,
                                            kMinMaxReconnectDelay, kMaxMaxReconnectDelay),
        .max_reconnect_attempts = read_count(config, {"websocket", "reconnect", "max_attempts"},
                                             defaults::kMaxReconnectAttempts,
                                             kMinReconnectAttempts, kMaxReconnectAttempts),
        .queue_size = read_count(config, {"websocket", "queue", "size"},
                                 defaults::kQueueSize, kMinQueueSize, kMaxQueueSize),
        .disconnect_check_interval = read_seconds(config, {"websocket", "proactive", "disconnect_check_interval"},
                                                  defaults::kDisconnectCheckInterval,
                                                  kMinDisconnectCheckInterval, kMaxDisconnectCheckInterval),
        .reconnect_check_interval = read_seconds(config, {"websocket", "proactive", "reconnect_check_interval"},
                                                 defaults::kReconnectCheckInterval,
                                                 kMinReconnectCheckInterval, kMaxReconnectCheckInterval),
        .disconnect_margin = read_seconds(config, {"websocket", "proactive", "disconnect_margin"},
                                          defaults::kDisconnectMargin,
                                          kMinDisconnectMargin, kMaxDisconnectMargin),
    };
}

}  // namespace tether
