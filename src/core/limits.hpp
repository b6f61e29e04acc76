#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>

namespace tether {

using Seconds = std::chrono::duration<double>;

/// Built-in defaults for the WebSocket manager
namespace defaults {
inline constexpr Seconds kPingInterval{20.0};
inline constexpr Seconds kPingTimeout{10.0};
inline constexpr Seconds kConnectionTimeout{30.0};
inline constexpr Seconds kReconnectDelay{1.0};
inline constexpr Seconds kMaxReconnectDelay{60.0};
inline constexpr std::size_t kMaxReconnectAttempts = 10;
inline constexpr std::size_t kQueueSize = 1000;
inline constexpr Seconds kDisconnectCheckInterval{10.0};
inline constexpr Seconds kReconnectCheckInterval{5.0};
inline constexpr Seconds kDisconnectMargin{300.0};
}  // namespace defaults

/// Hard bounds applied to values read from a configuration mapping
namespace hard_limits {
inline constexpr Seconds kMinPingInterval{5.0};
inline constexpr Seconds kMaxPingInterval{60.0};
inline constexpr Seconds kMinPingTimeout{5.0};
inline constexpr Seconds kMaxPingTimeout{30.0};
inline constexpr Seconds kMinConnectionTimeout{5.0};
inline constexpr Seconds kMaxConnectionTimeout{120.0};
inline constexpr Seconds kMinReconnectDelay{0.0};
inline constexpr Seconds kMaxReconnectDelay{300.0};
inline constexpr Seconds kMinMaxReconnectDelay{1.0};
inline constexpr Seconds kMaxMaxReconnectDelay{600.0};
inline constexpr std::size_t kMinReconnectAttempts = 0;
inline constexpr std::size_t kMaxReconnectAttempts = 100;
inline constexpr std::size_t kMinQueueSize = 0;  // 0 = unbounded
inline constexpr std::size_t kMaxQueueSize = 10000;
inline constexpr Seconds kMinDisconnectCheckInterval{1.0};
inline constexpr Seconds kMaxDisconnectCheckInterval{60.0};
inline constexpr Seconds kMinReconnectCheckInterval{0.5};
inline constexpr Seconds kMaxReconnectCheckInterval{60.0};
inline constexpr Seconds kMinDisconnectMargin{60.0};
inline constexpr Seconds kMaxDisconnectMargin{3600.0};
}  // namespace hard_limits

/// Effective WebSocket limits after reading a configuration mapping
struct WebSocketLimits {
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
};

/// Read limits from the nested "websocket" section of a configuration mapping
///
/// Recognized keys: websocket.ping.{interval,timeout}, websocket.connection.timeout,
/// websocket.reconnect.{delay,max_delay,max_attempts}, websocket.queue.size,
/// websocket.proactive.{disconnect_check_interval,reconnect_check_interval,disconnect_margin}.
/// Durations are in seconds. Missing keys and values of the wrong type fall
/// back to the defaults; numeric values are clamped to the hard limits.
[[nodiscard]] WebSocketLimits get_websocket_limits(const nlohmann::json& config);

/// Limits built from defaults only
[[nodiscard]] WebSocketLimits default_websocket_limits();

/// Convert fractional seconds to whole milliseconds
[[nodiscard]] constexpr std::chrono::milliseconds to_millis(Seconds value) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(value);
}

}  // namespace tether
