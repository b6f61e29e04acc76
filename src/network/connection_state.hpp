#pragma once

#include <cstdint>
#include <string_view>

namespace tether::network {

/// Lifecycle state of a managed WebSocket connection
enum class ConnectionState : std::uint8_t {
    Disconnected,    // Initial, or after a kill / exhausted retries
    Connecting,      // Transport open in progress
    Connected,       // Open and reading
    Reconnecting,    // Waiting for the next reconnect attempt
    Closed           // Terminal, never left
};

/// Why a connection ended
enum class DisconnectReason : std::uint8_t {
    NormalClose,         // Local close requested
    ServerClose,         // Remote sent a close frame
    NetworkError,        // Transport failure
    PingTimeout,         // Keepalive probe unanswered
    Killed,              // Forced disconnect by the caller
    ProactiveReconnect,  // Planned rotation by the caller
    Shutdown,            // Manager retired
    UserRequested,       // request_disconnect() without a more specific reason
    Scheduled,           // Time-based rotation chosen by the caller
    CallbackTriggered,   // Caller hook asked for the disconnect
    ConnectionLimit,     // Connection close to a server-imposed lifetime
    ProtocolError        // Peer violated the WebSocket protocol
};

/// Delay policy between reconnect attempts
enum class ReconnectStrategy : std::uint8_t {
    FixedDelay,
    ExponentialBackoff,
    Immediate,
    CallbackControlled   // should_reconnect polled every reconnect_check_interval
};

/// A new connection may be started from every state except Closed
[[nodiscard]] constexpr bool can_connect(ConnectionState state) noexcept {
    return state != ConnectionState::Closed;
}

[[nodiscard]] constexpr bool can_send(ConnectionState state) noexcept {
    return state == ConnectionState::Connected;
}

[[nodiscard]] constexpr bool is_terminal(ConnectionState state) noexcept {
    return state == ConnectionState::Closed;
}

/// Caller-intended disconnects; everything else counts as reactive
[[nodiscard]] constexpr bool is_proactive(DisconnectReason reason) noexcept {
    switch (reason) {
        case DisconnectReason::ProactiveReconnect:
        case DisconnectReason::NormalClose:
        case DisconnectReason::Shutdown:
        case DisconnectReason::UserRequested:
        case DisconnectReason::Scheduled:
        case DisconnectReason::CallbackTriggered:
        case DisconnectReason::ConnectionLimit:
            return true;
        default:
            return false;
    }
}

/// Convert ConnectionState to string for logging
[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "DISCONNECTED";
        case ConnectionState::Connecting:   return "CONNECTING";
        case ConnectionState::Connected:    return "CONNECTED";
        case ConnectionState::Reconnecting: return "RECONNECTING";
        case ConnectionState::Closed:       return "CLOSED";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view to_string(DisconnectReason reason) noexcept {
    switch (reason) {
        case DisconnectReason::NormalClose:        return "NORMAL_CLOSE";
        case DisconnectReason::ServerClose:        return "SERVER_CLOSE";
        case DisconnectReason::NetworkError:       return "NETWORK_ERROR";
        case DisconnectReason::PingTimeout:        return "PING_TIMEOUT";
        case DisconnectReason::Killed:             return "KILLED";
        case DisconnectReason::ProactiveReconnect: return "PROACTIVE_RECONNECT";
        case DisconnectReason::Shutdown:           return "SHUTDOWN";
        case DisconnectReason::UserRequested:      return "USER_REQUESTED";
        case DisconnectReason::Scheduled:          return "SCHEDULED";
        case DisconnectReason::CallbackTriggered:  return "CALLBACK_TRIGGERED";
        case DisconnectReason::ConnectionLimit:    return "CONNECTION_LIMIT";
        case DisconnectReason::ProtocolError:      return "PROTOCOL_ERROR";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view to_string(ReconnectStrategy strategy) noexcept {
    switch (strategy) {
        case ReconnectStrategy::FixedDelay:         return "FIXED_DELAY";
        case ReconnectStrategy::ExponentialBackoff: return "EXPONENTIAL_BACKOFF";
        case ReconnectStrategy::Immediate:          return "IMMEDIATE";
        case ReconnectStrategy::CallbackControlled: return "CALLBACK_CONTROLLED";
    }
    return "UNKNOWN";
}

}  // namespace tether::network
