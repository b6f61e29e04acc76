#include "websocket/settings.hpp"
#include "core/limits.hpp"

namespace tether::websocket {

Settings resolve_settings(const Options& options) {
    const WebSocketLimits limits = get_websocket_limits(options.config);

    return Settings{
        .url = options.url,
        .ping_interval = options.ping_interval.value_or(limits.ping_interval),
        .ping_timeout = options.ping_timeout.value_or(limits.ping_timeout),
        .connection_timeout = options.connection_timeout.value_or(limits.connection_timeout),
        .reconnect_delay = options.reconnect_delay.value_or(limits.reconnect_delay),
        .max_reconnect_delay = options.max_reconnect_delay.value_or(limits.max_reconnect_delay),
        .max_reconnect_attempts = options.max_reconnect_attempts.value_or(limits.max_reconnect_attempts),
        .queue_size = options.queue_size.value_or(limits.queue_size),
        .disconnect_check_interval =
            options.disconnect_check_interval.value_or(limits.disconnect_check_interval),
        .reconnect_check_interval =
            options.reconnect_check_interval.value_or(limits.reconnect_check_interval),
        .disconnect_margin = options.disconnect_margin.value_or(limits.disconnect_margin),
        .max_connection_age = options.max_connection_age,
        .reconnect_strategy = options.reconnect_strategy,
        .reconnect_jitter = options.reconnect_jitter,
        .auto_reconnect = options.auto_reconnect,
    };
}

}  // namespace tether::websocket
