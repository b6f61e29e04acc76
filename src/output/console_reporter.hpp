#pragma once

#include "codec/message.hpp"
#include "core/limits.hpp"
#include "network/connection_state.hpp"
#include "websocket/connection_stats.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace tether::output {

/// Console output for streamed messages and connection health
class ConsoleReporter {
public:
    /// Create a console reporter
    /// @param interval Minimum time between stats outputs
    /// @param preview_length Maximum characters of a message payload to print
    explicit ConsoleReporter(std::chrono::milliseconds interval, std::size_t preview_length = 160);

    /// Log connection stats (respects rate limiting)
    /// @return true if logged, false if rate limited
    bool log_stats(
        const websocket::ConnectionStats& stats,
        network::ConnectionState state,
        Seconds uptime
    );

    /// Log one inbound message
    void log_message(const Message& message);

    /// Log connection status change
    void log_connection_status(bool connected, const std::string& details = "");

    /// Log why a connection ended
    void log_disconnect(network::DisconnectReason reason);

    /// Force next log_stats to output regardless of rate limit
    void force_next();

    /// Short single-line rendering of a message payload
    [[nodiscard]] std::string preview(const Message& message) const;

private:
    std::chrono::milliseconds interval_;
    std::size_t preview_length_;
    std::chrono::steady_clock::time_point last_output_;
    bool force_next_{false};
};

}  // namespace tether::output
