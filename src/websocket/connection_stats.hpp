#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace tether::websocket {

/// Counters describing one manager's connection history
///
/// Owned by the manager, which hands out copies as snapshots.
/// Time points are zero (epoch) until first set.
struct ConnectionStats {
    using Clock = std::chrono::system_clock;

    std::uint64_t connects{0};
    std::uint64_t disconnects{0};
    std::uint64_t proactive_disconnects{0};
    std::uint64_t reactive_disconnects{0};
    std::uint64_t messages_received{0};
    std::uint64_t bytes_received{0};
    std::uint64_t messages_sent{0};
    std::uint64_t bytes_sent{0};

    Clock::time_point last_connect_time{};
    Clock::time_point last_disconnect_time{};
    Clock::time_point last_message_time{};

    void record_connect();
    void record_disconnect(bool proactive);
    void record_message_received(std::size_t bytes);
    void record_message_sent(std::size_t bytes);

    /// Zero every counter and time point
    void reset() noexcept;
};

}  // namespace tether::websocket
