#pragma once

#include "network/connection_state.hpp"
#include <chrono>
#include <cstddef>
#include <random>

namespace tether::websocket {

/// Delay calculator for reconnect attempts
///
/// FixedDelay always waits base_delay, ExponentialBackoff waits
/// base_delay * 2^n capped at max_delay, Immediate never waits.
/// CallbackControlled never waits either: the caller's hook decides when.
/// A non-zero jitter factor scales each delay by a random value in
/// [1 - jitter, 1 + jitter].
class BackoffPolicy {
public:
    BackoffPolicy(
        network::ReconnectStrategy strategy = network::ReconnectStrategy::ExponentialBackoff,
        std::chrono::milliseconds base_delay = std::chrono::milliseconds{1000},
        std::chrono::milliseconds max_delay = std::chrono::milliseconds{60000},
        double jitter_factor = 0.0
    );

    /// Get the delay before the next attempt and advance the attempt counter
    [[nodiscard]] std::chrono::milliseconds next_delay();

    /// Reset back to the first attempt
    void reset() noexcept;

    /// Delay the next call would return, without jitter
    [[nodiscard]] std::chrono::milliseconds current_delay() const noexcept;

    /// Get attempt count since last reset
    [[nodiscard]] std::size_t attempt_count() const noexcept;

    [[nodiscard]] network::ReconnectStrategy strategy() const noexcept { return strategy_; }

private:
    network::ReconnectStrategy strategy_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    double jitter_factor_;
    std::size_t attempt_count_{0};

    std::mt19937 rng_{std::random_device{}()};
};

}  // namespace tether::websocket
