#include "websocket/backoff_policy.hpp"
#include <algorithm>
#include <cstdint>

namespace tether::websocket {

namespace {

// 2^30 ms is far past any clamped max delay
constexpr std::size_t kMaxShift = 30;

}  // namespace

BackoffPolicy::BackoffPolicy(
    network::ReconnectStrategy strategy,
    std::chrono::milliseconds base_delay,
    std::chrono::milliseconds max_delay,
    double jitter_factor
)
    : strategy_(strategy)
    , base_delay_(base_delay)
    , max_delay_(std::max(max_delay, base_delay))
    , jitter_factor_(std::clamp(jitter_factor, 0.0, 1.0))
{}

std::chrono::milliseconds BackoffPolicy::current_delay() const noexcept {
    switch (strategy_) {
        case network::ReconnectStrategy::Immediate:
        case network::ReconnectStrategy::CallbackControlled:
            return std::chrono::milliseconds{0};
        case network::ReconnectStrategy::FixedDelay:
            return base_delay_;
        case network::ReconnectStrategy::ExponentialBackoff:
            break;
    }

    auto shift = std::min(attempt_count_, kMaxShift);
    auto scaled = base_delay_.count() * (std::int64_t{1} << shift);
    return std::min(std::chrono::milliseconds{scaled}, max_delay_);
}

std::chrono::milliseconds BackoffPolicy::next_delay() {
    auto delay = current_delay();
    ++attempt_count_;

    if (jitter_factor_ <= 0.0 || delay.count() == 0) {
        return delay;
    }

    // Apply random jitter: delay * (1 ± jitter_factor)
    std::uniform_real_distribution<double> dist(
        1.0 - jitter_factor_,
        1.0 + jitter_factor_
    );
    auto jittered_count = static_cast<std::int64_t>(
        static_cast<double>(delay.count()) * dist(rng_)
    );
    return std::chrono::milliseconds{jittered_count};
}

void BackoffPolicy::reset() noexcept {
    attempt_count_ = 0;
}

std::size_t BackoffPolicy::attempt_count() const noexcept {
    return attempt_count_;
}

}  // namespace tether::websocket
