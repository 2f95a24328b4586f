#pragma once

/// @file backoff_policy.hpp
/// @brief Delay schedule between connect attempts.

#include <chrono>
#include <cstdint>
#include <functional>

#include "cgc/net/connection_config.hpp"

namespace cgc::net {

/// Pure delay schedule: Linear base*n, Exponential base*2^(n-1) capped at
/// maxDelay. Attempt numbers start at 1; delay(0) is zero.
///
/// | strategy    | base | n | delay |
/// |-------------|------|---|-------|
/// | Linear      | 1000 | 3 | 3000  |
/// | Exponential | 1000 | 3 | 4000  |
class BackoffPolicy {
public:
    /// Uniform random source returning a value in [0, 1).
    using RandomSource = std::function<double()>;

    /// Jitter spread applied by delayWithJitter(): +/-20%.
    static constexpr double kJitterFraction = 0.2;

    BackoffPolicy() = default;
    BackoffPolicy(BackoffStrategy strategy, std::chrono::milliseconds base,
                  std::chrono::milliseconds maxDelay);

    static BackoffPolicy fromConfig(const ConnectionConfig& config);

    /// Deterministic delay before retry @p attempt.
    [[nodiscard]] std::chrono::milliseconds delay(uint32_t attempt) const;

    /// delay() scaled by a factor in [1 - 0.2, 1 + 0.2) drawn from @p random.
    /// Never exceeds maxDelay for the exponential strategy.
    [[nodiscard]] std::chrono::milliseconds delayWithJitter(uint32_t attempt,
                                                            const RandomSource& random) const;

    /// Process-wide default random source (thread-safe).
    static RandomSource defaultRandom();

    [[nodiscard]] BackoffStrategy strategy() const noexcept { return strategy_; }
    [[nodiscard]] std::chrono::milliseconds base() const noexcept { return base_; }
    [[nodiscard]] std::chrono::milliseconds maxDelay() const noexcept { return maxDelay_; }

private:
    BackoffStrategy strategy_ = BackoffStrategy::Linear;
    std::chrono::milliseconds base_{1000};
    std::chrono::milliseconds maxDelay_{30000};
};

/// Apply +/-20% jitter to an arbitrary interval (reconnect supervisor ticks).
[[nodiscard]] std::chrono::milliseconds jittered(std::chrono::milliseconds interval,
                                                 const BackoffPolicy::RandomSource& random);

} // namespace cgc::net
