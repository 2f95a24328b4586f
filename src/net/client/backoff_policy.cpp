/// @file backoff_policy.cpp
/// @brief BackoffPolicy implementation.

#include "cgc/net/backoff_policy.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>
#include <random>

namespace cgc::net {

namespace {

std::chrono::milliseconds scale(std::chrono::milliseconds value, double factor) {
    auto scaled = std::llround(static_cast<double>(value.count()) * factor);
    return std::chrono::milliseconds(std::max<long long>(0, scaled));
}

double jitterFactor(const BackoffPolicy::RandomSource& random) {
    double r = random ? random() : 0.5;
    r = std::clamp(r, 0.0, 1.0);
    return 1.0 - BackoffPolicy::kJitterFraction + 2.0 * BackoffPolicy::kJitterFraction * r;
}

} // namespace

BackoffPolicy::BackoffPolicy(BackoffStrategy strategy, std::chrono::milliseconds base,
                             std::chrono::milliseconds maxDelay)
    : strategy_(strategy), base_(base), maxDelay_(maxDelay) {}

BackoffPolicy BackoffPolicy::fromConfig(const ConnectionConfig& config) {
    return BackoffPolicy(config.backoffStrategy, config.retryBaseDelay, config.maxRetryDelay);
}

std::chrono::milliseconds BackoffPolicy::delay(uint32_t attempt) const {
    if (attempt == 0 || base_.count() <= 0) {
        return std::chrono::milliseconds(0);
    }

    const int64_t base = base_.count();
    if (strategy_ == BackoffStrategy::Linear) {
        if (base > std::numeric_limits<int64_t>::max() / attempt) {
            return std::chrono::milliseconds(std::numeric_limits<int64_t>::max());
        }
        return std::chrono::milliseconds(base * static_cast<int64_t>(attempt));
    }

    // Exponential: double until the cap is reached so large attempts cannot overflow.
    const int64_t cap = maxDelay_.count();
    int64_t value = base;
    for (uint32_t i = 1; i < attempt && value < cap; ++i) {
        value = value > cap / 2 ? cap : value * 2;
    }
    return std::chrono::milliseconds(std::min(value, cap));
}

std::chrono::milliseconds BackoffPolicy::delayWithJitter(uint32_t attempt,
                                                         const RandomSource& random) const {
    auto result = scale(delay(attempt), jitterFactor(random));
    if (strategy_ == BackoffStrategy::Exponential) {
        result = std::min(result, maxDelay_);
    }
    return result;
}

BackoffPolicy::RandomSource BackoffPolicy::defaultRandom() {
    return [] {
        static std::mutex mutex;
        static std::mt19937_64 engine{std::random_device{}()};
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        std::lock_guard lock(mutex);
        return dist(engine);
    };
}

std::chrono::milliseconds jittered(std::chrono::milliseconds interval,
                                   const BackoffPolicy::RandomSource& random) {
    return scale(interval, jitterFactor(random));
}

} // namespace cgc::net
