#pragma once

/// @file latency_tracker.hpp
/// @brief Fixed-capacity ring buffer of round-trip samples.

#include <array>
#include <cstddef>
#include <mutex>

namespace cgc::net {

/// Rolling window of the most recent round-trip times in milliseconds.
/// Once full, each new sample evicts the oldest. Thread-safe.
template <std::size_t Capacity = 100>
class LatencyTracker {
    static_assert(Capacity > 0, "LatencyTracker needs room for one sample");

public:
    static constexpr std::size_t kCapacity = Capacity;

    void record(float sampleMs) {
        std::lock_guard lock(mutex_);
        if (count_ == Capacity) {
            sum_ -= samples_[head_];
        } else {
            ++count_;
        }
        samples_[head_] = sampleMs;
        sum_ += sampleMs;
        head_ = (head_ + 1) % Capacity;
    }

    /// Mean of the retained samples, 0 when empty.
    [[nodiscard]] float average() const {
        std::lock_guard lock(mutex_);
        return count_ == 0 ? 0.0f : static_cast<float>(sum_ / static_cast<double>(count_));
    }

    /// Most recent sample, 0 when empty.
    [[nodiscard]] float last() const {
        std::lock_guard lock(mutex_);
        if (count_ == 0) {
            return 0.0f;
        }
        return samples_[(head_ + Capacity - 1) % Capacity];
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return count_;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        count_ = 0;
        head_ = 0;
        sum_ = 0.0;
    }

private:
    mutable std::mutex mutex_;
    std::array<float, Capacity> samples_{};
    std::size_t head_ = 0;
    std::size_t count_ = 0;
    double sum_ = 0.0;
};

} // namespace cgc::net
