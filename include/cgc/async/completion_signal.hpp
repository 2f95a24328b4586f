#pragma once

/// @file completion_signal.hpp
/// @brief One-shot completion signal and a small reuse pool.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "cgc/async/cancellation_token.hpp"

namespace cgc::async {

/// One-shot value slot a waiter blocks on until another thread completes it.
///
/// Completion is first-wins: later trySet() calls return false. reset()
/// re-arms the signal for reuse through CompletionSignalPool.
template <typename T>
class CompletionSignal {
public:
    /// Complete the signal. Returns false if it was already completed.
    bool trySet(T value) {
        {
            std::lock_guard lock(mutex_);
            if (value_) {
                return false;
            }
            value_ = std::move(value);
        }
        cv_.notify_all();
        return true;
    }

    /// Wait up to @p timeout for completion.
    /// @return The value, or nullopt on timeout or cancellation of @p token.
    std::optional<T> waitFor(std::chrono::milliseconds timeout,
                             const CancellationToken& token = CancellationToken::none()) {
        // Wake the waiter when the token fires.
        auto registration = token.onCancel([this] {
            std::lock_guard lock(mutex_);
            cv_.notify_all();
        });
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [&] {
            return value_.has_value() || token.isCancelled();
        });
        return value_;
    }

    [[nodiscard]] bool isSet() const {
        std::lock_guard lock(mutex_);
        return value_.has_value();
    }

    void reset() {
        std::lock_guard lock(mutex_);
        value_.reset();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> value_;
};

/// Pool of re-armable completion signals.
///
/// Keeps at most kMaxPooled idle signals; returning more discards them.
template <typename T>
class CompletionSignalPool {
public:
    static constexpr std::size_t kMaxPooled = 20;

    std::shared_ptr<CompletionSignal<T>> acquire() {
        std::lock_guard lock(mutex_);
        if (idle_.empty()) {
            return std::make_shared<CompletionSignal<T>>();
        }
        auto signal = std::move(idle_.front());
        idle_.pop_front();
        return signal;
    }

    void release(std::shared_ptr<CompletionSignal<T>> signal) {
        if (!signal) {
            return;
        }
        signal->reset();
        std::lock_guard lock(mutex_);
        if (idle_.size() < kMaxPooled) {
            idle_.push_back(std::move(signal));
        }
    }

    [[nodiscard]] std::size_t idleCount() const {
        std::lock_guard lock(mutex_);
        return idle_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::shared_ptr<CompletionSignal<T>>> idle_;
};

} // namespace cgc::async
