#pragma once

/// @file bounded_queue.hpp
/// @brief Bounded multi-producer queue with non-blocking push.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace cgc::net {

/// Outgoing frame queue of the connection client.
///
/// Producers never block: tryPush() fails when the queue is full so the
/// caller can report backpressure. The consumer waits with a timeout so it
/// can observe cancellation between items. close() wakes every waiter;
/// items already queued can still be popped after close.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// @return false if the queue is full or closed.
    bool tryPush(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_ || items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return true;
    }

    /// Wait up to @p timeout for an item. nullopt on timeout or when closed and drained.
    std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        notEmpty_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
    }

    /// Drop queued items and accept pushes again.
    void reopen() {
        std::lock_guard lock(mutex_);
        items_.clear();
        closed_ = false;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] bool isClosed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace cgc::net
