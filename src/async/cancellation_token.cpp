/// @file cancellation_token.cpp
/// @brief Shared cancellation state behind CancellationSource / CancellationToken.

#include "cgc/async/cancellation_token.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace cgc::async {

namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
    std::map<uint64_t, std::function<void()>> callbacks;
    uint64_t nextId = 1;

    // Callback currently run by cancel(), and the thread running it.
    uint64_t runningId = 0;
    std::thread::id runningThread;

    // Linked sources keep their parents alive; parents only hold a weak
    // reference back, so there is no cycle.
    std::vector<CancellationToken> parents;
    std::vector<CancellationRegistration> parentLinks;

    void cancel() {
        {
            std::lock_guard lock(mutex);
            if (cancelled.exchange(true, std::memory_order_acq_rel)) {
                return;
            }
            runningThread = std::this_thread::get_id();
        }
        cv.notify_all();

        // One at a time so remove() can tell a pending callback from a running one.
        while (true) {
            std::function<void()> cb;
            {
                std::lock_guard lock(mutex);
                if (callbacks.empty()) {
                    break;
                }
                auto it = callbacks.begin();
                runningId = it->first;
                cb = std::move(it->second);
                callbacks.erase(it);
            }
            RunningGuard guard{*this};
            cb();
        }
    }

    /// Unregister @p id. If cancel() is running that callback on another
    /// thread, block until it returns.
    void remove(uint64_t id) {
        std::unique_lock lock(mutex);
        if (callbacks.erase(id) > 0) {
            return;
        }
        if (runningThread == std::this_thread::get_id()) {
            return;
        }
        cv.wait(lock, [&] { return runningId != id; });
    }

private:
    struct RunningGuard {
        CancellationState& state;
        ~RunningGuard() {
            {
                std::lock_guard lock(state.mutex);
                state.runningId = 0;
            }
            state.cv.notify_all();
        }
    };
};

} // namespace detail

// ---------------------------------------------------------------------------
// CancellationRegistration
// ---------------------------------------------------------------------------

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

CancellationRegistration& CancellationRegistration::operator=(
    CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (id_ == 0) {
        return;
    }
    if (auto state = state_.lock()) {
        state->remove(id_);
    }
    state_.reset();
    id_ = 0;
}

// ---------------------------------------------------------------------------
// CancellationToken
// ---------------------------------------------------------------------------

bool CancellationToken::isCancelled() const noexcept {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] {
        return state_->cancelled.load(std::memory_order_acquire);
    });
}

void CancellationToken::wait() const {
    if (!state_) {
        // Never cancelled: block the way a none() token would.
        std::mutex m;
        std::condition_variable cv;
        std::unique_lock lock(m);
        cv.wait(lock, [] { return false; });
        return;
    }
    std::unique_lock lock(state_->mutex);
    state_->cv.wait(lock, [this] {
        return state_->cancelled.load(std::memory_order_acquire);
    });
}

CancellationRegistration CancellationToken::onCancel(std::function<void()> callback) const {
    if (!state_) {
        return {};
    }
    uint64_t id = 0;
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->cancelled.load(std::memory_order_acquire)) {
            id = state_->nextId++;
            state_->callbacks.emplace(id, std::move(callback));
        }
    }
    if (id == 0) {
        callback();
        return {};
    }
    return CancellationRegistration(state_, id);
}

foundation::ClientResult<void> CancellationToken::checkpoint() const {
    if (isCancelled()) {
        return cancelledResult<void>();
    }
    return foundation::ClientResult<void>::ok();
}

// ---------------------------------------------------------------------------
// CancellationSource
// ---------------------------------------------------------------------------

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource CancellationSource::linked(
    std::initializer_list<CancellationToken> parents) {
    return linked(std::vector<CancellationToken>(parents));
}

CancellationSource CancellationSource::linked(const std::vector<CancellationToken>& parents) {
    CancellationSource source;
    std::weak_ptr<detail::CancellationState> weak = source.state_;
    std::vector<CancellationRegistration> links;
    links.reserve(parents.size());
    for (const auto& parent : parents) {
        links.push_back(parent.onCancel([weak] {
            if (auto child = weak.lock()) {
                child->cancel();
            }
        }));
    }
    {
        std::lock_guard lock(source.state_->mutex);
        source.state_->parents = parents;
        source.state_->parentLinks = std::move(links);
    }
    return source;
}

void CancellationSource::cancel() {
    state_->cancel();
}

bool CancellationSource::isCancelled() const noexcept {
    return state_->cancelled.load(std::memory_order_acquire);
}

} // namespace cgc::async
