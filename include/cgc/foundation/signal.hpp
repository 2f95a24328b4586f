#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> with RAII Subscription handles.
///
/// Slots are invoked synchronously in registration order. emit() takes a
/// snapshot of the slot list under a shared lock, so slots may subscribe or
/// unsubscribe from inside a callback. A slot that throws a std::exception is
/// logged and skipped; delivery continues with the next slot.

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "cgc/foundation/client_logger.hpp"

namespace cgc::foundation {

/// Move-only handle that removes its slot when reset or destroyed.
///
/// Holds only a weak reference to the signal's slot registry, so it is safe
/// to release a Subscription after the Signal itself has been destroyed.
class Subscription {
public:
    Subscription() = default;

    explicit Subscription(std::function<void()> release)
        : release_(std::move(release)) {}

    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : release_(std::exchange(other.release_, nullptr)) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            release_ = std::exchange(other.release_, nullptr);
        }
        return *this;
    }

    /// Unsubscribe now. Idempotent.
    void reset() {
        if (release_) {
            auto release = std::exchange(release_, nullptr);
            release();
        }
    }

    /// Keep the slot registered for the signal's lifetime.
    void detach() noexcept { release_ = nullptr; }

    [[nodiscard]] bool active() const noexcept { return static_cast<bool>(release_); }

private:
    std::function<void()> release_;
};

/// Thread-safe signal (observer pattern) that dispatches events to registered
/// callbacks.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<float> onLatency;
///   auto sub = onLatency.subscribe([](float ms) { hud.setPing(ms); });
///   onLatency.emit(42.0f);
///   sub.reset();   // or let it go out of scope
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() : registry_(std::make_shared<Registry>()) {}
    ~Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Register a callback; the returned handle owns the registration.
    [[nodiscard]] Subscription subscribe(Slot slot) {
        auto id = connect(std::move(slot));
        std::weak_ptr<Registry> weak = registry_;
        return Subscription([weak, id] {
            if (auto registry = weak.lock()) {
                std::unique_lock lock(registry->mutex);
                registry->slots.erase(id);
            }
        });
    }

    /// Register a callback without a handle. Returns a SlotId for disconnect().
    SlotId connect(Slot slot) {
        auto id = registry_->nextId.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(registry_->mutex);
        registry_->slots.emplace(id, std::move(slot));
        return id;
    }

    /// Remove a previously registered callback by its SlotId.
    void disconnect(SlotId id) {
        std::unique_lock lock(registry_->mutex);
        registry_->slots.erase(id);
    }

    /// Fire the signal. Returns the number of slots that threw.
    std::size_t emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(registry_->mutex);
            snapshot.reserve(registry_->slots.size());
            for (const auto& [id, slot] : registry_->slots) {
                snapshot.push_back(slot);
            }
        }

        std::size_t failures = 0;
        for (const auto& slot : snapshot) {
            try {
                slot(args...);
            } catch (const std::exception& e) {
                ++failures;
                CGC_LOG_WARN(LogCategory::Events,
                             std::string("event handler threw: ") + e.what());
            } catch (...) {
                ++failures;
                CGC_LOG_WARN(LogCategory::Events, "event handler threw a non-standard exception");
            }
        }
        return failures;
    }

    /// Return the number of currently connected slots.
    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(registry_->mutex);
        return registry_->slots.size();
    }

private:
    struct Registry {
        mutable std::shared_mutex mutex;
        std::map<SlotId, Slot> slots; // ordered by id == registration order
        std::atomic<SlotId> nextId{1};
    };

    std::shared_ptr<Registry> registry_;
};

} // namespace cgc::foundation
