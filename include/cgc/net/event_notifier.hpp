#pragma once

/// @file event_notifier.hpp
/// @brief Connection lifecycle events delivered to the application.

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>

#include "cgc/foundation/signal.hpp"
#include "cgc/net/message.hpp"

namespace cgc::net {

namespace events {

struct Connected {};
struct Disconnected {};
struct ErrorRaised {
    std::string message;
};
struct LatencyMeasured {
    float milliseconds = 0.0f;
};
struct MessageReceived {
    Message message;
};

} // namespace events

/// Closed set of events a ConnectionClient can publish.
using ConnectionEvent = std::variant<events::Connected,
                                     events::Disconnected,
                                     events::ErrorRaised,
                                     events::LatencyMeasured,
                                     events::MessageReceived>;

[[nodiscard]] std::string_view connectionEventName(const ConnectionEvent& event);

/// Fan-out point for connection events.
///
/// Delivery is synchronous on the publishing thread (usually a client loop),
/// in registration order, over a snapshot taken at publish time. A handler
/// that throws is logged and skipped; the remaining handlers still run.
/// Handlers must not block for long: they run on the client's I/O threads.
///
/// Example:
/// @code
///   EventNotifier events;
///   auto sub = events.onError([](const std::string& what) { showToast(what); });
///   ConnectionClient client(config, scopes, events);
/// @endcode
class EventNotifier {
public:
    EventNotifier() = default;

    EventNotifier(const EventNotifier&) = delete;
    EventNotifier& operator=(const EventNotifier&) = delete;

    [[nodiscard]] foundation::Subscription onConnected(std::function<void()> handler);
    [[nodiscard]] foundation::Subscription onDisconnected(std::function<void()> handler);
    [[nodiscard]] foundation::Subscription onError(std::function<void(const std::string&)> handler);
    [[nodiscard]] foundation::Subscription onLatencyMeasured(std::function<void(float)> handler);
    [[nodiscard]] foundation::Subscription onMessage(std::function<void(const Message&)> handler);

    /// Observe every event as a ConnectionEvent value.
    [[nodiscard]] foundation::Subscription onAny(
        std::function<void(const ConnectionEvent&)> handler);

    /// Dispatch @p event to the matching signal, then to onAny() handlers.
    void publish(const ConnectionEvent& event);

    void notifyConnected() { publish(events::Connected{}); }
    void notifyDisconnected() { publish(events::Disconnected{}); }
    void notifyError(std::string message) { publish(events::ErrorRaised{std::move(message)}); }
    void notifyLatency(float ms) { publish(events::LatencyMeasured{ms}); }
    void notifyMessage(Message message) { publish(events::MessageReceived{std::move(message)}); }

    [[nodiscard]] std::size_t subscriberCount() const;

private:
    foundation::Signal<> connected_;
    foundation::Signal<> disconnected_;
    foundation::Signal<const std::string&> error_;
    foundation::Signal<float> latency_;
    foundation::Signal<const Message&> message_;
    foundation::Signal<const ConnectionEvent&> any_;
};

/// Buffers events published on client threads and replays them on the
/// thread that calls drain(), typically the application's main loop.
///
/// Subscribers attach to notifier(), which only ever fires from drain().
class DeferredEventQueue {
public:
    /// @param maxPending Oldest events are dropped beyond this count; 0 = unbounded.
    explicit DeferredEventQueue(EventNotifier& source, std::size_t maxPending = 0);

    DeferredEventQueue(const DeferredEventQueue&) = delete;
    DeferredEventQueue& operator=(const DeferredEventQueue&) = delete;

    /// Replay buffered events in arrival order. Returns the number replayed.
    /// Events arriving during drain() wait for the next call.
    std::size_t drain();

    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] std::size_t dropped() const;

    EventNotifier& notifier() noexcept { return local_; }

private:
    void enqueue(const ConnectionEvent& event);

    EventNotifier local_;
    const std::size_t maxPending_;
    mutable std::mutex mutex_;
    std::deque<ConnectionEvent> queue_;
    std::size_t dropped_ = 0;
    foundation::Subscription subscription_;
};

} // namespace cgc::net
