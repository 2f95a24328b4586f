/// @file event_notifier.cpp
/// @brief EventNotifier and DeferredEventQueue implementation.

#include "cgc/net/event_notifier.hpp"

namespace cgc::net {

using foundation::Subscription;

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

std::string_view connectionEventName(const ConnectionEvent& event) {
    return std::visit(Overloaded{
        [](const events::Connected&) -> std::string_view { return "Connected"; },
        [](const events::Disconnected&) -> std::string_view { return "Disconnected"; },
        [](const events::ErrorRaised&) -> std::string_view { return "Error"; },
        [](const events::LatencyMeasured&) -> std::string_view { return "LatencyMeasured"; },
        [](const events::MessageReceived&) -> std::string_view { return "Message"; },
    }, event);
}

// ---------------------------------------------------------------------------
// EventNotifier
// ---------------------------------------------------------------------------

Subscription EventNotifier::onConnected(std::function<void()> handler) {
    return connected_.subscribe(std::move(handler));
}

Subscription EventNotifier::onDisconnected(std::function<void()> handler) {
    return disconnected_.subscribe(std::move(handler));
}

Subscription EventNotifier::onError(std::function<void(const std::string&)> handler) {
    return error_.subscribe(std::move(handler));
}

Subscription EventNotifier::onLatencyMeasured(std::function<void(float)> handler) {
    return latency_.subscribe(std::move(handler));
}

Subscription EventNotifier::onMessage(std::function<void(const Message&)> handler) {
    return message_.subscribe(std::move(handler));
}

Subscription EventNotifier::onAny(std::function<void(const ConnectionEvent&)> handler) {
    return any_.subscribe(std::move(handler));
}

void EventNotifier::publish(const ConnectionEvent& event) {
    std::visit(Overloaded{
        [this](const events::Connected&) { connected_.emit(); },
        [this](const events::Disconnected&) { disconnected_.emit(); },
        [this](const events::ErrorRaised& e) { error_.emit(e.message); },
        [this](const events::LatencyMeasured& e) { latency_.emit(e.milliseconds); },
        [this](const events::MessageReceived& e) { message_.emit(e.message); },
    }, event);
    any_.emit(event);
}

std::size_t EventNotifier::subscriberCount() const {
    return connected_.slotCount() + disconnected_.slotCount() + error_.slotCount() +
           latency_.slotCount() + message_.slotCount() + any_.slotCount();
}

// ---------------------------------------------------------------------------
// DeferredEventQueue
// ---------------------------------------------------------------------------

DeferredEventQueue::DeferredEventQueue(EventNotifier& source, std::size_t maxPending)
    : maxPending_(maxPending) {
    subscription_ = source.onAny([this](const ConnectionEvent& event) { enqueue(event); });
}

void DeferredEventQueue::enqueue(const ConnectionEvent& event) {
    std::lock_guard lock(mutex_);
    if (maxPending_ != 0 && queue_.size() >= maxPending_) {
        queue_.pop_front();
        ++dropped_;
    }
    queue_.push_back(event);
}

std::size_t DeferredEventQueue::drain() {
    std::deque<ConnectionEvent> batch;
    {
        std::lock_guard lock(mutex_);
        batch.swap(queue_);
    }
    for (const auto& event : batch) {
        local_.publish(event);
    }
    return batch.size();
}

std::size_t DeferredEventQueue::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

std::size_t DeferredEventQueue::dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

} // namespace cgc::net
