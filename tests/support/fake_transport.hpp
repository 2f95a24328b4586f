#pragma once

/// @file fake_transport.hpp
/// @brief In-process ITransport with a scriptable server side.

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

#include "cgc/net/message_codec.hpp"
#include "cgc/net/transport.hpp"

namespace cgc::test {

using cgc::foundation::ClientResult;
using cgc::foundation::ErrorCode;
using cgc::foundation::makeError;

/// Server end of one fake connection.
class FakeLink {
public:
    /// Called with every message the client writes, outside the link lock.
    using Responder = std::function<void(FakeLink&, const net::Message&)>;

    explicit FakeLink(Responder responder) : responder_(std::move(responder)) {}

    /// Queue an encoded message for the client to read.
    void push(const net::Message& message) {
        auto frame = codec_.encode(message);
        ASSERT_TRUE(frame.hasValue());
        pushBytes(frame.value());
    }

    void push(net::MessageType type, uint32_t sequence, std::vector<uint8_t> payload = {}) {
        net::Message message;
        message.type = type;
        message.sequenceNumber = sequence;
        message.timestampMs = net::nowEpochMs();
        message.payload = std::move(payload);
        push(message);
    }

    void pushBytes(const std::vector<uint8_t>& bytes) {
        {
            std::lock_guard lock(mutex_);
            toClient_.insert(toClient_.end(), bytes.begin(), bytes.end());
        }
        cv_.notify_all();
    }

    /// Simulate the server dropping the connection.
    void closePeer() {
        {
            std::lock_guard lock(mutex_);
            peerClosed_ = true;
        }
        cv_.notify_all();
    }

    /// While stalled, client writes block until released or closed.
    void stallWrites(bool stall) {
        {
            std::lock_guard lock(mutex_);
            stalled_ = stall;
        }
        cv_.notify_all();
    }

    /// Every message the client has written so far, in order.
    std::vector<net::Message> received() const {
        std::lock_guard lock(mutex_);
        return received_;
    }

    /// Wait until a written message satisfies @p pred.
    std::optional<net::Message> waitFor(const std::function<bool(const net::Message&)>& pred,
                                        std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock lock(mutex_);
        std::optional<net::Message> found;
        cv_.wait_for(lock, timeout, [&] {
            auto it = std::find_if(received_.begin(), received_.end(), pred);
            if (it != received_.end()) {
                found = *it;
                return true;
            }
            return false;
        });
        return found;
    }

    bool isClosed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    // -- client side, used by FakeTransport ------------------------------------

    ClientResult<void> write(std::span<const uint8_t> bytes) {
        std::optional<net::Message> decoded;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return !stalled_ || closed_; });
            if (closed_ || peerClosed_) {
                return makeError<void>(ErrorCode::NotConnected, "fake link closed");
            }
            auto message = codec_.decode(bytes);
            if (message.hasValue()) {
                received_.push_back(message.value());
                decoded = message.value();
            }
        }
        cv_.notify_all();
        if (decoded && responder_) {
            responder_(*this, *decoded);
        }
        return ClientResult<void>::ok();
    }

    ClientResult<std::size_t> read(std::span<uint8_t> out, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] {
            return !toClient_.empty() || closed_ || peerClosed_;
        });
        if (!toClient_.empty()) {
            auto n = std::min(out.size(), toClient_.size());
            std::copy_n(toClient_.begin(), n, out.begin());
            toClient_.erase(toClient_.begin(), toClient_.begin() + static_cast<std::ptrdiff_t>(n));
            return ClientResult<std::size_t>::ok(n);
        }
        if (closed_ || peerClosed_) {
            return makeError<std::size_t>(ErrorCode::ConnectionLost, "fake peer closed");
        }
        return ClientResult<std::size_t>::ok(0);
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    Responder responder_;
    const net::MessageCodec codec_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<uint8_t> toClient_;
    std::vector<net::Message> received_;
    bool closed_ = false;
    bool peerClosed_ = false;
    bool stalled_ = false;
};

/// Creates FakeTransports and records every link they open.
class FakeNetwork {
public:
    /// Every open() fails with ConnectionRefused while set.
    std::atomic<bool> refuse{false};

    /// Responder installed on new links.
    FakeLink::Responder responder;

    /// When set, open() blocks until holdOpens(false) or cancellation.
    void holdOpens(bool hold) {
        {
            std::lock_guard lock(mutex_);
            hold_ = hold;
        }
        cv_.notify_all();
    }

    net::TransportFactory factory();

    int opens() const { return opens_.load(); }

    /// Link of the @p index-th successful open, waiting for it to appear.
    std::shared_ptr<FakeLink> link(std::size_t index = 0,
                                   std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [&] { return links_.size() > index; });
        return links_.size() > index ? links_[index] : nullptr;
    }

    std::shared_ptr<FakeLink> lastLink() {
        std::lock_guard lock(mutex_);
        return links_.empty() ? nullptr : links_.back();
    }

    std::size_t linkCount() const {
        std::lock_guard lock(mutex_);
        return links_.size();
    }

    /// Wait until @p count open() calls were made.
    bool waitForOpens(int count, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return opens_.load() >= count; });
    }

    ClientResult<std::shared_ptr<FakeLink>> open(const async::CancellationToken& token) {
        // Registered before locking: it runs inline if already cancelled.
        auto wake = token.onCancel([this] {
            std::lock_guard inner(mutex_);
            cv_.notify_all();
        });
        {
            std::unique_lock lock(mutex_);
            opens_.fetch_add(1);
            cv_.notify_all();
            cv_.wait(lock, [&] { return !hold_ || token.isCancelled(); });
        }
        if (token.isCancelled()) {
            return makeError<std::shared_ptr<FakeLink>>(ErrorCode::OperationCancelled,
                                                        "open cancelled");
        }
        if (refuse.load()) {
            return makeError<std::shared_ptr<FakeLink>>(ErrorCode::ConnectionRefused,
                                                        "connection refused");
        }
        auto link = std::make_shared<FakeLink>(responder);
        {
            std::lock_guard lock(mutex_);
            links_.push_back(link);
        }
        cv_.notify_all();
        return ClientResult<std::shared_ptr<FakeLink>>::ok(link);
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::shared_ptr<FakeLink>> links_;
    std::atomic<int> opens_{0};
    bool hold_ = false;
};

/// ITransport over a FakeLink.
class FakeTransport : public net::ITransport {
public:
    FakeTransport(FakeNetwork& network, net::TransportKind kind)
        : network_(network), kind_(kind) {}

    ClientResult<void> open(const net::Endpoint& endpoint, std::chrono::milliseconds,
                            const async::CancellationToken& token) override {
        endpoint_ = endpoint;
        auto opened = network_.open(token);
        if (!opened) {
            return ClientResult<void>::err(opened.error());
        }
        link_ = opened.value();
        return ClientResult<void>::ok();
    }

    ClientResult<void> write(std::span<const uint8_t> bytes) override {
        if (!link_) {
            return makeError<void>(ErrorCode::NotConnected, "not open");
        }
        return link_->write(bytes);
    }

    ClientResult<std::size_t> read(std::span<uint8_t> out,
                                   std::chrono::milliseconds timeout) override {
        if (!link_) {
            return makeError<std::size_t>(ErrorCode::NotConnected, "not open");
        }
        return link_->read(out, timeout);
    }

    void close() override {
        if (link_) {
            link_->close();
        }
    }

    bool isOpen() const override { return link_ && !link_->isClosed(); }

    std::string_view name() const override {
        return kind_ == net::TransportKind::Rpc ? "fake-rpc" : "fake-stream";
    }

private:
    FakeNetwork& network_;
    net::TransportKind kind_;
    net::Endpoint endpoint_;
    std::shared_ptr<FakeLink> link_;
};

inline net::TransportFactory FakeNetwork::factory() {
    return [this](net::TransportKind kind) -> std::unique_ptr<net::ITransport> {
        return std::make_unique<FakeTransport>(*this, kind);
    };
}

/// Responder acknowledging Connect and answering heartbeats.
inline FakeLink::Responder ackingServer(std::vector<uint8_t> resumptionToken = {}) {
    return [resumptionToken](FakeLink& link, const net::Message& message) {
        if (message.type == net::MessageType::Connect) {
            link.push(net::MessageType::ConnectAck, 0, resumptionToken);
        } else if (message.type == net::MessageType::Heartbeat) {
            link.push(net::MessageType::HeartbeatAck, message.sequenceNumber);
        }
    };
}

} // namespace cgc::test
