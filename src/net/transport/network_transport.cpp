/// @file network_transport.cpp
/// @brief ITransport implementations wrapping kcenon network_system clients.

#include "cgc/net/transport.hpp"

#include "cgc/foundation/client_logger.hpp"

// kcenon facade headers (kept out of the public API)
#include <kcenon/network/facade/tcp_facade.h>
#include <kcenon/network/facade/websocket_facade.h>
#include <kcenon/network/interfaces/connection_observer.h>
#include <kcenon/network/interfaces/i_protocol_client.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace cgc::net {

using foundation::ClientResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::makeError;

namespace knet = kcenon::network;

namespace {

/// State shared with the observer callbacks. Callbacks capture it by
/// shared_ptr so they stay valid if the transport is destroyed first.
struct LinkState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<uint8_t> inbound;
    bool connected = false;
    bool closed = false;
    std::string closeReason;
};

class NetworkTransport final : public ITransport {
public:
    explicit NetworkTransport(TransportKind kind) : kind_(kind) {}

    ~NetworkTransport() override { close(); }

    ClientResult<void> open(const Endpoint& endpoint, std::chrono::milliseconds timeout,
                            const async::CancellationToken& token) override {
        if (token.isCancelled()) {
            return async::cancelledResult<void>("connect cancelled");
        }

        auto state = std::make_shared<LinkState>();
        std::shared_ptr<knet::interfaces::i_protocol_client> client;

        if (kind_ == TransportKind::Stream) {
            // TCP facade starts connecting inside create_client().
            knet::facade::tcp_facade tcp;
            knet::facade::tcp_facade::client_config cfg{};
            cfg.host = endpoint.host;
            cfg.port = endpoint.port;
            cfg.client_id = "cgc-stream";
            client = tcp.create_client(cfg);
        } else {
            knet::facade::websocket_facade ws;
            client = ws.create_client({.client_id = "cgc-rpc"});
        }
        if (!client) {
            return makeError<void>(ErrorCode::ConnectionFailed,
                                   "failed to create client for " + endpoint.toString());
        }

        attachObserver(*client, state);

        if (kind_ == TransportKind::Rpc) {
            auto started = client->start(endpoint.host, endpoint.port);
            if (started.is_err()) {
                return makeError<void>(ErrorCode::ConnectionRefused,
                                       "websocket start failed for " + endpoint.toString());
            }
        }

        // The connected callback may have fired before the observer was attached.
        if (client->is_connected()) {
            std::lock_guard lock(state->mutex);
            state->connected = true;
        }

        auto wake = token.onCancel([state] {
            std::lock_guard lock(state->mutex);
            state->cv.notify_all();
        });

        bool connected = false;
        bool refused = false;
        {
            std::unique_lock lock(state->mutex);
            state->cv.wait_for(lock, timeout, [&] {
                return state->connected || state->closed || token.isCancelled();
            });
            connected = state->connected && !state->closed;
            refused = state->closed;
        }

        if (!connected) {
            (void)client->stop();
            if (token.isCancelled()) {
                return async::cancelledResult<void>("connect cancelled");
            }
            if (refused) {
                return makeError<void>(ErrorCode::ConnectionRefused,
                                       "connection to " + endpoint.toString() + " refused");
            }
            return makeError<void>(ErrorCode::Timeout,
                                   "connect to " + endpoint.toString() + " timed out after " +
                                       std::to_string(timeout.count()) + "ms");
        }

        {
            std::lock_guard lock(clientMutex_);
            client_ = std::move(client);
            state_ = std::move(state);
        }
        CGC_LOG_DEBUG(LogCategory::Transport,
                      std::string(name()) + " connected to " + endpoint.toString());
        return ClientResult<void>::ok();
    }

    ClientResult<void> write(std::span<const uint8_t> bytes) override {
        std::shared_ptr<knet::interfaces::i_protocol_client> client;
        {
            std::lock_guard lock(clientMutex_);
            client = client_;
        }
        if (!client || !isOpen()) {
            return makeError<void>(ErrorCode::NotConnected, "transport is not open");
        }
        auto sent = client->send(std::vector<uint8_t>(bytes.begin(), bytes.end()));
        if (!sent.is_ok()) {
            return makeError<void>(ErrorCode::SendFailed, "transport send failed");
        }
        return ClientResult<void>::ok();
    }

    ClientResult<std::size_t> read(std::span<uint8_t> out,
                                   std::chrono::milliseconds timeout) override {
        std::shared_ptr<LinkState> state;
        {
            std::lock_guard lock(clientMutex_);
            state = state_;
        }
        if (!state) {
            return makeError<std::size_t>(ErrorCode::NotConnected, "transport is not open");
        }

        std::unique_lock lock(state->mutex);
        state->cv.wait_for(lock, timeout, [&] {
            return !state->inbound.empty() || state->closed;
        });
        if (state->inbound.empty()) {
            if (state->closed) {
                return makeError<std::size_t>(
                    ErrorCode::ConnectionLost,
                    state->closeReason.empty() ? "connection closed by peer"
                                               : state->closeReason);
            }
            return ClientResult<std::size_t>::ok(0);
        }

        auto n = std::min(out.size(), state->inbound.size());
        std::copy_n(state->inbound.begin(), n, out.begin());
        state->inbound.erase(state->inbound.begin(),
                             state->inbound.begin() + static_cast<std::ptrdiff_t>(n));
        return ClientResult<std::size_t>::ok(n);
    }

    void close() override {
        std::shared_ptr<knet::interfaces::i_protocol_client> client;
        std::shared_ptr<LinkState> state;
        {
            std::lock_guard lock(clientMutex_);
            client = std::exchange(client_, nullptr);
            state = state_;
        }
        if (state) {
            {
                std::lock_guard lock(state->mutex);
                state->closed = true;
                if (state->closeReason.empty()) {
                    state->closeReason = "closed locally";
                }
            }
            state->cv.notify_all();
        }
        if (client) {
            auto stopped = client->stop();
            if (stopped.is_err()) {
                CGC_LOG_DEBUG(LogCategory::Transport,
                              std::string(name()) + " stop reported an error");
            }
        }
    }

    bool isOpen() const override {
        std::shared_ptr<LinkState> state;
        {
            std::lock_guard lock(clientMutex_);
            if (!client_) {
                return false;
            }
            state = state_;
        }
        std::lock_guard lock(state->mutex);
        return state->connected && !state->closed;
    }

    std::string_view name() const override {
        return kind_ == TransportKind::Stream ? "tcp" : "websocket";
    }

private:
    static void attachObserver(knet::interfaces::i_protocol_client& client,
                               const std::shared_ptr<LinkState>& state) {
        auto adapter = std::make_shared<knet::interfaces::callback_adapter>();
        adapter->on_connected([state]() {
            {
                std::lock_guard lock(state->mutex);
                state->connected = true;
            }
            state->cv.notify_all();
        }).on_receive([state](std::span<const uint8_t> data) {
            {
                std::lock_guard lock(state->mutex);
                state->inbound.insert(state->inbound.end(), data.begin(), data.end());
            }
            state->cv.notify_all();
        }).on_disconnected([state](std::optional<std::string_view> reason) {
            {
                std::lock_guard lock(state->mutex);
                state->closed = true;
                if (reason) {
                    state->closeReason = std::string(*reason);
                }
            }
            state->cv.notify_all();
        }).on_error([state](std::error_code ec) {
            {
                std::lock_guard lock(state->mutex);
                state->closed = true;
                state->closeReason = ec.message();
            }
            state->cv.notify_all();
        });
        client.set_observer(adapter);
    }

    const TransportKind kind_;
    mutable std::mutex clientMutex_;
    std::shared_ptr<knet::interfaces::i_protocol_client> client_;
    std::shared_ptr<LinkState> state_;
};

} // namespace

std::unique_ptr<ITransport> makeStreamTransport() {
    return std::make_unique<NetworkTransport>(TransportKind::Stream);
}

std::unique_ptr<ITransport> makeRpcTransport() {
    return std::make_unique<NetworkTransport>(TransportKind::Rpc);
}

TransportFactory defaultTransportFactory() {
    return [](TransportKind kind) -> std::unique_ptr<ITransport> {
        return kind == TransportKind::Rpc ? makeRpcTransport() : makeStreamTransport();
    };
}

} // namespace cgc::net
