#pragma once

/// @file connection_client.hpp
/// @brief Resilient connection to a game server: state machine, framed
///        send/receive loops, keepalive and automatic reconnection.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "cgc/async/cancellation_scope_manager.hpp"
#include "cgc/foundation/client_result.hpp"
#include "cgc/net/connection_config.hpp"
#include "cgc/net/connection_control.hpp"
#include "cgc/net/event_notifier.hpp"
#include "cgc/net/message.hpp"
#include "cgc/net/resumption_store.hpp"
#include "cgc/net/transport.hpp"

namespace cgc::net {

class HealthMonitor;
class ReconnectSupervisor;

/// Client side of one server connection.
///
/// All background work (sender, receiver, keepalive, reconnect supervisor)
/// runs as tracked operations of the injected CancellationScopeManager. The
/// link loops follow a link scope nested in the client's session scope, so
/// disconnect() and CancellationScopeManager::resetSession() both stop them.
///
/// Public methods are thread-safe. Events are published through the
/// injected EventNotifier on the thread that caused them, which is often a
/// client loop; handlers may call disconnect() from there.
///
/// Example:
/// @code
///   CancellationScopeManager scopes;
///   EventNotifier events;
///   auto sub = events.onMessage([](const Message& m) { apply(m); });
///
///   ConnectionClient client(config, scopes, events);
///   if (auto connected = client.connect(); !connected) {
///       CGC_LOG_ERROR(LogCategory::Core, connected.error().describe());
///   }
///   client.send(MessageType::PlayerAction, encodeMove(move));
///   client.disconnect();
/// @endcode
class ConnectionClient final : public IConnectionControl {
public:
    ConnectionClient(ConnectionConfig config,
                     async::CancellationScopeManager& scopes,
                     EventNotifier& events,
                     TransportFactory transportFactory = defaultTransportFactory(),
                     std::shared_ptr<IResumptionStore> resumptionStore = nullptr);

    /// Calls dispose().
    ~ConnectionClient() override;

    ConnectionClient(const ConnectionClient&) = delete;
    ConnectionClient& operator=(const ConnectionClient&) = delete;

    /// Connect with retries. Blocks the caller until Connected, retries are
    /// exhausted, or disconnect() interrupts the attempt.
    ///
    /// @return AlreadyInProgress while Connecting, AlreadyConnected when
    ///         Connected, InvalidState when Faulted or Disconnecting,
    ///         InvalidConfig (client becomes Faulted), HandshakeRejected
    ///         (Faulted), RetriesExhausted, OperationCancelled, Disposed.
    foundation::ClientResult<void> connect();

    /// Queue @p message for sending. Sequence number and timestamp are
    /// assigned here. Never blocks on I/O.
    /// @return The sequence number, or NotConnected, FrameTooLarge, Backpressure.
    foundation::ClientResult<uint32_t> send(Message message);
    foundation::ClientResult<uint32_t> send(MessageType type, std::vector<uint8_t> payload);

    /// Close the connection and stop the session. Idempotent.
    foundation::ClientResult<void> disconnect();

    /// disconnect() and release the client for good. Later connect() calls
    /// return Disposed.
    void dispose();

    // IConnectionControl
    [[nodiscard]] ConnectionState state() const override;
    [[nodiscard]] TransportKind transportKind() const override;
    foundation::ClientResult<void> reconnect(const async::CancellationToken& token) override;
    void reportLinkFailure(const foundation::ClientError& error) override;
    foundation::ClientResult<std::chrono::milliseconds> probe(
        std::chrono::milliseconds timeout, const async::CancellationToken& token) override;
    foundation::ClientResult<void> sendHeartbeat() override;

    [[nodiscard]] ConnectionMetrics metrics() const;
    [[nodiscard]] const ConnectionConfig& config() const noexcept;
    [[nodiscard]] float averageLatency() const;

    /// Store a resumption token for the configured endpoint. No-op without a store.
    void saveResumptionToken(std::vector<uint8_t> token);
    [[nodiscard]] std::optional<std::vector<uint8_t>> loadResumptionToken() const;

    [[nodiscard]] HealthMonitor& healthMonitor() noexcept;
    [[nodiscard]] ReconnectSupervisor& supervisor() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cgc::net
