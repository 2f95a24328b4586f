#pragma once

/// @file connection_control.hpp
/// @brief Connection state machine values and the control surface used by
///        the health monitor and reconnect supervisor.

#include <chrono>
#include <cstdint>
#include <string_view>

#include "cgc/async/cancellation_token.hpp"
#include "cgc/foundation/client_result.hpp"
#include "cgc/net/connection_config.hpp"

namespace cgc::net {

/// Lifecycle of a ConnectionClient.
///
/// Disconnected -> Connecting -> Connected -> Disconnecting -> Disconnected.
/// Faulted is entered from Connecting on an unrecoverable configuration or
/// handshake error and is left only through disconnect().
enum class ConnectionState : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting,
    Faulted
};

constexpr std::string_view connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:  return "Disconnected";
        case ConnectionState::Connecting:    return "Connecting";
        case ConnectionState::Connected:     return "Connected";
        case ConnectionState::Disconnecting: return "Disconnecting";
        case ConnectionState::Faulted:       return "Faulted";
    }
    return "Unknown";
}

/// Point-in-time copy of the client counters.
struct ConnectionMetrics {
    uint64_t totalConnections = 0;
    uint64_t totalDisconnections = 0;
    uint64_t totalErrors = 0;
    uint64_t messagesSent = 0;
    uint64_t messagesReceived = 0;
    uint64_t reconnectAttempts = 0;
    float averageLatencyMs = 0.0f;
    /// Epoch milliseconds of the last frame sent or received; 0 if none.
    uint64_t lastActivityMs = 0;
};

/// Operations the background supervisors need from a connection.
///
/// Implemented by ConnectionClient; tests substitute a fake.
class IConnectionControl {
public:
    virtual ~IConnectionControl() = default;

    [[nodiscard]] virtual ConnectionState state() const = 0;
    [[nodiscard]] virtual TransportKind transportKind() const = 0;

    /// Run the connect procedure again within the current session.
    virtual foundation::ClientResult<void> reconnect(const async::CancellationToken& token) = 0;

    /// Tear down the live link (not the session) after a detected failure.
    virtual void reportLinkFailure(const foundation::ClientError& error) = 0;

    /// Send a Heartbeat and wait for its HeartbeatAck.
    /// @return Round-trip time, ProbeTimeout, or OperationCancelled.
    virtual foundation::ClientResult<std::chrono::milliseconds> probe(
        std::chrono::milliseconds timeout, const async::CancellationToken& token) = 0;

    /// Queue a Heartbeat frame without waiting for an answer.
    virtual foundation::ClientResult<void> sendHeartbeat() = 0;
};

} // namespace cgc::net
