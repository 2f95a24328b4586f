#pragma once

/// @file transport.hpp
/// @brief Byte transport abstraction used by ConnectionClient and its
///        kcenon network_system backed implementations.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string_view>

#include "cgc/async/cancellation_token.hpp"
#include "cgc/foundation/client_result.hpp"
#include "cgc/net/connection_config.hpp"

namespace cgc::net {

/// Bidirectional byte channel to the server.
///
/// Implementations must allow write() and read() to be called concurrently
/// from different threads, and close() from any thread; close() wakes a
/// blocked read().
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Connect to @p endpoint, giving up after @p timeout or when @p token fires.
    /// @return Timeout, ConnectionRefused/ConnectionFailed, or OperationCancelled.
    virtual foundation::ClientResult<void> open(const Endpoint& endpoint,
                                                std::chrono::milliseconds timeout,
                                                const async::CancellationToken& token) = 0;

    /// Send @p bytes. Fails with NotConnected or SendFailed.
    virtual foundation::ClientResult<void> write(std::span<const uint8_t> bytes) = 0;

    /// Copy up to out.size() received bytes into @p out.
    /// @return Bytes copied, 0 if nothing arrived within @p timeout,
    ///         ConnectionLost once the peer closed and the buffer is drained.
    virtual foundation::ClientResult<std::size_t> read(std::span<uint8_t> out,
                                                       std::chrono::milliseconds timeout) = 0;

    /// Close the channel. Idempotent.
    virtual void close() = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Creates a fresh transport for each connect attempt.
using TransportFactory = std::function<std::unique_ptr<ITransport>(TransportKind)>;

/// Framed-stream transport over the kcenon TCP facade.
[[nodiscard]] std::unique_ptr<ITransport> makeStreamTransport();

/// RPC-style transport over the kcenon WebSocket facade (message channel).
[[nodiscard]] std::unique_ptr<ITransport> makeRpcTransport();

/// Factory choosing makeStreamTransport() or makeRpcTransport() by kind.
[[nodiscard]] TransportFactory defaultTransportFactory();

} // namespace cgc::net
