#pragma once

/// @file connection_config.hpp
/// @brief ConnectionConfig, endpoint parsing and YAML loading.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "cgc/foundation/client_result.hpp"

namespace cgc::foundation {
class ConfigManager;
} // namespace cgc::foundation

namespace cgc::net {

/// Transport flavour used by a ConnectionClient.
enum class TransportKind : uint8_t {
    Stream, ///< Length-prefixed frames over a TCP byte stream
    Rpc     ///< Message-oriented channel with request/ack semantics
};

/// Growth of the delay between connect attempts.
enum class BackoffStrategy : uint8_t { Linear, Exponential };

constexpr std::string_view transportKindName(TransportKind kind) {
    return kind == TransportKind::Rpc ? "rpc" : "stream";
}

constexpr std::string_view backoffStrategyName(BackoffStrategy strategy) {
    return strategy == BackoffStrategy::Exponential ? "Exponential" : "Linear";
}

/// Host and port parsed from a "host:port" address.
struct Endpoint {
    std::string host;
    uint16_t port = 0;

    [[nodiscard]] std::string toString() const {
        return host + ":" + std::to_string(port);
    }

    friend bool operator==(const Endpoint&, const Endpoint&) = default;
};

/// Parse "host:port" (IPv6 literals as "[::1]:port").
/// @return InvalidConfig for a missing host, missing or zero port.
[[nodiscard]] foundation::ClientResult<Endpoint> parseEndpoint(std::string_view address);

/// Connection settings. Immutable once handed to a ConnectionClient.
struct ConnectionConfig {
    std::string serverAddress = "127.0.0.1:5000";
    TransportKind transport = TransportKind::Stream;

    std::chrono::milliseconds connectTimeout{5000};
    uint32_t maxRetryAttempts = 3;
    std::chrono::milliseconds retryBaseDelay{1000};
    BackoffStrategy backoffStrategy = BackoffStrategy::Linear;
    std::chrono::milliseconds maxRetryDelay{30000};
    bool enableJitter = false;

    /// Zero disables keepalive.
    std::chrono::milliseconds keepaliveInterval{30000};
    std::chrono::milliseconds probeTimeout{5000};

    std::chrono::milliseconds reconnectDelay{5000};
    bool enableAutoReconnect = true;

    std::size_t compressionThreshold = 512;
    bool enableCompression = true;
    std::size_t maxFrameSize = 65536;

    std::size_t sendQueueCapacity = 1024;
    std::chrono::milliseconds disconnectTimeout{2000};
    std::chrono::milliseconds gracefulCloseWait{100};

    /// Check field ranges and that serverAddress parses.
    [[nodiscard]] foundation::ClientResult<void> validate() const;
};

/// Read a ConnectionConfig from @p section of a loaded ConfigManager.
///
/// Absent keys keep their defaults. The result is validated.
/// @return ConfigTypeMismatch for wrongly typed values or unknown
///         Transport/BackoffStrategy names, InvalidConfig from validate().
[[nodiscard]] foundation::ClientResult<ConnectionConfig>
loadConnectionConfig(const foundation::ConfigManager& config,
                     std::string_view section = "network");

} // namespace cgc::net
