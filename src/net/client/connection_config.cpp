/// @file connection_config.cpp
/// @brief Endpoint parsing, ConnectionConfig validation and YAML mapping.

#include "cgc/net/connection_config.hpp"

#include "cgc/foundation/config_manager.hpp"

#include <charconv>
#include <functional>
#include <type_traits>

namespace cgc::net {

using foundation::ClientError;
using foundation::ClientResult;
using foundation::ErrorCode;
using foundation::makeError;

ClientResult<Endpoint> parseEndpoint(std::string_view address) {
    std::string_view host;
    std::string_view port;

    if (!address.empty() && address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string_view::npos || close + 1 >= address.size() ||
            address[close + 1] != ':') {
            return makeError<Endpoint>(ErrorCode::InvalidConfig,
                                       "malformed IPv6 address: " + std::string(address));
        }
        host = address.substr(1, close - 1);
        port = address.substr(close + 2);
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string_view::npos) {
            return makeError<Endpoint>(ErrorCode::InvalidConfig,
                                       "address must be host:port: " + std::string(address));
        }
        host = address.substr(0, colon);
        port = address.substr(colon + 1);
    }

    if (host.empty()) {
        return makeError<Endpoint>(ErrorCode::InvalidConfig,
                                   "missing host in address: " + std::string(address));
    }

    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    if (ec != std::errc() || ptr != port.data() + port.size() || value == 0 || value > 65535) {
        return makeError<Endpoint>(ErrorCode::InvalidConfig,
                                   "invalid port in address: " + std::string(address));
    }
    return ClientResult<Endpoint>::ok(Endpoint{std::string(host), static_cast<uint16_t>(value)});
}

ClientResult<void> ConnectionConfig::validate() const {
    auto endpoint = parseEndpoint(serverAddress);
    if (endpoint.hasError()) {
        return ClientResult<void>::err(endpoint.error());
    }

    auto invalid = [](std::string what) {
        return makeError<void>(ErrorCode::InvalidConfig, std::move(what));
    };

    if (connectTimeout.count() <= 0) {
        return invalid("ConnectTimeoutMs must be positive");
    }
    if (maxRetryAttempts == 0) {
        return invalid("MaxRetryAttempts must be at least 1");
    }
    if (retryBaseDelay.count() < 0 || maxRetryDelay.count() < 0 ||
        reconnectDelay.count() < 0 || keepaliveInterval.count() < 0 ||
        gracefulCloseWait.count() < 0) {
        return invalid("delays must not be negative");
    }
    if (probeTimeout.count() <= 0) {
        return invalid("ProbeTimeoutMs must be positive");
    }
    if (disconnectTimeout.count() <= 0) {
        return invalid("DisconnectTimeoutMs must be positive");
    }
    if (maxFrameSize == 0) {
        return invalid("MaxFrameSizeBytes must be positive");
    }
    if (sendQueueCapacity == 0) {
        return invalid("SendQueueCapacity must be positive");
    }
    return ClientResult<void>::ok();
}

namespace {

/// Apply @p key to the config through @p apply if present.
template <typename T>
ClientResult<void> readKey(const foundation::ConfigManager& config, const std::string& key,
                           const std::function<ClientResult<void>(T)>& apply) {
    if (!config.hasKey(key)) {
        return ClientResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (value.hasError()) {
        return ClientResult<void>::err(value.error());
    }
    return apply(value.value());
}

ClientResult<void> nonNegative(const std::string& key, int64_t value) {
    if (value < 0) {
        return makeError<void>(ErrorCode::InvalidConfig, key + " must not be negative");
    }
    return ClientResult<void>::ok();
}

} // namespace

ClientResult<ConnectionConfig> loadConnectionConfig(const foundation::ConfigManager& config,
                                                    std::string_view section) {
    ConnectionConfig out;
    const std::string prefix = section.empty() ? std::string() : std::string(section) + ".";
    auto key = [&](const char* name) { return prefix + name; };

    using Millis = std::chrono::milliseconds;
    auto millis = [&](const char* name, Millis& field) {
        return readKey<int64_t>(config, key(name), [&field](int64_t v) {
            field = Millis(v);
            return ClientResult<void>::ok();
        });
    };
    auto count = [&](const char* name, auto& field) {
        const auto full = key(name);
        return readKey<int64_t>(config, full, [&field, full](int64_t v) {
            auto check = nonNegative(full, v);
            if (check.hasValue()) {
                field = static_cast<std::remove_reference_t<decltype(field)>>(v);
            }
            return check;
        });
    };
    auto flag = [&](const char* name, bool& field) {
        return readKey<bool>(config, key(name), [&field](bool v) {
            field = v;
            return ClientResult<void>::ok();
        });
    };

    const std::function<ClientResult<void>()> steps[] = {
        [&] {
            return readKey<std::string>(config, key("ServerAddress"), [&](std::string v) {
                out.serverAddress = std::move(v);
                return ClientResult<void>::ok();
            });
        },
        [&] {
            return readKey<std::string>(config, key("Transport"), [&](std::string v) {
                if (v == "stream" || v == "tcp") {
                    out.transport = TransportKind::Stream;
                } else if (v == "rpc" || v == "grpc") {
                    out.transport = TransportKind::Rpc;
                } else {
                    return makeError<void>(ErrorCode::ConfigTypeMismatch,
                                           "unknown Transport: " + v);
                }
                return ClientResult<void>::ok();
            });
        },
        [&] {
            return readKey<std::string>(config, key("BackoffStrategy"), [&](std::string v) {
                if (v == "Linear") {
                    out.backoffStrategy = BackoffStrategy::Linear;
                } else if (v == "Exponential") {
                    out.backoffStrategy = BackoffStrategy::Exponential;
                } else {
                    return makeError<void>(ErrorCode::ConfigTypeMismatch,
                                           "unknown BackoffStrategy: " + v);
                }
                return ClientResult<void>::ok();
            });
        },
        [&] { return millis("ConnectTimeoutMs", out.connectTimeout); },
        [&] { return count("MaxRetryAttempts", out.maxRetryAttempts); },
        [&] { return millis("RetryBaseDelayMs", out.retryBaseDelay); },
        [&] { return millis("MaxRetryDelayMs", out.maxRetryDelay); },
        [&] { return flag("EnableJitter", out.enableJitter); },
        [&] { return millis("KeepaliveIntervalMs", out.keepaliveInterval); },
        [&] { return millis("ProbeTimeoutMs", out.probeTimeout); },
        [&] { return millis("ReconnectDelayMs", out.reconnectDelay); },
        [&] { return flag("EnableAutoReconnect", out.enableAutoReconnect); },
        [&] { return count("CompressionThresholdBytes", out.compressionThreshold); },
        [&] { return flag("EnableCompression", out.enableCompression); },
        [&] { return count("MaxFrameSizeBytes", out.maxFrameSize); },
        [&] { return count("SendQueueCapacity", out.sendQueueCapacity); },
        [&] { return millis("DisconnectTimeoutMs", out.disconnectTimeout); },
        [&] { return millis("GracefulCloseWaitMs", out.gracefulCloseWait); },
    };

    for (const auto& step : steps) {
        auto applied = step();
        if (applied.hasError()) {
            return ClientResult<ConnectionConfig>::err(applied.error());
        }
    }

    auto valid = out.validate();
    if (valid.hasError()) {
        return ClientResult<ConnectionConfig>::err(valid.error());
    }
    return ClientResult<ConnectionConfig>::ok(std::move(out));
}

} // namespace cgc::net
