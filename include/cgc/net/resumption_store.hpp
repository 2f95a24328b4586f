#pragma once

/// @file resumption_store.hpp
/// @brief Persistence hooks for the opaque session resumption token.
///
/// The server hands out a resumption token in its ConnectAck. The client
/// presents it in the Connect of the next connection so the server can
/// resume the previous session. Storage is an external concern; any
/// key-value backend can implement IResumptionStore.

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cgc::net {

/// Abstract interface for resumption-token persistence.
///
/// Implementations must be thread-safe: the receive loop saves tokens while
/// the connect path loads them.
class IResumptionStore {
public:
    virtual ~IResumptionStore() = default;

    /// Replace the token stored for @p endpoint.
    virtual void save(std::string_view endpoint, std::vector<uint8_t> token) = 0;

    [[nodiscard]] virtual std::optional<std::vector<uint8_t>> load(std::string_view endpoint) const = 0;

    /// Forget the token for @p endpoint. Returns false if none was stored.
    virtual bool erase(std::string_view endpoint) = 0;
};

/// Thread-safe in-memory store for tests and single-process clients.
class InMemoryResumptionStore : public IResumptionStore {
public:
    void save(std::string_view endpoint, std::vector<uint8_t> token) override;

    [[nodiscard]] std::optional<std::vector<uint8_t>> load(std::string_view endpoint) const override;

    bool erase(std::string_view endpoint) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<uint8_t>> tokens_;
};

} // namespace cgc::net
