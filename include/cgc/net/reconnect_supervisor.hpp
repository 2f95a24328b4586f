#pragma once

/// @file reconnect_supervisor.hpp
/// @brief Session-scoped loop that restores a lost connection.

#include <atomic>
#include <chrono>
#include <cstdint>

#include "cgc/async/cancellation_token.hpp"
#include "cgc/foundation/client_result.hpp"
#include "cgc/net/backoff_policy.hpp"
#include "cgc/net/connection_control.hpp"

namespace cgc::net {

/// Periodically checks the connection and calls reconnect() while it is
/// Disconnected. Faulted and Connecting are left alone: a faulted client
/// needs an explicit disconnect()/connect(), and a connect in progress
/// must not be raced.
///
/// run() blocks until its token is cancelled; the client runs it as a
/// session-scoped operation so disconnect() stops it before the link is
/// torn down.
class ReconnectSupervisor {
public:
    struct Options {
        std::chrono::milliseconds interval{5000};
        bool jitter = false;
        BackoffPolicy::RandomSource random;  ///< Defaults to BackoffPolicy::defaultRandom()

        static Options fromConfig(const ConnectionConfig& config);
    };

    ReconnectSupervisor(IConnectionControl& control, Options options);

    ReconnectSupervisor(const ReconnectSupervisor&) = delete;
    ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

    /// Supervise until @p token is cancelled.
    /// @return OperationCancelled once the token fires.
    foundation::ClientResult<void> run(const async::CancellationToken& token);

    /// One supervision step: reconnect if the client is Disconnected.
    /// @return true if a reconnect was attempted.
    bool tick(const async::CancellationToken& token);

    /// Hand a detected link failure to the client, which tears the link down
    /// so the next tick can reconnect.
    void reportFailure(const foundation::ClientError& error);

    [[nodiscard]] uint64_t reconnectAttempts() const noexcept { return attempts_.load(); }
    [[nodiscard]] uint64_t successfulReconnects() const noexcept { return successes_.load(); }
    [[nodiscard]] uint64_t failuresReported() const noexcept { return failures_.load(); }

private:
    [[nodiscard]] std::chrono::milliseconds nextInterval() const;

    IConnectionControl& control_;
    Options options_;
    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace cgc::net
