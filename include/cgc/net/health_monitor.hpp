#pragma once

/// @file health_monitor.hpp
/// @brief Keepalive loop for a live link.

#include <atomic>
#include <chrono>
#include <cstdint>

#include "cgc/async/cancellation_token.hpp"
#include "cgc/foundation/client_result.hpp"
#include "cgc/net/connection_control.hpp"

namespace cgc::net {

class ReconnectSupervisor;

/// Sends keepalives every interval while the connection is Connected.
///
/// RPC transports get a full probe (Heartbeat, wait for HeartbeatAck);
/// the framed stream only emits a Heartbeat frame. A failed probe is
/// handed to the ReconnectSupervisor, which tears the link down.
class HealthMonitor {
public:
    struct Options {
        /// Zero disables the loop.
        std::chrono::milliseconds interval{30000};
        std::chrono::milliseconds probeTimeout{5000};

        static Options fromConfig(const ConnectionConfig& config);
    };

    HealthMonitor(IConnectionControl& control, ReconnectSupervisor& supervisor,
                  Options options);

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /// Check every interval until @p token is cancelled.
    /// @return OperationCancelled when stopped, success right away if disabled.
    foundation::ClientResult<void> run(const async::CancellationToken& token);

    /// Perform one keepalive now. Failures other than cancellation are
    /// reported to the supervisor before being returned.
    foundation::ClientResult<void> checkOnce(const async::CancellationToken& token);

    [[nodiscard]] uint64_t checksPerformed() const noexcept { return checks_.load(); }
    [[nodiscard]] uint64_t failuresDetected() const noexcept { return failures_.load(); }

    /// Round trip of the last successful probe; zero before the first one.
    [[nodiscard]] std::chrono::milliseconds lastRoundTrip() const noexcept {
        return std::chrono::milliseconds(lastRttMs_.load());
    }

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    IConnectionControl& control_;
    ReconnectSupervisor& supervisor_;
    Options options_;
    std::atomic<uint64_t> checks_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<int64_t> lastRttMs_{0};
};

} // namespace cgc::net
