/// @file health_monitor.cpp
/// @brief HealthMonitor implementation.

#include "cgc/net/health_monitor.hpp"

#include <string>

#include "cgc/foundation/client_logger.hpp"
#include "cgc/net/reconnect_supervisor.hpp"

namespace cgc::net {

using foundation::ClientResult;
using foundation::ErrorCode;
using foundation::LogCategory;

HealthMonitor::Options HealthMonitor::Options::fromConfig(const ConnectionConfig& config) {
    Options options;
    options.interval = config.keepaliveInterval;
    options.probeTimeout = config.probeTimeout;
    return options;
}

HealthMonitor::HealthMonitor(IConnectionControl& control, ReconnectSupervisor& supervisor,
                             Options options)
    : control_(control), supervisor_(supervisor), options_(options) {}

ClientResult<void> HealthMonitor::run(const async::CancellationToken& token) {
    if (options_.interval.count() <= 0) {
        CGC_LOG_DEBUG(LogCategory::Health, "keepalive disabled");
        return ClientResult<void>::ok();
    }

    while (!token.isCancelled()) {
        if (token.waitFor(options_.interval)) {
            break;
        }
        if (control_.state() != ConnectionState::Connected) {
            continue;
        }
        auto checked = checkOnce(token);
        if (checked.hasError() && !checked.error().isCancellation()) {
            // The link is being torn down; this loop belongs to it.
            break;
        }
    }
    return async::cancelledResult<void>("health monitor stopped");
}

ClientResult<void> HealthMonitor::checkOnce(const async::CancellationToken& token) {
    ++checks_;

    ClientResult<void> outcome = ClientResult<void>::ok();
    if (control_.transportKind() == TransportKind::Rpc) {
        auto rtt = control_.probe(options_.probeTimeout, token);
        if (rtt.hasValue()) {
            lastRttMs_.store(rtt.value().count());
            CGC_LOG_DEBUG(LogCategory::Health,
                          "probe answered in " + std::to_string(rtt.value().count()) + "ms");
        } else {
            outcome = ClientResult<void>::err(rtt.error());
        }
    } else {
        outcome = control_.sendHeartbeat();
    }

    if (outcome.hasValue() || outcome.error().isCancellation()) {
        return outcome;
    }
    if (outcome.error().code() == ErrorCode::Backpressure) {
        // A full send queue means the link is busy, not dead.
        CGC_LOG_DEBUG(LogCategory::Health, "heartbeat skipped, send queue full");
        return ClientResult<void>::ok();
    }
    if (token.isCancelled()) {
        return async::cancelledResult<void>("health check cancelled");
    }

    ++failures_;
    CGC_LOG_WARN(LogCategory::Health, "keepalive failed: " + outcome.error().describe());
    supervisor_.reportFailure(outcome.error());
    return outcome;
}

} // namespace cgc::net
