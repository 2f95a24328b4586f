/// @file reconnect_supervisor.cpp
/// @brief ReconnectSupervisor implementation.

#include "cgc/net/reconnect_supervisor.hpp"

#include <string>
#include <utility>

#include "cgc/foundation/client_logger.hpp"

namespace cgc::net {

using foundation::ClientError;
using foundation::ClientLogger;
using foundation::ClientResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

ReconnectSupervisor::Options ReconnectSupervisor::Options::fromConfig(
    const ConnectionConfig& config) {
    Options options;
    options.interval = config.reconnectDelay;
    options.jitter = config.enableJitter;
    return options;
}

ReconnectSupervisor::ReconnectSupervisor(IConnectionControl& control, Options options)
    : control_(control), options_(std::move(options)) {
    if (!options_.random) {
        options_.random = BackoffPolicy::defaultRandom();
    }
}

ClientResult<void> ReconnectSupervisor::run(const async::CancellationToken& token) {
    CGC_LOG_DEBUG(LogCategory::Reconnect,
                  "supervisor started, interval " +
                      std::to_string(options_.interval.count()) + "ms");
    while (!token.isCancelled()) {
        if (token.waitFor(nextInterval())) {
            break;
        }
        tick(token);
    }
    CGC_LOG_DEBUG(LogCategory::Reconnect, "supervisor stopped");
    return async::cancelledResult<void>("reconnect supervisor stopped");
}

bool ReconnectSupervisor::tick(const async::CancellationToken& token) {
    if (token.isCancelled() || control_.state() != ConnectionState::Disconnected) {
        return false;
    }

    auto attempt = ++attempts_;
    LogContext ctx;
    ctx.attempt = static_cast<uint32_t>(attempt);
    ctx.operation = "reconnect";
    ClientLogger::instance().logWithContext(LogLevel::Info, LogCategory::Reconnect,
                                            "connection lost, reconnecting", ctx);

    auto result = control_.reconnect(token);
    if (result.hasValue()) {
        ++successes_;
        CGC_LOG_INFO(LogCategory::Reconnect, "reconnected");
    } else if (!result.error().isCancellation()) {
        CGC_LOG_WARN(LogCategory::Reconnect,
                     "reconnect failed: " + result.error().describe());
    }
    return true;
}

void ReconnectSupervisor::reportFailure(const ClientError& error) {
    ++failures_;
    CGC_LOG_WARN(LogCategory::Reconnect, "link failure reported: " + error.describe());
    control_.reportLinkFailure(error);
}

std::chrono::milliseconds ReconnectSupervisor::nextInterval() const {
    return options_.jitter ? jittered(options_.interval, options_.random) : options_.interval;
}

} // namespace cgc::net
