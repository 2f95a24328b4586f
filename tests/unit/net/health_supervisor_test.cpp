#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "cgc/net/health_monitor.hpp"
#include "cgc/net/reconnect_supervisor.hpp"

using namespace cgc::net;
using cgc::async::CancellationSource;
using cgc::async::CancellationToken;
using cgc::foundation::ClientError;
using cgc::foundation::ClientResult;
using cgc::foundation::ErrorCode;
using cgc::foundation::makeError;
using namespace std::chrono_literals;

namespace {

/// Scriptable IConnectionControl.
class FakeControl : public IConnectionControl {
public:
    ConnectionState state() const override { return state_.load(); }
    TransportKind transportKind() const override { return kind; }

    ClientResult<void> reconnect(const CancellationToken&) override {
        ++reconnects;
        if (reconnectSucceeds) {
            state_.store(ConnectionState::Connected);
            return ClientResult<void>::ok();
        }
        return makeError<void>(ErrorCode::RetriesExhausted, "still down");
    }

    void reportLinkFailure(const ClientError& error) override {
        std::lock_guard lock(mutex_);
        reported.push_back(error.code());
        state_.store(ConnectionState::Disconnected);
    }

    ClientResult<std::chrono::milliseconds> probe(std::chrono::milliseconds,
                                                  const CancellationToken&) override {
        ++probes;
        if (probeError) {
            return ClientResult<std::chrono::milliseconds>::err(ClientError(*probeError, "probe"));
        }
        return ClientResult<std::chrono::milliseconds>::ok(probeRtt);
    }

    ClientResult<void> sendHeartbeat() override {
        ++heartbeats;
        if (heartbeatError) {
            return makeError<void>(*heartbeatError, "heartbeat");
        }
        return ClientResult<void>::ok();
    }

    void setState(ConnectionState s) { state_.store(s); }

    std::vector<ErrorCode> reportedCodes() const {
        std::lock_guard lock(mutex_);
        return reported;
    }

    TransportKind kind = TransportKind::Stream;
    bool reconnectSucceeds = true;
    std::optional<ErrorCode> probeError;
    std::optional<ErrorCode> heartbeatError;
    std::chrono::milliseconds probeRtt{12};
    std::atomic<int> reconnects{0};
    std::atomic<int> probes{0};
    std::atomic<int> heartbeats{0};

private:
    std::atomic<ConnectionState> state_{ConnectionState::Connected};
    mutable std::mutex mutex_;
    std::vector<ErrorCode> reported;
};

ReconnectSupervisor::Options fastSupervisor() {
    ReconnectSupervisor::Options options;
    options.interval = 10ms;
    return options;
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = 2s) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

// ---------------------------------------------------------------------------
// ReconnectSupervisor
// ---------------------------------------------------------------------------

TEST(ReconnectSupervisorTest, TickOnlyActsWhenDisconnected) {
    FakeControl control;
    ReconnectSupervisor supervisor(control, fastSupervisor());

    for (auto state : {ConnectionState::Connected, ConnectionState::Connecting,
                       ConnectionState::Disconnecting, ConnectionState::Faulted}) {
        control.setState(state);
        EXPECT_FALSE(supervisor.tick(CancellationToken::none()))
            << connectionStateName(state);
    }
    EXPECT_EQ(control.reconnects.load(), 0);

    control.setState(ConnectionState::Disconnected);
    EXPECT_TRUE(supervisor.tick(CancellationToken::none()));
    EXPECT_EQ(control.reconnects.load(), 1);
    EXPECT_EQ(supervisor.reconnectAttempts(), 1u);
    EXPECT_EQ(supervisor.successfulReconnects(), 1u);
}

TEST(ReconnectSupervisorTest, FailedReconnectIsCountedButNotSuccessful) {
    FakeControl control;
    control.reconnectSucceeds = false;
    control.setState(ConnectionState::Disconnected);
    ReconnectSupervisor supervisor(control, fastSupervisor());

    EXPECT_TRUE(supervisor.tick(CancellationToken::none()));
    EXPECT_TRUE(supervisor.tick(CancellationToken::none()));
    EXPECT_EQ(supervisor.reconnectAttempts(), 2u);
    EXPECT_EQ(supervisor.successfulReconnects(), 0u);
}

TEST(ReconnectSupervisorTest, CancelledTokenSkipsTick) {
    FakeControl control;
    control.setState(ConnectionState::Disconnected);
    ReconnectSupervisor supervisor(control, fastSupervisor());

    CancellationSource source;
    source.cancel();
    EXPECT_FALSE(supervisor.tick(source.token()));
    EXPECT_EQ(control.reconnects.load(), 0);
}

TEST(ReconnectSupervisorTest, RunRestoresConnectionUntilCancelled) {
    FakeControl control;
    control.setState(ConnectionState::Disconnected);
    ReconnectSupervisor supervisor(control, fastSupervisor());

    CancellationSource source;
    std::thread loop([&] {
        auto result = supervisor.run(source.token());
        EXPECT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code(), ErrorCode::OperationCancelled);
    });

    EXPECT_TRUE(eventually([&] { return control.state() == ConnectionState::Connected; }));
    source.cancel();
    loop.join();
    EXPECT_EQ(supervisor.successfulReconnects(), 1u);
}

TEST(ReconnectSupervisorTest, ReportFailureTearsDownLink) {
    FakeControl control;
    ReconnectSupervisor supervisor(control, fastSupervisor());

    supervisor.reportFailure(ClientError(ErrorCode::ProbeTimeout, "no ack"));

    EXPECT_EQ(supervisor.failuresReported(), 1u);
    EXPECT_EQ(control.state(), ConnectionState::Disconnected);
    ASSERT_EQ(control.reportedCodes().size(), 1u);
    EXPECT_EQ(control.reportedCodes()[0], ErrorCode::ProbeTimeout);
}

TEST(ReconnectSupervisorTest, OptionsFromConfig) {
    ConnectionConfig config;
    config.reconnectDelay = 1234ms;
    config.enableJitter = true;
    auto options = ReconnectSupervisor::Options::fromConfig(config);
    EXPECT_EQ(options.interval, 1234ms);
    EXPECT_TRUE(options.jitter);
}

// ---------------------------------------------------------------------------
// HealthMonitor
// ---------------------------------------------------------------------------

TEST(HealthMonitorTest, RpcCheckProbesAndRecordsRoundTrip) {
    FakeControl control;
    control.kind = TransportKind::Rpc;
    control.probeRtt = 42ms;
    ReconnectSupervisor supervisor(control, fastSupervisor());
    HealthMonitor monitor(control, supervisor, {});

    EXPECT_TRUE(monitor.checkOnce(CancellationToken::none()).hasValue());
    EXPECT_EQ(control.probes.load(), 1);
    EXPECT_EQ(control.heartbeats.load(), 0);
    EXPECT_EQ(monitor.lastRoundTrip(), 42ms);
    EXPECT_EQ(monitor.checksPerformed(), 1u);
}

TEST(HealthMonitorTest, StreamCheckSendsHeartbeatOnly) {
    FakeControl control;
    ReconnectSupervisor supervisor(control, fastSupervisor());
    HealthMonitor monitor(control, supervisor, {});

    EXPECT_TRUE(monitor.checkOnce(CancellationToken::none()).hasValue());
    EXPECT_EQ(control.heartbeats.load(), 1);
    EXPECT_EQ(control.probes.load(), 0);
}

TEST(HealthMonitorTest, ProbeTimeoutIsReportedToSupervisor) {
    FakeControl control;
    control.kind = TransportKind::Rpc;
    control.probeError = ErrorCode::ProbeTimeout;
    ReconnectSupervisor supervisor(control, fastSupervisor());
    HealthMonitor monitor(control, supervisor, {});

    auto result = monitor.checkOnce(CancellationToken::none());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ProbeTimeout);
    EXPECT_EQ(monitor.failuresDetected(), 1u);
    EXPECT_EQ(supervisor.failuresReported(), 1u);
    EXPECT_EQ(control.state(), ConnectionState::Disconnected);
}

TEST(HealthMonitorTest, BackpressureIsNotAFailure) {
    FakeControl control;
    control.heartbeatError = ErrorCode::Backpressure;
    ReconnectSupervisor supervisor(control, fastSupervisor());
    HealthMonitor monitor(control, supervisor, {});

    EXPECT_TRUE(monitor.checkOnce(CancellationToken::none()).hasValue());
    EXPECT_EQ(monitor.failuresDetected(), 0u);
    EXPECT_EQ(supervisor.failuresReported(), 0u);
}

TEST(HealthMonitorTest, CancelledProbeIsNotReported) {
    FakeControl control;
    control.kind = TransportKind::Rpc;
    control.probeError = ErrorCode::OperationCancelled;
    ReconnectSupervisor supervisor(control, fastSupervisor());
    HealthMonitor monitor(control, supervisor, {});

    auto result = monitor.checkOnce(CancellationToken::none());
    ASSERT_TRUE(result.hasError());
    EXPECT_TRUE(result.error().isCancellation());
    EXPECT_EQ(supervisor.failuresReported(), 0u);
}

TEST(HealthMonitorTest, ZeroIntervalDisablesLoop) {
    FakeControl control;
    ReconnectSupervisor supervisor(control, fastSupervisor());
    HealthMonitor::Options options;
    options.interval = 0ms;
    HealthMonitor monitor(control, supervisor, options);

    EXPECT_TRUE(monitor.run(CancellationToken::none()).hasValue());
    EXPECT_EQ(monitor.checksPerformed(), 0u);
}

TEST(HealthMonitorTest, RunSkipsWhileNotConnectedAndStopsAfterFailure) {
    FakeControl control;
    control.setState(ConnectionState::Connecting);
    control.heartbeatError = ErrorCode::SendFailed;
    ReconnectSupervisor supervisor(control, fastSupervisor());
    HealthMonitor::Options options;
    options.interval = 10ms;
    HealthMonitor monitor(control, supervisor, options);

    CancellationSource source;
    std::atomic<bool> finished{false};
    std::thread loop([&] {
        monitor.run(source.token());
        finished = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(monitor.checksPerformed(), 0u);

    control.setState(ConnectionState::Connected);
    EXPECT_TRUE(eventually([&] { return finished.load(); }));
    EXPECT_EQ(monitor.failuresDetected(), 1u);

    source.cancel();
    loop.join();
}
