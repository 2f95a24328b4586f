/// @file connection_client.cpp
/// @brief ConnectionClient state machine and link loops.

#include "cgc/net/connection_client.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

#include "cgc/async/completion_signal.hpp"
#include "cgc/foundation/client_logger.hpp"
#include "cgc/net/backoff_policy.hpp"
#include "cgc/net/bounded_queue.hpp"
#include "cgc/net/health_monitor.hpp"
#include "cgc/net/latency_tracker.hpp"
#include "cgc/net/message_codec.hpp"
#include "cgc/net/reconnect_supervisor.hpp"

namespace cgc::net {

using async::CancellationRegistration;
using async::CancellationSource;
using async::CancellationToken;
using async::OperationHandle;
using async::OperationScope;
using foundation::ClientError;
using foundation::ClientLogger;
using foundation::ClientResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::makeError;

namespace {

/// Read poll period; bounds how long the receiver takes to notice cancellation.
constexpr std::chrono::milliseconds kReadPollInterval{100};
constexpr std::chrono::milliseconds kSendPollInterval{50};
constexpr std::size_t kReadBufferSize = 8 * 1024;
constexpr std::size_t kMaxPendingHeartbeats = 64;

std::string payloadText(const std::vector<uint8_t>& payload) {
    return std::string(payload.begin(), payload.end());
}

} // namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct ConnectionClient::Impl {
    /// A client loop running as a tracked operation.
    struct LoopTask {
        uint64_t key = 0;
        std::string name;
        OperationHandle handle;
    };

    struct PendingHeartbeat {
        std::chrono::steady_clock::time_point sentAt;
        /// Set for probes; fire-and-forget heartbeats have none.
        std::shared_ptr<async::CompletionSignal<bool>> signal;
    };

    /// Marks the current thread as running loop @p key for its lifetime.
    class LoopThreadScope {
    public:
        LoopThreadScope(Impl& impl, uint64_t key) : impl_(impl), key_(key) {
            std::lock_guard lock(impl_.loopThreadsMutex);
            impl_.loopThreads[key_] = std::this_thread::get_id();
        }
        ~LoopThreadScope() {
            std::lock_guard lock(impl_.loopThreadsMutex);
            impl_.loopThreads.erase(key_);
        }
        LoopThreadScope(const LoopThreadScope&) = delete;
        LoopThreadScope& operator=(const LoopThreadScope&) = delete;

    private:
        Impl& impl_;
        uint64_t key_;
    };

    Impl(ConnectionClient& self, ConnectionConfig cfg,
         async::CancellationScopeManager& scopeManager, EventNotifier& notifier,
         TransportFactory factory, std::shared_ptr<IResumptionStore> store)
        : owner(self),
          config(std::move(cfg)),
          scopes(scopeManager),
          events(notifier),
          transportFactory(std::move(factory)),
          resumptionStore(std::move(store)),
          codec(CodecOptions::fromConfig(config)),
          backoff(BackoffPolicy::fromConfig(config)),
          random(BackoffPolicy::defaultRandom()),
          supervisor(self, ReconnectSupervisor::Options::fromConfig(config)),
          health(self, supervisor, HealthMonitor::Options::fromConfig(config)),
          sendQueue(config.sendQueueCapacity),
          assembler(config.maxFrameSize) {}

    // -- connect procedure ----------------------------------------------------

    /// Create a session scope if none is alive. Caller holds mutex.
    /// @return true if a new session was created.
    bool ensureSessionLocked() {
        if (session && !session->isCancelled()) {
            return false;
        }
        session.emplace(CancellationSource::linked({scopes.linkedToken()}));
        supervisorStarted = false;
        return true;
    }

    /// Disconnect the client when the session scope is cancelled from outside
    /// (CancellationScopeManager::resetSession / cancelAll).
    void watchSession(const CancellationToken& token) {
        // May run the callback right here if the scope is already gone.
        auto registration = token.onCancel([this] { onSessionCancelled(); });
        {
            std::lock_guard lock(mutex);
            if (session && session->token() == token) {
                std::swap(sessionWatch, registration);
            }
        }
        // Dropped outside the lock: reset() waits for a running callback,
        // which itself takes the lock.
        registration.reset();
    }

    void onSessionCancelled() {
        std::lock_guard lock(mutex);
        if (disposed) {
            return;
        }
        auto posted = scopes.runAsync(
            "cgc.session-closed",
            [this](const CancellationToken&) { return owner.disconnect(); },
            OperationScope::App);
        if (!posted) {
            CGC_LOG_WARN(LogCategory::Connection,
                         "session cancelled but close could not be scheduled: " +
                             posted.error().describe());
            return;
        }
        closers.erase(std::remove_if(closers.begin(), closers.end(),
                                     [](const LoopTask& task) { return task.handle.isDone(); }),
                      closers.end());
        closers.push_back(LoopTask{0, "cgc.session-closed", posted.value()});
    }

    ClientResult<void> runConnectAttempts(const CancellationToken& token) {
        const uint32_t attempts = std::max<uint32_t>(1, config.maxRetryAttempts);
        std::optional<ClientError> lastError;

        for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
            if (attempt > 1) {
                auto wait = config.enableJitter ? backoff.delayWithJitter(attempt - 1, random)
                                                : backoff.delay(attempt - 1);
                logAttempt(LogLevel::Debug,
                           "retrying in " + std::to_string(wait.count()) + "ms", attempt);
                if (token.waitFor(wait)) {
                    return async::cancelledResult<void>("connect cancelled during backoff");
                }
            }
            if (token.isCancelled()) {
                return async::cancelledResult<void>("connect cancelled");
            }

            auto result = attemptOnce(token);
            if (result.hasValue()) {
                return result;
            }
            const auto& error = result.error();
            if (error.isCancellation() || error.code() == ErrorCode::HandshakeRejected) {
                return result;
            }
            ++totalErrors;
            logAttempt(LogLevel::Warning, "connect attempt failed: " + error.describe(), attempt);
            lastError = error;
        }

        std::string message = "giving up on " + config.serverAddress + " after " +
                              std::to_string(attempts) + " attempt(s)";
        if (lastError) {
            message += ": " + lastError->describe();
        }
        return makeError<void>(ErrorCode::RetriesExhausted, std::move(message));
    }

    ClientResult<void> attemptOnce(const CancellationToken& token) {
        std::shared_ptr<ITransport> candidate(transportFactory(config.transport));
        if (!candidate) {
            return makeError<void>(ErrorCode::ConnectionFailed,
                                   "no transport available for " +
                                       std::string(transportKindName(config.transport)));
        }
        auto opened = candidate->open(endpoint, config.connectTimeout, token);
        if (!opened) {
            return opened;
        }

        nextSequence.store(1);
        sendQueue.reopen();
        assembler.reset();
        failPendingHeartbeats();

        std::vector<Message> early;
        auto handshake = performHandshake(*candidate, token, early);
        if (!handshake) {
            candidate->close();
            return handshake;
        }

        bool interrupted = false;
        {
            std::lock_guard lock(mutex);
            if (state != ConnectionState::Connecting || token.isCancelled()) {
                interrupted = true;
            } else {
                transport = candidate;
                link.emplace(CancellationSource::linked({token}));
                handshakeBacklog = std::move(early);
                state = ConnectionState::Connected;
            }
        }
        if (interrupted) {
            candidate->close();
            return async::cancelledResult<void>("connect interrupted by disconnect");
        }
        return ClientResult<void>::ok();
    }

    /// Send Connect (carrying the resumption token). RPC transports then wait
    /// for ConnectAck or Error; messages arriving first go to @p early.
    ClientResult<void> performHandshake(ITransport& channel, const CancellationToken& token,
                                        std::vector<Message>& early) {
        Message hello;
        hello.type = MessageType::Connect;
        hello.sequenceNumber = nextSequence.fetch_add(1);
        hello.timestampMs = nowEpochMs();
        hello.payload = loadResumptionToken().value_or(std::vector<uint8_t>{});

        auto frame = codec.encode(hello);
        if (!frame) {
            return ClientResult<void>::err(frame.error());
        }
        auto written = writeFrame(channel, frame.value());
        if (!written) {
            return written;
        }
        if (config.transport != TransportKind::Rpc) {
            return ClientResult<void>::ok();
        }

        const auto deadline = std::chrono::steady_clock::now() + config.connectTimeout;
        std::vector<uint8_t> buffer(kReadBufferSize);
        while (true) {
            if (token.isCancelled()) {
                return async::cancelledResult<void>("handshake cancelled");
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return makeError<void>(ErrorCode::Timeout, "no ConnectAck within " +
                                           std::to_string(config.connectTimeout.count()) + "ms");
            }

            auto read = channel.read(buffer, std::min(remaining, kReadPollInterval));
            if (!read) {
                return ClientResult<void>::err(read.error());
            }
            if (read.value() == 0) {
                continue;
            }
            assembler.feed(std::span<const uint8_t>(buffer.data(), read.value()));

            while (true) {
                auto body = assembler.next();
                if (!body) {
                    return ClientResult<void>::err(body.error());
                }
                if (!body.value()) {
                    break;
                }
                auto message = codec.decodeBody(*body.value());
                if (!message) {
                    return ClientResult<void>::err(message.error());
                }
                ++messagesReceived;
                touch();

                if (message.value().type == MessageType::ConnectAck) {
                    if (!message.value().payload.empty()) {
                        saveResumptionToken(std::move(message.value().payload));
                    }
                    return ClientResult<void>::ok();
                }
                if (message.value().type == MessageType::Error) {
                    return makeError<void>(ErrorCode::HandshakeRejected,
                                           "server rejected connection: " +
                                               payloadText(message.value().payload));
                }
                early.push_back(std::move(message.value()));
            }
        }
    }

    /// Common tail of connect() and reconnect().
    ClientResult<void> finishConnect(ClientResult<void> result) {
        if (result.hasValue()) {
            std::vector<Message> backlog;
            bool startSupervisor = false;
            CancellationToken sessionToken;
            {
                std::lock_guard lock(mutex);
                connectInFlight = false;
                stateCv.notify_all();
                if (state != ConnectionState::Connected) {
                    return async::cancelledResult<void>("connect interrupted by disconnect");
                }
                backlog.swap(handshakeBacklog);
                if (config.enableAutoReconnect && !supervisorStarted && session) {
                    supervisorStarted = true;
                    startSupervisor = true;
                    sessionToken = session->token();
                }
            }

            ++totalConnections;
            CGC_LOG_INFO(LogCategory::Connection,
                         "connected to " + endpoint.toString() + " over " +
                             std::string(transportKindName(config.transport)));
            events.notifyConnected();
            for (auto& message : backlog) {
                dispatch(std::move(message));
            }
            startLinkLoops();
            if (startSupervisor) {
                startSupervisorLoop(sessionToken);
            }
            return result;
        }

        const auto error = result.error();
        bool notify = false;
        {
            std::lock_guard lock(mutex);
            connectInFlight = false;
            if (state == ConnectionState::Disconnecting) {
                // disconnect() interrupted us and completes the transition.
            } else if (error.code() == ErrorCode::HandshakeRejected) {
                state = ConnectionState::Faulted;
                notify = true;
            } else {
                state = ConnectionState::Disconnected;
                notify = !error.isCancellation();
            }
            stateCv.notify_all();
        }

        if (error.code() == ErrorCode::HandshakeRejected) {
            ++totalErrors;
        }
        if (notify) {
            CGC_LOG_ERROR(LogCategory::Connection, "connect failed: " + error.describe());
            events.notifyError(error.describe());
        } else {
            CGC_LOG_DEBUG(LogCategory::Connection, "connect ended: " + error.describe());
        }
        return result;
    }

    // -- loops ----------------------------------------------------------------

    std::optional<LoopTask> launchLoop(std::string name, std::function<ClientResult<void>()> body) {
        const auto key = nextLoopKey.fetch_add(1);
        auto handle = scopes.runLongRunning(
            name,
            [this, key, body = std::move(body)](const CancellationToken&) {
                LoopThreadScope marker(*this, key);
                return body();
            },
            OperationScope::Session);
        if (!handle) {
            CGC_LOG_ERROR(LogCategory::Connection,
                          "failed to start " + name + ": " + handle.error().describe());
            return std::nullopt;
        }
        return LoopTask{key, std::move(name), handle.value()};
    }

    void startLinkLoops() {
        CancellationToken linkToken;
        std::shared_ptr<ITransport> active;
        {
            std::lock_guard lock(mutex);
            if (state != ConnectionState::Connected || !link) {
                return;
            }
            linkToken = link->token();
            active = transport;
        }

        std::vector<std::optional<LoopTask>> started;
        started.push_back(launchLoop("cgc.sender", [this, linkToken, active] {
            return senderLoop(linkToken, active);
        }));
        started.push_back(launchLoop("cgc.receiver", [this, linkToken, active] {
            return receiverLoop(linkToken, active);
        }));
        started.push_back(launchLoop("cgc.keepalive", [this, linkToken] {
            return health.run(linkToken);
        }));

        bool complete = true;
        {
            std::lock_guard lock(mutex);
            for (auto& task : started) {
                if (task) {
                    linkLoops.push_back(std::move(*task));
                } else {
                    complete = false;
                }
            }
        }
        if (!complete) {
            teardownLink(ClientError(ErrorCode::TaskSubmitFailed, "client loops could not be started"),
                         linkToken);
        }
    }

    void startSupervisorLoop(CancellationToken sessionToken) {
        auto task = launchLoop("cgc.reconnect-supervisor", [this, sessionToken] {
            return supervisor.run(sessionToken);
        });
        if (!task) {
            return;
        }
        std::lock_guard lock(mutex);
        supervisorTask = std::move(*task);
    }

    ClientResult<void> senderLoop(const CancellationToken& linkToken,
                                  const std::shared_ptr<ITransport>& active) {
        while (!linkToken.isCancelled()) {
            auto frame = sendQueue.popFor(kSendPollInterval);
            if (!frame) {
                continue;
            }
            auto written = writeFrame(*active, *frame);
            if (!written) {
                if (!linkToken.isCancelled()) {
                    teardownLink(written.error(), linkToken);
                }
                return written;
            }
        }
        return async::cancelledResult<void>("sender stopped");
    }

    ClientResult<void> receiverLoop(const CancellationToken& linkToken,
                                    const std::shared_ptr<ITransport>& active) {
        // Frames read past the ConnectAck during the handshake.
        auto pending = drainFrames(linkToken);
        std::vector<uint8_t> buffer(kReadBufferSize);

        while (pending && !linkToken.isCancelled()) {
            auto read = active->read(buffer, kReadPollInterval);
            if (!read) {
                pending = ClientResult<void>::err(read.error());
                break;
            }
            if (read.value() == 0) {
                continue;
            }
            assembler.feed(std::span<const uint8_t>(buffer.data(), read.value()));
            pending = drainFrames(linkToken);
        }

        if (!pending) {
            if (!linkToken.isCancelled()) {
                teardownLink(pending.error(), linkToken);
            }
            return pending;
        }
        return async::cancelledResult<void>("receiver stopped");
    }

    ClientResult<void> drainFrames(const CancellationToken& linkToken) {
        while (!linkToken.isCancelled()) {
            auto body = assembler.next();
            if (!body) {
                return ClientResult<void>::err(body.error());
            }
            if (!body.value()) {
                break;
            }
            auto message = codec.decodeBody(*body.value());
            if (!message) {
                return ClientResult<void>::err(message.error());
            }
            ++messagesReceived;
            touch();
            dispatch(std::move(message.value()));
        }
        return ClientResult<void>::ok();
    }

    void dispatch(Message message) {
        switch (message.type) {
            case MessageType::Heartbeat: {
                auto reply = enqueueControl(MessageType::HeartbeatAck, message.sequenceNumber);
                if (!reply) {
                    CGC_LOG_DEBUG(LogCategory::Health,
                                  "heartbeat reply dropped: " + reply.error().describe());
                }
                break;
            }
            case MessageType::HeartbeatAck:
                resolveHeartbeat(message.sequenceNumber);
                break;
            case MessageType::ConnectAck:
                if (!message.payload.empty()) {
                    saveResumptionToken(std::move(message.payload));
                }
                break;
            case MessageType::Disconnect: {
                CGC_LOG_INFO(LogCategory::Connection, "server closed the connection");
                auto closed = owner.disconnect();
                if (!closed) {
                    CGC_LOG_WARN(LogCategory::Connection,
                                 "close after server disconnect: " + closed.error().describe());
                }
                break;
            }
            case MessageType::Error:
                ++totalErrors;
                events.notifyError(payloadText(message.payload));
                break;
            case MessageType::Connect:
                CGC_LOG_DEBUG(LogCategory::Connection, "ignoring Connect from server");
                break;
            default:
                events.notifyMessage(std::move(message));
                break;
        }
    }

    // -- link teardown --------------------------------------------------------

    /// Close the live link and go Disconnected, keeping the session (and its
    /// supervisor) alive. With @p expectedLink set, only that link is closed.
    /// @return false if there was no matching live link.
    bool teardownLink(std::optional<ClientError> error,
                      std::optional<CancellationToken> expectedLink = std::nullopt) {
        std::optional<CancellationSource> oldLink;
        std::shared_ptr<ITransport> oldTransport;
        std::vector<LoopTask> loops;
        {
            std::lock_guard lock(mutex);
            if (state != ConnectionState::Connected || connectInFlight) {
                return false;
            }
            if (expectedLink && (!link || !(link->token() == *expectedLink))) {
                return false;
            }
            state = ConnectionState::Disconnecting;
            oldLink = std::exchange(link, std::nullopt);
            oldTransport = std::exchange(transport, nullptr);
            loops.swap(linkLoops);
        }

        if (error) {
            CGC_LOG_WARN(LogCategory::Connection, "link lost: " + error->describe());
        }
        if (oldLink) {
            oldLink->cancel();
        }
        sendQueue.close();
        failPendingHeartbeats();
        if (oldTransport) {
            oldTransport->close();
        }
        joinLoops(loops, config.disconnectTimeout);

        {
            std::lock_guard lock(mutex);
            state = ConnectionState::Disconnected;
            stateCv.notify_all();
        }
        ++totalDisconnections;
        if (error) {
            ++totalErrors;
            events.notifyError(error->describe());
        }
        events.notifyDisconnected();
        return true;
    }

    /// Wait for @p loops with a shared deadline. The calling loop is skipped.
    void joinLoops(std::vector<LoopTask>& loops, std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (auto& task : loops) {
            if (isLoopThread(task.key)) {
                continue;
            }
            auto remaining = std::max(std::chrono::milliseconds(0),
                                      std::chrono::duration_cast<std::chrono::milliseconds>(
                                          deadline - std::chrono::steady_clock::now()));
            if (!task.handle.wait(remaining)) {
                CGC_LOG_WARN(LogCategory::Connection,
                             task.name + " did not stop within " +
                                 std::to_string(timeout.count()) + "ms");
                std::lock_guard lock(mutex);
                strays.push_back(task);
            }
        }
    }

    bool isLoopThread(uint64_t key) const {
        std::lock_guard lock(loopThreadsMutex);
        auto it = loopThreads.find(key);
        return it != loopThreads.end() && it->second == std::this_thread::get_id();
    }

    bool onAnyLoopThread() const {
        std::lock_guard lock(loopThreadsMutex);
        const auto self = std::this_thread::get_id();
        return std::any_of(loopThreads.begin(), loopThreads.end(),
                           [self](const auto& entry) { return entry.second == self; });
    }

    // -- outgoing frames ------------------------------------------------------

    ClientResult<void> writeFrame(ITransport& target, const std::vector<uint8_t>& frame) {
        std::lock_guard lock(writeMutex);
        auto written = target.write(frame);
        if (written) {
            ++messagesSent;
            touch();
        }
        return written;
    }

    ClientResult<uint32_t> enqueueFrame(std::vector<uint8_t> frame, uint32_t sequence) {
        if (!sendQueue.tryPush(std::move(frame))) {
            if (sendQueue.isClosed()) {
                return makeError<uint32_t>(ErrorCode::NotConnected, "link is closing");
            }
            return makeError<uint32_t>(ErrorCode::Backpressure,
                                       "send queue full (" +
                                           std::to_string(sendQueue.capacity()) + " frames)");
        }
        return ClientResult<uint32_t>::ok(sequence);
    }

    ClientResult<uint32_t> enqueueControl(MessageType type, uint32_t sequence) {
        Message message;
        message.type = type;
        message.sequenceNumber = sequence;
        message.timestampMs = nowEpochMs();
        auto frame = codec.encode(message);
        if (!frame) {
            return ClientResult<uint32_t>::err(frame.error());
        }
        return enqueueFrame(std::move(frame.value()), sequence);
    }

    /// Best-effort Disconnect notice to the server before closing.
    void sendGoodbye(ITransport& target) {
        Message goodbye;
        goodbye.type = MessageType::Disconnect;
        goodbye.sequenceNumber = nextSequence.fetch_add(1);
        goodbye.timestampMs = nowEpochMs();
        auto frame = codec.encode(goodbye);
        if (!frame) {
            return;
        }
        auto written = writeFrame(target, frame.value());
        if (!written) {
            CGC_LOG_DEBUG(LogCategory::Connection,
                          "disconnect notice not sent: " + written.error().describe());
            return;
        }
        std::this_thread::sleep_for(config.gracefulCloseWait);
    }

    // -- heartbeats -----------------------------------------------------------

    void registerHeartbeat(uint32_t sequence,
                           std::shared_ptr<async::CompletionSignal<bool>> signal,
                           std::chrono::steady_clock::time_point sentAt) {
        std::lock_guard lock(heartbeatMutex);
        pendingHeartbeats[sequence] = PendingHeartbeat{sentAt, std::move(signal)};
        // Unanswered fire-and-forget heartbeats are dropped oldest first.
        auto it = pendingHeartbeats.begin();
        while (pendingHeartbeats.size() > kMaxPendingHeartbeats && it != pendingHeartbeats.end()) {
            it = it->second.signal ? std::next(it) : pendingHeartbeats.erase(it);
        }
    }

    void forgetHeartbeat(uint32_t sequence) {
        std::lock_guard lock(heartbeatMutex);
        pendingHeartbeats.erase(sequence);
    }

    void resolveHeartbeat(uint32_t sequence) {
        std::chrono::steady_clock::time_point sentAt;
        {
            std::lock_guard lock(heartbeatMutex);
            auto it = pendingHeartbeats.find(sequence);
            if (it == pendingHeartbeats.end()) {
                CGC_LOG_DEBUG(LogCategory::Health,
                              "unmatched HeartbeatAck " + std::to_string(sequence));
                return;
            }
            if (it->second.signal) {
                // Completed under the lock: probe() forgets the entry before
                // the signal goes back to the pool. probe() measures the
                // round trip itself.
                it->second.signal->trySet(true);
                return;
            }
            sentAt = it->second.sentAt;
            pendingHeartbeats.erase(it);
        }
        recordLatency(std::chrono::steady_clock::now() - sentAt);
    }

    void failPendingHeartbeats() {
        std::lock_guard lock(heartbeatMutex);
        for (auto& [sequence, entry] : pendingHeartbeats) {
            if (entry.signal) {
                entry.signal->trySet(false);
            }
        }
        pendingHeartbeats.clear();
    }

    void recordLatency(std::chrono::steady_clock::duration rtt) {
        auto ms = std::chrono::duration<float, std::milli>(rtt).count();
        latency.record(ms);
        events.notifyLatency(ms);
    }

    // -- misc -----------------------------------------------------------------

    void saveResumptionToken(std::vector<uint8_t> token) {
        if (resumptionStore) {
            resumptionStore->save(config.serverAddress, std::move(token));
        }
    }

    std::optional<std::vector<uint8_t>> loadResumptionToken() const {
        if (!resumptionStore) {
            return std::nullopt;
        }
        return resumptionStore->load(config.serverAddress);
    }

    void touch() { lastActivityMs.store(nowEpochMs()); }

    void logAttempt(LogLevel level, std::string_view msg, uint32_t attempt) const {
        LogContext ctx;
        ctx.endpoint = config.serverAddress;
        ctx.attempt = attempt;
        ClientLogger::instance().logWithContext(level, LogCategory::Connection, msg, ctx);
    }

    // -- members --------------------------------------------------------------

    ConnectionClient& owner;
    const ConnectionConfig config;
    async::CancellationScopeManager& scopes;
    EventNotifier& events;
    TransportFactory transportFactory;
    std::shared_ptr<IResumptionStore> resumptionStore;

    const MessageCodec codec;
    const BackoffPolicy backoff;
    BackoffPolicy::RandomSource random;
    Endpoint endpoint;

    ReconnectSupervisor supervisor;
    HealthMonitor health;

    mutable std::mutex mutex;
    std::condition_variable stateCv;
    ConnectionState state = ConnectionState::Disconnected;
    bool connectInFlight = false;
    bool disposed = false;
    bool supervisorStarted = false;
    std::optional<CancellationSource> session;
    CancellationRegistration sessionWatch;
    std::optional<CancellationSource> link;
    std::shared_ptr<ITransport> transport;
    std::vector<Message> handshakeBacklog;
    std::vector<LoopTask> linkLoops;
    std::optional<LoopTask> supervisorTask;
    std::vector<LoopTask> closers;
    std::vector<LoopTask> strays;

    mutable std::mutex loopThreadsMutex;
    std::unordered_map<uint64_t, std::thread::id> loopThreads;
    std::atomic<uint64_t> nextLoopKey{1};

    std::mutex writeMutex;
    BoundedQueue<std::vector<uint8_t>> sendQueue;
    FrameAssembler assembler;  ///< Handshake, then receiver loop only
    std::atomic<uint32_t> nextSequence{1};

    std::mutex heartbeatMutex;
    std::map<uint32_t, PendingHeartbeat> pendingHeartbeats;
    LatencyTracker<100> latency;

    std::atomic<uint64_t> totalConnections{0};
    std::atomic<uint64_t> totalDisconnections{0};
    std::atomic<uint64_t> totalErrors{0};
    std::atomic<uint64_t> messagesSent{0};
    std::atomic<uint64_t> messagesReceived{0};
    std::atomic<uint64_t> reconnectAttempts{0};
    std::atomic<uint64_t> lastActivityMs{0};
};

// ---------------------------------------------------------------------------
// ConnectionClient
// ---------------------------------------------------------------------------

ConnectionClient::ConnectionClient(ConnectionConfig config,
                                   async::CancellationScopeManager& scopes,
                                   EventNotifier& events,
                                   TransportFactory transportFactory,
                                   std::shared_ptr<IResumptionStore> resumptionStore)
    : impl_(std::make_unique<Impl>(*this, std::move(config), scopes, events,
                                   std::move(transportFactory), std::move(resumptionStore))) {}

ConnectionClient::~ConnectionClient() {
    dispose();
}

ClientResult<void> ConnectionClient::connect() {
    auto& d = *impl_;
    CancellationToken sessionToken;
    bool newSession = false;
    std::optional<ClientError> invalid;
    {
        std::lock_guard lock(d.mutex);
        if (d.disposed) {
            return makeError<void>(ErrorCode::Disposed, "client has been disposed");
        }
        switch (d.state) {
            case ConnectionState::Connecting:
                return makeError<void>(ErrorCode::AlreadyInProgress, "connect already in progress");
            case ConnectionState::Connected:
                return makeError<void>(ErrorCode::AlreadyConnected,
                                       "already connected to " + d.config.serverAddress);
            case ConnectionState::Disconnecting:
                return makeError<void>(ErrorCode::InvalidState, "disconnect in progress");
            case ConnectionState::Faulted:
                return makeError<void>(ErrorCode::InvalidState,
                                       "client is faulted; disconnect() before reconnecting");
            case ConnectionState::Disconnected:
                break;
        }
        if (d.scopes.isShutdown()) {
            return makeError<void>(ErrorCode::ScopeShutdown, "cancellation scopes are shut down");
        }

        auto valid = d.config.validate();
        ClientResult<Endpoint> parsed = valid ? parseEndpoint(d.config.serverAddress)
                                              : ClientResult<Endpoint>::err(valid.error());
        if (!parsed) {
            d.state = ConnectionState::Faulted;
            invalid = parsed.error();
        } else {
            d.endpoint = parsed.value();
            d.state = ConnectionState::Connecting;
            d.connectInFlight = true;
            newSession = d.ensureSessionLocked();
            sessionToken = d.session->token();
        }
    }

    if (invalid) {
        ++d.totalErrors;
        CGC_LOG_ERROR(LogCategory::Connection, "invalid configuration: " + invalid->describe());
        d.events.notifyError(invalid->describe());
        return ClientResult<void>::err(*invalid);
    }

    if (newSession) {
        d.watchSession(sessionToken);
    }
    d.logAttempt(LogLevel::Info, "connecting", 1);
    return d.finishConnect(d.runConnectAttempts(sessionToken));
}

ClientResult<void> ConnectionClient::reconnect(const CancellationToken& token) {
    auto& d = *impl_;
    bool live = false;
    {
        std::lock_guard lock(d.mutex);
        if (d.disposed) {
            return makeError<void>(ErrorCode::Disposed, "client has been disposed");
        }
        live = d.state == ConnectionState::Connected && !d.connectInFlight;
    }
    if (live) {
        d.teardownLink(std::nullopt);
    }

    CancellationToken sessionToken;
    {
        std::lock_guard lock(d.mutex);
        if (token.isCancelled() || !d.session || d.session->isCancelled()) {
            return async::cancelledResult<void>("session ended");
        }
        if (d.state != ConnectionState::Disconnected) {
            return makeError<void>(ErrorCode::InvalidState,
                                   "cannot reconnect while " +
                                       std::string(connectionStateName(d.state)));
        }
        d.state = ConnectionState::Connecting;
        d.connectInFlight = true;
        sessionToken = d.session->token();
    }
    ++d.reconnectAttempts;
    return d.finishConnect(d.runConnectAttempts(sessionToken));
}

ClientResult<uint32_t> ConnectionClient::send(Message message) {
    auto& d = *impl_;
    {
        std::lock_guard lock(d.mutex);
        if (d.state != ConnectionState::Connected) {
            return makeError<uint32_t>(ErrorCode::NotConnected,
                                       "cannot send while " +
                                           std::string(connectionStateName(d.state)));
        }
    }
    message.sequenceNumber = d.nextSequence.fetch_add(1);
    message.timestampMs = nowEpochMs();
    auto frame = d.codec.encode(message);
    if (!frame) {
        return ClientResult<uint32_t>::err(frame.error());
    }
    return d.enqueueFrame(std::move(frame.value()), message.sequenceNumber);
}

ClientResult<uint32_t> ConnectionClient::send(MessageType type, std::vector<uint8_t> payload) {
    Message message;
    message.type = type;
    message.payload = std::move(payload);
    return send(std::move(message));
}

ClientResult<void> ConnectionClient::disconnect() {
    auto& d = *impl_;
    bool wasConnected = false;
    bool interruptConnect = false;
    CancellationRegistration watch;
    std::optional<CancellationSource> session;
    {
        std::unique_lock lock(d.mutex);
        if (d.state == ConnectionState::Disconnecting) {
            // Another thread is closing the link. Its loops cannot wait for us.
            if (d.onAnyLoopThread()) {
                return ClientResult<void>::ok();
            }
            const auto limit = d.config.disconnectTimeout + d.config.gracefulCloseWait;
            if (!d.stateCv.wait_for(lock, limit, [&] {
                    return d.state != ConnectionState::Disconnecting;
                })) {
                return makeError<void>(ErrorCode::Timeout, "disconnect still in progress");
            }
        }

        switch (d.state) {
            case ConnectionState::Connected:
                d.state = ConnectionState::Disconnecting;
                interruptConnect = d.connectInFlight;
                wasConnected = !d.connectInFlight;
                break;
            case ConnectionState::Connecting:
                d.state = ConnectionState::Disconnecting;
                interruptConnect = true;
                break;
            case ConnectionState::Faulted:
                d.state = ConnectionState::Disconnected;
                break;
            case ConnectionState::Disconnected:
            case ConnectionState::Disconnecting:
                break;
        }
        watch = std::move(d.sessionWatch);
        session = std::exchange(d.session, std::nullopt);
    }

    // Stop the supervisor before touching the socket.
    watch.reset();
    if (session) {
        session->cancel();
    }

    if (interruptConnect) {
        std::unique_lock lock(d.mutex);
        if (!d.stateCv.wait_for(lock, d.config.disconnectTimeout,
                                [&] { return !d.connectInFlight; })) {
            CGC_LOG_WARN(LogCategory::Connection, "connect did not unwind in time");
        }
    }

    std::optional<CancellationSource> link;
    std::shared_ptr<ITransport> transport;
    std::vector<Impl::LoopTask> loops;
    {
        std::lock_guard lock(d.mutex);
        link = std::exchange(d.link, std::nullopt);
        transport = std::exchange(d.transport, nullptr);
        loops.swap(d.linkLoops);
        if (d.supervisorTask) {
            loops.push_back(std::move(*d.supervisorTask));
            d.supervisorTask.reset();
        }
    }

    if (wasConnected && transport) {
        d.sendGoodbye(*transport);
    }
    if (link) {
        link->cancel();
    }
    d.sendQueue.close();
    d.failPendingHeartbeats();
    d.joinLoops(loops, d.config.disconnectTimeout);
    if (transport) {
        transport->close();
    }

    bool changed = false;
    {
        std::lock_guard lock(d.mutex);
        changed = d.state != ConnectionState::Disconnected;
        d.state = ConnectionState::Disconnected;
        d.stateCv.notify_all();
    }
    if (wasConnected) {
        ++d.totalDisconnections;
        CGC_LOG_INFO(LogCategory::Connection, "disconnected from " + d.config.serverAddress);
        d.events.notifyDisconnected();
    } else if (changed) {
        CGC_LOG_DEBUG(LogCategory::Connection, "connect abandoned");
    }
    return ClientResult<void>::ok();
}

void ConnectionClient::dispose() {
    auto& d = *impl_;
    {
        std::lock_guard lock(d.mutex);
        if (d.disposed) {
            return;
        }
    }

    auto closed = disconnect();
    if (!closed) {
        CGC_LOG_WARN(LogCategory::Connection, "dispose: " + closed.error().describe());
    }

    std::vector<Impl::LoopTask> leftovers;
    {
        std::lock_guard lock(d.mutex);
        d.disposed = true;
        leftovers.swap(d.closers);
        leftovers.insert(leftovers.end(), d.strays.begin(), d.strays.end());
        d.strays.clear();
    }

    // Tasks still referencing this client must finish before it goes away.
    for (const auto& task : leftovers) {
        if (d.isLoopThread(task.key)) {
            continue;
        }
        while (!task.handle.wait(d.config.disconnectTimeout)) {
            CGC_LOG_WARN(LogCategory::Connection, "waiting for " + task.name + " to finish");
        }
    }
    CGC_LOG_DEBUG(LogCategory::Connection, "client disposed");
}

ConnectionState ConnectionClient::state() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->state;
}

TransportKind ConnectionClient::transportKind() const {
    return impl_->config.transport;
}

void ConnectionClient::reportLinkFailure(const ClientError& error) {
    impl_->teardownLink(error);
}

ClientResult<std::chrono::milliseconds> ConnectionClient::probe(
    std::chrono::milliseconds timeout, const CancellationToken& token) {
    using Rtt = ClientResult<std::chrono::milliseconds>;
    auto& d = *impl_;
    if (state() != ConnectionState::Connected) {
        return makeError<std::chrono::milliseconds>(ErrorCode::NotConnected, "probe needs a live link");
    }

    auto signal = d.scopes.signalPool().acquire();
    const auto sequence = d.nextSequence.fetch_add(1);
    const auto sentAt = std::chrono::steady_clock::now();
    d.registerHeartbeat(sequence, signal, sentAt);

    auto queued = d.enqueueControl(MessageType::Heartbeat, sequence);
    if (!queued) {
        d.forgetHeartbeat(sequence);
        d.scopes.signalPool().release(std::move(signal));
        return Rtt::err(queued.error());
    }

    auto answered = signal->waitFor(timeout, token);
    d.forgetHeartbeat(sequence);
    d.scopes.signalPool().release(std::move(signal));

    if (answered && *answered) {
        auto rtt = std::chrono::steady_clock::now() - sentAt;
        d.recordLatency(rtt);
        return Rtt::ok(std::chrono::duration_cast<std::chrono::milliseconds>(rtt));
    }
    if (answered) {
        return makeError<std::chrono::milliseconds>(ErrorCode::ConnectionLost,
                                                    "link closed while probing");
    }
    if (token.isCancelled()) {
        return async::cancelledResult<std::chrono::milliseconds>("probe cancelled");
    }
    return makeError<std::chrono::milliseconds>(
        ErrorCode::ProbeTimeout, "no HeartbeatAck for " + std::to_string(sequence) + " within " +
                                     std::to_string(timeout.count()) + "ms");
}

ClientResult<void> ConnectionClient::sendHeartbeat() {
    auto& d = *impl_;
    if (state() != ConnectionState::Connected) {
        return makeError<void>(ErrorCode::NotConnected, "heartbeat needs a live link");
    }
    const auto sequence = d.nextSequence.fetch_add(1);
    d.registerHeartbeat(sequence, nullptr, std::chrono::steady_clock::now());
    auto queued = d.enqueueControl(MessageType::Heartbeat, sequence);
    if (!queued) {
        d.forgetHeartbeat(sequence);
        return ClientResult<void>::err(queued.error());
    }
    return ClientResult<void>::ok();
}

ConnectionMetrics ConnectionClient::metrics() const {
    const auto& d = *impl_;
    ConnectionMetrics out;
    out.totalConnections = d.totalConnections.load();
    out.totalDisconnections = d.totalDisconnections.load();
    out.totalErrors = d.totalErrors.load();
    out.messagesSent = d.messagesSent.load();
    out.messagesReceived = d.messagesReceived.load();
    out.reconnectAttempts = d.reconnectAttempts.load();
    out.averageLatencyMs = d.latency.average();
    out.lastActivityMs = d.lastActivityMs.load();
    return out;
}

const ConnectionConfig& ConnectionClient::config() const noexcept {
    return impl_->config;
}

float ConnectionClient::averageLatency() const {
    return impl_->latency.average();
}

void ConnectionClient::saveResumptionToken(std::vector<uint8_t> token) {
    impl_->saveResumptionToken(std::move(token));
}

std::optional<std::vector<uint8_t>> ConnectionClient::loadResumptionToken() const {
    return impl_->loadResumptionToken();
}

HealthMonitor& ConnectionClient::healthMonitor() noexcept {
    return impl_->health;
}

ReconnectSupervisor& ConnectionClient::supervisor() noexcept {
    return impl_->supervisor;
}

} // namespace cgc::net
