/// @file cancellation_scope_manager.cpp
/// @brief CancellationScopeManager implementation.

#include "cgc/async/cancellation_scope_manager.hpp"

#include "cgc/foundation/client_logger.hpp"
#include "cgc/foundation/task_runner.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <utility>

namespace cgc::async {

using foundation::ClientError;
using foundation::ClientResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

OperationStatus classify(const ClientResult<void>& result, const CancellationToken& token) {
    if (result.hasValue()) {
        return OperationStatus::Completed;
    }
    if (result.error().code() == ErrorCode::Timeout) {
        return OperationStatus::Failed;
    }
    if (result.error().isCancellation() || token.isCancelled()) {
        return OperationStatus::Cancelled;
    }
    return OperationStatus::Failed;
}

} // namespace

struct CancellationScopeManager::Impl {
    explicit Impl(const Options& options)
        : runner(options.workerThreads, options.poolName),
          baseWorkers(runner.workerCount()) {}

    mutable std::mutex mutex;
    std::condition_variable drained;
    CancellationSource app;
    CancellationSource session;
    std::map<uint64_t, OperationRecord> records;
    std::atomic<uint64_t> nextId{1};
    bool shutdown = false;

    CompletionSignalPool<bool> signals;
    foundation::TaskRunner runner;

    // Workers kept free for short operations; long-running ones get extra.
    const std::size_t baseWorkers;
    std::size_t longRunning = 0;

    /// Reserve a worker for a long-running operation. Caller holds mutex.
    ClientResult<void> reserveWorkerLocked() {
        const auto needed = baseWorkers + longRunning + 1;
        const auto have = runner.workerCount();
        if (have < needed) {
            auto grown = runner.addWorkers(needed - have);
            if (!grown) {
                return grown;
            }
        }
        ++longRunning;
        return ClientResult<void>::ok();
    }

    void finish(uint64_t id, bool releasesWorker) {
        {
            std::lock_guard lock(mutex);
            records.erase(id);
            if (releasesWorker) {
                --longRunning;
            }
        }
        drained.notify_all();
    }
};

CancellationScopeManager::CancellationScopeManager()
    : CancellationScopeManager(Options{}) {}

CancellationScopeManager::CancellationScopeManager(Options options)
    : impl_(std::make_unique<Impl>(options)) {}

CancellationScopeManager::~CancellationScopeManager() {
    shutdown();
}

CancellationToken CancellationScopeManager::appToken() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->app.token();
}

CancellationToken CancellationScopeManager::sessionToken() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->session.token();
}

CancellationToken CancellationScopeManager::linkedToken() const {
    CancellationToken app;
    CancellationToken session;
    {
        std::lock_guard lock(impl_->mutex);
        app = impl_->app.token();
        session = impl_->session.token();
    }
    return CancellationSource::linked({app, session}).token();
}

ClientResult<OperationHandle> CancellationScopeManager::runAsync(
    std::string name, ScopedOperation operation, OperationScope scope) {
    auto token = scope == OperationScope::App ? appToken() : linkedToken();
    return launch(std::move(name), std::move(operation), scope, std::move(token), false);
}

ClientResult<OperationHandle> CancellationScopeManager::runLongRunning(
    std::string name, ScopedOperation operation, OperationScope scope) {
    auto token = scope == OperationScope::App ? appToken() : linkedToken();
    return launch(std::move(name), std::move(operation), scope, std::move(token), true);
}

ClientResult<OperationHandle> CancellationScopeManager::runWithTimeout(
    std::string name, ScopedOperation operation, std::chrono::milliseconds timeout) {
    auto deadline = CancellationSource::linked({linkedToken()});
    CancellationSource done;
    auto timedOut = std::make_shared<std::atomic<bool>>(false);

    auto wrapped = [op = std::move(operation), done, timedOut, timeout](
                       const CancellationToken& token) mutable -> ClientResult<void> {
        auto result = op(token);
        done.cancel();
        if (result.hasError() && timedOut->load(std::memory_order_acquire)) {
            return foundation::makeError<void>(
                ErrorCode::Timeout,
                "timed out after " + std::to_string(timeout.count()) + "ms");
        }
        return result;
    };

    auto handle = launch(name + "_timeout", std::move(wrapped),
                         OperationScope::Session, deadline.token(), false);
    if (handle.hasError()) {
        return handle;
    }

    auto watchdog = impl_->runner.submit(
        name + "_watchdog", [deadline, done, timedOut, timeout]() mutable {
            auto wake = CancellationSource::linked({done.token(), deadline.token()});
            if (!wake.token().waitFor(timeout)) {
                timedOut->store(true, std::memory_order_release);
                deadline.cancel();
            }
        });
    if (watchdog.hasError()) {
        // Without a watchdog the operation could never time out.
        deadline.cancel();
        CGC_LOG_WARN(LogCategory::Scope, "watchdog rejected for " + name);
    }
    return handle;
}

ClientResult<OperationHandle> CancellationScopeManager::launch(
    std::string name, ScopedOperation operation,
    OperationScope scope, CancellationToken token, bool longRunning) {
    auto id = impl_->nextId.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->shutdown) {
            return foundation::makeError<OperationHandle>(
                ErrorCode::ScopeShutdown, "scope manager is shut down: " + name);
        }
        if (longRunning) {
            auto reserved = impl_->reserveWorkerLocked();
            if (!reserved) {
                return ClientResult<OperationHandle>::err(reserved.error());
            }
        }
        OperationRecord record;
        record.id = id;
        record.name = name;
        record.scope = scope;
        record.startTime = std::chrono::steady_clock::now();
        impl_->records.emplace(id, std::move(record));
    }

    auto promise = std::make_shared<std::promise<OperationOutcome>>();
    auto future = promise->get_future().share();
    auto* impl = impl_.get();

    auto submitted = impl_->runner.submit(
        name, [impl, id, name, op = std::move(operation), token, promise, longRunning] {
            auto start = std::chrono::steady_clock::now();
            auto result = [&]() -> ClientResult<void> {
                try {
                    return op(token);
                } catch (const std::exception& e) {
                    return foundation::makeError<void>(
                        ErrorCode::OperationFailed, std::string("threw: ") + e.what());
                } catch (...) {
                    return foundation::makeError<void>(
                        ErrorCode::OperationFailed, "threw a non-standard exception");
                }
            }();

            OperationOutcome outcome;
            outcome.id = id;
            outcome.name = name;
            outcome.status = classify(result, token);
            outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            if (result.hasError()) {
                outcome.error = result.error();
            }

            switch (outcome.status) {
                case OperationStatus::Cancelled:
                    CGC_LOG_DEBUG(LogCategory::Scope, "operation cancelled: " + name);
                    break;
                case OperationStatus::Failed:
                    CGC_LOG_ERROR(LogCategory::Scope, "operation failed: " + name + " - " +
                                  std::string(result.error().message()));
                    break;
                default:
                    break;
            }

            impl->finish(id, longRunning);
            promise->set_value(std::move(outcome));
        });

    if (submitted.hasError()) {
        impl_->finish(id, longRunning);
        return ClientResult<OperationHandle>::err(submitted.error());
    }
    return ClientResult<OperationHandle>::ok(OperationHandle(id, std::move(future)));
}

bool CancellationScopeManager::delay(std::chrono::milliseconds duration,
                                     const CancellationToken& token) const {
    return !token.waitFor(duration);
}

bool CancellationScopeManager::delay(std::chrono::milliseconds duration) const {
    return delay(duration, linkedToken());
}

void CancellationScopeManager::resetSession() {
    CancellationSource old;
    {
        std::lock_guard lock(impl_->mutex);
        old = std::exchange(impl_->session, CancellationSource());
    }
    // Callbacks may call back into the manager, so cancel outside the lock.
    old.cancel();
    CGC_LOG_DEBUG(LogCategory::Scope, "session scope reset");
}

void CancellationScopeManager::cancelAll() {
    CancellationSource app;
    CancellationSource session;
    {
        std::lock_guard lock(impl_->mutex);
        app = impl_->app;
        session = impl_->session;
        auto now = std::chrono::steady_clock::now();
        for (auto& [id, record] : impl_->records) {
            record.status = OperationStatus::Cancelled;
            record.endTime = now;
        }
    }
    app.cancel();
    session.cancel();
    CGC_LOG_INFO(LogCategory::Scope, "all operations cancelled");
}

void CancellationScopeManager::shutdown(std::chrono::milliseconds drainTimeout) {
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->shutdown) {
            return;
        }
        impl_->shutdown = true;
    }
    cancelAll();

    std::unique_lock lock(impl_->mutex);
    bool drained = impl_->drained.wait_for(lock, drainTimeout, [this] {
        return impl_->records.empty();
    });
    auto remaining = impl_->records.size();
    lock.unlock();

    if (!drained) {
        CGC_LOG_WARN(LogCategory::Scope, std::to_string(remaining) +
                     " operation(s) still running after drain timeout");
    }
    impl_->runner.stop();
}

bool CancellationScopeManager::isShutdown() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->shutdown;
}

std::vector<OperationRecord> CancellationScopeManager::activeOperations() const {
    std::lock_guard lock(impl_->mutex);
    std::vector<OperationRecord> out;
    out.reserve(impl_->records.size());
    for (const auto& [id, record] : impl_->records) {
        out.push_back(record);
    }
    return out;
}

std::size_t CancellationScopeManager::activeCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->records.size();
}

std::size_t CancellationScopeManager::workerCount() const {
    return impl_->runner.workerCount();
}

CompletionSignalPool<bool>& CancellationScopeManager::signalPool() noexcept {
    return impl_->signals;
}

} // namespace cgc::async
