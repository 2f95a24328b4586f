#pragma once

/// @file cancellation_scope_manager.hpp
/// @brief App / Session cancellation scopes and a registry of tracked
///        background operations.

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cgc/async/cancellation_token.hpp"
#include "cgc/async/completion_signal.hpp"
#include "cgc/foundation/client_result.hpp"

namespace cgc::async {

/// Which scope's cancellation an operation follows.
enum class OperationScope : uint8_t {
    App,     ///< Lives until cancelAll()/shutdown()
    Session  ///< Additionally cancelled by resetSession()
};

enum class OperationStatus : uint8_t { Running, Completed, Cancelled, Failed };

constexpr std::string_view operationStatusName(OperationStatus status) {
    switch (status) {
        case OperationStatus::Running:   return "Running";
        case OperationStatus::Completed: return "Completed";
        case OperationStatus::Cancelled: return "Cancelled";
        case OperationStatus::Failed:    return "Failed";
    }
    return "Unknown";
}

/// Registry entry for a running operation. Introspection only.
struct OperationRecord {
    uint64_t id = 0;
    std::string name;
    OperationScope scope = OperationScope::Session;
    OperationStatus status = OperationStatus::Running;
    std::chrono::steady_clock::time_point startTime;
    std::optional<std::chrono::steady_clock::time_point> endTime;
};

/// Final classification of a tracked operation.
struct OperationOutcome {
    uint64_t id = 0;
    std::string name;
    OperationStatus status = OperationStatus::Completed;
    std::optional<foundation::ClientError> error;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool completed() const noexcept { return status == OperationStatus::Completed; }
    [[nodiscard]] bool cancelled() const noexcept { return status == OperationStatus::Cancelled; }
    [[nodiscard]] bool failed() const noexcept { return status == OperationStatus::Failed; }
};

/// Handle to a submitted operation; copyable, may be discarded.
class OperationHandle {
public:
    OperationHandle() = default;
    OperationHandle(uint64_t id, std::shared_future<OperationOutcome> future)
        : id_(id), future_(std::move(future)) {}

    [[nodiscard]] uint64_t id() const noexcept { return id_; }

    /// Wait up to @p timeout. nullopt if the operation is still running.
    std::optional<OperationOutcome> wait(std::chrono::milliseconds timeout) const {
        if (!future_.valid() ||
            future_.wait_for(timeout) != std::future_status::ready) {
            return std::nullopt;
        }
        return future_.get();
    }

    [[nodiscard]] bool isDone() const {
        return future_.valid() &&
               future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

private:
    uint64_t id_ = 0;
    std::shared_future<OperationOutcome> future_;
};

/// Body of a tracked operation. Returns OperationCancelled (or any
/// cancellation-kind error) when it unwinds because the token fired.
using ScopedOperation = std::function<foundation::ClientResult<void>(const CancellationToken&)>;

/// Owns the application and session cancellation scopes and runs tracked
/// operations on a TaskRunner worker pool. Options::workerThreads is the
/// number of workers reserved for short operations; long-running ones add
/// their own.
///
/// Constructed once by the application and passed by reference to the
/// components that need it.
///
/// Example:
/// @code
///   CancellationScopeManager scopes;
///   auto handle = scopes.runAsync("warmup", [](const CancellationToken& t) {
///       return t.waitFor(250ms) ? cancelledResult<void>() : ClientResult<void>::ok();
///   });
///   scopes.resetSession();   // cancels "warmup"
///   auto outcome = handle.value().wait(1s);   // status == Cancelled
/// @endcode
class CancellationScopeManager {
public:
    struct Options {
        std::size_t workerThreads = 8;
        std::string poolName = "cgc_scopes";
    };

    CancellationScopeManager();
    explicit CancellationScopeManager(Options options);

    /// Calls shutdown() with the default drain timeout.
    ~CancellationScopeManager();

    CancellationScopeManager(const CancellationScopeManager&) = delete;
    CancellationScopeManager& operator=(const CancellationScopeManager&) = delete;

    [[nodiscard]] CancellationToken appToken() const;
    [[nodiscard]] CancellationToken sessionToken() const;

    /// Token cancelled when either the app or the current session scope is.
    [[nodiscard]] CancellationToken linkedToken() const;

    /// Register and start @p operation on the worker pool.
    /// @return ScopeShutdown after shutdown(), TaskSubmitFailed if the pool
    ///         rejected the task.
    foundation::ClientResult<OperationHandle> runAsync(
        std::string name, ScopedOperation operation,
        OperationScope scope = OperationScope::Session);

    /// Like runAsync() for an operation that blocks for most of its life (a
    /// read or send loop). The pool grows so that Options::workerThreads
    /// workers always stay free for other operations.
    /// @return TaskSubmitFailed if the pool could not be grown.
    foundation::ClientResult<OperationHandle> runLongRunning(
        std::string name, ScopedOperation operation,
        OperationScope scope = OperationScope::Session);

    /// Session-scoped run that is cancelled after @p timeout. A timed-out
    /// operation is reported as Failed with ErrorCode::Timeout.
    foundation::ClientResult<OperationHandle> runWithTimeout(
        std::string name, ScopedOperation operation, std::chrono::milliseconds timeout);

    /// Cancellable sleep. @return true if the full duration elapsed.
    bool delay(std::chrono::milliseconds duration, const CancellationToken& token) const;

    /// Sleep bound to the linked app/session token.
    bool delay(std::chrono::milliseconds duration) const;

    /// Cancel the current session scope and start a fresh one.
    /// App-scoped operations are unaffected.
    void resetSession();
    void cancelSession() { resetSession(); }

    /// Cancel both scopes and mark every tracked operation Cancelled.
    void cancelAll();

    /// cancelAll(), reject new operations, wait up to @p drainTimeout for
    /// running ones, then stop the pool. Must not be called from an operation.
    void shutdown(std::chrono::milliseconds drainTimeout = std::chrono::milliseconds(2000));

    [[nodiscard]] bool isShutdown() const;

    [[nodiscard]] std::vector<OperationRecord> activeOperations() const;
    [[nodiscard]] std::size_t activeCount() const;

    /// Current size of the worker pool.
    [[nodiscard]] std::size_t workerCount() const;

    CompletionSignalPool<bool>& signalPool() noexcept;

private:
    foundation::ClientResult<OperationHandle> launch(
        std::string name, ScopedOperation operation,
        OperationScope scope, CancellationToken token, bool longRunning);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cgc::async
