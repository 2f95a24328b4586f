#pragma once

/// @file task_runner.hpp
/// @brief TaskRunner wrapping kcenon thread_system as the client's worker pool.

#include "cgc/foundation/client_result.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace cgc::foundation {

/// Fixed-size worker pool backed by kcenon's thread_pool.
///
/// Background loops of the client (sender, receiver, keepalive, reconnect
/// supervision) and tracked operations run here. A loop holds its worker for
/// its whole lifetime; callers running such loops grow the pool with
/// addWorkers() first. Uses PIMPL to keep thread_system headers out of the
/// public API.
///
/// Example:
/// @code
///   TaskRunner runner(4, "net");
///   auto submitted = runner.submit("flush", [] { flushStats(); });
///   if (!submitted) { ... }
///   runner.stop();
/// @endcode
class TaskRunner {
public:
    using Task = std::function<void()>;

    explicit TaskRunner(std::size_t numThreads = 8, std::string name = "cgc_runner");

    /// Stops the pool, waiting for running tasks.
    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;
    TaskRunner(TaskRunner&&) noexcept;
    TaskRunner& operator=(TaskRunner&&) noexcept;

    /// Queue @p task for execution on a worker.
    /// @return TaskSubmitFailed if the pool rejected it or is stopped.
    ClientResult<void> submit(std::string name, Task task);

    /// Add @p count workers to the running pool. The pool never shrinks.
    /// @return TaskSubmitFailed if the pool is stopped or rejected them.
    ClientResult<void> addWorkers(std::size_t count);

    /// Stop accepting work and join the workers once running tasks return.
    /// Idempotent.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] std::size_t workerCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cgc::foundation
