/// @file task_runner.cpp
/// @brief TaskRunner implementation over kcenon thread_system.

#include "cgc/foundation/task_runner.hpp"

#include "cgc/foundation/client_logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace cgc::foundation {

struct TaskRunner::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<std::size_t> workers{0};
    std::atomic<bool> running{false};
    std::mutex stopMutex;
};

namespace {

std::vector<std::unique_ptr<kcenon::thread::thread_worker>> makeWorkers(std::size_t count) {
    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    return workers;
}

} // namespace

TaskRunner::TaskRunner(std::size_t numThreads, std::string name)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(name);
    impl_->pool->enqueue_batch(makeWorkers(numThreads));
    impl_->pool->start();
    impl_->workers = numThreads;
    impl_->running.store(true, std::memory_order_release);
}

TaskRunner::~TaskRunner() {
    if (impl_) {
        stop();
    }
}

TaskRunner::TaskRunner(TaskRunner&&) noexcept = default;
TaskRunner& TaskRunner::operator=(TaskRunner&&) noexcept = default;

ClientResult<void> TaskRunner::submit(std::string name, Task task) {
    if (!impl_->running.load(std::memory_order_acquire)) {
        return ClientResult<void>::err(
            ClientError(ErrorCode::TaskSubmitFailed, "task runner is stopped"));
    }

    auto job = kcenon::thread::job_builder()
        .name(name)
        .work([fn = std::move(task), name]() -> kcenon::common::VoidResult {
            try {
                fn();
            } catch (const std::exception& e) {
                CGC_LOG_ERROR(LogCategory::Core,
                              "task '" + name + "' threw: " + e.what());
            } catch (...) {
                CGC_LOG_ERROR(LogCategory::Core,
                              "task '" + name + "' threw a non-standard exception");
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqueued = impl_->pool->enqueue(std::move(job));
    if (enqueued.is_err()) {
        return ClientResult<void>::err(
            ClientError(ErrorCode::TaskSubmitFailed, "failed to enqueue task: " + name));
    }
    return ClientResult<void>::ok();
}

ClientResult<void> TaskRunner::addWorkers(std::size_t count) {
    if (count == 0) {
        return ClientResult<void>::ok();
    }
    std::lock_guard lock(impl_->stopMutex);
    if (!impl_->running.load(std::memory_order_acquire)) {
        return ClientResult<void>::err(
            ClientError(ErrorCode::TaskSubmitFailed, "task runner is stopped"));
    }
    // Workers joining a started pool are started by it.
    auto added = impl_->pool->enqueue_batch(makeWorkers(count));
    if (added.is_err()) {
        return ClientResult<void>::err(ClientError(
            ErrorCode::TaskSubmitFailed, "failed to add " + std::to_string(count) + " worker(s)"));
    }
    impl_->workers.fetch_add(count, std::memory_order_acq_rel);
    CGC_LOG_DEBUG(LogCategory::Core, "worker pool grown to " +
                  std::to_string(impl_->workers.load()) + " thread(s)");
    return ClientResult<void>::ok();
}

void TaskRunner::stop() {
    std::lock_guard lock(impl_->stopMutex);
    if (!impl_->running.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    impl_->pool->stop(false); // graceful: wait for running jobs
}

bool TaskRunner::isRunning() const noexcept {
    return impl_ && impl_->running.load(std::memory_order_acquire);
}

std::size_t TaskRunner::workerCount() const noexcept {
    return impl_ ? impl_->workers.load(std::memory_order_acquire) : 0;
}

} // namespace cgc::foundation
