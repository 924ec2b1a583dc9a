/// @file task_executor.cpp
/// @brief TaskExecutor implementation wrapping kcenon thread_system.

#include "agw/foundation/task_executor.hpp"

#include "agw/foundation/gateway_logger.hpp"

#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <atomic>
#include <exception>
#include <mutex>
#include <vector>

namespace agw::foundation {

struct TaskExecutor::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string name;
    std::size_t workers{0};
    std::atomic<uint64_t> nextTaskId{1};
    std::atomic<bool> running{false};
    std::mutex lifecycleMutex;
};

TaskExecutor::TaskExecutor(std::size_t numThreads, std::string name)
    : impl_(std::make_unique<Impl>())
{
    impl_->name = std::move(name);
    impl_->workers = numThreads == 0 ? 1 : numThreads;
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(impl_->name);

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(impl_->workers);
    for (std::size_t i = 0; i < impl_->workers; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));

    auto started = impl_->pool->start();
    if (started.is_err()) {
        AGW_LOG_ERROR(LogCategory::Core, "failed to start executor " + impl_->name);
        return;
    }
    impl_->running.store(true, std::memory_order_release);
}

TaskExecutor::~TaskExecutor() {
    if (impl_) {
        shutdown();
    }
}

TaskExecutor::TaskExecutor(TaskExecutor&&) noexcept = default;
TaskExecutor& TaskExecutor::operator=(TaskExecutor&&) noexcept = default;

GatewayResult<void> TaskExecutor::post(TaskFunc task) {
    if (!impl_->running.load(std::memory_order_acquire)) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ExecutorStopped, "executor is not running: " + impl_->name));
    }

    auto id = impl_->nextTaskId.fetch_add(1, std::memory_order_relaxed);
    auto job = kcenon::thread::job_builder()
        .name(impl_->name + "_" + std::to_string(id))
        .work([fn = std::move(task), name = impl_->name]() -> kcenon::common::VoidResult {
            try {
                fn();
            } catch (const std::exception& e) {
                // Surface the failure through thread_system's job result.
                AGW_LOG_ERROR(LogCategory::Core,
                              "task on " + name + " failed: " + e.what());
                return kcenon::common::VoidResult::err(
                    kcenon::common::error_info{-1, e.what(), name});
            } catch (...) {
                AGW_LOG_ERROR(LogCategory::Core,
                              "task on " + name + " failed with a non-standard exception");
                return kcenon::common::VoidResult::err(
                    kcenon::common::error_info{-1, "non-standard exception", name});
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqueued = impl_->pool->enqueue(std::move(job));
    if (enqueued.is_err()) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::TaskScheduleFailed, "failed to enqueue task on " + impl_->name));
    }
    return GatewayResult<void>::ok();
}

void TaskExecutor::shutdown() {
    std::lock_guard lock(impl_->lifecycleMutex);
    if (!impl_->running.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    impl_->pool->stop(false); // graceful: wait for running jobs
}

std::size_t TaskExecutor::workerCount() const noexcept {
    return impl_->workers;
}

bool TaskExecutor::isRunning() const noexcept {
    return impl_->running.load(std::memory_order_acquire);
}

} // namespace agw::foundation
