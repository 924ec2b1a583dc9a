#pragma once

/// @file task_executor.hpp
/// @brief TaskExecutor wrapping kcenon thread_system for fire-and-forget work.

#include "agw/foundation/gateway_result.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace agw::foundation {

/// Fixed-size worker pool backed by kcenon's thread_pool.
///
/// Used for the pooled completion mode and as the worker set of every
/// breaker isolation pool. PIMPL keeps thread_system headers out of the
/// public API.
///
/// Example:
/// @code
///   TaskExecutor executor(4, "agw_completion");
///   auto posted = executor.post([ctx] { resolver.complete(...); });
///   if (!posted) { ... }
/// @endcode
class TaskExecutor {
public:
    using TaskFunc = std::function<void()>;

    explicit TaskExecutor(std::size_t numThreads = std::thread::hardware_concurrency(),
                          std::string name = "agw_executor");

    /// Stops the pool, letting running tasks finish.
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;
    TaskExecutor(TaskExecutor&&) noexcept;
    TaskExecutor& operator=(TaskExecutor&&) noexcept;

    /// Queue a task for execution on one of the workers.
    /// @return Success, or TaskScheduleFailed / ExecutorStopped.
    GatewayResult<void> post(TaskFunc task);

    /// Stop accepting tasks and join the workers. Idempotent.
    void shutdown();

    [[nodiscard]] std::size_t workerCount() const noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace agw::foundation
