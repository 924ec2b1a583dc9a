#pragma once

/// @file isolation_pool.hpp
/// @brief Bounded worker set isolating one breaker-protected path.

#include "agw/foundation/gateway_result.hpp"
#include "agw/foundation/task_executor.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace agw::service {

/// Fixed-capacity execution pool for one breaker key.
///
/// Admission never queues: a task is accepted only while fewer than
/// capacity() tasks are in flight, otherwise tryExecute() returns
/// IsolationRejected immediately. Work for one path therefore cannot
/// starve the workers of another.
class IsolationPool {
public:
    using Task = std::function<void()>;

    IsolationPool(std::string key, uint32_t coreSize);
    ~IsolationPool();

    IsolationPool(const IsolationPool&) = delete;
    IsolationPool& operator=(const IsolationPool&) = delete;

    /// Run @p task on a pool worker if a slot is free.
    /// @return Success, IsolationRejected when saturated, or the
    ///         executor's scheduling error.
    foundation::GatewayResult<void> tryExecute(Task task);

    /// Stop the workers, letting running tasks finish. Idempotent.
    void shutdown();

    [[nodiscard]] uint32_t activeCount() const noexcept;
    [[nodiscard]] uint32_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] uint64_t rejectedCount() const noexcept;
    [[nodiscard]] std::string_view key() const noexcept { return key_; }

private:
    bool acquireSlot() noexcept;
    void releaseSlot() noexcept;

    std::string key_;
    uint32_t capacity_;
    std::atomic<uint32_t> active_{0};
    std::atomic<uint64_t> rejected_{0};
    // Declared last so the workers are joined before the counters go away.
    foundation::TaskExecutor executor_;
};

}  // namespace agw::service
