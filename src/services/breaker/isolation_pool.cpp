/// @file isolation_pool.cpp
/// @brief IsolationPool admission control on top of TaskExecutor.

#include "agw/service/isolation_pool.hpp"

#include "agw/foundation/gateway_logger.hpp"

#include <algorithm>

namespace agw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;

namespace {

uint32_t clampCapacity(uint32_t coreSize) {
    return std::max<uint32_t>(coreSize, 1);
}

}  // namespace

IsolationPool::IsolationPool(std::string key, uint32_t coreSize)
    : key_(std::move(key)),
      capacity_(clampCapacity(coreSize)),
      executor_(capacity_, "agw_breaker:" + key_) {}

IsolationPool::~IsolationPool() {
    shutdown();
}

GatewayResult<void> IsolationPool::tryExecute(Task task) {
    if (!acquireSlot()) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::IsolationRejected,
                         "isolation pool '" + key_ + "' saturated"));
    }

    auto posted = executor_.post([this, task = std::move(task)] {
        struct SlotGuard {
            IsolationPool* pool;
            ~SlotGuard() { pool->releaseSlot(); }
        } guard{this};
        task();
    });

    if (posted.hasError()) {
        releaseSlot();
        AGW_LOG_ERROR(LogCategory::Breaker,
                      "isolation pool '" + key_ + "' failed to schedule: " +
                          std::string(posted.error().message()));
    }
    return posted;
}

void IsolationPool::shutdown() {
    executor_.shutdown();
}

uint32_t IsolationPool::activeCount() const noexcept {
    return active_.load(std::memory_order_acquire);
}

uint64_t IsolationPool::rejectedCount() const noexcept {
    return rejected_.load(std::memory_order_relaxed);
}

bool IsolationPool::acquireSlot() noexcept {
    auto current = active_.load(std::memory_order_acquire);
    while (current < capacity_) {
        if (active_.compare_exchange_weak(current, current + 1,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

void IsolationPool::releaseSlot() noexcept {
    active_.fetch_sub(1, std::memory_order_acq_rel);
}

}  // namespace agw::service
