#pragma once

/// @file retry_controller.hpp
/// @brief Bounded re-invocation of the router for transient failures.

#include <functional>
#include <memory>

namespace agw::service {

class ExchangeContext;
struct RouterCounters;

/// Re-runs the routing stage for an exchange after a retryable failure.
///
/// Retries of one exchange are strictly sequential: a retry is only
/// requested from the completion of the previous attempt. When an upstream
/// completes synchronously the retry would re-enter the router on the same
/// stack, so retries are driven by a per-thread trampoline instead: a retry
/// requested while the thread is already driving one is queued and run by
/// the outer loop, keeping the stack depth constant.
///
/// An exception thrown while re-routing one exchange drops only that
/// exchange's queued retries. Retries queued for other exchanges on the
/// same thread still run, and the first exception is then rethrown to
/// whoever started the drive.
class RetryController {
public:
    using Reinvoke = std::function<void(const std::shared_ptr<ExchangeContext>&)>;

    RetryController(std::shared_ptr<RouterCounters> counters, Reinvoke reinvoke);

    /// Increment the exchange's retry count and route it again.
    void retry(const std::shared_ptr<ExchangeContext>& ctx);

    /// True while the calling thread is inside a trampoline drive.
    [[nodiscard]] static bool driving() noexcept;

private:
    std::shared_ptr<RouterCounters> counters_;
    Reinvoke reinvoke_;
};

}  // namespace agw::service
