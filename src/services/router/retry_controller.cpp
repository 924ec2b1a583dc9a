/// @file retry_controller.cpp
/// @brief RetryController and its per-thread trampoline.

#include "agw/service/retry_controller.hpp"

#include "agw/foundation/gateway_logger.hpp"
#include "agw/service/exchange_context.hpp"
#include "agw/service/router_stats.hpp"

#include <deque>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace agw::service {

using foundation::GatewayLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

struct PendingRetry {
    const RetryController::Reinvoke* reinvoke;
    std::shared_ptr<ExchangeContext> ctx;
};

struct Trampoline {
    bool driving = false;
    std::deque<PendingRetry> pending;
};

Trampoline& trampoline() {
    thread_local Trampoline t;
    return t;
}

struct DriveGuard {
    explicit DriveGuard(Trampoline& t) : tramp(t) { tramp.driving = true; }
    ~DriveGuard() {
        tramp.driving = false;
        tramp.pending.clear();
    }
    DriveGuard(const DriveGuard&) = delete;
    DriveGuard& operator=(const DriveGuard&) = delete;

    Trampoline& tramp;
};

}  // namespace

RetryController::RetryController(std::shared_ptr<RouterCounters> counters, Reinvoke reinvoke)
    : counters_(std::move(counters)),
      reinvoke_(std::move(reinvoke)) {
    if (!counters_ || !reinvoke_) {
        throw std::invalid_argument("RetryController requires counters and a reinvoke target");
    }
}

void RetryController::retry(const std::shared_ptr<ExchangeContext>& ctx) {
    auto attempt = ctx->incrementRetryTimes();
    counters_->retries.fetch_add(1, std::memory_order_relaxed);

    auto& logger = GatewayLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Retry)) {
        LogContext logCtx;
        logCtx.requestId = ctx->request().uniqueId;
        logCtx.ruleId = ctx->rule().id;
        logCtx.path = ctx->request().path;
        logCtx.extra["retry"] = std::to_string(attempt);
        logCtx.extra["max"] = std::to_string(ctx->rule().retryConfig.times);
        logger.logWithContext(LogLevel::Debug, LogCategory::Retry,
                              "retrying upstream call", logCtx);
    }

    auto& tramp = trampoline();
    if (tramp.driving) {
        tramp.pending.push_back(PendingRetry{&reinvoke_, ctx});
        return;
    }

    DriveGuard guard(tramp);
    std::exception_ptr firstFailure;

    // A failing reinvoke only drops its own exchange's queued retries; the
    // other exchanges queued on this thread still run before the rethrow.
    auto onFailure = [&](const PendingRetry& failed, const std::string& what) {
        if (!firstFailure) {
            firstFailure = std::current_exception();
        }
        std::erase_if(tramp.pending, [&failed](const PendingRetry& p) {
            return p.ctx == failed.ctx;
        });
        AGW_LOG_ERROR(LogCategory::Retry,
                      "retry of " + failed.ctx->request().uniqueId + " failed: " + what);
    };

    PendingRetry current{&reinvoke_, ctx};
    for (;;) {
        try {
            (*current.reinvoke)(current.ctx);
        } catch (const std::exception& e) {
            onFailure(current, e.what());
        } catch (...) {
            onFailure(current, "unknown exception");
        }

        if (tramp.pending.empty()) {
            break;
        }
        current = std::move(tramp.pending.front());
        tramp.pending.pop_front();
    }

    if (firstFailure) {
        std::rethrow_exception(firstFailure);
    }
}

bool RetryController::driving() noexcept {
    return trampoline().driving;
}

}  // namespace agw::service
