/// @file breaker_adapter.cpp
/// @brief BreakerAdapter implementation.

#include "agw/service/breaker_adapter.hpp"

#include "agw/foundation/gateway_error.hpp"
#include "agw/foundation/gateway_logger.hpp"
#include "agw/service/exchange_context.hpp"
#include "agw/service/isolation_pool.hpp"
#include "agw/service/response_committer.hpp"
#include "agw/service/route_rule.hpp"
#include "agw/service/router_stats.hpp"

#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace agw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

struct BreakerAdapter::PathCommand {
    explicit PathCommand(const BreakerConfig& config)
        : breaker(CircuitBreakerConfig::from(config)),
          pool(config.path, config.threadCoreSize) {}

    ServiceCircuitBreaker breaker;
    IsolationPool pool;
};

struct BreakerAdapter::Impl {
    std::shared_ptr<ResponseCommitter> committer;
    std::shared_ptr<RouterCounters> counters;
    bool logFallbacks = true;

    /// Keyed by (rule id, breaker path).
    using CommandKey = std::pair<std::string, std::string>;

    mutable std::mutex mutex;
    std::map<CommandKey, std::unique_ptr<PathCommand>> commands;

    PathCommand& commandFor(const Rule& rule, const BreakerConfig& config) {
        std::lock_guard lock(mutex);
        CommandKey key{rule.id, config.path};
        auto it = commands.find(key);
        if (it == commands.end()) {
            it = commands.emplace(std::move(key), std::make_unique<PathCommand>(config)).first;
            AGW_LOG_INFO(LogCategory::Breaker,
                         "created breaker for " + config.path + " in rule '" + rule.id +
                             "' (pool " +
                             std::to_string(it->second->pool.capacity()) + ", timeout " +
                             std::to_string(config.timeout.count()) + "ms)");
        }
        return *it->second;
    }
};

BreakerAdapter::BreakerAdapter(std::shared_ptr<ResponseCommitter> committer,
                               std::shared_ptr<RouterCounters> counters,
                               bool logFallbacks)
    : impl_(std::make_unique<Impl>()) {
    if (!committer || !counters) {
        throw std::invalid_argument("BreakerAdapter requires a committer and counters");
    }
    impl_->committer = std::move(committer);
    impl_->counters = std::move(counters);
    impl_->logFallbacks = logFallbacks;
}

BreakerAdapter::~BreakerAdapter() {
    shutdown();
}

void BreakerAdapter::execute(const std::shared_ptr<ExchangeContext>& ctx,
                             const BreakerConfig& config,
                             Attempt attempt) {
    auto& command = impl_->commandFor(ctx->rule(), config);

    if (!command.breaker.allowRequest()) {
        impl_->counters->shortCircuits.fetch_add(1, std::memory_order_relaxed);
        fallback(ctx, config, ErrorCode::BreakerOpen, "circuit open");
        return;
    }

    auto* cmd = &command;
    auto admitted = command.pool.tryExecute(
        [this, cmd, ctx, &config, attempt = std::move(attempt)] {
            UpstreamFuture future;
            try {
                future = attempt();
            } catch (const std::exception& e) {
                cmd->breaker.recordFailure();
                fallback(ctx, config, ErrorCode::BreakerExecutionFailed, e.what());
                return;
            }

            if (!future.waitFor(config.timeout)) {
                if (future.cancel("breaker timeout after " +
                                  std::to_string(config.timeout.count()) + "ms")) {
                    impl_->counters->breakerTimeouts.fetch_add(1, std::memory_order_relaxed);
                    cmd->breaker.recordFailure();
                    fallback(ctx, config, ErrorCode::BreakerTimeout, "execution timed out");
                    return;
                }
                // Lost the race with the upstream: the outcome is settled.
            }

            const auto& outcome = future.outcome();
            if (outcome.hasError()) {
                cmd->breaker.recordFailure();
                fallback(ctx, config, ErrorCode::BreakerExecutionFailed, outcome.error().message);
                return;
            }
            cmd->breaker.recordSuccess();
        });

    if (admitted.hasError()) {
        impl_->counters->isolationRejections.fetch_add(1, std::memory_order_relaxed);
        command.breaker.recordFailure();
        fallback(ctx, config, admitted.error().code(),
                 std::string(admitted.error().message()));
    }
}

void BreakerAdapter::fallback(const std::shared_ptr<ExchangeContext>& ctx,
                              const BreakerConfig& config,
                              ErrorCode reason,
                              const std::string& detail) {
    ctx->releaseRequest();
    impl_->counters->fallbacks.fetch_add(1, std::memory_order_relaxed);

    LogContext logCtx;
    logCtx.requestId = ctx->request().uniqueId;
    logCtx.ruleId = ctx->rule().id;
    logCtx.path = config.path;
    logCtx.extra["code"] = std::to_string(static_cast<uint32_t>(reason));
    logCtx.extra["reason"] = detail;
    GatewayLogger::instance().logWithContext(
        LogLevel::Warning, LogCategory::Breaker, "serving breaker fallback", logCtx);

    impl_->committer->commit(*ctx, config.fallbackResponse,
                             GatewayError(reason, detail), impl_->logFallbacks);
}

std::optional<ServiceCircuitBreaker::State> BreakerAdapter::state(std::string_view ruleId,
                                                                  std::string_view path) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->commands.find(Impl::CommandKey{std::string(ruleId), std::string(path)});
    if (it == impl_->commands.end()) {
        return std::nullopt;
    }
    return it->second->breaker.state();
}

void BreakerAdapter::forceState(const Rule& rule,
                                const BreakerConfig& config,
                                ServiceCircuitBreaker::State newState) {
    impl_->commandFor(rule, config).breaker.forceState(newState);
}

void BreakerAdapter::shutdown() {
    if (!impl_) {
        return;
    }
    std::lock_guard lock(impl_->mutex);
    for (auto& [key, command] : impl_->commands) {
        command->pool.shutdown();
    }
}

}  // namespace agw::service
