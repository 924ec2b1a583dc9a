/// @file router.cpp
/// @brief Router implementation wiring the pipeline stages.

#include "agw/service/router.hpp"

#include "agw/foundation/gateway_logger.hpp"
#include "agw/foundation/task_executor.hpp"
#include "agw/service/access_log.hpp"
#include "agw/service/breaker_adapter.hpp"
#include "agw/service/completion_resolver.hpp"
#include "agw/service/exchange_context.hpp"
#include "agw/service/response_committer.hpp"
#include "agw/service/response_writer.hpp"
#include "agw/service/retry_controller.hpp"
#include "agw/service/upstream_client.hpp"

#include <stdexcept>

namespace agw::service {

using foundation::LogCategory;
using foundation::TaskExecutor;

// ============================================================================
// Impl
// ============================================================================

struct Router::Impl {
    RouterOptions options;
    std::shared_ptr<RouterCounters> counters = std::make_shared<RouterCounters>();
    std::shared_ptr<TaskExecutor> completionExecutor;
    std::shared_ptr<ResponseCommitter> committer;
    std::shared_ptr<RetryController> retry;
    std::shared_ptr<CompletionResolver> resolver;
    std::unique_ptr<UpstreamDispatcher> dispatcher;
    std::unique_ptr<BreakerAdapter> breaker;

    ~Impl() { shutdown(); }

    void route(const std::shared_ptr<ExchangeContext>& ctx) {
        const auto& request = ctx->request();
        const auto* config = ctx->rule().findBreakerConfig(request.path);
        if (config != nullptr) {
            AGW_LOG_DEBUG(LogCategory::Router,
                          "breaker route " + request.path + " for " + request.uniqueId);
            breaker->execute(ctx, *config, [this, ctx, config] {
                return dispatcher->dispatch(ctx, config);
            });
            return;
        }

        AGW_LOG_DEBUG(LogCategory::Router,
                      "plain route " + request.path + " for " + request.uniqueId);
        dispatcher->dispatch(ctx, nullptr);
    }

    void shutdown() {
        if (breaker) {
            breaker->shutdown();
        }
        if (completionExecutor) {
            completionExecutor->shutdown();
        }
    }
};

// ============================================================================
// Router
// ============================================================================

Router::Router(RouterOptions options,
               std::shared_ptr<UpstreamClient> client,
               std::shared_ptr<ResponseWriter> writer,
               std::shared_ptr<AccessLogSink> accessLog)
    : impl_(std::make_unique<Impl>()) {
    impl_->options = options;

    if (options.completionMode == CompletionMode::Pooled) {
        impl_->completionExecutor = std::make_shared<TaskExecutor>(
            options.completionThreads == 0 ? 1 : options.completionThreads,
            "agw_completion");
    }

    impl_->committer = std::make_shared<ResponseCommitter>(
        std::move(writer), std::move(accessLog), impl_->counters);

    auto* impl = impl_.get();
    impl_->retry = std::make_shared<RetryController>(
        impl_->counters,
        [impl](const std::shared_ptr<ExchangeContext>& ctx) { impl->route(ctx); });

    impl_->resolver = std::make_shared<CompletionResolver>(
        impl_->committer, impl_->counters, impl_->retry);

    auto resolver = impl_->resolver;
    impl_->dispatcher = std::make_unique<UpstreamDispatcher>(
        std::move(client), options.completionMode, impl_->completionExecutor, impl_->counters,
        [resolver](const UpstreamRequest& request,
                   const UpstreamOutcome& outcome,
                   const std::shared_ptr<ExchangeContext>& ctx,
                   const BreakerConfig* breakerConfig) {
            resolver->complete(request, outcome, ctx, breakerConfig);
        });

    impl_->breaker = std::make_unique<BreakerAdapter>(
        impl_->committer, impl_->counters, options.logFallbacks);

    AGW_LOG_INFO(LogCategory::Core,
                 "router started (completion " +
                     std::string(completionModeName(options.completionMode)) + ")");
}

Router::~Router() {
    if (impl_) {
        shutdown();
    }
}

Router::Router(Router&&) noexcept = default;
Router& Router::operator=(Router&&) noexcept = default;

void Router::route(const std::shared_ptr<ExchangeContext>& ctx) {
    if (!ctx) {
        throw std::invalid_argument("Router::route requires an exchange context");
    }
    impl_->route(ctx);
}

void Router::shutdown() {
    impl_->shutdown();
}

RouterStats Router::stats() const {
    return impl_->counters->snapshot();
}

const RouterOptions& Router::options() const noexcept {
    return impl_->options;
}

std::optional<ServiceCircuitBreaker::State> Router::breakerState(std::string_view ruleId,
                                                                 std::string_view path) const {
    return impl_->breaker->state(ruleId, path);
}

}  // namespace agw::service
