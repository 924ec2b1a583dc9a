/// @file upstream_dispatcher.cpp
/// @brief UpstreamDispatcher implementation.

#include "agw/service/upstream_dispatcher.hpp"

#include "agw/foundation/gateway_logger.hpp"
#include "agw/foundation/task_executor.hpp"
#include "agw/service/exchange_context.hpp"
#include "agw/service/router_stats.hpp"
#include "agw/service/upstream_client.hpp"

#include <exception>
#include <stdexcept>

namespace agw::service {

using foundation::LogCategory;

UpstreamDispatcher::UpstreamDispatcher(std::shared_ptr<UpstreamClient> client,
                                       CompletionMode mode,
                                       std::shared_ptr<foundation::TaskExecutor> executor,
                                       std::shared_ptr<RouterCounters> counters,
                                       CompletionHandler onComplete)
    : client_(std::move(client)),
      mode_(mode),
      executor_(std::move(executor)),
      counters_(std::move(counters)),
      onComplete_(std::move(onComplete)) {
    if (!client_ || !counters_ || !onComplete_) {
        throw std::invalid_argument("UpstreamDispatcher requires a client, counters and a handler");
    }
    if (mode_ == CompletionMode::Pooled && !executor_) {
        throw std::invalid_argument("pooled completion mode requires an executor");
    }
}

UpstreamFuture UpstreamDispatcher::dispatch(const std::shared_ptr<ExchangeContext>& ctx,
                                            const BreakerConfig* breaker) {
    auto request = ctx->outboundRequest();
    counters_->attempts.fetch_add(1, std::memory_order_relaxed);

    UpstreamFuture future;
    try {
        future = client_->submit(request);
    } catch (const std::exception& e) {
        AGW_LOG_WARN(LogCategory::Upstream,
                     "submit to " + request.url + " threw: " + e.what());
        future = UpstreamFuture::failed(
            UpstreamFailure{UpstreamErrorKind::Connection, e.what()});
    }
    if (!future.valid()) {
        future = UpstreamFuture::failed(
            UpstreamFailure{UpstreamErrorKind::Other, "upstream client returned no future"});
    }

    future.whenComplete([this, request, ctx, breaker](const UpstreamOutcome& outcome) {
        deliver(request, outcome, ctx, breaker);
    });
    return future;
}

void UpstreamDispatcher::deliver(const UpstreamRequest& request,
                                 const UpstreamOutcome& outcome,
                                 const std::shared_ptr<ExchangeContext>& ctx,
                                 const BreakerConfig* breaker) {
    if (mode_ == CompletionMode::Inline) {
        onComplete_(request, outcome, ctx, breaker);
        return;
    }

    auto posted = executor_->post([this, request, outcome, ctx, breaker] {
        onComplete_(request, outcome, ctx, breaker);
    });
    if (posted.hasError()) {
        AGW_LOG_WARN(LogCategory::Upstream,
                     "completion executor unavailable, resolving inline: " +
                         std::string(posted.error().message()));
        onComplete_(request, outcome, ctx, breaker);
    }
}

}  // namespace agw::service
