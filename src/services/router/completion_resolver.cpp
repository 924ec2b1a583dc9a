/// @file completion_resolver.cpp
/// @brief CompletionResolver implementation.

#include "agw/service/completion_resolver.hpp"

#include "agw/foundation/gateway_logger.hpp"
#include "agw/service/exchange_context.hpp"
#include "agw/service/response_committer.hpp"
#include "agw/service/retry_controller.hpp"
#include "agw/service/router_stats.hpp"

#include <exception>
#include <optional>
#include <stdexcept>

namespace agw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

CompletionResolver::CompletionResolver(std::shared_ptr<ResponseCommitter> committer,
                                       std::shared_ptr<RouterCounters> counters,
                                       std::shared_ptr<RetryController> retry)
    : committer_(std::move(committer)),
      counters_(std::move(counters)),
      retry_(std::move(retry)) {
    if (!committer_ || !counters_ || !retry_) {
        throw std::invalid_argument("CompletionResolver requires a committer, counters and a retry controller");
    }
}

bool CompletionResolver::shouldRetry(const ExchangeContext& ctx,
                                     const UpstreamFailure& failure,
                                     const BreakerConfig* breaker) {
    return breaker == nullptr &&
           isRetryable(failure.kind) &&
           ctx.currentRetryTimes() < ctx.rule().retryConfig.times;
}

void CompletionResolver::complete(const UpstreamRequest& request,
                                  const UpstreamOutcome& outcome,
                                  const std::shared_ptr<ExchangeContext>& ctx,
                                  const BreakerConfig* breaker) {
    ctx->releaseRequest();

    if (outcome.hasError()) {
        const auto& failure = outcome.error();
        if (breaker != nullptr) {
            // The breaker adapter observes the same outcome and falls back.
            AGW_LOG_DEBUG(LogCategory::Upstream,
                          "breaker route failure left to fallback: " + failure.message);
            return;
        }
        if (shouldRetry(*ctx, failure, breaker)) {
            retry_->retry(ctx);
            return;
        }
    }

    GatewayResponse response;
    std::optional<GatewayError> error;
    try {
        if (outcome.hasError()) {
            const auto& failure = outcome.error();
            LogContext logCtx;
            logCtx.requestId = ctx->request().uniqueId;
            logCtx.ruleId = ctx->rule().id;
            logCtx.path = ctx->request().path;
            logCtx.extra["kind"] = std::string(upstreamErrorKindName(failure.kind));
            logCtx.extra["url"] = request.url;

            if (failure.kind == UpstreamErrorKind::Timeout) {
                counters_->timeouts.fetch_add(1, std::memory_order_relaxed);
                response = GatewayResponse::fromCode(ResponseCode::RequestTimeout);
                error = GatewayError(ErrorCode::UpstreamTimeout, failure.message);
                GatewayLogger::instance().logWithContext(
                    LogLevel::Warning, LogCategory::Upstream, "upstream timed out", logCtx);
            } else {
                counters_->upstreamErrors.fetch_add(1, std::memory_order_relaxed);
                response = GatewayResponse::fromCode(ResponseCode::HttpResponseError);
                error = GatewayError(
                    ErrorCode::UpstreamResponseError, failure.message,
                    UpstreamErrorContext{failure.message, ctx->request().uniqueId, request.url});
                GatewayLogger::instance().logWithContext(
                    LogLevel::Error, LogCategory::Upstream,
                    "upstream call failed: " + failure.message, logCtx);
            }
        } else {
            response = GatewayResponse::fromUpstream(outcome.value());
        }
    } catch (const std::exception& e) {
        counters_->internalErrors.fetch_add(1, std::memory_order_relaxed);
        response = GatewayResponse::fromCode(ResponseCode::InternalError);
        error = GatewayError(ErrorCode::InternalError, e.what());
        AGW_LOG_ERROR(LogCategory::Router,
                      "failed to resolve response for " + std::string(ctx->uniqueId()) +
                          ": " + e.what());
    }

    committer_->commit(*ctx, std::move(response), std::move(error));
}

}  // namespace agw::service
