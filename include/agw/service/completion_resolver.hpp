#pragma once

/// @file completion_resolver.hpp
/// @brief Turns one attempt's outcome into a retry or a terminal response.

#include "agw/service/upstream_future.hpp"

#include <memory>
#include <string>

namespace agw::service {

class ExchangeContext;
class ResponseCommitter;
class RetryController;
struct BreakerConfig;
struct RouterCounters;

/// Context attached to an UpstreamResponseError failure.
struct UpstreamErrorContext {
    std::string cause;
    std::string requestId;
    std::string url;
};

/// Completion stage, invoked once per dispatch attempt.
///
/// | Outcome                                   | Result                      |
/// |-------------------------------------------|-----------------------------|
/// | retryable failure, budget left, no breaker | RetryController::retry()   |
/// | any failure on a breaker route             | left to the breaker adapter |
/// | Timeout                                   | RequestTimeout (504)        |
/// | other failure                             | HttpResponseError (502)     |
/// | upstream response                         | passthrough                 |
/// | exception while resolving                 | InternalError (500)         |
///
/// Exceptions thrown by a retry propagate to the caller.
class CompletionResolver {
public:
    CompletionResolver(std::shared_ptr<ResponseCommitter> committer,
                       std::shared_ptr<RouterCounters> counters,
                       std::shared_ptr<RetryController> retry);

    void complete(const UpstreamRequest& request,
                  const UpstreamOutcome& outcome,
                  const std::shared_ptr<ExchangeContext>& ctx,
                  const BreakerConfig* breaker);

    /// Retry gate: retryable kind, retry budget not exhausted, and no
    /// breaker governing the route.
    [[nodiscard]] static bool shouldRetry(const ExchangeContext& ctx,
                                          const UpstreamFailure& failure,
                                          const BreakerConfig* breaker);

private:
    std::shared_ptr<ResponseCommitter> committer_;
    std::shared_ptr<RouterCounters> counters_;
    std::shared_ptr<RetryController> retry_;
};

}  // namespace agw::service
