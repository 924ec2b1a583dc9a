#pragma once

/// @file breaker_adapter.hpp
/// @brief Runs breaker-governed attempts on isolated pools with a hard timeout.

#include "agw/foundation/error_code.hpp"
#include "agw/service/circuit_breaker.hpp"
#include "agw/service/upstream_future.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace agw::service {

class ExchangeContext;
class ResponseCommitter;
struct BreakerConfig;
struct RouterCounters;
struct Rule;

/// Breaker-protected execution stage.
///
/// Each (rule id, breaker path) pair owns a ServiceCircuitBreaker and an
/// IsolationPool, created lazily from that rule's config for the path.
/// Two rules sharing a path never share a pool or breaker window.
/// One attempt flows as:
///
/// 1. Breaker open -> fallback (short-circuit).
/// 2. Isolation pool saturated -> fallback (rejection counts as a failure).
/// 3. On a pool worker: start the attempt and wait up to the config's
///    timeout. Timeout cancels the in-flight call; a thrown error or a
///    failed outcome also falls back. A successful outcome was already
///    written by the completion stage.
///
/// The blocking wait only ever happens on an isolation worker.
class BreakerAdapter {
public:
    using Attempt = std::function<UpstreamFuture()>;

    BreakerAdapter(std::shared_ptr<ResponseCommitter> committer,
                   std::shared_ptr<RouterCounters> counters,
                   bool logFallbacks);

    /// Stops every isolation pool before the per-path state is released.
    ~BreakerAdapter();

    BreakerAdapter(const BreakerAdapter&) = delete;
    BreakerAdapter& operator=(const BreakerAdapter&) = delete;

    /// Run @p attempt for @p ctx under the breaker for @p config.path of
    /// the context's rule.
    void execute(const std::shared_ptr<ExchangeContext>& ctx,
                 const BreakerConfig& config,
                 Attempt attempt);

    /// Breaker state for @p path under rule @p ruleId, if one has been created.
    [[nodiscard]] std::optional<ServiceCircuitBreaker::State> state(std::string_view ruleId,
                                                                    std::string_view path) const;

    /// Force the breaker for @p config.path under @p rule into @p newState,
    /// creating it if needed.
    void forceState(const Rule& rule, const BreakerConfig& config,
                    ServiceCircuitBreaker::State newState);

    /// Stop all isolation pools, letting running attempts finish. Idempotent.
    void shutdown();

private:
    struct PathCommand;
    struct Impl;

    void fallback(const std::shared_ptr<ExchangeContext>& ctx,
                  const BreakerConfig& config,
                  foundation::ErrorCode reason,
                  const std::string& detail);

    std::unique_ptr<Impl> impl_;
};

}  // namespace agw::service
