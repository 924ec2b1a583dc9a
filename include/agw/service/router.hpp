#pragma once

/// @file router.hpp
/// @brief Routing stage: picks the resilience path for an exchange and
///        drives it to a terminal response.

#include "agw/service/circuit_breaker.hpp"
#include "agw/service/router_stats.hpp"
#include "agw/service/upstream_dispatcher.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>

namespace agw::service {

class AccessLogSink;
class ExchangeContext;
class ResponseWriter;
class UpstreamClient;

/// Construction-time options for a Router.
struct RouterOptions {
    /// Where upstream completions are resolved.
    CompletionMode completionMode = CompletionMode::Inline;

    /// Worker count of the completion executor (Pooled mode only).
    uint32_t completionThreads = std::thread::hardware_concurrency();

    /// Emit the access-log record for breaker fallbacks as well.
    bool logFallbacks = true;
};

/// Entry point of the forwarding core, called by the filter chain once an
/// exchange has a matched rule and a resolved upstream target.
///
/// route() looks up the breaker config whose path equals the request path
/// exactly. With a config the attempt runs through the breaker adapter,
/// otherwise it is dispatched directly with bounded retries. The lookup is
/// repeated on every retry. Whatever happens, the exchange is written
/// exactly once and produces one access-log record.
///
/// Example:
/// @code
///   RouterOptions options;
///   options.completionMode = CompletionMode::Pooled;
///   Router router(options, httpClient, responseWriter,
///                 std::make_shared<RegistryAccessLogSink>());
///
///   auto ctx = std::make_shared<ExchangeContext>(rule, std::move(request));
///   router.route(ctx);
/// @endcode
///
/// The router must outlive every in-flight upstream call it started.
class Router {
public:
    Router(RouterOptions options,
           std::shared_ptr<UpstreamClient> client,
           std::shared_ptr<ResponseWriter> writer,
           std::shared_ptr<AccessLogSink> accessLog);

    /// Calls shutdown().
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;
    Router(Router&&) noexcept;
    Router& operator=(Router&&) noexcept;

    // -- Routing --------------------------------------------------------------

    /// Route @p ctx. Never reports errors through a return value: every
    /// outcome ends in a written response. Exceptions raised while driving
    /// a retry propagate.
    void route(const std::shared_ptr<ExchangeContext>& ctx);

    // -- Lifecycle ------------------------------------------------------------

    /// Stop the isolation pools and the completion executor. Idempotent.
    void shutdown();

    // -- Statistics -----------------------------------------------------------

    [[nodiscard]] RouterStats stats() const;

    [[nodiscard]] const RouterOptions& options() const noexcept;

    /// State of the breaker for @p path under rule @p ruleId, once one has
    /// been created.
    [[nodiscard]] std::optional<ServiceCircuitBreaker::State> breakerState(std::string_view ruleId,
                                                                           std::string_view path) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace agw::service
