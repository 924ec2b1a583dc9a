#pragma once

/// @file exchange_context.hpp
/// @brief Mutable per-request state threaded through the routing pipeline.

#include "agw/foundation/gateway_error.hpp"
#include "agw/service/gateway_response.hpp"
#include "agw/service/http_types.hpp"
#include "agw/service/route_rule.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace agw::service {

/// Inbound request as seen by the routing stage. The upstream target
/// (scheme + host) has already been resolved by an earlier filter.
struct GatewayRequest {
    std::string uniqueId;
    std::string clientIp;
    std::string method = "GET";
    std::string path;
    std::string query;

    std::string scheme = "http";
    std::string host;

    HeaderList headers;
    std::string contentType;
    std::string body;

    /// Per-attempt client timeout forwarded to the upstream client.
    std::chrono::milliseconds timeout{0};

    std::chrono::steady_clock::time_point beginTime = std::chrono::steady_clock::now();

    /// scheme://host/path[?query]
    [[nodiscard]] std::string url() const;
};

/// State for one logical request, shared by every attempt and completion
/// callback until the terminal write.
///
/// The written flag is single-assignment: markWritten() succeeds exactly
/// once, and only the caller that won it may attach the response.
///
/// Example:
/// @code
///   auto ctx = std::make_shared<ExchangeContext>(rule, std::move(request));
///   router.route(ctx);
///   // ... later, on some completion thread:
///   if (ctx->markWritten()) {
///       ctx->setResponse(GatewayResponse::fromCode(ResponseCode::InternalError));
///   }
/// @endcode
class ExchangeContext {
public:
    ExchangeContext(std::shared_ptr<const Rule> rule, GatewayRequest request);

    ExchangeContext(const ExchangeContext&) = delete;
    ExchangeContext& operator=(const ExchangeContext&) = delete;

    [[nodiscard]] const Rule& rule() const noexcept { return *rule_; }

    [[nodiscard]] const GatewayRequest& request() const noexcept { return request_; }

    [[nodiscard]] std::string_view uniqueId() const noexcept { return request_.uniqueId; }

    /// Outbound request for the upstream client. Built on first use and
    /// reused by every retry, so it survives releaseRequest().
    [[nodiscard]] UpstreamRequest outboundRequest();

    /// Drop the inbound payload. Idempotent.
    void releaseRequest();

    [[nodiscard]] bool requestReleased() const;

    // -- Terminal state -------------------------------------------------------

    /// Atomically flip written false -> true.
    /// @return true for the single caller that performed the transition.
    [[nodiscard]] bool markWritten() noexcept;

    [[nodiscard]] bool isWritten() const noexcept;

    /// Attach the terminal response.
    /// @return false (and leaves the response untouched) if one is already set.
    bool setResponse(GatewayResponse response);

    [[nodiscard]] std::optional<GatewayResponse> response() const;

    void setFailure(foundation::GatewayError failure);

    [[nodiscard]] std::optional<foundation::GatewayError> failure() const;

    // -- Retry bookkeeping ----------------------------------------------------

    [[nodiscard]] uint32_t currentRetryTimes() const noexcept;

    /// Increment the retry count and return the new value.
    uint32_t incrementRetryTimes() noexcept;

private:
    std::shared_ptr<const Rule> rule_;
    GatewayRequest request_;

    mutable std::mutex mutex_;
    std::optional<UpstreamRequest> outbound_;
    bool released_ = false;
    std::optional<GatewayResponse> response_;
    std::optional<foundation::GatewayError> failure_;

    std::atomic<bool> written_{false};
    std::atomic<uint32_t> retryTimes_{0};
};

}  // namespace agw::service
