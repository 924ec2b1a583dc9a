#pragma once

/// @file route_rule.hpp
/// @brief Routing rule with per-path breaker settings and retry policy.
///
/// Rules are immutable once built and shared read-only by every request
/// routed through them.

#include "agw/service/gateway_response.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace agw::service {

/// Circuit-breaker settings for one exact request path.
struct BreakerConfig {
    /// Request path this breaker governs (exact match).
    std::string path;

    /// Worker count of the path's isolation pool; admissions beyond it
    /// trip to the fallback.
    uint32_t threadCoreSize = 1;

    /// Hard execution timeout for one attempt.
    std::chrono::milliseconds timeout{1000};

    /// Response written when the breaker trips.
    GatewayResponse fallbackResponse = GatewayResponse::fromCode(ResponseCode::ServiceUnavailable);

    /// Minimum requests in the rolling window before the error rate counts.
    uint32_t requestVolumeThreshold = 20;

    /// Error percentage at or above which the breaker opens.
    uint32_t errorThresholdPercentage = 50;

    /// How long the breaker stays open before probing.
    std::chrono::milliseconds sleepWindow{5000};

    /// Length of the rolling statistics window.
    std::chrono::milliseconds rollingWindow{10000};

    /// Consecutive half-open successes needed to close again.
    uint32_t halfOpenSuccessThreshold = 1;
};

/// Retry policy for transient upstream failures.
struct RetryConfig {
    /// Maximum number of retries after the first attempt.
    uint32_t times = 0;
};

/// A routing rule matched to the request by an earlier filter.
struct Rule {
    std::string id;
    std::string name;
    std::string protocol = "http";
    std::string serviceId;
    std::string prefix;
    std::vector<std::string> paths;
    int order = 0;

    RetryConfig retryConfig;
    std::vector<BreakerConfig> breakerConfigs;

    /// Breaker config whose path equals @p path exactly, or nullptr.
    [[nodiscard]] const BreakerConfig* findBreakerConfig(std::string_view path) const;
};

}  // namespace agw::service
