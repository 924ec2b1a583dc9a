#pragma once

/// @file rule_loader.hpp
/// @brief Builds immutable routing rules from YAML.

#include "agw/foundation/config_manager.hpp"
#include "agw/foundation/gateway_result.hpp"
#include "agw/service/route_rule.hpp"

#include <memory>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace agw::service {

using RuleList = std::vector<std::shared_ptr<const Rule>>;

/// Parse a `rules` sequence.
///
/// Example YAML:
/// @code
///   rules:
///     - id: orders
///       service_id: order-service
///       prefix: /orders
///       paths: [/orders/list, /orders/detail]
///       retry:
///         times: 2
///       breakers:
///         - path: /orders/list
///           thread_core_size: 4
///           timeout_ms: 200
///           fallback:
///             status: 503
///             body: '{"code":10008,"message":"service unavailable"}'
///           request_volume_threshold: 20
///           error_threshold_percentage: 50
///           sleep_window_ms: 5000
///           rolling_window_ms: 10000
///           half_open_success_threshold: 1
/// @endcode
///
/// @return The rules, ConfigTypeMismatch for malformed values, or
///         InvalidArgument for values out of range.
[[nodiscard]] foundation::GatewayResult<RuleList> parseRules(const YAML::Node& rules);

/// Parse the `rules` key of a loaded configuration. A missing key yields
/// an empty list.
[[nodiscard]] foundation::GatewayResult<RuleList> loadRules(const foundation::ConfigManager& config);

}  // namespace agw::service
