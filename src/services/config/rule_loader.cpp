/// @file rule_loader.cpp
/// @brief YAML rule parsing.

#include "agw/service/rule_loader.hpp"

#include "agw/foundation/gateway_logger.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>

namespace agw::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;

namespace {

/// Raised inside the parser for out-of-range values; converted to
/// InvalidArgument at the parseRules() boundary.
class RuleValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template <typename T>
void readIfPresent(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw RuleValidationError(message);
    }
}

BreakerConfig parseBreaker(const YAML::Node& node, const std::string& ruleId) {
    BreakerConfig config;
    readIfPresent(node, "path", config.path);
    require(!config.path.empty() && config.path.front() == '/',
            "rule '" + ruleId + "': breaker path must start with '/'");

    readIfPresent(node, "thread_core_size", config.threadCoreSize);
    require(config.threadCoreSize > 0,
            "rule '" + ruleId + "': thread_core_size must be positive for " + config.path);

    if (node["timeout_ms"]) {
        auto timeoutMs = node["timeout_ms"].as<int64_t>();
        require(timeoutMs > 0, "rule '" + ruleId + "': timeout_ms must be positive for " + config.path);
        config.timeout = std::chrono::milliseconds(timeoutMs);
    }

    if (const auto fallback = node["fallback"]) {
        int status = fallback["status"] ? fallback["status"].as<int>() : 503;
        require(status >= 100 && status <= 599,
                "rule '" + ruleId + "': fallback status out of range for " + config.path);
        if (fallback["body"]) {
            std::string contentType(kJsonContentType);
            readIfPresent(fallback, "content_type", contentType);
            config.fallbackResponse = GatewayResponse::fixed(
                status, fallback["body"].as<std::string>(), std::move(contentType));
        } else {
            config.fallbackResponse.status = status;
        }
    }

    readIfPresent(node, "request_volume_threshold", config.requestVolumeThreshold);
    readIfPresent(node, "error_threshold_percentage", config.errorThresholdPercentage);
    require(config.errorThresholdPercentage <= 100,
            "rule '" + ruleId + "': error_threshold_percentage above 100 for " + config.path);

    if (node["sleep_window_ms"]) {
        config.sleepWindow = std::chrono::milliseconds(node["sleep_window_ms"].as<int64_t>());
    }
    if (node["rolling_window_ms"]) {
        auto rollingMs = node["rolling_window_ms"].as<int64_t>();
        require(rollingMs > 0, "rule '" + ruleId + "': rolling_window_ms must be positive for " + config.path);
        config.rollingWindow = std::chrono::milliseconds(rollingMs);
    }
    readIfPresent(node, "half_open_success_threshold", config.halfOpenSuccessThreshold);
    return config;
}

std::shared_ptr<const Rule> parseRule(const YAML::Node& node) {
    require(node.IsMap(), "rule entry must be a map");

    auto rule = std::make_shared<Rule>();
    readIfPresent(node, "id", rule->id);
    require(!rule->id.empty(), "rule entry without id");

    readIfPresent(node, "name", rule->name);
    readIfPresent(node, "protocol", rule->protocol);
    readIfPresent(node, "service_id", rule->serviceId);
    readIfPresent(node, "prefix", rule->prefix);
    readIfPresent(node, "paths", rule->paths);
    readIfPresent(node, "order", rule->order);

    if (const auto retry = node["retry"]) {
        readIfPresent(retry, "times", rule->retryConfig.times);
    }

    if (const auto breakers = node["breakers"]) {
        require(breakers.IsSequence(), "rule '" + rule->id + "': breakers must be a list");
        std::unordered_set<std::string> seen;
        for (const auto& entry : breakers) {
            auto config = parseBreaker(entry, rule->id);
            require(seen.insert(config.path).second,
                    "rule '" + rule->id + "': duplicate breaker path " + config.path);
            rule->breakerConfigs.push_back(std::move(config));
        }
    }
    return rule;
}

}  // namespace

GatewayResult<RuleList> parseRules(const YAML::Node& rules) {
    if (!rules || rules.IsNull()) {
        return GatewayResult<RuleList>::ok({});
    }
    if (!rules.IsSequence()) {
        return GatewayResult<RuleList>::err(
            GatewayError(ErrorCode::ConfigTypeMismatch, "rules must be a list"));
    }

    RuleList parsed;
    try {
        for (const auto& node : rules) {
            parsed.push_back(parseRule(node));
        }
    } catch (const RuleValidationError& e) {
        return GatewayResult<RuleList>::err(GatewayError(ErrorCode::InvalidArgument, e.what()));
    } catch (const YAML::Exception& e) {
        return GatewayResult<RuleList>::err(GatewayError(ErrorCode::ConfigTypeMismatch, e.what()));
    }

    AGW_LOG_INFO(LogCategory::Config, "loaded " + std::to_string(parsed.size()) + " rule(s)");
    return GatewayResult<RuleList>::ok(std::move(parsed));
}

GatewayResult<RuleList> loadRules(const ConfigManager& config) {
    if (!config.hasKey("rules")) {
        return GatewayResult<RuleList>::ok({});
    }
    auto node = config.get<YAML::Node>("rules");
    if (node.hasError()) {
        return GatewayResult<RuleList>::err(node.error());
    }
    return parseRules(node.value());
}

}  // namespace agw::service
