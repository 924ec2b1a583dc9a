/// @file gateway_config.cpp
/// @brief GatewayConfig loading from ConfigManager.

#include "agw/service/gateway_config.hpp"

#include "agw/foundation/gateway_logger.hpp"

#include <cstdlib>
#include <limits>

namespace agw::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;

namespace {

/// Assign the value at @p key to @p out if present.
/// @return false (with @p error set) on a type mismatch.
template <typename T>
bool readOptional(const ConfigManager& config, std::string_view key, T& out, GatewayError& error) {
    if (!config.hasKey(key)) {
        return true;
    }
    auto value = config.get<T>(key);
    if (value.hasError()) {
        error = value.error();
        return false;
    }
    out = std::move(value).value();
    return true;
}

}  // namespace

GatewayResult<GatewayConfig> loadGatewayConfig(const ConfigManager& config) {
    GatewayConfig cfg;
    GatewayError error;

    int port = cfg.port;
    unsigned int bossThreads = cfg.bossThreads;
    unsigned int workerThreads = cfg.workerThreads;
    unsigned long long maxContentLength = cfg.maxContentLength;
    unsigned int completionThreads = cfg.completionThreads;

    bool ok = readOptional(config, "gateway.port", port, error) &&
              readOptional(config, "gateway.application_name", cfg.applicationName, error) &&
              readOptional(config, "gateway.registry_address", cfg.registryAddress, error) &&
              readOptional(config, "gateway.env", cfg.env, error) &&
              readOptional(config, "gateway.boss_threads", bossThreads, error) &&
              readOptional(config, "gateway.worker_threads", workerThreads, error) &&
              readOptional(config, "gateway.max_content_length", maxContentLength, error) &&
              readOptional(config, "gateway.when_complete", cfg.whenComplete, error) &&
              readOptional(config, "gateway.completion_threads", completionThreads, error) &&
              readOptional(config, "gateway.log_fallbacks", cfg.logFallbacks, error);
    if (!ok) {
        return GatewayResult<GatewayConfig>::err(std::move(error));
    }

    if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
        return GatewayResult<GatewayConfig>::err(
            GatewayError(ErrorCode::InvalidArgument,
                         "gateway.port out of range: " + std::to_string(port)));
    }
    cfg.port = static_cast<uint16_t>(port);
    cfg.bossThreads = bossThreads;
    cfg.workerThreads = workerThreads;
    cfg.maxContentLength = static_cast<std::size_t>(maxContentLength);
    cfg.completionThreads = completionThreads;

    AGW_LOG_INFO(LogCategory::Config, describeGatewayConfig(cfg));
    return GatewayResult<GatewayConfig>::ok(std::move(cfg));
}

RouterOptions toRouterOptions(const GatewayConfig& config) {
    RouterOptions options;
    options.completionMode = config.whenComplete ? CompletionMode::Inline : CompletionMode::Pooled;
    options.completionThreads = config.completionThreads == 0 ? 1 : config.completionThreads;
    options.logFallbacks = config.logFallbacks;
    return options;
}

std::string describeGatewayConfig(const GatewayConfig& config) {
    return config.applicationName + " env=" + config.env +
           " port=" + std::to_string(config.port) +
           " registry=" + config.registryAddress +
           " boss_threads=" + std::to_string(config.bossThreads) +
           " worker_threads=" + std::to_string(config.workerThreads) +
           " max_content_length=" + std::to_string(config.maxContentLength) +
           " completion=" + (config.whenComplete ? "inline" : "pooled");
}

GatewayResult<void> loadConfig(ConfigManager& config,
                               const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    // Environment variable override for 12-factor compliance.
    const char* envPath = std::getenv("AGW_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    AGW_LOG_INFO(LogCategory::Config, "loading configuration from " + configPath.string());
    return config.load(configPath);
}

}  // namespace agw::service
