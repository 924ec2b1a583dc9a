#pragma once

/// @file gateway_config.hpp
/// @brief Process-level gateway settings and their mapping to RouterOptions.

#include "agw/foundation/config_manager.hpp"
#include "agw/foundation/gateway_result.hpp"
#include "agw/service/router.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>

namespace agw::service {

/// Gateway process configuration (`gateway.*` keys).
///
/// Example YAML:
/// @code
///   gateway:
///     port: 8888
///     application_name: api-gateway
///     registry_address: 127.0.0.1:8848
///     env: dev
///     boss_threads: 1
///     worker_threads: 8
///     max_content_length: 67108864
///     when_complete: true
///     completion_threads: 4
///     log_fallbacks: true
/// @endcode
struct GatewayConfig {
    // -- Process settings -------------------------------------------------------
    // Validated here and passed through to the embedding server process
    // (listener, registry client, event loops); the router does not use them.

    uint16_t port = 8888;
    std::string applicationName = "api-gateway";
    std::string registryAddress = "127.0.0.1:8848";
    std::string env = "dev";
    uint32_t bossThreads = 1;
    uint32_t workerThreads = std::thread::hardware_concurrency();
    std::size_t maxContentLength = 64 * 1024 * 1024;

    // -- Router settings --------------------------------------------------------

    /// true resolves completions inline, false on the completion pool.
    bool whenComplete = true;
    uint32_t completionThreads = std::thread::hardware_concurrency();
    bool logFallbacks = true;
};

/// Read the `gateway.*` keys, keeping defaults for absent ones.
/// @return The config, or ConfigTypeMismatch / InvalidArgument.
[[nodiscard]] foundation::GatewayResult<GatewayConfig> loadGatewayConfig(
    const foundation::ConfigManager& config);

[[nodiscard]] RouterOptions toRouterOptions(const GatewayConfig& config);

/// One-line summary of @p config, logged once it has been loaded.
[[nodiscard]] std::string describeGatewayConfig(const GatewayConfig& config);

/// Load @p defaultPath into @p config, or the file named by the
/// AGW_CONFIG_PATH environment variable when set.
foundation::GatewayResult<void> loadConfig(foundation::ConfigManager& config,
                                           const std::filesystem::path& defaultPath);

}  // namespace agw::service
