/// @file gateway_config_test.cpp
/// @brief Unit tests for GatewayConfig loading and YAML rule parsing.

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <yaml-cpp/yaml.h>

#include "agw/foundation/config_manager.hpp"
#include "agw/foundation/error_code.hpp"
#include "agw/service/gateway_config.hpp"
#include "agw/service/rule_loader.hpp"

using namespace agw::service;
using agw::foundation::ConfigManager;
using agw::foundation::ErrorCode;

// ===========================================================================
// GatewayConfig
// ===========================================================================

TEST(GatewayConfigTest, DefaultsWhenKeysAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("other: 1").hasValue());

    auto result = loadGatewayConfig(config);
    ASSERT_TRUE(result.hasValue());
    const auto& cfg = result.value();
    EXPECT_EQ(cfg.port, 8888);
    EXPECT_EQ(cfg.applicationName, "api-gateway");
    EXPECT_EQ(cfg.registryAddress, "127.0.0.1:8848");
    EXPECT_EQ(cfg.env, "dev");
    EXPECT_EQ(cfg.bossThreads, 1u);
    EXPECT_EQ(cfg.maxContentLength, 64u * 1024u * 1024u);
    EXPECT_TRUE(cfg.whenComplete);
    EXPECT_TRUE(cfg.logFallbacks);
}

TEST(GatewayConfigTest, ReadsGatewayKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
gateway:
  port: 9000
  application_name: edge
  registry_address: 10.0.0.5:8848
  env: prod
  boss_threads: 2
  worker_threads: 16
  max_content_length: 1048576
  when_complete: false
  completion_threads: 3
  log_fallbacks: false
)").hasValue());

    auto result = loadGatewayConfig(config);
    ASSERT_TRUE(result.hasValue());
    const auto& cfg = result.value();
    EXPECT_EQ(cfg.port, 9000);
    EXPECT_EQ(cfg.applicationName, "edge");
    EXPECT_EQ(cfg.registryAddress, "10.0.0.5:8848");
    EXPECT_EQ(cfg.env, "prod");
    EXPECT_EQ(cfg.bossThreads, 2u);
    EXPECT_EQ(cfg.workerThreads, 16u);
    EXPECT_EQ(cfg.maxContentLength, 1048576u);
    EXPECT_FALSE(cfg.whenComplete);
    EXPECT_EQ(cfg.completionThreads, 3u);
    EXPECT_FALSE(cfg.logFallbacks);

    auto options = toRouterOptions(cfg);
    EXPECT_EQ(options.completionMode, CompletionMode::Pooled);
    EXPECT_EQ(options.completionThreads, 3u);
    EXPECT_FALSE(options.logFallbacks);

    EXPECT_EQ(describeGatewayConfig(cfg),
              "edge env=prod port=9000 registry=10.0.0.5:8848 boss_threads=2 "
              "worker_threads=16 max_content_length=1048576 completion=pooled");
}

TEST(GatewayConfigTest, InlineModeWhenComplete) {
    GatewayConfig cfg;
    cfg.completionThreads = 0;
    auto options = toRouterOptions(cfg);
    EXPECT_EQ(options.completionMode, CompletionMode::Inline);
    EXPECT_EQ(options.completionThreads, 1u);
    EXPECT_TRUE(options.logFallbacks);
}

TEST(GatewayConfigTest, TypeMismatchIsReported) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("gateway:\n  port: not-a-port\n").hasValue());

    auto result = loadGatewayConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(GatewayConfigTest, PortOutOfRange) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("gateway:\n  port: 70000\n").hasValue());

    auto result = loadGatewayConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(GatewayConfigTest, EnvironmentOverridesConfigPath) {
    auto dir = std::filesystem::temp_directory_path() / "agw_test_env_override";
    std::filesystem::create_directories(dir);
    auto path = dir / "override.yaml";
    {
        std::ofstream ofs(path);
        ofs << "gateway:\n  port: 7777\n";
    }

    ::setenv("AGW_CONFIG_PATH", path.c_str(), 1);
    ConfigManager config;
    auto loaded = loadConfig(config, "/nonexistent/default.yaml");
    ::unsetenv("AGW_CONFIG_PATH");

    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(config.get<int>("gateway.port").value(), 7777);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(GatewayConfigTest, MissingDefaultFileFails) {
    ::unsetenv("AGW_CONFIG_PATH");
    ConfigManager config;
    auto loaded = loadConfig(config, "/nonexistent/default.yaml");
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigLoadFailed);
}

// ===========================================================================
// Rule loader
// ===========================================================================

TEST(RuleLoaderTest, ParsesRulesWithBreakersAndRetry) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
rules:
  - id: orders
    name: Orders
    service_id: order-service
    prefix: /orders
    paths: [/orders/list, /orders/detail]
    order: 2
    retry:
      times: 3
    breakers:
      - path: /orders/list
        thread_core_size: 4
        timeout_ms: 250
        fallback:
          status: 429
          body: '{"code":10008,"message":"slow down"}'
        request_volume_threshold: 10
        error_threshold_percentage: 25
        sleep_window_ms: 1000
        rolling_window_ms: 2000
        half_open_success_threshold: 2
      - path: /orders/detail
  - id: users
)").hasValue());

    auto result = loadRules(config);
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    const auto& rules = result.value();
    ASSERT_EQ(rules.size(), 2u);

    const auto& orders = *rules[0];
    EXPECT_EQ(orders.id, "orders");
    EXPECT_EQ(orders.name, "Orders");
    EXPECT_EQ(orders.protocol, "http");
    EXPECT_EQ(orders.serviceId, "order-service");
    EXPECT_EQ(orders.prefix, "/orders");
    ASSERT_EQ(orders.paths.size(), 2u);
    EXPECT_EQ(orders.order, 2);
    EXPECT_EQ(orders.retryConfig.times, 3u);
    ASSERT_EQ(orders.breakerConfigs.size(), 2u);

    const auto* list = orders.findBreakerConfig("/orders/list");
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->threadCoreSize, 4u);
    EXPECT_EQ(list->timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(list->fallbackResponse.status, 429);
    EXPECT_EQ(list->fallbackResponse.body, R"({"code":10008,"message":"slow down"})");
    EXPECT_EQ(list->requestVolumeThreshold, 10u);
    EXPECT_EQ(list->errorThresholdPercentage, 25u);
    EXPECT_EQ(list->sleepWindow, std::chrono::milliseconds(1000));
    EXPECT_EQ(list->rollingWindow, std::chrono::milliseconds(2000));
    EXPECT_EQ(list->halfOpenSuccessThreshold, 2u);

    const auto* detail = orders.findBreakerConfig("/orders/detail");
    ASSERT_NE(detail, nullptr);
    EXPECT_EQ(detail->threadCoreSize, 1u);
    EXPECT_EQ(detail->fallbackResponse.status, 503);

    EXPECT_EQ(rules[1]->id, "users");
    EXPECT_EQ(rules[1]->retryConfig.times, 0u);
    EXPECT_TRUE(rules[1]->breakerConfigs.empty());
}

TEST(RuleLoaderTest, MissingRulesIsEmpty) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("gateway:\n  port: 8888\n").hasValue());
    auto result = loadRules(config);
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().empty());
}

TEST(RuleLoaderTest, RulesMustBeList) {
    auto result = parseRules(YAML::Load("id: orders"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(RuleLoaderTest, RuleWithoutIdIsInvalid) {
    auto result = parseRules(YAML::Load("- name: nameless"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(RuleLoaderTest, BreakerPathMustBeAbsolute) {
    auto result = parseRules(YAML::Load(R"(
- id: a
  breakers:
    - path: relative
)"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(RuleLoaderTest, DuplicateBreakerPathRejected) {
    auto result = parseRules(YAML::Load(R"(
- id: a
  breakers:
    - path: /x
    - path: /x
)"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(RuleLoaderTest, InvalidTimeoutRejected) {
    auto result = parseRules(YAML::Load(R"(
- id: a
  breakers:
    - path: /x
      timeout_ms: 0
)"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(RuleLoaderTest, MalformedValueIsTypeMismatch) {
    auto result = parseRules(YAML::Load(R"(
- id: a
  retry:
    times: many
)"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}
