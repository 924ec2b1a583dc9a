#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "agw/foundation/gateway_result.hpp"

namespace agw::foundation {

/// YAML configuration manager providing typed access to config values.
///
/// Maps are flattened into dotted keys ("gateway.port"); sequences and
/// scalars are leaves, so "rules" yields the whole rule list as a
/// YAML::Node.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing the current entries.
    GatewayResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    GatewayResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    GatewayResult<T> get(std::string_view key) const;

    /// Override a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
GatewayResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GatewayResult<T>::err(
            GatewayError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GatewayResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GatewayResult<T>::err(
            GatewayError(ErrorCode::ConfigTypeMismatch,
                         std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace agw::foundation
