#pragma once

/// @file gateway_logger.hpp
/// @brief GatewayLogger wrapping kcenon logging interfaces for structured,
///        category-filtered logging in the routing core.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "agw/foundation/gateway_result.hpp"

namespace agw::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per pipeline stage.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Wiring and lifecycle
    Router   = 1, ///< Route selection and terminal writes
    Upstream = 2, ///< Outbound dispatch and completion
    Breaker  = 3, ///< Isolation pools, trips and fallbacks
    Retry    = 4, ///< Retry decisions
    Config   = 5  ///< Configuration and rule loading
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Router", "Upstream", "Breaker", "Retry", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.requestId = exchange.request().uniqueId;
///   ctx.path = exchange.request().path;
///   ctx.extra["retry"] = "2";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Retry,
///                         "retrying upstream call", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> requestId;
    std::optional<std::string> ruleId;
    std::optional<std::string> path;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger on top of kcenon's GlobalLoggerRegistry.
///
/// Each category resolves to the named logger "agw.<Category>" and falls
/// back to the registry default. PIMPL keeps kcenon headers out of the
/// public API.
///
/// Default levels:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Router   | Info          |
/// | Upstream | Info          |
/// | Breaker  | Info          |
/// | Retry    | Debug         |
/// | Config   | Info          |
class GatewayLogger {
public:
    GatewayLogger();
    ~GatewayLogger();

    GatewayLogger(const GatewayLogger&) = delete;
    GatewayLogger& operator=(const GatewayLogger&) = delete;
    GatewayLogger(GatewayLogger&&) noexcept;
    GatewayLogger& operator=(GatewayLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by its context as `{key=val, ...}`.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the registry's default logger.
    GatewayResult<void> flush();

    /// Process-wide instance used by the AGW_LOG macros.
    static GatewayLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace agw::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name AGW_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define AGW_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef AGW_MIN_LOG_LEVEL
    #define AGW_MIN_LOG_LEVEL 0
#endif

#define AGW_LOG(level, cat, msg)                                                    \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= AGW_MIN_LOG_LEVEL &&                         \
            ::agw::foundation::GatewayLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::agw::foundation::GatewayLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define AGW_LOG_DEBUG(cat, msg) \
    AGW_LOG(::agw::foundation::LogLevel::Debug, (cat), (msg))

#define AGW_LOG_INFO(cat, msg) \
    AGW_LOG(::agw::foundation::LogLevel::Info, (cat), (msg))

#define AGW_LOG_WARN(cat, msg) \
    AGW_LOG(::agw::foundation::LogLevel::Warning, (cat), (msg))

#define AGW_LOG_ERROR(cat, msg) \
    AGW_LOG(::agw::foundation::LogLevel::Error, (cat), (msg))

/// @}
