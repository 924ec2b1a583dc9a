#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the gateway routing core.

#include <cstdint>
#include <string_view>

namespace agw::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the error source
/// can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    InternalError = 0x0004,

    // Upstream (0x0100 - 0x01FF)
    UpstreamError = 0x0100,
    UpstreamTimeout = 0x0101,
    UpstreamConnectFailed = 0x0102,
    UpstreamResponseError = 0x0103,
    UpstreamCancelled = 0x0104,

    // Routing (0x0200 - 0x02FF)
    RoutingError = 0x0200,
    RuleNotFound = 0x0201,
    RetryExhausted = 0x0202,

    // Breaker (0x0300 - 0x03FF)
    BreakerError = 0x0300,
    BreakerOpen = 0x0301,
    BreakerTimeout = 0x0302,
    IsolationRejected = 0x0303,
    BreakerExecutionFailed = 0x0304,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    TaskScheduleFailed = 0x0701,
    ExecutorStopped = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Upstream";
        case 0x0200: return "Routing";
        case 0x0300: return "Breaker";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace agw::foundation
