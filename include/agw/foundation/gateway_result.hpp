#pragma once

/// @file gateway_result.hpp
/// @brief GatewayResult<T> type alias used across the gateway core.

#include "agw/core/result.hpp"
#include "agw/foundation/gateway_error.hpp"

namespace agw::foundation {

/// Result type specialized with GatewayError.
///
/// Example:
/// @code
///   GatewayResult<std::chrono::milliseconds> parseTimeout(int ms) {
///       if (ms <= 0) {
///           return GatewayResult<std::chrono::milliseconds>::err(
///               GatewayError(ErrorCode::InvalidArgument, "timeout must be positive"));
///       }
///       return GatewayResult<std::chrono::milliseconds>::ok(std::chrono::milliseconds(ms));
///   }
/// @endcode
template <typename T>
using GatewayResult = agw::Result<T, GatewayError>;

}  // namespace agw::foundation
