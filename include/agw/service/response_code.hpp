#pragma once

/// @file response_code.hpp
/// @brief Standardized gateway response codes.

#include <cstdint>
#include <string_view>

namespace agw::service {

/// Gateway-level outcome codes surfaced to clients.
enum class ResponseCode : uint8_t {
    Success,
    InternalError,
    ServiceUnavailable,
    RequestTimeout,
    HttpResponseError
};

/// HTTP status, machine-checkable application code and message for a
/// ResponseCode.
struct ResponseCodeInfo {
    int httpStatus;
    int appCode;
    std::string_view message;
};

constexpr ResponseCodeInfo describe(ResponseCode code) {
    switch (code) {
        case ResponseCode::Success:
            return {200, 0, "success"};
        case ResponseCode::InternalError:
            return {500, 10000, "internal error"};
        case ResponseCode::ServiceUnavailable:
            return {503, 10008, "service unavailable"};
        case ResponseCode::RequestTimeout:
            return {504, 10006, "request timeout"};
        case ResponseCode::HttpResponseError:
            return {502, 10007, "upstream response error"};
    }
    return {500, 10000, "internal error"};
}

}  // namespace agw::service
