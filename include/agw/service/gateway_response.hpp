#pragma once

/// @file gateway_response.hpp
/// @brief Response attached to an exchange and written back to the client.

#include "agw/service/http_types.hpp"
#include "agw/service/response_code.hpp"

#include <cstddef>
#include <string>

namespace agw::service {

/// Content type used by the standardized error bodies.
inline constexpr std::string_view kJsonContentType = "application/json;charset=utf-8";

/// Response produced by the routing core.
struct GatewayResponse {
    int status = 200;
    std::string contentType;
    HeaderList headers;
    std::string body;

    /// Gateway-generated responses carry their ResponseCode; upstream
    /// passthrough responses carry Success.
    ResponseCode code = ResponseCode::Success;

    [[nodiscard]] std::size_t bodyLength() const noexcept { return body.size(); }

    /// Standardized response: `{"code":<appCode>,"message":"<message>"}`.
    [[nodiscard]] static GatewayResponse fromCode(ResponseCode code);

    /// Passthrough of an upstream response (status, headers, body).
    /// Throws std::invalid_argument if the upstream status is not a valid
    /// HTTP status.
    [[nodiscard]] static GatewayResponse fromUpstream(const UpstreamResponse& upstream);

    /// Static response used as a breaker fallback.
    [[nodiscard]] static GatewayResponse fixed(int status, std::string body,
                                               std::string contentType = std::string(kJsonContentType));
};

}  // namespace agw::service
