/// @file gateway_response.cpp
/// @brief GatewayResponse builders.

#include "agw/service/gateway_response.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <string_view>

namespace agw::service {

namespace {

void appendJsonString(std::string& out, std::string_view value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
}

// Framing headers are recomputed by the response serializer.
bool isFramingHeader(std::string_view name) {
    auto lower = std::string(name);
    for (auto& ch : lower) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return lower == "content-length" || lower == "transfer-encoding" || lower == "connection";
}

}  // namespace

GatewayResponse GatewayResponse::fromCode(ResponseCode code) {
    auto info = describe(code);

    GatewayResponse response;
    response.status = info.httpStatus;
    response.code = code;
    response.contentType = std::string(kJsonContentType);
    response.body = "{\"code\":" + std::to_string(info.appCode) + ",\"message\":";
    appendJsonString(response.body, info.message);
    response.body += '}';
    return response;
}

GatewayResponse GatewayResponse::fromUpstream(const UpstreamResponse& upstream) {
    if (upstream.status < 100 || upstream.status > 599) {
        throw std::invalid_argument("invalid upstream status " + std::to_string(upstream.status));
    }

    GatewayResponse response;
    response.status = upstream.status;
    response.code = ResponseCode::Success;
    response.contentType = std::string(findHeader(upstream.headers, "Content-Type"));
    for (const auto& header : upstream.headers) {
        if (!isFramingHeader(header.first)) {
            response.headers.push_back(header);
        }
    }
    response.body = upstream.body;
    return response;
}

GatewayResponse GatewayResponse::fixed(int status, std::string body, std::string contentType) {
    GatewayResponse response;
    response.status = status;
    response.code = ResponseCode::ServiceUnavailable;
    response.contentType = std::move(contentType);
    response.body = std::move(body);
    return response;
}

}  // namespace agw::service
