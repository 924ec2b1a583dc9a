#pragma once

/// @file http_types.hpp
/// @brief Plain HTTP message types exchanged with the upstream client.

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace agw::service {

/// Ordered header list; duplicates are allowed and preserved.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// Outbound request handed to the asynchronous HTTP client.
struct UpstreamRequest {
    std::string method = "GET";

    /// Absolute URL: scheme://host/path[?query].
    std::string url;

    HeaderList headers;

    std::string body;

    /// Client-side timeout; zero leaves it to the client's default.
    std::chrono::milliseconds timeout{0};

    /// Request id propagated for tracing.
    std::string requestId;
};

/// Raw response received from the upstream service.
struct UpstreamResponse {
    int status = 200;
    HeaderList headers;
    std::string body;
};

/// Case-insensitive header lookup; returns an empty view when absent.
[[nodiscard]] std::string_view findHeader(const HeaderList& headers, std::string_view name);

}  // namespace agw::service
