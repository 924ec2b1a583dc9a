#pragma once

/// @file upstream_client.hpp
/// @brief Boundary to the asynchronous HTTP client.

#include "agw/service/upstream_future.hpp"

namespace agw::service {

/// Asynchronous HTTP client used for outbound calls.
///
/// Implementations return immediately with a pending future and settle it
/// from their I/O threads. Failures must be classified into
/// UpstreamErrorKind (at least Timeout and Connection). Implementations
/// should register an abort hook with UpstreamPromise::onCancel() so a
/// breaker timeout interrupts the in-flight I/O.
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    [[nodiscard]] virtual UpstreamFuture submit(const UpstreamRequest& request) = 0;
};

}  // namespace agw::service
