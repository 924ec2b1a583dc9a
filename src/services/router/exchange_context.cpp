/// @file exchange_context.cpp
/// @brief ExchangeContext implementation.

#include "agw/service/exchange_context.hpp"

#include <stdexcept>

namespace agw::service {

std::string GatewayRequest::url() const {
    std::string out;
    out.reserve(scheme.size() + host.size() + path.size() + query.size() + 4);
    out += scheme;
    out += "://";
    out += host;
    if (path.empty() || path.front() != '/') {
        out += '/';
    }
    out += path;
    if (!query.empty()) {
        out += '?';
        out += query;
    }
    return out;
}

ExchangeContext::ExchangeContext(std::shared_ptr<const Rule> rule, GatewayRequest request)
    : rule_(std::move(rule)), request_(std::move(request)) {
    if (!rule_) {
        throw std::invalid_argument("ExchangeContext requires a routing rule");
    }
}

UpstreamRequest ExchangeContext::outboundRequest() {
    std::lock_guard lock(mutex_);
    if (!outbound_) {
        UpstreamRequest out;
        out.method = request_.method;
        out.url = request_.url();
        out.headers = request_.headers;
        if (!request_.contentType.empty() && findHeader(out.headers, "Content-Type").empty()) {
            out.headers.emplace_back("Content-Type", request_.contentType);
        }
        out.body = request_.body;
        out.timeout = request_.timeout;
        out.requestId = request_.uniqueId;
        outbound_ = std::move(out);
    }
    return *outbound_;
}

void ExchangeContext::releaseRequest() {
    std::lock_guard lock(mutex_);
    if (released_) {
        return;
    }
    request_.body.clear();
    request_.body.shrink_to_fit();
    released_ = true;
}

bool ExchangeContext::requestReleased() const {
    std::lock_guard lock(mutex_);
    return released_;
}

bool ExchangeContext::markWritten() noexcept {
    bool expected = false;
    return written_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

bool ExchangeContext::isWritten() const noexcept {
    return written_.load(std::memory_order_acquire);
}

bool ExchangeContext::setResponse(GatewayResponse response) {
    std::lock_guard lock(mutex_);
    if (response_.has_value()) {
        return false;
    }
    response_ = std::move(response);
    return true;
}

std::optional<GatewayResponse> ExchangeContext::response() const {
    std::lock_guard lock(mutex_);
    return response_;
}

void ExchangeContext::setFailure(foundation::GatewayError failure) {
    std::lock_guard lock(mutex_);
    failure_ = std::move(failure);
}

std::optional<foundation::GatewayError> ExchangeContext::failure() const {
    std::lock_guard lock(mutex_);
    return failure_;
}

uint32_t ExchangeContext::currentRetryTimes() const noexcept {
    return retryTimes_.load(std::memory_order_acquire);
}

uint32_t ExchangeContext::incrementRetryTimes() noexcept {
    return retryTimes_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

}  // namespace agw::service
