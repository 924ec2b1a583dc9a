/// @file access_log.cpp
/// @brief Access-log record construction and the registry-backed sink.

#include "agw/service/access_log.hpp"

#include "agw/service/exchange_context.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <sstream>

namespace agw::service {

namespace kci = kcenon::common::interfaces;

AccessLogRecord makeAccessLogRecord(const ExchangeContext& ctx,
                                    std::chrono::steady_clock::time_point now) {
    const auto& request = ctx.request();

    AccessLogRecord entry;
    entry.elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - request.beginTime).count();
    entry.clientIp = request.clientIp;
    entry.requestId = request.uniqueId;
    entry.method = request.method;
    entry.path = request.path;

    auto response = ctx.response();
    if (response.has_value()) {
        entry.statusCode = response->status;
        entry.bodyLength = response->bodyLength();
    }
    return entry;
}

std::string formatAccessLog(const AccessLogRecord& record) {
    std::ostringstream oss;
    oss << record.elapsedMs << ' '
        << record.clientIp << ' '
        << record.requestId << ' '
        << record.method << ' '
        << record.path << ' '
        << record.statusCode << ' '
        << record.bodyLength;
    return oss.str();
}

RegistryAccessLogSink::RegistryAccessLogSink(std::string loggerName)
    : loggerName_(std::move(loggerName)) {}

void RegistryAccessLogSink::record(const AccessLogRecord& entry) {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_logger(loggerName_);
    if (logger == kci::GlobalLoggerRegistry::null_logger()) {
        logger = registry.get_default_logger();
    }
    logger->log(kci::log_level::info, formatAccessLog(entry));
}

}  // namespace agw::service
