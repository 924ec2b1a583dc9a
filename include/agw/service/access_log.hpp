#pragma once

/// @file access_log.hpp
/// @brief Access-log record emitted once per logical request.
///
/// The line layout is consumed by downstream log parsers and must keep its
/// field order:
/// @code
///   <elapsed-ms> <client-ip> <request-id> <method> <path> <status-code> <body-length>
/// @endcode

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace agw::service {

class ExchangeContext;

struct AccessLogRecord {
    int64_t elapsedMs = 0;
    std::string clientIp;
    std::string requestId;
    std::string method;
    std::string path;
    int statusCode = 0;
    std::size_t bodyLength = 0;
};

/// Build the record for a context whose response has been attached.
[[nodiscard]] AccessLogRecord makeAccessLogRecord(
    const ExchangeContext& ctx,
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

/// Render the record as a single space-separated line.
[[nodiscard]] std::string formatAccessLog(const AccessLogRecord& record);

/// Destination for access-log records.
class AccessLogSink {
public:
    virtual ~AccessLogSink() = default;

    virtual void record(const AccessLogRecord& entry) = 0;
};

/// Sink writing each line at info level to a named kcenon logger
/// (default "agw.access"), falling back to the registry default logger.
class RegistryAccessLogSink : public AccessLogSink {
public:
    explicit RegistryAccessLogSink(std::string loggerName = "agw.access");

    void record(const AccessLogRecord& entry) override;

private:
    std::string loggerName_;
};

}  // namespace agw::service
