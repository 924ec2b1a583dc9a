#pragma once

/// @file response_committer.hpp
/// @brief Exactly-once terminal write of an exchange's response.

#include "agw/foundation/gateway_error.hpp"
#include "agw/service/gateway_response.hpp"

#include <memory>
#include <optional>

namespace agw::service {

class AccessLogSink;
class ExchangeContext;
class ResponseWriter;
struct RouterCounters;

/// Commits terminal responses: claims the written flag, attaches the
/// response, hands the exchange to the ResponseWriter and emits the
/// access-log record.
///
/// Every path that can end a request (completion resolver, breaker
/// fallback) goes through commit(), so the write and the access log
/// happen at most once per exchange no matter how many completions race.
class ResponseCommitter {
public:
    ResponseCommitter(std::shared_ptr<ResponseWriter> writer,
                      std::shared_ptr<AccessLogSink> accessLog,
                      std::shared_ptr<RouterCounters> counters);

    /// @param failure       Error recorded on the exchange alongside the response.
    /// @param emitAccessLog Whether to record the access-log line.
    /// @return true if this call performed the terminal write; false if
    ///         the exchange was already written.
    bool commit(ExchangeContext& ctx,
                GatewayResponse response,
                std::optional<foundation::GatewayError> failure = std::nullopt,
                bool emitAccessLog = true);

private:
    std::shared_ptr<ResponseWriter> writer_;
    std::shared_ptr<AccessLogSink> accessLog_;
    std::shared_ptr<RouterCounters> counters_;
};

}  // namespace agw::service
