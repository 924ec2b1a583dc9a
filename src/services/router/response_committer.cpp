/// @file response_committer.cpp
/// @brief ResponseCommitter implementation.

#include "agw/service/response_committer.hpp"

#include "agw/foundation/gateway_logger.hpp"
#include "agw/service/access_log.hpp"
#include "agw/service/exchange_context.hpp"
#include "agw/service/response_writer.hpp"
#include "agw/service/router_stats.hpp"

#include <exception>
#include <stdexcept>

namespace agw::service {

using foundation::GatewayLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

ResponseCommitter::ResponseCommitter(std::shared_ptr<ResponseWriter> writer,
                                     std::shared_ptr<AccessLogSink> accessLog,
                                     std::shared_ptr<RouterCounters> counters)
    : writer_(std::move(writer)),
      accessLog_(std::move(accessLog)),
      counters_(std::move(counters)) {
    if (!writer_ || !counters_) {
        throw std::invalid_argument("ResponseCommitter requires a writer and counters");
    }
}

bool ResponseCommitter::commit(ExchangeContext& ctx,
                               GatewayResponse response,
                               std::optional<foundation::GatewayError> failure,
                               bool emitAccessLog) {
    if (!ctx.markWritten()) {
        counters_->duplicateCompletions.fetch_add(1, std::memory_order_relaxed);
        AGW_LOG_DEBUG(LogCategory::Router,
                      "dropping late completion for " + std::string(ctx.uniqueId()));
        return false;
    }

    ctx.setResponse(std::move(response));
    if (failure.has_value()) {
        ctx.setFailure(std::move(*failure));
    }

    try {
        writer_->write(ctx);
    } catch (const std::exception& e) {
        LogContext logCtx;
        logCtx.requestId = ctx.request().uniqueId;
        logCtx.ruleId = ctx.rule().id;
        logCtx.path = ctx.request().path;
        GatewayLogger::instance().logWithContext(
            LogLevel::Error, LogCategory::Router,
            std::string("response write failed: ") + e.what(), logCtx);
    }

    if (emitAccessLog && accessLog_) {
        accessLog_->record(makeAccessLogRecord(ctx));
    }

    counters_->responsesWritten.fetch_add(1, std::memory_order_relaxed);
    return true;
}

}  // namespace agw::service
