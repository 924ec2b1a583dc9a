#pragma once

/// @file upstream_dispatcher.hpp
/// @brief Submits an exchange's outbound request and routes the completion.

#include "agw/service/upstream_future.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>

namespace agw::foundation {
class TaskExecutor;
}  // namespace agw::foundation

namespace agw::service {

class ExchangeContext;
class UpstreamClient;
struct BreakerConfig;
struct RouterCounters;

/// Thread on which upstream completions are resolved.
enum class CompletionMode : uint8_t {
    /// On the HTTP client's I/O completion thread.
    Inline,
    /// Posted onto a dedicated completion executor.
    Pooled
};

constexpr std::string_view completionModeName(CompletionMode mode) {
    switch (mode) {
        case CompletionMode::Inline: return "inline";
        case CompletionMode::Pooled: return "pooled";
    }
    return "unknown";
}

/// Outbound dispatch stage.
///
/// Each dispatch() submits one attempt and arranges for the completion
/// handler to run exactly once with that attempt's outcome, either inline
/// or on the completion executor depending on the mode.
class UpstreamDispatcher {
public:
    using CompletionHandler = std::function<void(const UpstreamRequest&,
                                                 const UpstreamOutcome&,
                                                 const std::shared_ptr<ExchangeContext>&,
                                                 const BreakerConfig*)>;

    /// @param executor Required in Pooled mode, ignored in Inline mode.
    UpstreamDispatcher(std::shared_ptr<UpstreamClient> client,
                       CompletionMode mode,
                       std::shared_ptr<foundation::TaskExecutor> executor,
                       std::shared_ptr<RouterCounters> counters,
                       CompletionHandler onComplete);

    /// Submit one attempt for @p ctx.
    ///
    /// Never throws: a client that throws on submit yields a failed
    /// future with a Connection failure.
    ///
    /// @param breaker Breaker config governing this attempt, or nullptr.
    /// @return The in-flight future of this attempt.
    UpstreamFuture dispatch(const std::shared_ptr<ExchangeContext>& ctx,
                            const BreakerConfig* breaker);

    [[nodiscard]] CompletionMode mode() const noexcept { return mode_; }

private:
    void deliver(const UpstreamRequest& request,
                 const UpstreamOutcome& outcome,
                 const std::shared_ptr<ExchangeContext>& ctx,
                 const BreakerConfig* breaker);

    std::shared_ptr<UpstreamClient> client_;
    CompletionMode mode_;
    std::shared_ptr<foundation::TaskExecutor> executor_;
    std::shared_ptr<RouterCounters> counters_;
    CompletionHandler onComplete_;
};

}  // namespace agw::service
