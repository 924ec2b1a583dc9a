#pragma once

/// @file upstream_future.hpp
/// @brief Awaitable, cancellable handle for one in-flight upstream call.

#include "agw/core/result.hpp"
#include "agw/service/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace agw::service {

/// Classification of a failed upstream call.
enum class UpstreamErrorKind : uint8_t {
    /// The client gave up waiting for the upstream.
    Timeout,
    /// Connect / read / write failure at the I/O level.
    Connection,
    /// The call was cancelled by the gateway (breaker timeout).
    Cancelled,
    /// Anything else (protocol error, client bug, ...).
    Other
};

constexpr std::string_view upstreamErrorKindName(UpstreamErrorKind kind) {
    switch (kind) {
        case UpstreamErrorKind::Timeout:    return "timeout";
        case UpstreamErrorKind::Connection: return "connection";
        case UpstreamErrorKind::Cancelled:  return "cancelled";
        case UpstreamErrorKind::Other:      return "other";
    }
    return "unknown";
}

/// Transient failures that the retry controller may re-attempt.
constexpr bool isRetryable(UpstreamErrorKind kind) {
    return kind == UpstreamErrorKind::Timeout || kind == UpstreamErrorKind::Connection;
}

struct UpstreamFailure {
    UpstreamErrorKind kind = UpstreamErrorKind::Other;
    std::string message;
};

/// Either the upstream response or the reason the call failed.
using UpstreamOutcome = agw::Result<UpstreamResponse, UpstreamFailure>;

namespace detail {
struct UpstreamCallState;
}  // namespace detail

/// Shared handle to the result of one upstream call.
///
/// The first completion wins: later complete / fail / cancel calls are
/// ignored. Continuations registered after completion run immediately on
/// the registering thread; otherwise they run on the completing thread.
///
/// Example:
/// @code
///   auto future = client.submit(request);
///   future.whenComplete([](const UpstreamOutcome& outcome) { ... });
///
///   // Inside a breaker isolation thread only:
///   if (!future.waitFor(std::chrono::milliseconds(200))) {
///       future.cancel("breaker timeout");
///   }
/// @endcode
class UpstreamFuture {
public:
    using Continuation = std::function<void(const UpstreamOutcome&)>;

    /// An invalid future with no shared state.
    UpstreamFuture() = default;

    /// An already-completed successful future.
    [[nodiscard]] static UpstreamFuture completed(UpstreamResponse response);

    /// An already-completed failed future.
    [[nodiscard]] static UpstreamFuture failed(UpstreamFailure failure);

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

    [[nodiscard]] bool isReady() const;

    /// Block until completion or until @p timeout elapses.
    /// @return true if the future completed.
    bool waitFor(std::chrono::milliseconds timeout) const;

    /// Block until completion.
    void wait() const;

    /// The settled outcome. Throws std::logic_error when not yet ready.
    [[nodiscard]] const UpstreamOutcome& outcome() const;

    /// Register a continuation invoked exactly once with the outcome.
    void whenComplete(Continuation continuation) const;

    /// Complete the call with a Cancelled failure and fire the client's
    /// abort hook.
    /// @return true if this call settled the future.
    bool cancel(std::string reason = "cancelled") const;

private:
    friend class UpstreamPromise;

    explicit UpstreamFuture(std::shared_ptr<detail::UpstreamCallState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::UpstreamCallState> state_;
};

/// Producer side of an UpstreamFuture, held by the HTTP client.
class UpstreamPromise {
public:
    UpstreamPromise();

    [[nodiscard]] UpstreamFuture future() const;

    /// @return true if this call settled the future.
    bool complete(UpstreamResponse response) const;

    /// @return true if this call settled the future.
    bool fail(UpstreamFailure failure) const;

    /// Register the hook used to abort the underlying I/O on cancel().
    /// Runs immediately if the call was already cancelled.
    void onCancel(std::function<void()> hook) const;

private:
    std::shared_ptr<detail::UpstreamCallState> state_;
};

}  // namespace agw::service
