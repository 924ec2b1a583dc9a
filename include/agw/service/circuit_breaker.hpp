#pragma once

/// @file circuit_breaker.hpp
/// @brief Per-path circuit breaker driven by a rolling error-rate window.
///
/// Implements the circuit breaker pattern (Closed -> Open -> HalfOpen).
/// The circuit opens when, within the rolling window, at least
/// requestVolumeThreshold calls were recorded and the failure share
/// reached errorThresholdPercentage.

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace agw::service {

struct BreakerConfig;

/// Configuration for a ServiceCircuitBreaker instance.
struct CircuitBreakerConfig {
    /// Minimum calls in the rolling window before the error rate is evaluated.
    uint32_t requestVolumeThreshold = 20;

    /// Failure percentage (0-100) at or above which the circuit opens.
    uint32_t errorThresholdPercentage = 50;

    /// Duration the circuit stays open before transitioning to half-open.
    std::chrono::milliseconds sleepWindow{5000};

    /// Length of the rolling statistics window.
    std::chrono::milliseconds rollingWindow{10000};

    /// Number of buckets the rolling window is divided into.
    uint32_t bucketCount = 10;

    /// Number of consecutive successes in half-open to close the circuit.
    uint32_t successThreshold = 1;

    /// Human-readable name for logging.
    std::string name = "default";

    /// Breaker settings derived from a per-path BreakerConfig.
    [[nodiscard]] static CircuitBreakerConfig from(const BreakerConfig& config);
};

/// Circuit breaker state machine guarding one request path.
///
/// Usage:
/// @code
///   ServiceCircuitBreaker cb(CircuitBreakerConfig{.name = "/orders"});
///   if (cb.allowRequest()) {
///       if (callSucceeded) {
///           cb.recordSuccess();
///       } else {
///           cb.recordFailure();
///       }
///   } else {
///       // Circuit is open, serve the fallback
///   }
/// @endcode
///
/// Thread-safe: all state transitions use a mutex.
class ServiceCircuitBreaker {
public:
    /// Circuit breaker states.
    enum class State : uint8_t {
        Closed,   ///< Normal operation; calls pass through.
        Open,     ///< Error threshold reached; calls are rejected.
        HalfOpen  ///< Recovery probe; one trial call admitted at a time.
    };

    explicit ServiceCircuitBreaker(CircuitBreakerConfig config = {});

    /// Check whether a request is allowed through the circuit.
    ///
    /// If the circuit is Open, checks whether the sleep window has
    /// elapsed and transitions to HalfOpen if so. In HalfOpen only one
    /// trial call is admitted until it records its result.
    ///
    /// @return true if the call should proceed, false if rejected.
    [[nodiscard]] bool allowRequest();

    /// Record a successful call. May close a half-open circuit.
    void recordSuccess();

    /// Record a failed call. May open the circuit.
    void recordFailure();

    /// Force the circuit into a specific state (for testing or manual override).
    void forceState(State newState);

    /// Clear the rolling window and return to Closed state.
    void reset();

    // -- Queries --------------------------------------------------------------

    /// Current circuit state.
    [[nodiscard]] State state() const;

    /// Calls recorded in the current rolling window.
    [[nodiscard]] uint64_t windowRequestCount() const;

    /// Failures recorded in the current rolling window.
    [[nodiscard]] uint64_t windowFailureCount() const;

    /// Failure percentage of the current rolling window (0 when empty).
    [[nodiscard]] uint32_t errorPercentage() const;

    /// Number of consecutive successes in HalfOpen state.
    [[nodiscard]] uint32_t halfOpenSuccessCount() const;

    /// Total number of requests rejected while open or while a half-open
    /// trial call was outstanding.
    [[nodiscard]] uint64_t rejectedCount() const;

    /// Configuration name.
    [[nodiscard]] std::string_view name() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Bucket {
        int64_t slot = -1;
        uint64_t successes = 0;
        uint64_t failures = 0;
    };

    void transitionTo(State newState);
    Bucket& currentBucket(Clock::time_point now);
    void windowTotals(Clock::time_point now, uint64_t& successes, uint64_t& failures) const;
    void clearWindow();
    [[nodiscard]] int64_t slotOf(Clock::time_point now) const;

    CircuitBreakerConfig config_;
    Clock::time_point epoch_;
    Clock::duration bucketWidth_;
    mutable std::mutex mutex_;
    std::vector<Bucket> buckets_;
    State state_{State::Closed};
    uint32_t halfOpenSuccesses_{0};
    bool probeInFlight_{false};
    uint64_t totalRejected_{0};
    Clock::time_point openedAt_{};
};

/// Convert circuit breaker state to string.
[[nodiscard]] constexpr std::string_view toString(ServiceCircuitBreaker::State s) {
    switch (s) {
        case ServiceCircuitBreaker::State::Closed:
            return "closed";
        case ServiceCircuitBreaker::State::Open:
            return "open";
        case ServiceCircuitBreaker::State::HalfOpen:
            return "half_open";
    }
    return "unknown";
}

}  // namespace agw::service
