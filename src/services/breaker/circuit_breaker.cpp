/// @file circuit_breaker.cpp
/// @brief ServiceCircuitBreaker state machine and rolling window.

#include "agw/service/circuit_breaker.hpp"

#include "agw/service/route_rule.hpp"

#include <algorithm>

namespace agw::service {

CircuitBreakerConfig CircuitBreakerConfig::from(const BreakerConfig& config) {
    CircuitBreakerConfig out;
    out.requestVolumeThreshold = config.requestVolumeThreshold;
    out.errorThresholdPercentage = config.errorThresholdPercentage;
    out.sleepWindow = config.sleepWindow;
    out.rollingWindow = config.rollingWindow;
    out.successThreshold = config.halfOpenSuccessThreshold;
    out.name = config.path;
    return out;
}

ServiceCircuitBreaker::ServiceCircuitBreaker(CircuitBreakerConfig config)
    : config_(std::move(config)),
      epoch_(Clock::now()) {
    config_.bucketCount = std::max<uint32_t>(config_.bucketCount, 1);
    auto window = std::max<Clock::duration>(config_.rollingWindow, std::chrono::milliseconds(1));
    bucketWidth_ = std::max<Clock::duration>(window / config_.bucketCount, Clock::duration(1));
    buckets_.resize(config_.bucketCount);
}

bool ServiceCircuitBreaker::allowRequest() {
    std::lock_guard lock(mutex_);

    switch (state_) {
        case State::Closed:
            return true;

        case State::Open: {
            auto elapsed = Clock::now() - openedAt_;
            if (elapsed >= config_.sleepWindow) {
                transitionTo(State::HalfOpen);
                probeInFlight_ = true;
                return true;
            }
            ++totalRejected_;
            return false;
        }

        case State::HalfOpen:
            // One trial call at a time until it reports.
            if (probeInFlight_) {
                ++totalRejected_;
                return false;
            }
            probeInFlight_ = true;
            return true;
    }
    return false;
}

void ServiceCircuitBreaker::recordSuccess() {
    std::lock_guard lock(mutex_);

    switch (state_) {
        case State::Closed:
            ++currentBucket(Clock::now()).successes;
            break;

        case State::HalfOpen:
            probeInFlight_ = false;
            ++halfOpenSuccesses_;
            if (halfOpenSuccesses_ >= config_.successThreshold) {
                transitionTo(State::Closed);
            }
            break;

        case State::Open:
            // A call admitted before the trip finished late.
            break;
    }
}

void ServiceCircuitBreaker::recordFailure() {
    std::lock_guard lock(mutex_);

    auto now = Clock::now();
    switch (state_) {
        case State::Closed: {
            ++currentBucket(now).failures;
            uint64_t successes = 0;
            uint64_t failures = 0;
            windowTotals(now, successes, failures);
            auto total = successes + failures;
            if (total >= config_.requestVolumeThreshold && total > 0 &&
                failures * 100 >= static_cast<uint64_t>(config_.errorThresholdPercentage) * total) {
                transitionTo(State::Open);
            }
            break;
        }

        case State::HalfOpen:
            // Any failure in half-open immediately re-opens.
            transitionTo(State::Open);
            break;

        case State::Open:
            break;
    }
}

void ServiceCircuitBreaker::forceState(State newState) {
    std::lock_guard lock(mutex_);
    transitionTo(newState);
}

void ServiceCircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    state_ = State::Closed;
    halfOpenSuccesses_ = 0;
    probeInFlight_ = false;
    totalRejected_ = 0;
    openedAt_ = {};
    clearWindow();
}

ServiceCircuitBreaker::State ServiceCircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint64_t ServiceCircuitBreaker::windowRequestCount() const {
    std::lock_guard lock(mutex_);
    uint64_t successes = 0;
    uint64_t failures = 0;
    windowTotals(Clock::now(), successes, failures);
    return successes + failures;
}

uint64_t ServiceCircuitBreaker::windowFailureCount() const {
    std::lock_guard lock(mutex_);
    uint64_t successes = 0;
    uint64_t failures = 0;
    windowTotals(Clock::now(), successes, failures);
    return failures;
}

uint32_t ServiceCircuitBreaker::errorPercentage() const {
    std::lock_guard lock(mutex_);
    uint64_t successes = 0;
    uint64_t failures = 0;
    windowTotals(Clock::now(), successes, failures);
    auto total = successes + failures;
    return total == 0 ? 0 : static_cast<uint32_t>(failures * 100 / total);
}

uint32_t ServiceCircuitBreaker::halfOpenSuccessCount() const {
    std::lock_guard lock(mutex_);
    return halfOpenSuccesses_;
}

uint64_t ServiceCircuitBreaker::rejectedCount() const {
    std::lock_guard lock(mutex_);
    return totalRejected_;
}

std::string_view ServiceCircuitBreaker::name() const {
    return config_.name;
}

void ServiceCircuitBreaker::transitionTo(State newState) {
    state_ = newState;
    probeInFlight_ = false;
    if (newState == State::Closed) {
        halfOpenSuccesses_ = 0;
        clearWindow();
    } else if (newState == State::Open) {
        openedAt_ = Clock::now();
    } else if (newState == State::HalfOpen) {
        halfOpenSuccesses_ = 0;
    }
}

int64_t ServiceCircuitBreaker::slotOf(Clock::time_point now) const {
    return static_cast<int64_t>((now - epoch_) / bucketWidth_);
}

ServiceCircuitBreaker::Bucket& ServiceCircuitBreaker::currentBucket(Clock::time_point now) {
    auto slot = slotOf(now);
    auto& bucket = buckets_[static_cast<std::size_t>(slot) % buckets_.size()];
    if (bucket.slot != slot) {
        bucket = Bucket{slot, 0, 0};
    }
    return bucket;
}

void ServiceCircuitBreaker::windowTotals(Clock::time_point now,
                                         uint64_t& successes,
                                         uint64_t& failures) const {
    auto slot = slotOf(now);
    auto oldest = slot - static_cast<int64_t>(buckets_.size()) + 1;
    for (const auto& bucket : buckets_) {
        if (bucket.slot >= oldest && bucket.slot <= slot) {
            successes += bucket.successes;
            failures += bucket.failures;
        }
    }
}

void ServiceCircuitBreaker::clearWindow() {
    std::fill(buckets_.begin(), buckets_.end(), Bucket{});
}

} // namespace agw::service
