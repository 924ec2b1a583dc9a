#pragma once

/// @file router_stats.hpp
/// @brief Runtime counters for the routing pipeline.

#include <atomic>
#include <cstdint>

namespace agw::service {

/// Snapshot of router counters.
struct RouterStats {
    /// Upstream dispatch attempts, retries included.
    uint64_t attempts = 0;
    uint64_t retries = 0;
    uint64_t responsesWritten = 0;
    uint64_t fallbacks = 0;
    uint64_t timeouts = 0;
    uint64_t upstreamErrors = 0;
    uint64_t internalErrors = 0;
    /// Completions that lost the race for the written flag.
    uint64_t duplicateCompletions = 0;
    uint64_t isolationRejections = 0;
    uint64_t shortCircuits = 0;
    uint64_t breakerTimeouts = 0;
};

/// Live counters shared by the pipeline stages.
struct RouterCounters {
    std::atomic<uint64_t> attempts{0};
    std::atomic<uint64_t> retries{0};
    std::atomic<uint64_t> responsesWritten{0};
    std::atomic<uint64_t> fallbacks{0};
    std::atomic<uint64_t> timeouts{0};
    std::atomic<uint64_t> upstreamErrors{0};
    std::atomic<uint64_t> internalErrors{0};
    std::atomic<uint64_t> duplicateCompletions{0};
    std::atomic<uint64_t> isolationRejections{0};
    std::atomic<uint64_t> shortCircuits{0};
    std::atomic<uint64_t> breakerTimeouts{0};

    [[nodiscard]] RouterStats snapshot() const {
        RouterStats s;
        s.attempts = attempts.load(std::memory_order_relaxed);
        s.retries = retries.load(std::memory_order_relaxed);
        s.responsesWritten = responsesWritten.load(std::memory_order_relaxed);
        s.fallbacks = fallbacks.load(std::memory_order_relaxed);
        s.timeouts = timeouts.load(std::memory_order_relaxed);
        s.upstreamErrors = upstreamErrors.load(std::memory_order_relaxed);
        s.internalErrors = internalErrors.load(std::memory_order_relaxed);
        s.duplicateCompletions = duplicateCompletions.load(std::memory_order_relaxed);
        s.isolationRejections = isolationRejections.load(std::memory_order_relaxed);
        s.shortCircuits = shortCircuits.load(std::memory_order_relaxed);
        s.breakerTimeouts = breakerTimeouts.load(std::memory_order_relaxed);
        return s;
    }
};

}  // namespace agw::service
