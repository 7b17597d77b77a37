/**
 * @file failure_tracker.hpp
 * @brief Consecutive-failure counter with capped exponential backoff.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/core/export.hpp"

#include <atomic>
#include <cstdint>

namespace gatelink {
namespace core {

/**
 * @class FailureTracker
 * @brief Backoff policy for the wide-area discovery loop.
 *
 * | consecutive failures | delay                       |
 * |----------------------|-----------------------------|
 * | 0                    | base                        |
 * | 1 .. threshold-1     | min(base * 2^(n-1), max)    |
 * | >= threshold         | max                         |
 *
 * The tracker only shapes the delay. Queries continue at the ceiling rate
 * however many failures accumulate.
 */
class GATELINK_CORE_API FailureTracker {
public:
    static constexpr int64_t DEFAULT_BASE_DELAY_MS = 5000;
    static constexpr int64_t DEFAULT_MAX_DELAY_MS = 60000;
    static constexpr int DEFAULT_THRESHOLD = 5;

    FailureTracker(int64_t baseDelayMs = DEFAULT_BASE_DELAY_MS,
                   int64_t maxDelayMs = DEFAULT_MAX_DELAY_MS,
                   int threshold = DEFAULT_THRESHOLD);

    void recordFailure() { failures_.fetch_add(1, std::memory_order_relaxed); }

    void recordSuccess() { failures_.store(0, std::memory_order_relaxed); }

    int consecutiveFailures() const { return failures_.load(std::memory_order_relaxed); }

    /// Delay before the next attempt.
    int64_t backoffDelayMs() const;

    int64_t baseDelayMs() const { return baseDelayMs_; }
    int64_t maxDelayMs() const { return maxDelayMs_; }

private:
    int64_t baseDelayMs_;
    int64_t maxDelayMs_;
    int threshold_;
    std::atomic<int> failures_{0};
};

}  // namespace core
}  // namespace gatelink
