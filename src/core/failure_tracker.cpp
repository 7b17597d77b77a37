/**
 * @file failure_tracker.cpp
 * @brief Backoff computation.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/core/failure_tracker.hpp"

#include <algorithm>

namespace gatelink {
namespace core {

FailureTracker::FailureTracker(int64_t baseDelayMs, int64_t maxDelayMs, int threshold)
    : baseDelayMs_(std::max<int64_t>(baseDelayMs, 0))
    , maxDelayMs_(std::max(maxDelayMs, std::max<int64_t>(baseDelayMs, 0)))
    , threshold_(std::max(threshold, 1))
{
}

int64_t FailureTracker::backoffDelayMs() const {
    const int n = consecutiveFailures();
    if (n <= 0) {
        return baseDelayMs_;
    }
    if (n >= threshold_) {
        return maxDelayMs_;
    }

    // Doubling stops as soon as the ceiling is reached, so no overflow.
    int64_t delay = baseDelayMs_;
    for (int i = 1; i < n && delay < maxDelayMs_; ++i) {
        delay *= 2;
    }
    return std::min(delay, maxDelayMs_);
}

}  // namespace core
}  // namespace gatelink
