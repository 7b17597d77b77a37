/**
 * @file clock.hpp
 * @brief Wall-clock abstraction so expiry logic can be driven by tests.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#pragma once

#include "gatelink/utils/export.hpp"

#include <chrono>
#include <cstdint>

namespace gatelink {
namespace utils {

/**
 * @class Clock
 * @brief Source of the current time in Unix epoch milliseconds.
 */
class GATELINK_UTILS_API Clock {
public:
    virtual ~Clock() = default;

    virtual int64_t nowMs() const = 0;
};

/**
 * @class SystemClock
 * @brief Clock backed by std::chrono::system_clock.
 */
class GATELINK_UTILS_API SystemClock final : public Clock {
public:
    int64_t nowMs() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

}  // namespace utils
}  // namespace gatelink
