#pragma once
/**
 * @file clock.hpp
 * @brief Wall-clock source injected into components that stamp incidents.
 */

#include <chrono>

namespace remedy {

using TimePoint = std::chrono::system_clock::time_point;

/** @class Clock
 *  @brief Source of "now". Tests substitute a manually advanced clock.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const noexcept = 0;
};

/// Production clock backed by std::chrono::system_clock.
class SystemClock final : public Clock {
public:
    TimePoint now() const noexcept override { return std::chrono::system_clock::now(); }

    /// Process-wide instance.
    static const SystemClock& instance() noexcept {
        static const SystemClock clk;
        return clk;
    }
};

} // namespace remedy
