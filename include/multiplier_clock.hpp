#pragma once

#include "fixed_point.hpp"

#include <chrono>

namespace sky {

// Displayed multiplier as a pure function of flight progress.
class MultiplierClock {
public:
    using Duration = std::chrono::microseconds;

    // 1 + (target - 1) * elapsed / flight, floored to hundredths; exactly `target`
    // once elapsed >= flight.
    static Fixed64 at(Duration elapsed, Fixed64 target, Duration flightDuration);

    static bool reachedCrash(Duration elapsed, Fixed64 target, Duration flightDuration) {
        return at(elapsed, target, flightDuration) >= target;
    }
};

} // namespace sky
