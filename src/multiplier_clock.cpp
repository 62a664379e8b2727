#include "multiplier_clock.hpp"

#include <stdexcept>

namespace sky {

Fixed64 MultiplierClock::at(Duration elapsed, Fixed64 target, Duration flightDuration) {
    static const Fixed64 one(1);
    if (target < one) {
        throw std::invalid_argument("crash multiplier must be at least 1.00");
    }
    if (flightDuration.count() <= 0 || elapsed >= flightDuration) {
        return target;
    }
    if (elapsed.count() <= 0) {
        return one;
    }

    __int128 climb = static_cast<__int128>((target - one).raw()) * elapsed.count();
    climb /= flightDuration.count();
    Fixed64 value = one + Fixed64::fromRaw(static_cast<std::int64_t>(climb));

    // Flooring keeps the shown value at or below the true curve; never past target.
    value = value.floorToHundredths();
    return value < target ? value : target;
}

} // namespace sky
