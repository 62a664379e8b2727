#include "deterministic_math.hpp"

#include <limits>
#include <stdexcept>

namespace sky {

DeterministicMath::HighPrecision DeterministicMath::clampUnitInterval(HighPrecision value) {
    if (value < HighPrecision(0)) {
        return HighPrecision(0);
    }
    if (value > HighPrecision(1)) {
        return HighPrecision(1);
    }
    return value;
}

DeterministicMath::HighPrecision DeterministicMath::toHighPrecision(Fixed64 value) {
    return HighPrecision(value.raw()) / HighPrecision(Fixed64::kScale);
}

Fixed64 DeterministicMath::fromHighPrecision(const HighPrecision& value) {
    HighPrecision scaled = boost::multiprecision::round(value * HighPrecision(Fixed64::kScale));
    if (scaled > HighPrecision(std::numeric_limits<std::int64_t>::max()) ||
        scaled < HighPrecision(std::numeric_limits<std::int64_t>::min())) {
        throw std::overflow_error("value exceeds Fixed64 range");
    }
    return Fixed64::fromRaw(scaled.convert_to<std::int64_t>());
}

Fixed64 DeterministicMath::interpolateHundredths(Fixed64 low, Fixed64 high, double fraction) {
    if (high < low) {
        throw std::invalid_argument("interpolation bounds are inverted");
    }
    HighPrecision hpLow = toHighPrecision(low);
    HighPrecision hpHigh = toHighPrecision(high);
    HighPrecision t = clampUnitInterval(HighPrecision(fraction));

    HighPrecision value = hpLow + t * (hpHigh - hpLow);
    HighPrecision hundredths = boost::multiprecision::round(value * HighPrecision(100));
    return fromHighPrecision(hundredths / HighPrecision(100));
}

Fixed64 DeterministicMath::scale(Fixed64 value, double factor) {
    return fromHighPrecision(toHighPrecision(value) * HighPrecision(factor));
}

} // namespace sky
