#pragma once

#include "fixed_point.hpp"

#include <boost/multiprecision/cpp_dec_float.hpp>

namespace sky {

class DeterministicMath {
public:
    using HighPrecision = boost::multiprecision::cpp_dec_float_50;

    // low + fraction * (high - low), rounded half-up to hundredths.
    static Fixed64 interpolateHundredths(Fixed64 low, Fixed64 high, double fraction);

    // value * factor with the result in Fixed64 microunits.
    static Fixed64 scale(Fixed64 value, double factor);

private:
    static HighPrecision toHighPrecision(Fixed64 value);
    static Fixed64 fromHighPrecision(const HighPrecision& value);
    static HighPrecision clampUnitInterval(HighPrecision value);
};

} // namespace sky
