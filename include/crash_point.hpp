#pragma once

#include "fixed_point.hpp"

#include <array>
#include <chrono>
#include <string>

namespace sky {

class RandomSource;

struct CrashPoint {
    Fixed64 multiplier;
    std::chrono::milliseconds flightDuration;
};

struct FlightLimits {
    std::chrono::milliseconds minFlight{1000};
    std::chrono::milliseconds maxFlight{40000};
};

// One slice of the crash distribution. `upperBase + upperEdgeWeight * edge` is the
// cumulative probability at which the band ends; `secondsPerUnit` is how many flight
// seconds each 1.00x of the band adds.
struct CrashBand {
    double upperBase;
    double upperEdgeWeight;
    Fixed64 low;
    Fixed64 high;
    double secondsPerUnit;
};

class CrashPointGenerator {
public:
    static constexpr double kMaxHouseEdgePercent = 50.0;

    explicit CrashPointGenerator(std::string deploymentId = "local", FlightLimits limits = {});

    // Pure: same (seed, houseEdgePercent) always yields the same crash point.
    CrashPoint generate(const std::string& seed, double houseEdgePercent) const;

    CrashPoint generate(RandomSource& rng, double houseEdgePercent) const;

    // Band selection from r and interpolation from u; exposed for audits and tests.
    CrashPoint fromDraws(double r, double u, double houseEdgePercent) const;

    std::chrono::milliseconds flightDurationFor(Fixed64 multiplier) const;

    static const std::array<CrashBand, 4>& bands();

    const FlightLimits& limits() const { return limits_; }
    const std::string& deploymentId() const { return deploymentId_; }

private:
    std::string deploymentId_;
    FlightLimits limits_;
};

} // namespace sky
