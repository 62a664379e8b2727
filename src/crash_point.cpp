#include "crash_point.hpp"

#include "deterministic_math.hpp"
#include "rng.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sky {

namespace {

// Flight time already elapsed when the curve leaves 1.00x.
constexpr double kBaseFlightSeconds = 0.8;

void checkHouseEdge(double houseEdgePercent) {
    if (!std::isfinite(houseEdgePercent) || houseEdgePercent < 0.0 ||
        houseEdgePercent > CrashPointGenerator::kMaxHouseEdgePercent) {
        throw std::invalid_argument("house edge must be within [0, 50] percent");
    }
}

void checkUnit(double value, const char* name) {
    if (!std::isfinite(value) || value < 0.0 || value >= 1.0) {
        throw std::invalid_argument(std::string(name) + " must be within [0, 1)");
    }
}

} // namespace

const std::array<CrashBand, 4>& CrashPointGenerator::bands() {
    static const std::array<CrashBand, 4> kBands{ {
        { 0.50, 1.00, Fixed64::fromCents(100), Fixed64::fromCents(250), 0.8 },
        { 0.80, 0.50, Fixed64::fromCents(250), Fixed64::fromCents(750), 0.6 },
        { 0.95, 0.25, Fixed64::fromCents(750), Fixed64::fromCents(2250), 0.4 },
        { 1.00, 0.00, Fixed64::fromCents(2250), Fixed64::fromCents(10000), 0.3 },
    } };
    return kBands;
}

CrashPointGenerator::CrashPointGenerator(std::string deploymentId, FlightLimits limits)
    : deploymentId_(std::move(deploymentId))
    , limits_(limits) {
    if (deploymentId_.empty()) {
        throw std::invalid_argument("deploymentId must not be empty");
    }
    if (limits_.minFlight.count() <= 0 || limits_.maxFlight < limits_.minFlight) {
        throw std::invalid_argument("flight limits must satisfy 0 < min <= max");
    }
}

CrashPoint CrashPointGenerator::generate(const std::string& seed, double houseEdgePercent) const {
    SeededRng rng(seed, deploymentId_);
    return generate(rng, houseEdgePercent);
}

CrashPoint CrashPointGenerator::generate(RandomSource& rng, double houseEdgePercent) const {
    checkHouseEdge(houseEdgePercent);
    double r = rng.uniform01();
    double u = rng.uniform01();
    return fromDraws(r, u, houseEdgePercent);
}

CrashPoint CrashPointGenerator::fromDraws(double r, double u, double houseEdgePercent) const {
    checkHouseEdge(houseEdgePercent);
    checkUnit(r, "band draw");
    checkUnit(u, "interpolation draw");

    const double edge = houseEdgePercent / 100.0;
    const auto& table = bands();

    const CrashBand* chosen = &table.back();
    for (const auto& band : table) {
        if (r < band.upperBase + band.upperEdgeWeight * edge) {
            chosen = &band;
            break;
        }
    }

    Fixed64 multiplier = DeterministicMath::interpolateHundredths(chosen->low, chosen->high, u);
    return CrashPoint{ multiplier, flightDurationFor(multiplier) };
}

std::chrono::milliseconds CrashPointGenerator::flightDurationFor(Fixed64 multiplier) const {
    Fixed64 seconds = Fixed64::fromDouble(kBaseFlightSeconds);
    for (const auto& band : bands()) {
        if (multiplier <= band.low) {
            break;
        }
        Fixed64 top = std::min(multiplier, band.high);
        seconds += DeterministicMath::scale(top - band.low, band.secondsPerUnit);
    }

    std::chrono::milliseconds flight(seconds.raw() / (Fixed64::kScale / 1000));
    return std::clamp(flight, limits_.minFlight, limits_.maxFlight);
}

} // namespace sky
