#pragma once

#include "betting.hpp"
#include "crash_point.hpp"
#include "fixed_point.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace sky {

struct EngineConfig {
    double houseEdgePercent = 3.0;
    std::chrono::milliseconds bettingWindow{ 10'000 };
    std::chrono::milliseconds interRoundPause{ 5'000 };
    std::chrono::milliseconds tickInterval{ 100 };

    Fixed64 minBet = Fixed64::fromCents(100);
    Fixed64 maxBet = Fixed64::fromCents(1'000'000);
    Fixed64 minAutoCashout = Fixed64::fromCents(101);
    Fixed64 maxAutoCashout = Fixed64::fromCents(100'000);

    std::chrono::milliseconds minFlight{ 1'000 };
    std::chrono::milliseconds maxFlight{ 40'000 };

    bool maintenanceMode = false;
    std::chrono::milliseconds maintenancePoll{ 5'000 };
    std::chrono::milliseconds creationRetryBackoff{ 1'000 };
    std::chrono::milliseconds maxCreationRetryBackoff{ 30'000 };
    // Measured from flight start; a flight running longer than this is force-crashed.
    std::chrono::milliseconds stallTimeout{ 600'000 };
    // Deadline for each round store call and crash point draw.
    std::chrono::milliseconds externalCallTimeout{ 5'000 };

    // Pay min(client multiplier, elapsed-time multiplier) on manual cash-out.
    bool clampCashoutToElapsed = false;

    std::size_t historySize = 20;
    // Transcript events kept after each round; older ones fold into the anchor leaf.
    std::size_t transcriptRetention = 100'000;
    std::string deploymentId = "local";

    BetLimits betLimits() const {
        return BetLimits{ minBet, maxBet, minAutoCashout, maxAutoCashout };
    }
    FlightLimits flightLimits() const { return FlightLimits{ minFlight, maxFlight }; }

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;

    // Overlays SKY_* environment variables onto `base`, then validates.
    static EngineConfig fromEnvironment(EngineConfig base);

    std::string describe() const;
};

} // namespace sky
