#pragma once

#include "fixed_point.hpp"

#include <cstdint>
#include <string>

namespace sky {

class BetLedger;
class SettlementEngine;

class AutoCashoutMonitor {
public:
    AutoCashoutMonitor(BetLedger& bets, SettlementEngine& settlement);

    // Settles, at their own thresholds, all active bets whose threshold the live
    // multiplier has reached. Returns how many this tick paid out.
    std::uint64_t tick(const std::string& roundId, Fixed64 currentMultiplier);

private:
    BetLedger& bets_;
    SettlementEngine& settlement_;
};

} // namespace sky
