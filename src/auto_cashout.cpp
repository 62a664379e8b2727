#include "auto_cashout.hpp"

#include "betting.hpp"
#include "settlement.hpp"

namespace sky {

AutoCashoutMonitor::AutoCashoutMonitor(BetLedger& bets, SettlementEngine& settlement)
    : bets_(bets)
    , settlement_(settlement) {}

std::uint64_t AutoCashoutMonitor::tick(const std::string& roundId, Fixed64 currentMultiplier) {
    std::uint64_t settled = 0;
    // Thresholds come off an ordered index, so a tick only touches bets that are due.
    for (const auto& record : bets_.takeDueAutoCashouts(roundId, currentMultiplier)) {
        const Fixed64 threshold = *record->bet.autoCashoutAt;
        if (settlement_.settleWin(*record, threshold, BetStatus::Won)) {
            ++settled;
        }
    }
    return settled;
}

} // namespace sky
