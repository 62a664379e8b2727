#include "settlement.hpp"

#include "errors.hpp"
#include "multiplier_clock.hpp"
#include "transcript_log.hpp"
#include "wallet.hpp"

#include <sstream>

namespace sky {

SettlementEngine::SettlementEngine(BetLedger& bets,
                                   WalletLedger& wallets,
                                   const RoundHandle& rounds,
                                   TranscriptLog& transcript)
    : bets_(bets)
    , wallets_(wallets)
    , rounds_(rounds)
    , transcript_(transcript) {}

CashoutReceipt SettlementEngine::cashOut(const std::string& betId, Fixed64 requestedMultiplier) {
    BetRecordPtr record = bets_.find(betId);
    if (!record) {
        throw Rejection(RejectReason::UnknownBet, "no bet " + betId);
    }

    static const Fixed64 one(1);
    if (requestedMultiplier < one || !requestedMultiplier.isCentAligned()) {
        throw Rejection(RejectReason::InvalidMultiplier,
                        "multiplier " + requestedMultiplier.toString(6) + " is not a 0.01x step >= 1.00");
    }

    {
        std::lock_guard<std::mutex> lock(record->mutex);
        if (!record->bet.isActive()) {
            throw Rejection(RejectReason::BetNotActive,
                            std::string("bet already ") + toString(record->bet.status));
        }
    }

    RoundPtr round = rounds_.load();
    if (!round || round->id != record->bet.roundId) {
        throw Rejection(RejectReason::RoundAlreadyCrashed, "round of bet " + betId + " is over");
    }
    switch (round->status) {
    case RoundStatus::Waiting:
    case RoundStatus::Betting:
        throw Rejection(RejectReason::RoundNotFlying, "round has not taken off");
    case RoundStatus::Crashed:
    case RoundStatus::Completed:
        throw Rejection(RejectReason::RoundAlreadyCrashed, "round already crashed");
    case RoundStatus::Flying:
        break;
    }

    const Fixed64 crash = *round->crashMultiplier;
    if (requestedMultiplier > crash) {
        throw Rejection(RejectReason::MultiplierExceedsCrash,
                        "requested " + requestedMultiplier.toString() + "x above the crash point");
    }

    Fixed64 multiplier = requestedMultiplier;
    if (clampToElapsed()) {
        auto elapsed = std::chrono::duration_cast<MultiplierClock::Duration>(
            std::chrono::steady_clock::now() - round->flightStartSteady);
        Fixed64 live = MultiplierClock::at(
            elapsed, crash, std::chrono::duration_cast<MultiplierClock::Duration>(round->flightDuration));
        if (live < multiplier) {
            multiplier = live;
        }
    }

    auto payout = settleWin(*record, multiplier, BetStatus::CashedOut);
    if (!payout) {
        throw Rejection(RejectReason::BetNotActive, "bet settled concurrently");
    }
    return CashoutReceipt{ betId, multiplier, *payout };
}

std::optional<Fixed64> SettlementEngine::settleWin(BetRecord& record,
                                                   Fixed64 multiplier,
                                                   BetStatus outcome) {
    std::unique_lock<std::mutex> lock(record.mutex);
    Bet& bet = record.bet;
    if (!bet.isActive()) {
        return std::nullopt;
    }

    Fixed64 payout = payoutFor(bet.amount, multiplier);
    // Throws before the bet is touched, leaving it active for a later attempt.
    wallets_.credit(bet.userId, payout, winReference(bet.id));

    bet.status = outcome;
    bet.settledMultiplier = multiplier;
    bet.payout = payout;
    bet.settledAt = std::chrono::system_clock::now();

    std::ostringstream detail;
    detail << "bet=" << bet.id << " user=" << bet.userId << " at=" << multiplier.toString()
           << "x payout=" << payout.toString() << (outcome == BetStatus::Won ? " auto" : " manual");
    std::uint64_t roundNumber = bet.roundNumber;
    lock.unlock();

    transcript_.append(EventKind::Cashout, roundNumber, detail.str());
    return payout;
}

bool SettlementEngine::settleLoss(BetRecord& record) {
    std::lock_guard<std::mutex> lock(record.mutex);
    Bet& bet = record.bet;
    if (!bet.isActive()) {
        return false;
    }
    bet.status = BetStatus::Lost;
    bet.payout = Fixed64();
    bet.settledAt = std::chrono::system_clock::now();
    return true;
}

SettlementSummary SettlementEngine::settleRemaining(const std::string& roundId, Fixed64 crashMultiplier) {
    SettlementSummary summary;
    for (const auto& record : bets_.roundBets(roundId)) {
        const auto& threshold = record->bet.autoCashoutAt;
        try {
            if (threshold && *threshold <= crashMultiplier) {
                if (auto payout = settleWin(*record, *threshold, BetStatus::Won)) {
                    ++summary.winners;
                    summary.paidOut += *payout;
                } else {
                    ++summary.alreadySettled;
                }
                continue;
            }
            if (settleLoss(*record)) {
                ++summary.losers;
            } else {
                ++summary.alreadySettled;
            }
        } catch (const std::exception& ex) {
            transcript_.append(EventKind::Error,
                               record->bet.roundNumber,
                               "settlement of bet " + record->bet.id + " failed: " + ex.what());
            // The round must not complete with an active bet left behind.
            if (settleLoss(*record)) {
                ++summary.losers;
            }
        }
    }
    return summary;
}

} // namespace sky
