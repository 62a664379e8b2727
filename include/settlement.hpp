#pragma once

#include "betting.hpp"
#include "fixed_point.hpp"
#include "round.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace sky {

class TranscriptLog;
class WalletLedger;

struct CashoutReceipt {
    std::string betId;
    Fixed64 multiplier;
    Fixed64 payout;
};

struct SettlementSummary {
    std::uint64_t winners = 0;
    std::uint64_t losers = 0;
    std::uint64_t alreadySettled = 0;
    Fixed64 paidOut;
};

// Owns the single active -> terminal transition of every bet. Each transition takes
// the bet's own lock, re-checks that the bet is still active, and commits the bet
// fields together with the wallet credit and its ledger entry.
class SettlementEngine {
public:
    SettlementEngine(BetLedger& bets,
                     WalletLedger& wallets,
                     const RoundHandle& rounds,
                     TranscriptLog& transcript);

    // Manual cash-out at a client-observed multiplier. Throws Rejection.
    CashoutReceipt cashOut(const std::string& betId, Fixed64 requestedMultiplier);

    // Win path shared by manual and automatic cash-out. Returns nullopt when the bet
    // was already settled by someone else.
    std::optional<Fixed64> settleWin(BetRecord& record, Fixed64 multiplier, BetStatus outcome);

    // Crash sweep: every bet still active either wins at its threshold (when the
    // threshold is at or below the crash) or loses.
    SettlementSummary settleRemaining(const std::string& roundId, Fixed64 crashMultiplier);

    // Pays min(requested, multiplier implied by elapsed flight time) instead of
    // trusting the client value up to the crash point.
    void setClampToElapsed(bool enabled) { clampToElapsed_.store(enabled); }
    bool clampToElapsed() const { return clampToElapsed_.load(); }

private:
    bool settleLoss(BetRecord& record);

    BetLedger& bets_;
    WalletLedger& wallets_;
    const RoundHandle& rounds_;
    TranscriptLog& transcript_;
    std::atomic<bool> clampToElapsed_{ false };
};

} // namespace sky
