#pragma once

#include "fixed_point.hpp"
#include "round.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sky {

class WalletLedger;

enum class BetStatus { Active, Won, Lost, CashedOut };

const char* toString(BetStatus status);

struct Bet {
    std::string id;
    std::string roundId;
    std::uint64_t roundNumber = 0;
    std::string userId;
    Fixed64 amount;
    std::optional<Fixed64> autoCashoutAt;
    BetStatus status = BetStatus::Active;
    std::optional<Fixed64> settledMultiplier;
    Fixed64 payout;
    Timestamp placedAt{};
    std::optional<Timestamp> settledAt;

    bool isActive() const { return status == BetStatus::Active; }
};

// A bet plus the lock that makes its active -> terminal move single-writer.
// Identity fields (id, round, user, amount, threshold) never change after creation.
struct BetRecord {
    explicit BetRecord(Bet initial) : bet(std::move(initial)) {}

    Bet snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return bet;
    }

    mutable std::mutex mutex;
    Bet bet;
};

using BetRecordPtr = std::shared_ptr<BetRecord>;

struct BetLimits {
    Fixed64 minBet = Fixed64::fromCents(100);
    Fixed64 maxBet = Fixed64::fromCents(1'000'000);
    Fixed64 minAutoCashout = Fixed64::fromCents(101);
    Fixed64 maxAutoCashout = Fixed64::fromCents(100'000);
};

std::string betReference(const std::string& betId);
std::string winReference(const std::string& betId);

class BetLedger {
public:
    explicit BetLedger(WalletLedger& wallets);

    // Starts accepting bets for a round under the limits in force for that round.
    void openRound(const std::string& roundId, std::uint64_t roundNumber, BetLimits limits);
    // After this returns no further bet can land in the round.
    void closeBetting(const std::string& roundId);

    // Debits the stake and records the bet as one unit. Throws Rejection.
    Bet placeBet(const std::string& roundId,
                 const std::string& userId,
                 Fixed64 amount,
                 std::optional<Fixed64> autoCashoutAt);

    BetRecordPtr find(const std::string& betId) const;
    BetRecordPtr findByUser(const std::string& roundId, const std::string& userId) const;
    std::vector<BetRecordPtr> roundBets(const std::string& roundId) const;
    std::vector<Bet> snapshot(const std::string& roundId) const;

    // Removes and returns bets whose threshold is at or below `multiplier`, lowest first.
    std::vector<BetRecordPtr> takeDueAutoCashouts(const std::string& roundId, Fixed64 multiplier);

    // Forgets a finished round and its bets.
    void retireRound(const std::string& roundId);

private:
    struct RoundBook {
        std::uint64_t roundNumber = 0;
        BetLimits limits;
        bool open = true;
        std::unordered_map<std::string, BetRecordPtr> byUser;
        std::multimap<Fixed64, BetRecordPtr> byThreshold;
        std::vector<BetRecordPtr> all;
        std::mutex mutex;
    };

    std::shared_ptr<RoundBook> book(const std::string& roundId) const;
    void validate(const RoundBook& book, Fixed64 amount, const std::optional<Fixed64>& autoCashoutAt) const;

    WalletLedger& wallets_;
    mutable std::mutex booksMutex_;
    std::unordered_map<std::string, std::shared_ptr<RoundBook>> books_;
    mutable std::mutex indexMutex_;
    std::unordered_map<std::string, BetRecordPtr> byId_;
};

} // namespace sky
