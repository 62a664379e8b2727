#pragma once

#include "auto_cashout.hpp"
#include "betting.hpp"
#include "engine_config.hpp"
#include "errors.hpp"
#include "fixed_point.hpp"
#include "player_stats.hpp"
#include "round.hpp"
#include "round_scheduler.hpp"
#include "round_store.hpp"
#include "settlement.hpp"
#include "transcript_log.hpp"
#include "wallet.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sky {

struct RoundView {
    std::string roundId;
    std::uint64_t roundNumber = 0;
    RoundStatus status = RoundStatus::Waiting;
    std::string hashValue;
    Timestamp bettingWindowEnd{};
    // Present while flying.
    std::optional<Fixed64> liveMultiplier;
    // Present once crashed.
    std::optional<Fixed64> finalMultiplier;
};

struct HistoryEntry {
    std::uint64_t roundNumber = 0;
    Fixed64 finalMultiplier;
    Timestamp crashedAt{};
    std::string seed;
    std::string hashValue;
    bool forced = false;
};

struct UserBetView {
    Bet bet;
    // amount x live multiplier while the bet is active and the round is flying.
    std::optional<Fixed64> potentialPayout;
};

struct CommandResult {
    bool ok = false;
    RejectReason reason = RejectReason::None;
    std::string betId;
    Fixed64 multiplier;
    Fixed64 payout;
    Fixed64 balance;
};

// The boundary the surrounding application talks to. Commands never throw; they
// report a RejectReason instead.
class CrashEngine {
public:
    explicit CrashEngine(EngineConfig config = EngineConfig(),
                         RoundStorePtr store = std::make_shared<InMemoryRoundStore>());
    ~CrashEngine();

    CrashEngine(const CrashEngine&) = delete;
    CrashEngine& operator=(const CrashEngine&) = delete;

    CommandResult placeBet(const std::string& userId,
                           Fixed64 amount,
                           std::optional<Fixed64> autoCashoutAt = std::nullopt);
    CommandResult cashOut(const std::string& userId, const std::string& betId, Fixed64 observedMultiplier);

    std::optional<RoundView> currentRound() const;
    std::vector<HistoryEntry> history() const;
    std::optional<UserBetView> userBet(const std::string& userId) const;
    std::optional<RoundStatistics> statistics(const std::string& roundId) const;
    std::optional<PlayerStats> playerStats(const std::string& userId) const;

    void start();
    void stop();
    bool forceCrash();
    // Throws std::invalid_argument for an invalid config.
    void updateConfig(const EngineConfig& config);
    EngineConfig config() const;

    WalletLedger& wallets() { return wallets_; }
    const WalletLedger& wallets() const { return wallets_; }
    TranscriptLog& transcript() { return transcript_; }
    RoundScheduler& scheduler() { return scheduler_; }

private:
    CommandResult internalError(const std::string& operation, const std::exception& ex);

    TranscriptLog transcript_;
    WalletLedger wallets_;
    BetLedger bets_;
    RoundHandle current_;
    SettlementEngine settlement_;
    AutoCashoutMonitor monitor_;
    PlayerStatsBook players_;
    RoundStorePtr store_;
    RoundScheduler scheduler_;
};

} // namespace sky
