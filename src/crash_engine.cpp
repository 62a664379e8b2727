#include "crash_engine.hpp"

#include "multiplier_clock.hpp"

namespace sky {

namespace {

std::optional<Fixed64> liveMultiplier(const Round& round) {
    if (round.status != RoundStatus::Flying || !round.crashMultiplier) {
        return std::nullopt;
    }
    auto elapsed = std::chrono::duration_cast<MultiplierClock::Duration>(
        std::chrono::steady_clock::now() - round.flightStartSteady);
    return MultiplierClock::at(
        elapsed, *round.crashMultiplier, std::chrono::duration_cast<MultiplierClock::Duration>(round.flightDuration));
}

CommandResult rejected(RejectReason reason) {
    CommandResult result;
    result.reason = reason;
    return result;
}

} // namespace

CrashEngine::CrashEngine(EngineConfig config, RoundStorePtr store)
    : bets_(wallets_)
    , settlement_(bets_, wallets_, current_, transcript_)
    , monitor_(bets_, settlement_)
    , store_(store)
    , scheduler_(std::move(config), std::move(store), bets_, settlement_, monitor_, current_, players_, transcript_) {}

CrashEngine::~CrashEngine() {
    scheduler_.stop();
}

CommandResult CrashEngine::placeBet(const std::string& userId, Fixed64 amount, std::optional<Fixed64> autoCashoutAt) {
    try {
        RoundPtr round = current_.load();
        if (!round || round->status != RoundStatus::Betting) {
            return rejected(scheduler_.config().maintenanceMode ? RejectReason::Maintenance
                                                                 : RejectReason::RoundNotAcceptingBets);
        }
        Bet bet = bets_.placeBet(round->id, userId, amount, autoCashoutAt);
        CommandResult result;
        result.ok = true;
        result.betId = bet.id;
        result.balance = wallets_.balance(userId);
        return result;
    } catch (const Rejection& rejection) {
        return rejected(rejection.reason());
    } catch (const std::exception& ex) {
        return internalError("placeBet", ex);
    }
}

CommandResult CrashEngine::cashOut(const std::string& userId, const std::string& betId, Fixed64 observedMultiplier) {
    try {
        BetRecordPtr record = bets_.find(betId);
        if (!record || record->bet.userId != userId) {
            return rejected(RejectReason::UnknownBet);
        }
        CashoutReceipt receipt = settlement_.cashOut(betId, observedMultiplier);
        CommandResult result;
        result.ok = true;
        result.betId = receipt.betId;
        result.multiplier = receipt.multiplier;
        result.payout = receipt.payout;
        result.balance = wallets_.balance(userId);
        return result;
    } catch (const Rejection& rejection) {
        return rejected(rejection.reason());
    } catch (const std::exception& ex) {
        return internalError("cashOut", ex);
    }
}

std::optional<RoundView> CrashEngine::currentRound() const {
    RoundPtr round = current_.load();
    if (!round) {
        return std::nullopt;
    }
    RoundView view;
    view.roundId = round->id;
    view.roundNumber = round->roundNumber;
    view.status = round->status;
    view.hashValue = round->hashValue;
    view.bettingWindowEnd = round->bettingWindowEnd;
    view.liveMultiplier = liveMultiplier(*round);
    view.finalMultiplier = round->finalMultiplier;
    return view;
}

std::vector<HistoryEntry> CrashEngine::history() const {
    std::vector<HistoryEntry> out;
    for (const auto& round : store_->recentCompleted(scheduler_.config().historySize)) {
        HistoryEntry entry;
        entry.roundNumber = round.roundNumber;
        entry.finalMultiplier = round.finalMultiplier.value_or(Fixed64(1));
        entry.crashedAt = round.crashedAt.value_or(round.createdAt);
        entry.seed = round.seed;
        entry.hashValue = round.hashValue;
        entry.forced = round.forced;
        out.push_back(std::move(entry));
    }
    return out;
}

std::optional<UserBetView> CrashEngine::userBet(const std::string& userId) const {
    RoundPtr round = current_.load();
    if (!round) {
        return std::nullopt;
    }
    BetRecordPtr record = bets_.findByUser(round->id, userId);
    if (!record) {
        return std::nullopt;
    }
    UserBetView view;
    view.bet = record->snapshot();
    if (view.bet.isActive()) {
        if (auto live = liveMultiplier(*round)) {
            view.potentialPayout = payoutFor(view.bet.amount, *live);
        }
    }
    return view;
}

std::optional<RoundStatistics> CrashEngine::statistics(const std::string& roundId) const {
    return store_->findStatistics(roundId);
}

std::optional<PlayerStats> CrashEngine::playerStats(const std::string& userId) const {
    return players_.find(userId);
}

void CrashEngine::start() {
    scheduler_.start();
}

void CrashEngine::stop() {
    scheduler_.stop();
}

bool CrashEngine::forceCrash() {
    return scheduler_.forceCrash();
}

void CrashEngine::updateConfig(const EngineConfig& config) {
    scheduler_.updateConfig(config);
}

EngineConfig CrashEngine::config() const {
    return scheduler_.config();
}

CommandResult CrashEngine::internalError(const std::string& operation, const std::exception& ex) {
    RoundPtr round = current_.load();
    transcript_.append(EventKind::Error, round ? round->roundNumber : 0, operation + " failed: " + ex.what());
    return rejected(RejectReason::Internal);
}

} // namespace sky
