#include "round_scheduler.hpp"

#include "auto_cashout.hpp"
#include "betting.hpp"
#include "multiplier_clock.hpp"
#include "player_stats.hpp"
#include "rng.hpp"
#include "settlement.hpp"
#include "transcript_log.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace sky {

namespace {

CrashPoint seededCrashPoint(const Round& round, const EngineConfig& cfg) {
    CrashPointGenerator generator(cfg.deploymentId, cfg.flightLimits());
    return generator.generate(round.seed, cfg.houseEdgePercent);
}

// Runs `call` on its own thread and waits at most `timeout` for the result. An
// overrunning call is abandoned and keeps only what it captured by value.
template <typename Fn>
auto callWithDeadline(Fn call, std::chrono::milliseconds timeout, const std::string& what) -> decltype(call()) {
    using Result = decltype(call());
    auto promise = std::make_shared<std::promise<Result>>();
    std::future<Result> result = promise->get_future();
    std::thread([promise, call]() mutable {
        try {
            if constexpr (std::is_void_v<Result>) {
                call();
                promise->set_value();
            } else {
                promise->set_value(call());
            }
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (result.wait_for(timeout) != std::future_status::ready) {
        throw std::runtime_error(what + " timed out after " + std::to_string(timeout.count()) + "ms");
    }
    return result.get();
}

MultiplierClock::Duration sinceSteady(SteadyTime start) {
    return std::chrono::duration_cast<MultiplierClock::Duration>(std::chrono::steady_clock::now() - start);
}

} // namespace

RoundScheduler::RoundScheduler(EngineConfig config,
                               RoundStorePtr store,
                               BetLedger& bets,
                               SettlementEngine& settlement,
                               AutoCashoutMonitor& monitor,
                               RoundHandle& current,
                               PlayerStatsBook& players,
                               TranscriptLog& transcript)
    : config_(std::move(config))
    , crashSource_(seededCrashPoint)
    , store_(std::move(store))
    , bets_(bets)
    , settlement_(settlement)
    , monitor_(monitor)
    , current_(current)
    , players_(players)
    , transcript_(transcript) {
    if (!store_) {
        throw std::invalid_argument("RoundScheduler requires a round store");
    }
    config_.validate();
}

RoundScheduler::~RoundScheduler() {
    stop();
}

void RoundScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    stopping_.store(false);
    transcript_.append(EventKind::EngineStart, 0, config().describe());
    worker_ = std::thread([this]() { run(); });
}

void RoundScheduler::stop() {
    stopping_.store(true);
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (running_.exchange(false)) {
        transcript_.append(EventKind::EngineStop, 0, "scheduler stopped");
    }
}

bool RoundScheduler::forceCrash() {
    RoundPtr round = current_.load();
    if (!round || round->status != RoundStatus::Flying) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        forceCrashRoundId_ = round->id;
    }
    wake_.notify_all();
    return true;
}

void RoundScheduler::updateConfig(const EngineConfig& config) {
    config.validate();
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = config;
    }
    RoundPtr round = current_.load();
    transcript_.append(EventKind::ConfigUpdate, round ? round->roundNumber : 0, config.describe());
}

EngineConfig RoundScheduler::config() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

void RoundScheduler::setCrashPointSource(CrashPointSource source) {
    std::lock_guard<std::mutex> lock(configMutex_);
    crashSource_ = source ? std::move(source) : CrashPointSource(seededCrashPoint);
}

void RoundScheduler::run() {
    while (!stopping_.load()) {
        const EngineConfig cfg = config();
        if (cfg.maintenanceMode) {
            waitUntil(std::chrono::steady_clock::now() + cfg.maintenancePoll);
            continue;
        }

        try {
            runRoundWith(cfg);
        } catch (const std::exception& ex) {
            RoundPtr round = current_.load();
            transcript_.append(EventKind::Error,
                               round ? round->roundNumber : 0,
                               std::string("round aborted: ") + ex.what());
            recoverLiveRound();
        }

        if (!stopping_.load()) {
            waitUntil(std::chrono::steady_clock::now() + cfg.interRoundPause);
        }
    }
}

std::optional<RoundStatistics> RoundScheduler::runRound() {
    return runRoundWith(config());
}

std::optional<RoundStatistics> RoundScheduler::runRoundWith(const EngineConfig& cfg) {
    std::lock_guard<std::mutex> roundLock(roundMutex_);

    std::optional<Round> created = createRound(cfg);
    if (!created) {
        return std::nullopt;
    }
    Round round = std::move(*created);
    const SteadyTime roundStart = std::chrono::steady_clock::now();

    settlement_.setClampToElapsed(cfg.clampCashoutToElapsed);
    bets_.openRound(round.id, round.roundNumber, cfg.betLimits());
    if (!previousRoundId_.empty()) {
        bets_.retireRound(previousRoundId_);
        previousRoundId_.clear();
    }
    current_.publish(round);
    {
        std::ostringstream detail;
        detail << "id=" << round.id << " hash=" << round.hashValue
               << " betting_ms=" << cfg.bettingWindow.count();
        transcript_.append(EventKind::RoundStart, round.roundNumber, detail.str());
    }

    waitUntil(roundStart + cfg.bettingWindow);
    bets_.closeBetting(round.id);

    Fixed64 finalMultiplier = fly(round, cfg);
    return finishRound(round, finalMultiplier);
}

std::optional<Round> RoundScheduler::createRound(const EngineConfig& cfg) {
    auto backoff = cfg.creationRetryBackoff;
    while (true) {
        try {
            Round draft;
            draft.id = newIdentifier();
            draft.seed = generateRoundSeed();
            draft.hashValue = seedCommitment(draft.seed, cfg.deploymentId);
            draft.createdAt = std::chrono::system_clock::now();
            draft.bettingWindowEnd = draft.createdAt + cfg.bettingWindow;
            advanceStatus(draft, RoundStatus::Betting);
            return callWithDeadline(
                [store = store_, draft = std::move(draft)]() mutable { return store->createRound(std::move(draft)); },
                cfg.externalCallTimeout,
                "round store createRound");
        } catch (const std::exception& ex) {
            std::ostringstream detail;
            detail << "round creation failed: " << ex.what() << "; retrying in " << backoff.count() << "ms";
            transcript_.append(EventKind::Error, 0, detail.str());
        }

        waitUntil(std::chrono::steady_clock::now() + backoff);
        if (stopping_.load()) {
            return std::nullopt;
        }
        backoff = std::min(backoff * 2, cfg.maxCreationRetryBackoff);
    }
}

CrashPoint RoundScheduler::drawCrashPoint(Round& round, const EngineConfig& cfg) {
    // Flies straight into a 1.00x crash; every bet without a settled cash-out loses.
    static const CrashPoint grounded{ Fixed64(1), std::chrono::milliseconds(0) };
    if (stopping_.load()) {
        round.forced = true;
        return grounded;
    }

    CrashPointSource source;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        source = crashSource_;
    }
    try {
        CrashPoint point = callWithDeadline(
            [source, snapshot = round, cfg]() { return source(snapshot, cfg); }, cfg.externalCallTimeout, "crash point draw");
        if (point.multiplier < Fixed64(1) || !point.multiplier.isCentAligned() ||
            point.flightDuration.count() < 0) {
            throw std::runtime_error("crash point " + point.multiplier.toString(6) + " is malformed");
        }
        return point;
    } catch (const std::exception& ex) {
        transcript_.append(EventKind::Error,
                           round.roundNumber,
                           std::string("crash point generation failed: ") + ex.what());
        round.forced = true;
        return grounded;
    }
}

Fixed64 RoundScheduler::fly(Round& round, const EngineConfig& cfg) {
    const CrashPoint point = drawCrashPoint(round, cfg);

    round.crashMultiplier = point.multiplier;
    round.flightDuration = point.flightDuration;
    round.flightStart = std::chrono::system_clock::now();
    round.flightStartSteady = std::chrono::steady_clock::now();
    advanceStatus(round, RoundStatus::Flying);
    persist(round);
    current_.publish(round);
    {
        std::ostringstream detail;
        detail << "crash=" << point.multiplier.toString() << " flight_ms=" << point.flightDuration.count();
        transcript_.append(EventKind::FlyingStart, round.roundNumber, detail.str());
    }

    const auto flight = std::chrono::duration_cast<MultiplierClock::Duration>(point.flightDuration);
    while (true) {
        const Fixed64 live = MultiplierClock::at(sinceSteady(round.flightStartSteady), point.multiplier, flight);

        try {
            monitor_.tick(round.id, live);
        } catch (const std::exception& ex) {
            transcript_.append(EventKind::Error,
                               round.roundNumber,
                               std::string("auto cash-out tick failed: ") + ex.what());
        }

        if (live >= point.multiplier) {
            return live;
        }

        std::string reason;
        if (forceRequestedFor(round.id)) {
            reason = "operator";
        } else if (stopping_.load()) {
            reason = "shutdown";
        } else if (std::chrono::steady_clock::now() - round.flightStartSteady > cfg.stallTimeout) {
            reason = "stalled";
        }
        if (!reason.empty()) {
            round.forced = true;
            transcript_.append(EventKind::ForceCrash,
                               round.roundNumber,
                               "reason=" + reason + " at=" + live.toString());
            return live;
        }

        waitUntil(std::chrono::steady_clock::now() + cfg.tickInterval, round.id);
    }
}

RoundStatistics RoundScheduler::finishRound(Round& round, Fixed64 finalMultiplier) {
    round.finalMultiplier = finalMultiplier;
    round.crashedAt = std::chrono::system_clock::now();
    advanceStatus(round, RoundStatus::Crashed);
    persist(round);
    current_.publish(round);
    transcript_.append(EventKind::Crash,
                       round.roundNumber,
                       "at=" + finalMultiplier.toString() + (round.forced ? " forced" : ""));

    SettlementSummary summary = settlement_.settleRemaining(round.id, finalMultiplier);
    {
        std::ostringstream detail;
        detail << "winners=" << summary.winners << " losers=" << summary.losers
               << " raced=" << summary.alreadySettled << " paid=" << summary.paidOut.toString();
        transcript_.append(EventKind::SettlementSummary, round.roundNumber, detail.str());
    }

    const std::vector<Bet> settled = bets_.snapshot(round.id);
    RoundStatistics stats;
    stats.roundId = round.id;
    stats.roundNumber = round.roundNumber;
    stats.finalMultiplier = finalMultiplier;
    std::unordered_set<std::string> players;
    for (const auto& bet : settled) {
        ++stats.betCount;
        stats.totalStaked += bet.amount;
        stats.totalPaidOut += bet.payout;
        stats.maxStake = std::max(stats.maxStake, bet.amount);
        players.insert(bet.userId);
    }
    stats.uniquePlayers = players.size();

    advanceStatus(round, RoundStatus::Completed);
    persist(round);
    current_.publish(round);
    previousRoundId_ = round.id;

    try {
        callWithDeadline([store = store_, stats]() { store->saveStatistics(stats); },
                         config().externalCallTimeout,
                         "round store saveStatistics");
    } catch (const std::exception& ex) {
        transcript_.append(EventKind::Error,
                           round.roundNumber,
                           std::string("statistics not saved: ") + ex.what());
    }
    players_.recordRound(settled);
    transcript_.compact(config().transcriptRetention);
    completedRounds_.fetch_add(1);
    return stats;
}

void RoundScheduler::recoverLiveRound() {
    RoundPtr published = current_.load();
    if (!published || published->status == RoundStatus::Completed) {
        return;
    }
    Round round = *published;
    try {
        bets_.closeBetting(round.id);
        if (round.status == RoundStatus::Crashed) {
            settlement_.settleRemaining(round.id, *round.finalMultiplier);
            advanceStatus(round, RoundStatus::Completed);
            persist(round);
            current_.publish(round);
            previousRoundId_ = round.id;
            return;
        }
        if (round.status != RoundStatus::Flying) {
            round.crashMultiplier = Fixed64(1);
            round.flightStart = std::chrono::system_clock::now();
            round.flightStartSteady = std::chrono::steady_clock::now();
            advanceStatus(round, RoundStatus::Flying);
        }
        round.forced = true;
        const Fixed64 live = MultiplierClock::at(
            sinceSteady(round.flightStartSteady),
            *round.crashMultiplier,
            std::chrono::duration_cast<MultiplierClock::Duration>(round.flightDuration));
        transcript_.append(EventKind::ForceCrash, round.roundNumber, "reason=recovery at=" + live.toString());
        finishRound(round, live);
    } catch (const std::exception& ex) {
        std::cerr << "[sky] round " << round.roundNumber << " could not be recovered: " << ex.what() << "\n";
    }
}

void RoundScheduler::waitUntil(SteadyTime deadline, const std::string& roundId) {
    std::unique_lock<std::mutex> lock(waitMutex_);
    wake_.wait_until(lock, deadline, [&]() {
        return stopping_.load() || (!roundId.empty() && forceCrashRoundId_ == roundId);
    });
}

bool RoundScheduler::forceRequestedFor(const std::string& roundId) {
    std::lock_guard<std::mutex> lock(waitMutex_);
    if (forceCrashRoundId_ != roundId) {
        return false;
    }
    forceCrashRoundId_.clear();
    return true;
}

void RoundScheduler::persist(const Round& round) {
    try {
        callWithDeadline([store = store_, round]() { store->saveRound(round); },
                         config().externalCallTimeout,
                         "round store saveRound");
    } catch (const std::exception& ex) {
        transcript_.append(EventKind::Error,
                           round.roundNumber,
                           std::string("round not persisted: ") + ex.what());
    }
}

} // namespace sky
