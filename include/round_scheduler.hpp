#pragma once

#include "crash_point.hpp"
#include "engine_config.hpp"
#include "fixed_point.hpp"
#include "round.hpp"
#include "round_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace sky {

class AutoCashoutMonitor;
class BetLedger;
class PlayerStatsBook;
class SettlementEngine;
class TranscriptLog;

// Drives rounds through waiting -> betting -> flying -> crashed -> completed, one at a
// time. The run loop lives on its own thread; every wait it makes is bounded and is
// cut short by stop().
class RoundScheduler {
public:
    // Produces the crash point for a round. The default derives it from the round seed.
    using CrashPointSource = std::function<CrashPoint(const Round&, const EngineConfig&)>;

    RoundScheduler(EngineConfig config,
                   RoundStorePtr store,
                   BetLedger& bets,
                   SettlementEngine& settlement,
                   AutoCashoutMonitor& monitor,
                   RoundHandle& current,
                   PlayerStatsBook& players,
                   TranscriptLog& transcript);
    ~RoundScheduler();

    RoundScheduler(const RoundScheduler&) = delete;
    RoundScheduler& operator=(const RoundScheduler&) = delete;

    void start();
    // Crashes and settles any live round, then joins the run loop.
    void stop();
    bool running() const { return running_.load(); }

    // Crashes the flying round at its current multiplier. False when nothing is flying.
    bool forceCrash();

    // Validates and stores `config`; the round in progress keeps the one it started with.
    void updateConfig(const EngineConfig& config);
    EngineConfig config() const;

    void setCrashPointSource(CrashPointSource source);

    // One full round on the calling thread. Returns nullopt when the round was never
    // created because stop() interrupted the creation retries.
    std::optional<RoundStatistics> runRound();

    std::uint64_t completedRounds() const { return completedRounds_.load(); }

private:
    void run();
    std::optional<RoundStatistics> runRoundWith(const EngineConfig& cfg);

    std::optional<Round> createRound(const EngineConfig& cfg);
    CrashPoint drawCrashPoint(Round& round, const EngineConfig& cfg);
    Fixed64 fly(Round& round, const EngineConfig& cfg);
    RoundStatistics finishRound(Round& round, Fixed64 finalMultiplier);
    void recoverLiveRound();

    // Sleeps until `deadline`, stop(), or a force crash for `roundId`.
    void waitUntil(SteadyTime deadline, const std::string& roundId = std::string());
    bool forceRequestedFor(const std::string& roundId);
    void persist(const Round& round);

    mutable std::mutex configMutex_;
    EngineConfig config_;
    CrashPointSource crashSource_;

    RoundStorePtr store_;
    BetLedger& bets_;
    SettlementEngine& settlement_;
    AutoCashoutMonitor& monitor_;
    RoundHandle& current_;
    PlayerStatsBook& players_;
    TranscriptLog& transcript_;

    std::mutex roundMutex_;
    std::string previousRoundId_;

    std::mutex waitMutex_;
    std::condition_variable wake_;
    std::string forceCrashRoundId_;

    std::atomic<bool> running_{ false };
    std::atomic<bool> stopping_{ false };
    std::atomic<std::uint64_t> completedRounds_{ 0 };
    std::thread worker_;
};

} // namespace sky
