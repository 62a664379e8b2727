#include "crash_engine.hpp"
#include "rng.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace sky;

namespace {

struct SimulatedPlayer {
    std::string userId;
    std::string betId;
    std::optional<Fixed64> manualTarget;
};

EngineConfig demoConfig() {
    EngineConfig cfg;
    cfg.bettingWindow = std::chrono::milliseconds(3'000);
    cfg.interRoundPause = std::chrono::milliseconds(2'000);
    cfg.maxFlight = std::chrono::milliseconds(15'000);
    return EngineConfig::fromEnvironment(cfg);
}

Fixed64 pickMultiplier(RandomSource& rng, double low, double high) {
    return Fixed64::fromDouble(low + rng.uniform01() * (high - low)).floorToHundredths();
}

void placeBets(CrashEngine& engine, RandomSource& rng, std::vector<SimulatedPlayer>& players) {
    for (auto& player : players) {
        player.betId.clear();
        player.manualTarget.reset();
        if (rng.uniform01() < 0.2) {
            continue;
        }

        Fixed64 stake = Fixed64::fromCents(100 + static_cast<std::int64_t>(rng.uniform01() * 1'900));
        std::optional<Fixed64> autoTarget;
        if (rng.uniform01() < 0.5) {
            autoTarget = pickMultiplier(rng, 1.2, 4.0);
        } else {
            player.manualTarget = pickMultiplier(rng, 1.1, 6.0);
        }

        CommandResult result = engine.placeBet(player.userId, stake, autoTarget);
        if (!result.ok) {
            std::cout << "  " << player.userId << " bet refused: " << toString(result.reason) << "\n";
            continue;
        }
        player.betId = result.betId;
        std::cout << "  " << player.userId << " stakes " << stake.toString();
        if (autoTarget) {
            std::cout << " auto@" << autoTarget->toString() << "x";
        } else {
            std::cout << " manual@" << player.manualTarget->toString() << "x";
        }
        std::cout << "  balance " << result.balance.toString() << "\n";
    }
}

void cashOutDue(CrashEngine& engine, Fixed64 live, std::vector<SimulatedPlayer>& players) {
    for (auto& player : players) {
        if (player.betId.empty() || !player.manualTarget || live < *player.manualTarget) {
            continue;
        }
        CommandResult result = engine.cashOut(player.userId, player.betId, live);
        if (result.ok) {
            std::cout << "  " << player.userId << " cashed out at " << result.multiplier.toString()
                      << "x for " << result.payout.toString() << "\n";
        } else {
            std::cout << "  " << player.userId << " too late: " << toString(result.reason) << "\n";
        }
        player.manualTarget.reset();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::uint64_t rounds = 3;
    if (argc > 1) {
        char* end = nullptr;
        long parsed = std::strtol(argv[1], &end, 10);
        if (end && *end == '\0' && parsed > 0) {
            rounds = static_cast<std::uint64_t>(parsed);
        } else {
            std::cerr << "Invalid round count provided. Using default of 3.\n";
        }
    }

    EngineConfig cfg;
    try {
        cfg = demoConfig();
    } catch (const std::exception& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << "\n";
        return 1;
    }

    std::cout << "Skyline crash engine\n";
    std::cout << "Config: " << cfg.describe() << "\n";
    std::cout << "(set SKY_* variables, e.g. SKY_BETTING_MS or SKY_DEPLOYMENT_ID, to override)\n";

    CrashEngine engine(cfg);
    engine.transcript().mirrorTo(&std::cout);

    std::vector<SimulatedPlayer> players;
    for (int i = 1; i <= 5; ++i) {
        SimulatedPlayer player;
        player.userId = "player-" + std::to_string(i);
        engine.wallets().open(player.userId, Fixed64(100));
        players.push_back(player);
    }

    InsecureTestRng rng(static_cast<std::uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count()));

    engine.start();
    std::uint64_t bettingRound = 0;
    while (engine.scheduler().completedRounds() < rounds) {
        auto view = engine.currentRound();
        if (view && view->status == RoundStatus::Betting && view->roundNumber != bettingRound) {
            bettingRound = view->roundNumber;
            std::cout << "\nRound " << bettingRound << " open, commitment " << view->hashValue << "\n";
            placeBets(engine, rng, players);
        } else if (view && view->liveMultiplier) {
            cashOutDue(engine, *view->liveMultiplier, players);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    engine.stop();

    std::cout << "\n=== BALANCES ===\n";
    for (const auto& player : players) {
        std::cout << "  " << player.userId << ": " << engine.wallets().balance(player.userId).toString();
        if (auto stats = engine.playerStats(player.userId)) {
            std::cout << "  played " << stats->gamesPlayed << " won " << stats->gamesWon << " ("
                      << stats->winRatePercent() << "%) biggest win " << stats->biggestWin.toString();
        }
        std::cout << "\n";
    }

    std::cout << "\n=== HISTORY (seeds revealed) ===\n";
    for (const auto& entry : engine.history()) {
        std::cout << "  #" << entry.roundNumber << " " << entry.finalMultiplier.toString() << "x"
                  << (entry.forced ? " (forced)" : "") << " seed " << entry.seed << "\n";
    }
    std::cout << "Verify a round with: audit_round <seed> " << cfg.houseEdgePercent << " " << cfg.deploymentId
              << "\n";
    std::cout << "Transcript Merkle root (" << engine.transcript().size()
              << " events): " << engine.transcript().merkleRoot() << "\n";
    return 0;
}
