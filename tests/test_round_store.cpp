#include "player_stats.hpp"
#include "round_store.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace sky;

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "round_store_test failure: " << msg << std::endl;
    std::exit(1);
}

Round draft(const std::string& id) {
    Round round;
    round.id = id;
    round.seed = "seed-" + id;
    advanceStatus(round, RoundStatus::Betting);
    return round;
}

Bet settledBet(const std::string& user, Fixed64 amount, BetStatus status, Fixed64 payout,
               std::optional<Fixed64> multiplier = std::nullopt) {
    Bet bet;
    bet.id = "bet-" + user;
    bet.userId = user;
    bet.amount = amount;
    bet.status = status;
    bet.payout = payout;
    bet.settledMultiplier = multiplier;
    return bet;
}

void concurrentNumbering() {
    InMemoryRoundStore store;
    std::mutex numbersMutex;
    std::vector<std::uint64_t> numbers;
    std::vector<std::thread> writers;
    for (int t = 0; t < 8; ++t) {
        writers.emplace_back([&, t] {
            for (int i = 0; i < 25; ++i) {
                Round stored = store.createRound(draft("r" + std::to_string(t) + "-" + std::to_string(i)));
                std::lock_guard<std::mutex> lock(numbersMutex);
                numbers.push_back(stored.roundNumber);
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    std::sort(numbers.begin(), numbers.end());
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        if (numbers[i] != i + 1) {
            fail("round numbers are not contiguous from 1");
        }
    }
    if (store.roundCount() != 200) {
        fail("store lost rounds");
    }
}

void roundLifecycle() {
    InMemoryRoundStore store;
    bool rejected = false;
    try {
        store.createRound(draft(""));
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    if (!rejected) {
        fail("empty round id accepted");
    }

    std::vector<Round> rounds;
    for (int i = 0; i < 4; ++i) {
        rounds.push_back(store.createRound(draft("round-" + std::to_string(i))));
    }
    rejected = false;
    try {
        store.createRound(draft("round-0"));
    } catch (const std::logic_error&) {
        rejected = true;
    }
    if (!rejected) {
        fail("duplicate round id accepted");
    }

    if (!store.recentCompleted(10).empty()) {
        fail("no round is completed yet");
    }
    for (int i : { 0, 1, 3 }) {
        Round& round = rounds[i];
        round.finalMultiplier = Fixed64(2);
        advanceStatus(round, RoundStatus::Completed);
        store.saveRound(round);
    }
    auto recent = store.recentCompleted(2);
    if (recent.size() != 2 || recent[0].roundNumber != 4 || recent[1].roundNumber != 2) {
        fail("recent completed rounds should be newest first and skip live ones");
    }
    if (store.findRound("round-2")->status != RoundStatus::Betting) {
        fail("live round changed");
    }

    Round stale = rounds[3];
    stale.status = RoundStatus::Flying;
    stale.crashMultiplier = Fixed64(5);
    rejected = false;
    try {
        store.saveRound(stale);
    } catch (const std::logic_error&) {
        rejected = true;
    }
    if (!rejected || store.findRound("round-3")->status != RoundStatus::Completed) {
        fail("a late flying write must not overwrite a completed round");
    }

    Round ghost = draft("ghost");
    rejected = false;
    try {
        store.saveRound(ghost);
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    if (!rejected) {
        fail("saving an unknown round should fail");
    }
    Round renumbered = rounds[2];
    renumbered.roundNumber = 99;
    rejected = false;
    try {
        store.saveRound(renumbered);
    } catch (const std::logic_error&) {
        rejected = true;
    }
    if (!rejected) {
        fail("round number rewrite accepted");
    }

    RoundStatistics stats;
    stats.roundId = rounds[0].id;
    stats.roundNumber = 1;
    stats.betCount = 2;
    store.saveStatistics(stats);
    rejected = false;
    try {
        store.saveStatistics(stats);
    } catch (const std::logic_error&) {
        rejected = true;
    }
    if (!rejected || store.findStatistics(rounds[0].id)->betCount != 2 || store.findStatistics("round-9")) {
        fail("statistics should be write-once");
    }
}

void playerAggregates() {
    PlayerStatsBook book;
    book.recordRound({ settledBet("ann", Fixed64(10), BetStatus::CashedOut, Fixed64(25), Fixed64::parse("2.50")),
                       settledBet("ben", Fixed64(5), BetStatus::Lost, Fixed64()) });
    book.recordRound({ settledBet("ann", Fixed64(20), BetStatus::Won, Fixed64(30), Fixed64::parse("1.50")) });

    auto ann = book.find("ann");
    if (!ann || ann->gamesPlayed != 2 || ann->gamesWon != 2 || ann->totalWagered != Fixed64(30) ||
        ann->totalWon != Fixed64(55) || ann->biggestWin != Fixed64(30) ||
        ann->highestMultiplier != Fixed64::parse("2.50") || ann->winRatePercent() != 100.0) {
        fail("ann's aggregates wrong");
    }
    auto ben = book.find("ben");
    if (!ben || ben->gamesLost != 1 || ben->winRatePercent() != 0.0) {
        fail("ben's aggregates wrong");
    }

    bool rejected = false;
    try {
        book.recordRound({ settledBet("cat", Fixed64(5), BetStatus::Active, Fixed64()) });
    } catch (const std::logic_error&) {
        rejected = true;
    }
    if (!rejected || book.find("cat")) {
        fail("an unsettled round must not be folded in");
    }
    auto all = book.all();
    if (all.size() != 2 || all[0].userId != "ann" || all[1].userId != "ben") {
        fail("player list should be sorted by user");
    }
}

} // namespace

int main() {
    concurrentNumbering();
    roundLifecycle();
    playerAggregates();

    std::cout << "Round store checks passed\n";
    return 0;
}
