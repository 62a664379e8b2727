#include "auto_cashout.hpp"
#include "betting.hpp"
#include "errors.hpp"
#include "round.hpp"
#include "settlement.hpp"
#include "transcript_log.hpp"
#include "wallet.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace sky;

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "settlement_test failure: " << msg << std::endl;
    std::exit(1);
}

void expectRejection(RejectReason expected, const std::function<void()>& fn, const std::string& what) {
    try {
        fn();
    } catch (const Rejection& rejection) {
        if (rejection.reason() != expected) {
            fail(what + " rejected with " + toString(rejection.reason()));
        }
        return;
    }
    fail(what + " was not rejected");
}

// One round wired the way the scheduler wires it, with phases driven by hand.
struct Table {
    TranscriptLog transcript;
    WalletLedger wallets;
    BetLedger bets{ wallets };
    RoundHandle handle;
    SettlementEngine settlement{ bets, wallets, handle, transcript };
    AutoCashoutMonitor monitor{ bets, settlement };
    Round round;

    explicit Table(const std::string& roundId = "round-1") {
        round.id = roundId;
        round.roundNumber = 1;
        advanceStatus(round, RoundStatus::Betting);
        bets.openRound(round.id, round.roundNumber, BetLimits{});
        handle.publish(round);
    }

    std::string bet(const std::string& user, Fixed64 amount, std::optional<Fixed64> autoAt = std::nullopt) {
        if (!wallets.find(user)) {
            wallets.open(user, Fixed64(100));
        }
        return bets.placeBet(round.id, user, amount, autoAt).id;
    }

    void fly(Fixed64 crash, std::chrono::milliseconds flight = std::chrono::milliseconds(10'000)) {
        bets.closeBetting(round.id);
        round.crashMultiplier = crash;
        round.flightDuration = flight;
        round.flightStartSteady = std::chrono::steady_clock::now();
        advanceStatus(round, RoundStatus::Flying);
        handle.publish(round);
    }

    void markCrashed() {
        round.finalMultiplier = round.crashMultiplier;
        advanceStatus(round, RoundStatus::Crashed);
        handle.publish(round);
    }

    SettlementSummary crash() {
        markCrashed();
        return settlement.settleRemaining(round.id, *round.finalMultiplier);
    }

    std::size_t winEntries(const std::string& betId) const {
        std::size_t n = 0;
        for (const auto& tx : wallets.transactions().all()) {
            if (tx.reference == winReference(betId)) {
                ++n;
            }
        }
        return n;
    }
};

void manualCashoutScenario() {
    Table table;
    std::string betId = table.bet("alice", Fixed64(20));
    expectRejection(RejectReason::RoundNotFlying,
                    [&] { table.settlement.cashOut(betId, Fixed64(2)); },
                    "cash-out while betting");

    table.fly(Fixed64::parse("3.40"));
    CashoutReceipt receipt = table.settlement.cashOut(betId, Fixed64(2));
    if (receipt.payout != Fixed64(40) || table.wallets.balance("alice") != Fixed64(120)) {
        fail("cash-out at 2.00 should pay 40.00 and leave 120.00");
    }
    Bet settled = table.bets.find(betId)->snapshot();
    if (settled.status != BetStatus::CashedOut || !settled.settledMultiplier ||
        *settled.settledMultiplier != Fixed64(2) || !settled.settledAt) {
        fail("bet not marked cashed_out at 2.00");
    }

    expectRejection(RejectReason::BetNotActive,
                    [&] { table.settlement.cashOut(betId, Fixed64(2)); },
                    "second cash-out");
    if (table.wallets.balance("alice") != Fixed64(120) || table.winEntries(betId) != 1) {
        fail("second cash-out paid again");
    }

    SettlementSummary summary = table.crash();
    if (summary.alreadySettled != 1 || summary.winners != 0 || summary.losers != 0) {
        fail("sweep should skip the cashed-out bet");
    }
    if (table.transcript.eventsOf(EventKind::Cashout).size() != 1) {
        fail("cash-out event not recorded once");
    }
}

void lossScenario() {
    Table table;
    std::string betId = table.bet("alice", Fixed64(20));
    table.fly(Fixed64::parse("3.40"));
    SettlementSummary summary = table.crash();
    Bet settled = table.bets.find(betId)->snapshot();
    if (summary.losers != 1 || settled.status != BetStatus::Lost || settled.payout != Fixed64()) {
        fail("uncashed bet should lose");
    }
    if (table.wallets.balance("alice") != Fixed64(80)) {
        fail("loss should leave 80.00");
    }
}

void autoCashoutBoundaryScenario() {
    Table table;
    std::string exact = table.bet("alice", Fixed64(20), Fixed64::parse("2.50"));
    std::string above = table.bet("bob", Fixed64(20), Fixed64::parse("2.51"));
    table.fly(Fixed64::parse("2.50"));

    if (table.monitor.tick(table.round.id, Fixed64::parse("2.49")) != 0) {
        fail("nothing is due below 2.50");
    }
    if (table.monitor.tick(table.round.id, Fixed64::parse("2.50")) != 1) {
        fail("threshold equal to the crash point must pay");
    }
    Bet won = table.bets.find(exact)->snapshot();
    if (won.status != BetStatus::Won || won.payout != Fixed64(50) || table.wallets.balance("alice") != Fixed64(130)) {
        fail("auto cash-out at 2.50 should pay 50.00");
    }

    SettlementSummary summary = table.crash();
    if (summary.losers != 1 || table.bets.find(above)->snapshot().status != BetStatus::Lost) {
        fail("threshold above the crash point must lose");
    }
}

void sweepPaysMissedThresholds() {
    Table table;
    std::string betId = table.bet("carol", Fixed64(10), Fixed64::parse("1.80"));
    table.fly(Fixed64(3));
    SettlementSummary summary = table.crash();
    Bet settled = table.bets.find(betId)->snapshot();
    if (summary.winners != 1 || settled.status != BetStatus::Won || settled.payout != Fixed64(18)) {
        fail("sweep should pay a threshold at or below the crash point");
    }
}

void rejectionScenarios() {
    Table table;
    std::string betId = table.bet("dave", Fixed64(10));
    table.fly(Fixed64::parse("3.40"));

    expectRejection(RejectReason::UnknownBet, [&] { table.settlement.cashOut("nope", Fixed64(2)); }, "unknown bet");
    expectRejection(RejectReason::MultiplierExceedsCrash,
                    [&] { table.settlement.cashOut(betId, Fixed64::parse("3.41")); },
                    "claim above the crash point");
    expectRejection(RejectReason::InvalidMultiplier,
                    [&] { table.settlement.cashOut(betId, Fixed64::parse("0.99")); },
                    "claim below 1.00");
    expectRejection(RejectReason::InvalidMultiplier,
                    [&] { table.settlement.cashOut(betId, Fixed64::parse("2.005")); },
                    "claim off the 0.01 grid");

    table.markCrashed();
    expectRejection(RejectReason::RoundAlreadyCrashed,
                    [&] { table.settlement.cashOut(betId, Fixed64(2)); },
                    "claim after the crash");
    table.settlement.settleRemaining(table.round.id, *table.round.finalMultiplier);
    if (table.wallets.balance("dave") != Fixed64(90)) {
        fail("rejected claims changed the balance");
    }
}

void clampToElapsedPolicy() {
    Table table;
    table.settlement.setClampToElapsed(true);
    std::string betId = table.bet("erin", Fixed64(10));
    table.fly(Fixed64(50), std::chrono::milliseconds(60'000));

    CashoutReceipt receipt = table.settlement.cashOut(betId, Fixed64(40));
    if (receipt.multiplier >= Fixed64(40) || receipt.multiplier < Fixed64(1)) {
        fail("clamped cash-out should pay near the elapsed multiplier, got " + receipt.multiplier.toString());
    }
    if (receipt.payout != payoutFor(Fixed64(10), receipt.multiplier)) {
        fail("clamped payout inconsistent with its multiplier");
    }
}

// N manual cash-outs, the auto cash-out monitor and the crash sweep all race for
// one bet; exactly one settlement may take effect.
void settlementRace(bool withThreshold) {
    for (int iteration = 0; iteration < 50; ++iteration) {
        Table table("race-" + std::to_string(iteration));
        std::optional<Fixed64> threshold;
        if (withThreshold) {
            threshold = Fixed64(2);
        }
        std::string betId = table.bet("racer", Fixed64(10), threshold);
        table.fly(Fixed64(3));

        std::atomic<bool> go{ false };
        std::atomic<int> manualWins{ 0 };
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                try {
                    table.settlement.cashOut(betId, Fixed64::parse("2.50"));
                    manualWins.fetch_add(1);
                } catch (const Rejection&) {
                    // Lost the race; checked below through the ledger.
                }
            });
        }
        threads.emplace_back([&] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            table.monitor.tick(table.round.id, Fixed64(2));
        });
        threads.emplace_back([&] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            table.settlement.settleRemaining(table.round.id, Fixed64(3));
        });
        go.store(true);
        for (auto& thread : threads) {
            thread.join();
        }

        Bet settled = table.bets.find(betId)->snapshot();
        if (settled.isActive()) {
            fail("bet still active after the race");
        }
        const std::size_t credits = table.winEntries(betId);
        if (manualWins.load() > 1) {
            fail("more than one manual cash-out succeeded");
        }
        if (settled.status == BetStatus::Lost) {
            if (credits != 0 || manualWins.load() != 0 || table.wallets.balance("racer") != Fixed64(90)) {
                fail("lost bet was credited");
            }
        } else {
            if (credits != 1 || table.wallets.balance("racer") != Fixed64(90) + settled.payout) {
                fail("winning bet credited " + std::to_string(credits) + " times");
            }
            if ((settled.status == BetStatus::CashedOut) != (manualWins.load() == 1)) {
                fail("bet status disagrees with the manual cash-out result");
            }
        }
        if (withThreshold && settled.status == BetStatus::Lost) {
            fail("a threshold below the crash point can never lose");
        }
    }
}

} // namespace

int main() {
    manualCashoutScenario();
    lossScenario();
    autoCashoutBoundaryScenario();
    sweepPaysMissedThresholds();
    rejectionScenarios();
    clampToElapsedPolicy();
    settlementRace(false);
    settlementRace(true);

    std::cout << "Settlement checks passed\n";
    return 0;
}
