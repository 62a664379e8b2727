#include "round.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace sky;

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "round_test failure: " << msg << std::endl;
    std::exit(1);
}

void expectLogicError(const std::function<void()>& fn, const std::string& what) {
    try {
        fn();
    } catch (const std::logic_error&) {
        return;
    }
    fail(what + " was allowed");
}

} // namespace

int main() {
    Round round;
    round.id = "r1";
    advanceStatus(round, RoundStatus::Betting);

    expectLogicError([&] { advanceStatus(round, RoundStatus::Betting); }, "same-state move");
    expectLogicError([&] { advanceStatus(round, RoundStatus::Waiting); }, "move back to waiting");
    expectLogicError([&] { advanceStatus(round, RoundStatus::Flying); }, "flying without a crash multiplier");
    if (round.status != RoundStatus::Betting) {
        fail("refused moves changed the status");
    }

    round.crashMultiplier = Fixed64::parse("2.40");
    advanceStatus(round, RoundStatus::Flying);
    advanceStatus(round, RoundStatus::Crashed);
    expectLogicError([&] { advanceStatus(round, RoundStatus::Flying); }, "move back to flying");
    advanceStatus(round, RoundStatus::Completed);
    expectLogicError([&] { advanceStatus(round, RoundStatus::Crashed); }, "move back from completed");

    // Readers keep the snapshot they loaded while newer ones are published.
    RoundHandle handle;
    if (handle.load()) {
        fail("empty handle should publish nothing");
    }
    Round live;
    live.id = "r2";
    advanceStatus(live, RoundStatus::Betting);
    handle.publish(live);
    RoundPtr betting = handle.load();

    live.crashMultiplier = Fixed64(3);
    advanceStatus(live, RoundStatus::Flying);
    handle.publish(live);
    RoundPtr flying = handle.load();

    if (betting->status != RoundStatus::Betting || betting->crashMultiplier) {
        fail("earlier snapshot was modified by a later publish");
    }
    if (flying->status != RoundStatus::Flying || flying->crashMultiplier != Fixed64(3)) {
        fail("flying snapshot should carry its crash multiplier");
    }

    std::cout << "Round checks passed\n";
    return 0;
}
