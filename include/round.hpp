#pragma once

#include "fixed_point.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sky {

using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;

enum class RoundStatus { Waiting, Betting, Flying, Crashed, Completed };

const char* toString(RoundStatus status);

struct Round {
    std::string id;
    std::uint64_t roundNumber = 0;
    RoundStatus status = RoundStatus::Waiting;
    std::string seed;
    std::string hashValue;

    // Fixed before the round is published as Flying; never rewritten.
    std::optional<Fixed64> crashMultiplier;
    std::chrono::milliseconds flightDuration{ 0 };
    // Where the round actually ended; differs from crashMultiplier only on a forced crash.
    std::optional<Fixed64> finalMultiplier;
    bool forced = false;

    Timestamp createdAt{};
    Timestamp bettingWindowEnd{};
    std::optional<Timestamp> flightStart;
    std::optional<Timestamp> crashedAt;
    SteadyTime flightStartSteady{};

    bool isLive() const {
        return status == RoundStatus::Waiting || status == RoundStatus::Betting ||
               status == RoundStatus::Flying;
    }
};

using RoundPtr = std::shared_ptr<const Round>;

struct RoundStatistics {
    std::string roundId;
    std::uint64_t roundNumber = 0;
    std::uint64_t betCount = 0;
    Fixed64 totalStaked;
    Fixed64 totalPaidOut;
    std::uint64_t uniquePlayers = 0;
    Fixed64 maxStake;
    Fixed64 finalMultiplier;
};

// Moves a round to `next`; throws std::logic_error on any backward or same-state move.
void advanceStatus(Round& round, RoundStatus next);

// The published view of the live round. One writer (the scheduler) swaps in a new
// immutable snapshot per phase transition; readers take a snapshot and keep using it.
class RoundHandle {
public:
    RoundPtr load() const { return std::atomic_load(&current_); }

    void publish(Round round) {
        std::atomic_store(&current_, RoundPtr(std::make_shared<const Round>(std::move(round))));
    }

private:
    RoundPtr current_;
};

} // namespace sky
