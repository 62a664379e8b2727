#pragma once

#include "betting.hpp"
#include "fixed_point.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sky {

struct PlayerStats {
    std::string userId;
    std::uint64_t gamesPlayed = 0;
    std::uint64_t gamesWon = 0;
    std::uint64_t gamesLost = 0;
    Fixed64 totalWagered;
    Fixed64 totalWon;
    Fixed64 biggestWin;
    Fixed64 highestMultiplier;

    double winRatePercent() const {
        if (gamesPlayed == 0) {
            return 0.0;
        }
        return 100.0 * static_cast<double>(gamesWon) / static_cast<double>(gamesPlayed);
    }
};

// Per-user aggregates, folded in once per completed round from its settled bets.
class PlayerStatsBook {
public:
    // Throws std::logic_error if any bet is still active.
    void recordRound(const std::vector<Bet>& settledBets);

    std::optional<PlayerStats> find(const std::string& userId) const;
    std::vector<PlayerStats> all() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PlayerStats> stats_;
};

} // namespace sky
