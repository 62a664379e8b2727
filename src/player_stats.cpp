#include "player_stats.hpp"

#include <algorithm>
#include <stdexcept>

namespace sky {

void PlayerStatsBook::recordRound(const std::vector<Bet>& settledBets) {
    for (const auto& bet : settledBets) {
        if (bet.isActive()) {
            throw std::logic_error("bet " + bet.id + " is still active");
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& bet : settledBets) {
        PlayerStats& stats = stats_[bet.userId];
        stats.userId = bet.userId;
        ++stats.gamesPlayed;
        stats.totalWagered += bet.amount;
        if (bet.status == BetStatus::Lost) {
            ++stats.gamesLost;
            continue;
        }
        ++stats.gamesWon;
        stats.totalWon += bet.payout;
        stats.biggestWin = std::max(stats.biggestWin, bet.payout);
        if (bet.settledMultiplier) {
            stats.highestMultiplier = std::max(stats.highestMultiplier, *bet.settledMultiplier);
        }
    }
}

std::optional<PlayerStats> PlayerStatsBook::find(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(userId);
    if (it == stats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PlayerStats> PlayerStatsBook::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PlayerStats> out;
    out.reserve(stats_.size());
    for (const auto& entry : stats_) {
        out.push_back(entry.second);
    }
    std::sort(out.begin(), out.end(), [](const PlayerStats& a, const PlayerStats& b) {
        return a.userId < b.userId;
    });
    return out;
}

} // namespace sky
