#include "round_store.hpp"

#include <stdexcept>

namespace sky {

Round InMemoryRoundStore::createRound(Round draft) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (draft.id.empty()) {
        throw std::invalid_argument("round id must not be empty");
    }
    if (rounds_.count(draft.id) != 0) {
        throw std::logic_error("round " + draft.id + " already exists");
    }
    draft.roundNumber = byNumber_.empty() ? 1 : byNumber_.rbegin()->first + 1;
    byNumber_.emplace(draft.roundNumber, draft.id);
    rounds_.emplace(draft.id, draft);
    return draft;
}

void InMemoryRoundStore::saveRound(const Round& round) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rounds_.find(round.id);
    if (it == rounds_.end()) {
        throw std::runtime_error("round " + round.id + " was never created");
    }
    if (it->second.roundNumber != round.roundNumber) {
        throw std::logic_error("round number of " + round.id + " cannot change");
    }
    if (static_cast<int>(round.status) < static_cast<int>(it->second.status)) {
        throw std::logic_error(std::string("round ") + round.id + " is already " + toString(it->second.status));
    }
    it->second = round;
}

std::optional<Round> InMemoryRoundStore::findRound(const std::string& roundId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rounds_.find(roundId);
    if (it == rounds_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Round> InMemoryRoundStore::recentCompleted(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Round> out;
    for (auto it = byNumber_.rbegin(); it != byNumber_.rend() && out.size() < limit; ++it) {
        const Round& round = rounds_.at(it->second);
        if (round.status == RoundStatus::Completed) {
            out.push_back(round);
        }
    }
    return out;
}

void InMemoryRoundStore::saveStatistics(const RoundStatistics& stats) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!statistics_.emplace(stats.roundId, stats).second) {
        throw std::logic_error("statistics for round " + stats.roundId + " already written");
    }
}

std::optional<RoundStatistics> InMemoryRoundStore::findStatistics(const std::string& roundId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statistics_.find(roundId);
    if (it == statistics_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t InMemoryRoundStore::roundCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rounds_.size();
}

} // namespace sky
