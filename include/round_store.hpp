#pragma once

#include "round.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sky {

// Persistence boundary for rounds and their aggregate rows. The scheduler calls it
// under a deadline and abandons calls that overrun, so a late write can arrive
// after a newer one.
class RoundStore {
public:
    virtual ~RoundStore() = default;

    // Inserts `draft` with roundNumber = current max + 1, assigned atomically with the
    // insert. Returns the stored round.
    virtual Round createRound(Round draft) = 0;
    // Throws std::logic_error for a write whose status is behind the stored one.
    virtual void saveRound(const Round& round) = 0;
    virtual std::optional<Round> findRound(const std::string& roundId) const = 0;
    // Most recent completed rounds, newest first.
    virtual std::vector<Round> recentCompleted(std::size_t limit) const = 0;

    // Write-once; a second write for the same round throws std::logic_error.
    virtual void saveStatistics(const RoundStatistics& stats) = 0;
    virtual std::optional<RoundStatistics> findStatistics(const std::string& roundId) const = 0;
};

using RoundStorePtr = std::shared_ptr<RoundStore>;

class InMemoryRoundStore : public RoundStore {
public:
    Round createRound(Round draft) override;
    void saveRound(const Round& round) override;
    std::optional<Round> findRound(const std::string& roundId) const override;
    std::vector<Round> recentCompleted(std::size_t limit) const override;

    void saveStatistics(const RoundStatistics& stats) override;
    std::optional<RoundStatistics> findStatistics(const std::string& roundId) const override;

    std::size_t roundCount() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Round> rounds_;
    std::map<std::uint64_t, std::string> byNumber_;
    std::unordered_map<std::string, RoundStatistics> statistics_;
};

} // namespace sky
