#include "round.hpp"

#include <stdexcept>

namespace sky {

const char* toString(RoundStatus status) {
    switch (status) {
    case RoundStatus::Waiting:
        return "waiting";
    case RoundStatus::Betting:
        return "betting";
    case RoundStatus::Flying:
        return "flying";
    case RoundStatus::Crashed:
        return "crashed";
    case RoundStatus::Completed:
        return "completed";
    }
    return "unknown";
}

void advanceStatus(Round& round, RoundStatus next) {
    if (static_cast<int>(next) <= static_cast<int>(round.status)) {
        throw std::logic_error(std::string("round status cannot move from ") +
                               toString(round.status) + " to " + toString(next));
    }
    if (next == RoundStatus::Flying && !round.crashMultiplier) {
        throw std::logic_error("round cannot fly before its crash multiplier is fixed");
    }
    round.status = next;
}

} // namespace sky
