#pragma once

#include <stdexcept>
#include <string>

namespace sky {

enum class RejectReason {
    None,
    DuplicateBet,
    InvalidAmount,
    InvalidAutoCashout,
    RoundNotAcceptingBets,
    InsufficientFunds,
    UnknownBet,
    UnknownWallet,
    BetNotActive,
    RoundAlreadyCrashed,
    RoundNotFlying,
    MultiplierExceedsCrash,
    InvalidMultiplier,
    Maintenance,
    Internal
};

// Stable snake_case code for the presentation layer.
const char* toString(RejectReason reason);

// A request refused without any state change, or the losing side of a settlement race.
class Rejection : public std::runtime_error {
public:
    Rejection(RejectReason reason, const std::string& detail)
        : std::runtime_error(std::string(toString(reason)) + ": " + detail)
        , reason_(reason) {}

    RejectReason reason() const { return reason_; }

private:
    RejectReason reason_;
};

} // namespace sky
