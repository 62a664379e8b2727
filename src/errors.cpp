#include "errors.hpp"

namespace sky {

const char* toString(RejectReason reason) {
    switch (reason) {
    case RejectReason::None:
        return "none";
    case RejectReason::DuplicateBet:
        return "duplicate_bet";
    case RejectReason::InvalidAmount:
        return "invalid_amount";
    case RejectReason::InvalidAutoCashout:
        return "invalid_auto_cashout";
    case RejectReason::RoundNotAcceptingBets:
        return "round_not_accepting_bets";
    case RejectReason::InsufficientFunds:
        return "insufficient_funds";
    case RejectReason::UnknownBet:
        return "unknown_bet";
    case RejectReason::UnknownWallet:
        return "unknown_wallet";
    case RejectReason::BetNotActive:
        return "bet_not_active";
    case RejectReason::RoundAlreadyCrashed:
        return "round_already_crashed";
    case RejectReason::RoundNotFlying:
        return "round_not_flying";
    case RejectReason::MultiplierExceedsCrash:
        return "multiplier_exceeds_crash";
    case RejectReason::InvalidMultiplier:
        return "invalid_multiplier";
    case RejectReason::Maintenance:
        return "maintenance";
    case RejectReason::Internal:
        return "internal_error";
    }
    return "unknown";
}

} // namespace sky
