#include "betting.hpp"

#include "errors.hpp"
#include "rng.hpp"
#include "wallet.hpp"

namespace sky {

const char* toString(BetStatus status) {
    switch (status) {
    case BetStatus::Active:
        return "active";
    case BetStatus::Won:
        return "won";
    case BetStatus::Lost:
        return "lost";
    case BetStatus::CashedOut:
        return "cashed_out";
    }
    return "unknown";
}

std::string betReference(const std::string& betId) {
    return "BET_" + betId;
}

std::string winReference(const std::string& betId) {
    return "WIN_" + betId;
}

BetLedger::BetLedger(WalletLedger& wallets)
    : wallets_(wallets) {}

void BetLedger::openRound(const std::string& roundId, std::uint64_t roundNumber, BetLimits limits) {
    auto fresh = std::make_shared<RoundBook>();
    fresh->roundNumber = roundNumber;
    fresh->limits = limits;

    std::lock_guard<std::mutex> lock(booksMutex_);
    if (!books_.emplace(roundId, std::move(fresh)).second) {
        throw std::logic_error("bet book already open for round " + roundId);
    }
}

void BetLedger::closeBetting(const std::string& roundId) {
    auto b = book(roundId);
    if (!b) {
        return;
    }
    std::lock_guard<std::mutex> lock(b->mutex);
    b->open = false;
}

std::shared_ptr<BetLedger::RoundBook> BetLedger::book(const std::string& roundId) const {
    std::lock_guard<std::mutex> lock(booksMutex_);
    auto it = books_.find(roundId);
    if (it == books_.end()) {
        return nullptr;
    }
    return it->second;
}

void BetLedger::validate(const RoundBook& b,
                         Fixed64 amount,
                         const std::optional<Fixed64>& autoCashoutAt) const {
    if (!amount.isCentAligned()) {
        throw Rejection(RejectReason::InvalidAmount, "stake must be a whole number of cents");
    }
    if (amount < b.limits.minBet || amount > b.limits.maxBet) {
        throw Rejection(RejectReason::InvalidAmount,
                        "stake " + amount.toString() + " outside [" + b.limits.minBet.toString() +
                            ", " + b.limits.maxBet.toString() + "]");
    }
    if (autoCashoutAt) {
        static const Fixed64 one(1);
        const Fixed64 threshold = *autoCashoutAt;
        if (threshold <= one || !threshold.isCentAligned() ||
            threshold < b.limits.minAutoCashout || threshold > b.limits.maxAutoCashout) {
            throw Rejection(RejectReason::InvalidAutoCashout,
                            "auto cash-out " + threshold.toString() + " outside [" +
                                b.limits.minAutoCashout.toString() + ", " +
                                b.limits.maxAutoCashout.toString() + "]");
        }
    }
}

Bet BetLedger::placeBet(const std::string& roundId,
                        const std::string& userId,
                        Fixed64 amount,
                        std::optional<Fixed64> autoCashoutAt) {
    auto b = book(roundId);
    if (!b) {
        throw Rejection(RejectReason::RoundNotAcceptingBets, "unknown round " + roundId);
    }

    std::lock_guard<std::mutex> lock(b->mutex);
    if (!b->open) {
        throw Rejection(RejectReason::RoundNotAcceptingBets, "betting window closed");
    }
    if (b->byUser.count(userId) != 0) {
        throw Rejection(RejectReason::DuplicateBet, "user " + userId + " already bet this round");
    }
    validate(*b, amount, autoCashoutAt);

    Bet bet;
    bet.id = newIdentifier();
    bet.roundId = roundId;
    bet.roundNumber = b->roundNumber;
    bet.userId = userId;
    bet.amount = amount;
    bet.autoCashoutAt = autoCashoutAt;
    bet.placedAt = std::chrono::system_clock::now();
    auto record = std::make_shared<BetRecord>(bet);

    // Register the bet first and unwind every index if the debit is refused, so a
    // failed placement leaves neither a bet nor a ledger entry behind.
    b->byUser.emplace(userId, record);
    std::multimap<Fixed64, BetRecordPtr>::iterator thresholdIt = b->byThreshold.end();
    bool indexed = false;
    try {
        b->all.push_back(record);
        if (autoCashoutAt) {
            thresholdIt = b->byThreshold.emplace(*autoCashoutAt, record);
        }
        {
            std::lock_guard<std::mutex> indexLock(indexMutex_);
            byId_.emplace(bet.id, record);
            indexed = true;
        }
        wallets_.debit(userId, amount, betReference(bet.id));
    } catch (...) {
        if (indexed) {
            std::lock_guard<std::mutex> indexLock(indexMutex_);
            byId_.erase(bet.id);
        }
        if (thresholdIt != b->byThreshold.end()) {
            b->byThreshold.erase(thresholdIt);
        }
        if (!b->all.empty() && b->all.back() == record) {
            b->all.pop_back();
        }
        b->byUser.erase(userId);
        throw;
    }
    return bet;
}

BetRecordPtr BetLedger::find(const std::string& betId) const {
    std::lock_guard<std::mutex> lock(indexMutex_);
    auto it = byId_.find(betId);
    if (it == byId_.end()) {
        return nullptr;
    }
    return it->second;
}

BetRecordPtr BetLedger::findByUser(const std::string& roundId, const std::string& userId) const {
    auto b = book(roundId);
    if (!b) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(b->mutex);
    auto it = b->byUser.find(userId);
    if (it == b->byUser.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<BetRecordPtr> BetLedger::roundBets(const std::string& roundId) const {
    auto b = book(roundId);
    if (!b) {
        return {};
    }
    std::lock_guard<std::mutex> lock(b->mutex);
    return b->all;
}

std::vector<Bet> BetLedger::snapshot(const std::string& roundId) const {
    std::vector<Bet> out;
    for (const auto& record : roundBets(roundId)) {
        out.push_back(record->snapshot());
    }
    return out;
}

std::vector<BetRecordPtr> BetLedger::takeDueAutoCashouts(const std::string& roundId, Fixed64 multiplier) {
    std::vector<BetRecordPtr> due;
    auto b = book(roundId);
    if (!b) {
        return due;
    }
    std::lock_guard<std::mutex> lock(b->mutex);
    auto end = b->byThreshold.upper_bound(multiplier);
    for (auto it = b->byThreshold.begin(); it != end; ++it) {
        due.push_back(it->second);
    }
    b->byThreshold.erase(b->byThreshold.begin(), end);
    return due;
}

void BetLedger::retireRound(const std::string& roundId) {
    std::shared_ptr<RoundBook> b;
    {
        std::lock_guard<std::mutex> lock(booksMutex_);
        auto it = books_.find(roundId);
        if (it == books_.end()) {
            return;
        }
        b = it->second;
        books_.erase(it);
    }

    std::lock_guard<std::mutex> lock(b->mutex);
    std::lock_guard<std::mutex> indexLock(indexMutex_);
    for (const auto& record : b->all) {
        byId_.erase(record->bet.id);
    }
}

} // namespace sky
