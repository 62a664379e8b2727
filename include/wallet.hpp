#pragma once

#include "fixed_point.hpp"
#include "round.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sky {

enum class TransactionKind { Bet, Win, Deposit };

const char* toString(TransactionKind kind);

struct Transaction {
    std::uint64_t id = 0;
    std::string userId;
    TransactionKind kind = TransactionKind::Bet;
    Fixed64 amount;
    std::string reference;
    Timestamp createdAt{};
};

struct Wallet {
    std::string userId;
    Fixed64 balance;
    Fixed64 totalWagered;
    Fixed64 totalWon;
    Fixed64 totalDeposited;
};

// Append-only ledger. A reference can be written once; a second write is a
// logic error, which backs up the per-bet settlement gate.
class TransactionLog {
public:
    bool contains(const std::string& reference) const;
    Transaction append(const std::string& userId,
                       TransactionKind kind,
                       Fixed64 amount,
                       const std::string& reference);

    std::vector<Transaction> forUser(const std::string& userId) const;
    std::vector<Transaction> all() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Transaction> entries_;
    std::unordered_set<std::string> references_;
    std::unordered_map<std::string, std::vector<std::size_t>> byUser_;
};

// Per-user balances. Mutations of one wallet are serialized by that wallet's own
// mutex; different users never contend with each other.
class WalletLedger {
public:
    void open(const std::string& userId, Fixed64 initialBalance);

    // Stake debit. Throws Rejection(InsufficientFunds | UnknownWallet).
    Transaction debit(const std::string& userId, Fixed64 amount, const std::string& reference);
    Transaction credit(const std::string& userId, Fixed64 amount, const std::string& reference);
    Transaction deposit(const std::string& userId, Fixed64 amount, const std::string& reference);

    std::optional<Wallet> find(const std::string& userId) const;
    Fixed64 balance(const std::string& userId) const;

    const TransactionLog& transactions() const { return log_; }

private:
    struct Account {
        mutable std::mutex mutex;
        Wallet wallet;
    };

    Account& account(const std::string& userId) const;
    Transaction apply(const std::string& userId,
                      TransactionKind kind,
                      Fixed64 amount,
                      const std::string& reference);

    mutable std::mutex accountsMutex_;
    std::unordered_map<std::string, std::unique_ptr<Account>> accounts_;
    TransactionLog log_;
};

} // namespace sky
