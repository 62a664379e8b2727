#include "wallet.hpp"

#include "errors.hpp"

#include <stdexcept>

namespace sky {

const char* toString(TransactionKind kind) {
    switch (kind) {
    case TransactionKind::Bet:
        return "bet";
    case TransactionKind::Win:
        return "win";
    case TransactionKind::Deposit:
        return "deposit";
    }
    return "unknown";
}

bool TransactionLog::contains(const std::string& reference) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return references_.count(reference) != 0;
}

Transaction TransactionLog::append(const std::string& userId,
                                   TransactionKind kind,
                                   Fixed64 amount,
                                   const std::string& reference) {
    if (reference.empty()) {
        throw std::invalid_argument("transaction reference must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!references_.insert(reference).second) {
        throw std::logic_error("transaction reference already recorded: " + reference);
    }

    Transaction tx;
    tx.id = entries_.size() + 1;
    tx.userId = userId;
    tx.kind = kind;
    tx.amount = amount;
    tx.reference = reference;
    tx.createdAt = std::chrono::system_clock::now();
    try {
        byUser_[userId].push_back(entries_.size());
        entries_.push_back(tx);
    } catch (...) {
        references_.erase(reference);
        throw;
    }
    return tx;
}

std::vector<Transaction> TransactionLog::forUser(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transaction> out;
    auto it = byUser_.find(userId);
    if (it == byUser_.end()) {
        return out;
    }
    out.reserve(it->second.size());
    for (std::size_t idx : it->second) {
        out.push_back(entries_[idx]);
    }
    return out;
}

std::vector<Transaction> TransactionLog::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t TransactionLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void WalletLedger::open(const std::string& userId, Fixed64 initialBalance) {
    if (userId.empty()) {
        throw std::invalid_argument("userId must not be empty");
    }
    if (initialBalance < Fixed64()) {
        throw std::invalid_argument("initial balance must not be negative");
    }

    auto acct = std::make_unique<Account>();
    acct->wallet.userId = userId;
    acct->wallet.balance = initialBalance;

    std::lock_guard<std::mutex> lock(accountsMutex_);
    if (!accounts_.emplace(userId, std::move(acct)).second) {
        throw std::invalid_argument("wallet already exists for user " + userId);
    }
}

WalletLedger::Account& WalletLedger::account(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(accountsMutex_);
    auto it = accounts_.find(userId);
    if (it == accounts_.end()) {
        throw Rejection(RejectReason::UnknownWallet, "no wallet for user " + userId);
    }
    // Accounts are never erased, so the reference stays valid after the lock drops.
    return *it->second;
}

Transaction WalletLedger::apply(const std::string& userId,
                                TransactionKind kind,
                                Fixed64 amount,
                                const std::string& reference) {
    if (amount <= Fixed64()) {
        throw Rejection(RejectReason::InvalidAmount, "amount must be positive");
    }

    Account& acct = account(userId);
    std::lock_guard<std::mutex> lock(acct.mutex);
    Wallet next = acct.wallet;

    switch (kind) {
    case TransactionKind::Bet:
        if (next.balance < amount) {
            throw Rejection(RejectReason::InsufficientFunds,
                            "balance " + next.balance.toString() + " below stake " +
                                amount.toString());
        }
        next.balance -= amount;
        next.totalWagered += amount;
        break;
    case TransactionKind::Win:
        next.balance += amount;
        next.totalWon += amount;
        break;
    case TransactionKind::Deposit:
        next.balance += amount;
        next.totalDeposited += amount;
        break;
    }

    if (next.balance < Fixed64()) {
        throw std::logic_error("wallet balance would go negative for user " + userId);
    }

    // The ledger entry is the only step that can still fail; the wallet is
    // rewritten only after it lands.
    Transaction tx = log_.append(userId, kind, amount, reference);
    acct.wallet = next;
    return tx;
}

Transaction WalletLedger::debit(const std::string& userId,
                                Fixed64 amount,
                                const std::string& reference) {
    return apply(userId, TransactionKind::Bet, amount, reference);
}

Transaction WalletLedger::credit(const std::string& userId,
                                 Fixed64 amount,
                                 const std::string& reference) {
    return apply(userId, TransactionKind::Win, amount, reference);
}

Transaction WalletLedger::deposit(const std::string& userId,
                                  Fixed64 amount,
                                  const std::string& reference) {
    return apply(userId, TransactionKind::Deposit, amount, reference);
}

std::optional<Wallet> WalletLedger::find(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(accountsMutex_);
    auto it = accounts_.find(userId);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> acctLock(it->second->mutex);
    return it->second->wallet;
}

Fixed64 WalletLedger::balance(const std::string& userId) const {
    Account& acct = account(userId);
    std::lock_guard<std::mutex> lock(acct.mutex);
    return acct.wallet.balance;
}

} // namespace sky
