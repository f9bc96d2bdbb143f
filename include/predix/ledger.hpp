#pragma once

#include "predix/types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <string>
#include <vector>

namespace predix {

// Snapshot of wallet balances
using LedgerState = std::map<std::string, double>;

struct BalanceInfo {
    std::string wallet;
    double balance = 0.0;
    bool is_new_user = false;
};

// Per-wallet balance store.
//
// Each wallet has its own lock, so debits and credits on unrelated wallets
// never block each other. Balances never go negative: debit checks and
// decrements under the wallet's lock. Unknown wallets are provisioned with
// the starting balance on first touch.
class Ledger {
public:
    explicit Ledger(double initial_balance);
    virtual ~Ledger() = default;

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    BalanceInfo balance_of(const std::string& wallet);

    // Returns the new balance. Throws EngineError(InsufficientFunds) when the
    // balance is lower than amount, EngineError(ValidationError) for a bad amount.
    virtual double debit(const std::string& wallet, double amount);

    // Returns the new balance. Throws EngineError(ValidationError) for a bad amount.
    virtual double credit(const std::string& wallet, double amount);

    bool has_wallet(const std::string& wallet) const;
    std::optional<User> get_user(const std::string& wallet) const;
    void set_verified(const std::string& wallet, bool verified);

    // Reinstates a persisted user record as-is
    void restore(const User& user);

    // Newest first
    std::vector<User> users() const;

    LedgerState get_state() const;
    size_t size() const;
    double initial_balance() const { return initial_balance_; }

protected:
    struct Account {
        mutable std::mutex mutex;
        User user;
    };

    std::shared_ptr<Account> find_account(const std::string& wallet) const;
    std::shared_ptr<Account> provision(const std::string& wallet, bool& created);

    static void check_amount(double amount);

private:
    double initial_balance_;
    std::map<std::string, std::shared_ptr<Account>> accounts_;
    mutable std::shared_mutex accounts_mutex_;
};

} // namespace predix
