#include "predix/ledger.hpp"
#include "predix/logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace predix {

Ledger::Ledger(double initial_balance)
    : initial_balance_(initial_balance) {
}

void Ledger::check_amount(double amount) {
    if (!std::isfinite(amount) || amount <= 0.0) {
        throw EngineError(ErrorKind::ValidationError, "Amount must be positive");
    }
}

std::shared_ptr<Ledger::Account> Ledger::find_account(const std::string& wallet) const {
    std::shared_lock<std::shared_mutex> lock(accounts_mutex_);
    auto it = accounts_.find(wallet);
    if (it == accounts_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<Ledger::Account> Ledger::provision(const std::string& wallet, bool& created) {
    created = false;
    if (wallet.empty()) {
        throw EngineError(ErrorKind::ValidationError, "Wallet is required");
    }

    if (auto existing = find_account(wallet)) {
        return existing;
    }

    std::unique_lock<std::shared_mutex> lock(accounts_mutex_);
    auto& slot = accounts_[wallet];
    if (!slot) {
        slot = std::make_shared<Account>();
        slot->user = User{
            .wallet = wallet,
            .balance = initial_balance_,
            .verified = false,
            .created_at = std::chrono::system_clock::now()
        };
        created = true;
        Logger::instance().info("LEDGER", "New wallet ", wallet, " credited with ", initial_balance_);
    }
    return slot;
}

BalanceInfo Ledger::balance_of(const std::string& wallet) {
    bool created = false;
    auto account = provision(wallet, created);

    std::lock_guard<std::mutex> lock(account->mutex);
    return BalanceInfo{.wallet = wallet, .balance = account->user.balance, .is_new_user = created};
}

double Ledger::debit(const std::string& wallet, double amount) {
    check_amount(amount);
    bool created = false;
    auto account = provision(wallet, created);

    std::lock_guard<std::mutex> lock(account->mutex);
    double balance = account->user.balance;
    if (amount > balance) {
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(2)
            << "Insufficient balance. You have " << balance << ", need " << amount;
        throw EngineError(ErrorKind::InsufficientFunds, msg.str());
    }
    account->user.balance = balance - amount;
    return account->user.balance;
}

double Ledger::credit(const std::string& wallet, double amount) {
    check_amount(amount);
    bool created = false;
    auto account = provision(wallet, created);

    std::lock_guard<std::mutex> lock(account->mutex);
    double balance = account->user.balance + amount;
    if (!std::isfinite(balance)) {
        throw EngineError(ErrorKind::Internal, "Balance overflow for " + wallet);
    }
    account->user.balance = balance;
    return balance;
}

bool Ledger::has_wallet(const std::string& wallet) const {
    return find_account(wallet) != nullptr;
}

std::optional<User> Ledger::get_user(const std::string& wallet) const {
    auto account = find_account(wallet);
    if (!account) return std::nullopt;
    std::lock_guard<std::mutex> lock(account->mutex);
    return account->user;
}

void Ledger::set_verified(const std::string& wallet, bool verified) {
    bool created = false;
    auto account = provision(wallet, created);
    std::lock_guard<std::mutex> lock(account->mutex);
    account->user.verified = verified;
}

void Ledger::restore(const User& user) {
    auto account = std::make_shared<Account>();
    account->user = user;
    account->user.balance = std::max(0.0, user.balance);

    std::unique_lock<std::shared_mutex> lock(accounts_mutex_);
    accounts_[user.wallet] = account;
}

std::vector<User> Ledger::users() const {
    std::vector<User> out;
    {
        std::shared_lock<std::shared_mutex> lock(accounts_mutex_);
        for (const auto& [wallet, account] : accounts_) {
            std::lock_guard<std::mutex> account_lock(account->mutex);
            out.push_back(account->user);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const User& a, const User& b) {
        return a.created_at > b.created_at;
    });
    return out;
}

LedgerState Ledger::get_state() const {
    std::shared_lock<std::shared_mutex> lock(accounts_mutex_);
    LedgerState state;
    for (const auto& [wallet, account] : accounts_) {
        std::lock_guard<std::mutex> account_lock(account->mutex);
        state[wallet] = account->user.balance;
    }
    return state;
}

size_t Ledger::size() const {
    std::shared_lock<std::shared_mutex> lock(accounts_mutex_);
    return accounts_.size();
}

} // namespace predix
