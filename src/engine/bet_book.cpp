#include "predix/bet_book.hpp"
#include <algorithm>

namespace predix {

Bet BetBook::create(Bet bet) {
    std::lock_guard<std::mutex> lock(mutex_);
    bet.id = next_id_++;
    bet.created_at = std::chrono::system_clock::now();
    bets_[bet.id] = bet;
    return bet;
}

void BetBook::update(const Bet& bet) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bets_.find(bet.id);
    if (it == bets_.end()) {
        throw EngineError(ErrorKind::NotFound, "Bet " + std::to_string(bet.id) + " not found");
    }
    it->second = bet;
}

void BetBook::restore(const Bet& bet) {
    std::lock_guard<std::mutex> lock(mutex_);
    bets_[bet.id] = bet;
    next_id_ = std::max(next_id_, bet.id + 1);
}

std::optional<Bet> BetBook::get(BetId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bets_.find(id);
    if (it == bets_.end()) return std::nullopt;
    return it->second;
}

std::vector<Bet> BetBook::open_bets(MarketId market_id, const std::string& wallet, Side side) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Bet> out;
    for (const auto& [id, bet] : bets_) {
        if (bet.market_id == market_id && bet.wallet == wallet && bet.side == side &&
            bet.status == BetStatus::OPEN && bet.shares > 0.0) {
            out.push_back(bet);
        }
    }
    return out;
}

std::vector<Bet> BetBook::open_bets(MarketId market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Bet> out;
    for (const auto& [id, bet] : bets_) {
        if (bet.market_id == market_id && bet.status == BetStatus::OPEN) {
            out.push_back(bet);
        }
    }
    return out;
}

std::vector<Bet> BetBook::unsettled_bets(MarketId market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Bet> out;
    for (const auto& [id, bet] : bets_) {
        if (bet.market_id == market_id && bet.status == BetStatus::RESOLVED && !bet.payout_settled) {
            out.push_back(bet);
        }
    }
    return out;
}

std::vector<Bet> BetBook::bets_for_market(MarketId market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Bet> out;
    for (const auto& [id, bet] : bets_) {
        if (bet.market_id == market_id) out.push_back(bet);
    }
    return out;
}

std::vector<Bet> BetBook::bets_for_wallet(const std::string& wallet) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Bet> out;
    for (auto it = bets_.rbegin(); it != bets_.rend(); ++it) {
        if (it->second.wallet == wallet) out.push_back(it->second);
    }
    return out;
}

std::vector<Bet> BetBook::all_bets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Bet> out;
    out.reserve(bets_.size());
    for (auto it = bets_.rbegin(); it != bets_.rend(); ++it) {
        out.push_back(it->second);
    }
    return out;
}

size_t BetBook::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bets_.size();
}

} // namespace predix
