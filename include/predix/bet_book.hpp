#pragma once

#include "predix/types.hpp"
#include <map>
#include <mutex>
#include <vector>
#include <optional>

namespace predix {

// Bet records keyed by id.
//
// The book only guards its own map. Bets belonging to a market are mutated
// while the caller holds that market's MarketStore::Guard.
class BetBook {
public:
    BetBook() = default;
    BetBook(const BetBook&) = delete;
    BetBook& operator=(const BetBook&) = delete;

    // Assigns id and creation time
    Bet create(Bet bet);

    // Throws EngineError(NotFound) for an unknown id
    void update(const Bet& bet);

    void restore(const Bet& bet);

    std::optional<Bet> get(BetId id) const;

    // Open bets of one wallet on one market side, oldest first
    std::vector<Bet> open_bets(MarketId market_id, const std::string& wallet, Side side) const;

    // Open bets on a market, oldest first
    std::vector<Bet> open_bets(MarketId market_id) const;

    // Resolved bets whose payout has not been credited yet
    std::vector<Bet> unsettled_bets(MarketId market_id) const;

    std::vector<Bet> bets_for_market(MarketId market_id) const;

    // Newest first
    std::vector<Bet> bets_for_wallet(const std::string& wallet) const;

    // Every bet, newest first
    std::vector<Bet> all_bets() const;

    size_t size() const;

private:
    std::map<BetId, Bet> bets_;
    BetId next_id_ = 1;
    mutable std::mutex mutex_;
};

} // namespace predix
