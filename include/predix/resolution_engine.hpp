#pragma once

#include "predix/types.hpp"
#include "predix/config.hpp"
#include "predix/market_store.hpp"
#include "predix/ledger.hpp"
#include "predix/bet_book.hpp"
#include <vector>
#include <map>

namespace predix {

class AsyncStateWriter;

struct FailedPayout {
    BetId bet_id = 0;
    std::string wallet;
    double amount = 0.0;         // net credit that did not land
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

struct ResolutionSummary {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    MarketId market_id = 0;
    Side outcome = Side::YES;
    bool payouts_distributed = false;   // every winning bet was credited
    size_t bets_settled = 0;
    size_t payouts_credited = 0;
    double total_payout = 0.0;          // net of fees
    double total_fees = 0.0;
    size_t winners_count = 0;           // distinct winning wallets
    std::vector<FailedPayout> failed_payouts;
};

struct WalletPayout {
    std::string wallet;
    double total_bet = 0.0;
    double total_shares = 0.0;
    double payout = 0.0;
    double fee = 0.0;
    double profit = 0.0;
    std::vector<Bet> bets;
};

struct PayoutReport {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    MarketId market_id = 0;
    Side resolution = Side::YES;
    double total_amount_bet = 0.0;
    double total_payout = 0.0;
    double total_fees = 0.0;
    std::vector<WalletPayout> payouts;
};

// Open -> Resolved transition and payout distribution.
//
// Runs under the same per-market Guard as the trade sequencer. Each bet is
// settled independently: a failed credit is reported and left for
// retry_failed_payouts(), it never undoes payouts already made.
class ResolutionEngine {
public:
    ResolutionEngine(const Config& config, MarketStore& markets, Ledger& ledger, BetBook& bets);

    void set_async_writer(AsyncStateWriter* writer) { writer_ = writer; }

    ResolutionSummary resolve(MarketId market_id, Side outcome);

    // Credits resolved bets whose payout has not landed yet; each bet at most once
    ResolutionSummary retry_failed_payouts(MarketId market_id);

    // Read-only, aggregated per wallet
    PayoutReport payout_report(MarketId market_id) const;

private:
    // Credits one resolved bet; returns false and fills `failure` on error
    bool settle(Bet& bet, FailedPayout& failure);

    void persist_market(const Market& market);
    void persist_bet(const Bet& bet);
    void persist_wallet(const std::string& wallet);

    double fee_rate_;
    MarketStore& markets_;
    Ledger& ledger_;
    BetBook& bets_;
    AsyncStateWriter* writer_ = nullptr;
};

} // namespace predix
