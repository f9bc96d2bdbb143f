#pragma once

#include "predix/types.hpp"
#include "predix/config.hpp"
#include "predix/pricing.hpp"
#include "predix/market_store.hpp"
#include "predix/ledger.hpp"
#include "predix/bet_book.hpp"
#include "predix/result_store.hpp"
#include "predix/trade_sequencer.hpp"
#include "predix/resolution_engine.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace predix {

class Database;
class AsyncStateWriter;

struct CreateMarketResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    Market market;
};

struct PreviewResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    MarketId market_id = 0;
    Side side = Side::YES;
    double amount = 0.0;
    double shares = 0.0;
    double avg_price = 0.0;
    PriceQuote price_before;
    PriceQuote price_after;
    size_t queue_depth = 0;     // trades that will run before one submitted now
};

struct PriceResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    MarketId market_id = 0;
    MarketStatus status = MarketStatus::OPEN;
    PriceQuote prices;
};

struct BalanceResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    std::string wallet;
    double balance = 0.0;
    bool is_new_user = false;
    bool verified = false;
};

struct MarketSummary {
    Market market;
    MarketState state;
    PriceQuote prices;          // final (1/0) once resolved
    double total_yes = 0.0;     // amount staked, void bets excluded
    double total_no = 0.0;
    size_t bet_count = 0;
};

struct BetView {
    Bet bet;
    std::string question;
    double current_price = 0.0;
    double current_value = 0.0;
    double unrealized_profit = 0.0;
};

struct SlippageReport {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    RequestId request_id;
    BetId bet_id = 0;
    double previewed_shares = 0.0;
    double realized_shares = 0.0;
    double relative_difference = 0.0;
    bool undo_recommended = false;
};

struct UserSummary {
    std::string wallet;
    double balance = 0.0;
    bool verified = false;
    Timestamp created_at;
    size_t total_bets = 0;          // void bets excluded
    double total_bet_amount = 0.0;
    size_t open_positions = 0;      // open bets on open markets
};

struct ActivityEntry {
    Bet bet;
    std::string question;
    double current_probability = 0.0;   // YES price in percent
};

struct EngineStatus {
    bool running = false;
    bool persistence = false;
    size_t markets_open = 0;
    size_t markets_resolved = 0;
    size_t wallets = 0;
    size_t bets = 0;
    size_t pending_trades = 0;
    uint64_t processed_trades = 0;
    size_t stored_results = 0;
    size_t pending_writes = 0;
    int64_t uptime_seconds = 0;
};

// Entry point for everything outside the core: owns the stores, the
// sequencer and the resolution engine and wires them together.
class MarketEngine {
public:
    explicit MarketEngine(Config config);

    // Ledger replacement, e.g. one that records or fails credits
    MarketEngine(Config config, std::unique_ptr<Ledger> ledger);
    ~MarketEngine();

    MarketEngine(const MarketEngine&) = delete;
    MarketEngine& operator=(const MarketEngine&) = delete;
    MarketEngine(MarketEngine&&) = delete;
    MarketEngine& operator=(MarketEngine&&) = delete;

    void start();
    void stop();
    bool is_running() const { return sequencer_.is_running(); }

    const Config& config() const { return config_; }

    // ============ PERSISTENCE ============

    // Restores markets, users and bets; returns the number of rows loaded
    size_t load_from(Database& db);

    // Writes every later mutation through to db on a background thread
    void enable_persistence(Database& db);

    // ============ MARKETS ============

    CreateMarketResult create_market(const MarketSpec& spec);
    std::vector<MarketSummary> list_markets(std::optional<MarketStatus> status = std::nullopt) const;
    PriceResult get_price(MarketId market_id) const;

    // Non-mutating quote against the current state
    PreviewResult preview_trade(MarketId market_id, Side side, double amount) const;

    // ============ TRADES ============

    Submission submit_trade(TradeRequest request);
    Submission submit_buy(const std::string& wallet, MarketId market_id, Side side, double amount);
    Submission submit_sell(const std::string& wallet, MarketId market_id, Side side, double shares,
                           std::optional<BetId> bet_id = std::nullopt);
    Submission submit_undo(const std::string& wallet, BetId bet_id);

    PollResult poll_result(const RequestId& request_id);

    // Compares a completed buy with the shares the caller was shown beforehand
    SlippageReport check_slippage(const RequestId& request_id, double previewed_shares);

    // For tests and shutdown: true once every submitted trade has a result
    bool wait_idle(std::chrono::milliseconds timeout);

    // ============ RESOLUTION ============

    ResolutionSummary resolve_market(MarketId market_id, Side outcome);
    ResolutionSummary retry_payouts(MarketId market_id);
    PayoutReport payout_report(MarketId market_id) const;

    // ============ WALLETS ============

    BalanceResult get_balance(const std::string& wallet);
    BalanceResult credit_wallet(const std::string& wallet, double amount);
    BalanceResult set_verified(const std::string& wallet, bool verified);

    // Newest first, valued at current prices
    std::vector<BetView> list_bets(const std::string& wallet) const;

    // Every wallet with its betting totals, newest first
    std::vector<UserSummary> list_users() const;

    // Latest bets on open markets, newest first
    std::vector<ActivityEntry> recent_activity(size_t limit = 50) const;

    EngineStatus get_status() const;

    // Direct state access for inspection
    const MarketStore& markets() const { return markets_; }
    const Ledger& ledger() const { return *ledger_; }
    const BetBook& bets() const { return bets_; }

private:
    void persist_wallet(const std::string& wallet);

    // Live prices while open, final (1/0) once resolved
    PriceQuote display_prices(const Market& market, const MarketState& state) const;

    Config config_;
    LmsrPricer pricer_;
    MarketStore markets_;
    std::unique_ptr<Ledger> ledger_;
    BetBook bets_;
    ResultStore results_;
    TradeSequencer sequencer_;
    ResolutionEngine resolution_;
    std::unique_ptr<AsyncStateWriter> writer_;
    std::chrono::system_clock::time_point start_time_;
};

} // namespace predix
