#include "predix/market_engine.hpp"
#include "predix/async_state_writer.hpp"
#include "predix/database.hpp"
#include "predix/logger.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace predix {

MarketEngine::MarketEngine(Config config)
    : MarketEngine(config, std::make_unique<Ledger>(config.initial_balance)) {
}

MarketEngine::MarketEngine(Config config, std::unique_ptr<Ledger> ledger)
    : config_(std::move(config))
    , pricer_(config_)
    , markets_(config_.lmsr_buffer)
    , ledger_(std::move(ledger))
    , results_(std::chrono::milliseconds(config_.result_ttl_ms), config_.max_results)
    , sequencer_(config_, markets_, *ledger_, bets_, results_)
    , resolution_(config_, markets_, *ledger_, bets_)
    , start_time_(std::chrono::system_clock::now()) {
}

MarketEngine::~MarketEngine() {
    stop();
}

void MarketEngine::start() {
    start_time_ = std::chrono::system_clock::now();
    if (writer_) writer_->start();
    sequencer_.start();
    Logger::instance().info("ENGINE", "Market engine started (b=", config_.lmsr_b,
                            ", buffer=", config_.lmsr_buffer, ")");
}

void MarketEngine::stop() {
    if (!sequencer_.is_running()) return;
    sequencer_.stop();
    if (writer_) writer_->stop();
    Logger::instance().info("ENGINE", "Market engine stopped");
}

// ============ PERSISTENCE ============

size_t MarketEngine::load_from(Database& db) {
    std::map<MarketId, MarketState> states;
    for (const auto& state : db.load_market_states()) {
        states[state.market_id] = state;
    }

    std::vector<Bet> bets = db.load_bets();
    std::map<MarketId, uint64_t> last_seq;
    for (const auto& bet : bets) {
        last_seq[bet.market_id] = std::max(last_seq[bet.market_id], bet.trade_seq_after);
    }

    size_t rows = 0;
    for (const auto& market : db.load_markets()) {
        MarketState state{.market_id = market.id, .q_yes = config_.lmsr_buffer, .q_no = config_.lmsr_buffer};
        auto it = states.find(market.id);
        if (it != states.end()) {
            state = it->second;
        } else {
            Logger::instance().warn("ENGINE", "Market ", market.id, " has no stored state, starting at buffer");
        }

        // A sequence behind its own bets means it was never stored; no stored bet may match it
        auto seq = last_seq.find(market.id);
        if (seq != last_seq.end() && state.trade_seq < seq->second) {
            Logger::instance().warn("ENGINE", "Market ", market.id, " trade sequence ", state.trade_seq,
                                    " is behind its bets, advancing to ", seq->second + 1);
            state.trade_seq = seq->second + 1;
        }

        markets_.restore(market, state);
        rows++;
    }

    for (const auto& user : db.load_users()) {
        ledger_->restore(user);
        rows++;
    }

    for (const auto& bet : bets) {
        bets_.restore(bet);
        rows++;
    }

    Logger::instance().info("ENGINE", "Loaded ", markets_.size(), " markets, ", ledger_->size(),
                            " wallets, ", bets_.size(), " bets");
    return rows;
}

void MarketEngine::enable_persistence(Database& db) {
    if (writer_) return;
    writer_ = std::make_unique<AsyncStateWriter>(db);
    sequencer_.set_async_writer(writer_.get());
    resolution_.set_async_writer(writer_.get());
    if (sequencer_.is_running()) writer_->start();
}

void MarketEngine::persist_wallet(const std::string& wallet) {
    if (!writer_) return;
    if (auto user = ledger_->get_user(wallet)) {
        writer_->queue_record(*user);
    }
}

// ============ MARKETS ============

CreateMarketResult MarketEngine::create_market(const MarketSpec& spec) {
    CreateMarketResult result;
    try {
        result.market = markets_.create_market(spec);
        result.success = true;
    } catch (const EngineError& e) {
        result.error_kind = e.kind();
        result.error = e.what();
        return result;
    }

    if (writer_) {
        writer_->queue_record(result.market);
        if (auto state = markets_.get(result.market.id)) {
            writer_->queue_record(*state);
        }
    }
    return result;
}

std::vector<MarketSummary> MarketEngine::list_markets(std::optional<MarketStatus> status) const {
    std::vector<MarketSummary> out;
    for (const auto& market : markets_.list_markets(status)) {
        MarketSummary summary;
        summary.market = market;
        summary.state = markets_.get(market.id).value_or(MarketState{.market_id = market.id});

        summary.prices = display_prices(market, summary.state);

        for (const auto& bet : bets_.bets_for_market(market.id)) {
            if (bet.status == BetStatus::VOID) continue;
            (bet.side == Side::YES ? summary.total_yes : summary.total_no) += bet.amount;
            summary.bet_count++;
        }
        out.push_back(summary);
    }
    return out;
}

PriceResult MarketEngine::get_price(MarketId market_id) const {
    PriceResult result;
    result.market_id = market_id;

    auto market = markets_.get_market(market_id);
    auto state = markets_.get(market_id);
    if (!market || !state) {
        result.error_kind = ErrorKind::NotFound;
        result.error = "Market " + std::to_string(market_id) + " not found";
        return result;
    }

    result.status = market->status;
    result.prices = display_prices(*market, *state);
    result.success = true;
    return result;
}

PreviewResult MarketEngine::preview_trade(MarketId market_id, Side side, double amount) const {
    PreviewResult result;
    result.market_id = market_id;
    result.side = side;
    result.amount = amount;

    try {
        auto market = markets_.get_market(market_id);
        auto state = markets_.get(market_id);
        if (!market || !state) {
            throw EngineError(ErrorKind::NotFound, "Market " + std::to_string(market_id) + " not found");
        }
        if (market->status != MarketStatus::OPEN) {
            throw EngineError(ErrorKind::MarketClosedError,
                "Market " + std::to_string(market_id) + " is resolved");
        }
        if (amount > config_.max_trade_amount) {
            throw EngineError(ErrorKind::ValidationError, "Amount exceeds maximum");
        }

        BuyQuote quote = pricer_.quote_buy(*state, side, amount);
        result.shares = quote.shares;
        result.avg_price = quote.avg_price;
        result.price_before = quote.price_before;
        result.price_after = quote.price_after;
        result.queue_depth = sequencer_.pending();
        result.success = true;
    } catch (const EngineError& e) {
        result.error_kind = e.kind();
        result.error = e.what();
    }
    return result;
}

// ============ TRADES ============

Submission MarketEngine::submit_trade(TradeRequest request) {
    return sequencer_.submit(std::move(request));
}

Submission MarketEngine::submit_buy(const std::string& wallet, MarketId market_id, Side side, double amount) {
    TradeRequest request;
    request.kind = TradeKind::BUY;
    request.wallet = wallet;
    request.market_id = market_id;
    request.side = side;
    request.amount = amount;
    return sequencer_.submit(std::move(request));
}

Submission MarketEngine::submit_sell(const std::string& wallet, MarketId market_id, Side side, double shares,
                                     std::optional<BetId> bet_id) {
    TradeRequest request;
    request.kind = TradeKind::SELL;
    request.wallet = wallet;
    request.market_id = market_id;
    request.side = side;
    request.shares = shares;
    request.bet_id = bet_id;
    return sequencer_.submit(std::move(request));
}

Submission MarketEngine::submit_undo(const std::string& wallet, BetId bet_id) {
    TradeRequest request;
    request.kind = TradeKind::UNDO;
    request.wallet = wallet;
    request.bet_id = bet_id;
    return sequencer_.submit(std::move(request));
}

PollResult MarketEngine::poll_result(const RequestId& request_id) {
    return results_.poll(request_id);
}

SlippageReport MarketEngine::check_slippage(const RequestId& request_id, double previewed_shares) {
    SlippageReport report;
    report.request_id = request_id;
    report.previewed_shares = previewed_shares;

    if (!std::isfinite(previewed_shares) || previewed_shares <= 0.0) {
        report.error_kind = ErrorKind::ValidationError;
        report.error = "Previewed shares must be positive";
        return report;
    }

    PollResult polled = results_.poll(request_id);
    if (!polled.found) {
        report.error_kind = polled.error_kind;
        report.error = polled.error;
        return report;
    }
    if (!polled.result) {
        report.error_kind = ErrorKind::ValidationError;
        report.error = std::string("Trade is still ") + request_status_name(polled.status);
        return report;
    }

    const TradeResult& trade = *polled.result;
    if (trade.kind != TradeKind::BUY || !trade.success) {
        report.error_kind = ErrorKind::ValidationError;
        report.error = "Slippage applies to completed buys only";
        return report;
    }

    report.bet_id = trade.bet_id;
    report.realized_shares = trade.shares;
    report.relative_difference = std::abs(trade.shares - previewed_shares) / previewed_shares;
    report.undo_recommended = report.relative_difference > config_.slippage_threshold;
    report.success = true;
    return report;
}

bool MarketEngine::wait_idle(std::chrono::milliseconds timeout) {
    return sequencer_.wait_idle(timeout);
}

// ============ RESOLUTION ============

ResolutionSummary MarketEngine::resolve_market(MarketId market_id, Side outcome) {
    return resolution_.resolve(market_id, outcome);
}

ResolutionSummary MarketEngine::retry_payouts(MarketId market_id) {
    return resolution_.retry_failed_payouts(market_id);
}

PayoutReport MarketEngine::payout_report(MarketId market_id) const {
    return resolution_.payout_report(market_id);
}

// ============ WALLETS ============

BalanceResult MarketEngine::get_balance(const std::string& wallet) {
    BalanceResult result;
    result.wallet = normalize_wallet(wallet);
    try {
        BalanceInfo info = ledger_->balance_of(result.wallet);
        result.balance = info.balance;
        result.is_new_user = info.is_new_user;
        result.verified = ledger_->get_user(result.wallet).value_or(User{}).verified;
        result.success = true;
        if (info.is_new_user) persist_wallet(result.wallet);
    } catch (const EngineError& e) {
        result.error_kind = e.kind();
        result.error = e.what();
    }
    return result;
}

BalanceResult MarketEngine::credit_wallet(const std::string& wallet, double amount) {
    BalanceResult result;
    result.wallet = normalize_wallet(wallet);
    try {
        if (result.wallet.empty()) {
            throw EngineError(ErrorKind::ValidationError, "Wallet is required");
        }
        result.is_new_user = !ledger_->has_wallet(result.wallet);
        result.balance = ledger_->credit(result.wallet, amount);
        result.verified = ledger_->get_user(result.wallet).value_or(User{}).verified;
        result.success = true;
        persist_wallet(result.wallet);
        Logger::instance().info("LEDGER", "Credited ", amount, " to ", result.wallet,
                                " (balance ", result.balance, ")");
    } catch (const EngineError& e) {
        result.error_kind = e.kind();
        result.error = e.what();
    }
    return result;
}

BalanceResult MarketEngine::set_verified(const std::string& wallet, bool verified) {
    BalanceResult result;
    result.wallet = normalize_wallet(wallet);
    try {
        result.is_new_user = !ledger_->has_wallet(result.wallet);
        ledger_->set_verified(result.wallet, verified);
        auto user = ledger_->get_user(result.wallet).value_or(User{});
        result.balance = user.balance;
        result.verified = user.verified;
        result.success = true;
        persist_wallet(result.wallet);
        Logger::instance().info("LEDGER", result.wallet, (verified ? " verified" : " unverified"));
    } catch (const EngineError& e) {
        result.error_kind = e.kind();
        result.error = e.what();
    }
    return result;
}

std::vector<BetView> MarketEngine::list_bets(const std::string& wallet) const {
    std::vector<BetView> out;
    std::map<MarketId, std::pair<std::string, PriceQuote>> market_cache;

    for (const auto& bet : bets_.bets_for_wallet(normalize_wallet(wallet))) {
        auto cached = market_cache.find(bet.market_id);
        if (cached == market_cache.end()) {
            auto market = markets_.get_market(bet.market_id);
            auto state = markets_.get(bet.market_id);
            PriceQuote prices = state ? pricer_.prices(*state) : PriceQuote{};
            cached = market_cache.emplace(bet.market_id,
                std::make_pair(market ? market->question : std::string(), prices)).first;
        }

        BetView view;
        view.bet = bet;
        view.question = cached->second.first;

        switch (bet.status) {
            case BetStatus::OPEN:
                view.current_price = cached->second.second.of(bet.side);
                view.current_value = bet.shares * view.current_price;
                view.unrealized_profit = view.current_value - bet.amount;
                break;
            case BetStatus::RESOLVED:
                view.current_price = bet.result == BetResult::WON ? 1.0 : 0.0;
                view.current_value = bet.payout - bet.fee;
                break;
            case BetStatus::CLOSED_BY_SALE:
            case BetStatus::VOID:
                break;
        }
        out.push_back(view);
    }
    return out;
}

std::vector<UserSummary> MarketEngine::list_users() const {
    std::map<std::string, UserSummary> totals;
    std::map<MarketId, bool> open_markets;

    for (const auto& bet : bets_.all_bets()) {
        if (bet.status == BetStatus::VOID) continue;
        auto& summary = totals[bet.wallet];
        summary.total_bets++;
        summary.total_bet_amount += bet.amount;

        if (bet.status != BetStatus::OPEN || bet.shares <= 0.0) continue;
        auto open = open_markets.find(bet.market_id);
        if (open == open_markets.end()) {
            auto market = markets_.get_market(bet.market_id);
            open = open_markets.emplace(bet.market_id,
                market && market->status == MarketStatus::OPEN).first;
        }
        if (open->second) summary.open_positions++;
    }

    std::vector<UserSummary> out;
    for (const auto& user : ledger_->users()) {
        UserSummary summary;
        auto it = totals.find(user.wallet);
        if (it != totals.end()) summary = it->second;
        summary.wallet = user.wallet;
        summary.balance = user.balance;
        summary.verified = user.verified;
        summary.created_at = user.created_at;
        out.push_back(summary);
    }
    return out;
}

std::vector<ActivityEntry> MarketEngine::recent_activity(size_t limit) const {
    std::vector<ActivityEntry> out;
    std::map<MarketId, std::optional<std::pair<std::string, double>>> market_cache;

    for (const auto& bet : bets_.all_bets()) {
        if (out.size() >= limit) break;
        if (bet.status == BetStatus::VOID) continue;

        auto cached = market_cache.find(bet.market_id);
        if (cached == market_cache.end()) {
            std::optional<std::pair<std::string, double>> entry;
            auto market = markets_.get_market(bet.market_id);
            auto state = markets_.get(bet.market_id);
            if (market && state && market->status == MarketStatus::OPEN) {
                entry = std::make_pair(market->question, pricer_.prices(*state).yes);
            }
            cached = market_cache.emplace(bet.market_id, entry).first;
        }
        if (!cached->second) continue;

        ActivityEntry activity;
        activity.bet = bet;
        activity.question = cached->second->first;
        activity.current_probability = std::round(cached->second->second * 1000.0) / 10.0;
        out.push_back(activity);
    }
    return out;
}

PriceQuote MarketEngine::display_prices(const Market& market, const MarketState& state) const {
    if (market.status == MarketStatus::RESOLVED && market.resolution) {
        PriceQuote prices;
        prices.yes = *market.resolution == Side::YES ? 1.0 : 0.0;
        prices.no = 1.0 - prices.yes;
        return prices;
    }
    return pricer_.prices(state);
}

EngineStatus MarketEngine::get_status() const {
    EngineStatus status;
    status.running = sequencer_.is_running();
    status.persistence = writer_ != nullptr;
    for (const auto& market : markets_.list_markets()) {
        (market.status == MarketStatus::OPEN ? status.markets_open : status.markets_resolved)++;
    }
    status.wallets = ledger_->size();
    status.bets = bets_.size();
    status.pending_trades = sequencer_.pending();
    status.processed_trades = sequencer_.processed_count();
    status.stored_results = results_.size();
    status.pending_writes = writer_ ? writer_->pending_count() : 0;
    status.uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - start_time_).count();
    return status;
}

} // namespace predix
