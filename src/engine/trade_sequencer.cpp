#include "predix/trade_sequencer.hpp"
#include "predix/async_state_writer.hpp"
#include "predix/logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <boost/uuid/uuid_io.hpp>

namespace predix {

TradeSequencer::TradeSequencer(const Config& config, MarketStore& markets, Ledger& ledger,
                               BetBook& bets, ResultStore& results)
    : config_(config)
    , pricer_(config)
    , markets_(markets)
    , ledger_(ledger)
    , bets_(bets)
    , results_(results) {
}

TradeSequencer::~TradeSequencer() {
    stop();
}

void TradeSequencer::start() {
    if (running_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }
    worker_ = std::thread(&TradeSequencer::worker_loop, this);
    Logger::instance().info("SEQ", "Trade sequencer started");
}

void TradeSequencer::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    work_cv_.notify_all();
    space_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    Logger::instance().info("SEQ", "Trade sequencer stopped (processed: ", processed_.load(), ")");
}

// ============ SUBMISSION ============

void TradeSequencer::validate(TradeRequest& request) const {
    request.wallet = normalize_wallet(request.wallet);
    if (request.wallet.empty()) {
        throw EngineError(ErrorKind::ValidationError, "Wallet is required");
    }

    switch (request.kind) {
        case TradeKind::BUY:
            if (!std::isfinite(request.amount) || request.amount <= 0.0) {
                throw EngineError(ErrorKind::ValidationError, "Amount must be positive");
            }
            if (request.amount > config_.max_trade_amount) {
                std::ostringstream msg;
                msg << "Amount exceeds maximum of " << config_.max_trade_amount;
                throw EngineError(ErrorKind::ValidationError, msg.str());
            }
            break;

        case TradeKind::SELL:
            if (!std::isfinite(request.shares) || request.shares <= 0.0) {
                throw EngineError(ErrorKind::ValidationError, "Shares must be positive");
            }
            break;

        case TradeKind::UNDO: {
            if (!request.bet_id) {
                throw EngineError(ErrorKind::ValidationError, "Bet id is required for undo");
            }
            auto bet = bets_.get(*request.bet_id);
            if (!bet || bet->wallet != request.wallet) {
                throw EngineError(ErrorKind::NotFound,
                    "Bet " + std::to_string(*request.bet_id) + " not found for " + request.wallet);
            }
            request.market_id = bet->market_id;
            request.side = bet->side;
            break;
        }
    }

    auto market = markets_.get_market(request.market_id);
    if (!market) {
        throw EngineError(ErrorKind::NotFound, "Market " + std::to_string(request.market_id) + " not found");
    }
    if (market->status != MarketStatus::OPEN) {
        throw EngineError(ErrorKind::MarketClosedError,
            "Market " + std::to_string(request.market_id) + " is resolved");
    }
}

Submission TradeSequencer::submit(TradeRequest request) {
    Submission submission;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        request.request_id = boost::uuids::to_string(uuid_gen_());
    }
    request.submitted_at = std::chrono::system_clock::now();
    submission.request_id = request.request_id;

    try {
        validate(request);
    } catch (const EngineError& e) {
        submission.error_kind = e.kind();
        submission.error = e.what();

        TradeResult rejected;
        rejected.request_id = request.request_id;
        rejected.kind = request.kind;
        rejected.error_kind = e.kind();
        rejected.error = e.what();
        rejected.market_id = request.market_id;
        rejected.wallet = request.wallet;
        rejected.side = request.side;
        results_.complete(rejected);

        Logger::instance().warn("SEQ", "Rejected ", trade_kind_name(request.kind), " from '",
                                request.wallet, "': ", e.what());
        return submission;
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        space_cv_.wait(lock, [this] {
            return queue_.size() < config_.max_queue_depth || !running_;
        });
        if (stopped_) {
            submission.error_kind = ErrorKind::Internal;
            submission.error = "Trade sequencer is stopped";
            return submission;
        }
        if (queue_.size() >= config_.max_queue_depth) {
            submission.error_kind = ErrorKind::Internal;
            submission.error = "Trade queue is full";
            return submission;
        }

        request.queue_position = queue_.size() + (in_flight_ ? 1 : 0);
        results_.mark_queued(request);
        queue_.push(request);
    }
    work_cv_.notify_one();

    submission.success = true;
    submission.queue_position = request.queue_position;
    Logger::instance().debug("SEQ", "Queued ", trade_kind_name(request.kind), " ", request.request_id,
                             " at position ", request.queue_position);
    return submission;
}

size_t TradeSequencer::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + (in_flight_ ? 1 : 0);
}

bool TradeSequencer::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !in_flight_; });
}

void TradeSequencer::worker_loop() {
    while (true) {
        TradeRequest request;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

            // Drain what was accepted before stop()
            if (queue_.empty()) break;

            request = queue_.front();
            queue_.pop();
            in_flight_ = true;
        }
        space_cv_.notify_one();

        results_.mark_processing(request.request_id);
        TradeResult result = process(request);
        results_.complete(result);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_ = false;
        }
        processed_++;
        idle_cv_.notify_all();
    }
}

// ============ EXECUTION ============

TradeResult TradeSequencer::process(const TradeRequest& request) {
    TradeResult result;
    result.request_id = request.request_id;
    result.kind = request.kind;
    result.market_id = request.market_id;
    result.wallet = request.wallet;
    result.side = request.side;
    result.queue_position = request.queue_position;

    try {
        switch (request.kind) {
            case TradeKind::BUY:  execute_buy(request, result); break;
            case TradeKind::SELL: execute_sell(request, result); break;
            case TradeKind::UNDO: execute_undo(request, result); break;
        }
        result.success = true;
        result.error_kind = ErrorKind::None;
    } catch (const EngineError& e) {
        result.success = false;
        result.error_kind = e.kind();
        result.error = e.what();
        if (e.kind() == ErrorKind::Internal) {
            Logger::instance().error("SEQ", trade_kind_name(request.kind), " ", request.request_id,
                                     " failed: ", e.what());
        } else {
            Logger::instance().warn("SEQ", trade_kind_name(request.kind), " ", request.request_id,
                                    " rejected: ", e.what());
        }
    } catch (const std::exception& e) {
        result.success = false;
        result.error_kind = ErrorKind::Internal;
        result.error = e.what();
        Logger::instance().error("SEQ", trade_kind_name(request.kind), " ", request.request_id,
                                 " failed: ", e.what());
    }

    return result;
}

void TradeSequencer::execute_buy(const TradeRequest& request, TradeResult& result) {
    auto guard = markets_.lock(request.market_id);
    if (guard.market().status != MarketStatus::OPEN) {
        throw EngineError(ErrorKind::MarketClosedError,
            "Market " + std::to_string(request.market_id) + " is resolved");
    }

    MarketState before = guard.state();
    BuyQuote quote = pricer_.quote_buy(before, request.side, request.amount);

    // Nothing has changed if the debit fails
    double balance = ledger_.debit(request.wallet, request.amount);

    try {
        guard.apply(quote.delta_yes, quote.delta_no);
    } catch (const std::exception&) {
        ledger_.credit(request.wallet, request.amount);
        throw;
    }

    Bet bet;
    bet.market_id = request.market_id;
    bet.wallet = request.wallet;
    bet.side = request.side;
    bet.amount = request.amount;
    bet.shares = quote.shares;
    bet.avg_price = quote.avg_price;
    bet.state_before = before;
    bet.trade_seq_after = guard.trade_seq();
    bet = bets_.create(bet);

    result.bet_id = bet.id;
    result.amount = request.amount;
    result.shares = quote.shares;
    result.price = quote.avg_price;
    result.balance_after = balance;
    result.price_after = pricer_.prices(guard.state());

    persist_wallet(request.wallet);
    persist_state(guard.state());
    persist_bet(bet);

    Logger::instance().info("SEQ", "Bet ", bet.id, ": ", request.wallet, " bought ", quote.shares, " ",
                            side_name(request.side), " on market ", request.market_id, " for ",
                            request.amount, " (yes now ", result.price_after.yes, ")");
}

void TradeSequencer::execute_sell(const TradeRequest& request, TradeResult& result) {
    auto guard = markets_.lock(request.market_id);
    if (guard.market().status != MarketStatus::OPEN) {
        throw EngineError(ErrorKind::MarketClosedError,
            "Market " + std::to_string(request.market_id) + " is resolved");
    }

    Side side = request.side;
    std::vector<Bet> sources;
    if (request.bet_id) {
        auto bet = bets_.get(*request.bet_id);
        if (!bet || bet->wallet != request.wallet || bet->market_id != request.market_id) {
            throw EngineError(ErrorKind::NotFound,
                "Bet " + std::to_string(*request.bet_id) + " not found for " + request.wallet);
        }
        if (bet->status != BetStatus::OPEN || bet->shares <= 0.0) {
            throw EngineError(ErrorKind::InsufficientShares,
                "Bet " + std::to_string(bet->id) + " has no open shares");
        }
        side = bet->side;
        sources.push_back(*bet);
    } else {
        sources = bets_.open_bets(request.market_id, request.wallet, side);
    }

    double held = 0.0;
    for (const auto& bet : sources) {
        held += bet.shares;
    }

    if (held <= 0.0) {
        throw EngineError(ErrorKind::InsufficientShares,
            std::string("No open ") + side_name(side) + " shares to sell on market " +
            std::to_string(request.market_id));
    }
    if (request.shares > held + config_.dust_shares) {
        std::ostringstream msg;
        msg << "Insufficient shares. You hold " << held << " " << side_name(side)
            << ", tried to sell " << request.shares;
        throw EngineError(ErrorKind::InsufficientShares, msg.str());
    }

    // Oldest first; a remainder below dust goes with the sale
    std::vector<double> takes;
    double remaining = std::min(request.shares, held);
    double total = 0.0;
    for (const auto& bet : sources) {
        if (remaining <= 0.0) break;
        double take = std::min(bet.shares, remaining);
        if (bet.shares - take < config_.dust_shares) {
            take = bet.shares;
        }
        takes.push_back(take);
        remaining -= take;
        total += take;
    }

    if (total <= 0.0) {
        throw EngineError(ErrorKind::InsufficientShares, "Nothing to sell");
    }

    SellQuote quote = pricer_.quote_sell(guard.state(), side, total);
    guard.apply(quote.delta_yes, quote.delta_no);

    double balance;
    try {
        balance = ledger_.credit(request.wallet, quote.proceeds);
    } catch (const std::exception&) {
        guard.apply(-quote.delta_yes, -quote.delta_no);
        throw;
    }

    for (size_t i = 0; i < takes.size(); ++i) {
        Bet bet = sources[i];
        double take = takes[i];
        double fraction = take / bet.shares;

        bet.sold_shares += take;
        bet.sale_proceeds += quote.proceeds * (take / total);
        if (take >= bet.shares) {
            bet.shares = 0.0;
            bet.amount = 0.0;
            bet.status = BetStatus::CLOSED_BY_SALE;
        } else {
            bet.shares -= take;
            bet.amount -= bet.amount * fraction;
        }
        bets_.update(bet);
        persist_bet(bet);
    }

    result.side = side;
    result.bet_id = sources.front().id;
    result.shares = total;
    result.proceeds = quote.proceeds;
    result.price = quote.avg_price;
    result.balance_after = balance;
    result.price_after = pricer_.prices(guard.state());

    persist_wallet(request.wallet);
    persist_state(guard.state());

    Logger::instance().info("SEQ", request.wallet, " sold ", total, " ", side_name(side), " on market ",
                            request.market_id, " for ", quote.proceeds);
}

void TradeSequencer::execute_undo(const TradeRequest& request, TradeResult& result) {
    auto guard = markets_.lock(request.market_id);
    if (guard.market().status != MarketStatus::OPEN) {
        throw EngineError(ErrorKind::MarketClosedError,
            "Market " + std::to_string(request.market_id) + " is resolved");
    }

    // Re-read under the market lock
    auto found = bets_.get(*request.bet_id);
    if (!found || found->wallet != request.wallet) {
        throw EngineError(ErrorKind::NotFound,
            "Bet " + std::to_string(*request.bet_id) + " not found for " + request.wallet);
    }
    Bet bet = *found;

    if (bet.status != BetStatus::OPEN || bet.sold_shares > 0.0) {
        throw EngineError(ErrorKind::UndoConflict,
            "Bet " + std::to_string(bet.id) + " is " + bet_status_name(bet.status) +
            (bet.sold_shares > 0.0 ? " and partially sold" : ""));
    }
    if (guard.trade_seq() != bet.trade_seq_after) {
        throw EngineError(ErrorKind::UndoConflict,
            "Market " + std::to_string(bet.market_id) + " has traded since bet " + std::to_string(bet.id));
    }

    const MarketState& current = guard.state();
    guard.apply(bet.state_before.q_yes - current.q_yes, bet.state_before.q_no - current.q_no);

    double balance = ledger_.credit(bet.wallet, bet.amount);

    double refunded = bet.amount;
    double reversed = bet.shares;
    bet.status = BetStatus::VOID;
    bets_.update(bet);

    result.bet_id = bet.id;
    result.amount = refunded;
    result.shares = reversed;
    result.price = bet.avg_price;
    result.balance_after = balance;
    result.price_after = pricer_.prices(guard.state());

    persist_wallet(bet.wallet);
    persist_state(guard.state());
    persist_bet(bet);

    Logger::instance().info("SEQ", "Bet ", bet.id, " undone: refunded ", refunded, " to ", bet.wallet);
}

// ============ PERSISTENCE ============

void TradeSequencer::persist_wallet(const std::string& wallet) {
    if (!writer_) return;
    if (auto user = ledger_.get_user(wallet)) {
        writer_->queue_record(*user);
    }
}

void TradeSequencer::persist_state(const MarketState& state) {
    if (writer_) writer_->queue_record(state);
}

void TradeSequencer::persist_bet(const Bet& bet) {
    if (writer_) writer_->queue_record(bet);
}

} // namespace predix
