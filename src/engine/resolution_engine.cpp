#include "predix/resolution_engine.hpp"
#include "predix/async_state_writer.hpp"
#include "predix/logger.hpp"
#include <algorithm>
#include <set>

namespace predix {

ResolutionEngine::ResolutionEngine(const Config& config, MarketStore& markets, Ledger& ledger, BetBook& bets)
    : fee_rate_(config.profit_fee_rate)
    , markets_(markets)
    , ledger_(ledger)
    , bets_(bets) {
}

bool ResolutionEngine::settle(Bet& bet, FailedPayout& failure) {
    double net = bet.payout - bet.fee;

    try {
        if (net > 0.0) {
            double balance = ledger_.credit(bet.wallet, net);
            Logger::instance().info("PAYOUT", "Bet ", bet.id, ": ", bet.wallet, " gross ", bet.payout,
                                    " fee ", bet.fee, " net ", net, " (balance ", balance, ")");
            persist_wallet(bet.wallet);
        }
        bet.payout_settled = true;
        bets_.update(bet);
        persist_bet(bet);
        return true;
    } catch (const EngineError& e) {
        failure.error_kind = e.kind();
        failure.error = e.what();
    } catch (const std::exception& e) {
        failure.error_kind = ErrorKind::Internal;
        failure.error = e.what();
    }

    failure.bet_id = bet.id;
    failure.wallet = bet.wallet;
    failure.amount = net;
    Logger::instance().error("PAYOUT", "Payout for bet ", bet.id, " to ", bet.wallet,
                             " failed: ", failure.error);
    return false;
}

ResolutionSummary ResolutionEngine::resolve(MarketId market_id, Side outcome) {
    ResolutionSummary summary;
    summary.market_id = market_id;
    summary.outcome = outcome;

    try {
        auto guard = markets_.lock(market_id);
        guard.mark_resolved(outcome);
        persist_market(guard.market());
        Logger::instance().info("RESOLVE", "Market ", market_id, " resolved as ", side_name(outcome));

        std::set<std::string> winners;
        for (Bet bet : bets_.open_bets(market_id)) {
            bool won = bet.side == outcome;
            bet.status = BetStatus::RESOLVED;
            bet.result = won ? BetResult::WON : BetResult::LOST;
            bet.payout = won ? bet.shares * 1.0 : 0.0;
            bet.profit = bet.payout - bet.amount;
            bet.fee = std::max(0.0, bet.profit) * fee_rate_;
            bet.payout_settled = false;
            summary.bets_settled++;

            FailedPayout failure;
            try {
                bets_.update(bet);
            } catch (const EngineError& e) {
                failure.bet_id = bet.id;
                failure.wallet = bet.wallet;
                failure.amount = bet.payout - bet.fee;
                failure.error_kind = e.kind();
                failure.error = e.what();
                summary.failed_payouts.push_back(failure);
                continue;
            }

            if (won) winners.insert(bet.wallet);

            if (settle(bet, failure)) {
                if (won) {
                    summary.payouts_credited++;
                    summary.total_payout += bet.payout - bet.fee;
                    summary.total_fees += bet.fee;
                }
            } else {
                summary.failed_payouts.push_back(failure);
                persist_bet(bet);
            }
        }

        summary.winners_count = winners.size();
        summary.payouts_distributed = summary.failed_payouts.empty();
        summary.success = true;
    } catch (const EngineError& e) {
        summary.error_kind = e.kind();
        summary.error = e.what();
        Logger::instance().warn("RESOLVE", "Resolve market ", market_id, " rejected: ", e.what());
        return summary;
    }

    Logger::instance().info("RESOLVE", "Market ", market_id, ": distributed ", summary.total_payout,
                            " to ", summary.winners_count, " winner(s), fees ", summary.total_fees,
                            ", failed ", summary.failed_payouts.size());
    return summary;
}

ResolutionSummary ResolutionEngine::retry_failed_payouts(MarketId market_id) {
    ResolutionSummary summary;
    summary.market_id = market_id;

    try {
        auto guard = markets_.lock(market_id);
        if (guard.market().status != MarketStatus::RESOLVED || !guard.market().resolution) {
            throw EngineError(ErrorKind::ValidationError,
                "Market " + std::to_string(market_id) + " is not resolved");
        }
        summary.outcome = *guard.market().resolution;

        std::set<std::string> winners;
        for (Bet bet : bets_.unsettled_bets(market_id)) {
            summary.bets_settled++;
            FailedPayout failure;
            if (settle(bet, failure)) {
                if (bet.result == BetResult::WON) {
                    winners.insert(bet.wallet);
                    summary.payouts_credited++;
                    summary.total_payout += bet.payout - bet.fee;
                    summary.total_fees += bet.fee;
                }
            } else {
                summary.failed_payouts.push_back(failure);
            }
        }

        summary.winners_count = winners.size();
        summary.payouts_distributed = summary.failed_payouts.empty();
        summary.success = true;
    } catch (const EngineError& e) {
        summary.error_kind = e.kind();
        summary.error = e.what();
        Logger::instance().warn("RESOLVE", "Payout retry for market ", market_id, " rejected: ", e.what());
        return summary;
    }

    Logger::instance().info("RESOLVE", "Market ", market_id, ": retried ", summary.bets_settled,
                            " payout(s), ", summary.failed_payouts.size(), " still failing");
    return summary;
}

PayoutReport ResolutionEngine::payout_report(MarketId market_id) const {
    PayoutReport report;
    report.market_id = market_id;

    auto market = markets_.get_market(market_id);
    if (!market) {
        report.error_kind = ErrorKind::NotFound;
        report.error = "Market " + std::to_string(market_id) + " not found";
        return report;
    }
    if (market->status != MarketStatus::RESOLVED || !market->resolution) {
        report.error_kind = ErrorKind::ValidationError;
        report.error = "Market " + std::to_string(market_id) + " not resolved yet";
        return report;
    }
    report.resolution = *market->resolution;

    std::map<std::string, WalletPayout> by_wallet;
    for (const auto& bet : bets_.bets_for_market(market_id)) {
        if (bet.status != BetStatus::RESOLVED) continue;

        auto& entry = by_wallet[bet.wallet];
        entry.wallet = bet.wallet;
        entry.total_bet += bet.amount;
        entry.total_shares += bet.shares;
        entry.payout += bet.payout;
        entry.fee += bet.fee;
        entry.profit += bet.profit;
        entry.bets.push_back(bet);

        report.total_amount_bet += bet.amount;
        report.total_payout += bet.payout;
        report.total_fees += bet.fee;
    }

    for (auto& [wallet, entry] : by_wallet) {
        report.payouts.push_back(std::move(entry));
    }
    report.success = true;
    return report;
}

void ResolutionEngine::persist_market(const Market& market) {
    if (writer_) writer_->queue_record(market);
}

void ResolutionEngine::persist_bet(const Bet& bet) {
    if (writer_) writer_->queue_record(bet);
}

void ResolutionEngine::persist_wallet(const std::string& wallet) {
    if (!writer_) return;
    if (auto user = ledger_.get_user(wallet)) {
        writer_->queue_record(*user);
    }
}

} // namespace predix
