#include "predix/operator_console.hpp"
#include "predix/logger.hpp"
#include <iostream>
#include <sstream>
#include <vector>
#include <nlohmann/json.hpp>

namespace predix {

using nlohmann::json;

namespace {
    const char* kHelp =
        "=== PREDIX COMMANDS ===\n"
        "help                                 - Show commands\n"
        "status                               - Engine status\n"
        "markets [open|resolved]              - List markets with prices\n"
        "create <question> [| category | end] - Create a market\n"
        "price <market>                       - Current YES/NO price\n"
        "preview <market> <YES|NO> <amount>   - Quote a buy without trading\n"
        "buy <wallet> <market> <YES|NO> <amount>\n"
        "sell <wallet> <market> <YES|NO> <shares> [bet]\n"
        "undo <wallet> <bet>                  - Reverse the latest buy\n"
        "poll <request>                       - Trade result\n"
        "slippage <request> <previewed_shares>\n"
        "balance <wallet>                     - Balance (creates wallet)\n"
        "credit <wallet> <amount>             - Admin credit\n"
        "verify <wallet> [on|off]             - Verification flag\n"
        "bets <wallet>                        - Portfolio\n"
        "users                                - All wallets with betting totals\n"
        "activity [n]                         - Latest bets on open markets\n"
        "resolve <market> <YES|NO>            - Resolve and pay out\n"
        "payouts <market>                     - Payout report\n"
        "retry <market>                       - Retry failed payouts\n"
        "logs [n]                             - Recent log entries\n"
        "quit                                 - Exit";

    std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    double parse_number(const std::string& text, const char* what) {
        try {
            size_t used = 0;
            double value = std::stod(text, &used);
            if (used != text.size()) throw std::invalid_argument(text);
            return value;
        } catch (const std::exception&) {
            throw EngineError(ErrorKind::ValidationError, std::string("Invalid ") + what + ": '" + text + "'");
        }
    }

    int64_t parse_id(const std::string& text, const char* what) {
        try {
            size_t used = 0;
            long long value = std::stoll(text, &used);
            if (used != text.size() || value <= 0) throw std::invalid_argument(text);
            return value;
        } catch (const std::exception&) {
            throw EngineError(ErrorKind::ValidationError, std::string("Invalid ") + what + ": '" + text + "'");
        }
    }

    Side parse_side_arg(const std::string& text) {
        auto side = parse_side(text);
        if (!side) {
            throw EngineError(ErrorKind::ValidationError, "Side must be YES or NO, got '" + text + "'");
        }
        return *side;
    }

    void require_args(const std::vector<std::string>& args, size_t count, const char* usage) {
        if (args.size() < count + 1) {
            throw EngineError(ErrorKind::ValidationError, std::string("Usage: ") + usage);
        }
    }

    json ok(json data) {
        return {{"success", true}, {"data", std::move(data)}};
    }

    json fail(ErrorKind kind, const std::string& error) {
        return {{"success", false}, {"error_kind", error_kind_name(kind)}, {"error", error}};
    }

    template<typename R>
    json reply(const R& result, json data) {
        if (!result.success) return fail(result.error_kind, result.error);
        return ok(std::move(data));
    }

    json prices_json(const PriceQuote& p) {
        return {{"yes", p.yes}, {"no", p.no}};
    }

    json market_json(const MarketSummary& s) {
        json j = {
            {"id", s.market.id},
            {"question", s.market.question},
            {"category", s.market.category},
            {"end_date", s.market.end_date},
            {"status", market_status_name(s.market.status)},
            {"resolution", s.market.resolution ? json(side_name(*s.market.resolution)) : json(nullptr)},
            {"prices", prices_json(s.prices)},
            {"q_yes", s.state.q_yes},
            {"q_no", s.state.q_no},
            {"total_yes", s.total_yes},
            {"total_no", s.total_no},
            {"bet_count", s.bet_count}
        };
        return j;
    }

    json bet_json(const Bet& b) {
        return {
            {"id", b.id},
            {"market_id", b.market_id},
            {"wallet", b.wallet},
            {"side", side_name(b.side)},
            {"amount", b.amount},
            {"shares", b.shares},
            {"avg_price", b.avg_price},
            {"status", bet_status_name(b.status)},
            {"result", bet_result_name(b.result)},
            {"payout", b.payout},
            {"fee", b.fee},
            {"profit", b.profit},
            {"sold_shares", b.sold_shares},
            {"sale_proceeds", b.sale_proceeds},
            {"created_at", to_epoch_seconds(b.created_at)}
        };
    }

    json trade_json(const TradeResult& t) {
        return {
            {"request_id", t.request_id},
            {"kind", trade_kind_name(t.kind)},
            {"success", t.success},
            {"error_kind", error_kind_name(t.error_kind)},
            {"error", t.error},
            {"market_id", t.market_id},
            {"wallet", t.wallet},
            {"side", side_name(t.side)},
            {"bet_id", t.bet_id},
            {"amount", t.amount},
            {"shares", t.shares},
            {"price", t.price},
            {"proceeds", t.proceeds},
            {"balance_after", t.balance_after},
            {"price_after", prices_json(t.price_after)},
            {"queue_position", t.queue_position}
        };
    }

    json submission_json(const Submission& s) {
        if (!s.success) {
            json j = fail(s.error_kind, s.error);
            j["request_id"] = s.request_id;
            return j;
        }
        return ok({{"request_id", s.request_id}, {"queue_position", s.queue_position}});
    }

    json balance_json(const BalanceResult& b) {
        return reply(b, {
            {"wallet", b.wallet},
            {"balance", b.balance},
            {"is_new_user", b.is_new_user},
            {"verified", b.verified}
        });
    }

    json resolution_json(const ResolutionSummary& r) {
        json failed = json::array();
        for (const auto& f : r.failed_payouts) {
            failed.push_back({
                {"bet_id", f.bet_id},
                {"wallet", f.wallet},
                {"amount", f.amount},
                {"error_kind", error_kind_name(f.error_kind)},
                {"error", f.error}
            });
        }
        return reply(r, {
            {"market_id", r.market_id},
            {"outcome", side_name(r.outcome)},
            {"payouts_distributed", r.payouts_distributed},
            {"bets_settled", r.bets_settled},
            {"payouts_credited", r.payouts_credited},
            {"total_payout", r.total_payout},
            {"total_fees", r.total_fees},
            {"winners_count", r.winners_count},
            {"failed_payouts", failed}
        });
    }
}

OperatorConsole::OperatorConsole(MarketEngine& engine) : engine_(engine) {}

std::string OperatorConsole::process_command(const std::string& line) {
    std::string input = trim(line);
    std::istringstream iss(input);
    std::vector<std::string> args;
    for (std::string tok; iss >> tok;) {
        args.push_back(tok);
    }
    if (args.empty()) {
        return fail(ErrorKind::ValidationError, "Empty command").dump();
    }

    const std::string& cmd = args[0];
    json response;

    try {
        if (cmd == "help") {
            response = ok(kHelp);
        }
        else if (cmd == "status") {
            auto s = engine_.get_status();
            response = ok({
                {"running", s.running},
                {"persistence", s.persistence},
                {"markets_open", s.markets_open},
                {"markets_resolved", s.markets_resolved},
                {"wallets", s.wallets},
                {"bets", s.bets},
                {"pending_trades", s.pending_trades},
                {"processed_trades", s.processed_trades},
                {"stored_results", s.stored_results},
                {"pending_writes", s.pending_writes},
                {"uptime_seconds", s.uptime_seconds},
                {"config", engine_.config().to_json()}
            });
        }
        else if (cmd == "markets") {
            std::optional<MarketStatus> filter;
            if (args.size() > 1) {
                filter = parse_market_status(args[1]);
                if (!filter) {
                    throw EngineError(ErrorKind::ValidationError, "Status must be open or resolved");
                }
            }
            json list = json::array();
            for (const auto& s : engine_.list_markets(filter)) {
                list.push_back(market_json(s));
            }
            response = ok(list);
        }
        else if (cmd == "create") {
            std::string rest = trim(input.substr(cmd.size()));
            std::vector<std::string> parts;
            std::istringstream fields(rest);
            for (std::string part; std::getline(fields, part, '|');) {
                parts.push_back(trim(part));
            }

            MarketSpec spec;
            spec.question = parts.empty() ? "" : parts[0];
            if (parts.size() > 1) spec.category = parts[1];
            if (parts.size() > 2) spec.end_date = parts[2];
            spec.created_by = "console";

            auto r = engine_.create_market(spec);
            response = reply(r, {
                {"id", r.market.id},
                {"question", r.market.question},
                {"category", r.market.category},
                {"end_date", r.market.end_date}
            });
        }
        else if (cmd == "price") {
            require_args(args, 1, "price <market>");
            auto r = engine_.get_price(parse_id(args[1], "market id"));
            response = reply(r, {
                {"market_id", r.market_id},
                {"status", market_status_name(r.status)},
                {"yes_price", r.prices.yes},
                {"no_price", r.prices.no}
            });
        }
        else if (cmd == "preview") {
            require_args(args, 3, "preview <market> <YES|NO> <amount>");
            auto r = engine_.preview_trade(parse_id(args[1], "market id"), parse_side_arg(args[2]),
                                           parse_number(args[3], "amount"));
            response = reply(r, {
                {"market_id", r.market_id},
                {"side", side_name(r.side)},
                {"amount", r.amount},
                {"shares", r.shares},
                {"price", r.avg_price},
                {"price_before", prices_json(r.price_before)},
                {"price_after", prices_json(r.price_after)},
                {"queue_depth", r.queue_depth}
            });
        }
        else if (cmd == "buy") {
            require_args(args, 4, "buy <wallet> <market> <YES|NO> <amount>");
            response = submission_json(engine_.submit_buy(args[1], parse_id(args[2], "market id"),
                                                          parse_side_arg(args[3]),
                                                          parse_number(args[4], "amount")));
        }
        else if (cmd == "sell") {
            require_args(args, 4, "sell <wallet> <market> <YES|NO> <shares> [bet]");
            std::optional<BetId> bet_id;
            if (args.size() > 5) bet_id = parse_id(args[5], "bet id");
            response = submission_json(engine_.submit_sell(args[1], parse_id(args[2], "market id"),
                                                           parse_side_arg(args[3]),
                                                           parse_number(args[4], "shares"), bet_id));
        }
        else if (cmd == "undo") {
            require_args(args, 2, "undo <wallet> <bet>");
            response = submission_json(engine_.submit_undo(args[1], parse_id(args[2], "bet id")));
        }
        else if (cmd == "poll") {
            require_args(args, 1, "poll <request>");
            auto r = engine_.poll_result(args[1]);
            if (!r.found) {
                response = fail(r.error_kind, r.error);
            } else {
                json data = {{"request_id", args[1]}, {"status", request_status_name(r.status)}};
                if (r.result) data["result"] = trade_json(*r.result);
                response = ok(data);
            }
        }
        else if (cmd == "slippage") {
            require_args(args, 2, "slippage <request> <previewed_shares>");
            auto r = engine_.check_slippage(args[1], parse_number(args[2], "shares"));
            response = reply(r, {
                {"request_id", r.request_id},
                {"bet_id", r.bet_id},
                {"previewed_shares", r.previewed_shares},
                {"realized_shares", r.realized_shares},
                {"relative_difference", r.relative_difference},
                {"undo_recommended", r.undo_recommended}
            });
        }
        else if (cmd == "balance") {
            require_args(args, 1, "balance <wallet>");
            response = balance_json(engine_.get_balance(args[1]));
        }
        else if (cmd == "credit") {
            require_args(args, 2, "credit <wallet> <amount>");
            response = balance_json(engine_.credit_wallet(args[1], parse_number(args[2], "amount")));
        }
        else if (cmd == "verify") {
            require_args(args, 1, "verify <wallet> [on|off]");
            bool verified = args.size() < 3 || args[2] != "off";
            response = balance_json(engine_.set_verified(args[1], verified));
        }
        else if (cmd == "bets") {
            require_args(args, 1, "bets <wallet>");
            json list = json::array();
            for (const auto& view : engine_.list_bets(args[1])) {
                json j = bet_json(view.bet);
                j["question"] = view.question;
                j["current_price"] = view.current_price;
                j["current_value"] = view.current_value;
                j["unrealized_profit"] = view.unrealized_profit;
                list.push_back(j);
            }
            response = ok(list);
        }
        else if (cmd == "users") {
            json list = json::array();
            for (const auto& u : engine_.list_users()) {
                list.push_back({
                    {"wallet", u.wallet},
                    {"balance", u.balance},
                    {"verified", u.verified},
                    {"created_at", to_epoch_seconds(u.created_at)},
                    {"total_bets", u.total_bets},
                    {"total_bet_amount", u.total_bet_amount},
                    {"open_positions", u.open_positions}
                });
            }
            response = ok(list);
        }
        else if (cmd == "activity") {
            size_t limit = 50;
            if (args.size() > 1) limit = static_cast<size_t>(parse_id(args[1], "count"));
            json list = json::array();
            for (const auto& a : engine_.recent_activity(limit)) {
                list.push_back({
                    {"id", a.bet.id},
                    {"market_id", a.bet.market_id},
                    {"question", a.question},
                    {"wallet", a.bet.wallet},
                    {"side", side_name(a.bet.side)},
                    {"amount", a.bet.amount},
                    {"shares", a.bet.shares},
                    {"current_probability", a.current_probability},
                    {"created_at", to_epoch_seconds(a.bet.created_at)}
                });
            }
            response = ok(list);
        }
        else if (cmd == "resolve") {
            require_args(args, 2, "resolve <market> <YES|NO>");
            response = resolution_json(engine_.resolve_market(parse_id(args[1], "market id"),
                                                              parse_side_arg(args[2])));
        }
        else if (cmd == "payouts") {
            require_args(args, 1, "payouts <market>");
            auto r = engine_.payout_report(parse_id(args[1], "market id"));
            json wallets = json::array();
            for (const auto& w : r.payouts) {
                json bets = json::array();
                for (const auto& b : w.bets) {
                    bets.push_back(bet_json(b));
                }
                wallets.push_back({
                    {"wallet", w.wallet},
                    {"total_bet", w.total_bet},
                    {"total_shares", w.total_shares},
                    {"payout", w.payout},
                    {"fee", w.fee},
                    {"profit", w.profit},
                    {"bets", bets}
                });
            }
            response = reply(r, {
                {"market_id", r.market_id},
                {"resolution", side_name(r.resolution)},
                {"total_amount_bet", r.total_amount_bet},
                {"total_payout", r.total_payout},
                {"total_fees", r.total_fees},
                {"payouts", wallets}
            });
        }
        else if (cmd == "retry") {
            require_args(args, 1, "retry <market>");
            response = resolution_json(engine_.retry_payouts(parse_id(args[1], "market id")));
        }
        else if (cmd == "logs") {
            size_t limit = 50;
            if (args.size() > 1) limit = static_cast<size_t>(parse_id(args[1], "count"));
            response = ok(Logger::instance().recent(limit));
        }
        else {
            response = fail(ErrorKind::ValidationError, "Unknown command: " + cmd + " (try 'help')");
        }
    } catch (const EngineError& e) {
        response = fail(e.kind(), e.what());
    }

    if (cmd != "logs" && cmd != "help") {
        Logger::instance().debug("CMD", input, " -> ", response.value("success", false) ? "ok" : "error");
    }
    return response.dump();
}

void OperatorConsole::run(std::istream& in, std::ostream& out, const std::atomic<bool>& running) {
    std::string line;
    while (running && std::getline(in, line)) {
        std::string cmd = trim(line);
        if (cmd.empty()) continue;
        if (cmd == "quit" || cmd == "exit") break;
        out << process_command(cmd) << std::endl;
    }
}

} // namespace predix
