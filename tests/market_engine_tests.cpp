#include <boost/test/unit_test.hpp>
#include "predix/market_engine.hpp"
#include <cmath>
#include <map>
#include <thread>

using namespace predix;
using namespace std::chrono_literals;

namespace {
    Config short_ttl_config() {
        Config config;
        config.result_ttl_ms = 100;
        return config;
    }

    struct engine_fixture {
        MarketEngine engine{Config{}};
        MarketId market_id = 0;

        engine_fixture() {
            engine.start();
            market_id = engine.create_market(MarketSpec{
                .question = "Will the Liffey freeze?",
                .description = "Resolves YES on any ice",
                .category = "weather",
                .end_date = "2026-12-31"
            }).market.id;
        }

        TradeResult settle(const Submission& submission) {
            BOOST_REQUIRE(submission.success);
            BOOST_REQUIRE(engine.wait_idle(5s));
            auto polled = engine.poll_result(submission.request_id);
            BOOST_REQUIRE(polled.result);
            return *polled.result;
        }
    };
}

BOOST_FIXTURE_TEST_SUITE(market_engine_tests, engine_fixture)

BOOST_AUTO_TEST_CASE(create_and_price)
{
    auto price = engine.get_price(market_id);
    BOOST_REQUIRE(price.success);
    BOOST_CHECK_CLOSE(price.prices.yes, 0.5, 1e-9);

    auto bad = engine.create_market(MarketSpec{.question = ""});
    BOOST_CHECK(!bad.success);
    BOOST_CHECK(bad.error_kind == ErrorKind::ValidationError);

    BOOST_CHECK(engine.get_price(77).error_kind == ErrorKind::NotFound);
}

BOOST_AUTO_TEST_CASE(preview_does_not_mutate)
{
    auto preview = engine.preview_trade(market_id, Side::YES, 2000.0);
    BOOST_REQUIRE(preview.success);
    BOOST_CHECK(std::fabs(preview.price_after.yes - 0.66) < 0.01);
    BOOST_CHECK_EQUAL(engine.markets().get(market_id)->q_yes, 10000.0);
    BOOST_CHECK_CLOSE(engine.get_price(market_id).prices.yes, 0.5, 1e-9);

    BOOST_CHECK(engine.preview_trade(market_id, Side::YES, -1.0).error_kind == ErrorKind::ValidationError);
}

BOOST_AUTO_TEST_CASE(preview_matches_execution_when_nothing_intervenes)
{
    auto preview = engine.preview_trade(market_id, Side::NO, 150.0);
    auto result = settle(engine.submit_buy("alice", market_id, Side::NO, 150.0));
    BOOST_CHECK_CLOSE(result.shares, preview.shares, 1e-9);

    auto slippage = engine.check_slippage(result.request_id, preview.shares);
    BOOST_REQUIRE(slippage.success);
    BOOST_CHECK(!slippage.undo_recommended);
    BOOST_CHECK_SMALL(slippage.relative_difference, 1e-9);
}

BOOST_AUTO_TEST_CASE(slippage_recommends_undo)
{
    auto preview = engine.preview_trade(market_id, Side::YES, 500.0);
    // Someone else moves the price first
    settle(engine.submit_buy("whale", market_id, Side::YES, 900.0));
    auto result = settle(engine.submit_buy("alice", market_id, Side::YES, 500.0));

    auto slippage = engine.check_slippage(result.request_id, preview.shares);
    BOOST_REQUIRE(slippage.success);
    BOOST_CHECK(slippage.realized_shares < preview.shares);
    BOOST_CHECK(slippage.relative_difference > engine.config().slippage_threshold);
    BOOST_CHECK(slippage.undo_recommended);
    BOOST_CHECK_EQUAL(slippage.bet_id, result.bet_id);

    // alice's buy is the latest trade, so it can still be reversed
    auto undone = settle(engine.submit_undo("alice", result.bet_id));
    BOOST_CHECK(undone.success);
    BOOST_CHECK_EQUAL(engine.get_balance("alice").balance, 1000.0);
}

BOOST_AUTO_TEST_CASE(slippage_needs_a_completed_buy)
{
    BOOST_CHECK(engine.check_slippage("nope", 10.0).error_kind == ErrorKind::NotFound);

    auto failed = settle(engine.submit_buy("alice", market_id, Side::YES, 5000.0));
    BOOST_CHECK(!failed.success);
    BOOST_CHECK(engine.check_slippage(failed.request_id, 10.0).error_kind == ErrorKind::ValidationError);
}

BOOST_AUTO_TEST_CASE(wallets_are_normalized_and_provisioned)
{
    auto first = engine.get_balance("  0xABCdef ");
    BOOST_REQUIRE(first.success);
    BOOST_CHECK_EQUAL(first.wallet, "0xabcdef");
    BOOST_CHECK(first.is_new_user);
    BOOST_CHECK_EQUAL(first.balance, 1000.0);

    auto again = engine.get_balance("0xabcdef");
    BOOST_CHECK(!again.is_new_user);

    BOOST_CHECK(!engine.get_balance("").success);
}

BOOST_AUTO_TEST_CASE(credit_and_verify)
{
    auto credited = engine.credit_wallet("Bob", 250.0);
    BOOST_REQUIRE(credited.success);
    BOOST_CHECK_EQUAL(credited.balance, 1250.0);

    BOOST_CHECK(engine.credit_wallet("bob", 0.0).error_kind == ErrorKind::ValidationError);

    auto verified = engine.set_verified("BOB", true);
    BOOST_CHECK(verified.verified);
    BOOST_CHECK(engine.get_balance("bob").verified);
}

BOOST_AUTO_TEST_CASE(market_listing_with_totals_and_final_prices)
{
    settle(engine.submit_buy("a", market_id, Side::YES, 100.0));
    settle(engine.submit_buy("b", market_id, Side::NO, 40.0));
    auto voided = settle(engine.submit_buy("c", market_id, Side::NO, 10.0));
    settle(engine.submit_undo("c", voided.bet_id));

    auto listed = engine.list_markets();
    BOOST_REQUIRE_EQUAL(listed.size(), 1u);
    BOOST_CHECK_EQUAL(listed[0].total_yes, 100.0);
    BOOST_CHECK_EQUAL(listed[0].total_no, 40.0);
    BOOST_CHECK_EQUAL(listed[0].bet_count, 2u);
    BOOST_CHECK(listed[0].prices.yes > 0.5);

    engine.resolve_market(market_id, Side::NO);
    auto resolved = engine.list_markets(MarketStatus::RESOLVED);
    BOOST_REQUIRE_EQUAL(resolved.size(), 1u);
    BOOST_CHECK_EQUAL(resolved[0].prices.yes, 0.0);
    BOOST_CHECK_EQUAL(resolved[0].prices.no, 1.0);
    BOOST_CHECK(engine.list_markets(MarketStatus::OPEN).empty());
}

BOOST_AUTO_TEST_CASE(portfolio_values_open_bets)
{
    auto bought = settle(engine.submit_buy("alice", market_id, Side::YES, 200.0));
    auto views = engine.list_bets("ALICE");
    BOOST_REQUIRE_EQUAL(views.size(), 1u);
    BOOST_CHECK_EQUAL(views[0].bet.id, bought.bet_id);
    BOOST_CHECK_EQUAL(views[0].question, "Will the Liffey freeze?");
    BOOST_CHECK_CLOSE(views[0].current_price, bought.price_after.yes, 1e-9);
    BOOST_CHECK_CLOSE(views[0].current_value, bought.shares * bought.price_after.yes, 1e-9);
    BOOST_CHECK_CLOSE(views[0].unrealized_profit, views[0].current_value - 200.0, 1e-9);

    engine.resolve_market(market_id, Side::YES);
    views = engine.list_bets("alice");
    BOOST_CHECK(views[0].bet.result == BetResult::WON);
    BOOST_CHECK_EQUAL(views[0].current_price, 1.0);
}

BOOST_AUTO_TEST_CASE(resolved_market_prices_are_final)
{
    settle(engine.submit_buy("alice", market_id, Side::YES, 300.0));
    BOOST_CHECK(engine.get_price(market_id).prices.yes > 0.5);

    engine.resolve_market(market_id, Side::NO);
    auto price = engine.get_price(market_id);
    BOOST_REQUIRE(price.success);
    BOOST_CHECK(price.status == MarketStatus::RESOLVED);
    BOOST_CHECK_EQUAL(price.prices.yes, 0.0);
    BOOST_CHECK_EQUAL(price.prices.no, 1.0);
}

BOOST_AUTO_TEST_CASE(users_and_recent_activity)
{
    settle(engine.submit_buy("alice", market_id, Side::YES, 100.0));
    settle(engine.submit_buy("alice", market_id, Side::NO, 50.0));
    auto voided = settle(engine.submit_buy("bob", market_id, Side::YES, 10.0));
    BOOST_REQUIRE(settle(engine.submit_undo("bob", voided.bet_id)).success);
    engine.get_balance("carol");

    auto other = engine.create_market(MarketSpec{.question = "Settled already?"}).market.id;
    settle(engine.submit_buy("alice", other, Side::YES, 20.0));
    engine.resolve_market(other, Side::YES);

    auto users = engine.list_users();
    BOOST_REQUIRE_EQUAL(users.size(), 3u);
    std::map<std::string, UserSummary> by_wallet;
    for (const auto& u : users) by_wallet[u.wallet] = u;

    BOOST_CHECK_EQUAL(by_wallet["alice"].total_bets, 3u);
    BOOST_CHECK_CLOSE(by_wallet["alice"].total_bet_amount, 170.0, 1e-9);
    BOOST_CHECK_EQUAL(by_wallet["alice"].open_positions, 2u);
    BOOST_CHECK_EQUAL(by_wallet["alice"].balance, engine.get_balance("alice").balance);
    BOOST_CHECK_EQUAL(by_wallet["bob"].total_bets, 0u);
    BOOST_CHECK_EQUAL(by_wallet["bob"].balance, 1000.0);
    BOOST_CHECK_EQUAL(by_wallet["carol"].open_positions, 0u);

    // Only open markets, void bets left out, newest first
    auto activity = engine.recent_activity();
    BOOST_REQUIRE_EQUAL(activity.size(), 2u);
    BOOST_CHECK(activity[0].bet.side == Side::NO);
    BOOST_CHECK(activity[1].bet.side == Side::YES);
    BOOST_CHECK_EQUAL(activity[0].question, "Will the Liffey freeze?");
    double yes = engine.get_price(market_id).prices.yes;
    BOOST_CHECK(std::fabs(activity[0].current_probability - yes * 100.0) <= 0.05 + 1e-9);

    BOOST_CHECK_EQUAL(engine.recent_activity(1).size(), 1u);
}

BOOST_AUTO_TEST_CASE(trading_stops_at_resolution)
{
    settle(engine.submit_buy("alice", market_id, Side::YES, 25.0));
    auto summary = engine.resolve_market(market_id, Side::YES);
    BOOST_REQUIRE(summary.success);
    BOOST_CHECK_EQUAL(summary.winners_count, 1u);

    auto late = engine.submit_buy("bob", market_id, Side::NO, 10.0);
    BOOST_CHECK(!late.success);
    BOOST_CHECK(late.error_kind == ErrorKind::MarketClosedError);

    BOOST_CHECK(engine.resolve_market(market_id, Side::NO).error_kind == ErrorKind::AlreadyResolved);
    BOOST_CHECK(engine.payout_report(market_id).success);
    BOOST_CHECK_EQUAL(engine.retry_payouts(market_id).bets_settled, 0u);
}

BOOST_AUTO_TEST_CASE(buffer_holds_after_mixed_trading)
{
    const double buffer = engine.config().lmsr_buffer;
    for (int i = 0; i < 10; ++i) {
        auto bought = settle(engine.submit_buy("t" + std::to_string(i), market_id,
                                               i % 2 ? Side::YES : Side::NO, 50.0 + i));
        settle(engine.submit_sell("t" + std::to_string(i), market_id, bought.side, bought.shares * 0.75));
        auto state = *engine.markets().get(market_id);
        BOOST_CHECK(state.q_yes >= buffer);
        BOOST_CHECK(state.q_no >= buffer);
        auto p = engine.get_price(market_id).prices;
        BOOST_CHECK_SMALL(p.yes + p.no - 1.0, 1e-12);
    }
}

BOOST_AUTO_TEST_CASE(status_counts)
{
    settle(engine.submit_buy("alice", market_id, Side::YES, 10.0));
    auto status = engine.get_status();
    BOOST_CHECK(status.running);
    BOOST_CHECK(!status.persistence);
    BOOST_CHECK_EQUAL(status.markets_open, 1u);
    BOOST_CHECK_EQUAL(status.bets, 1u);
    BOOST_CHECK_EQUAL(status.wallets, 1u);
    BOOST_CHECK_EQUAL(status.processed_trades, 1u);
    BOOST_CHECK_EQUAL(status.pending_trades, 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(market_engine_ttl_tests)

BOOST_AUTO_TEST_CASE(results_expire_after_ttl)
{
    MarketEngine engine(short_ttl_config());
    engine.start();
    auto market = engine.create_market(MarketSpec{.question = "Q"}).market;

    auto submission = engine.submit_buy("w", market.id, Side::YES, 10.0);
    BOOST_REQUIRE(submission.success);
    BOOST_REQUIRE(engine.wait_idle(5s));
    BOOST_CHECK(engine.poll_result(submission.request_id).result);

    std::this_thread::sleep_for(250ms);
    auto polled = engine.poll_result(submission.request_id);
    BOOST_CHECK(!polled.found);
    BOOST_CHECK(polled.error_kind == ErrorKind::StaleRequest);

    // Expiry does not roll anything back
    BOOST_CHECK(engine.markets().get(market.id)->q_yes > 10000.0);
}

BOOST_AUTO_TEST_SUITE_END()
