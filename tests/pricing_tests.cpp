#include <boost/test/unit_test.hpp>
#include "predix/pricing.hpp"
#include <cmath>

using namespace predix;

namespace {
    MarketState fresh(double buffer = 10000.0) {
        return MarketState{.market_id = 1, .q_yes = buffer, .q_no = buffer};
    }
}

BOOST_AUTO_TEST_SUITE(pricing_tests)

BOOST_AUTO_TEST_CASE(fresh_market_is_even)
{
    LmsrPricer pricer(5000.0, 10000.0);
    auto p = pricer.prices(fresh());
    BOOST_CHECK_CLOSE(p.yes, 0.5, 1e-9);
    BOOST_CHECK_CLOSE(p.no, 0.5, 1e-9);
}

BOOST_AUTO_TEST_CASE(first_buy_moves_yes_to_about_two_thirds)
{
    LmsrPricer pricer(5000.0, 10000.0);
    auto quote = pricer.quote_buy(fresh(), Side::YES, 2000.0);

    BOOST_CHECK_CLOSE(quote.shares, 3424.7, 0.01);
    BOOST_CHECK_CLOSE(quote.price_before.yes, 0.5, 1e-9);
    BOOST_CHECK(std::fabs(quote.price_after.yes - 0.66) < 0.01);
    BOOST_CHECK_CLOSE(quote.avg_price, 2000.0 / quote.shares, 1e-9);
    BOOST_CHECK_EQUAL(quote.delta_no, 0.0);
    BOOST_CHECK_EQUAL(quote.delta_yes, quote.shares);
}

BOOST_AUTO_TEST_CASE(buy_cost_matches_cost_function)
{
    LmsrPricer pricer(5000.0, 10000.0);
    MarketState state{.market_id = 1, .q_yes = 14000.0, .q_no = 11000.0};

    for (double amount : {0.5, 10.0, 250.0, 5000.0}) {
        auto quote = pricer.quote_buy(state, Side::NO, amount);
        double paid = pricer.cost(state.q_yes, state.q_no + quote.shares) - pricer.cost(state.q_yes, state.q_no);
        BOOST_CHECK_CLOSE(paid, amount, 1e-6);
    }
}

BOOST_AUTO_TEST_CASE(prices_always_sum_to_one)
{
    LmsrPricer pricer(5000.0, 10000.0);
    MarketState state = fresh();
    for (int i = 0; i < 50; ++i) {
        Side side = i % 3 == 0 ? Side::NO : Side::YES;
        auto quote = pricer.quote_buy(state, side, 100.0 + i * 37.0);
        state.q_yes += quote.delta_yes;
        state.q_no += quote.delta_no;
        auto p = pricer.prices(state);
        BOOST_CHECK_SMALL(p.yes + p.no - 1.0, 1e-12);
    }
}

BOOST_AUTO_TEST_CASE(display_prices_are_clamped)
{
    LmsrPricer pricer(5000.0, 10000.0);
    MarketState lopsided{.market_id = 1, .q_yes = 10000.0 + 200000.0, .q_no = 10000.0};
    auto p = pricer.prices(lopsided);
    BOOST_CHECK_CLOSE(p.yes, 0.99, 1e-9);
    BOOST_CHECK_CLOSE(p.no, 0.01, 1e-6);
    BOOST_CHECK(pricer.raw_price(lopsided, Side::YES) > 0.99);
}

BOOST_AUTO_TEST_CASE(huge_exposure_does_not_overflow)
{
    LmsrPricer pricer(5000.0, 10000.0);
    MarketState state{.market_id = 1, .q_yes = 5.0e7, .q_no = 4.9e7};

    double c = pricer.cost(state.q_yes, state.q_no);
    BOOST_CHECK(std::isfinite(c));

    auto buy = pricer.quote_buy(state, Side::NO, 1000.0);
    BOOST_CHECK(std::isfinite(buy.shares));
    BOOST_CHECK(buy.shares > 0.0);

    auto sell = pricer.quote_sell(state, Side::YES, 1000.0);
    BOOST_CHECK(std::isfinite(sell.proceeds));
    BOOST_CHECK(sell.proceeds > 0.0);
}

BOOST_AUTO_TEST_CASE(sell_returns_what_the_buy_cost)
{
    LmsrPricer pricer(5000.0, 10000.0);
    MarketState state = fresh();
    auto buy = pricer.quote_buy(state, Side::YES, 300.0);
    state.q_yes += buy.shares;

    auto sell = pricer.quote_sell(state, Side::YES, buy.shares);
    BOOST_CHECK_CLOSE(sell.proceeds, 300.0, 1e-6);
    BOOST_CHECK_EQUAL(sell.delta_yes, -buy.shares);
}

BOOST_AUTO_TEST_CASE(sell_below_buffer_is_rejected)
{
    LmsrPricer pricer(5000.0, 10000.0);
    MarketState state{.market_id = 1, .q_yes = 10100.0, .q_no = 10000.0};

    BOOST_CHECK_NO_THROW(pricer.quote_sell(state, Side::YES, 100.0));
    try {
        pricer.quote_sell(state, Side::YES, 100.5);
        BOOST_FAIL("expected BufferViolation");
    } catch (const EngineError& e) {
        BOOST_CHECK(e.kind() == ErrorKind::BufferViolation);
    }
}

BOOST_AUTO_TEST_CASE(non_positive_amounts_are_rejected)
{
    LmsrPricer pricer(5000.0, 10000.0);
    for (double bad : {0.0, -5.0, std::nan("")}) {
        try {
            pricer.quote_buy(fresh(), Side::YES, bad);
            BOOST_FAIL("expected ValidationError");
        } catch (const EngineError& e) {
            BOOST_CHECK(e.kind() == ErrorKind::ValidationError);
        }
    }
    BOOST_CHECK_THROW(pricer.quote_sell(fresh(), Side::NO, 0.0), EngineError);
}

BOOST_AUTO_TEST_SUITE_END()
