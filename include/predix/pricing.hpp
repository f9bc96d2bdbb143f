#pragma once

#include "predix/types.hpp"
#include "predix/config.hpp"

namespace predix {

struct PriceQuote {
    double yes = 0.5;
    double no = 0.5;

    double of(Side side) const { return side == Side::YES ? yes : no; }
};

struct BuyQuote {
    double shares = 0.0;
    double avg_price = 0.0;
    double delta_yes = 0.0;
    double delta_no = 0.0;
    PriceQuote price_before;
    PriceQuote price_after;
};

struct SellQuote {
    double proceeds = 0.0;
    double avg_price = 0.0;
    double delta_yes = 0.0;
    double delta_no = 0.0;
    PriceQuote price_before;
    PriceQuote price_after;
};

// Logarithmic Market Scoring Rule for a binary market.
//
// All functions are pure: they read a MarketState snapshot and return a quote,
// never touching shared state, so they are safe to call from any thread.
// Exponentials are evaluated in the log domain (log-sum-exp shift) so large
// cumulative exposure cannot overflow.
class LmsrPricer {
public:
    LmsrPricer(double b, double buffer, double min_price = 0.01, double max_price = 0.99);
    explicit LmsrPricer(const Config& config);

    double b() const { return b_; }
    double buffer() const { return buffer_; }

    // Tolerance below the buffer that is treated as rounding noise
    double buffer_epsilon() const;

    // C(q_yes, q_no) = b * ln(exp(q_yes/b) + exp(q_no/b))
    double cost(double q_yes, double q_no) const;

    // Unclamped instantaneous price of one side
    double raw_price(const MarketState& state, Side side) const;

    // Display prices clamped to [min_price, max_price]; yes + no == 1
    PriceQuote prices(const MarketState& state) const;

    // Spend `amount` on `side`. Throws EngineError(ValidationError) for a non-positive amount.
    BuyQuote quote_buy(const MarketState& state, Side side, double amount) const;

    // Liquidate `shares` of `side`. Throws EngineError(BufferViolation) if the
    // side's exposure would drop below the buffer floor.
    SellQuote quote_sell(const MarketState& state, Side side, double shares) const;

private:
    double b_;
    double buffer_;
    double min_price_;
    double max_price_;
};

} // namespace predix
