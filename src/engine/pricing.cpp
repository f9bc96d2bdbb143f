#include "predix/pricing.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace predix {

namespace {
    // ln(1 + e^x)
    double softplus(double x) {
        return std::max(x, 0.0) + std::log1p(std::exp(-std::fabs(x)));
    }

    // ln(e^a + e^b)
    double log_sum_exp(double a, double b) {
        double m = std::max(a, b);
        return m + std::log(std::exp(a - m) + std::exp(b - m));
    }

    // ln(e^x - 1) for x > 0
    double log_expm1(double x) {
        if (x > 50.0) {
            return x + std::log1p(-std::exp(-x));
        }
        return std::log(std::expm1(x));
    }

    MarketState shifted(const MarketState& state, double delta_yes, double delta_no) {
        MarketState next = state;
        next.q_yes += delta_yes;
        next.q_no += delta_no;
        return next;
    }
}

LmsrPricer::LmsrPricer(double b, double buffer, double min_price, double max_price)
    : b_(b), buffer_(buffer), min_price_(min_price), max_price_(max_price) {
}

LmsrPricer::LmsrPricer(const Config& config)
    : LmsrPricer(config.lmsr_b, config.lmsr_buffer, config.min_price, config.max_price) {
}

double LmsrPricer::buffer_epsilon() const {
    return 1e-9 * std::max(1.0, buffer_);
}

double LmsrPricer::cost(double q_yes, double q_no) const {
    return b_ * log_sum_exp(q_yes / b_, q_no / b_);
}

double LmsrPricer::raw_price(const MarketState& state, Side side) const {
    double exponent = (state.q(opposite(side)) - state.q(side)) / b_;
    exponent = std::clamp(exponent, -700.0, 700.0);
    return 1.0 / (1.0 + std::exp(exponent));
}

PriceQuote LmsrPricer::prices(const MarketState& state) const {
    double yes = std::clamp(raw_price(state, Side::YES), min_price_, max_price_);
    return PriceQuote{.yes = yes, .no = 1.0 - yes};
}

BuyQuote LmsrPricer::quote_buy(const MarketState& state, Side side, double amount) const {
    if (!std::isfinite(amount) || amount <= 0.0) {
        throw EngineError(ErrorKind::ValidationError, "Amount must be positive");
    }

    // Closed form of C(q_side', q_other) - C(q_side, q_other) = amount:
    //   shares = b * ln(1 + (e^(amount/b) - 1) * (1 + e^((q_other - q_side)/b)))
    double d = (state.q(opposite(side)) - state.q(side)) / b_;
    double x = log_expm1(amount / b_) + softplus(d);
    double shares = b_ * softplus(x);

    if (!std::isfinite(shares) || shares <= 0.0) {
        throw EngineError(ErrorKind::ValidationError, "Amount too small to buy any shares");
    }

    BuyQuote quote;
    quote.shares = shares;
    quote.avg_price = amount / shares;
    quote.delta_yes = side == Side::YES ? shares : 0.0;
    quote.delta_no = side == Side::NO ? shares : 0.0;
    quote.price_before = prices(state);
    quote.price_after = prices(shifted(state, quote.delta_yes, quote.delta_no));
    return quote;
}

SellQuote LmsrPricer::quote_sell(const MarketState& state, Side side, double shares) const {
    if (!std::isfinite(shares) || shares <= 0.0) {
        throw EngineError(ErrorKind::ValidationError, "Shares must be positive");
    }

    double q_side = state.q(side);
    double q_other = state.q(opposite(side));
    if (q_side - shares < buffer_ - buffer_epsilon()) {
        std::ostringstream msg;
        msg << "Selling " << shares << " " << side_name(side)
            << " shares would push exposure below the buffer floor (" << buffer_ << ")";
        throw EngineError(ErrorKind::BufferViolation, msg.str());
    }

    double proceeds = b_ * (log_sum_exp(q_side / b_, q_other / b_)
                          - log_sum_exp((q_side - shares) / b_, q_other / b_));
    proceeds = std::max(0.0, proceeds);

    SellQuote quote;
    quote.proceeds = proceeds;
    quote.avg_price = proceeds / shares;
    quote.delta_yes = side == Side::YES ? -shares : 0.0;
    quote.delta_no = side == Side::NO ? -shares : 0.0;
    quote.price_before = prices(state);
    quote.price_after = prices(shifted(state, quote.delta_yes, quote.delta_no));
    return quote;
}

} // namespace predix
