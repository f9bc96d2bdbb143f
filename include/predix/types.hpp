#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <optional>
#include <stdexcept>

namespace predix {

using MarketId = int64_t;
using BetId = int64_t;
using RequestId = std::string;
using Timestamp = std::chrono::system_clock::time_point;

enum class Side {
    YES,
    NO
};

enum class MarketStatus {
    OPEN,
    RESOLVED
};

enum class BetStatus {
    OPEN,
    CLOSED_BY_SALE,
    RESOLVED,
    VOID
};

enum class BetResult {
    NA,
    WON,
    LOST
};

enum class TradeKind {
    BUY,
    SELL,
    UNDO
};

// ============ ERROR TAXONOMY ============

enum class ErrorKind {
    None,
    ValidationError,
    MarketClosedError,
    InsufficientFunds,
    InsufficientShares,
    BufferViolation,
    AlreadyResolved,
    NotFound,
    StaleRequest,
    UndoConflict,
    Internal
};

const char* error_kind_name(ErrorKind kind);

// Thrown by the stores; caught and recorded by the sequencer and resolution engine
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// ============ RECORDS ============

struct Market {
    MarketId id = 0;
    std::string question;
    std::string description;
    std::string category;
    std::string end_date;
    std::string created_by;
    MarketStatus status = MarketStatus::OPEN;
    std::optional<Side> resolution;
    Timestamp created_at;
    std::optional<Timestamp> resolved_at;
};

struct MarketState {
    MarketId market_id = 0;
    double q_yes = 0.0;
    double q_no = 0.0;
    uint64_t trade_seq = 0;     // bumped by every applied trade

    double q(Side side) const { return side == Side::YES ? q_yes : q_no; }
};

struct User {
    std::string wallet;
    double balance = 0.0;
    bool verified = false;
    Timestamp created_at;
};

struct Bet {
    BetId id = 0;
    MarketId market_id = 0;
    std::string wallet;
    Side side = Side::YES;
    double amount = 0.0;      // remaining cost basis
    double shares = 0.0;      // remaining shares
    double avg_price = 0.0;
    BetStatus status = BetStatus::OPEN;
    BetResult result = BetResult::NA;
    double payout = 0.0;
    double fee = 0.0;
    double profit = 0.0;
    double sold_shares = 0.0;
    double sale_proceeds = 0.0;
    bool payout_settled = false;
    Timestamp created_at;

    // Market snapshot around the buy, used to reverse it on undo
    MarketState state_before;
    uint64_t trade_seq_after = 0;
};

// ============ STRING CONVERSIONS ============

const char* side_name(Side side);
std::optional<Side> parse_side(const std::string& text);
Side opposite(Side side);

const char* market_status_name(MarketStatus status);
std::optional<MarketStatus> parse_market_status(const std::string& text);

const char* bet_status_name(BetStatus status);
std::optional<BetStatus> parse_bet_status(const std::string& text);

const char* bet_result_name(BetResult result);
std::optional<BetResult> parse_bet_result(const std::string& text);

const char* trade_kind_name(TradeKind kind);

// Trimmed and lower-cased wallet key
std::string normalize_wallet(const std::string& wallet);

int64_t to_epoch_seconds(Timestamp ts);
Timestamp from_epoch_seconds(int64_t seconds);

} // namespace predix
