#include "predix/types.hpp"
#include <algorithm>
#include <cctype>

namespace predix {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "None";
        case ErrorKind::ValidationError:    return "ValidationError";
        case ErrorKind::MarketClosedError:  return "MarketClosedError";
        case ErrorKind::InsufficientFunds:  return "InsufficientFunds";
        case ErrorKind::InsufficientShares: return "InsufficientShares";
        case ErrorKind::BufferViolation:    return "BufferViolation";
        case ErrorKind::AlreadyResolved:    return "AlreadyResolved";
        case ErrorKind::NotFound:           return "NotFound";
        case ErrorKind::StaleRequest:       return "StaleRequest";
        case ErrorKind::UndoConflict:       return "UndoConflict";
        case ErrorKind::Internal:           return "Internal";
    }
    return "Internal";
}

const char* side_name(Side side) {
    return side == Side::YES ? "YES" : "NO";
}

std::optional<Side> parse_side(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "YES") return Side::YES;
    if (upper == "NO") return Side::NO;
    return std::nullopt;
}

Side opposite(Side side) {
    return side == Side::YES ? Side::NO : Side::YES;
}

const char* market_status_name(MarketStatus status) {
    return status == MarketStatus::OPEN ? "open" : "resolved";
}

std::optional<MarketStatus> parse_market_status(const std::string& text) {
    if (text == "open") return MarketStatus::OPEN;
    if (text == "resolved") return MarketStatus::RESOLVED;
    return std::nullopt;
}

const char* bet_status_name(BetStatus status) {
    switch (status) {
        case BetStatus::OPEN:           return "open";
        case BetStatus::CLOSED_BY_SALE: return "closed";
        case BetStatus::RESOLVED:       return "resolved";
        case BetStatus::VOID:           return "void";
    }
    return "open";
}

std::optional<BetStatus> parse_bet_status(const std::string& text) {
    if (text == "open") return BetStatus::OPEN;
    if (text == "closed") return BetStatus::CLOSED_BY_SALE;
    if (text == "resolved") return BetStatus::RESOLVED;
    if (text == "void") return BetStatus::VOID;
    return std::nullopt;
}

const char* bet_result_name(BetResult result) {
    switch (result) {
        case BetResult::NA:   return "n/a";
        case BetResult::WON:  return "won";
        case BetResult::LOST: return "lost";
    }
    return "n/a";
}

std::optional<BetResult> parse_bet_result(const std::string& text) {
    if (text == "n/a") return BetResult::NA;
    if (text == "won") return BetResult::WON;
    if (text == "lost") return BetResult::LOST;
    return std::nullopt;
}

const char* trade_kind_name(TradeKind kind) {
    switch (kind) {
        case TradeKind::BUY:  return "buy";
        case TradeKind::SELL: return "sell";
        case TradeKind::UNDO: return "undo";
    }
    return "buy";
}

std::string normalize_wallet(const std::string& wallet) {
    size_t start = 0;
    size_t end = wallet.size();
    while (start < end && std::isspace(static_cast<unsigned char>(wallet[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(wallet[end - 1]))) --end;

    std::string out = wallet.substr(start, end - start);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int64_t to_epoch_seconds(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_seconds(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

} // namespace predix
