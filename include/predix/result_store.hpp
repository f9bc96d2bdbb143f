#pragma once

#include "predix/types.hpp"
#include "predix/pricing.hpp"
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace predix {

struct TradeRequest {
    RequestId request_id;
    TradeKind kind = TradeKind::BUY;
    std::string wallet;
    MarketId market_id = 0;
    Side side = Side::YES;
    double amount = 0.0;              // buy: currency to spend
    double shares = 0.0;              // sell: shares to liquidate
    std::optional<BetId> bet_id;      // sell: restrict to one bet; undo: bet to reverse
    size_t queue_position = 0;
    Timestamp submitted_at;
};

struct TradeResult {
    RequestId request_id;
    TradeKind kind = TradeKind::BUY;
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    MarketId market_id = 0;
    std::string wallet;
    Side side = Side::YES;
    BetId bet_id = 0;
    double amount = 0.0;          // spent (buy), refunded (undo)
    double shares = 0.0;          // bought, sold or reversed
    double price = 0.0;           // average price per share
    double proceeds = 0.0;        // sell only
    double balance_after = 0.0;
    PriceQuote price_after;
    size_t queue_position = 0;
};

enum class RequestStatus {
    QUEUED,
    PROCESSING,
    DONE
};

const char* request_status_name(RequestStatus status);

struct PollResult {
    bool found = false;
    RequestStatus status = RequestStatus::QUEUED;
    ErrorKind error_kind = ErrorKind::None;   // NotFound / StaleRequest when !found
    std::string error;
    std::optional<TradeResult> result;        // set once DONE
};

// Request id -> outcome, kept for polling.
//
// A completed result stays readable (polling is idempotent) until its TTL
// elapses or the store exceeds max_results, oldest completed first. Ids that
// were purged are remembered for a while so a late poll reports
// StaleRequest rather than NotFound.
class ResultStore {
public:
    using Clock = std::chrono::steady_clock;

    ResultStore(std::chrono::milliseconds ttl, size_t max_results);

    void mark_queued(const TradeRequest& request);
    void mark_processing(const RequestId& request_id);
    void complete(const TradeResult& result);

    PollResult poll(const RequestId& request_id);

    // Completed result, if still retained
    std::optional<TradeResult> find(const RequestId& request_id);

    // Returns number of entries dropped
    size_t purge_expired();

    size_t size() const;

private:
    struct Entry {
        RequestStatus status = RequestStatus::QUEUED;
        std::optional<TradeResult> result;
        Clock::time_point completed_at;
    };

    size_t purge_locked(Clock::time_point now);
    void remember_purged(const RequestId& request_id);

    std::chrono::milliseconds ttl_;
    size_t max_results_;
    size_t max_tombstones_;
    std::unordered_map<RequestId, Entry> entries_;
    std::deque<RequestId> completion_order_;
    std::unordered_set<RequestId> purged_;
    std::deque<RequestId> purged_order_;
    mutable std::mutex mutex_;
};

} // namespace predix
