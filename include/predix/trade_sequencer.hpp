#pragma once

#include "predix/types.hpp"
#include "predix/config.hpp"
#include "predix/pricing.hpp"
#include "predix/market_store.hpp"
#include "predix/ledger.hpp"
#include "predix/bet_book.hpp"
#include "predix/result_store.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>
#include <boost/uuid/uuid_generators.hpp>

namespace predix {

class AsyncStateWriter;

struct Submission {
    bool success = false;
    RequestId request_id;
    size_t queue_position = 0;     // trades ahead of this one
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

// Single consumer of all trade intents (buy, sell, undo).
//
// Producers call submit() from any thread; it validates the request shape,
// assigns a request id and returns immediately. One worker thread pops
// requests in arrival order and runs each to completion under the target
// market's exclusive lock, so trade N+1 always prices against the state
// left by trade N. Every outcome lands in the ResultStore.
class TradeSequencer {
public:
    TradeSequencer(const Config& config, MarketStore& markets, Ledger& ledger,
                   BetBook& bets, ResultStore& results);
    ~TradeSequencer();

    TradeSequencer(const TradeSequencer&) = delete;
    TradeSequencer& operator=(const TradeSequencer&) = delete;

    // Optional write-through of every mutation; must outlive the sequencer
    void set_async_writer(AsyncStateWriter* writer) { writer_ = writer; }

    void start();

    // Finishes the accepted work; submissions are rejected until the next start()
    void stop();

    bool is_running() const { return running_; }

    // Blocks only while the queue is at max_queue_depth. Work submitted before
    // the first start() waits in the queue.
    Submission submit(TradeRequest request);

    // Queued plus in-flight
    size_t pending() const;

    // True once the queue is empty and nothing is in flight
    bool wait_idle(std::chrono::milliseconds timeout);

    uint64_t processed_count() const { return processed_; }

private:
    void worker_loop();
    TradeResult process(const TradeRequest& request);

    void execute_buy(const TradeRequest& request, TradeResult& result);
    void execute_sell(const TradeRequest& request, TradeResult& result);
    void execute_undo(const TradeRequest& request, TradeResult& result);

    void validate(TradeRequest& request) const;
    void persist_wallet(const std::string& wallet);
    void persist_state(const MarketState& state);
    void persist_bet(const Bet& bet);

    Config config_;
    LmsrPricer pricer_;
    MarketStore& markets_;
    Ledger& ledger_;
    BetBook& bets_;
    ResultStore& results_;
    AsyncStateWriter* writer_ = nullptr;

    std::queue<TradeRequest> queue_;
    bool in_flight_ = false;
    bool stopped_ = false;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable space_cv_;
    std::condition_variable idle_cv_;
    boost::uuids::random_generator uuid_gen_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> processed_{0};
};

} // namespace predix
