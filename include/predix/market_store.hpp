#pragma once

#include "predix/types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include <optional>

namespace predix {

struct MarketSpec {
    std::string question;
    std::string description;
    std::string category;
    std::string end_date;
    std::string created_by;
};

// Per-market (q_yes, q_no) accumulator plus market metadata.
//
// Readers take a shared lock for a consistent snapshot. The only way to
// mutate a market is through a Guard, which holds that market's exclusive
// lock for its lifetime; the trade sequencer and the resolution engine both
// go through it, so a trade and a resolution on the same market never
// interleave. Different markets never contend.
class MarketStore {
    struct Slot {
        mutable std::shared_mutex mutex;
        Market market;
        MarketState state;
    };

public:
    class Guard {
    public:
        Guard(Guard&&) noexcept = default;
        Guard& operator=(Guard&&) noexcept = default;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        const Market& market() const { return slot_->market; }
        const MarketState& state() const { return slot_->state; }

        // Incremented by every apply(); identifies the last trade on this market
        uint64_t trade_seq() const { return slot_->state.trade_seq; }

        // Adds (delta_yes, delta_no) to the exposure. Throws EngineError(BufferViolation)
        // if either side would fall below the buffer floor; values within rounding
        // distance of the floor are pinned to it.
        const MarketState& apply(double delta_yes, double delta_no);

        // Open -> Resolved. Throws EngineError(AlreadyResolved) on a second attempt.
        void mark_resolved(Side outcome);

    private:
        friend class MarketStore;
        Guard(std::shared_ptr<Slot> slot, double buffer, double epsilon);

        std::shared_ptr<Slot> slot_;
        std::unique_lock<std::shared_mutex> lock_;
        double buffer_;
        double epsilon_;
    };

    explicit MarketStore(double buffer);

    MarketStore(const MarketStore&) = delete;
    MarketStore& operator=(const MarketStore&) = delete;

    // Throws EngineError(ValidationError) for an empty question
    Market create_market(const MarketSpec& spec);

    // Reinstates a persisted market, trade sequence included; keeps id
    // allocation ahead of restored ids
    void restore(const Market& market, const MarketState& state);

    bool exists(MarketId id) const;
    std::optional<Market> get_market(MarketId id) const;
    std::optional<MarketState> get(MarketId id) const;
    std::vector<Market> list_markets(std::optional<MarketStatus> status = std::nullopt) const;
    size_t size() const;

    // Exclusive access to one market. Throws EngineError(NotFound).
    Guard lock(MarketId id);

    double buffer() const { return buffer_; }

private:
    std::shared_ptr<Slot> find_slot(MarketId id) const;

    double buffer_;
    double epsilon_;
    MarketId next_id_ = 1;
    std::map<MarketId, std::shared_ptr<Slot>> slots_;
    mutable std::shared_mutex map_mutex_;
};

} // namespace predix
