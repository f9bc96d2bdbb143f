#include "predix/market_store.hpp"
#include "predix/logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace predix {

// ============ GUARD ============

MarketStore::Guard::Guard(std::shared_ptr<Slot> slot, double buffer, double epsilon)
    : slot_(std::move(slot))
    , lock_(slot_->mutex)
    , buffer_(buffer)
    , epsilon_(epsilon) {
}

const MarketState& MarketStore::Guard::apply(double delta_yes, double delta_no) {
    if (!std::isfinite(delta_yes) || !std::isfinite(delta_no)) {
        throw EngineError(ErrorKind::ValidationError, "Exposure change must be finite");
    }

    double q_yes = slot_->state.q_yes + delta_yes;
    double q_no = slot_->state.q_no + delta_no;

    if (q_yes < buffer_ - epsilon_ || q_no < buffer_ - epsilon_) {
        std::ostringstream msg;
        msg << "Market " << slot_->market.id << " exposure would fall below buffer "
            << buffer_ << " (q_yes=" << q_yes << ", q_no=" << q_no << ")";
        throw EngineError(ErrorKind::BufferViolation, msg.str());
    }

    slot_->state.q_yes = std::max(q_yes, buffer_);
    slot_->state.q_no = std::max(q_no, buffer_);
    ++slot_->state.trade_seq;
    return slot_->state;
}

void MarketStore::Guard::mark_resolved(Side outcome) {
    if (slot_->market.status == MarketStatus::RESOLVED) {
        throw EngineError(ErrorKind::AlreadyResolved,
            "Market " + std::to_string(slot_->market.id) + " already resolved");
    }
    slot_->market.status = MarketStatus::RESOLVED;
    slot_->market.resolution = outcome;
    slot_->market.resolved_at = std::chrono::system_clock::now();
}

// ============ STORE ============

MarketStore::MarketStore(double buffer)
    : buffer_(buffer)
    , epsilon_(1e-9 * std::max(1.0, buffer)) {
}

Market MarketStore::create_market(const MarketSpec& spec) {
    std::string question = spec.question;
    question.erase(0, question.find_first_not_of(" \t\r\n"));
    question.erase(question.find_last_not_of(" \t\r\n") + 1);
    if (question.empty()) {
        throw EngineError(ErrorKind::ValidationError, "Question is required");
    }

    auto slot = std::make_shared<Slot>();
    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        MarketId id = next_id_++;

        slot->market = Market{
            .id = id,
            .question = question,
            .description = spec.description,
            .category = spec.category,
            .end_date = spec.end_date,
            .created_by = spec.created_by,
            .status = MarketStatus::OPEN,
            .resolution = std::nullopt,
            .created_at = std::chrono::system_clock::now(),
            .resolved_at = std::nullopt
        };
        slot->state = MarketState{.market_id = id, .q_yes = buffer_, .q_no = buffer_};
        slots_[id] = slot;
    }

    Logger::instance().info("MARKET", "Created market ", slot->market.id, ": ", question);
    return slot->market;
}

void MarketStore::restore(const Market& market, const MarketState& state) {
    auto slot = std::make_shared<Slot>();
    slot->market = market;
    slot->state = state;
    slot->state.market_id = market.id;
    slot->state.q_yes = std::max(slot->state.q_yes, buffer_);
    slot->state.q_no = std::max(slot->state.q_no, buffer_);

    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    slots_[market.id] = slot;
    next_id_ = std::max(next_id_, market.id + 1);
}

std::shared_ptr<MarketStore::Slot> MarketStore::find_slot(MarketId id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = slots_.find(id);
    if (it == slots_.end()) return nullptr;
    return it->second;
}

bool MarketStore::exists(MarketId id) const {
    return find_slot(id) != nullptr;
}

std::optional<Market> MarketStore::get_market(MarketId id) const {
    auto slot = find_slot(id);
    if (!slot) return std::nullopt;
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->market;
}

std::optional<MarketState> MarketStore::get(MarketId id) const {
    auto slot = find_slot(id);
    if (!slot) return std::nullopt;
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    return slot->state;
}

std::vector<Market> MarketStore::list_markets(std::optional<MarketStatus> status) const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        for (const auto& [id, slot] : slots_) {
            slots.push_back(slot);
        }
    }

    std::vector<Market> markets;
    for (const auto& slot : slots) {
        std::shared_lock<std::shared_mutex> lock(slot->mutex);
        if (!status || slot->market.status == *status) {
            markets.push_back(slot->market);
        }
    }
    return markets;
}

size_t MarketStore::size() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return slots_.size();
}

MarketStore::Guard MarketStore::lock(MarketId id) {
    auto slot = find_slot(id);
    if (!slot) {
        throw EngineError(ErrorKind::NotFound, "Market " + std::to_string(id) + " not found");
    }
    return Guard(std::move(slot), buffer_, epsilon_);
}

} // namespace predix
