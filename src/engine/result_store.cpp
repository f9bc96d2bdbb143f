#include "predix/result_store.hpp"

namespace predix {

const char* request_status_name(RequestStatus status) {
    switch (status) {
        case RequestStatus::QUEUED:     return "queued";
        case RequestStatus::PROCESSING: return "processing";
        case RequestStatus::DONE:       return "done";
    }
    return "queued";
}

ResultStore::ResultStore(std::chrono::milliseconds ttl, size_t max_results)
    : ttl_(ttl)
    , max_results_(max_results)
    , max_tombstones_(max_results * 10) {
}

void ResultStore::mark_queued(const TradeRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[request.request_id] = Entry{};
}

void ResultStore::mark_processing(const RequestId& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(request_id);
    if (it != entries_.end()) {
        it->second.status = RequestStatus::PROCESSING;
    }
}

void ResultStore::complete(const TradeResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();

    auto& entry = entries_[result.request_id];
    entry.status = RequestStatus::DONE;
    entry.result = result;
    entry.completed_at = now;
    completion_order_.push_back(result.request_id);

    purge_locked(now);
}

PollResult ResultStore::poll(const RequestId& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_locked(Clock::now());

    PollResult out;
    auto it = entries_.find(request_id);
    if (it == entries_.end()) {
        if (purged_.count(request_id)) {
            out.error_kind = ErrorKind::StaleRequest;
            out.error = "Result for request " + request_id + " expired";
        } else {
            out.error_kind = ErrorKind::NotFound;
            out.error = "Unknown request " + request_id;
        }
        return out;
    }

    out.found = true;
    out.status = it->second.status;
    out.result = it->second.result;
    if (out.result) {
        out.error_kind = out.result->error_kind;
        out.error = out.result->error;
    }
    return out;
}

std::optional<TradeResult> ResultStore::find(const RequestId& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_locked(Clock::now());
    auto it = entries_.find(request_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.result;
}

size_t ResultStore::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return purge_locked(Clock::now());
}

size_t ResultStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t ResultStore::purge_locked(Clock::time_point now) {
    size_t purged = 0;

    // completion_order_ is sorted by completion time, so expiry stops at the first live entry
    while (!completion_order_.empty()) {
        const RequestId& oldest = completion_order_.front();
        auto it = entries_.find(oldest);
        bool expired = it != entries_.end() && now - it->second.completed_at >= ttl_;
        bool over_capacity = completion_order_.size() > max_results_;
        if (!expired && !over_capacity) break;

        if (it != entries_.end()) {
            entries_.erase(it);
            ++purged;
        }
        remember_purged(oldest);
        completion_order_.pop_front();
    }

    return purged;
}

void ResultStore::remember_purged(const RequestId& request_id) {
    if (purged_.insert(request_id).second) {
        purged_order_.push_back(request_id);
    }
    while (purged_order_.size() > max_tombstones_) {
        purged_.erase(purged_order_.front());
        purged_order_.pop_front();
    }
}

} // namespace predix
