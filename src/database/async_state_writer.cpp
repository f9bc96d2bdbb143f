#include "predix/async_state_writer.hpp"
#include "predix/logger.hpp"

namespace predix {

namespace {
    const char* record_table(const StateRecord& record) {
        switch (record.index()) {
            case 0: return "markets";
            case 1: return "market_state";
            case 2: return "users";
            default: return "bets";
        }
    }
}

AsyncStateWriter::AsyncStateWriter(Database& db) : db_(db) {}

AsyncStateWriter::~AsyncStateWriter() {
    stop();
}

void AsyncStateWriter::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread(&AsyncStateWriter::worker_loop, this);
    Logger::instance().info("ASYNC", "State writer started");
}

void AsyncStateWriter::stop() {
    if (!running_.exchange(false)) return;
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    Logger::instance().info("ASYNC", "State writer stopped");
}

void AsyncStateWriter::queue_record(const StateRecord& record) {
    size_t pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(record);
        pending = queue_.size();
    }
    cv_.notify_one();
    Logger::instance().debug("ASYNC", "Queued ", record_table(record), " row (pending: ", pending, ")");
}

size_t AsyncStateWriter::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void AsyncStateWriter::write_one(const StateRecord& record) {
    if (!db_.write(record)) {
        failed_++;
        Logger::instance().error("ASYNC", "Failed to save ", record_table(record), " row");
    }
}

void AsyncStateWriter::worker_loop() {
    while (running_) {
        StateRecord record;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

            if (!running_ && queue_.empty()) break;
            if (queue_.empty()) continue;

            record = queue_.front();
            queue_.pop();
        }

        write_one(record);
    }

    // Drain remaining rows on shutdown
    std::queue<StateRecord> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(remaining, queue_);
    }
    while (!remaining.empty()) {
        write_one(remaining.front());
        remaining.pop();
    }
}

} // namespace predix
