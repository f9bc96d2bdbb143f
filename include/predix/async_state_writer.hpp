#pragma once

#include "predix/database.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace predix {

// Background writer so trade processing never waits on PostgreSQL
class AsyncStateWriter {
public:
    explicit AsyncStateWriter(Database& db);
    ~AsyncStateWriter();

    // Non-blocking: queues a row for async upsert
    void queue_record(const StateRecord& record);

    void start();
    void stop();

    size_t pending_count() const;
    size_t failed_count() const { return failed_.load(); }

private:
    void worker_loop();
    void write_one(const StateRecord& record);

    Database& db_;
    std::queue<StateRecord> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> failed_{0};
};

} // namespace predix
