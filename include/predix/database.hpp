#pragma once

#include "predix/types.hpp"
#include <string>
#include <vector>
#include <variant>
#include <libpq-fe.h>

namespace predix {

// One row to upsert into the durable state tables
using StateRecord = std::variant<Market, MarketState, User, Bet>;

// PostgreSQL persistence for markets, market_state, users and bets.
// Not thread-safe: one thread loads at start-up, then the async writer owns it.
class Database {
public:
    explicit Database(const std::string& connection_string);
    ~Database();

    // Disable copy, enable move
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&&) noexcept;
    Database& operator=(Database&&) noexcept;

    bool connect();
    void disconnect();
    bool is_connected() const;

    // CREATE TABLE IF NOT EXISTS for all four tables
    bool ensure_schema();

    bool upsert_market(const Market& market);
    bool upsert_market_state(const MarketState& state);
    bool upsert_user(const User& user);
    bool upsert_bet(const Bet& bet);
    bool write(const StateRecord& record);

    std::vector<Market> load_markets();
    std::vector<MarketState> load_market_states();
    std::vector<User> load_users();
    std::vector<Bet> load_bets();

    // Execute raw query
    bool execute(const std::string& query);

private:
    bool execute_params(const std::string& query, const std::vector<std::string>& params);
    PGresult* select(const std::string& query);

    std::string connection_string_;
    PGconn* conn_{nullptr};

    bool check_connection();
};

} // namespace predix
