#include "predix/database.hpp"
#include "predix/logger.hpp"
#include <iomanip>
#include <type_traits>
#include <limits>
#include <sstream>

namespace predix {

namespace {
    std::string num(double value) {
        std::ostringstream oss;
        oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
        return oss.str();
    }

    std::string num(int64_t value) {
        return std::to_string(value);
    }

    std::string num(uint64_t value) {
        return std::to_string(value);
    }

    std::string boolean(bool value) {
        return value ? "true" : "false";
    }

    std::string field(PGresult* res, int row, int col) {
        if (PQgetisnull(res, row, col)) return "";
        return PQgetvalue(res, row, col);
    }

    double field_double(PGresult* res, int row, int col) {
        std::string v = field(res, row, col);
        return v.empty() ? 0.0 : std::stod(v);
    }

    int64_t field_int(PGresult* res, int row, int col) {
        std::string v = field(res, row, col);
        return v.empty() ? 0 : std::stoll(v);
    }

    bool field_bool(PGresult* res, int row, int col) {
        std::string v = field(res, row, col);
        return v == "t" || v == "true";
    }

    const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS markets (
    id BIGINT PRIMARY KEY,
    question TEXT NOT NULL,
    description TEXT,
    category TEXT,
    end_date TEXT,
    created_by TEXT,
    status TEXT NOT NULL DEFAULT 'open',
    resolution TEXT,
    created_at BIGINT NOT NULL,
    resolved_at BIGINT
);
CREATE TABLE IF NOT EXISTS market_state (
    market_id BIGINT PRIMARY KEY REFERENCES markets(id),
    q_yes DOUBLE PRECISION NOT NULL,
    q_no DOUBLE PRECISION NOT NULL,
    trade_seq BIGINT NOT NULL DEFAULT 0
);
ALTER TABLE market_state ADD COLUMN IF NOT EXISTS trade_seq BIGINT NOT NULL DEFAULT 0;
CREATE TABLE IF NOT EXISTS users (
    wallet TEXT PRIMARY KEY,
    balance DOUBLE PRECISION NOT NULL CHECK (balance >= 0),
    verified BOOLEAN NOT NULL DEFAULT false,
    created_at BIGINT NOT NULL
);
CREATE TABLE IF NOT EXISTS bets (
    id BIGINT PRIMARY KEY,
    market_id BIGINT NOT NULL REFERENCES markets(id),
    wallet TEXT NOT NULL,
    side TEXT NOT NULL CHECK (side IN ('YES', 'NO')),
    amount DOUBLE PRECISION NOT NULL,
    shares DOUBLE PRECISION NOT NULL,
    avg_price DOUBLE PRECISION NOT NULL,
    status TEXT NOT NULL,
    result TEXT NOT NULL,
    payout DOUBLE PRECISION NOT NULL DEFAULT 0,
    fee DOUBLE PRECISION NOT NULL DEFAULT 0,
    profit DOUBLE PRECISION NOT NULL DEFAULT 0,
    sold_shares DOUBLE PRECISION NOT NULL DEFAULT 0,
    sale_proceeds DOUBLE PRECISION NOT NULL DEFAULT 0,
    payout_settled BOOLEAN NOT NULL DEFAULT false,
    created_at BIGINT NOT NULL,
    q_yes_before DOUBLE PRECISION NOT NULL,
    q_no_before DOUBLE PRECISION NOT NULL,
    trade_seq_after BIGINT NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_bets_market ON bets(market_id);
CREATE INDEX IF NOT EXISTS idx_bets_wallet ON bets(wallet);
)SQL";
}

Database::Database(const std::string& connection_string)
    : connection_string_(connection_string) {
}

Database::~Database() {
    disconnect();
}

Database::Database(Database&& other) noexcept
    : connection_string_(std::move(other.connection_string_))
    , conn_(other.conn_) {
    other.conn_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        disconnect();
        connection_string_ = std::move(other.connection_string_);
        conn_ = other.conn_;
        other.conn_ = nullptr;
    }
    return *this;
}

bool Database::connect() {
    conn_ = PQconnectdb(connection_string_.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        Logger::instance().error("DB", "Connection failed: ", PQerrorMessage(conn_));
        PQfinish(conn_);
        conn_ = nullptr;
        return false;
    }

    Logger::instance().info("DB", "Connected to PostgreSQL");
    return true;
}

void Database::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
        Logger::instance().info("DB", "Disconnected");
    }
}

bool Database::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool Database::check_connection() {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        return connect();
    }
    return true;
}

bool Database::ensure_schema() {
    return execute(kSchema);
}

bool Database::upsert_market(const Market& market) {
    std::string resolution = market.resolution ? side_name(*market.resolution) : "";
    std::string resolved_at = market.resolved_at ? num(to_epoch_seconds(*market.resolved_at)) : "";

    return execute_params(
        "INSERT INTO markets (id, question, description, category, end_date, created_by, "
        "status, resolution, created_at, resolved_at) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, NULLIF($8, ''), $9, NULLIF($10, '')::BIGINT) "
        "ON CONFLICT (id) DO UPDATE SET status = EXCLUDED.status, "
        "resolution = EXCLUDED.resolution, resolved_at = EXCLUDED.resolved_at",
        {
            num(market.id), market.question, market.description, market.category,
            market.end_date, market.created_by, market_status_name(market.status),
            resolution, num(to_epoch_seconds(market.created_at)), resolved_at
        });
}

bool Database::upsert_market_state(const MarketState& state) {
    return execute_params(
        "INSERT INTO market_state (market_id, q_yes, q_no, trade_seq) VALUES ($1, $2, $3, $4) "
        "ON CONFLICT (market_id) DO UPDATE SET q_yes = EXCLUDED.q_yes, q_no = EXCLUDED.q_no, "
        "trade_seq = EXCLUDED.trade_seq",
        {num(state.market_id), num(state.q_yes), num(state.q_no), num(state.trade_seq)});
}

bool Database::upsert_user(const User& user) {
    return execute_params(
        "INSERT INTO users (wallet, balance, verified, created_at) VALUES ($1, $2, $3, $4) "
        "ON CONFLICT (wallet) DO UPDATE SET balance = EXCLUDED.balance, verified = EXCLUDED.verified",
        {user.wallet, num(user.balance), boolean(user.verified), num(to_epoch_seconds(user.created_at))});
}

bool Database::upsert_bet(const Bet& bet) {
    return execute_params(
        "INSERT INTO bets (id, market_id, wallet, side, amount, shares, avg_price, status, result, "
        "payout, fee, profit, sold_shares, sale_proceeds, payout_settled, created_at, "
        "q_yes_before, q_no_before, trade_seq_after) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, $17, $18, $19) "
        "ON CONFLICT (id) DO UPDATE SET amount = EXCLUDED.amount, shares = EXCLUDED.shares, "
        "status = EXCLUDED.status, result = EXCLUDED.result, payout = EXCLUDED.payout, "
        "fee = EXCLUDED.fee, profit = EXCLUDED.profit, sold_shares = EXCLUDED.sold_shares, "
        "sale_proceeds = EXCLUDED.sale_proceeds, payout_settled = EXCLUDED.payout_settled",
        {
            num(bet.id), num(bet.market_id), bet.wallet, side_name(bet.side),
            num(bet.amount), num(bet.shares), num(bet.avg_price),
            bet_status_name(bet.status), bet_result_name(bet.result),
            num(bet.payout), num(bet.fee), num(bet.profit),
            num(bet.sold_shares), num(bet.sale_proceeds), boolean(bet.payout_settled),
            num(to_epoch_seconds(bet.created_at)),
            num(bet.state_before.q_yes), num(bet.state_before.q_no), num(bet.trade_seq_after)
        });
}

bool Database::write(const StateRecord& record) {
    return std::visit([this](const auto& row) {
        using T = std::decay_t<decltype(row)>;
        if constexpr (std::is_same_v<T, Market>) return upsert_market(row);
        else if constexpr (std::is_same_v<T, MarketState>) return upsert_market_state(row);
        else if constexpr (std::is_same_v<T, User>) return upsert_user(row);
        else return upsert_bet(row);
    }, record);
}

std::vector<Market> Database::load_markets() {
    std::vector<Market> markets;
    PGresult* res = select(
        "SELECT id, question, description, category, end_date, created_by, status, "
        "resolution, created_at, resolved_at FROM markets ORDER BY id");
    if (!res) return markets;

    int rows = PQntuples(res);
    for (int i = 0; i < rows; i++) {
        Market m;
        m.id = field_int(res, i, 0);
        m.question = field(res, i, 1);
        m.description = field(res, i, 2);
        m.category = field(res, i, 3);
        m.end_date = field(res, i, 4);
        m.created_by = field(res, i, 5);
        m.status = parse_market_status(field(res, i, 6)).value_or(MarketStatus::OPEN);
        m.resolution = parse_side(field(res, i, 7));
        m.created_at = from_epoch_seconds(field_int(res, i, 8));
        if (!PQgetisnull(res, i, 9)) {
            m.resolved_at = from_epoch_seconds(field_int(res, i, 9));
        }
        markets.push_back(m);
    }

    PQclear(res);
    return markets;
}

std::vector<MarketState> Database::load_market_states() {
    std::vector<MarketState> states;
    PGresult* res = select("SELECT market_id, q_yes, q_no, trade_seq FROM market_state");
    if (!res) return states;

    int rows = PQntuples(res);
    for (int i = 0; i < rows; i++) {
        states.push_back(MarketState{
            .market_id = field_int(res, i, 0),
            .q_yes = field_double(res, i, 1),
            .q_no = field_double(res, i, 2),
            .trade_seq = static_cast<uint64_t>(field_int(res, i, 3))
        });
    }

    PQclear(res);
    return states;
}

std::vector<User> Database::load_users() {
    std::vector<User> users;
    PGresult* res = select("SELECT wallet, balance, verified, created_at FROM users");
    if (!res) return users;

    int rows = PQntuples(res);
    for (int i = 0; i < rows; i++) {
        users.push_back(User{
            .wallet = field(res, i, 0),
            .balance = field_double(res, i, 1),
            .verified = field_bool(res, i, 2),
            .created_at = from_epoch_seconds(field_int(res, i, 3))
        });
    }

    PQclear(res);
    return users;
}

std::vector<Bet> Database::load_bets() {
    std::vector<Bet> bets;
    PGresult* res = select(
        "SELECT id, market_id, wallet, side, amount, shares, avg_price, status, result, "
        "payout, fee, profit, sold_shares, sale_proceeds, payout_settled, created_at, "
        "q_yes_before, q_no_before, trade_seq_after FROM bets ORDER BY id");
    if (!res) return bets;

    int rows = PQntuples(res);
    for (int i = 0; i < rows; i++) {
        Bet b;
        b.id = field_int(res, i, 0);
        b.market_id = field_int(res, i, 1);
        b.wallet = field(res, i, 2);
        b.side = parse_side(field(res, i, 3)).value_or(Side::YES);
        b.amount = field_double(res, i, 4);
        b.shares = field_double(res, i, 5);
        b.avg_price = field_double(res, i, 6);
        b.status = parse_bet_status(field(res, i, 7)).value_or(BetStatus::OPEN);
        b.result = parse_bet_result(field(res, i, 8)).value_or(BetResult::NA);
        b.payout = field_double(res, i, 9);
        b.fee = field_double(res, i, 10);
        b.profit = field_double(res, i, 11);
        b.sold_shares = field_double(res, i, 12);
        b.sale_proceeds = field_double(res, i, 13);
        b.payout_settled = field_bool(res, i, 14);
        b.created_at = from_epoch_seconds(field_int(res, i, 15));
        b.state_before = MarketState{
            .market_id = b.market_id,
            .q_yes = field_double(res, i, 16),
            .q_no = field_double(res, i, 17)
        };
        b.trade_seq_after = static_cast<uint64_t>(field_int(res, i, 18));
        bets.push_back(b);
    }

    PQclear(res);
    return bets;
}

bool Database::execute(const std::string& query) {
    if (!check_connection()) return false;

    PGresult* res = PQexec(conn_, query.c_str());
    ExecStatusType status = PQresultStatus(res);

    bool success = (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);

    if (!success) {
        Logger::instance().error("DB", "Query failed: ", PQerrorMessage(conn_));
    }

    PQclear(res);
    return success;
}

bool Database::execute_params(const std::string& query, const std::vector<std::string>& params) {
    if (!check_connection()) return false;

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    PGresult* res = PQexecParams(conn_, query.c_str(), static_cast<int>(values.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0);
    ExecStatusType status = PQresultStatus(res);
    bool success = (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);

    if (!success) {
        Logger::instance().error("DB", "Query failed: ", PQerrorMessage(conn_));
    }

    PQclear(res);
    return success;
}

PGresult* Database::select(const std::string& query) {
    if (!check_connection()) return nullptr;

    PGresult* res = PQexec(conn_, query.c_str());
    if (PQresultStatus(res) != PGRES_TUPLES_OK) {
        Logger::instance().error("DB", "Select failed: ", PQerrorMessage(conn_));
        PQclear(res);
        return nullptr;
    }
    return res;
}

} // namespace predix
