#include "predix/config.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace predix {

namespace {
    void read_double(const char* name, double& out) {
        const char* value = std::getenv(name);
        if (!value || !*value) return;
        try {
            out = std::stod(value);
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("Invalid number in ") + name + ": " + value);
        }
    }

    void read_int(const char* name, int64_t& out) {
        const char* value = std::getenv(name);
        if (!value || !*value) return;
        try {
            out = std::stoll(value);
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("Invalid integer in ") + name + ": " + value);
        }
    }

    void read_string(const char* name, std::string& out) {
        const char* value = std::getenv(name);
        if (value && *value) out = value;
    }
}

Config Config::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    return from_json(j);
}

Config Config::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    Config c;
    c.lmsr_b = j.value("lmsr_b", c.lmsr_b);
    c.lmsr_buffer = j.value("lmsr_buffer", c.lmsr_buffer);
    c.min_price = j.value("min_price", c.min_price);
    c.max_price = j.value("max_price", c.max_price);
    c.initial_balance = j.value("initial_balance", c.initial_balance);
    c.profit_fee_rate = j.value("profit_fee_rate", c.profit_fee_rate);
    c.result_ttl_ms = j.value("result_ttl_ms", c.result_ttl_ms);
    c.max_results = j.value("max_results", c.max_results);
    c.max_queue_depth = j.value("max_queue_depth", c.max_queue_depth);
    c.max_trade_amount = j.value("max_trade_amount", c.max_trade_amount);
    c.slippage_threshold = j.value("slippage_threshold", c.slippage_threshold);
    c.dust_shares = j.value("dust_shares", c.dust_shares);
    c.log_level = j.value("log_level", c.log_level);
    c.log_file = j.value("log_file", c.log_file);
    c.database_url = j.value("database_url", c.database_url);
    return c;
}

void Config::apply_env() {
    read_double("PREDIX_LMSR_B", lmsr_b);
    read_double("PREDIX_LMSR_BUFFER", lmsr_buffer);
    read_double("PREDIX_INITIAL_BALANCE", initial_balance);
    read_double("PREDIX_FEE_RATE", profit_fee_rate);
    read_int("PREDIX_RESULT_TTL_MS", result_ttl_ms);
    read_string("PREDIX_LOG_LEVEL", log_level);
    read_string("PREDIX_LOG_FILE", log_file);
    read_string("DATABASE_URL", database_url);
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;

    if (!std::isfinite(lmsr_b) || lmsr_b <= 0.0) {
        problems.push_back("lmsr_b must be positive");
    }
    if (!std::isfinite(lmsr_buffer) || lmsr_buffer < 0.0) {
        problems.push_back("lmsr_buffer must be non-negative");
    }
    if (!(min_price > 0.0 && min_price < max_price && max_price < 1.0)) {
        problems.push_back("price bounds must satisfy 0 < min_price < max_price < 1");
    } else if (std::fabs(min_price + max_price - 1.0) > 1e-12) {
        problems.push_back("price bounds must be symmetric (min_price + max_price == 1)");
    }
    if (!std::isfinite(initial_balance) || initial_balance < 0.0) {
        problems.push_back("initial_balance must be non-negative");
    }
    if (!(profit_fee_rate >= 0.0 && profit_fee_rate < 1.0)) {
        problems.push_back("profit_fee_rate must be in [0, 1)");
    }
    if (result_ttl_ms <= 0) {
        problems.push_back("result_ttl_ms must be positive");
    }
    if (max_results == 0) {
        problems.push_back("max_results must be positive");
    }
    if (max_queue_depth == 0) {
        problems.push_back("max_queue_depth must be positive");
    }
    if (!(max_trade_amount > 0.0)) {
        problems.push_back("max_trade_amount must be positive");
    }
    if (!(slippage_threshold >= 0.0)) {
        problems.push_back("slippage_threshold must be non-negative");
    }
    if (!(dust_shares >= 0.0)) {
        problems.push_back("dust_shares must be non-negative");
    }

    return problems;
}

nlohmann::json Config::to_json() const {
    return {
        {"lmsr_b", lmsr_b},
        {"lmsr_buffer", lmsr_buffer},
        {"min_price", min_price},
        {"max_price", max_price},
        {"initial_balance", initial_balance},
        {"profit_fee_rate", profit_fee_rate},
        {"result_ttl_ms", result_ttl_ms},
        {"max_results", max_results},
        {"max_queue_depth", max_queue_depth},
        {"max_trade_amount", max_trade_amount},
        {"slippage_threshold", slippage_threshold},
        {"dust_shares", dust_shares},
        {"log_level", log_level},
        {"log_file", log_file},
        {"database", database_url.empty() ? "disabled" : "enabled"}
    };
}

} // namespace predix
