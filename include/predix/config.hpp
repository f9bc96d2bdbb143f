#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace predix {

struct Config {
    // LMSR
    double lmsr_b = 5000.0;          // liquidity parameter
    double lmsr_buffer = 10000.0;    // initial and minimum exposure per side
    double min_price = 0.01;
    double max_price = 0.99;

    // Ledger
    double initial_balance = 1000.0;

    // Settlement
    double profit_fee_rate = 0.02;   // applied to positive profit only

    // Sequencer
    int64_t result_ttl_ms = 3600 * 1000;
    size_t max_results = 1000;
    size_t max_queue_depth = 10000;
    double max_trade_amount = 1000000.0;
    double slippage_threshold = 0.05;
    double dust_shares = 0.01;

    // Runtime
    std::string log_level = "info";
    std::string log_file;
    std::string database_url;

    // Reads a JSON object; missing keys keep their defaults. Throws on unreadable or malformed files.
    static Config from_file(const std::string& path);
    static Config from_json(const nlohmann::json& j);

    // Environment overrides (PREDIX_*, DATABASE_URL)
    void apply_env();

    // Empty when the configuration is usable
    std::vector<std::string> validate() const;

    nlohmann::json to_json() const;
};

} // namespace predix
