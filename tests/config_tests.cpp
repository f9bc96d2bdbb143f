#include <boost/test/unit_test.hpp>
#include "predix/config.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace predix;

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_AUTO_TEST_CASE(defaults_are_valid)
{
    Config config;
    BOOST_CHECK(config.validate().empty());
    BOOST_CHECK_EQUAL(config.lmsr_b, 5000.0);
    BOOST_CHECK_EQUAL(config.lmsr_buffer, 10000.0);
    BOOST_CHECK_EQUAL(config.initial_balance, 1000.0);
    BOOST_CHECK_EQUAL(config.profit_fee_rate, 0.02);
    BOOST_CHECK_EQUAL(config.result_ttl_ms, 3600 * 1000);
}

BOOST_AUTO_TEST_CASE(json_overrides_only_given_keys)
{
    auto config = Config::from_json({{"lmsr_b", 250.0}, {"max_results", 10}, {"log_level", "debug"}});
    BOOST_CHECK_EQUAL(config.lmsr_b, 250.0);
    BOOST_CHECK_EQUAL(config.max_results, 10u);
    BOOST_CHECK_EQUAL(config.log_level, "debug");
    BOOST_CHECK_EQUAL(config.lmsr_buffer, 10000.0);

    BOOST_CHECK_THROW(Config::from_json(nlohmann::json::array()), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(validate_reports_each_problem)
{
    Config config;
    config.lmsr_b = 0.0;
    config.profit_fee_rate = 1.5;
    config.min_price = 0.6;
    config.result_ttl_ms = 0;

    auto problems = config.validate();
    BOOST_CHECK_EQUAL(problems.size(), 4u);
}

BOOST_AUTO_TEST_CASE(file_loading)
{
    const char* path = "predix_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"initial_balance": 50, "profit_fee_rate": 0.1})";
    }
    auto config = Config::from_file(path);
    BOOST_CHECK_EQUAL(config.initial_balance, 50.0);
    BOOST_CHECK_EQUAL(config.profit_fee_rate, 0.1);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    BOOST_CHECK_THROW(Config::from_file(path), std::runtime_error);
    std::remove(path);

    BOOST_CHECK_THROW(Config::from_file("/nonexistent/predix.json"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(environment_overrides)
{
    setenv("PREDIX_LMSR_B", "1234.5", 1);
    setenv("PREDIX_RESULT_TTL_MS", "500", 1);
    Config config;
    config.apply_env();
    BOOST_CHECK_EQUAL(config.lmsr_b, 1234.5);
    BOOST_CHECK_EQUAL(config.result_ttl_ms, 500);

    setenv("PREDIX_LMSR_B", "lots", 1);
    BOOST_CHECK_THROW(config.apply_env(), std::runtime_error);

    unsetenv("PREDIX_LMSR_B");
    unsetenv("PREDIX_RESULT_TTL_MS");
}

BOOST_AUTO_TEST_SUITE_END()
