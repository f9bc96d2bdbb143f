#include <boost/test/unit_test.hpp>
#include "predix/ledger.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace predix;

BOOST_AUTO_TEST_SUITE(ledger_tests)

BOOST_AUTO_TEST_CASE(first_touch_provisions_wallet)
{
    Ledger ledger(1000.0);
    auto first = ledger.balance_of("0xabc");
    BOOST_CHECK(first.is_new_user);
    BOOST_CHECK_EQUAL(first.balance, 1000.0);

    auto second = ledger.balance_of("0xabc");
    BOOST_CHECK(!second.is_new_user);
    BOOST_CHECK_EQUAL(second.balance, 1000.0);
    BOOST_CHECK_EQUAL(ledger.size(), 1u);
}

BOOST_AUTO_TEST_CASE(debit_and_credit)
{
    Ledger ledger(1000.0);
    BOOST_CHECK_EQUAL(ledger.debit("w", 250.0), 750.0);
    BOOST_CHECK_EQUAL(ledger.credit("w", 50.0), 800.0);
    BOOST_CHECK_EQUAL(ledger.balance_of("w").balance, 800.0);
}

BOOST_AUTO_TEST_CASE(overdraft_is_rejected_without_change)
{
    Ledger ledger(1000.0);
    try {
        ledger.debit("w", 1500.0);
        BOOST_FAIL("expected InsufficientFunds");
    } catch (const EngineError& e) {
        BOOST_CHECK(e.kind() == ErrorKind::InsufficientFunds);
        BOOST_CHECK(std::string(e.what()).find("You have 1000.00, need 1500.00") != std::string::npos);
    }
    BOOST_CHECK_EQUAL(ledger.balance_of("w").balance, 1000.0);

    // Whole balance can be spent
    BOOST_CHECK_EQUAL(ledger.debit("w", 1000.0), 0.0);
}

BOOST_AUTO_TEST_CASE(bad_amounts_and_wallets)
{
    Ledger ledger(10.0);
    BOOST_CHECK_THROW(ledger.debit("w", 0.0), EngineError);
    BOOST_CHECK_THROW(ledger.credit("w", -1.0), EngineError);
    BOOST_CHECK_THROW(ledger.balance_of(""), EngineError);
}

BOOST_AUTO_TEST_CASE(verification_flag)
{
    Ledger ledger(10.0);
    ledger.set_verified("w", true);
    auto user = ledger.get_user("w");
    BOOST_REQUIRE(user);
    BOOST_CHECK(user->verified);
    BOOST_CHECK(!ledger.get_user("nobody"));
}

BOOST_AUTO_TEST_CASE(concurrent_debits_never_overdraw)
{
    Ledger ledger(1000.0);
    std::atomic<int> accepted{0};
    std::atomic<int> refused{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 10; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                try {
                    ledger.debit("shared", 1.0);
                    accepted++;
                } catch (const EngineError& e) {
                    if (e.kind() == ErrorKind::InsufficientFunds) refused++;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    BOOST_CHECK_EQUAL(accepted.load(), 1000);
    BOOST_CHECK_EQUAL(refused.load(), 1000);
    BOOST_CHECK_EQUAL(ledger.balance_of("shared").balance, 0.0);
}

BOOST_AUTO_TEST_CASE(state_snapshot)
{
    Ledger ledger(5.0);
    ledger.credit("a", 1.0);
    ledger.restore(User{.wallet = "b", .balance = 42.0, .verified = true});
    auto state = ledger.get_state();
    BOOST_CHECK_EQUAL(state.size(), 2u);
    BOOST_CHECK_EQUAL(state["a"], 6.0);
    BOOST_CHECK_EQUAL(state["b"], 42.0);
}

BOOST_AUTO_TEST_SUITE_END()
