#include <boost/test/unit_test.hpp>
#include "predix/result_store.hpp"
#include <thread>

using namespace predix;
using namespace std::chrono_literals;

namespace {
    TradeRequest request(const std::string& id) {
        TradeRequest r;
        r.request_id = id;
        r.wallet = "w";
        r.market_id = 1;
        r.amount = 10.0;
        return r;
    }

    TradeResult done(const std::string& id, double shares) {
        TradeResult r;
        r.request_id = id;
        r.success = true;
        r.shares = shares;
        return r;
    }
}

BOOST_AUTO_TEST_SUITE(result_store_tests)

BOOST_AUTO_TEST_CASE(status_moves_queued_processing_done)
{
    ResultStore store(1h, 100);
    store.mark_queued(request("r1"));

    auto polled = store.poll("r1");
    BOOST_CHECK(polled.found);
    BOOST_CHECK(polled.status == RequestStatus::QUEUED);
    BOOST_CHECK(!polled.result);

    store.mark_processing("r1");
    BOOST_CHECK(store.poll("r1").status == RequestStatus::PROCESSING);

    store.complete(done("r1", 12.5));
    polled = store.poll("r1");
    BOOST_CHECK(polled.status == RequestStatus::DONE);
    BOOST_REQUIRE(polled.result);
    BOOST_CHECK_EQUAL(polled.result->shares, 12.5);
}

BOOST_AUTO_TEST_CASE(poll_is_idempotent)
{
    ResultStore store(1h, 100);
    store.mark_queued(request("r1"));
    store.complete(done("r1", 3.0));

    for (int i = 0; i < 5; ++i) {
        auto polled = store.poll("r1");
        BOOST_REQUIRE(polled.result);
        BOOST_CHECK_EQUAL(polled.result->shares, 3.0);
        BOOST_CHECK(polled.error_kind == ErrorKind::None);
    }
    BOOST_CHECK_EQUAL(store.size(), 1u);
}

BOOST_AUTO_TEST_CASE(unknown_request_is_not_found)
{
    ResultStore store(1h, 100);
    auto polled = store.poll("never-issued");
    BOOST_CHECK(!polled.found);
    BOOST_CHECK(polled.error_kind == ErrorKind::NotFound);
}

BOOST_AUTO_TEST_CASE(expired_result_is_stale)
{
    ResultStore store(50ms, 100);
    store.mark_queued(request("r1"));
    store.complete(done("r1", 1.0));
    BOOST_CHECK(store.poll("r1").found);

    std::this_thread::sleep_for(150ms);

    auto polled = store.poll("r1");
    BOOST_CHECK(!polled.found);
    BOOST_CHECK(polled.error_kind == ErrorKind::StaleRequest);
    BOOST_CHECK_EQUAL(store.size(), 0u);
}

BOOST_AUTO_TEST_CASE(ttl_does_not_apply_to_pending_requests)
{
    ResultStore store(20ms, 100);
    store.mark_queued(request("slow"));
    std::this_thread::sleep_for(60ms);
    BOOST_CHECK_EQUAL(store.purge_expired(), 0u);
    BOOST_CHECK(store.poll("slow").found);
}

BOOST_AUTO_TEST_CASE(capacity_evicts_oldest_completed)
{
    ResultStore store(1h, 2);
    for (const char* id : {"a", "b", "c"}) {
        store.mark_queued(request(id));
        store.complete(done(id, 1.0));
    }

    BOOST_CHECK(store.poll("a").error_kind == ErrorKind::StaleRequest);
    BOOST_CHECK(store.poll("b").found);
    BOOST_CHECK(store.poll("c").found);
    BOOST_CHECK(!store.find("a"));
    BOOST_CHECK(store.find("c"));
}

BOOST_AUTO_TEST_SUITE_END()
