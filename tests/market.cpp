#include "catalog/Market.hpp"
#include <boost/test/unit_test.hpp>
#include <eris/random/rng.hpp>
#include <stdexcept>

using namespace catalog;

namespace {

MarketSettings small_market() {
    MarketSettings s;
    s.authors = 6;
    s.consumers = 40;
    s.genres = 3;
    s.days = 45;
    s.consumer_funds = 200000;
    s.catalog.content_fee = 100;
    s.catalog.premium_fee = 1500;
    s.catalog.payable_views = 4;
    s.prob_publish = 0.3;
    s.prob_duplicate = 0.2;
    s.prob_subscribe = 0.05;
    s.prob_read = 0.5;
    return s;
}

}

BOOST_AUTO_TEST_SUITE(market)

BOOST_AUTO_TEST_CASE(invalid_parameters) {
    MarketSettings s = small_market();
    s.authors = 0;
    BOOST_CHECK_THROW(Market(s).checkParameters(), std::domain_error);
    s = small_market();
    s.consumers = 1;
    BOOST_CHECK_THROW(Market(s).checkParameters(), std::domain_error);
    s = small_market();
    s.prob_read = 1.5;
    BOOST_CHECK_THROW(Market(s).checkParameters(), std::domain_error);
    s = small_market();
    s.prob_gift = -0.1;
    BOOST_CHECK_THROW(Market(s).checkParameters(), std::domain_error);
    s = small_market();
    s.catalog.premium_fee = 0;
    BOOST_CHECK_THROW(Market(s).checkParameters(), std::domain_error);

    Market m(s);
    BOOST_CHECK_THROW(m.setup(), std::domain_error);
    BOOST_CHECK_NO_THROW(Market(small_market()).checkParameters());
}

BOOST_AUTO_TEST_CASE(call_order) {
    Market m(small_market());
    BOOST_CHECK_THROW(m.runDay(), std::logic_error);
    BOOST_CHECK_THROW(m.close(), std::logic_error);
    BOOST_CHECK_THROW(m.catalog(), std::logic_error);

    m.setup();
    BOOST_CHECK_THROW(m.setup(), std::logic_error);
    m.runDay();
    BOOST_CHECK_EQUAL(m.day(), 1u);
    m.close();
    BOOST_CHECK_THROW(m.runDay(), std::logic_error);
    BOOST_CHECK_THROW(m.close(), std::logic_error);
}

BOOST_AUTO_TEST_CASE(simulation_conserves_funds) {
    eris::random::seed(20240611);
    const MarketSettings s = small_market();
    Market m(s);
    m.setup();
    const amount_t supply = m.chain().totalSupply();
    BOOST_REQUIRE_EQUAL(supply, s.consumers * s.consumer_funds);

    for (uint32_t d = 0; d < s.days; d++) m.runDay();
    BOOST_CHECK_EQUAL(m.day(), s.days);
    BOOST_CHECK_EQUAL(m.chain().now(), s.days * DAY);

    const auto &stats = m.statistics();
    BOOST_CHECK(stats.published > 0);
    BOOST_CHECK(stats.pay_per_view > 0);
    BOOST_CHECK_EQUAL(stats.published, m.catalog().contentCount());
    BOOST_CHECK(stats.gifts <= stats.subscriptions);
    // Every grant is read straight away
    BOOST_CHECK_EQUAL(stats.consumed, stats.pay_per_view + stats.premium_views);
    BOOST_CHECK_EQUAL(stats.events.at("ContentGranted"), stats.pay_per_view + stats.premium_views);
    BOOST_CHECK_EQUAL(stats.events.at("NewContentPublished"), stats.published);
    if (stats.subscriptions > 0)
        BOOST_CHECK_EQUAL(stats.events.at("NewPremiumSubscription"), stats.subscriptions);
    // Duplicate bytes are attempted with prob_duplicate, and always rejected
    BOOST_CHECK(stats.rejected.count(CatalogError::Reason::duplicate_content) > 0);

    uint64_t views = 0;
    for (const auto &v : m.catalog().getStatistics().views) views += v;
    BOOST_CHECK_EQUAL(views, stats.pay_per_view + stats.premium_views);

    m.close();
    BOOST_CHECK(m.catalog().closed());
    BOOST_CHECK_EQUAL(m.chain().balance(m.chain().catalogAccount()), 0u);
    BOOST_CHECK_EQUAL(m.chain().totalSupply(), supply);

    // Authors' accounts hold exactly what the market recorded paying them
    amount_t authors_total = 0;
    for (const auto &a : m.authors()) {
        auto found = m.authorTotals().find(a);
        amount_t expected = found == m.authorTotals().end() ? 0 : found->second.total();
        BOOST_CHECK_EQUAL(m.chain().balance(a), expected);
        authors_total += expected;
    }
    BOOST_CHECK_EQUAL(m.chain().balance(m.catalog().owner()), stats.residual);

    // What consumers spent went to authors, except for the rounding residual
    amount_t spent = stats.pay_per_view * s.catalog.content_fee + stats.subscriptions * s.catalog.premium_fee;
    BOOST_CHECK_EQUAL(authors_total + stats.residual, spent);
    BOOST_CHECK_EQUAL(stats.events.at("CatalogClosed"), 1u);
}

BOOST_AUTO_TEST_CASE(runs_are_reproducible) {
    auto run = [](Market::Statistics &stats, amount_t &residual) {
        eris::random::seed(777);
        Market m(small_market());
        m.setup();
        for (int d = 0; d < 20; d++) m.runDay();
        m.close();
        stats = m.statistics();
        residual = m.chain().balance(m.catalog().owner());
    };
    Market::Statistics a, b;
    amount_t ra = 0, rb = 0;
    run(a, ra);
    run(b, rb);
    BOOST_CHECK_EQUAL(a.published, b.published);
    BOOST_CHECK_EQUAL(a.pay_per_view, b.pay_per_view);
    BOOST_CHECK_EQUAL(a.subscriptions, b.subscriptions);
    BOOST_CHECK_EQUAL(a.premium_views, b.premium_views);
    BOOST_CHECK_EQUAL(a.withdrawals, b.withdrawals);
    BOOST_CHECK_EQUAL(a.distributions, b.distributions);
    BOOST_CHECK_EQUAL(ra, rb);
    BOOST_CHECK(a.events == b.events);
}

BOOST_AUTO_TEST_SUITE_END()
