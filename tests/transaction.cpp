#include "catalog/Transaction.hpp"
#include "catalog/Event.hpp"
#include <boost/test/unit_test.hpp>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace catalog;

namespace {

struct JournalFixture {
    JournalFixture() {
        journal.subscribe([this](const Event &e) { delivered.push_back(e); });
    }

    Journal journal;
    std::vector<Event> delivered;
};

}

BOOST_FIXTURE_TEST_SUITE(transaction, JournalFixture)

BOOST_AUTO_TEST_CASE(commit_keeps_changes_and_delivers) {
    int x = 1;
    std::string s = "before";
    {
        Transaction tx(journal);
        BOOST_CHECK_EQUAL(journal.depth(), 1u);
        BOOST_CHECK(not tx.nested());
        tx.save(x);
        tx.save(s);
        x = 2;
        s = "after";
        tx.emit(Event::newAuthor(7));
        BOOST_CHECK(delivered.empty());
        tx.commit();
        BOOST_REQUIRE_EQUAL(delivered.size(), 1u);
    }
    BOOST_CHECK_EQUAL(journal.depth(), 0u);
    BOOST_CHECK_EQUAL(x, 2);
    BOOST_CHECK_EQUAL(s, "after");
    BOOST_CHECK(delivered[0].type == Event::Type::new_author);
    BOOST_CHECK_EQUAL(delivered[0].account, 7u);
}

BOOST_AUTO_TEST_CASE(rollback_restores_and_drops_events) {
    int x = 1;
    std::map<int, int> m{{1, 10}};
    {
        Transaction tx(journal);
        tx.save(x);
        x = 5;
        // Saving twice restores the first value
        tx.save(x);
        x = 6;
        m[2] = 20;
        tx.onRollback([&m] { m.erase(2); });
        tx.save(m.at(1));
        m.at(1) = 11;
        tx.emit(Event::creditAvailable(3));
    }
    BOOST_CHECK_EQUAL(x, 1);
    BOOST_CHECK_EQUAL(m.size(), 1u);
    BOOST_CHECK_EQUAL(m.at(1), 10);
    BOOST_CHECK(delivered.empty());
    BOOST_CHECK_EQUAL(journal.depth(), 0u);

    // Nothing left over from the failed frame
    Transaction tx(journal);
    tx.emit(Event::newAuthor(1));
    tx.commit();
    BOOST_CHECK_EQUAL(delivered.size(), 1u);
}

BOOST_AUTO_TEST_CASE(rollback_on_exception) {
    int x = 1;
    auto op = [&] {
        Transaction tx(journal);
        tx.save(x);
        x = 2;
        tx.emit(Event::newAuthor(1));
        throw std::runtime_error("failed");
    };
    BOOST_CHECK_THROW(op(), std::runtime_error);
    BOOST_CHECK_EQUAL(x, 1);
    BOOST_CHECK(delivered.empty());
}

BOOST_AUTO_TEST_CASE(nested_commit_joins_outer_frame) {
    int outer_value = 0, inner_value = 0;
    {
        Transaction outer(journal);
        outer.save(outer_value);
        outer_value = 1;
        outer.emit(Event::newAuthor(1));
        {
            Transaction inner(journal);
            BOOST_CHECK(inner.nested());
            BOOST_CHECK_EQUAL(journal.depth(), 2u);
            inner.save(inner_value);
            inner_value = 1;
            inner.emit(Event::newAuthor(2));
            inner.commit();
        }
        // Only the outermost commit delivers
        BOOST_CHECK(delivered.empty());
        outer.emit(Event::newAuthor(3));
        outer.commit();
    }
    BOOST_CHECK_EQUAL(outer_value, 1);
    BOOST_CHECK_EQUAL(inner_value, 1);
    BOOST_REQUIRE_EQUAL(delivered.size(), 3u);
    BOOST_CHECK_EQUAL(delivered[0].account, 1u);
    BOOST_CHECK_EQUAL(delivered[1].account, 2u);
    BOOST_CHECK_EQUAL(delivered[2].account, 3u);
}

BOOST_AUTO_TEST_CASE(outer_rollback_undoes_committed_inner) {
    int outer_value = 0, inner_value = 0;
    {
        Transaction outer(journal);
        outer.save(outer_value);
        outer_value = 1;
        {
            Transaction inner(journal);
            inner.save(inner_value);
            inner_value = 1;
            inner.emit(Event::newAuthor(2));
            inner.commit();
        }
    }
    BOOST_CHECK_EQUAL(outer_value, 0);
    BOOST_CHECK_EQUAL(inner_value, 0);
    BOOST_CHECK(delivered.empty());
}

BOOST_AUTO_TEST_CASE(inner_rollback_is_independent) {
    int outer_value = 0, inner_value = 0;
    {
        Transaction outer(journal);
        outer.save(outer_value);
        outer_value = 1;
        outer.emit(Event::newAuthor(1));
        {
            Transaction inner(journal);
            inner.save(inner_value);
            inner_value = 1;
            inner.emit(Event::newAuthor(2));
        }
        BOOST_CHECK_EQUAL(inner_value, 0);
        BOOST_CHECK_EQUAL(outer_value, 1);
        outer.commit();
    }
    BOOST_CHECK_EQUAL(outer_value, 1);
    BOOST_REQUIRE_EQUAL(delivered.size(), 1u);
    BOOST_CHECK_EQUAL(delivered[0].account, 1u);
}

BOOST_AUTO_TEST_CASE(commit_misuse) {
    {
        Transaction tx(journal);
        tx.commit();
        BOOST_CHECK_THROW(tx.commit(), std::logic_error);
        BOOST_CHECK_THROW(tx.emit(Event::newAuthor(1)), std::logic_error);
    }
    {
        Transaction outer(journal);
        Transaction inner(journal);
        BOOST_CHECK_THROW(outer.commit(), std::logic_error);
        inner.commit();
        outer.commit();
    }
    BOOST_CHECK_EQUAL(journal.depth(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
