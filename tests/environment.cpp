#include "fixture.hpp"
#include "catalog/ContentStore.hpp"
#include <boost/test/unit_test.hpp>
#include <memory>
#include <stdexcept>
#include <string>

using namespace catalog;
using namespace catalog::test;
using Reason = CatalogError::Reason;

BOOST_AUTO_TEST_SUITE(environment)

BOOST_AUTO_TEST_CASE(accounts_and_clock) {
    LocalChain chain(T0);
    BOOST_CHECK_EQUAL(chain.now(), T0);
    account_t a = chain.createAccount(), b = chain.createAccount(500);
    BOOST_CHECK(a != 0);
    BOOST_CHECK(a != b);
    BOOST_CHECK_EQUAL(chain.balance(a), 0u);
    BOOST_CHECK_EQUAL(chain.balance(b), 500u);
    BOOST_CHECK_EQUAL(chain.totalSupply(), 500u);
    BOOST_CHECK_THROW(chain.balance(b + 100), std::out_of_range);

    chain.advance(DAY);
    BOOST_CHECK_EQUAL(chain.now(), T0 + DAY);
    chain.setTime(T0 + DAY);
    BOOST_CHECK_THROW(chain.setTime(T0), std::logic_error);
    BOOST_CHECK_EQUAL(chain.now(), T0 + DAY);
}

BOOST_AUTO_TEST_CASE(execute_moves_value) {
    LocalChain chain;
    account_t vault = chain.createAccount(), payer = chain.createAccount(100), payee = chain.createAccount();
    BOOST_CHECK_THROW(chain.transfer(payee, 1), std::logic_error);
    chain.setCatalogAccount(vault);
    BOOST_CHECK_EQUAL(chain.catalogAccount(), vault);

    chain.execute(payer, 40, [&] {
        BOOST_CHECK_EQUAL(chain.balance(vault), 40u);
        chain.transfer(payee, 15);
    });
    BOOST_CHECK_EQUAL(chain.balance(payer), 60u);
    BOOST_CHECK_EQUAL(chain.balance(vault), 25u);
    BOOST_CHECK_EQUAL(chain.balance(payee), 15u);
    BOOST_CHECK_EQUAL(chain.totalSupply(), 100u);

    BOOST_CHECK_THROW(chain.execute(payer, 61, [] {}), std::runtime_error);
    BOOST_CHECK_THROW(chain.transfer(payee, 26), std::runtime_error);
    BOOST_CHECK_EQUAL(chain.balance(payer), 60u);
    BOOST_CHECK_EQUAL(chain.balance(vault), 25u);
}

BOOST_AUTO_TEST_CASE(failed_execute_reverts) {
    LocalChain chain;
    account_t vault = chain.createAccount(), payer = chain.createAccount(100), payee = chain.createAccount();
    chain.setCatalogAccount(vault);

    BOOST_CHECK_THROW(chain.execute(payer, 30, [&] {
        chain.transfer(payee, 20);
        // A nested call that succeeds is undone along with its parent
        chain.execute(payee, 5, [] {});
        throw std::runtime_error("call failed");
    }), std::runtime_error);
    BOOST_CHECK_EQUAL(chain.balance(payer), 100u);
    BOOST_CHECK_EQUAL(chain.balance(vault), 0u);
    BOOST_CHECK_EQUAL(chain.balance(payee), 0u);

    // A nested failure reverts only the nested call
    chain.execute(payer, 30, [&] {
        chain.transfer(payee, 10);
        try { chain.execute(payee, 10, [] { throw std::runtime_error("inner"); }); }
        catch (const std::runtime_error&) {}
    });
    BOOST_CHECK_EQUAL(chain.balance(payer), 70u);
    BOOST_CHECK_EQUAL(chain.balance(vault), 20u);
    BOOST_CHECK_EQUAL(chain.balance(payee), 10u);
}

BOOST_AUTO_TEST_CASE(receive_hooks) {
    LocalChain chain;
    account_t vault = chain.createAccount(100), payee = chain.createAccount(), other = chain.createAccount();
    chain.setCatalogAccount(vault);

    amount_t received = 0;
    chain.onReceive(payee, [&](amount_t amount) { received += amount; });
    chain.transfer(payee, 10);
    BOOST_CHECK_EQUAL(received, 10u);

    // A throwing hook reverts its transfer and whatever the hook moved
    chain.onReceive(payee, [&](amount_t) {
        chain.transfer(other, 5);
        throw std::runtime_error("rejected");
    });
    BOOST_CHECK_THROW(chain.transfer(payee, 10), std::runtime_error);
    BOOST_CHECK_EQUAL(chain.balance(payee), 10u);
    BOOST_CHECK_EQUAL(chain.balance(other), 0u);
    BOOST_CHECK_EQUAL(chain.balance(vault), 90u);

    chain.onReceive(payee, nullptr);
    chain.transfer(payee, 10);
    BOOST_CHECK_EQUAL(chain.balance(payee), 20u);
    BOOST_CHECK_THROW(chain.onReceive(other + 100, nullptr), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(deployment) {
    LocalChain chain;
    account_t author = chain.createAccount();
    BOOST_CHECK_THROW(chain.deploy(std::shared_ptr<ContentManager>()), std::invalid_argument);

    content_t ref = chain.deploy<ContentStore>(chain, author, "Notes", 3, "some bytes");
    BOOST_CHECK(ref != author);
    auto info = chain.contentManager(ref).info();
    BOOST_CHECK_EQUAL(info.author, author);
    BOOST_CHECK_EQUAL(info.title, "Notes");
    BOOST_CHECK_EQUAL(info.genre, 3u);
    BOOST_CHECK(info.fingerprint == fingerprint("some bytes"));
    BOOST_CHECK_THROW(chain.contentManager(ref + 1), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(sha256_fingerprint) {
    BOOST_CHECK_EQUAL(to_hex(fingerprint("abc")), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    BOOST_CHECK_EQUAL(to_hex(fingerprint("")), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    BOOST_CHECK(fingerprint("abc") != fingerprint("abd"));
}

BOOST_AUTO_TEST_CASE(content_store_grants) {
    LocalChain chain(T0);
    account_t author = chain.createAccount(), reader = chain.createAccount();
    ContentStore store(chain, author, "Story", 1, "once upon a time");

    BOOST_CHECK(not store.hasAccess(reader));
    BOOST_CHECK_THROW(store.consume(reader), std::runtime_error);

    store.grantAccess(reader, T0 + 10);
    BOOST_CHECK(store.hasAccess(reader));
    BOOST_CHECK_THROW(store.grantAccess(reader, T0 + 20), std::runtime_error);

    BOOST_CHECK_EQUAL(store.consume(reader), "once upon a time");
    BOOST_CHECK_EQUAL(store.consumed(), 1u);
    BOOST_CHECK(not store.hasAccess(reader));

    // Expiry: access lasts through the grant time
    store.grantAccess(reader, T0 + 10);
    chain.setTime(T0 + 10);
    BOOST_CHECK(store.hasAccess(reader));
    chain.advance(1);
    BOOST_CHECK(not store.hasAccess(reader));
    store.grantAccess(reader, T0 + 100);
    BOOST_CHECK(store.hasAccess(reader));
}

BOOST_FIXTURE_TEST_CASE(content_store_in_catalog, CatalogFixture) {
    auto store = std::make_shared<ContentStore>(chain, alice, "Poem", 2, "roses are red");
    content_t ref = chain.deploy(store);
    chain.execute(alice, 0, [&] { catalog.publish(alice, ref); });

    buy(dave, ref);
    BOOST_CHECK(store->hasAccess(dave));
    // Paying again for access that is still held is refused, and the payment is returned
    BOOST_CHECK_EXCEPTION(buy(dave, ref), CatalogError, reason(Reason::external_call_failed));
    BOOST_CHECK_EQUAL(chain.balance(dave), FUNDS - catalog.settings().content_fee);
    BOOST_CHECK_EQUAL(catalog.contentInfo(ref).views, 1u);

    BOOST_CHECK_EQUAL(store->consume(dave), "roses are red");
    buy(dave, ref);
    BOOST_CHECK_EQUAL(catalog.contentInfo(ref).views, 2u);

    // The same bytes under another store are a duplicate
    content_t copy = chain.deploy<ContentStore>(chain, bob, "Also a poem", 2, "roses are red");
    BOOST_CHECK_EXCEPTION(chain.execute(bob, 0, [&] { catalog.publish(bob, copy); }), CatalogError, reason(Reason::duplicate_content));
}

BOOST_AUTO_TEST_SUITE_END()
