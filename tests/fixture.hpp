#pragma once
#include "catalog/Catalog.hpp"
#include "catalog/CatalogError.hpp"
#include "catalog/ContentManager.hpp"
#include "catalog/Event.hpp"
#include "catalog/Fingerprint.hpp"
#include "catalog/LocalChain.hpp"
#include <algorithm>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace catalog { namespace test {

/// Start time of every test environment
constexpr timestamp_t T0 = 1000000;

/// Starting funds of every test consumer
constexpr amount_t FUNDS = 1000000;

/// Predicate for BOOST_CHECK_EXCEPTION matching a CatalogError by reason
inline std::function<bool(const CatalogError&)> reason(CatalogError::Reason r) {
    return [r](const CatalogError &e) { return e.reason() == r; };
}

/** Content manager test double.  Accepts every grant by default; `refuse` makes grantAccess()
 * throw, `broken` makes info() throw, and `on_grant` runs inside grantAccess() before the grant is
 * accepted or refused (which is where re-entrant calls are made from).
 */
class TestManager : public ContentManager {
    public:
        TestManager(account_t author, std::string title, genre_t genre, const std::string &bytes) {
            info_.author = author;
            info_.title = std::move(title);
            info_.genre = genre;
            info_.fingerprint = fingerprint(bytes);
        }

        Info info() const override {
            if (broken) throw std::runtime_error("TestManager: info unavailable");
            return info_;
        }

        void grantAccess(account_t account, timestamp_t until) override {
            if (on_grant) {
                // Copied: the hook may replace itself
                auto hook = on_grant;
                hook(account, until);
            }
            if (refuse) throw std::runtime_error("TestManager: grant refused");
            grants.emplace_back(account, until);
        }

        Info info_;
        bool refuse = false;
        bool broken = false;
        std::function<void(account_t, timestamp_t)> on_grant;
        std::vector<std::pair<account_t, timestamp_t>> grants;
};

/** A catalog on a LocalChain with an owner, three authors (alice, bob, carol; no funds) and three
 * consumers (dave, erin, frank; FUNDS each).  Every call goes through LocalChain::execute(), so
 * payments and payouts move real balances.  Events delivered to subscribers are collected in
 * `events`.
 */
struct CatalogFixture {
    explicit CatalogFixture(const CatalogSettings &settings = CatalogSettings()) : catalog(chain, owner, settings) {
        chain.setCatalogAccount(vault);
        catalog.subscribe([this](const Event &e) { events.push_back(e); });
    }

    LocalChain chain{T0};
    const account_t owner = chain.createAccount();
    const account_t vault = chain.createAccount();
    const account_t alice = chain.createAccount(), bob = chain.createAccount(), carol = chain.createAccount();
    const account_t dave = chain.createAccount(FUNDS), erin = chain.createAccount(FUNDS), frank = chain.createAccount(FUNDS);
    Catalog catalog;
    std::vector<Event> events;
    std::unordered_map<content_t, std::shared_ptr<TestManager>> managers;
    unsigned int serial = 0;

    /// Deploys (without publishing) a content manager for `author`; the bytes are unique unless given.
    content_t deploy(account_t author, genre_t genre = 1, std::string bytes = "") {
        serial++;
        if (bytes.empty()) bytes = "test content " + std::to_string(serial);
        auto m = std::make_shared<TestManager>(author, "Title " + std::to_string(serial), genre, bytes);
        content_t ref = chain.deploy(m);
        managers.emplace(ref, std::move(m));
        return ref;
    }

    /// The test double deployed at `content`
    TestManager& manager(content_t content) { return *managers.at(content); }

    /// Deploys and publishes content by `author`
    content_t publish(account_t author, genre_t genre = 1, std::string bytes = "") {
        content_t ref = deploy(author, genre, std::move(bytes));
        chain.execute(author, 0, [&] { catalog.publish(author, ref); });
        return ref;
    }

    /// Buys pay-per-view access for `consumer`, paying `value` (the content fee by default)
    timestamp_t buy(account_t consumer, content_t content, amount_t value = 0) {
        if (value == 0) value = catalog.settings().content_fee;
        timestamp_t until = 0;
        chain.execute(consumer, value, [&] { until = catalog.getContent(consumer, content, value); });
        return until;
    }

    /// Buys a premium subscription for `consumer`, paying `value` (the premium fee by default)
    timestamp_t subscribe(account_t consumer, amount_t value = 0) {
        if (value == 0) value = catalog.settings().premium_fee;
        timestamp_t expires = 0;
        chain.execute(consumer, value, [&] { expires = catalog.buyPremium(consumer, value); });
        return expires;
    }

    /// Accesses `content` under `consumer`'s subscription
    timestamp_t premiumView(account_t consumer, content_t content) {
        timestamp_t until = 0;
        chain.execute(consumer, 0, [&] { until = catalog.getContentPremium(consumer, content); });
        return until;
    }

    /// Withdraws `author`'s credit
    amount_t withdraw(account_t author) {
        amount_t amount = 0;
        chain.execute(author, 0, [&] { amount = catalog.withdraw(author); });
        return amount;
    }

    /// Runs a premium distribution triggered by `caller`
    std::vector<Catalog::Payout> distribute(account_t caller) {
        std::vector<Catalog::Payout> payouts;
        chain.execute(caller, 0, [&] { payouts = catalog.distributePremiumCredits(caller); });
        return payouts;
    }

    /// Closes the catalog as `caller`
    std::vector<Catalog::Payout> close(account_t caller) {
        std::vector<Catalog::Payout> payouts;
        chain.execute(caller, 0, [&] { payouts = catalog.closeCatalog(caller); });
        return payouts;
    }

    /// Number of collected events of the given type
    size_t count(Event::Type type) const {
        return std::count_if(events.begin(), events.end(), [type](const Event &e) { return e.type == type; });
    }

    /// Funds the environment holds for the catalog
    amount_t held() const { return chain.balance(vault); }
};

/// Catalog fixture with small numbers that make the arithmetic easy to follow
struct SmallCatalogFixture : CatalogFixture {
    static CatalogSettings small() {
        CatalogSettings s;
        s.content_fee = 10;
        s.premium_fee = 100;
        s.payable_views = 3;
        return s;
    }

    SmallCatalogFixture() : CatalogFixture(small()) {}
};

}}
