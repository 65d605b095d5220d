#include "catalog/Market.hpp"
#include "catalog/ContentStore.hpp"
#include "catalog/Event.hpp"
#include <eris/debug.hpp>
#include <eris/random/rng.hpp>
#include <eris/random/util.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace catalog {

using eris::random::rcoin;

Market::Market(const MarketSettings &settings) : set_(settings) {}

void Market::checkParameters() const {
#define PROHIBIT(FIELD, BAD) \
    if (set_.FIELD BAD) throw std::domain_error("Invalid Market parameter: parameters." #FIELD " " #BAD " is invalid")
#define PROBABILITY(FIELD) \
    if (not (set_.FIELD >= 0 and set_.FIELD <= 1)) throw std::domain_error("Invalid Market parameter: parameters." #FIELD " must be in [0, 1]")

    PROHIBIT(authors, == 0);
    PROHIBIT(consumers, < 2);
    PROHIBIT(genres, == 0);
    PROBABILITY(prob_publish);
    PROBABILITY(prob_duplicate);
    PROBABILITY(prob_subscribe);
    PROBABILITY(prob_gift);
    PROBABILITY(prob_read);
    PROBABILITY(prob_recommended);
    PROBABILITY(prob_withdraw);
#undef PROHIBIT
#undef PROBABILITY
    Catalog::checkSettings(set_.catalog);
}

void Market::setup() {
    if (catalog_) throw std::logic_error("Market: setup() called twice");
    checkParameters();

    owner_ = chain_.createAccount();
    chain_.setCatalogAccount(chain_.createAccount());

    authors_.reserve(set_.authors);
    for (uint32_t i = 0; i < set_.authors; i++) authors_.push_back(chain_.createAccount());
    consumers_.reserve(set_.consumers);
    for (uint32_t i = 0; i < set_.consumers; i++) consumers_.push_back(chain_.createAccount(set_.consumer_funds));

    catalog_.reset(new Catalog(chain_, owner_, set_.catalog));
    catalog_->subscribe([this](const Event &e) { stats_.events[Event::typeName(e.type)]++; });
}

const Catalog& Market::catalog() const {
    if (not catalog_) throw std::logic_error("Market: catalog() called before setup()");
    return *catalog_;
}

template <typename F>
bool Market::attempt(account_t caller, amount_t value, F call) {
    try {
        chain_.execute(caller, value, call);
        return true;
    }
    catch (const CatalogError &e) {
        ERIS_DBG("day " << day_ << ": call by " << caller << " rejected: " << e.what());
        stats_.rejected[e.reason()]++;
        return false;
    }
}

size_t Market::draw(size_t n) {
    return boost::random::uniform_int_distribution<size_t>(0, n - 1)(eris::random::rng());
}

void Market::runDay() {
    if (not catalog_) throw std::logic_error("Market: runDay() called before setup()");
    if (closed_) throw std::logic_error("Market: runDay() called after close()");

    authorsAct();
    consumersAct();
    distribute();
    audit();

    chain_.advance(DAY);
    day_++;
}

void Market::authorsAct() {
    const auto &settings = catalog_->settings();
    const auto &ledger = catalog_->ledger();

    for (const auto &author : authors_) {
        if (rcoin(set_.prob_publish)) {
            serial_++;
            std::string bytes;
            if (not published_bytes_.empty() and rcoin(set_.prob_duplicate))
                bytes = published_bytes_[draw(published_bytes_.size())];
            else
                bytes = "content #" + std::to_string(serial_) + " by " + std::to_string(author) + " on day " + std::to_string(day_);

            auto store = std::make_shared<ContentStore>(chain_, author, "Item " + std::to_string(serial_),
                    genre_t(1 + draw(set_.genres)), bytes);
            content_t ref = chain_.deploy(store);
            if (attempt(author, 0, [&] { catalog_->publish(author, ref); })) {
                stats_.published++;
                totals_[author].published++;
                stores_.emplace(ref, std::move(store));
                published_bytes_.push_back(std::move(bytes));
            }
        }

        if (ledger.authors.count(author) == 0) continue;
        const auto &info = catalog_->authorInfo(author);
        if (info.content_views >= settings.payable_views and rcoin(set_.prob_withdraw)) {
            amount_t amount = 0;
            if (attempt(author, 0, [&] { amount = catalog_->withdraw(author); })) {
                stats_.withdrawals++;
                totals_[author].withdrawn += amount;
            }
        }
    }
}

void Market::consumersAct() {
    const auto &settings = catalog_->settings();

    for (const auto &consumer : consumers_) {
        if (not catalog_->isPremium(consumer) and rcoin(set_.prob_subscribe) and chain_.balance(consumer) >= settings.premium_fee) {
            if (rcoin(set_.prob_gift)) {
                account_t recipient = consumer;
                while (recipient == consumer) recipient = consumers_[draw(consumers_.size())];
                if (attempt(consumer, settings.premium_fee, [&] { catalog_->giftPremium(consumer, recipient, settings.premium_fee); })) {
                    stats_.subscriptions++;
                    stats_.gifts++;
                }
            }
            else if (attempt(consumer, settings.premium_fee, [&] { catalog_->buyPremium(consumer, settings.premium_fee); })) {
                stats_.subscriptions++;
            }
        }

        if (rcoin(set_.prob_read)) read(consumer);
    }
}

content_t Market::choose() {
    if (catalog_->contentCount() == 0) return 0;

    if (rcoin(set_.prob_recommended)) {
        content_t pick = 0;
        if (rcoin(0.5)) {
            auto newest = catalog_->getNewContentList(5);
            pick = newest[draw(newest.size())];
        }
        else {
            pick = catalog_->getMostPopularByGenre(genre_t(1 + draw(set_.genres)));
        }
        if (pick != 0) return pick;
    }

    auto all = catalog_->getContentList();
    return all[draw(all.size())];
}

void Market::read(account_t consumer) {
    content_t content = choose();
    if (content == 0) return;
    auto &store = *stores_.at(content);

    if (not store.hasAccess(consumer)) {
        if (catalog_->isPremium(consumer)) {
            if (not attempt(consumer, 0, [&] { catalog_->getContentPremium(consumer, content); })) return;
            stats_.premium_views++;
        }
        else {
            const amount_t fee = catalog_->settings().content_fee;
            if (chain_.balance(consumer) < fee) return;
            if (not attempt(consumer, fee, [&] { catalog_->getContent(consumer, content, fee); })) return;
            stats_.pay_per_view++;
        }
    }

    store.consume(consumer);
    stats_.consumed++;
}

void Market::distribute() {
    const timestamp_t allowed = catalog_->lastDistribution() + catalog_->settings().premium_withdrawal_period;
    if (chain_.now() < allowed or catalog_->premiumViews() == 0) return;

    account_t trigger = consumers_[draw(consumers_.size())];
    std::vector<Catalog::Payout> payouts;
    if (attempt(trigger, 0, [&] { payouts = catalog_->distributePremiumCredits(trigger); })) {
        stats_.distributions++;
        for (const auto &p : payouts) totals_[p.account].premium += p.amount;
    }
}

void Market::audit() const {
    const amount_t held = chain_.balance(chain_.catalogAccount());
    if (held != catalog_->balance())
        throw std::logic_error("Market: catalog bookkeeping (" + std::to_string(catalog_->balance())
                + ") disagrees with the funds held for it (" + std::to_string(held) + ")");
}

std::vector<Catalog::Payout> Market::close() {
    if (not catalog_) throw std::logic_error("Market: close() called before setup()");
    if (closed_) throw std::logic_error("Market: close() called twice");

    std::vector<Catalog::Payout> payouts;
    chain_.execute(owner_, 0, [&] { payouts = catalog_->closeCatalog(owner_); });
    closed_ = true;

    for (const auto &p : payouts) {
        if (p.account == owner_) stats_.residual += p.amount;
        else totals_[p.account].closing += p.amount;
    }
    if (chain_.balance(chain_.catalogAccount()) != 0)
        throw std::logic_error("Market: funds left in the catalog account after closing");
    return payouts;
}

}
