#include "catalog/RevenueDistributor.hpp"
#include "catalog/CatalogError.hpp"
#include "catalog/Environment.hpp"
#include "catalog/Event.hpp"
#include "catalog/Transaction.hpp"
#include <eris/debug.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <exception>
#include <stdexcept>
#include <string>

namespace catalog {

using Reason = CatalogError::Reason;

RevenueDistributor::RevenueDistributor(state::Ledger &ledger, Environment &env) : ledger_(ledger), env_(env) {}

amount_t RevenueDistributor::share(amount_t pool, uint64_t views, uint64_t total) {
    if (total == 0) throw std::logic_error("RevenueDistributor::share() called with no views");
    if (views > total) throw std::logic_error("RevenueDistributor::share() called with views > total");
    boost::multiprecision::uint128_t product = pool;
    product *= views;
    product /= total;
    return product.convert_to<amount_t>();
}

std::vector<RevenueDistributor::Payout> RevenueDistributor::distributePremiumCredits(Transaction &tx) {
    const timestamp_t now = env_.now();
    const timestamp_t allowed = ledger_.last_distribution + ledger_.settings.premium_withdrawal_period;
    if (now < allowed)
        throw CatalogError(Reason::too_early, "distributePremiumCredits: the next distribution is allowed at " + std::to_string(allowed));
    if (ledger_.premium_views == 0)
        throw CatalogError(Reason::nothing_to_distribute, "distributePremiumCredits: no premium views since the last distribution");

    const amount_t pool = ledger_.premium_credit;
    const uint64_t total = ledger_.premium_views;

    std::vector<Payout> payouts;
    amount_t paid = 0;
    for (const auto &author : ledger_.author_order) {
        auto &a = ledger_.authors.at(author);
        if (a.premium_views == 0) continue;
        amount_t amount = share(pool, a.premium_views, total);
        tx.save(a.premium_views);
        a.premium_views = 0;
        if (amount > 0) {
            payouts.push_back({author, amount});
            paid += amount;
        }
    }

    tx.save(ledger_.premium_credit);
    tx.save(ledger_.premium_views);
    tx.save(ledger_.last_distribution);
    tx.save(ledger_.balance);
    ledger_.premium_credit = 0;
    ledger_.premium_views = 0;
    ledger_.last_distribution = now;
    ledger_.balance -= paid;

    ERIS_DBG("distributing premium pool of " << pool << " over " << total << " views to " << payouts.size()
            << " authors; " << pool - paid << " forfeited to rounding");

    pay(tx, payouts, "distributePremiumCredits");
    return payouts;
}

std::vector<RevenueDistributor::Payout> RevenueDistributor::liquidate(Transaction &tx) {
    const amount_t pool = ledger_.premium_credit;
    const uint64_t total = ledger_.premium_views;

    std::vector<Payout> payouts;
    amount_t paid = 0;
    for (const auto &author : ledger_.author_order) {
        auto &a = ledger_.authors.at(author);
        amount_t amount = a.content_credit;
        if (a.premium_views > 0) amount += share(pool, a.premium_views, total);

        tx.save(a.content_credit);
        tx.save(a.content_views);
        tx.save(a.premium_views);
        a.content_credit = 0;
        a.content_views = 0;
        a.premium_views = 0;

        if (amount > 0) {
            payouts.push_back({author, amount});
            paid += amount;
        }
    }

    if (paid > ledger_.balance)
        throw std::logic_error("RevenueDistributor::liquidate(): owed credit exceeds the catalog balance");
    const amount_t residual = ledger_.balance - paid;
    if (residual > 0) payouts.push_back({ledger_.owner, residual});

    tx.save(ledger_.premium_credit);
    tx.save(ledger_.premium_views);
    tx.save(ledger_.balance);
    tx.save(ledger_.closed);
    ledger_.premium_credit = 0;
    ledger_.premium_views = 0;
    ledger_.balance = 0;
    ledger_.closed = true;

    ERIS_DBG("liquidating catalog: " << paid << " to authors, " << residual << " to the owner");

    pay(tx, payouts, "closeCatalog");
    tx.emit(Event::catalogClosed(ledger_.owner, residual));
    return payouts;
}

void RevenueDistributor::pay(Transaction &tx, const std::vector<Payout> &payouts, const char *operation) {
    for (const auto &p : payouts) {
        tx.emit(Event::creditTransferred(p.account, p.amount));
        try {
            env_.transfer(p.account, p.amount);
        }
        catch (const std::exception &e) {
            throw CatalogError(Reason::external_call_failed, std::string(operation) + ": transfer of "
                    + std::to_string(p.amount) + " to " + std::to_string(p.account) + " failed: " + e.what());
        }
    }
}

}
