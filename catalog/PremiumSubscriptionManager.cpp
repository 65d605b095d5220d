#include "catalog/PremiumSubscriptionManager.hpp"
#include "catalog/CatalogError.hpp"
#include "catalog/Environment.hpp"
#include "catalog/Event.hpp"
#include "catalog/Transaction.hpp"
#include <eris/debug.hpp>
#include <algorithm>
#include <string>

namespace catalog {

PremiumSubscriptionManager::PremiumSubscriptionManager(state::Ledger &ledger, const Environment &env)
    : ledger_(ledger), env_(env) {}

timestamp_t PremiumSubscriptionManager::expiration(account_t account) const {
    auto found = ledger_.premium_expiration.find(account);
    return found == ledger_.premium_expiration.end() ? 0 : found->second;
}

bool PremiumSubscriptionManager::isPremium(account_t account) const {
    auto found = ledger_.premium_expiration.find(account);
    return found != ledger_.premium_expiration.end() and found->second >= env_.now();
}

timestamp_t PremiumSubscriptionManager::buySubscription(Transaction &tx, account_t beneficiary, amount_t fee) {
    if (fee != ledger_.settings.premium_fee)
        throw CatalogError(CatalogError::Reason::wrong_value, "buySubscription: a subscription costs exactly "
                + std::to_string(ledger_.settings.premium_fee) + ", not " + std::to_string(fee));

    auto found = ledger_.premium_expiration.find(beneficiary);
    if (found == ledger_.premium_expiration.end()) {
        found = ledger_.premium_expiration.emplace(beneficiary, 0).first;
        auto &ledger = ledger_;
        tx.onRollback([&ledger, beneficiary] { ledger.premium_expiration.erase(beneficiary); });
    }
    else {
        tx.save(found->second);
    }

    timestamp_t &expires = found->second;
    expires = std::max(expires, env_.now()) + ledger_.settings.premium_period;

    tx.save(ledger_.premium_credit);
    tx.save(ledger_.balance);
    ledger_.premium_credit += fee;
    ledger_.balance += fee;

    tx.emit(Event::newPremiumSubscription(beneficiary, expires));
    ERIS_DBG("account " << beneficiary << " is premium until " << expires);
    return expires;
}

}
