#include "catalog/AccessGrantBridge.hpp"
#include "catalog/AuthorLedger.hpp"
#include "catalog/CatalogError.hpp"
#include "catalog/ContentManager.hpp"
#include "catalog/ContentRegistry.hpp"
#include "catalog/Environment.hpp"
#include "catalog/Event.hpp"
#include "catalog/PremiumSubscriptionManager.hpp"
#include "catalog/Transaction.hpp"
#include <eris/debug.hpp>
#include <exception>
#include <string>

namespace catalog {

using Reason = CatalogError::Reason;

AccessGrantBridge::AccessGrantBridge(state::Ledger &ledger, Environment &env, ContentRegistry &registry,
        AuthorLedger &authors, const PremiumSubscriptionManager &premium)
    : ledger_(ledger), env_(env), registry_(registry), authors_(authors), premium_(premium) {}

timestamp_t AccessGrantBridge::grantPayPerView(Transaction &tx, content_t content, account_t recipient, amount_t fee) {
    if (fee != ledger_.settings.content_fee)
        throw CatalogError(Reason::wrong_value, "pay-per-view access costs exactly "
                + std::to_string(ledger_.settings.content_fee) + ", not " + std::to_string(fee));

    auto &info = registry_.info(content);

    tx.save(ledger_.balance);
    ledger_.balance += fee;
    authors_.recordPayPerView(tx, info.author, fee);

    const timestamp_t until = env_.now() + ledger_.settings.content_period;
    grant(tx, info, recipient, until, false);
    return until;
}

timestamp_t AccessGrantBridge::grantPremium(Transaction &tx, content_t content, account_t consumer) {
    if (not premium_.isPremium(consumer))
        throw CatalogError(Reason::subscription_expired, "premium access: account " + std::to_string(consumer)
                + " has no active premium subscription");

    auto &info = registry_.info(content);

    authors_.recordPremiumView(tx, info.author);

    const timestamp_t until = premium_.expiration(consumer);
    grant(tx, info, consumer, until, true);
    return until;
}

void AccessGrantBridge::grant(Transaction &tx, state::ContentInfo &info, account_t account, timestamp_t until, bool premium) {
    tx.save(info.views);
    info.views++;
    tx.emit(Event::contentGranted(info.content, account, until, premium));

    try {
        env_.contentManager(info.content).grantAccess(account, until);
    }
    catch (const std::exception &e) {
        ERIS_DBG("content manager " << info.content << " refused access for " << account << ": " << e.what());
        throw CatalogError(Reason::external_call_failed, "content manager " + std::to_string(info.content)
                + " refused to grant access to " + std::to_string(account) + ": " + e.what());
    }
}

}
