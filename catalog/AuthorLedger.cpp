#include "catalog/AuthorLedger.hpp"
#include "catalog/CatalogError.hpp"
#include "catalog/Environment.hpp"
#include "catalog/Event.hpp"
#include "catalog/Transaction.hpp"
#include <eris/debug.hpp>
#include <exception>
#include <string>

namespace catalog {

using Reason = CatalogError::Reason;

AuthorLedger::AuthorLedger(state::Ledger &ledger, Environment &env) : ledger_(ledger), env_(env) {}

bool AuthorLedger::registered(account_t author) const {
    auto found = ledger_.authors.find(author);
    return found != ledger_.authors.end() and found->second.registered;
}

const state::AuthorInfo& AuthorLedger::info(account_t author) const {
    if (not registered(author))
        throw CatalogError(Reason::unregistered, "account " + std::to_string(author) + " is not a registered author");
    return ledger_.authors.at(author);
}

state::AuthorInfo& AuthorLedger::author(account_t author, const char *operation) {
    if (not registered(author))
        throw CatalogError(Reason::unregistered, std::string(operation) + ": account " + std::to_string(author) + " is not a registered author");
    return ledger_.authors.at(author);
}

void AuthorLedger::recordPayPerView(Transaction &tx, account_t author_id, amount_t fee) {
    auto &a = author(author_id, "recordPayPerView");
    tx.save(a.content_views);
    tx.save(a.content_credit);
    a.content_views++;
    a.content_credit += fee;

    if (a.content_views >= ledger_.settings.payable_views)
        tx.emit(Event::creditAvailable(author_id));
}

void AuthorLedger::recordPremiumView(Transaction &tx, account_t author_id) {
    auto &a = author(author_id, "recordPremiumView");
    tx.save(a.premium_views);
    tx.save(ledger_.premium_views);
    a.premium_views++;
    ledger_.premium_views++;
}

amount_t AuthorLedger::withdraw(Transaction &tx, account_t caller) {
    auto &a = author(caller, "withdraw");
    if (a.content_views < ledger_.settings.payable_views)
        throw CatalogError(Reason::threshold_not_reached, "withdraw: " + std::to_string(a.content_views) + " of the "
                + std::to_string(ledger_.settings.payable_views) + " views required have been reached");

    const amount_t amount = a.content_credit;
    tx.save(a.content_credit);
    tx.save(a.content_views);
    tx.save(ledger_.balance);
    a.content_credit = 0;
    a.content_views = 0;
    ledger_.balance -= amount;
    tx.emit(Event::creditTransferred(caller, amount));

    try {
        env_.transfer(caller, amount);
    }
    catch (const std::exception &e) {
        throw CatalogError(Reason::external_call_failed, "withdraw: transfer of " + std::to_string(amount) + " to "
                + std::to_string(caller) + " failed: " + e.what());
    }

    ERIS_DBG("author " << caller << " withdrew " << amount);
    return amount;
}

}
