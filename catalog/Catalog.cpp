#include "catalog/Catalog.hpp"
#include "catalog/CatalogError.hpp"
#include "catalog/Environment.hpp"
#include <eris/debug.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace catalog {

using Reason = CatalogError::Reason;

Catalog::Catalog(Environment &env, account_t owner, const CatalogSettings &settings)
    : env_(env),
    registry_(ledger_, env_),
    authors_(ledger_, env_),
    premium_(ledger_, env_),
    bridge_(ledger_, env_, registry_, authors_, premium_),
    distributor_(ledger_, env_)
{
    if (owner == 0) throw std::domain_error("Invalid Catalog owner: account 0 is not a valid account");
    checkSettings(settings);
    ledger_.owner = owner;
    ledger_.settings = settings;
    ledger_.last_distribution = env_.now();
}

void Catalog::checkSettings(const CatalogSettings &settings) {
#define PROHIBIT(FIELD, BAD) \
    if (settings.FIELD BAD) throw std::domain_error("Invalid Catalog setting: settings." #FIELD " " #BAD " is invalid")
    PROHIBIT(content_fee, == 0);
    PROHIBIT(content_period, == 0);
    PROHIBIT(premium_fee, == 0);
    PROHIBIT(premium_period, == 0);
    PROHIBIT(payable_views, == 0);
#undef PROHIBIT
}

void Catalog::subscribe(Journal::Listener listener) {
    journal_.subscribe(std::move(listener));
}

account_t Catalog::owner() const { return ledger_.owner; }
bool Catalog::closed() const { return ledger_.closed; }
const state::Ledger& Catalog::ledger() const { return ledger_; }

const CatalogSettings& Catalog::settings() const {
    requireOpen("settings");
    return ledger_.settings;
}

void Catalog::requireOpen(const char *operation) const {
    if (ledger_.closed)
        throw CatalogError(Reason::catalog_closed, std::string(operation) + ": the catalog has been closed");
}

void Catalog::requireOwner(account_t caller, const char *operation) const {
    if (caller != ledger_.owner)
        throw CatalogError(Reason::permission_denied, std::string(operation) + ": only the owner may do this, not account " + std::to_string(caller));
}

void Catalog::requireAccount(account_t account, const char *operation) const {
    if (account == 0)
        throw CatalogError(Reason::invalid_account, std::string(operation) + ": account 0 cannot receive access");
}

void Catalog::publish(account_t caller, content_t content) {
    requireOpen("publish");
    Transaction tx(journal_);
    registry_.publish(tx, caller, content);
    tx.commit();
}

timestamp_t Catalog::buyPremium(account_t caller, amount_t value) {
    return premiumFor(caller, caller, value, "buyPremium");
}

timestamp_t Catalog::giftPremium(account_t caller, account_t beneficiary, amount_t value) {
    return premiumFor(caller, beneficiary, value, "giftPremium");
}

timestamp_t Catalog::premiumFor(account_t caller, account_t beneficiary, amount_t value, const char *operation) {
    requireOpen(operation);
    requireAccount(beneficiary, operation);
    Transaction tx(journal_);
    auto expires = premium_.buySubscription(tx, beneficiary, value);
    tx.commit();
    ERIS_DBG("account " << caller << " bought premium for " << beneficiary);
    return expires;
}

timestamp_t Catalog::getContent(account_t caller, content_t content, amount_t value) {
    return contentFor(caller, content, caller, value, "getContent");
}

timestamp_t Catalog::giftContent(account_t caller, content_t content, account_t recipient, amount_t value) {
    return contentFor(caller, content, recipient, value, "giftContent");
}

timestamp_t Catalog::contentFor(account_t caller, content_t content, account_t recipient, amount_t value, const char *operation) {
    requireOpen(operation);
    requireAccount(recipient, operation);
    Transaction tx(journal_);
    auto until = bridge_.grantPayPerView(tx, content, recipient, value);
    tx.commit();
    ERIS_DBG("account " << caller << " bought access to " << content << " for " << recipient);
    return until;
}

timestamp_t Catalog::getContentPremium(account_t caller, content_t content) {
    requireOpen("getContentPremium");
    Transaction tx(journal_);
    auto until = bridge_.grantPremium(tx, content, caller);
    tx.commit();
    return until;
}

amount_t Catalog::withdraw(account_t caller) {
    requireOpen("withdraw");
    Transaction tx(journal_);
    auto amount = authors_.withdraw(tx, caller);
    tx.commit();
    return amount;
}

std::vector<Catalog::Payout> Catalog::distributePremiumCredits(account_t caller) {
    requireOpen("distributePremiumCredits");
    Transaction tx(journal_);
    auto payouts = distributor_.distributePremiumCredits(tx);
    tx.commit();
    ERIS_DBG("premium distribution triggered by " << caller);
    return payouts;
}

std::vector<Catalog::Payout> Catalog::closeCatalog(account_t caller) {
    requireOpen("closeCatalog");
    requireOwner(caller, "closeCatalog");
    Transaction tx(journal_);
    auto payouts = distributor_.liquidate(tx);
    tx.commit();
    return payouts;
}

template <typename T>
void Catalog::set(account_t caller, T CatalogSettings::*field, T value, const char *operation) {
    requireOpen(operation);
    requireOwner(caller, operation);
    CatalogSettings updated = ledger_.settings;
    updated.*field = value;
    checkSettings(updated);
    // Journaled so that a setter called re-entrantly is undone if the enclosing operation fails
    Transaction tx(journal_);
    tx.save(ledger_.settings);
    ledger_.settings = updated;
    tx.commit();
    ERIS_DBG(operation << "(" << value << ")");
}

void Catalog::setContentFee(account_t caller, amount_t fee) {
    set(caller, &CatalogSettings::content_fee, fee, "setContentFee");
}

void Catalog::setContentPeriod(account_t caller, timestamp_t period) {
    set(caller, &CatalogSettings::content_period, period, "setContentPeriod");
}

void Catalog::setPremiumFee(account_t caller, amount_t fee) {
    set(caller, &CatalogSettings::premium_fee, fee, "setPremiumFee");
}

void Catalog::setPremiumPeriod(account_t caller, timestamp_t period) {
    set(caller, &CatalogSettings::premium_period, period, "setPremiumPeriod");
}

void Catalog::setPremiumWithdrawalPeriod(account_t caller, timestamp_t period) {
    set(caller, &CatalogSettings::premium_withdrawal_period, period, "setPremiumWithdrawalPeriod");
}

void Catalog::setPayableViews(account_t caller, uint64_t views) {
    set(caller, &CatalogSettings::payable_views, views, "setPayableViews");
}

bool Catalog::isPremium(account_t account) const {
    requireOpen("isPremium");
    return premium_.isPremium(account);
}

timestamp_t Catalog::premiumExpiration(account_t account) const {
    requireOpen("premiumExpiration");
    return premium_.expiration(account);
}

std::vector<content_t> Catalog::getContentList() const {
    requireOpen("getContentList");
    return registry_.contentList();
}

ContentRegistry::Statistics Catalog::getStatistics() const {
    requireOpen("getStatistics");
    return registry_.statistics();
}

std::vector<content_t> Catalog::getNewContentList(size_t n) const {
    requireOpen("getNewContentList");
    return registry_.newContentList(n);
}

content_t Catalog::getLatestByGenre(genre_t genre) const {
    requireOpen("getLatestByGenre");
    return registry_.latestByGenre(genre);
}

content_t Catalog::getLatestByAuthor(account_t author) const {
    requireOpen("getLatestByAuthor");
    return registry_.latestByAuthor(author);
}

content_t Catalog::getMostPopularByGenre(genre_t genre) const {
    requireOpen("getMostPopularByGenre");
    return registry_.mostPopularByGenre(genre);
}

content_t Catalog::getMostPopularByAuthor(account_t author) const {
    requireOpen("getMostPopularByAuthor");
    return registry_.mostPopularByAuthor(author);
}

const state::ContentInfo& Catalog::contentInfo(content_t content) const {
    requireOpen("contentInfo");
    return registry_.info(content);
}

size_t Catalog::contentCount() const {
    requireOpen("contentCount");
    return registry_.size();
}

const state::AuthorInfo& Catalog::authorInfo(account_t author) const {
    requireOpen("authorInfo");
    return authors_.info(author);
}

amount_t Catalog::premiumCredit() const {
    requireOpen("premiumCredit");
    return ledger_.premium_credit;
}

uint64_t Catalog::premiumViews() const {
    requireOpen("premiumViews");
    return ledger_.premium_views;
}

timestamp_t Catalog::lastDistribution() const {
    requireOpen("lastDistribution");
    return ledger_.last_distribution;
}

amount_t Catalog::balance() const {
    requireOpen("balance");
    return ledger_.balance;
}

}
