#pragma once
#include "catalog/AccessGrantBridge.hpp"
#include "catalog/AuthorLedger.hpp"
#include "catalog/CatalogSettings.hpp"
#include "catalog/ContentRegistry.hpp"
#include "catalog/PremiumSubscriptionManager.hpp"
#include "catalog/RevenueDistributor.hpp"
#include "catalog/Transaction.hpp"
#include "catalog/state/Ledger.hpp"
#include "catalog/types.hpp"
#include <eris/noncopyable.hpp>
#include <cstddef>
#include <vector>

namespace catalog {

class Environment;

/** Central class of a content catalog: the marketplace between authors, who publish content, and
 * consumers, who pay for access to it either per item or through a premium subscription.
 *
 * The catalog owns the complete ledger (see state::Ledger) and is the only way to change it.  Each
 * public operation takes the calling account explicitly, plus the payment attached to the call
 * where the operation is paid for.  Operations are atomic: one that throws leaves the ledger
 * exactly as it found it and emits no events.  Rejections are reported by throwing CatalogError.
 *
 * Once closeCatalog() has succeeded, every operation and query other than closed() and owner()
 * throws a CatalogError with reason `catalog_closed`.
 *
 * The catalog does not hold funds itself: payments arrive with the calls (the environment moves
 * them) and payouts are made through Environment::transfer().  The catalog's `balance()` tracks
 * how much the environment holds on its behalf.
 */
class Catalog : private eris::noncopyable {
    public:
        /// Not default constructible
        Catalog() = delete;

        /** Creates a catalog in the given environment.  The distribution clock starts now.
         *
         * \param env the execution environment; must outlive the catalog.
         * \param owner the owner account, allowed to change the settings and to close the catalog.
         * \param settings the initial settings.
         * \throws std::domain_error if `owner` is 0 or `settings` contains an invalid value.
         */
        Catalog(Environment &env, account_t owner, const CatalogSettings &settings = CatalogSettings());

        /** Checks that all values of `settings` are usable.
         *
         * \throws std::domain_error naming the first invalid value found.
         */
        static void checkSettings(const CatalogSettings &settings);

        /// The payout type returned by the distribution operations
        using Payout = RevenueDistributor::Payout;

        /** Adds an event subscriber.  Subscribers see the events of each operation once it has
         * committed.
         */
        void subscribe(Journal::Listener listener);

        /// The owner account.
        account_t owner() const;

        /// True once the catalog has been closed.
        bool closed() const;

        /// The current settings.
        const CatalogSettings& settings() const;

        /** Read-only access to the raw ledger.  Unlike the queries, this remains available after
         * the catalog is closed.
         */
        const state::Ledger& ledger() const;

        /** Publishes content.  See ContentRegistry::publish(). */
        void publish(account_t caller, content_t content);

        /** Buys a premium subscription period for the caller, paid with `value`.
         *
         * \returns the new expiration time
         * \sa PremiumSubscriptionManager::buySubscription()
         */
        timestamp_t buyPremium(account_t caller, amount_t value);

        /** Buys a premium subscription period for `beneficiary`, paid by the caller with `value`.
         * `beneficiary` may not be account 0.
         *
         * \returns the new expiration time of `beneficiary`
         */
        timestamp_t giftPremium(account_t caller, account_t beneficiary, amount_t value);

        /** Buys pay-per-view access to `content` for the caller.
         *
         * \returns the time until which access was granted
         * \sa AccessGrantBridge::grantPayPerView()
         */
        timestamp_t getContent(account_t caller, content_t content, amount_t value);

        /** Buys pay-per-view access to `content` for `recipient`, paid by the caller.  `recipient`
         * may not be account 0.
         *
         * \returns the time until which access was granted
         */
        timestamp_t giftContent(account_t caller, content_t content, account_t recipient, amount_t value);

        /** Obtains access to `content` under the caller's premium subscription.
         *
         * \returns the time until which access was granted (the subscription's expiration)
         * \sa AccessGrantBridge::grantPremium()
         */
        timestamp_t getContentPremium(account_t caller, content_t content);

        /** Pays the caller's accrued pay-per-view credit out to them.
         *
         * \returns the amount paid
         * \sa AuthorLedger::withdraw()
         */
        amount_t withdraw(account_t caller);

        /** Splits the premium pool among authors by premium views.  Anyone may call this.
         *
         * \sa RevenueDistributor::distributePremiumCredits()
         */
        std::vector<Payout> distributePremiumCredits(account_t caller);

        /** Pays out everything owed and closes the catalog for good.  Only the owner may do this.
         *
         * \throws CatalogError with reason `permission_denied` if `caller` isn't the owner.
         * \sa RevenueDistributor::liquidate()
         */
        std::vector<Payout> closeCatalog(account_t caller);

        /** \name Owner-only settings
         *
         * Each setter throws CatalogError with reason `permission_denied` if `caller` isn't the
         * owner, and std::domain_error if the value is invalid.  A new value applies from the next
         * operation on: e.g. a changed premium_period does not alter existing expiration times.
         */
        //@{
        /// Sets `content_fee`
        void setContentFee(account_t caller, amount_t fee);
        /// Sets `content_period`
        void setContentPeriod(account_t caller, timestamp_t period);
        /// Sets `premium_fee`
        void setPremiumFee(account_t caller, amount_t fee);
        /// Sets `premium_period`
        void setPremiumPeriod(account_t caller, timestamp_t period);
        /// Sets `premium_withdrawal_period`
        void setPremiumWithdrawalPeriod(account_t caller, timestamp_t period);
        /// Sets `payable_views`
        void setPayableViews(account_t caller, uint64_t views);
        //@}

        /// \name Queries
        //@{
        /// True if `account` has an active premium subscription
        bool isPremium(account_t account) const;
        /// The subscription expiration of `account` (0 if never subscribed)
        timestamp_t premiumExpiration(account_t account) const;
        /// All published content, in publication order
        std::vector<content_t> getContentList() const;
        /// Published content and view counts
        ContentRegistry::Statistics getStatistics() const;
        /// Up to `n` most recently published items, newest first
        std::vector<content_t> getNewContentList(size_t n) const;
        /// Latest item of a genre, or 0
        content_t getLatestByGenre(genre_t genre) const;
        /// Latest item by an author, or 0
        content_t getLatestByAuthor(account_t author) const;
        /// Most viewed item of a genre (later publication wins ties), or 0
        content_t getMostPopularByGenre(genre_t genre) const;
        /// Most viewed item by an author (later publication wins ties), or 0
        content_t getMostPopularByAuthor(account_t author) const;
        /// Record of a published item; throws CatalogError (`content_not_found`) if unknown
        const state::ContentInfo& contentInfo(content_t content) const;
        /// Number of published items
        size_t contentCount() const;
        /// Record of an author; throws CatalogError (`unregistered`) if unknown
        const state::AuthorInfo& authorInfo(account_t author) const;
        /// Subscription fees collected since the last distribution
        amount_t premiumCredit() const;
        /// Premium views since the last distribution
        uint64_t premiumViews() const;
        /// Time of the last distribution (creation time before the first)
        timestamp_t lastDistribution() const;
        /// Funds held on behalf of the catalog
        amount_t balance() const;
        //@}

    private:
        Environment &env_;
        state::Ledger ledger_;
        Journal journal_;
        ContentRegistry registry_;
        AuthorLedger authors_;
        PremiumSubscriptionManager premium_;
        AccessGrantBridge bridge_;
        RevenueDistributor distributor_;

        // Throws CatalogError(catalog_closed) if the catalog is closed
        void requireOpen(const char *operation) const;
        // Throws CatalogError(permission_denied) unless `caller` is the owner
        void requireOwner(account_t caller, const char *operation) const;
        // Throws CatalogError(invalid_account) for the "nobody" account 0
        void requireAccount(account_t account, const char *operation) const;
        // Shared bodies of the buy and gift operations; `operation` labels errors
        timestamp_t premiumFor(account_t caller, account_t beneficiary, amount_t value, const char *operation);
        timestamp_t contentFor(account_t caller, content_t content, account_t recipient, amount_t value, const char *operation);
        // Owner-only assignment of a single setting, validated by checkSettings()
        template <typename T>
        void set(account_t caller, T CatalogSettings::*field, T value, const char *operation);
};

}
