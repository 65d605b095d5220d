#pragma once
#include "catalog/state/Ledger.hpp"
#include "catalog/types.hpp"

namespace catalog {

class AuthorLedger;
class ContentRegistry;
class Environment;
class PremiumSubscriptionManager;
class Transaction;

/** Sells access to published content, either one item at a time (pay-per-view) or under a premium
 * subscription, and forwards the resulting grant to the item's content manager.
 *
 * Every view is recorded (content views, author credit or premium counters) before the content
 * manager is called, so that anything the manager does in the meantime, including calling back
 * into the catalog, already sees the updated counts.  If the manager refuses the grant, all of it
 * is undone.
 */
class AccessGrantBridge {
    public:
        /// Creates the bridge over the given ledger and the components it records views with.
        AccessGrantBridge(state::Ledger &ledger, Environment &env, ContentRegistry &registry,
                AuthorLedger &authors, const PremiumSubscriptionManager &premium);

        /** Sells a pay-per-view access of `content` to `recipient`, valid for `content_period`
         * from now.  `fee` is credited to the content's author.
         *
         * \returns the time until which access was granted
         * \throws CatalogError with reason
         * - `wrong_value` unless `fee` is exactly `content_fee`;
         * - `content_not_found` if `content` was never published;
         * - `external_call_failed` if the content manager refuses the grant.
         */
        timestamp_t grantPayPerView(Transaction &tx, content_t content, account_t recipient, amount_t fee);

        /** Grants `consumer` access to `content` under their premium subscription, valid until the
         * subscription expires.  Counts as a premium view of the content's author.
         *
         * \returns the time until which access was granted
         * \throws CatalogError with reason
         * - `subscription_expired` unless `consumer` currently has a premium subscription;
         * - `content_not_found` if `content` was never published;
         * - `external_call_failed` if the content manager refuses the grant.
         */
        timestamp_t grantPremium(Transaction &tx, content_t content, account_t consumer);

    private:
        state::Ledger &ledger_;
        Environment &env_;
        ContentRegistry &registry_;
        AuthorLedger &authors_;
        const PremiumSubscriptionManager &premium_;

        // Records the view on the content and calls the content manager
        void grant(Transaction &tx, state::ContentInfo &info, account_t account, timestamp_t until, bool premium);
};

}
