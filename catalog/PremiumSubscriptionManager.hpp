#pragma once
#include "catalog/state/Ledger.hpp"
#include "catalog/types.hpp"

namespace catalog {

class Environment;
class Transaction;

/** Sells premium subscriptions and collects their fees into the premium pool, from which
 * RevenueDistributor later pays authors in proportion to their premium views.
 */
class PremiumSubscriptionManager {
    public:
        /// Creates a subscription manager operating on the given ledger, reading time from `env`.
        PremiumSubscriptionManager(state::Ledger &ledger, const Environment &env);

        /// Returns true if `account` has a subscription that has not yet expired.
        bool isPremium(account_t account) const;

        /** Returns the time at which the subscription of `account` expires (or expired), or 0 if the
         * account never had one.
         */
        timestamp_t expiration(account_t account) const;

        /** Buys one subscription period for `beneficiary`.  The new period starts at the current
         * expiration if the subscription is still active, and now otherwise.  The fee goes to the
         * premium pool.
         *
         * \returns the new expiration time
         * \throws CatalogError with reason `wrong_value` unless `fee` is exactly `premium_fee`.
         */
        timestamp_t buySubscription(Transaction &tx, account_t beneficiary, amount_t fee);

    private:
        state::Ledger &ledger_;
        const Environment &env_;
};

}
