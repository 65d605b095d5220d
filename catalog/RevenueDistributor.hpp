#pragma once
#include "catalog/state/Ledger.hpp"
#include "catalog/types.hpp"
#include <cstdint>
#include <vector>

namespace catalog {

class Environment;
class Transaction;

/** Pays out the premium pool.  Subscription fees are collected into a common pool; periodically,
 * the whole pool is split among all authors in proportion to the number of premium views of
 * their content since the previous split.
 *
 * For example, with a pool of 1000 and premium views of
 *     A - 15 views
 *     B - 5 views
 *     C - 4 views
 *     D - 1 view
 * A receives 600, B 200, C 160 and D 40.  Shares are rounded down to the currency unit: with a
 * pool of 100 and views of 2 and 1, the authors receive 66 and 33, and the remaining unit is
 * forfeited.  The pool is emptied either way; forfeited units stay in the catalog's balance until
 * teardown, when they go to the owner.
 *
 * The distributor is also responsible for teardown, which pays every author everything still owed
 * to them and closes the catalog.
 */
class RevenueDistributor {
    public:
        /// Creates a distributor operating on the given ledger, paying out through `env`.
        RevenueDistributor(state::Ledger &ledger, Environment &env);

        /// A single payment made by the distributor.
        struct Payout {
            account_t account; ///< The payee
            amount_t amount; ///< The amount paid
        };

        /** Distributes the premium pool.  Anyone may trigger this, at most once per
         * `premium_withdrawal_period`.  Authors whose share rounds down to zero get nothing (and no
         * event).  The pool is emptied and the distribution time recorded before any payment is
         * made.
         *
         * \returns the payments made, in author registration order
         * \throws CatalogError with reason
         * - `too_early` if `premium_withdrawal_period` hasn't elapsed since the last distribution;
         * - `nothing_to_distribute` if there were no premium views since then;
         * - `external_call_failed` if a transfer fails.
         */
        std::vector<Payout> distributePremiumCredits(Transaction &tx);

        /** Liquidates the catalog.  Every author is paid their unwithdrawn pay-per-view credit plus
         * their share of the current premium pool (regardless of when the last distribution
         * happened and of the withdrawal threshold), then everything else the catalog holds,
         * including rounding remainders, goes to the owner.  Afterwards the ledger is marked
         * closed.
         *
         * Caller authorization is the caller's responsibility (see Catalog::closeCatalog).
         *
         * \returns the payments made: authors first, in registration order, then the owner's
         * residual (if non-zero).
         * \throws CatalogError with reason `external_call_failed` if a transfer fails.
         */
        std::vector<Payout> liquidate(Transaction &tx);

        /** Returns `floor(pool * views / total)` without overflow.  `total` must be non-zero and
         * `views` must not exceed it.
         */
        static amount_t share(amount_t pool, uint64_t views, uint64_t total);

    private:
        state::Ledger &ledger_;
        Environment &env_;

        // Pays out the given payouts, emitting an event for each
        void pay(Transaction &tx, const std::vector<Payout> &payouts, const char *operation);
};

}
