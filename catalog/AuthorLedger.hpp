#pragma once
#include "catalog/state/Ledger.hpp"
#include "catalog/types.hpp"

namespace catalog {

class Environment;
class Transaction;

/** Per-author accounting of pay-per-view revenue: accrues credit as views are sold and pays it out
 * once the author has accumulated enough views.
 */
class AuthorLedger {
    public:
        /// Creates an author ledger operating on the given ledger, paying out through `env`.
        AuthorLedger(state::Ledger &ledger, Environment &env);

        /** Records one sold pay-per-view access of content by `author`, adding `fee` to the author's
         * credit.  Once the author's views since the last withdrawal reach `payable_views`, a
         * CreditAvailable event is emitted; it is emitted again on each later view until the author
         * withdraws.
         *
         * \throws CatalogError with reason `unregistered` if `author` never published.
         */
        void recordPayPerView(Transaction &tx, account_t author, amount_t fee);

        /** Records one premium access of content by `author`, counting it both for the author and
         * for the global premium pool.
         *
         * \throws CatalogError with reason `unregistered` if `author` never published.
         */
        void recordPremiumView(Transaction &tx, account_t author);

        /** Pays the caller's accrued pay-per-view credit out to the caller.  The credit and the
         * view count are set to zero before the transfer is made, so a re-entrant withdraw from
         * inside the transfer finds nothing to pay.
         *
         * \returns the amount paid
         * \throws CatalogError with reason
         * - `unregistered` if `caller` never published;
         * - `threshold_not_reached` if `caller` has fewer than `payable_views` views since the last
         *   withdrawal;
         * - `external_call_failed` if the transfer fails.
         */
        amount_t withdraw(Transaction &tx, account_t caller);

        /// Returns true if `author` has published something.
        bool registered(account_t author) const;

        /** Returns the bookkeeping of the given author.
         *
         * \throws CatalogError with reason `unregistered` if `author` never published.
         */
        const state::AuthorInfo& info(account_t author) const;

    private:
        state::Ledger &ledger_;
        Environment &env_;

        state::AuthorInfo& author(account_t author, const char *operation);
};

}
