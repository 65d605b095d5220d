#pragma once
#include "catalog/Catalog.hpp"
#include "catalog/CatalogError.hpp"
#include "catalog/LocalChain.hpp"
#include "catalog/MarketSettings.hpp"
#include "catalog/types.hpp"
#include <eris/noncopyable.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace catalog {

class ContentStore;

/** A simulated market around a single catalog, running on a LocalChain.  Authors publish content,
 * consumers buy access to it (pay-per-view or through premium subscriptions) and read it, authors
 * withdraw their credit, anyone triggers premium distributions, and finally the owner closes the
 * catalog.  All random draws come from eris's shared RNG, so a run is reproducible from its seed.
 *
 * Every call goes through LocalChain::execute(), exactly as an external caller's would; rejected
 * calls are expected (for instance duplicate publications) and are tallied by reason.
 */
class Market : private eris::noncopyable {
    public:
        /// Creates a market with the given settings.  Nothing is set up until setup() is called.
        explicit Market(const MarketSettings &settings);

        /// The settings the market was created with
        const MarketSettings &parameters{set_};

        /** Checks that all values of `parameters` are usable.
         *
         * \throws std::domain_error if any value is invalid.
         */
        void checkParameters() const;

        /** Creates the environment, the owner, author and consumer accounts, and the catalog.
         *
         * \throws std::domain_error (via checkParameters() or Catalog::checkSettings()) if any
         * settings are invalid.
         * \throws std::logic_error if called twice.
         */
        void setup();

        /** Simulates one day, then advances the clock by a day.
         *
         * \throws std::logic_error if the market isn't set up or has been closed, or if the
         * catalog's bookkeeping ever disagrees with the funds the environment holds for it.
         */
        void runDay();

        /// The number of days simulated so far.
        uint32_t day() const { return day_; }

        /** Closes the catalog (as the owner), paying out everything still owed.
         *
         * \returns the payouts made at closing
         */
        std::vector<Catalog::Payout> close();

        /// Accumulated payments to an author, by channel.
        struct AuthorTotals {
            uint32_t published = 0; ///< Items successfully published
            amount_t withdrawn = 0; ///< Pay-per-view credit withdrawn during the run
            amount_t premium = 0; ///< Premium distribution shares received during the run
            amount_t closing = 0; ///< Paid out at closing

            /// Sum of all channels
            amount_t total() const { return withdrawn + premium + closing; }
        };

        /// Market-wide counters.
        struct Statistics {
            uint64_t published = 0; ///< Successful publications
            uint64_t pay_per_view = 0; ///< Pay-per-view purchases
            uint64_t subscriptions = 0; ///< Premium subscription purchases (including gifts)
            uint64_t gifts = 0; ///< Premium subscriptions bought for someone else
            uint64_t premium_views = 0; ///< Accesses under a subscription
            uint64_t consumed = 0; ///< Content actually read
            uint64_t withdrawals = 0; ///< Successful withdrawals
            uint64_t distributions = 0; ///< Successful premium distributions
            amount_t residual = 0; ///< Paid to the owner at closing
            /// Rejected calls, by reason
            std::map<CatalogError::Reason, uint64_t> rejected;
            /// Events delivered, by type name
            std::map<std::string, uint64_t> events;
        };

        /// The market-wide counters.
        const Statistics& statistics() const { return stats_; }

        /// The author accounts, in creation order.
        const std::vector<account_t>& authors() const { return authors_; }

        /// Per-author totals; authors who never received anything may be missing.
        const std::unordered_map<account_t, AuthorTotals>& authorTotals() const { return totals_; }

        /// The catalog.  Only valid after setup().
        const Catalog& catalog() const;

        /// The environment the catalog runs in.
        const LocalChain& chain() const { return chain_; }

    private:
        MarketSettings set_;
        LocalChain chain_;
        std::unique_ptr<Catalog> catalog_;
        account_t owner_ = 0;
        std::vector<account_t> authors_, consumers_;
        // Deployed stores by reference, and the byte strings published so far (for duplicates)
        std::unordered_map<content_t, std::shared_ptr<ContentStore>> stores_;
        std::vector<std::string> published_bytes_;
        std::unordered_map<account_t, AuthorTotals> totals_;
        Statistics stats_;
        uint32_t day_ = 0;
        uint64_t serial_ = 0;
        bool closed_ = false;

        // Runs `call` as `caller` with `value` attached; returns false (and tallies the reason) if
        // the catalog rejected it
        template <typename F> bool attempt(account_t caller, amount_t value, F call);

        void authorsAct();
        void consumersAct();
        void read(account_t consumer);
        void distribute();
        // Picks something to read, or 0 if nothing is published yet
        content_t choose();
        // Verifies that the catalog's balance matches its account on the chain
        void audit() const;

        static size_t draw(size_t n);
};

}
