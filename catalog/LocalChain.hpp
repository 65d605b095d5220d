#pragma once
#include "catalog/Environment.hpp"
#include "catalog/types.hpp"
#include <eris/noncopyable.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace catalog {

class ContentManager;

/** In-process execution environment: a single-threaded stand-in for the ledger platform a catalog
 * is deployed on.  It keeps account balances, a clock under the caller's control, and the content
 * managers deployed on it, and it executes calls atomically with respect to balances.
 *
 * Accounts and deployed content managers share one identifier space, starting at 1.
 *
 * Payees can register a receive hook, which runs inside the transfer paying them (much like code
 * attached to a contract account); hooks are where re-entrant calls into a catalog come from.
 */
class LocalChain : public Environment, private eris::noncopyable {
    public:
        /// Creates an environment with no accounts and the clock at `start`.
        explicit LocalChain(timestamp_t start = 0);

        timestamp_t now() const override;

        /// Sets the clock.  Time may not go backwards.
        void setTime(timestamp_t t);

        /// Advances the clock by `seconds`.
        void advance(timestamp_t seconds);

        /// Creates a new account with the given starting balance and returns its identifier.
        account_t createAccount(amount_t balance = 0);

        /** Returns the balance of `account`.
         *
         * \throws std::out_of_range if the account doesn't exist.
         */
        amount_t balance(account_t account) const;

        /** Deploys a content manager, returning the reference it can be reached at.
         *
         * \throws std::invalid_argument if `manager` is null.
         */
        content_t deploy(std::shared_ptr<ContentManager> manager);

        /// Convenience wrapper around deploy() that constructs the manager in place.
        template <class T, typename... Args>
        content_t deploy(Args&&... args) {
            return deploy(std::make_shared<T>(std::forward<Args>(args)...));
        }

        ContentManager& contentManager(content_t content) override;

        /** Designates the account whose funds `transfer()` pays out of and which receives the
         * value attached to execute().  Must be called before either is used.
         *
         * \throws std::out_of_range if the account doesn't exist.
         */
        void setCatalogAccount(account_t account);

        /// The account designated by setCatalogAccount() (0 if not yet set).
        account_t catalogAccount() const { return catalog_account_; }

        /** Moves `amount` from the catalog account to `to`, then runs `to`'s receive hook, if any.
         * If the hook throws, the transfer and everything moved during the hook is reverted, and
         * the exception propagates.
         *
         * \throws std::out_of_range if `to` doesn't exist.
         * \throws std::runtime_error if the catalog account has insufficient funds.
         */
        void transfer(account_t to, amount_t amount) override;

        /// Callback run when an account receives a transfer; it gets the amount received.
        using ReceiveHook = std::function<void(amount_t)>;

        /// Sets (or, with an empty function, clears) the receive hook of `account`.
        void onReceive(account_t account, ReceiveHook hook);

        /** Executes one call from `caller` with `value` attached.  The value is moved from `caller`
         * to the catalog account, then `call` runs.  If `call` throws, all balance movements made
         * since the start of the call (including the attached value) are reverted and the exception
         * is rethrown.  Calls can be nested (for example from a receive hook); each nesting level
         * reverts independently.
         *
         * \throws std::runtime_error if `caller` cannot pay `value`.
         */
        void execute(account_t caller, amount_t value, const std::function<void()> &call);

        /// Total of all balances; constant except for account creation.
        amount_t totalSupply() const;

    private:
        struct Move {
            account_t from, to;
            amount_t amount;
        };

        timestamp_t now_;
        eris::eris_id_t next_id_ = 1;
        account_t catalog_account_ = 0;
        std::unordered_map<account_t, amount_t> balances_;
        std::unordered_map<content_t, std::shared_ptr<ContentManager>> managers_;
        std::unordered_map<account_t, ReceiveHook> hooks_;
        // Balance movements of the open execute()/transfer() frames, for reverting
        std::vector<Move> moves_;
        unsigned int frames_ = 0;

        amount_t& account(account_t a);
        void move(account_t from, account_t to, amount_t amount);
        void revert(size_t mark);
};

}
