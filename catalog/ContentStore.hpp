#pragma once
#include "catalog/ContentManager.hpp"
#include "catalog/types.hpp"
#include <string>
#include <unordered_map>

namespace catalog {

class Environment;

/** Reference content manager: holds one content item in memory and keeps its own record of who
 * may access it.
 *
 * A grant lasts until the time given by the catalog or until the holder consumes the content,
 * whichever comes first.  A new grant for an account is refused while that account still holds an
 * unexpired, unconsumed grant, so that nobody pays twice for access they already have.
 */
class ContentStore : public ContentManager {
    public:
        /** Creates a content store.  The fingerprint is computed from `bytes`.
         *
         * \param env the environment, used for the current time
         * \param author the creator (the only account allowed to publish it)
         * \param title the title
         * \param genre the genre tag
         * \param bytes the raw content
         */
        ContentStore(const Environment &env, account_t author, std::string title, genre_t genre, std::string bytes);

        /// Returns the publication metadata.
        Info info() const override;

        /** Records a grant for `account` until `until`.
         *
         * \throws std::runtime_error if `account` already holds an active grant.
         */
        void grantAccess(account_t account, timestamp_t until) override;

        /// Returns true if `account` currently holds an unexpired, unconsumed grant.
        bool hasAccess(account_t account) const;

        /** Returns the content to `account`, spending their grant.
         *
         * \throws std::runtime_error if `account` does not currently have access.
         */
        const std::string& consume(account_t account);

        /// The number of times the content has been consumed.
        unsigned int consumed() const { return consumed_; }

    private:
        const Environment &env_;
        Info info_;
        std::string bytes_;
        std::unordered_map<account_t, timestamp_t> grants_;
        unsigned int consumed_ = 0;
};

}
