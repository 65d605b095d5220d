#pragma once
#include "catalog/state/Ledger.hpp"
#include "catalog/types.hpp"
#include <cstddef>
#include <vector>

namespace catalog {

class Environment;
class Transaction;

/** Registry of published content.  Publishes content (at most once per reference and at most once
 * per fingerprint) and answers the read-only content queries.
 */
class ContentRegistry {
    public:
        /// Creates a registry operating on the given ledger, resolving content through `env`.
        ContentRegistry(state::Ledger &ledger, Environment &env);

        /** Publishes the content held by the content manager deployed at `content`.
         *
         * The manager is asked for its metadata; only the author it reports may publish.  The
         * author is registered (and announced with a NewAuthor event) on their first publication.
         *
         * \throws CatalogError with reason
         * - `external_call_failed` if `content` doesn't resolve to a manager or its info() throws;
         * - `permission_denied` if `caller` is not the content's author;
         * - `duplicate_content` if the reference or the fingerprint has already been published.
         */
        void publish(Transaction &tx, account_t caller, content_t content);

        /// Returns true if `content` has been published.
        bool published(content_t content) const;

        /** Returns the record of a published item.
         *
         * \throws CatalogError with reason `content_not_found` if `content` was never published.
         */
        const state::ContentInfo& info(content_t content) const;

        /// Mutable version of info(), for the components that record views.
        state::ContentInfo& info(content_t content);

        /// The number of published items.
        size_t size() const;

        /// Every published reference, in publication order.
        std::vector<content_t> contentList() const;

        /// View counts of every published item, parallel to `contents`.
        struct Statistics {
            std::vector<content_t> contents; ///< Published references, in publication order
            std::vector<uint64_t> views; ///< `views[i]` is the view count of `contents[i]`
        };

        /// Returns the references and their view counts.
        Statistics statistics() const;

        /** Returns the `n` most recently published references, most recent first.  If fewer than
         * `n` items exist, all of them are returned.
         */
        std::vector<content_t> newContentList(size_t n) const;

        /// The most recently published item of the given genre, or 0 if there is none.
        content_t latestByGenre(genre_t genre) const;

        /// The most recently published item by the given author, or 0 if there is none.
        content_t latestByAuthor(account_t author) const;

        /** The item of the given genre with the most views, or 0 if there is none.  Between items
         * with equal views, the one published later wins.
         */
        content_t mostPopularByGenre(genre_t genre) const;

        /** The item by the given author with the most views, or 0 if there is none.  Between items
         * with equal views, the one published later wins.
         */
        content_t mostPopularByAuthor(account_t author) const;

    private:
        state::Ledger &ledger_;
        Environment &env_;

        // Scans in publication order; returns the latest match of `pred`
        template <typename Pred> content_t latest(Pred pred) const;
        // Scans in publication order; returns the match with the most views, later entries winning ties
        template <typename Pred> content_t mostPopular(Pred pred) const;
};

}
