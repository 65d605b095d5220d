#pragma once
#include "catalog/types.hpp"
#include <string>

namespace catalog {

/** Abstract interface of a content manager: the external entity that holds a content item's
 * bytes and metadata and enforces per-consumer access grants.  The catalog only ever uses the two
 * methods declared here; how a manager keeps track of its grants is its own business.
 *
 * \sa ContentStore for the reference implementation.
 */
class ContentManager {
    public:
        /// The publication metadata reported by a content manager.
        struct Info {
            /// The account that created the content; only this account may publish it.
            account_t author = 0;
            /// Human-readable title (only forwarded in the publication event)
            std::string title;
            /// Opaque genre tag
            genre_t genre = 0;
            /// Digest of the content's raw bytes, used for publish-once deduplication.
            Fingerprint fingerprint{};
        };

        /// Virtual destructor
        virtual ~ContentManager() = default;

        /** Returns the publication metadata of the content.  This must not modify anything. */
        virtual Info info() const = 0;

        /** Grants `account` access to the content until the absolute time `until`.  Called by the
         * catalog once the access has been paid for (or covered by a subscription).
         *
         * Implementations may call back into the catalog from here.  Any exception thrown aborts
         * the catalog operation that requested the grant.
         *
         * \throws std::exception (any subclass) if the manager refuses the grant.
         */
        virtual void grantAccess(account_t account, timestamp_t until) = 0;
};

}
