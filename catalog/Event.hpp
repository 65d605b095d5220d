#pragma once
#include "catalog/types.hpp"
#include <ostream>
#include <string>

namespace catalog {

/** Notification emitted by the catalog for external observers.  Events are delivered only once
 * the operation that emitted them has committed, in emission order; an operation that fails emits
 * nothing.  They are an observation channel only: nothing in the catalog ever reads them back.
 *
 * Which fields are meaningful depends on the type; unused fields are left at 0 (or empty).
 */
class Event final {
    public:
        /// The kinds of event
        enum class Type {
            new_author, ///< `account` published for the first time
            new_content_published, ///< `content` by `account` with `title` and `genre` was published
            new_premium_subscription, ///< `account` is now premium until `time`
            content_granted, ///< `account` may access `content` until `time` (`premium` if by subscription)
            credit_available, ///< `account` has reached the withdrawal threshold
            credit_transferred, ///< `amount` was paid out to `account`
            catalog_closed ///< The catalog was closed by `account` (the owner); `amount` is the residual it received
        };

        Type type;
        account_t account = 0;
        content_t content = 0;
        amount_t amount = 0;
        timestamp_t time = 0;
        genre_t genre = 0;
        bool premium = false;
        std::string title;

        /// Creates a new_author event
        static Event newAuthor(account_t author);
        /// Creates a new_content_published event
        static Event newContentPublished(content_t content, account_t author, const std::string &title, genre_t genre);
        /// Creates a new_premium_subscription event
        static Event newPremiumSubscription(account_t account, timestamp_t expiration);
        /// Creates a content_granted event
        static Event contentGranted(content_t content, account_t account, timestamp_t until, bool premium);
        /// Creates a credit_available event
        static Event creditAvailable(account_t author);
        /// Creates a credit_transferred event
        static Event creditTransferred(account_t payee, amount_t amount);
        /// Creates a catalog_closed event
        static Event catalogClosed(account_t owner, amount_t residual);

        /// Returns the name of the given event type, e.g. "NewContentPublished".
        static const char* typeName(Type type);

    private:
        explicit Event(Type t) : type{t} {}
};

/// Writes a one-line, human-readable rendering of the event.
std::ostream& operator<<(std::ostream &out, const Event &e);

}
