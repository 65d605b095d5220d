#pragma once
#include <stdexcept>
#include <string>

namespace catalog {

/** Exception thrown whenever the catalog rejects an operation.  The operation that throws this has
 * not changed any catalog state: every mutation it made before the failure has been undone.
 *
 * The reason code identifies the violated condition; what() additionally names the operation.
 */
class CatalogError : public std::runtime_error {
    public:
        /// The rejection reasons
        enum class Reason {
            permission_denied, ///< Caller is not the owner (or not the author) required by the operation
            wrong_value, ///< Attached payment does not exactly equal the required fee
            duplicate_content, ///< Content reference or fingerprint already published
            content_not_found, ///< Content reference has never been published
            unregistered, ///< Account has never published anything
            threshold_not_reached, ///< Fewer pay-per-view accesses than `payable_views`
            subscription_expired, ///< Account has no active premium subscription
            too_early, ///< Premium withdrawal period has not elapsed since the last distribution
            nothing_to_distribute, ///< No premium views were recorded since the last distribution
            external_call_failed, ///< A content manager or a value transfer failed
            invalid_account, ///< Account 0 was named as the receiver of access
            catalog_closed ///< The catalog has been closed and accepts no further operations
        };

        /// Constructs an error with the given reason and a message describing the failure.
        CatalogError(Reason reason, const std::string &message);

        /// The reason the operation was rejected.
        Reason reason() const { return reason_; }

        /// Returns a short name for the given reason, such as "threshold_not_reached".
        static const char* reasonName(Reason reason);

    private:
        Reason reason_;
};

}
