#pragma once
#include "catalog/types.hpp"

namespace catalog {

class ContentManager;

/** The execution environment the catalog runs inside: whatever executes the transactions also
 * provides the clock, moves value out of the catalog, and resolves content references to the
 * content manager objects that answer them.
 *
 * The environment is responsible for the atomicity of its own value movements: if a catalog
 * operation throws, every transfer the environment performed on its behalf must be discarded along
 * with the payment that accompanied the call.  The catalog restores its own bookkeeping.
 *
 * \sa LocalChain for an in-process implementation.
 */
class Environment {
    public:
        /// Virtual destructor
        virtual ~Environment() = default;

        /// The current time, in seconds.
        virtual timestamp_t now() const = 0;

        /** Pays `amount` out of the catalog's funds to `to`.  This is a synchronous call that may
         * run code belonging to the payee, which may in turn call back into the catalog.
         *
         * \throws std::exception (any subclass) if the transfer fails.
         */
        virtual void transfer(account_t to, amount_t amount) = 0;

        /** Returns the content manager that answers for `content`.
         *
         * \throws std::out_of_range if nothing is deployed under that reference.
         */
        virtual ContentManager& contentManager(content_t content) = 0;
};

}
