#pragma once
#include "catalog/types.hpp"
#include <cstdint>

namespace catalog { namespace state {

/** The bookkeeping the catalog keeps for each author.  Created (zero-initialized, then marked
 * registered) when the author first publishes, and never removed.
 */
struct AuthorInfo {
    /// Pay-per-view revenue accrued and not yet withdrawn
    amount_t content_credit = 0;

    /// Pay-per-view accesses since the last withdrawal
    uint64_t content_views = 0;

    /// Premium accesses to this author's content since the last premium distribution
    uint64_t premium_views = 0;

    /// True once the author has published; never reset.
    bool registered = false;
};

}}
