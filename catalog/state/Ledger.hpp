#pragma once
#include "catalog/CatalogSettings.hpp"
#include "catalog/state/AuthorInfo.hpp"
#include "catalog/state/ContentInfo.hpp"
#include "catalog/types.hpp"
#include <cstdint>
#include <deque>
#include <set>
#include <unordered_map>
#include <vector>

/// Namespace for the plain data making up the catalog's durable state.
namespace catalog { namespace state {

/** The complete durable state of a catalog.  A Catalog owns exactly one of these; the catalog
 * components each operate on a reference to it, so a Ledger can also be built directly (for
 * example by tests) and handed to a single component.
 *
 * Invariants maintained by the components (outside of an operation in progress):
 * - every entry of `contents` has a matching `content_index` entry, and vice versa;
 * - `premium_views` equals the sum of `premium_views` over all of `authors`;
 * - every key of `authors` appears exactly once in `author_order`, and every such author is
 *   registered.
 */
struct Ledger {
    /// The owner: fixed at construction, receives the residual at teardown.
    account_t owner = 0;

    /// The current parameters
    CatalogSettings settings;

    /** Published content in publication order.  A deque keeps element references stable while
     * new items are appended (which can happen from a re-entrant call during another operation).
     */
    std::deque<ContentInfo> contents;

    /// Maps content reference to its position in `contents`
    std::unordered_map<content_t, size_t> content_index;

    /// Fingerprints of everything published so far
    std::set<Fingerprint> fingerprints;

    /// Per-author bookkeeping
    std::unordered_map<account_t, AuthorInfo> authors;

    /// Authors in the order in which they first published
    std::vector<account_t> author_order;

    /// Premium subscription expiration times, keyed by consumer
    std::unordered_map<account_t, timestamp_t> premium_expiration;

    /// Subscription fees collected since the last distribution
    amount_t premium_credit = 0;

    /// Premium views recorded since the last distribution, over all authors
    uint64_t premium_views = 0;

    /// Time of the last distribution (or of the catalog's creation, before the first one)
    timestamp_t last_distribution = 0;

    /// Funds held by the catalog: all accepted fees less everything paid out
    amount_t balance = 0;

    /// Set (permanently) by teardown
    bool closed = false;
};

}}
