#pragma once
#include "catalog/types.hpp"
#include <cstdint>

namespace catalog {

/** Catalog parameters.  The values given at construction are checked by Catalog::checkSettings();
 * afterwards they may only be changed by the owner through the Catalog setters.
 */
struct CatalogSettings {
    /** The exact amount that must accompany a pay-per-view access purchase.  Any other amount
     * (including an overpayment) is rejected.  Must be positive.
     */
    amount_t content_fee = 1000;

    /** How long a pay-per-view grant lasts, in seconds, counted from the moment of purchase.  Must
     * be positive.  Defaults to one day.
     */
    timestamp_t content_period = DAY;

    /// The exact amount of a premium subscription purchase.  Must be positive.
    amount_t premium_fee = 20000;

    /** The length of one premium subscription, in seconds.  A purchase made while a subscription
     * is still active extends the current expiration, so no paid-for time is ever lost.  Must be
     * positive.  Defaults to 30 days.
     */
    timestamp_t premium_period = 30 * DAY;

    /** The minimum time, in seconds, between two premium credit distributions.  0 allows a
     * distribution whenever there are premium views to pay for.  Defaults to 7 days.
     */
    timestamp_t premium_withdrawal_period = 7 * DAY;

    /** The number of pay-per-view accesses an author must accumulate (since the last withdrawal)
     * before being allowed to withdraw the accrued content credit.  Must be at least 1.
     */
    uint64_t payable_views = 10;
};

}
