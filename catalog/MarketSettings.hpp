#pragma once
#include "catalog/CatalogSettings.hpp"
#include "catalog/types.hpp"
#include <cstdint>

namespace catalog {

/** Parameters of a simulated market, used by Market::setup().  Probabilities are per agent per
 * simulated day.
 */
struct MarketSettings {
    /// The settings the market's catalog is created with.
    CatalogSettings catalog;

    /// The number of author agents
    uint32_t authors = 20;

    /// The number of consumer agents
    uint32_t consumers = 200;

    /// The number of distinct genres content is drawn from; genres are numbered from 1.
    uint32_t genres = 8;

    /// The number of days the market runs before the owner closes the catalog.
    uint32_t days = 120;

    /// The funds each consumer starts with.
    amount_t consumer_funds = 5000000;

    /// The probability that an author publishes a new item on a given day.
    double prob_publish = 0.1;

    /** The probability that a publication attempt re-uses the bytes of content that was already
     * published (by anyone).  The catalog must reject such attempts.
     */
    double prob_duplicate = 0.05;

    /** The probability that a consumer without an active subscription buys one on a given day. */
    double prob_subscribe = 0.01;

    /** The probability that a subscription purchase is a gift to another consumer rather than for
     * the buyer.
     */
    double prob_gift = 0.1;

    /** The probability that a consumer reads something on a given day: through their subscription
     * when they have one, by buying pay-per-view access otherwise.
     */
    double prob_read = 0.3;

    /** The probability that a consumer picks a recommended item (newest, or most popular of a
     * genre) rather than a uniformly drawn one.
     */
    double prob_recommended = 0.5;

    /** The probability that an author who is allowed to withdraw their pay-per-view credit does so
     * on a given day.
     */
    double prob_withdraw = 0.25;
};

}
