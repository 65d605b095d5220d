#include "catalog/cmdargs/Simulator.hpp"
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>
#include <regex>
#include <string>

namespace catalog { namespace cmdargs {

namespace po = boost::program_options;

Simulator::Simulator(MarketSettings &ms) : s_(ms) {}

void Simulator::addOptions() {
    CmdArgs::addOptions();
    po::options_description fees("Catalog fees and periods"), market("Market structure"),
        behaviour("Agent behaviour (daily probabilities)"), controls("Simulator controls");

    fees.add_options()
        ("content-fee,f", above<0>(s_.catalog.content_fee), "The exact price of pay-per-view access to one item")
        ("content-period,p", duration(s_.catalog.content_period), "How long pay-per-view access lasts")
        ("premium-fee,F", above<0>(s_.catalog.premium_fee), "The exact price of one premium subscription period")
        ("premium-period,P", duration(s_.catalog.premium_period), "The length of one premium subscription period; purchases while subscribed extend the current period")
        ("withdrawal-period,W", duration<false>(s_.catalog.premium_withdrawal_period), "The minimum time between two premium pool distributions")
        ("payable-views,v", min<1>(s_.catalog.payable_views), "The number of pay-per-view accesses an author needs before withdrawing their credit")
        ;
    options_.add(fees);

    market.add_options()
        ("authors,a", min<1>(s_.authors), "Number of author agents")
        ("consumers,c", min<2>(s_.consumers), "Number of consumer agents")
        ("genres,g", min<1>(s_.genres), "Number of content genres")
        ("funds", value(s_.consumer_funds), "Starting funds of each consumer")
        ("days,d", value(s_.days), "Number of days to simulate before the owner closes the catalog")
        ;
    options_.add(market);

    behaviour.add_options()
        ("prob-publish,w", range<0, 1>(s_.prob_publish), "Probability that an author publishes a new item")
        ("prob-duplicate,G", range<0, 1>(s_.prob_duplicate), "Probability that a publication attempt re-uses already published bytes (and is rejected)")
        ("prob-subscribe,s", range<0, 1>(s_.prob_subscribe), "Probability that a consumer without a subscription buys one")
        ("prob-gift", range<0, 1>(s_.prob_gift), "Probability that a subscription purchase is a gift to another consumer")
        ("prob-read,r", range<0, 1>(s_.prob_read), "Probability that a consumer reads an item")
        ("prob-recommended,R", range<0, 1>(s_.prob_recommended), "Probability that a consumer picks a recommended item (newest or most popular) instead of a random one")
        ("prob-withdraw,S", range<0, 1>(s_.prob_withdraw), "Probability that an eligible author withdraws their credit")
        ;
    options_.add(behaviour);

    controls.add_options()
        ("seed", value(seed), "Random seed to use.  If omitted, a random seed is obtained from the operating system's random source.")
        ("output,o", value(output), "Output file for the per-author payouts (CSV).  If this contains the characters 'SEED', they will be replaced with the random seed value used.  Nothing is written if omitted.")
        ("overwrite,O", value(overwrite), "Allows the file given to -o to be overwritten.")
        ("quiet,q", value(quiet), "If specified, don't output daily progress.")
        ;
    options_.add(controls);
}

void Simulator::postParse(boost::program_options::variables_map&) {
    // Explicitly setting the seed resets the RNG, so only do it if it actually changed
    if (eris::random::seed() != seed) {
        eris::random::seed(seed);
    }

    if (not output.empty()) {
        output = std::regex_replace(output, std::regex("SEED"), std::to_string(eris::random::seed()));
    }
}

std::string Simulator::version() const {
    return CmdArgs::version() + " -- command-line simulator";
}

}}
