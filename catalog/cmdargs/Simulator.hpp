#pragma once
#include "catalog/cmdargs/CmdArgs.hpp"
#include "catalog/MarketSettings.hpp"
#include <boost/program_options/options_description.hpp>
#include <eris/random/rng.hpp>
#include <string>
namespace boost { namespace program_options { class variables_map; } }

namespace catalog { namespace cmdargs {

/** Command-line arguments of the market simulator.  Catalog and market settings are stored
 * directly into the MarketSettings object given to the constructor.
 *
 * Single-letter options used in this class:
 *     a c d f F g G o O p P q r R s S v w W
 * Used in CmdArgs base class:
 *     h
 */
class Simulator : public CmdArgs {
    public:
        /// Default constructor deleted
        Simulator() = delete;

        /// Constructs a Simulator object that stores values in the given MarketSettings object.
        explicit Simulator(MarketSettings &ms);

        /** The output file for per-author payouts, as CSV.  If empty (the default), no file is
         * written.  "SEED" in the name is replaced with the seed used.
         */
        std::string output;

        /// Whether `output` may be overwritten
        bool overwrite = false;

        /// Set to suppress daily progress output
        bool quiet = false;

        /** The seed.  The default is whatever eris::random::seed() returns, which is random
         * (unless overridden with ERIS_RNG_SEED).  parse() reseeds the RNG if this is changed.
         */
        eris::random::rng_t::result_type seed = eris::random::seed();

        /// Overridden to add " -- command-line simulator"
        std::string version() const override;

    protected:
        /// Adds the catalog, market and simulator options
        void addOptions() override;

        /// Overridden to handle the seed and output settings
        void postParse(boost::program_options::variables_map &vars) override;

        /** The settings reference in which to store given values */
        MarketSettings &s_;
};

}}
