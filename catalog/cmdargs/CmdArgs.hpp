#pragma once
#include "catalog/cmdargs/Validation.hpp"
#include "catalog/cmdargs/strings.hpp"
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <string>
#include <type_traits>

namespace boost { namespace program_options { class variables_map; } }

namespace catalog {
/// Command-line handling for the catalog executables.
namespace cmdargs {

/** Common base of the command-line front ends.  A subclass registers its options in
 * addOptions() through the value() helpers below; each helper binds an option to an existing
 * variable, whose value at registration time is what --help shows as the default.
 *
 * \todo --help alignment is off for options whose value names contain multi-byte UTF-8 characters
 * (ℕ, ⩾, ...) since boost counts bytes.
 */
class CmdArgs {

    protected:
        /// Only subclasses can be instantiated.
        CmdArgs() = default;

    public:
        /// Option value type returned by the helpers
        template <typename T> using typed = boost::program_options::typed_value<T>;

        virtual ~CmdArgs() = default;

        /** Reads the command line into the bound variables.
         *
         * `--help` and `--version` print their output and terminate the process with status 0.
         * Otherwise, once every value has been accepted, postParse() runs.
         *
         * \throws boost::program_options::error (or a subclass) for an unknown option, a missing
         * argument, or a value its validator refuses.  In that case no variable is modified.
         */
        void parse(int argc, char const* const* argv);

        /** Binds a signed integer or floating point option to `store`, with no restriction on
         * the value.
         */
        template <typename T>
        static typename std::enable_if<not std::is_unsigned<T>::value and not std::is_same<T, bool>::value, typed<T>*>::type
        value(T &store) {
            return boost::program_options::value<T>(&store)->default_value(store)->value_name(type_string<T>());
        }

        /** Binds an unsigned option to `store`.  Any non-negative value is accepted; "-3" is an
         * error rather than a wrapped-around huge number.
         */
        template <typename T>
        static typename std::enable_if<std::is_unsigned<T>::value and not std::is_same<T, bool>::value, typed<Validation<T>>*>::type
        value(T &store) {
            return value<Validation<T>>(store);
        }

        /// Binds a flag (no argument) to `store`.
        static typed<bool>* value(bool &store) {
            return boost::program_options::bool_switch(&store)->default_value(store);
        }

        /// Binds a free-form string option to `store`.
        static typed<std::string>* value(std::string &store) {
            return boost::program_options::value<std::string>(&store)->default_value(store)->value_name("arg");
        }

        /** Binds an option to `store` through the validating wrapper `V`, which must throw from
         * its constructor on an unacceptable value and expose the wrapped type as `value_type`.
         * The accepted value is copied into `store` when the options are notified.
         */
        template <typename V>
        static typed<V>* value(typename V::value_type &store) {
            return boost::program_options::value<V>()
                ->default_value(V(store), display(V(store)))
                ->value_name(V::validationString())
                ->notifier([&store](const V &v) { store = v; });
        }

        /// Binds an option that must be at least `minimum/denom`
        template <long minimum, long denom = 1, typename T>
        static typed<Min<T, minimum, denom>>* min(T &store) { return value<Min<T, minimum, denom>>(store); }

        /// Binds an option that must lie in `[lo/denom, hi/denom]`
        template <long lo, long hi, long denom = 1, typename T>
        static typed<Range<T, lo, hi, denom>>* range(T &store) { return value<Range<T, lo, hi, denom>>(store); }

        /// Binds an option that must be strictly greater than `lower/denom`
        template <long lower, long denom = 1, typename T>
        static typed<Above<T, lower, denom>>* above(T &store) { return value<Above<T, lower, denom>>(store); }

        /// Binds a length of time given with an optional s/m/h/d unit; 0 is refused if `positive`
        template <bool positive = true>
        static typed<Duration<positive>>* duration(timestamp_t &store) { return value<Duration<positive>>(store); }

        /// Program name and version, as printed by --version.
        virtual std::string version() const;

        /// The first line of --help output.
        virtual std::string usage() const;

        /// The complete --help output: usage line plus every registered option.
        virtual std::string help() const;

    protected:
        /** Registers the options.  parse() calls this once, on first use.  The base version adds
         * --help and --version; subclasses extend it with their own groups.
         */
        virtual void addOptions();

        /** Hook run by parse() after every value has been stored.  The base version does
         * nothing.
         */
        virtual void postParse(boost::program_options::variables_map &vars);

        /// argv[0] of the last parse(); empty before it.
        std::string program_;

        /// Every registered option
        boost::program_options::options_description options_;

    private:
        // Default value text for --help
        template <typename T>
        static std::string display(const Validation<T> &v) { return output_string((const T&) v); }
        template <bool positive>
        static std::string display(const Duration<positive> &v) { return duration_string(v); }
};

}}
