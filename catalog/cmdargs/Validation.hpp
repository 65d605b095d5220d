#pragma once
#include "catalog/cmdargs/strings.hpp"
#include "catalog/types.hpp"
#include <boost/any.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <string>
#include <type_traits>
#include <vector>

namespace catalog { namespace cmdargs {

/// Marker base shared by every option validation wrapper; validate() below is enabled for it.
class ValidationTag {};

/// Throws the program_options error for a value its validator refuses.
inline void reject_value() {
    throw boost::program_options::validation_error(boost::program_options::validation_error::invalid_option_value);
}

/// Renders the bound `num/denom` of a validator for --help: "3" or "0.25".
template <long num, long denom>
std::string bound_string() {
    return denom == 1 ? output_string(num) : output_string(num / (double) denom);
}

/** Wraps an option value of type T.  On its own it only refuses negative input for unsigned T
 * (see validate()); the subclasses add bounds.  They derive virtually so that bounds can be
 * combined, as Range does.
 */
template <typename T>
class Validation : public ValidationTag {
    public:
        /// Wraps `v`
        Validation(T v) : val_(v) {}
        virtual ~Validation() = default;
        /// The wrapped value
        operator const T& () const { return val_; }
        /// The wrapped type
        using value_type = T;
        /// Value name shown by --help
        static std::string validationString() {
            return std::is_unsigned<T>::value ? type_string<T>() + u8"⩾0" : type_string<T>();
        }

    protected:
        T val_;
};

/// Values of at least `min/denom` (a fraction, since template arguments can't be floating point)
template <typename T, long min, long denom = 1>
class Min : public virtual Validation<T> {
    public:
        /// Throws unless `v >= min/denom`
        Min(T v) : Validation<T>(v) { if (v < min / (double) denom) reject_value(); }
        /// Value name shown by --help
        static std::string validationString() { return type_string<T>() + u8"⩾" + bound_string<min, denom>(); }
};

/// Values of at most `max/denom`
template <typename T, long max, long denom = 1>
class Max : public virtual Validation<T> {
    public:
        /// Throws unless `v <= max/denom`
        Max(T v) : Validation<T>(v) { if (v > max / (double) denom) reject_value(); }
        /// Value name shown by --help
        static std::string validationString() { return type_string<T>() + u8"⩽" + bound_string<max, denom>(); }
};

/// Values in `[min/denom, max/denom]`, such as probabilities
template <typename T, long min, long max, long denom = 1>
class Range : public Min<T, min, denom>, public Max<T, max, denom> {
    public:
        /// Throws unless the value is within both bounds
        Range(T v) : Validation<T>(v), Min<T, min, denom>(v), Max<T, max, denom>(v) {}
        /// Value name shown by --help
        static std::string validationString() {
            return bound_string<min, denom>() + u8"⩽" + type_string<T>() + u8"⩽" + bound_string<max, denom>();
        }
};

/// Values strictly above `lower/denom`; `Above<T, 0>` is the usual "must be positive"
template <typename T, long lower, long denom = 1>
class Above : public virtual Validation<T> {
    public:
        /// Throws unless `v > lower/denom`
        Above(T v) : Validation<T>(v) { if (v <= lower / (double) denom) reject_value(); }
        /// Value name shown by --help
        static std::string validationString() { return type_string<T>() + u8">" + bound_string<lower, denom>(); }
};

/** Validation wrapper for a length of time.  Accepts a number of seconds, optionally followed by a
 * unit suffix: `s`, `m` (minutes), `h` or `d`, so that `30d`, `720h` and `2592000` are the same
 * value.  If `positive` is true, 0 is rejected.
 */
template <bool positive = true>
class Duration : public virtual Validation<timestamp_t> {
    public:
        /// Throws if `positive` is set and `v` is 0
        Duration(timestamp_t v) : Validation<timestamp_t>(v) { if (positive and v == 0) reject_value(); }

        /// Value name shown by --help
        static std::string validationString() { return positive ? u8"ℕ>0[smhd]" : u8"ℕ[smhd]"; }
};

/** Parses a duration string as accepted by Duration.
 *
 * \throws boost::program_options::invalid_option_value if the value can't be parsed.
 */
timestamp_t parse_duration(const std::string &value);

/** program_options validator for the wrappers above, picked up by argument-dependent lookup.  The
 * string is converted with lexical_cast and handed to the wrapper's constructor, which refuses it
 * by throwing.
 */
template <class V, typename = typename std::enable_if<std::is_base_of<ValidationTag, V>::value>::type>
void validate(boost::any &v, const std::vector<std::string> &values, V*, int) {
    namespace po = boost::program_options;
    po::validators::check_first_occurrence(v);
    const std::string &s = po::validators::get_single_string(values);
    using T = typename V::value_type;
    if (std::is_unsigned<T>::value and s.find('-') != std::string::npos)
        throw po::invalid_option_value(s);
    try {
        v = boost::any(V(boost::lexical_cast<T>(s)));
    }
    catch (const boost::bad_lexical_cast&) {
        throw po::invalid_option_value(s);
    }
}

/// Validator hook for Duration options, which parses unit suffixes.
template <bool positive>
void validate(boost::any &v, const std::vector<std::string> &values, Duration<positive>*, int) {
    namespace po = boost::program_options;
    po::validators::check_first_occurrence(v);
    v = boost::any(Duration<positive>(parse_duration(po::validators::get_single_string(values))));
}

}}
