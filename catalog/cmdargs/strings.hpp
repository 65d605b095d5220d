#pragma once
#include "catalog/types.hpp"
#include <string>
#include <type_traits>

namespace catalog { namespace cmdargs {

/** Returns an argument name for T for use in --help output: ℝ for floating point types, ℕ for
 * unsigned integers, ℤ for signed integers, and "arg" for anything else.
 */
template <typename T>
std::string type_string() {
    return std::is_floating_point<T>::value ? u8"ℝ" :
        std::is_integral<T>::value ? std::is_unsigned<T>::value ? u8"ℕ" : u8"ℤ" :
        u8"arg";
}

/** Returns a value converted to a string via std::to_string. */
template <typename T, typename = typename std::enable_if<std::is_arithmetic<T>::value>::type>
std::string output_string(T v) {
    return std::to_string(v);
}

/** Specialization of output_string for doubles that trims trailing 0's and a trailing decimal
 * point, so that 0.25 comes out as "0.25" rather than "0.250000".
 */
template <> std::string output_string(double v); // Specialization in .cpp

/** Renders a number of seconds in the largest units that represent it exactly, as accepted by
 * parse_duration(): 2592000 becomes "30d", 5400 becomes "90m", and 0 becomes "0s".
 */
std::string duration_string(timestamp_t seconds);

}}
