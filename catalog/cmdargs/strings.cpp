#include "catalog/cmdargs/strings.hpp"
#include "catalog/cmdargs/Validation.hpp"
#include <boost/program_options/errors.hpp>
#include <limits>
#include <regex>
#include <stdexcept>
#include <string>

namespace catalog { namespace cmdargs {

template <>
std::string output_string(double v) {
    return std::regex_replace(
            std::regex_replace(std::to_string(v),
                std::regex("(\\.\\d*?)0+$"),
                "$1"),
            std::regex("\\.$"),
            "");
}

std::string duration_string(timestamp_t seconds) {
    if (seconds == 0) return "0s";
    if (seconds % DAY == 0) return std::to_string(seconds / DAY) + "d";
    if (seconds % 3600 == 0) return std::to_string(seconds / 3600) + "h";
    if (seconds % 60 == 0) return std::to_string(seconds / 60) + "m";
    return std::to_string(seconds) + "s";
}

timestamp_t parse_duration(const std::string &value) {
    static const std::regex duration_re("\\s*(\\d+)\\s*([smhd]?)\\s*");
    std::smatch m;
    if (not std::regex_match(value, m, duration_re))
        throw boost::program_options::invalid_option_value(value);

    timestamp_t unit = 1;
    if (m[2] == "m") unit = 60;
    else if (m[2] == "h") unit = 3600;
    else if (m[2] == "d") unit = DAY;

    const std::string digits = m[1];
    timestamp_t count;
    try { count = std::stoull(digits); }
    catch (const std::out_of_range&) { throw boost::program_options::invalid_option_value(value); }
    if (count > std::numeric_limits<timestamp_t>::max() / unit)
        throw boost::program_options::invalid_option_value(value);

    return count * unit;
}

}}
