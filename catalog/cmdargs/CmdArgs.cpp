#include "catalog/cmdargs/CmdArgs.hpp"
#include "catalog/config.hpp"
#include <boost/program_options/errors.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

namespace catalog { namespace cmdargs {

namespace po = boost::program_options;

void CmdArgs::addOptions() {
    po::options_description about("About");
    about.add_options()
        ("help,h", "Shows this help and exits.")
        ("version", "Shows the version and exits.")
        ;
    options_.add(about);
}

void CmdArgs::postParse(po::variables_map&) {}

void CmdArgs::parse(int argc, char const* const* argv) {
    if (options_.options().empty()) addOptions();
    program_ = argc > 0 ? argv[0] : "";

    // Notifiers copy accepted values into the bound variables; the map is kept for the hooks
    po::variables_map vars;
    po::store(po::parse_command_line(argc, argv, options_), vars);

    if (vars.count("help")) {
        std::cout << version() << "\n\n" << help();
        std::exit(0);
    }
    if (vars.count("version")) {
        std::cout << version() << "\n";
        std::exit(0);
    }

    po::notify(vars);
    postParse(vars);
}

std::string CmdArgs::version() const {
    std::ostringstream out;
    out << "Catalog market simulator v" << VERSION[0] << "." << VERSION[1] << "." << VERSION[2];
    return out.str();
}

std::string CmdArgs::usage() const {
    return "Usage: " + (program_.empty() ? std::string("catalog-sim") : program_) + " [OPTIONS]";
}

std::string CmdArgs::help() const {
    std::ostringstream out;
    out << usage() << "\n";
    if (not options_.options().empty())
        out << "Options:\n" << options_ << "\n";
    return out.str();
}

}}
