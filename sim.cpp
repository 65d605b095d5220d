#include "catalog/Market.hpp"
#include "catalog/CatalogError.hpp"
#include "catalog/cmdargs/Simulator.hpp"
#include <eris/random/rng.hpp>
#include <cstdio>
#include <cstdlib>
#include <cmath>
#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/system/error_code.hpp>
#include <boost/random/uniform_int_distribution.hpp>
extern "C" {
#include <unistd.h>
}
#ifdef __linux__
extern "C" {
#include <sys/prctl.h>
}
#endif

using namespace catalog;

namespace fs = boost::filesystem;

std::string random_filename(const std::string &basename) {
    std::random_device rd;
    boost::random::uniform_int_distribution<unsigned char> rand_index(0, 35);
    constexpr char map[37] = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::ostringstream buf;
    buf << basename << ".partial.";
    for (int i = 0; i < 7; i++) {
        buf << map[rand_index(rd)];
    }
    return buf.str();
}

// Formats an elapsed wall-clock time on output
struct elapsed {
    unsigned minutes, seconds, milliseconds;
    explicit elapsed(double s) :
        minutes{unsigned(s / 60)},
        seconds{unsigned(s - minutes*60)},
        milliseconds{unsigned(std::lround(1000*(s - minutes*60 - seconds)))}
    {}
    friend std::ostream& operator<<(std::ostream &out, const elapsed &d) {
        auto save = out.flags();
        if (d.minutes > 0)
            out << d.minutes << 'm' << std::setfill('0') << std::setw(2);
        out << d.seconds << '.' << std::setfill('0') << std::setw(3) << d.milliseconds << "s" << std::setfill(' ');
        out.flags(save);
        return out;
    }
};

// Writes the per-author payouts as CSV
void write_payouts(std::ostream &out, const Market &market) {
    out << "author,published,withdrawn,premium,closing,total\n";
    const auto &totals = market.authorTotals();
    for (const auto &author : market.authors()) {
        auto found = totals.find(author);
        Market::AuthorTotals t = found == totals.end() ? Market::AuthorTotals() : found->second;
        out << author << "," << t.published << "," << t.withdrawn << "," << t.premium << "," << t.closing << "," << t.total() << "\n";
    }
}

int main(int argc, char *argv[]) {
    MarketSettings settings;
    cmdargs::Simulator args(settings);
    try {
        args.parse(argc, argv);
    }
    catch (const boost::program_options::error &e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n\n" << args.help();
        exit(2);
    }

    const std::string out = args.output;
    fs::path outpath(out);
    if (not out.empty()) {
        // Check now rather than after the run: the file might still get created in the meantime,
        // but the typical mistake gets caught before the simulation is wasted.
        if (not args.overwrite and fs::exists(outpath)) {
            std::cerr << "Error: `" << out << "' already exists; specify a different file or add `--overwrite' option to overwrite\n";
            exit(1);
        }
        std::string dirname = outpath.parent_path().string();
        if (dirname.empty()) dirname = ".";
        if (outpath.filename().empty() or not fs::is_directory(dirname)) {
            std::cerr << "Error: directory `" << dirname << "' does not exist or is not a directory\n";
            exit(1);
        }
    }

    Market market(settings);
    try {
        market.setup();
    }
    catch (const std::domain_error &e) {
        std::cerr << "Invalid settings: " << e.what() << "\n";
        exit(1);
    }

    const uint32_t days = settings.days;
    bool tty = isatty(fileno(stdout));
    auto started = std::chrono::high_resolution_clock::now();
    std::cout << "Running market for " << days << " days (seed " << eris::random::seed() << ").\n";

    while (market.day() < days) {
#ifdef __linux__
        // Shows up in ps/top as something like "catsim [43/120]" (the kernel limits names to 15 characters)
        {
            std::string progress = "[" + std::to_string(market.day()) + "/" + std::to_string(days) + "]";
            std::string name = progress.size() <= 8 ? "catsim " + progress : "catsim" + progress;
            prctl(PR_SET_NAME, name.c_str());
        }
#endif
        market.runDay();

        if (not args.quiet) {
            const auto &stats = market.statistics();
            if (tty) std::cout << "\r";
            std::cout << "Running market [day=" << market.day() << "; C=" << stats.published
                << "; PPV=" << stats.pay_per_view << "; S=" << stats.subscriptions << "; PV=" << stats.premium_views
                << "; balance=" << market.catalog().balance() << "]";
            if (tty) std::cout << "   " << std::flush;
            else std::cout << std::endl;
        }
    }
    if (tty and not args.quiet) std::cout << std::endl;

    auto closing = market.close();
    auto finished = std::chrono::high_resolution_clock::now();
    std::cout << "Market closed after " << elapsed(std::chrono::duration<double>(finished - started).count())
        << "; " << closing.size() << " payments made at closing.\n\n";

    const auto &stats = market.statistics();
    amount_t withdrawn = 0, premium = 0, closed = 0;
    for (const auto &t : market.authorTotals()) {
        withdrawn += t.second.withdrawn;
        premium += t.second.premium;
        closed += t.second.closing;
    }
    std::cout << "Published:           " << stats.published << "\n"
              << "Pay-per-view sales:  " << stats.pay_per_view << "\n"
              << "Subscriptions:       " << stats.subscriptions << " (" << stats.gifts << " gifts)\n"
              << "Premium views:       " << stats.premium_views << "\n"
              << "Items read:          " << stats.consumed << "\n"
              << "Withdrawals:         " << stats.withdrawals << " (" << withdrawn << " paid)\n"
              << "Distributions:       " << stats.distributions << " (" << premium << " paid)\n"
              << "Paid at closing:     " << closed << " to authors, " << stats.residual << " to the owner\n";
    if (not stats.rejected.empty()) {
        std::cout << "Rejected calls:\n";
        for (const auto &r : stats.rejected)
            std::cout << "    " << std::setw(22) << std::left << CatalogError::reasonName(r.first) << std::right << r.second << "\n";
    }
    std::cout << "Events:\n";
    for (const auto &e : stats.events)
        std::cout << "    " << std::setw(22) << std::left << e.first << std::right << e.second << "\n";

    if (not out.empty()) {
        // Write to a temporary file first, then move it into place
        std::string partial = random_filename(out);
        try {
            std::ofstream csv(partial);
            if (not csv) throw std::runtime_error("unable to open `" + partial + "' for writing");
            write_payouts(csv, market);
            csv.close();
            if (not csv) throw std::runtime_error("error writing `" + partial + "'");
            fs::rename(partial, outpath);
        }
        catch (const std::exception &e) {
            std::cerr << "Unable to write to file: " << e.what() << "\n";
            boost::system::error_code ignored;
            fs::remove(partial, ignored);
            exit(1);
        }
        std::cout << "\nPayouts saved to " << out << ".\n";
    }
}
