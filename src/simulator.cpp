/**
 * OmoriFit Simulator
 *
 * Generates a synthetic earthquake catalog for testing the analysis:
 * well separated mainshocks, each followed by an Omori-Utsu aftershock
 * sequence, plus optional background seismicity.
 */

#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>

#include "omorifit/core/types.hpp"
#include "omorifit/core/event_store.hpp"
#include "omorifit/core/synthetic.hpp"

using namespace omorifit;

void printUsage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output <file>       Output catalog (default: synthetic_catalog.csv)\n";
    std::cout << "  -n, --mainshocks <n>      Number of mainshocks (default: 9)\n";
    std::cout << "  -a, --aftershocks <n>     Aftershocks per mainshock (default: 200)\n";
    std::cout << "  -p, --p-value <p>         Mean decay exponent (default: 1.1)\n";
    std::cout << "  --p-spread <dp>           Exponents spread over p +- dp (default: 0.15)\n";
    std::cout << "  --c-value <c>             Omori c in hours (default: 0.05)\n";
    std::cout << "  --jitter <f>              Relative time perturbation (default: 0.05)\n";
    std::cout << "  -b, --background <n>      Background events per mainshock (default: 20)\n";
    std::cout << "  --seed <n>                Random seed for background events (default: 42)\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << std::endl;
}

int main(int argc, char* argv[]) {
    std::string output_file = "synthetic_catalog.csv";
    int n_mainshocks = 9;
    int n_aftershocks = 200;
    double p_mean = 1.1;
    double p_spread = 0.15;
    double c_value = 0.05;
    double jitter = 0.05;
    int n_background = 20;
    unsigned int seed = 42;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
                output_file = argv[++i];
            } else if ((arg == "-n" || arg == "--mainshocks") && i + 1 < argc) {
                n_mainshocks = std::stoi(argv[++i]);
            } else if ((arg == "-a" || arg == "--aftershocks") && i + 1 < argc) {
                n_aftershocks = std::stoi(argv[++i]);
            } else if ((arg == "-p" || arg == "--p-value") && i + 1 < argc) {
                p_mean = std::stod(argv[++i]);
            } else if (arg == "--p-spread" && i + 1 < argc) {
                p_spread = std::stod(argv[++i]);
            } else if (arg == "--c-value" && i + 1 < argc) {
                c_value = std::stod(argv[++i]);
            } else if (arg == "--jitter" && i + 1 < argc) {
                jitter = std::stod(argv[++i]);
            } else if ((arg == "-b" || arg == "--background") && i + 1 < argc) {
                n_background = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<unsigned int>(std::stoul(argv[++i]));
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::invalid_argument&) {
        std::cerr << "Invalid numeric option value" << std::endl;
        return 1;
    } catch (const std::out_of_range&) {
        std::cerr << "Numeric option value out of range" << std::endl;
        return 1;
    }

    if (n_mainshocks <= 0 || n_aftershocks < 0 || n_background < 0 || !(c_value > 0.0)) {
        std::cerr << "Counts must not be negative and c must be positive" << std::endl;
        return 1;
    }

    SyntheticSequenceGenerator generator(seed);
    EventStore catalog;

    // 2020-01-01T00:00:00Z
    TimePoint start = fromEpochSeconds(1577836800.0);

    std::cout << "=== Generating synthetic catalog ===" << std::endl;

    for (int k = 0; k < n_mainshocks; k++) {
        SyntheticSequence seq;
        seq.id_prefix = "ms" + std::to_string(k + 1);
        // 60 days and 5 degrees apart, so sequences never overlap
        seq.origin_time = addHours(start, k * 60.0 * 24.0);
        seq.epicenter = GeoPoint(35.0 + 0.5 * (k % 3), -120.0 + 5.0 * k, 10.0);
        seq.magnitude = 6.2 + 0.2 * (k % 8);
        seq.place = "Synthetic region " + std::to_string(k + 1);
        seq.count = n_aftershocks;
        seq.c = c_value;
        seq.p = n_mainshocks > 1
            ? p_mean - p_spread + 2.0 * p_spread * k / (n_mainshocks - 1)
            : p_mean;
        seq.jitter = jitter;
        seq.phase = k;

        for (const auto& ev : generator.generate(seq)) {
            catalog.add(ev);
        }

        // Background far enough from the epicentre to stay unassociated
        for (const auto& ev : generator.background(seq.id_prefix + "bg",
                 seq.epicenter.destination(90.0, 250.0), 100.0,
                 seq.origin_time, 60.0 * 24.0, n_background, 2.0, 4.5)) {
            catalog.add(ev);
        }

        std::cout << "Mainshock " << seq.id_prefix << ": M" << std::fixed
                  << std::setprecision(1) << seq.magnitude
                  << ", p=" << std::setprecision(3) << seq.p
                  << ", " << seq.count << " aftershocks" << std::endl;
    }

    if (!catalog.saveToFile(output_file)) {
        std::cerr << "Failed to write catalog: " << output_file << std::endl;
        return 1;
    }

    std::cout << "Wrote " << catalog.size() << " events to " << output_file << std::endl;
    return 0;
}
