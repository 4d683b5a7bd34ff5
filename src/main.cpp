/**
 * OmoriFit - Aftershock sequence extraction and Omori-Utsu fitting
 *
 * Main application that:
 * 1. Loads an earthquake catalog from a CSV file or a catalog database
 * 2. Selects mainshocks and associates their aftershocks
 * 3. Bins each sequence's rate in logarithmic time
 * 4. Fits the modified Omori-Utsu law and the classical p = 1 law
 * 5. Reports per-sequence results and aggregate statistics
 */

#include <iostream>
#include <stdexcept>
#include <string>

#include "omorifit/core/config.hpp"
#include "omorifit/core/analysis_config.hpp"
#include "omorifit/core/event_store.hpp"
#include "omorifit/analysis/sequence_analyzer.hpp"
#include "omorifit/analysis/report.hpp"
#include "omorifit/database/catalog_database.hpp"

using namespace omorifit;

void printUsage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>         Configuration file\n";
    std::cout << "  -e, --events <file>         Event catalog (CSV)\n";
    std::cout << "  -d, --database <file>       Catalog database (SQLite); events are read\n";
    std::cout << "                              from it when no catalog file is given and\n";
    std::cout << "                              results are stored in it\n";
    std::cout << "  -o, --output <file>         Per-sequence results (CSV)\n";
    std::cout << "  -j, --threads <n>           Worker threads (0 = all cores)\n";
    std::cout << "  -m, --min-magnitude <M>     Minimum mainshock magnitude\n";
    std::cout << "  -v, --verbose               Print every sequence\n";
    std::cout << "  --write-config <file>       Write the effective configuration and exit\n";
    std::cout << "  -h, --help                  Show this help message\n";
    std::cout << "\n";
    std::cout << "Catalog format:\n";
    std::cout << "  id,time,latitude,longitude,depth_km,magnitude[,mag_type[,place]]\n";
    std::cout << "  time is ISO-8601 UTC (2023-02-06T01:17:34Z) or epoch seconds\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progname << " -e catalog.csv -o sequences.csv\n";
    std::cout << "  " << progname << " -c omorifit.conf -e catalog.csv -d results.db -j 0\n";
    std::cout << std::endl;
}

/**
 * OmoriFit Application
 */
class OmoriFitApp {
public:
    OmoriFitApp() : db_enabled_(false) {}

    bool loadConfig(const std::string& filename) {
        if (!config_.loadFromFile(filename)) {
            std::cerr << "Failed to load config: " << filename << std::endl;
            return false;
        }
        analysis_ = AnalysisConfig::fromConfig(config_);
        return true;
    }

    AnalysisConfig& analysisConfig() { return analysis_; }

    bool openDatabase(const std::string& filename) {
        if (!database_.open(filename)) {
            std::cerr << "Failed to open database: " << filename << std::endl;
            return false;
        }
        if (!database_.createSchema()) {
            std::cerr << "Failed to create database schema" << std::endl;
            return false;
        }
        database_.setAuthor(config_.getString("database.author", "omorifit"));
        db_enabled_ = true;
        std::cout << "Catalog database opened: " << filename << std::endl;
        return true;
    }

    bool loadCatalog(const std::string& filename) {
        if (!events_.loadFromFile(filename)) {
            return false;
        }
        if (db_enabled_ && !database_.storeEvents(events_)) {
            std::cerr << "Failed to store catalog in database" << std::endl;
            return false;
        }
        return true;
    }

    bool loadCatalogFromDatabase() {
        if (!db_enabled_) return false;
        int64_t n = database_.loadEvents(events_);
        if (n < 0) {
            std::cerr << "Failed to load events from database" << std::endl;
            return false;
        }
        std::cout << "Loaded " << n << " events from database" << std::endl;
        return true;
    }

    bool run(const std::string& output_file) {
        analysis_.validateOrThrow();

        if (events_.empty()) {
            std::cerr << "Catalog is empty" << std::endl;
            return false;
        }

        auto mainshocks = events_.mainshocks(analysis_.min_mainshock_magnitude);
        std::cout << "Analyzing " << mainshocks.size() << " mainshocks (M >= "
                  << analysis_.min_mainshock_magnitude << ") in "
                  << events_.size() << " events" << std::endl;

        SequenceAnalyzer analyzer(analysis_);
        AnalysisOutput output = analyzer.analyze(mainshocks, events_);

        printSummary(std::cout, output.summary);

        bool ok = true;
        if (!output_file.empty()) {
            if (writeResultsCsv(output_file, output.results)) {
                std::cout << "Results written to " << output_file << std::endl;
            } else {
                ok = false;
            }
        }

        if (db_enabled_) {
            int64_t runid = database_.storeAnalysis(analysis_, output);
            if (runid < 0) {
                std::cerr << "Failed to store analysis in database" << std::endl;
                ok = false;
            } else {
                std::cout << "Analysis stored as run " << runid << std::endl;
            }
        }

        return ok;
    }

private:
    Config config_;
    AnalysisConfig analysis_;
    EventStore events_;
    CatalogDatabase database_;
    bool db_enabled_;
};

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string events_file;
    std::string database_file;
    std::string output_file;
    std::string write_config_file;
    int threads = -1;
    double min_magnitude = 0.0;
    bool have_min_magnitude = false;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_file = argv[++i];
            } else if ((arg == "-e" || arg == "--events") && i + 1 < argc) {
                events_file = argv[++i];
            } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
                database_file = argv[++i];
            } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
                output_file = argv[++i];
            } else if ((arg == "-j" || arg == "--threads") && i + 1 < argc) {
                threads = std::stoi(argv[++i]);
            } else if ((arg == "-m" || arg == "--min-magnitude") && i + 1 < argc) {
                min_magnitude = std::stod(argv[++i]);
                have_min_magnitude = true;
            } else if (arg == "-v" || arg == "--verbose") {
                verbose = true;
            } else if (arg == "--write-config" && i + 1 < argc) {
                write_config_file = argv[++i];
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

    std::cout << "==========================================\n";
    std::cout << "OmoriFit - Aftershock Decay Analysis\n";
    std::cout << "  Modified Omori-Utsu law fitting\n";
    std::cout << "==========================================\n\n";

    OmoriFitApp app;

    try {
        if (!config_file.empty() && !app.loadConfig(config_file)) {
            return 1;
        }

        // Command line overrides the configuration file
        AnalysisConfig& analysis = app.analysisConfig();
        if (threads >= 0) analysis.threads = threads;
        if (have_min_magnitude) analysis.min_mainshock_magnitude = min_magnitude;
        if (verbose) analysis.verbose = true;

        if (!write_config_file.empty()) {
            analysis.validateOrThrow();
            if (!analysis.toConfig().saveToFile(write_config_file)) {
                std::cerr << "Failed to write config: " << write_config_file << std::endl;
                return 1;
            }
            std::cout << "Configuration written to " << write_config_file << std::endl;
            return 0;
        }

        if (events_file.empty() && database_file.empty()) {
            std::cerr << "No event catalog given (use -e or -d)" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (!database_file.empty() && !app.openDatabase(database_file)) {
            return 1;
        }

        if (!events_file.empty()) {
            if (!app.loadCatalog(events_file)) {
                return 1;
            }
        } else if (!app.loadCatalogFromDatabase()) {
            return 1;
        }

        if (!app.run(output_file)) {
            return 1;
        }
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "OmoriFit analysis complete" << std::endl;
    return 0;
}
