#pragma once

#include "config.hpp"
#include "types.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace omorifit {

// Closed parameter interval used as an optimizer bound
struct ParamBounds {
    double lower;
    double upper;

    ParamBounds() : lower(0), upper(0) {}
    ParamBounds(double lo, double hi) : lower(lo), upper(hi) {}

    bool contains(double v) const { return v >= lower && v <= upper; }
    double clamp(double v) const { return std::min(std::max(v, lower), upper); }
};

struct OmoriBounds {
    ParamBounds K{0.01, 1.0e6};
    ParamBounds c{0.001, 10.0};
    ParamBounds p{0.1, 3.0};
};

/**
 * AnalysisConfig - Every tunable of the pipeline in one value
 *
 * Each component keeps its own copy; nothing reads thresholds from
 * anywhere else.
 */
struct AnalysisConfig {
    // Mainshock selection
    double min_mainshock_magnitude = 6.0;

    // Aftershock association
    double detection_threshold = 2.0;
    double spatial_radius_km = 100.0;
    double min_delay_minutes = 1.0;
    double temporal_window_days = 30.0;
    int min_aftershocks = 10;

    // Binning
    int n_bins = 20;
    bool adaptive_bins = false;

    // Fitting
    double fit_success_threshold = 0.5;    // R² must exceed this
    double fixed_p = 1.0;                  // exponent of the classical model
    int max_iterations = 500;
    double tolerance = 1e-10;              // relative SSR change
    OmoriBounds bounds;

    // Execution
    int threads = 1;                       // 0 = hardware concurrency
    bool verbose = false;

    double minDelayHours() const { return min_delay_minutes / constants::MINUTES_PER_HOUR; }
    double maxDelayHours() const { return temporal_window_days * constants::HOURS_PER_DAY; }

    // All problems found, empty if the configuration is usable
    std::vector<std::string> validate() const;

    // Throws ConfigurationError listing every problem
    void validateOrThrow() const;

    // Defaults overridden by whatever keys the file sets
    static AnalysisConfig fromConfig(const Config& config);

    // Inverse of fromConfig
    Config toConfig() const;
};

} // namespace omorifit
