#pragma once

#include "aftershock_sequence.hpp"
#include "omorifit/core/analysis_config.hpp"
#include <vector>

namespace omorifit {

// One non-empty time bin, times in hours after the mainshock
struct RateBin {
    double start;
    double end;
    double center;      // arithmetic midpoint
    double width;       // end - start
    double rate;        // events per hour
    int count;
};

/**
 * RateSeries - Binned aftershock rate, ready for regression
 *
 * edges holds all n+1 boundaries (strictly increasing, equal ratio);
 * bins holds only those with at least one event.
 */
struct RateSeries {
    std::vector<RateBin> bins;
    std::vector<double> edges;
    double first_time = 0.0;
    double last_time = 0.0;
    int requested_bins = 0;
    int event_count = 0;

    size_t size() const { return bins.size(); }
    bool empty() const { return bins.empty(); }

    // Fewer than three non-empty bins cannot be fit
    bool isFittable() const { return bins.size() >= 3; }
};

/**
 * RateBinner - Logarithmic time binning of an aftershock sequence
 */
class RateBinner {
public:
    explicit RateBinner(const AnalysisConfig& config) : config_(config) {}

    // Bin count taken from the configuration (adaptive if enabled)
    RateSeries bin(const AftershockSequence& sequence) const;

    RateSeries bin(const AftershockSequence& sequence, int n_bins) const;

    // Same on raw elapsed times (hours)
    static RateSeries binTimes(std::vector<double> elapsed_hours, int n_bins);

    // n + 1 boundaries from t_min to t_max with a constant ratio
    static std::vector<double> logEdges(double t_min, double t_max, int n_bins);

    int binCountFor(size_t event_count) const;

private:
    AnalysisConfig config_;
};

} // namespace omorifit
