#pragma once

#include "omorifit/core/analysis_config.hpp"
#include "omorifit/core/event_store.hpp"
#include "omorifit/fitting/omori_fitter.hpp"
#include "omorifit/sequence/rate_binner.hpp"
#include "omorifit/sequence/sequence_builder.hpp"
#include <optional>
#include <string>
#include <vector>

namespace omorifit {

/**
 * SequenceResult - Outcome for one candidate mainshock
 *
 * Every candidate gets a result, including those without enough
 * aftershocks; those have insufficient set and no fits.
 */
struct SequenceResult {
    EventPtr mainshock;
    size_t aftershock_count = 0;
    double duration_hours = 0.0;
    bool insufficient = true;

    RateSeries series;
    OmoriFit modified;                  // free p
    std::optional<OmoriFit> fixed;      // p = fixed_p

    bool success() const { return !insufficient && modified.success; }

    // "insufficient_data" or the status of the modified fit
    std::string status() const;
};

/**
 * SequenceSummary - Aggregate statistics over successful sequences
 *
 * Standard deviations are population values. Statistics that have no
 * data are NaN.
 */
struct SequenceSummary {
    size_t total_candidates = 0;
    size_t insufficient_count = 0;
    size_t fitted_count = 0;        // sequences that reached the fitter
    size_t success_count = 0;

    double p_mean = OmoriFit::kUnfit;
    double p_std = OmoriFit::kUnfit;
    double p_min = OmoriFit::kUnfit;
    double p_max = OmoriFit::kUnfit;

    double r2_mean = OmoriFit::kUnfit;
    double r2_std = OmoriFit::kUnfit;
    double r2_min = OmoriFit::kUnfit;
    double r2_max = OmoriFit::kUnfit;

    // Classical model over the successful sequences where it was fit,
    // and the modified R² over that same subset
    size_t fixed_count = 0;
    double r2_fixed_mean = OmoriFit::kUnfit;
    double r2_modified_paired_mean = OmoriFit::kUnfit;
    double fixed_p = 1.0;

    // Least-squares p = intercept + slope * M over successful sequences
    bool has_magnitude_trend = false;
    double p_magnitude_slope = OmoriFit::kUnfit;
    double p_magnitude_intercept = OmoriFit::kUnfit;
    double p_magnitude_correlation = OmoriFit::kUnfit;
};

struct AnalysisOutput {
    std::vector<SequenceResult> results;    // mainshock time order
    SequenceSummary summary;
};

/**
 * SequenceAnalyzer - Builds, bins and fits every candidate sequence
 *
 * Sequences are independent, so they can be processed on several worker
 * threads; results are identical to a sequential run.
 */
class SequenceAnalyzer {
public:
    explicit SequenceAnalyzer(const AnalysisConfig& config);

    // Throws ConfigurationError if the configuration is invalid
    AnalysisOutput analyze(const std::vector<EventPtr>& mainshocks,
                           const std::vector<EventPtr>& all_events) const;

    AnalysisOutput analyze(const std::vector<EventPtr>& mainshocks,
                           const EventStore& store) const;

    // Mainshocks selected from the store with the configured magnitude
    AnalysisOutput analyze(const EventStore& store) const;

    // Single mainshock, candidates already narrowed down
    SequenceResult analyzeOne(const EventPtr& mainshock,
                              const std::vector<EventPtr>& candidates) const;

    static SequenceSummary summarize(const std::vector<SequenceResult>& results,
                                     double fixed_p = 1.0);

    const AnalysisConfig& config() const { return config_; }

private:
    AnalysisConfig config_;
    SequenceBuilder builder_;
    RateBinner binner_;
    OmoriFitter fitter_;

    template <typename CandidateFn>
    AnalysisOutput run(std::vector<EventPtr> mainshocks, CandidateFn candidates) const;

    int workerCount(size_t jobs) const;
};

} // namespace omorifit
