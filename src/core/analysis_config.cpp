#include "omorifit/core/analysis_config.hpp"
#include <cmath>
#include <sstream>

namespace omorifit {

namespace {

void checkBounds(const char* name, const ParamBounds& b, bool strictly_positive,
                 std::vector<std::string>& errors) {
    std::string n(name);
    if (!std::isfinite(b.lower) || !std::isfinite(b.upper)) {
        errors.push_back(n + " bounds must be finite");
        return;
    }
    if (b.lower > b.upper) {
        std::ostringstream oss;
        oss << n << " lower bound " << b.lower << " exceeds upper bound " << b.upper;
        errors.push_back(oss.str());
    }
    if (strictly_positive && b.lower <= 0.0) {
        errors.push_back(n + " lower bound must be positive");
    }
}

} // namespace

std::vector<std::string> AnalysisConfig::validate() const {
    std::vector<std::string> errors;

    if (!std::isfinite(min_mainshock_magnitude)) {
        errors.push_back("mainshock magnitude threshold must be finite");
    }
    if (!std::isfinite(detection_threshold)) {
        errors.push_back("detection threshold must be finite");
    }
    if (!(spatial_radius_km > 0.0) || !std::isfinite(spatial_radius_km)) {
        errors.push_back("spatial radius must be positive");
    }
    if (!(temporal_window_days > 0.0) || !std::isfinite(temporal_window_days)) {
        errors.push_back("temporal window must be positive");
    }
    if (!(min_delay_minutes >= 0.0)) {
        errors.push_back("minimum delay must not be negative");
    } else if (std::isfinite(temporal_window_days) &&
               minDelayHours() >= maxDelayHours()) {
        errors.push_back("minimum delay must be shorter than the temporal window");
    }
    if (min_aftershocks <= 0) {
        errors.push_back("minimum aftershock count must be positive");
    }
    if (n_bins <= 0) {
        errors.push_back("bin count must be positive");
    }
    if (!(fit_success_threshold <= 1.0)) {
        errors.push_back("R² success threshold must not exceed 1");
    }
    if (max_iterations <= 0) {
        errors.push_back("iteration limit must be positive");
    }
    if (!(tolerance > 0.0)) {
        errors.push_back("tolerance must be positive");
    }

    checkBounds("K", bounds.K, true, errors);
    checkBounds("c", bounds.c, true, errors);
    checkBounds("p", bounds.p, false, errors);

    if (!bounds.p.contains(fixed_p)) {
        errors.push_back("fixed p lies outside the p bounds");
    }
    if (threads < 0) {
        errors.push_back("thread count must not be negative");
    }

    return errors;
}

void AnalysisConfig::validateOrThrow() const {
    auto errors = validate();
    if (errors.empty()) return;

    std::string msg = "Invalid analysis configuration: ";
    for (size_t i = 0; i < errors.size(); i++) {
        if (i > 0) msg += "; ";
        msg += errors[i];
    }
    throw ConfigurationError(msg);
}

AnalysisConfig AnalysisConfig::fromConfig(const Config& config) {
    AnalysisConfig ac;

    ac.min_mainshock_magnitude = config.getDouble("mainshock.min_magnitude",
                                                  ac.min_mainshock_magnitude);

    ac.detection_threshold = config.getDouble("aftershock.detection_threshold",
                                              ac.detection_threshold);
    ac.spatial_radius_km = config.getDouble("aftershock.radius_km", ac.spatial_radius_km);
    ac.min_delay_minutes = config.getDouble("aftershock.min_delay_minutes",
                                            ac.min_delay_minutes);
    ac.temporal_window_days = config.getDouble("aftershock.window_days",
                                               ac.temporal_window_days);
    ac.min_aftershocks = config.getInt("aftershock.min_count", ac.min_aftershocks);

    ac.n_bins = config.getInt("binning.n_bins", ac.n_bins);
    ac.adaptive_bins = config.getBool("binning.adaptive", ac.adaptive_bins);

    ac.fit_success_threshold = config.getDouble("fit.success_r2", ac.fit_success_threshold);
    ac.fixed_p = config.getDouble("fit.fixed_p", ac.fixed_p);
    ac.max_iterations = config.getInt("fit.max_iterations", ac.max_iterations);
    ac.tolerance = config.getDouble("fit.tolerance", ac.tolerance);
    ac.bounds.K.lower = config.getDouble("fit.K_min", ac.bounds.K.lower);
    ac.bounds.K.upper = config.getDouble("fit.K_max", ac.bounds.K.upper);
    ac.bounds.c.lower = config.getDouble("fit.c_min", ac.bounds.c.lower);
    ac.bounds.c.upper = config.getDouble("fit.c_max", ac.bounds.c.upper);
    ac.bounds.p.lower = config.getDouble("fit.p_min", ac.bounds.p.lower);
    ac.bounds.p.upper = config.getDouble("fit.p_max", ac.bounds.p.upper);

    ac.threads = config.getInt("analysis.threads", ac.threads);
    ac.verbose = config.getBool("analysis.verbose", ac.verbose);

    return ac;
}

Config AnalysisConfig::toConfig() const {
    Config config;

    config.set("mainshock.min_magnitude", min_mainshock_magnitude);
    config.set("aftershock.detection_threshold", detection_threshold);
    config.set("aftershock.radius_km", spatial_radius_km);
    config.set("aftershock.min_delay_minutes", min_delay_minutes);
    config.set("aftershock.window_days", temporal_window_days);
    config.set("aftershock.min_count", min_aftershocks);
    config.set("binning.n_bins", n_bins);
    config.set("binning.adaptive", adaptive_bins);
    config.set("fit.success_r2", fit_success_threshold);
    config.set("fit.fixed_p", fixed_p);
    config.set("fit.max_iterations", max_iterations);
    config.set("fit.tolerance", tolerance);
    config.set("fit.K_min", bounds.K.lower);
    config.set("fit.K_max", bounds.K.upper);
    config.set("fit.c_min", bounds.c.lower);
    config.set("fit.c_max", bounds.c.upper);
    config.set("fit.p_min", bounds.p.lower);
    config.set("fit.p_max", bounds.p.upper);
    config.set("analysis.threads", threads);
    config.set("analysis.verbose", verbose);

    return config;
}

} // namespace omorifit
