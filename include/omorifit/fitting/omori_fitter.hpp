#pragma once

#include "omorifit/core/analysis_config.hpp"
#include "omorifit/sequence/rate_binner.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <optional>
#include <string>

namespace omorifit {

// Modified Omori-Utsu rate n(t) = K / (c + t)^p
inline double omoriRate(double t, double K, double c, double p) {
    return K / std::pow(c + t, p);
}

inline double omoriLog10Rate(double t, double K, double c, double p) {
    return std::log10(K) - p * std::log10(c + t);
}

enum class FitStatus {
    Success,            // converged and R² above the threshold
    PoorFit,            // converged, R² at or below the threshold
    InsufficientData,   // fewer than 3 rate points
    NumericalFailure,   // singular system, NaN, invalid bounds
    NotConverged        // iteration limit reached
};

std::string fitStatusToString(FitStatus status);

/**
 * OmoriFit - Result of one Omori-Utsu regression
 *
 * Failed fits (anything but Success and PoorFit) carry NaN parameters
 * and metrics.
 */
struct OmoriFit {
    static constexpr double kUnfit = std::numeric_limits<double>::quiet_NaN();

    double K = kUnfit;
    double c = kUnfit;
    double p = kUnfit;
    double p_stderr = kUnfit;   // free-p fits with more than 3 points
    OmoriBounds bounds;

    double r_squared = kUnfit;  // log10-rate space
    double rmse = kUnfit;       // rate space, events per hour

    bool success = false;
    bool p_fixed = false;
    FitStatus status = FitStatus::InsufficientData;
    std::string message;
    int iterations = 0;
    int point_count = 0;

    // Parameters were estimated (possibly with a poor R²)
    bool isFit() const {
        return status == FitStatus::Success || status == FitStatus::PoorFit;
    }

    double rate(double t) const { return omoriRate(t, K, c, p); }
};

/**
 * OmoriFitter - Bounded least squares fit of the Omori-Utsu law
 *
 * Minimizes sum (log10 n_obs - log10 n_model)^2 over
 * theta = (log10 K, log10 c [, p]) with projected Levenberg-Marquardt
 * steps; the normal equations are solved with Eigen's LDLT.
 *
 * A free-p fit is started from the data-derived seed and from the
 * fixed-p optimum, keeping the lower residual. Results are fully
 * deterministic.
 */
class OmoriFitter {
public:
    explicit OmoriFitter(const AnalysisConfig& config) : config_(config) {}

    // Fit K, c and p, or only K and c when fix_p is given
    OmoriFit fit(const RateSeries& series,
                 std::optional<double> fix_p = std::nullopt) const;

    // Convenience for the classical model with the configured exponent
    OmoriFit fitFixed(const RateSeries& series) const {
        return fit(series, config_.fixed_p);
    }

    const AnalysisConfig& config() const { return config_; }

private:
    AnalysisConfig config_;

    struct Problem {
        Eigen::VectorXd t;          // bin centres, hours
        Eigen::VectorXd log_rate;   // log10 observed rate
        std::optional<double> fix_p;
        Eigen::VectorXd lower;      // bounds on theta
        Eigen::VectorXd upper;
    };

    struct Solution {
        Eigen::VectorXd theta;
        double ssr = std::numeric_limits<double>::infinity();
        int iterations = 0;
        bool converged = false;
        bool valid = false;
        std::string error;
    };

    Solution minimize(const Problem& problem, Eigen::VectorXd theta) const;

    Eigen::VectorXd initialGuess(const RateSeries& series, const Problem& problem,
                                 double p0) const;

    static Eigen::VectorXd residuals(const Problem& problem, const Eigen::VectorXd& theta);
    static Eigen::MatrixXd jacobian(const Problem& problem, const Eigen::VectorXd& theta);
    static Eigen::VectorXd project(const Problem& problem, Eigen::VectorXd theta);
};

} // namespace omorifit
