#include "omorifit/fitting/omori_fitter.hpp"
#include <algorithm>
#include <sstream>

namespace omorifit {

namespace {

constexpr double kInitialLambda = 1e-3;
constexpr double kMinLambda = 1e-12;
constexpr double kMaxLambda = 1e10;
constexpr double kMinStep = 1e-12;
constexpr double kPerfectSSR = 1e-24;

OmoriFit failure(FitStatus status, const std::string& message, const RateSeries& series,
                 const OmoriBounds& bounds, std::optional<double> fix_p) {
    OmoriFit fit;
    fit.status = status;
    fit.message = message;
    fit.bounds = bounds;
    fit.point_count = static_cast<int>(series.size());
    fit.p_fixed = fix_p.has_value();
    return fit;
}

} // namespace

std::string fitStatusToString(FitStatus status) {
    switch (status) {
        case FitStatus::Success: return "success";
        case FitStatus::PoorFit: return "poor_fit";
        case FitStatus::InsufficientData: return "insufficient_data";
        case FitStatus::NumericalFailure: return "numerical_failure";
        case FitStatus::NotConverged: return "not_converged";
        default: return "unknown";
    }
}

OmoriFit OmoriFitter::fit(const RateSeries& series, std::optional<double> fix_p) const {
    const OmoriBounds& bounds = config_.bounds;

    if (!series.isFittable()) {
        std::ostringstream oss;
        oss << series.size() << " non-empty bins, at least 3 required";
        return failure(FitStatus::InsufficientData, oss.str(), series, bounds, fix_p);
    }
    if (!(bounds.K.lower > 0.0) || !(bounds.c.lower > 0.0) ||
        bounds.K.lower > bounds.K.upper || bounds.c.lower > bounds.c.upper ||
        bounds.p.lower > bounds.p.upper) {
        return failure(FitStatus::NumericalFailure, "invalid parameter bounds",
                       series, bounds, fix_p);
    }
    if (fix_p && (!std::isfinite(*fix_p) || !bounds.p.contains(*fix_p))) {
        return failure(FitStatus::NumericalFailure, "fixed p outside its bounds",
                       series, bounds, fix_p);
    }

    // Regression data in log10 space
    int n = static_cast<int>(series.size());
    Problem problem;
    problem.fix_p = fix_p;
    problem.t.resize(n);
    problem.log_rate.resize(n);
    for (int i = 0; i < n; i++) {
        const RateBin& b = series.bins[i];
        if (!(b.rate > 0.0) || !std::isfinite(b.rate) || !(b.center >= 0.0)) {
            return failure(FitStatus::NumericalFailure, "non-positive rate in series",
                           series, bounds, fix_p);
        }
        problem.t(i) = b.center;
        problem.log_rate(i) = std::log10(b.rate);
    }

    int m = fix_p ? 2 : 3;
    problem.lower.resize(m);
    problem.upper.resize(m);
    problem.lower(0) = std::log10(bounds.K.lower);
    problem.upper(0) = std::log10(bounds.K.upper);
    problem.lower(1) = std::log10(bounds.c.lower);
    problem.upper(1) = std::log10(bounds.c.upper);
    if (!fix_p) {
        problem.lower(2) = bounds.p.lower;
        problem.upper(2) = bounds.p.upper;
    }

    Solution best;
    if (fix_p) {
        best = minimize(problem, initialGuess(series, problem, *fix_p));
    } else {
        best = minimize(problem, initialGuess(series, problem, 1.0));

        // Second start from the classical-model optimum, so the free
        // exponent never ends up worse than the fixed one
        Problem fixed = problem;
        fixed.fix_p = config_.fixed_p;
        fixed.lower = problem.lower.head(2);
        fixed.upper = problem.upper.head(2);
        Solution classical = minimize(fixed, initialGuess(series, fixed, config_.fixed_p));

        if (classical.valid) {
            Eigen::VectorXd start(3);
            start << classical.theta(0), classical.theta(1), config_.fixed_p;
            Solution refined = minimize(problem, start);
            refined.iterations += classical.iterations;
            if (refined.valid && (!best.valid || refined.ssr < best.ssr)) {
                best = refined;
            }
        }
    }

    if (!best.valid) {
        return failure(FitStatus::NumericalFailure, best.error, series, bounds, fix_p);
    }
    if (!best.converged) {
        std::ostringstream oss;
        oss << "no convergence after " << best.iterations << " iterations";
        OmoriFit result = failure(FitStatus::NotConverged, oss.str(), series, bounds, fix_p);
        result.iterations = best.iterations;
        return result;
    }

    OmoriFit result;
    result.bounds = bounds;
    result.p_fixed = fix_p.has_value();
    result.point_count = n;
    result.iterations = best.iterations;
    result.K = std::pow(10.0, best.theta(0));
    result.c = std::pow(10.0, best.theta(1));
    result.p = fix_p ? *fix_p : best.theta(2);

    // R² in log space
    double mean = problem.log_rate.mean();
    double sst = (problem.log_rate.array() - mean).square().sum();
    result.r_squared = sst > 0.0 ? 1.0 - best.ssr / sst : 0.0;

    // RMSE in rate space
    double sum_sq = 0.0;
    for (int i = 0; i < n; i++) {
        double diff = series.bins[i].rate - result.rate(problem.t(i));
        sum_sq += diff * diff;
    }
    result.rmse = std::sqrt(sum_sq / n);

    // Standard error of p from the covariance s^2 (J'J)^-1
    if (!fix_p && n > 3) {
        Eigen::MatrixXd J = jacobian(problem, best.theta);
        Eigen::MatrixXd JtJ = J.transpose() * J;
        Eigen::LDLT<Eigen::MatrixXd> ldlt(JtJ);
        if (ldlt.info() == Eigen::Success) {
            Eigen::MatrixXd inv = ldlt.solve(Eigen::MatrixXd::Identity(3, 3));
            double var = best.ssr / (n - 3) * inv(2, 2);
            if (std::isfinite(var) && var >= 0.0) {
                result.p_stderr = std::sqrt(var);
            }
        }
    }

    if (!std::isfinite(result.K) || !std::isfinite(result.c) || !std::isfinite(result.p) ||
        !std::isfinite(result.r_squared) || !std::isfinite(result.rmse)) {
        return failure(FitStatus::NumericalFailure, "non-finite fit result",
                       series, bounds, fix_p);
    }

    result.success = result.r_squared > config_.fit_success_threshold;
    result.status = result.success ? FitStatus::Success : FitStatus::PoorFit;
    if (!result.success) {
        std::ostringstream oss;
        oss << "R² " << result.r_squared << " not above " << config_.fit_success_threshold;
        result.message = oss.str();
    }

    return result;
}

Eigen::VectorXd OmoriFitter::initialGuess(const RateSeries& series, const Problem& problem,
                                          double p0) const {
    // c from the earliest aftershock, K so that the curve passes through
    // the peak observed rate
    double first = series.first_time > 0.0 ? series.first_time : series.bins.front().center;
    double c0 = config_.bounds.c.clamp(first);

    auto peak = std::max_element(series.bins.begin(), series.bins.end(),
        [](const RateBin& a, const RateBin& b) { return a.rate < b.rate; });
    double K0 = config_.bounds.K.clamp(peak->rate * std::pow(c0 + peak->center, p0));

    Eigen::VectorXd theta(problem.fix_p ? 2 : 3);
    theta(0) = std::log10(K0);
    theta(1) = std::log10(c0);
    if (!problem.fix_p) {
        theta(2) = config_.bounds.p.clamp(p0);
    }
    return theta;
}

Eigen::VectorXd OmoriFitter::residuals(const Problem& problem, const Eigen::VectorXd& theta) {
    double c = std::pow(10.0, theta(1));
    double p = problem.fix_p ? *problem.fix_p : theta(2);

    Eigen::VectorXd r(problem.t.size());
    for (int i = 0; i < problem.t.size(); i++) {
        r(i) = theta(0) - p * std::log10(c + problem.t(i)) - problem.log_rate(i);
    }
    return r;
}

Eigen::MatrixXd OmoriFitter::jacobian(const Problem& problem, const Eigen::VectorXd& theta) {
    double c = std::pow(10.0, theta(1));
    double p = problem.fix_p ? *problem.fix_p : theta(2);

    Eigen::MatrixXd J(problem.t.size(), theta.size());
    for (int i = 0; i < problem.t.size(); i++) {
        double ct = c + problem.t(i);
        J(i, 0) = 1.0;
        J(i, 1) = -p * c / ct;        // d/d(log10 c)
        if (!problem.fix_p) {
            J(i, 2) = -std::log10(ct);
        }
    }
    return J;
}

Eigen::VectorXd OmoriFitter::project(const Problem& problem, Eigen::VectorXd theta) {
    return theta.cwiseMax(problem.lower).cwiseMin(problem.upper);
}

OmoriFitter::Solution OmoriFitter::minimize(const Problem& problem,
                                            Eigen::VectorXd theta) const {
    Solution sol;
    theta = project(problem, theta);

    Eigen::VectorXd r = residuals(problem, theta);
    double ssr = r.squaredNorm();
    if (!std::isfinite(ssr)) {
        sol.error = "non-finite residual at the initial guess";
        return sol;
    }

    double lambda = kInitialLambda;
    int iter = 0;

    for (; iter < config_.max_iterations; iter++) {
        Eigen::MatrixXd J = jacobian(problem, theta);
        Eigen::MatrixXd JtJ = J.transpose() * J;
        Eigen::VectorXd g = J.transpose() * r;

        // Marquardt scaling of the damping term
        Eigen::VectorXd scale = JtJ.diagonal().cwiseMax(1e-12);

        // Parameters held at a bound by the gradient stay out of the step
        for (int j = 0; j < theta.size(); j++) {
            bool at_lower = theta(j) <= problem.lower(j) && g(j) > 0.0;
            bool at_upper = theta(j) >= problem.upper(j) && g(j) < 0.0;
            if (at_lower || at_upper) {
                JtJ.row(j).setZero();
                JtJ.col(j).setZero();
                JtJ(j, j) = 1.0;
                scale(j) = 0.0;
                g(j) = 0.0;
            }
        }

        bool improved = false;
        double rel_change = 0.0;
        double step = 0.0;

        while (lambda < kMaxLambda) {
            Eigen::MatrixXd A = JtJ;
            A.diagonal() += lambda * scale;

            Eigen::LDLT<Eigen::MatrixXd> ldlt(A);
            if (ldlt.info() != Eigen::Success) {
                sol.error = "singular normal equations";
                return sol;
            }
            Eigen::VectorXd delta = ldlt.solve(-g);
            if (!delta.allFinite()) {
                sol.error = "non-finite parameter update";
                return sol;
            }

            Eigen::VectorXd candidate = project(problem, theta + delta);
            Eigen::VectorXd rc = residuals(problem, candidate);
            double sc = rc.squaredNorm();

            if (std::isfinite(sc) && sc < ssr) {
                step = (candidate - theta).cwiseAbs().maxCoeff();
                rel_change = (ssr - sc) / std::max(ssr, 1e-300);
                theta = candidate;
                r = rc;
                ssr = sc;
                lambda = std::max(lambda * 0.1, kMinLambda);
                improved = true;
                break;
            }
            lambda *= 10.0;
        }

        // No downhill step at any damping: stationary point within bounds
        if (!improved) {
            sol.converged = true;
            break;
        }
        if (rel_change < config_.tolerance || step < kMinStep || ssr < kPerfectSSR) {
            sol.converged = true;
            iter++;
            break;
        }
    }

    sol.theta = theta;
    sol.ssr = ssr;
    sol.iterations = iter;
    sol.valid = true;
    return sol;
}

} // namespace omorifit
