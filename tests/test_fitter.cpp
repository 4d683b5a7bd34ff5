/**
 * Unit tests for the Omori-Utsu fitter
 */

#include "test_framework.hpp"
#include "omorifit/fitting/omori_fitter.hpp"
#include <utility>

using namespace omorifit;
using namespace omorifit::test;

namespace {

// Rate series straight from (time, rate) pairs
RateSeries makeSeries(const std::vector<std::pair<double, double>>& points) {
    RateSeries series;
    for (const auto& [t, rate] : points) {
        RateBin b;
        b.start = t * 0.9;
        b.end = t * 1.1;
        b.center = t;
        b.width = b.end - b.start;
        b.rate = rate;
        b.count = 1;
        series.bins.push_back(b);
    }
    if (!points.empty()) {
        series.first_time = points.front().first;
        series.last_time = points.back().first;
    }
    series.requested_bins = static_cast<int>(points.size());
    series.event_count = static_cast<int>(points.size());
    return series;
}

// Noise-free modified Omori-Utsu rates on a log-spaced grid up to 720 h
RateSeries exactSeries(double K, double c, double p) {
    std::vector<std::pair<double, double>> points;
    for (int i = 0; i < 30; i++) {
        double t = 0.05 * std::pow(20000.0, i / 29.0);
        if (t > 720.0) break;
        points.emplace_back(t, omoriRate(t, K, c, p));
    }
    return makeSeries(points);
}

std::vector<double> doublingTimes() {
    std::vector<double> times;
    for (int i = 0; i < 8; i++) times.push_back(0.1 * std::pow(2.0, i));
    return times;
}

} // namespace

TEST(OmoriRate, Formula) {
    ASSERT_NEAR(omoriRate(0.0, 100.0, 1.0, 1.2), 100.0, 1e-12);
    ASSERT_NEAR(omoriRate(9.0, 100.0, 1.0, 1.0), 10.0, 1e-12);
    ASSERT_NEAR(omoriLog10Rate(9.0, 100.0, 1.0, 1.0), 1.0, 1e-12);
}

TEST(FitStatus, Names) {
    ASSERT_EQ(fitStatusToString(FitStatus::Success), std::string("success"));
    ASSERT_EQ(fitStatusToString(FitStatus::PoorFit), std::string("poor_fit"));
    ASSERT_EQ(fitStatusToString(FitStatus::InsufficientData), std::string("insufficient_data"));
    ASSERT_EQ(fitStatusToString(FitStatus::NumericalFailure), std::string("numerical_failure"));
    ASSERT_EQ(fitStatusToString(FitStatus::NotConverged), std::string("not_converged"));
}

TEST(OmoriFitter, RecoversExactParameters) {
    RateSeries series = exactSeries(250.0, 0.5, 1.1);
    ASSERT_EQ(series.size(), 29u);

    OmoriFitter fitter{AnalysisConfig()};
    OmoriFit fit = fitter.fit(series);

    ASSERT_TRUE(fit.status == FitStatus::Success);
    ASSERT_TRUE(fit.success);
    ASSERT_FALSE(fit.p_fixed);
    ASSERT_NEAR(fit.p, 1.1, 0.011);
    ASSERT_NEAR(fit.K, 250.0, 2.5);
    ASSERT_NEAR(fit.c, 0.5, 0.005);
    ASSERT_GT(fit.r_squared, 0.99);
    ASSERT_LT(fit.rmse, 1e-6);
    ASSERT_EQ(fit.point_count, 29);
    ASSERT_GT(fit.iterations, 0);
    ASSERT_TRUE(std::isfinite(fit.p_stderr));
    ASSERT_LT(fit.p_stderr, 1e-3);
}

TEST(OmoriFitter, RecoversAcrossExponents) {
    OmoriFitter fitter{AnalysisConfig()};
    for (double p : {0.7, 0.9, 1.0, 1.3, 1.6}) {
        OmoriFit fit = fitter.fit(exactSeries(80.0, 0.2, p));
        ASSERT_TRUE(fit.success);
        ASSERT_NEAR(fit.p, p, 0.01 * p);
        ASSERT_GT(fit.r_squared, 0.99);
    }
}

TEST(OmoriFitter, Deterministic) {
    RateSeries series = exactSeries(40.0, 0.08, 1.25);
    OmoriFitter fitter{AnalysisConfig()};
    OmoriFit a = fitter.fit(series);
    OmoriFit b = fitter.fit(series);
    ASSERT_TRUE(a.K == b.K);
    ASSERT_TRUE(a.c == b.c);
    ASSERT_TRUE(a.p == b.p);
    ASSERT_TRUE(a.r_squared == b.r_squared);
    ASSERT_EQ(a.iterations, b.iterations);
}

TEST(OmoriFitter, FixedExponent) {
    RateSeries series = exactSeries(250.0, 0.5, 1.1);
    OmoriFitter fitter{AnalysisConfig()};

    OmoriFit fixed = fitter.fitFixed(series);
    ASSERT_TRUE(fixed.success);
    ASSERT_TRUE(fixed.p_fixed);
    ASSERT_TRUE(fixed.p == 1.0);
    ASSERT_TRUE(std::isnan(fixed.p_stderr));
    ASSERT_GT(fixed.r_squared, 0.99);

    OmoriFit modified = fitter.fit(series);
    ASSERT_GE(modified.r_squared, fixed.r_squared);
}

TEST(OmoriFitter, ExplicitFixedExponent) {
    RateSeries series = exactSeries(60.0, 0.1, 1.3);
    OmoriFitter fitter{AnalysisConfig()};
    OmoriFit fit = fitter.fit(series, 1.3);
    ASSERT_TRUE(fit.p == 1.3);
    ASSERT_NEAR(fit.K, 60.0, 0.6);
    ASSERT_NEAR(fit.c, 0.1, 0.001);
}

TEST(OmoriFitter, ModifiedNeverWorseThanFixed) {
    // Rough data where the free exponent has to compete with p = 1
    std::vector<std::pair<double, double>> points = {
        {0.05, 40.0}, {0.2, 35.0}, {0.7, 12.0}, {2.0, 6.5},
        {6.0, 1.1}, {20.0, 0.6}, {70.0, 0.09}, {250.0, 0.03}};
    RateSeries series = makeSeries(points);

    OmoriFitter fitter{AnalysisConfig()};
    OmoriFit modified = fitter.fit(series);
    OmoriFit fixed = fitter.fitFixed(series);
    ASSERT_TRUE(modified.isFit());
    ASSERT_TRUE(fixed.isFit());
    ASSERT_GE(modified.r_squared, fixed.r_squared);
}

TEST(OmoriFitter, InsufficientPoints) {
    RateSeries series = makeSeries({{1.0, 10.0}, {10.0, 1.0}});
    OmoriFitter fitter{AnalysisConfig()};
    OmoriFit fit = fitter.fit(series);

    ASSERT_TRUE(fit.status == FitStatus::InsufficientData);
    ASSERT_FALSE(fit.success);
    ASSERT_FALSE(fit.isFit());
    ASSERT_TRUE(std::isnan(fit.K));
    ASSERT_TRUE(std::isnan(fit.c));
    ASSERT_TRUE(std::isnan(fit.p));
    ASSERT_TRUE(std::isnan(fit.r_squared));
    ASSERT_EQ(fit.point_count, 2);
    ASSERT_FALSE(fit.message.empty());
}

TEST(OmoriFitter, PoorFit) {
    // Alternating rates that no decaying curve can follow
    std::vector<std::pair<double, double>> points;
    auto times = doublingTimes();
    for (size_t i = 0; i < times.size(); i++) {
        points.emplace_back(times[i], i % 2 == 0 ? 10.0 : 1.0);
    }

    OmoriFitter fitter{AnalysisConfig()};
    OmoriFit fit = fitter.fit(makeSeries(points));

    ASSERT_TRUE(fit.status == FitStatus::PoorFit);
    ASSERT_FALSE(fit.success);
    ASSERT_TRUE(fit.isFit());
    ASSERT_LT(fit.r_squared, 0.5);
    ASSERT_TRUE(std::isfinite(fit.p));
    ASSERT_TRUE(std::isfinite(fit.rmse));
}

TEST(OmoriFitter, FlatRateHasZeroRSquared) {
    std::vector<std::pair<double, double>> points;
    for (double t : doublingTimes()) points.emplace_back(t, 7.0);

    OmoriFitter fitter{AnalysisConfig()};
    OmoriFit fit = fitter.fit(makeSeries(points));
    ASSERT_TRUE(fit.isFit());
    ASSERT_NEAR(fit.r_squared, 0.0, 1e-15);
    ASSERT_FALSE(fit.success);
}

TEST(OmoriFitter, ParametersStayWithinBounds) {
    // p = 4 is steeper than the upper bound allows
    std::vector<std::pair<double, double>> points;
    for (double t : doublingTimes()) points.emplace_back(t, omoriRate(t, 5000.0, 0.2, 4.0));

    AnalysisConfig config;
    OmoriFitter fitter(config);
    OmoriFit fit = fitter.fit(makeSeries(points));

    ASSERT_TRUE(fit.isFit());
    ASSERT_LE(fit.p, config.bounds.p.upper);
    ASSERT_NEAR(fit.p, config.bounds.p.upper, 1e-6);
    ASSERT_GE(fit.c, config.bounds.c.lower * (1.0 - 1e-12));
    ASSERT_LE(fit.c, config.bounds.c.upper * (1.0 + 1e-12));
    ASSERT_GE(fit.K, config.bounds.K.lower * (1.0 - 1e-12));
    ASSERT_LE(fit.K, config.bounds.K.upper * (1.0 + 1e-12));
}

TEST(OmoriFitter, NarrowBoundsRespected) {
    AnalysisConfig config;
    config.bounds.p = ParamBounds(1.2, 1.5);
    config.fixed_p = 1.3;
    OmoriFitter fitter(config);

    OmoriFit fit = fitter.fit(exactSeries(250.0, 0.5, 1.0));
    ASSERT_TRUE(fit.isFit());
    ASSERT_GE(fit.p, 1.2);
    ASSERT_NEAR(fit.p, 1.2, 1e-3);
}

TEST(OmoriFitter, FixedExponentOutsideBounds) {
    OmoriFitter fitter{AnalysisConfig()};
    OmoriFit fit = fitter.fit(exactSeries(250.0, 0.5, 1.1), 3.5);
    ASSERT_TRUE(fit.status == FitStatus::NumericalFailure);
    ASSERT_TRUE(std::isnan(fit.K));
}

TEST(OmoriFitter, NonPositiveRateRejected) {
    RateSeries series = makeSeries({{1.0, 10.0}, {2.0, 0.0}, {4.0, 2.0}});
    OmoriFitter fitter{AnalysisConfig()};
    OmoriFit fit = fitter.fit(series);
    ASSERT_TRUE(fit.status == FitStatus::NumericalFailure);
    ASSERT_FALSE(fit.success);
}

TEST(OmoriFitter, SuccessThreshold) {
    RateSeries series = exactSeries(250.0, 0.5, 1.1);

    AnalysisConfig strict;
    strict.fit_success_threshold = 0.999;
    OmoriFit fixed = OmoriFitter(strict).fitFixed(series);
    ASSERT_TRUE(fixed.status == FitStatus::PoorFit);
    ASSERT_FALSE(fixed.success);

    OmoriFit modified = OmoriFitter(strict).fit(series);
    ASSERT_TRUE(modified.success);
}

TEST(OmoriFitter, IterationLimit) {
    AnalysisConfig config;
    config.max_iterations = 1;
    OmoriFitter fitter(config);
    OmoriFit fit = fitter.fit(exactSeries(250.0, 0.5, 1.1), 1.0);
    ASSERT_TRUE(fit.status == FitStatus::NotConverged);
    ASSERT_TRUE(std::isnan(fit.p));
    ASSERT_EQ(fit.iterations, 1);
}
