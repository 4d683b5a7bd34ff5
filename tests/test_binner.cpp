/**
 * Unit tests for logarithmic rate binning
 */

#include "test_framework.hpp"
#include "omorifit/sequence/rate_binner.hpp"
#include "omorifit/fitting/omori_fitter.hpp"
#include "omorifit/core/synthetic.hpp"

using namespace omorifit;
using namespace omorifit::test;

TEST(RateBinner, LogEdgesConstantRatio) {
    auto edges = RateBinner::logEdges(0.1, 1000.0, 4);
    ASSERT_EQ(edges.size(), 5u);
    ASSERT_NEAR(edges[0], 0.1, 1e-15);
    ASSERT_NEAR(edges[1], 1.0, 1e-12);
    ASSERT_NEAR(edges[2], 10.0, 1e-10);
    ASSERT_NEAR(edges[3], 100.0, 1e-9);
    ASSERT_NEAR(edges[4], 1000.0, 1e-15);
}

TEST(RateBinner, LogEdgesStrictlyIncreasing) {
    auto edges = RateBinner::logEdges(1.0 / 60.0, 712.3, 20);
    ASSERT_EQ(edges.size(), 21u);
    double ratio = edges[1] / edges[0];
    for (size_t i = 1; i < edges.size(); i++) {
        ASSERT_GT(edges[i], edges[i - 1]);
        ASSERT_NEAR(edges[i] / edges[i - 1], ratio, 1e-9);
    }
    ASSERT_TRUE(edges.back() == 712.3);
}

TEST(RateBinner, LogEdgesDegenerate) {
    ASSERT_TRUE(RateBinner::logEdges(5.0, 5.0, 10).empty());
    ASSERT_TRUE(RateBinner::logEdges(5.0, 1.0, 10).empty());
    ASSERT_TRUE(RateBinner::logEdges(0.0, 1.0, 10).empty());
    ASSERT_TRUE(RateBinner::logEdges(1.0, 2.0, 0).empty());
}

TEST(RateBinner, NoEmptyBins) {
    // Two clusters leave the middle bins empty
    std::vector<double> times = {0.1, 0.11, 0.12, 0.13, 50.0, 60.0, 70.0, 100.0};
    RateSeries series = RateBinner::binTimes(times, 10);

    ASSERT_EQ(series.edges.size(), 11u);
    ASSERT_LT(series.size(), 10u);
    int total = 0;
    for (const auto& b : series.bins) {
        ASSERT_GT(b.count, 0);
        ASSERT_GT(b.rate, 0.0);
        total += b.count;
    }
    ASSERT_EQ(total, 8);
    ASSERT_EQ(series.event_count, 8);
}

TEST(RateBinner, RatesAndCenters) {
    auto times = SyntheticSequenceGenerator::omoriTimes(300, 0.05, 1.1, 1.0 / 60.0, 700.0);
    RateSeries series = RateBinner::binTimes(times, 20);

    ASSERT_NEAR(series.first_time, times.front(), 1e-12);
    ASSERT_NEAR(series.last_time, times.back(), 1e-12);
    ASSERT_EQ(series.requested_bins, 20);

    int total = 0;
    for (size_t i = 0; i < series.size(); i++) {
        const RateBin& b = series.bins[i];
        ASSERT_NEAR(b.width, b.end - b.start, 1e-12);
        ASSERT_NEAR(b.center, 0.5 * (b.start + b.end), 1e-12);
        ASSERT_NEAR(b.rate, b.count / b.width, 1e-9);
        if (i > 0) ASSERT_LT(series.bins[i - 1].center, b.center);
        total += b.count;
    }
    ASSERT_EQ(total, 300);

    // Rate decays from the first bin to the last
    ASSERT_GT(series.bins.front().rate, 100.0 * series.bins.back().rate);
}

TEST(RateBinner, ExtremesAreCounted) {
    std::vector<double> times = {1.0, 1.5, 3.0, 6.0, 12.0, 16.0};
    RateSeries series = RateBinner::binTimes(times, 4);

    // The first and last events sit exactly on the outer edges
    ASSERT_EQ(series.size(), 4u);
    ASSERT_EQ(series.bins[0].count, 2);
    ASSERT_EQ(series.bins[1].count, 1);
    ASSERT_EQ(series.bins[3].count, 2);
}

TEST(RateBinner, SingleDistinctTime) {
    std::vector<double> times(12, 3.5);
    RateSeries series = RateBinner::binTimes(times, 20);
    ASSERT_TRUE(series.empty());
    ASSERT_TRUE(series.edges.empty());
    ASSERT_FALSE(series.isFittable());
    ASSERT_EQ(series.event_count, 12);
}

TEST(RateBinner, DropsNonPositiveTimes) {
    std::vector<double> times = {-1.0, 0.0, 0.5, 1.0, 2.0, 4.0};
    RateSeries series = RateBinner::binTimes(times, 3);
    ASSERT_EQ(series.event_count, 4);
    ASSERT_NEAR(series.first_time, 0.5, 1e-12);
}

TEST(RateBinner, EmptyInput) {
    RateSeries series = RateBinner::binTimes({}, 20);
    ASSERT_TRUE(series.empty());
    ASSERT_EQ(series.event_count, 0);
}

TEST(RateBinner, AdaptiveBinCount) {
    AnalysisConfig config;
    config.n_bins = 20;
    RateBinner fixed_binner(config);
    ASSERT_EQ(fixed_binner.binCountFor(12), 20);

    config.adaptive_bins = true;
    RateBinner adaptive(config);
    ASSERT_EQ(adaptive.binCountFor(30), 10);
    ASSERT_EQ(adaptive.binCountFor(300), 20);
    ASSERT_EQ(adaptive.binCountFor(2), 1);
}

TEST(RateBinner, BinsSequence) {
    auto ms = std::make_shared<const Event>("ms", fromEpochSeconds(0.0), GeoPoint(0, 0), 7.0);
    std::vector<EventPtr> members;
    for (double h : {0.5, 0.7, 1.4, 2.8, 5.6, 11.3, 22.6, 45.0, 64.0}) {
        std::string id = "h" + std::to_string(members.size());
        members.push_back(std::make_shared<const Event>(id, addHours(ms->time(), h),
                                                        GeoPoint(0, 0.1), 3.0));
    }
    AftershockSequence seq(ms, members);

    AnalysisConfig config;
    config.n_bins = 7;
    RateBinner binner(config);
    RateSeries series = binner.bin(seq);

    ASSERT_EQ(series.size(), 7u);
    ASSERT_NEAR(series.first_time, 0.5, 1e-9);
    ASSERT_NEAR(series.last_time, 64.0, 1e-9);
    ASSERT_EQ(series.bins.back().count, 2);
}

TEST(RateBinner, TwoPopulatedBinsCannotBeFit) {
    std::vector<double> times = {1.0, 1.0, 1.0, 1.0, 1.0, 100.0, 100.0, 100.0, 100.0, 100.0};
    RateSeries series = RateBinner::binTimes(times, 10);
    ASSERT_EQ(series.size(), 2u);
    ASSERT_FALSE(series.isFittable());

    OmoriFitter fitter{AnalysisConfig()};
    OmoriFit fit = fitter.fit(series);
    ASSERT_TRUE(fit.status == FitStatus::InsufficientData);
    ASSERT_FALSE(fit.success);
    ASSERT_TRUE(std::isnan(fit.p));
    ASSERT_TRUE(std::isnan(fit.r_squared));
}
