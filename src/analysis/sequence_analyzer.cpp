#include "omorifit/analysis/sequence_analyzer.hpp"
#include "omorifit/analysis/report.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>

namespace omorifit {

namespace {

struct Moments {
    double mean = OmoriFit::kUnfit;
    double stddev = OmoriFit::kUnfit;
    double min = OmoriFit::kUnfit;
    double max = OmoriFit::kUnfit;
};

Moments moments(const std::vector<double>& values) {
    Moments m;
    if (values.empty()) return m;

    Eigen::Map<const Eigen::ArrayXd> v(values.data(), static_cast<Eigen::Index>(values.size()));
    m.mean = v.mean();
    m.stddev = std::sqrt((v - m.mean).square().mean());
    m.min = v.minCoeff();
    m.max = v.maxCoeff();
    return m;
}

} // namespace

std::string SequenceResult::status() const {
    if (insufficient) return "insufficient_data";
    return fitStatusToString(modified.status);
}

SequenceAnalyzer::SequenceAnalyzer(const AnalysisConfig& config)
    : config_(config)
    , builder_(config)
    , binner_(config)
    , fitter_(config)
{
}

AnalysisOutput SequenceAnalyzer::analyze(const std::vector<EventPtr>& mainshocks,
                                         const std::vector<EventPtr>& all_events) const {
    return run(mainshocks, [&all_events](const EventPtr&) -> const std::vector<EventPtr>& {
        return all_events;
    });
}

AnalysisOutput SequenceAnalyzer::analyze(const std::vector<EventPtr>& mainshocks,
                                         const EventStore& store) const {
    return run(mainshocks, [this, &store](const EventPtr& mainshock) {
        return builder_.window(mainshock, store);
    });
}

AnalysisOutput SequenceAnalyzer::analyze(const EventStore& store) const {
    return analyze(store.mainshocks(config_.min_mainshock_magnitude), store);
}

SequenceResult SequenceAnalyzer::analyzeOne(const EventPtr& mainshock,
                                            const std::vector<EventPtr>& candidates) const {
    SequenceResult result;
    result.mainshock = mainshock;

    auto members = builder_.collect(mainshock, candidates);
    result.aftershock_count = members.size();

    if (members.size() < static_cast<size_t>(config_.min_aftershocks)) {
        result.modified.message = "fewer aftershocks than the minimum count";
        return result;
    }

    AftershockSequence sequence(mainshock, std::move(members));
    result.insufficient = false;
    result.duration_hours = sequence.durationHours();
    result.series = binner_.bin(sequence);
    result.modified = fitter_.fit(result.series);
    result.fixed = fitter_.fitFixed(result.series);

    return result;
}

template <typename CandidateFn>
AnalysisOutput SequenceAnalyzer::run(std::vector<EventPtr> mainshocks,
                                     CandidateFn candidates) const {
    config_.validateOrThrow();

    mainshocks.erase(std::remove(mainshocks.begin(), mainshocks.end(), nullptr),
                     mainshocks.end());
    std::stable_sort(mainshocks.begin(), mainshocks.end(),
        [](const EventPtr& a, const EventPtr& b) {
            if (a->time() != b->time()) return a->time() < b->time();
            return a->id() < b->id();
        });

    AnalysisOutput output;
    output.results.resize(mainshocks.size());

    std::atomic<size_t> next{0};
    std::mutex error_mutex;
    std::exception_ptr error;

    auto worker = [&]() {
        try {
            for (size_t i = next++; i < mainshocks.size(); i = next++) {
                output.results[i] = analyzeOne(mainshocks[i], candidates(mainshocks[i]));
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!error) error = std::current_exception();
            next = mainshocks.size();
        }
    };

    int n_workers = workerCount(mainshocks.size());
    if (n_workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        for (int i = 0; i < n_workers; i++) {
            threads.emplace_back(worker);
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    if (error) {
        std::rethrow_exception(error);
    }

    if (config_.verbose) {
        for (const auto& r : output.results) {
            printSequenceLine(std::cout, r);
        }
    }

    output.summary = summarize(output.results, config_.fixed_p);
    return output;
}

int SequenceAnalyzer::workerCount(size_t jobs) const {
    int n = config_.threads;
    if (n == 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    return static_cast<int>(std::min<size_t>(static_cast<size_t>(n), std::max<size_t>(jobs, 1)));
}

SequenceSummary SequenceAnalyzer::summarize(const std::vector<SequenceResult>& results,
                                            double fixed_p) {
    SequenceSummary s;
    s.total_candidates = results.size();
    s.fixed_p = fixed_p;

    std::vector<double> p_values, r2_values, magnitudes;
    std::vector<double> r2_fixed, r2_paired;

    for (const auto& r : results) {
        if (r.insufficient) {
            s.insufficient_count++;
            continue;
        }
        s.fitted_count++;
        if (!r.success()) continue;

        s.success_count++;
        p_values.push_back(r.modified.p);
        r2_values.push_back(r.modified.r_squared);
        magnitudes.push_back(r.mainshock->magnitude());

        if (r.fixed && r.fixed->isFit()) {
            r2_fixed.push_back(r.fixed->r_squared);
            r2_paired.push_back(r.modified.r_squared);
        }
    }

    Moments p = moments(p_values);
    s.p_mean = p.mean;
    s.p_std = p.stddev;
    s.p_min = p.min;
    s.p_max = p.max;

    Moments r2 = moments(r2_values);
    s.r2_mean = r2.mean;
    s.r2_std = r2.stddev;
    s.r2_min = r2.min;
    s.r2_max = r2.max;

    s.fixed_count = r2_fixed.size();
    s.r2_fixed_mean = moments(r2_fixed).mean;
    s.r2_modified_paired_mean = moments(r2_paired).mean;

    // p against mainshock magnitude
    size_t n = p_values.size();
    if (n >= 3) {
        Eigen::Map<const Eigen::VectorXd> m(magnitudes.data(), static_cast<Eigen::Index>(n));
        Eigen::Map<const Eigen::VectorXd> y(p_values.data(), static_cast<Eigen::Index>(n));
        Eigen::VectorXd dm = (m.array() - m.mean()).matrix();
        Eigen::VectorXd dy = (y.array() - y.mean()).matrix();
        double sxx = dm.squaredNorm();
        double syy = dy.squaredNorm();

        if (sxx > 0.0) {
            Eigen::MatrixXd X(n, 2);
            X.col(0).setOnes();
            X.col(1) = m;
            Eigen::Vector2d coef = X.colPivHouseholderQr().solve(y);

            s.has_magnitude_trend = true;
            s.p_magnitude_intercept = coef(0);
            s.p_magnitude_slope = coef(1);
            s.p_magnitude_correlation = syy > 0.0 ? dm.dot(dy) / std::sqrt(sxx * syy) : 0.0;
        }
    }

    return s;
}

} // namespace omorifit
