#include "omorifit/sequence/rate_binner.hpp"
#include <algorithm>
#include <cmath>

namespace omorifit {

std::vector<double> RateBinner::logEdges(double t_min, double t_max, int n_bins) {
    std::vector<double> edges;
    if (n_bins <= 0 || !(t_min > 0.0) || !(t_max > t_min)) return edges;

    double log_ratio = std::log(t_max / t_min);
    edges.reserve(n_bins + 1);
    for (int i = 0; i <= n_bins; i++) {
        edges.push_back(t_min * std::exp(log_ratio * i / n_bins));
    }

    // Pin the ends so the extreme events fall inside
    edges.front() = t_min;
    edges.back() = t_max;
    return edges;
}

int RateBinner::binCountFor(size_t event_count) const {
    if (!config_.adaptive_bins) return config_.n_bins;
    int by_count = std::max(1, static_cast<int>(event_count / 3));
    return std::min(config_.n_bins, by_count);
}

RateSeries RateBinner::bin(const AftershockSequence& sequence) const {
    return bin(sequence, binCountFor(sequence.size()));
}

RateSeries RateBinner::bin(const AftershockSequence& sequence, int n_bins) const {
    return binTimes(sequence.elapsedHours(), n_bins);
}

RateSeries RateBinner::binTimes(std::vector<double> elapsed_hours, int n_bins) {
    RateSeries series;
    series.requested_bins = n_bins;

    // Elapsed times must be positive for log spacing
    elapsed_hours.erase(std::remove_if(elapsed_hours.begin(), elapsed_hours.end(),
                            [](double t) { return !(t > 0.0) || !std::isfinite(t); }),
                        elapsed_hours.end());
    std::sort(elapsed_hours.begin(), elapsed_hours.end());

    series.event_count = static_cast<int>(elapsed_hours.size());
    if (elapsed_hours.empty()) return series;

    series.first_time = elapsed_hours.front();
    series.last_time = elapsed_hours.back();

    series.edges = logEdges(series.first_time, series.last_time, n_bins);
    if (series.edges.empty()) return series;

    std::vector<int> counts(n_bins, 0);
    for (double t : elapsed_hours) {
        auto it = std::upper_bound(series.edges.begin(), series.edges.end(), t);
        int idx = static_cast<int>(it - series.edges.begin()) - 1;
        idx = std::min(std::max(idx, 0), n_bins - 1);   // last bin is closed
        counts[idx]++;
    }

    for (int i = 0; i < n_bins; i++) {
        if (counts[i] == 0) continue;

        RateBin b;
        b.start = series.edges[i];
        b.end = series.edges[i + 1];
        b.width = b.end - b.start;
        if (!(b.width > 0.0)) continue;
        b.center = 0.5 * (b.start + b.end);
        b.count = counts[i];
        b.rate = b.count / b.width;
        series.bins.push_back(b);
    }

    return series;
}

} // namespace omorifit
