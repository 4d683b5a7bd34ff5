#include "omorifit/core/synthetic.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace omorifit {

namespace {

// Low-discrepancy sequence in [0, 1)
double fraction(double x) {
    return x - std::floor(x);
}

std::string makeId(const std::string& prefix, int index) {
    std::ostringstream oss;
    oss << prefix << "-" << std::setw(4) << std::setfill('0') << index;
    return oss.str();
}

} // namespace

std::vector<double> SyntheticSequenceGenerator::omoriTimes(int count, double c, double p,
                                                           double start_hours,
                                                           double end_hours,
                                                           double jitter, double phase) {
    std::vector<double> times;
    if (count <= 0 || !(end_hours > start_hours)) return times;
    times.reserve(count);

    for (int i = 0; i < count; i++) {
        double q = (i + 0.5) / count;
        double t;

        // Inverse of the cumulative Omori-Utsu count
        if (std::abs(p - 1.0) < 1e-12) {
            t = (c + start_hours) * std::exp(q * std::log((c + end_hours) / (c + start_hours))) - c;
        } else {
            double a = std::pow(c + start_hours, 1.0 - p);
            double b = std::pow(c + end_hours, 1.0 - p);
            t = std::pow(a + q * (b - a), 1.0 / (1.0 - p)) - c;
        }

        if (jitter > 0.0) {
            t *= 1.0 + jitter * std::sin(12.9898 * (i + 1) + phase);
        }
        times.push_back(t);
    }

    std::sort(times.begin(), times.end());
    return times;
}

std::vector<Event> SyntheticSequenceGenerator::generate(const SyntheticSequence& seq) const {
    std::vector<Event> events;

    events.emplace_back(seq.id_prefix, seq.origin_time, seq.epicenter,
                        seq.magnitude, seq.magnitude_type, seq.place);

    auto times = omoriTimes(seq.count, seq.c, seq.p, seq.start_hours, seq.end_hours,
                            seq.jitter, seq.phase);

    double max_mag = std::min(seq.max_magnitude, seq.magnitude - 0.5);
    double span = std::max(0.0, max_mag - seq.min_magnitude);

    for (size_t i = 0; i < times.size(); i++) {
        double k = static_cast<double>(i + 1);

        // Spread epicentres over the disc, denser near the mainshock
        double azimuth = fraction(k * 0.6180339887) * 360.0;
        double distance = seq.max_distance_km * fraction(k * 0.7548776662);
        GeoPoint loc = seq.epicenter.destination(azimuth, distance);
        loc.depth = std::max(0.0, seq.epicenter.depth + 5.0 * std::sin(k));

        // Truncated Gutenberg-Richter magnitudes
        double u = fraction(k * 0.5698402910);
        double mag = seq.min_magnitude;
        if (span > 0.0) {
            double tail = 1.0 - std::pow(10.0, -seq.b_value * span);
            mag = seq.min_magnitude - std::log10(1.0 - u * tail) / seq.b_value;
            mag = std::min(std::round(mag * 10.0) / 10.0, max_mag);
        }

        events.emplace_back(makeId(seq.id_prefix, static_cast<int>(i + 1)),
                            addHours(seq.origin_time, times[i]), loc, mag,
                            MagnitudeType::ML, seq.place);
    }

    return events;
}

std::vector<Event> SyntheticSequenceGenerator::background(const std::string& id_prefix,
                                                          const GeoPoint& center,
                                                          double radius_km,
                                                          TimePoint start,
                                                          double span_hours,
                                                          int count, double min_mag,
                                                          double max_mag) {
    std::uniform_real_distribution<> unit(0.0, 1.0);
    std::vector<Event> events;

    for (int i = 0; i < count; i++) {
        double azimuth = unit(gen_) * 360.0;
        double distance = radius_km * std::sqrt(unit(gen_));
        double hours = unit(gen_) * span_hours;
        double mag = std::round((min_mag + unit(gen_) * (max_mag - min_mag)) * 10.0) / 10.0;

        GeoPoint loc = center.destination(azimuth, distance);
        loc.depth = 2.0 + unit(gen_) * 18.0;

        events.emplace_back(makeId(id_prefix, i + 1), addHours(start, hours), loc, mag,
                            MagnitudeType::ML, "background");
    }

    return events;
}

} // namespace omorifit
