#pragma once

#include "event.hpp"
#include <random>
#include <string>
#include <vector>

namespace omorifit {

/**
 * SyntheticSequence - Parameters of one artificial mainshock sequence
 *
 * Aftershock times follow the Omori-Utsu density between start_hours and
 * end_hours after the mainshock. They are placed at the (i + 0.5) / count
 * quantiles of that density, so a sequence is fully reproducible.
 */
struct SyntheticSequence {
    std::string id_prefix = "syn";
    GeoPoint epicenter;
    TimePoint origin_time;
    double magnitude = 7.0;
    MagnitudeType magnitude_type = MagnitudeType::Mw;
    std::string place;

    int count = 100;               // aftershocks generated
    double c = 0.05;               // hours
    double p = 1.1;
    double start_hours = 1.0 / 60.0;
    double end_hours = 700.0;

    // Relative time perturbation amplitude, e.g. 0.05 for 5%
    double jitter = 0.0;
    double phase = 0.0;

    double max_distance_km = 50.0;
    double min_magnitude = 2.0;
    double max_magnitude = 5.5;    // also capped at mainshock - 0.5
    double b_value = 1.0;
};

class SyntheticSequenceGenerator {
public:
    SyntheticSequenceGenerator() : gen_(42) {}
    explicit SyntheticSequenceGenerator(unsigned int seed) : gen_(seed) {}

    // Elapsed aftershock times (hours), ascending
    static std::vector<double> omoriTimes(int count, double c, double p,
                                          double start_hours, double end_hours,
                                          double jitter = 0.0, double phase = 0.0);

    // Mainshock first, then its aftershocks in time order
    std::vector<Event> generate(const SyntheticSequence& seq) const;

    // Uniform background seismicity inside a circle
    std::vector<Event> background(const std::string& id_prefix, const GeoPoint& center,
                                  double radius_km, TimePoint start, double span_hours,
                                  int count, double min_mag, double max_mag);

private:
    std::mt19937 gen_;
};

} // namespace omorifit
