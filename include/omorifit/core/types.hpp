#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <cmath>
#include <limits>

namespace omorifit {

// Time handling - using microsecond precision
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;

// Constants
namespace constants {
    constexpr double EARTH_RADIUS_KM = 6371.0;
    constexpr double DEG_TO_RAD = M_PI / 180.0;
    constexpr double RAD_TO_DEG = 180.0 / M_PI;
    constexpr double HOURS_PER_DAY = 24.0;
    constexpr double MINUTES_PER_HOUR = 60.0;
}

// Geographic coordinates
struct GeoPoint {
    double latitude;   // degrees, -90 to 90
    double longitude;  // degrees, -180 to 180
    double depth;      // km below surface (positive downward)

    GeoPoint() : latitude(0), longitude(0), depth(0) {}
    GeoPoint(double lat, double lon, double dep = 0)
        : latitude(lat), longitude(lon), depth(dep) {}

    // Haversine surface distance in km (depth is ignored)
    double distanceTo(const GeoPoint& other) const {
        using namespace constants;
        double lat1 = latitude * DEG_TO_RAD;
        double lat2 = other.latitude * DEG_TO_RAD;
        double dLat = (other.latitude - latitude) * DEG_TO_RAD;
        double dLon = (other.longitude - longitude) * DEG_TO_RAD;

        double a = std::sin(dLat/2) * std::sin(dLat/2) +
                   std::cos(lat1) * std::cos(lat2) *
                   std::sin(dLon/2) * std::sin(dLon/2);
        double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1-a));
        return EARTH_RADIUS_KM * c;
    }

    // Point reached by travelling distance_km along an azimuth (degrees)
    GeoPoint destination(double azimuth_deg, double distance_km) const {
        using namespace constants;
        double delta = distance_km / EARTH_RADIUS_KM;
        double theta = azimuth_deg * DEG_TO_RAD;
        double lat1 = latitude * DEG_TO_RAD;
        double lon1 = longitude * DEG_TO_RAD;

        double lat2 = std::asin(std::sin(lat1) * std::cos(delta) +
                                std::cos(lat1) * std::sin(delta) * std::cos(theta));
        double lon2 = lon1 + std::atan2(std::sin(theta) * std::sin(delta) * std::cos(lat1),
                                        std::cos(delta) - std::sin(lat1) * std::sin(lat2));
        double lon_deg = std::fmod(lon2 * RAD_TO_DEG + 540.0, 360.0) - 180.0;
        return GeoPoint(lat2 * RAD_TO_DEG, lon_deg, depth);
    }
};

// Magnitude types
enum class MagnitudeType {
    ML,     // Local magnitude
    Mw,     // Moment magnitude
    Mb,     // Body wave magnitude
    Ms,     // Surface wave magnitude
    Md,     // Duration magnitude
    Unknown
};

inline std::string magnitudeTypeToString(MagnitudeType mt) {
    switch (mt) {
        case MagnitudeType::ML: return "ML";
        case MagnitudeType::Mw: return "Mw";
        case MagnitudeType::Mb: return "Mb";
        case MagnitudeType::Ms: return "Ms";
        case MagnitudeType::Md: return "Md";
        default: return "?";
    }
}

// Accepts catalog spellings such as "mww", "mwc", "ml", "mb_lg", "Md"
inline MagnitudeType stringToMagnitudeType(const std::string& s) {
    std::string v;
    for (char ch : s) v += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    if (v.rfind("mw", 0) == 0) return MagnitudeType::Mw;
    if (v.rfind("ml", 0) == 0) return MagnitudeType::ML;
    if (v.rfind("mb", 0) == 0) return MagnitudeType::Mb;
    if (v.rfind("ms", 0) == 0) return MagnitudeType::Ms;
    if (v.rfind("md", 0) == 0) return MagnitudeType::Md;
    return MagnitudeType::Unknown;
}

// Elapsed time between two instants
inline double hoursBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count() / 3600.0;
}

inline TimePoint addHours(TimePoint t, double hours) {
    return t + std::chrono::duration_cast<std::chrono::system_clock::duration>(
        Duration(static_cast<int64_t>(std::llround(hours * 3.6e9))));
}

inline double toEpochSeconds(TimePoint t) {
    return std::chrono::duration_cast<Duration>(t.time_since_epoch()).count() / 1e6;
}

inline TimePoint fromEpochSeconds(double epoch) {
    return TimePoint(std::chrono::duration_cast<std::chrono::system_clock::duration>(
        Duration(static_cast<int64_t>(std::llround(epoch * 1e6)))));
}

} // namespace omorifit
