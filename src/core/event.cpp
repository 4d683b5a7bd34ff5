#include "omorifit/core/event.hpp"
#include <sstream>
#include <iomanip>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace omorifit {

std::string Event::label() const {
    std::ostringstream oss;
    oss << "M" << std::fixed << std::setprecision(1) << magnitude_;
    if (!place_.empty()) {
        oss << " " << place_;
    }
    oss << " (" << formatTime(time_) << ")";
    return oss.str();
}

std::string Event::summary() const {
    std::ostringstream oss;

    oss << std::fixed << std::setprecision(3);
    oss << "Event: " << id_ << "\n";
    oss << "  Time: " << formatTime(time_, true) << "\n";
    oss << "  Location: " << location_.latitude << "° N, "
        << location_.longitude << "° E\n";
    oss << "  Depth: " << location_.depth << " km\n";
    oss << std::setprecision(1);
    oss << "  Magnitude: " << magnitude_;
    if (magnitude_type_ != MagnitudeType::Unknown) {
        oss << " " << magnitudeTypeToString(magnitude_type_);
    }
    oss << "\n";
    if (!place_.empty()) {
        oss << "  Place: " << place_ << "\n";
    }

    return oss.str();
}

std::optional<TimePoint> parseTime(const std::string& text) {
    std::string s = text;
    s.erase(0, s.find_first_not_of(" \t\r\n\""));
    s.erase(s.find_last_not_of(" \t\r\n\"") + 1);
    if (s.empty()) return std::nullopt;

    // Plain epoch seconds
    char* end = nullptr;
    double epoch = std::strtod(s.c_str(), &end);
    if (end && *end == '\0' && s.find('-', 1) == std::string::npos) {
        return fromEpochSeconds(epoch);
    }

    int year, month, day, hour = 0, minute = 0;
    double second = 0.0;
    int consumed = 0;
    int n = std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed);
    if (n != 3) return std::nullopt;

    std::string rest = s.substr(consumed);
    if (!rest.empty() && (rest[0] == 'T' || rest[0] == ' ')) {
        int consumed_time = 0;
        n = std::sscanf(rest.c_str() + 1, "%2d:%2d:%lf%n",
                        &hour, &minute, &second, &consumed_time);
        if (n != 3) return std::nullopt;
        rest = rest.substr(1 + consumed_time);
    }
    if (!rest.empty() && rest != "Z" && rest != "+00:00") return std::nullopt;

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 ||
        second < 0.0 || second >= 61.0) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = 0;

    time_t whole = timegm(&tm);
    return fromEpochSeconds(static_cast<double>(whole) + second);
}

std::string formatTime(TimePoint t, bool with_fraction) {
    auto micros = std::chrono::duration_cast<Duration>(t.time_since_epoch()).count();
    int64_t secs = micros / 1000000;
    int64_t frac = micros % 1000000;
    if (frac < 0) {
        frac += 1000000;
        secs -= 1;
    }

    time_t time_t_val = static_cast<time_t>(secs);
    std::tm tm{};
    gmtime_r(&time_t_val, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (with_fraction) {
        oss << "." << std::setw(6) << std::setfill('0') << frac;
    }
    oss << "Z";
    return oss.str();
}

} // namespace omorifit
