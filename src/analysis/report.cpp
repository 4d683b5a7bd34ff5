#include "omorifit/analysis/report.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace omorifit {

namespace {

// Literature range of p for tectonic sequences
constexpr double kLiteraturePMin = 1.0;
constexpr double kLiteraturePMax = 1.3;

std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char ch : s) {
        if (ch == '"') out += '"';
        out += ch;
    }
    out += '"';
    return out;
}

// Empty cell for missing values
std::string number(double v, int precision) {
    if (!std::isfinite(v)) return "";
    std::ostringstream oss;
    oss << std::setprecision(precision) << v;
    return oss.str();
}

} // namespace

void printSequenceLine(std::ostream& os, const SequenceResult& result) {
    if (!result.mainshock) return;

    os << result.mainshock->label() << ": "
       << result.aftershock_count << " aftershocks";

    if (result.insufficient) {
        os << " [insufficient data]" << std::endl;
        return;
    }

    const OmoriFit& fit = result.modified;
    if (fit.isFit()) {
        std::ios::fmtflags flags(os.flags());
        std::streamsize precision = os.precision();
        os << std::fixed << std::setprecision(3)
           << ", K=" << fit.K << " c=" << fit.c << " p=" << fit.p
           << " R²=" << fit.r_squared;
        if (result.fixed && result.fixed->isFit()) {
            os << " (p=" << std::setprecision(1) << result.fixed->p << ": R²="
               << std::setprecision(3) << result.fixed->r_squared << ")";
        }
        os.flags(flags);
        os.precision(precision);
    }
    os << " [" << result.status() << "]";
    if (!fit.isFit() && !fit.message.empty()) {
        os << " " << fit.message;
    }
    os << std::endl;
}

void printSummary(std::ostream& os, const SequenceSummary& s) {
    os << "\n=== Omori-Utsu Analysis Summary ===" << std::endl;
    os << "Candidate mainshocks: " << s.total_candidates << std::endl;
    os << "Insufficient data:    " << s.insufficient_count << std::endl;
    os << "Sequences fitted:     " << s.fitted_count << std::endl;
    os << "Successful fits:      " << s.success_count << std::endl;

    if (s.success_count == 0) {
        os << "No successful fits; no statistics available." << std::endl;
        return;
    }

    std::ios::fmtflags flags(os.flags());
    std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(3);
    os << "\nDecay exponent p: " << s.p_mean << " ± " << s.p_std
       << " (range " << s.p_min << " - " << s.p_max << ")" << std::endl;
    os << "R²:               " << s.r2_mean << " ± " << s.r2_std
       << " (range " << s.r2_min << " - " << s.r2_max << ")" << std::endl;

    if (s.fixed_count > 0) {
        os << "\nOriginal Omori (p = " << std::setprecision(1) << s.fixed_p << ")"
           << std::setprecision(3) << " mean R²: " << s.r2_fixed_mean << std::endl;
        os << "Modified Omori-Utsu mean R²: " << s.r2_modified_paired_mean << std::endl;
        os << "Improvement: " << std::showpos
           << (s.r2_modified_paired_mean - s.r2_fixed_mean) << std::noshowpos << std::endl;
    }

    if (s.has_magnitude_trend) {
        os << "\np vs mainshock magnitude: p = " << s.p_magnitude_intercept
           << std::showpos << " " << s.p_magnitude_slope << std::noshowpos
           << " * M (r = " << s.p_magnitude_correlation << ")" << std::endl;
    }

    os << "\nLiterature range p = " << std::setprecision(1) << kLiteraturePMin
       << "-" << kLiteraturePMax << ": mean p is ";
    if (s.p_mean < kLiteraturePMin) {
        os << "below (slower decay)";
    } else if (s.p_mean > kLiteraturePMax) {
        os << "above (faster decay)";
    } else {
        os << "within range";
    }
    os << std::endl;
    os.flags(flags);
    os.precision(precision);
}

void writeResultsCsv(std::ostream& os, const std::vector<SequenceResult>& results) {
    os << "mainshock_id,time,magnitude,depth_km,latitude,longitude,place,"
       << "aftershocks,duration_hours,status,K,c,p,r_squared,rmse,success,"
       << "fixed_K,fixed_c,fixed_r_squared\n";

    for (const auto& r : results) {
        if (!r.mainshock) continue;
        const Event& ms = *r.mainshock;
        const OmoriFit& fit = r.modified;
        bool has_fixed = r.fixed && r.fixed->isFit();

        os << csvField(ms.id()) << ","
           << formatTime(ms.time()) << ","
           << number(ms.magnitude(), 3) << ","
           << number(ms.depth(), 4) << ","
           << number(ms.latitude(), 8) << ","
           << number(ms.longitude(), 8) << ","
           << csvField(ms.place()) << ","
           << r.aftershock_count << ","
           << (r.insufficient ? "" : number(r.duration_hours, 6)) << ","
           << r.status() << ","
           << number(fit.K, 6) << ","
           << number(fit.c, 6) << ","
           << number(fit.p, 6) << ","
           << number(fit.r_squared, 6) << ","
           << number(fit.rmse, 6) << ","
           << (r.success() ? "true" : "false") << ","
           << (has_fixed ? number(r.fixed->K, 6) : "") << ","
           << (has_fixed ? number(r.fixed->c, 6) : "") << ","
           << (has_fixed ? number(r.fixed->r_squared, 6) : "") << "\n";
    }
}

bool writeResultsCsv(const std::string& filename, const std::vector<SequenceResult>& results) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Cannot write results to " << filename << std::endl;
        return false;
    }
    writeResultsCsv(file, results);
    return static_cast<bool>(file);
}

} // namespace omorifit
