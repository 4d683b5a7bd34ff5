#include "omorifit/core/event_store.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace omorifit {

namespace {

bool earlier(const EventPtr& a, const EventPtr& b) {
    if (a->time() != b->time()) return a->time() < b->time();
    return a->id() < b->id();
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Comma separated, double-quoted fields may hold commas and "" escapes
std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::string item;
    bool quoted = false;
    bool was_quoted = false;

    for (size_t i = 0; i < line.size(); i++) {
        char ch = line[i];
        if (quoted) {
            if (ch == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                item += '"';
                i++;
            } else if (ch == '"') {
                quoted = false;
            } else {
                item += ch;
            }
        } else if (ch == '"' && trim(item).empty()) {
            item.clear();
            quoted = was_quoted = true;
        } else if (ch == ',') {
            fields.push_back(was_quoted ? item : trim(item));
            item.clear();
            was_quoted = false;
        } else {
            item += ch;
        }
    }
    fields.push_back(was_quoted ? item : trim(item));
    return fields;
}

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

bool parseDouble(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end && *end == '\0' && std::isfinite(out);
}

} // namespace

bool EventStore::add(const Event& event) {
    if (event.id().empty()) {
        return add(std::make_shared<const Event>(event.withId(generateId())));
    }
    return add(std::make_shared<const Event>(event));
}

bool EventStore::add(EventPtr event) {
    if (!event) return false;
    if (event->id().empty()) {
        return add(*event);
    }
    if (by_id_.count(event->id()) > 0) {
        return false;
    }

    auto pos = std::upper_bound(events_.begin(), events_.end(), event, earlier);
    events_.insert(pos, event);
    by_id_[event->id()] = event;
    return true;
}

void EventStore::clear() {
    events_.clear();
    by_id_.clear();
    next_generated_id_ = 1;
}

EventPtr EventStore::find(const std::string& id) const {
    auto it = by_id_.find(id);
    return it != by_id_.end() ? it->second : nullptr;
}

std::vector<EventPtr> EventStore::mainshocks(double min_magnitude) const {
    std::vector<EventPtr> result;
    for (const auto& ev : events_) {
        if (ev->magnitude() >= min_magnitude) {
            result.push_back(ev);
        }
    }
    return result;
}

std::vector<EventPtr> EventStore::eventsBetween(TimePoint start, TimePoint end) const {
    if (end < start) return {};

    auto lo = std::lower_bound(events_.begin(), events_.end(), start,
        [](const EventPtr& ev, TimePoint t) { return ev->time() < t; });
    auto hi = std::upper_bound(lo, events_.end(), end,
        [](TimePoint t, const EventPtr& ev) { return t < ev->time(); });

    return std::vector<EventPtr>(lo, hi);
}

bool EventStore::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open catalog file: " << filename << std::endl;
        return false;
    }

    std::string line;
    int line_num = 0;
    size_t loaded = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip comments, empty lines and the header
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("id,", 0) == 0) continue;

        // Format: id,time,latitude,longitude,depth_km,magnitude[,mag_type[,place]]
        auto fields = splitFields(line);
        if (fields.size() < 6) {
            std::cerr << "Parse error at line " << line_num
                      << ": expected at least 6 fields" << std::endl;
            continue;
        }

        auto time = parseTime(fields[1]);
        double lat, lon, depth, mag;
        if (!time || !parseDouble(fields[2], lat) || !parseDouble(fields[3], lon) ||
            !parseDouble(fields[4], depth) || !parseDouble(fields[5], mag)) {
            std::cerr << "Parse error at line " << line_num << std::endl;
            continue;
        }
        if (lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0) {
            std::cerr << "Invalid coordinates at line " << line_num << std::endl;
            continue;
        }

        MagnitudeType mag_type = MagnitudeType::Unknown;
        if (fields.size() > 6) {
            mag_type = stringToMagnitudeType(fields[6]);
        }

        // Unquoted place names may still contain commas
        std::string place;
        for (size_t i = 7; i < fields.size(); i++) {
            if (i > 7) place += ", ";
            place += fields[i];
        }

        Event event(fields[0], *time, GeoPoint(lat, lon, depth), mag, mag_type, place);
        if (!add(event)) {
            std::cerr << "Duplicate event id '" << fields[0]
                      << "' at line " << line_num << std::endl;
            continue;
        }
        loaded++;
    }

    std::cout << "Loaded " << loaded << " events from " << filename << std::endl;
    return true;
}

bool EventStore::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# OmoriFit event catalog\n";
    file << "id,time,latitude,longitude,depth_km,magnitude,mag_type,place\n";
    file << std::fixed;

    for (const auto& ev : events_) {
        file << csvField(ev->id()) << ","
             << formatTime(ev->time(), true) << ","
             << std::setprecision(5) << ev->latitude() << ","
             << ev->longitude() << ","
             << std::setprecision(2) << ev->depth() << ","
             << std::defaultfloat << std::setprecision(std::numeric_limits<double>::max_digits10)
             << ev->magnitude() << std::fixed << ","
             << magnitudeTypeToString(ev->magnitudeType()) << ","
             << csvField(ev->place()) << "\n";
    }

    file.flush();
    return file.good();
}

std::string EventStore::generateId() {
    std::string id;
    do {
        std::ostringstream oss;
        oss << "ev" << std::setw(6) << std::setfill('0') << next_generated_id_++;
        id = oss.str();
    } while (by_id_.count(id) > 0);
    return id;
}

} // namespace omorifit
