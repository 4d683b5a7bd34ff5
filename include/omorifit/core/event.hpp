#pragma once

#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace omorifit {

/**
 * Event - Catalog earthquake, immutable once constructed
 *
 * Events are shared between the catalog and every sequence that
 * references them, so identity is the id string (and the shared handle).
 */
class Event {
public:
    Event(const std::string& id, TimePoint time, const GeoPoint& location,
          double magnitude, MagnitudeType mag_type = MagnitudeType::Unknown,
          const std::string& place = "")
        : id_(id), time_(time), location_(location),
          magnitude_(magnitude), magnitude_type_(mag_type), place_(place) {}

    const std::string& id() const { return id_; }
    TimePoint time() const { return time_; }
    const GeoPoint& location() const { return location_; }
    double latitude() const { return location_.latitude; }
    double longitude() const { return location_.longitude; }
    double depth() const { return location_.depth; }
    double magnitude() const { return magnitude_; }
    MagnitudeType magnitudeType() const { return magnitude_type_; }
    const std::string& place() const { return place_; }

    // Surface distance to another event (km)
    double distanceTo(const Event& other) const {
        return location_.distanceTo(other.location_);
    }

    // Hours from this event to another (negative if other is earlier)
    double hoursUntil(const Event& other) const {
        return hoursBetween(time_, other.time_);
    }

    // Copy with a different id
    Event withId(const std::string& id) const {
        return Event(id, time_, location_, magnitude_, magnitude_type_, place_);
    }

    // One-line description, e.g. "M7.8 Pazarcik, Turkey (2023-02-06T01:17:34Z)"
    std::string label() const;

    // Multi-line summary
    std::string summary() const;

private:
    std::string id_;
    TimePoint time_;
    GeoPoint location_;
    double magnitude_;
    MagnitudeType magnitude_type_;
    std::string place_;
};

using EventPtr = std::shared_ptr<const Event>;

// ISO-8601 UTC time handling ("2023-02-06T01:17:34.500Z")
std::optional<TimePoint> parseTime(const std::string& text);
std::string formatTime(TimePoint t, bool with_fraction = false);

} // namespace omorifit
