#pragma once

#include "event.hpp"
#include <map>
#include <memory>
#include <vector>

namespace omorifit {

/**
 * EventStore - In-memory earthquake catalog
 *
 * Events are kept sorted by origin time (ties broken by id) and ids are
 * unique. The store hands out shared handles; events never change after
 * insertion.
 */
class EventStore {
public:
    EventStore() = default;

    // Add an event. An empty id is replaced by a generated one.
    // Returns false if an event with the same id is already stored.
    bool add(const Event& event);
    bool add(EventPtr event);

    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }
    void clear();

    // All events, time ascending
    const std::vector<EventPtr>& events() const { return events_; }

    EventPtr find(const std::string& id) const;

    // Mainshock candidates: magnitude >= min_magnitude, time ascending
    std::vector<EventPtr> mainshocks(double min_magnitude) const;

    // Events with start <= time <= end
    std::vector<EventPtr> eventsBetween(TimePoint start, TimePoint end) const;

    // Catalog text file:
    //   id,time,latitude,longitude,depth_km,magnitude[,mag_type[,place]]
    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

private:
    std::vector<EventPtr> events_;
    std::map<std::string, EventPtr> by_id_;
    size_t next_generated_id_ = 1;

    std::string generateId();
};

} // namespace omorifit
