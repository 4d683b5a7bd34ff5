#pragma once

#include "omorifit/core/event.hpp"
#include <vector>

namespace omorifit {

/**
 * AftershockSequence - A mainshock and the events associated with it
 *
 * Members are time ordered and unique. Built by SequenceBuilder, which
 * guarantees every member satisfies the association rules.
 */
class AftershockSequence {
public:
    AftershockSequence(EventPtr mainshock, std::vector<EventPtr> members)
        : mainshock_(std::move(mainshock)), members_(std::move(members)) {}

    const EventPtr& mainshock() const { return mainshock_; }
    const std::vector<EventPtr>& members() const { return members_; }

    size_t size() const { return members_.size(); }
    bool empty() const { return members_.empty(); }

    // Hours after the mainshock, one per member, ascending
    std::vector<double> elapsedHours() const {
        std::vector<double> hours;
        hours.reserve(members_.size());
        for (const auto& ev : members_) {
            hours.push_back(hoursBetween(mainshock_->time(), ev->time()));
        }
        return hours;
    }

    // Elapsed time of the last member
    double durationHours() const {
        if (members_.empty()) return 0.0;
        return hoursBetween(mainshock_->time(), members_.back()->time());
    }

private:
    EventPtr mainshock_;
    std::vector<EventPtr> members_;
};

} // namespace omorifit
