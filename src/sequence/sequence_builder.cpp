#include "omorifit/sequence/sequence_builder.hpp"
#include <algorithm>
#include <set>

namespace omorifit {

bool SequenceBuilder::associates(const Event& mainshock, const Event& candidate) const {
    // Catalog ids identify events only when present
    if (&candidate == &mainshock ||
        (!candidate.id().empty() && candidate.id() == mainshock.id())) {
        return false;
    }

    // Magnitude
    double mag = candidate.magnitude();
    if (mag < config_.detection_threshold || mag >= mainshock.magnitude()) {
        return false;
    }

    // Time window after the mainshock
    double dt = mainshock.hoursUntil(candidate);
    if (dt < config_.minDelayHours() || dt > config_.maxDelayHours()) {
        return false;
    }

    // Surface distance, depth ignored
    return mainshock.distanceTo(candidate) <= config_.spatial_radius_km;
}

std::vector<EventPtr> SequenceBuilder::collect(
        const EventPtr& mainshock, const std::vector<EventPtr>& candidates) const {
    std::vector<EventPtr> members;
    if (!mainshock) return members;

    std::set<const Event*> seen;
    std::set<std::string> seen_ids;
    for (const auto& ev : candidates) {
        if (!ev || !associates(*mainshock, *ev)) continue;
        if (!seen.insert(ev.get()).second) continue;
        if (!ev->id().empty() && !seen_ids.insert(ev->id()).second) continue;
        members.push_back(ev);
    }

    std::stable_sort(members.begin(), members.end(),
        [](const EventPtr& a, const EventPtr& b) {
            if (a->time() != b->time()) return a->time() < b->time();
            return a->id() < b->id();
        });
    return members;
}

std::vector<EventPtr> SequenceBuilder::window(const EventPtr& mainshock,
                                              const EventStore& store) const {
    if (!mainshock) return {};
    return store.eventsBetween(addHours(mainshock->time(), config_.minDelayHours()),
                               addHours(mainshock->time(), config_.maxDelayHours()));
}

std::optional<AftershockSequence> SequenceBuilder::build(
        const EventPtr& mainshock, const std::vector<EventPtr>& candidates) const {
    auto members = collect(mainshock, candidates);
    if (!mainshock || members.size() < static_cast<size_t>(config_.min_aftershocks)) {
        return std::nullopt;
    }
    return AftershockSequence(mainshock, std::move(members));
}

std::optional<AftershockSequence> SequenceBuilder::build(
        const EventPtr& mainshock, const EventStore& store) const {
    return build(mainshock, window(mainshock, store));
}

} // namespace omorifit
