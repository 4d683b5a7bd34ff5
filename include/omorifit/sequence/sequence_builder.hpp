#pragma once

#include "aftershock_sequence.hpp"
#include "omorifit/core/analysis_config.hpp"
#include "omorifit/core/event_store.hpp"
#include <optional>

namespace omorifit {

/**
 * SequenceBuilder - Spatiotemporal aftershock association
 *
 * An event belongs to a mainshock's sequence when it occurs between
 * min_delay and the temporal window after it, lies within the spatial
 * radius (surface distance), and has detection_threshold <= M < M_main.
 */
class SequenceBuilder {
public:
    explicit SequenceBuilder(const AnalysisConfig& config) : config_(config) {}

    // Sequence of every qualifying candidate, or nullopt when fewer than
    // min_aftershocks qualify
    std::optional<AftershockSequence> build(const EventPtr& mainshock,
                                            const std::vector<EventPtr>& candidates) const;

    // Same, but only scans the store's time window
    std::optional<AftershockSequence> build(const EventPtr& mainshock,
                                            const EventStore& store) const;

    // Every qualifying candidate, time ordered, regardless of count
    std::vector<EventPtr> collect(const EventPtr& mainshock,
                                  const std::vector<EventPtr>& candidates) const;

    // Candidates from the store that fall inside the temporal window
    std::vector<EventPtr> window(const EventPtr& mainshock, const EventStore& store) const;

    // Association test for a single event
    bool associates(const Event& mainshock, const Event& candidate) const;

private:
    AnalysisConfig config_;
};

} // namespace omorifit
