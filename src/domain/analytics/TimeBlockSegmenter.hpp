/**
 * @file TimeBlockSegmenter.hpp
 * @brief Splits a sorted event stream into time blocks and classifies each block.
 */

#pragma once

#include <vector>
#include "domain/browsing/TrackingConfig.hpp"
#include "AnalyticsTypes.hpp"

namespace sessionlens::domain::analytics {

class TimeBlockSegmenter {
public:
    /**
     * @brief Builds classified blocks from events sorted by timestamp.
     *
     * A block closes when the next event is more than `blockGap` later, when
     * there is no next event, or when it holds `maxBlockEvents` events.
     */
    static std::vector<TimeBlock> Segment(const BrowsingEventList& sortedEvents,
                                          const browsing::TrackingConfig& config);

    /**
     * @brief Idle, then focused, then distracted, otherwise active.
     */
    static BlockType Classify(const TimeBlock& block, const browsing::TrackingConfig& config);

    /** @brief Block length in minutes with a one-second floor, so rates stay finite. */
    static double RateMinutes(const TimeBlock& block);
};

} // namespace sessionlens::domain::analytics
