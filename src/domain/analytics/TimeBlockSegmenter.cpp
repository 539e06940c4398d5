/**
 * @file TimeBlockSegmenter.cpp
 * @brief Implementation of TimeBlockSegmenter.
 */

#include "domain/analytics/TimeBlockSegmenter.hpp"
#include "domain/browsing/TimeUtils.hpp"
#include <algorithm>

namespace sessionlens::domain::analytics {

using browsing::EventType;

namespace {

constexpr Millis kFocusedMinDuration = 180000;  // 3 minutes
constexpr double kFocusedMaxDomains = 2;
constexpr double kFocusedMaxSwitchRate = 2.0;
constexpr double kDistractedMinDomains = 5;
constexpr double kDistractedMinSwitchRate = 5.0;

TimeBlock openBlock(Timestamp start) {
    TimeBlock block;
    block.start = start;
    return block;
}

} // namespace

std::vector<TimeBlock> TimeBlockSegmenter::Segment(const BrowsingEventList& sortedEvents,
                                                   const browsing::TrackingConfig& config) {
    std::vector<TimeBlock> blocks;
    if (sortedEvents.empty()) return blocks;

    TimeBlock current = openBlock(sortedEvents.front().timestamp);

    for (size_t i = 0; i < sortedEvents.size(); ++i) {
        const auto& event = sortedEvents[i];
        const BrowsingEvent* next = (i + 1 < sortedEvents.size()) ? &sortedEvents[i + 1] : nullptr;

        current.events.push_back(event);

        if (event.url) {
            if (auto domain = browsing::ExtractDomain(*event.url)) {
                if (std::find(current.domains.begin(), current.domains.end(), *domain) == current.domains.end()) {
                    current.domains.push_back(*domain);
                }
            }
        }

        if (event.type == EventType::TabActivated) {
            current.tabSwitches++;
        } else if (event.type == EventType::WindowFocusChanged) {
            current.windowSwitches++;
        }

        bool shouldClose = !next ||
                           (next->timestamp - event.timestamp > config.blockGap) ||
                           (current.events.size() >= config.maxBlockEvents);

        if (shouldClose) {
            current.end = event.timestamp;
            current.duration = current.end - current.start;
            current.type = Classify(current, config);
            blocks.push_back(std::move(current));

            if (next) {
                current = openBlock(next->timestamp);
            }
        }
    }

    return blocks;
}

double TimeBlockSegmenter::RateMinutes(const TimeBlock& block) {
    return browsing::ToMinutes(std::max<Millis>(block.duration, 1000));
}

BlockType TimeBlockSegmenter::Classify(const TimeBlock& block, const browsing::TrackingConfig& config) {
    const double minutes = RateMinutes(block);
    const double eventDensity = static_cast<double>(block.events.size()) / minutes;
    const double domainDiversity = static_cast<double>(block.domains.size());
    const double switchRate = static_cast<double>(block.tabSwitches + block.windowSwitches) / minutes;

    // A long block only counts as idle when its activity is sparse.
    if (eventDensity < config.minActiveDensity ||
        (block.duration > config.idleBlockDuration && eventDensity < config.sustainedActivityDensity)) {
        return BlockType::Idle;
    }

    if (domainDiversity <= kFocusedMaxDomains &&
        switchRate < kFocusedMaxSwitchRate &&
        block.duration > kFocusedMinDuration) {
        return BlockType::Focused;
    }

    if (domainDiversity > kDistractedMinDomains || switchRate > kDistractedMinSwitchRate) {
        return BlockType::Distracted;
    }

    return BlockType::Active;
}

} // namespace sessionlens::domain::analytics
