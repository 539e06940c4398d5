/**
 * @file PatternDetector.hpp
 * @brief Recognizes behavioral patterns in classified time blocks.
 */

#pragma once

#include <optional>
#include <vector>
#include "domain/browsing/TrackingConfig.hpp"
#include "AnalyticsTypes.hpp"

namespace sessionlens::domain::analytics {

class PatternDetector {
public:
    explicit PatternDetector(const browsing::TrackingConfig& config) : m_config(config) {}

    /** @brief One pattern at most per block, in block order. */
    std::vector<ActivityPattern> detect(const std::vector<TimeBlock>& blocks) const;

    /**
     * @brief First match of focus_period, multitasking, browsing_spree, research_mode.
     */
    std::optional<ActivityPattern> detectPattern(const TimeBlock& block) const;

    static PatternCharacteristics Characterize(const TimeBlock& block);

private:
    const browsing::TrackingConfig& m_config;
};

} // namespace sessionlens::domain::analytics
