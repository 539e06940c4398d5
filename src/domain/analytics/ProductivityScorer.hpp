/**
 * @file ProductivityScorer.hpp
 * @brief Aggregates a batch into productivity metrics and a 0-100 focus score.
 */

#pragma once

#include <vector>
#include "domain/browsing/TrackingConfig.hpp"
#include "AnalyticsTypes.hpp"

namespace sessionlens::domain::analytics {

class ProductivityScorer {
public:
    explicit ProductivityScorer(const browsing::TrackingConfig& config) : m_config(config) {}

    ProductivityMetrics compute(const BrowsingEventList& sortedEvents,
                                const std::vector<TimeBlock>& blocks) const;

    /**
     * @brief 40 * active share + deep work bonus + domain bonus - switching and distraction penalties
     * + 10 * non-idle share, clamped to [0, 100].
     */
    static double Score(const ProductivityMetrics& metrics);

private:
    const browsing::TrackingConfig& m_config;
};

} // namespace sessionlens::domain::analytics
