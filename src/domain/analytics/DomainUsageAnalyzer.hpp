/**
 * @file DomainUsageAnalyzer.hpp
 * @brief Per-hostname usage statistics: visits, time, focus share, category and peak hours.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "domain/browsing/DomainCatalog.hpp"
#include "domain/browsing/TrackingConfig.hpp"
#include "AnalyticsTypes.hpp"

namespace sessionlens::domain::analytics {

class DomainUsageAnalyzer {
public:
    DomainUsageAnalyzer(const browsing::TrackingConfig& config, const browsing::DomainCatalog& catalog)
        : m_config(config), m_catalog(catalog) {}

    /**
     * @brief Groups sorted events by hostname and analyzes each group.
     * @param blocks Already classified blocks of the same batch; used for focus scores.
     */
    std::map<std::string, DomainAnalytics> analyze(const BrowsingEventList& sortedEvents,
                                                   const std::vector<TimeBlock>& blocks) const;

    DomainAnalytics analyzeDomain(const std::string& domain,
                                  const BrowsingEventList& events,
                                  const std::vector<TimeBlock>& blocks) const;

    /** @brief Splits a domain's events wherever consecutive events are more than `visitGap` apart. */
    std::vector<BrowsingEventList> groupVisits(const BrowsingEventList& events) const;

    Millis totalTime(const std::vector<BrowsingEventList>& visits) const;

    static ProductivityLevel ClassifyProductivity(double focusScore, DomainCategory category);

    static std::vector<int> FindPeakHours(const BrowsingEventList& events);

private:
    const browsing::TrackingConfig& m_config;
    const browsing::DomainCatalog& m_catalog;
};

} // namespace sessionlens::domain::analytics
