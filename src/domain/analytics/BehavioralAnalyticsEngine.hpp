/**
 * @file BehavioralAnalyticsEngine.hpp
 * @brief Batch analytics over browsing events: blocks, domains, patterns and productivity.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "domain/browsing/DomainCatalog.hpp"
#include "domain/browsing/TrackingConfig.hpp"
#include "AnalyticsTypes.hpp"

namespace sessionlens::domain::analytics {

/**
 * @class BehavioralAnalyticsEngine
 * @brief Rebuilds its whole state from each batch and answers section queries against it.
 *
 * Single-threaded; the application layer serializes access.
 */
class BehavioralAnalyticsEngine {
public:
    explicit BehavioralAnalyticsEngine(browsing::TrackingConfig config,
                                       browsing::DomainCatalog catalog = browsing::DomainCatalog());

    /**
     * @brief Discards prior results and analyzes the batch. An empty batch leaves the engine empty.
     */
    void processEvents(const BrowsingEventList& events);

    /**
     * @brief Computes the sections named in `query.metrics`. Unknown names are ignored.
     */
    AnalyticsResults queryAnalytics(const AnalyticsQuery& query) const;

    /** @brief Takes effect on the next processEvents() call. */
    void updateConfig(const browsing::TrackingConfig& config) { m_config = config; }

    AnalyticsStats getAnalyticsStats() const;

    void clearAnalytics();

    const std::vector<TimeBlock>& getTimeBlocks() const { return m_timeBlocks; }
    const std::map<std::string, DomainAnalytics>& getDomainAnalytics() const { return m_domainAnalytics; }
    const std::vector<ActivityPattern>& getActivityPatterns() const { return m_activityPatterns; }
    const std::map<std::string, ProductivityMetrics>& getCachedMetrics() const { return m_cachedMetrics; }
    const browsing::TrackingConfig& getConfig() const { return m_config; }

private:
    std::vector<TimeBlock> blocksInRange(const DateRange& range) const;

    TimeAnalytics timeSection(const DateRange& range) const;
    std::optional<ProductivityAnalytics> productivitySection(const AnalyticsQuery& query) const;
    PatternAnalytics patternSection(const DateRange& range) const;
    DomainReport domainSection() const;
    ActivityAnalytics activitySection(const DateRange& range) const;

    static std::vector<std::string> Recommendations(const ProductivityMetrics& metrics);
    static std::array<double, 24> HourlyActivity(const std::vector<TimeBlock>& blocks);

    browsing::TrackingConfig m_config;
    browsing::DomainCatalog m_catalog;

    std::vector<TimeBlock> m_timeBlocks;
    std::map<std::string, DomainAnalytics> m_domainAnalytics;
    std::vector<ActivityPattern> m_activityPatterns;
    std::map<std::string, ProductivityMetrics> m_cachedMetrics;
};

} // namespace sessionlens::domain::analytics
