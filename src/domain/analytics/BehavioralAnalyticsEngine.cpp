/**
 * @file BehavioralAnalyticsEngine.cpp
 * @brief Implementation of BehavioralAnalyticsEngine.
 */

#include "domain/analytics/BehavioralAnalyticsEngine.hpp"
#include "domain/analytics/DomainUsageAnalyzer.hpp"
#include "domain/analytics/PatternDetector.hpp"
#include "domain/analytics/ProductivityScorer.hpp"
#include "domain/analytics/TimeBlockSegmenter.hpp"
#include "domain/browsing/TimeUtils.hpp"
#include <algorithm>

namespace sessionlens::domain::analytics {

namespace {

constexpr std::size_t kMaxReportedPatterns = 10;
constexpr std::size_t kTopDomains = 10;
constexpr std::size_t kFocusLeaders = 5;

constexpr double kRecommendFocusBelow = 60.0;
constexpr std::size_t kRecommendMaxDistractions = 3;
constexpr std::size_t kRecommendMaxDomains = 20;

std::vector<DomainAnalytics> sortedBy(const std::map<std::string, DomainAnalytics>& domains,
                                      bool (*before)(const DomainAnalytics&, const DomainAnalytics&),
                                      std::size_t limit) {
    std::vector<DomainAnalytics> sorted;
    sorted.reserve(domains.size());
    for (const auto& [name, analytics] : domains) sorted.push_back(analytics);
    std::stable_sort(sorted.begin(), sorted.end(), before);
    if (sorted.size() > limit) sorted.resize(limit);
    return sorted;
}

} // namespace

BehavioralAnalyticsEngine::BehavioralAnalyticsEngine(browsing::TrackingConfig config,
                                                     browsing::DomainCatalog catalog)
    : m_config(std::move(config)), m_catalog(std::move(catalog)) {}

void BehavioralAnalyticsEngine::processEvents(const BrowsingEventList& events) {
    clearAnalytics();
    if (events.empty()) return;

    BrowsingEventList sorted = events;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const BrowsingEvent& a, const BrowsingEvent& b) { return a.timestamp < b.timestamp; });

    m_timeBlocks = TimeBlockSegmenter::Segment(sorted, m_config);
    m_domainAnalytics = DomainUsageAnalyzer(m_config, m_catalog).analyze(sorted, m_timeBlocks);
    m_activityPatterns = PatternDetector(m_config).detect(m_timeBlocks);

    auto metrics = ProductivityScorer(m_config).compute(sorted, m_timeBlocks);
    std::string sessionId = metrics.sessionId;
    m_cachedMetrics[sessionId] = std::move(metrics);
}

AnalyticsResults BehavioralAnalyticsEngine::queryAnalytics(const AnalyticsQuery& query) const {
    AnalyticsResults results;
    auto wants = [&query](const char* section) {
        return std::find(query.metrics.begin(), query.metrics.end(), section) != query.metrics.end();
    };

    if (wants("time")) results.time = timeSection(query.dateRange);
    if (wants("productivity")) results.productivity = productivitySection(query);
    if (wants("patterns")) results.patterns = patternSection(query.dateRange);
    if (wants("domains")) results.domains = domainSection();
    if (wants("activity")) results.activity = activitySection(query.dateRange);

    return results;
}

AnalyticsStats BehavioralAnalyticsEngine::getAnalyticsStats() const {
    AnalyticsStats stats;
    stats.timeBlocks = m_timeBlocks.size();
    stats.domains = m_domainAnalytics.size();
    stats.patterns = m_activityPatterns.size();
    stats.cachedMetrics = m_cachedMetrics.size();
    for (const auto& block : m_timeBlocks) {
        if (block.type == BlockType::Focused) stats.focusedBlocks++;
        if (block.type == BlockType::Distracted) stats.distractedBlocks++;
    }
    return stats;
}

void BehavioralAnalyticsEngine::clearAnalytics() {
    m_timeBlocks.clear();
    m_domainAnalytics.clear();
    m_activityPatterns.clear();
    m_cachedMetrics.clear();
}

std::vector<TimeBlock> BehavioralAnalyticsEngine::blocksInRange(const DateRange& range) const {
    std::vector<TimeBlock> blocks;
    for (const auto& block : m_timeBlocks) {
        if (block.start >= range.start && block.end <= range.end) {
            blocks.push_back(block);
        }
    }
    return blocks;
}

TimeAnalytics BehavioralAnalyticsEngine::timeSection(const DateRange& range) const {
    TimeAnalytics time;
    auto blocks = blocksInRange(range);
    for (const auto& block : blocks) {
        time.totalTime += block.duration;
        switch (block.type) {
            case BlockType::Focused:
                time.focusedTime += block.duration;
                time.activeTime += block.duration;
                break;
            case BlockType::Active:
                time.activeTime += block.duration;
                break;
            case BlockType::Distracted:
                time.distractedTime += block.duration;
                break;
            case BlockType::Idle:
                time.idleTime += block.duration;
                break;
        }
    }
    time.blockCount = static_cast<int>(blocks.size());
    if (!blocks.empty()) {
        time.averageBlockDuration = static_cast<double>(time.totalTime) / static_cast<double>(blocks.size());
    }
    return time;
}

std::optional<ProductivityAnalytics> BehavioralAnalyticsEngine::productivitySection(const AnalyticsQuery& query) const {
    const ProductivityMetrics* metrics = nullptr;
    if (query.sessionId) {
        auto it = m_cachedMetrics.find(*query.sessionId);
        if (it != m_cachedMetrics.end()) metrics = &it->second;
    } else if (!m_cachedMetrics.empty()) {
        metrics = &m_cachedMetrics.begin()->second;
    }
    if (!metrics) return std::nullopt;

    ProductivityAnalytics productivity;
    productivity.focusScore = metrics->focusScore;
    productivity.deepWorkPeriods = static_cast<int>(metrics->deepWorkPeriods.size());
    productivity.distractionPeriods = static_cast<int>(metrics->distractionPeriods.size());
    for (const auto& period : metrics->deepWorkPeriods) {
        productivity.totalDeepWorkTime += period.duration;
    }
    // No history is kept between batches.
    productivity.productivityTrend = "stable";
    productivity.recommendations = Recommendations(*metrics);
    return productivity;
}

PatternAnalytics BehavioralAnalyticsEngine::patternSection(const DateRange& range) const {
    PatternAnalytics analytics;
    double confidenceSum = 0.0;

    for (const auto& pattern : m_activityPatterns) {
        if (pattern.startTime < range.start || pattern.startTime > range.end) continue;
        analytics.totalPatterns++;
        analytics.patternTypes[PatternTypeToString(pattern.type)]++;
        confidenceSum += pattern.confidence;
        if (analytics.patterns.size() < kMaxReportedPatterns) {
            analytics.patterns.push_back(pattern);
        }
    }

    if (analytics.totalPatterns > 0) {
        analytics.averageConfidence = confidenceSum / analytics.totalPatterns;
    }

    int best = 0;
    for (const auto& [type, count] : analytics.patternTypes) {
        if (count > best) {
            best = count;
            analytics.mostCommonPattern = type;
        }
    }
    return analytics;
}

DomainReport BehavioralAnalyticsEngine::domainSection() const {
    DomainReport report;
    report.totalDomains = static_cast<int>(m_domainAnalytics.size());

    report.topDomains = sortedBy(m_domainAnalytics,
        [](const DomainAnalytics& a, const DomainAnalytics& b) { return a.totalTime > b.totalTime; },
        kTopDomains);
    report.focusLeaders = sortedBy(m_domainAnalytics,
        [](const DomainAnalytics& a, const DomainAnalytics& b) { return a.focusScore > b.focusScore; },
        kFocusLeaders);

    Millis allDomainsTime = 0;
    for (const auto& [name, analytics] : m_domainAnalytics) {
        auto& summary = report.productivityByCategory[browsing::CategoryToString(analytics.category)];
        summary.domains.push_back(analytics);
        summary.totalTime += analytics.totalTime;
        allDomainsTime += analytics.totalTime;
    }
    for (auto& [category, summary] : report.productivityByCategory) {
        double focusSum = 0.0;
        for (const auto& d : summary.domains) focusSum += d.focusScore;
        summary.averageFocusScore = summary.domains.empty() ? 0.0 : focusSum / summary.domains.size();
    }

    for (const auto& d : report.topDomains) {
        report.timeDistribution[d.domain] = allDomainsTime > 0
            ? static_cast<double>(d.totalTime) / static_cast<double>(allDomainsTime) * 100.0
            : 0.0;
    }
    return report;
}

ActivityAnalytics BehavioralAnalyticsEngine::activitySection(const DateRange& range) const {
    ActivityAnalytics activity;
    auto blocks = blocksInRange(range);
    activity.totalBlocks = static_cast<int>(blocks.size());

    int tabSwitches = 0;
    int windowSwitches = 0;
    for (const auto& block : blocks) {
        activity.blockTypes[BlockTypeToString(block.type)]++;
        tabSwitches += block.tabSwitches;
        windowSwitches += block.windowSwitches;
    }
    if (!blocks.empty()) {
        activity.averageTabSwitches = static_cast<double>(tabSwitches) / blocks.size();
        activity.averageWindowSwitches = static_cast<double>(windowSwitches) / blocks.size();
    }
    activity.hourlyActivity = HourlyActivity(blocks);
    return activity;
}

std::vector<std::string> BehavioralAnalyticsEngine::Recommendations(const ProductivityMetrics& metrics) {
    std::vector<std::string> recommendations;
    if (metrics.focusScore < kRecommendFocusBelow) {
        recommendations.push_back("Consider reducing tab switching to improve focus");
    }
    if (metrics.deepWorkPeriods.empty()) {
        recommendations.push_back("Try to establish longer periods of focused work");
    }
    if (metrics.distractionPeriods.size() > kRecommendMaxDistractions) {
        recommendations.push_back("Identify and minimize sources of distraction");
    }
    if (metrics.uniqueDomains.size() > kRecommendMaxDomains) {
        recommendations.push_back("Consider focusing on fewer websites to improve productivity");
    }
    return recommendations;
}

std::array<double, 24> BehavioralAnalyticsEngine::HourlyActivity(const std::vector<TimeBlock>& blocks) {
    std::array<double, 24> hourly{};
    for (const auto& block : blocks) {
        const int startHour = browsing::LocalHour(block.start);
        const int endHour = browsing::LocalHour(block.end);

        if (startHour == endHour && block.duration < browsing::kHour) {
            hourly[startHour] += static_cast<double>(block.duration);
            continue;
        }

        // Hours touched, wrapping past midnight; a block of a day or more touches all 24.
        int span = (endHour - startHour + 24) % 24 + 1;
        if (startHour == endHour || block.duration >= 24 * browsing::kHour) span = 24;
        const double share = static_cast<double>(block.duration) / span;
        for (int i = 0; i < span; ++i) {
            hourly[(startHour + i) % 24] += share;
        }
    }
    return hourly;
}

} // namespace sessionlens::domain::analytics
