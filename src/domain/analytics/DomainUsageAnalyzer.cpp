/**
 * @file DomainUsageAnalyzer.cpp
 * @brief Implementation of DomainUsageAnalyzer.
 */

#include "domain/analytics/DomainUsageAnalyzer.hpp"
#include "domain/browsing/TimeUtils.hpp"
#include <algorithm>
#include <array>

namespace sessionlens::domain::analytics {

std::map<std::string, DomainAnalytics> DomainUsageAnalyzer::analyze(const BrowsingEventList& sortedEvents,
                                                                    const std::vector<TimeBlock>& blocks) const {
    std::map<std::string, BrowsingEventList> byDomain;
    for (const auto& event : sortedEvents) {
        if (!event.url) continue;
        if (auto domain = browsing::ExtractDomain(*event.url)) {
            byDomain[*domain].push_back(event);
        }
    }

    std::map<std::string, DomainAnalytics> result;
    for (const auto& [domain, events] : byDomain) {
        result.emplace(domain, analyzeDomain(domain, events, blocks));
    }
    return result;
}

DomainAnalytics DomainUsageAnalyzer::analyzeDomain(const std::string& domain,
                                                   const BrowsingEventList& events,
                                                   const std::vector<TimeBlock>& blocks) const {
    DomainAnalytics analytics;
    analytics.domain = domain;

    auto visits = groupVisits(events);
    analytics.totalTime = totalTime(visits);
    analytics.visitCount = static_cast<int>(visits.size());
    analytics.averageVisitDuration = visits.empty()
        ? 0.0
        : static_cast<double>(analytics.totalTime) / static_cast<double>(visits.size());

    Millis focusedTime = 0;
    for (const auto& block : blocks) {
        if (block.type != BlockType::Focused) continue;
        if (std::find(block.domains.begin(), block.domains.end(), domain) != block.domains.end()) {
            focusedTime += block.duration;
        }
    }
    if (analytics.totalTime > 0) {
        analytics.focusScore = std::min(100.0,
            static_cast<double>(focusedTime) / static_cast<double>(analytics.totalTime) * 100.0);
    }

    analytics.category = m_catalog.categorize(domain);
    analytics.productivity = ClassifyProductivity(analytics.focusScore, analytics.category);
    analytics.peakHours = FindPeakHours(events);
    return analytics;
}

std::vector<BrowsingEventList> DomainUsageAnalyzer::groupVisits(const BrowsingEventList& events) const {
    std::vector<BrowsingEventList> visits;
    if (events.empty()) return visits;

    BrowsingEventList current{events.front()};
    for (size_t i = 1; i < events.size(); ++i) {
        if (events[i].timestamp - events[i - 1].timestamp > m_config.visitGap) {
            visits.push_back(std::move(current));
            current.clear();
        }
        current.push_back(events[i]);
    }
    visits.push_back(std::move(current));
    return visits;
}

Millis DomainUsageAnalyzer::totalTime(const std::vector<BrowsingEventList>& visits) const {
    Millis total = 0;
    for (const auto& visit : visits) {
        if (visit.size() > 1) {
            total += visit.back().timestamp - visit.front().timestamp;
        } else {
            total += m_config.singleVisitEstimate;
        }
    }
    return total;
}

ProductivityLevel DomainUsageAnalyzer::ClassifyProductivity(double focusScore, DomainCategory category) {
    switch (category) {
        case DomainCategory::Work:
        case DomainCategory::Education:
            if (focusScore > 70) return ProductivityLevel::High;
            if (focusScore > 40) return ProductivityLevel::Medium;
            return ProductivityLevel::Low;
        case DomainCategory::News:
        case DomainCategory::Other:
            return focusScore > 80 ? ProductivityLevel::Medium : ProductivityLevel::Low;
        default:
            // Entertainment, social, shopping
            return ProductivityLevel::Low;
    }
}

std::vector<int> DomainUsageAnalyzer::FindPeakHours(const BrowsingEventList& events) {
    std::array<int, 24> hourCounts{};
    for (const auto& event : events) {
        hourCounts[browsing::LocalHour(event.timestamp)]++;
    }

    double average = static_cast<double>(events.size()) / 24.0;
    std::vector<int> peaks;
    for (int hour = 0; hour < 24; ++hour) {
        if (hourCounts[hour] > average * 1.5) {
            peaks.push_back(hour);
        }
    }
    return peaks;
}

} // namespace sessionlens::domain::analytics
