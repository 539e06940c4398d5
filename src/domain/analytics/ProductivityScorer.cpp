/**
 * @file ProductivityScorer.cpp
 * @brief Implementation of ProductivityScorer.
 */

#include "domain/analytics/ProductivityScorer.hpp"
#include <algorithm>

namespace sessionlens::domain::analytics {

using browsing::EventType;

namespace {

TimeRange rangeOf(const TimeBlock& block) {
    return TimeRange{block.start, block.end, block.duration};
}

} // namespace

ProductivityMetrics ProductivityScorer::compute(const BrowsingEventList& sortedEvents,
                                                const std::vector<TimeBlock>& blocks) const {
    ProductivityMetrics metrics;
    if (sortedEvents.empty()) {
        metrics.sessionId = "unknown";
        return metrics;
    }

    metrics.sessionId = sortedEvents.front().sessionId.empty() ? "unknown" : sortedEvents.front().sessionId;
    metrics.totalTime = sortedEvents.back().timestamp - sortedEvents.front().timestamp;

    for (const auto& block : blocks) {
        switch (block.type) {
            case BlockType::Active:
            case BlockType::Focused:
                metrics.activeTime += block.duration;
                break;
            case BlockType::Idle:
                metrics.idleTime += block.duration;
                break;
            default:
                break;
        }

        if (block.type == BlockType::Focused && block.duration > m_config.deepWorkThreshold) {
            metrics.deepWorkPeriods.push_back(rangeOf(block));
        }
        if (block.type == BlockType::Distracted && block.duration > m_config.distractionThreshold) {
            metrics.distractionPeriods.push_back(rangeOf(block));
        }
    }

    for (const auto& event : sortedEvents) {
        switch (event.type) {
            case EventType::TabActivated: metrics.tabSwitches++; break;
            case EventType::WindowFocusChanged: metrics.windowSwitches++; break;
            case EventType::PageLoaded: metrics.pageCount++; break;
            case EventType::ScrollEvent: metrics.scrollEvents++; break;
            case EventType::ClickEvent: metrics.clickEvents++; break;
            case EventType::FormInteraction: metrics.formInteractions++; break;
            default: break;
        }

        if (event.url) {
            if (auto domain = browsing::ExtractDomain(*event.url)) {
                if (std::find(metrics.uniqueDomains.begin(), metrics.uniqueDomains.end(), *domain) ==
                    metrics.uniqueDomains.end()) {
                    metrics.uniqueDomains.push_back(*domain);
                }
            }
        }
    }

    metrics.focusScore = Score(metrics);
    return metrics;
}

double ProductivityScorer::Score(const ProductivityMetrics& metrics) {
    if (metrics.totalTime <= 0) return 0.0;

    const double total = static_cast<double>(metrics.totalTime);
    double score = 0.0;

    score += static_cast<double>(metrics.activeTime) / total * 40.0;
    score += std::min(static_cast<double>(metrics.deepWorkPeriods.size()) * 10.0, 30.0);

    const int domainCount = static_cast<int>(metrics.uniqueDomains.size());
    if (domainCount <= 3) {
        score += 20.0;
    } else {
        score += std::max(0.0, 20.0 - static_cast<double>(domainCount - 3) * 2.0);
    }

    score -= std::min(static_cast<double>(metrics.tabSwitches) * 0.5, 15.0);
    score -= static_cast<double>(metrics.distractionPeriods.size()) * 5.0;
    score += (1.0 - static_cast<double>(metrics.idleTime) / total) * 10.0;

    return std::clamp(score, 0.0, 100.0);
}

} // namespace sessionlens::domain::analytics
