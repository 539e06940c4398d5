/**
 * @file AnalyticsJson.cpp
 * @brief Implementation of AnalyticsJson.
 */

#include "infrastructure/AnalyticsJson.hpp"

namespace sessionlens::infrastructure {

using json = nlohmann::json;
using namespace domain::analytics;
using namespace domain::session;

namespace {

json rangeToJson(const TimeRange& range) {
    return {{"start", range.start}, {"end", range.end}, {"duration", range.duration}};
}

json domainList(const std::vector<DomainAnalytics>& domains) {
    json list = json::array();
    for (const auto& d : domains) list.push_back(AnalyticsJson::ToJson(d));
    return list;
}

} // namespace

json AnalyticsJson::ToJson(const SessionSignal& signal) {
    return {
        {"type", SignalTypeToString(signal.type)},
        {"strength", signal.strength},
        {"timestamp", signal.timestamp},
        {"metadata", signal.metadata}
    };
}

json AnalyticsJson::ToJson(const SessionBoundary& boundary) {
    return {
        {"id", boundary.id},
        {"type", BoundaryTypeToString(boundary.type)},
        {"reason", BoundaryReasonToString(boundary.reason)},
        {"timestamp", boundary.timestamp},
        {"sessionId", boundary.sessionId},
        {"metadata", boundary.metadata}
    };
}

json AnalyticsJson::ToJson(const DetectionStats& stats) {
    return {
        {"recentEvents", stats.recentEvents},
        {"currentDomains", stats.currentDomains},
        {"navigationGaps", stats.navigationGaps},
        {"domainTransitions", stats.domainTransitions},
        {"sessionSignals", stats.sessionSignals},
        {"windowCount", stats.windowCount},
        {"tabCount", stats.tabCount}
    };
}

json AnalyticsJson::ToJson(const DomainAnalytics& analytics) {
    return {
        {"domain", analytics.domain},
        {"totalTime", analytics.totalTime},
        {"visitCount", analytics.visitCount},
        {"averageVisitDuration", analytics.averageVisitDuration},
        {"focusScore", analytics.focusScore},
        {"productivity", ProductivityToString(analytics.productivity)},
        {"category", domain::browsing::CategoryToString(analytics.category)},
        {"peakHours", analytics.peakHours},
        {"patterns", analytics.patterns}
    };
}

json AnalyticsJson::ToJson(const ActivityPattern& pattern) {
    return {
        {"type", PatternTypeToString(pattern.type)},
        {"startTime", pattern.startTime},
        {"duration", pattern.duration},
        {"confidence", pattern.confidence},
        {"characteristics", {
            {"domainCount", pattern.characteristics.domainCount},
            {"tabSwitchRate", pattern.characteristics.tabSwitchRate},
            {"averagePageTime", pattern.characteristics.averagePageTime},
            {"scrollActivity", pattern.characteristics.scrollActivity}
        }}
    };
}

json AnalyticsJson::ToJson(const ProductivityMetrics& metrics) {
    json deepWork = json::array();
    for (const auto& r : metrics.deepWorkPeriods) deepWork.push_back(rangeToJson(r));
    json distractions = json::array();
    for (const auto& r : metrics.distractionPeriods) distractions.push_back(rangeToJson(r));

    return {
        {"sessionId", metrics.sessionId},
        {"totalTime", metrics.totalTime},
        {"activeTime", metrics.activeTime},
        {"idleTime", metrics.idleTime},
        {"tabSwitches", metrics.tabSwitches},
        {"windowSwitches", metrics.windowSwitches},
        {"uniqueDomains", metrics.uniqueDomains},
        {"pageCount", metrics.pageCount},
        {"scrollEvents", metrics.scrollEvents},
        {"clickEvents", metrics.clickEvents},
        {"formInteractions", metrics.formInteractions},
        {"deepWorkPeriods", deepWork},
        {"distractionPeriods", distractions},
        {"focusScore", metrics.focusScore}
    };
}

json AnalyticsJson::ToJson(const AnalyticsResults& results) {
    json j = json::object();

    if (results.time) {
        const auto& t = *results.time;
        j["time"] = {
            {"totalTime", t.totalTime},
            {"activeTime", t.activeTime},
            {"focusedTime", t.focusedTime},
            {"distractedTime", t.distractedTime},
            {"idleTime", t.idleTime},
            {"blockCount", t.blockCount},
            {"averageBlockDuration", t.averageBlockDuration}
        };
    }

    if (results.productivity) {
        const auto& p = *results.productivity;
        j["productivity"] = {
            {"focusScore", p.focusScore},
            {"deepWorkPeriods", p.deepWorkPeriods},
            {"distractionPeriods", p.distractionPeriods},
            {"totalDeepWorkTime", p.totalDeepWorkTime},
            {"productivityTrend", p.productivityTrend},
            {"recommendations", p.recommendations}
        };
    }

    if (results.patterns) {
        const auto& p = *results.patterns;
        json patterns = json::array();
        for (const auto& pattern : p.patterns) patterns.push_back(ToJson(pattern));
        j["patterns"] = {
            {"totalPatterns", p.totalPatterns},
            {"patternTypes", p.patternTypes},
            {"averageConfidence", p.averageConfidence},
            {"mostCommonPattern", p.mostCommonPattern},
            {"patterns", patterns}
        };
    }

    if (results.domains) {
        const auto& d = *results.domains;
        json categories = json::object();
        for (const auto& [name, summary] : d.productivityByCategory) {
            categories[name] = {
                {"domains", domainList(summary.domains)},
                {"totalTime", summary.totalTime},
                {"averageFocusScore", summary.averageFocusScore}
            };
        }
        j["domains"] = {
            {"totalDomains", d.totalDomains},
            {"topDomains", domainList(d.topDomains)},
            {"productivityByCategory", categories},
            {"focusLeaders", domainList(d.focusLeaders)},
            {"timeDistribution", d.timeDistribution}
        };
    }

    if (results.activity) {
        const auto& a = *results.activity;
        json hourly = json::object();
        for (int hour = 0; hour < 24; ++hour) {
            hourly[std::to_string(hour)] = a.hourlyActivity[hour];
        }
        j["activity"] = {
            {"totalBlocks", a.totalBlocks},
            {"blockTypes", a.blockTypes},
            {"averageTabSwitches", a.averageTabSwitches},
            {"averageWindowSwitches", a.averageWindowSwitches},
            {"hourlyActivity", hourly}
        };
    }

    return j;
}

json AnalyticsJson::ToJson(const AnalyticsStats& stats) {
    return {
        {"timeBlocks", stats.timeBlocks},
        {"domains", stats.domains},
        {"patterns", stats.patterns},
        {"cachedMetrics", stats.cachedMetrics},
        {"focusedBlocks", stats.focusedBlocks},
        {"distractedBlocks", stats.distractedBlocks}
    };
}

} // namespace sessionlens::infrastructure
