#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "domain/analytics/BehavioralAnalyticsEngine.hpp"
#include "domain/analytics/PatternDetector.hpp"
#include "domain/analytics/ProductivityScorer.hpp"
#include "TestEventFactory.hpp"

using namespace sessionlens::domain::analytics;
using namespace sessionlens::domain::browsing;
using namespace sessionlens::test;

namespace {

const std::vector<std::string> kAllSections = {"time", "productivity", "patterns", "domains", "activity"};

AnalyticsQuery everything() {
    AnalyticsQuery query;
    query.dateRange = {0, std::numeric_limits<Timestamp>::max()};
    query.metrics = kAllSections;
    return query;
}

/** 40 tab activations, one every 5 s, cycling four sites. */
BrowsingEventList multitaskingEvents() {
    const char* sites[] = {"https://github.com/", "https://www.youtube.com/", "https://reddit.com/", "https://cnn.com/"};
    BrowsingEventList events;
    for (int i = 0; i < 40; ++i) {
        events.push_back(MakeEvent(kBaseTime + i * 5000, EventType::TabActivated, std::string(sites[i % 4])));
    }
    return events;
}

void testDeepWork() {
    std::cout << "[Test] Sustained single-domain work..." << std::endl;
    BehavioralAnalyticsEngine engine{TrackingConfig()};
    engine.processEvents(SteadyEvents(30, 60000, "https://docs.google.com/document/d/1"));

    auto stats = engine.getAnalyticsStats();
    assert(stats.timeBlocks == 1);
    assert(stats.focusedBlocks == 1);
    assert(stats.domains == 1);
    assert(stats.patterns == 1);
    assert(stats.cachedMetrics == 1);
    assert(engine.getActivityPatterns()[0].type == PatternType::FocusPeriod);
    assert(engine.getActivityPatterns()[0].confidence == 0.9);

    const auto& metrics = engine.getCachedMetrics().at("test-session");
    assert(metrics.deepWorkPeriods.size() == 1);
    assert(metrics.activeTime == metrics.totalTime);
    // 40 active share + 10 deep work + 20 domain bonus + 10 non-idle share
    assert(std::fabs(metrics.focusScore - 80.0) < 1e-9);

    auto results = engine.queryAnalytics(everything());
    assert(results.time && results.productivity && results.patterns && results.domains && results.activity);
    assert(results.time->totalTime == 29 * 60000);
    assert(results.time->focusedTime <= results.time->activeTime);
    assert(results.time->activeTime <= results.time->totalTime);
    assert(results.productivity->deepWorkPeriods == 1);
    assert(results.productivity->totalDeepWorkTime == 29 * 60000);
    assert(results.productivity->productivityTrend == "stable");
    // Focused, no distraction, one site: nothing to recommend
    assert(results.productivity->recommendations.empty());
    assert(results.patterns->mostCommonPattern == "focus_period");
    assert(results.domains->totalDomains == 1);
    assert(results.domains->topDomains[0].domain == "docs.google.com");
    assert(results.domains->productivityByCategory.at("work").totalTime == 29 * 60000);
    assert(results.domains->timeDistribution.at("docs.google.com") == 100.0);
    assert(results.activity->blockTypes.at("focused") == 1);

    double hourly = 0.0;
    for (double ms : results.activity->hourlyActivity) hourly += ms;
    assert(std::fabs(hourly - 29 * 60000) < 1e-6);
    std::cout << "[PASS] Sustained single-domain work." << std::endl;
}

void testMultitasking() {
    std::cout << "[Test] Rapid switching across four sites..." << std::endl;
    BehavioralAnalyticsEngine engine{TrackingConfig()};
    engine.processEvents(multitaskingEvents());

    auto stats = engine.getAnalyticsStats();
    assert(stats.patterns > 0);
    assert(stats.domains == 4);
    assert(stats.distractedBlocks == 1);

    AnalyticsQuery query = everything();
    query.metrics = {"patterns", "productivity", "bogus"};
    auto results = engine.queryAnalytics(query);
    assert(!results.time && !results.domains && !results.activity);
    assert(results.patterns->mostCommonPattern == "multitasking");
    assert(results.patterns->patternTypes.at("multitasking") == 1);
    assert(results.patterns->patterns[0].characteristics.domainCount == 4);
    assert(results.patterns->patterns[0].characteristics.tabSwitchRate > 3.0);

    const auto& recs = results.productivity->recommendations;
    assert(!recs.empty());
    assert(recs.front() == "Consider reducing tab switching to improve focus");
    assert(results.productivity->focusScore >= 0.0 && results.productivity->focusScore <= 100.0);
    std::cout << "[PASS] Rapid switching across four sites." << std::endl;
}

void testPatternRules() {
    std::cout << "[Test] Pattern rules..." << std::endl;
    TrackingConfig config;
    PatternDetector detector(config);

    // Many quick page views on one site
    TimeBlock spree;
    spree.start = kBaseTime;
    spree.duration = 60000;
    spree.events = SteadyEvents(12, 5000, "https://a.com/");
    spree.domains = {"a.com"};
    auto pattern = detector.detectPattern(spree);
    assert(pattern && pattern->type == PatternType::BrowsingSpree);
    assert(pattern->confidence == 0.7);

    // Slow reading across two sites with plenty of scrolling
    TimeBlock research;
    research.start = kBaseTime;
    research.duration = 400000;
    research.events = SteadyEvents(8, 50000, "https://a.com/", EventType::ScrollEvent);
    research.domains = {"a.com", "b.com"};
    pattern = detector.detectPattern(research);
    assert(pattern && pattern->type == PatternType::ResearchMode);
    assert(pattern->characteristics.scrollActivity == 8);

    // Quiet block: nothing
    TimeBlock quiet;
    quiet.start = kBaseTime;
    quiet.duration = 400000;
    quiet.events = SteadyEvents(2, 400000, "https://a.com/");
    quiet.domains = {"a.com"};
    assert(!detector.detectPattern(quiet));
    std::cout << "[PASS] Pattern rules." << std::endl;
}

void testProductivityScore() {
    std::cout << "[Test] Productivity score bounds..." << std::endl;
    ProductivityMetrics empty;
    assert(ProductivityScorer::Score(empty) == 0.0);

    ProductivityMetrics noisy;
    noisy.totalTime = 1000000;
    noisy.idleTime = 1000000;
    noisy.tabSwitches = 200;
    for (int i = 0; i < 10; ++i) noisy.distractionPeriods.push_back({});
    for (int i = 0; i < 30; ++i) noisy.uniqueDomains.push_back("d" + std::to_string(i) + ".com");
    assert(ProductivityScorer::Score(noisy) == 0.0);

    ProductivityMetrics ideal;
    ideal.totalTime = 1000000;
    ideal.activeTime = 1000000;
    for (int i = 0; i < 5; ++i) ideal.deepWorkPeriods.push_back({});
    assert(ProductivityScorer::Score(ideal) == 100.0);

    // Single event: zero total time scores zero
    BehavioralAnalyticsEngine engine{TrackingConfig()};
    engine.processEvents({MakeEvent(kBaseTime, EventType::PageLoaded, std::string("https://a.com/"), "")});
    const auto& metrics = engine.getCachedMetrics().at("unknown");
    assert(metrics.focusScore == 0.0);
    assert(metrics.pageCount == 1);
    std::cout << "[PASS] Productivity score bounds." << std::endl;
}

void testResetAndRanges() {
    std::cout << "[Test] Batch reset and query ranges..." << std::endl;
    BehavioralAnalyticsEngine engine{TrackingConfig()};
    engine.processEvents(multitaskingEvents());
    assert(engine.getAnalyticsStats().timeBlocks > 0);

    // Inverted range: empty sections, no throw
    AnalyticsQuery inverted = everything();
    inverted.dateRange = {kBaseTime + 1000000, kBaseTime};
    auto results = engine.queryAnalytics(inverted);
    assert(results.time->totalTime == 0);
    assert(results.time->blockCount == 0);
    assert(results.patterns->totalPatterns == 0);
    assert(results.patterns->mostCommonPattern.empty());
    assert(results.activity->totalBlocks == 0);

    // Unknown session: no productivity section
    AnalyticsQuery other = everything();
    other.sessionId = "someone-else";
    assert(!engine.queryAnalytics(other).productivity);

    // Order of input does not matter
    auto shuffled = multitaskingEvents();
    std::reverse(shuffled.begin(), shuffled.end());
    BehavioralAnalyticsEngine second{TrackingConfig()};
    second.processEvents(shuffled);
    assert(second.getTimeBlocks().size() == engine.getTimeBlocks().size());
    assert(second.getTimeBlocks()[0].duration == engine.getTimeBlocks()[0].duration);

    // An empty batch discards everything
    engine.processEvents({});
    auto stats = engine.getAnalyticsStats();
    assert(stats.timeBlocks == 0);
    assert(stats.domains == 0);
    assert(stats.patterns == 0);
    assert(stats.cachedMetrics == 0);
    assert(!engine.queryAnalytics(everything()).productivity);

    // Config changes apply to the next batch
    TrackingConfig shortDeepWork;
    shortDeepWork.deepWorkThreshold = 60000;
    engine.updateConfig(shortDeepWork);
    engine.processEvents(SteadyEvents(5, 60000, "https://github.com/"));
    assert(engine.getCachedMetrics().begin()->second.deepWorkPeriods.size() == 1);

    engine.clearAnalytics();
    assert(engine.getAnalyticsStats().timeBlocks == 0);
    std::cout << "[PASS] Batch reset and query ranges." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Behavioral Analytics Engine Test..." << std::endl;
    testDeepWork();
    testMultitasking();
    testPatternRules();
    testProductivityScore();
    testResetAndRanges();
    std::cout << "[PASS] Behavioral Analytics Engine Test." << std::endl;
    return 0;
}
