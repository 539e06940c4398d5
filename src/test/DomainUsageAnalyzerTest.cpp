#include <algorithm>
#include <cassert>
#include <iostream>

#include "domain/analytics/DomainUsageAnalyzer.hpp"
#include "domain/analytics/TimeBlockSegmenter.hpp"
#include "domain/browsing/TimeUtils.hpp"
#include "TestEventFactory.hpp"

using namespace sessionlens::domain::analytics;
using namespace sessionlens::domain::browsing;
using namespace sessionlens::test;

namespace {

const TrackingConfig kConfig;
const DomainCatalog kCatalog;

void testHostnames() {
    std::cout << "[Test] Hostname extraction and categories..." << std::endl;
    assert(ExtractDomain("https://GitHub.com/org/repo?q=1") == std::optional<std::string>("github.com"));
    assert(ExtractDomain("http://user:pw@news.bbc.com:8080/path") == std::optional<std::string>("news.bbc.com"));
    assert(!ExtractDomain("about:blank"));
    assert(!ExtractDomain("not a url"));
    assert(!ExtractDomain(""));
    assert(RootDomain("mail.google.com") == std::optional<std::string>("google.com"));
    assert(!RootDomain("localhost"));

    assert(kCatalog.categorize("github.com") == DomainCategory::Work);
    assert(kCatalog.categorize("www.youtube.com") == DomainCategory::Entertainment);
    assert(kCatalog.categorize("en.wikipedia.org") == DomainCategory::Education);
    assert(kCatalog.categorize("example.com") == DomainCategory::Other);

    // Swappable table
    DomainCatalog custom(std::vector<DomainCatalog::Entry>{{DomainCategory::Shopping, {"example.com"}}});
    assert(custom.categorize("shop.example.com") == DomainCategory::Shopping);
    assert(custom.categorize("github.com") == DomainCategory::Other);

    assert(CategoryFromString("news") == std::optional<DomainCategory>(DomainCategory::News));
    assert(!CategoryFromString("gaming"));
    std::cout << "[PASS] Hostname extraction and categories." << std::endl;
}

void testVisits() {
    std::cout << "[Test] Visit grouping and time..." << std::endl;
    DomainUsageAnalyzer analyzer(kConfig, kCatalog);

    BrowsingEventList events = SteadyEvents(3, 60000, "https://example.com/");
    // Gap of exactly visitGap keeps the visit going
    events.push_back(MakeEvent(kBaseTime + 120000 + 600000, EventType::TabUpdated, std::string("https://example.com/")));
    assert(analyzer.groupVisits(events).size() == 1);

    events.push_back(MakeEvent(kBaseTime + 720000 + 600001, EventType::TabUpdated, std::string("https://example.com/")));
    auto visits = analyzer.groupVisits(events);
    assert(visits.size() == 2);
    assert(visits[1].size() == 1);

    // 720000 for the first visit, plus the single-event estimate
    assert(analyzer.totalTime(visits) == 720000 + kConfig.singleVisitEstimate);

    auto analytics = analyzer.analyzeDomain("example.com", events, {});
    assert(analytics.visitCount == 2);
    assert(analytics.totalTime == 750000);
    assert(analytics.averageVisitDuration == 375000.0);
    assert(analytics.focusScore == 0.0);
    assert(analytics.category == DomainCategory::Other);
    assert(analytics.productivity == ProductivityLevel::Low);
    assert(analytics.patterns.empty());
    std::cout << "[PASS] Visit grouping and time." << std::endl;
}

void testFocusAndProductivity() {
    std::cout << "[Test] Focus score and productivity..." << std::endl;
    DomainUsageAnalyzer analyzer(kConfig, kCatalog);

    auto events = SteadyEvents(30, 60000, "https://github.com/org/repo");
    events.push_back(MakeEvent(kBaseTime + 10000, EventType::TabUpdated, std::string("not a url")));
    events.push_back(MakeEvent(kBaseTime + 20000, EventType::ScrollEvent));
    std::stable_sort(events.begin(), events.end(),
                     [](const auto& a, const auto& b) { return a.timestamp < b.timestamp; });
    auto blocks = TimeBlockSegmenter::Segment(events, kConfig);

    auto result = analyzer.analyze(events, blocks);
    assert(result.size() == 1);
    const auto& github = result.at("github.com");
    assert(github.focusScore == 100.0);
    assert(github.category == DomainCategory::Work);
    assert(github.productivity == ProductivityLevel::High);

    assert(DomainUsageAnalyzer::ClassifyProductivity(71, DomainCategory::Education) == ProductivityLevel::High);
    assert(DomainUsageAnalyzer::ClassifyProductivity(70, DomainCategory::Work) == ProductivityLevel::Medium);
    assert(DomainUsageAnalyzer::ClassifyProductivity(40, DomainCategory::Work) == ProductivityLevel::Low);
    assert(DomainUsageAnalyzer::ClassifyProductivity(81, DomainCategory::News) == ProductivityLevel::Medium);
    assert(DomainUsageAnalyzer::ClassifyProductivity(80, DomainCategory::Other) == ProductivityLevel::Low);
    assert(DomainUsageAnalyzer::ClassifyProductivity(100, DomainCategory::Social) == ProductivityLevel::Low);
    assert(DomainUsageAnalyzer::ClassifyProductivity(100, DomainCategory::Entertainment) == ProductivityLevel::Low);
    std::cout << "[PASS] Focus score and productivity." << std::endl;
}

void testPeakHours() {
    std::cout << "[Test] Peak hours..." << std::endl;

    // One event per hour: perfectly flat, no peak
    BrowsingEventList flat;
    for (int i = 0; i < 24; ++i) {
        flat.push_back(MakeEvent(kBaseTime + i * kHour, EventType::TabUpdated, std::string("https://a.com/")));
    }
    assert(DomainUsageAnalyzer::FindPeakHours(flat).empty());

    // Everything in one hour
    Timestamp tenAm = LocalTime(2024, 3, 4, 10, 5);
    auto burst = SteadyEvents(10, 60000, "https://a.com/", EventType::TabUpdated, tenAm);
    auto peaks = DomainUsageAnalyzer::FindPeakHours(burst);
    assert(peaks.size() == 1 && peaks[0] == 10);
    std::cout << "[PASS] Peak hours." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Domain Usage Analyzer Test..." << std::endl;
    testHostnames();
    testVisits();
    testFocusAndProductivity();
    testPeakHours();
    std::cout << "[PASS] Domain Usage Analyzer Test." << std::endl;
    return 0;
}
