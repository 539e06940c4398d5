#include <cassert>
#include <cmath>
#include <iostream>

#include "domain/browsing/TimeUtils.hpp"
#include "domain/session/SignalDetectors.hpp"
#include "TestEventFactory.hpp"

using namespace sessionlens::domain::browsing;
using namespace sessionlens::domain::session;
using namespace sessionlens::test;

namespace {

const DomainCatalog kCatalog;
constexpr Timestamp kFarClock = 0;

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

/** Feeds `history` and `event` to a fresh context, then runs one detector on `event`. */
SignalList run(SignalDetector detect, const BrowsingEventList& history, const BrowsingEvent& event,
               const TrackingConfig& config = TrackingConfig(), Timestamp now = kFarClock) {
    SessionContext context;
    for (const auto& e : history) context.update(e);
    context.update(event);
    DetectionInput input{event, context, config, kCatalog, now};
    return detect(input);
}

void testIdle() {
    std::cout << "[Test] Idle detector..." << std::endl;
    const std::string url = "https://github.com/repo";
    auto first = MakeEvent(kBaseTime, EventType::TabUpdated, url);

    // No previous activity
    assert(run(&DetectIdleSignals, {}, first).empty());

    // Exactly at the threshold is not idle
    assert(run(&DetectIdleSignals, {first}, MakeEvent(kBaseTime + 300000, EventType::TabUpdated, url)).empty());

    auto signals = run(&DetectIdleSignals, {first}, MakeEvent(kBaseTime + 450000, EventType::TabUpdated, url));
    assert(signals.size() == 1);
    assert(signals[0].type == SignalType::Idle);
    assert(near(signals[0].strength, 0.75));
    assert(signals[0].metadata["idleDuration"] == 450000);

    // Saturates at 1.0
    signals = run(&DetectIdleSignals, {first}, MakeEvent(kBaseTime + 3600000, EventType::TabUpdated, url));
    assert(signals.size() == 1 && near(signals[0].strength, 1.0));

    // Resumed activity: quiet period above 80% of the threshold, below the threshold itself
    signals = run(&DetectIdleSignals, {first}, MakeEvent(kBaseTime + 250000, EventType::TabActivated, url));
    assert(signals.size() == 1);
    assert(near(signals[0].strength, 0.6));
    assert(signals[0].metadata["resumedActivity"] == true);

    // The quiet period may equal 80% of the threshold
    signals = run(&DetectIdleSignals, {first}, MakeEvent(kBaseTime + 240000, EventType::TabActivated, url));
    assert(signals.size() == 1 && near(signals[0].strength, 0.6));
    assert(run(&DetectIdleSignals, {first}, MakeEvent(kBaseTime + 239999, EventType::NavigationStarted, url)).empty());

    // Resumption only counts for tab activation and navigation start
    assert(run(&DetectIdleSignals, {first}, MakeEvent(kBaseTime + 250000, EventType::ScrollEvent, url)).empty());
    std::cout << "[PASS] Idle detector." << std::endl;
}

void testDomainChange() {
    std::cout << "[Test] Domain change detector..." << std::endl;
    TrackingConfig enabled;
    enabled.domainChangeSessionBoundary = true;

    auto work = MakeEvent(kBaseTime, EventType::TabUpdated, std::string("https://github.com/a"));
    auto video = MakeEvent(kBaseTime + 1000, EventType::TabUpdated, std::string("https://www.youtube.com/watch"));

    // Disabled by default
    assert(run(&DetectDomainChangeSignals, {work}, video).empty());

    // First domain carries no change
    assert(run(&DetectDomainChangeSignals, {}, work, enabled).empty());

    // Unrelated and different category: computed signal plus context switch
    auto signals = run(&DetectDomainChangeSignals, {work}, video, enabled);
    assert(signals.size() == 2);
    assert(near(signals[0].strength, 0.7));
    assert(signals[0].metadata["newDomain"] == "www.youtube.com");
    assert(signals[0].metadata["categoryChange"]["changed"] == true);
    assert(signals[0].metadata["categoryChange"]["to"] == "entertainment");
    assert(near(signals[1].strength, 0.8));
    assert(signals[1].metadata["contextSwitch"] == true);

    // Unrelated but same category: only the context switch fires
    auto qa = MakeEvent(kBaseTime + 1000, EventType::TabUpdated, std::string("https://stackoverflow.com/q/1"));
    signals = run(&DetectDomainChangeSignals, {work}, qa, enabled);
    assert(signals.size() == 1);
    assert(near(signals[0].strength, 0.8));

    // Sibling host under the same root: nothing
    auto gist = MakeEvent(kBaseTime + 1000, EventType::TabUpdated, std::string("https://gist.github.com/x"));
    assert(run(&DetectDomainChangeSignals, {work}, gist, enabled).empty());

    // No URL: nothing
    assert(run(&DetectDomainChangeSignals, {work}, MakeEvent(kBaseTime + 1000, EventType::ClickEvent), enabled).empty());
    std::cout << "[PASS] Domain change detector." << std::endl;
}

void testNavigationGap() {
    std::cout << "[Test] Navigation gap detector..." << std::endl;
    const std::string url = "https://example.com/";
    auto nav = [&](Timestamp offset) { return MakeEvent(kBaseTime + offset, EventType::PageLoaded, url); };

    // Non-navigation events are ignored
    assert(run(&DetectNavigationGapSignals, {nav(0)}, MakeEvent(kBaseTime + 900000, EventType::ClickEvent, url)).empty());

    auto signals = run(&DetectNavigationGapSignals, {nav(0)}, nav(700000));
    assert(signals.size() == 1);
    assert(signals[0].type == SignalType::NavigationGap);
    assert(near(signals[0].strength, 700000.0 / 1800000.0));
    assert(signals[0].metadata["gap"] == 700000);

    // Gaps 0, 1000, 2000, 3000: strictly increasing run of three
    signals = run(&DetectNavigationGapSignals, {nav(0), nav(1000), nav(3000)}, nav(6000));
    assert(signals.size() == 1);
    assert(near(signals[0].strength, 0.6));
    assert(signals[0].metadata["pattern"] == "increasing_gaps");

    // Equal gaps are not increasing
    assert(run(&DetectNavigationGapSignals, {nav(0), nav(1000), nav(2000)}, nav(3000)).empty());
    std::cout << "[PASS] Navigation gap detector." << std::endl;
}

void testWindowPattern() {
    std::cout << "[Test] Window pattern detector..." << std::endl;
    auto created = [](Timestamp offset) { return MakeEvent(kBaseTime + offset, EventType::WindowCreated); };
    auto removed = [](Timestamp offset) { return MakeEvent(kBaseTime + offset, EventType::WindowRemoved); };

    // Three windows, one closed: two remain, too weak
    assert(run(&DetectWindowPatternSignals, {created(0), created(1), created(2)}, removed(3)).empty());

    auto signals = run(&DetectWindowPatternSignals, {created(0), created(1)}, removed(2));
    assert(signals.size() == 1);
    assert(near(signals[0].strength, 0.6));
    assert(signals[0].metadata["remainingWindows"] == 1);

    signals = run(&DetectWindowPatternSignals, {created(0)}, removed(1));
    assert(signals.size() == 1 && near(signals[0].strength, 0.9));

    // Counter never goes negative
    signals = run(&DetectWindowPatternSignals, {}, removed(0));
    assert(signals.size() == 1 && signals[0].metadata["remainingWindows"] == 0);

    // New window after a quiet minute
    signals = run(&DetectWindowPatternSignals, {MakeEvent(kBaseTime, EventType::TabUpdated)}, created(120000));
    assert(signals.size() == 1);
    assert(near(signals[0].strength, 0.5));
    assert(signals[0].metadata["pattern"] == "new_window_after_quiet");

    assert(run(&DetectWindowPatternSignals, {MakeEvent(kBaseTime, EventType::TabUpdated)}, created(30000)).empty());

    // Exactly one quiet minute counts
    signals = run(&DetectWindowPatternSignals, {MakeEvent(kBaseTime, EventType::TabUpdated)}, created(60000));
    assert(signals.size() == 1 && near(signals[0].strength, 0.5));
    assert(run(&DetectWindowPatternSignals, {MakeEvent(kBaseTime, EventType::TabUpdated)}, created(59999)).empty());
    std::cout << "[PASS] Window pattern detector." << std::endl;
}

void testTimeBased() {
    std::cout << "[Test] Time based detector..." << std::endl;
    Timestamp nineThirty = LocalTime(2024, 1, 15, 9, 30);
    auto event = MakeEvent(nineThirty, EventType::TabUpdated);

    auto signals = run(&DetectTimeBasedSignals, {}, event, TrackingConfig(), nineThirty);
    assert(signals.size() == 1);
    assert(near(signals[0].strength, 0.4));
    assert(signals[0].metadata["transitionType"] == "work_start");

    // Replayed events far from "now" do not count as transitions
    assert(run(&DetectTimeBasedSignals, {}, event, TrackingConfig(), kFarClock).empty());

    Timestamp tenThirty = LocalTime(2024, 1, 15, 10, 30);
    assert(run(&DetectTimeBasedSignals, {}, MakeEvent(tenThirty, EventType::TabUpdated), TrackingConfig(), tenThirty).empty());

    // Nine hours since the oldest remembered event
    auto start = MakeEvent(kBaseTime, EventType::TabUpdated);
    signals = run(&DetectTimeBasedSignals, {start}, MakeEvent(kBaseTime + 9 * kHour, EventType::TabUpdated));
    assert(signals.size() == 1);
    assert(signals[0].metadata["longSession"] == true);
    assert(near(signals[0].strength, 0.75));

    // Capped at 0.8
    signals = run(&DetectTimeBasedSignals, {start}, MakeEvent(kBaseTime + 20 * kHour, EventType::TabUpdated));
    assert(signals.size() == 1 && near(signals[0].strength, 0.8));
    std::cout << "[PASS] Time based detector." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Signal Detectors Test..." << std::endl;
    testIdle();
    testDomainChange();
    testNavigationGap();
    testWindowPattern();
    testTimeBased();
    assert(DefaultDetectors().size() == 5);
    std::cout << "[PASS] Signal Detectors Test." << std::endl;
    return 0;
}
