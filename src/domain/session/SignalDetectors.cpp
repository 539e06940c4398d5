/**
 * @file SignalDetectors.cpp
 * @brief Implementation of the boundary heuristics.
 */

#include "domain/session/SignalDetectors.hpp"
#include "domain/browsing/TimeUtils.hpp"
#include <algorithm>
#include <cstdlib>

namespace sessionlens::domain::session {

using json = nlohmann::json;
using browsing::EventType;
using browsing::kHour;

namespace {

constexpr double kResumedActivityStrength = 0.6;
constexpr double kResumedActivityRatio = 0.8;
constexpr double kDomainChangeMinStrength = 0.5;
constexpr double kContextSwitchStrength = 0.8;
constexpr double kIncreasingGapsStrength = 0.6;
constexpr double kWindowCloseMinStrength = 0.5;
constexpr double kNewWindowStrength = 0.5;
constexpr Millis kNewWindowQuietPeriod = 60000;
constexpr double kHourTransitionStrength = 0.4;
constexpr Millis kHourTransitionWindow = 300000;
constexpr Millis kLongSessionStart = 8 * kHour;
constexpr Millis kLongSessionSaturation = 12 * kHour;
constexpr double kLongSessionMaxStrength = 0.8;

const char* transitionType(int hour) {
    switch (hour) {
        case 9: return "work_start";
        case 12: return "lunch_break";
        case 17: return "work_end";
        case 22: return "evening_wind_down";
        default: return "other";
    }
}

bool isHourTransition(int hour) {
    return hour == 9 || hour == 12 || hour == 17 || hour == 22;
}

double windowCloseStrength(int remainingWindows) {
    if (remainingWindows <= 0) return 0.9;  // last window closed
    if (remainingWindows == 1) return 0.6;  // second to last
    return 0.3;
}

} // namespace

SignalList DetectIdleSignals(const DetectionInput& input) {
    SignalList signals;
    const auto& event = input.event;
    const auto idleThreshold = input.config.idleThreshold;

    if (auto previous = input.context.getPreviousActivity()) {
        Millis idleDuration = event.timestamp - *previous;
        if (idleDuration > idleThreshold) {
            double strength = std::min(static_cast<double>(idleDuration) / (idleThreshold * 2.0), 1.0);
            signals.push_back({SignalType::Idle, strength, event.timestamp,
                               json{{"idleDuration", idleDuration}, {"threshold", idleThreshold}}});
        }
    }

    if (event.type == EventType::TabActivated || event.type == EventType::NavigationStarted) {
        Millis quietPeriod = input.context.quietPeriodBefore(event.timestamp);
        if (quietPeriod >= idleThreshold * kResumedActivityRatio) {
            signals.push_back({SignalType::Idle, kResumedActivityStrength, event.timestamp,
                               json{{"quietPeriod", quietPeriod}, {"resumedActivity", true}}});
        }
    }

    return signals;
}

SignalList DetectDomainChangeSignals(const DetectionInput& input) {
    SignalList signals;
    if (!input.config.domainChangeSessionBoundary) return signals;

    const auto& newDomain = input.context.getLatestDomain();
    if (!newDomain) return signals;

    const auto& previousDomains = input.context.getPreviousDomains();
    if (previousDomains.empty()) return signals;  // first domain carries no change

    const auto newCategory = input.catalog.categorize(*newDomain);
    json previousCategories = json::array();
    bool categoryChange = true;
    for (const auto& d : previousDomains) {
        auto category = input.catalog.categorize(d);
        previousCategories.push_back(browsing::CategoryToString(category));
        if (category == newCategory) categoryChange = false;
    }
    const bool contextSwitch = !SessionContext::HasRelatedDomain(*newDomain, previousDomains);

    double strength = 0.0;
    if (contextSwitch) strength += 0.4;
    if (categoryChange) strength += 0.3;
    strength = std::min(strength, 1.0);

    if (strength > kDomainChangeMinStrength) {
        signals.push_back({SignalType::DomainChange, strength, input.event.timestamp,
                           json{{"newDomain", *newDomain},
                                {"previousDomains", previousDomains},
                                {"categoryChange", {
                                    {"from", previousCategories},
                                    {"to", browsing::CategoryToString(newCategory)},
                                    {"changed", categoryChange}}}}});
    }

    if (contextSwitch) {
        signals.push_back({SignalType::DomainChange, kContextSwitchStrength, input.event.timestamp,
                           json{{"contextSwitch", true},
                                {"newDomain", *newDomain},
                                {"previousDomainCount", previousDomains.size()}}});
    }

    return signals;
}

SignalList DetectNavigationGapSignals(const DetectionInput& input) {
    SignalList signals;
    if (!browsing::IsNavigationEvent(input.event.type)) return signals;

    const auto& gaps = input.context.getNavigationGaps();
    const auto threshold = input.config.sessionGapThreshold;
    Millis gap = gaps.empty() ? 0 : gaps.back();

    if (gap > threshold) {
        double strength = std::min(static_cast<double>(gap) / (threshold * 3.0), 1.0);
        std::vector<Millis> previous(gaps.size() > 5 ? gaps.end() - 5 : gaps.begin(), gaps.end());
        signals.push_back({SignalType::NavigationGap, strength, input.event.timestamp,
                           json{{"gap", gap}, {"threshold", threshold}, {"previousNavigations", previous}}});
    }

    if (gaps.size() >= 3) {
        std::vector<Millis> recent(gaps.end() - 3, gaps.end());
        bool increasing = recent[0] < recent[1] && recent[1] < recent[2];
        if (increasing) {
            signals.push_back({SignalType::NavigationGap, kIncreasingGapsStrength, input.event.timestamp,
                               json{{"pattern", "increasing_gaps"}, {"gaps", recent}}});
        }
    }

    return signals;
}

SignalList DetectWindowPatternSignals(const DetectionInput& input) {
    SignalList signals;
    const auto& event = input.event;

    if (event.type == EventType::WindowRemoved) {
        int remaining = input.context.getWindowCount();
        double strength = windowCloseStrength(remaining);
        if (strength > kWindowCloseMinStrength) {
            signals.push_back({SignalType::WindowPattern, strength, event.timestamp,
                               json{{"pattern", "window_closing"}, {"remainingWindows", remaining}}});
        }
    }

    if (event.type == EventType::WindowCreated) {
        Millis quietPeriod = input.context.quietPeriodBefore(event.timestamp);
        if (quietPeriod >= kNewWindowQuietPeriod) {
            signals.push_back({SignalType::WindowPattern, kNewWindowStrength, event.timestamp,
                               json{{"pattern", "new_window_after_quiet"}, {"quietPeriod", quietPeriod}}});
        }
    }

    return signals;
}

SignalList DetectTimeBasedSignals(const DetectionInput& input) {
    SignalList signals;
    const auto ts = input.event.timestamp;

    int hour = browsing::LocalHour(ts);
    if (isHourTransition(hour) && std::llabs(ts - input.now) < kHourTransitionWindow) {
        signals.push_back({SignalType::TimeBased, kHourTransitionStrength, ts,
                           json{{"hourTransition", hour}, {"transitionType", transitionType(hour)}}});
    }

    Millis duration = input.context.sessionDurationAt(ts);
    if (duration > kLongSessionStart) {
        double strength = std::min(static_cast<double>(duration) / kLongSessionSaturation, kLongSessionMaxStrength);
        signals.push_back({SignalType::TimeBased, strength, ts,
                           json{{"longSession", true}, {"duration", duration}}});
    }

    return signals;
}

const std::vector<SignalDetector>& DefaultDetectors() {
    static const std::vector<SignalDetector> detectors = {
        &DetectIdleSignals,
        &DetectDomainChangeSignals,
        &DetectNavigationGapSignals,
        &DetectWindowPatternSignals,
        &DetectTimeBasedSignals
    };
    return detectors;
}

} // namespace sessionlens::domain::session
