/**
 * @file PatternDetector.cpp
 * @brief Implementation of PatternDetector.
 */

#include "domain/analytics/PatternDetector.hpp"
#include "domain/analytics/TimeBlockSegmenter.hpp"

namespace sessionlens::domain::analytics {

namespace {

constexpr double kFocusConfidence = 0.9;
constexpr double kMultitaskingConfidence = 0.8;
constexpr double kSpreeConfidence = 0.7;
constexpr double kResearchConfidence = 0.6;

constexpr int kMultitaskingMinDomains = 3;
constexpr double kMultitaskingMinSwitchRate = 3.0;
constexpr double kSpreeMaxPageTime = 30000.0;
constexpr std::size_t kSpreeMinEvents = 10;
constexpr int kResearchMinDomains = 2;
constexpr int kResearchMinScrolls = 5;
constexpr Millis kResearchMinDuration = 300000;

ActivityPattern makePattern(PatternType type, double confidence, const TimeBlock& block,
                            const PatternCharacteristics& traits) {
    ActivityPattern pattern;
    pattern.type = type;
    pattern.startTime = block.start;
    pattern.duration = block.duration;
    pattern.confidence = confidence;
    pattern.characteristics = traits;
    return pattern;
}

} // namespace

std::vector<ActivityPattern> PatternDetector::detect(const std::vector<TimeBlock>& blocks) const {
    std::vector<ActivityPattern> patterns;
    for (const auto& block : blocks) {
        if (auto pattern = detectPattern(block)) {
            patterns.push_back(*pattern);
        }
    }
    return patterns;
}

std::optional<ActivityPattern> PatternDetector::detectPattern(const TimeBlock& block) const {
    const auto traits = Characterize(block);

    if (block.type == BlockType::Focused && block.duration > m_config.deepWorkThreshold) {
        return makePattern(PatternType::FocusPeriod, kFocusConfidence, block, traits);
    }

    if (traits.domainCount >= kMultitaskingMinDomains && traits.tabSwitchRate > kMultitaskingMinSwitchRate) {
        return makePattern(PatternType::Multitasking, kMultitaskingConfidence, block, traits);
    }

    if (traits.averagePageTime < kSpreeMaxPageTime && block.events.size() > kSpreeMinEvents) {
        return makePattern(PatternType::BrowsingSpree, kSpreeConfidence, block, traits);
    }

    if (traits.domainCount >= kResearchMinDomains &&
        traits.scrollActivity > kResearchMinScrolls &&
        block.duration > kResearchMinDuration) {
        return makePattern(PatternType::ResearchMode, kResearchConfidence, block, traits);
    }

    return std::nullopt;
}

PatternCharacteristics PatternDetector::Characterize(const TimeBlock& block) {
    PatternCharacteristics traits;
    traits.domainCount = static_cast<int>(block.domains.size());
    traits.tabSwitchRate = static_cast<double>(block.tabSwitches) / TimeBlockSegmenter::RateMinutes(block);
    traits.averagePageTime = block.events.empty()
        ? 0.0
        : static_cast<double>(block.duration) / static_cast<double>(block.events.size());
    for (const auto& event : block.events) {
        if (event.type == browsing::EventType::ScrollEvent) traits.scrollActivity++;
    }
    return traits;
}

} // namespace sessionlens::domain::analytics
