/**
 * @file AnalyticsTypes.hpp
 * @brief Value types produced by the behavioral analytics engine and its query surface.
 */

#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/browsing/BrowsingEvent.hpp"
#include "domain/browsing/DomainCatalog.hpp"

namespace sessionlens::domain::analytics {

using browsing::BrowsingEvent;
using browsing::BrowsingEventList;
using browsing::DomainCategory;
using browsing::Millis;
using browsing::Timestamp;

/**
 * @enum BlockType
 * @brief Classification of a contiguous stretch of activity.
 */
enum class BlockType {
    Active,
    Idle,
    Focused,
    Distracted
};

inline std::string BlockTypeToString(BlockType type) {
    switch (type) {
        case BlockType::Active: return "active";
        case BlockType::Idle: return "idle";
        case BlockType::Focused: return "focused";
        case BlockType::Distracted: return "distracted";
        default: return "active";
    }
}

struct TimeBlock {
    Timestamp start = 0;
    Timestamp end = 0;
    Millis duration = 0;
    BlockType type = BlockType::Active;
    BrowsingEventList events;
    std::vector<std::string> domains;  ///< Distinct, in first-seen order.
    int tabSwitches = 0;
    int windowSwitches = 0;
};

enum class ProductivityLevel {
    High,
    Medium,
    Low
};

inline std::string ProductivityToString(ProductivityLevel level) {
    switch (level) {
        case ProductivityLevel::High: return "high";
        case ProductivityLevel::Medium: return "medium";
        default: return "low";
    }
}

struct DomainAnalytics {
    std::string domain;
    Millis totalTime = 0;
    int visitCount = 0;
    double averageVisitDuration = 0.0;
    double focusScore = 0.0;  ///< 0 to 100
    ProductivityLevel productivity = ProductivityLevel::Low;
    DomainCategory category = DomainCategory::Other;
    std::vector<int> peakHours;
    std::vector<std::string> patterns;  ///< Reserved; not populated.
};

enum class PatternType {
    FocusPeriod,
    Multitasking,
    BrowsingSpree,
    ResearchMode
};

inline std::string PatternTypeToString(PatternType type) {
    switch (type) {
        case PatternType::FocusPeriod: return "focus_period";
        case PatternType::Multitasking: return "multitasking";
        case PatternType::BrowsingSpree: return "browsing_spree";
        case PatternType::ResearchMode: return "research_mode";
        default: return "focus_period";
    }
}

struct PatternCharacteristics {
    int domainCount = 0;
    double tabSwitchRate = 0.0;    ///< Tab switches per minute.
    double averagePageTime = 0.0;  ///< Milliseconds per event.
    int scrollActivity = 0;
};

struct ActivityPattern {
    PatternType type = PatternType::FocusPeriod;
    Timestamp startTime = 0;
    Millis duration = 0;
    double confidence = 0.0;
    PatternCharacteristics characteristics;
};

struct TimeRange {
    Timestamp start = 0;
    Timestamp end = 0;
    Millis duration = 0;
};

struct ProductivityMetrics {
    std::string sessionId;
    Millis totalTime = 0;
    Millis activeTime = 0;
    Millis idleTime = 0;
    int tabSwitches = 0;
    int windowSwitches = 0;
    std::vector<std::string> uniqueDomains;
    int pageCount = 0;
    int scrollEvents = 0;
    int clickEvents = 0;
    int formInteractions = 0;
    std::vector<TimeRange> deepWorkPeriods;
    std::vector<TimeRange> distractionPeriods;
    double focusScore = 0.0;  ///< 0 to 100
};

// ============================================================================
// Query surface
// ============================================================================

struct DateRange {
    Timestamp start = 0;
    Timestamp end = 0;
};

/**
 * @struct AnalyticsQuery
 * @brief Requested sections are named: "time", "productivity", "patterns", "domains", "activity".
 */
struct AnalyticsQuery {
    std::optional<std::string> sessionId;
    DateRange dateRange;
    std::vector<std::string> metrics;
};

struct TimeAnalytics {
    Millis totalTime = 0;
    Millis activeTime = 0;
    Millis focusedTime = 0;
    Millis distractedTime = 0;
    Millis idleTime = 0;
    int blockCount = 0;
    double averageBlockDuration = 0.0;
};

struct ProductivityAnalytics {
    double focusScore = 0.0;
    int deepWorkPeriods = 0;
    int distractionPeriods = 0;
    Millis totalDeepWorkTime = 0;
    std::string productivityTrend = "stable";
    std::vector<std::string> recommendations;
};

struct PatternAnalytics {
    int totalPatterns = 0;
    std::map<std::string, int> patternTypes;
    double averageConfidence = 0.0;
    std::string mostCommonPattern;  ///< Empty when no pattern matched.
    std::vector<ActivityPattern> patterns;  ///< At most 10.
};

struct CategorySummary {
    std::vector<DomainAnalytics> domains;
    Millis totalTime = 0;
    double averageFocusScore = 0.0;
};

struct DomainReport {
    int totalDomains = 0;
    std::vector<DomainAnalytics> topDomains;    ///< By total time, at most 10.
    std::map<std::string, CategorySummary> productivityByCategory;
    std::vector<DomainAnalytics> focusLeaders;  ///< By focus score, at most 5.
    std::map<std::string, double> timeDistribution;  ///< Percent of total time per top domain.
};

struct ActivityAnalytics {
    int totalBlocks = 0;
    std::map<std::string, int> blockTypes;
    double averageTabSwitches = 0.0;
    double averageWindowSwitches = 0.0;
    std::array<double, 24> hourlyActivity{};  ///< Milliseconds per local hour.
};

/**
 * @struct AnalyticsResults
 * @brief Only the requested sections are set. `productivity` also stays unset when no metrics are cached.
 */
struct AnalyticsResults {
    std::optional<TimeAnalytics> time;
    std::optional<ProductivityAnalytics> productivity;
    std::optional<PatternAnalytics> patterns;
    std::optional<DomainReport> domains;
    std::optional<ActivityAnalytics> activity;
};

struct AnalyticsStats {
    std::size_t timeBlocks = 0;
    std::size_t domains = 0;
    std::size_t patterns = 0;
    std::size_t cachedMetrics = 0;
    std::size_t focusedBlocks = 0;
    std::size_t distractedBlocks = 0;
};

} // namespace sessionlens::domain::analytics
