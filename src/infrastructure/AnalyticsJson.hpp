/**
 * @file AnalyticsJson.hpp
 * @brief JSON rendering of boundaries, signals and analytics reports.
 */

#pragma once

#include "domain/analytics/AnalyticsTypes.hpp"
#include "domain/session/SessionBoundaryDetector.hpp"
#include <nlohmann/json.hpp>

namespace sessionlens::infrastructure {

/**
 * @class AnalyticsJson
 * @brief Field names follow the event log's camelCase; enums render as their wire names.
 */
class AnalyticsJson {
public:
    static nlohmann::json ToJson(const domain::session::SessionSignal& signal);
    static nlohmann::json ToJson(const domain::session::SessionBoundary& boundary);
    static nlohmann::json ToJson(const domain::session::DetectionStats& stats);

    static nlohmann::json ToJson(const domain::analytics::DomainAnalytics& domain);
    static nlohmann::json ToJson(const domain::analytics::ActivityPattern& pattern);
    static nlohmann::json ToJson(const domain::analytics::ProductivityMetrics& metrics);

    /** @brief Only the sections present in `results` appear in the output. */
    static nlohmann::json ToJson(const domain::analytics::AnalyticsResults& results);
    static nlohmann::json ToJson(const domain::analytics::AnalyticsStats& stats);
};

} // namespace sessionlens::infrastructure
