/**
 * @file SessionLensApp.cpp
 * @brief Implementation of SessionLensApp.
 */

#include "app/SessionLensApp.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

#include "application/AsyncTaskManager.hpp"
#include "application/BrowsingAnalyticsService.hpp"
#include "infrastructure/AnalyticsJson.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/EventLogReader.hpp"

namespace sessionlens::app {

using json = nlohmann::json;

SessionLensApp::SessionLensApp(std::string logPath, std::optional<std::string> settingsPath)
    : m_logPath(std::move(logPath)), m_settingsPath(std::move(settingsPath)) {}

int SessionLensApp::Run(std::ostream& out) {
    auto settings = m_settingsPath ? infrastructure::ConfigLoader::Load(*m_settingsPath)
                                   : infrastructure::AppSettings{};

    infrastructure::EventLogReadResult log;
    try {
        log = infrastructure::EventLogReader::ReadFile(m_logPath);
    } catch (const std::exception& e) {
        std::cerr << "[sessionlens] " << e.what() << std::endl;
        return 1;
    }

    if (log.events.empty()) {
        std::cerr << "[sessionlens] No events in " << m_logPath << std::endl;
        return 1;
    }

    // Replay: "now" is the timestamp of the event being ingested.
    auto replayNow = std::make_shared<std::atomic<domain::browsing::Timestamp>>(log.events.front().timestamp);
    auto taskManager = std::make_shared<application::AsyncTaskManager>();
    application::BrowsingAnalyticsService service(settings.tracking, settings.catalog, taskManager,
                                                  [replayNow] { return replayNow->load(); });

    json boundaries = json::array();
    for (const auto& event : log.events) {
        replayNow->store(event.timestamp);
        if (auto boundary = service.IngestEvent(event)) {
            boundaries.push_back(infrastructure::AnalyticsJson::ToJson(*boundary));
        }
    }

    auto task = service.AnalyzeBatchAsync(log.events);
    taskManager->Wait(task);
    if (task->failed) {
        std::cerr << "[sessionlens] Analysis failed: " << task->errorMessage << std::endl;
        return 1;
    }

    auto [first, last] = std::minmax_element(log.events.begin(), log.events.end(),
        [](const auto& a, const auto& b) { return a.timestamp < b.timestamp; });

    domain::analytics::AnalyticsQuery query;
    query.dateRange = {first->timestamp, last->timestamp};
    query.metrics = {"time", "productivity", "patterns", "domains", "activity"};

    json output = {
        {"events", log.events.size()},
        {"skippedLines", log.skippedLines},
        {"boundaries", boundaries},
        {"report", infrastructure::AnalyticsJson::ToJson(service.Query(query))},
        {"stats", infrastructure::AnalyticsJson::ToJson(service.GetAnalyticsStats())},
        {"detection", infrastructure::AnalyticsJson::ToJson(service.GetDetectionStats())}
    };

    out << output.dump(2) << std::endl;
    return 0;
}

} // namespace sessionlens::app
