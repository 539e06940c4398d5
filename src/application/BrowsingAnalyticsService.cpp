/**
 * @file BrowsingAnalyticsService.cpp
 * @brief Implementation of BrowsingAnalyticsService.
 */

#include "application/BrowsingAnalyticsService.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <stdexcept>

namespace sessionlens::application {

using domain::analytics::AnalyticsQuery;
using domain::analytics::AnalyticsResults;
using domain::analytics::AnalyticsStats;
using domain::browsing::BrowsingEvent;
using domain::browsing::BrowsingEventList;
using domain::session::SessionBoundary;

BrowsingAnalyticsService::BrowsingAnalyticsService(domain::browsing::TrackingConfig config,
                                                   domain::browsing::DomainCatalog catalog,
                                                   std::shared_ptr<AsyncTaskManager> taskManager,
                                                   domain::browsing::Clock clock)
    : m_taskManager(std::move(taskManager)),
      m_clock(clock ? std::move(clock) : domain::browsing::Clock(&domain::browsing::SystemNow)),
      m_detector(config, catalog, m_clock),
      m_rng(std::random_device{}()),
      m_engine(config, catalog) {
    if (!m_taskManager) {
        throw std::runtime_error("BrowsingAnalyticsService requires a task manager");
    }
    m_currentSessionId = NewSessionId();
}

BrowsingAnalyticsService::~BrowsingAnalyticsService() {
    std::vector<std::shared_ptr<TaskStatus>> pending;
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        pending.swap(m_pendingBatches);
    }
    for (const auto& status : pending) {
        m_taskManager->Wait(status);
    }
}

std::optional<SessionBoundary> BrowsingAnalyticsService::IngestEvent(BrowsingEvent event) {
    std::lock_guard<std::mutex> lock(m_detectorMutex);

    if (event.sessionId.empty()) {
        event.sessionId = m_currentSessionId;
    }

    auto signals = m_detector.analyzeEvent(event);
    auto boundary = m_detector.shouldCreateBoundary(signals);
    if (!boundary) {
        return std::nullopt;
    }

    boundary->sessionId = m_currentSessionId;
    m_currentSessionId = NewSessionId();
    std::clog << "[AnalyticsService] Session boundary (" << domain::session::BoundaryReasonToString(boundary->reason)
              << ") closed " << boundary->sessionId << ", now " << m_currentSessionId << std::endl;
    return boundary;
}

void BrowsingAnalyticsService::ProcessBatch(const BrowsingEventList& events) {
    std::lock_guard<std::mutex> lock(m_engineMutex);
    m_engine.processEvents(events);
    auto stats = m_engine.getAnalyticsStats();
    std::clog << "[AnalyticsService] Processed " << events.size() << " events into "
              << stats.timeBlocks << " blocks, " << stats.domains << " domains, "
              << stats.patterns << " patterns" << std::endl;
}

std::shared_ptr<TaskStatus> BrowsingAnalyticsService::AnalyzeBatchAsync(BrowsingEventList events) {
    std::string description = "Analyzing " + std::to_string(events.size()) + " events";
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    m_pendingBatches.erase(
        std::remove_if(m_pendingBatches.begin(), m_pendingBatches.end(),
            [](const auto& s) { return s->isCompleted.load(); }),
        m_pendingBatches.end());

    auto status = m_taskManager->SubmitTask(TaskType::EventProcessing, description,
        [this](std::shared_ptr<TaskStatus> status, BrowsingEventList batch) {
            status->progress = 0.1f;
            ProcessBatch(batch);
        }, std::move(events));
    m_pendingBatches.push_back(status);
    return status;
}

AnalyticsResults BrowsingAnalyticsService::Query(const AnalyticsQuery& query) const {
    std::lock_guard<std::mutex> lock(m_engineMutex);
    return m_engine.queryAnalytics(query);
}

AnalyticsStats BrowsingAnalyticsService::GetAnalyticsStats() const {
    std::lock_guard<std::mutex> lock(m_engineMutex);
    return m_engine.getAnalyticsStats();
}

domain::session::DetectionStats BrowsingAnalyticsService::GetDetectionStats() const {
    std::lock_guard<std::mutex> lock(m_detectorMutex);
    return m_detector.getDetectionStats();
}

void BrowsingAnalyticsService::UpdateConfig(const domain::browsing::TrackingConfig& config) {
    {
        std::lock_guard<std::mutex> lock(m_detectorMutex);
        m_detector.updateConfig(config);
    }
    std::lock_guard<std::mutex> lock(m_engineMutex);
    m_engine.updateConfig(config);
}

void BrowsingAnalyticsService::ResetSession() {
    std::lock_guard<std::mutex> lock(m_detectorMutex);
    m_detector.reset();
    m_currentSessionId = NewSessionId();
}

std::string BrowsingAnalyticsService::GetCurrentSessionId() const {
    std::lock_guard<std::mutex> lock(m_detectorMutex);
    return m_currentSessionId;
}

std::string BrowsingAnalyticsService::NewSessionId() {
    std::uniform_int_distribution<int> dist(0, 0xFFFF);
    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "%04x", dist(m_rng));
    return "session_" + std::to_string(m_clock()) + "_" + suffix;
}

} // namespace sessionlens::application
