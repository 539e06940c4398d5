/**
 * @file BrowsingAnalyticsService.hpp
 * @brief Wires the session boundary detector and the analytics engine behind one thread-safe facade.
 */

#pragma once

#include "application/AsyncTaskManager.hpp"
#include "domain/analytics/BehavioralAnalyticsEngine.hpp"
#include "domain/browsing/TimeUtils.hpp"
#include "domain/session/SessionBoundaryDetector.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace sessionlens::application {

/**
 * @class BrowsingAnalyticsService
 * @brief Owns the current session id, rotates it on boundaries and runs batch analysis in the background.
 *
 * Online detection and batch analytics are guarded by separate mutexes, so a
 * long batch never stalls event ingestion and a query never sees a
 * half-rebuilt engine.
 */
class BrowsingAnalyticsService {
public:
    BrowsingAnalyticsService(domain::browsing::TrackingConfig config,
                             domain::browsing::DomainCatalog catalog,
                             std::shared_ptr<AsyncTaskManager> taskManager,
                             domain::browsing::Clock clock = &domain::browsing::SystemNow);

    /** @brief Waits for the batches this service submitted; the task manager may outlive it. */
    ~BrowsingAnalyticsService();

    BrowsingAnalyticsService(const BrowsingAnalyticsService&) = delete;
    BrowsingAnalyticsService& operator=(const BrowsingAnalyticsService&) = delete;

    /**
     * @brief Feeds one event to the detector.
     *
     * Events without a session id are stamped with the current one before
     * detection. When a boundary is returned it carries the id of the session
     * it closes, and the service has already moved on to a fresh id.
     */
    std::optional<domain::session::SessionBoundary> IngestEvent(domain::browsing::BrowsingEvent event);

    /** @brief Runs the engine over the batch on the calling thread. */
    void ProcessBatch(const domain::browsing::BrowsingEventList& events);

    /** @brief Submits the batch to the task manager; the batch is copied. */
    std::shared_ptr<TaskStatus> AnalyzeBatchAsync(domain::browsing::BrowsingEventList events);

    domain::analytics::AnalyticsResults Query(const domain::analytics::AnalyticsQuery& query) const;

    domain::analytics::AnalyticsStats GetAnalyticsStats() const;
    domain::session::DetectionStats GetDetectionStats() const;

    /** @brief Applies new thresholds to both the detector and the next batch. */
    void UpdateConfig(const domain::browsing::TrackingConfig& config);

    /** @brief Clears detector context and starts a fresh session id. */
    void ResetSession();

    std::string GetCurrentSessionId() const;

private:
    std::string NewSessionId();

    std::shared_ptr<AsyncTaskManager> m_taskManager;
    domain::browsing::Clock m_clock;

    mutable std::mutex m_detectorMutex;
    domain::session::SessionBoundaryDetector m_detector;
    std::string m_currentSessionId;
    std::mt19937 m_rng;

    mutable std::mutex m_engineMutex;
    domain::analytics::BehavioralAnalyticsEngine m_engine;

    std::mutex m_pendingMutex;
    std::vector<std::shared_ptr<TaskStatus>> m_pendingBatches;
};

} // namespace sessionlens::application
