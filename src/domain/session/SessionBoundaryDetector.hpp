/**
 * @file SessionBoundaryDetector.hpp
 * @brief Online detector deciding where one browsing session ends and the next begins.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <random>
#include "domain/browsing/DomainCatalog.hpp"
#include "domain/browsing/TimeUtils.hpp"
#include "domain/browsing/TrackingConfig.hpp"
#include "SessionContext.hpp"
#include "SessionSignal.hpp"

namespace sessionlens::domain::session {

/**
 * @struct DetectionStats
 * @brief Sizes of the detector's rolling state, for diagnostics.
 */
struct DetectionStats {
    std::size_t recentEvents = 0;
    std::size_t currentDomains = 0;
    std::size_t navigationGaps = 0;
    std::size_t domainTransitions = 0;
    std::size_t sessionSignals = 0;
    int windowCount = 0;
    int tabCount = 0;
};

/**
 * @class SessionBoundaryDetector
 * @brief Accumulates a rolling context and turns weighted signals into boundary decisions.
 *
 * Not thread-safe: feed it one event at a time from a single caller. A
 * returned boundary does not reset the context; call reset() for that.
 */
class SessionBoundaryDetector {
public:
    static constexpr std::size_t kMaxSignalHistory = 100;
    static constexpr std::size_t kTrimmedSignalHistory = 50;

    explicit SessionBoundaryDetector(browsing::TrackingConfig config,
                                     browsing::DomainCatalog catalog = browsing::DomainCatalog(),
                                     browsing::Clock clock = &browsing::SystemNow);

    /**
     * @brief Updates the context with the event and runs every detector against it.
     * @return Signals in detector order; empty when nothing fired.
     */
    SignalList analyzeEvent(const browsing::BrowsingEvent& event);

    /**
     * @brief Averages signal strengths and emits an "end" boundary when the mean reaches the threshold.
     */
    std::optional<SessionBoundary> shouldCreateBoundary(const SignalList& signals);

    /** @brief Replaces thresholds for subsequent events. */
    void updateConfig(const browsing::TrackingConfig& config) { m_config = config; }

    void reset();

    DetectionStats getDetectionStats() const;

    const SessionContext& getContext() const { return m_context; }
    const std::deque<SessionSignal>& getSignalHistory() const { return m_signalHistory; }
    const browsing::TrackingConfig& getConfig() const { return m_config; }

private:
    SessionBoundary createBoundary(const SessionSignal& primary, const SignalList& all);
    std::string generateBoundaryId();

    browsing::TrackingConfig m_config;
    browsing::DomainCatalog m_catalog;
    browsing::Clock m_clock;
    SessionContext m_context;
    std::deque<SessionSignal> m_signalHistory;
    std::mt19937 m_rng;
};

} // namespace sessionlens::domain::session
