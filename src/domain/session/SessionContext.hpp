/**
 * @file SessionContext.hpp
 * @brief Rolling, bounded view of recent activity owned by the boundary detector.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include "domain/browsing/BrowsingEvent.hpp"

namespace sessionlens::domain::session {

using browsing::BrowsingEvent;
using browsing::Millis;
using browsing::Timestamp;

/**
 * @class SessionContext
 * @brief Sliding window of events plus derived counters.
 *
 * Every container is bounded. The state as it stood before the latest event
 * (previous activity time, previous domain set) is kept next to the updated
 * state so detectors can tell what the event changed.
 */
class SessionContext {
public:
    static constexpr std::size_t kMaxRecentEvents = 50;
    static constexpr std::size_t kMaxDomains = 10;
    static constexpr std::size_t kDomainPruneWindow = 20;
    static constexpr std::size_t kMaxNavigationGaps = 10;
    static constexpr std::size_t kMaxDomainTransitions = 20;

    /** @brief Folds one event into the context. */
    void update(const BrowsingEvent& event);

    void clear();

    // --- Accessors ---
    const std::deque<BrowsingEvent>& getRecentEvents() const { return m_recentEvents; }
    const std::set<std::string>& getCurrentDomains() const { return m_currentDomains; }
    const std::set<std::string>& getPreviousDomains() const { return m_previousDomains; }
    std::optional<Timestamp> getLastActivity() const { return m_lastActivity; }
    std::optional<Timestamp> getPreviousActivity() const { return m_previousActivity; }
    int getWindowCount() const { return m_windowCount; }
    int getTabCount() const { return m_tabCount; }
    const std::deque<Millis>& getNavigationGaps() const { return m_navigationGaps; }
    const std::deque<std::string>& getDomainTransitions() const { return m_domainTransitions; }

    /** @brief Domain of the latest event, if it had a parseable URL. */
    const std::optional<std::string>& getLatestDomain() const { return m_latestDomain; }

    // --- Derived measurements ---

    /** @brief Time between `timestamp` and the newest event strictly before it; 0 if none. */
    Millis quietPeriodBefore(Timestamp timestamp) const;

    /** @brief Interval between `timestamp` and the second most recent navigation event; 0 if fewer than two. */
    Millis navigationGapAt(Timestamp timestamp) const;

    /** @brief Time since the oldest event still in the window. */
    Millis sessionDurationAt(Timestamp timestamp) const;

    /** @brief True when some domain in `domains` shares the last two labels of `domain`. */
    static bool HasRelatedDomain(const std::string& domain, const std::set<std::string>& domains);

private:
    void pruneDomains();

    std::deque<BrowsingEvent> m_recentEvents;
    std::set<std::string> m_currentDomains;
    std::set<std::string> m_previousDomains;
    std::optional<Timestamp> m_lastActivity;
    std::optional<Timestamp> m_previousActivity;
    std::optional<std::string> m_latestDomain;
    int m_windowCount = 0;
    int m_tabCount = 0;
    std::deque<Millis> m_navigationGaps;
    std::deque<std::string> m_domainTransitions;
};

} // namespace sessionlens::domain::session
