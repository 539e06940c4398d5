/**
 * @file SessionContext.cpp
 * @brief Implementation of SessionContext.
 */

#include "domain/session/SessionContext.hpp"
#include "domain/browsing/DomainCatalog.hpp"
#include <algorithm>

namespace sessionlens::domain::session {

using browsing::EventType;

void SessionContext::update(const BrowsingEvent& event) {
    m_previousDomains = m_currentDomains;
    m_previousActivity = m_lastActivity;

    m_recentEvents.push_back(event);
    if (m_recentEvents.size() > kMaxRecentEvents) {
        m_recentEvents.pop_front();
    }

    m_latestDomain.reset();
    if (event.url) {
        m_latestDomain = browsing::ExtractDomain(*event.url);
        if (m_latestDomain) {
            m_currentDomains.insert(*m_latestDomain);
            m_domainTransitions.push_back(*m_latestDomain);
            if (m_domainTransitions.size() > kMaxDomainTransitions) {
                m_domainTransitions.pop_front();
            }
        }
    }

    m_lastActivity = event.timestamp;

    if (browsing::IsNavigationEvent(event.type)) {
        m_navigationGaps.push_back(navigationGapAt(event.timestamp));
        if (m_navigationGaps.size() > kMaxNavigationGaps) {
            m_navigationGaps.pop_front();
        }
    }

    if (event.type == EventType::WindowCreated) {
        m_windowCount++;
    } else if (event.type == EventType::WindowRemoved) {
        m_windowCount = std::max(0, m_windowCount - 1);
    }

    if (event.type == EventType::TabCreated) {
        m_tabCount++;
    } else if (event.type == EventType::TabRemoved) {
        m_tabCount = std::max(0, m_tabCount - 1);
    }

    if (m_currentDomains.size() > kMaxDomains) {
        pruneDomains();
    }
}

void SessionContext::pruneDomains() {
    std::set<std::string> recent;
    size_t start = m_recentEvents.size() > kDomainPruneWindow ? m_recentEvents.size() - kDomainPruneWindow : 0;
    for (size_t i = start; i < m_recentEvents.size(); ++i) {
        const auto& e = m_recentEvents[i];
        if (!e.url) continue;
        if (auto domain = browsing::ExtractDomain(*e.url)) {
            recent.insert(*domain);
        }
    }
    m_currentDomains = std::move(recent);
}

void SessionContext::clear() {
    m_recentEvents.clear();
    m_currentDomains.clear();
    m_previousDomains.clear();
    m_lastActivity.reset();
    m_previousActivity.reset();
    m_latestDomain.reset();
    m_windowCount = 0;
    m_tabCount = 0;
    m_navigationGaps.clear();
    m_domainTransitions.clear();
}

Millis SessionContext::quietPeriodBefore(Timestamp timestamp) const {
    for (auto it = m_recentEvents.rbegin(); it != m_recentEvents.rend(); ++it) {
        if (it->timestamp < timestamp) {
            return timestamp - it->timestamp;
        }
    }
    return 0;
}

Millis SessionContext::navigationGapAt(Timestamp timestamp) const {
    const BrowsingEvent* latest = nullptr;
    for (auto it = m_recentEvents.rbegin(); it != m_recentEvents.rend(); ++it) {
        if (!browsing::IsNavigationEvent(it->type)) continue;
        if (!latest) {
            latest = &*it;
        } else {
            return timestamp - it->timestamp;
        }
    }
    return 0;
}

Millis SessionContext::sessionDurationAt(Timestamp timestamp) const {
    if (m_recentEvents.empty()) return 0;
    return timestamp - m_recentEvents.front().timestamp;
}

bool SessionContext::HasRelatedDomain(const std::string& domain, const std::set<std::string>& domains) {
    auto root = browsing::RootDomain(domain);
    if (!root) return false;
    return std::any_of(domains.begin(), domains.end(), [&](const std::string& existing) {
        auto existingRoot = browsing::RootDomain(existing);
        return existingRoot && *existingRoot == *root;
    });
}

} // namespace sessionlens::domain::session
