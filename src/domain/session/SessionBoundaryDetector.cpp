/**
 * @file SessionBoundaryDetector.cpp
 * @brief Implementation of SessionBoundaryDetector.
 */

#include "domain/session/SessionBoundaryDetector.hpp"
#include "domain/session/SignalDetectors.hpp"
#include <algorithm>

namespace sessionlens::domain::session {

using json = nlohmann::json;

SessionBoundaryDetector::SessionBoundaryDetector(browsing::TrackingConfig config,
                                                 browsing::DomainCatalog catalog,
                                                 browsing::Clock clock)
    : m_config(std::move(config)),
      m_catalog(std::move(catalog)),
      m_clock(clock ? std::move(clock) : browsing::Clock(&browsing::SystemNow)),
      m_rng(std::random_device{}()) {}

SignalList SessionBoundaryDetector::analyzeEvent(const browsing::BrowsingEvent& event) {
    m_context.update(event);

    DetectionInput input{event, m_context, m_config, m_catalog, m_clock()};
    SignalList signals;
    for (SignalDetector detect : DefaultDetectors()) {
        auto found = detect(input);
        signals.insert(signals.end(), found.begin(), found.end());
    }

    m_signalHistory.insert(m_signalHistory.end(), signals.begin(), signals.end());
    if (m_signalHistory.size() > kMaxSignalHistory) {
        m_signalHistory.erase(m_signalHistory.begin(),
                              m_signalHistory.end() - static_cast<std::ptrdiff_t>(kTrimmedSignalHistory));
    }

    return signals;
}

std::optional<SessionBoundary> SessionBoundaryDetector::shouldCreateBoundary(const SignalList& signals) {
    if (signals.empty()) {
        return std::nullopt;
    }

    double total = 0.0;
    for (const auto& s : signals) total += s.strength;
    double average = total / static_cast<double>(signals.size());

    if (average < m_config.boundaryThreshold) {
        return std::nullopt;
    }

    // First strongest signal wins ties.
    auto primary = signals.begin();
    for (auto it = signals.begin() + 1; it != signals.end(); ++it) {
        if (it->strength > primary->strength) primary = it;
    }

    return createBoundary(*primary, signals);
}

SessionBoundary SessionBoundaryDetector::createBoundary(const SessionSignal& primary, const SignalList& all) {
    SessionBoundary boundary;
    boundary.id = generateBoundaryId();
    boundary.type = BoundaryType::End;
    boundary.reason = ReasonForSignal(primary.type);
    boundary.timestamp = primary.timestamp;
    boundary.sessionId = "";

    json types = json::array();
    for (const auto& s : all) types.push_back(SignalTypeToString(s.type));

    boundary.metadata = {
        {"primarySignal", SignalTypeToString(primary.type)},
        {"signalStrength", primary.strength},
        {"totalSignals", all.size()},
        {"allSignalTypes", types}
    };
    if (primary.metadata.is_object()) {
        boundary.metadata.update(primary.metadata);
    }
    return boundary;
}

std::string SessionBoundaryDetector::generateBoundaryId() {
    static const char alphanum[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphanum) - 2);
    std::string suffix;
    suffix.reserve(6);
    for (int i = 0; i < 6; ++i) {
        suffix += alphanum[pick(m_rng)];
    }
    return "boundary_" + std::to_string(m_clock()) + "_" + suffix;
}

void SessionBoundaryDetector::reset() {
    m_context.clear();
    m_signalHistory.clear();
}

DetectionStats SessionBoundaryDetector::getDetectionStats() const {
    DetectionStats stats;
    stats.recentEvents = m_context.getRecentEvents().size();
    stats.currentDomains = m_context.getCurrentDomains().size();
    stats.navigationGaps = m_context.getNavigationGaps().size();
    stats.domainTransitions = m_context.getDomainTransitions().size();
    stats.sessionSignals = m_signalHistory.size();
    stats.windowCount = m_context.getWindowCount();
    stats.tabCount = m_context.getTabCount();
    return stats;
}

} // namespace sessionlens::domain::session
