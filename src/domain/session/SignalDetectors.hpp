/**
 * @file SignalDetectors.hpp
 * @brief The five boundary heuristics, each a pure function of (event, context).
 */

#pragma once

#include <vector>
#include "domain/browsing/BrowsingEvent.hpp"
#include "domain/browsing/DomainCatalog.hpp"
#include "domain/browsing/TrackingConfig.hpp"
#include "SessionContext.hpp"
#include "SessionSignal.hpp"

namespace sessionlens::domain::session {

/**
 * @struct DetectionInput
 * @brief Everything a detector may look at. The context is already updated with `event`.
 */
struct DetectionInput {
    const browsing::BrowsingEvent& event;
    const SessionContext& context;
    const browsing::TrackingConfig& config;
    const browsing::DomainCatalog& catalog;
    Timestamp now;
};

using SignalDetector = SignalList (*)(const DetectionInput&);

/**
 * @brief Long pause since the previous event, or activity resuming after a quiet period.
 */
SignalList DetectIdleSignals(const DetectionInput& input);

/**
 * @brief Switch to a domain unrelated to, or in another category than, the active ones.
 * Silent unless domainChangeSessionBoundary is enabled.
 */
SignalList DetectDomainChangeSignals(const DetectionInput& input);

/**
 * @brief Long interval between navigations, or a run of growing navigation gaps.
 */
SignalList DetectNavigationGapSignals(const DetectionInput& input);

/**
 * @brief Closing the last windows, or opening a window after a quiet minute.
 */
SignalList DetectWindowPatternSignals(const DetectionInput& input);

/**
 * @brief Canonical hour transitions and very long sessions.
 */
SignalList DetectTimeBasedSignals(const DetectionInput& input);

/** @brief Detectors in evaluation order. */
const std::vector<SignalDetector>& DefaultDetectors();

} // namespace sessionlens::domain::session
