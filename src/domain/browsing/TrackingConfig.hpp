/**
 * @file TrackingConfig.hpp
 * @brief Numeric and boolean options consumed by the detector and the analytics engine.
 */

#pragma once

#include <cstddef>
#include "BrowsingEvent.hpp"

namespace sessionlens::domain::browsing {

/**
 * @struct TrackingConfig
 * @brief Flat configuration. All durations in milliseconds.
 *
 * The second group holds heuristic calibration constants. They are exposed
 * so they can be tuned and tested, and carry the values the detector and the
 * engine were calibrated with.
 */
struct TrackingConfig {
    Millis idleThreshold = 300000;
    Millis sessionGapThreshold = 600000;
    bool domainChangeSessionBoundary = false;
    Millis deepWorkThreshold = 900000;
    Millis distractionThreshold = 30000;

    // Consumed upstream by the capture layer; carried for completeness.
    bool enableFormTracking = true;
    bool enableScrollTracking = true;
    bool enableClickTracking = true;
    bool enableProductivityMetrics = true;

    // --- Calibration constants ---
    double boundaryThreshold = 0.7;       ///< Mean signal strength that opens a boundary.
    Millis blockGap = 300000;             ///< Gap that closes a time block.
    std::size_t maxBlockEvents = 50;      ///< Events per time block before it is closed.
    Millis idleBlockDuration = 600000;    ///< Blocks longer than this are idle unless densely active.
    double minActiveDensity = 0.1;        ///< Events per minute below which a block is idle.
    double sustainedActivityDensity = 0.5;///< Density that keeps a long block from being idle.
    Millis visitGap = 600000;             ///< Gap that splits visits to the same domain.
    Millis singleVisitEstimate = 30000;   ///< Time credited to a single-event visit.

    /** @brief Basic sanity check used by the config loader. */
    bool isValid() const {
        return idleThreshold > 0 && sessionGapThreshold > 0 &&
               deepWorkThreshold >= 0 && distractionThreshold >= 0 &&
               boundaryThreshold > 0.0 && boundaryThreshold <= 1.0 &&
               blockGap > 0 && maxBlockEvents > 0 && visitGap > 0;
    }
};

} // namespace sessionlens::domain::browsing
