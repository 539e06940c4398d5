/**
 * @file SessionSignal.hpp
 * @brief Weighted boundary signals and the boundary decision value.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/browsing/BrowsingEvent.hpp"

namespace sessionlens::domain::session {

using browsing::Timestamp;

/**
 * @enum SignalType
 * @brief Family of heuristic that produced a signal.
 */
enum class SignalType {
    Idle,
    DomainChange,
    NavigationGap,
    WindowPattern,
    TimeBased
};

inline std::string SignalTypeToString(SignalType type) {
    switch (type) {
        case SignalType::Idle: return "idle";
        case SignalType::DomainChange: return "domain_change";
        case SignalType::NavigationGap: return "navigation_gap";
        case SignalType::WindowPattern: return "window_pattern";
        case SignalType::TimeBased: return "time_based";
        default: return "unknown";
    }
}

/**
 * @struct SessionSignal
 * @brief One piece of evidence for a boundary. Metadata explains the evidence.
 */
struct SessionSignal {
    SignalType type;
    double strength = 0.0;  ///< 0.0 to 1.0
    Timestamp timestamp = 0;
    nlohmann::json metadata = nlohmann::json::object();
};

using SignalList = std::vector<SessionSignal>;

/** @brief Boundary direction. The detector only reports `End`; `Start` is for callers that record session openings. */
enum class BoundaryType {
    Start,
    End
};

inline std::string BoundaryTypeToString(BoundaryType type) {
    return type == BoundaryType::Start ? "start" : "end";
}

enum class BoundaryReason {
    UserInitiated,
    IdleTimeout,
    NavigationGap,
    DomainChange
};

inline std::string BoundaryReasonToString(BoundaryReason reason) {
    switch (reason) {
        case BoundaryReason::UserInitiated: return "user_initiated";
        case BoundaryReason::IdleTimeout: return "idle_timeout";
        case BoundaryReason::NavigationGap: return "navigation_gap";
        case BoundaryReason::DomainChange: return "domain_change";
        default: return "user_initiated";
    }
}

/**
 * @brief Boundary reason reported for a deciding signal type.
 */
inline BoundaryReason ReasonForSignal(SignalType type) {
    switch (type) {
        case SignalType::Idle: return BoundaryReason::IdleTimeout;
        case SignalType::DomainChange: return BoundaryReason::DomainChange;
        case SignalType::NavigationGap: return BoundaryReason::NavigationGap;
        case SignalType::WindowPattern:
        case SignalType::TimeBased:
        default:
            return BoundaryReason::UserInitiated;
    }
}

/**
 * @struct SessionBoundary
 * @brief Detector output. sessionId is left blank for the session manager.
 */
struct SessionBoundary {
    std::string id;
    BoundaryType type = BoundaryType::End;
    BoundaryReason reason = BoundaryReason::UserInitiated;
    Timestamp timestamp = 0;
    std::string sessionId;
    nlohmann::json metadata = nlohmann::json::object();
};

} // namespace sessionlens::domain::session
