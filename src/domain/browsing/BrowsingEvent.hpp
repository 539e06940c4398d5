/**
 * @file BrowsingEvent.hpp
 * @brief Event model shared by the boundary detector and the analytics engine.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sessionlens::domain::browsing {

/** @brief Epoch milliseconds. */
using Timestamp = std::int64_t;

/** @brief Durations are kept in milliseconds throughout the code base. */
using Millis = std::int64_t;

/**
 * @enum EventType
 * @brief Closed set of activity events produced by the capture layer.
 */
enum class EventType {
    TabCreated,
    TabUpdated,
    TabRemoved,
    TabActivated,
    TabMoved,
    TabPinned,
    TabUnpinned,
    TabMuted,
    TabUnmuted,
    WindowCreated,
    WindowRemoved,
    WindowFocusChanged,
    WindowStateChanged,
    NavigationStarted,
    NavigationCompleted,
    NavigationCommitted,
    NavigationError,
    PageLoaded,
    PageUnloaded,
    FormInteraction,
    ScrollEvent,
    ClickEvent,
    SessionStarted,
    SessionEnded,
    IdleStart,
    IdleEnd,
    Unknown            ///< Wire name not recognized; kept so the event still counts.
};

inline std::string EventTypeToString(EventType type) {
    switch (type) {
        case EventType::TabCreated: return "tab_created";
        case EventType::TabUpdated: return "tab_updated";
        case EventType::TabRemoved: return "tab_removed";
        case EventType::TabActivated: return "tab_activated";
        case EventType::TabMoved: return "tab_moved";
        case EventType::TabPinned: return "tab_pinned";
        case EventType::TabUnpinned: return "tab_unpinned";
        case EventType::TabMuted: return "tab_muted";
        case EventType::TabUnmuted: return "tab_unmuted";
        case EventType::WindowCreated: return "window_created";
        case EventType::WindowRemoved: return "window_removed";
        case EventType::WindowFocusChanged: return "window_focus_changed";
        case EventType::WindowStateChanged: return "window_state_changed";
        case EventType::NavigationStarted: return "navigation_started";
        case EventType::NavigationCompleted: return "navigation_completed";
        case EventType::NavigationCommitted: return "navigation_committed";
        case EventType::NavigationError: return "navigation_error";
        case EventType::PageLoaded: return "page_loaded";
        case EventType::PageUnloaded: return "page_unloaded";
        case EventType::FormInteraction: return "form_interaction";
        case EventType::ScrollEvent: return "scroll_event";
        case EventType::ClickEvent: return "click_event";
        case EventType::SessionStarted: return "session_started";
        case EventType::SessionEnded: return "session_ended";
        case EventType::IdleStart: return "idle_start";
        case EventType::IdleEnd: return "idle_end";
        default: return "unknown";
    }
}

/**
 * @brief Parses a wire name. Unrecognized names map to EventType::Unknown.
 */
inline EventType EventTypeFromString(const std::string& name) {
    static const EventType all[] = {
        EventType::TabCreated, EventType::TabUpdated, EventType::TabRemoved,
        EventType::TabActivated, EventType::TabMoved, EventType::TabPinned,
        EventType::TabUnpinned, EventType::TabMuted, EventType::TabUnmuted,
        EventType::WindowCreated, EventType::WindowRemoved, EventType::WindowFocusChanged,
        EventType::WindowStateChanged, EventType::NavigationStarted, EventType::NavigationCompleted,
        EventType::NavigationCommitted, EventType::NavigationError, EventType::PageLoaded,
        EventType::PageUnloaded, EventType::FormInteraction, EventType::ScrollEvent,
        EventType::ClickEvent, EventType::SessionStarted, EventType::SessionEnded,
        EventType::IdleStart, EventType::IdleEnd
    };
    for (EventType t : all) {
        if (EventTypeToString(t) == name) return t;
    }
    return EventType::Unknown;
}

/**
 * @brief Navigation-class events drive the navigation gap bookkeeping.
 */
inline bool IsNavigationEvent(EventType type) {
    return type == EventType::NavigationStarted ||
           type == EventType::NavigationCompleted ||
           type == EventType::NavigationCommitted ||
           type == EventType::PageLoaded;
}

/**
 * @struct EventMetadata
 * @brief Bounded metadata schema. Every field is optional; unknown keys are dropped on ingestion.
 */
struct EventMetadata {
    // Navigation
    std::optional<std::string> domain;
    std::optional<std::string> referrer;
    std::optional<std::string> transitionType;

    // Tab
    std::optional<int> parentTabId;
    std::optional<int> openerTabId;
    std::optional<bool> pinned;
    std::optional<bool> muted;

    // Window
    std::optional<std::string> windowType;   ///< normal, popup, panel, app, devtools
    std::optional<std::string> windowState;  ///< normal, minimized, maximized, fullscreen

    std::optional<std::string> sessionBoundary;

    // Counters and timings reported by the content script
    std::optional<double> loadTime;
    std::optional<double> renderTime;
    std::optional<double> timeSpent;
    std::optional<int> scrollEvents;
    std::optional<int> clickEvents;

    // Privacy
    std::optional<bool> isIncognito;
    std::optional<bool> sensitiveDataFiltered;
};

/**
 * @struct BrowsingEvent
 * @brief One captured activity event. Read-only to the analysis core.
 */
struct BrowsingEvent {
    std::string id;
    Timestamp timestamp = 0;
    EventType type = EventType::Unknown;
    std::string sessionId;
    std::optional<int> tabId;
    std::optional<int> windowId;
    std::optional<std::string> url;
    std::optional<std::string> title;
    EventMetadata metadata;
};

using BrowsingEventList = std::vector<BrowsingEvent>;

} // namespace sessionlens::domain::browsing
