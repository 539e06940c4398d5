/**
 * @file TimeUtils.hpp
 * @brief Wall-clock helpers for epoch-millisecond timestamps.
 */

#pragma once

#include <chrono>
#include <ctime>
#include <functional>
#include "BrowsingEvent.hpp"

namespace sessionlens::domain::browsing {

constexpr Millis kMinute = 60 * 1000;
constexpr Millis kHour = 60 * kMinute;

/** @brief Source of "now" in epoch milliseconds. Injected so detection stays reproducible. */
using Clock = std::function<Timestamp()>;

inline Timestamp SystemNow() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief Hour of day (0-23) of a timestamp in the local time zone.
 */
inline int LocalHour(Timestamp ts) {
    std::time_t seconds = static_cast<std::time_t>(ts / 1000);
    if (ts < 0 && ts % 1000 != 0) --seconds;
    std::tm tm{};
    localtime_r(&seconds, &tm);
    return tm.tm_hour;
}

/** @brief Minutes as a double, for per-minute rates. */
inline double ToMinutes(Millis ms) {
    return static_cast<double>(ms) / static_cast<double>(kMinute);
}

} // namespace sessionlens::domain::browsing
