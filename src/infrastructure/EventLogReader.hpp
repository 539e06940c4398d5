/**
 * @file EventLogReader.hpp
 * @brief Loads browsing events from newline-delimited JSON logs.
 */

#pragma once

#include "domain/browsing/BrowsingEvent.hpp"
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace sessionlens::infrastructure {

struct EventLogReadResult {
    domain::browsing::BrowsingEventList events;
    std::size_t skippedLines = 0;  ///< Lines that were not valid events.
};

/**
 * @class EventLogReader
 * @brief One JSON object per line. Blank lines are ignored, malformed ones skipped and counted.
 */
class EventLogReader {
public:
    /**
     * @brief Reads a whole log file.
     * @throws std::runtime_error if the file cannot be opened.
     */
    static EventLogReadResult ReadFile(const std::string& path);

    static EventLogReadResult ReadStream(std::istream& in);

    /** @brief Parses one line; std::nullopt when it is not a usable event. */
    static std::optional<domain::browsing::BrowsingEvent> ParseLine(const std::string& line);

    /**
     * @brief Maps a JSON object to an event. `timestamp` and `type` are required; unknown keys are ignored.
     * @throws nlohmann::json::exception on missing or mistyped required fields.
     */
    static domain::browsing::BrowsingEvent FromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::browsing::BrowsingEvent& event);
};

} // namespace sessionlens::infrastructure
