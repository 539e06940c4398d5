/**
 * @file SessionLensApp.hpp
 * @brief Command-line application: replays an NDJSON event log and prints boundaries plus an analytics report.
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace sessionlens::app {

/**
 * @class SessionLensApp
 * @brief Loads settings, replays the event log through the analytics service and writes the JSON report.
 *
 * The report is the only thing written to the output stream. Progress and
 * errors go to the standard log and error streams.
 */
class SessionLensApp {
public:
    SessionLensApp(std::string logPath, std::optional<std::string> settingsPath);

    /**
     * @brief Runs the replay.
     * @return Exit code (0 for success, 1 when the log is unreadable, empty or the analysis failed).
     */
    int Run(std::ostream& out);

private:
    std::string m_logPath;
    std::optional<std::string> m_settingsPath;
};

} // namespace sessionlens::app
