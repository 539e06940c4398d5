/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving tracking configuration (settings.json).
 *
 * Tracking options live under "tracking"; an optional "domainCategories"
 * object replaces the built-in category table. Anything missing or invalid
 * falls back to the built-in defaults.
 */

#pragma once

#include "domain/browsing/DomainCatalog.hpp"
#include "domain/browsing/TrackingConfig.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace sessionlens::infrastructure {

struct AppSettings {
    domain::browsing::TrackingConfig tracking;
    domain::browsing::DomainCatalog catalog;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param settingsPath Path to settings.json. A missing file yields defaults.
     */
    static AppSettings Load(const std::string& settingsPath);

    /**
     * @brief Overlays the keys present in `j` on top of `defaults`.
     * Mistyped keys are logged and keep their default.
     */
    static domain::browsing::TrackingConfig ParseTracking(const nlohmann::json& j,
                                                          domain::browsing::TrackingConfig defaults = {});

    /**
     * @brief Builds a catalog from {"work": ["github.com", ...], ...}.
     * Categories keep the built-in order; unknown category names are ignored.
     * @return std::nullopt when no usable category is present.
     */
    static std::optional<domain::browsing::DomainCatalog> ParseCatalog(const nlohmann::json& j);

    static nlohmann::json ToJson(const AppSettings& settings);

    /** @brief Writes settings, preserving unrelated keys of an existing file. */
    static void Save(const std::string& settingsPath, const AppSettings& settings);
};

} // namespace sessionlens::infrastructure
