/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace sessionlens::infrastructure {

using json = nlohmann::json;
using domain::browsing::DomainCatalog;
using domain::browsing::DomainCategory;
using domain::browsing::TrackingConfig;

namespace {

template<typename T>
void overlay(const json& j, const char* key, T& field) {
    auto it = j.find(key);
    if (it == j.end()) return;
    try {
        field = it->get<T>();
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring tracking." << key << ": " << e.what() << std::endl;
    }
}

} // namespace

AppSettings ConfigLoader::Load(const std::string& settingsPath) {
    AppSettings settings;
    if (!std::filesystem::exists(settingsPath)) {
        return settings;
    }

    try {
        std::ifstream f(settingsPath);
        json j;
        f >> j;

        if (auto it = j.find("tracking"); it != j.end() && it->is_object()) {
            auto tracking = ParseTracking(*it);
            if (tracking.isValid()) {
                settings.tracking = tracking;
            } else {
                std::cerr << "[ConfigLoader] Invalid tracking values in " << settingsPath
                          << ", using defaults." << std::endl;
            }
        }

        if (auto it = j.find("domainCategories"); it != j.end()) {
            if (auto catalog = ParseCatalog(*it)) {
                settings.catalog = std::move(*catalog);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
        return AppSettings{};
    }

    return settings;
}

TrackingConfig ConfigLoader::ParseTracking(const json& j, TrackingConfig defaults) {
    TrackingConfig config = defaults;
    overlay(j, "idleThreshold", config.idleThreshold);
    overlay(j, "sessionGapThreshold", config.sessionGapThreshold);
    overlay(j, "domainChangeSessionBoundary", config.domainChangeSessionBoundary);
    overlay(j, "deepWorkThreshold", config.deepWorkThreshold);
    overlay(j, "distractionThreshold", config.distractionThreshold);
    overlay(j, "enableFormTracking", config.enableFormTracking);
    overlay(j, "enableScrollTracking", config.enableScrollTracking);
    overlay(j, "enableClickTracking", config.enableClickTracking);
    overlay(j, "enableProductivityMetrics", config.enableProductivityMetrics);
    overlay(j, "boundaryThreshold", config.boundaryThreshold);
    overlay(j, "blockGap", config.blockGap);
    overlay(j, "maxBlockEvents", config.maxBlockEvents);
    overlay(j, "idleBlockDuration", config.idleBlockDuration);
    overlay(j, "minActiveDensity", config.minActiveDensity);
    overlay(j, "sustainedActivityDensity", config.sustainedActivityDensity);
    overlay(j, "visitGap", config.visitGap);
    overlay(j, "singleVisitEstimate", config.singleVisitEstimate);
    return config;
}

std::optional<DomainCatalog> ConfigLoader::ParseCatalog(const json& j) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] domainCategories must be an object, using built-in table." << std::endl;
        return std::nullopt;
    }

    for (const auto& item : j.items()) {
        if (!domain::browsing::CategoryFromString(item.key())) {
            std::cerr << "[ConfigLoader] Unknown domain category: " << item.key() << std::endl;
        }
    }

    std::vector<DomainCatalog::Entry> entries;
    for (const auto& builtIn : DomainCatalog::DefaultEntries()) {
        auto it = j.find(domain::browsing::CategoryToString(builtIn.first));
        if (it == j.end() || !it->is_array()) continue;

        std::vector<std::string> patterns;
        for (const auto& p : *it) {
            if (p.is_string() && !p.get<std::string>().empty()) patterns.push_back(p.get<std::string>());
        }
        if (!patterns.empty()) entries.emplace_back(builtIn.first, std::move(patterns));
    }

    if (entries.empty()) return std::nullopt;
    return DomainCatalog(std::move(entries));
}

json ConfigLoader::ToJson(const AppSettings& settings) {
    const auto& c = settings.tracking;
    json tracking = {
        {"idleThreshold", c.idleThreshold},
        {"sessionGapThreshold", c.sessionGapThreshold},
        {"domainChangeSessionBoundary", c.domainChangeSessionBoundary},
        {"deepWorkThreshold", c.deepWorkThreshold},
        {"distractionThreshold", c.distractionThreshold},
        {"enableFormTracking", c.enableFormTracking},
        {"enableScrollTracking", c.enableScrollTracking},
        {"enableClickTracking", c.enableClickTracking},
        {"enableProductivityMetrics", c.enableProductivityMetrics},
        {"boundaryThreshold", c.boundaryThreshold},
        {"blockGap", c.blockGap},
        {"maxBlockEvents", c.maxBlockEvents},
        {"idleBlockDuration", c.idleBlockDuration},
        {"minActiveDensity", c.minActiveDensity},
        {"sustainedActivityDensity", c.sustainedActivityDensity},
        {"visitGap", c.visitGap},
        {"singleVisitEstimate", c.singleVisitEstimate}
    };

    json categories = json::object();
    for (const auto& [category, patterns] : settings.catalog.getEntries()) {
        categories[domain::browsing::CategoryToString(category)] = patterns;
    }

    return {{"tracking", tracking}, {"domainCategories", categories}};
}

void ConfigLoader::Save(const std::string& settingsPath, const AppSettings& settings) {
    json j = json::object();

    // Keep unrelated keys of an existing file
    if (std::filesystem::exists(settingsPath)) {
        try {
            std::ifstream f(settingsPath);
            f >> j;
            if (!j.is_object()) j = json::object();
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << settingsPath << ": " << e.what() << std::endl;
            j = json::object();
        }
    }

    j.update(ToJson(settings));

    std::ofstream f(settingsPath);
    if (!f) {
        std::cerr << "[ConfigLoader] Error writing " << settingsPath << std::endl;
        return;
    }
    f << j.dump(4);
}

} // namespace sessionlens::infrastructure
