/**
 * @file EventLogReader.cpp
 * @brief Implementation of EventLogReader.
 */

#include "infrastructure/EventLogReader.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace sessionlens::infrastructure {

using json = nlohmann::json;
using domain::browsing::BrowsingEvent;
using domain::browsing::EventMetadata;

namespace {

// A mistyped optional field is dropped; the rest of the event is kept.
template<typename T>
void readOptional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        std::cerr << "[EventLogReader] Ignoring field '" << key << "': " << e.what() << std::endl;
        out.reset();
    }
}

std::string readString(const json& j, const char* key) {
    std::optional<std::string> value;
    readOptional(j, key, value);
    return value.value_or(std::string());
}

template<typename T>
void writeOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

EventMetadata metadataFromJson(const json& j) {
    EventMetadata m;
    if (!j.is_object()) return m;
    readOptional(j, "domain", m.domain);
    readOptional(j, "referrer", m.referrer);
    readOptional(j, "transitionType", m.transitionType);
    readOptional(j, "parentTabId", m.parentTabId);
    readOptional(j, "openerTabId", m.openerTabId);
    readOptional(j, "pinned", m.pinned);
    readOptional(j, "muted", m.muted);
    readOptional(j, "windowType", m.windowType);
    readOptional(j, "windowState", m.windowState);
    readOptional(j, "sessionBoundary", m.sessionBoundary);
    readOptional(j, "loadTime", m.loadTime);
    readOptional(j, "renderTime", m.renderTime);
    readOptional(j, "timeSpent", m.timeSpent);
    readOptional(j, "scrollEvents", m.scrollEvents);
    readOptional(j, "clickEvents", m.clickEvents);
    readOptional(j, "isIncognito", m.isIncognito);
    readOptional(j, "sensitiveDataFiltered", m.sensitiveDataFiltered);
    return m;
}

json metadataToJson(const EventMetadata& m) {
    json j = json::object();
    writeOptional(j, "domain", m.domain);
    writeOptional(j, "referrer", m.referrer);
    writeOptional(j, "transitionType", m.transitionType);
    writeOptional(j, "parentTabId", m.parentTabId);
    writeOptional(j, "openerTabId", m.openerTabId);
    writeOptional(j, "pinned", m.pinned);
    writeOptional(j, "muted", m.muted);
    writeOptional(j, "windowType", m.windowType);
    writeOptional(j, "windowState", m.windowState);
    writeOptional(j, "sessionBoundary", m.sessionBoundary);
    writeOptional(j, "loadTime", m.loadTime);
    writeOptional(j, "renderTime", m.renderTime);
    writeOptional(j, "timeSpent", m.timeSpent);
    writeOptional(j, "scrollEvents", m.scrollEvents);
    writeOptional(j, "clickEvents", m.clickEvents);
    writeOptional(j, "isIncognito", m.isIncognito);
    writeOptional(j, "sensitiveDataFiltered", m.sensitiveDataFiltered);
    return j;
}

} // namespace

EventLogReadResult EventLogReader::ReadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open event log: " + path);
    }
    auto result = ReadStream(in);
    if (result.skippedLines > 0) {
        std::cerr << "[EventLogReader] Skipped " << result.skippedLines
                  << " malformed line(s) in " << path << std::endl;
    }
    return result;
}

EventLogReadResult EventLogReader::ReadStream(std::istream& in) {
    EventLogReadResult result;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        if (auto event = ParseLine(line)) {
            result.events.push_back(std::move(*event));
        } else {
            result.skippedLines++;
        }
    }
    return result;
}

std::optional<BrowsingEvent> EventLogReader::ParseLine(const std::string& line) {
    try {
        auto j = json::parse(line);
        if (!j.is_object()) return std::nullopt;
        return FromJson(j);
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

BrowsingEvent EventLogReader::FromJson(const json& j) {
    BrowsingEvent event;
    event.timestamp = j.at("timestamp").get<domain::browsing::Timestamp>();
    event.type = domain::browsing::EventTypeFromString(j.at("type").get<std::string>());
    event.id = readString(j, "id");
    event.sessionId = readString(j, "sessionId");
    readOptional(j, "tabId", event.tabId);
    readOptional(j, "windowId", event.windowId);
    readOptional(j, "url", event.url);
    readOptional(j, "title", event.title);
    if (auto it = j.find("metadata"); it != j.end()) {
        event.metadata = metadataFromJson(*it);
    }
    return event;
}

json EventLogReader::ToJson(const BrowsingEvent& event) {
    json j = {
        {"id", event.id},
        {"timestamp", event.timestamp},
        {"type", domain::browsing::EventTypeToString(event.type)},
        {"sessionId", event.sessionId}
    };
    writeOptional(j, "tabId", event.tabId);
    writeOptional(j, "windowId", event.windowId);
    writeOptional(j, "url", event.url);
    writeOptional(j, "title", event.title);
    j["metadata"] = metadataToJson(event.metadata);
    return j;
}

} // namespace sessionlens::infrastructure
