/**
 * @file DomainCatalog.hpp
 * @brief Hostname extraction and domain categorization lookup tables.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sessionlens::domain::browsing {

/**
 * @enum DomainCategory
 * @brief Coarse site category used by both the detector and the engine.
 */
enum class DomainCategory {
    Work,
    Social,
    Entertainment,
    Shopping,
    News,
    Education,
    Other
};

std::string CategoryToString(DomainCategory category);

/** @brief Parses a category name; unknown names yield std::nullopt. */
std::optional<DomainCategory> CategoryFromString(const std::string& name);

/**
 * @brief Extracts the lowercase hostname of an absolute URL.
 * @return std::nullopt when the URL is malformed or has no host (e.g. "about:blank").
 */
std::optional<std::string> ExtractDomain(const std::string& url);

/**
 * @brief Last two dot-separated labels of a hostname, or std::nullopt for single-label hosts.
 */
std::optional<std::string> RootDomain(const std::string& hostname);

/**
 * @class DomainCatalog
 * @brief Ordered category -> domain pattern table.
 *
 * A hostname belongs to the first category with a pattern contained in it.
 * The table is data, so callers (and tests) can swap it out.
 */
class DomainCatalog {
public:
    using Entry = std::pair<DomainCategory, std::vector<std::string>>;

    DomainCatalog();  ///< Built-in table.
    explicit DomainCatalog(std::vector<Entry> entries);

    DomainCategory categorize(const std::string& hostname) const;

    const std::vector<Entry>& getEntries() const { return m_entries; }

    static std::vector<Entry> DefaultEntries();

private:
    std::vector<Entry> m_entries;
};

} // namespace sessionlens::domain::browsing
