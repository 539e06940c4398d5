/**
 * @file DomainCatalog.cpp
 * @brief Implementation of hostname parsing and DomainCatalog.
 */

#include "domain/browsing/DomainCatalog.hpp"
#include <algorithm>
#include <cctype>

namespace sessionlens::domain::browsing {

std::string CategoryToString(DomainCategory category) {
    switch (category) {
        case DomainCategory::Work: return "work";
        case DomainCategory::Social: return "social";
        case DomainCategory::Entertainment: return "entertainment";
        case DomainCategory::Shopping: return "shopping";
        case DomainCategory::News: return "news";
        case DomainCategory::Education: return "education";
        default: return "other";
    }
}

std::optional<DomainCategory> CategoryFromString(const std::string& name) {
    if (name == "work") return DomainCategory::Work;
    if (name == "social") return DomainCategory::Social;
    if (name == "entertainment") return DomainCategory::Entertainment;
    if (name == "shopping") return DomainCategory::Shopping;
    if (name == "news") return DomainCategory::News;
    if (name == "education") return DomainCategory::Education;
    if (name == "other") return DomainCategory::Other;
    return std::nullopt;
}

static bool isSchemeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

std::optional<std::string> ExtractDomain(const std::string& url) {
    auto colon = url.find(':');
    if (colon == std::string::npos || colon == 0) return std::nullopt;
    if (!std::isalpha(static_cast<unsigned char>(url[0]))) return std::nullopt;
    for (size_t i = 1; i < colon; ++i) {
        if (!isSchemeChar(url[i])) return std::nullopt;
    }

    // Only hierarchical URLs ("scheme://authority/...") carry a hostname.
    if (url.compare(colon + 1, 2, "//") != 0) return std::nullopt;

    size_t authStart = colon + 3;
    size_t authEnd = url.find_first_of("/?#", authStart);
    std::string authority = url.substr(authStart, authEnd == std::string::npos ? std::string::npos : authEnd - authStart);

    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    std::string host;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        host = authority.substr(0, close + 1);
    } else {
        auto portSep = authority.find(':');
        host = authority.substr(0, portSep);
        if (portSep != std::string::npos) {
            std::string port = authority.substr(portSep + 1);
            if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
                return std::nullopt;
            }
        }
    }

    if (host.empty()) return std::nullopt;
    for (char c : host) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '<' || c == '>' || c == '%' || c == '\\') {
            return std::nullopt;
        }
    }

    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return host;
}

std::optional<std::string> RootDomain(const std::string& hostname) {
    auto last = hostname.rfind('.');
    if (last == std::string::npos || last == 0) return std::nullopt;
    auto prev = hostname.rfind('.', last - 1);
    return prev == std::string::npos ? hostname : hostname.substr(prev + 1);
}

DomainCatalog::DomainCatalog() : m_entries(DefaultEntries()) {}

DomainCatalog::DomainCatalog(std::vector<Entry> entries) : m_entries(std::move(entries)) {}

DomainCategory DomainCatalog::categorize(const std::string& hostname) const {
    for (const auto& [category, patterns] : m_entries) {
        for (const auto& pattern : patterns) {
            if (!pattern.empty() && hostname.find(pattern) != std::string::npos) {
                return category;
            }
        }
    }
    return DomainCategory::Other;
}

std::vector<DomainCatalog::Entry> DomainCatalog::DefaultEntries() {
    return {
        {DomainCategory::Work, {"gmail.com", "docs.google.com", "slack.com", "teams.microsoft.com", "github.com", "stackoverflow.com"}},
        {DomainCategory::Social, {"facebook.com", "twitter.com", "instagram.com", "linkedin.com", "reddit.com"}},
        {DomainCategory::Entertainment, {"youtube.com", "netflix.com", "spotify.com", "twitch.tv", "tiktok.com"}},
        {DomainCategory::Shopping, {"amazon.com", "ebay.com", "shopify.com", "etsy.com", "walmart.com"}},
        {DomainCategory::News, {"cnn.com", "bbc.com", "reuters.com", "news.google.com", "nytimes.com"}},
        {DomainCategory::Education, {"coursera.org", "edx.org", "khanacademy.org", "udemy.com", "wikipedia.org"}}
    };
}

} // namespace sessionlens::domain::browsing
