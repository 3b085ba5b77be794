#include "link_extractor.hpp"

LinkExtractor::LinkExtractor(const DomainScope& scope, const RobotsPolicy& robots, std::string user_agent)
    : scope_(scope), robots_(robots), user_agent_(std::move(user_agent)) {}

std::vector<std::string> LinkExtractor::extract_links(const HtmlDocument& doc,
                                                      const std::string& base_url,
                                                      const std::unordered_set<std::string>& visited) const {
    std::vector<std::string> links;
    std::unordered_set<std::string> seen;
    for (const auto& href : doc.anchor_hrefs()) {
        std::string raw = trim(href);
        if (raw.empty() || raw[0] == '#') continue;

        auto canon = canonicalize(resolve_url(base_url, raw));
        if (!canon) continue;
        if (visited.count(*canon) || seen.count(*canon)) continue;
        if (!scope_.contains(*canon)) continue;
        if (!robots_.can_fetch(*canon, user_agent_)) continue;

        seen.insert(*canon);
        links.push_back(*canon);
    }
    return links;
}

std::vector<std::string> LinkExtractor::extract_links(const std::string& html,
                                                      const std::string& base_url,
                                                      const std::unordered_set<std::string>& visited) const {
    HtmlDocument doc(html, base_url);
    return extract_links(doc, base_url, visited);
}
