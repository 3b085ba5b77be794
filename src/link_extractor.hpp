#pragma once

#include "html_document.hpp"
#include "robots_policy.hpp"
#include "url.hpp"

#include <string>
#include <unordered_set>
#include <vector>

class LinkExtractor {
public:
    LinkExtractor(const DomainScope& scope, const RobotsPolicy& robots, std::string user_agent);

    // Anchors resolved against base_url and canonicalized, kept when in scope,
    // not yet visited and allowed by robots. Document order, no duplicates.
    // The robots check here only saves queue space; the crawler checks again
    // when the URL is dequeued.
    std::vector<std::string> extract_links(const HtmlDocument& doc,
                                           const std::string& base_url,
                                           const std::unordered_set<std::string>& visited) const;

    std::vector<std::string> extract_links(const std::string& html,
                                           const std::string& base_url,
                                           const std::unordered_set<std::string>& visited) const;

private:
    const DomainScope& scope_;
    const RobotsPolicy& robots_;
    std::string user_agent_;
};
