#pragma once

#include "page_fetcher.hpp"
#include "url.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// robots.txt bodies beyond this size are cut before parsing
constexpr std::size_t kMaxRobotsBytes = 500 * 1024;

// Crawl-delay values above this are clamped.
constexpr double kMaxCrawlDelaySeconds = 86400.0;

// One spelling for robots paths and patterns: %XX of unreserved characters is
// decoded, other escapes get uppercase hex, non-ASCII and control bytes are
// escaped. '*' and '$' are left alone.
std::string normalize_robots_path(const std::string& path);

// Prefix match of a robots path pattern against path[?query]. '*' matches any
// run of characters, a trailing '$' anchors the pattern at the end.
bool robots_pattern_matches(const std::string& pattern, const std::string& path);

// Product token of a User-Agent string: "DataCollectorBot/1.0 (...)" -> "datacollectorbot".
std::string robots_agent_token(const std::string& user_agent);

// Parsed robots.txt directives for one host.
class RobotsRules {
public:
    struct Rule {
        std::string pattern;
        bool allow = false;
    };

    struct Group {
        std::vector<std::string> agents;  // lowercase, "*" for the wildcard group
        std::vector<Rule> rules;
        std::optional<double> crawl_delay;
    };

    static RobotsRules parse(const std::string& body);

    // Longest matching pattern wins, allow wins a tie, no match means allowed.
    bool allowed(const std::string& path, const std::string& user_agent) const;

    // Delay of the groups naming this agent, else of the "*" group.
    std::optional<std::chrono::milliseconds> crawl_delay(const std::string& user_agent) const;

    const std::vector<Group>& groups() const { return groups_; }
    const std::vector<std::string>& sitemaps() const { return sitemaps_; }

private:
    std::vector<const Group*> groups_for(const std::string& user_agent) const;

    std::vector<Group> groups_;
    std::vector<std::string> sitemaps_;
};

// Result of requesting <origin>/robots.txt. status_code is -1 when the
// request never produced a response, error then carries the reason.
struct RobotsFetch {
    std::string robots_url;
    long status_code = -1;
    std::string body;
    std::string error;
};

// Robots exclusion for the crawled domain. Without directives (robots.txt
// missing, unreachable or ignored) every URL is allowed.
class RobotsPolicy {
public:
    RobotsPolicy() = default;
    explicit RobotsPolicy(RobotsRules rules);

    static std::string robots_url_for(const UrlParts& domain_root);
    static RobotsFetch fetch(const UrlParts& domain_root, PageFetcher& fetcher, std::chrono::milliseconds timeout);
    // Directives only from a 200 with a non-empty body.
    static RobotsPolicy from_fetch(const RobotsFetch& fetched);
    static RobotsPolicy load(const UrlParts& domain_root, PageFetcher& fetcher, std::chrono::milliseconds timeout);

    bool present() const { return rules_.has_value(); }
    const RobotsRules* rules() const { return rules_ ? &*rules_ : nullptr; }

    // Fails open: a URL that cannot be evaluated is allowed.
    bool can_fetch(const std::string& url, const std::string& user_agent) const;
    std::optional<std::chrono::milliseconds> crawl_delay(const std::string& user_agent) const;

private:
    std::optional<RobotsRules> rules_;
};
