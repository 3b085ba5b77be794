#pragma once

#include "crawl_config.hpp"
#include "page_fetcher.hpp"
#include "url.hpp"

#include <nlohmann/json.hpp>

#include <string>

// Exit status of check_robots.
enum class RobotsVerdict { Allowed = 0, Disallowed = 3, Unknown = 4 };

// Fetches <origin>/robots.txt and evaluates `path` for cfg.user_agent. The
// result carries base_url, robots_url, fetched, status_code, error,
// user_agent, tested_path, allowed (true, false or null), note, raw,
// crawl_delay_ms and sitemaps. A 404 counts as allowed; a failed fetch or any
// other status leaves allowed null.
nlohmann::json robots_report(const UrlParts& base, const std::string& path, PageFetcher& fetcher,
                             const CrawlConfig& cfg);

RobotsVerdict robots_verdict(const nlohmann::json& report);

constexpr std::size_t kRawPreview = 2000;

// Human-readable summary with the first kRawPreview bytes of robots.txt.
std::string format_robots_report(const nlohmann::json& report);
