#include "robots_report.hpp"

#include "robots_policy.hpp"

#include <sstream>

using nlohmann::json;

json robots_report(const UrlParts& base, const std::string& path, PageFetcher& fetcher, const CrawlConfig& cfg) {
    RobotsFetch fetched = RobotsPolicy::fetch(base, fetcher, cfg.timeout);

    json result;
    result["base_url"] = base.origin();
    result["robots_url"] = fetched.robots_url;
    result["fetched"] = false;
    result["status_code"] = fetched.status_code;
    result["error"] = fetched.error.empty() ? json(nullptr) : json(fetched.error);
    result["user_agent"] = cfg.user_agent;
    result["tested_path"] = path;
    result["allowed"] = nullptr;
    result["note"] = nullptr;
    result["raw"] = nullptr;
    result["crawl_delay_ms"] = nullptr;
    result["sitemaps"] = json::array();

    if (!fetched.error.empty()) {
        result["note"] = "error fetching robots.txt: " + fetched.error;
    } else if (fetched.status_code == 200) {
        result["fetched"] = true;
        result["raw"] = fetched.body;
        RobotsPolicy policy{RobotsRules::parse(fetched.body)};
        result["allowed"] = policy.can_fetch(resolve_url(base.origin() + "/", path), cfg.user_agent);
        if (auto delay = policy.crawl_delay(cfg.user_agent)) result["crawl_delay_ms"] = delay->count();
        for (const auto& s : policy.rules()->sitemaps()) result["sitemaps"].push_back(s);
        result["note"] = "parsed robots.txt";
    } else if (fetched.status_code == 404) {
        result["allowed"] = true;
        result["note"] = "robots.txt not found (404); nothing is disallowed, check the site's terms anyway";
    } else {
        result["note"] = "robots.txt unavailable (status " + std::to_string(fetched.status_code) + ")";
    }
    return result;
}

RobotsVerdict robots_verdict(const json& report) {
    auto it = report.find("allowed");
    if (it == report.end() || !it->is_boolean()) return RobotsVerdict::Unknown;
    return it->get<bool>() ? RobotsVerdict::Allowed : RobotsVerdict::Disallowed;
}

std::string format_robots_report(const json& res) {
    std::ostringstream out;
    out << "Base: " << res["base_url"].get<std::string>() << "\n";
    out << "Robots URL: " << res["robots_url"].get<std::string>() << "\n";
    out << "Status: " << res["status_code"].get<long>() << "\n";
    if (!res["note"].is_null()) out << "Note: " << res["note"].get<std::string>() << "\n";
    out << "User-Agent: " << res["user_agent"].get<std::string>() << "\n";
    out << "Path: " << res["tested_path"].get<std::string>() << "\n";
    if (!res["crawl_delay_ms"].is_null()) out << "Crawl-delay: " << res["crawl_delay_ms"].get<long long>() << " ms\n";
    for (const auto& s : res["sitemaps"]) out << "Sitemap: " << s.get<std::string>() << "\n";

    switch (robots_verdict(res)) {
        case RobotsVerdict::Allowed: out << "Result: ALLOWED\n"; break;
        case RobotsVerdict::Disallowed: out << "Result: DISALLOWED\n"; break;
        case RobotsVerdict::Unknown: out << "Result: UNKNOWN (robots.txt missing or not usable)\n"; break;
    }

    if (res["raw"].is_string() && !res["raw"].get<std::string>().empty()) {
        out << "\n--- robots.txt ---\n" << res["raw"].get<std::string>().substr(0, kRawPreview) << "\n--- end ---\n";
    }
    return out.str();
}
