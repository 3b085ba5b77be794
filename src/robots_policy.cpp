#include "robots_policy.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

// -------------------- matching --------------------
static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static void append_escaped(std::string& out, unsigned char byte) {
    static const char digits[] = "0123456789ABCDEF";
    out += '%';
    out += digits[byte >> 4];
    out += digits[byte & 0x0F];
}

std::string normalize_robots_path(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (size_t i = 0; i < path.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(path[i]);
        if (c == '%' && i + 2 < path.size() && hex_value(path[i + 1]) >= 0 && hex_value(path[i + 2]) >= 0) {
            const unsigned char decoded = static_cast<unsigned char>(hex_value(path[i + 1]) * 16 + hex_value(path[i + 2]));
            if (std::isalnum(decoded) || decoded == '-' || decoded == '.' || decoded == '_' || decoded == '~') {
                out += static_cast<char>(decoded);
            } else {
                append_escaped(out, decoded);
            }
            i += 2;
        } else if (c <= 0x20 || c >= 0x7F) {
            append_escaped(out, c);
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

bool robots_pattern_matches(const std::string& pattern, const std::string& path) {
    bool anchored = !pattern.empty() && pattern.back() == '$';
    const size_t plen = anchored ? pattern.size() - 1 : pattern.size();

    // reachable[i]: the pattern prefix consumed so far can end at path[i]
    std::vector<char> reachable(path.size() + 1, 0);
    reachable[0] = 1;
    for (size_t k = 0; k < plen; ++k) {
        const char pc = pattern[k];
        std::vector<char> next(path.size() + 1, 0);
        bool any = false;
        if (pc == '*') {
            size_t first = 0;
            while (first <= path.size() && !reachable[first]) ++first;
            for (size_t i = first; i <= path.size(); ++i) next[i] = 1;
            any = first <= path.size();
        } else {
            for (size_t i = 0; i < path.size(); ++i) {
                if (reachable[i] && path[i] == pc) {
                    next[i + 1] = 1;
                    any = true;
                }
            }
        }
        if (!any) return false;
        reachable.swap(next);
    }
    if (anchored) return reachable[path.size()] != 0;
    return true;
}

std::string robots_agent_token(const std::string& user_agent) {
    std::string t = trim(user_agent);
    auto end = t.find_first_of("/ \t");
    return to_lower(end == std::string::npos ? t : t.substr(0, end));
}

// -------------------- parsing --------------------
RobotsRules RobotsRules::parse(const std::string& body_in) {
    RobotsRules out;
    const std::string body = body_in.size() > kMaxRobotsBytes ? body_in.substr(0, kMaxRobotsBytes) : body_in;

    std::istringstream iss(body);
    std::string line;
    Group* current = nullptr;
    bool last_was_agent = false;

    while (std::getline(iss, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        line = trim(line);
        if (line.empty()) continue;

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (key == "user-agent") {
            if (!last_was_agent || current == nullptr) {
                out.groups_.emplace_back();
                current = &out.groups_.back();
            }
            current->agents.push_back(value == "*" ? "*" : robots_agent_token(value));
            last_was_agent = true;
            continue;
        }
        last_was_agent = false;

        if (key == "sitemap") {
            if (!value.empty()) out.sitemaps_.push_back(value);
        } else if (current == nullptr) {
            // rules outside any group
            continue;
        } else if (key == "allow" || key == "disallow") {
            // "Disallow:" with no path allows everything
            if (value.empty()) continue;
            current->rules.push_back(Rule{normalize_robots_path(value), key == "allow"});
        } else if (key == "crawl-delay") {
            try {
                size_t used = 0;
                double d = std::stod(value, &used);
                if (used == value.size() && std::isfinite(d) && d >= 0) {
                    current->crawl_delay = std::min(d, kMaxCrawlDelaySeconds);
                } else {
                    std::cerr << "[warn] robots.txt: ignoring bad Crawl-delay '" << value << "'" << std::endl;
                }
            } catch (const std::exception&) {
                std::cerr << "[warn] robots.txt: ignoring bad Crawl-delay '" << value << "'" << std::endl;
            }
        }
    }
    return out;
}

std::vector<const RobotsRules::Group*> RobotsRules::groups_for(const std::string& user_agent) const {
    const std::string token = robots_agent_token(user_agent);
    std::vector<const Group*> specific;
    std::vector<const Group*> wildcard;
    for (const auto& g : groups_) {
        bool named = false;
        bool star = false;
        for (const auto& a : g.agents) {
            if (a == "*") star = true;
            else if (!a.empty() && token.find(a) != std::string::npos) named = true;
        }
        if (named) specific.push_back(&g);
        else if (star) wildcard.push_back(&g);
    }
    return specific.empty() ? wildcard : specific;
}

bool RobotsRules::allowed(const std::string& raw_path, const std::string& user_agent) const {
    const std::string path = normalize_robots_path(raw_path);
    if (path == "/robots.txt") return true;

    size_t best_len = 0;
    bool best_allow = true;
    bool matched = false;
    for (const Group* g : groups_for(user_agent)) {
        for (const auto& r : g->rules) {
            if (!robots_pattern_matches(r.pattern, path)) continue;
            size_t len = r.pattern.size();
            if (!matched || len > best_len || (len == best_len && r.allow && !best_allow)) {
                best_len = len;
                best_allow = r.allow;
                matched = true;
            }
        }
    }
    return best_allow;
}

std::optional<std::chrono::milliseconds> RobotsRules::crawl_delay(const std::string& user_agent) const {
    auto to_ms = [](double seconds) {
        std::chrono::duration<double> d(std::min(std::max(seconds, 0.0), kMaxCrawlDelaySeconds));
        return std::chrono::round<std::chrono::milliseconds>(d);
    };
    for (const Group* g : groups_for(user_agent)) {
        if (g->crawl_delay) return to_ms(*g->crawl_delay);
    }
    for (const auto& g : groups_) {
        for (const auto& a : g.agents) {
            if (a == "*" && g.crawl_delay) return to_ms(*g.crawl_delay);
        }
    }
    return std::nullopt;
}

// -------------------- policy --------------------
RobotsPolicy::RobotsPolicy(RobotsRules rules) : rules_(std::move(rules)) {}

std::string RobotsPolicy::robots_url_for(const UrlParts& domain_root) {
    return domain_root.origin() + "/robots.txt";
}

RobotsFetch RobotsPolicy::fetch(const UrlParts& domain_root, PageFetcher& fetcher, std::chrono::milliseconds timeout) {
    RobotsFetch out;
    out.robots_url = robots_url_for(domain_root);
    try {
        FetchResult r = fetcher.fetch(out.robots_url, timeout);
        out.status_code = r.status_code;
        if (r.status_code == 200) out.body = std::move(r.body);
    } catch (const FetchError& e) {
        out.error = e.what();
    }
    return out;
}

RobotsPolicy RobotsPolicy::from_fetch(const RobotsFetch& fetched) {
    if (fetched.status_code != 200 || fetched.body.empty()) return RobotsPolicy{};
    return RobotsPolicy{RobotsRules::parse(fetched.body)};
}

RobotsPolicy RobotsPolicy::load(const UrlParts& domain_root, PageFetcher& fetcher, std::chrono::milliseconds timeout) {
    RobotsFetch fetched = fetch(domain_root, fetcher, timeout);
    RobotsPolicy policy = from_fetch(fetched);
    if (policy.present()) {
        std::cout << "Loaded robots.txt: " << fetched.robots_url << std::endl;
    } else if (!fetched.error.empty()) {
        std::cerr << "[warn] robots.txt unreachable (" << fetched.error << "), proceeding permissively" << std::endl;
    } else {
        std::cout << "No robots.txt parsed at " << fetched.robots_url << " (status " << fetched.status_code
                  << ", proceeding permissively)" << std::endl;
    }
    return policy;
}

bool RobotsPolicy::can_fetch(const std::string& url, const std::string& user_agent) const {
    if (!rules_) return true;
    try {
        auto parts = parse_url(url);
        if (!parts) throw std::invalid_argument("unparsable URL");
        std::string path = parts->path;
        if (parts->has_query) path += "?" + parts->query;
        return rules_->allowed(path, user_agent);
    } catch (const std::exception& e) {
        std::cerr << "[warn] robots evaluation failed for " << url << " (" << e.what() << "), allowing" << std::endl;
        return true;
    }
}

std::optional<std::chrono::milliseconds> RobotsPolicy::crawl_delay(const std::string& user_agent) const {
    if (!rules_) return std::nullopt;
    return rules_->crawl_delay(user_agent);
}
