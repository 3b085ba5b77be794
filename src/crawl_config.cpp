#include "crawl_config.hpp"

#include <cmath>
#include <stdexcept>

std::string to_string(ExtractMode mode) {
    switch (mode) {
        case ExtractMode::None: return "none";
        case ExtractMode::Text: return "text";
        case ExtractMode::Html: return "html";
    }
    return "none";
}

ExtractMode parse_extract_mode(const std::string& s) {
    if (s == "none") return ExtractMode::None;
    if (s == "text") return ExtractMode::Text;
    if (s == "html") return ExtractMode::Html;
    throw std::invalid_argument("invalid extraction mode '" + s + "' (expected none, text or html)");
}

std::chrono::milliseconds seconds_to_ms(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0) throw std::invalid_argument("duration must be a non-negative number of seconds");
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

void CrawlConfig::validate() const {
    if (seed_url.empty()) throw std::invalid_argument("start URL is required");
    if (out_dir.empty()) throw std::invalid_argument("output directory is required");
    if (max_pages < 0) throw std::invalid_argument("max pages must be >= 0");
    if (max_depth < 0) throw std::invalid_argument("max depth must be >= 0");
    if (user_agent.empty()) throw std::invalid_argument("user agent must not be empty");
    if (default_delay.count() < 0) throw std::invalid_argument("delay must be >= 0");
    if (timeout.count() <= 0) throw std::invalid_argument("timeout must be > 0");
    if (retries < 0) throw std::invalid_argument("retries must be >= 0");
    if (!std::isfinite(backoff_factor) || backoff_factor < 0) throw std::invalid_argument("backoff factor must be >= 0");
}
