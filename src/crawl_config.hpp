#pragma once

#include <chrono>
#include <cstddef>
#include <string>

enum class ExtractMode { None, Text, Html };

std::string to_string(ExtractMode mode);
// Throws std::invalid_argument for anything but none/text/html.
ExtractMode parse_extract_mode(const std::string& s);

// Every knob of a crawl run. Built once (usually from the command line) and
// handed by const reference to each component.
struct CrawlConfig {
    static constexpr const char* kDefaultUserAgent = "DataCollectorBot/1.0 (+mailto:crawler@example.com)";

    std::string seed_url;
    std::string out_dir;
    int max_pages = 50;  // 0 = no limit
    int max_depth = 3;
    std::string user_agent = kDefaultUserAgent;
    bool include_subdomains = false;
    ExtractMode extract_mode = ExtractMode::None;
    bool ignore_robots = false;

    std::chrono::milliseconds default_delay{500};
    std::chrono::milliseconds timeout{15000};
    int retries = 3;
    double backoff_factor = 0.5;
    std::size_t max_bytes = 0;  // 0 = no limit

    // Throws std::invalid_argument describing the first bad field.
    void validate() const;
};

// Seconds given on the command line ("0.5", "2") to milliseconds.
std::chrono::milliseconds seconds_to_ms(double seconds);
