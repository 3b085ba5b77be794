#pragma once

#include "content_persister.hpp"
#include "crawl_config.hpp"
#include "crawl_reporter.hpp"
#include "http_client.hpp"
#include "link_extractor.hpp"
#include "page_fetcher.hpp"
#include "robots_policy.hpp"
#include "sleeper.hpp"
#include "url.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

struct FrontierEntry {
    std::string url;  // canonical
    int depth = 0;
};

struct CrawlStats {
    int processed = 0;
    int disallowed = 0;
    int errors = 0;
};

// Breadth-first crawl of one domain. Single-threaded: the control loop owns
// the frontier, the visited set and the robots directives.
class Crawler {
public:
    // Throws std::invalid_argument for a bad config or a seed that is not an
    // http(s) URL with a host. Nothing touches the network before run().
    explicit Crawler(CrawlConfig cfg);
    Crawler(CrawlConfig cfg, HttpClient& client, Sleeper& sleeper);

    CrawlStats run();

    // Ask the loop to stop after the record it is working on. Safe to call
    // from a signal handler.
    void stop() noexcept { stop_requested_.store(true); }

    const std::string& seed() const { return seed_; }
    const std::string& report_path() const { return report_path_; }
    const std::unordered_set<std::string>& visited() const { return visited_; }
    const CrawlStats& stats() const { return stats_; }

private:
    CrawlConfig cfg_;
    std::unique_ptr<HttpClient> owned_client_;
    std::unique_ptr<Sleeper> owned_sleeper_;
    HttpClient* client_;
    Sleeper* sleeper_;

    std::string seed_;
    UrlParts seed_parts_;
    DomainScope scope_;
    std::string report_path_;

    PageFetcher fetcher_;
    ContentPersister persister_;

    std::deque<FrontierEntry> frontier_;
    std::unordered_set<std::string> visited_;
    std::unordered_set<std::string> enqueued_;
    CrawlStats stats_;

    std::chrono::milliseconds delay_{0};
    std::optional<Sleeper::clock::time_point> last_fetch_;
    std::atomic<bool> stop_requested_{false};

    static UrlParts checked_seed(const CrawlConfig& cfg);

    bool limit_reached() const;
    void enqueue(const std::string& url, int depth);
    void polite_delay();
    void mark_fetch_done();

    CrawlRecord process(const FrontierEntry& entry, const LinkExtractor& extractor);
};
