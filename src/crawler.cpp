#include "crawler.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

// -------------------- ctor --------------------
Crawler::Crawler(CrawlConfig cfg)
    : cfg_(std::move(cfg)),
      owned_client_(std::make_unique<CprHttpClient>()),
      owned_sleeper_(std::make_unique<SystemSleeper>()),
      client_(owned_client_.get()),
      sleeper_(owned_sleeper_.get()),
      seed_parts_(checked_seed(cfg_)),
      scope_(seed_parts_, cfg_.include_subdomains),
      report_path_((fs::path(cfg_.out_dir) / "crawl_report.jsonl").string()),
      fetcher_(cfg_, *client_, *sleeper_),
      persister_(cfg_) {
    seed_ = seed_parts_.to_string();
}

Crawler::Crawler(CrawlConfig cfg, HttpClient& client, Sleeper& sleeper)
    : cfg_(std::move(cfg)),
      client_(&client),
      sleeper_(&sleeper),
      seed_parts_(checked_seed(cfg_)),
      scope_(seed_parts_, cfg_.include_subdomains),
      report_path_((fs::path(cfg_.out_dir) / "crawl_report.jsonl").string()),
      fetcher_(cfg_, *client_, *sleeper_),
      persister_(cfg_) {
    seed_ = seed_parts_.to_string();
}

UrlParts Crawler::checked_seed(const CrawlConfig& cfg) {
    cfg.validate();
    auto canon = canonicalize(cfg.seed_url);
    if (!canon) throw std::invalid_argument("start URL must be an http(s) URL with a host: '" + cfg.seed_url + "'");
    return parse_url(*canon).value();
}

// -------------------- frontier --------------------
bool Crawler::limit_reached() const {
    return cfg_.max_pages > 0 && stats_.processed >= cfg_.max_pages;
}

void Crawler::enqueue(const std::string& url, int depth) {
    if (depth > cfg_.max_depth) return;
    if (visited_.count(url)) return;
    if (!enqueued_.insert(url).second) return;
    frontier_.push_back(FrontierEntry{url, depth});
}

// -------------------- politeness --------------------
void Crawler::polite_delay() {
    if (!last_fetch_) return;
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(sleeper_->now() - *last_fetch_);
    if (elapsed < delay_) sleeper_->sleep_for(delay_ - elapsed);
}

void Crawler::mark_fetch_done() {
    last_fetch_ = sleeper_->now();
}

// -------------------- one url --------------------
CrawlRecord Crawler::process(const FrontierEntry& entry, const LinkExtractor& extractor) {
    polite_delay();
    FetchResult res;
    try {
        res = fetcher_.fetch(entry.url);
    } catch (const FetchError& ex) {
        mark_fetch_done();
        std::cerr << "[error] Failed to GET " << entry.url << ": " << ex.what() << std::endl;
        ++stats_.errors;
        return CrawlRecord::failed(entry.url, entry.depth, ex.what());
    }
    mark_fetch_done();

    CrawlRecord rec;
    rec.url = entry.url;
    rec.depth = entry.depth;
    rec.status_code = res.status_code;
    if (!res.content_type.empty()) rec.content_type = res.content_type;

    try {
        rec.saved_raw = persister_.save_raw(entry.url, res.content_type, res.body);

        if (res.kind == ContentKind::Html && !res.body.empty()) {
            HtmlDocument doc(res.body, entry.url);
            rec.title = doc.title();
            rec.saved_text = persister_.extract_and_save_text(entry.url, doc, res.body, cfg_.extract_mode);

            if (entry.depth < cfg_.max_depth) {
                int added = 0;
                for (const auto& link : extractor.extract_links(doc, entry.url, visited_)) {
                    size_t before = frontier_.size();
                    enqueue(link, entry.depth + 1);
                    if (frontier_.size() > before) ++added;
                }
                if (added) std::cout << "  Queued " << added << " new link(s) at depth " << entry.depth + 1 << std::endl;
            }
        }
    } catch (const std::exception& ex) {
        // PersistError, HtmlParseError or a filesystem failure: this page only
        std::cerr << "[error] " << entry.url << ": " << ex.what() << std::endl;
        rec.outcome = CrawlOutcome::Error;
        rec.error = ex.what();
        ++stats_.errors;
        return rec;
    }

    ++stats_.processed;
    std::cout << "[" << stats_.processed << "/" << (cfg_.max_pages > 0 ? std::to_string(cfg_.max_pages) : "-")
              << "] Fetched " << entry.url << " (status=" << res.status_code << ", type=" << res.content_type << ")"
              << std::endl;
    return rec;
}

// -------------------- orchestration --------------------
CrawlStats Crawler::run() {
    persister_.prepare();

    RobotsPolicy robots;
    if (!cfg_.ignore_robots) {
        robots = RobotsPolicy::load(seed_parts_, fetcher_, cfg_.timeout);
        mark_fetch_done();
    }
    delay_ = robots.crawl_delay(cfg_.user_agent).value_or(cfg_.default_delay);
    std::cout << "Politeness delay: " << delay_.count() << " ms" << std::endl;

    CrawlReporter reporter(report_path_);
    LinkExtractor extractor(scope_, robots, cfg_.user_agent);

    enqueue(seed_, 0);

    while (!frontier_.empty() && !limit_reached()) {
        if (stop_requested_.load()) {
            std::cerr << "Interrupted, stopping with " << frontier_.size() << " URL(s) still queued" << std::endl;
            break;
        }

        FrontierEntry entry = std::move(frontier_.front());
        frontier_.pop_front();
        if (entry.depth > cfg_.max_depth || visited_.count(entry.url)) continue;

        if (!robots.can_fetch(entry.url, cfg_.user_agent)) {
            std::cout << "[robots] Skipping (disallowed): " << entry.url << std::endl;
            visited_.insert(entry.url);
            ++stats_.disallowed;
            reporter.append(CrawlRecord::disallowed(entry.url, entry.depth));
            continue;
        }

        CrawlRecord rec = process(entry, extractor);
        reporter.append(rec);
        visited_.insert(entry.url);
    }
    reporter.close();

    std::cout << "Done. Pages fetched: " << stats_.processed << " (disallowed: " << stats_.disallowed
              << ", errors: " << stats_.errors << "). Report: " << report_path_ << std::endl;
    return stats_;
}
