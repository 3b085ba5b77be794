#include "page_fetcher.hpp"

#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

// -------------------- content type --------------------
std::string to_string(ContentKind kind) {
    switch (kind) {
        case ContentKind::Html: return "html";
        case ContentKind::Pdf: return "pdf";
        case ContentKind::Text: return "text";
        case ContentKind::Image: return "image";
        case ContentKind::Binary: return "binary";
    }
    return "binary";
}

std::string media_type(const std::string& content_type) {
    auto semi = content_type.find(';');
    return to_lower(trim(content_type.substr(0, semi)));
}

ContentKind classify_content_type(const std::string& content_type) {
    std::string mt = media_type(content_type);
    if (mt == "text/html" || mt == "application/xhtml+xml") return ContentKind::Html;
    if (mt == "application/pdf") return ContentKind::Pdf;
    if (starts_with(mt, "text/")) return ContentKind::Text;
    if (starts_with(mt, "image/")) return ContentKind::Image;
    return ContentKind::Binary;
}

std::string extension_for(const std::string& content_type) {
    switch (classify_content_type(content_type)) {
        case ContentKind::Html: return "html";
        case ContentKind::Pdf: return "pdf";
        case ContentKind::Text: return "txt";
        case ContentKind::Image: {
            std::string sub = media_type(content_type).substr(6);
            sub = sub.substr(0, sub.find('+'));
            bool clean = !sub.empty() && std::all_of(sub.begin(), sub.end(), [](unsigned char c) {
                return std::isalnum(c) || c == '-' || c == '.';
            });
            return clean ? sub : "bin";
        }
        case ContentKind::Binary: break;
    }
    return "bin";
}

// -------------------- fetcher --------------------
PageFetcher::PageFetcher(const CrawlConfig& cfg, HttpClient& client, Sleeper& sleeper)
    : cfg_(cfg), client_(client), sleeper_(sleeper) {}

bool PageFetcher::is_retryable(long status) {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

std::chrono::milliseconds PageFetcher::backoff_delay(int retry) const {
    if (retry < 1) return std::chrono::milliseconds{0};
    double seconds = cfg_.backoff_factor * std::pow(2.0, retry - 1);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

FetchResult PageFetcher::fetch(const std::string& url) {
    return fetch(url, cfg_.timeout);
}

FetchResult PageFetcher::fetch(const std::string& url, std::chrono::milliseconds timeout) {
    HttpRequest req{url, cfg_.user_agent, timeout};

    for (int attempt = 1;; ++attempt) {
        HttpResponse r = client_.get(req);

        if (!is_retryable(r.status_code)) {
            FetchResult res;
            res.status_code = r.status_code;
            res.content_type = r.header("Content-Type");
            res.kind = classify_content_type(res.content_type);
            res.headers = std::move(r.headers);
            res.body = std::move(r.body);
            res.attempts = attempt;
            return res;
        }

        int retry = attempt;
        if (retry > cfg_.retries) {
            throw FetchError("retries exhausted for " + url + " (last status " + std::to_string(r.status_code) + ")");
        }

        auto wait = backoff_delay(retry);
        // Retry-After in seconds takes over when it asks for longer
        std::string retry_after = trim(r.header("Retry-After"));
        if (!retry_after.empty() && std::all_of(retry_after.begin(), retry_after.end(), [](unsigned char c) { return std::isdigit(c); }) &&
            retry_after.size() < 7) {
            wait = std::max(wait, std::chrono::milliseconds(std::stoll(retry_after) * 1000));
        }
        std::cerr << "[warn] " << url << " returned " << r.status_code << ", retry " << retry << "/" << cfg_.retries
                  << " in " << wait.count() << " ms" << std::endl;
        sleeper_.sleep_for(wait);
    }
}
