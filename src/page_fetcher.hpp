#pragma once

#include "crawl_config.hpp"
#include "http_client.hpp"
#include "sleeper.hpp"

#include <chrono>
#include <string>

enum class ContentKind { Html, Pdf, Text, Image, Binary };

std::string to_string(ContentKind kind);

// Media type of a Content-Type header value ("text/html; charset=utf-8"
// -> "text/html"), lowercase.
std::string media_type(const std::string& content_type);
ContentKind classify_content_type(const std::string& content_type);
// File extension (without dot) for raw artifacts of this content type.
std::string extension_for(const std::string& content_type);

struct FetchResult {
    long status_code = 0;
    HeaderMap headers;
    std::string body;
    std::string content_type;
    ContentKind kind = ContentKind::Binary;
    int attempts = 1;
};

// GET with bounded retries on 429/500/502/503/504 and exponential backoff
// (backoff_factor * 2^(n-1) before retry n). Every other status is returned
// as-is on the first attempt.
class PageFetcher {
public:
    PageFetcher(const CrawlConfig& cfg, HttpClient& client, Sleeper& sleeper);

    // Throws FetchError on transport failure or when every retry ended on a
    // retryable status.
    FetchResult fetch(const std::string& url);
    FetchResult fetch(const std::string& url, std::chrono::milliseconds timeout);

    static bool is_retryable(long status);
    std::chrono::milliseconds backoff_delay(int retry) const;

private:
    const CrawlConfig& cfg_;
    HttpClient& client_;
    Sleeper& sleeper_;
};
