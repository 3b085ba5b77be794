#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

// Transport failure, exhausted retries or an oversized body.
class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

struct HttpResponse {
    long status_code = 0;
    HeaderMap headers;
    std::string body;
    std::string final_url;

    std::string header(const std::string& name) const;
};

struct HttpRequest {
    std::string url;
    std::string user_agent;
    std::chrono::milliseconds timeout{15000};
};

// One blocking GET. Any HTTP status is a response; only transport failures
// (DNS, connect, TLS, timeout) throw FetchError.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const HttpRequest& request) = 0;
};

// libcurl through cpr, redirects followed.
class CprHttpClient : public HttpClient {
public:
    HttpResponse get(const HttpRequest& request) override;
};
