#include "http_client.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
        return std::tolower(x) < std::tolower(y);
    });
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? std::string{} : it->second;
}

HttpResponse CprHttpClient::get(const HttpRequest& request) {
    cpr::Response r = cpr::Get(cpr::Url{request.url},
                               cpr::Header{{"User-Agent", request.user_agent}},
                               cpr::Timeout{request.timeout},
                               cpr::Redirect{true});
    if (r.error) {
        throw FetchError("GET " + request.url + " failed: " + r.error.message);
    }

    HttpResponse out;
    out.status_code = r.status_code;
    for (const auto& kv : r.header) out.headers[kv.first] = kv.second;
    out.body = std::move(r.text);
    out.final_url = r.url.str();
    return out;
}
