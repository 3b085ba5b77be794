#pragma once

#include <optional>
#include <string>

// Absolute URL split into the pieces the crawler cares about.
// scheme and host are lowercase, userinfo is dropped and a default port
// (80 for http, 443 for https) is stored as 0.
struct UrlParts {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
    std::string query;
    bool has_query = false;

    std::string authority() const;
    std::string origin() const;
    // scheme://authority/path[?query], never carries a fragment
    std::string to_string() const;
};

std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& pre);
bool ends_with(const std::string& s, const std::string& suf);
std::string trim(const std::string& s);

std::optional<UrlParts> parse_url(const std::string& url);

// Fragment stripped, http/https only, non-empty host. std::nullopt for
// anything else (mailto:, javascript:, relative references ...).
std::optional<std::string> canonicalize(const std::string& url);

// RFC 3986 reference resolution of ref against an absolute base.
std::string resolve_url(const std::string& base, const std::string& ref);

std::string remove_dot_segments(const std::string& path);

// Decides whether a URL belongs to the crawl. Exact mode compares host and
// port with the seed. Subdomain mode accepts the seed's base domain (seed host
// without a leading "www.") and any host ending in ".<base>", so a host that
// only shares trailing characters with the seed is rejected.
class DomainScope {
public:
    DomainScope(const UrlParts& seed, bool include_subdomains);

    bool contains(const UrlParts& url) const;
    bool contains(const std::string& url) const;

    const std::string& base_domain() const { return base_domain_; }

private:
    std::string host_;
    int port_;
    std::string base_domain_;
    bool include_subdomains_;
};
