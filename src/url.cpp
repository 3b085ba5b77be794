#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <vector>

// -------------------- small utils --------------------
std::string to_lower(const std::string& s) {
    std::string r = s;
    for (auto& ch : r) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return r;
}

bool starts_with(const std::string& s, const std::string& pre) {
    return s.rfind(pre, 0) == 0;
}

bool ends_with(const std::string& s, const std::string& suf) {
    if (s.size() < suf.size()) return false;
    return std::equal(s.end() - suf.size(), s.end(), suf.begin());
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n\f\v");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(a, b - a + 1);
}

static int default_port(const std::string& scheme) {
    if (scheme == "http") return 80;
    if (scheme == "https") return 443;
    return 0;
}

static bool has_scheme(const std::string& ref) {
    static const std::regex re(R"(^[a-zA-Z][a-zA-Z0-9+.-]*:)");
    return std::regex_search(ref, re);
}

// -------------------- UrlParts --------------------
std::string UrlParts::authority() const {
    if (port == 0) return host;
    return host + ":" + std::to_string(port);
}

std::string UrlParts::origin() const {
    return scheme + "://" + authority();
}

std::string UrlParts::to_string() const {
    std::string r = origin();
    r += path.empty() ? "/" : path;
    if (has_query) r += "?" + query;
    return r;
}

// -------------------- parsing --------------------
std::optional<UrlParts> parse_url(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/?#]*)([^?#]*)(\?[^#]*)?(#.*)?$)");
    std::smatch m;
    if (!std::regex_match(url, m, re)) return std::nullopt;

    UrlParts p;
    p.scheme = to_lower(m[1].str());

    std::string authority = m[2].str();
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    std::string host = authority;
    std::string port;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        host = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }
    p.host = to_lower(host);

    if (!port.empty()) {
        if (port.size() > 5 || !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); }))
            return std::nullopt;
        int n = std::stoi(port);
        if (n > 65535) return std::nullopt;
        p.port = (n == default_port(p.scheme)) ? 0 : n;
    }

    p.path = m[3].str();
    if (p.path.empty()) p.path = "/";
    if (m[4].matched) {
        p.has_query = true;
        p.query = m[4].str().substr(1);
    }
    return p;
}

std::optional<std::string> canonicalize(const std::string& url) {
    std::string u = trim(url);
    if (u.empty()) return std::nullopt;
    auto hash = u.find('#');
    if (hash != std::string::npos) u = u.substr(0, hash);

    auto parts = parse_url(u);
    if (!parts) return std::nullopt;
    if (parts->scheme != "http" && parts->scheme != "https") return std::nullopt;
    if (parts->host.empty()) return std::nullopt;
    return parts->to_string();
}

// -------------------- resolution --------------------
std::string remove_dot_segments(const std::string& path) {
    std::string in = path;
    std::string out;
    while (!in.empty()) {
        if (starts_with(in, "../")) {
            in.erase(0, 3);
        } else if (starts_with(in, "./")) {
            in.erase(0, 2);
        } else if (starts_with(in, "/./")) {
            in.erase(0, 2);
        } else if (in == "/.") {
            in = "/";
        } else if (starts_with(in, "/../") || in == "/..") {
            in = in == "/.." ? "/" : in.substr(3);
            auto slash = out.rfind('/');
            out.erase(slash == std::string::npos ? 0 : slash);
        } else if (in == "." || in == "..") {
            in.clear();
        } else {
            size_t next = in.find('/', in[0] == '/' ? 1 : 0);
            if (next == std::string::npos) next = in.size();
            out += in.substr(0, next);
            in.erase(0, next);
        }
    }
    return out;
}

std::string resolve_url(const std::string& base, const std::string& ref_in) {
    std::string ref = trim(ref_in);
    if (has_scheme(ref)) return ref;

    auto b = parse_url(base);
    if (!b) return ref;

    // protocol-relative
    if (starts_with(ref, "//")) return b->scheme + ":" + ref;

    std::string fragment;
    auto hash = ref.find('#');
    if (hash != std::string::npos) {
        fragment = ref.substr(hash);
        ref = ref.substr(0, hash);
    }
    std::string ref_query;
    bool ref_has_query = false;
    auto q = ref.find('?');
    if (q != std::string::npos) {
        ref_has_query = true;
        ref_query = ref.substr(q + 1);
        ref = ref.substr(0, q);
    }

    UrlParts r = *b;
    if (ref.empty()) {
        if (ref_has_query) {
            r.has_query = true;
            r.query = ref_query;
        }
    } else {
        if (ref[0] == '/') {
            r.path = remove_dot_segments(ref);
        } else {
            auto slash = b->path.rfind('/');
            std::string dir = slash == std::string::npos ? "/" : b->path.substr(0, slash + 1);
            r.path = remove_dot_segments(dir + ref);
        }
        r.has_query = ref_has_query;
        r.query = ref_query;
    }
    return r.to_string() + fragment;
}

// -------------------- scope --------------------
DomainScope::DomainScope(const UrlParts& seed, bool include_subdomains)
    : host_(seed.host),
      port_(seed.port),
      base_domain_(starts_with(seed.host, "www.") ? seed.host.substr(4) : seed.host),
      include_subdomains_(include_subdomains) {}

bool DomainScope::contains(const UrlParts& url) const {
    if (url.host.empty()) return false;
    if (!include_subdomains_) return url.host == host_ && url.port == port_;
    return url.host == base_domain_ || ends_with(url.host, "." + base_domain_);
}

bool DomainScope::contains(const std::string& url) const {
    auto p = parse_url(url);
    return p && contains(*p);
}
