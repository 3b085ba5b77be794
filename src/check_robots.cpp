// Fetches and evaluates a site's robots.txt for one path.
//
// Exit status: 0 allowed (or no robots.txt), 3 disallowed, 4 robots.txt could
// not be fetched or evaluated, 2 usage error.

#include "crawl_config.hpp"
#include "http_client.hpp"
#include "page_fetcher.hpp"
#include "robots_report.hpp"
#include "sleeper.hpp"
#include "url.hpp"

#include <getopt.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using nlohmann::json;

namespace {

void usage(const char* progname) {
    std::cerr << "Usage: " << progname << " --url URL [options]\n"
              << "\t[--path PATH]            path to test (default /)\n"
              << "\t[--user-agent STRING]    (default \"" << CrawlConfig::kDefaultUserAgent << "\")\n"
              << "\t[--json]                 print the result as JSON\n"
              << "\t[--out FILE]             write the result to FILE instead of stdout\n"
              << "\t[--retries N]            (default 3)\n"
              << "\t[--backoff FACTOR]       (default 0.5)\n"
              << "\t[--timeout SECONDS]      (default 10)\n";
    std::exit(2);
}

const struct option options[] = {{"url", required_argument, nullptr, 'U'},
                                 {"path", required_argument, nullptr, 'P'},
                                 {"user-agent", required_argument, nullptr, 'u'},
                                 {"json", no_argument, nullptr, 'j'},
                                 {"out", required_argument, nullptr, 'o'},
                                 {"retries", required_argument, nullptr, 'r'},
                                 {"backoff", required_argument, nullptr, 'b'},
                                 {"timeout", required_argument, nullptr, 't'},
                                 {"help", no_argument, nullptr, 'h'},
                                 {nullptr, no_argument, nullptr, 0}};

// Numbers must parse completely and be >= 0.
long parse_count(const char* progname, const char* name, const char* value) {
    try {
        size_t used = 0;
        long v = std::stol(value, &used);
        if (used == std::string(value).size() && v >= 0) return v;
    } catch (const std::exception&) {
    }
    std::cerr << progname << ": invalid " << name << " \"" << value << "\" (expected a number >= 0)\n";
    usage(progname);
    return 0;
}

double parse_seconds(const char* progname, const char* name, const char* value) {
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used == std::string(value).size() && std::isfinite(v) && v >= 0) return v;
    } catch (const std::exception&) {
    }
    std::cerr << progname << ": invalid " << name << " \"" << value << "\" (expected a number >= 0)\n";
    usage(progname);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const char* progname = argv[0];
    CrawlConfig cfg;
    cfg.timeout = std::chrono::milliseconds(10000);
    std::string url;
    std::string path = "/";
    std::string out_file;
    bool as_json = false;

    for (;;) {
        int option_index = 0;
        int option = ::getopt_long(argc, argv, "h", options, &option_index);
        if (option == -1) break;
        switch (option) {
            case 'U': url = optarg; break;
            case 'P': path = optarg; break;
            case 'u': cfg.user_agent = optarg; break;
            case 'j': as_json = true; break;
            case 'o': out_file = optarg; break;
            case 'r': cfg.retries = static_cast<int>(parse_count(progname, "retries", optarg)); break;
            case 'b': cfg.backoff_factor = parse_seconds(progname, "backoff", optarg); break;
            case 't': cfg.timeout = seconds_to_ms(parse_seconds(progname, "timeout", optarg)); break;
            default: usage(progname);
        }
    }
    if (url.empty() || cfg.user_agent.empty() || cfg.timeout.count() <= 0 || optind != argc) usage(progname);

    auto canon = canonicalize(url);
    if (!canon) {
        std::cerr << "Invalid URL: " << url << " (expected http:// or https:// with a host)" << std::endl;
        return 2;
    }
    UrlParts base = parse_url(*canon).value();

    json res;
    try {
        CprHttpClient client;
        SystemSleeper sleeper;
        PageFetcher fetcher(cfg, client, sleeper);
        res = robots_report(base, path, fetcher, cfg);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 4;
    }

    std::string text = as_json ? res.dump(2, ' ', false, json::error_handler_t::replace) : format_robots_report(res);
    if (!out_file.empty()) {
        std::ofstream ofs(out_file);
        ofs << text << "\n";
        if (!ofs) {
            std::cerr << "Error: cannot write " << out_file << std::endl;
            return 4;
        }
        std::cout << "Written to " << out_file << std::endl;
    } else {
        std::cout << text << std::endl;
    }

    return static_cast<int>(robots_verdict(res));
}
