#include "crawler.hpp"

#include <getopt.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

Crawler* g_crawler = nullptr;

void on_signal(int sig) {
    // a second signal kills the process the usual way
    std::signal(sig, SIG_DFL);
    if (g_crawler) g_crawler->stop();
}

void usage(const char* progname) {
    std::cerr << "Usage: " << progname << " --start-url URL --out-dir DIR [options]\n"
              << "\t[--max-pages N]           pages to fetch, 0 for no limit (default 50)\n"
              << "\t[--max-depth N]           link depth from the start URL (default 3)\n"
              << "\t[--user-agent STRING]     (default \"" << CrawlConfig::kDefaultUserAgent << "\")\n"
              << "\t[--delay SECONDS]         delay between requests when robots.txt sets none (default 0.5)\n"
              << "\t[--timeout SECONDS]       per-request timeout (default 15)\n"
              << "\t[--retries N]             retries on 429/500/502/503/504 (default 3)\n"
              << "\t[--backoff FACTOR]        exponential backoff factor in seconds (default 0.5)\n"
              << "\t[--max-bytes N]           largest body to save, 0 for no limit (default 0)\n"
              << "\t[--include-subdomains]    also crawl subdomains of the start host\n"
              << "\t[--extract none|text|html] save readable text or the HTML to DIR/text (default none)\n"
              << "\t[--ignore-robots]         do not load robots.txt (testing only)\n";
    std::exit(2);
}

const struct option options[] = {{"start-url", required_argument, nullptr, 's'},
                                 {"out-dir", required_argument, nullptr, 'o'},
                                 {"max-pages", required_argument, nullptr, 'p'},
                                 {"max-depth", required_argument, nullptr, 'd'},
                                 {"user-agent", required_argument, nullptr, 'u'},
                                 {"delay", required_argument, nullptr, 'w'},
                                 {"timeout", required_argument, nullptr, 't'},
                                 {"retries", required_argument, nullptr, 'r'},
                                 {"backoff", required_argument, nullptr, 'b'},
                                 {"max-bytes", required_argument, nullptr, 'm'},
                                 {"include-subdomains", no_argument, nullptr, 'S'},
                                 {"extract", required_argument, nullptr, 'e'},
                                 {"ignore-robots", no_argument, nullptr, 'i'},
                                 {"help", no_argument, nullptr, 'h'},
                                 {nullptr, no_argument, nullptr, 0}};

long parse_long(const char* progname, const char* name, const char* value) {
    try {
        size_t used = 0;
        long v = std::stol(value, &used);
        if (used == std::string(value).size()) return v;
    } catch (const std::exception&) {
    }
    std::cerr << progname << ": invalid " << name << " \"" << value << "\"\n";
    usage(progname);
    return 0;
}

double parse_double(const char* progname, const char* name, const char* value) {
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used == std::string(value).size()) return v;
    } catch (const std::exception&) {
    }
    std::cerr << progname << ": invalid " << name << " \"" << value << "\"\n";
    usage(progname);
    return 0;
}

CrawlConfig parse_args(int argc, char** argv) {
    CrawlConfig cfg;
    const char* progname = argv[0];
    for (;;) {
        int option_index = 0;
        int option = ::getopt_long(argc, argv, "h", options, &option_index);
        if (option == -1) break;
        try {
            switch (option) {
                case 's': cfg.seed_url = optarg; break;
                case 'o': cfg.out_dir = optarg; break;
                case 'p': cfg.max_pages = static_cast<int>(parse_long(progname, "max-pages", optarg)); break;
                case 'd': cfg.max_depth = static_cast<int>(parse_long(progname, "max-depth", optarg)); break;
                case 'u': cfg.user_agent = optarg; break;
                case 'w': cfg.default_delay = seconds_to_ms(parse_double(progname, "delay", optarg)); break;
                case 't': cfg.timeout = seconds_to_ms(parse_double(progname, "timeout", optarg)); break;
                case 'r': cfg.retries = static_cast<int>(parse_long(progname, "retries", optarg)); break;
                case 'b': cfg.backoff_factor = parse_double(progname, "backoff", optarg); break;
                case 'm': {
                    long v = parse_long(progname, "max-bytes", optarg);
                    if (v < 0) {
                        std::cerr << progname << ": max-bytes must be >= 0\n";
                        usage(progname);
                    }
                    cfg.max_bytes = static_cast<std::size_t>(v);
                    break;
                }
                case 'S': cfg.include_subdomains = true; break;
                case 'e': cfg.extract_mode = parse_extract_mode(optarg); break;
                case 'i': cfg.ignore_robots = true; break;
                default: usage(progname);
            }
        } catch (const std::invalid_argument& ex) {
            std::cerr << progname << ": " << ex.what() << "\n";
            usage(progname);
        }
    }
    if (optind != argc || cfg.seed_url.empty() || cfg.out_dir.empty()) usage(progname);
    return cfg;
}

}  // namespace

int main(int argc, char** argv) {
    CrawlConfig cfg = parse_args(argc, argv);

    try {
        Crawler crawler(cfg);
        g_crawler = &crawler;
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        crawler.run();
        g_crawler = nullptr;
    } catch (const std::exception& ex) {
        g_crawler = nullptr;
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
