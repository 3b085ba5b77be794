#include "crawl_reporter.hpp"

#include <iostream>

using nlohmann::json;

CrawlRecord CrawlRecord::disallowed(std::string url, int depth) {
    CrawlRecord r;
    r.url = std::move(url);
    r.outcome = CrawlOutcome::Disallowed;
    r.depth = depth;
    return r;
}

CrawlRecord CrawlRecord::failed(std::string url, int depth, std::string error) {
    CrawlRecord r;
    r.url = std::move(url);
    r.outcome = CrawlOutcome::Error;
    r.depth = depth;
    r.error = std::move(error);
    return r;
}

static json optional_string(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

json to_json(const CrawlRecord& record) {
    json j;
    j["url"] = record.url;
    switch (record.outcome) {
        case CrawlOutcome::Processed: j["status"] = record.status_code; break;
        case CrawlOutcome::Disallowed: j["status"] = "disallowed_by_robots"; break;
        case CrawlOutcome::Error: j["status"] = "error"; break;
    }
    j["content_type"] = optional_string(record.content_type);
    j["saved_raw"] = optional_string(record.saved_raw);
    j["saved_text"] = optional_string(record.saved_text);
    j["title"] = optional_string(record.title);
    j["depth"] = record.depth;
    if (record.outcome == CrawlOutcome::Error) j["error"] = record.error;
    return j;
}

CrawlReporter::CrawlReporter(const std::string& path) : path_(path), ofs_(path, std::ios::out | std::ios::trunc) {
    if (!ofs_) throw ReportError("cannot open report " + path_);
}

CrawlReporter::~CrawlReporter() {
    if (ofs_.is_open()) ofs_.close();
}

void CrawlReporter::append(const CrawlRecord& record) {
    // invalid UTF-8 from a page title is replaced rather than thrown
    ofs_ << to_json(record).dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    ofs_.flush();
    if (!ofs_) throw ReportError("write to report " + path_ + " failed");
    ++records_;
}

void CrawlReporter::close() {
    if (!ofs_.is_open()) return;
    ofs_.close();
    if (ofs_.fail()) std::cerr << "[warn] closing report " << path_ << " failed" << std::endl;
}
