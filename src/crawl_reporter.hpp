#pragma once

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

class ReportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class CrawlOutcome { Processed, Disallowed, Error };

// One line of the crawl report.
struct CrawlRecord {
    std::string url;
    CrawlOutcome outcome = CrawlOutcome::Processed;
    long status_code = 0;  // Processed only
    std::optional<std::string> content_type;
    std::optional<std::string> saved_raw;
    std::optional<std::string> saved_text;
    std::optional<std::string> title;
    int depth = 0;
    std::string error;  // Error only

    static CrawlRecord disallowed(std::string url, int depth);
    static CrawlRecord failed(std::string url, int depth, std::string error);
};

nlohmann::json to_json(const CrawlRecord& record);

// Append-only JSON Lines report; every record is flushed as soon as it is
// written so an interrupted run leaves a complete file.
class CrawlReporter {
public:
    explicit CrawlReporter(const std::string& path);
    ~CrawlReporter();

    CrawlReporter(const CrawlReporter&) = delete;
    CrawlReporter& operator=(const CrawlReporter&) = delete;

    // Throws ReportError if the line could not be written.
    void append(const CrawlRecord& record);
    void close();

    const std::string& path() const { return path_; }
    int records() const { return records_; }

private:
    std::string path_;
    std::ofstream ofs_;
    int records_ = 0;
};
