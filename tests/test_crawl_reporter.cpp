#include <gtest/gtest.h>

#include "crawl_reporter.hpp"
#include "fakes.hpp"

TEST(CrawlRecordTest, ProcessedRecordFields) {
    CrawlRecord r;
    r.url = "https://example.test/";
    r.status_code = 200;
    r.content_type = "text/html";
    r.saved_raw = "out/raw/root_abc.html";
    r.title = "Home";
    r.depth = 0;

    auto j = to_json(r);
    EXPECT_EQ(j["url"], "https://example.test/");
    EXPECT_EQ(j["status"], 200);
    EXPECT_EQ(j["content_type"], "text/html");
    EXPECT_EQ(j["saved_raw"], "out/raw/root_abc.html");
    EXPECT_TRUE(j["saved_text"].is_null());
    EXPECT_EQ(j["title"], "Home");
    EXPECT_EQ(j["depth"], 0);
    EXPECT_FALSE(j.contains("error"));
}

TEST(CrawlRecordTest, SkipAndErrorRecords) {
    auto skip = to_json(CrawlRecord::disallowed("https://example.test/private", 2));
    EXPECT_EQ(skip["status"], "disallowed_by_robots");
    EXPECT_EQ(skip["depth"], 2);
    EXPECT_TRUE(skip["saved_raw"].is_null());
    EXPECT_FALSE(skip.contains("error"));

    auto err = to_json(CrawlRecord::failed("https://example.test/x", 1, "connection refused"));
    EXPECT_EQ(err["status"], "error");
    EXPECT_EQ(err["error"], "connection refused");
}

TEST(CrawlReporterTest, OneFlushedLinePerRecord) {
    TempDir dir;
    const std::string path = (dir.path() / "crawl_report.jsonl").string();
    CrawlReporter reporter(path);

    reporter.append(CrawlRecord::disallowed("https://example.test/a", 1));
    // readable before close
    EXPECT_EQ(read_report(path).size(), 1u);

    reporter.append(CrawlRecord::failed("https://example.test/b", 1, "boom"));
    reporter.close();

    auto lines = read_report(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["url"], "https://example.test/a");
    EXPECT_EQ(lines[1]["error"], "boom");
    EXPECT_EQ(reporter.records(), 2);
}

TEST(CrawlReporterTest, InvalidUtf8TitleIsReplaced) {
    TempDir dir;
    const std::string path = (dir.path() / "r.jsonl").string();
    CrawlReporter reporter(path);
    CrawlRecord r;
    r.url = "https://example.test/";
    r.status_code = 200;
    r.title = std::string("bad \xff byte");
    EXPECT_NO_THROW(reporter.append(r));
    reporter.close();
    ASSERT_EQ(read_report(path).size(), 1u);
}

TEST(CrawlReporterTest, UnopenableReportThrows) {
    TempDir dir;
    EXPECT_THROW({ CrawlReporter reporter((dir.path() / "missing" / "r.jsonl").string()); }, ReportError);
}
