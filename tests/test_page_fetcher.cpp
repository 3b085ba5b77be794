#include <gtest/gtest.h>

#include "fakes.hpp"
#include "page_fetcher.hpp"

class PageFetcherTest : public ::testing::Test {
protected:
    PageFetcherTest() : fetcher(cfg, client, sleeper) {
        cfg.retries = 3;
        cfg.backoff_factor = 0.5;
        cfg.user_agent = "TestBot/0.1";
    }

    static FakeHttpClient::Reply reply(long status, const std::string& body = "ok") {
        FakeHttpClient::Reply r;
        r.status = status;
        r.body = body;
        return r;
    }

    CrawlConfig cfg;
    FakeSleeper sleeper;
    FakeHttpClient client;
    PageFetcher fetcher;
};

TEST_F(PageFetcherTest, ReturnsFirstSuccessWithoutRetry) {
    client.on("https://example.test/", reply(200, "<html></html>"));
    FetchResult r = fetcher.fetch("https://example.test/");
    EXPECT_EQ(r.status_code, 200);
    EXPECT_EQ(r.body, "<html></html>");
    EXPECT_EQ(r.kind, ContentKind::Html);
    EXPECT_EQ(r.attempts, 1);
    EXPECT_TRUE(sleeper.sleeps.empty());
    EXPECT_EQ(client.last_user_agent, "TestBot/0.1");
}

TEST_F(PageFetcherTest, RetriesServiceUnavailableThenSucceeds) {
    client.on_sequence("https://example.test/flaky", {reply(503), reply(503), reply(200, "finally")});
    FetchResult r = fetcher.fetch("https://example.test/flaky");
    EXPECT_EQ(r.status_code, 200);
    EXPECT_EQ(r.body, "finally");
    EXPECT_EQ(r.attempts, 3);
    EXPECT_EQ(client.count("https://example.test/flaky"), 3);
    ASSERT_EQ(sleeper.sleeps.size(), 2u);
    EXPECT_EQ(sleeper.sleeps[0].count(), 500);
    EXPECT_EQ(sleeper.sleeps[1].count(), 1000);
}

TEST_F(PageFetcherTest, EveryRetryableStatusIsRetried) {
    for (long status : {429L, 500L, 502L, 503L, 504L}) {
        EXPECT_TRUE(PageFetcher::is_retryable(status)) << status;
    }
    for (long status : {200L, 301L, 400L, 401L, 403L, 404L, 410L, 501L}) {
        EXPECT_FALSE(PageFetcher::is_retryable(status)) << status;
    }
}

TEST_F(PageFetcherTest, ClientErrorsAreReturnedAsIs) {
    client.on("https://example.test/gone", reply(404, "missing"));
    FetchResult r = fetcher.fetch("https://example.test/gone");
    EXPECT_EQ(r.status_code, 404);
    EXPECT_EQ(client.count("https://example.test/gone"), 1);
    EXPECT_TRUE(sleeper.sleeps.empty());
}

TEST_F(PageFetcherTest, ExhaustedRetriesThrow) {
    client.on("https://example.test/down", reply(502));
    EXPECT_THROW(fetcher.fetch("https://example.test/down"), FetchError);
    EXPECT_EQ(client.count("https://example.test/down"), 4);
    ASSERT_EQ(sleeper.sleeps.size(), 3u);
    EXPECT_EQ(sleeper.sleeps[2].count(), 2000);
}

TEST_F(PageFetcherTest, ZeroRetriesMeansSingleAttempt) {
    cfg.retries = 0;
    client.on("https://example.test/down", reply(500));
    EXPECT_THROW(fetcher.fetch("https://example.test/down"), FetchError);
    EXPECT_EQ(client.count("https://example.test/down"), 1);
}

TEST_F(PageFetcherTest, TransportErrorsAreNotRetried) {
    FakeHttpClient::Reply r;
    r.transport_error = true;
    client.on("https://example.test/refused", r);
    EXPECT_THROW(fetcher.fetch("https://example.test/refused"), FetchError);
    EXPECT_EQ(client.count("https://example.test/refused"), 1);
}

TEST_F(PageFetcherTest, RetryAfterExtendsTheWait) {
    FakeHttpClient::Reply limited = reply(429);
    limited.headers["Retry-After"] = "3";
    client.on_sequence("https://example.test/limited", {limited, reply(200)});
    FetchResult r = fetcher.fetch("https://example.test/limited");
    EXPECT_EQ(r.status_code, 200);
    ASSERT_EQ(sleeper.sleeps.size(), 1u);
    EXPECT_EQ(sleeper.sleeps[0].count(), 3000);
}

TEST(ContentTypeTest, Classification) {
    EXPECT_EQ(classify_content_type("text/html; charset=UTF-8"), ContentKind::Html);
    EXPECT_EQ(classify_content_type("application/xhtml+xml"), ContentKind::Html);
    EXPECT_EQ(classify_content_type("application/pdf"), ContentKind::Pdf);
    EXPECT_EQ(classify_content_type("text/plain"), ContentKind::Text);
    EXPECT_EQ(classify_content_type("text/css"), ContentKind::Text);
    EXPECT_EQ(classify_content_type("image/png"), ContentKind::Image);
    EXPECT_EQ(classify_content_type("application/octet-stream"), ContentKind::Binary);
    EXPECT_EQ(classify_content_type(""), ContentKind::Binary);
}

TEST(ContentTypeTest, Extensions) {
    EXPECT_EQ(extension_for("TEXT/HTML"), "html");
    EXPECT_EQ(extension_for("application/pdf"), "pdf");
    EXPECT_EQ(extension_for("text/plain; charset=utf-8"), "txt");
    EXPECT_EQ(extension_for("image/jpeg"), "jpeg");
    EXPECT_EQ(extension_for("image/svg+xml"), "svg");
    EXPECT_EQ(extension_for("application/zip"), "bin");
    EXPECT_EQ(extension_for(""), "bin");
}
