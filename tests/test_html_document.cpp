#include <gtest/gtest.h>

#include "html_document.hpp"

TEST(HtmlDocumentTest, TitleIsCollapsed) {
    HtmlDocument doc("<html><head><title>\n  Tax   Guide \n</title></head><body></body></html>");
    ASSERT_TRUE(doc.title().has_value());
    EXPECT_EQ(doc.title().value(), "Tax Guide");
}

TEST(HtmlDocumentTest, MissingOrEmptyTitle) {
    EXPECT_FALSE(HtmlDocument("<html><body><p>x</p></body></html>").title().has_value());
    EXPECT_FALSE(HtmlDocument("<html><head><title>  </title></head></html>").title().has_value());
}

TEST(HtmlDocumentTest, AnchorHrefsInDocumentOrder) {
    HtmlDocument doc(R"(<html><body>
        <a href="/one">1</a>
        <A HREF="two.html">2</A>
        <a name="no-href">x</a>
        <link href="/style.css">
        <a href='https://other.test/three'>3</a>
    </body></html>)");
    auto hrefs = doc.anchor_hrefs();
    ASSERT_EQ(hrefs.size(), 3u);
    EXPECT_EQ(hrefs[0], "/one");
    EXPECT_EQ(hrefs[1], "two.html");
    EXPECT_EQ(hrefs[2], "https://other.test/three");
}

TEST(HtmlDocumentTest, MalformedMarkupIsRecovered) {
    HtmlDocument doc("<html><body><div><p>unclosed <a href='/x'>link<p>second");
    auto hrefs = doc.anchor_hrefs();
    ASSERT_EQ(hrefs.size(), 1u);
    EXPECT_EQ(hrefs[0], "/x");
    EXPECT_NE(doc.readable_text().find("second"), std::string::npos);
}

TEST(HtmlDocumentTest, ArticleParagraphsComeFirst) {
    HtmlDocument doc(R"(<html><body>
        <p>Navigation blurb</p>
        <article><h1>Heading</h1><p>First   paragraph.</p><div><p>Second paragraph.</p></div></article>
        <p>Footer</p>
    </body></html>)");
    EXPECT_EQ(doc.readable_text(), "First paragraph.\n\nSecond paragraph.");
}

TEST(HtmlDocumentTest, FallsBackToAllParagraphs) {
    HtmlDocument doc(R"(<html><body>
        <article><h1>Only a heading</h1></article>
        <p>One</p><p> </p><p>Two</p>
    </body></html>)");
    EXPECT_EQ(doc.readable_text(), "One\n\nTwo");
}

TEST(HtmlDocumentTest, FallsBackToVisibleText) {
    HtmlDocument doc(R"(<html><head><title>T</title><style>body{}</style></head><body>
        <script>var hidden = 1;</script>
        <div>Visible   line</div><span>Another</span>
    </body></html>)");
    std::string text = doc.readable_text();
    EXPECT_NE(text.find("Visible line"), std::string::npos);
    EXPECT_NE(text.find("Another"), std::string::npos);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_EQ(text.find("body{}"), std::string::npos);
}

TEST(HtmlDocumentTest, EmptyTextForEmptyBody) {
    HtmlDocument doc("<html><body>   </body></html>");
    EXPECT_EQ(doc.readable_text(), "");
}

TEST(HtmlDocumentTest, CollapseWhitespace) {
    EXPECT_EQ(collapse_whitespace("  a \n\t b  "), "a b");
    EXPECT_EQ(collapse_whitespace(""), "");
}
