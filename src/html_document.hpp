#pragma once

#include <libxml/HTMLparser.h>
#include <libxml/xpath.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class HtmlParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Runs of whitespace become one space, ends trimmed.
std::string collapse_whitespace(const std::string& s);

// libxml2 HTML document parsed in recovery mode. Broken markup is repaired,
// only a document libxml2 cannot build at all raises HtmlParseError.
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html, const std::string& url = {});

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    std::optional<std::string> title() const;

    // href values of every <a>, in document order, unresolved.
    std::vector<std::string> anchor_hrefs() const;

    // Paragraphs of the first <article>, else every paragraph of the
    // document, else all visible text. Empty when the page has no text.
    std::string readable_text() const;

private:
    struct DocFree {
        void operator()(xmlDoc* d) const { xmlFreeDoc(d); }
    };

    std::vector<xmlNodePtr> select(const char* xpath) const;
    std::string paragraphs(const char* xpath) const;
    static std::string node_text(xmlNodePtr node);

    std::unique_ptr<xmlDoc, DocFree> doc_;
};
