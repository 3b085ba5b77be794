#include "html_document.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <cctype>
#include <climits>

namespace {

struct XPathContextFree {
    void operator()(xmlXPathContext* c) const { xmlXPathFreeContext(c); }
};

struct XPathObjectFree {
    void operator()(xmlXPathObject* o) const { xmlXPathFreeObject(o); }
};

const int kParseOptions = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;

const char* kVisibleText =
    "//text()[not(ancestor::script) and not(ancestor::style) and not(ancestor::noscript)"
    " and not(ancestor::template) and not(ancestor::head)]";

}  // namespace

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char ch : s) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += ch;
    }
    return out;
}

HtmlDocument::HtmlDocument(const std::string& html, const std::string& url) {
    static const bool initialized = (xmlInitParser(), true);
    (void)initialized;

    if (html.size() > static_cast<size_t>(INT_MAX)) throw HtmlParseError("HTML document too large to parse");
    doc_.reset(htmlReadMemory(html.data(), static_cast<int>(html.size()), url.empty() ? nullptr : url.c_str(), nullptr,
                              kParseOptions));
    if (!doc_) throw HtmlParseError("libxml2 could not build a document" + (url.empty() ? std::string{} : " for " + url));
}

std::vector<xmlNodePtr> HtmlDocument::select(const char* xpath) const {
    std::unique_ptr<xmlXPathContext, XPathContextFree> ctx(xmlXPathNewContext(doc_.get()));
    if (!ctx) throw HtmlParseError("cannot create XPath context");
    std::unique_ptr<xmlXPathObject, XPathObjectFree> obj(
        xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(xpath), ctx.get()));
    if (!obj) throw HtmlParseError(std::string("XPath evaluation failed: ") + xpath);

    std::vector<xmlNodePtr> nodes;
    if (obj->nodesetval) {
        nodes.reserve(static_cast<size_t>(obj->nodesetval->nodeNr));
        for (int i = 0; i < obj->nodesetval->nodeNr; ++i) nodes.push_back(obj->nodesetval->nodeTab[i]);
    }
    return nodes;
}

std::string HtmlDocument::node_text(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return {};
    std::string s(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return s;
}

std::optional<std::string> HtmlDocument::title() const {
    auto nodes = select("//title");
    if (nodes.empty()) return std::nullopt;
    std::string t = collapse_whitespace(node_text(nodes.front()));
    if (t.empty()) return std::nullopt;
    return t;
}

std::vector<std::string> HtmlDocument::anchor_hrefs() const {
    std::vector<std::string> hrefs;
    for (xmlNodePtr attr : select("//a/@href")) hrefs.push_back(node_text(attr));
    return hrefs;
}

std::string HtmlDocument::paragraphs(const char* xpath) const {
    std::string out;
    for (xmlNodePtr p : select(xpath)) {
        std::string t = collapse_whitespace(node_text(p));
        if (t.empty()) continue;
        if (!out.empty()) out += "\n\n";
        out += t;
    }
    return out;
}

std::string HtmlDocument::readable_text() const {
    std::string text = paragraphs("(//article)[1]//p");
    if (!text.empty()) return text;

    text = paragraphs("//p");
    if (!text.empty()) return text;

    for (xmlNodePtr n : select(kVisibleText)) {
        std::string t = collapse_whitespace(node_text(n));
        if (t.empty()) continue;
        if (!text.empty()) text += "\n";
        text += t;
    }
    return text;
}
