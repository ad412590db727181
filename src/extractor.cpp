#include "extractor.hpp"

#include "errors.hpp"
#include "page_source.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include <climits>

namespace {

class HtmlDocGuard {
public:
    explicit HtmlDocGuard(xmlDocPtr doc) : doc_(doc) {}
    ~HtmlDocGuard() {
        if (doc_) xmlFreeDoc(doc_);
    }
    HtmlDocGuard(const HtmlDocGuard&) = delete;
    HtmlDocGuard& operator=(const HtmlDocGuard&) = delete;

    xmlDocPtr get() const { return doc_; }
    explicit operator bool() const { return doc_ != nullptr; }

private:
    xmlDocPtr doc_;
};

std::string take_xml_string(xmlChar* value) {
    if (!value) return {};
    std::string out(reinterpret_cast<char*>(value));
    xmlFree(value);
    return out;
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

Anchor to_anchor(xmlNodePtr node) {
    Anchor a;
    for (xmlAttrPtr attr = node->properties; attr; attr = attr->next) {
        std::string name(reinterpret_cast<const char*>(attr->name));
        a.attributes[name] = take_xml_string(xmlGetProp(node, attr->name));
    }
    if (node->children) a.label = trim(take_xml_string(xmlNodeGetContent(node->children)));
    return a;
}

void collect_anchors(xmlNodePtr node, std::vector<Anchor>& out) {
    if (node->type == XML_ELEMENT_NODE && xmlStrcasecmp(node->name, BAD_CAST "a") == 0) {
        out.push_back(to_anchor(node));
    }
    for (xmlNodePtr c = node->children; c; c = c->next) collect_anchors(c, out);
}

} // namespace

std::vector<Anchor> parse_anchors(const std::string& html, const std::string& url) {
    if (html.empty()) throw ParseError(url, "empty body");
    if (html.size() > static_cast<size_t>(INT_MAX)) throw ParseError(url, "body too large");

    HtmlDocGuard doc(htmlReadMemory(html.data(),
                                    static_cast<int>(html.size()),
                                    url.c_str(),
                                    nullptr,
                                    HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
                                        HTML_PARSE_NONET));
    if (!doc) throw ParseError(url, "not an HTML document");

    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (!root) throw ParseError(url, "document has no root element");

    std::vector<Anchor> anchors;
    collect_anchors(root, anchors);
    return anchors;
}

// -------------------- extractor --------------------
PageExtractor::PageExtractor(PageSource& source, const LinkRules& rules)
    : source_(source), rules_(rules) {
    xmlInitParser();
}

std::vector<TypedLink> PageExtractor::extract(const std::string& url) const {
    std::string body = source_.fetch(url);
    std::vector<TypedLink> links;
    for (const auto& a : parse_anchors(body, url)) {
        auto link = classify_link(a, rules_);
        if (link) links.push_back(std::move(*link));
    }
    return links;
}
