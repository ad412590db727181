#pragma once

#include "links.hpp"

#include <string>
#include <vector>

class PageSource;

// Every <a> element of the page in document (pre-order) order.
// Throws ParseError when the body does not yield an HTML document.
std::vector<Anchor> parse_anchors(const std::string& html, const std::string& url);

class PageExtractor {
public:
    PageExtractor(PageSource& source, const LinkRules& rules);

    // One fetch, one parse. Safe to call concurrently for different URLs.
    std::vector<TypedLink> extract(const std::string& url) const;

private:
    PageSource& source_;
    const LinkRules& rules_;
};
