#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// Network/transport failure or a non-200 status for one page.
class FetchError : public std::runtime_error {
public:
    FetchError(std::string url, const std::string& cause)
        : std::runtime_error("fetching " + url + ": " + cause), url_(std::move(url)) {}

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

// Body could not be turned into an HTML document.
class ParseError : public std::runtime_error {
public:
    ParseError(std::string url, const std::string& cause)
        : std::runtime_error("parsing " + url + ": " + cause), url_(std::move(url)) {}

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

// Bad command line or configuration, raised before any crawl starts.
class InputValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
