#pragma once

#include <mutex>
#include <ostream>
#include <string>

// Turns a URL into a page body. Implementations must be safe to call from
// several threads at once and throw FetchError on any failure.
class PageSource {
public:
    virtual ~PageSource() = default;
    virtual std::string fetch(const std::string& url) = 0;
};

class HttpPageSource : public PageSource {
public:
    static constexpr const char* kDefaultUserAgent =
        "treemark/1.0 (+directory listing crawler for documentation checklists)";

    // With a log stream, every response gets a "Status: <code>, bytes: <n>" line.
    explicit HttpPageSource(int timeoutMs = 30000,
                            std::ostream* log = nullptr,
                            std::string userAgent = kDefaultUserAgent);

    std::string fetch(const std::string& url) override;

private:
    int timeoutMs_;
    std::ostream* log_;
    std::mutex log_mtx_;
    std::string userAgent_;
};
