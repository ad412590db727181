#include "page_source.hpp"

#include "errors.hpp"

#include <cpr/cpr.h>

HttpPageSource::HttpPageSource(int timeoutMs, std::ostream* log, std::string userAgent)
    : timeoutMs_(timeoutMs), log_(log), userAgent_(std::move(userAgent)) {}

std::string HttpPageSource::fetch(const std::string& url) {
    cpr::Response r = cpr::Get(cpr::Url{url},
                               cpr::Header{{"User-Agent", userAgent_}},
                               cpr::Timeout{timeoutMs_},
                               cpr::Redirect{true});
    if (log_) {
        std::lock_guard<std::mutex> lk(log_mtx_);
        *log_ << "  Status: " << r.status_code << ", bytes: " << r.text.size() << " (" << url << ")" << std::endl;
    }
    if (r.error) throw FetchError(url, r.error.message);
    if (r.status_code != 200) throw FetchError(url, "HTTP status " + std::to_string(r.status_code));
    return std::move(r.text);
}
