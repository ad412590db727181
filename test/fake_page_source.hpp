#pragma once

#include "errors.hpp"
#include "links.hpp"
#include "page_source.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>

// Serves canned pages; any unknown URL is a 404.
class FakePageSource : public PageSource {
public:
    void add(const std::string& url, const std::string& html) { pages_[url] = html; }

    std::string fetch(const std::string& url) override {
        int now = ++inFlight_;
        int seen = maxInFlight_.load();
        while (now > seen && !maxInFlight_.compare_exchange_weak(seen, now)) {}
        {
            std::lock_guard<std::mutex> lk(mtx_);
            ++fetches_[url];
            fetchThreads_.insert(std::this_thread::get_id());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --inFlight_;

        auto it = pages_.find(url);
        if (it == pages_.end()) throw FetchError(url, "HTTP status 404");
        return it->second;
    }

    int fetch_count(const std::string& url) {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = fetches_.find(url);
        return it == fetches_.end() ? 0 : it->second;
    }

    int total_fetches() {
        std::lock_guard<std::mutex> lk(mtx_);
        int total = 0;
        for (const auto& kv : fetches_) total += kv.second;
        return total;
    }

    int max_in_flight() const { return maxInFlight_; }

    size_t fetching_threads() {
        std::lock_guard<std::mutex> lk(mtx_);
        return fetchThreads_.size();
    }

private:
    std::map<std::string, std::string> pages_; // read-only once crawling starts
    std::map<std::string, int> fetches_;
    std::set<std::thread::id> fetchThreads_;
    std::mutex mtx_;
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxInFlight_{0};
};

inline const std::string kRepo = "https://github.com/acme/widgets";

inline std::string row(const std::string& path, const std::string& label) {
    return std::string("<a class=\"") + LinkRules::kDefaultMarkerClass + "\" href=\"/acme/widgets/" + path +
           "\">" + label + "</a>\n";
}

inline std::string dir_row(const std::string& dir) {
    auto slash = dir.rfind('/');
    return row("tree/main/" + dir, slash == std::string::npos ? dir : dir.substr(slash + 1));
}

inline std::string file_row(const std::string& dir, const std::string& file) {
    return row("blob/main/" + (dir.empty() ? file : dir + "/" + file), file);
}

inline std::string page(const std::string& rows) {
    return "<html><body><nav><a href=\"/\">home</a></nav><table>" + rows + "</table></body></html>";
}

inline std::string tree_url(const std::string& dir) {
    return kRepo + "/tree/main/" + dir;
}
