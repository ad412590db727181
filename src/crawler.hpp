#pragma once

#include "extractor.hpp"
#include "links.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

class PageSource;

using CrawlResult = std::vector<FileLink>;

struct CrawlStats {
    size_t dispatched = 0; // fetch tasks started, root included
    size_t completed = 0;  // completions drained by the consumer loop
    size_t files = 0;
    long pending = 0;      // pending counter when the loop exited
};

// Walks a directory tree of unknown shape. Every discovered directory becomes
// one fetch task; tasks only post completions, and a single consumer loop in
// crawl() owns the pending counter and the result vector.
//
// maxConcurrency == 0 runs each task on its own thread. maxConcurrency > 0
// runs tasks on a fixed pool of that many workers draining a work queue.
class Crawler {
public:
    Crawler(PageSource& source,
            const LinkRules& rules,
            int maxConcurrency = 0,
            int delayMs = 0,
            std::ostream* log = nullptr);
    ~Crawler();

    Crawler(const Crawler&) = delete;
    Crawler& operator=(const Crawler&) = delete;

    // Returns every tracked file under rootUrl. The first FetchError or
    // ParseError from any task is rethrown once in-flight tasks are drained;
    // no partial result is returned.
    CrawlResult crawl(const std::string& rootUrl);

    CrawlStats stats() const { return stats_; }

private:
    struct Completion {
        size_t task = 0;
        std::string url;
        std::vector<TypedLink> links;
        std::exception_ptr error;
    };

    struct WorkItem {
        size_t task;
        std::string url;
    };

    PageExtractor extractor_;
    int maxConcurrency_;
    int delayMs_;
    std::ostream* log_;
    std::mutex log_mtx_;

    CrawlStats stats_;
    std::atomic<bool> aborting_{false};

    // Unbounded mode: one thread per task, joined when its completion is drained
    std::map<size_t, std::thread> tasks_;

    // Bounded mode: worker pool and its queue
    std::vector<std::thread> workers_;
    std::deque<WorkItem> work_;
    bool stopping_ = false;
    std::mutex work_mtx_;
    std::condition_variable work_cv_;

    // Completion channel: many producers, one consumer
    std::deque<Completion> completions_;
    std::mutex completions_mtx_;
    std::condition_variable completions_cv_;

    void log_line(const std::string& line);
    void polite_delay() const;

    Completion run_fetch(size_t task, const std::string& url);
    void dispatch(const std::string& url);
    void post(Completion c);
    Completion wait_completion();
    void retire(size_t task);

    void start_workers();
    void worker_loop();
    void shutdown();

    long drain(const std::string& rootUrl, CrawlResult& results, std::exception_ptr& firstError);
};
