#include "crawler.hpp"

#include <chrono>
#include <system_error>
#include <utility>
#include <variant>

namespace {

// Per-link branch of the consumer loop.
struct LinkDispatch {
    std::vector<std::string>& directories;
    CrawlResult& results;

    void operator()(DirectoryLink& d) const { directories.push_back(std::move(d.href)); }
    void operator()(FileLink& f) const { results.push_back(std::move(f)); }
};

} // namespace

// -------------------- ctor --------------------
Crawler::Crawler(PageSource& source,
                 const LinkRules& rules,
                 int maxConcurrency,
                 int delayMs,
                 std::ostream* log)
    : extractor_(source, rules),
      maxConcurrency_(maxConcurrency),
      delayMs_(delayMs),
      log_(log) {}

Crawler::~Crawler() {
    aborting_ = true;
    shutdown();
}

// -------------------- small utils --------------------
void Crawler::log_line(const std::string& line) {
    if (!log_) return;
    std::lock_guard<std::mutex> lk(log_mtx_);
    *log_ << line << std::flush;
}

void Crawler::polite_delay() const {
    if (delayMs_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delayMs_));
}

// -------------------- tasks --------------------
Crawler::Completion Crawler::run_fetch(size_t task, const std::string& url) {
    Completion c;
    c.task = task;
    c.url = url;
    if (aborting_) return c;
    try {
        polite_delay();
        log_line("Visiting: " + url + "\n");
        c.links = extractor_.extract(url);
    } catch (...) {
        c.error = std::current_exception();
    }
    return c;
}

void Crawler::post(Completion c) {
    {
        std::lock_guard<std::mutex> lk(completions_mtx_);
        completions_.push_back(std::move(c));
    }
    completions_cv_.notify_one();
}

Crawler::Completion Crawler::wait_completion() {
    std::unique_lock<std::mutex> lk(completions_mtx_);
    completions_cv_.wait(lk, [&]{ return !completions_.empty(); });
    Completion c = std::move(completions_.front());
    completions_.pop_front();
    return c;
}

void Crawler::dispatch(const std::string& url) {
    size_t task = ++stats_.dispatched;

    if (maxConcurrency_ > 0) {
        {
            std::lock_guard<std::mutex> lk(work_mtx_);
            work_.push_back(WorkItem{task, url});
        }
        work_cv_.notify_one();
        return;
    }

    std::thread& slot = tasks_[task];
    try {
        slot = std::thread([this, task, url]{ post(run_fetch(task, url)); });
    } catch (const std::system_error&) {
        // The task never ran; report it on the channel so the counter still balances.
        tasks_.erase(task);
        Completion c;
        c.task = task;
        c.url = url;
        c.error = std::current_exception();
        post(std::move(c));
    }
}

// A drained completion means its thread is about to exit.
void Crawler::retire(size_t task) {
    auto it = tasks_.find(task);
    if (it == tasks_.end()) return;
    if (it->second.joinable()) it->second.join();
    tasks_.erase(it);
}

// -------------------- workers --------------------
void Crawler::start_workers() {
    {
        std::lock_guard<std::mutex> lk(work_mtx_);
        stopping_ = false;
        work_.clear();
    }
    if (maxConcurrency_ <= 0) return;
    workers_.reserve(maxConcurrency_);
    for (int i = 0; i < maxConcurrency_; ++i) workers_.emplace_back(&Crawler::worker_loop, this);
}

void Crawler::worker_loop() {
    for (;;) {
        WorkItem item;
        {
            std::unique_lock<std::mutex> lk(work_mtx_);
            work_cv_.wait(lk, [&]{ return !work_.empty() || stopping_; });
            if (stopping_) break;
            item = std::move(work_.front());
            work_.pop_front();
        }
        post(run_fetch(item.task, item.url));
    }
}

void Crawler::shutdown() {
    {
        std::lock_guard<std::mutex> lk(work_mtx_);
        stopping_ = true;
        work_.clear();
    }
    work_cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();

    for (auto& kv : tasks_) {
        if (kv.second.joinable()) kv.second.join();
    }
    tasks_.clear();

    std::lock_guard<std::mutex> lk(completions_mtx_);
    completions_.clear();
}

// -------------------- orchestration --------------------
long Crawler::drain(const std::string& rootUrl, CrawlResult& results, std::exception_ptr& firstError) {
    long n = 1;
    dispatch(rootUrl);

    for (; n > 0; --n) {
        Completion c = wait_completion();
        retire(c.task);
        ++stats_.completed;

        if (c.error) {
            if (!firstError) {
                firstError = c.error;
                aborting_ = true;
                log_line("  Failed: " + c.url + ", draining " + std::to_string(n - 1) + " task(s)\n");
            }
            continue;
        }
        if (firstError) continue;

        std::vector<std::string> directories;
        size_t filesBefore = results.size();
        LinkDispatch visitor{directories, results};
        for (auto& link : c.links) std::visit(visitor, link);

        for (const auto& href : directories) {
            ++n;
            dispatch(href);
        }
        log_line("  " + c.url + ": " + std::to_string(directories.size()) + " dir(s), " +
                 std::to_string(results.size() - filesBefore) + " file(s)\n");
    }
    return n;
}

CrawlResult Crawler::crawl(const std::string& rootUrl) {
    stats_ = CrawlStats{};
    aborting_ = false;
    {
        std::lock_guard<std::mutex> lk(completions_mtx_);
        completions_.clear();
    }

    CrawlResult results;
    std::exception_ptr firstError;
    long n = 0;
    try {
        start_workers();
        n = drain(rootUrl, results, firstError);
    } catch (...) {
        // Nothing from this crawl may leak into the next one.
        aborting_ = true;
        shutdown();
        throw;
    }
    shutdown();

    stats_.pending = n;
    stats_.files = results.size();

    if (firstError) std::rethrow_exception(firstError);

    log_line("Crawled " + std::to_string(stats_.completed) + " page(s), found " +
             std::to_string(stats_.files) + " file(s)\n");
    return results;
}
