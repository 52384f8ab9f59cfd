#include "crawler.hpp"
#include "bounded_queue.hpp"
#include "../http/http_error.hpp"

#include <spdlog/spdlog.h>

#include <deque>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <thread>
#include <utility>

namespace drive {

namespace {

struct CrawlJob {
    int64_t     dir_id;
    std::string dir_name;
};

struct CrawlResult {
    std::vector<Entry> entries;
    std::string        dir_name;
    std::exception_ptr error;       // set instead of entries on failure
};

// Closes both queues and joins the workers on every exit path of crawl().
class WorkerGroup {
public:
    WorkerGroup(BoundedQueue<CrawlJob>& jobs, BoundedQueue<CrawlResult>& results)
        : jobs_(jobs), results_(results) {}

    ~WorkerGroup() {
        jobs_.close();
        results_.close();
        for (auto& t : threads_) t.join();
    }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    template <typename F>
    void spawn(size_t n, F&& fn) {
        threads_.reserve(n);
        for (size_t i = 0; i < n; ++i)
            threads_.emplace_back(fn);
    }

private:
    BoundedQueue<CrawlJob>&    jobs_;
    BoundedQueue<CrawlResult>& results_;
    std::vector<std::thread>   threads_;
};

}  // anonymous namespace

TreeCrawler::TreeCrawler(ListChildrenFn list, CrawlOptions opts)
    : list_(std::move(list)), opts_(opts) {
    if (!list_)
        throw std::invalid_argument("TreeCrawler: null listing function");
    if (opts_.workers == 0)
        throw std::invalid_argument("TreeCrawler: workers must be > 0");
}

std::vector<Entry> TreeCrawler::crawl(int64_t root_id, const std::string& root_name,
                                      const CancelToken& cancel,
                                      const ProgressCallback& progress) const {
    cancel.throw_if_cancelled();

    BoundedQueue<CrawlJob>    jobs(opts_.queue_capacity);
    BoundedQueue<CrawlResult> results(opts_.queue_capacity);

    // Wake the control loop and every blocked worker as soon as cancel fires.
    const auto subscription = cancel.subscribe([&jobs, &results] {
        jobs.close();
        results.close();
    });

    auto worker = [this, &jobs, &results, &cancel] {
        while (auto job = jobs.pop()) {
            if (cancel.cancelled()) return;

            CrawlResult r;
            r.dir_name = job->dir_name;
            try {
                r.entries = list_(job->dir_id, cancel);
            } catch (...) {
                r.error = std::current_exception();
            }

            if (cancel.cancelled()) return;
            if (!results.push(std::move(r))) return;
        }
    };

    WorkerGroup group(jobs, results);
    group.spawn(opts_.workers, worker);

    spdlog::debug("crawl started root={} name={} workers={}", root_id, root_name, opts_.workers);

    std::vector<Entry>   all;
    std::deque<CrawlJob> backlog;     // discovered, not yet handed to the job queue
    std::exception_ptr   first_error;
    size_t               pending = 1;

    backlog.push_back({root_id, root_name});

    // Move as many backlog jobs as fit; never blocks the control loop.
    auto dispatch = [&backlog, &jobs] {
        while (!backlog.empty() && jobs.try_push(backlog.front()))
            backlog.pop_front();
    };

    dispatch();
    while (pending > 0) {
        auto r = results.pop();
        if (!r || cancel.cancelled())
            throw Cancelled();
        --pending;

        if (r->error) {
            if (!first_error) {
                first_error = r->error;
                // Jobs no worker has started are dropped; in-flight ones drain.
                pending -= backlog.size();
                backlog.clear();
                while (jobs.try_pop()) --pending;
                spdlog::debug("crawl error in dir={}, draining pending={}", r->dir_name, pending);
            }
            continue;
        }
        if (first_error) continue;

        for (const auto& e : r->entries) {
            if (e.is_dir()) {
                ++pending;
                backlog.push_back({e.id, e.name});
            }
        }
        all.insert(all.end(),
                   std::make_move_iterator(r->entries.begin()),
                   std::make_move_iterator(r->entries.end()));

        if (progress) progress(r->dir_name, all.size());
        dispatch();
    }

    cancel.throw_if_cancelled();
    if (first_error)
        std::rethrow_exception(first_error);

    spdlog::debug("crawl finished root={} entries={}", root_id, all.size());
    return all;
}

}  // namespace drive
