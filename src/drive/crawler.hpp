#pragma once

#include "drive_types.hpp"
#include "../http/cancel.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace drive {

// Called by the control loop after each directory listing has been merged,
// with the directory name and the running number of collected entries.
using ProgressCallback = std::function<void(const std::string& dir_name, size_t entry_count)>;

// Lists every direct child of one directory (all pages). Must be safe to call
// from several threads at once.
using ListChildrenFn = std::function<std::vector<Entry>(int64_t dir_id, const CancelToken& cancel)>;

struct CrawlOptions {
    size_t workers        = 5;
    size_t queue_capacity = 100;   // bound of both the job and result queues
};

// Concurrent breadth-first listing of a whole subtree.
//
// A fixed pool of worker threads takes directory jobs from a bounded queue,
// lists them through `list`, and publishes one result per job. The calling
// thread runs the control loop: it alone owns the pending-job counter and the
// accumulated entries, and it queues a job for every directory it discovers.
//
// crawl() returns the flattened set of all descendants (the root itself is
// not included), in no particular order. It never returns a partial tree:
//   - the first failed listing is remembered, remaining in-flight results are
//     drained and discarded, then that error is rethrown;
//   - if `cancel` fires, Cancelled is thrown, whether or not an error was seen.
// Worker threads are always joined before crawl() returns or throws.
class TreeCrawler {
public:
    explicit TreeCrawler(ListChildrenFn list, CrawlOptions opts = {});

    std::vector<Entry> crawl(int64_t root_id, const std::string& root_name,
                             const CancelToken& cancel,
                             const ProgressCallback& progress = nullptr) const;

private:
    ListChildrenFn list_;
    CrawlOptions   opts_;
};

}  // namespace drive
