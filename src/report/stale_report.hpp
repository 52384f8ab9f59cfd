#pragma once

#include "../drive/drive_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace report {

struct AgeBucket {
    std::string label;
    int         min_days = 0;
    int         max_days = -1;  // exclusive; -1 = unbounded
    size_t      count    = 0;
    int64_t     size     = 0;
};

struct StaleFile {
    int64_t     id          = 0;
    std::string name;
    int64_t     size        = 0;
    int64_t     modified_at = 0;
    int         age_days    = 0;
};

struct StaleReport {
    std::vector<AgeBucket> buckets;
    std::vector<StaleFile> stale;        // largest first
    size_t                 total_files = 0;
    int64_t                total_size  = 0;
    int64_t                stale_size  = 0;
};

// < 6 months, 6m - 1 year, 1 - 2 years, 2 - 3 years, 3 - 5 years, > 5 years.
std::vector<AgeBucket> default_age_buckets();

// Bucket every file by days since last modification and collect the files
// modified before now - threshold_days that are at least min_size bytes.
// Directories are ignored.
StaleReport build_stale_report(const std::vector<drive::Entry>& entries,
                               int64_t now_unix, int threshold_days, int64_t min_size);

}  // namespace report
