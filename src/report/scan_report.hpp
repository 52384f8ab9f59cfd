#pragma once

#include "../drive/drive_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace report {

// Direct-children statistics of one directory.
struct DirStats {
    int64_t     id         = 0;
    std::string name;
    size_t      file_count = 0;
    int64_t     size       = 0;
    int32_t     depth      = 0;
};

struct ScanSummary {
    std::vector<DirStats> dirs;          // only directories holding files
    size_t                total_files = 0;
    size_t                total_dirs  = 0;
    int64_t               total_size  = 0;
};

enum class ScanSort { Size, Files };

struct ScanFilter {
    bool     all       = false;  // keep every row
    size_t   threshold = 100;    // minimum file_count
    size_t   top       = 10;     // 0 = unlimited
    ScanSort sort      = ScanSort::Size;
};

struct ScanSelection {
    std::vector<DirStats> rows;
    bool                  fell_back = false;  // nothing met the threshold
};

// Group the crawled entries by parent directory. The start directory is
// registered explicitly because the crawl does not return it.
ScanSummary summarize_dirs(const std::vector<drive::Entry>& entries,
                           int64_t start_id, const std::string& start_name);

// Sort descending by the chosen key, then apply threshold/top. When no row
// meets the threshold, the top rows are returned and fell_back is set.
ScanSelection select_dirs(std::vector<DirStats> dirs, const ScanFilter& filter);

}  // namespace report
