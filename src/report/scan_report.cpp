#include "scan_report.hpp"

#include <algorithm>
#include <map>

namespace report {

ScanSummary summarize_dirs(const std::vector<drive::Entry>& entries,
                           int64_t start_id, const std::string& start_name) {
    std::map<int64_t, DirStats> stats;

    for (const auto& e : entries) {
        if (e.is_dir())
            stats[e.id] = DirStats{e.id, e.name, 0, 0, e.depth};
    }
    stats[start_id] = DirStats{start_id, start_name, 0, 0, 0};

    ScanSummary summary;
    for (const auto& e : entries) {
        if (e.is_dir()) {
            ++summary.total_dirs;
            continue;
        }
        ++summary.total_files;
        summary.total_size += e.size;
        auto it = stats.find(e.parent_id);
        if (it != stats.end()) {
            ++it->second.file_count;
            it->second.size += e.size;
        }
    }

    for (auto& kv : stats) {
        if (kv.second.file_count > 0)
            summary.dirs.push_back(std::move(kv.second));
    }
    return summary;
}

ScanSelection select_dirs(std::vector<DirStats> dirs, const ScanFilter& filter) {
    if (filter.sort == ScanSort::Size) {
        std::stable_sort(dirs.begin(), dirs.end(),
                         [](const DirStats& a, const DirStats& b) { return a.size > b.size; });
    } else {
        std::stable_sort(dirs.begin(), dirs.end(), [](const DirStats& a, const DirStats& b) {
            return a.file_count > b.file_count;
        });
    }

    ScanSelection sel;
    if (filter.all) {
        sel.rows = std::move(dirs);
        return sel;
    }

    for (const auto& d : dirs) {
        if (d.file_count >= filter.threshold) sel.rows.push_back(d);
    }

    if (sel.rows.empty() && !dirs.empty()) {
        sel.fell_back = true;
        sel.rows      = std::move(dirs);
    }
    if (filter.top > 0 && sel.rows.size() > filter.top)
        sel.rows.resize(filter.top);
    return sel;
}

}  // namespace report
