#include "stale_report.hpp"

#include <algorithm>

namespace report {

static constexpr int64_t SECONDS_PER_DAY = 24 * 60 * 60;

std::vector<AgeBucket> default_age_buckets() {
    return {
        {"< 6 months",  0,    182,  0, 0},
        {"6m - 1 year", 182,  365,  0, 0},
        {"1 - 2 years", 365,  730,  0, 0},
        {"2 - 3 years", 730,  1095, 0, 0},
        {"3 - 5 years", 1095, 1825, 0, 0},
        {"> 5 years",   1825, -1,   0, 0},
    };
}

StaleReport build_stale_report(const std::vector<drive::Entry>& entries,
                               int64_t now_unix, int threshold_days, int64_t min_size) {
    StaleReport rep;
    rep.buckets = default_age_buckets();

    const int64_t threshold_unix = now_unix - int64_t{threshold_days} * SECONDS_PER_DAY;

    for (const auto& e : entries) {
        if (e.is_dir()) continue;

        ++rep.total_files;
        rep.total_size += e.size;

        const int age_days = static_cast<int>((now_unix - e.last_modified_at) / SECONDS_PER_DAY);

        for (auto& b : rep.buckets) {
            if (age_days >= b.min_days && (b.max_days == -1 || age_days < b.max_days)) {
                ++b.count;
                b.size += e.size;
                break;
            }
        }

        if (e.last_modified_at < threshold_unix) {
            if (min_size > 0 && e.size < min_size) continue;
            rep.stale.push_back({e.id, e.name, e.size, e.last_modified_at, age_days});
            rep.stale_size += e.size;
        }
    }

    std::stable_sort(rep.stale.begin(), rep.stale.end(),
                     [](const StaleFile& a, const StaleFile& b) { return a.size > b.size; });
    return rep;
}

}  // namespace report
