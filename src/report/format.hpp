#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace report {

// 1024-based human size: "512 B", "1.5 KB", "2.0 MB", "1.1 GB".
std::string format_size(int64_t bytes);

// Age in days as "2a 3m", "1a", "5m" or "12j".
std::string format_age_days(int days);

// Cut `name` to `max` characters, ending with "..." when shortened.
std::string truncate_name(const std::string& name, size_t max);

// "YYYY-MM-DD" / "YYYY-MM-DD HH:MM" in local time for a unix timestamp.
std::string format_date(int64_t unix_seconds);
std::string format_datetime(int64_t unix_seconds);

// Parse "<n>[y|a|m|d|j]" into days (unit defaults to years).
// Throws std::invalid_argument on anything else.
int parse_age(const std::string& age);

// Parse a non-negative decimal count or byte size, at most INT64_MAX.
// Throws std::invalid_argument on signs, junk or overflow.
uint64_t parse_count(const std::string& text);

}  // namespace report
