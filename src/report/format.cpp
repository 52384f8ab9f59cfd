#include "format.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstdio>
#include <ctime>
#include <limits>
#include <stdexcept>

namespace report {

std::string format_size(int64_t bytes) {
    static constexpr int64_t KB = 1024;
    static constexpr int64_t MB = KB * 1024;
    static constexpr int64_t GB = MB * 1024;

    char buf[32];
    if      (bytes >= GB) snprintf(buf, sizeof(buf), "%.1f GB", bytes / double(GB));
    else if (bytes >= MB) snprintf(buf, sizeof(buf), "%.1f MB", bytes / double(MB));
    else if (bytes >= KB) snprintf(buf, sizeof(buf), "%.1f KB", bytes / double(KB));
    else                  snprintf(buf, sizeof(buf), "%lld B", static_cast<long long>(bytes));
    return buf;
}

std::string format_age_days(int days) {
    const int years  = days / 365;
    const int months = (days % 365) / 30;

    if (years > 0) {
        if (months > 0)
            return std::to_string(years) + "a " + std::to_string(months) + "m";
        return std::to_string(years) + "a";
    }
    if (months > 0) return std::to_string(months) + "m";
    return std::to_string(days) + "j";
}

std::string truncate_name(const std::string& name, size_t max) {
    if (name.size() <= max) return name;
    if (max <= 3) return name.substr(0, max);
    return name.substr(0, max - 3) + "...";
}

static std::string format_time(int64_t unix_seconds, const char* fmt) {
    const std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::string format_date(int64_t unix_seconds) {
    return format_time(unix_seconds, "%Y-%m-%d");
}

std::string format_datetime(int64_t unix_seconds) {
    return format_time(unix_seconds, "%Y-%m-%d %H:%M");
}

int parse_age(const std::string& age) {
    size_t i = 0;
    while (i < age.size() && std::isdigit(static_cast<unsigned char>(age[i]))) ++i;
    if (i == 0 || age.size() - i > 1)
        throw std::invalid_argument("format: <number>[y|m|d] (ex: 2y, 6m, 90d)");

    int value = 0;
    try {
        value = std::stoi(age.substr(0, i));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("age out of range: " + age);
    }

    const char unit = (i < age.size()) ? age[i] : 'y';
    int per_unit = 0;
    switch (unit) {
        case 'y': case 'a': per_unit = 365; break;
        case 'm':           per_unit = 30;  break;
        case 'd': case 'j': per_unit = 1;   break;
        default:
            throw std::invalid_argument("format: <number>[y|m|d] (ex: 2y, 6m, 90d)");
    }
    if (value > std::numeric_limits<int>::max() / per_unit)
        throw std::invalid_argument("age out of range: " + age);
    return value * per_unit;
}

uint64_t parse_count(const std::string& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0])))
        throw std::invalid_argument("expected a non-negative integer, got '" + text + "'");
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (end != text.c_str() + text.size())
        throw std::invalid_argument("expected a non-negative integer, got '" + text + "'");
    if (errno == ERANGE || v > static_cast<unsigned long long>(std::numeric_limits<int64_t>::max()))
        throw std::invalid_argument("value out of range: " + text);
    return v;
}

}  // namespace report
