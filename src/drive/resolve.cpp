#include "resolve.hpp"
#include "files.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace drive {

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

std::optional<int64_t> parse_id(const std::string& s) {
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
    return static_cast<int64_t>(v);
}

Entry find_by_path(RequestTransport& transport, int64_t drive_id,
                   const std::string& path, const CancelToken& cancel) {
    int64_t current = ROOT_ID;

    size_t pos = 0;
    while (pos < path.size()) {
        const size_t slash = path.find('/', pos);
        const size_t end   = (slash == std::string::npos) ? path.size() : slash;
        const std::string part = path.substr(pos, end - pos);
        pos = end + 1;
        if (part.empty()) continue;

        spdlog::debug("resolving path component={} parent={}", part, current);
        bool found = false;
        for (const auto& e : list_children(transport, drive_id, current, cancel)) {
            if (iequals(e.name, part)) {
                current = e.id;
                found   = true;
                break;
            }
        }
        if (!found)
            throw std::runtime_error("path not found: " + part);
    }

    return get_file(transport, drive_id, current, cancel);
}

}  // namespace drive
