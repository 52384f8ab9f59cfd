#pragma once

#include "drive_types.hpp"
#include "../http/cancel.hpp"
#include "../http/request_transport.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace drive {

// Walk `path` component by component from the drive root, matching names
// case-insensitively, and return the final entry. "" and "/" resolve to the
// root. Throws std::runtime_error("path not found: <component>") on a miss.
Entry find_by_path(RequestTransport& transport, int64_t drive_id,
                   const std::string& path, const CancelToken& cancel);

// Parse a whole-string decimal id ("42"); std::nullopt for anything else.
std::optional<int64_t> parse_id(const std::string& s);

bool iequals(const std::string& a, const std::string& b);

}  // namespace drive
