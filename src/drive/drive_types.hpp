#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace drive {

// Identifier of the implicit root directory of every drive.
static constexpr int64_t ROOT_ID = 1;

enum class EntryKind {
    Dir,
    File,
    Other,
};

// One node of the remote tree, as returned by the API. Immutable snapshot.
struct Entry {
    int64_t     id        = 0;
    int64_t     parent_id = 0;
    EntryKind   kind      = EntryKind::File;
    std::string type;                 // raw kind string: "dir", "file", ...
    std::string name;
    int64_t     size      = 0;        // files only
    int32_t     depth     = 0;        // depth from the drive root
    int64_t     created_at       = 0; // unix seconds
    int64_t     added_at         = 0;
    int64_t     last_modified_at = 0;
    int64_t     updated_at       = 0;
    std::string status;
    std::string visibility;
    int64_t     drive_id  = 0;
    std::string color;                // optional, empty when absent

    bool is_dir() const { return kind == EntryKind::Dir; }
};

// One page of a directory listing.
struct ListPage {
    std::vector<Entry> entries;
    bool               has_more    = false;
    std::string        cursor;          // opaque, meaningful only when has_more
    int64_t            response_at = 0;
};

// A category ("tag") defined on the drive.
struct Category {
    int64_t     id            = 0;
    std::string name;
    std::string color;
    bool        is_predefined = false;
    int64_t     created_by    = 0;
    int64_t     created_at    = 0;
};

// Per-file outcome of a category mutation. result == false means the file
// already had (add) or did not have (remove) the category.
struct CategoryResult {
    int64_t id     = 0;
    bool    result = false;
};

EntryKind parse_kind(const std::string& type);

// ── JSON helpers ─────────────────────────────────────────────────────────────
// All decoders throw DecodeError when the document does not match the schema.

Entry    decode_entry(const nlohmann::json& j);
Category decode_category(const nlohmann::json& j);

// Parse an API response body and check its envelope. Returns the whole
// document; throws DecodeError on malformed JSON and ApiError(status, body)
// when "result" is not "success".
nlohmann::json parse_envelope(const std::string& body, long status = 200);

}  // namespace drive
