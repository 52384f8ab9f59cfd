#include "drive_types.hpp"
#include "../http/http_error.hpp"

#include <nlohmann/json.hpp>

namespace drive {

namespace {

// Like json::value(), but an explicit null also yields the default.
template <typename T>
T field(const nlohmann::json& j, const char* key, T def) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    return it->template get<T>();
}

}  // anonymous namespace

EntryKind parse_kind(const std::string& type) {
    if (type == "dir")  return EntryKind::Dir;
    if (type == "file") return EntryKind::File;
    return EntryKind::Other;
}

Entry decode_entry(const nlohmann::json& j) {
    try {
        Entry e;
        e.id               = j.at("id").get<int64_t>();
        e.name             = j.at("name").get<std::string>();
        e.type             = j.at("type").get<std::string>();
        e.kind             = parse_kind(e.type);
        e.parent_id        = field(j, "parent_id", int64_t{0});
        e.size             = field(j, "size", int64_t{0});
        e.depth            = field(j, "depth", int32_t{0});
        e.created_at       = field(j, "created_at", int64_t{0});
        e.added_at         = field(j, "added_at", int64_t{0});
        e.last_modified_at = field(j, "last_modified_at", int64_t{0});
        e.updated_at       = field(j, "updated_at", int64_t{0});
        e.status           = field(j, "status", std::string{});
        e.visibility       = field(j, "visibility", std::string{});
        e.drive_id         = field(j, "drive_id", int64_t{0});
        e.color            = field(j, "color", std::string{});
        return e;
    } catch (const nlohmann::json::exception& ex) {
        throw DecodeError(std::string("JSON parse error: entry: ") + ex.what());
    }
}

Category decode_category(const nlohmann::json& j) {
    try {
        Category c;
        c.id            = j.at("id").get<int64_t>();
        c.name          = j.at("name").get<std::string>();
        c.color         = field(j, "color", std::string{});
        c.is_predefined = field(j, "is_predefined", false);
        c.created_by    = field(j, "created_by", int64_t{0});
        c.created_at    = field(j, "created_at", int64_t{0});
        return c;
    } catch (const nlohmann::json::exception& ex) {
        throw DecodeError(std::string("JSON parse error: category: ") + ex.what());
    }
}

nlohmann::json parse_envelope(const std::string& body, long status) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& ex) {
        throw DecodeError(std::string("JSON parse error: ") + ex.what());
    }
    if (!doc.is_object())
        throw DecodeError("JSON parse error: response is not an object");

    const auto it = doc.find("result");
    if (it == doc.end() || !it->is_string())
        throw DecodeError("JSON parse error: missing \"result\"");
    if (it->get<std::string>() != "success")
        throw ApiError(status, body);
    return doc;
}

}  // namespace drive
