#include "files.hpp"
#include "../http/http_error.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iterator>

namespace drive {

std::string file_path(int64_t drive_id, int64_t file_id) {
    return "/3/drive/" + std::to_string(drive_id) + "/files/" + std::to_string(file_id);
}

std::string children_path(int64_t drive_id, int64_t dir_id, const std::string& cursor) {
    std::string path = file_path(drive_id, dir_id) + "/files";
    if (!cursor.empty())
        path += "?cursor=" + url_escape(cursor);
    return path;
}

Entry decode_file_reply(const std::string& body) {
    const auto doc = parse_envelope(body);
    const auto it  = doc.find("data");
    if (it == doc.end() || !it->is_object())
        throw DecodeError("JSON parse error: file reply has no \"data\" object");
    return decode_entry(*it);
}

ListPage decode_list_reply(const std::string& body) {
    const auto doc = parse_envelope(body);

    ListPage page;
    const auto data = doc.find("data");
    if (data != doc.end() && !data->is_null()) {
        if (!data->is_array())
            throw DecodeError("JSON parse error: listing \"data\" is not an array");
        page.entries.reserve(data->size());
        for (const auto& item : *data)
            page.entries.push_back(decode_entry(item));
    }

    try {
        page.has_more    = doc.value("has_more", false);
        page.response_at = doc.value("response_at", int64_t{0});
        const auto cur   = doc.find("cursor");
        if (cur != doc.end() && cur->is_string())
            page.cursor = cur->get<std::string>();
    } catch (const nlohmann::json::exception& ex) {
        throw DecodeError(std::string("JSON parse error: listing: ") + ex.what());
    }

    if (page.has_more && page.cursor.empty())
        throw DecodeError("JSON parse error: has_more without a cursor");
    return page;
}

Entry get_file(RequestTransport& transport, int64_t drive_id, int64_t file_id,
               const CancelToken& cancel) {
    const auto body = transport.execute(HttpMethod::GET, file_path(drive_id, file_id), cancel);
    return decode_file_reply(body);
}

ListPage list_page(RequestTransport& transport, int64_t drive_id, int64_t dir_id,
                   const std::string& cursor, const CancelToken& cancel) {
    const auto body = transport.execute(HttpMethod::GET,
                                        children_path(drive_id, dir_id, cursor), cancel);
    return decode_list_reply(body);
}

std::vector<Entry> list_children(RequestTransport& transport, int64_t drive_id,
                                 int64_t dir_id, const CancelToken& cancel) {
    std::vector<Entry> all;
    std::string cursor;
    int pages = 0;

    for (;;) {
        auto page = list_page(transport, drive_id, dir_id, cursor, cancel);
        ++pages;
        all.insert(all.end(),
                   std::make_move_iterator(page.entries.begin()),
                   std::make_move_iterator(page.entries.end()));
        if (!page.has_more) break;
        cursor = std::move(page.cursor);
    }

    spdlog::debug("listed directory id={} entries={} pages={}", dir_id, all.size(), pages);
    return all;
}

}  // namespace drive
