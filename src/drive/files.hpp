#pragma once

#include "drive_types.hpp"
#include "../http/cancel.hpp"
#include "../http/request_transport.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace drive {

// Request paths and decode helpers (pure, no network)
std::string file_path(int64_t drive_id, int64_t file_id);
std::string children_path(int64_t drive_id, int64_t dir_id, const std::string& cursor = "");
Entry    decode_file_reply(const std::string& body);
ListPage decode_list_reply(const std::string& body);

// GET /3/drive/{drive}/files/{id}: fetch a single entry.
Entry get_file(RequestTransport& transport, int64_t drive_id, int64_t file_id,
               const CancelToken& cancel);

// GET /3/drive/{drive}/files/{id}/files: one page of direct children.
// Pass an empty cursor for the first page; subsequent calls use the cursor
// of the previous ListPage.
ListPage list_page(RequestTransport& transport, int64_t drive_id, int64_t dir_id,
                   const std::string& cursor, const CancelToken& cancel);

// Convenience: follow cursors until has_more is false and return every
// child in server order. Any page failure propagates and the pages already
// fetched are dropped.
std::vector<Entry> list_children(RequestTransport& transport, int64_t drive_id,
                                 int64_t dir_id, const CancelToken& cancel);

}  // namespace drive
