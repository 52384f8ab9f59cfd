#pragma once

#include "drive_types.hpp"
#include "../http/cancel.hpp"
#include "../http/request_transport.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace drive {

// Maximum number of file ids the CLI sends in one mutation call.
static constexpr size_t CATEGORY_BATCH_SIZE = 50;

// Encode/decode helpers (pure, no network)
std::string categories_path(int64_t drive_id);
std::string file_categories_path(int64_t drive_id, int64_t category_id);
std::string encode_file_ids(const std::vector<int64_t>& file_ids);  // {"file_ids":[...]}
std::vector<Category>       decode_categories_reply(const std::string& body);
std::vector<CategoryResult> decode_category_results(const std::string& body);

// GET /2/drive/{drive}/categories
std::vector<Category> list_categories(RequestTransport& transport, int64_t drive_id,
                                      const CancelToken& cancel);

// POST /2/drive/{drive}/files/categories/{category}
std::vector<CategoryResult> add_category(RequestTransport& transport, int64_t drive_id,
                                         int64_t category_id,
                                         const std::vector<int64_t>& file_ids,
                                         const CancelToken& cancel);

// DELETE /2/drive/{drive}/files/categories/{category}
std::vector<CategoryResult> remove_category(RequestTransport& transport, int64_t drive_id,
                                            int64_t category_id,
                                            const std::vector<int64_t>& file_ids,
                                            const CancelToken& cancel);

}  // namespace drive
