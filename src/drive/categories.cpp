#include "categories.hpp"
#include "../http/http_error.hpp"

#include <nlohmann/json.hpp>

namespace drive {

namespace {

const nlohmann::json& data_array(const nlohmann::json& doc) {
    const auto it = doc.find("data");
    if (it == doc.end() || !it->is_array())
        throw DecodeError("JSON parse error: \"data\" is not an array");
    return *it;
}

std::vector<CategoryResult> modify_category(RequestTransport& transport, HttpMethod method,
                                            int64_t drive_id, int64_t category_id,
                                            const std::vector<int64_t>& file_ids,
                                            const CancelToken& cancel) {
    const auto body  = encode_file_ids(file_ids);
    const auto reply = transport.execute(method, file_categories_path(drive_id, category_id),
                                         &body, cancel);
    return decode_category_results(reply);
}

}  // anonymous namespace

std::string categories_path(int64_t drive_id) {
    return "/2/drive/" + std::to_string(drive_id) + "/categories";
}

std::string file_categories_path(int64_t drive_id, int64_t category_id) {
    return "/2/drive/" + std::to_string(drive_id) + "/files/categories/" +
           std::to_string(category_id);
}

std::string encode_file_ids(const std::vector<int64_t>& file_ids) {
    nlohmann::json j;
    j["file_ids"] = file_ids;
    return j.dump();
}

std::vector<Category> decode_categories_reply(const std::string& body) {
    const auto doc = parse_envelope(body);
    std::vector<Category> out;
    for (const auto& item : data_array(doc))
        out.push_back(decode_category(item));
    return out;
}

std::vector<CategoryResult> decode_category_results(const std::string& body) {
    const auto doc = parse_envelope(body);
    std::vector<CategoryResult> out;
    try {
        for (const auto& item : data_array(doc)) {
            CategoryResult r;
            r.id     = item.at("id").get<int64_t>();
            r.result = item.at("result").get<bool>();
            out.push_back(r);
        }
    } catch (const nlohmann::json::exception& ex) {
        throw DecodeError(std::string("JSON parse error: category result: ") + ex.what());
    }
    return out;
}

std::vector<Category> list_categories(RequestTransport& transport, int64_t drive_id,
                                      const CancelToken& cancel) {
    const auto body = transport.execute(HttpMethod::GET, categories_path(drive_id), cancel);
    return decode_categories_reply(body);
}

std::vector<CategoryResult> add_category(RequestTransport& transport, int64_t drive_id,
                                         int64_t category_id,
                                         const std::vector<int64_t>& file_ids,
                                         const CancelToken& cancel) {
    return modify_category(transport, HttpMethod::POST, drive_id, category_id, file_ids, cancel);
}

std::vector<CategoryResult> remove_category(RequestTransport& transport, int64_t drive_id,
                                            int64_t category_id,
                                            const std::vector<int64_t>& file_ids,
                                            const CancelToken& cancel) {
    return modify_category(transport, HttpMethod::DELETE, drive_id, category_id, file_ids, cancel);
}

}  // namespace drive
