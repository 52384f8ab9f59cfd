#include "drive_client.hpp"
#include "drive/categories.hpp"
#include "drive/files.hpp"
#include "drive/resolve.hpp"

TransportOptions DriveClient::transport_options(const Config& cfg) {
    TransportOptions opts;
    opts.base_url     = cfg.base_url;
    opts.token        = cfg.api_token;
    opts.timeout      = cfg.request_timeout;
    opts.rate_per_sec = cfg.rate_per_sec;
    opts.burst        = cfg.burst;
    return opts;
}

DriveClient::DriveClient(const Config& cfg, CancelToken cancel)
    : DriveClient(cfg, std::move(cancel), std::make_unique<CurlSender>()) {}

DriveClient::DriveClient(const Config& cfg, CancelToken cancel,
                         std::unique_ptr<HttpSender> sender)
    : drive_id_(cfg.drive_id),
      cancel_(std::move(cancel)),
      transport_(transport_options(cfg), std::move(sender)),
      crawler_([this](int64_t dir_id, const CancelToken& c) {
                   return drive::list_children(transport_, drive_id_, dir_id, c);
               },
               drive::CrawlOptions{cfg.workers, 100}) {}

drive::Entry DriveClient::get_file(int64_t file_id) {
    return drive::get_file(transport_, drive_id_, file_id, cancel_);
}

std::vector<drive::Entry> DriveClient::list_files(int64_t dir_id) {
    return drive::list_children(transport_, drive_id_, dir_id, cancel_);
}

drive::Entry DriveClient::find_by_path(const std::string& path) {
    return drive::find_by_path(transport_, drive_id_, path, cancel_);
}

std::vector<drive::Entry> DriveClient::list_recursive(int64_t dir_id,
                                                      const std::string& dir_name,
                                                      const drive::ProgressCallback& progress) {
    return crawler_.crawl(dir_id, dir_name, cancel_, progress);
}

std::vector<drive::Category> DriveClient::list_categories() {
    return drive::list_categories(transport_, drive_id_, cancel_);
}

std::vector<drive::CategoryResult> DriveClient::add_category(int64_t category_id,
                                                             const std::vector<int64_t>& file_ids) {
    return drive::add_category(transport_, drive_id_, category_id, file_ids, cancel_);
}

std::vector<drive::CategoryResult> DriveClient::remove_category(int64_t category_id,
                                                                const std::vector<int64_t>& file_ids) {
    return drive::remove_category(transport_, drive_id_, category_id, file_ids, cancel_);
}
