#pragma once

#include "config/config.hpp"
#include "drive/drive_types.hpp"
#include "drive/crawler.hpp"
#include "http/cancel.hpp"
#include "http/http_sender.hpp"
#include "http/request_transport.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// High-level client for one drive.
//
// Owns the request transport (and through it the rate limiter shared by all
// calls made with this client). Every call observes the cancellation token
// given at construction, typically raised by SIGINT.
class DriveClient {
public:
    // Production client: libcurl sender.
    DriveClient(const Config& cfg, CancelToken cancel);

    // Same, with an explicit sender (tests inject fakes here).
    DriveClient(const Config& cfg, CancelToken cancel, std::unique_ptr<HttpSender> sender);

    DriveClient(const DriveClient&) = delete;
    DriveClient& operator=(const DriveClient&) = delete;

    // ── Files ────────────────────────────────────────────────────────────────

    drive::Entry get_file(int64_t file_id);

    // Direct children of a directory, all pages.
    std::vector<drive::Entry> list_files(int64_t dir_id);

    // Resolve a slash-separated path from the drive root.
    drive::Entry find_by_path(const std::string& path);

    // Every descendant of dir_id, crawled concurrently with cfg.workers threads.
    std::vector<drive::Entry> list_recursive(int64_t dir_id, const std::string& dir_name,
                                             const drive::ProgressCallback& progress = nullptr);

    // ── Categories ───────────────────────────────────────────────────────────

    std::vector<drive::Category> list_categories();

    std::vector<drive::CategoryResult> add_category(int64_t category_id,
                                                    const std::vector<int64_t>& file_ids);

    std::vector<drive::CategoryResult> remove_category(int64_t category_id,
                                                       const std::vector<int64_t>& file_ids);

private:
    static TransportOptions transport_options(const Config& cfg);

    int64_t             drive_id_;
    CancelToken         cancel_;
    RequestTransport    transport_;
    drive::TreeCrawler  crawler_;
};
