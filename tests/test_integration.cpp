// Integration tests for drivescan against a live drive API.
//
// Requires:
//   - DRIVESCAN_API_TOKEN and DRIVESCAN_DRIVE_ID set to a token with read
//     access to a drive (tests are skipped otherwise).
//   - Optionally DRIVESCAN_BASE_URL to target another API host.
//
// Nothing is modified on the drive.

#include "config/config.hpp"
#include "http/http_error.hpp"
#include "drive_client.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <set>
#include <string>
#include <vector>

class DriveIntegration : public ::testing::Test {
protected:
    void SetUp() override {
        if (!std::getenv("DRIVESCAN_API_TOKEN") || !std::getenv("DRIVESCAN_DRIVE_ID"))
            GTEST_SKIP() << "DRIVESCAN_API_TOKEN / DRIVESCAN_DRIVE_ID not set";

        Config cfg;
        apply_env(cfg, [](const char* name) { return std::getenv(name); });
        cfg.validate();
        client_ = std::make_unique<DriveClient>(cfg, CancelToken());
    }

    std::unique_ptr<DriveClient> client_;
};

TEST_F(DriveIntegration, GetRoot) {
    const auto root = client_->get_file(drive::ROOT_ID);
    EXPECT_EQ(root.id, drive::ROOT_ID);
    EXPECT_TRUE(root.is_dir());
}

TEST_F(DriveIntegration, ListRootChildren) {
    for (const auto& e : client_->list_files(drive::ROOT_ID))
        EXPECT_EQ(e.parent_id, drive::ROOT_ID) << e.name;
}

TEST_F(DriveIntegration, RootPathResolvesToRoot) {
    EXPECT_EQ(client_->find_by_path("/").id, drive::ROOT_ID);
}

TEST_F(DriveIntegration, CrawlFirstSubdirectoryMatchesSequentialListing) {
    const auto children = client_->list_files(drive::ROOT_ID);
    const drive::Entry* sub = nullptr;
    for (const auto& e : children) {
        if (e.is_dir()) {
            sub = &e;
            break;
        }
    }
    if (!sub) GTEST_SKIP() << "drive root has no subdirectory";

    std::set<int64_t> expected;
    std::vector<int64_t> stack{sub->id};
    while (!stack.empty()) {
        const int64_t dir = stack.back();
        stack.pop_back();
        for (const auto& e : client_->list_files(dir)) {
            expected.insert(e.id);
            if (e.is_dir()) stack.push_back(e.id);
        }
    }

    std::set<int64_t> crawled;
    for (const auto& e : client_->list_recursive(sub->id, sub->name)) crawled.insert(e.id);
    EXPECT_EQ(crawled, expected);
}

TEST_F(DriveIntegration, ListCategories) {
    for (const auto& c : client_->list_categories())
        EXPECT_FALSE(c.name.empty());
}

TEST_F(DriveIntegration, MissingFileIsApiError) {
    EXPECT_THROW(client_->get_file(int64_t{1} << 50), ApiError);
}
