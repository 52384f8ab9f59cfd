#include "drive/bounded_queue.hpp"
#include "drive/crawler.hpp"
#include "drive_client.hpp"
#include "fake_sender.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace drive;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

// ── In-memory tree ───────────────────────────────────────────────────────────

namespace {

Entry make_entry(int64_t id, int64_t parent, bool dir, const std::string& name,
                 int64_t size = 0) {
    Entry e;
    e.id        = id;
    e.parent_id = parent;
    e.kind      = dir ? EntryKind::Dir : EntryKind::File;
    e.type      = dir ? "dir" : "file";
    e.name      = name;
    e.size      = size;
    return e;
}

// Directory id -> direct children. Read-only once built, so safe to share.
using Tree = std::map<int64_t, std::vector<Entry>>;

// Uniform tree of `depth` levels below the root, `fanout` subdirectories and
// `files` files per directory.
Tree build_tree(int depth, int fanout, int files) {
    Tree tree;
    int64_t next_id = 2;
    std::vector<int64_t> level{ROOT_ID};
    tree[ROOT_ID];
    for (int d = 0; d < depth; ++d) {
        std::vector<int64_t> next;
        for (int64_t parent : level) {
            auto& kids = tree[parent];
            for (int f = 0; f < files; ++f, ++next_id)
                kids.push_back(make_entry(next_id, parent, false,
                                          "f" + std::to_string(next_id), next_id));
            for (int s = 0; s < fanout; ++s, ++next_id) {
                kids.push_back(make_entry(next_id, parent, true, "d" + std::to_string(next_id)));
                tree[next_id];
                next.push_back(next_id);
            }
        }
        level = std::move(next);
    }
    return tree;
}

ListChildrenFn tree_lister(const Tree& tree) {
    return [&tree](int64_t dir, const CancelToken&) { return tree.at(dir); };
}

std::set<int64_t> sequential_ids(const Tree& tree, int64_t root) {
    std::set<int64_t> out;
    std::vector<int64_t> stack{root};
    while (!stack.empty()) {
        const int64_t dir = stack.back();
        stack.pop_back();
        for (const auto& e : tree.at(dir)) {
            out.insert(e.id);
            if (e.is_dir()) stack.push_back(e.id);
        }
    }
    return out;
}

std::set<int64_t> ids_of(const std::vector<Entry>& entries) {
    std::set<int64_t> out;
    for (const auto& e : entries) out.insert(e.id);
    return out;
}

}  // anonymous namespace

// ── BoundedQueue ─────────────────────────────────────────────────────────────

TEST(BoundedQueue, FifoWithinCapacity) {
    BoundedQueue<int> q(2);
    int a = 1, b = 2, c = 3;
    EXPECT_TRUE(q.try_push(a));
    EXPECT_TRUE(q.try_push(b));
    EXPECT_FALSE(q.try_push(c));
    EXPECT_EQ(c, 3);
    EXPECT_EQ(q.pop(), 1);
    EXPECT_EQ(q.try_pop(), 2);
    EXPECT_FALSE(q.try_pop());
}

TEST(BoundedQueue, CloseWakesBlockedPop) {
    BoundedQueue<int> q(1);
    std::thread closer([&q] {
        std::this_thread::sleep_for(50ms);
        q.close();
    });
    EXPECT_FALSE(q.pop());
    EXPECT_FALSE(q.push(5));
    closer.join();
}

TEST(BoundedQueue, PopDrainsAfterClose) {
    BoundedQueue<int> q(4);
    q.push(1);
    q.push(2);
    q.close();
    EXPECT_EQ(q.pop(), 1);
    EXPECT_EQ(q.pop(), 2);
    EXPECT_FALSE(q.pop());
}

// ── Crawl results ────────────────────────────────────────────────────────────

TEST(TreeCrawler, ConcreteTree) {
    Tree tree;
    tree[ROOT_ID] = {make_entry(10, ROOT_ID, true, "A"), make_entry(11, ROOT_ID, false, "B", 500)};
    tree[10]      = {make_entry(12, 10, false, "C", 1500)};

    for (size_t workers : {1u, 5u, 10u}) {
        TreeCrawler crawler(tree_lister(tree), CrawlOptions{workers, 100});
        CancelToken cancel;
        const auto entries = crawler.crawl(ROOT_ID, "/", cancel);

        ASSERT_EQ(entries.size(), 3u) << workers << " workers";
        std::map<int64_t, Entry> by_id;
        int64_t total = 0;
        for (const auto& e : entries) {
            by_id[e.id] = e;
            total += e.size;
        }
        EXPECT_TRUE(by_id.at(10).is_dir());
        EXPECT_EQ(by_id.at(11).size, 500);
        EXPECT_EQ(by_id.at(12).size, 1500);
        EXPECT_EQ(total, 2000);
    }
}

TEST(TreeCrawler, MatchesSequentialListingForAnyPoolSize) {
    const Tree tree = build_tree(4, 3, 2);  // 120 dirs, 80 files
    const auto expected = sequential_ids(tree, ROOT_ID);

    for (size_t workers : {1u, 5u, 10u}) {
        TreeCrawler crawler(tree_lister(tree), CrawlOptions{workers, 100});
        CancelToken cancel;
        const auto entries = crawler.crawl(ROOT_ID, "/", cancel);
        EXPECT_EQ(entries.size(), expected.size()) << workers << " workers";
        EXPECT_EQ(ids_of(entries), expected) << workers << " workers";
        EXPECT_EQ(ids_of(entries).count(ROOT_ID), 0u);
    }
}

TEST(TreeCrawler, IdempotentAcrossCalls) {
    const Tree tree = build_tree(3, 4, 3);
    TreeCrawler crawler(tree_lister(tree), CrawlOptions{5, 100});
    CancelToken cancel;
    EXPECT_EQ(ids_of(crawler.crawl(ROOT_ID, "/", cancel)),
              ids_of(crawler.crawl(ROOT_ID, "/", cancel)));
}

TEST(TreeCrawler, EmptyRoot) {
    Tree tree;
    tree[ROOT_ID];
    TreeCrawler crawler(tree_lister(tree));
    CancelToken cancel;
    EXPECT_TRUE(crawler.crawl(ROOT_ID, "/", cancel).empty());
}

TEST(TreeCrawler, WideTreeWithTinyQueuesDoesNotDeadlock) {
    const Tree tree = build_tree(2, 60, 1);  // 3660 dirs discovered in bursts of 60
    TreeCrawler crawler(tree_lister(tree), CrawlOptions{3, 2});
    CancelToken cancel;
    EXPECT_EQ(ids_of(crawler.crawl(ROOT_ID, "/", cancel)), sequential_ids(tree, ROOT_ID));
}

TEST(TreeCrawler, DeepChain) {
    Tree tree;
    int64_t parent = ROOT_ID;
    for (int64_t id = 2; id < 300; ++id) {
        tree[parent] = {make_entry(id, parent, true, "d")};
        parent = id;
    }
    tree[parent];
    TreeCrawler crawler(tree_lister(tree), CrawlOptions{4, 8});
    CancelToken cancel;
    EXPECT_EQ(crawler.crawl(ROOT_ID, "/", cancel).size(), 298u);
}

TEST(TreeCrawler, ProgressReportsEveryDirectory) {
    const Tree tree = build_tree(2, 3, 2);  // 13 directories listed
    TreeCrawler crawler(tree_lister(tree), CrawlOptions{4, 100});
    CancelToken cancel;

    std::vector<std::pair<std::string, size_t>> calls;
    const auto entries = crawler.crawl(ROOT_ID, "/", cancel,
                                       [&calls](const std::string& name, size_t n) {
                                           calls.emplace_back(name, n);
                                       });

    ASSERT_EQ(calls.size(), 13u);
    for (size_t i = 1; i < calls.size(); ++i)
        EXPECT_GE(calls[i].second, calls[i - 1].second);
    EXPECT_EQ(calls.back().second, entries.size());
}

TEST(TreeCrawler, RejectsZeroWorkers) {
    Tree tree;
    EXPECT_THROW(TreeCrawler(tree_lister(tree), CrawlOptions{0, 10}), std::invalid_argument);
}

// ── Failure and cancellation ─────────────────────────────────────────────────

TEST(TreeCrawler, FirstErrorAbortsWholeCrawl) {
    Tree tree;
    for (int64_t i = 0; i < 9; ++i) {
        const int64_t id = 100 + i;
        tree[ROOT_ID].push_back(make_entry(id, ROOT_ID, true, "sub" + std::to_string(i + 1)));
        tree[id] = {make_entry(200 + i, id, false, "file", 10)};
    }
    const int64_t seventh = 106;

    for (size_t workers : {1u, 5u, 10u}) {
        TreeCrawler crawler(
            [&tree, seventh](int64_t dir, const CancelToken&) -> std::vector<Entry> {
                if (dir == seventh) throw ApiError(500, "listing failed");
                return tree.at(dir);
            },
            CrawlOptions{workers, 100});
        CancelToken cancel;
        try {
            crawler.crawl(ROOT_ID, "/", cancel);
            FAIL() << "expected ApiError with " << workers << " workers";
        } catch (const ApiError& e) {
            EXPECT_EQ(e.status, 500);
            EXPECT_EQ(e.body, "listing failed");
        }
    }
}

TEST(TreeCrawler, ErrorStopsDispatchingNewJobs) {
    const Tree tree = build_tree(3, 5, 0);  // 155 directories
    std::atomic<int> listed{0};
    TreeCrawler crawler(
        [&tree, &listed](int64_t dir, const CancelToken&) -> std::vector<Entry> {
            ++listed;
            if (dir == ROOT_ID) return tree.at(dir);
            throw DecodeError("bad page");
        },
        CrawlOptions{2, 100});
    CancelToken cancel;
    EXPECT_THROW(crawler.crawl(ROOT_ID, "/", cancel), DecodeError);
    // Root plus at most the five first-level jobs already queued.
    EXPECT_LE(listed.load(), 6);
}

TEST(TreeCrawler, CancelMidCrawl) {
    const Tree tree = build_tree(3, 4, 1);
    const size_t workers = 2;
    std::atomic<int> listed{0};
    std::atomic<int> after_cancel{0};
    TreeCrawler crawler(
        [&tree, &listed, &after_cancel](int64_t dir, const CancelToken& c) -> std::vector<Entry> {
            ++listed;
            if (c.cancelled()) ++after_cancel;
            if (!c.sleep_for(20ms)) throw Cancelled();
            return tree.at(dir);
        },
        CrawlOptions{workers, 100});

    CancelToken cancel;
    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(50ms);
        cancel.cancel();
    });

    const auto start = Clock::now();
    EXPECT_THROW(crawler.crawl(ROOT_ID, "/", cancel), Cancelled);
    EXPECT_LT(Clock::now() - start, 2s);
    canceller.join();

    // A worker may pass its cancel check just before the token fires, so each
    // worker can start at most one listing late. Nothing starts once crawl()
    // has returned.
    EXPECT_LE(after_cancel.load(), static_cast<int>(workers));
    const int at_return = listed.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(listed.load(), at_return);
}

TEST(TreeCrawler, CancelTakesPrecedenceOverError) {
    Tree tree;
    tree[ROOT_ID] = {make_entry(2, ROOT_ID, true, "a")};
    tree[2];
    CancelToken cancel;
    TreeCrawler crawler(
        [&cancel](int64_t dir, const CancelToken&) -> std::vector<Entry> {
            if (dir == 2) {
                cancel.cancel();
                throw ApiError(500, "x");
            }
            return {make_entry(2, ROOT_ID, true, "a")};
        },
        CrawlOptions{1, 10});
    EXPECT_THROW(crawler.crawl(ROOT_ID, "/", cancel), Cancelled);
}

TEST(TreeCrawler, AlreadyCancelledListsNothing) {
    std::atomic<int> listed{0};
    TreeCrawler crawler([&listed](int64_t, const CancelToken&) {
        ++listed;
        return std::vector<Entry>{};
    });
    CancelToken cancel;
    cancel.cancel();
    EXPECT_THROW(crawler.crawl(ROOT_ID, "/", cancel), Cancelled);
    EXPECT_EQ(listed.load(), 0);
}

// ── Through DriveClient and the HTTP layer ───────────────────────────────────

class CrawlClient : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<FakeDriveState>();
        cfg_.api_token    = "test-token";
        cfg_.drive_id     = FAKE_DRIVE_ID;
        cfg_.base_url     = FAKE_BASE_URL;
        cfg_.rate_per_sec = 100000.0;
        cfg_.burst        = 100000;
    }

    std::unique_ptr<DriveClient> client() {
        return std::make_unique<DriveClient>(cfg_, cancel_, std::make_unique<FakeDrive>(state_));
    }

    std::shared_ptr<FakeDriveState> state_;
    Config                          cfg_;
    CancelToken                     cancel_;
};

TEST_F(CrawlClient, ListRecursiveAcrossPages) {
    state_->page_size = 3;
    const auto a = state_->add_dir(ROOT_ID, "A", 10);
    state_->add_file(ROOT_ID, "B", 500, 11);
    state_->add_file(a, "C", 1500, 12);
    for (int i = 0; i < 7; ++i) state_->add_file(a, "x" + std::to_string(i), 1);

    const auto entries = client()->list_recursive(ROOT_ID, "/");
    EXPECT_EQ(entries.size(), 10u);
    int64_t total = 0;
    for (const auto& e : entries) total += e.size;
    EXPECT_EQ(total, 2007);
}

TEST_F(CrawlClient, ConcurrencyBoundedByWorkers) {
    state_->list_delay = 5ms;
    for (int i = 0; i < 30; ++i) {
        const auto d = state_->add_dir(ROOT_ID, "d" + std::to_string(i));
        state_->add_file(d, "f", 1);
    }
    cfg_.workers = 3;

    EXPECT_EQ(client()->list_recursive(ROOT_ID, "/").size(), 60u);
    EXPECT_LE(state_->max_in_flight.load(), 3);
    EXPECT_EQ(state_->listings.load(), 31);
}

TEST_F(CrawlClient, ServerErrorFailsCrawl) {
    for (int i = 0; i < 9; ++i) state_->add_dir(ROOT_ID, "sub" + std::to_string(i + 1));
    state_->failing_dirs.insert(state_->nodes.at(ROOT_ID).children[6]);

    try {
        client()->list_recursive(ROOT_ID, "/");
        FAIL() << "expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.status, 500);
    }
}

TEST_F(CrawlClient, CancelStopsDispatch) {
    state_->list_delay = 30ms;
    for (int i = 0; i < 40; ++i) {
        const auto d = state_->add_dir(ROOT_ID, "d" + std::to_string(i));
        state_->add_dir(d, "inner");
    }
    auto c = client();
    std::thread canceller([this]() {
        std::this_thread::sleep_for(60ms);
        cancel_.cancel();
    });

    const auto start = Clock::now();
    EXPECT_THROW(c->list_recursive(ROOT_ID, "/"), Cancelled);
    EXPECT_LT(Clock::now() - start, 2s);
    canceller.join();

    // At most one late request per worker; none once the crawl has returned.
    EXPECT_LE(state_->listings_after_cancel.load(), static_cast<int>(cfg_.workers));
    const int at_return = state_->listings.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(state_->listings.load(), at_return);
    EXPECT_LT(at_return, 81);
}
