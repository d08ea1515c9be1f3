#include <gtest/gtest.h>
#include <pastebin/storage/btree.hpp>
#include <pastebin/storage/buffer_pool.hpp>
#include <pastebin/storage/disk_manager.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <map>
#include <random>

using namespace pastebin;
namespace fs = std::filesystem;

class BPlusTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
            (std::string("pastebin_btree_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        auto dm = DiskManager::open(test_dir_ / "test.db");
        ASSERT_TRUE(dm.ok()) << dm.error().to_string();
        disk_manager_ = std::move(dm).value();
        buffer_pool_ = std::make_unique<BufferPool>(64, disk_manager_.get());

        auto root = BPlusTree::create(buffer_pool_.get());
        ASSERT_TRUE(root.ok());
        root_ = root.value();
    }

    void TearDown() override {
        buffer_pool_.reset();
        disk_manager_.reset();
        fs::remove_all(test_dir_);
    }

    static std::string key_for(int i) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "key%06d", i);
        return buf;
    }

    fs::path test_dir_;
    std::unique_ptr<DiskManager> disk_manager_;
    std::unique_ptr<BufferPool> buffer_pool_;
    PageId root_ = INVALID_PAGE_ID;
};

TEST_F(BPlusTreeTest, InsertAndFind) {
    BPlusTree tree(buffer_pool_.get(), root_);

    EXPECT_TRUE(tree.insert("key1", "value1").ok());
    EXPECT_TRUE(tree.insert("key2", "value2").ok());
    EXPECT_TRUE(tree.insert("key3", "value3").ok());

    auto v1 = tree.find("key1");
    ASSERT_TRUE(v1.ok());
    EXPECT_EQ(v1.value(), "value1");

    auto v2 = tree.find("key2");
    ASSERT_TRUE(v2.ok());
    EXPECT_EQ(v2.value(), "value2");

    auto missing = tree.find("nonexistent");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error_code(), ErrorCode::NOT_FOUND);

    auto has = tree.contains("key3");
    ASSERT_TRUE(has.ok());
    EXPECT_TRUE(has.value());
}

TEST_F(BPlusTreeTest, DuplicateKeyConflicts) {
    BPlusTree tree(buffer_pool_.get(), root_);

    ASSERT_TRUE(tree.insert("key", "value1").ok());
    auto again = tree.insert("key", "value2");
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error_code(), ErrorCode::CONFLICT);

    auto v = tree.find("key");
    ASSERT_TRUE(v.ok());
    EXPECT_EQ(v.value(), "value1");
}

TEST_F(BPlusTreeTest, RejectsOversizedEntries) {
    BPlusTree tree(buffer_pool_.get(), root_);

    EXPECT_EQ(tree.insert("", "v").error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(tree.insert(std::string(MAX_KEY_SIZE + 1, 'k'), "v").error_code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(tree.insert("k", std::string(MAX_INLINE_VALUE_SIZE + 1, 'v')).error_code(),
              ErrorCode::INVALID_ARGUMENT);

    EXPECT_TRUE(tree.insert(std::string(MAX_KEY_SIZE, 'k'),
                            std::string(MAX_INLINE_VALUE_SIZE, 'v')).ok());
}

TEST_F(BPlusTreeTest, ManyInsertsSplitAndStayOrdered) {
    BPlusTree tree(buffer_pool_.get(), root_);

    std::vector<int> order(2000);
    for (int i = 0; i < 2000; ++i) order[i] = i;
    std::mt19937 rng(42);
    std::shuffle(order.begin(), order.end(), rng);

    for (int i : order) {
        ASSERT_TRUE(tree.insert(key_for(i), "value" + std::to_string(i)).ok()) << i;
    }

    EXPECT_NE(tree.get_root_page_id(), root_);
    auto height = tree.height();
    ASSERT_TRUE(height.ok());
    EXPECT_GE(height.value(), 2u);

    auto verified = tree.verify();
    EXPECT_TRUE(verified.ok()) << verified.error().to_string();

    for (int i = 0; i < 2000; ++i) {
        auto v = tree.find(key_for(i));
        ASSERT_TRUE(v.ok()) << i;
        EXPECT_EQ(v.value(), "value" + std::to_string(i));
    }

    std::vector<std::string> keys;
    ASSERT_TRUE(tree.for_each([&](const std::string& k, const std::string&) {
        keys.push_back(k);
        return true;
    }).ok());
    ASSERT_EQ(keys.size(), 2000u);
    EXPECT_TRUE(std::is_sorted(keys.begin(), keys.end()));
}

TEST_F(BPlusTreeTest, LargeValuesSplitBySize) {
    BPlusTree tree(buffer_pool_.get(), root_);

    // Mix of tiny and maximum-size values forces uneven splits
    for (int i = 0; i < 300; ++i) {
        size_t len = (i % 3 == 0) ? MAX_INLINE_VALUE_SIZE : 5;
        ASSERT_TRUE(tree.insert(key_for(i), std::string(len, 'a' + i % 26)).ok()) << i;
    }

    auto verified = tree.verify();
    EXPECT_TRUE(verified.ok()) << verified.error().to_string();

    for (int i = 0; i < 300; ++i) {
        auto v = tree.find(key_for(i));
        ASSERT_TRUE(v.ok());
        EXPECT_EQ(v.value().size(), (i % 3 == 0) ? MAX_INLINE_VALUE_SIZE : 5u);
    }
}

TEST_F(BPlusTreeTest, ScanFromKeyWithLimit) {
    BPlusTree tree(buffer_pool_.get(), root_);

    for (int i = 0; i < 500; ++i) {
        ASSERT_TRUE(tree.insert(key_for(i), std::to_string(i)).ok());
    }

    auto page = tree.scan(key_for(250), 10);
    ASSERT_TRUE(page.ok());
    ASSERT_EQ(page.value().size(), 10u);
    for (size_t i = 0; i < 10; ++i) {
        EXPECT_EQ(page.value()[i].first, key_for(250 + static_cast<int>(i)));
    }

    // Start key between entries
    auto between = tree.scan("key000249x", 1);
    ASSERT_TRUE(between.ok());
    ASSERT_EQ(between.value().size(), 1u);
    EXPECT_EQ(between.value()[0].first, key_for(250));

    auto tail = tree.scan(key_for(495), 100);
    ASSERT_TRUE(tail.ok());
    EXPECT_EQ(tail.value().size(), 5u);

    auto none = tree.scan("", 0);
    ASSERT_TRUE(none.ok());
    EXPECT_TRUE(none.value().empty());
}

TEST_F(BPlusTreeTest, ForEachStopsEarly) {
    BPlusTree tree(buffer_pool_.get(), root_);
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(tree.insert(key_for(i), "v").ok());
    }

    int visited = 0;
    ASSERT_TRUE(tree.for_each([&](const std::string&, const std::string&) {
        return ++visited < 7;
    }).ok());
    EXPECT_EQ(visited, 7);
}

TEST_F(BPlusTreeTest, PersistsAcrossReopen) {
    PageId root;
    {
        BPlusTree tree(buffer_pool_.get(), root_);
        for (int i = 0; i < 1000; ++i) {
            ASSERT_TRUE(tree.insert(key_for(i), "value" + std::to_string(i)).ok());
        }
        root = tree.get_root_page_id();
        ASSERT_TRUE(buffer_pool_->flush_all_pages().ok());

        StoreHeader header = disk_manager_->header();
        header.primary_root = root;
        header.recent_root = root;
        ASSERT_TRUE(disk_manager_->write_header(header).ok());
    }

    buffer_pool_.reset();
    disk_manager_.reset();

    auto dm = DiskManager::open(test_dir_ / "test.db");
    ASSERT_TRUE(dm.ok()) << dm.error().to_string();
    disk_manager_ = std::move(dm).value();
    buffer_pool_ = std::make_unique<BufferPool>(16, disk_manager_.get());

    EXPECT_EQ(disk_manager_->header().primary_root, root);

    BPlusTree tree(buffer_pool_.get(), root);
    for (int i = 0; i < 1000; i += 37) {
        auto v = tree.find(key_for(i));
        ASSERT_TRUE(v.ok()) << i;
        EXPECT_EQ(v.value(), "value" + std::to_string(i));
    }
    EXPECT_TRUE(tree.verify().ok());
}

TEST_F(BPlusTreeTest, NoPagesLeftPinned) {
    BPlusTree tree(buffer_pool_.get(), root_);
    for (int i = 0; i < 800; ++i) {
        ASSERT_TRUE(tree.insert(key_for(i), std::string(40, 'x')).ok());
    }
    ASSERT_TRUE(tree.find(key_for(10)).ok());
    ASSERT_TRUE(tree.scan("", 100).ok());

    EXPECT_EQ(buffer_pool_->get_free_frame_count(), buffer_pool_->get_pool_size());
}
