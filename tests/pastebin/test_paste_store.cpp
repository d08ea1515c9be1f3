#include <gtest/gtest.h>
#include <pastebin/pastebin.hpp>
#include <pastebin/util/time_format.hpp>

#include <sys/resource.h>

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace pastebin;
namespace fs = std::filesystem;
using std::chrono::microseconds;

namespace {

const int64_t START_MICROS = 1700000000000000LL;

// Hands out a fixed list of instants, then repeats the last one
class ScriptedClock : public Clock {
public:
    explicit ScriptedClock(std::vector<int64_t> micros) : micros_(std::move(micros)) {}

    std::chrono::system_clock::time_point now() override {
        int64_t m = micros_[std::min(next_, micros_.size() - 1)];
        ++next_;
        return from_unix_micros(m);
    }

    size_t calls() const { return next_; }

private:
    std::vector<int64_t> micros_;
    size_t next_ = 0;
};

class RecordingLogger : public Logger {
public:
    RecordingLogger() { set_min_level(LogLevel::DEBUG); }

    void log(LogLevel level, const std::string& message) override {
        entries.emplace_back(level, message);
    }

    size_t count(LogLevel level) const {
        size_t n = 0;
        for (const auto& e : entries) {
            if (e.first == level) ++n;
        }
        return n;
    }

    std::vector<std::pair<LogLevel, std::string>> entries;
};

}  // namespace

class PasteStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
            (std::string("pastebin_store_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir_);

        config_.root_directory = test_dir_;
        clock_ = std::make_shared<ManualClock>(from_unix_micros(START_MICROS), microseconds(1000));
        open_store(clock_);
    }

    void TearDown() override {
        store_.reset();
        fs::remove_all(test_dir_);
    }

    void open_store(std::shared_ptr<Clock> clock, std::shared_ptr<Logger> logger = nullptr) {
        store_.reset();
        auto result = PasteStore::open(config_, std::move(clock), std::move(logger));
        ASSERT_TRUE(result.ok()) << result.error().to_string();
        store_ = std::move(result).value();
    }

    fs::path test_dir_;
    Config config_;
    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<PasteStore> store_;
};

TEST_F(PasteStoreTest, OpenCreatesDatabase) {
    EXPECT_TRUE(store_->is_open());
    EXPECT_TRUE(fs::exists(test_dir_ / "pastes.db"));
    EXPECT_EQ(store_->count(), 0u);
    EXPECT_EQ(store_->get_root_directory(), test_dir_);
}

TEST_F(PasteStoreTest, HelloWorld) {
    auto id = store_->create("hello world", "Test", "text");
    ASSERT_TRUE(id.ok()) << id.error().to_string();

    // First instant handed out is exactly 1700000000.000000
    EXPECT_EQ(id.value(), "87a86979");
    EXPECT_TRUE(is_valid_paste_id(id.value()));
    EXPECT_EQ(store_->count(), 1u);

    auto paste = store_->fetch_by_id(id.value());
    ASSERT_TRUE(paste.ok());
    EXPECT_EQ(paste.value().id, id.value());
    EXPECT_EQ(paste.value().title, "Test");
    EXPECT_EQ(paste.value().language, "text");
    EXPECT_EQ(paste.value().content, "hello world");
    EXPECT_EQ(to_unix_micros(paste.value().created_at), START_MICROS);
}

TEST_F(PasteStoreTest, ContentRoundTripsByteForByte) {
    const std::string samples[] = {
        "  leading and trailing  \n\n",
        "tabs\tand\r\nwindows lines\r\n",
        std::string("embedded\0nul", 12),
        "\xe2\x9c\x93 unicode \xf0\x9f\x98\x80",
        "x",
    };

    for (const auto& content : samples) {
        auto id = store_->create(content);
        ASSERT_TRUE(id.ok()) << id.error().to_string();

        auto back = store_->fetch_content_by_id(id.value());
        ASSERT_TRUE(back.ok());
        EXPECT_EQ(back.value(), content);
    }
    EXPECT_EQ(store_->count(), 5u);
}

TEST_F(PasteStoreTest, EmptyContentRejected) {
    for (const std::string content : {"", "   ", " \n\t\r "}) {
        auto id = store_->create(content, "title");
        ASSERT_FALSE(id.ok());
        EXPECT_EQ(id.error_code(), ErrorCode::VALIDATION_ERROR);
    }
    EXPECT_EQ(store_->count(), 0u);

    auto recent = store_->list_recent(10);
    ASSERT_TRUE(recent.ok());
    EXPECT_TRUE(recent.value().empty());
}

TEST_F(PasteStoreTest, TitleAndLanguageDefaults) {
    auto a = store_->create("body", "   ", "");
    ASSERT_TRUE(a.ok());
    auto pa = store_->fetch_by_id(a.value());
    ASSERT_TRUE(pa.ok());
    EXPECT_EQ(pa.value().title, "Untitled");
    EXPECT_EQ(pa.value().language, "text");

    auto b = store_->create("body", "  My Title \n", "python");
    ASSERT_TRUE(b.ok());
    auto pb = store_->fetch_by_id(b.value());
    ASSERT_TRUE(pb.ok());
    EXPECT_EQ(pb.value().title, "My Title");
    EXPECT_EQ(pb.value().language, "python");

    auto c = store_->create("body");
    ASSERT_TRUE(c.ok());
    auto pc = store_->fetch_by_id(c.value());
    ASSERT_TRUE(pc.ok());
    EXPECT_EQ(pc.value().title, "Untitled");
}

TEST_F(PasteStoreTest, UnknownIdsNotFound) {
    ASSERT_TRUE(store_->create("something").ok());

    for (const std::string id : {"deadbeef", "00000000", "", "xyz", "DEADBEEF", "deadbeef0"}) {
        auto paste = store_->fetch_by_id(id);
        ASSERT_FALSE(paste.ok()) << id;
        EXPECT_EQ(paste.error_code(), ErrorCode::NOT_FOUND);

        auto content = store_->fetch_content_by_id(id);
        ASSERT_FALSE(content.ok()) << id;
        EXPECT_EQ(content.error_code(), ErrorCode::NOT_FOUND);
    }
}

TEST_F(PasteStoreTest, ListRecentNewestFirst) {
    std::vector<PasteId> ids;
    for (int i = 0; i < 15; ++i) {
        auto id = store_->create("paste " + std::to_string(i), "title " + std::to_string(i));
        ASSERT_TRUE(id.ok());
        ids.push_back(id.value());
    }

    auto recent = store_->list_recent(10);
    ASSERT_TRUE(recent.ok());
    ASSERT_EQ(recent.value().size(), 10u);
    for (size_t i = 0; i < 10; ++i) {
        EXPECT_EQ(recent.value()[i].id, ids[14 - i]);
        EXPECT_EQ(recent.value()[i].title, "title " + std::to_string(14 - i));
    }
    for (size_t i = 1; i < recent.value().size(); ++i) {
        EXPECT_GT(recent.value()[i - 1].created_at, recent.value()[i].created_at);
    }

    auto all = store_->list_recent(100);
    ASSERT_TRUE(all.ok());
    EXPECT_EQ(all.value().size(), 15u);

    auto none = store_->list_recent(0);
    ASSERT_TRUE(none.ok());
    EXPECT_TRUE(none.value().empty());
}

TEST_F(PasteStoreTest, SameInstantKeepsInsertionOrder) {
    clock_->set_tick(microseconds(0));

    std::vector<PasteId> ids;
    for (int i = 0; i < 5; ++i) {
        auto id = store_->create("distinct " + std::to_string(i));
        ASSERT_TRUE(id.ok());
        ids.push_back(id.value());
    }

    auto recent = store_->list_recent(5);
    ASSERT_TRUE(recent.ok());
    ASSERT_EQ(recent.value().size(), 5u);
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(recent.value()[i].id, ids[4 - i]);
    }
}

TEST_F(PasteStoreTest, FrozenClockDuplicateConflicts) {
    clock_->set_tick(microseconds(0));

    auto first = store_->create("same", "a");
    ASSERT_TRUE(first.ok());

    auto second = store_->create("same", "b");
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.error_code(), ErrorCode::CONFLICT);
    EXPECT_FALSE(second.error().is_storage_error());

    EXPECT_EQ(store_->count(), 1u);
    auto paste = store_->fetch_by_id(first.value());
    ASSERT_TRUE(paste.ok());
    EXPECT_EQ(paste.value().title, "a");
}

TEST_F(PasteStoreTest, TickingClockGivesDistinctIds) {
    auto first = store_->create("same");
    auto second = store_->create("same");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(store_->count(), 2u);
}

TEST_F(PasteStoreTest, CollisionRereadsClock) {
    auto clock = std::make_shared<ScriptedClock>(
        std::vector<int64_t>{START_MICROS, START_MICROS, START_MICROS + 1});
    auto logger = std::make_shared<RecordingLogger>();
    open_store(clock, logger);

    auto first = store_->create("dup");
    ASSERT_TRUE(first.ok());

    auto second = store_->create("dup");
    ASSERT_TRUE(second.ok()) << second.error().to_string();
    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(clock->calls(), 3u);
    EXPECT_EQ(logger->count(LogLevel::WARNING), 1u);

    auto paste = store_->fetch_by_id(second.value());
    ASSERT_TRUE(paste.ok());
    EXPECT_EQ(to_unix_micros(paste.value().created_at), START_MICROS + 1);
}

TEST_F(PasteStoreTest, ConflictAfterConfiguredAttempts) {
    config_.max_create_attempts = 5;
    auto clock = std::make_shared<ScriptedClock>(std::vector<int64_t>{START_MICROS});
    open_store(clock);

    ASSERT_TRUE(store_->create("dup").ok());
    auto second = store_->create("dup");
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.error_code(), ErrorCode::CONFLICT);
    EXPECT_EQ(clock->calls(), 6u);
}

TEST_F(PasteStoreTest, PersistsAcrossReopen) {
    std::vector<PasteId> ids;
    for (int i = 0; i < 50; ++i) {
        auto id = store_->create("persisted " + std::to_string(i), "t" + std::to_string(i));
        ASSERT_TRUE(id.ok());
        ids.push_back(id.value());
    }

    ASSERT_TRUE(store_->close().ok());
    EXPECT_FALSE(store_->is_open());
    open_store(clock_);

    EXPECT_EQ(store_->count(), 50u);
    for (int i = 0; i < 50; ++i) {
        auto content = store_->fetch_content_by_id(ids[i]);
        ASSERT_TRUE(content.ok());
        EXPECT_EQ(content.value(), "persisted " + std::to_string(i));
    }

    auto recent = store_->list_recent(3);
    ASSERT_TRUE(recent.ok());
    ASSERT_EQ(recent.value().size(), 3u);
    EXPECT_EQ(recent.value()[0].id, ids[49]);

    // Insertion order continues after reopen
    auto next = store_->create("after reopen");
    ASSERT_TRUE(next.ok());
    auto newest = store_->list_recent(1);
    ASSERT_TRUE(newest.ok());
    EXPECT_EQ(newest.value()[0].id, next.value());
}

TEST_F(PasteStoreTest, InitializeIsIdempotent) {
    ASSERT_TRUE(store_->create("one").ok());
    auto size_before = fs::file_size(test_dir_ / "pastes.db");

    ASSERT_TRUE(store_->initialize().ok());
    ASSERT_TRUE(store_->initialize().ok());

    EXPECT_EQ(store_->count(), 1u);
    EXPECT_EQ(fs::file_size(test_dir_ / "pastes.db"), size_before);
}

TEST_F(PasteStoreTest, CorruptedHeaderReported) {
    ASSERT_TRUE(store_->create("data").ok());
    store_.reset();

    {
        std::fstream f(test_dir_ / "pastes.db", std::ios::in | std::ios::out | std::ios::binary);
        ASSERT_TRUE(f.is_open());
        f.seekp(20);
        const char junk[4] = {'\x13', '\x37', '\x13', '\x37'};
        f.write(junk, sizeof(junk));
    }

    auto result = PasteStore::open(config_, clock_);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::CORRUPTION);
    EXPECT_TRUE(result.error().is_storage_error());
}

TEST_F(PasteStoreTest, NotADatabaseFile) {
    store_.reset();
    {
        std::ofstream f(test_dir_ / "pastes.db", std::ios::binary | std::ios::trunc);
        f << "this is not a paste database";
    }

    auto result = PasteStore::open(config_, clock_);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::CORRUPTION);
}

TEST_F(PasteStoreTest, LargeContentUsesOverflow) {
    std::string big;
    for (int i = 0; big.size() < 200 * 1024; ++i) {
        big += "line " + std::to_string(i) + " of a large paste\n";
    }

    auto id = store_->create(big, "Big one");
    ASSERT_TRUE(id.ok()) << id.error().to_string();
    auto small = store_->create("small after big");
    ASSERT_TRUE(small.ok());

    auto content = store_->fetch_content_by_id(id.value());
    ASSERT_TRUE(content.ok()) << content.error().to_string();
    EXPECT_EQ(content.value(), big);

    auto recent = store_->list_recent(10);
    ASSERT_TRUE(recent.ok());
    ASSERT_EQ(recent.value().size(), 2u);
    EXPECT_EQ(recent.value()[1].id, id.value());
    EXPECT_EQ(recent.value()[1].title, "Big one");

    ASSERT_TRUE(store_->close().ok());
    open_store(clock_);
    auto reread = store_->fetch_by_id(id.value());
    ASSERT_TRUE(reread.ok());
    EXPECT_EQ(reread.value().content, big);
}

TEST_F(PasteStoreTest, ManyPastesKeepTreesValid) {
    config_.buffer_pool_size = 16;
    open_store(clock_);

    std::vector<PasteId> ids;
    for (int i = 0; i < 1500; ++i) {
        std::string content = "paste number " + std::to_string(i);
        if (i % 100 == 0) {
            content += std::string(3000, 'z');
        }
        auto id = store_->create(content, "title " + std::to_string(i));
        ASSERT_TRUE(id.ok()) << i << ": " << id.error().to_string();
        ids.push_back(id.value());
    }

    EXPECT_EQ(store_->count(), 1500u);
    auto verified = store_->verify();
    EXPECT_TRUE(verified.ok()) << verified.error().to_string();

    for (int i = 0; i < 1500; i += 97) {
        auto paste = store_->fetch_by_id(ids[i]);
        ASSERT_TRUE(paste.ok());
        EXPECT_EQ(paste.value().title, "title " + std::to_string(i));
    }

    auto recent = store_->list_recent(20);
    ASSERT_TRUE(recent.ok());
    ASSERT_EQ(recent.value().size(), 20u);
    EXPECT_EQ(recent.value().front().id, ids.back());
    EXPECT_EQ(recent.value().back().id, ids[1480]);
}

TEST_F(PasteStoreTest, FailedCreateLeavesNoTrace) {
    // Writes past the size limit fail with EFBIG instead of raising SIGXFSZ
    std::signal(SIGXFSZ, SIG_IGN);
    struct rlimit original;
    ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &original), 0);

    clock_->set_tick(microseconds(0));
    int64_t now_us = START_MICROS;
    const fs::path db = test_dir_ / "pastes.db";

    std::vector<PasteId> stored;
    int failures = 0;
    for (int i = 0; i < 300; ++i) {
        clock_->advance(microseconds(500));
        now_us += 500;
        std::string content = "entry " + std::to_string(i) + " " +
                              std::string(600, static_cast<char>('a' + i % 26));

        // The file may be rewritten but not grown, so any page allocation fails
        struct rlimit capped = original;
        capped.rlim_cur = static_cast<rlim_t>(fs::file_size(db));
        ASSERT_EQ(setrlimit(RLIMIT_FSIZE, &capped), 0);
        auto id = store_->create(content);
        ASSERT_EQ(setrlimit(RLIMIT_FSIZE, &original), 0);

        if (id.ok()) {
            stored.push_back(id.value());
        } else {
            ++failures;
            EXPECT_TRUE(id.error().is_storage_error()) << id.error().to_string();

            auto expected = IdentifierGenerator::generate(content, from_unix_micros(now_us));
            ASSERT_TRUE(expected.ok());
            EXPECT_EQ(store_->fetch_by_id(expected.value()).error_code(), ErrorCode::NOT_FOUND);
            EXPECT_EQ(store_->count(), stored.size());

            // Same content at the same instant: the id must still be free
            auto retried = store_->create(content);
            ASSERT_TRUE(retried.ok()) << i << ": " << retried.error().to_string();
            EXPECT_EQ(retried.value(), expected.value());
            stored.push_back(retried.value());
        }

        ASSERT_EQ(store_->count(), stored.size()) << i;
    }

    EXPECT_GT(failures, 0);
    auto verified = store_->verify();
    EXPECT_TRUE(verified.ok()) << verified.error().to_string();

    auto recent = store_->list_recent(stored.size() + 10);
    ASSERT_TRUE(recent.ok());
    EXPECT_EQ(recent.value().size(), stored.size());

    ASSERT_TRUE(store_->close().ok());
    open_store(clock_);

    EXPECT_EQ(store_->count(), stored.size());
    recent = store_->list_recent(stored.size() + 10);
    ASSERT_TRUE(recent.ok());
    ASSERT_EQ(recent.value().size(), stored.size());
    EXPECT_EQ(recent.value().front().id, stored.back());
    for (size_t i = 0; i < stored.size(); i += 17) {
        EXPECT_TRUE(store_->fetch_by_id(stored[i]).ok()) << stored[i];
    }
    verified = store_->verify();
    EXPECT_TRUE(verified.ok()) << verified.error().to_string();
}

TEST_F(PasteStoreTest, ConfigIsExposed) {
    config_.recent_limit = 3;
    open_store(clock_);
    EXPECT_EQ(store_->get_config().recent_limit, 3u);
    EXPECT_EQ(store_->get_config().database_file, "pastes.db");
}

TEST_F(PasteStoreTest, StatusReportsCount) {
    ASSERT_TRUE(store_->create("a").ok());
    ASSERT_TRUE(store_->create("b").ok());

    StoreStatus status = store_->status();
    EXPECT_EQ(status.status, "ok");
    EXPECT_FALSE(status.message.empty());
    EXPECT_EQ(status.total_pastes, 2u);
}

TEST_F(PasteStoreTest, ClosedStoreRejectsOperations) {
    ASSERT_TRUE(store_->close().ok());
    ASSERT_TRUE(store_->close().ok());

    EXPECT_EQ(store_->create("x").error_code(), ErrorCode::STORE_NOT_OPEN);
    EXPECT_EQ(store_->fetch_by_id("deadbeef").error_code(), ErrorCode::STORE_NOT_OPEN);
    EXPECT_EQ(store_->list_recent(5).error_code(), ErrorCode::STORE_NOT_OPEN);
    EXPECT_EQ(store_->initialize().error_code(), ErrorCode::STORE_NOT_OPEN);
    EXPECT_EQ(store_->count(), 0u);
    EXPECT_EQ(store_->status().status, "error");
}

TEST_F(PasteStoreTest, InvalidConfigRejected) {
    store_.reset();

    Config tiny = config_;
    tiny.buffer_pool_size = 2;
    auto result = PasteStore::open(tiny);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT);

    Config no_attempts = config_;
    no_attempts.max_create_attempts = 0;
    result = PasteStore::open(no_attempts);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PasteStoreTest, LogsOpenAndCreate) {
    auto logger = std::make_shared<RecordingLogger>();
    open_store(clock_, logger);

    ASSERT_TRUE(store_->create("logged").ok());
    EXPECT_GE(logger->count(LogLevel::INFO), 1u);
    EXPECT_GE(logger->count(LogLevel::DEBUG), 1u);
    EXPECT_EQ(logger->count(LogLevel::ERROR), 0u);
}
