// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "tasklog/task_log.hpp"
#include "tasklog/date_format.hpp"

#include "../src/file_lock.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

namespace tasklog {
namespace {

constexpr std::chrono::year_month_day kToday{std::chrono::year{2026}, std::chrono::month{10}, std::chrono::day{19}};

class TaskLogTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    Paths paths_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("tasklog_test_") + info->name());
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        paths_ = Paths{test_dir_ / "home"};
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    static std::string read(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static void write(const std::filesystem::path& path, std::string_view content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    // Initialized base directory whose log holds `content`
    TaskLog make_log(std::string_view content, Config config = {}) {
        EXPECT_TRUE(TaskLog::init(paths_).has_value());
        config.log_path = (paths_.base_dir / "log.md").string();
        write(config.log_path, content);

        TaskLog log(paths_, config);
        log.set_today_provider([] { return kToday; });
        return log;
    }
};

// ============================================================================
// init / open
// ============================================================================

TEST_F(TaskLogTest, InitCreatesFiles) {
    ASSERT_TRUE(TaskLog::init(paths_).has_value());

    EXPECT_TRUE(std::filesystem::exists(paths_.config_file()));
    EXPECT_EQ(read(paths_.state_file()), "{}\n");

    auto log_file = paths_.base_dir / "log.md";
    ASSERT_TRUE(std::filesystem::exists(log_file));
    EXPECT_EQ(read(log_file), "### " + DateFormat().format(local_today()) + "\n");
}

TEST_F(TaskLogTest, InitKeepsExistingFiles) {
    ASSERT_TRUE(TaskLog::init(paths_).has_value());
    write(paths_.base_dir / "log.md", "hand written\n");
    write(paths_.state_file(), R"({"dev": 9})");

    ASSERT_TRUE(TaskLog::init(paths_).has_value());
    EXPECT_EQ(read(paths_.base_dir / "log.md"), "hand written\n");
    EXPECT_EQ(read(paths_.state_file()), R"({"dev": 9})");
}

TEST_F(TaskLogTest, InitStoresLogPath) {
    auto custom = (test_dir_ / "elsewhere" / "tasks.md").string();
    ASSERT_TRUE(TaskLog::init(paths_, custom).has_value());

    auto log = TaskLog::open(paths_);
    ASSERT_TRUE(log.has_value());
    EXPECT_EQ(log->config().log_path, custom);
    EXPECT_EQ(log->log_file(), std::filesystem::path(custom));
    EXPECT_TRUE(std::filesystem::exists(custom));
}

TEST_F(TaskLogTest, InitRejectsNonUtf8LogPath) {
    auto result = TaskLog::init(paths_, (test_dir_ / "caf\xe9.md").string());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
    EXPECT_FALSE(std::filesystem::exists(paths_.config_file()));
}

TEST_F(TaskLogTest, InitUsesConfiguredLockTimeout) {
    ASSERT_TRUE(TaskLog::init(paths_).has_value());
    auto log = TaskLog::open(paths_);
    ASSERT_TRUE(log.has_value());
    auto changed = log->config();
    changed.lock_timeout = std::chrono::milliseconds{50};
    write(paths_.config_file(), dump_config(changed));

    auto held = FileLock::acquire(paths_.lock_file(), std::chrono::milliseconds{1000});
    ASSERT_TRUE(held.has_value());

    auto start = std::chrono::steady_clock::now();
    auto result = TaskLog::init(paths_);
    auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::LockTimeout);
    EXPECT_LT(waited, kDefaultLockTimeout);
}

TEST_F(TaskLogTest, OpenWithoutInit) {
    auto log = TaskLog::open(paths_);
    ASSERT_FALSE(log.has_value());
    EXPECT_EQ(log.error().code, ErrorCode::NotInitialized);
}

TEST_F(TaskLogTest, OpenInvalidConfig) {
    std::filesystem::create_directories(paths_.base_dir);
    write(paths_.config_file(), R"({"note_indent": 0, "date_format": "DD"})");

    auto log = TaskLog::open(paths_);
    ASSERT_FALSE(log.has_value());
    EXPECT_EQ(log.error().code, ErrorCode::ConfigInvalid);
}

TEST_F(TaskLogTest, RelativeLogPathIsUnderBaseDir) {
    auto config = ConfigBuilder().log_path("notes/log.md").build_unchecked();
    TaskLog log(paths_, config);
    EXPECT_EQ(log.log_file(), paths_.base_dir / "notes" / "log.md");
}

// ============================================================================
// Mutations
// ============================================================================

TEST_F(TaskLogTest, CreateTaskInEmptyLog) {
    auto log = make_log("");

    auto id = log.create_task("dev", "implement login flow");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->to_string(), "dev-1");
    EXPECT_EQ(read(log.log_file()), "### 19/10/2026\n- [ ] dev-1 implement login flow\n");

    auto state = read(paths_.state_file());
    EXPECT_NE(state.find("\"dev\": 1"), std::string::npos) << state;
}

TEST_F(TaskLogTest, CountersPersistAcrossInstances) {
    {
        auto log = make_log("");
        ASSERT_TRUE(log.create_task("dev", "one").has_value());
        ASSERT_TRUE(log.create_task("dev", "two").has_value());
    }

    auto reopened = TaskLog::open(paths_);
    ASSERT_TRUE(reopened.has_value());
    reopened->set_today_provider([] { return kToday; });
    auto id = reopened->create_task("dev", "three");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->number, 3u);
}

TEST_F(TaskLogTest, AddNoteAndComplete) {
    auto log = make_log("### 19/10/2026\n- [ ] infra-1 rotate production credentials\n");

    ASSERT_TRUE(log.add_note("infra-1", "blocked on access request").has_value());
    ASSERT_TRUE(log.complete_task("infra-1").has_value());

    EXPECT_EQ(read(log.log_file()),
        "### 19/10/2026\n"
        "- [x] infra-1 rotate production credentials\n"
        "      - blocked on access request\n");
}

TEST_F(TaskLogTest, CompleteAlreadyDoneLeavesFile) {
    const std::string content = "### 19/10/2026\n- [x] dev-1 shipped\n";
    auto log = make_log(content);

    ASSERT_TRUE(log.complete_task("dev-1").has_value());
    ASSERT_TRUE(log.complete_task("dev-1").has_value());
    EXPECT_EQ(read(log.log_file()), content);
}

TEST_F(TaskLogTest, MalformedIdIsInvalidInput) {
    auto log = make_log("### 19/10/2026\n");
    for (const char* id : {"", "dev", "dev-x", "dev-01", "DEV-1"}) {
        auto result = log.complete_task(id);
        ASSERT_FALSE(result.has_value()) << id;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidInput) << id;
    }
}

TEST_F(TaskLogTest, UnknownIdIsTaskNotFound) {
    auto log = make_log("### 19/10/2026\n");
    auto result = log.add_note("dev-7", "text");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TaskNotFound);
}

TEST_F(TaskLogTest, WindowBoundaryOnDisk) {
    std::string content = "### 18/10/2026\n- [ ] dev-1 old\n";
    for (int i = 0; i < 20; ++i) {
        content += "filler line\n";
    }
    auto log = make_log(content, ConfigBuilder().scan_window(10).build_unchecked());

    auto result = log.complete_task("dev-1");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TaskNotFound);
    EXPECT_EQ(read(log.log_file()), content);
}

TEST_F(TaskLogTest, CorruptStateLeavesLogUntouched) {
    const std::string content = "### 19/10/2026\n- [ ] dev-1 task\n";
    auto log = make_log(content);
    write(paths_.state_file(), "{not json");

    auto id = log.create_task("dev", "another");
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, ErrorCode::CounterStateCorrupt);
    EXPECT_EQ(read(log.log_file()), content);
    EXPECT_EQ(read(paths_.state_file()), "{not json");
}

TEST_F(TaskLogTest, MissingStateIsNotInitialized) {
    auto log = make_log("### 19/10/2026\n");
    std::filesystem::remove(paths_.state_file());

    auto id = log.create_task("dev", "task");
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, ErrorCode::NotInitialized);
}

TEST_F(TaskLogTest, MissingLogIsNotInitialized) {
    auto log = make_log("");
    std::filesystem::remove(log.log_file());

    auto matches = log.search_tasks("x");
    ASSERT_FALSE(matches.has_value());
    EXPECT_EQ(matches.error().code, ErrorCode::NotInitialized);
}

TEST_F(TaskLogTest, InvalidInputWritesNothing) {
    auto log = make_log("### 19/10/2026\n");
    auto state_before = read(paths_.state_file());

    auto id = log.create_task("Bad Tag", "title");
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, ErrorCode::InvalidInput);
    EXPECT_EQ(read(paths_.state_file()), state_before);
    EXPECT_EQ(read(log.log_file()), "### 19/10/2026\n");
}

#ifndef _WIN32
TEST_F(TaskLogTest, PermissionsPreserved) {
    auto log = make_log("### 19/10/2026\n");
    std::filesystem::permissions(log.log_file(),
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);

    ASSERT_TRUE(log.create_task("dev", "task").has_value());

    auto perms = std::filesystem::status(log.log_file()).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::all,
              std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
}
#endif

// ============================================================================
// Locking
// ============================================================================

TEST_F(TaskLogTest, LockTimeoutWhenHeld) {
    auto config = ConfigBuilder().lock_timeout(std::chrono::milliseconds{50}).build_unchecked();
    auto log = make_log("### 19/10/2026\n", config);

    auto held = FileLock::acquire(paths_.lock_file(), std::chrono::milliseconds{1000});
    ASSERT_TRUE(held.has_value());

    auto id = log.create_task("dev", "task");
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, ErrorCode::LockTimeout);
    EXPECT_EQ(read(log.log_file()), "### 19/10/2026\n");

    // Queries do not take the lock
    EXPECT_TRUE(log.search_tasks("task").has_value());
    EXPECT_TRUE(log.get_today_section().has_value());

    held->release();
    EXPECT_TRUE(log.create_task("dev", "task").has_value());
}

TEST_F(TaskLogTest, ConcurrentCreatesGetUniqueIds) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 10;

    auto config = ConfigBuilder().lock_timeout(std::chrono::milliseconds{60000}).build_unchecked();
    (void)make_log("", config);
    config.log_path = (paths_.base_dir / "log.md").string();

    std::vector<std::vector<std::uint64_t>> results(kThreads);
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            TaskLog log(paths_, config);
            log.set_today_provider([] { return kToday; });
            for (int i = 0; i < kPerThread; ++i) {
                auto id = log.create_task("dev", "parallel task");
                if (id) {
                    results[t].push_back(id->number);
                } else {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);

    std::set<std::uint64_t> all;
    for (const auto& numbers : results) {
        EXPECT_TRUE(std::is_sorted(numbers.begin(), numbers.end()));
        all.insert(numbers.begin(), numbers.end());
    }
    ASSERT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_EQ(*all.begin(), 1u);
    EXPECT_EQ(*all.rbegin(), static_cast<std::uint64_t>(kThreads * kPerThread));

    auto content = read(paths_.base_dir / "log.md");
    auto lines = std::count(content.begin(), content.end(), '\n');
    EXPECT_EQ(lines, kThreads * kPerThread + 1);
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(TaskLogTest, SearchDoneTask) {
    auto log = make_log(
        "### 18/10/2026\n"
        "- [x] infra-3 rotate production keys\n");

    auto matches = log.search_tasks("rotate");
    ASSERT_TRUE(matches.has_value());
    ASSERT_EQ(matches->size(), 1u);
    EXPECT_EQ((*matches)[0].id.to_string(), "infra-3");
    EXPECT_EQ((*matches)[0].status, TaskStatus::Done);
    EXPECT_EQ((*matches)[0].title, "rotate production keys");
}

TEST_F(TaskLogTest, TodaySection) {
    auto log = make_log(
        "### 18/10/2026\n"
        "- [ ] dev-1 old\n"
        "### 19/10/2026\n"
        "notes for today\n"
        "- [ ] dev-2 current\n");

    auto today = log.get_today_section();
    ASSERT_TRUE(today.has_value());
    EXPECT_EQ(*today, "### 19/10/2026\nnotes for today\n- [ ] dev-2 current\n");
}

} // namespace
} // namespace tasklog
