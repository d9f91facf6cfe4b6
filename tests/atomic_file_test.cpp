// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "../src/atomic_file.hpp"
#include "../src/file_lock.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace tasklog {
namespace {

class AtomicFileTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("tasklog_io_test_") + info->name());
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    static std::string read_raw(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::size_t entry_count() const {
        std::size_t count = 0;
        for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(test_dir_)) {
            ++count;
        }
        return count;
    }
};

// ============================================================================
// read_file
// ============================================================================

TEST_F(AtomicFileTest, ReadMissingFile) {
    auto content = read_file(test_dir_ / "absent.md");
    ASSERT_FALSE(content.has_value());
    EXPECT_EQ(content.error().code, ErrorCode::IOFailure);
}

TEST_F(AtomicFileTest, ReadEmptyFile) {
    std::ofstream(test_dir_ / "empty.md").close();
    auto content = read_file(test_dir_ / "empty.md");
    ASSERT_TRUE(content.has_value());
    EXPECT_TRUE(content->empty());
}

TEST_F(AtomicFileTest, ReadKeepsBytes) {
    const std::string data = "### 19/10/2026\r\n- [ ] dev-1 x\r\nno newline";
    {
        std::ofstream out(test_dir_ / "log.md", std::ios::binary);
        out << data;
    }
    auto content = read_file(test_dir_ / "log.md");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, data);
}

// ============================================================================
// write_file_atomic
// ============================================================================

TEST_F(AtomicFileTest, CreatesFile) {
    auto path = test_dir_ / "state.json";
    ASSERT_TRUE(write_file_atomic(path, "{}\n").has_value());
    EXPECT_EQ(read_raw(path), "{}\n");
}

TEST_F(AtomicFileTest, ReplacesContent) {
    auto path = test_dir_ / "log.md";
    ASSERT_TRUE(write_file_atomic(path, "a much longer first version\n").has_value());
    ASSERT_TRUE(write_file_atomic(path, "short\n").has_value());
    EXPECT_EQ(read_raw(path), "short\n");
}

TEST_F(AtomicFileTest, WritesEmptyContent) {
    auto path = test_dir_ / "log.md";
    ASSERT_TRUE(write_file_atomic(path, "content").has_value());
    ASSERT_TRUE(write_file_atomic(path, "").has_value());
    EXPECT_EQ(std::filesystem::file_size(path), 0u);
}

TEST_F(AtomicFileTest, LeavesNoTemporaryFiles) {
    auto path = test_dir_ / "log.md";
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(write_file_atomic(path, std::to_string(i)).has_value());
    }
    EXPECT_EQ(entry_count(), 1u);
}

TEST_F(AtomicFileTest, MissingDirectoryFails) {
    auto result = write_file_atomic(test_dir_ / "no" / "such" / "log.md", "x");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::IOFailure);
}

#ifndef _WIN32
TEST_F(AtomicFileTest, PreservesPermissions) {
    using std::filesystem::perms;
    auto path = test_dir_ / "log.md";
    ASSERT_TRUE(write_file_atomic(path, "v1").has_value());
    std::filesystem::permissions(path, perms::owner_read | perms::owner_write | perms::group_read);

    ASSERT_TRUE(write_file_atomic(path, "v2").has_value());
    EXPECT_EQ(std::filesystem::status(path).permissions() & perms::all,
              perms::owner_read | perms::owner_write | perms::group_read);
}
#endif

// ============================================================================
// FileLock
// ============================================================================

TEST_F(AtomicFileTest, LockCreatesFile) {
    auto lock = FileLock::acquire(test_dir_ / "lock", std::chrono::milliseconds{100});
    ASSERT_TRUE(lock.has_value());
    EXPECT_TRUE(lock->owns_lock());
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "lock"));
}

TEST_F(AtomicFileTest, SecondAcquireTimesOut) {
    auto first = FileLock::acquire(test_dir_ / "lock", std::chrono::milliseconds{100});
    ASSERT_TRUE(first.has_value());

    auto start = std::chrono::steady_clock::now();
    auto second = FileLock::acquire(test_dir_ / "lock", std::chrono::milliseconds{60});
    auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::LockTimeout);
    EXPECT_GE(waited, std::chrono::milliseconds{60});
}

TEST_F(AtomicFileTest, ReleaseAllowsReacquire) {
    auto first = FileLock::acquire(test_dir_ / "lock", std::chrono::milliseconds{100});
    ASSERT_TRUE(first.has_value());
    first->release();
    EXPECT_FALSE(first->owns_lock());

    auto second = FileLock::acquire(test_dir_ / "lock", std::chrono::milliseconds{100});
    EXPECT_TRUE(second.has_value());
}

TEST_F(AtomicFileTest, MovedLockStaysHeld) {
    auto first = FileLock::acquire(test_dir_ / "lock", std::chrono::milliseconds{100});
    ASSERT_TRUE(first.has_value());

    FileLock moved = std::move(*first);
    EXPECT_TRUE(moved.owns_lock());
    EXPECT_FALSE(first->owns_lock());

    auto other = FileLock::acquire(test_dir_ / "lock", std::chrono::milliseconds{30});
    EXPECT_FALSE(other.has_value());
}

TEST_F(AtomicFileTest, WaiterGetsLockAfterRelease) {
    auto held = FileLock::acquire(test_dir_ / "lock", std::chrono::milliseconds{100});
    ASSERT_TRUE(held.has_value());

    std::thread releaser([&held] {
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        held->release();
    });

    auto waiter = FileLock::acquire(test_dir_ / "lock", std::chrono::milliseconds{5000});
    releaser.join();
    EXPECT_TRUE(waiter.has_value());
}

} // namespace
} // namespace tasklog
