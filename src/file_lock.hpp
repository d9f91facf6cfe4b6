// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include "tasklog/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace tasklog {

// ============================================================================
// FileLock - Exclusive advisory lock on a sidecar file, held for its lifetime
// ============================================================================
//
// The lock lives on a dedicated file next to the state rather than on the
// task log: the log is replaced by rename on every write, and a lock held on
// the old inode would not exclude a process that opened the new one.
// ============================================================================

class FileLock {
public:
    /// Polls until the lock is free or `timeout` expires (LockTimeout).
    /// Creates the lock file if needed.
    [[nodiscard]] static Result<FileLock> acquire(const std::filesystem::path& path,
                                                  std::chrono::milliseconds timeout);

    ~FileLock();

    // Move-only
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    [[nodiscard]] bool owns_lock() const noexcept;

    void release() noexcept;

private:
#ifdef _WIN32
    using native_handle = std::intptr_t;  // HANDLE
    static constexpr native_handle kInvalidHandle = -1;
#else
    using native_handle = int;
    static constexpr native_handle kInvalidHandle = -1;
#endif

    explicit FileLock(native_handle handle) noexcept : handle_(handle) {}

    native_handle handle_ = kInvalidHandle;
};

} // namespace tasklog
