// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "file_lock.hpp"
#include "tasklog/platform.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <thread>

#ifdef TASKLOG_PLATFORM_WINDOWS
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #include <Windows.h>
#else
    #include <fcntl.h>
    #include <sys/file.h>
    #include <unistd.h>
#endif

namespace tasklog {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds{10};

} // anonymous namespace

#ifdef TASKLOG_PLATFORM_WINDOWS

Result<FileLock> FileLock::acquire(const std::filesystem::path& path,
                                   std::chrono::milliseconds timeout) {
    HANDLE handle = ::CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE,
                                  FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                                  nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        return make_error(ErrorCode::IOFailure,
                          std::format("cannot open lock file {} (error {})", path.string(), ::GetLastError()));
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        OVERLAPPED overlapped{};
        if (::LockFileEx(handle, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                         0, MAXDWORD, MAXDWORD, &overlapped)) {
            return FileLock(reinterpret_cast<native_handle>(handle));
        }
        DWORD err = ::GetLastError();
        if (err != ERROR_LOCK_VIOLATION && err != ERROR_IO_PENDING) {
            ::CloseHandle(handle);
            return make_error(ErrorCode::IOFailure, std::format("lock failed (error {})", err));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::CloseHandle(handle);
            return make_error(ErrorCode::LockTimeout, std::format("after {} ms", timeout.count()));
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

void FileLock::release() noexcept {
    if (handle_ == kInvalidHandle) return;
    HANDLE handle = reinterpret_cast<HANDLE>(handle_);
    OVERLAPPED overlapped{};
    ::UnlockFileEx(handle, 0, MAXDWORD, MAXDWORD, &overlapped);
    ::CloseHandle(handle);
    handle_ = kInvalidHandle;
}

#else

Result<FileLock> FileLock::acquire(const std::filesystem::path& path,
                                   std::chrono::milliseconds timeout) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return make_error(ErrorCode::IOFailure,
                          std::format("cannot open lock file {}: {}", path.string(), std::strerror(errno)));
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            return FileLock(fd);
        }
        int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (err != EWOULDBLOCK) {
            ::close(fd);
            return make_error(ErrorCode::IOFailure, std::format("flock: {}", std::strerror(err)));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::close(fd);
            return make_error(ErrorCode::LockTimeout, std::format("after {} ms", timeout.count()));
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

void FileLock::release() noexcept {
    if (handle_ == kInvalidHandle) return;
    // Closing the descriptor drops the flock
    ::close(handle_);
    handle_ = kInvalidHandle;
}

#endif

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept : handle_(other.handle_) {
    other.handle_ = kInvalidHandle;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        handle_ = other.handle_;
        other.handle_ = kInvalidHandle;
    }
    return *this;
}

bool FileLock::owns_lock() const noexcept {
    return handle_ != kInvalidHandle;
}

} // namespace tasklog
