// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "tasklog/platform.hpp"

#include <cstdint>
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#include <processthreadsapi.h>
#else
#include <unistd.h>
#include <pthread.h>
#ifdef __linux__
#include <sys/syscall.h>
#endif
#endif

namespace tasklog {

// ============================================================================
// Process/Thread ID Functions
// ============================================================================

std::int64_t get_pid() noexcept {
#ifdef _WIN32
    return static_cast<std::int64_t>(GetCurrentProcessId());
#else
    return static_cast<std::int64_t>(getpid());
#endif
}

std::int64_t get_tid() noexcept {
#ifdef _WIN32
    return static_cast<std::int64_t>(GetCurrentThreadId());
#elif defined(__APPLE__)
    std::uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return static_cast<std::int64_t>(tid);
#elif defined(__linux__)
    return static_cast<std::int64_t>(syscall(SYS_gettid));
#else
    return static_cast<std::int64_t>(reinterpret_cast<std::intptr_t>(pthread_self()));
#endif
}

// ============================================================================
// Timestamp / Environment
// ============================================================================

Timestamp get_timestamp() noexcept {
    return Timestamp::now();
}

std::filesystem::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home == nullptr || *home == '\0') {
        return {};
    }
    return std::filesystem::path(home);
}

} // namespace tasklog
