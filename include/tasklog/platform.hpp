// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(_WIN32) || defined(_WIN64) || defined(__CYGWIN__)
    #define TASKLOG_PLATFORM_WINDOWS 1
    #define TASKLOG_PLATFORM_NAME "Windows"
#endif

#if defined(__APPLE__) && defined(__MACH__)
    #define TASKLOG_PLATFORM_APPLE 1
    #define TASKLOG_PLATFORM_NAME "macOS"
#endif

#if defined(__linux__)
    #define TASKLOG_PLATFORM_LINUX 1
    #define TASKLOG_PLATFORM_NAME "Linux"
#endif

#if defined(__FreeBSD__)
    #define TASKLOG_PLATFORM_FREEBSD 1
    #define TASKLOG_PLATFORM_NAME "FreeBSD"
#endif

#ifndef TASKLOG_PLATFORM_NAME
    #define TASKLOG_PLATFORM_UNKNOWN 1
    #define TASKLOG_PLATFORM_NAME "Unknown"
#endif

namespace tasklog::platform {

constexpr const char* name() noexcept { return TASKLOG_PLATFORM_NAME; }

} // namespace tasklog::platform

// ============================================================================
// Platform Utility Functions (implemented in platform.cpp)
// ============================================================================

#include "types.hpp"

#include <cstdint>
#include <filesystem>

namespace tasklog {

// Process/Thread ID
[[nodiscard]] std::int64_t get_pid() noexcept;
[[nodiscard]] std::int64_t get_tid() noexcept;

// Timestamps
[[nodiscard]] Timestamp get_timestamp() noexcept;

// $HOME (or %USERPROFILE%); empty path when neither is set
[[nodiscard]] std::filesystem::path home_dir();

} // namespace tasklog
