// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace tasklog {

// ============================================================================
// Timestamp
// ============================================================================

struct Timestamp {
    std::int64_t tv_sec = 0;   // Seconds since epoch
    std::int64_t tv_usec = 0;  // Microseconds

    static Timestamp now() noexcept {
        auto tp = std::chrono::system_clock::now();
        auto sec = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch());
        auto usec = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) - sec;
        return {sec.count(), usec.count()};
    }
};

// ============================================================================
// Diagnostic Log Levels
// ============================================================================

enum class Level : std::uint8_t {
    Verbose = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

[[nodiscard]] constexpr std::string_view level_name(Level level) noexcept {
    switch (level) {
        case Level::Verbose: return "V";
        case Level::Debug:   return "D";
        case Level::Info:    return "I";
        case Level::Warn:    return "W";
        case Level::Error:   return "E";
        case Level::Off:     return "O";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view level_full_name(Level level) noexcept {
    switch (level) {
        case Level::Verbose: return "VERBOSE";
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO";
        case Level::Warn:    return "WARN";
        case Level::Error:   return "ERROR";
        case Level::Off:     return "OFF";
    }
    return "UNKNOWN";
}

// ============================================================================
// Diagnostic Log Record
// ============================================================================

struct Record {
    Level level = Level::Info;
    std::string_view tag;
    std::string_view message;
    std::source_location location;
    Timestamp timestamp{};
    std::int64_t pid = 0;
    std::int64_t tid = 0;
};

// ============================================================================
// Line Classification
// ============================================================================

enum class LineKind : std::uint8_t {
    SectionHeader,
    TaskLine,
    NoteLine,
    Freeform
};

[[nodiscard]] constexpr std::string_view line_kind_name(LineKind kind) noexcept {
    switch (kind) {
        case LineKind::SectionHeader: return "SectionHeader";
        case LineKind::TaskLine:      return "TaskLine";
        case LineKind::NoteLine:      return "NoteLine";
        case LineKind::Freeform:      return "Freeform";
    }
    return "Unknown";
}

// ============================================================================
// Tasks
// ============================================================================

enum class TaskStatus : std::uint8_t {
    Open,
    Done
};

// Character between the checkbox brackets
[[nodiscard]] constexpr char status_marker(TaskStatus status) noexcept {
    return status == TaskStatus::Done ? 'x' : ' ';
}

[[nodiscard]] constexpr std::string_view status_name(TaskStatus status) noexcept {
    return status == TaskStatus::Done ? "done" : "open";
}

struct TaskId {
    std::string tag;
    std::uint64_t number = 0;

    [[nodiscard]] std::string to_string() const {
        return std::format("{}-{}", tag, number);
    }

    bool operator==(const TaskId&) const = default;
};

// One search hit
struct Match {
    TaskId id;
    TaskStatus status = TaskStatus::Open;
    std::string title;
    std::string snippet;             // title, or the first matching note
    std::vector<std::string> notes;  // all notes of the task, in order
};

// ============================================================================
// Errors
// ============================================================================

enum class ErrorCode : std::uint8_t {
    InvalidInput,
    TaskNotFound,
    LockTimeout,
    IOFailure,
    CounterStateCorrupt,
    ConfigInvalid,
    NotInitialized
};

[[nodiscard]] constexpr std::string_view error_code_message(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidInput:
            return "invalid input";
        case ErrorCode::TaskNotFound:
            return "task not found";
        case ErrorCode::LockTimeout:
            return "timed out waiting for the task log lock";
        case ErrorCode::IOFailure:
            return "I/O error";
        case ErrorCode::CounterStateCorrupt:
            return "counter state file is corrupt";
        case ErrorCode::ConfigInvalid:
            return "invalid configuration";
        case ErrorCode::NotInitialized:
            return "not initialized, run `tl init` first";
    }
    return "unknown error";
}

struct Error {
    ErrorCode code = ErrorCode::IOFailure;
    std::string detail;

    [[nodiscard]] std::string message() const {
        if (detail.empty()) {
            return std::string(error_code_message(code));
        }
        return std::format("{}: {}", error_code_message(code), detail);
    }
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline std::unexpected<Error> make_error(ErrorCode code, std::string detail = {}) {
    return std::unexpected(Error{code, std::move(detail)});
}

} // namespace tasklog
