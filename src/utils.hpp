// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#ifndef TASKLOG_UTILS_HPP
#define TASKLOG_UTILS_HPP

#include "tasklog/types.hpp"
#include "tasklog/platform.hpp"

#include <ctime>
#include <string>
#include <string_view>

namespace tasklog {

// ============================================================================
// Time Formatting Utilities
// ============================================================================

// Platform-specific localtime wrapper
[[nodiscard]] std::tm localtime_safe(std::time_t time);

// "YYYY-MM-DD HH:MM:SS.mmm"
[[nodiscard]] std::string format_timestamp(const Timestamp& tv);

// "YYYY-MM-DD"
[[nodiscard]] std::string format_date(const Timestamp& tv);

// "YYYYMMDD"
[[nodiscard]] std::string format_date_compact(const Timestamp& tv);

// ============================================================================
// Text Utilities
// ============================================================================

[[nodiscard]] bool is_all_digits(std::string_view text) noexcept;

// ASCII-only lowering; bytes >= 0x80 pass through unchanged
[[nodiscard]] std::string to_lower_ascii(std::string_view text);

[[nodiscard]] bool contains_icase(std::string_view haystack, std::string_view needle);

// Strips spaces, tabs, CR and LF from both ends
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

[[nodiscard]] bool has_line_break(std::string_view text) noexcept;

// Well-formed UTF-8: no overlongs, surrogates or code points above U+10FFFF
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

} // namespace tasklog

#endif // TASKLOG_UTILS_HPP
