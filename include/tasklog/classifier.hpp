// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include "types.hpp"
#include "date_format.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

namespace tasklog {

// ============================================================================
// Line Grammar
// ============================================================================
//
//   SectionHeader  "#".."######", one space, a date in the configured format
//   TaskLine       "- [ ] " or "- [x] ", <tag>-<number>, one space, <title>
//   NoteLine       <note_indent spaces>"- "<text>, directly after a task/note
//   Freeform       anything else, never modified
//
// <tag> is [a-z0-9-]+, <number> a positive integer without leading zeros,
// <title> non-empty and not starting with whitespace.
// ============================================================================

/// Components of a recognized task line
struct TaskLineParts {
    TaskStatus status = TaskStatus::Open;
    TaskId id;
    std::string_view title;
};

[[nodiscard]] bool is_valid_tag(std::string_view tag) noexcept;

/// Parses "tag-number"; the number is split at the last hyphen
[[nodiscard]] std::optional<TaskId> parse_task_id(std::string_view text);

class LineClassifier {
public:
    LineClassifier(DateFormat date_format, std::size_t note_indent);

    /// `previous` is the kind assigned to the line immediately above
    [[nodiscard]] LineKind classify(std::string_view line, LineKind previous) const;

    [[nodiscard]] std::optional<std::chrono::year_month_day>
    parse_header(std::string_view line) const;

    [[nodiscard]] static std::optional<TaskLineParts> parse_task_line(std::string_view line);

    /// Note text, without context checks
    [[nodiscard]] std::optional<std::string_view> parse_note_line(std::string_view line) const;

    [[nodiscard]] const DateFormat& date_format() const noexcept { return date_format_; }
    [[nodiscard]] std::size_t note_indent() const noexcept { return note_indent_; }

private:
    DateFormat date_format_;
    std::size_t note_indent_;
};

} // namespace tasklog
