// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "tasklog/classifier.hpp"
#include "utils.hpp"

#include <algorithm>
#include <charconv>

namespace tasklog {

namespace {

constexpr std::size_t kMaxHeadingLevel = 6;
constexpr std::string_view kOpenCheckbox = "- [ ] ";
constexpr std::string_view kDoneCheckbox = "- [x] ";

} // anonymous namespace

bool is_valid_tag(std::string_view tag) noexcept {
    if (tag.empty()) return false;
    return std::all_of(tag.begin(), tag.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    });
}

std::optional<TaskId> parse_task_id(std::string_view text) {
    auto dash = text.rfind('-');
    if (dash == std::string_view::npos || dash == 0) return std::nullopt;

    auto tag = text.substr(0, dash);
    auto digits = text.substr(dash + 1);

    if (!is_valid_tag(tag)) return std::nullopt;
    if (!is_all_digits(digits) || digits.front() == '0') return std::nullopt;

    std::uint64_t number = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return TaskId{std::string(tag), number};
}

// ============================================================================
// LineClassifier
// ============================================================================

LineClassifier::LineClassifier(DateFormat date_format, std::size_t note_indent)
    : date_format_(std::move(date_format))
    , note_indent_(note_indent) {
}

LineKind LineClassifier::classify(std::string_view line, LineKind previous) const {
    if (parse_header(line)) {
        return LineKind::SectionHeader;
    }
    if (parse_task_line(line)) {
        return LineKind::TaskLine;
    }
    if ((previous == LineKind::TaskLine || previous == LineKind::NoteLine) &&
        parse_note_line(line)) {
        return LineKind::NoteLine;
    }
    return LineKind::Freeform;
}

std::optional<std::chrono::year_month_day>
LineClassifier::parse_header(std::string_view line) const {
    std::size_t level = 0;
    while (level < line.size() && line[level] == '#') {
        ++level;
    }
    if (level == 0 || level > kMaxHeadingLevel) return std::nullopt;
    if (level >= line.size() || line[level] != ' ') return std::nullopt;

    return date_format_.parse(line.substr(level + 1));
}

std::optional<TaskLineParts> LineClassifier::parse_task_line(std::string_view line) {
    TaskLineParts parts;
    if (line.starts_with(kOpenCheckbox)) {
        parts.status = TaskStatus::Open;
    } else if (line.starts_with(kDoneCheckbox)) {
        parts.status = TaskStatus::Done;
    } else {
        return std::nullopt;
    }

    auto rest = line.substr(kOpenCheckbox.size());
    auto space = rest.find(' ');
    if (space == std::string_view::npos) return std::nullopt;

    auto id = parse_task_id(rest.substr(0, space));
    if (!id) return std::nullopt;

    auto title = rest.substr(space + 1);
    if (title.empty() || title.front() == ' ' || title.front() == '\t') {
        return std::nullopt;
    }

    parts.id = std::move(*id);
    parts.title = title;
    return parts;
}

std::optional<std::string_view> LineClassifier::parse_note_line(std::string_view line) const {
    if (line.size() <= note_indent_ + 2) return std::nullopt;

    for (std::size_t i = 0; i < note_indent_; ++i) {
        if (line[i] != ' ') return std::nullopt;
    }
    if (line[note_indent_] != '-' || line[note_indent_ + 1] != ' ') {
        return std::nullopt;
    }
    return line.substr(note_indent_ + 2);
}

} // namespace tasklog
