// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include "types.hpp"
#include "classifier.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tasklog {

// ============================================================================
// Document Model
// ============================================================================
//
// Only the trailing scan window is modeled. Structured lines (headers, tasks,
// notes) are regenerated from the model on write; every other line is kept
// as a Verbatim block and emitted byte for byte. Each line carries its own
// terminator ("\n", "\r\n", or "" for a final line without one).
// ============================================================================

struct Verbatim {
    std::string text;
    std::string eol;
};

struct Note {
    std::string text;
    std::string eol;
};

struct Task {
    TaskId id;
    TaskStatus status = TaskStatus::Open;
    std::string title;
    std::string eol;
    std::vector<Note> notes;
};

using Block = std::variant<Verbatim, Task>;

struct Section {
    std::chrono::year_month_day date;
    std::string header;   // Header line as found (or as created)
    std::string eol;
    std::vector<Block> blocks;
};

struct LogDocument {
    std::string head;                 // Bytes before the scan window, opaque
    std::vector<Verbatim> preamble;   // Window lines before the first header
    std::vector<Section> sections;
    std::size_t note_indent = 6;
    std::string newline = "\n";       // Terminator used for generated lines

    /// Last occurrence of `id` in the window, nullptr when absent
    [[nodiscard]] Task* find_task(const TaskId& id);
    [[nodiscard]] const Task* find_task(const TaskId& id) const;

    /// Last section dated `date`, nullptr when absent
    [[nodiscard]] Section* find_section(const std::chrono::year_month_day& date);
    [[nodiscard]] const Section* find_section(const std::chrono::year_month_day& date) const;

    /// Terminator of the last line of the file, nullptr for an empty file
    [[nodiscard]] std::string* last_eol();

    /// True for an empty window or one whose last line is blank
    [[nodiscard]] bool ends_with_blank_line() const;

    [[nodiscard]] std::size_t task_count() const noexcept;

    [[nodiscard]] std::string serialize() const;
};

[[nodiscard]] std::string render_task_line(const Task& task);
[[nodiscard]] std::string render_note_line(const Note& note, std::size_t note_indent);
[[nodiscard]] std::string render_section(const Section& section, std::size_t note_indent);

// ============================================================================
// Document Builder
// ============================================================================

class DocumentBuilder {
public:
    DocumentBuilder(const LineClassifier& classifier, std::size_t scan_window_lines);

    [[nodiscard]] LogDocument build(std::string_view content) const;

private:
    const LineClassifier& classifier_;
    std::size_t scan_window_lines_;
};

} // namespace tasklog
