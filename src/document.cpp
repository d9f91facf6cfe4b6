// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "tasklog/document.hpp"
#include "utils.hpp"

#include <format>

namespace tasklog {

namespace {

struct RawLine {
    std::string_view text;
    std::string_view eol;
    std::size_t offset = 0;
};

std::vector<RawLine> split_lines(std::string_view content) {
    std::vector<RawLine> lines;
    std::size_t pos = 0;

    while (pos < content.size()) {
        auto nl = content.find('\n', pos);
        RawLine line;
        line.offset = pos;
        if (nl == std::string_view::npos) {
            line.text = content.substr(pos);
            pos = content.size();
        } else {
            std::size_t text_end = nl;
            if (text_end > pos && content[text_end - 1] == '\r') {
                --text_end;
            }
            line.text = content.substr(pos, text_end - pos);
            line.eol = content.substr(text_end, nl + 1 - text_end);
            pos = nl + 1;
        }
        lines.push_back(line);
    }
    return lines;
}

template <typename Self>
auto find_task_impl(Self& doc, const TaskId& id) -> decltype(doc.find_task(id)) {
    decltype(doc.find_task(id)) found = nullptr;
    for (auto& section : doc.sections) {
        for (auto& block : section.blocks) {
            if (auto* task = std::get_if<Task>(&block); task && task->id == id) {
                found = task;
            }
        }
    }
    return found;
}

template <typename Self>
auto find_section_impl(Self& doc, const std::chrono::year_month_day& date)
    -> decltype(doc.find_section(date)) {
    decltype(doc.find_section(date)) found = nullptr;
    for (auto& section : doc.sections) {
        if (section.date == date) {
            found = &section;
        }
    }
    return found;
}

} // anonymous namespace

// ============================================================================
// Rendering
// ============================================================================

std::string render_task_line(const Task& task) {
    return std::format("- [{}] {} {}", status_marker(task.status), task.id.to_string(), task.title);
}

std::string render_note_line(const Note& note, std::size_t note_indent) {
    std::string out(note_indent, ' ');
    out += "- ";
    out += note.text;
    return out;
}

std::string render_section(const Section& section, std::size_t note_indent) {
    std::string out = section.header + section.eol;
    for (const auto& block : section.blocks) {
        if (const auto* verbatim = std::get_if<Verbatim>(&block)) {
            out += verbatim->text;
            out += verbatim->eol;
            continue;
        }
        const auto& task = std::get<Task>(block);
        out += render_task_line(task);
        out += task.eol;
        for (const auto& note : task.notes) {
            out += render_note_line(note, note_indent);
            out += note.eol;
        }
    }
    return out;
}

// ============================================================================
// LogDocument
// ============================================================================

Task* LogDocument::find_task(const TaskId& id) {
    return find_task_impl(*this, id);
}

const Task* LogDocument::find_task(const TaskId& id) const {
    return find_task_impl(*this, id);
}

Section* LogDocument::find_section(const std::chrono::year_month_day& date) {
    return find_section_impl(*this, date);
}

const Section* LogDocument::find_section(const std::chrono::year_month_day& date) const {
    return find_section_impl(*this, date);
}

std::string* LogDocument::last_eol() {
    if (!sections.empty()) {
        auto& section = sections.back();
        if (section.blocks.empty()) {
            return &section.eol;
        }
        auto& block = section.blocks.back();
        if (auto* verbatim = std::get_if<Verbatim>(&block)) {
            return &verbatim->eol;
        }
        auto& task = std::get<Task>(block);
        return task.notes.empty() ? &task.eol : &task.notes.back().eol;
    }
    if (!preamble.empty()) {
        return &preamble.back().eol;
    }
    return nullptr;
}

bool LogDocument::ends_with_blank_line() const {
    const Verbatim* last = nullptr;
    if (!sections.empty()) {
        const auto& section = sections.back();
        if (section.blocks.empty()) return false;
        last = std::get_if<Verbatim>(&section.blocks.back());
        if (last == nullptr) return false;
    } else if (!preamble.empty()) {
        last = &preamble.back();
    } else {
        return true;
    }
    return trim(last->text).empty();
}

std::size_t LogDocument::task_count() const noexcept {
    std::size_t count = 0;
    for (const auto& section : sections) {
        for (const auto& block : section.blocks) {
            if (std::holds_alternative<Task>(block)) {
                ++count;
            }
        }
    }
    return count;
}

std::string LogDocument::serialize() const {
    std::string out;
    out.reserve(head.size() + 4096);
    out += head;

    for (const auto& line : preamble) {
        out += line.text;
        out += line.eol;
    }
    for (const auto& section : sections) {
        out += render_section(section, note_indent);
    }
    return out;
}

// ============================================================================
// DocumentBuilder
// ============================================================================

DocumentBuilder::DocumentBuilder(const LineClassifier& classifier, std::size_t scan_window_lines)
    : classifier_(classifier)
    , scan_window_lines_(scan_window_lines) {
}

LogDocument DocumentBuilder::build(std::string_view content) const {
    LogDocument doc;
    doc.note_indent = classifier_.note_indent();

    auto lines = split_lines(content);
    std::size_t start = lines.size() > scan_window_lines_ ? lines.size() - scan_window_lines_ : 0;
    if (start > 0) {
        doc.head = std::string(content.substr(0, lines[start].offset));
    }

    bool newline_seen = false;
    LineKind previous = LineKind::Freeform;

    for (std::size_t i = start; i < lines.size(); ++i) {
        const auto& raw = lines[i];
        if (!newline_seen && !raw.eol.empty()) {
            doc.newline = std::string(raw.eol);
            newline_seen = true;
        }

        LineKind kind = classifier_.classify(raw.text, previous);

        // Tasks above the first in-window header have no owning section
        if (kind == LineKind::TaskLine && doc.sections.empty()) {
            kind = LineKind::Freeform;
        }

        switch (kind) {
            case LineKind::SectionHeader: {
                Section section;
                section.date = *classifier_.parse_header(raw.text);
                section.header = std::string(raw.text);
                section.eol = std::string(raw.eol);
                doc.sections.push_back(std::move(section));
                break;
            }
            case LineKind::TaskLine: {
                auto parts = *LineClassifier::parse_task_line(raw.text);
                Task task;
                task.id = std::move(parts.id);
                task.status = parts.status;
                task.title = std::string(parts.title);
                task.eol = std::string(raw.eol);
                doc.sections.back().blocks.emplace_back(std::move(task));
                break;
            }
            case LineKind::NoteLine: {
                // previous was TaskLine/NoteLine, so the last block is that task
                auto& task = std::get<Task>(doc.sections.back().blocks.back());
                task.notes.push_back(Note{std::string(*classifier_.parse_note_line(raw.text)),
                                          std::string(raw.eol)});
                break;
            }
            case LineKind::Freeform: {
                Verbatim line{std::string(raw.text), std::string(raw.eol)};
                if (doc.sections.empty()) {
                    doc.preamble.push_back(std::move(line));
                } else {
                    doc.sections.back().blocks.emplace_back(std::move(line));
                }
                break;
            }
        }
        previous = kind;
    }

    return doc;
}

} // namespace tasklog
