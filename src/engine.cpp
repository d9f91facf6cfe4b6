// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "tasklog/engine.hpp"
#include "tasklog/classifier.hpp"
#include "utils.hpp"

#include <algorithm>
#include <format>

namespace tasklog {

namespace {

constexpr std::string_view kSectionPrefix = "### ";

// Terminator of the last physical line a block occupies
std::string& block_eol(Block& block) {
    if (auto* verbatim = std::get_if<Verbatim>(&block)) {
        return verbatim->eol;
    }
    auto& task = std::get<Task>(block);
    return task.notes.empty() ? task.eol : task.notes.back().eol;
}

// A new line goes after a line whose terminator is `predecessor`. When that
// line ended the file without a terminator, it gets one and the new line
// takes over the missing final newline.
std::string terminator_after(std::string& predecessor, const std::string& newline) {
    if (predecessor.empty()) {
        predecessor = newline;
        return {};
    }
    return newline;
}

Result<std::string> clean_text(std::string_view text, std::string_view what) {
    auto trimmed = trim(text);
    if (trimmed.empty()) {
        return make_error(ErrorCode::InvalidInput, std::format("{} cannot be empty", what));
    }
    if (has_line_break(trimmed)) {
        return make_error(ErrorCode::InvalidInput, std::format("{} must be a single line", what));
    }
    return std::string(trimmed);
}

// Index in `section.blocks` where a new task belongs
std::size_t task_insert_index(const Section& section) {
    const auto& blocks = section.blocks;
    for (std::size_t i = blocks.size(); i > 0; --i) {
        if (std::holds_alternative<Task>(blocks[i - 1])) {
            return i;
        }
    }
    for (std::size_t i = blocks.size(); i > 0; --i) {
        const auto& verbatim = std::get<Verbatim>(blocks[i - 1]);
        if (!trim(verbatim.text).empty()) {
            return i;
        }
    }
    return 0;
}

} // anonymous namespace

MutationEngine::MutationEngine(DateFormat date_format, std::chrono::year_month_day today)
    : date_format_(std::move(date_format))
    , today_(today) {
}

std::string MutationEngine::today_header() const {
    return std::string(kSectionPrefix) + date_format_.format(today_);
}

// ============================================================================
// CreateTask
// ============================================================================

Result<TaskId> MutationEngine::create_task(LogDocument& doc,
                                           CounterState& counters,
                                           std::string_view tag,
                                           std::string_view title,
                                           bool reconcile) const {
    if (tag.empty()) {
        return make_error(ErrorCode::InvalidInput, "tag cannot be empty");
    }
    if (!is_valid_tag(tag)) {
        return make_error(ErrorCode::InvalidInput,
                          std::format("tag '{}' must match [a-z0-9-]+", tag));
    }
    auto clean_title = clean_text(title, "title");
    if (!clean_title) {
        return std::unexpected(std::move(clean_title.error()));
    }

    if (reconcile) {
        std::uint64_t highest = 0;
        for (const auto& section : doc.sections) {
            for (const auto& block : section.blocks) {
                if (const auto* task = std::get_if<Task>(&block); task && task->id.tag == tag) {
                    highest = std::max(highest, task->id.number);
                }
            }
        }
        counters.raise_to(tag, highest);
    }

    Task task;
    task.id = TaskId{std::string(tag), counters.reserve(tag)};
    task.title = std::move(*clean_title);

    Section* section = doc.find_section(today_);
    if (section == nullptr) {
        std::string* last = doc.last_eol();
        bool blank_needed = !doc.ends_with_blank_line();
        std::string eol = last ? terminator_after(*last, doc.newline) : doc.newline;

        Section created;
        created.date = today_;
        created.header = today_header();
        created.eol = doc.newline;

        if (blank_needed) {
            Verbatim blank{std::string(), doc.newline};
            if (doc.sections.empty()) {
                doc.preamble.push_back(std::move(blank));
            } else {
                doc.sections.back().blocks.emplace_back(std::move(blank));
            }
        }

        task.eol = std::move(eol);
        created.blocks.emplace_back(std::move(task));
        doc.sections.push_back(std::move(created));
        return std::get<Task>(doc.sections.back().blocks.back()).id;
    }

    auto index = task_insert_index(*section);
    std::string& predecessor = index == 0 ? section->eol : block_eol(section->blocks[index - 1]);
    task.eol = terminator_after(predecessor, doc.newline);

    auto it = section->blocks.emplace(section->blocks.begin() + static_cast<std::ptrdiff_t>(index),
                                      std::move(task));
    return std::get<Task>(*it).id;
}

// ============================================================================
// CompleteTask
// ============================================================================

Result<bool> MutationEngine::complete_task(LogDocument& doc, const TaskId& id) const {
    Task* task = doc.find_task(id);
    if (task == nullptr) {
        return make_error(ErrorCode::TaskNotFound, id.to_string());
    }
    if (task->status == TaskStatus::Done) {
        return false;
    }
    task->status = TaskStatus::Done;
    return true;
}

// ============================================================================
// AddNote
// ============================================================================

Result<void> MutationEngine::add_note(LogDocument& doc, const TaskId& id, std::string_view text) const {
    auto clean = clean_text(text, "note text");
    if (!clean) {
        return std::unexpected(std::move(clean.error()));
    }

    Task* task = doc.find_task(id);
    if (task == nullptr) {
        return make_error(ErrorCode::TaskNotFound, id.to_string());
    }

    std::string& predecessor = task->notes.empty() ? task->eol : task->notes.back().eol;
    Note note;
    note.text = std::move(*clean);
    note.eol = terminator_after(predecessor, doc.newline);
    task->notes.push_back(std::move(note));
    return {};
}

// ============================================================================
// Queries
// ============================================================================

std::vector<Match> MutationEngine::search_tasks(const LogDocument& doc,
                                                std::string_view query,
                                                std::optional<std::string_view> tag) const {
    auto needle = trim(query);
    std::vector<Match> matches;

    for (const auto& section : doc.sections) {
        for (const auto& block : section.blocks) {
            const auto* task = std::get_if<Task>(&block);
            if (task == nullptr) continue;
            if (tag && task->id.tag != *tag) continue;

            const std::string* snippet = nullptr;
            if (contains_icase(task->title, needle)) {
                snippet = &task->title;
            } else {
                for (const auto& note : task->notes) {
                    if (contains_icase(note.text, needle)) {
                        snippet = &note.text;
                        break;
                    }
                }
            }
            if (snippet == nullptr) continue;

            Match match;
            match.id = task->id;
            match.status = task->status;
            match.title = task->title;
            match.snippet = *snippet;
            match.notes.reserve(task->notes.size());
            for (const auto& note : task->notes) {
                match.notes.push_back(note.text);
            }
            matches.push_back(std::move(match));
        }
    }
    return matches;
}

std::string MutationEngine::today_section(const LogDocument& doc) const {
    const Section* section = doc.find_section(today_);
    if (section == nullptr) {
        return {};
    }
    return render_section(*section, doc.note_indent);
}

} // namespace tasklog
