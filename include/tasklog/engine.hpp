// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include "types.hpp"
#include "counter_state.hpp"
#include "date_format.hpp"
#include "document.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tasklog {

// ============================================================================
// Mutation Engine
// ============================================================================
//
// Applies one operation to an in-memory LogDocument. No I/O; the caller owns
// locking, loading and writing back. `today` is fixed at construction so one
// operation sees one date.
// ============================================================================

class MutationEngine {
public:
    MutationEngine(DateFormat date_format, std::chrono::year_month_day today);

    /// Appends "- [ ] <tag>-<n> <title>" to today's section, creating the
    /// section at the end of the document when there is none.
    /// With `reconcile`, the tag's counter is first raised to the highest
    /// number for that tag in the window.
    [[nodiscard]] Result<TaskId> create_task(LogDocument& doc,
                                             CounterState& counters,
                                             std::string_view tag,
                                             std::string_view title,
                                             bool reconcile = false) const;

    /// true when the task changed, false when it was already done
    [[nodiscard]] Result<bool> complete_task(LogDocument& doc, const TaskId& id) const;

    [[nodiscard]] Result<void> add_note(LogDocument& doc, const TaskId& id, std::string_view text) const;

    [[nodiscard]] std::vector<Match> search_tasks(const LogDocument& doc,
                                                  std::string_view query,
                                                  std::optional<std::string_view> tag = std::nullopt) const;

    /// Serialized text of the last section dated today, empty when absent
    [[nodiscard]] std::string today_section(const LogDocument& doc) const;

    /// "### <today>" in the configured date format
    [[nodiscard]] std::string today_header() const;

    [[nodiscard]] std::chrono::year_month_day today() const noexcept { return today_; }

private:
    DateFormat date_format_;
    std::chrono::year_month_day today_;
};

} // namespace tasklog
