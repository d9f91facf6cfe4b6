// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include "types.hpp"
#include "config.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tasklog {

// ============================================================================
// TaskLog - Public API over one markdown task log
// ============================================================================
//
// Every mutating call is one critical section under the lock file in the
// base directory: read log and counters, apply one operation to the trailing
// scan window, write counters then log atomically. Queries read without the
// lock; they always see a complete file because writes replace by rename.
//
// Usage:
//   auto log = TaskLog::open(Paths::from_env());
//   if (!log) { ... log.error().message() ... }
//   auto id = log->create_task("dev", "implement login flow");
//
// ============================================================================

class TaskLog {
public:
    using TodayProvider = std::function<std::chrono::year_month_day()>;

    /**
     * @brief Prepare a base directory
     *
     * Creates the directory, config.json and state.json when missing, and the
     * log (holding only today's header) when missing. An existing log is
     * never touched. A given `log_path` is stored in config.json.
     */
    [[nodiscard]] static Result<void> init(const Paths& paths,
                                           std::optional<std::string> log_path = std::nullopt);

    /**
     * @brief Load config.json from the base directory
     * @return NotInitialized without a config file, ConfigInvalid when it
     *         does not validate
     */
    [[nodiscard]] static Result<TaskLog> open(const Paths& paths);

    TaskLog(Paths paths, Config config);
    ~TaskLog();

    // Move-only
    TaskLog(TaskLog&&) noexcept;
    TaskLog& operator=(TaskLog&&) noexcept;
    TaskLog(const TaskLog&) = delete;
    TaskLog& operator=(const TaskLog&) = delete;

    // ========================================================================
    // Mutations
    // ========================================================================

    [[nodiscard]] Result<TaskId> create_task(std::string_view tag, std::string_view title);

    /// Succeeds without writing when the task is already done
    [[nodiscard]] Result<void> complete_task(std::string_view id);

    [[nodiscard]] Result<void> add_note(std::string_view id, std::string_view text);

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] Result<std::vector<Match>> search_tasks(
        std::string_view query,
        std::optional<std::string_view> tag = std::nullopt) const;

    [[nodiscard]] Result<std::string> get_today_section() const;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] const Config& config() const noexcept;
    [[nodiscard]] const Paths& paths() const noexcept;

    /// Absolute location of the markdown log; relative config paths are
    /// taken against the base directory
    [[nodiscard]] std::filesystem::path log_file() const;

    /// Replaces the local calendar date (tests)
    void set_today_provider(TodayProvider provider);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tasklog
