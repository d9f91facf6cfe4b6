// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include "types.hpp"
#include "formatter.hpp"

#include <filesystem>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace tasklog {

inline constexpr std::string_view kDefaultLoggerName = "tl";

// ============================================================================
// Diagnostic Logger Options
// ============================================================================

struct LogOptions {
    Level min_level = Level::Info;

    // Mirror records to stderr
    bool console_output = false;

    // Directory for daily diagnostic files; empty disables file output
    std::filesystem::path log_dir;

    // Registration name and file name prefix
    std::string name_prefix = std::string(kDefaultLoggerName);

    // Empty keeps Formatter::kDefaultPattern
    std::string format_pattern;
};

// ============================================================================
// Logger - Diagnostic logging for the library and its front ends
// ============================================================================
//
// Diagnostics never touch the task log itself and never fail an operation:
// a sink that cannot write drops the record.
// ============================================================================

class Logger {
public:
    /**
     * @brief Get logger by name, or the default logger if name is empty
     * @return Pointer to the logger, nullptr if none was created
     */
    [[nodiscard]] static Logger* instance(const std::string& name = "");

    /**
     * @brief Create and register a logger under options.name_prefix
     * @return Pointer to created logger, nullptr if the name is taken
     */
    static Logger* create(const LogOptions& options);

    static bool release(const std::string& name = "");

    static void release_all();

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    [[nodiscard]] const std::string& name() const noexcept;

    [[nodiscard]] const LogOptions& options() const noexcept;

    void set_level(Level level);
    [[nodiscard]] Level level() const noexcept;

    void set_pattern(std::string_view pattern);

    /// Path of the file sink's current file, empty without one
    [[nodiscard]] std::filesystem::path current_log_path() const;

    [[nodiscard]] bool is_enabled(Level level) const noexcept;

    void log(Level level,
             std::string_view tag,
             std::string_view message,
             const std::source_location& loc = std::source_location::current());

    template<typename... Args>
    void log(Level level,
             std::string_view tag,
             std::format_string<Args...> fmt,
             Args&&... args) {
        if (!is_enabled(level)) return;
        log(level, tag, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void debug(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
        log(Level::Debug, tag, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
        log(Level::Info, tag, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
        log(Level::Warn, tag, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
        log(Level::Error, tag, fmt, std::forward<Args>(args)...);
    }

    void flush();

private:
    explicit Logger(std::string name);

    void init(const LogOptions& options);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

// These use the default logger and do nothing when it has not been created.

#define TASKLOG_D(tag, ...) \
    do { if (auto* _l = ::tasklog::Logger::instance()) _l->debug(tag, __VA_ARGS__); } while(0)

#define TASKLOG_I(tag, ...) \
    do { if (auto* _l = ::tasklog::Logger::instance()) _l->info(tag, __VA_ARGS__); } while(0)

#define TASKLOG_W(tag, ...) \
    do { if (auto* _l = ::tasklog::Logger::instance()) _l->warn(tag, __VA_ARGS__); } while(0)

#define TASKLOG_E(tag, ...) \
    do { if (auto* _l = ::tasklog::Logger::instance()) _l->error(tag, __VA_ARGS__); } while(0)

} // namespace tasklog
