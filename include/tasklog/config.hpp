// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include "date_format.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tasklog {

// ============================================================================
// Constants
// ============================================================================

inline constexpr std::string_view kDefaultLogPath = "~/.config/tl/log.md";
inline constexpr std::size_t kDefaultNoteIndent = 6;
inline constexpr std::size_t kDefaultScanWindowLines = 5000;
inline constexpr auto kDefaultLockTimeout = std::chrono::milliseconds{5000};

/// Constraints
inline constexpr std::size_t kMinNoteIndent = 1;
inline constexpr std::size_t kMaxNoteIndent = 32;
inline constexpr std::size_t kMinScanWindowLines = 1;
inline constexpr auto kMinLockTimeout = std::chrono::milliseconds{1};
inline constexpr auto kMaxLockTimeout = std::chrono::milliseconds{86'400'000};  // 24 hours

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    EmptyLogPath,
    InvalidDateFormat,     // Missing or repeated YYYY / MM / DD
    InvalidNoteIndent,     // Out of range [1, 32]
    InvalidScanWindow,     // Zero lines
    InvalidLockTimeout,    // Out of range [1, 86400000] ms
    MalformedFile,         // Not a JSON object, or a field of the wrong type
};

[[nodiscard]] constexpr std::string_view config_error_message(ConfigError err) noexcept {
    switch (err) {
        case ConfigError::EmptyLogPath:
            return "log_path cannot be empty";
        case ConfigError::InvalidDateFormat:
            return "date_format must contain YYYY, MM and DD exactly once";
        case ConfigError::InvalidNoteIndent:
            return "note_indent must be in range [1, 32]";
        case ConfigError::InvalidScanWindow:
            return "scan_window_lines must be at least 1";
        case ConfigError::InvalidLockTimeout:
            return "lock_timeout_ms must be in range [1, 86400000]";
        case ConfigError::MalformedFile:
            return "config file is not a valid JSON object of the expected shape";
    }
    return "unknown configuration error";
}

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    // Markdown log location; a leading "~/" expands to the home directory
    std::string log_path = std::string(kDefaultLogPath);

    // Pattern for section header dates (see DateFormat)
    std::string date_format = std::string(DateFormat::kDefaultPattern);

    // Leading spaces before "- " on note lines
    std::size_t note_indent = kDefaultNoteIndent;

    // Trailing lines of the log that are parsed and editable
    std::size_t scan_window_lines = kDefaultScanWindowLines;

    // Bounded wait for the cross-process lock
    std::chrono::milliseconds lock_timeout = kDefaultLockTimeout;

    // Raise a tag's counter to the highest number seen in the scan window
    // before allocating. Off by default: hand-written IDs are not reconciled.
    bool reconcile_counters = false;

    [[nodiscard]] std::filesystem::path resolved_log_path() const;

    [[nodiscard]] std::expected<void, std::vector<ConfigError>> validate() const {
        std::vector<ConfigError> errors;

        if (log_path.empty()) {
            errors.push_back(ConfigError::EmptyLogPath);
        }

        if (!DateFormat(date_format).is_complete()) {
            errors.push_back(ConfigError::InvalidDateFormat);
        }

        if (note_indent < kMinNoteIndent || note_indent > kMaxNoteIndent) {
            errors.push_back(ConfigError::InvalidNoteIndent);
        }

        if (scan_window_lines < kMinScanWindowLines) {
            errors.push_back(ConfigError::InvalidScanWindow);
        }

        if (lock_timeout < kMinLockTimeout || lock_timeout > kMaxLockTimeout) {
            errors.push_back(ConfigError::InvalidLockTimeout);
        }

        if (errors.empty()) {
            return {};
        }
        return std::unexpected(std::move(errors));
    }
};

// ============================================================================
// Config Builder (Fluent API)
// ============================================================================

class ConfigBuilder {
public:
    ConfigBuilder() = default;

    ConfigBuilder& log_path(std::string path) {
        config_.log_path = std::move(path);
        return *this;
    }

    ConfigBuilder& date_format(std::string pattern) {
        config_.date_format = std::move(pattern);
        return *this;
    }

    ConfigBuilder& note_indent(std::size_t spaces) {
        config_.note_indent = spaces;
        return *this;
    }

    ConfigBuilder& scan_window(std::size_t lines) {
        config_.scan_window_lines = lines;
        return *this;
    }

    ConfigBuilder& lock_timeout(std::chrono::milliseconds timeout) {
        config_.lock_timeout = timeout;
        return *this;
    }

    ConfigBuilder& reconcile_counters(bool enable = true) {
        config_.reconcile_counters = enable;
        return *this;
    }

    /// Build with validation
    [[nodiscard]] std::expected<Config, std::vector<ConfigError>> build() const {
        auto result = config_.validate();
        if (!result) {
            return std::unexpected(std::move(result.error()));
        }
        return config_;
    }

    /// Build without validation
    [[nodiscard]] Config build_unchecked() const {
        return config_;
    }

private:
    Config config_;
};

// ============================================================================
// JSON Persistence (config.json)
// ============================================================================

/// Parse and validate; missing fields keep their defaults
[[nodiscard]] std::expected<Config, std::vector<ConfigError>> parse_config(std::string_view json_text);

[[nodiscard]] std::string dump_config(const Config& config);

/// Joins messages for every error, "; " separated
[[nodiscard]] std::string describe_config_errors(const std::vector<ConfigError>& errors);

// ============================================================================
// Base Directory Layout
// ============================================================================

struct Paths {
    std::filesystem::path base_dir;

    [[nodiscard]] std::filesystem::path config_file() const { return base_dir / "config.json"; }
    [[nodiscard]] std::filesystem::path state_file() const { return base_dir / "state.json"; }
    [[nodiscard]] std::filesystem::path lock_file() const { return base_dir / "lock"; }

    /// $TL_HOME if set, else ~/.config/tl
    [[nodiscard]] static Paths from_env();
};

} // namespace tasklog
