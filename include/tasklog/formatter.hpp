// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include "types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace tasklog {

// ============================================================================
// Diagnostic Format Pattern Tokens
// ============================================================================
//
// Supported patterns:
//   {level}      - Single letter level (D, I, W, E)
//   {Level}      - Full level name (DEBUG, INFO, etc.)
//   {time}       - Timestamp (YYYY-MM-DD HH:MM:SS.mmm)
//   {date}       - Date only (YYYY-MM-DD)
//   {pid}        - Process ID
//   {tid}        - Thread ID
//   {tag}        - Log tag
//   {file}       - Source file name (without path)
//   {line}       - Source line number
//   {func}       - Function name
//   {msg}        - Log message
//   {n}          - Newline
//
// Unknown tokens are emitted literally, braces included.
//
// ============================================================================

class Formatter {
public:
    static constexpr std::string_view kDefaultPattern =
        "[{level}][{time}][{pid}][{tag}] {msg}{n}";

    // Minimal pattern for console
    static constexpr std::string_view kConsolePattern =
        "[{level}][{tag}] {msg}{n}";

    Formatter();
    explicit Formatter(std::string_view pattern);
    ~Formatter();

    // Non-copyable, movable
    Formatter(const Formatter&) = delete;
    Formatter& operator=(const Formatter&) = delete;
    Formatter(Formatter&&) noexcept;
    Formatter& operator=(Formatter&&) noexcept;

    void set_pattern(std::string_view pattern);

    [[nodiscard]] std::string_view pattern() const noexcept;

    [[nodiscard]] std::string format(const Record& record) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

[[nodiscard]] constexpr std::string_view extract_filename(std::string_view path) noexcept {
    if (auto pos = path.find_last_of("/\\"); pos != std::string_view::npos) {
        return path.substr(pos + 1);
    }
    return path;
}

} // namespace tasklog
