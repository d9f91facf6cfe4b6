// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tasklog {

// ============================================================================
// Date Pattern Tokens
// ============================================================================
//
// Supported tokens:
//   YYYY  - four-digit year
//   MM    - two-digit month (01-12)
//   DD    - two-digit day of month
//
// Every other character is a literal and must match exactly when parsing.
// A usable pattern contains each token exactly once.
//
// Examples:
//   "DD/MM/YYYY"  -> 19/10/2026
//   "YYYY-MM-DD"  -> 2026-10-19
//
// ============================================================================

class DateFormat {
public:
    static constexpr std::string_view kDefaultPattern = "DD/MM/YYYY";

    DateFormat();
    explicit DateFormat(std::string_view pattern);

    void set_pattern(std::string_view pattern);

    [[nodiscard]] std::string_view pattern() const noexcept { return pattern_; }

    // True when the pattern has exactly one YYYY, MM and DD
    [[nodiscard]] bool is_complete() const noexcept;

    [[nodiscard]] std::string format(const std::chrono::year_month_day& date) const;

    // Exact parse: every literal must match, fields must have their full
    // digit count, no trailing input, and the date must exist on the calendar.
    [[nodiscard]] std::optional<std::chrono::year_month_day> parse(std::string_view text) const;

private:
    enum class TokenType : std::uint8_t {
        Literal,
        Year,
        Month,
        Day
    };

    struct Token {
        TokenType type;
        std::string literal;  // Only used for Literal type
    };

    void parse_pattern(std::string_view pattern);

    std::string pattern_;
    std::vector<Token> tokens_;
};

// Current local calendar date
[[nodiscard]] std::chrono::year_month_day local_today();

} // namespace tasklog
