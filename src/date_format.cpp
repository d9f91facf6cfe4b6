// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "tasklog/date_format.hpp"
#include "utils.hpp"

#include <charconv>
#include <ctime>
#include <format>

namespace tasklog {

namespace {

struct TokenSpec {
    std::string_view text;
    int digits;
};

constexpr TokenSpec kYearSpec{"YYYY", 4};
constexpr TokenSpec kMonthSpec{"MM", 2};
constexpr TokenSpec kDaySpec{"DD", 2};

// Reads exactly `digits` decimal digits from the front of `text`
std::optional<int> take_digits(std::string_view& text, int digits) {
    if (text.size() < static_cast<std::size_t>(digits)) return std::nullopt;

    auto field = text.substr(0, digits);
    if (!is_all_digits(field)) return std::nullopt;

    int value = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc{} || ptr != field.data() + field.size()) {
        return std::nullopt;
    }
    text.remove_prefix(digits);
    return value;
}

} // anonymous namespace

// ============================================================================
// DateFormat Implementation
// ============================================================================

DateFormat::DateFormat() {
    parse_pattern(kDefaultPattern);
}

DateFormat::DateFormat(std::string_view pattern) {
    parse_pattern(pattern);
}

void DateFormat::set_pattern(std::string_view pattern) {
    parse_pattern(pattern);
}

void DateFormat::parse_pattern(std::string_view pat) {
    pattern_ = std::string(pat);
    tokens_.clear();

    std::string current_literal;
    std::string_view remaining = pat;

    auto flush_literal = [&] {
        if (!current_literal.empty()) {
            tokens_.push_back({TokenType::Literal, std::move(current_literal)});
            current_literal.clear();
        }
    };

    while (!remaining.empty()) {
        if (remaining.starts_with(kYearSpec.text)) {
            flush_literal();
            tokens_.push_back({TokenType::Year, {}});
            remaining.remove_prefix(kYearSpec.text.size());
        } else if (remaining.starts_with(kMonthSpec.text)) {
            flush_literal();
            tokens_.push_back({TokenType::Month, {}});
            remaining.remove_prefix(kMonthSpec.text.size());
        } else if (remaining.starts_with(kDaySpec.text)) {
            flush_literal();
            tokens_.push_back({TokenType::Day, {}});
            remaining.remove_prefix(kDaySpec.text.size());
        } else {
            current_literal.push_back(remaining.front());
            remaining.remove_prefix(1);
        }
    }
    flush_literal();
}

bool DateFormat::is_complete() const noexcept {
    int years = 0, months = 0, days = 0;
    for (const auto& token : tokens_) {
        switch (token.type) {
            case TokenType::Year:  ++years;  break;
            case TokenType::Month: ++months; break;
            case TokenType::Day:   ++days;   break;
            case TokenType::Literal: break;
        }
    }
    return years == 1 && months == 1 && days == 1;
}

std::string DateFormat::format(const std::chrono::year_month_day& date) const {
    std::string out;
    out.reserve(pattern_.size());

    for (const auto& token : tokens_) {
        switch (token.type) {
            case TokenType::Literal:
                out.append(token.literal);
                break;
            case TokenType::Year:
                std::format_to(std::back_inserter(out), "{:04d}", static_cast<int>(date.year()));
                break;
            case TokenType::Month:
                std::format_to(std::back_inserter(out), "{:02d}",
                               static_cast<unsigned>(date.month()));
                break;
            case TokenType::Day:
                std::format_to(std::back_inserter(out), "{:02d}",
                               static_cast<unsigned>(date.day()));
                break;
        }
    }
    return out;
}

std::optional<std::chrono::year_month_day> DateFormat::parse(std::string_view text) const {
    if (!is_complete()) return std::nullopt;

    int year = 0, month = 0, day = 0;
    std::string_view remaining = text;

    for (const auto& token : tokens_) {
        switch (token.type) {
            case TokenType::Literal:
                if (!remaining.starts_with(token.literal)) return std::nullopt;
                remaining.remove_prefix(token.literal.size());
                break;
            case TokenType::Year: {
                auto v = take_digits(remaining, kYearSpec.digits);
                if (!v) return std::nullopt;
                year = *v;
                break;
            }
            case TokenType::Month: {
                auto v = take_digits(remaining, kMonthSpec.digits);
                if (!v) return std::nullopt;
                month = *v;
                break;
            }
            case TokenType::Day: {
                auto v = take_digits(remaining, kDaySpec.digits);
                if (!v) return std::nullopt;
                day = *v;
                break;
            }
        }
    }

    if (!remaining.empty()) return std::nullopt;

    std::chrono::year_month_day date{std::chrono::year{year},
                                     std::chrono::month{static_cast<unsigned>(month)},
                                     std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok()) return std::nullopt;
    return date;
}

std::chrono::year_month_day local_today() {
    auto tm_buf = localtime_safe(static_cast<std::time_t>(get_timestamp().tv_sec));
    return std::chrono::year_month_day{
        std::chrono::year{1900 + tm_buf.tm_year},
        std::chrono::month{static_cast<unsigned>(1 + tm_buf.tm_mon)},
        std::chrono::day{static_cast<unsigned>(tm_buf.tm_mday)}};
}

} // namespace tasklog
