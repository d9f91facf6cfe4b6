// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "tasklog/date_format.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace tasklog {
namespace {

constexpr std::chrono::year_month_day make_date(int y, unsigned m, unsigned d) {
    return std::chrono::year_month_day{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
}

// ============================================================================
// Pattern
// ============================================================================

TEST(DateFormatTest, DefaultPattern) {
    DateFormat fmt;
    EXPECT_EQ(fmt.pattern(), "DD/MM/YYYY");
    EXPECT_TRUE(fmt.is_complete());
}

TEST(DateFormatTest, IncompletePatterns) {
    EXPECT_FALSE(DateFormat("DD/MM").is_complete());
    EXPECT_FALSE(DateFormat("YYYY-MM-DD-DD").is_complete());
    EXPECT_FALSE(DateFormat("").is_complete());
    EXPECT_FALSE(DateFormat("today").is_complete());
}

TEST(DateFormatTest, SetPattern) {
    DateFormat fmt;
    fmt.set_pattern("YYYY-MM-DD");
    EXPECT_EQ(fmt.pattern(), "YYYY-MM-DD");
    EXPECT_EQ(fmt.format(make_date(2026, 10, 19)), "2026-10-19");
}

// ============================================================================
// Formatting
// ============================================================================

TEST(DateFormatTest, FormatPadsFields) {
    DateFormat fmt;
    EXPECT_EQ(fmt.format(make_date(2024, 3, 7)), "07/03/2024");
}

TEST(DateFormatTest, FormatKeepsLiterals) {
    DateFormat fmt("Week of DD.MM.YYYY");
    EXPECT_EQ(fmt.format(make_date(2025, 12, 1)), "Week of 01.12.2025");
}

// ============================================================================
// Parsing
// ============================================================================

TEST(DateFormatTest, ParseValid) {
    DateFormat fmt;
    auto date = fmt.parse("19/10/2026");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(*date, make_date(2026, 10, 19));
}

TEST(DateFormatTest, ParseIsoPattern) {
    DateFormat fmt("YYYY-MM-DD");
    auto date = fmt.parse("2024-02-29");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(*date, make_date(2024, 2, 29));
}

TEST(DateFormatTest, ParseRejectsShortFields) {
    DateFormat fmt;
    EXPECT_FALSE(fmt.parse("9/10/2026").has_value());
    EXPECT_FALSE(fmt.parse("19/1/2026").has_value());
    EXPECT_FALSE(fmt.parse("19/10/26").has_value());
}

TEST(DateFormatTest, ParseRejectsTrailingText) {
    DateFormat fmt;
    EXPECT_FALSE(fmt.parse("19/10/2026 ").has_value());
    EXPECT_FALSE(fmt.parse("19/10/2026 notes").has_value());
}

TEST(DateFormatTest, ParseRejectsWrongLiterals) {
    DateFormat fmt;
    EXPECT_FALSE(fmt.parse("19-10-2026").has_value());
}

TEST(DateFormatTest, ParseRejectsSigns) {
    DateFormat fmt;
    EXPECT_FALSE(fmt.parse("-1/10/2026").has_value());
    EXPECT_FALSE(fmt.parse("+1/10/2026").has_value());
}

TEST(DateFormatTest, ParseRejectsImpossibleDates) {
    DateFormat fmt;
    EXPECT_FALSE(fmt.parse("31/02/2026").has_value());
    EXPECT_FALSE(fmt.parse("29/02/2025").has_value());
    EXPECT_FALSE(fmt.parse("00/10/2026").has_value());
    EXPECT_FALSE(fmt.parse("10/13/2026").has_value());
}

TEST(DateFormatTest, ParseWithIncompletePatternFails) {
    DateFormat fmt("DD/MM");
    EXPECT_FALSE(fmt.parse("19/10").has_value());
}

TEST(DateFormatTest, FormatThenParse) {
    DateFormat fmt("DD.MM.YYYY");
    auto date = make_date(2027, 1, 31);
    EXPECT_EQ(fmt.parse(fmt.format(date)), date);
}

TEST(DateFormatTest, LocalTodayIsValid) {
    EXPECT_TRUE(local_today().ok());
}

} // namespace
} // namespace tasklog
