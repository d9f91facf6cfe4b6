// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "utils.hpp"

#include <algorithm>
#include <format>

namespace tasklog {

std::tm localtime_safe(std::time_t time) {
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    return tm_buf;
}

// ============================================================================
// Time Formatting Functions
// ============================================================================

std::string format_timestamp(const Timestamp& tv) {
    auto tm_buf = localtime_safe(static_cast<std::time_t>(tv.tv_sec));

    return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
        1900 + tm_buf.tm_year, 1 + tm_buf.tm_mon, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(tv.tv_usec / 1000));
}

std::string format_date(const Timestamp& tv) {
    auto tm_buf = localtime_safe(static_cast<std::time_t>(tv.tv_sec));

    return std::format("{:04d}-{:02d}-{:02d}",
        1900 + tm_buf.tm_year, 1 + tm_buf.tm_mon, tm_buf.tm_mday);
}

std::string format_date_compact(const Timestamp& tv) {
    auto tm_buf = localtime_safe(static_cast<std::time_t>(tv.tv_sec));

    return std::format("{:04d}{:02d}{:02d}",
        1900 + tm_buf.tm_year, 1 + tm_buf.tm_mon, tm_buf.tm_mday);
}

// ============================================================================
// Text Functions
// ============================================================================

bool is_all_digits(std::string_view text) noexcept {
    if (text.empty()) return false;
    return std::all_of(text.begin(), text.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
}

std::string to_lower_ascii(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

bool contains_icase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    return to_lower_ascii(haystack).find(to_lower_ascii(needle)) != std::string::npos;
}

std::string_view trim(std::string_view text) noexcept {
    constexpr std::string_view kSpace = " \t\r\n";
    auto first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(kSpace);
    return text.substr(first, last - first + 1);
}

bool has_line_break(std::string_view text) noexcept {
    return text.find_first_of("\r\n") != std::string_view::npos;
}

bool is_valid_utf8(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t extra = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            extra = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            extra = 2;
            if (lead == 0xE0) lo = 0xA0;        // overlong
            if (lead == 0xED) hi = 0x9F;        // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            extra = 3;
            if (lead == 0xF0) lo = 0x90;        // overlong
            if (lead == 0xF4) hi = 0x8F;        // above U+10FFFF
        } else {
            return false;
        }

        if (text.size() - i <= extra) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            auto c = static_cast<unsigned char>(text[i + k]);
            if (k == 1 ? (c < lo || c > hi) : (c < 0x80 || c > 0xBF)) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

} // namespace tasklog
