// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "tasklog/formatter.hpp"
#include "utils.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace tasklog {

enum class TokenType : std::uint8_t {
    Literal,
    Level,
    LevelFull,
    Time,
    Date,
    Pid,
    Tid,
    Tag,
    File,
    Line,
    Func,
    Message,
    Newline
};

struct Token {
    TokenType type;
    std::string literal;  // Only used for Literal type
};

namespace {

const std::unordered_map<std::string_view, TokenType>& get_token_map() {
    static const std::unordered_map<std::string_view, TokenType> map = {
        {"level", TokenType::Level},
        {"Level", TokenType::LevelFull},
        {"time",  TokenType::Time},
        {"date",  TokenType::Date},
        {"pid",   TokenType::Pid},
        {"tid",   TokenType::Tid},
        {"tag",   TokenType::Tag},
        {"file",  TokenType::File},
        {"line",  TokenType::Line},
        {"func",  TokenType::Func},
        {"msg",   TokenType::Message},
        {"n",     TokenType::Newline},
    };
    return map;
}

template <typename Int>
void append_int(std::string& out, Int value) {
    std::array<char, 24> buf;
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    out.append(buf.data(), static_cast<std::size_t>(ptr - buf.data()));
}

} // anonymous namespace

// ============================================================================
// Formatter Implementation
// ============================================================================

struct Formatter::Impl {
    std::string pattern;
    std::vector<Token> tokens;

    void parse_pattern(std::string_view pat) {
        pattern = std::string(pat);
        tokens.clear();

        const auto& token_map = get_token_map();
        std::string_view remaining = pat;
        std::string current_literal;

        while (!remaining.empty()) {
            auto pos = remaining.find('{');

            if (pos == std::string_view::npos) {
                current_literal.append(remaining);
                remaining = {};
            } else if (pos > 0) {
                current_literal.append(remaining.substr(0, pos));
                remaining.remove_prefix(pos);
            } else {
                auto end_pos = remaining.find('}');
                if (end_pos == std::string_view::npos) {
                    // Unterminated, treat as literal
                    current_literal.append(remaining);
                    remaining = {};
                    continue;
                }

                auto token_name = remaining.substr(1, end_pos - 1);
                remaining.remove_prefix(end_pos + 1);

                if (auto it = token_map.find(token_name); it != token_map.end()) {
                    if (!current_literal.empty()) {
                        tokens.push_back({TokenType::Literal, std::move(current_literal)});
                        current_literal.clear();
                    }
                    tokens.push_back({it->second, {}});
                } else {
                    current_literal.push_back('{');
                    current_literal.append(token_name);
                    current_literal.push_back('}');
                }
            }
        }

        if (!current_literal.empty()) {
            tokens.push_back({TokenType::Literal, std::move(current_literal)});
        }
    }

    std::string format(const Record& record) const {
        std::string out;
        out.reserve(128 + record.message.size());

        for (const auto& token : tokens) {
            switch (token.type) {
                case TokenType::Literal:
                    out += token.literal;
                    break;
                case TokenType::Message:
                    out += record.message;
                    break;
                case TokenType::Tag:
                    out += record.tag;
                    break;
                case TokenType::Time:
                    out += format_timestamp(record.timestamp);
                    break;
                case TokenType::Date:
                    out += format_date(record.timestamp);
                    break;
                case TokenType::Level:
                    out += level_name(record.level);
                    break;
                case TokenType::LevelFull:
                    out += level_full_name(record.level);
                    break;
                case TokenType::Pid:
                    append_int(out, record.pid);
                    break;
                case TokenType::Tid:
                    append_int(out, record.tid);
                    break;
                case TokenType::File:
                    out += extract_filename(record.location.file_name());
                    break;
                case TokenType::Line:
                    append_int(out, record.location.line());
                    break;
                case TokenType::Func:
                    out += record.location.function_name();
                    break;
                case TokenType::Newline:
                    out += '\n';
                    break;
            }
        }
        return out;
    }
};

// ============================================================================
// Formatter Public API
// ============================================================================

Formatter::Formatter() : impl_(std::make_unique<Impl>()) {
    impl_->parse_pattern(kDefaultPattern);
}

Formatter::Formatter(std::string_view pattern) : impl_(std::make_unique<Impl>()) {
    impl_->parse_pattern(pattern);
}

Formatter::~Formatter() = default;

Formatter::Formatter(Formatter&&) noexcept = default;
Formatter& Formatter::operator=(Formatter&&) noexcept = default;

void Formatter::set_pattern(std::string_view pattern) {
    impl_->parse_pattern(pattern);
}

std::string_view Formatter::pattern() const noexcept {
    return impl_->pattern;
}

std::string Formatter::format(const Record& record) const {
    return impl_->format(record);
}

} // namespace tasklog
