// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include "types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace tasklog {

// ============================================================================
// Counter State
// ============================================================================
//
// Per-tag record of the last allocated number, persisted as a JSON object
// of the form {"dev": 4, "ops": 12}. A tag with no entry has never
// allocated; its first ID is <tag>-1. Counters only move forward.
// ============================================================================

class CounterState {
public:
    using Map = std::map<std::string, std::uint64_t, std::less<>>;

    CounterState() = default;
    explicit CounterState(Map counters) : counters_(std::move(counters)) {}

    /// Empty or whitespace-only text is an empty state
    [[nodiscard]] static Result<CounterState> parse(std::string_view json_text);

    /// NotInitialized when the file does not exist
    [[nodiscard]] static Result<CounterState> load(const std::filesystem::path& path);

    [[nodiscard]] std::string dump() const;

    /// Number the next reserve() for `tag` would hand out
    [[nodiscard]] std::uint64_t peek(std::string_view tag) const;

    /// Allocates the next number for `tag` and advances the counter
    std::uint64_t reserve(std::string_view tag);

    /// Moves the counter up to `last_used`; never moves it down
    void raise_to(std::string_view tag, std::uint64_t last_used);

    /// 0 when the tag has never allocated
    [[nodiscard]] std::uint64_t last_allocated(std::string_view tag) const;

    [[nodiscard]] bool dirty() const noexcept { return dirty_; }
    [[nodiscard]] const Map& counters() const noexcept { return counters_; }

private:
    Map counters_;
    bool dirty_ = false;
};

} // namespace tasklog
