// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "tasklog/counter_state.hpp"
#include "tasklog/classifier.hpp"
#include "atomic_file.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <system_error>

namespace tasklog {

using json = nlohmann::json;

Result<CounterState> CounterState::parse(std::string_view json_text) {
    if (trim(json_text).empty()) {
        return CounterState{};
    }

    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return make_error(ErrorCode::CounterStateCorrupt, e.what());
    }

    if (!root.is_object()) {
        return make_error(ErrorCode::CounterStateCorrupt, "expected a JSON object");
    }

    Map counters;
    for (const auto& [tag, value] : root.items()) {
        if (!is_valid_tag(tag)) {
            return make_error(ErrorCode::CounterStateCorrupt, std::format("invalid tag '{}'", tag));
        }
        if (!value.is_number_unsigned()) {
            return make_error(ErrorCode::CounterStateCorrupt,
                              std::format("counter for '{}' is not a non-negative integer", tag));
        }
        counters.emplace(tag, value.get<std::uint64_t>());
    }
    return CounterState{std::move(counters)};
}

Result<CounterState> CounterState::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return make_error(ErrorCode::IOFailure, std::format("{}: {}", path.string(), ec.message()));
        }
        return make_error(ErrorCode::NotInitialized, std::format("missing {}", path.string()));
    }

    auto text = read_file(path);
    if (!text) {
        return std::unexpected(std::move(text.error()));
    }
    return parse(*text);
}

std::string CounterState::dump() const {
    json root = json::object();
    for (const auto& [tag, last] : counters_) {
        root[tag] = last;
    }
    return root.dump(2) + "\n";
}

std::uint64_t CounterState::last_allocated(std::string_view tag) const {
    auto it = counters_.find(tag);
    return it == counters_.end() ? 0 : it->second;
}

std::uint64_t CounterState::peek(std::string_view tag) const {
    return last_allocated(tag) + 1;
}

std::uint64_t CounterState::reserve(std::string_view tag) {
    auto next = peek(tag);
    counters_.insert_or_assign(std::string(tag), next);
    dirty_ = true;
    return next;
}

void CounterState::raise_to(std::string_view tag, std::uint64_t last_used) {
    if (last_used <= last_allocated(tag)) {
        return;
    }
    counters_.insert_or_assign(std::string(tag), last_used);
    dirty_ = true;
}

} // namespace tasklog
