// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "tasklog/config.hpp"
#include "tasklog/platform.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <type_traits>

namespace tasklog {

using json = nlohmann::json;

namespace {

// Copies `key` into `out` when present; false when present with the wrong type
template <typename T>
bool read_field(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if constexpr (std::is_same_v<T, bool>) {
        if (!it->is_boolean()) return false;
    } else if constexpr (std::is_integral_v<T>) {
        if (!it->is_number_integer()) return false;
        if (!it->is_number_unsigned() && it->get<std::int64_t>() < 0) return false;
    } else {
        if (!it->is_string()) return false;
    }
    out = it->get<T>();
    return true;
}

} // anonymous namespace

std::filesystem::path Config::resolved_log_path() const {
    std::string_view path = log_path;
    if (path == "~" || path.starts_with("~/")) {
        auto home = home_dir();
        if (!home.empty()) {
            return path.size() <= 2 ? home : home / std::filesystem::path(path.substr(2));
        }
    }
    return std::filesystem::path(path);
}

std::expected<Config, std::vector<ConfigError>> parse_config(std::string_view json_text) {
    Config config;

    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error&) {
        return std::unexpected(std::vector<ConfigError>{ConfigError::MalformedFile});
    }

    if (!root.is_object()) {
        return std::unexpected(std::vector<ConfigError>{ConfigError::MalformedFile});
    }

    std::uint64_t timeout_ms = static_cast<std::uint64_t>(config.lock_timeout.count());

    bool ok = read_field(root, "log_path", config.log_path) &&
              read_field(root, "date_format", config.date_format) &&
              read_field(root, "note_indent", config.note_indent) &&
              read_field(root, "scan_window_lines", config.scan_window_lines) &&
              read_field(root, "lock_timeout_ms", timeout_ms) &&
              read_field(root, "reconcile_counters", config.reconcile_counters);
    if (!ok) {
        return std::unexpected(std::vector<ConfigError>{ConfigError::MalformedFile});
    }
    // Clamp before narrowing so oversized values fail validation instead of wrapping
    auto max_ms = static_cast<std::uint64_t>(kMaxLockTimeout.count()) + 1;
    config.lock_timeout = std::chrono::milliseconds{static_cast<std::int64_t>(std::min(timeout_ms, max_ms))};

    auto valid = config.validate();
    if (!valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return config;
}

std::string dump_config(const Config& config) {
    json root = {
        {"log_path", config.log_path},
        {"date_format", config.date_format},
        {"note_indent", config.note_indent},
        {"scan_window_lines", config.scan_window_lines},
        {"lock_timeout_ms", config.lock_timeout.count()},
        {"reconcile_counters", config.reconcile_counters},
    };
    return root.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

std::string describe_config_errors(const std::vector<ConfigError>& errors) {
    std::string out;
    for (auto err : errors) {
        if (!out.empty()) out += "; ";
        out += config_error_message(err);
    }
    return out;
}

Paths Paths::from_env() {
    if (const char* env = std::getenv("TL_HOME"); env != nullptr && *env != '\0') {
        return Paths{std::filesystem::path(env)};
    }
    auto home = home_dir();
    if (home.empty()) {
        home = ".";
    }
    return Paths{home / ".config" / "tl"};
}

} // namespace tasklog
