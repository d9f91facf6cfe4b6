// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors
//
// TaskLog - Persistence around the mutation engine
//
//   TaskLog (this file)    - Locking, loading, write-back ordering
//       |
//       v per operation
//   MutationEngine         - Pure edits of the windowed LogDocument
//   FileLock / atomic_file - Cross-process exclusion, rename-based writes

#include "tasklog/task_log.hpp"
#include "tasklog/classifier.hpp"
#include "tasklog/counter_state.hpp"
#include "tasklog/document.hpp"
#include "tasklog/engine.hpp"
#include "tasklog/logger.hpp"
#include "atomic_file.hpp"
#include "file_lock.hpp"
#include "utils.hpp"

#include <format>
#include <system_error>

namespace tasklog {

namespace {

constexpr std::string_view kTag = "tasklog";

using Operation = std::function<Result<bool>(const MutationEngine&, LogDocument&, CounterState&)>;

std::filesystem::path log_file_for(const Paths& paths, const Config& config) {
    auto path = config.resolved_log_path();
    if (path.is_relative()) {
        path = paths.base_dir / path;
    }
    return path;
}

Result<bool> file_exists(const std::filesystem::path& path) {
    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        return make_error(ErrorCode::IOFailure, std::format("{}: {}", path.string(), ec.message()));
    }
    return exists;
}

Result<void> ensure_directory(const std::filesystem::path& dir) {
    if (dir.empty()) {
        return {};
    }
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return make_error(ErrorCode::IOFailure, std::format("cannot create {}: {}", dir.string(), ec.message()));
    }
    return {};
}

Result<Config> load_config(const std::filesystem::path& path) {
    auto text = read_file(path);
    if (!text) {
        return std::unexpected(std::move(text.error()));
    }
    auto config = parse_config(*text);
    if (!config) {
        return make_error(ErrorCode::ConfigInvalid,
                          std::format("{}: {}", path.string(), describe_config_errors(config.error())));
    }
    return std::move(*config);
}

Result<TaskId> parse_id_argument(std::string_view text) {
    auto id = parse_task_id(trim(text));
    if (!id) {
        return make_error(ErrorCode::InvalidInput, std::format("'{}' is not a task ID (<tag>-<number>)", text));
    }
    return std::move(*id);
}

} // anonymous namespace

// ============================================================================
// TaskLog Implementation
// ============================================================================

struct TaskLog::Impl {
    Paths paths;
    Config config;
    LineClassifier classifier;
    TodayProvider today = [] { return local_today(); };

    Impl(Paths p, Config c)
        : paths(std::move(p))
        , config(std::move(c))
        , classifier(DateFormat(config.date_format), config.note_indent) {}

    std::filesystem::path log_file() const {
        return log_file_for(paths, config);
    }

    MutationEngine make_engine() const {
        return MutationEngine(classifier.date_format(), today());
    }

    Result<LogDocument> load_document() const {
        auto path = log_file();
        auto exists = file_exists(path);
        if (!exists) {
            return std::unexpected(std::move(exists.error()));
        }
        if (!*exists) {
            return make_error(ErrorCode::NotInitialized, std::format("missing log {}", path.string()));
        }

        auto content = read_file(path);
        if (!content) {
            return std::unexpected(std::move(content.error()));
        }
        return DocumentBuilder(classifier, config.scan_window_lines).build(*content);
    }

    // Lock, load, apply, write back. The operation returns whether the log
    // changed; counters are written whenever they moved.
    Result<void> run_locked(std::string_view name, const Operation& op) {
        auto lock = FileLock::acquire(paths.lock_file(), config.lock_timeout);
        if (!lock) {
            TASKLOG_W(kTag, "{}: {}", name, lock.error().message());
            return std::unexpected(std::move(lock.error()));
        }

        auto doc = load_document();
        if (!doc) {
            return std::unexpected(std::move(doc.error()));
        }
        auto counters = CounterState::load(paths.state_file());
        if (!counters) {
            TASKLOG_E(kTag, "{}: {}", name, counters.error().message());
            return std::unexpected(std::move(counters.error()));
        }

        auto changed = op(make_engine(), *doc, *counters);
        if (!changed) {
            TASKLOG_D(kTag, "{} rejected: {}", name, changed.error().message());
            return std::unexpected(std::move(changed.error()));
        }

        // Counters first: a crash between the two writes burns an ID
        // instead of handing the same one out twice.
        if (counters->dirty()) {
            auto written = write_file_atomic(paths.state_file(), counters->dump());
            if (!written) {
                TASKLOG_E(kTag, "{}: {}", name, written.error().message());
                return written;
            }
        }
        if (*changed) {
            auto written = write_file_atomic(log_file(), doc->serialize());
            if (!written) {
                TASKLOG_E(kTag, "{}: {}", name, written.error().message());
                return written;
            }
        }
        return {};
    }
};

// ============================================================================
// Static Factory Methods
// ============================================================================

Result<void> TaskLog::init(const Paths& paths, std::optional<std::string> log_path) {
    if (log_path && !is_valid_utf8(*log_path)) {
        return make_error(ErrorCode::InvalidInput, "log path must be valid UTF-8");
    }
    if (auto dir = ensure_directory(paths.base_dir); !dir) {
        return dir;
    }

    // An existing config's timeout applies; it is re-read under the lock
    auto timeout = kDefaultLockTimeout;
    if (auto existing = load_config(paths.config_file()); existing) {
        timeout = existing->lock_timeout;
    }

    auto lock = FileLock::acquire(paths.lock_file(), timeout);
    if (!lock) {
        return std::unexpected(std::move(lock.error()));
    }

    auto config_exists = file_exists(paths.config_file());
    if (!config_exists) {
        return std::unexpected(std::move(config_exists.error()));
    }

    Config config;
    bool config_dirty = false;
    if (*config_exists) {
        auto loaded = load_config(paths.config_file());
        if (!loaded) {
            return std::unexpected(std::move(loaded.error()));
        }
        config = std::move(*loaded);
    } else {
        config.log_path = (paths.base_dir / "log.md").string();
        config_dirty = true;
    }

    if (log_path && *log_path != config.log_path) {
        config.log_path = std::move(*log_path);
        if (auto valid = config.validate(); !valid) {
            return make_error(ErrorCode::ConfigInvalid, describe_config_errors(valid.error()));
        }
        config_dirty = true;
    }

    if (config_dirty) {
        if (auto written = write_file_atomic(paths.config_file(), dump_config(config)); !written) {
            return written;
        }
        TASKLOG_I(kTag, "wrote {}", paths.config_file().string());
    }

    auto state_exists = file_exists(paths.state_file());
    if (!state_exists) {
        return std::unexpected(std::move(state_exists.error()));
    }
    if (!*state_exists) {
        if (auto written = write_file_atomic(paths.state_file(), CounterState{}.dump()); !written) {
            return written;
        }
    }

    auto log_file = log_file_for(paths, config);
    auto log_exists = file_exists(log_file);
    if (!log_exists) {
        return std::unexpected(std::move(log_exists.error()));
    }
    if (!*log_exists) {
        if (auto dir = ensure_directory(log_file.parent_path()); !dir) {
            return dir;
        }
        MutationEngine engine(DateFormat(config.date_format), local_today());
        if (auto written = write_file_atomic(log_file, engine.today_header() + "\n"); !written) {
            return written;
        }
        TASKLOG_I(kTag, "created log {}", log_file.string());
    }
    return {};
}

Result<TaskLog> TaskLog::open(const Paths& paths) {
    auto exists = file_exists(paths.config_file());
    if (!exists) {
        return std::unexpected(std::move(exists.error()));
    }
    if (!*exists) {
        return make_error(ErrorCode::NotInitialized, std::format("missing {}", paths.config_file().string()));
    }

    auto config = load_config(paths.config_file());
    if (!config) {
        return std::unexpected(std::move(config.error()));
    }
    return TaskLog(paths, std::move(*config));
}

// ============================================================================
// Constructors / Destructor
// ============================================================================

TaskLog::TaskLog(Paths paths, Config config)
    : impl_(std::make_unique<Impl>(std::move(paths), std::move(config))) {}

TaskLog::~TaskLog() = default;

TaskLog::TaskLog(TaskLog&&) noexcept = default;
TaskLog& TaskLog::operator=(TaskLog&&) noexcept = default;

// ============================================================================
// Mutations
// ============================================================================

Result<TaskId> TaskLog::create_task(std::string_view tag, std::string_view title) {
    TaskId created;
    bool reconcile = impl_->config.reconcile_counters;

    auto result = impl_->run_locked("create_task",
        [&](const MutationEngine& engine, LogDocument& doc, CounterState& counters) -> Result<bool> {
            auto id = engine.create_task(doc, counters, tag, title, reconcile);
            if (!id) {
                return std::unexpected(std::move(id.error()));
            }
            created = std::move(*id);
            return true;
        });
    if (!result) {
        return std::unexpected(std::move(result.error()));
    }

    TASKLOG_I(kTag, "created {}", created.to_string());
    return created;
}

Result<void> TaskLog::complete_task(std::string_view id) {
    auto task_id = parse_id_argument(id);
    if (!task_id) {
        return std::unexpected(std::move(task_id.error()));
    }

    bool changed = false;
    auto result = impl_->run_locked("complete_task",
        [&](const MutationEngine& engine, LogDocument& doc, CounterState&) -> Result<bool> {
            auto done = engine.complete_task(doc, *task_id);
            if (done) {
                changed = *done;
            }
            return done;
        });
    if (result && changed) {
        TASKLOG_I(kTag, "completed {}", task_id->to_string());
    } else if (result) {
        TASKLOG_D(kTag, "{} already done", task_id->to_string());
    }
    return result;
}

Result<void> TaskLog::add_note(std::string_view id, std::string_view text) {
    auto task_id = parse_id_argument(id);
    if (!task_id) {
        return std::unexpected(std::move(task_id.error()));
    }

    auto result = impl_->run_locked("add_note",
        [&](const MutationEngine& engine, LogDocument& doc, CounterState&) -> Result<bool> {
            auto added = engine.add_note(doc, *task_id, text);
            if (!added) {
                return std::unexpected(std::move(added.error()));
            }
            return true;
        });
    if (result) {
        TASKLOG_I(kTag, "noted {}", task_id->to_string());
    }
    return result;
}

// ============================================================================
// Queries
// ============================================================================

Result<std::vector<Match>> TaskLog::search_tasks(std::string_view query,
                                                 std::optional<std::string_view> tag) const {
    auto doc = impl_->load_document();
    if (!doc) {
        return std::unexpected(std::move(doc.error()));
    }
    auto matches = impl_->make_engine().search_tasks(*doc, query, tag);
    TASKLOG_D(kTag, "search '{}' matched {}", query, matches.size());
    return matches;
}

Result<std::string> TaskLog::get_today_section() const {
    auto doc = impl_->load_document();
    if (!doc) {
        return std::unexpected(std::move(doc.error()));
    }
    return impl_->make_engine().today_section(*doc);
}

// ============================================================================
// Accessors
// ============================================================================

const Config& TaskLog::config() const noexcept {
    return impl_->config;
}

const Paths& TaskLog::paths() const noexcept {
    return impl_->paths;
}

std::filesystem::path TaskLog::log_file() const {
    return impl_->log_file();
}

void TaskLog::set_today_provider(TodayProvider provider) {
    impl_->today = std::move(provider);
}

} // namespace tasklog
