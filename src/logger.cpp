// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors
//
// Logger - Diagnostic logging with named instances
//
//   Logger (this file)     - Level filtering, formatting, instance registry
//       |
//       v writes to
//   ISink (internal)       - ConsoleSink (stderr), FileSink (daily file)

#include "tasklog/logger.hpp"
#include "tasklog/platform.hpp"
#include "sink.hpp"

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace tasklog {

// ============================================================================
// Named Loggers Registry (static)
// ============================================================================

namespace {

struct LoggerRegistry {
    std::shared_mutex mutex;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

std::string lookup_name(const std::string& name) {
    return name.empty() ? std::string(kDefaultLoggerName) : name;
}

} // anonymous namespace

// ============================================================================
// Logger Implementation
// ============================================================================

struct Logger::Impl {
    std::string name;
    LogOptions options;
    Formatter formatter;
    std::vector<std::unique_ptr<ISink>> sinks;
    FileSink* file_sink = nullptr;

    std::atomic<Level> min_level{Level::Info};
    std::mutex write_mutex;

    explicit Impl(std::string logger_name) : name(std::move(logger_name)) {}

    void init(const LogOptions& opts) {
        options = opts;
        min_level.store(opts.min_level);

        if (!opts.format_pattern.empty()) {
            formatter.set_pattern(opts.format_pattern);
        }

        if (opts.console_output) {
            sinks.push_back(std::make_unique<ConsoleSink>());
        }
        if (!opts.log_dir.empty()) {
            auto sink = std::make_unique<FileSink>(opts.log_dir, opts.name_prefix);
            file_sink = sink.get();
            sinks.push_back(std::move(sink));
        }
    }
};

// ============================================================================
// Static Factory Methods
// ============================================================================

Logger* Logger::instance(const std::string& name) {
    auto& registry = get_registry();
    std::shared_lock lock(registry.mutex);

    auto it = registry.loggers.find(lookup_name(name));
    return (it != registry.loggers.end()) ? it->second.get() : nullptr;
}

Logger* Logger::create(const LogOptions& options) {
    auto name = lookup_name(options.name_prefix);

    auto& registry = get_registry();
    std::unique_lock lock(registry.mutex);

    if (registry.loggers.find(name) != registry.loggers.end()) {
        return nullptr;  // Name collision
    }

    auto logger = std::unique_ptr<Logger>(new Logger(name));
    logger->init(options);

    auto* ptr = logger.get();
    registry.loggers[name] = std::move(logger);
    return ptr;
}

bool Logger::release(const std::string& name) {
    auto& registry = get_registry();
    std::unique_lock lock(registry.mutex);
    return registry.loggers.erase(lookup_name(name)) > 0;
}

void Logger::release_all() {
    auto& registry = get_registry();
    std::unique_lock lock(registry.mutex);
    registry.loggers.clear();
}

// ============================================================================
// Constructors / Destructor
// ============================================================================

Logger::Logger(std::string name) : impl_(std::make_unique<Impl>(std::move(name))) {}

Logger::~Logger() {
    flush();
}

void Logger::init(const LogOptions& options) {
    impl_->init(options);
}

const std::string& Logger::name() const noexcept {
    return impl_->name;
}

const LogOptions& Logger::options() const noexcept {
    return impl_->options;
}

// ============================================================================
// Configuration
// ============================================================================

void Logger::set_level(Level level) {
    impl_->min_level.store(level);
}

Level Logger::level() const noexcept {
    return impl_->min_level.load();
}

void Logger::set_pattern(std::string_view pattern) {
    std::lock_guard lock(impl_->write_mutex);
    impl_->formatter.set_pattern(pattern);
}

std::filesystem::path Logger::current_log_path() const {
    return impl_->file_sink ? impl_->file_sink->current_path() : std::filesystem::path{};
}

// ============================================================================
// Logging
// ============================================================================

bool Logger::is_enabled(Level level) const noexcept {
    return level != Level::Off && level >= impl_->min_level.load(std::memory_order_relaxed);
}

void Logger::log(Level level,
                 std::string_view tag,
                 std::string_view message,
                 const std::source_location& loc) {
    if (!is_enabled(level)) return;

    Record record;
    record.level = level;
    record.tag = tag;
    record.message = message;
    record.location = loc;
    record.timestamp = get_timestamp();
    record.pid = get_pid();
    record.tid = get_tid();

    std::lock_guard lock(impl_->write_mutex);
    auto line = impl_->formatter.format(record);
    for (auto& sink : impl_->sinks) {
        sink->write(line);
    }
}

void Logger::flush() {
    std::lock_guard lock(impl_->write_mutex);
    for (auto& sink : impl_->sinks) {
        sink->flush();
    }
}

} // namespace tasklog
