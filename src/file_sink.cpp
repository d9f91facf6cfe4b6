// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "sink.hpp"
#include "utils.hpp"

#include <cstdio>
#include <format>
#include <mutex>

namespace tasklog {

// ============================================================================
// FileSink Implementation
// ============================================================================

struct FileSink::Impl {
    std::filesystem::path log_dir;
    std::string name_prefix;

    std::FILE* file = nullptr;
    std::filesystem::path current_path;
    std::string open_date;  // YYYYMMDD of the open file
    std::mutex mutex;

    Impl(std::filesystem::path dir, std::string prefix)
        : log_dir(std::move(dir)), name_prefix(std::move(prefix)) {}

    ~Impl() {
        close_file();
    }

    bool open_file(const std::string& date) {
        current_path = log_dir / std::format("{}_{}.log", name_prefix, date);
        file = std::fopen(current_path.string().c_str(), "ab");
        if (!file) {
            current_path.clear();
            return false;
        }
        open_date = date;
        return true;
    }

    void close_file() {
        if (file) {
            std::fclose(file);
            file = nullptr;
        }
        open_date.clear();
    }

    void write(std::string_view data) {
        std::lock_guard lock(mutex);

        auto date = format_date_compact(get_timestamp());
        if (file && date != open_date) {
            close_file();
        }
        // Diagnostics are best effort; an unopenable file drops the record
        if (!file && !open_file(date)) {
            return;
        }

        std::fwrite(data.data(), 1, data.size(), file);
        if (!data.empty() && data.back() != '\n') {
            std::fputc('\n', file);
        }
    }

    void flush() {
        std::lock_guard lock(mutex);
        if (file) {
            std::fflush(file);
        }
    }
};

FileSink::FileSink(std::filesystem::path log_dir, std::string name_prefix)
    : impl_(std::make_unique<Impl>(std::move(log_dir), std::move(name_prefix))) {}

FileSink::~FileSink() = default;

void FileSink::write(std::string_view data) {
    impl_->write(data);
}

void FileSink::flush() {
    impl_->flush();
}

std::filesystem::path FileSink::current_path() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->current_path;
}

} // namespace tasklog
