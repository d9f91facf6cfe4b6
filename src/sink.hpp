// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include "tasklog/types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace tasklog {

// ============================================================================
// Sink Interface - Abstract output destination for diagnostics
// ============================================================================

class ISink {
public:
    virtual ~ISink() = default;

    virtual void write(std::string_view data) = 0;

    virtual void flush() = 0;
};

// ============================================================================
// File Sink - Appends to one file per day: <prefix>_YYYYMMDD.log
// ============================================================================

class FileSink : public ISink {
public:
    /// @param log_dir Existing directory; it is not created here
    /// @param name_prefix File name prefix (e.g., "tl" -> "tl_20261019.log")
    FileSink(std::filesystem::path log_dir, std::string name_prefix);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(std::string_view data) override;
    void flush() override;

    /// Empty until the first successful write
    [[nodiscard]] std::filesystem::path current_path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Console Sink - Writes to stderr so stdout stays clean for command output
// ============================================================================

class ConsoleSink : public ISink {
public:
    ConsoleSink() = default;
    ~ConsoleSink() override = default;

    ConsoleSink(const ConsoleSink&) = delete;
    ConsoleSink& operator=(const ConsoleSink&) = delete;

    void write(std::string_view data) override;
    void flush() override;
};

} // namespace tasklog
