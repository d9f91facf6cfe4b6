// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include "tasklog/types.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace tasklog {

// ============================================================================
// Whole-file I/O
// ============================================================================

/// Reads the entire file through a read-only mapping. IOFailure when the
/// file is missing or unreadable; an empty file yields an empty string.
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path& path);

/// Replaces `path` with `data` so that readers see either the old or the new
/// contents, never a mix. Writes a temporary in the same directory, syncs it,
/// renames it over the target, then syncs the directory. An existing file's
/// permission bits are carried over.
[[nodiscard]] Result<void> write_file_atomic(const std::filesystem::path& path, std::string_view data);

} // namespace tasklog
