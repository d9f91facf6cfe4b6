// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

/**
 * @file tasklog.hpp
 * @brief Tasklog - Structured task log over a plain markdown file
 *
 * @code
 * auto paths = tasklog::Paths::from_env();
 * if (auto ok = tasklog::TaskLog::init(paths); !ok) { ... }
 *
 * auto log = tasklog::TaskLog::open(paths);
 * auto id = log->create_task("dev", "implement login flow");   // dev-1
 * log->add_note(id->to_string(), "blocked on review");
 * log->complete_task(id->to_string());
 * @endcode
 */

#pragma once

#define TASKLOG_VERSION_MAJOR 0
#define TASKLOG_VERSION_MINOR 1
#define TASKLOG_VERSION_PATCH 0
#define TASKLOG_VERSION_STRING "0.1.0"

#include "platform.hpp"
#include "types.hpp"
#include "config.hpp"
#include "date_format.hpp"
#include "classifier.hpp"
#include "document.hpp"
#include "counter_state.hpp"
#include "engine.hpp"
#include "task_log.hpp"
#include "logger.hpp"
#include "mcp_server.hpp"
