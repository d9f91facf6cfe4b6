// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#pragma once

#include "config.hpp"
#include "task_log.hpp"

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

namespace tasklog {

// ============================================================================
// McpServer - Model Context Protocol front end
// ============================================================================
//
// JSON-RPC 2.0, one message per line on the input stream, responses one per
// line on the output stream. Methods: initialize, notifications/initialized,
// ping, tools/list, tools/call. Tools: init_log, create_task, complete_task,
// add_note, search_tasks, get_today_section.
//
// Each tool call opens the task log afresh so edits made by other processes
// between calls are always seen.
// ============================================================================

namespace rpc_error {
    inline constexpr int kParseError = -32700;
    inline constexpr int kInvalidRequest = -32600;
    inline constexpr int kMethodNotFound = -32601;
    inline constexpr int kInvalidParams = -32602;
}

class McpServer {
public:
    explicit McpServer(Paths paths);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Serves until `in` reaches end of file
    void run(std::istream& in, std::ostream& out);

    /// Response text for one request line; empty for notifications
    [[nodiscard]] std::string handle_line(std::string_view line);

    /// Forwarded to every TaskLog the server opens (tests)
    void set_today_provider(TaskLog::TodayProvider provider);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tasklog
