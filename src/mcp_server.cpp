// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "tasklog/mcp_server.hpp"
#include "tasklog/tasklog.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <format>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace tasklog {

using json = nlohmann::json;

namespace {

constexpr std::string_view kTag = "mcp";
constexpr std::string_view kProtocolVersion = "2025-03-26";

struct ToolResult {
    bool is_error = false;
    std::string text;
    json structured;
};

// Unexpected carries an invalid-params message
using ToolOutcome = std::expected<ToolResult, std::string>;
using ToolHandler = std::function<ToolOutcome(const json& arguments)>;

struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

json make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

// Log text is not guaranteed to be UTF-8; invalid bytes become U+FFFD
// instead of throwing from dump()
std::string to_wire(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

ToolResult failure(const Error& error) {
    return ToolResult{true, std::format("Error: {}", error.message()), json()};
}

json string_property(const char* description) {
    return {{"type", "string"}, {"description", description}};
}

json object_schema(json properties, std::vector<std::string> required) {
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)}
    };
}

// Required string argument; nullopt when absent or not a string
std::optional<std::string> string_arg(const json& arguments, const char* key) {
    auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::string missing_arg(const char* key) {
    return std::format("missing or invalid argument '{}'", key);
}

} // anonymous namespace

// ============================================================================
// McpServer Implementation
// ============================================================================

struct McpServer::Impl {
    Paths paths;
    TaskLog::TodayProvider today;
    std::vector<ToolSchema> tools;
    std::unordered_map<std::string, ToolHandler> handlers;

    explicit Impl(Paths p) : paths(std::move(p)) {
        register_tools();
    }

    Result<TaskLog> open_log() const {
        auto log = TaskLog::open(paths);
        if (log && today) {
            log->set_today_provider(today);
        }
        return log;
    }

    void add_tool(std::string name, std::string description, json schema, ToolHandler handler) {
        handlers.emplace(name, std::move(handler));
        tools.push_back({std::move(name), std::move(description), std::move(schema)});
    }

    void register_tools() {
        add_tool("init_log",
                 "Initialize the task log environment. Creates config, log, and state files if missing.",
                 object_schema(json::object(), {}),
                 [this](const json&) -> ToolOutcome {
                     if (auto ok = TaskLog::init(paths); !ok) {
                         return failure(ok.error());
                     }
                     return ToolResult{false, "Task log initialized successfully.", json()};
                 });

        add_tool("create_task",
                 "Create a new task with a tag and title. Returns the assigned task ID.",
                 object_schema({{"tag", string_property("Task tag (lowercase alphanumeric, e.g. \"infra\")")},
                                {"title", string_property("Task title")}},
                               {"tag", "title"}),
                 [this](const json& args) -> ToolOutcome {
                     auto tag = string_arg(args, "tag");
                     if (!tag) return std::unexpected(missing_arg("tag"));
                     auto title = string_arg(args, "title");
                     if (!title) return std::unexpected(missing_arg("title"));

                     auto log = open_log();
                     if (!log) return failure(log.error());
                     auto id = log->create_task(*tag, *title);
                     if (!id) return failure(id.error());
                     return ToolResult{false, std::format("Created task: {}", id->to_string()),
                                       {{"id", id->to_string()}}};
                 });

        add_tool("complete_task",
                 "Mark a task as completed by its ID (e.g. 'infra-12').",
                 object_schema({{"id", string_property("Task ID (e.g. \"infra-12\")")}}, {"id"}),
                 [this](const json& args) -> ToolOutcome {
                     auto id = string_arg(args, "id");
                     if (!id) return std::unexpected(missing_arg("id"));

                     auto log = open_log();
                     if (!log) return failure(log.error());
                     if (auto ok = log->complete_task(*id); !ok) return failure(ok.error());
                     return ToolResult{false, std::format("Completed task: {}", *id), json()};
                 });

        add_tool("add_note",
                 "Add a note to an existing task by its ID.",
                 object_schema({{"id", string_property("Task ID (e.g. \"infra-12\")")},
                                {"text", string_property("Note text")}},
                               {"id", "text"}),
                 [this](const json& args) -> ToolOutcome {
                     auto id = string_arg(args, "id");
                     if (!id) return std::unexpected(missing_arg("id"));
                     auto text = string_arg(args, "text");
                     if (!text) return std::unexpected(missing_arg("text"));

                     auto log = open_log();
                     if (!log) return failure(log.error());
                     if (auto ok = log->add_note(*id, *text); !ok) return failure(ok.error());
                     return ToolResult{false, std::format("Note added to task: {}", *id), json()};
                 });

        add_tool("search_tasks",
                 "Search tasks and notes. Optionally filter by tag.",
                 object_schema({{"query", string_property("Search query")},
                                {"tag", string_property("Optional tag filter")}},
                               {"query"}),
                 [this](const json& args) -> ToolOutcome {
                     auto query = string_arg(args, "query");
                     if (!query) return std::unexpected(missing_arg("query"));
                     std::optional<std::string> tag;
                     if (args.contains("tag") && !args["tag"].is_null()) {
                         tag = string_arg(args, "tag");
                         if (!tag) return std::unexpected(missing_arg("tag"));
                     }

                     auto log = open_log();
                     if (!log) return failure(log.error());
                     auto matches = tag ? log->search_tasks(*query, std::string_view(*tag))
                                        : log->search_tasks(*query);
                     if (!matches) return failure(matches.error());
                     return render_matches(*query, *matches, log->config().note_indent);
                 });

        add_tool("get_today_section",
                 "Get the raw text of today's section from the log.",
                 object_schema(json::object(), {}),
                 [this](const json&) -> ToolOutcome {
                     auto log = open_log();
                     if (!log) return failure(log.error());
                     auto text = log->get_today_section();
                     if (!text) return failure(text.error());
                     return ToolResult{false, std::move(*text), json()};
                 });
    }

    static ToolResult render_matches(const std::string& query,
                                     const std::vector<Match>& matches,
                                     std::size_t note_indent) {
        if (matches.empty()) {
            return ToolResult{false, std::format("No tasks found matching '{}'", query),
                              {{"matches", json::array()}}};
        }

        std::string text;
        json structured = json::array();
        for (const auto& match : matches) {
            text += std::format("[{}] {} {}\n", status_marker(match.status), match.id.to_string(), match.title);
            for (const auto& note : match.notes) {
                text += std::string(note_indent, ' ');
                text += "- ";
                text += note;
                text += '\n';
            }
            structured.push_back({
                {"id", match.id.to_string()},
                {"status", std::string(status_name(match.status))},
                {"title", match.title},
                {"snippet", match.snippet},
                {"notes", match.notes}
            });
        }
        return ToolResult{false, std::move(text), {{"matches", std::move(structured)}}};
    }

    // ========================================================================
    // Dispatch
    // ========================================================================

    json handle_request(const json& request) {
        if (!request.is_object()) {
            return make_error(nullptr, rpc_error::kInvalidRequest, "request must be a JSON object");
        }

        json id = request.value("id", json());
        bool is_notification = !request.contains("id");

        if (request.value("jsonrpc", json()) != "2.0") {
            return make_error(id, rpc_error::kInvalidRequest, "missing or invalid jsonrpc version");
        }
        if (!request.contains("method") || !request["method"].is_string()) {
            return make_error(id, rpc_error::kInvalidRequest, "missing or invalid method");
        }

        std::string method = request["method"];
        json params = request.value("params", json::object());

        if (is_notification) {
            // notifications/initialized and any other notification get no reply
            TASKLOG_D(kTag, "notification {}", method);
            return json();
        }

        if (method == "initialize") {
            return handle_initialize(id);
        } else if (method == "ping") {
            return make_result(id, json::object());
        } else if (method == "tools/list") {
            return handle_tools_list(id);
        } else if (method == "tools/call") {
            return handle_tools_call(params, id);
        }

        return make_error(id, rpc_error::kMethodNotFound, "Unknown method: " + method);
    }

    json handle_initialize(const json& id) const {
        json result = {
            {"protocolVersion", std::string(kProtocolVersion)},
            {"capabilities", {{"tools", json::object()}}},
            {"serverInfo", {{"name", "tl"}, {"version", TASKLOG_VERSION_STRING}}},
            {"instructions", "Task log tool. Use create_task to add tasks, complete_task to mark done, "
                             "add_note to annotate, search_tasks to find tasks."}
        };
        return make_result(id, result);
    }

    json handle_tools_list(const json& id) const {
        json tools_array = json::array();
        for (const auto& tool : tools) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            return make_error(id, rpc_error::kInvalidParams, "missing tool name");
        }

        std::string name = params["name"];
        json arguments = params.value("arguments", json::object());
        if (!arguments.is_object()) {
            return make_error(id, rpc_error::kInvalidParams, "arguments must be an object");
        }

        auto it = handlers.find(name);
        if (it == handlers.end()) {
            return make_error(id, rpc_error::kInvalidParams, "Unknown tool: " + name);
        }

        auto outcome = it->second(arguments);
        if (!outcome) {
            return make_error(id, rpc_error::kInvalidParams, outcome.error());
        }
        if (outcome->is_error) {
            TASKLOG_W(kTag, "{} failed: {}", name, outcome->text);
        }

        json response = {
            {"content", json::array({{{"type", "text"}, {"text", outcome->text}}})},
            {"isError", outcome->is_error}
        };
        if (!outcome->structured.is_null()) {
            response["structuredContent"] = outcome->structured;
        }
        return make_result(id, response);
    }
};

// ============================================================================
// McpServer Public API
// ============================================================================

McpServer::McpServer(Paths paths) : impl_(std::make_unique<Impl>(std::move(paths))) {}

McpServer::~McpServer() = default;

void McpServer::run(std::istream& in, std::ostream& out) {
    TASKLOG_I(kTag, "serving {}", impl_->paths.base_dir.string());

    std::string line;
    while (std::getline(in, line)) {
        auto response = handle_line(line);
        if (!response.empty()) {
            out << response << "\n";
            out.flush();
        }
    }
}

std::string McpServer::handle_line(std::string_view line) {
    if (line.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return {};
    }

    json request;
    try {
        request = json::parse(line);
    } catch (const json::exception& e) {
        return to_wire(make_error(nullptr, rpc_error::kParseError, std::string("Parse error: ") + e.what()));
    }

    auto response = impl_->handle_request(request);
    return response.is_null() ? std::string{} : to_wire(response);
}

void McpServer::set_today_provider(TaskLog::TodayProvider provider) {
    impl_->today = std::move(provider);
}

} // namespace tasklog
