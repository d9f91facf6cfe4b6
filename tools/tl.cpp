// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors
//
// tl - Command line front end for the markdown task log
//
// Usage:
//   tl [--home DIR] [-v] init [--log PATH]
//   tl [--home DIR] [-v] add <tag> <title...>
//   tl [--home DIR] [-v] done <id>
//   tl [--home DIR] [-v] note <id> <text...>
//   tl [--home DIR] [-v] search [--tag TAG] <query...>
//   tl [--home DIR] [-v] today
//   tl [--home DIR] [-v] mcp

#include <tasklog/tasklog.hpp>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace tasklog;

// ============================================================================
// Utilities
// ============================================================================

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "tl - Structured tasks in a plain markdown log\n\n"
        "Usage:\n"
        "  %s [options] init [--log PATH]\n"
        "  %s [options] add <tag> <title...>\n"
        "  %s [options] done <id>\n"
        "  %s [options] note <id> <text...>\n"
        "  %s [options] search [--tag TAG] <query...>\n"
        "  %s [options] today\n"
        "  %s [options] mcp\n\n"
        "Options:\n"
        "  --home DIR     Base directory (default: $TL_HOME, else ~/.config/tl)\n"
        "  -v, --verbose  Print diagnostics to stderr\n"
        "  -h, --help     Show this help message\n"
        "  --version      Show version\n\n"
        "Examples:\n"
        "  %s add dev implement login flow     # -> dev-1\n"
        "  %s note dev-1 blocked on review\n"
        "  %s done dev-1\n"
        "  %s search --tag dev login\n",
        prog, prog, prog, prog, prog, prog, prog, prog, prog, prog, prog);
}

static int fail(const Error& error) {
    std::fprintf(stderr, "error: %s\n", error.message().c_str());
    return 1;
}

static int usage_error(const char* prog, const char* message) {
    std::fprintf(stderr, "error: %s\n\n", message);
    print_usage(prog);
    return 1;
}

// Joins argv[from..argc) with single spaces
static std::string join_args(int argc, char* argv[], int from) {
    std::string out;
    for (int i = from; i < argc; ++i) {
        if (!out.empty()) out += ' ';
        out += argv[i];
    }
    return out;
}

static void setup_logging(const Paths& paths, bool verbose) {
    LogOptions options;
    options.min_level = verbose ? Level::Debug : Level::Info;
    options.console_output = verbose;
    options.log_dir = paths.base_dir;
    Logger::create(options);
}

// ============================================================================
// Commands
// ============================================================================

static int cmd_init(const Paths& paths, int argc, char* argv[], int arg_idx) {
    std::optional<std::string> log_path;
    while (arg_idx < argc) {
        if (std::strcmp(argv[arg_idx], "--log") == 0 && arg_idx + 1 < argc) {
            std::error_code ec;
            auto absolute = fs::absolute(argv[arg_idx + 1], ec);
            log_path = ec ? std::string(argv[arg_idx + 1]) : absolute.string();
            arg_idx += 2;
            continue;
        }
        return usage_error(argv[0], "init takes only --log PATH");
    }

    if (auto ok = TaskLog::init(paths, log_path); !ok) {
        return fail(ok.error());
    }
    auto log = TaskLog::open(paths);
    if (!log) {
        return fail(log.error());
    }
    std::printf("Initialized task log at %s\n", log->log_file().string().c_str());
    return 0;
}

static int cmd_add(TaskLog& log, int argc, char* argv[], int arg_idx) {
    if (arg_idx + 1 >= argc) {
        return usage_error(argv[0], "add needs a tag and a title");
    }
    auto id = log.create_task(argv[arg_idx], join_args(argc, argv, arg_idx + 1));
    if (!id) {
        return fail(id.error());
    }
    std::printf("Created task: %s\n", id->to_string().c_str());
    return 0;
}

static int cmd_done(TaskLog& log, int argc, char* argv[], int arg_idx) {
    if (arg_idx + 1 != argc) {
        return usage_error(argv[0], "done needs exactly one task ID");
    }
    if (auto ok = log.complete_task(argv[arg_idx]); !ok) {
        return fail(ok.error());
    }
    std::printf("Completed task: %s\n", argv[arg_idx]);
    return 0;
}

static int cmd_note(TaskLog& log, int argc, char* argv[], int arg_idx) {
    if (arg_idx + 1 >= argc) {
        return usage_error(argv[0], "note needs a task ID and text");
    }
    if (auto ok = log.add_note(argv[arg_idx], join_args(argc, argv, arg_idx + 1)); !ok) {
        return fail(ok.error());
    }
    std::printf("Note added to task: %s\n", argv[arg_idx]);
    return 0;
}

static int cmd_search(TaskLog& log, int argc, char* argv[], int arg_idx) {
    std::optional<std::string> tag;
    if (arg_idx < argc && std::strcmp(argv[arg_idx], "--tag") == 0) {
        if (arg_idx + 1 >= argc) {
            return usage_error(argv[0], "--tag needs a value");
        }
        tag = argv[arg_idx + 1];
        arg_idx += 2;
    }

    auto query = join_args(argc, argv, arg_idx);
    auto matches = tag ? log.search_tasks(query, std::string_view(*tag)) : log.search_tasks(query);
    if (!matches) {
        return fail(matches.error());
    }

    if (matches->empty()) {
        std::printf("No tasks found matching '%s'\n", query.c_str());
        return 0;
    }
    std::string indent(log.config().note_indent, ' ');
    for (const auto& match : *matches) {
        std::printf("[%c] %s %s\n", status_marker(match.status),
                    match.id.to_string().c_str(), match.title.c_str());
        for (const auto& note : match.notes) {
            std::printf("%s- %s\n", indent.c_str(), note.c_str());
        }
    }
    return 0;
}

static int cmd_today(TaskLog& log) {
    auto text = log.get_today_section();
    if (!text) {
        return fail(text.error());
    }
    std::fwrite(text->data(), 1, text->size(), stdout);
    return 0;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    int arg_idx = 1;
    bool verbose = false;
    std::optional<fs::path> home;

    // Parse global options
    while (arg_idx < argc) {
        const char* arg = argv[arg_idx];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }

        if (std::strcmp(arg, "--version") == 0) {
            std::printf("tl %s (%s)\n", TASKLOG_VERSION_STRING, platform::name());
            return 0;
        }

        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            verbose = true;
            ++arg_idx;
            continue;
        }

        if (std::strcmp(arg, "--home") == 0) {
            if (arg_idx + 1 >= argc) {
                std::fprintf(stderr, "Missing value for %s\n", arg);
                return 1;
            }
            home = fs::path(argv[arg_idx + 1]);
            arg_idx += 2;
            continue;
        }

        // Not an option, must be the command
        break;
    }

    if (arg_idx >= argc) {
        return usage_error(argv[0], "missing command");
    }

    Paths paths = home ? Paths{*home} : Paths::from_env();
    setup_logging(paths, verbose);

    const char* command = argv[arg_idx++];

    if (std::strcmp(command, "init") == 0) {
        return cmd_init(paths, argc, argv, arg_idx);
    }

    if (std::strcmp(command, "mcp") == 0) {
        McpServer server(paths);
        server.run(std::cin, std::cout);
        return 0;
    }

    static constexpr const char* kLogCommands[] = {"add", "done", "note", "search", "today"};
    bool known = false;
    for (const char* name : kLogCommands) {
        known = known || std::strcmp(command, name) == 0;
    }
    if (!known) {
        std::fprintf(stderr, "error: unknown command '%s'\n\n", command);
        print_usage(argv[0]);
        return 1;
    }

    auto log = TaskLog::open(paths);
    if (!log) {
        return fail(log.error());
    }

    if (std::strcmp(command, "add") == 0) {
        return cmd_add(*log, argc, argv, arg_idx);
    }
    if (std::strcmp(command, "done") == 0) {
        return cmd_done(*log, argc, argv, arg_idx);
    }
    if (std::strcmp(command, "note") == 0) {
        return cmd_note(*log, argc, argv, arg_idx);
    }
    if (std::strcmp(command, "search") == 0) {
        return cmd_search(*log, argc, argv, arg_idx);
    }
    return cmd_today(*log);
}
