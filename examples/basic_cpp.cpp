// SPDX-License-Identifier: MIT
// Tasklog C++ Basic Example
//
// Build:
//   cmake --build build --target basic_cpp
//
// Writes a log under ./tasklog-example/ and prints today's section.

#include <tasklog/tasklog.hpp>
#include <iostream>

int main() {
    // Diagnostics to stderr
    tasklog::LogOptions log_options;
    log_options.min_level = tasklog::Level::Debug;
    log_options.console_output = true;
    tasklog::Logger::create(log_options);

    tasklog::Paths paths{"./tasklog-example"};

    if (auto ok = tasklog::TaskLog::init(paths); !ok) {
        std::cerr << "init failed: " << ok.error().message() << "\n";
        return 1;
    }

    auto log = tasklog::TaskLog::open(paths);
    if (!log) {
        std::cerr << "open failed: " << log.error().message() << "\n";
        return 1;
    }

    // Create, annotate and complete a task
    auto id = log->create_task("dev", "implement login flow");
    if (!id) {
        std::cerr << "create failed: " << id.error().message() << "\n";
        return 1;
    }
    std::cout << "Created " << id->to_string() << "\n";

    if (auto ok = log->add_note(id->to_string(), "blocked on review"); !ok) {
        std::cerr << "note failed: " << ok.error().message() << "\n";
        return 1;
    }
    if (auto ok = log->complete_task(id->to_string()); !ok) {
        std::cerr << "complete failed: " << ok.error().message() << "\n";
        return 1;
    }

    // Search is case-insensitive over titles and notes
    if (auto matches = log->search_tasks("LOGIN"); matches) {
        for (const auto& match : *matches) {
            std::cout << match.id.to_string() << " [" << tasklog::status_name(match.status) << "] "
                      << match.title << "\n";
        }
    }

    if (auto today = log->get_today_section(); today) {
        std::cout << "\nToday:\n" << *today;
    }

    tasklog::Logger::release_all();
    return 0;
}
