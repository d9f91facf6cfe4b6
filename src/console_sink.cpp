// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "sink.hpp"

#include <cstdio>

namespace tasklog {

void ConsoleSink::write(std::string_view data) {
    // fprintf/fflush are POSIX thread-safe
    std::fprintf(stderr, "%.*s", static_cast<int>(data.size()), data.data());
    if (!data.empty() && data.back() != '\n') {
        std::fputc('\n', stderr);
    }
}

void ConsoleSink::flush() {
    std::fflush(stderr);
}

} // namespace tasklog
