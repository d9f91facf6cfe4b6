// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "atomic_file.hpp"
#include "tasklog/logger.hpp"
#include "tasklog/platform.hpp"

#include <mio/mmap.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <system_error>

#ifdef TASKLOG_PLATFORM_WINDOWS
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #include <Windows.h>
#else
    #include <fcntl.h>
    #include <sys/stat.h>
    #include <unistd.h>
#endif

namespace tasklog {

namespace {

constexpr std::string_view kTag = "io";

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path temp_path_for(const std::filesystem::path& path) {
    auto name = std::format(".{}.tmp.{}.{}.{}", path.filename().string(), get_pid(), get_tid(),
                            g_temp_counter.fetch_add(1, std::memory_order_relaxed));
    return path.parent_path() / name;
}

std::unexpected<Error> io_error(const std::filesystem::path& path, std::string_view what, int err) {
    return make_error(ErrorCode::IOFailure,
                      std::format("{} {}: {}", what, path.string(), std::strerror(err)));
}

} // anonymous namespace

Result<std::string> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return make_error(ErrorCode::IOFailure, std::format("{}: {}", path.string(), ec.message()));
    }
    if (size == 0) {
        return std::string{};
    }

    auto source = mio::make_mmap_source(path.string(), ec);
    if (ec) {
        return make_error(ErrorCode::IOFailure, std::format("mmap {}: {}", path.string(), ec.message()));
    }
    return std::string(source.data(), source.size());
}

#ifdef TASKLOG_PLATFORM_WINDOWS

Result<void> write_file_atomic(const std::filesystem::path& path, std::string_view data) {
    auto temp = temp_path_for(path);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return make_error(ErrorCode::IOFailure, std::format("cannot create {}", temp.string()));
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            std::error_code ec;
            std::filesystem::remove(temp, ec);
            return make_error(ErrorCode::IOFailure, std::format("write {}", temp.string()));
        }
    }

    if (!::MoveFileExW(temp.c_str(), path.c_str(), MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DWORD err = ::GetLastError();
        std::error_code ec;
        std::filesystem::remove(temp, ec);
        return make_error(ErrorCode::IOFailure,
                          std::format("rename to {} (error {})", path.string(), err));
    }
    return {};
}

#else

Result<void> write_file_atomic(const std::filesystem::path& path, std::string_view data) {
    auto temp = temp_path_for(path);

    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return io_error(temp, "create", errno);
    }

    auto fail = [&](std::string_view what, int err) {
        ::close(fd);
        ::unlink(temp.c_str());
        return io_error(temp, what, err);
    };

    struct stat st{};
    if (::stat(path.c_str(), &st) == 0) {
        if (::fchmod(fd, st.st_mode & 07777) != 0) {
            return fail("chmod", errno);
        }
    }

    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return fail("write", errno);
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }

    if (::fsync(fd) != 0) {
        return fail("fsync", errno);
    }
    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(temp.c_str());
        return io_error(temp, "close", err);
    }

    if (::rename(temp.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(temp.c_str());
        return io_error(path, "rename onto", err);
    }

    // The rename is durable only once the directory entry is on disk
    auto dir = path.parent_path();
    if (dir.empty()) dir = ".";
    int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd < 0) {
        TASKLOG_W(kTag, "cannot open {} for fsync: {}", dir.string(), std::strerror(errno));
        return {};
    }
    if (::fsync(dir_fd) != 0) {
        TASKLOG_W(kTag, "fsync {} failed: {}", dir.string(), std::strerror(errno));
    }
    ::close(dir_fd);
    return {};
}

#endif

} // namespace tasklog
