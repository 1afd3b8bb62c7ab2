/*
 * hoard/src/downloader/file_sync.cpp
 *
 * Durability helpers shared by the staging file and the retry ledger:
 * - fsync of files and directories (F_FULLFSYNC on macOS)
 * - whole-file atomic replacement via temp file + rename
 */

#include <hoard/downloader/file_sync.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace hoard::downloader {

namespace fs = std::filesystem;

Expected<void> syncFile(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
#if defined(__APPLE__)
    // On macOS, F_FULLFSYNC is stricter than fsync; do both, tolerating failures.
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
#endif
    ::close(fd);
    return Expected<void>{};
}

Expected<void> syncDirectory(const fs::path& dir) {
    const fs::path target = dir.empty() ? fs::path(".") : dir;
    int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + target.string()};
    }
#if defined(__APPLE__)
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + target.string()};
    }
#endif
    ::close(fd);
    return Expected<void>{};
}

Expected<void> replaceFileAtomically(const fs::path& target, std::string_view content) {
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create directory: " + target.parent_path().string()};
        }
    }

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream os(tmp, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!os.good()) {
            return Error{ErrorCode::IoError, "Failed to open temp file: " + tmp.string()};
        }
        os.write(content.data(), static_cast<std::streamsize>(content.size()));
        os.flush();
        if (!os.good()) {
            return Error{ErrorCode::IoError, "write failed on: " + tmp.string()};
        }
    }

    if (auto r = syncFile(tmp); !r.ok()) {
        fs::remove(tmp, ec);
        return r;
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code del_ec;
        fs::remove(tmp, del_ec);
        return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                             tmp.string() + " to " + target.string()};
    }

    if (auto r = syncDirectory(target.parent_path()); !r.ok()) {
        spdlog::debug("fsync on dir failed (continuing): {}", r.error().message);
    }
    return Expected<void>{};
}

} // namespace hoard::downloader
