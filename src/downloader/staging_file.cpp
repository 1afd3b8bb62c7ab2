/*
 * hoard/src/downloader/staging_file.cpp
 *
 * StagingFile implementation:
 * - "<final>.part" lives in the final artifact's directory so promotion is a
 *   same-filesystem rename (never copy-then-delete)
 * - Restrictive permissions (0600) while staging on POSIX
 * - Chunked buffered appends sized by the declared total
 */

#include <hoard/downloader/file_sync.hpp>
#include <hoard/downloader/staging_file.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace hoard::downloader {

namespace fs = std::filesystem;

namespace {

constexpr std::uint64_t KiB = 1024;
constexpr std::uint64_t MiB = 1024 * KiB;
constexpr std::uint64_t GiB = 1024 * MiB;

struct ChunkThreshold {
    std::uint64_t below;
    std::size_t chunk;
};

constexpr ChunkThreshold kThresholds[] = {
    {1 * MiB, 32 * KiB},    {10 * MiB, 128 * KiB}, {50 * MiB, 512 * KiB}, {100 * MiB, 1 * MiB},
    {250 * MiB, 2 * MiB},   {500 * MiB, 4 * MiB},  {1 * GiB, 8 * MiB},
};

constexpr std::size_t kLargeFileChunk = 16 * MiB;

void ensure_file_private(const fs::path& p) {
    std::error_code ec;
    fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace,
                    ec);
    if (ec) {
        spdlog::debug("Failed to set private file perms on {}: {}", p.string(), ec.message());
    }
}

void set_file_shared(const fs::path& p) {
    std::error_code ec;
    fs::permissions(p,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                        fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Failed to set permissions on {}: {}", p.string(), ec.message());
    }
}

} // namespace

std::size_t chunkSizeFor(std::optional<std::uint64_t> totalSize) noexcept {
    if (!totalSize)
        return kThresholds[0].chunk;
    for (const auto& t : kThresholds) {
        if (*totalSize < t.below)
            return t.chunk;
    }
    return kLargeFileChunk;
}

fs::path StagingFile::partPathFor(const fs::path& finalPath) {
    fs::path p = finalPath;
    p += ".part";
    return p;
}

StagingFile::StagingFile(fs::path finalPath)
    : finalPath_(std::move(finalPath)), partPath_(partPathFor(finalPath_)) {}

StagingFile::~StagingFile() {
    if (!buffer_.empty()) {
        if (auto r = flush(); !r.ok()) {
            spdlog::warn("StagingFile: losing buffered bytes for {}: {}", partPath_.string(),
                         r.error().message);
        }
    }
    close();
}

std::uint64_t StagingFile::existingSize() const {
    std::error_code ec;
    if (!fs::exists(partPath_, ec))
        return 0;
    auto sz = fs::file_size(partPath_, ec);
    return ec ? 0 : static_cast<std::uint64_t>(sz);
}

Expected<void> StagingFile::begin(std::uint64_t offset, std::optional<std::uint64_t> totalSize) {
    close();
    buffer_.clear();
    chunkSize_ = chunkSizeFor(totalSize);
    buffer_.reserve(chunkSize_);
    written_ = offset;
    truncateOnOpen_ = (offset == 0);

    // A partial shorter than the resume offset means someone else touched it.
    if (offset > 0 && existingSize() != offset) {
        return Error{ErrorCode::IoError,
                     "Partial size changed under resume: " + partPath_.string()};
    }
    return Expected<void>{};
}

Expected<void> StagingFile::open() {
    if (out_.is_open())
        return Expected<void>{};

    std::error_code ec;
    if (finalPath_.has_parent_path()) {
        fs::create_directories(finalPath_.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create directory: " + finalPath_.parent_path().string()};
        }
    }

    auto mode = std::ios::binary | std::ios::out;
    mode |= truncateOnOpen_ ? std::ios::trunc : std::ios::app;
    out_.open(partPath_, mode);
    if (!out_.good()) {
        return Error{ErrorCode::IoError, "Failed to open staging file: " + partPath_.string()};
    }
    ensure_file_private(partPath_);
    truncateOnOpen_ = false;
    return Expected<void>{};
}

void StagingFile::close() noexcept {
    if (out_.is_open()) {
        out_.close();
    }
}

Expected<void> StagingFile::append(std::span<const std::byte> bytes) {
    if (chunkSize_ == 0) {
        chunkSize_ = chunkSizeFor(std::nullopt);
    }
    if (auto r = open(); !r.ok()) {
        return r;
    }

    while (!bytes.empty()) {
        const std::size_t room = chunkSize_ - buffer_.size();
        const std::size_t take = std::min(room, bytes.size());
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.begin() + take);
        bytes = bytes.subspan(take);
        written_ += take;
        if (buffer_.size() >= chunkSize_) {
            if (auto r = flush(); !r.ok())
                return r;
        }
    }
    return Expected<void>{};
}

Expected<void> StagingFile::flush() {
    if (buffer_.empty())
        return Expected<void>{};
    if (auto r = open(); !r.ok()) {
        return r;
    }

    out_.write(reinterpret_cast<const char*>(buffer_.data()),
               static_cast<std::streamsize>(buffer_.size()));
    out_.flush();
    if (!out_.good()) {
        written_ -= buffer_.size();
        buffer_.clear();
        return Error{ErrorCode::IoError, "write failed on: " + partPath_.string()};
    }
    buffer_.clear();
    return Expected<void>{};
}

Expected<void> StagingFile::promote() {
    if (auto r = flush(); !r.ok())
        return r;
    // Zero-byte entity: nothing was appended, so create the (empty) partial now.
    if (auto r = open(); !r.ok())
        return r;
    close();

    if (auto r = syncFile(partPath_); !r.ok())
        return Error{r.error().code, "Failed to fsync staging: " + partPath_.string()};

    std::error_code ec;
    fs::rename(partPath_, finalPath_, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                             partPath_.string() + " to " + finalPath_.string()};
    }
    set_file_shared(finalPath_);

    if (auto r = syncDirectory(finalPath_.parent_path()); !r.ok()) {
        spdlog::debug("fsync on dir failed (continuing): {}", finalPath_.parent_path().string());
    }
    spdlog::debug("Promoted {} ({} bytes)", finalPath_.string(), written_);
    return Expected<void>{};
}

Expected<void> StagingFile::discard() {
    close();
    buffer_.clear();
    written_ = 0;
    std::error_code ec;
    fs::remove(partPath_, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to remove staging file " + partPath_.string() + ": " + ec.message()};
    }
    return Expected<void>{};
}

} // namespace hoard::downloader
