#pragma once

#include <hoard/downloader/downloader.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <vector>

namespace hoard::downloader {

/**
 * Write-buffer size for a transfer, chosen from the declared total size.
 * Unknown sizes use the smallest chunk.
 */
std::size_t chunkSizeFor(std::optional<std::uint64_t> totalSize) noexcept;

/**
 * Resumable staging artifact "<final>.part" beside the final artifact.
 *
 * The file is created lazily on the first appended byte. Bytes are buffered
 * up to the chunk size and written as whole chunks; every termination path
 * (flush, promote, destruction) writes out what is buffered, so an interrupted
 * transfer leaves every received byte on disk for the next resume.
 */
class StagingFile {
public:
    explicit StagingFile(std::filesystem::path finalPath);
    ~StagingFile();

    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;

    static std::filesystem::path partPathFor(const std::filesystem::path& finalPath);

    [[nodiscard]] const std::filesystem::path& finalPath() const noexcept { return finalPath_; }
    [[nodiscard]] const std::filesystem::path& partPath() const noexcept { return partPath_; }

    /// Size of the partial already on disk (0 when absent).
    [[nodiscard]] std::uint64_t existingSize() const;

    /**
     * Prepare to receive bytes starting at `offset`. An offset of zero
     * truncates any stale partial; otherwise new bytes are appended.
     */
    Expected<void> begin(std::uint64_t offset, std::optional<std::uint64_t> totalSize);

    Expected<void> append(std::span<const std::byte> bytes);

    /// Write buffered bytes to the file (no fsync).
    Expected<void> flush();

    /// Bytes of this item held by the partial, buffered ones included.
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return written_; }

    [[nodiscard]] std::size_t chunkSize() const noexcept { return chunkSize_; }

    /// flush + fsync + rename to the final name + fsync of the directory.
    Expected<void> promote();

    /// Remove the partial from disk.
    Expected<void> discard();

private:
    Expected<void> open();
    void close() noexcept;

    std::filesystem::path finalPath_;
    std::filesystem::path partPath_;
    std::ofstream out_;
    bool truncateOnOpen_{false};
    std::uint64_t written_{0};
    std::size_t chunkSize_{0};
    std::vector<std::byte> buffer_;
};

} // namespace hoard::downloader
