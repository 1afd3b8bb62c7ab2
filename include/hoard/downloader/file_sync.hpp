#pragma once

#include <hoard/downloader/downloader.hpp>

#include <filesystem>
#include <string_view>

namespace hoard::downloader {

/// fsync a regular file by path.
Expected<void> syncFile(const std::filesystem::path& p);

/// fsync a directory so renames and unlinks inside it are durable.
Expected<void> syncDirectory(const std::filesystem::path& dir);

/**
 * Replace `target` with `content` atomically: write "<target>.tmp", fsync it,
 * rename over the target, then fsync the parent directory. A crash leaves
 * either the old or the new content, never a torn file.
 */
Expected<void> replaceFileAtomically(const std::filesystem::path& target, std::string_view content);

} // namespace hoard::downloader
