#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace hoard::downloader {

inline constexpr std::size_t kMaxFilenameLength = 120;

/**
 * Strip characters that are illegal in filenames on common filesystems
 * (<>:"/\|?* and control characters). When the stem exceeds the length limit it
 * is cut so that stem plus extension fit. Returns "download" for empty input.
 */
std::string sanitizeFilename(std::string_view filename);

/// Replace path separators and ':' in an album id so it can name a directory.
/// "." and ".." become "album".
std::string sanitizeDirectoryName(std::string_view name);

/// Last non-empty path segment of a link, percent-decoded, without query or fragment.
std::string filenameFromLink(std::string_view link);

} // namespace hoard::downloader
