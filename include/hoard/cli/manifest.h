#pragma once

#include <hoard/downloader/downloader.hpp>

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace hoard::cli {

/**
 * Manifest format: one item per line, "link" or "link<TAB>filename".
 * Blank lines and lines starting with '#' are ignored. When no filename is
 * given it is taken from the link's last path segment. Ordinals follow line
 * order among accepted items, starting at 1.
 */
std::vector<downloader::ItemDescriptor> parseManifest(std::istream& in, const std::string& albumId);

downloader::Expected<std::vector<downloader::ItemDescriptor>>
loadManifest(const std::filesystem::path& path, const std::string& albumId);

} // namespace hoard::cli
