#include <hoard/cli/manifest.h>
#include <hoard/config/config_helpers.h>
#include <hoard/downloader/filename_utils.hpp>

#include <spdlog/spdlog.h>

#include <fstream>

namespace hoard::cli {

using downloader::Error;
using downloader::ErrorCode;
using downloader::ItemDescriptor;

std::vector<ItemDescriptor> parseManifest(std::istream& in, const std::string& albumId) {
    std::vector<ItemDescriptor> items;
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        config::rtrim(line);
        std::string probe = line;
        config::ltrim(probe);
        if (probe.empty() || probe[0] == '#')
            continue;

        ItemDescriptor item;
        auto tab = line.find('\t');
        if (tab == std::string::npos) {
            item.link = std::move(probe);
        } else {
            item.link = line.substr(0, tab);
            item.filename = line.substr(tab + 1);
            config::trim(item.link);
            config::trim(item.filename);
        }
        if (item.link.empty()) {
            spdlog::warn("Manifest line {}: missing link", lineNo);
            continue;
        }
        if (item.filename.empty())
            item.filename = downloader::filenameFromLink(item.link);

        item.ordinal = static_cast<int>(items.size() + 1);
        item.albumId = albumId;
        items.push_back(std::move(item));
    }
    return items;
}

downloader::Expected<std::vector<ItemDescriptor>> loadManifest(const std::filesystem::path& path,
                                                               const std::string& albumId) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::InvalidArgument, "Cannot open manifest: " + path.string()};
    }
    return parseManifest(in, albumId);
}

} // namespace hoard::cli
