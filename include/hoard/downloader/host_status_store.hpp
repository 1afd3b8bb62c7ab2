#pragma once

#include <hoard/downloader/downloader.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace hoard::downloader {

/**
 * Cross-run host status file.
 *
 * File layout (JSON object keyed by host id):
 * {
 *   "cdn1.example.net": "online",
 *   "cdn2.example.net": "offline",
 *   "media.example.org": "maintenance"
 * }
 *
 * Unknown status strings are ignored. A missing or corrupt file loads as empty.
 */
class JsonHostStatusStore {
public:
    explicit JsonHostStatusStore(std::filesystem::path path) : path_(std::move(path)) {}

    Expected<std::map<std::string, HostStatus>> load() const;

    /// Atomically rewrite the file with `statuses`.
    Expected<void> save(const std::map<std::string, HostStatus>& statuses) const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace hoard::downloader
