#include <hoard/downloader/file_sync.hpp>
#include <hoard/downloader/host_status_store.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <system_error>

namespace hoard::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

std::optional<HostStatus> parseStatus(const std::string& s) {
    if (s == "online")
        return HostStatus::Online;
    if (s == "offline")
        return HostStatus::Offline;
    if (s == "maintenance")
        return HostStatus::Maintenance;
    return std::nullopt;
}

} // namespace

Expected<std::map<std::string, HostStatus>> JsonHostStatusStore::load() const {
    std::map<std::string, HostStatus> out;
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return out;
    }

    std::ifstream in(path_);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open host status JSON for read"};
    }

    json root;
    try {
        in >> root;
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring unreadable host status file {}: {}", path_.string(), e.what());
        return out;
    }
    if (!root.is_object()) {
        spdlog::warn("Ignoring host status file {}: not a JSON object", path_.string());
        return out;
    }

    for (const auto& [host, value] : root.items()) {
        if (!value.is_string())
            continue;
        auto st = parseStatus(value.get<std::string>());
        if (!st) {
            spdlog::debug("Unknown status '{}' for host {}", value.get<std::string>(), host);
            continue;
        }
        out.emplace(host, *st);
    }
    return out;
}

Expected<void> JsonHostStatusStore::save(const std::map<std::string, HostStatus>& statuses) const {
    json root = json::object();
    for (const auto& [host, st] : statuses) {
        root[host] = toString(st);
    }
    return replaceFileAtomically(path_, root.dump(2) + "\n");
}

} // namespace hoard::downloader
