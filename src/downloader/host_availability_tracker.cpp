#include <hoard/downloader/host_availability_tracker.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace hoard::downloader {

bool HostAvailabilityTracker::isOffline(std::string_view link) const {
    return status(link) == HostStatus::Offline;
}

HostStatus HostAvailabilityTracker::status(std::string_view link) const {
    const auto host = hostIdForLink(link);
    if (host.empty())
        return HostStatus::Online;

    std::shared_lock lock(mutex_);
    auto it = hosts_.find(host);
    return it == hosts_.end() ? HostStatus::Online : it->second;
}

std::string HostAvailabilityTracker::markOffline(std::string_view link) {
    auto host = hostIdForLink(link);
    if (host.empty()) {
        spdlog::warn("HostAvailabilityTracker: cannot derive host from '{}'", link);
        return host;
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = hosts_.try_emplace(host, HostStatus::Offline);
    if (!inserted && it->second != HostStatus::Offline) {
        it->second = HostStatus::Offline;
        inserted = true;
    }
    if (inserted) {
        spdlog::warn("Host {} marked offline for the rest of this run", host);
    }
    return host;
}

void HostAvailabilityTracker::seed(const std::map<std::string, HostStatus>& statuses) {
    std::unique_lock lock(mutex_);
    hosts_.clear();
    for (const auto& [host, st] : statuses) {
        std::string key = host;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        hosts_[key] = st;
    }
    spdlog::debug("HostAvailabilityTracker: seeded {} host record(s)", hosts_.size());
}

std::map<std::string, HostStatus> HostAvailabilityTracker::snapshot() const {
    std::shared_lock lock(mutex_);
    return {hosts_.begin(), hosts_.end()};
}

} // namespace hoard::downloader
