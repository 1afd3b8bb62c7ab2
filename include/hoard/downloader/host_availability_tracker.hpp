#pragma once

#include <hoard/downloader/downloader.hpp>

#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace hoard::downloader {

/**
 * Run-wide knowledge of which hosts are unusable.
 *
 * Hosts are keyed by hostIdForLink(). A record is created on first reference
 * and lives for the run; there is no transition back to online within a run.
 * Mutations are visible to every worker as soon as they return.
 */
class HostAvailabilityTracker {
public:
    HostAvailabilityTracker() = default;

    [[nodiscard]] bool isOffline(std::string_view link) const;

    /// Marks the link's host offline. Idempotent; returns the host id.
    std::string markOffline(std::string_view link);

    /// Status of the link's host; unknown hosts are Online.
    [[nodiscard]] HostStatus status(std::string_view link) const;

    /// Replace recorded statuses with a persisted map (host id -> status).
    void seed(const std::map<std::string, HostStatus>& statuses);

    [[nodiscard]] std::map<std::string, HostStatus> snapshot() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, HostStatus> hosts_;
};

} // namespace hoard::downloader
