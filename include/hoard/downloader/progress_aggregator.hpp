#pragma once

#include <hoard/downloader/downloader.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace hoard::downloader {

/**
 * Live per-item state and run counters.
 *
 * Legal transitions:
 *   Pending -> InProgress -> {Completed, Skipped, Deferred}
 *   Deferred -> InProgress (retry) -> {Completed, Failed}
 *
 * Anything else is rejected (returns false) and logged; the stored state is
 * left untouched. Reads take a shared lock, updates an exclusive one.
 */
class ProgressAggregator {
public:
    using Clock = std::chrono::steady_clock;

    ProgressAggregator();

    /// Adds an item in Pending. Returns false if the link is already known.
    bool registerItem(const std::string& link);

    /// Registers a link carried over from an earlier run directly as Deferred.
    bool adoptDeferred(const std::string& link);

    /// Pending -> InProgress for the main pass, Deferred -> InProgress for the retry pass.
    bool begin(std::string_view link, AttemptPass pass);

    /// Applies a terminal outcome to an InProgress item.
    bool record(std::string_view link, const TransferOutcome& outcome);

    [[nodiscard]] std::optional<TransferState> state(std::string_view link) const;
    [[nodiscard]] std::optional<SkipReason> skipReason(std::string_view link) const;

    [[nodiscard]] std::size_t currentlyDeferred() const;
    [[nodiscard]] RunSummary summary() const;

private:
    struct Entry {
        TransferState state{TransferState::Pending};
        bool retrying{false};
        std::optional<SkipReason> skipReason{};
        std::optional<FailReason> failReason{};
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> items_;
    std::size_t currentlyDeferred_{0};
    Clock::time_point started_;
};

} // namespace hoard::downloader
