#pragma once

#include <hoard/downloader/downloader.hpp>
#include <hoard/downloader/run_context.hpp>
#include <hoard/downloader/transfer_executor.hpp>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <vector>

namespace hoard::downloader {

/**
 * Drives one album through the executor.
 *
 * Main phase: every descriptor is admitted exactly once into a pool of K
 * workers (at most K transfers in flight); join() is the barrier. The
 * trailing pass then re-attempts every ledger entry once, sequentially.
 */
class AlbumScheduler {
public:
    /// Throws std::invalid_argument when concurrency is zero.
    AlbumScheduler(TransferExecutor& executor, RunContext& ctx, std::size_t concurrency);

    /**
     * Run the main phase and return the items that ended Deferred. Items are
     * written to albumDir / sanitized filename. Duplicate links are attempted
     * once. After cancellation, items not yet admitted stay Pending.
     */
    std::vector<ItemDescriptor> runMainPhase(const std::vector<ItemDescriptor>& items,
                                             const std::filesystem::path& albumDir);

    /**
     * Attempt every ledger entry (plus any item deferred in this run that the
     * ledger could not record) exactly once. Links unknown to `items` get a
     * descriptor with a filename from the link and an ordinal after the album's.
     */
    RetryPassSummaryEvent runRetryPass(const std::vector<ItemDescriptor>& items,
                                       const std::vector<ItemDescriptor>& deferred,
                                       const std::filesystem::path& albumDir);

    [[nodiscard]] std::size_t concurrency() const noexcept { return concurrency_; }

    /// Highest number of simultaneously running transfers observed so far.
    [[nodiscard]] std::size_t peakInFlight() const noexcept { return peak_.load(); }

private:
    void noteStarted() noexcept;
    void noteFinished() noexcept;

    TransferExecutor& executor_;
    RunContext& ctx_;
    std::size_t concurrency_;
    std::atomic<std::size_t> inFlight_{0};
    std::atomic<std::size_t> peak_{0};
};

} // namespace hoard::downloader
