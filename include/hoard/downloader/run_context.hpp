#pragma once

#include <hoard/downloader/downloader.hpp>
#include <hoard/downloader/host_availability_tracker.hpp>
#include <hoard/downloader/progress_aggregator.hpp>
#include <hoard/downloader/retry_ledger.hpp>

#include <atomic>
#include <filesystem>
#include <utility>

namespace hoard::downloader {

/**
 * Run-scoped shared state handed to every component of one run. Each member
 * synchronizes itself; the context only ties their lifetimes to the run.
 */
struct RunContext {
    explicit RunContext(std::filesystem::path ledgerPath, IEventSink* sink = nullptr)
        : ledger(std::move(ledgerPath)), events(sink) {}

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    HostAvailabilityTracker hosts;
    RetryLedger ledger;
    ProgressAggregator progress;
    IEventSink* events{nullptr};

    // Set from a signal handler; must stay lock-free.
    std::atomic<bool> cancelRequested{false};

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelRequested.load(std::memory_order_relaxed);
    }
    void requestCancel() noexcept { cancelRequested.store(true, std::memory_order_relaxed); }
};

static_assert(std::atomic<bool>::is_always_lock_free);

} // namespace hoard::downloader
