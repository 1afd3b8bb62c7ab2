#pragma once

#include <hoard/downloader/album_scheduler.hpp>
#include <hoard/downloader/downloader.hpp>
#include <hoard/downloader/host_status_store.hpp>
#include <hoard/downloader/run_context.hpp>
#include <hoard/downloader/transfer_executor.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace hoard::downloader {

/**
 * One run end to end:
 *   load ledger + host statuses -> run-started -> main phase -> barrier ->
 *   trailing retry pass (skipped when cancelled) -> host statuses saved ->
 *   run-summary.
 */
class DownloadRun {
public:
    DownloadRun(IHttpAdapter& http, RunContext& ctx, TransferConfig config,
                std::size_t concurrency);

    /// Optional cross-run host status file; loaded before and saved after the run.
    void setHostStatusStore(const JsonHostStatusStore* store) { hostStore_ = store; }

    /// Backoff sleep override forwarded to the executor.
    void setSleepFunction(TransferExecutor::SleepFn fn) { executor_.setSleepFunction(std::move(fn)); }

    /**
     * Download `items` into downloadRoot / sanitized albumId. Ordinals left at
     * zero are assigned from list position; albumId is filled in when empty.
     */
    RunSummary run(const std::string& albumId, std::vector<ItemDescriptor> items,
                   const std::filesystem::path& downloadRoot);

    [[nodiscard]] const AlbumScheduler& scheduler() const noexcept { return scheduler_; }

private:
    RunContext& ctx_;
    TransferExecutor executor_;
    AlbumScheduler scheduler_;
    const JsonHostStatusStore* hostStore_{nullptr};
};

} // namespace hoard::downloader
