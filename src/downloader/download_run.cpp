#include <hoard/downloader/download_run.hpp>
#include <hoard/downloader/filename_utils.hpp>

#include <spdlog/spdlog.h>

#include <system_error>

namespace hoard::downloader {

namespace fs = std::filesystem;

DownloadRun::DownloadRun(IHttpAdapter& http, RunContext& ctx, TransferConfig config,
                         std::size_t concurrency)
    : ctx_(ctx), executor_(http, ctx, std::move(config)), scheduler_(executor_, ctx, concurrency) {}

RunSummary DownloadRun::run(const std::string& albumId, std::vector<ItemDescriptor> items,
                            const fs::path& downloadRoot) {
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (items[i].ordinal == 0)
            items[i].ordinal = static_cast<int>(i + 1);
        if (items[i].albumId.empty())
            items[i].albumId = albumId;
    }

    if (auto r = ctx_.ledger.load(); !r.ok()) {
        spdlog::warn("Starting without earlier retry entries: {}", r.error().message);
    }

    if (hostStore_) {
        auto seeded = hostStore_->load();
        if (seeded.ok()) {
            ctx_.hosts.seed(seeded.value());
        } else {
            spdlog::warn("Host status unavailable: {}", seeded.error().message);
        }
    }

    const fs::path albumDir =
        albumId.empty() ? downloadRoot : downloadRoot / sanitizeDirectoryName(albumId);
    std::error_code ec;
    fs::create_directories(albumDir, ec);
    if (ec) {
        // Individual items will report LocalIo and be deferred.
        spdlog::error("Cannot create {}: {}", albumDir.string(), ec.message());
    }

    if (ctx_.events) {
        ctx_.events->onRunStarted(
            RunStartedEvent{albumId, items.size(), scheduler_.concurrency(), ctx_.ledger.size()});
    }

    auto deferred = scheduler_.runMainPhase(items, albumDir);

    if (ctx_.cancelled()) {
        spdlog::warn("Run interrupted; {} item(s) remain in the retry ledger",
                     ctx_.ledger.size());
    } else {
        scheduler_.runRetryPass(items, deferred, albumDir);
    }

    if (hostStore_) {
        if (auto r = hostStore_->save(ctx_.hosts.snapshot()); !r.ok()) {
            spdlog::warn("Could not save host status: {}", r.error().message);
        }
    }

    auto summary = ctx_.progress.summary();
    if (ctx_.events) {
        ctx_.events->onRunSummary(summary);
    }
    return summary;
}

} // namespace hoard::downloader
