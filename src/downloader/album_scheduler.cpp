#include <hoard/downloader/album_scheduler.hpp>
#include <hoard/downloader/filename_utils.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace hoard::downloader {

namespace fs = std::filesystem;

AlbumScheduler::AlbumScheduler(TransferExecutor& executor, RunContext& ctx,
                               std::size_t concurrency)
    : executor_(executor), ctx_(ctx), concurrency_(concurrency) {
    if (concurrency_ == 0) {
        throw std::invalid_argument("AlbumScheduler: concurrency must be at least 1");
    }
}

void AlbumScheduler::noteStarted() noexcept {
    auto now = inFlight_.fetch_add(1) + 1;
    auto prev = peak_.load();
    while (now > prev && !peak_.compare_exchange_weak(prev, now)) {
    }
}

void AlbumScheduler::noteFinished() noexcept {
    inFlight_.fetch_sub(1);
}

std::vector<ItemDescriptor> AlbumScheduler::runMainPhase(const std::vector<ItemDescriptor>& items,
                                                         const fs::path& albumDir) {
    std::vector<ItemDescriptor> deferred;
    std::mutex deferredMutex;
    const int maxAttempts = executor_.config().retry.maxAttempts;

    std::vector<const ItemDescriptor*> admitted;
    admitted.reserve(items.size());
    std::unordered_set<std::string> seen;
    for (const auto& item : items) {
        if (!seen.insert(item.link).second) {
            spdlog::warn("[{}] {}: duplicate link, attempting once", item.ordinal, item.filename);
            continue;
        }
        ctx_.progress.registerItem(item.link);
        admitted.push_back(&item);
    }

    spdlog::debug("AlbumScheduler: {} item(s), {} worker(s)", admitted.size(), concurrency_);

    boost::asio::thread_pool pool(concurrency_);
    for (const ItemDescriptor* item : admitted) {
        boost::asio::post(pool, [&, item] {
            if (ctx_.cancelled()) {
                return; // admission stopped; item stays Pending
            }
            noteStarted();
            auto outcome =
                executor_.execute(*item, albumDir / sanitizeFilename(item->filename), maxAttempts);
            noteFinished();
            if (outcome.kind == OutcomeKind::Deferred) {
                std::lock_guard lock(deferredMutex);
                deferred.push_back(*item);
            }
        });
    }
    pool.join();

    spdlog::debug("AlbumScheduler: main phase done, {} deferred, peak {} in flight",
                  deferred.size(), peak_.load());
    return deferred;
}

RetryPassSummaryEvent AlbumScheduler::runRetryPass(const std::vector<ItemDescriptor>& items,
                                                   const std::vector<ItemDescriptor>& deferred,
                                                   const fs::path& albumDir) {
    std::unordered_map<std::string, ItemDescriptor> byLink;
    int lastOrdinal = 0;
    std::string albumId;
    for (const auto& item : items) {
        byLink.try_emplace(item.link, item);
        lastOrdinal = std::max(lastOrdinal, item.ordinal);
        if (albumId.empty())
            albumId = item.albumId;
    }

    std::vector<std::string> pass = ctx_.ledger.entries();
    for (const auto& item : deferred) {
        if (std::find(pass.begin(), pass.end(), item.link) == pass.end()) {
            spdlog::warn("[{}] {} missing from the retry ledger; retrying anyway", item.ordinal,
                         item.filename);
            pass.push_back(item.link);
        }
    }

    RetryPassSummaryEvent summary;
    if (pass.empty()) {
        return summary;
    }
    spdlog::info("Retrying {} deferred item(s)", pass.size());

    auto attempt = [&](const std::string& link) -> bool {
        if (ctx_.cancelled())
            return false;

        if (auto st = ctx_.progress.state(link)) {
            if (*st == TransferState::Skipped) {
                // Host went away earlier in this run; keep the entry for the next run.
                return false;
            }
            if (*st == TransferState::Completed)
                return true;
        }

        auto it = byLink.find(link);
        if (it == byLink.end()) {
            ItemDescriptor carried;
            carried.link = link;
            carried.filename = filenameFromLink(link);
            carried.ordinal = ++lastOrdinal;
            carried.albumId = albumId;
            it = byLink.emplace(link, std::move(carried)).first;
        }

        ++summary.attempted;
        noteStarted();
        auto outcome =
            executor_.execute(it->second, albumDir / sanitizeFilename(it->second.filename), 1);
        noteFinished();
        if (outcome.kind == OutcomeKind::Completed) {
            ++summary.recovered;
            return true;
        }
        return false;
    };

    auto remaining = ctx_.ledger.runRetryPass(pass, attempt);
    summary.remaining = remaining.size();

    if (ctx_.events) {
        ctx_.events->onRetryPassSummary(summary);
    }
    return summary;
}

} // namespace hoard::downloader
