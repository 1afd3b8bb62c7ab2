#pragma once

#include <hoard/downloader/downloader.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace hoard::downloader {

/**
 * Durable record of links owed exactly one more attempt.
 *
 * File format: UTF-8 text, one link per line. Appends go straight to the end
 * of the file and are fsync'd before returning; removals and the end-of-pass
 * rewrite replace the whole file atomically. An absent file means no entries.
 *
 * I/O failures are logged and returned; the in-memory view is updated either
 * way so a failing disk never blocks transfers.
 */
class RetryLedger {
public:
    /// Result of one trailing-pass attempt: true when the link is resolved.
    using AttemptFn = std::function<bool(const std::string& link)>;

    explicit RetryLedger(std::filesystem::path path);

    RetryLedger(const RetryLedger&) = delete;
    RetryLedger& operator=(const RetryLedger&) = delete;

    /// Read entries persisted by earlier runs. A missing file is not an error.
    Expected<void> load();

    /// Idempotent: a link already present is not written twice.
    Expected<void> append(const std::string& link);

    [[nodiscard]] bool contains(std::string_view link) const;

    Expected<void> remove(std::string_view link);

    [[nodiscard]] std::vector<std::string> entries() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /**
     * Attempt every entry exactly once, sequentially. Resolved entries are
     * dropped; the file is then rewritten with what is still owed, or deleted
     * when nothing remains. Returns the entries of `pass` that were not
     * resolved, without duplicates.
     */
    std::vector<std::string> runRetryPass(const std::vector<std::string>& pass,
                                          const AttemptFn& attempt);

private:
    Expected<void> persistLocked();

    std::filesystem::path path_;
    mutable std::shared_mutex mutex_;
    std::vector<std::string> order_;
    std::unordered_set<std::string> index_;
};

} // namespace hoard::downloader
