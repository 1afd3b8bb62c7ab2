#include <hoard/downloader/file_sync.hpp>
#include <hoard/downloader/retry_ledger.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <system_error>

namespace hoard::downloader {

namespace fs = std::filesystem;

namespace {

std::string trimmed(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

} // namespace

RetryLedger::RetryLedger(fs::path path) : path_(std::move(path)) {}

Expected<void> RetryLedger::load() {
    std::unique_lock lock(mutex_);
    order_.clear();
    index_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Expected<void>{};
    }

    std::ifstream in(path_);
    if (!in) {
        spdlog::warn("RetryLedger: cannot open '{}' for reading", path_.string());
        return Error{ErrorCode::IoError, "Failed to open ledger: " + path_.string()};
    }

    std::string line;
    while (std::getline(in, line)) {
        auto link = trimmed(line);
        if (link.empty())
            continue;
        if (index_.insert(link).second)
            order_.push_back(std::move(link));
    }
    spdlog::debug("RetryLedger: loaded {} entr(ies) from {}", order_.size(), path_.string());
    return Expected<void>{};
}

Expected<void> RetryLedger::append(const std::string& link) {
    auto key = trimmed(link);
    if (key.empty()) {
        return Error{ErrorCode::InvalidArgument, "Ledger entries must not be empty"};
    }

    std::unique_lock lock(mutex_);
    if (!index_.insert(key).second) {
        spdlog::debug("RetryLedger: skipped duplicate entry {}", key);
        return Expected<void>{};
    }
    order_.push_back(key);

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
    }

    {
        std::ofstream os(path_, std::ios::out | std::ios::app);
        if (!os.good()) {
            spdlog::warn("RetryLedger: failed to append '{}' to {}", key, path_.string());
            return Error{ErrorCode::IoError, "Failed to open ledger for append: " + path_.string()};
        }
        os << key << '\n';
        os.flush();
        if (!os.good()) {
            spdlog::warn("RetryLedger: write failed on {}", path_.string());
            return Error{ErrorCode::IoError, "write failed on: " + path_.string()};
        }
    }

    if (auto r = syncFile(path_); !r.ok()) {
        spdlog::warn("RetryLedger: {}", r.error().message);
        return r;
    }
    spdlog::debug("RetryLedger: appended {}", key);
    return Expected<void>{};
}

bool RetryLedger::contains(std::string_view link) const {
    auto key = trimmed(link);
    std::shared_lock lock(mutex_);
    return index_.find(key) != index_.end();
}

Expected<void> RetryLedger::remove(std::string_view link) {
    auto key = trimmed(link);
    std::unique_lock lock(mutex_);
    if (index_.erase(key) == 0) {
        return Expected<void>{};
    }
    order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
    spdlog::debug("RetryLedger: removed {}", key);
    return persistLocked();
}

std::vector<std::string> RetryLedger::entries() const {
    std::shared_lock lock(mutex_);
    return order_;
}

std::size_t RetryLedger::size() const {
    std::shared_lock lock(mutex_);
    return order_.size();
}

std::vector<std::string> RetryLedger::runRetryPass(const std::vector<std::string>& pass,
                                                   const AttemptFn& attempt) {
    std::vector<std::string> remaining;
    std::unordered_set<std::string> seen;

    for (const auto& raw : pass) {
        auto link = trimmed(raw);
        if (link.empty() || !seen.insert(link).second)
            continue;

        bool resolved = false;
        if (attempt) {
            resolved = attempt(link);
        }

        std::unique_lock lock(mutex_);
        if (resolved) {
            if (index_.erase(link) > 0) {
                order_.erase(std::remove(order_.begin(), order_.end(), link), order_.end());
            }
        } else {
            remaining.push_back(link);
            if (index_.insert(link).second)
                order_.push_back(link);
        }
    }

    std::unique_lock lock(mutex_);
    if (auto r = persistLocked(); !r.ok()) {
        spdlog::warn("RetryLedger: rewrite after retry pass failed: {}", r.error().message);
    }
    return remaining;
}

Expected<void> RetryLedger::persistLocked() {
    std::error_code ec;
    if (order_.empty()) {
        if (fs::remove(path_, ec); ec) {
            spdlog::warn("RetryLedger: failed to delete {}: {}", path_.string(), ec.message());
            return Error{ErrorCode::IoError, "Failed to delete ledger: " + path_.string()};
        }
        if (auto r = syncDirectory(path_.parent_path()); !r.ok()) {
            spdlog::debug("RetryLedger: {}", r.error().message);
        }
        return Expected<void>{};
    }

    std::string content;
    for (const auto& link : order_) {
        content += link;
        content.push_back('\n');
    }
    auto r = replaceFileAtomically(path_, content);
    if (!r.ok()) {
        spdlog::warn("RetryLedger: {}", r.error().message);
    }
    return r;
}

} // namespace hoard::downloader
