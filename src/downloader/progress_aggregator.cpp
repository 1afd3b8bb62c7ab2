#include <hoard/downloader/progress_aggregator.hpp>

#include <spdlog/spdlog.h>

#include <mutex>

namespace hoard::downloader {

namespace {

TransferState stateFor(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Completed:
            return TransferState::Completed;
        case OutcomeKind::Skipped:
            return TransferState::Skipped;
        case OutcomeKind::Deferred:
            return TransferState::Deferred;
        case OutcomeKind::Failed:
            return TransferState::Failed;
    }
    return TransferState::Failed;
}

} // namespace

ProgressAggregator::ProgressAggregator() : started_(Clock::now()) {}

bool ProgressAggregator::registerItem(const std::string& link) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = items_.try_emplace(link);
    if (!inserted) {
        spdlog::warn("ProgressAggregator: duplicate item {}", link);
    }
    return inserted;
}

bool ProgressAggregator::adoptDeferred(const std::string& link) {
    std::unique_lock lock(mutex_);
    Entry e;
    e.state = TransferState::Deferred;
    auto [it, inserted] = items_.try_emplace(link, e);
    if (!inserted) {
        spdlog::warn("ProgressAggregator: cannot adopt {} (already {})", link,
                     toString(it->second.state));
        return false;
    }
    ++currentlyDeferred_;
    return true;
}

bool ProgressAggregator::begin(std::string_view link, AttemptPass pass) {
    std::unique_lock lock(mutex_);
    auto it = items_.find(std::string(link));
    if (it == items_.end()) {
        spdlog::error("ProgressAggregator: begin() for unknown item {}", link);
        return false;
    }

    auto& e = it->second;
    const TransferState expected =
        pass == AttemptPass::Main ? TransferState::Pending : TransferState::Deferred;
    if (e.state != expected) {
        spdlog::error("ProgressAggregator: rejected {} -> in-progress for {}", toString(e.state),
                      link);
        return false;
    }
    e.state = TransferState::InProgress;
    e.retrying = (pass == AttemptPass::Retry);
    return true;
}

bool ProgressAggregator::record(std::string_view link, const TransferOutcome& outcome) {
    std::unique_lock lock(mutex_);
    auto it = items_.find(std::string(link));
    if (it == items_.end()) {
        spdlog::error("ProgressAggregator: record() for unknown item {}", link);
        return false;
    }

    auto& e = it->second;
    const TransferState next = stateFor(outcome.kind);
    bool legal = false;
    if (e.state == TransferState::InProgress) {
        if (e.retrying) {
            legal = next == TransferState::Completed || next == TransferState::Failed;
        } else {
            legal = next == TransferState::Completed || next == TransferState::Skipped ||
                    next == TransferState::Deferred;
        }
    }
    if (!legal) {
        spdlog::error("ProgressAggregator: rejected {} -> {} for {}", toString(e.state),
                      toString(next), link);
        return false;
    }

    if (e.retrying && currentlyDeferred_ > 0) {
        --currentlyDeferred_;
    }
    if (next == TransferState::Deferred) {
        ++currentlyDeferred_;
    }
    e.state = next;
    e.retrying = false;
    e.skipReason = outcome.skipReason;
    e.failReason = outcome.failReason;
    return true;
}

std::optional<TransferState> ProgressAggregator::state(std::string_view link) const {
    std::shared_lock lock(mutex_);
    auto it = items_.find(std::string(link));
    if (it == items_.end())
        return std::nullopt;
    return it->second.state;
}

std::optional<SkipReason> ProgressAggregator::skipReason(std::string_view link) const {
    std::shared_lock lock(mutex_);
    auto it = items_.find(std::string(link));
    if (it == items_.end())
        return std::nullopt;
    return it->second.skipReason;
}

std::size_t ProgressAggregator::currentlyDeferred() const {
    std::shared_lock lock(mutex_);
    return currentlyDeferred_;
}

RunSummary ProgressAggregator::summary() const {
    std::shared_lock lock(mutex_);
    RunSummary s;
    for (const auto& [link, e] : items_) {
        switch (e.state) {
            case TransferState::Completed:
                ++s.completed;
                break;
            case TransferState::Skipped:
                switch (e.skipReason.value_or(SkipReason::AlreadyExists)) {
                    case SkipReason::AlreadyExists:
                        ++s.skippedAlreadyExists;
                        break;
                    case SkipReason::IgnoreFilter:
                        ++s.skippedIgnoreFilter;
                        break;
                    case SkipReason::IncludeFilter:
                        ++s.skippedIncludeFilter;
                        break;
                    case SkipReason::HostOffline:
                        ++s.skippedHostOffline;
                        break;
                    case SkipReason::ServiceUnavailable:
                        ++s.skippedServiceUnavailable;
                        break;
                }
                break;
            case TransferState::Failed:
                if (e.failReason.value_or(FailReason::RetriesExhausted) == FailReason::HostOffline)
                    ++s.failedHostOffline;
                else
                    ++s.failedRetriesExhausted;
                break;
            case TransferState::Pending:
                ++s.notStarted;
                break;
            case TransferState::InProgress:
            case TransferState::Deferred:
                break;
        }
    }
    s.currentlyDeferred = currentlyDeferred_;
    s.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
    return s;
}

} // namespace hoard::downloader
