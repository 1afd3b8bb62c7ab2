#pragma once

#include <hoard/downloader/downloader.hpp>

#include <mutex>
#include <ostream>
#include <string>

namespace hoard::downloader {

/// Renders run events as spdlog lines.
class LoggingEventSink final : public IEventSink {
public:
    void onRunStarted(const RunStartedEvent& ev) override;
    void onItemOutcome(const ItemOutcomeEvent& ev) override;
    void onRetryPassSummary(const RetryPassSummaryEvent& ev) override;
    void onRunSummary(const RunSummary& summary) override;
};

/**
 * Writes one JSON object per event and line, e.g.
 *   {"event":"item-outcome","ordinal":2,"filename":"b.jpg","result":"completed",...}
 */
class JsonEventSink final : public IEventSink {
public:
    explicit JsonEventSink(std::ostream& out) : out_(out) {}

    void onRunStarted(const RunStartedEvent& ev) override;
    void onItemOutcome(const ItemOutcomeEvent& ev) override;
    void onRetryPassSummary(const RetryPassSummaryEvent& ev) override;
    void onRunSummary(const RunSummary& summary) override;

private:
    void writeLine(const std::string& line);

    std::mutex mutex_;
    std::ostream& out_;
};

} // namespace hoard::downloader
