#include <hoard/downloader/event_sinks.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace hoard::downloader {

using nlohmann::json;

namespace {

std::string reasonOf(const TransferOutcome& o) {
    if (o.skipReason)
        return toString(*o.skipReason);
    if (o.failReason)
        return toString(*o.failReason);
    return {};
}

} // namespace

// ---- LoggingEventSink ----

void LoggingEventSink::onRunStarted(const RunStartedEvent& ev) {
    spdlog::info("Album {}: {} item(s), {} worker(s), {} pending retr(ies) from earlier runs",
                 ev.albumId, ev.itemCount, ev.concurrency, ev.ledgerEntries);
}

void LoggingEventSink::onItemOutcome(const ItemOutcomeEvent& ev) {
    const auto& o = ev.outcome;
    const char* pass = ev.pass == AttemptPass::Retry ? " (retry)" : "";
    switch (o.kind) {
        case OutcomeKind::Completed:
            spdlog::info("[{}] {}{}: completed", ev.item.ordinal, ev.item.filename, pass);
            break;
        case OutcomeKind::Skipped:
            spdlog::info("[{}] {}: skipped ({})", ev.item.ordinal, ev.item.filename, reasonOf(o));
            break;
        case OutcomeKind::Deferred:
            spdlog::warn("[{}] {}: deferred to retry pass", ev.item.ordinal, ev.item.filename);
            break;
        case OutcomeKind::Failed:
            spdlog::error("[{}] {}{}: failed ({}){}{}", ev.item.ordinal, ev.item.filename, pass,
                          reasonOf(o), o.detail.empty() ? "" : ": ", o.detail);
            break;
    }
}

void LoggingEventSink::onRetryPassSummary(const RetryPassSummaryEvent& ev) {
    spdlog::info("Retry pass: {} attempted, {} recovered, {} still owed", ev.attempted,
                 ev.recovered, ev.remaining);
}

void LoggingEventSink::onRunSummary(const RunSummary& s) {
    spdlog::info("Completed: {}", s.completed);
    spdlog::info("Skipped: {} (already exists {}, ignore filter {}, include filter {}, "
                 "host offline {}, service unavailable {})",
                 s.skipped(), s.skippedAlreadyExists, s.skippedIgnoreFilter,
                 s.skippedIncludeFilter, s.skippedHostOffline, s.skippedServiceUnavailable);
    spdlog::info("Failed: {} (retries exhausted {}, host offline {})", s.failed(),
                 s.failedRetriesExhausted, s.failedHostOffline);
    if (s.currentlyDeferred > 0 || s.notStarted > 0) {
        spdlog::warn("Deferred: {}, not started: {}", s.currentlyDeferred, s.notStarted);
    }
    spdlog::info("Elapsed: {:.1f}s", static_cast<double>(s.elapsed.count()) / 1000.0);
}

// ---- JsonEventSink ----

void JsonEventSink::writeLine(const std::string& line) {
    std::lock_guard lock(mutex_);
    out_ << line << '\n';
    out_.flush();
}

void JsonEventSink::onRunStarted(const RunStartedEvent& ev) {
    json j{{"event", "run-started"},
           {"album", ev.albumId},
           {"items", ev.itemCount},
           {"concurrency", ev.concurrency},
           {"ledger_entries", ev.ledgerEntries}};
    writeLine(j.dump());
}

void JsonEventSink::onItemOutcome(const ItemOutcomeEvent& ev) {
    const auto& o = ev.outcome;
    json j{{"event", "item-outcome"},
           {"ordinal", ev.item.ordinal},
           {"filename", ev.item.filename},
           {"link", ev.item.link},
           {"pass", ev.pass == AttemptPass::Retry ? "retry" : "main"},
           {"result", toString(o.kind)},
           {"attempts", o.attempts},
           {"bytes", o.bytesWritten}};
    if (auto r = reasonOf(o); !r.empty())
        j["reason"] = r;
    if (!o.detail.empty())
        j["detail"] = o.detail;
    writeLine(j.dump());
}

void JsonEventSink::onRetryPassSummary(const RetryPassSummaryEvent& ev) {
    json j{{"event", "retry-pass-summary"},
           {"attempted", ev.attempted},
           {"recovered", ev.recovered},
           {"remaining", ev.remaining}};
    writeLine(j.dump());
}

void JsonEventSink::onRunSummary(const RunSummary& s) {
    json j{{"event", "run-summary"},
           {"completed", s.completed},
           {"skipped",
            {{"already-exists", s.skippedAlreadyExists},
             {"ignore-filter", s.skippedIgnoreFilter},
             {"include-filter", s.skippedIncludeFilter},
             {"host-offline", s.skippedHostOffline},
             {"service-unavailable", s.skippedServiceUnavailable}}},
           {"failed",
            {{"retries-exhausted", s.failedRetriesExhausted},
             {"host-offline", s.failedHostOffline}}},
           {"deferred", s.currentlyDeferred},
           {"not_started", s.notStarted},
           {"elapsed_ms", s.elapsed.count()}};
    writeLine(j.dump());
}

} // namespace hoard::downloader
