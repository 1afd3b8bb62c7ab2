#include <catch2/catch_test_macros.hpp>

#include <hoard/downloader/event_sinks.hpp>

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace hoard::downloader;

namespace {

std::vector<json> parse_lines(const std::string& text) {
    std::vector<json> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty())
            out.push_back(json::parse(line));
    }
    return out;
}

ItemOutcomeEvent outcomeEvent(TransferOutcome o, AttemptPass pass = AttemptPass::Main) {
    ItemOutcomeEvent ev;
    ev.item = ItemDescriptor{"https://cdn1.example.net/a/02.jpg", "02.jpg", 2, "album-7"};
    ev.pass = pass;
    ev.outcome = std::move(o);
    return ev;
}

} // namespace

TEST_CASE("JsonEventSink: one JSON object per line", "[downloader][events]") {
    std::ostringstream out;
    JsonEventSink sink(out);

    sink.onRunStarted(RunStartedEvent{"album-7", 5, 3, 1});
    sink.onItemOutcome(outcomeEvent(TransferOutcome::completed(1234, 2)));
    sink.onItemOutcome(outcomeEvent(TransferOutcome::skipped(SkipReason::HostOffline, "host down")));
    sink.onItemOutcome(outcomeEvent(
        TransferOutcome::failed(FailReason::RetriesExhausted, 1, "HTTP 404"), AttemptPass::Retry));
    sink.onRetryPassSummary(RetryPassSummaryEvent{2, 1, 1});

    RunSummary summary;
    summary.completed = 3;
    summary.skippedHostOffline = 1;
    summary.failedRetriesExhausted = 1;
    summary.elapsed = std::chrono::milliseconds(1500);
    sink.onRunSummary(summary);

    auto lines = parse_lines(out.str());
    REQUIRE(lines.size() == 6);

    CHECK(lines[0]["event"] == "run-started");
    CHECK(lines[0]["items"] == 5);
    CHECK(lines[0]["concurrency"] == 3);
    CHECK(lines[0]["ledger_entries"] == 1);

    CHECK(lines[1]["event"] == "item-outcome");
    CHECK(lines[1]["ordinal"] == 2);
    CHECK(lines[1]["filename"] == "02.jpg");
    CHECK(lines[1]["result"] == "completed");
    CHECK(lines[1]["bytes"] == 1234);
    CHECK(lines[1]["attempts"] == 2);
    CHECK_FALSE(lines[1].contains("reason"));

    CHECK(lines[2]["result"] == "skipped");
    CHECK(lines[2]["reason"] == "host-offline");
    CHECK(lines[2]["detail"] == "host down");

    CHECK(lines[3]["pass"] == "retry");
    CHECK(lines[3]["result"] == "failed");
    CHECK(lines[3]["reason"] == "retries-exhausted");

    CHECK(lines[4]["event"] == "retry-pass-summary");
    CHECK(lines[4]["recovered"] == 1);

    CHECK(lines[5]["event"] == "run-summary");
    CHECK(lines[5]["completed"] == 3);
    CHECK(lines[5]["skipped"]["host-offline"] == 1);
    CHECK(lines[5]["failed"]["retries-exhausted"] == 1);
    CHECK(lines[5]["elapsed_ms"] == 1500);
}

TEST_CASE("LoggingEventSink: accepts every event kind", "[downloader][events]") {
    LoggingEventSink sink;
    CHECK_NOTHROW(sink.onRunStarted(RunStartedEvent{"album-7", 1, 1, 0}));
    CHECK_NOTHROW(sink.onItemOutcome(outcomeEvent(TransferOutcome::deferred(5, "timeout"))));
    CHECK_NOTHROW(sink.onItemOutcome(
        outcomeEvent(TransferOutcome::failed(FailReason::HostOffline, 0), AttemptPass::Retry)));
    CHECK_NOTHROW(sink.onRetryPassSummary(RetryPassSummaryEvent{1, 0, 1}));
    CHECK_NOTHROW(sink.onRunSummary(RunSummary{}));
}
