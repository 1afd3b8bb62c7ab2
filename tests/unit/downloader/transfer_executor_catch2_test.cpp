#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"
#include "scripted_http_adapter.h"

#include <hoard/downloader/run_context.hpp>
#include <hoard/downloader/staging_file.hpp>
#include <hoard/downloader/transfer_executor.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace hoard::downloader;
using hoard::test::ScriptedHttpAdapter;
using hoard::test::Step;

namespace {

constexpr const char* kLink = "https://cdn1.example.net/albums/42/track01.flac";

ItemDescriptor item(const std::string& link = kLink, const std::string& filename = "track01.flac",
                    int ordinal = 1) {
    return ItemDescriptor{link, filename, ordinal, "album-42"};
}

struct ExecutorFixture {
    hoard::test::TempDir dir{"hoard_exec_"};
    RunContext ctx{dir / "session.log"};
    ScriptedHttpAdapter http;
    TransferConfig cfg;
    std::vector<std::chrono::milliseconds> sleeps;

    ExecutorFixture() { http.setContent(kLink, hoard::test::make_payload(10000)); }

    std::unique_ptr<TransferExecutor> executor;

    TransferExecutor& makeExecutor() {
        executor = std::make_unique<TransferExecutor>(http, ctx, cfg);
        executor->setSleepFunction([this](std::chrono::milliseconds d) { sleeps.push_back(d); });
        return *executor;
    }

    fs::path dest(const std::string& name = "track01.flac") const { return dir / "album" / name; }
};

} // namespace

TEST_CASE("TransferExecutor: fresh download completes and promotes", "[downloader][executor]") {
    ExecutorFixture f;
    auto& ex = f.makeExecutor();

    auto out = ex.execute(item(), f.dest(), 5);

    CHECK(out.kind == OutcomeKind::Completed);
    CHECK(out.attempts == 1);
    CHECK(out.bytesWritten == 10000);
    CHECK(hoard::test::read_file(f.dest()) == hoard::test::make_payload(10000));
    CHECK_FALSE(fs::exists(StagingFile::partPathFor(f.dest())));
    CHECK_FALSE(fs::exists(f.ctx.ledger.path()));
    CHECK(f.ctx.progress.state(kLink) == TransferState::Completed);
    CHECK(f.http.offsets(kLink) == std::vector<std::uint64_t>{0});
}

TEST_CASE("TransferExecutor: existing final artifact is authoritative", "[downloader][executor]") {
    ExecutorFixture f;
    hoard::test::write_file(f.dest(), "already here");
    REQUIRE(f.ctx.ledger.append(kLink).ok());
    auto& ex = f.makeExecutor();

    SECTION("main pass skips without contacting the host") {
        auto out = ex.execute(item(), f.dest(), 5);
        CHECK(out.kind == OutcomeKind::Skipped);
        CHECK(out.skipReason == SkipReason::AlreadyExists);
        CHECK(f.http.totalCalls() == 0);
        CHECK_FALSE(f.ctx.ledger.contains(kLink));
        CHECK(hoard::test::read_file(f.dest()) == "already here");
    }

    SECTION("retry pass counts it as resolved") {
        auto out = ex.execute(item(), f.dest(), 1);
        CHECK(out.kind == OutcomeKind::Completed);
        CHECK(f.http.totalCalls() == 0);
        CHECK_FALSE(f.ctx.ledger.contains(kLink));
    }
}

TEST_CASE("TransferExecutor: local filters", "[downloader][executor][filters]") {
    ExecutorFixture f;

    SECTION("ignore list matches a substring of the filename") {
        f.cfg.filters.ignore = {"sample"};
        auto& ex = f.makeExecutor();
        auto out = ex.execute(item(kLink, "track01-sample.flac"), f.dest("track01-sample.flac"), 5);
        CHECK(out.kind == OutcomeKind::Skipped);
        CHECK(out.skipReason == SkipReason::IgnoreFilter);
    }

    SECTION("include list rejects names matching none of its entries") {
        f.cfg.filters.include = {".jpg", ".png"};
        auto& ex = f.makeExecutor();
        auto out = ex.execute(item(), f.dest(), 5);
        CHECK(out.kind == OutcomeKind::Skipped);
        CHECK(out.skipReason == SkipReason::IncludeFilter);
    }

    SECTION("matching is case-sensitive") {
        f.cfg.filters.ignore = {"SAMPLE"};
        auto& ex = f.makeExecutor();
        auto out = ex.execute(item(kLink, "track01-sample.flac"), f.dest("track01-sample.flac"), 5);
        CHECK(out.kind == OutcomeKind::Completed);
    }

    CHECK(f.ctx.ledger.size() == 0);
}

TEST_CASE("TransferExecutor: resumes from an existing partial", "[downloader][executor][resume]") {
    ExecutorFixture f;
    const auto payload = hoard::test::make_payload(10000);
    hoard::test::write_file(StagingFile::partPathFor(f.dest()), payload.substr(0, 2500));
    auto& ex = f.makeExecutor();

    auto out = ex.execute(item(), f.dest(), 5);

    CHECK(out.kind == OutcomeKind::Completed);
    CHECK(f.http.offsets(kLink) == std::vector<std::uint64_t>{2500});
    CHECK(hoard::test::read_file(f.dest()) == payload);
}

TEST_CASE("TransferExecutor: server ignoring the range restarts from zero",
          "[downloader][executor][resume]") {
    ExecutorFixture f;
    hoard::test::write_file(StagingFile::partPathFor(f.dest()), std::string(300, 'x'));
    f.http.script(kLink, {Step::ignoreRange()});
    auto& ex = f.makeExecutor();

    auto out = ex.execute(item(), f.dest(), 5);

    CHECK(out.kind == OutcomeKind::Completed);
    CHECK(out.attempts == 1);
    CHECK(hoard::test::read_file(f.dest()) == hoard::test::make_payload(10000));
}

TEST_CASE("TransferExecutor: rejected resume offset discards the partial",
          "[downloader][executor][resume]") {
    ExecutorFixture f;
    // A partial as long as the entity makes the server answer 416.
    hoard::test::write_file(StagingFile::partPathFor(f.dest()), std::string(10000, 'x'));
    auto& ex = f.makeExecutor();

    auto out = ex.execute(item(), f.dest(), 5);

    CHECK(out.kind == OutcomeKind::Completed);
    CHECK(out.attempts == 2);
    CHECK(f.http.offsets(kLink) == std::vector<std::uint64_t>{10000, 0});
    CHECK(hoard::test::read_file(f.dest()) == hoard::test::make_payload(10000));
}

TEST_CASE("TransferExecutor: interrupted stream resumes on the next attempt",
          "[downloader][executor][resume]") {
    ExecutorFixture f;
    f.http.script(kLink, {Step::cutAfter(4096)});
    auto& ex = f.makeExecutor();

    auto out = ex.execute(item(), f.dest(), 5);

    CHECK(out.kind == OutcomeKind::Completed);
    CHECK(out.attempts == 2);
    CHECK(f.http.offsets(kLink) == std::vector<std::uint64_t>{0, 4096});
    CHECK(f.sleeps.size() == 1);
    CHECK(hoard::test::read_file(f.dest()) == hoard::test::make_payload(10000));
}

TEST_CASE("TransferExecutor: rate limiting backs off and retries", "[downloader][executor]") {
    ExecutorFixture f;
    f.http.script(kLink, {Step::status(429), Step::status(429)});
    auto& ex = f.makeExecutor();

    auto out = ex.execute(item(), f.dest(), 5);

    CHECK(out.kind == OutcomeKind::Completed);
    CHECK(out.attempts == 3);
    REQUIRE(f.sleeps.size() == 2);
    // initial 3 s + jitter [1 s, 3 s], then 9 s + jitter
    CHECK(f.sleeps[0] >= std::chrono::milliseconds(4000));
    CHECK(f.sleeps[0] <= std::chrono::milliseconds(6000));
    CHECK(f.sleeps[1] >= std::chrono::milliseconds(10000));
    CHECK(f.sleeps[1] <= std::chrono::milliseconds(12000));
    CHECK(f.ctx.ledger.size() == 0);
}

TEST_CASE("TransferExecutor: host down marks the host offline", "[downloader][executor][hosts]") {
    ExecutorFixture f;
    const std::string sibling = "https://cdn1.example.net/albums/42/track02.flac";
    f.http.setContent(sibling, "sibling");

    SECTION("HTTP 503") {
        f.http.script(kLink, {Step::status(503)});
    }
    SECTION("HTTP 521") {
        f.http.script(kLink, {Step::status(521)});
    }
    SECTION("connection refused") {
        f.http.script(kLink, {Step::fail(ErrorCode::ConnectionFailed)});
    }

    auto& ex = f.makeExecutor();
    auto out = ex.execute(item(), f.dest(), 5);

    CHECK(out.kind == OutcomeKind::Skipped);
    CHECK(out.skipReason == SkipReason::HostOffline);
    CHECK(f.http.calls(kLink) == 1);
    CHECK(f.sleeps.empty());
    CHECK(f.ctx.hosts.isOffline(kLink));
    CHECK(f.ctx.ledger.contains(kLink));

    // Every later item on the same host is short-circuited.
    auto next = ex.execute(item(sibling, "track02.flac", 2), f.dest("track02.flac"), 5);
    CHECK(next.kind == OutcomeKind::Skipped);
    CHECK(next.skipReason == SkipReason::HostOffline);
    CHECK(f.http.calls(sibling) == 0);
    CHECK(f.ctx.ledger.contains(sibling));

    // In the trailing pass an offline host is a failure.
    const std::string carried = "https://cdn1.example.net/albums/42/track03.flac";
    auto retried = ex.execute(item(carried, "track03.flac", 3), f.dest("track03.flac"), 1);
    CHECK(retried.kind == OutcomeKind::Failed);
    CHECK(retried.failReason == FailReason::HostOffline);
}

TEST_CASE("TransferExecutor: client errors are not retried in-process",
          "[downloader][executor]") {
    ExecutorFixture f;
    f.http.script(kLink, {Step::status(404), Step::status(404)});
    auto& ex = f.makeExecutor();

    auto out = ex.execute(item(), f.dest(), 5);
    CHECK(out.kind == OutcomeKind::Deferred);
    CHECK(out.attempts == 1);
    CHECK(f.sleeps.empty());
    CHECK(f.ctx.ledger.contains(kLink));
    CHECK(f.ctx.progress.currentlyDeferred() == 1);

    auto retried = ex.execute(item(), f.dest(), 1);
    CHECK(retried.kind == OutcomeKind::Failed);
    CHECK(retried.failReason == FailReason::RetriesExhausted);
    CHECK(f.ctx.progress.state(kLink) == TransferState::Failed);
    CHECK(f.ctx.progress.currentlyDeferred() == 0);
    CHECK(f.http.calls(kLink) == 2);
}

TEST_CASE("TransferExecutor: exhausting attempts defers the item", "[downloader][executor]") {
    ExecutorFixture f;
    f.http.script(kLink, std::vector<Step>(5, Step::fail(ErrorCode::NetworkError)));
    auto& ex = f.makeExecutor();

    auto out = ex.execute(item(), f.dest(), 5);

    CHECK(out.kind == OutcomeKind::Deferred);
    CHECK(out.attempts == 5);
    CHECK(f.sleeps.size() == 4);
    CHECK(f.http.calls(kLink) == 5);
    CHECK(f.ctx.ledger.contains(kLink));
    CHECK_FALSE(fs::exists(f.dest()));

    SECTION("the trailing pass recovers it with a single attempt") {
        auto retried = ex.execute(item(), f.dest(), 1);
        CHECK(retried.kind == OutcomeKind::Completed);
        CHECK(retried.attempts == 1);
        CHECK(f.http.calls(kLink) == 6);
    }
}

TEST_CASE("TransferExecutor: undeclared size never promotes", "[downloader][executor]") {
    ExecutorFixture f;
    f.http.script(kLink, std::vector<Step>(5, Step::noSize()));
    auto& ex = f.makeExecutor();

    auto out = ex.execute(item(), f.dest(), 5);

    CHECK(out.kind == OutcomeKind::Deferred);
    CHECK(out.attempts == 5);
    CHECK_FALSE(fs::exists(f.dest()));
}

TEST_CASE("TransferExecutor: link owed a deferred retry waits for the trailing pass",
          "[downloader][executor][ledger]") {
    ExecutorFixture f;
    REQUIRE(f.ctx.ledger.append(kLink).ok());
    auto& ex = f.makeExecutor();

    auto out = ex.execute(item(), f.dest(), 5);

    CHECK(out.kind == OutcomeKind::Deferred);
    CHECK(out.attempts == 0);
    CHECK(f.http.totalCalls() == 0);
    CHECK(f.ctx.ledger.size() == 1);
}

TEST_CASE("TransferExecutor: ledger entries are deferred before filters and host checks",
          "[downloader][executor][ledger]") {
    ExecutorFixture f;
    REQUIRE(f.ctx.ledger.append(kLink).ok());

    SECTION("ignored filename") {
        f.cfg.filters.ignore = {"track01"};
    }
    SECTION("filename outside the include list") {
        f.cfg.filters.include = {".jpg"};
    }
    SECTION("host flagged offline") {
        f.ctx.hosts.seed({{"cdn1.example.net", HostStatus::Offline}});
    }

    auto& ex = f.makeExecutor();
    auto out = ex.execute(item(), f.dest(), 5);

    CHECK(out.kind == OutcomeKind::Deferred);
    CHECK(f.http.totalCalls() == 0);
    CHECK(f.ctx.ledger.contains(kLink));

    // The trailing pass ignores filters but still honours the host status.
    auto retry = ex.execute(item(), f.dest(), 1);
    if (f.ctx.hosts.isOffline(kLink)) {
        CHECK(retry.kind == OutcomeKind::Failed);
        CHECK(retry.failReason == FailReason::HostOffline);
        CHECK(f.http.totalCalls() == 0);
    } else {
        CHECK(retry.kind == OutcomeKind::Completed);
        CHECK(fs::exists(f.dest()));
    }
}

TEST_CASE("TransferExecutor: maintenance hosts are not contacted", "[downloader][executor][hosts]") {
    ExecutorFixture f;
    f.ctx.hosts.seed({{"CDN1.example.net", HostStatus::Maintenance}});
    auto& ex = f.makeExecutor();

    auto out = ex.execute(item(), f.dest(), 5);
    CHECK(out.kind == OutcomeKind::Skipped);
    CHECK(out.skipReason == SkipReason::ServiceUnavailable);
    CHECK(f.ctx.ledger.contains(kLink));
    CHECK(f.http.totalCalls() == 0);
}

TEST_CASE("TransferExecutor: cancellation keeps the partial", "[downloader][executor][cancel]") {
    ExecutorFixture f;
    f.http.setFetchHook([&](const std::string&) { f.ctx.requestCancel(); });
    f.http.script(kLink, {Step::serve()});
    auto& ex = f.makeExecutor();

    auto out = ex.execute(item(), f.dest(), 5);

    CHECK(out.kind == OutcomeKind::Deferred);
    CHECK(f.http.calls(kLink) == 1);
    CHECK(f.sleeps.empty());
    CHECK(f.ctx.ledger.contains(kLink));
    CHECK_FALSE(fs::exists(f.dest()));
}

TEST_CASE("TransferExecutor: each item reports exactly one outcome", "[downloader][executor]") {
    ExecutorFixture f;
    auto& ex = f.makeExecutor();

    REQUIRE(ex.execute(item(), f.dest(), 5).kind == OutcomeKind::Completed);

    // A second main-pass execution of the same item is rejected.
    auto again = ex.execute(item(), f.dest(), 5);
    CHECK(again.kind == OutcomeKind::Deferred);
    CHECK(f.ctx.progress.state(kLink) == TransferState::Completed);
    CHECK(f.http.calls(kLink) == 1);
}

TEST_CASE("classify: maps errors to failure classes", "[downloader][classify]") {
    auto http = [](int s) { return Error{ErrorCode::ServerError, "HTTP", s}; };

    CHECK(classify(http(429)) == FailureClass::RateLimited);
    CHECK(classify(http(503)) == FailureClass::HostDown);
    CHECK(classify(http(521)) == FailureClass::HostDown);
    CHECK(classify(http(502)) == FailureClass::ClientError);
    CHECK(classify(http(403)) == FailureClass::ClientError);
    CHECK(classify(http(404)) == FailureClass::ClientError);
    CHECK(classify(http(500)) == FailureClass::TransportError);
    CHECK(classify(http(504)) == FailureClass::TransportError);
    CHECK(classify(Error{ErrorCode::RangeNotSatisfiable, "416", 416}) ==
          FailureClass::TransportError);
    CHECK(classify(Error{ErrorCode::ConnectionFailed, "refused"}) == FailureClass::HostDown);
    CHECK(classify(Error{ErrorCode::Timeout, "slow"}) == FailureClass::TransportError);
    CHECK(classify(Error{ErrorCode::NetworkError, "reset"}) == FailureClass::TransportError);
    CHECK(classify(Error{ErrorCode::IoError, "disk"}) == FailureClass::LocalIo);
    CHECK(classify(Error{ErrorCode::TlsVerificationFailed, "tls"}) == FailureClass::ClientError);
    CHECK(classify(Error{ErrorCode::Cancelled, "stop"}) == FailureClass::Cancelled);

    CHECK(isRetryable(FailureClass::TransportError));
    CHECK(isRetryable(FailureClass::RateLimited));
    CHECK(isRetryable(FailureClass::IncompleteStream));
    CHECK(isRetryable(FailureClass::SizeMismatch));
    CHECK_FALSE(isRetryable(FailureClass::HostDown));
    CHECK_FALSE(isRetryable(FailureClass::ClientError));
    CHECK_FALSE(isRetryable(FailureClass::LocalIo));
    CHECK_FALSE(isRetryable(FailureClass::Cancelled));
}

TEST_CASE("computeBackoff: exponential growth capped at the maximum", "[downloader][backoff]") {
    RetryPolicy p;
    std::mt19937 rng{7};

    SECTION("without jitter") {
        p.jitterMin = p.jitterMax = std::chrono::milliseconds(0);
        CHECK(computeBackoff(p, 1, rng) == std::chrono::milliseconds(3000));
        CHECK(computeBackoff(p, 2, rng) == std::chrono::milliseconds(9000));
        CHECK(computeBackoff(p, 3, rng) == std::chrono::milliseconds(27000));
        CHECK(computeBackoff(p, 4, rng) == std::chrono::milliseconds(60000));
        CHECK(computeBackoff(p, 10, rng) == std::chrono::milliseconds(60000));
    }

    SECTION("jitter stays within its range") {
        for (int i = 0; i < 200; ++i) {
            auto d = computeBackoff(p, 1, rng);
            CHECK(d >= std::chrono::milliseconds(4000));
            CHECK(d <= std::chrono::milliseconds(6000));
        }
    }
}
