/*
 * hoard/src/downloader/transfer_executor.cpp
 *
 * One item, start to finish:
 * - precondition checks, cheapest first (final artifact, filters, host state, ledger)
 * - resumable streaming into the staging file ("Range: bytes=N-")
 * - classification of failed attempts, exponential backoff with jitter
 * - promotion by rename when the byte count matches the declared total
 */

#include <hoard/downloader/staging_file.hpp>
#include <hoard/downloader/transfer_executor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <system_error>
#include <thread>

namespace hoard::downloader {

namespace fs = std::filesystem;

namespace {

bool matchesAny(const std::string& filename, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](const std::string& n) {
        return !n.empty() && filename.find(n) != std::string::npos;
    });
}

std::mt19937& threadRng() {
    thread_local std::mt19937 rng{std::random_device{}()};
    return rng;
}

} // namespace

FailureClass classify(const Error& err) noexcept {
    if (err.code == ErrorCode::Cancelled)
        return FailureClass::Cancelled;
    if (err.code == ErrorCode::RangeNotSatisfiable)
        return FailureClass::TransportError;

    if (err.httpStatus && *err.httpStatus >= 400) {
        const int status = *err.httpStatus;
        if (status == 429)
            return FailureClass::RateLimited;
        if (status == 503 || status == 521)
            return FailureClass::HostDown;
        if (status == 502 || status < 500)
            return FailureClass::ClientError;
        return FailureClass::TransportError;
    }

    switch (err.code) {
        case ErrorCode::ConnectionFailed:
            return FailureClass::HostDown;
        case ErrorCode::IoError:
            return FailureClass::LocalIo;
        case ErrorCode::TlsVerificationFailed:
        case ErrorCode::InvalidArgument:
            return FailureClass::ClientError;
        case ErrorCode::Timeout:
        case ErrorCode::NetworkError:
        case ErrorCode::ServerError:
        case ErrorCode::Unknown:
        case ErrorCode::None:
        default:
            return FailureClass::TransportError;
    }
}

bool isRetryable(FailureClass cls) noexcept {
    switch (cls) {
        case FailureClass::TransportError:
        case FailureClass::RateLimited:
        case FailureClass::IncompleteStream:
        case FailureClass::SizeMismatch:
            return true;
        case FailureClass::HostDown:
        case FailureClass::ClientError:
        case FailureClass::LocalIo:
        case FailureClass::Cancelled:
            return false;
    }
    return false;
}

std::chrono::milliseconds computeBackoff(const RetryPolicy& policy, int attempt,
                                         std::mt19937& rng) {
    const int exponent = std::max(0, attempt - 1);
    const double raw = static_cast<double>(policy.initialBackoff.count()) *
                       std::pow(policy.multiplier, static_cast<double>(exponent));
    const double capped = std::min(raw, static_cast<double>(policy.maxBackoff.count()));

    std::uniform_int_distribution<std::int64_t> jitter(policy.jitterMin.count(),
                                                       std::max(policy.jitterMin.count(),
                                                                policy.jitterMax.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped) + jitter(rng));
}

TransferExecutor::TransferExecutor(IHttpAdapter& http, RunContext& ctx, TransferConfig config)
    : http_(http), ctx_(ctx), config_(std::move(config)) {}

TransferOutcome TransferExecutor::execute(const ItemDescriptor& item, const fs::path& destination,
                                          int maxAttempts) {
    const AttemptPass pass = maxAttempts > 1 ? AttemptPass::Main : AttemptPass::Retry;

    if (!ctx_.progress.state(item.link)) {
        if (pass == AttemptPass::Main)
            ctx_.progress.registerItem(item.link);
        else
            ctx_.progress.adoptDeferred(item.link);
    }
    if (!ctx_.progress.begin(item.link, pass)) {
        return TransferOutcome::deferred(0, "item is not eligible for this pass");
    }

    TransferOutcome outcome;
    try {
        outcome = transfer(item, destination, maxAttempts);
    } catch (const std::exception& e) {
        spdlog::error("[{}] {}: unexpected error: {}", item.ordinal, item.filename, e.what());
        if (pass == AttemptPass::Main) {
            appendToLedger(item.link);
            outcome = TransferOutcome::deferred(0, e.what());
        } else {
            outcome = TransferOutcome::failed(FailReason::RetriesExhausted, 0, e.what());
        }
    }

    ctx_.progress.record(item.link, outcome);
    if (ctx_.events) {
        ctx_.events->onItemOutcome(ItemOutcomeEvent{item, pass, outcome});
    }
    return outcome;
}

TransferOutcome TransferExecutor::transfer(const ItemDescriptor& item, const fs::path& destination,
                                           int maxAttempts) {
    const bool mainPass = maxAttempts > 1;
    std::error_code ec;

    // Final artifact is authoritative.
    if (fs::exists(destination, ec)) {
        if (ctx_.ledger.contains(item.link)) {
            if (auto r = ctx_.ledger.remove(item.link); !r.ok()) {
                spdlog::warn("Could not drop stale ledger entry {}: {}", item.link,
                             r.error().message);
            }
        }
        if (mainPass) {
            return TransferOutcome::skipped(SkipReason::AlreadyExists);
        }
        auto size = fs::file_size(destination, ec);
        return TransferOutcome::completed(ec ? 0 : static_cast<std::uint64_t>(size), 0);
    }

    // A ledger entry is owed exactly one attempt, in the trailing pass, whatever
    // the filters or host status say now.
    if (mainPass && ctx_.ledger.contains(item.link)) {
        spdlog::info("[{}] {} is owed a deferred retry; not attempting now", item.ordinal,
                     item.filename);
        return TransferOutcome::deferred(0, "already in retry ledger");
    }

    if (mainPass) {
        if (matchesAny(item.filename, config_.filters.ignore)) {
            return TransferOutcome::skipped(SkipReason::IgnoreFilter);
        }
        if (!config_.filters.include.empty() &&
            !matchesAny(item.filename, config_.filters.include)) {
            return TransferOutcome::skipped(SkipReason::IncludeFilter);
        }
    }

    switch (ctx_.hosts.status(item.link)) {
        case HostStatus::Offline:
            if (!mainPass)
                return TransferOutcome::failed(FailReason::HostOffline, 0, "host offline");
            appendToLedger(item.link);
            return TransferOutcome::skipped(SkipReason::HostOffline, "host offline");
        case HostStatus::Maintenance:
            if (!mainPass)
                return TransferOutcome::failed(FailReason::HostOffline, 0,
                                               "host under maintenance");
            appendToLedger(item.link);
            return TransferOutcome::skipped(SkipReason::ServiceUnavailable,
                                            "host under maintenance");
        case HostStatus::Online:
            break;
    }

    // Attempt loop
    std::string lastError;
    int attempts = 0;
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (ctx_.cancelled()) {
            lastError = "cancelled";
            break;
        }
        if (attempt > 1 && ctx_.hosts.isOffline(item.link)) {
            // Another worker saw the host go down while we were backing off.
            if (!mainPass)
                return TransferOutcome::failed(FailReason::HostOffline, attempt - 1,
                                               "host offline");
            appendToLedger(item.link);
            return TransferOutcome::skipped(SkipReason::HostOffline, "host offline");
        }

        std::uint64_t bytes = 0;
        attempts = attempt;
        auto failure = attemptOnce(item, destination, bytes);
        if (!failure) {
            spdlog::info("[{}] {} completed ({} bytes, attempt {}/{})", item.ordinal,
                         item.filename, bytes, attempt, maxAttempts);
            return TransferOutcome::completed(bytes, attempt);
        }

        lastError = std::string(toString(failure->cls)) + ": " + failure->message;
        spdlog::debug("[{}] {} attempt {}/{} failed: {}", item.ordinal, item.filename, attempt,
                      maxAttempts, lastError);

        if (failure->cls == FailureClass::HostDown) {
            auto host = ctx_.hosts.markOffline(item.link);
            if (!mainPass)
                return TransferOutcome::failed(FailReason::HostOffline, attempt, lastError);
            appendToLedger(item.link);
            return TransferOutcome::skipped(SkipReason::HostOffline,
                                            "host " + host + " down: " + failure->message);
        }
        if (!isRetryable(failure->cls)) {
            break;
        }
        if (attempt < maxAttempts) {
            auto delay = computeBackoff(config_.retry, attempt, threadRng());
            spdlog::debug("[{}] {} retrying in {} ms", item.ordinal, item.filename, delay.count());
            if (sleep_)
                sleep_(delay);
            else
                cancellableSleep(delay);
        }
    }

    if (mainPass) {
        appendToLedger(item.link);
        spdlog::warn("[{}] {} deferred after {} attempt(s): {}", item.ordinal, item.filename,
                     attempts, lastError);
        return TransferOutcome::deferred(attempts, lastError);
    }
    spdlog::error("[{}] {} failed: {}", item.ordinal, item.filename, lastError);
    return TransferOutcome::failed(FailReason::RetriesExhausted, attempts, lastError);
}

std::optional<TransferExecutor::AttemptFailure>
TransferExecutor::attemptOnce(const ItemDescriptor& item, const fs::path& destination,
                              std::uint64_t& bytesWritten) {
    StagingFile staging(destination);
    const std::uint64_t offset = staging.existingSize();

    FetchRequest req;
    req.url = item.link;
    req.headers = config_.headers;
    req.offset = offset;
    req.timeout = config_.timeout;
    req.tls = config_.tls;
    req.proxy = config_.proxy;

    std::optional<AttemptFailure> local;
    std::optional<std::uint64_t> total;
    bool started = false;

    HeadCallback onHead = [&](const ResponseHead& head) -> Expected<void> {
        std::uint64_t start = 0;
        if (head.status == 206) {
            start = head.rangeStart.value_or(offset);
            if (start != offset) {
                local = AttemptFailure{FailureClass::SizeMismatch,
                                       "range starts at " + std::to_string(start) +
                                           ", expected " + std::to_string(offset)};
                return Error{ErrorCode::InvalidArgument, local->message};
            }
        } else if (offset > 0) {
            spdlog::info("[{}] {}: server ignored the range request, restarting from zero",
                         item.ordinal, item.filename);
        }
        total = head.totalSize;

        auto r = staging.begin(start, total);
        if (!r.ok()) {
            local = AttemptFailure{FailureClass::LocalIo, r.error().message};
            return r;
        }
        if (start > 0) {
            spdlog::info("[{}] {}: resuming at byte {}", item.ordinal, item.filename, start);
        }
        started = true;
        return Expected<void>{};
    };

    BodySink sink = [&](std::span<const std::byte> data) -> Expected<void> {
        auto r = staging.append(data);
        if (!r.ok()) {
            local = AttemptFailure{FailureClass::LocalIo, r.error().message};
        }
        return r;
    };

    ShouldCancel shouldCancel = [this] { return ctx_.cancelled(); };

    auto res = http_.fetch(req, onHead, sink, shouldCancel);

    // Every termination leaves received bytes in the partial.
    auto flushed = staging.flush();
    bytesWritten = staging.bytesWritten();

    if (local) {
        return local;
    }
    if (!res.ok()) {
        const auto& err = res.error();
        if (err.code == ErrorCode::RangeNotSatisfiable) {
            spdlog::info("[{}] {}: resume offset rejected, discarding partial", item.ordinal,
                         item.filename);
            if (auto d = staging.discard(); !d.ok()) {
                return AttemptFailure{FailureClass::LocalIo, d.error().message};
            }
        }
        std::string msg = err.message;
        if (err.httpStatus)
            msg += " (HTTP " + std::to_string(*err.httpStatus) + ")";
        return AttemptFailure{classify(err), msg};
    }
    if (!flushed.ok()) {
        return AttemptFailure{FailureClass::LocalIo, flushed.error().message};
    }
    if (!started) {
        return AttemptFailure{FailureClass::TransportError, "no response received"};
    }

    if (!total) {
        return AttemptFailure{FailureClass::IncompleteStream,
                              "server did not declare a size; kept " +
                                  std::to_string(bytesWritten) + " bytes"};
    }
    if (bytesWritten < *total) {
        return AttemptFailure{FailureClass::IncompleteStream,
                              "stream ended at " + std::to_string(bytesWritten) + " of " +
                                  std::to_string(*total) + " bytes"};
    }
    if (bytesWritten > *total) {
        return AttemptFailure{FailureClass::SizeMismatch,
                              "received " + std::to_string(bytesWritten) + " bytes, declared " +
                                  std::to_string(*total)};
    }

    if (auto p = staging.promote(); !p.ok()) {
        return AttemptFailure{FailureClass::LocalIo, p.error().message};
    }
    return std::nullopt;
}

void TransferExecutor::appendToLedger(const std::string& link) {
    if (auto r = ctx_.ledger.append(link); !r.ok()) {
        spdlog::warn("Retry ledger append failed for {}: {}", link, r.error().message);
    }
}

void TransferExecutor::cancellableSleep(std::chrono::milliseconds delay) {
    constexpr auto slice = std::chrono::milliseconds(100);
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (!ctx_.cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            break;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            slice, deadline - now));
    }
}

} // namespace hoard::downloader
