#pragma once

#include <hoard/downloader/downloader.hpp>
#include <hoard/downloader/run_context.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <random>

namespace hoard::downloader {

/**
 * Map a transport/HTTP error to its failure class.
 *  429 -> RateLimited; 503, 521, resolve/connect failures -> HostDown;
 *  502 and other 4xx -> ClientError; 416 and other 5xx, timeouts, resets -> TransportError;
 *  local write failures -> LocalIo; cancellation -> Cancelled.
 */
FailureClass classify(const Error& err) noexcept;

/// True when another attempt may succeed within the same pass.
bool isRetryable(FailureClass cls) noexcept;

/**
 * Delay before attempt `attempt + 1`, given that `attempt` (1-based) failed:
 * min(initial * multiplier^(attempt-1), maxBackoff) + uniform jitter.
 */
std::chrono::milliseconds computeBackoff(const RetryPolicy& policy, int attempt,
                                         std::mt19937& rng);

/**
 * Retrieves one item into "<destination>.part", promotes it on success and
 * reports exactly one terminal outcome to the run's ProgressAggregator (and
 * event sink, when set). Never throws for transport or filesystem failures.
 *
 * maxAttempts > 1 selects main-pass semantics (filters apply, ledger entries
 * from earlier runs are deferred without an attempt, exhaustion yields
 * Deferred). maxAttempts == 1 selects the trailing pass (exhaustion yields
 * Failed).
 *
 * One executor may be shared by all workers of a run.
 */
class TransferExecutor {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    TransferExecutor(IHttpAdapter& http, RunContext& ctx, TransferConfig config);

    TransferExecutor(const TransferExecutor&) = delete;
    TransferExecutor& operator=(const TransferExecutor&) = delete;

    TransferOutcome execute(const ItemDescriptor& item, const std::filesystem::path& destination,
                            int maxAttempts);

    /// Replace the backoff sleep. The default sleeps in slices and wakes on cancellation.
    void setSleepFunction(SleepFn fn) { sleep_ = std::move(fn); }

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

private:
    struct AttemptFailure {
        FailureClass cls{FailureClass::TransportError};
        std::string message;
    };

    TransferOutcome transfer(const ItemDescriptor& item, const std::filesystem::path& destination,
                             int maxAttempts);
    std::optional<AttemptFailure> attemptOnce(const ItemDescriptor& item,
                                              const std::filesystem::path& destination,
                                              std::uint64_t& bytesWritten);
    void appendToLedger(const std::string& link);
    void cancellableSleep(std::chrono::milliseconds delay);

    IHttpAdapter& http_;
    RunContext& ctx_;
    TransferConfig config_;
    SleepFn sleep_;
};

} // namespace hoard::downloader
