#pragma once

/*
 * hoard Downloader - Public Types and Service Interfaces (C++20)
 *
 * This header defines the public data types and abstract interfaces for the
 * album download engine. It intentionally contains no implementation details.
 *
 * Design principles:
 * - Every item ends the run in exactly one terminal outcome
 * - Staging (".part") files live beside the final artifact for atomic rename
 * - Two-level retry: N in-process attempts, then one deferred attempt via the ledger
 * - Clear separation of concerns (HTTP adapter, staging, ledger, host tracking, progress)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hoard::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Canonical error codes for downloader operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    ConnectionFailed,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError,
    IoError,
    RangeNotSatisfiable,
    Cancelled,
    Unknown
};

/**
 * Per-item lifecycle state tracked by the progress aggregator.
 */
enum class TransferState { Pending, InProgress, Completed, Skipped, Deferred, Failed };

/**
 * Terminal outcome kinds returned by the transfer executor.
 */
enum class OutcomeKind { Completed, Skipped, Deferred, Failed };

enum class SkipReason { AlreadyExists, IgnoreFilter, IncludeFilter, HostOffline, ServiceUnavailable };

enum class FailReason { RetriesExhausted, HostOffline };

/**
 * Classification of a single failed attempt.
 */
enum class FailureClass {
    TransportError,   // timeout/reset, retryable
    RateLimited,      // retryable with backoff
    HostDown,         // not retryable this run; host gets marked offline
    ClientError,      // definitive, not retryable
    IncompleteStream, // retryable, transport-class
    SizeMismatch,     // retryable, transport-class
    LocalIo,          // staging write failed, not retryable
    Cancelled         // external interrupt
};

/**
 * Which pass an attempt belongs to. The trailing pass bypasses the ledger check
 * and skips the local filters.
 */
enum class AttemptPass { Main, Retry };

enum class HostStatus { Online, Offline, Maintenance };

const char* toString(ErrorCode code) noexcept;
const char* toString(TransferState state) noexcept;
const char* toString(OutcomeKind kind) noexcept;
const char* toString(SkipReason reason) noexcept;
const char* toString(FailReason reason) noexcept;
const char* toString(FailureClass cls) noexcept;
const char* toString(HostStatus status) noexcept;

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * One downloadable file within an album. The ordinal is 1-based, assigned at
 * album resolution and never renumbered.
 */
struct ItemDescriptor {
    std::string link;
    std::string filename;
    int ordinal{0};
    std::string albumId;
};

/**
 * Retry/backoff policy for in-process attempts.
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{3000};
    double multiplier{3.0};
    std::chrono::milliseconds maxBackoff{60000};
    std::chrono::milliseconds jitterMin{1000};
    std::chrono::milliseconds jitterMax{3000};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Local skip filters (case-sensitive substring match on the filename).
 */
struct FilterConfig {
    std::vector<std::string> ignore;
    std::vector<std::string> include;
};

/**
 * Executor configuration shared by every item of a run.
 */
struct TransferConfig {
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{30000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    FilterConfig filters{};
    RetryPolicy retry{};
};

/**
 * Terminal outcome of one executor invocation.
 */
struct TransferOutcome {
    OutcomeKind kind{OutcomeKind::Deferred};
    std::optional<SkipReason> skipReason{};
    std::optional<FailReason> failReason{};
    std::uint64_t bytesWritten{0};
    int attempts{0};
    std::string detail;

    static TransferOutcome completed(std::uint64_t bytes, int attempts) {
        return {OutcomeKind::Completed, std::nullopt, std::nullopt, bytes, attempts, {}};
    }
    static TransferOutcome skipped(SkipReason reason, std::string detail = {}) {
        return {OutcomeKind::Skipped, reason, std::nullopt, 0, 0, std::move(detail)};
    }
    static TransferOutcome deferred(int attempts, std::string detail = {}) {
        return {OutcomeKind::Deferred, std::nullopt, std::nullopt, 0, attempts, std::move(detail)};
    }
    static TransferOutcome failed(FailReason reason, int attempts, std::string detail = {}) {
        return {OutcomeKind::Failed, std::nullopt, reason, 0, attempts, std::move(detail)};
    }
};

/**
 * Canonical error object. httpStatus is set when the server answered.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<int> httpStatus{};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Transport contract
// ===================

/**
 * Response metadata delivered once, before the first body byte.
 * totalSize is the entity size from Content-Range (206) or Content-Length (200).
 */
struct ResponseHead {
    int status{0};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::uint64_t> rangeStart{};
    std::optional<std::uint64_t> totalSize{};
};

/**
 * A single streaming GET. offset > 0 adds "Range: bytes=<offset>-".
 */
struct FetchRequest {
    std::string url;
    std::vector<Header> headers;
    std::uint64_t offset{0};
    std::chrono::milliseconds timeout{30000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
};

using ShouldCancel = std::function<bool()>; // return true to cancel ASAP
using HeadCallback = std::function<Expected<void>(const ResponseHead&)>;
using BodySink = std::function<Expected<void>(std::span<const std::byte>)>;

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 * Error responses (status >= 400) are reported as Error with httpStatus set and
 * never reach the sink. Returns the number of body bytes delivered.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    virtual Expected<std::uint64_t> fetch(const FetchRequest& request, const HeadCallback& onHead,
                                          const BodySink& sink,
                                          const ShouldCancel& shouldCancel) = 0;
};

// ===============
// Event contract
// ===============

struct RunStartedEvent {
    std::string albumId;
    std::size_t itemCount{0};
    std::size_t concurrency{0};
    std::size_t ledgerEntries{0};
};

struct ItemOutcomeEvent {
    ItemDescriptor item;
    AttemptPass pass{AttemptPass::Main};
    TransferOutcome outcome;
};

struct RetryPassSummaryEvent {
    std::size_t attempted{0};
    std::size_t recovered{0};
    std::size_t remaining{0};
};

/**
 * Counts keyed by (result, reason) plus the live deferred counter.
 */
struct RunSummary {
    std::size_t completed{0};
    std::size_t skippedAlreadyExists{0};
    std::size_t skippedIgnoreFilter{0};
    std::size_t skippedIncludeFilter{0};
    std::size_t skippedHostOffline{0};
    std::size_t skippedServiceUnavailable{0};
    std::size_t failedRetriesExhausted{0};
    std::size_t failedHostOffline{0};
    std::size_t currentlyDeferred{0};
    std::size_t notStarted{0};
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] std::size_t skipped() const noexcept {
        return skippedAlreadyExists + skippedIgnoreFilter + skippedIncludeFilter +
               skippedHostOffline + skippedServiceUnavailable;
    }
    [[nodiscard]] std::size_t failed() const noexcept {
        return failedRetriesExhausted + failedHostOffline;
    }
};

/**
 * Consumer of run events (presentation layer). Implementations must tolerate
 * concurrent onItemOutcome calls from worker threads.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void onRunStarted(const RunStartedEvent& ev) = 0;
    virtual void onItemOutcome(const ItemOutcomeEvent& ev) = 0;
    virtual void onRetryPassSummary(const RetryPassSummaryEvent& ev) = 0;
    virtual void onRunSummary(const RunSummary& summary) = 0;
};

// ==========
// Factories
// ==========

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();

/**
 * Extract the host identity (lower-cased host name) from a link.
 * Returns an empty string when the link cannot be parsed.
 */
std::string hostIdForLink(std::string_view link);

} // namespace hoard::downloader
