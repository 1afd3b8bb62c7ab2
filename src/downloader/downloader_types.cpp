/*
 * hoard/src/downloader/downloader_types.cpp
 *
 * String conversions for downloader enums and link -> host identity parsing.
 * Host parsing uses libcurl's URL API so links are interpreted exactly as the
 * transport will interpret them.
 */

#include <hoard/downloader/downloader.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace hoard::downloader {

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "none";
        case ErrorCode::InvalidArgument:
            return "invalid argument";
        case ErrorCode::ConnectionFailed:
            return "connection failed";
        case ErrorCode::NetworkError:
            return "network error";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::TlsVerificationFailed:
            return "TLS verification failed";
        case ErrorCode::ServerError:
            return "server error";
        case ErrorCode::IoError:
            return "I/O error";
        case ErrorCode::RangeNotSatisfiable:
            return "range not satisfiable";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::Unknown:
            return "unknown";
    }
    return "unknown";
}

const char* toString(TransferState state) noexcept {
    switch (state) {
        case TransferState::Pending:
            return "pending";
        case TransferState::InProgress:
            return "in-progress";
        case TransferState::Completed:
            return "completed";
        case TransferState::Skipped:
            return "skipped";
        case TransferState::Deferred:
            return "deferred";
        case TransferState::Failed:
            return "failed";
    }
    return "unknown";
}

const char* toString(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Completed:
            return "completed";
        case OutcomeKind::Skipped:
            return "skipped";
        case OutcomeKind::Deferred:
            return "deferred";
        case OutcomeKind::Failed:
            return "failed";
    }
    return "unknown";
}

const char* toString(SkipReason reason) noexcept {
    switch (reason) {
        case SkipReason::AlreadyExists:
            return "already-exists";
        case SkipReason::IgnoreFilter:
            return "ignore-filter";
        case SkipReason::IncludeFilter:
            return "include-filter";
        case SkipReason::HostOffline:
            return "host-offline";
        case SkipReason::ServiceUnavailable:
            return "service-unavailable";
    }
    return "unknown";
}

const char* toString(FailReason reason) noexcept {
    switch (reason) {
        case FailReason::RetriesExhausted:
            return "retries-exhausted";
        case FailReason::HostOffline:
            return "host-offline";
    }
    return "unknown";
}

const char* toString(FailureClass cls) noexcept {
    switch (cls) {
        case FailureClass::TransportError:
            return "transport-error";
        case FailureClass::RateLimited:
            return "rate-limited";
        case FailureClass::HostDown:
            return "host-down";
        case FailureClass::ClientError:
            return "client-error";
        case FailureClass::IncompleteStream:
            return "incomplete-stream";
        case FailureClass::SizeMismatch:
            return "size-mismatch";
        case FailureClass::LocalIo:
            return "local-io";
        case FailureClass::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

const char* toString(HostStatus status) noexcept {
    switch (status) {
        case HostStatus::Online:
            return "online";
        case HostStatus::Offline:
            return "offline";
        case HostStatus::Maintenance:
            return "maintenance";
    }
    return "unknown";
}

std::string hostIdForLink(std::string_view link) {
    if (link.empty())
        return {};

    using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;
    UrlHandle url{curl_url(), &curl_url_cleanup};
    if (!url)
        return {};

    const std::string owned(link);
    if (curl_url_set(url.get(), CURLUPART_URL, owned.c_str(), CURLU_DEFAULT_SCHEME) != CURLUE_OK) {
        spdlog::debug("hostIdForLink: unparsable link '{}'", owned);
        return {};
    }

    char* host = nullptr;
    if (curl_url_get(url.get(), CURLUPART_HOST, &host, 0) != CURLUE_OK || host == nullptr) {
        return {};
    }
    std::string out(host);
    curl_free(host);

    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace hoard::downloader
