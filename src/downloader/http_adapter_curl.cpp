/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Implements IHttpAdapter::fetch() with the libcurl easy API (one handle per call,
 *   so concurrent workers never share a handle).
 * - Honors timeout, TLS verify/CA, proxy, headers, redirects, and "Range: bytes=N-".
 * - Delivers a ResponseHead once before the first body byte; error statuses (>= 400)
 *   are returned as Error with httpStatus and never reach the sink.
 * - Supports cooperative cancellation from the write callback.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <hoard/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace hoard::downloader {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

static std::optional<std::uint64_t> parse_u64(std::string_view sv) {
    std::uint64_t tmp{0};
    auto res = std::from_chars(sv.data(), sv.data() + sv.size(), tmp);
    if (res.ec != std::errc() || res.ptr != sv.data() + sv.size())
        return std::nullopt;
    return tmp;
}

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
            err.code = ErrorCode::ConnectionFailed;
            break;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::IoError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Header parser context. Reset on every status line so redirects only leave
// the final response's headers behind.
struct HeaderParseContext {
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::uint64_t> rangeStart{};
    std::optional<std::uint64_t> rangeTotal{};
};

// "bytes 100-199/1000" or "bytes */1000"
static void parse_content_range(std::string_view val, HeaderParseContext& ctx) {
    auto v = trim(val);
    std::string_view sv(v);
    if (sv.size() < 6 || to_lower(sv.substr(0, 5)) != "bytes")
        return;
    sv.remove_prefix(5);
    while (!sv.empty() && sv.front() == ' ')
        sv.remove_prefix(1);

    auto slash = sv.find('/');
    if (slash == std::string_view::npos)
        return;
    auto range = sv.substr(0, slash);
    auto total = sv.substr(slash + 1);
    if (total != "*") {
        ctx.rangeTotal = parse_u64(total);
    }
    auto dash = range.find('-');
    if (dash != std::string_view::npos) {
        ctx.rangeStart = parse_u64(range.substr(0, dash));
    }
}

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    // Strip CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.size() >= 5 && to_lower(line.substr(0, 5)) == "http/") {
        *ctx = HeaderParseContext{};
        return total;
    }

    // We expect "Key: Value"
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "content-length") {
        ctx->contentLength = parse_u64(val);
    } else if (key == "content-range") {
        parse_content_range(val, *ctx);
    }

    return total;
}

// Write sink context for fetch
struct WriteContext {
    CURL* curl{nullptr};
    const HeaderParseContext* headers{nullptr};
    const HeadCallback* onHead{nullptr};
    const BodySink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    std::uint64_t delivered{0};
    bool headDelivered{false};
    bool cancelRequested{false};
    std::optional<Error> callbackError{};
};

static ResponseHead make_head(CURL* curl, const HeaderParseContext& hctx) {
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    ResponseHead head;
    head.status = static_cast<int>(http_status);
    head.contentLength = hctx.contentLength;
    if (head.status == 206) {
        head.rangeStart = hctx.rangeStart;
        head.totalSize = hctx.rangeTotal;
    } else {
        head.totalSize = hctx.contentLength;
    }
    return head;
}

static bool deliver_head(WriteContext& ctx) {
    if (ctx.headDelivered)
        return true;
    ctx.headDelivered = true;
    if (ctx.onHead == nullptr || !*ctx.onHead)
        return true;
    auto r = (*ctx.onHead)(make_head(ctx.curl, *ctx.headers));
    if (!r.ok()) {
        ctx.callbackError = r.error();
        return false;
    }
    return true;
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    if (!deliver_head(*ctx)) {
        return 0;
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (ctx->sink && *ctx->sink)
                 ? (*ctx->sink)(bytes)
                 : Expected<void>{Error{ErrorCode::IoError, "No sink provided"}};
    if (!r.ok()) {
        ctx->callbackError = r.error();
        return 0;
    }

    ctx->delivered += static_cast<std::uint64_t>(total);
    return total;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, std::chrono::milliseconds timeout, const TlsConfig& tls,
                             const std::optional<std::string>& proxy) {
    // Timeouts: connect bound plus a low-speed abort instead of a whole-transfer
    // cap, so large files are not cut off while still streaming.
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(timeout.count(), 30000)));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(std::max<long>(1, timeout.count() / 1000)));

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, tls.insecure ? 0L : 2L);
    if (!tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, tls.caPath.c_str());
    }

    // Proxy
    if (proxy && !proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() = default;
    ~CurlHttpAdapter() override = default;

    Expected<std::uint64_t> fetch(const FetchRequest& request, const HeadCallback& onHead,
                                  const BodySink& sink, const ShouldCancel& shouldCancel) override {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
        using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        // Build headers including Range
        HeaderList list{build_header_list(request.headers), &curl_slist_free_all};
        if (request.offset > 0) {
            const std::string rangeHeader = "Range: bytes=" + std::to_string(request.offset) + "-";
            list.reset(curl_slist_append(list.release(), rangeHeader.c_str()));
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);

        HeaderParseContext hctx{};
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.curl = curl.get();
        wctx.headers = &hctx;
        wctx.onHead = &onHead;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &wctx);

        configure_common(curl.get(), request.timeout, request.tls, request.proxy);

        spdlog::debug("fetch: GET {} (offset {})", request.url, request.offset);
        CURLcode rc = curl_easy_perform(curl.get());

        long http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

        if (wctx.cancelRequested) {
            return Error{ErrorCode::Cancelled, "Transfer cancelled", static_cast<int>(http_status)};
        }
        if (wctx.callbackError) {
            auto err = *wctx.callbackError;
            if (!err.httpStatus && http_status > 0)
                err.httpStatus = static_cast<int>(http_status);
            return err;
        }
        if (rc == CURLE_HTTP_RETURNED_ERROR || http_status >= 400) {
            Error err{http_status == 416 ? ErrorCode::RangeNotSatisfiable : ErrorCode::ServerError,
                      "HTTP error " + std::to_string(http_status), static_cast<int>(http_status)};
            return err;
        }
        if (rc != CURLE_OK) {
            auto err = makeCurlError(rc, "fetch(GET)");
            if (http_status > 0)
                err.httpStatus = static_cast<int>(http_status);
            return err;
        }

        // Empty body: the write callback never ran, so the head is still pending.
        if (!deliver_head(wctx)) {
            return *wctx.callbackError;
        }

        return wctx.delivered;
    }
};

static void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

/// Factory: global libcurl init happens once, before any worker creates a handle.
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    ensure_curl_initialized();
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace hoard::downloader
