#include <hoard/config/config_helpers.h>
#include <hoard/config/run_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <system_error>

namespace hoard::config {

using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;

namespace {

bool parse_bool(const std::string& v) {
    std::string s = v;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s == "true" || s == "1" || s == "yes" || s == "on";
}

template <typename T>
Expected<void> parse_integral(const std::string& raw, const char* key, T& out) {
    T tmp{};
    auto res = std::from_chars(raw.data(), raw.data() + raw.size(), tmp);
    if (res.ec != std::errc() || res.ptr != raw.data() + raw.size()) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Invalid integer for '") + key + "': " + raw};
    }
    out = tmp;
    return {};
}

Expected<void> parse_millis(const std::string& raw, const char* key,
                            std::chrono::milliseconds& out) {
    long long ms = 0;
    auto r = parse_integral(raw, key, ms);
    if (!r.ok())
        return r;
    out = std::chrono::milliseconds(ms);
    return {};
}

Expected<void> parse_double(const std::string& raw, const char* key, double& out) {
    try {
        size_t pos = 0;
        double v = std::stod(raw, &pos);
        if (pos != raw.size())
            throw std::invalid_argument(raw);
        out = v;
        return {};
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Invalid number for '") + key + "': " + raw};
    }
}

} // namespace

Expected<RunConfig> loadRunConfig(const std::filesystem::path& path) {
    RunConfig cfg;
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at '{}', using defaults", path.string());
        return cfg;
    }

    auto get = [&](const char* section, const char* key) {
        return parse_config_value(path, section, key);
    };

    if (auto v = get("download", "root"); !v.empty())
        cfg.downloadRoot = expand_tilde(v);
    if (auto v = get("download", "ledger"); !v.empty())
        cfg.ledgerPath = expand_tilde(v);
    if (auto v = get("download", "host_status"); !v.empty())
        cfg.hostStatusPath = expand_tilde(v);
    if (auto v = get("download", "concurrency"); !v.empty()) {
        if (auto r = parse_integral(v, "download.concurrency", cfg.concurrency); !r.ok())
            return r.error();
    }
    if (auto v = get("download", "timeout_ms"); !v.empty()) {
        if (auto r = parse_millis(v, "download.timeout_ms", cfg.timeout); !r.ok())
            return r.error();
    }
    if (auto v = get("download", "insecure"); !v.empty())
        cfg.insecure = parse_bool(v);
    if (auto v = get("download", "ca_path"); !v.empty())
        cfg.caPath = expand_tilde(v).string();
    if (auto v = get("download", "proxy"); !v.empty())
        cfg.proxy = v;
    if (auto v = get("download", "user_agent"); !v.empty())
        cfg.userAgent = v;
    if (auto v = get("download", "referer"); !v.empty())
        cfg.referer = v;

    if (auto v = get("retry", "max_attempts"); !v.empty()) {
        if (auto r = parse_integral(v, "retry.max_attempts", cfg.retry.maxAttempts); !r.ok())
            return r.error();
    }
    if (auto v = get("retry", "initial_backoff_ms"); !v.empty()) {
        if (auto r = parse_millis(v, "retry.initial_backoff_ms", cfg.retry.initialBackoff); !r.ok())
            return r.error();
    }
    if (auto v = get("retry", "multiplier"); !v.empty()) {
        if (auto r = parse_double(v, "retry.multiplier", cfg.retry.multiplier); !r.ok())
            return r.error();
    }
    if (auto v = get("retry", "max_backoff_ms"); !v.empty()) {
        if (auto r = parse_millis(v, "retry.max_backoff_ms", cfg.retry.maxBackoff); !r.ok())
            return r.error();
    }
    if (auto v = get("retry", "jitter_min_ms"); !v.empty()) {
        if (auto r = parse_millis(v, "retry.jitter_min_ms", cfg.retry.jitterMin); !r.ok())
            return r.error();
    }
    if (auto v = get("retry", "jitter_max_ms"); !v.empty()) {
        if (auto r = parse_millis(v, "retry.jitter_max_ms", cfg.retry.jitterMax); !r.ok())
            return r.error();
    }

    if (auto v = get("filters", "ignore"); !v.empty())
        cfg.filters.ignore = parse_list(v);
    if (auto v = get("filters", "include"); !v.empty())
        cfg.filters.include = parse_list(v);

    spdlog::debug("Loaded config from '{}'", path.string());
    return cfg;
}

Expected<void> validate(const RunConfig& cfg) {
    if (cfg.concurrency < 1) {
        return Error{ErrorCode::InvalidArgument, "concurrency must be at least 1"};
    }
    if (cfg.retry.maxAttempts < 2) {
        return Error{ErrorCode::InvalidArgument, "max_attempts must be at least 2"};
    }
    if (cfg.retry.initialBackoff.count() < 0 || cfg.retry.maxBackoff.count() < 0 ||
        cfg.retry.multiplier < 1.0) {
        return Error{ErrorCode::InvalidArgument, "backoff settings must be non-negative"};
    }
    if (cfg.retry.jitterMin.count() < 0 || cfg.retry.jitterMax < cfg.retry.jitterMin) {
        return Error{ErrorCode::InvalidArgument, "jitter range is invalid"};
    }
    if (cfg.timeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "timeout must be positive"};
    }
    return {};
}

downloader::TransferConfig toTransferConfig(const RunConfig& cfg) {
    downloader::TransferConfig tc;
    if (!cfg.userAgent.empty())
        tc.headers.push_back({"User-Agent", cfg.userAgent});
    tc.headers.push_back({"Connection", "keep-alive"});
    if (!cfg.referer.empty())
        tc.headers.push_back({"Referer", cfg.referer});
    tc.timeout = cfg.timeout;
    tc.tls.insecure = cfg.insecure;
    tc.tls.caPath = cfg.caPath;
    if (!cfg.proxy.empty())
        tc.proxy = cfg.proxy;
    tc.filters = cfg.filters;
    tc.retry = cfg.retry;
    return tc;
}

} // namespace hoard::config
