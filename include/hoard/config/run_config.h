#pragma once

#include <hoard/downloader/downloader.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hoard::config {

/**
 * Settings for one download run. Defaults apply when neither the config file
 * nor the command line names a value.
 *
 * Config file layout (TOML-style):
 *
 *   [download]
 *   root = "~/Downloads"
 *   concurrency = 3
 *   timeout_ms = 30000
 *   ledger = "session.log"
 *   host_status = "hosts.json"
 *   insecure = false
 *   ca_path = ""
 *   proxy = ""
 *   user_agent = "..."
 *   referer = "..."
 *
 *   [retry]
 *   max_attempts = 5
 *   initial_backoff_ms = 3000
 *   multiplier = 3.0
 *   max_backoff_ms = 60000
 *   jitter_min_ms = 1000
 *   jitter_max_ms = 3000
 *
 *   [filters]
 *   ignore = ["sample", "preview"]
 *   include = []
 */
struct RunConfig {
    std::filesystem::path downloadRoot{"Downloads"};
    std::filesystem::path ledgerPath{"session.log"};
    std::filesystem::path hostStatusPath{};
    std::size_t concurrency{3};
    std::chrono::milliseconds timeout{30000};
    bool insecure{false};
    std::string caPath;
    std::string proxy;
    std::string userAgent{"Mozilla/5.0 (X11; Linux x86_64; rv:136.0) Gecko/20100101 Firefox/136.0"};
    std::string referer;
    downloader::RetryPolicy retry{};
    downloader::FilterConfig filters{};
    bool jsonEvents{false};
};

/**
 * Load a RunConfig from a config file. A missing file yields the defaults.
 * Malformed numeric values are reported as InvalidArgument.
 */
downloader::Expected<RunConfig> loadRunConfig(const std::filesystem::path& path);

/**
 * Reject settings the engine cannot honor: concurrency < 1, max_attempts < 2,
 * negative backoff, or an inverted jitter range.
 */
downloader::Expected<void> validate(const RunConfig& cfg);

/**
 * Project the run settings onto the per-item executor configuration.
 */
downloader::TransferConfig toTransferConfig(const RunConfig& cfg);

} // namespace hoard::config
