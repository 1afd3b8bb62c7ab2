#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hoard::cli {

/// Map a --log-level name to an spdlog level (case-insensitive).
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& s);

class HoardCLI {
public:
    HoardCLI() = default;

    /// Parse arguments, run one album and return the process exit code.
    int run(int argc, char* argv[]);

private:
    std::string manifestPath_;
    std::string albumId_;
    std::string configPath_;
    std::string logLevel_{"info"};
    std::string destDir_;
    std::string ledgerPath_;
    std::string hostStatusPath_;
    std::string proxy_;
    std::string tlsCaPath_;
    std::vector<std::string> headers_;
    std::vector<std::string> ignore_;
    std::vector<std::string> include_;
    std::size_t concurrency_{0};
    int maxAttempts_{0};
    long timeoutMs_{0};
    bool tlsInsecure_{false};
    bool json_{false};
};

} // namespace hoard::cli
