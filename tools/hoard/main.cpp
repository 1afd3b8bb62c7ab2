#include <hoard/cli/hoard_cli.h>

#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; HoardCLI::run() adjusts based on --log-level
        spdlog::set_level(spdlog::level::warn);

        hoard::cli::HoardCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
