#include <ruget/cli/ruget_cli.h>
#include <ruget/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char* argv[]) {
    try {
        // Conservative default until RugetCLI::run() applies flags and config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        ruget::downloader::HttpGlobalScope http;

        ruget::cli::RugetCLI cli;
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return ruget::exitCodeFor(ruget::ErrorCode::InternalError);
    }
}
