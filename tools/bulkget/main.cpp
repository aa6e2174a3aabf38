#include <bulkget/cli/fetch_command.h>
#include <bulkget/version.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>

namespace {

std::atomic<bool> g_stop{false};

void installSignalHandlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = [](int) { g_stop.store(true); };
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, nullptr) == -1)
        spdlog::warn("Failed to install SIGINT handler");
    if (sigaction(SIGTERM, &sa, nullptr) == -1)
        spdlog::warn("Failed to install SIGTERM handler");
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"bulkget - resumable, chunked, parallel object downloader"};
        app.set_version_flag("--version", BULKGET_VERSION_STRING);

        bulkget::cli::FetchCommand fetch(g_stop);
        fetch.registerOptions(app);

        CLI11_PARSE(app, argc, argv);

        installSignalHandlers();
        return fetch.execute();
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
