#pragma once

#include <bulkget/config/config_helpers.h>
#include <bulkget/transfer/transfer.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace bulkget::cli {

/**
 * Raw command-line values. Unset optionals fall through to the config file,
 * then to the built-in defaults.
 */
struct FetchFlags {
    std::vector<std::string> ids;
    std::optional<std::string> outdir;
    std::optional<int> parallelFiles;
    std::optional<int> threads;
    std::optional<std::int64_t> chunkSizeMb;
    std::optional<int> flushEvery;
    std::optional<int> maxAttempts;
    std::optional<std::string> apiKey;
    std::optional<std::string> manifest;
    std::optional<std::string> configPath;
    std::optional<std::string> logFile;
    std::string logLevel{"info"};
};

/**
 * Effective settings after layering flags > config file > defaults.
 */
struct FetchSettings {
    std::vector<std::string> ids;
    transfer::RunOptions run;
    std::optional<std::filesystem::path> manifest;
    std::filesystem::path logFile{"bulkget.log"};
    std::string logLevel{"info"};
};

FetchSettings mergeSettings(const FetchFlags& flags, const config::TransferConfig& file,
                            const std::optional<std::string>& envApiKey);

// Exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailures = 1;
inline constexpr int kExitInterrupted = 130;

int exitCodeFor(const transfer::RunReport& report);

class FetchCommand {
public:
    explicit FetchCommand(const std::atomic<bool>& stopRequested) : stop_(stopRequested) {}

    void registerOptions(CLI::App& app);

    // Runs after parsing; returns the process exit code.
    int execute();

private:
    const std::atomic<bool>& stop_;
    FetchFlags flags_;
};

} // namespace bulkget::cli
