#include <bulkget/cli/fetch_command.h>
#include <bulkget/cli/progress_display.h>
#include <bulkget/transfer/engine.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <filesystem>
#include <iostream>
#include <memory>

namespace bulkget::cli {

namespace fs = std::filesystem;
using namespace bulkget::transfer;

namespace {

constexpr std::size_t kLogFileBytes = 10 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 5;

std::shared_ptr<spdlog::logger> makeRunLogger(const fs::path& logFile, const std::string& level) {
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("%H:%M:%S | %v");
    console->set_level(spdlog::level::from_str(level));

    std::vector<spdlog::sink_ptr> sinks{console};
    try {
        if (logFile.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(logFile.parent_path(), ec);
        }
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile.string(), kLogFileBytes, kLogFileCount);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [tid %t] %v");
        file->set_level(spdlog::level::debug);
        sinks.push_back(file);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "warning: cannot open log file " << logFile << ": " << e.what() << "\n";
    }

    auto logger = std::make_shared<spdlog::logger>("bulkget", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

FetchSettings mergeSettings(const FetchFlags& flags, const config::TransferConfig& file,
                            const std::optional<std::string>& envApiKey) {
    FetchSettings s;
    s.ids = flags.ids;
    s.logLevel = flags.logLevel;

    if (flags.outdir)
        s.run.outputDir = config::expand_tilde(*flags.outdir);
    else if (file.outputDir)
        s.run.outputDir = *file.outputDir;

    s.run.parallelFiles = flags.parallelFiles.value_or(file.parallelFiles.value_or(1));
    s.run.transfer.concurrency =
        flags.threads.value_or(file.threads.value_or(kDefaultChunkConcurrency));
    const std::int64_t chunkMb = flags.chunkSizeMb.value_or(
        file.chunkSizeMb.value_or(static_cast<std::int64_t>(kDefaultChunkSizeBytes / kMiB)));
    s.run.transfer.chunkSizeBytes = static_cast<std::uint64_t>(chunkMb) * kMiB;
    s.run.transfer.flushEvery = flags.flushEvery.value_or(file.flushEvery.value_or(kDefaultFlushEvery));
    if (auto attempts = flags.maxAttempts ? flags.maxAttempts : file.maxAttempts)
        s.run.transfer.retry.maxAttempts = *attempts;

    if (flags.apiKey)
        s.run.credential = flags.apiKey;
    else if (file.apiKey)
        s.run.credential = file.apiKey;
    else
        s.run.credential = envApiKey;

    if (flags.manifest)
        s.manifest = config::expand_tilde(*flags.manifest);

    if (flags.logFile)
        s.logFile = config::expand_tilde(*flags.logFile);
    else if (file.logFile)
        s.logFile = *file.logFile;
    return s;
}

int exitCodeFor(const RunReport& report) {
    if (report.interrupted)
        return kExitInterrupted;
    return report.failedIdentifiers().empty() ? kExitOk : kExitFailures;
}

void FetchCommand::registerOptions(CLI::App& app) {
    app.add_option("ids", flags_.ids, "Identifiers to transfer (one or more)")->required();

    // Output
    app.add_option("-o,--outdir", flags_.outdir, "Output directory (default: current directory)");

    // Concurrency and performance
    app.add_option("-p,--parallel-files", flags_.parallelFiles,
                   "Files transferred at the same time (default 1)")
        ->check(CLI::Range(1, 64));
    app.add_option("-t,--threads", flags_.threads, "Chunk workers per file (default 8)")
        ->check(CLI::Range(1, 64));
    app.add_option("--chunk-size", flags_.chunkSizeMb, "Chunk size in MB (default 20)")
        ->check(CLI::Range(static_cast<std::int64_t>(1), static_cast<std::int64_t>(4096)));
    app.add_option("--flush-every", flags_.flushEvery,
                   "Persist progress after this many completed chunks (default 10)")
        ->check(CLI::Range(1, 1000000));
    app.add_option("--retry", flags_.maxAttempts, "Attempts per chunk (default 5)")
        ->check(CLI::Range(1, 100));

    // Sources
    app.add_option("--api-key", flags_.apiKey, "NCBI API key (default: $NCBI_API_KEY)");
    app.add_option("--manifest", flags_.manifest,
                   "JSON manifest {id: {location, size, md5|sha256}} used instead of E-utilities")
        ->check(CLI::ExistingFile);

    // Configuration and logging
    app.add_option("--config", flags_.configPath, "Config file (default: $BULKGET_CONFIG or "
                                                  "~/.config/bulkget/config.toml)");
    app.add_option("--log", flags_.logFile, "Log file (default bulkget.log)");
    app.add_option("--log-level", flags_.logLevel, "Console log level (default info)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));

    app.footer(R"(Behavior:
  - Each file is split into fixed-size chunks fetched with ranged GETs in parallel.
  - Completed chunks are recorded in <file>.meta.json; re-running resumes where it stopped.
  - Files are verified against the published checksum when one is available.
  - Exit codes: 0 all succeeded, 1 some failed, 130 interrupted.)");
}

int FetchCommand::execute() {
    const auto configPath = config::get_config_path(flags_.configPath.value_or(""));
    const auto fileCfg = config::load_transfer_config(configPath);
    auto settings = mergeSettings(flags_, fileCfg, config::api_key_from_env());

    auto log = makeRunLogger(settings.logFile, settings.logLevel);
    for (const auto& p : fileCfg.problems)
        log->warn("config {}: ignoring {}", configPath.string(), p);

    std::error_code ec;
    fs::create_directories(settings.run.outputDir, ec);
    if (ec) {
        log->error("cannot create output directory {}: {}", settings.run.outputDir.string(),
                   ec.message());
        return kExitFailures;
    }
    const auto absOut = fs::absolute(settings.run.outputDir, ec);

    log->info("bulkget: {} file(s) -> {}", settings.ids.size(),
              (ec ? settings.run.outputDir : absOut).string());
    log->info("concurrency: {} file(s) x {} thread(s), chunk {} MB", settings.run.parallelFiles,
              settings.run.transfer.concurrency, settings.run.transfer.chunkSizeBytes / kMiB);
    log->debug("config file: {}; log file: {}", configPath.string(), settings.logFile.string());

    ShouldCancel shouldCancel = [this] { return stop_.load(std::memory_order_relaxed); };

    std::unique_ptr<IDescriptorResolver> resolver;
    if (settings.manifest) {
        resolver = makeManifestResolver(*settings.manifest);
    } else {
        resolver = makeRetryingResolver(makeEutilsResolver(log), RetryPolicy::forDescriptors(), log,
                                        shouldCancel);
    }
    auto reader = makeCurlRangeReader(log);
    auto progress = makeJsonProgressStore(log);

    ProgressDisplay display(std::cerr, isatty(STDERR_FILENO) != 0);
    RunScheduler scheduler(*resolver, *reader, *progress, log, settings.run);
    auto report = scheduler.run(
        settings.ids, shouldCancel, [&display](const ProgressEvent& ev) { display.onEvent(ev); });
    display.finish();

    for (const auto& o : report.outcomes) {
        if (o.state == TransferState::Succeeded)
            continue;
        log->warn("  {:<16} {:<16} {}", o.identifier, transferStateName(o.state),
                  o.failure ? o.failure->message : std::string{});
    }
    const auto failed = report.failedIdentifiers();
    if (report.interrupted) {
        log->warn("interrupted; re-run the same command to resume");
    } else if (failed.empty()) {
        log->info("all {} file(s) completed", report.outcomes.size());
    } else {
        log->error("{} of {} file(s) did not complete: {}", failed.size(), report.outcomes.size(),
                   fmt::join(failed, " "));
    }
    log->flush();
    return exitCodeFor(report);
}

} // namespace bulkget::cli
