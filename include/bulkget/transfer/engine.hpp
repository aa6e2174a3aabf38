#pragma once

/*
 * bulkget transfer engine
 *
 * TargetFile        - preallocated local file written with positional writes
 * ChunkFetcher      - one ranged read + positional write, wrapped in RetryPolicy
 * FileTransfer      - per-file state machine (plan, download, verify)
 * RunScheduler      - outer pool over many identifiers
 *
 * All collaborators are borrowed by reference and must outlive the engine objects.
 */

#include <bulkget/transfer/transfer.hpp>

#include <spdlog/logger.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bulkget::transfer {

/**
 * RAII handle over the local target file. The file is sized to exactly the object size
 * when opened; chunks are written with pwrite so concurrent writers to disjoint ranges
 * never share a cursor.
 */
class TargetFile {
public:
    static Expected<std::unique_ptr<TargetFile>> open(const std::filesystem::path& path,
                                                      std::uint64_t sizeBytes);
    ~TargetFile();

    TargetFile(const TargetFile&) = delete;
    TargetFile& operator=(const TargetFile&) = delete;

    Expected<void> writeAt(std::uint64_t offset, std::span<const std::byte> data) const;
    Expected<void> sync() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    // True when open() had to create the file or change its length.
    [[nodiscard]] bool reshaped() const noexcept { return reshaped_; }

private:
    TargetFile(std::filesystem::path path, int fd, std::uint64_t size, bool reshaped)
        : path_(std::move(path)), fd_(fd), size_(size), reshaped_(reshaped) {}

    std::filesystem::path path_;
    int fd_{-1};
    std::uint64_t size_{0};
    bool reshaped_{false};
};

/**
 * Fetches one chunk into the target file, retrying transient failures.
 */
class ChunkFetcher {
public:
    ChunkFetcher(IRangeReader& reader, RetryPolicy policy, std::shared_ptr<spdlog::logger> log);

    /**
     * Returns the chunk index when every byte of the range has been written.
     * Fails with ChunkFailed after retry exhaustion, with the original code for
     * non-transient errors, or with Interrupted if cancellation cut a retry short.
     */
    Expected<std::uint64_t> fetch(const ObjectDescriptor& object, const TargetFile& file,
                                  const ChunkTask& task, const ShouldCancel& shouldCancel = {}) const;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

private:
    Expected<void> attempt(const ObjectDescriptor& object, const TargetFile& file,
                           const ChunkTask& task) const;

    IRangeReader& reader_;
    RetryPolicy policy_;
    std::shared_ptr<spdlog::logger> log_;
};

/**
 * Drives one file through Planning -> Downloading -> Verifying.
 */
class FileTransfer {
public:
    FileTransfer(IRangeReader& reader, IProgressStore& progress,
                 std::shared_ptr<spdlog::logger> log, TransferOptions options = {});

    TransferOutcome run(std::string_view identifier, const ObjectDescriptor& object,
                        const std::filesystem::path& localPath,
                        const ShouldCancel& shouldCancel = {},
                        const ProgressCallback& onProgress = {});

private:
    TransferOutcome verify(TransferOutcome outcome, const ObjectDescriptor& object,
                           std::string_view identifier);

    IRangeReader& reader_;
    IProgressStore& progress_;
    std::shared_ptr<spdlog::logger> log_;
    TransferOptions options_;
};

/**
 * Runs many identifiers, sequentially or on an outer pool of parallelFiles workers.
 */
class RunScheduler {
public:
    RunScheduler(IDescriptorResolver& resolver, IRangeReader& reader, IProgressStore& progress,
                 std::shared_ptr<spdlog::logger> log, RunOptions options = {});

    RunReport run(const std::vector<std::string>& identifiers,
                  const ShouldCancel& shouldCancel = {}, const ProgressCallback& onProgress = {});

private:
    TransferOutcome runOne(const std::string& identifier, const ShouldCancel& shouldCancel,
                           const ProgressCallback& onProgress);

    IDescriptorResolver& resolver_;
    IRangeReader& reader_;
    IProgressStore& progress_;
    std::shared_ptr<spdlog::logger> log_;
    RunOptions options_;
};

/**
 * Sleep for up to `duration`, waking early when shouldCancel() turns true.
 * Returns false if cancelled.
 */
bool sleepUnlessCancelled(std::chrono::milliseconds duration, const ShouldCancel& shouldCancel);

std::string formatSpeed(std::uint64_t bytes, std::chrono::milliseconds elapsed);
std::string formatSeconds(std::chrono::milliseconds elapsed);

} // namespace bulkget::transfer
