/*
 * bulkget/src/transfer/chunk_fetcher.cpp
 *
 * One chunk = one ranged read streamed straight into the target file with pwrite.
 *
 * - The range reader's sink writes at range.start + bytesSoFar, so a chunk never
 *   depends on a shared cursor or on any other chunk
 * - A chunk only counts as fetched when exactly range.length() bytes were written;
 *   anything shorter is a ShortRead and is retried from the start of the range
 * - Transient errors back off per RetryPolicy (no jitter); permanent errors fail fast
 * - Cancellation never aborts an attempt that is already streaming; it only cuts
 *   the backoff sleep short so no further attempt starts
 */

#include <bulkget/transfer/engine.hpp>

#include <spdlog/logger.h>

#include <span>
#include <string>
#include <utility>

namespace bulkget::transfer {

ChunkFetcher::ChunkFetcher(IRangeReader& reader, RetryPolicy policy,
                           std::shared_ptr<spdlog::logger> log)
    : reader_(reader), policy_(std::move(policy)), log_(log ? std::move(log) : nullLogger()) {
    if (policy_.maxAttempts < 1)
        policy_.maxAttempts = 1;
}

Expected<void> ChunkFetcher::attempt(const ObjectDescriptor& object, const TargetFile& file,
                                     const ChunkTask& task) const {
    const std::uint64_t expected = task.range.length();
    std::uint64_t received = 0;

    auto sink = [&](std::span<const std::byte> data) -> Expected<void> {
        if (data.empty())
            return Expected<void>{};
        if (received + data.size() > expected) {
            return Error{ErrorCode::ServerError,
                         "response exceeds requested range for chunk " + std::to_string(task.index)};
        }
        auto wr = file.writeAt(task.range.start + received, data);
        if (!wr.ok())
            return wr.error();
        received += data.size();
        return Expected<void>{};
    };

    auto rr = reader_.readRange(object, task.range, sink);
    if (!rr.ok())
        return rr.error();

    if (received != expected) {
        return Error{ErrorCode::ShortRead, "chunk " + std::to_string(task.index) + " got " +
                                               std::to_string(received) + " of " +
                                               std::to_string(expected) + " bytes"};
    }
    return Expected<void>{};
}

Expected<std::uint64_t> ChunkFetcher::fetch(const ObjectDescriptor& object, const TargetFile& file,
                                            const ChunkTask& task,
                                            const ShouldCancel& shouldCancel) const {
    Error last;
    for (int n = 1; n <= policy_.maxAttempts; ++n) {
        auto r = attempt(object, file, task);
        if (r.ok()) {
            if (n > 1)
                log_->debug("chunk {} succeeded on attempt {}", task.index, n);
            return task.index;
        }

        last = r.error();
        if (!policy_.shouldRetry(last)) {
            log_->warn("chunk {} failed permanently ({}): {}", task.index,
                       errorCodeName(last.code), last.message);
            return last;
        }
        if (n == policy_.maxAttempts)
            break;

        const auto delay = policy_.backoffFor(n);
        log_->debug("chunk {} attempt {}/{} failed ({}); retrying in {} ms", task.index, n,
                    policy_.maxAttempts, last.message, delay.count());
        if (!sleepUnlessCancelled(delay, shouldCancel)) {
            return Error{ErrorCode::Interrupted,
                         "chunk " + std::to_string(task.index) + " retry cancelled"};
        }
    }

    return Error{ErrorCode::ChunkFailed, "chunk " + std::to_string(task.index) + " failed after " +
                                             std::to_string(policy_.maxAttempts) +
                                             " attempts: " + last.message};
}

} // namespace bulkget::transfer
