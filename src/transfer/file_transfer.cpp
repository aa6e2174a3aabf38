/*
 * bulkget/src/transfer/file_transfer.cpp
 *
 * Per-file transfer state machine:
 *
 *   Planning -> Downloading -> Verifying -> {Succeeded, ChecksumMismatch}
 *                    |
 *                    +-> Incomplete | Interrupted   (file + sidecar kept for resume)
 *
 * Planning sizes the target file, recomputes the chunk plan and loads the sidecar.
 * Sidecar indices are only interpreted against the current plan: if the file had
 * to be (re)allocated, or any index / the recorded geometry does not fit the plan,
 * the sidecar is stale and progress restarts from zero.
 *
 * Downloading posts every pending chunk to a boost::asio::thread_pool. Workers write
 * their own disjoint byte range without locking; the completed set, the flush
 * counter and the sidecar are guarded by one mutex (record-then-maybe-flush). A
 * flush fsyncs the target before the sidecar is rewritten, so an index is never
 * persisted ahead of its bytes. Progress callbacks run outside that mutex. The
 * pool is always joined before evaluation.
 */

#include <bulkget/transfer/engine.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/logger.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bulkget::transfer {

namespace {

using clock_type = std::chrono::steady_clock;

std::chrono::milliseconds since(clock_type::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_type::now() - start);
}

TransferOutcome failed(TransferOutcome outcome, Error err) {
    outcome.state = TransferState::Failed;
    outcome.success = false;
    outcome.failure = std::move(err);
    return outcome;
}

} // namespace

FileTransfer::FileTransfer(IRangeReader& reader, IProgressStore& progress,
                           std::shared_ptr<spdlog::logger> log, TransferOptions options)
    : reader_(reader), progress_(progress), log_(log ? std::move(log) : nullLogger()),
      options_(std::move(options)) {
    options_.concurrency = std::max(1, options_.concurrency);
    options_.flushEvery = std::max(1, options_.flushEvery);
}

TransferOutcome FileTransfer::run(std::string_view identifier, const ObjectDescriptor& object,
                                  const std::filesystem::path& localPath,
                                  const ShouldCancel& shouldCancel,
                                  const ProgressCallback& onProgress) {
    const auto started = clock_type::now();
    auto cancelled = [&shouldCancel] { return shouldCancel && shouldCancel(); };

    TransferOutcome outcome;
    outcome.identifier = std::string(identifier);
    outcome.localPath = localPath;
    outcome.state = TransferState::Planning;

    auto snapshot = [&](TransferState stage, std::uint64_t done) {
        ProgressEvent ev;
        ev.identifier = outcome.identifier;
        ev.stage = stage;
        ev.completedChunks = done;
        ev.totalChunks = outcome.chunksPlanned;
        ev.transferredBytes = outcome.bytesTransferred;
        ev.totalBytes = object.sizeBytes;
        return ev;
    };
    auto emit = [&](TransferState stage, std::uint64_t done) {
        if (onProgress)
            onProgress(snapshot(stage, done));
    };

    // ---- Planning ----
    auto planned = planChunks(object.sizeBytes, options_.chunkSizeBytes);
    if (!planned.ok())
        return failed(std::move(outcome), planned.error());
    auto plan = std::move(planned).value();
    outcome.chunksPlanned = plan.size();

    log_->info("[{}] preparing {} ({:.2f} GB)", identifier, localPath.filename().string(),
               static_cast<double>(object.sizeBytes) / (1024.0 * 1024.0 * 1024.0));

    auto opened = TargetFile::open(localPath, object.sizeBytes);
    if (!opened.ok()) {
        log_->error("[{}] cannot prepare local file: {}", identifier, opened.error().message);
        return failed(std::move(outcome), opened.error());
    }
    const auto file = std::move(opened).value();

    auto record = progress_.load(localPath);
    std::set<std::uint64_t> completed = std::move(record.completedChunks);
    if (!completed.empty()) {
        const bool outOfPlan = *completed.rbegin() >= plan.size();
        // A record without geometry (older "downloaded_chunks" sidecars) cannot be
        // matched against this plan.
        const bool geometryChanged =
            !record.totalBytes || !record.chunkSizeBytes ||
            *record.totalBytes != object.sizeBytes ||
            *record.chunkSizeBytes != options_.chunkSizeBytes;
        if (file->reshaped()) {
            log_->warn("[{}] local file was (re)allocated; discarding {} recorded chunk(s)",
                       identifier, completed.size());
            completed.clear();
        } else if (outOfPlan || geometryChanged) {
            log_->warn("[{}] progress record does not match the current plan ({} chunks); "
                       "restarting from scratch",
                       identifier, plan.size());
            completed.clear();
        }
        if (completed.empty())
            progress_.clear(localPath);
    }

    const auto pending = markCompleted(plan, completed);

    if (pending.empty()) {
        log_->info("[{}] all {} chunk(s) present locally; verifying", identifier, plan.size());
        outcome.chunksCompleted = plan.size();
        outcome.elapsed = since(started);
        emit(TransferState::Verifying, plan.size());
        return verify(std::move(outcome), object, identifier);
    }

    // ---- Downloading ----
    outcome.state = TransferState::Downloading;
    log_->info("[{}] remaining chunks: {}/{} | threads: {}", identifier, pending.size(),
               plan.size(), options_.concurrency);
    emit(TransferState::Downloading, completed.size());

    const ChunkFetcher fetcher(reader_, options_.retry, log_);

    std::mutex mu;
    int sinceFlush = 0;
    std::vector<Error> failures;

    const auto persistLocked = [&]() {
        auto sr = file->sync();
        if (!sr.ok()) {
            log_->warn("[{}] not saving progress, sync failed: {}", identifier, sr.error().message);
            return;
        }
        IProgressStore::State st;
        st.completedChunks = completed;
        st.totalBytes = object.sizeBytes;
        st.chunkSizeBytes = options_.chunkSizeBytes;
        auto saved = progress_.save(localPath, st);
        if (!saved.ok())
            log_->warn("[{}] failed to save progress: {}", identifier, saved.error().message);
    };

    {
        boost::asio::thread_pool pool(static_cast<std::size_t>(options_.concurrency));
        for (const auto& task : pending) {
            boost::asio::post(pool, [&, task]() {
                if (cancelled())
                    return;

                Expected<std::uint64_t> r;
                try {
                    r = fetcher.fetch(object, *file, task, shouldCancel);
                } catch (const std::exception& e) {
                    r = Error{ErrorCode::Unknown,
                              "chunk " + std::to_string(task.index) + ": " + e.what()};
                }

                std::optional<ProgressEvent> ev;
                {
                    std::lock_guard<std::mutex> lk(mu);
                    if (r.ok()) {
                        completed.insert(r.value());
                        outcome.bytesTransferred += task.range.length();
                        if (++sinceFlush >= options_.flushEvery) {
                            persistLocked();
                            sinceFlush = 0;
                        }
                        if (onProgress)
                            ev = snapshot(TransferState::Downloading, completed.size());
                    } else {
                        log_->error("[{}] chunk {} failed: {}", identifier, task.index,
                                    r.error().message);
                        failures.push_back(r.error());
                    }
                }
                if (ev)
                    onProgress(*ev);
            });
        }
        pool.join();
    }

    persistLocked();
    outcome.chunksCompleted = completed.size();
    outcome.elapsed = since(started);

    if (completed.size() == plan.size()) {
        emit(TransferState::Verifying, plan.size());
        return verify(std::move(outcome), object, identifier);
    }

    const auto missing = plan.size() - completed.size();
    if (cancelled()) {
        outcome.state = TransferState::Interrupted;
        outcome.failure = Error{ErrorCode::Interrupted,
                                "interrupted with " + std::to_string(missing) +
                                    " chunk(s) outstanding"};
        log_->warn("[{}] interrupted; progress saved ({}/{} chunks)", identifier,
                   completed.size(), plan.size());
    } else {
        outcome.state = TransferState::Incomplete;
        std::string msg = std::to_string(missing) + " chunk(s) not transferred";
        if (!failures.empty())
            msg += "; first error: " + failures.front().message;
        outcome.failure = Error{ErrorCode::IncompleteTransfer, std::move(msg)};
        log_->error("[{}] download incomplete ({}/{} chunks); progress saved, re-run to resume",
                    identifier, completed.size(), plan.size());
    }
    emit(outcome.state, completed.size());
    return outcome;
}

TransferOutcome FileTransfer::verify(TransferOutcome outcome, const ObjectDescriptor& object,
                                     std::string_view identifier) {
    outcome.state = TransferState::Verifying;
    const auto downloadElapsed = outcome.elapsed;

    if (!object.expected) {
        log_->warn("[{}] no expected checksum published; skipping verification", identifier);
        progress_.clear(outcome.localPath);
        outcome.state = TransferState::Succeeded;
        outcome.success = true;
        log_->info("[{}] done (unverified) in {}", identifier, formatSeconds(downloadElapsed));
        return outcome;
    }

    log_->info("[{}] verifying {} ...", identifier, hashAlgoName(object.expected->algo));
    const auto verifyStart = clock_type::now();
    auto digest =
        computeFileDigest(outcome.localPath, object.expected->algo, options_.verifyBlockBytes);
    outcome.verifyElapsed = since(verifyStart);
    outcome.elapsed = downloadElapsed + outcome.verifyElapsed;

    if (!digest.ok()) {
        log_->error("[{}] verification could not run: {}", identifier, digest.error().message);
        return failed(std::move(outcome), digest.error());
    }

    if (!digestsMatch(digest.value().hex, object.expected->hex)) {
        log_->critical("[{}] checksum mismatch! local: {} != remote: {}", identifier,
                       digest.value().hex, object.expected->hex);
        outcome.state = TransferState::ChecksumMismatch;
        outcome.failure = Error{ErrorCode::ChecksumMismatch,
                                "local " + digest.value().hex + " != expected " +
                                    object.expected->hex};
        return outcome;
    }

    std::string speed;
    if (outcome.bytesTransferred > 0)
        speed = " | speed: " + formatSpeed(outcome.bytesTransferred, downloadElapsed);
    log_->info("[{}] checksum verified. total: {} (download: {}{}, verify: {})", identifier,
               formatSeconds(outcome.elapsed), formatSeconds(downloadElapsed), speed,
               formatSeconds(outcome.verifyElapsed));
    log_->debug("STATS | ID={} | Size={} | Time={:.2f}s | Speed={}", identifier, object.sizeBytes,
                static_cast<double>(downloadElapsed.count()) / 1000.0,
                formatSpeed(outcome.bytesTransferred, downloadElapsed));

    progress_.clear(outcome.localPath);
    outcome.state = TransferState::Succeeded;
    outcome.success = true;
    return outcome;
}

} // namespace bulkget::transfer
