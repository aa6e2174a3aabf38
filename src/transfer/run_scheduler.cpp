/*
 * bulkget/src/transfer/run_scheduler.cpp
 *
 * RunScheduler: resolve + transfer each identifier, sequentially or on an outer
 * boost::asio::thread_pool of parallelFiles workers. Every identifier yields exactly
 * one TransferOutcome (input order); a failure or exception in one never stops the
 * others. The pool is joined before the report is returned. Local files are named
 * after the object key and always end in ".sra".
 */

#include <bulkget/transfer/engine.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/logger.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace bulkget::transfer {

namespace {

constexpr std::string_view kRunFileSuffix = ".sra";

// Last key segment (or the identifier), always carrying the ".sra" suffix.
std::string localFileName(const ObjectLocation& location, const std::string& identifier) {
    auto name = location.fileName();
    if (name.empty())
        name = identifier;
    if (!name.ends_with(kRunFileSuffix))
        name += kRunFileSuffix;
    return name;
}

} // namespace

RunScheduler::RunScheduler(IDescriptorResolver& resolver, IRangeReader& reader,
                           IProgressStore& progress, std::shared_ptr<spdlog::logger> log,
                           RunOptions options)
    : resolver_(resolver), reader_(reader), progress_(progress),
      log_(log ? std::move(log) : nullLogger()), options_(std::move(options)) {
    options_.parallelFiles = std::max(1, options_.parallelFiles);
}

TransferOutcome RunScheduler::runOne(const std::string& identifier,
                                     const ShouldCancel& shouldCancel,
                                     const ProgressCallback& onProgress) {
    const auto started = std::chrono::steady_clock::now();
    TransferOutcome outcome;
    outcome.identifier = identifier;

    auto finish = [&](TransferOutcome o) {
        o.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        return o;
    };

    if (shouldCancel && shouldCancel()) {
        outcome.state = TransferState::Interrupted;
        outcome.failure = Error{ErrorCode::Interrupted, "not started"};
        return finish(std::move(outcome));
    }

    try {
        log_->info("[{}] resolving descriptor...", identifier);
        auto resolved = resolver_.resolve(identifier, options_.credential);
        if (!resolved.ok()) {
            log_->error("[{}] no usable remote location: {}", identifier,
                        resolved.error().message);
            outcome.state = TransferState::Failed;
            outcome.failure = resolved.error();
            return finish(std::move(outcome));
        }
        const auto& object = resolved.value();
        log_->debug("[{}] descriptor: location={} size={} checksum={}", identifier,
                    object.location, object.sizeBytes,
                    object.expected ? object.expected->hex : std::string("unknown"));

        auto location = parseObjectLocation(object.location);
        if (!location) {
            outcome.state = TransferState::Failed;
            outcome.failure =
                Error{ErrorCode::InvalidArgument, "unrecognized object location: " + object.location};
            log_->error("[{}] {}", identifier, outcome.failure->message);
            return finish(std::move(outcome));
        }
        const auto name = localFileName(*location, identifier);

        FileTransfer transfer(reader_, progress_, log_, options_.transfer);
        return finish(
            transfer.run(identifier, object, options_.outputDir / name, shouldCancel, onProgress));
    } catch (const std::exception& e) {
        log_->error("[{}] unexpected error: {}", identifier, e.what());
        outcome.state = TransferState::Failed;
        outcome.failure = Error{ErrorCode::Unknown, e.what()};
        return finish(std::move(outcome));
    }
}

RunReport RunScheduler::run(const std::vector<std::string>& identifiers,
                            const ShouldCancel& shouldCancel, const ProgressCallback& onProgress) {
    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    for (const auto& id : identifiers) {
        if (id.empty())
            continue;
        if (seen.insert(id).second)
            unique.push_back(id);
        else
            log_->warn("[{}] listed more than once; transferring it once", id);
    }

    RunReport report;
    report.outcomes.resize(unique.size());
    const auto total = unique.size();

    if (options_.parallelFiles > 1 && total > 1) {
        const auto workers = std::min<std::size_t>(options_.parallelFiles, total);
        log_->info("parallel mode: {} file(s) at a time", workers);
        boost::asio::thread_pool pool(workers);
        for (std::size_t i = 0; i < total; ++i) {
            boost::asio::post(pool, [&, i]() {
                report.outcomes[i] = runOne(unique[i], shouldCancel, onProgress);
            });
        }
        pool.join();
    } else {
        for (std::size_t i = 0; i < total; ++i) {
            log_->info("processing {}/{}: {}", i + 1, total, unique[i]);
            report.outcomes[i] = runOne(unique[i], shouldCancel, onProgress);
        }
    }

    report.interrupted = shouldCancel && shouldCancel();
    const auto failedIds = report.failedIdentifiers();
    log_->info("run finished: {} succeeded, {} not completed", total - failedIds.size(),
               failedIds.size());
    return report;
}

} // namespace bulkget::transfer
