/*
 * bulkget/src/transfer/chunk_planner.cpp
 *
 * Deterministic chunk plan: index i covers [i*C, min((i+1)*C, S) - 1].
 * The plan is recomputed on every run; only completion status is persisted.
 */

#include <bulkget/transfer/transfer.hpp>

#include <algorithm>
#include <cstdint>
#include <set>
#include <vector>

namespace bulkget::transfer {

Expected<std::vector<ChunkTask>> planChunks(std::uint64_t totalBytes,
                                            std::uint64_t chunkSizeBytes) {
    if (chunkSizeBytes == 0) {
        return Error{ErrorCode::InvalidArgument, "planChunks: chunk size must be > 0"};
    }

    const std::uint64_t count = totalBytes / chunkSizeBytes + (totalBytes % chunkSizeBytes ? 1 : 0);

    std::vector<ChunkTask> tasks;
    tasks.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        ChunkTask t;
        t.index = i;
        t.range.start = i * chunkSizeBytes;
        t.range.end = t.range.start + std::min(chunkSizeBytes, totalBytes - t.range.start) - 1;
        tasks.push_back(t);
    }
    return tasks;
}

std::vector<ChunkTask> markCompleted(std::vector<ChunkTask>& plan,
                                     const std::set<std::uint64_t>& completed) {
    std::vector<ChunkTask> pending;
    pending.reserve(plan.size());
    for (auto& task : plan) {
        if (completed.contains(task.index)) {
            task.status = ChunkStatus::Done;
        } else {
            task.status = ChunkStatus::Pending;
            pending.push_back(task);
        }
    }
    return pending;
}

} // namespace bulkget::transfer
