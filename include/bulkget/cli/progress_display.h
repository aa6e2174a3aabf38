#pragma once

#include <bulkget/transfer/transfer.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <string>

namespace bulkget::cli {

/**
 * @brief Single-line, multi-file progress display for a run
 *
 * Receives ProgressEvents from any worker thread and redraws one status line
 * (percentage per active file plus aggregate throughput), throttled to the
 * update interval. Finished files drop off the line.
 */
class ProgressDisplay {
public:
    explicit ProgressDisplay(std::ostream& out, bool enabled = true, int updateIntervalMs = 500);
    ~ProgressDisplay();

    ProgressDisplay(const ProgressDisplay&) = delete;
    ProgressDisplay& operator=(const ProgressDisplay&) = delete;

    void onEvent(const transfer::ProgressEvent& ev);

    // Clear the status line.
    void finish();

    // Rendered line for the current state, without terminal control codes.
    std::string renderLine() const;

private:
    struct Entry {
        std::uint64_t transferred{0};
        std::uint64_t total{0};
        std::uint64_t completedChunks{0};
        std::uint64_t totalChunks{0};
    };

    std::string renderLocked() const;

    std::ostream& out_;
    bool enabled_;
    int updateIntervalMs_;
    mutable std::mutex mu_;
    std::map<std::string, Entry> active_;
    std::uint64_t bytesThisRun_{0};
    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point lastRender_{};
};

} // namespace bulkget::cli
