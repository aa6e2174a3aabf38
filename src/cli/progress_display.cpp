#include <bulkget/cli/progress_display.h>
#include <bulkget/transfer/engine.hpp>

#include <fmt/format.h>

namespace bulkget::cli {

using transfer::TransferState;

ProgressDisplay::ProgressDisplay(std::ostream& out, bool enabled, int updateIntervalMs)
    : out_(out), enabled_(enabled), updateIntervalMs_(updateIntervalMs),
      started_(std::chrono::steady_clock::now()) {}

ProgressDisplay::~ProgressDisplay() {
    finish();
}

void ProgressDisplay::onEvent(const transfer::ProgressEvent& ev) {
    std::lock_guard<std::mutex> lk(mu_);

    const bool terminal = ev.stage != TransferState::Downloading && ev.stage != TransferState::Planning;
    auto it = active_.find(ev.identifier);
    if (it != active_.end() && ev.transferredBytes > it->second.transferred)
        bytesThisRun_ += ev.transferredBytes - it->second.transferred;

    if (terminal || ev.stage == TransferState::Verifying) {
        active_.erase(ev.identifier);
    } else {
        auto& e = active_[ev.identifier];
        e.transferred = ev.transferredBytes;
        e.total = ev.totalBytes;
        e.completedChunks = ev.completedChunks;
        e.totalChunks = ev.totalChunks;
    }

    if (!enabled_)
        return;
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastRender_).count();
    if (elapsed < updateIntervalMs_ && !terminal)
        return;
    lastRender_ = now;
    out_ << "\r\033[K" << renderLocked() << std::flush;
}

void ProgressDisplay::finish() {
    std::lock_guard<std::mutex> lk(mu_);
    active_.clear();
    if (enabled_)
        out_ << "\r\033[K" << std::flush;
}

std::string ProgressDisplay::renderLine() const {
    std::lock_guard<std::mutex> lk(mu_);
    return renderLocked();
}

std::string ProgressDisplay::renderLocked() const {
    if (active_.empty())
        return {};
    std::string line;
    for (const auto& [id, e] : active_) {
        const int percent = e.totalChunks > 0
                                ? static_cast<int>((e.completedChunks * 100) / e.totalChunks)
                                : 100;
        line += fmt::format("[{} {:3d}% {}/{}] ", id, percent, e.completedChunks, e.totalChunks);
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    line += transfer::formatSpeed(bytesThisRun_, elapsed);
    return line;
}

} // namespace bulkget::cli
