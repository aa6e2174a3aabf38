/*
 * bulkget/src/transfer/progress_store.cpp
 *
 * Persistent JSON ProgressStore (one sidecar per target file).
 *
 * File layout ("<target>.meta.json"):
 * {
 *   "completed_chunk_indices": [0, 1, 2],
 *   "total_size": 100000000,
 *   "chunk_size": 20000000
 * }
 *
 * - load() never fails: a missing, empty or unparseable sidecar is an empty record
 * - save() rewrites the whole record through a fsynced temporary sibling and rename()
 * - Older sidecars used "downloaded_chunks"; they are still read
 */

#include <bulkget/transfer/transfer.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>

namespace bulkget::transfer {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr const char* kIndicesKey = "completed_chunk_indices";
constexpr const char* kLegacyIndicesKey = "downloaded_chunks";
constexpr const char* kTotalSizeKey = "total_size";
constexpr const char* kChunkSizeKey = "chunk_size";

void readIndices(const json& arr, std::set<std::uint64_t>& out) {
    if (!arr.is_array())
        return;
    for (const auto& v : arr) {
        if (v.is_number_unsigned()) {
            out.insert(v.get<std::uint64_t>());
        } else if (v.is_number_integer() && v.get<std::int64_t>() >= 0) {
            out.insert(static_cast<std::uint64_t>(v.get<std::int64_t>()));
        }
    }
}

// Write the whole buffer and fsync it, so a rename never exposes an empty record.
Expected<void> writeDurably(const fs::path& tmp, const std::string& data) {
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "Failed to open progress sidecar for write: " +
                                              tmp.string() + ": " + std::strerror(errno)};
    }
    std::size_t off = 0;
    while (off < data.size()) {
        auto n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const int err = errno;
            ::close(fd);
            return Error{ErrorCode::IoError, "Failed to write progress sidecar: " + tmp.string() +
                                                  ": " + std::strerror(err)};
        }
        off += static_cast<std::size_t>(n);
    }
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return Error{ErrorCode::IoError,
                     "Failed to sync progress sidecar: " + tmp.string() + ": " + std::strerror(err)};
    }
    if (::close(fd) != 0) {
        return Error{ErrorCode::IoError, "Failed to close progress sidecar: " + tmp.string()};
    }
    return Expected<void>{};
}

} // namespace

class JsonProgressStore final : public IProgressStore {
public:
    explicit JsonProgressStore(LoggerPtr log) : log_(log ? std::move(log) : nullLogger()) {}

    State load(const fs::path& target) override {
        State st;
        const auto path = sidecarPathFor(target);

        std::error_code ec;
        if (!fs::exists(path, ec))
            return st;

        std::ifstream in(path);
        if (!in) {
            log_->debug("ProgressStore: cannot open {}; treating as empty", path.string());
            return st;
        }
        try {
            json root;
            in >> root;
            if (!root.is_object())
                return st;
            if (root.contains(kIndicesKey)) {
                readIndices(root[kIndicesKey], st.completedChunks);
            } else if (root.contains(kLegacyIndicesKey)) {
                readIndices(root[kLegacyIndicesKey], st.completedChunks);
            }
            if (root.contains(kTotalSizeKey) && root[kTotalSizeKey].is_number_unsigned())
                st.totalBytes = root[kTotalSizeKey].get<std::uint64_t>();
            if (root.contains(kChunkSizeKey) && root[kChunkSizeKey].is_number_unsigned())
                st.chunkSizeBytes = root[kChunkSizeKey].get<std::uint64_t>();
        } catch (const json::exception& e) {
            log_->warn("ProgressStore: ignoring corrupt sidecar {}: {}", path.string(), e.what());
            return State{};
        }
        return st;
    }

    Expected<void> save(const fs::path& target, const State& state) override {
        const auto path = sidecarPathFor(target);
        auto tmp = path;
        tmp += ".tmp";

        json root = json::object();
        root[kIndicesKey] = json::array();
        for (auto idx : state.completedChunks)
            root[kIndicesKey].push_back(idx);
        if (state.totalBytes)
            root[kTotalSizeKey] = *state.totalBytes;
        if (state.chunkSizeBytes)
            root[kChunkSizeKey] = *state.chunkSizeBytes;

        std::lock_guard<std::mutex> lk(mutex_);
        if (auto w = writeDurably(tmp, root.dump()); !w.ok()) {
            std::error_code rmEc;
            fs::remove(tmp, rmEc);
            return w;
        }

        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec) {
            fs::remove(tmp, ec);
            return Error{ErrorCode::IoError, "Failed to replace progress sidecar " + path.string()};
        }

        log_->debug("ProgressStore: saved {} completed chunk(s) to {}",
                   state.completedChunks.size(), path.string());
        return Expected<void>{};
    }

    void clear(const fs::path& target) noexcept override {
        std::error_code ec;
        fs::remove(sidecarPathFor(target), ec);
        if (ec) {
            log_->debug("ProgressStore: failed to remove sidecar for {}: {}", target.string(),
                       ec.message());
        }
    }

private:
    LoggerPtr log_;
    std::mutex mutex_;
};

std::unique_ptr<IProgressStore> makeJsonProgressStore(LoggerPtr log) {
    return std::make_unique<JsonProgressStore>(std::move(log));
}

} // namespace bulkget::transfer
