/*
 * bulkget/src/transfer/target_file.cpp
 *
 * TargetFile implementation:
 * - Creates parent directories and the file on first use
 * - Sizes the file to exactly the object size (ftruncate, plus best-effort
 *   posix_fallocate on Linux so later pwrites do not hit ENOSPC halfway)
 * - pwrite() for every chunk write; no shared cursor between workers
 * - fsync() before progress is recorded durably
 *
 * POSIX only.
 */

#include <bulkget/transfer/engine.hpp>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace bulkget::transfer {

namespace fs = std::filesystem;

namespace {

std::string errnoMessage(int err) {
    return std::system_category().message(err);
}

ErrorCode errnoToCode(int err) {
    return (err == EACCES || err == EPERM || err == EROFS) ? ErrorCode::PermissionDenied
                                                           : ErrorCode::IoError;
}

#if defined(__linux__)
void best_effort_preallocate(int fd, std::uint64_t targetSize) {
    if (targetSize == 0)
        return;
    // EOPNOTSUPP / EINVAL on some filesystems; the file is already sized by ftruncate.
    (void)::posix_fallocate(fd, 0, static_cast<off_t>(targetSize));
}
#else
void best_effort_preallocate(int, std::uint64_t) {}
#endif

} // namespace

Expected<std::unique_ptr<TargetFile>> TargetFile::open(const fs::path& path,
                                                       std::uint64_t sizeBytes) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create directory: " + path.parent_path().string()};
        }
    }

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int err = errno;
        return Error{errnoToCode(err), "open() failed for " + path.string() + ": " +
                                           errnoMessage(err)};
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        ::close(fd);
        return Error{ErrorCode::IoError, "fstat() failed for " + path.string() + ": " +
                                             errnoMessage(err)};
    }

    // A freshly created file has length 0, so creation also counts as reshaping.
    bool reshaped = false;
    if (static_cast<std::uint64_t>(st.st_size) != sizeBytes) {
        if (::ftruncate(fd, static_cast<off_t>(sizeBytes)) != 0) {
            const int err = errno;
            ::close(fd);
            return Error{errnoToCode(err), "ftruncate() failed for " + path.string() + ": " +
                                               errnoMessage(err)};
        }
        reshaped = true;
        best_effort_preallocate(fd, sizeBytes);
    }

    return std::unique_ptr<TargetFile>(new TargetFile(path, fd, sizeBytes, reshaped));
}

TargetFile::~TargetFile() {
    if (fd_ >= 0)
        ::close(fd_);
}

Expected<void> TargetFile::writeAt(std::uint64_t offset, std::span<const std::byte> data) const {
    if (offset + data.size() > size_) {
        return Error{ErrorCode::InvalidArgument,
                     "write past end of " + path_.string() + " at offset " + std::to_string(offset)};
    }

    const auto* p = reinterpret_cast<const char*>(data.data());
    std::size_t remaining = data.size();
    auto pos = static_cast<off_t>(offset);
    while (remaining > 0) {
        const ssize_t n = ::pwrite(fd_, p, remaining, pos);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const int err = errno;
            return Error{errnoToCode(err), "pwrite() failed for " + path_.string() + ": " +
                                               errnoMessage(err)};
        }
        p += n;
        pos += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return Expected<void>{};
}

Expected<void> TargetFile::sync() const {
    if (::fsync(fd_) != 0) {
        const int err = errno;
        return Error{ErrorCode::IoError, "fsync() failed for " + path_.string() + ": " +
                                             errnoMessage(err)};
    }
    return Expected<void>{};
}

} // namespace bulkget::transfer
