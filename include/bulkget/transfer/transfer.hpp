#pragma once

/*
 * bulkget transfer - Public Types and Collaborator Interfaces (C++20)
 *
 * This header defines the data types and abstract interfaces shared by the
 * resumable transfer engine and its collaborators. Concrete engine classes
 * live in engine.hpp.
 *
 * Design principles:
 * - Objects are transferred as fixed-size chunks into a preallocated local file
 * - Completed chunk indices are persisted in a sidecar next to the target file
 * - Errors travel as values (Expected<T>), never as exceptions across the API
 * - Clear separation of concerns (descriptor resolution, range reads, progress
 *   persistence, integrity verification)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spdlog {
class logger;
}

namespace bulkget::transfer {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

// ================================
// Fundamental enums and constants
// ================================

/**
 * Hash algorithms supported for integrity verification.
 */
enum class HashAlgo { Md5, Sha256, Sha512 };

/**
 * Canonical error codes for transfer operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    DescriptorNotFound,
    NetworkError,
    Timeout,
    ServerError,
    ShortRead,
    PermissionDenied,
    IoError,
    ChunkFailed,
    IncompleteTransfer,
    ChecksumMismatch,
    Interrupted,
    Unknown
};

/**
 * Lifecycle of a single file transfer. The last five values are terminal.
 */
enum class TransferState {
    Planning,
    Downloading,
    Verifying,
    Succeeded,
    ChecksumMismatch,
    Incomplete,
    Interrupted,
    Failed
};

inline constexpr std::uint64_t kMiB = 1024ull * 1024ull;
inline constexpr std::uint64_t kDefaultChunkSizeBytes = 20 * kMiB;
inline constexpr std::size_t kDefaultVerifyBlockBytes = 8 * kMiB;
inline constexpr int kDefaultChunkConcurrency = 8;
inline constexpr int kDefaultFlushEvery = 10;
inline constexpr const char* kSidecarSuffix = ".meta.json";

constexpr const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::DescriptorNotFound: return "DescriptorNotFound";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::ServerError: return "ServerError";
        case ErrorCode::ShortRead: return "ShortRead";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ChunkFailed: return "ChunkFailed";
        case ErrorCode::IncompleteTransfer: return "IncompleteTransfer";
        case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorCode::Interrupted: return "Interrupted";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

constexpr const char* transferStateName(TransferState state) {
    switch (state) {
        case TransferState::Planning: return "Planning";
        case TransferState::Downloading: return "Downloading";
        case TransferState::Verifying: return "Verifying";
        case TransferState::Succeeded: return "Succeeded";
        case TransferState::ChecksumMismatch: return "ChecksumMismatch";
        case TransferState::Incomplete: return "Incomplete";
        case TransferState::Interrupted: return "Interrupted";
        case TransferState::Failed: return "Failed";
    }
    return "Unknown";
}

/**
 * Transient errors are worth retrying: network hiccups, timeouts, 5xx responses and
 * truncated bodies. Everything else fails fast.
 */
constexpr bool isTransient(ErrorCode code) {
    return code == ErrorCode::NetworkError || code == ErrorCode::Timeout ||
           code == ErrorCode::ServerError || code == ErrorCode::ShortRead;
}

// ===================
// Small data objects
// ===================

/**
 * Checksum descriptor (algorithm + hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Md5};
    std::string hex; // lower-case hex
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * Remote object address split into bucket and key.
 */
struct ObjectLocation {
    std::string bucket;
    std::string key;

    [[nodiscard]] std::string s3Uri() const { return "s3://" + bucket + "/" + key; }
    [[nodiscard]] std::string httpsUrl() const {
        return "https://" + bucket + ".s3.amazonaws.com/" + key;
    }
    // Last path segment of the key; used as the local file name.
    [[nodiscard]] std::string fileName() const;
};

/**
 * Parse "s3://bucket/key" or "https://bucket.s3.amazonaws.com/key".
 */
std::optional<ObjectLocation> parseObjectLocation(std::string_view location);

/**
 * Resolved description of a remote object. Immutable once resolved.
 */
struct ObjectDescriptor {
    std::string location;
    std::uint64_t sizeBytes{0};
    std::optional<Checksum> expected;
};

/**
 * Inclusive byte range [start, end].
 */
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
    bool operator==(const ByteRange&) const = default;
};

enum class ChunkStatus { Pending, Done };

struct ChunkTask {
    std::uint64_t index{0};
    ByteRange range;
    ChunkStatus status{ChunkStatus::Pending};
};

/**
 * Retry/backoff policy. Backoff for attempt n (1-based) is
 * min(initialBackoff * multiplier^(n-1), maxBackoff); no jitter.
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{1000};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{10000};
    // Empty predicate means isTransient(error.code).
    std::function<bool(const Error&)> retryable{};

    [[nodiscard]] std::chrono::milliseconds backoffFor(int attempt) const;
    [[nodiscard]] bool shouldRetry(const Error& err) const {
        return retryable ? retryable(err) : isTransient(err.code);
    }

    static RetryPolicy forChunks() { return RetryPolicy{}; }
    static RetryPolicy forDescriptors() {
        RetryPolicy p;
        p.maxAttempts = 3;
        p.initialBackoff = std::chrono::milliseconds{2000};
        return p;
    }
};

/**
 * Per-file transfer tuning.
 */
struct TransferOptions {
    std::uint64_t chunkSizeBytes{kDefaultChunkSizeBytes};
    int concurrency{kDefaultChunkConcurrency};
    int flushEvery{kDefaultFlushEvery};
    std::size_t verifyBlockBytes{kDefaultVerifyBlockBytes};
    RetryPolicy retry{RetryPolicy::forChunks()};
};

/**
 * Whole-run configuration handed to the scheduler.
 */
struct RunOptions {
    std::filesystem::path outputDir{"."};
    int parallelFiles{1};
    std::optional<std::string> credential;
    TransferOptions transfer{};
};

/**
 * Final result of one identifier's transfer.
 */
struct TransferOutcome {
    std::string identifier;
    TransferState state{TransferState::Planning};
    bool success{false};
    std::chrono::milliseconds elapsed{0};
    std::chrono::milliseconds verifyElapsed{0};
    std::uint64_t bytesTransferred{0};
    std::uint64_t chunksPlanned{0};
    std::uint64_t chunksCompleted{0};
    std::filesystem::path localPath;
    std::optional<Error> failure{};
};

/**
 * Aggregate of one run over many identifiers.
 */
struct RunReport {
    std::vector<TransferOutcome> outcomes; // input order
    bool interrupted{false};

    [[nodiscard]] std::vector<std::string> failedIdentifiers() const {
        std::vector<std::string> out;
        for (const auto& o : outcomes) {
            if (o.state != TransferState::Succeeded)
                out.push_back(o.identifier);
        }
        return out;
    }
};

/**
 * Streaming progress event for a single identifier.
 */
struct ProgressEvent {
    std::string identifier;
    TransferState stage{TransferState::Downloading};
    std::uint64_t completedChunks{0};
    std::uint64_t totalChunks{0};
    std::uint64_t transferredBytes{0};
    std::uint64_t totalBytes{0};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldCancel = std::function<bool()>; // return true to stop scheduling new work
using ByteSink = std::function<Expected<void>(std::span<const std::byte>)>;

// ==========================
// Service interface classes
// ==========================

/**
 * Turns an opaque identifier into an ObjectDescriptor.
 * Returns ErrorCode::DescriptorNotFound when no usable remote location exists.
 */
class IDescriptorResolver {
public:
    virtual ~IDescriptorResolver() = default;
    virtual Expected<ObjectDescriptor> resolve(std::string_view identifier,
                                               const std::optional<std::string>& credential) = 0;
};

/**
 * Ranged-read capability against the remote object store.
 * The sink may be called multiple times on the calling thread, in order.
 * Implementations must report transient failures with a transient ErrorCode.
 */
class IRangeReader {
public:
    virtual ~IRangeReader() = default;
    virtual Expected<void> readRange(const ObjectDescriptor& object, const ByteRange& range,
                                     const ByteSink& sink) = 0;
};

/**
 * Durable record of completed chunks for one target file (the sidecar).
 */
class IProgressStore {
public:
    struct State {
        std::set<std::uint64_t> completedChunks;
        std::optional<std::uint64_t> totalBytes;     // geometry the record was written for
        std::optional<std::uint64_t> chunkSizeBytes; // absent in legacy records
    };

    virtual ~IProgressStore() = default;

    // Missing or corrupt records load as an empty State; never an error.
    virtual State load(const std::filesystem::path& target) = 0;
    virtual Expected<void> save(const std::filesystem::path& target, const State& state) = 0;
    virtual void clear(const std::filesystem::path& target) noexcept = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual Expected<void> reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

// ======================
// Pure helpers
// ======================

/**
 * Split [0, totalBytes) into ceil(totalBytes / chunkSizeBytes) ordered chunks.
 * chunkSizeBytes must be > 0.
 */
Expected<std::vector<ChunkTask>> planChunks(std::uint64_t totalBytes, std::uint64_t chunkSizeBytes);

// Mark the recorded indices Done in `plan` and return the remaining work set, in plan order.
std::vector<ChunkTask> markCompleted(std::vector<ChunkTask>& plan,
                                     const std::set<std::uint64_t>& completed);

/**
 * Sidecar location for a target file: "<target>.meta.json".
 */
[[nodiscard]] inline std::filesystem::path sidecarPathFor(const std::filesystem::path& target) {
    auto p = target;
    p += kSidecarSuffix;
    return p;
}

/**
 * Stream a file through the given digest in blocks of blockBytes.
 */
Expected<Checksum> computeFileDigest(const std::filesystem::path& path, HashAlgo algo,
                                     std::size_t blockBytes = kDefaultVerifyBlockBytes);

/**
 * Exact, case-insensitive hex comparison.
 */
[[nodiscard]] bool digestsMatch(std::string_view a, std::string_view b) noexcept;

std::optional<HashAlgo> parseHashAlgo(std::string_view name);
const char* hashAlgoName(HashAlgo algo);

// ======================
// Factories
// ======================

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier();
std::unique_ptr<IProgressStore> makeJsonProgressStore(LoggerPtr log = {});
std::unique_ptr<IRangeReader>
makeCurlRangeReader(LoggerPtr log = {},
                    std::chrono::milliseconds timeout = std::chrono::milliseconds{60000});
std::unique_ptr<IDescriptorResolver>
makeEutilsResolver(LoggerPtr log = {},
                   std::chrono::milliseconds timeout = std::chrono::milliseconds{30000});
std::unique_ptr<IDescriptorResolver> makeManifestResolver(const std::filesystem::path& manifest);
std::unique_ptr<IDescriptorResolver> makeRetryingResolver(std::unique_ptr<IDescriptorResolver> inner,
                                                          RetryPolicy policy, LoggerPtr log = {},
                                                          ShouldCancel shouldCancel = {});

/**
 * Logger that discards everything; used when a caller passes no logger.
 */
LoggerPtr nullLogger();

/**
 * Parse an efetch (db=sra, rettype=full) XML document into a descriptor.
 * Returns DescriptorNotFound when no AWS worldwide location is listed.
 */
Expected<ObjectDescriptor> parseEfetchXml(std::string_view xml);

} // namespace bulkget::transfer
