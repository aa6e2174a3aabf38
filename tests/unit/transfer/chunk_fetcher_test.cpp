#include <catch2/catch_test_macros.hpp>

#include "transfer_test_support.h"

#include <atomic>
#include <chrono>

using namespace bulkget::test;
using namespace std::chrono_literals;

TEST_CASE("RetryPolicy: Backoff schedule", "[transfer][retry]") {
    SECTION("Chunk defaults double from 1 s and cap at 10 s") {
        const auto p = RetryPolicy::forChunks();
        CHECK(p.maxAttempts == 5);
        CHECK(p.backoffFor(1) == 1000ms);
        CHECK(p.backoffFor(2) == 2000ms);
        CHECK(p.backoffFor(3) == 4000ms);
        CHECK(p.backoffFor(4) == 8000ms);
        CHECK(p.backoffFor(5) == 10000ms);
        CHECK(p.backoffFor(12) == 10000ms);
    }

    SECTION("Descriptor defaults") {
        const auto p = RetryPolicy::forDescriptors();
        CHECK(p.maxAttempts == 3);
        CHECK(p.backoffFor(1) == 2000ms);
        CHECK(p.backoffFor(2) == 4000ms);
        CHECK(p.backoffFor(3) == 8000ms);
    }

    SECTION("Transient classification") {
        const auto p = RetryPolicy::forChunks();
        CHECK(p.shouldRetry(Error{ErrorCode::NetworkError, ""}));
        CHECK(p.shouldRetry(Error{ErrorCode::Timeout, ""}));
        CHECK(p.shouldRetry(Error{ErrorCode::ServerError, ""}));
        CHECK(p.shouldRetry(Error{ErrorCode::ShortRead, ""}));
        CHECK_FALSE(p.shouldRetry(Error{ErrorCode::PermissionDenied, ""}));
        CHECK_FALSE(p.shouldRetry(Error{ErrorCode::IoError, ""}));
        CHECK_FALSE(p.shouldRetry(Error{ErrorCode::DescriptorNotFound, ""}));
    }

    SECTION("Custom predicate overrides the default") {
        auto p = RetryPolicy::forChunks();
        p.retryable = [](const Error& e) { return e.code == ErrorCode::IoError; };
        CHECK(p.shouldRetry(Error{ErrorCode::IoError, ""}));
        CHECK_FALSE(p.shouldRetry(Error{ErrorCode::NetworkError, ""}));
    }
}

TEST_CASE("ChunkFetcher: Fetch one chunk", "[transfer][fetcher]") {
    auto dir = make_temp_dir();
    const auto payload = make_payload(100);
    FakeRangeReader reader(payload);
    ObjectDescriptor object{"s3://bucket/run/obj", payload.size(), std::nullopt};

    auto opened = TargetFile::open(dir / "obj", payload.size());
    REQUIRE(opened.ok());
    const auto file = std::move(opened).value();

    ChunkTask task;
    task.index = 2;
    task.range = ByteRange{40, 59};

    SECTION("Writes exactly the chunk's bytes at its offset") {
        ChunkFetcher fetcher(reader, no_wait_policy(), nullptr);
        auto r = fetcher.fetch(object, *file, task);
        REQUIRE(r.ok());
        CHECK(r.value() == 2);
        REQUIRE(file->sync().ok());
        const auto local = read_file(dir / "obj");
        REQUIRE(local.size() == payload.size());
        CHECK(local.substr(40, 20) == payload.substr(40, 20));
        CHECK(local.substr(0, 40) == std::string(40, '\0'));
    }

    SECTION("Transient failures are retried until success") {
        reader.failAt(40, Error{ErrorCode::NetworkError, "reset"}, 2);
        ChunkFetcher fetcher(reader, no_wait_policy(), nullptr);
        auto r = fetcher.fetch(object, *file, task);
        REQUIRE(r.ok());
        CHECK(reader.requests().size() == 3);
        CHECK(read_file(dir / "obj").substr(40, 20) == payload.substr(40, 20));
    }

    SECTION("Short read is retried from the start of the range") {
        reader.shortReadOnce(40, 5);
        ChunkFetcher fetcher(reader, no_wait_policy(), nullptr);
        auto r = fetcher.fetch(object, *file, task);
        REQUIRE(r.ok());
        CHECK(reader.requests().size() == 2);
        CHECK(read_file(dir / "obj").substr(40, 20) == payload.substr(40, 20));
    }

    SECTION("Exhaustion reports ChunkFailed after maxAttempts") {
        reader.failAt(40, Error{ErrorCode::ServerError, "503"}, 10);
        ChunkFetcher fetcher(reader, no_wait_policy(3), nullptr);
        auto r = fetcher.fetch(object, *file, task);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::ChunkFailed);
        CHECK(reader.requests().size() == 3);
    }

    SECTION("Permanent failure is not retried") {
        reader.failAt(40, Error{ErrorCode::PermissionDenied, "403"}, 10);
        ChunkFetcher fetcher(reader, no_wait_policy(), nullptr);
        auto r = fetcher.fetch(object, *file, task);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::PermissionDenied);
        CHECK(reader.requests().size() == 1);
    }

    SECTION("Cancellation during backoff stops further attempts") {
        reader.failAt(40, Error{ErrorCode::Timeout, "slow"}, 10);
        RetryPolicy slow = RetryPolicy::forChunks(); // 1 s first backoff
        std::atomic<bool> stop{false};
        reader.onRequest = [&](const ByteRange&) { stop = true; };
        ChunkFetcher fetcher(reader, slow, nullptr);
        const auto t0 = std::chrono::steady_clock::now();
        auto r = fetcher.fetch(object, *file, task, [&] { return stop.load(); });
        const auto took = std::chrono::steady_clock::now() - t0;
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::Interrupted);
        CHECK(reader.requests().size() == 1);
        CHECK(took < 900ms);
    }

    fs::remove_all(dir);
}

TEST_CASE("TargetFile: Sizing and positional writes", "[transfer][file]") {
    auto dir = make_temp_dir();

    SECTION("New file is created at the exact size and reported as reshaped") {
        auto f = TargetFile::open(dir / "sub" / "a.bin", 1234);
        REQUIRE(f.ok());
        CHECK(f.value()->reshaped());
        CHECK(fs::file_size(dir / "sub" / "a.bin") == 1234);
    }

    SECTION("Existing file of the right size is kept") {
        write_file(dir / "b.bin", std::string(10, 'x'));
        auto f = TargetFile::open(dir / "b.bin", 10);
        REQUIRE(f.ok());
        CHECK_FALSE(f.value()->reshaped());
        CHECK(read_file(dir / "b.bin") == std::string(10, 'x'));
    }

    SECTION("Existing file of another size is resized") {
        write_file(dir / "c.bin", std::string(30, 'x'));
        auto f = TargetFile::open(dir / "c.bin", 10);
        REQUIRE(f.ok());
        CHECK(f.value()->reshaped());
        CHECK(fs::file_size(dir / "c.bin") == 10);
    }

    SECTION("Writes past the end are rejected") {
        auto f = TargetFile::open(dir / "d.bin", 8);
        REQUIRE(f.ok());
        const std::string data = "0123456789";
        auto r = f.value()->writeAt(4, std::as_bytes(std::span<const char>(data.data(), data.size())));
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    fs::remove_all(dir);
}
