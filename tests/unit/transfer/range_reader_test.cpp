#include <catch2/catch_test_macros.hpp>

#include "transfer_test_support.h"

using namespace bulkget::test;

// Argument checks only; nothing here reaches the network.
TEST_CASE("CurlRangeReader: Request validation", "[transfer][reader]") {
    auto reader = makeCurlRangeReader();
    int sinkCalls = 0;
    ByteSink sink = [&](std::span<const std::byte>) -> Expected<void> {
        ++sinkCalls;
        return Expected<void>{};
    };

    SECTION("Unrecognized location") {
        ObjectDescriptor object{"ftp://mirror/obj", 10, std::nullopt};
        auto r = reader->readRange(object, ByteRange{0, 9}, sink);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Range past the end of the object") {
        ObjectDescriptor object{"s3://bucket/key", 10, std::nullopt};
        auto r = reader->readRange(object, ByteRange{5, 10}, sink);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Inverted range") {
        ObjectDescriptor object{"s3://bucket/key", 10, std::nullopt};
        auto r = reader->readRange(object, ByteRange{6, 2}, sink);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    CHECK(sinkCalls == 0);
}
