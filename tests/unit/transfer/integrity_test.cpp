#include <catch2/catch_test_macros.hpp>

#include "transfer_test_support.h"

using namespace bulkget::test;

TEST_CASE("IntegrityVerifier: Known digests", "[transfer][integrity]") {
    SECTION("MD5 of 'abc'") {
        CHECK(digest_of("abc", HashAlgo::Md5) == "900150983cd24fb0d6963f7d28e17f72");
    }

    SECTION("MD5 of empty input") {
        CHECK(digest_of("", HashAlgo::Md5) == "d41d8cd98f00b204e9800998ecf8427e");
    }

    SECTION("SHA-256 of 'abc'") {
        CHECK(digest_of("abc", HashAlgo::Sha256) ==
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    SECTION("Incremental updates equal a single update") {
        auto v = makeIntegrityVerifier();
        REQUIRE(v->reset(HashAlgo::Md5).ok());
        const std::string a = "ab", b = "c";
        v->update(std::as_bytes(std::span<const char>(a.data(), a.size())));
        v->update(std::as_bytes(std::span<const char>(b.data(), b.size())));
        auto sum = v->finalize();
        CHECK(sum.algo == HashAlgo::Md5);
        CHECK(sum.hex == "900150983cd24fb0d6963f7d28e17f72");
    }
}

TEST_CASE("IntegrityVerifier: File digests", "[transfer][integrity]") {
    auto dir = make_temp_dir();
    const auto payload = make_payload(10'000, 3);
    write_file(dir / "f.bin", payload);

    SECTION("Block size does not change the result") {
        const auto expected = digest_of(payload);
        for (std::size_t block : {1ul, 7ul, 4096ul, 1ul << 20}) {
            auto d = computeFileDigest(dir / "f.bin", HashAlgo::Md5, block);
            REQUIRE(d.ok());
            CHECK(d.value().hex == expected);
        }
    }

    SECTION("Missing file is an IoError") {
        auto d = computeFileDigest(dir / "nope.bin", HashAlgo::Md5);
        REQUIRE_FALSE(d.ok());
        CHECK(d.error().code == ErrorCode::IoError);
    }

    SECTION("Zero block size is rejected") {
        auto d = computeFileDigest(dir / "f.bin", HashAlgo::Md5, 0);
        REQUIRE_FALSE(d.ok());
        CHECK(d.error().code == ErrorCode::InvalidArgument);
    }

    fs::remove_all(dir);
}

TEST_CASE("IntegrityVerifier: Digest comparison", "[transfer][integrity]") {
    CHECK(digestsMatch("900150983CD24FB0D6963F7D28E17F72", "900150983cd24fb0d6963f7d28e17f72"));
    CHECK_FALSE(digestsMatch("900150983cd24fb0d6963f7d28e17f72", "900150983cd24fb0d6963f7d28e17f73"));
    CHECK_FALSE(digestsMatch("abc", "abcd"));
    CHECK_FALSE(digestsMatch("", ""));

    CHECK(parseHashAlgo("MD5") == HashAlgo::Md5);
    CHECK(parseHashAlgo("sha-256") == HashAlgo::Sha256);
    CHECK_FALSE(parseHashAlgo("crc32").has_value());
    CHECK(std::string(hashAlgoName(HashAlgo::Sha512)) == "sha512");
}
