#include <catch2/catch_test_macros.hpp>

#include "transfer_test_support.h"

using namespace bulkget::test;

namespace {

constexpr const char* kEfetchSample = R"(<?xml version="1.0" encoding="UTF-8" ?>
<EXPERIMENT_PACKAGE_SET>
  <EXPERIMENT_PACKAGE>
    <!-- <Alternatives org="AWS" free_egress="worldwide" url="https://decoy.s3.amazonaws.com/x"/> -->
    <RUN_SET>
      <RUN accession="SRR32730731" total_spots="100" size="987654321" published="2025-01-01">
        <SRAFiles>
          <SRAFile cluster="public" filename="SRR32730731.lite" size="500"
                   md5="00000000000000000000000000000000" semantic_name="SRA Lite">
            <Alternatives url="https://sra-pub-run-odp.s3.amazonaws.com/sra/SRR32730731/SRR32730731.lite"
                          free_egress="s3.us-east-1" access_type="aws identity" org="AWS"/>
          </SRAFile>
          <SRAFile cluster="public" filename="SRR32730731" size="123456789"
                   md5="8A2B9c0d1e2f30415263748596a7b8c9" semantic_name="run">
            <Alternatives url="https://ftp-trace.ncbi.nlm.nih.gov/sra/SRR32730731"
                          free_egress="worldwide" access_type="anonymous" org="NCBI"/>
            <Alternatives url="https://sra-pub-run-odp.s3.amazonaws.com/sra/SRR32730731/SRR32730731"
                          free_egress="worldwide" access_type="anonymous" org="AWS"/>
          </SRAFile>
        </SRAFiles>
      </RUN>
    </RUN_SET>
  </EXPERIMENT_PACKAGE>
</EXPERIMENT_PACKAGE_SET>
)";

} // namespace

TEST_CASE("Efetch XML: Descriptor extraction", "[transfer][resolver][efetch]") {
    SECTION("AWS worldwide alternative with matching SRAFile") {
        auto d = parseEfetchXml(kEfetchSample);
        REQUIRE(d.ok());
        CHECK(d.value().location == "s3://sra-pub-run-odp/sra/SRR32730731/SRR32730731");
        CHECK(d.value().sizeBytes == 123456789);
        REQUIRE(d.value().expected.has_value());
        CHECK(d.value().expected->algo == HashAlgo::Md5);
        CHECK(d.value().expected->hex == "8A2B9c0d1e2f30415263748596a7b8c9");
    }

    SECTION("RUN size is the fallback when no SRAFile matches") {
        const std::string xml = R"(<RUN accession="SRR1" size="4242">
            <Alternatives org='AWS' free_egress='worldwide'
                          url='https://bucket.s3.amazonaws.com/sra/SRR1/SRR1'/></RUN>)";
        auto d = parseEfetchXml(xml);
        REQUIRE(d.ok());
        CHECK(d.value().location == "s3://bucket/sra/SRR1/SRR1");
        CHECK(d.value().sizeBytes == 4242);
        CHECK_FALSE(d.value().expected.has_value());
    }

    SECTION("Entities in attribute values are decoded") {
        const std::string xml =
            R"(<RUN size="10"><Alternatives org="AWS" free_egress="worldwide" )"
            R"(url="https://b.s3.amazonaws.com/a&amp;b/obj"/></RUN>)";
        auto d = parseEfetchXml(xml);
        REQUIRE(d.ok());
        CHECK(d.value().location == "s3://b/a&b/obj");
    }

    SECTION("No AWS worldwide alternative is DescriptorNotFound") {
        const std::string xml = R"(<RUN size="10"><Alternatives org="NCBI" free_egress="worldwide"
            url="https://ftp-trace.ncbi.nlm.nih.gov/sra/SRR1"/></RUN>)";
        auto d = parseEfetchXml(xml);
        REQUIRE_FALSE(d.ok());
        CHECK(d.error().code == ErrorCode::DescriptorNotFound);
    }

    SECTION("Empty or error documents are DescriptorNotFound") {
        CHECK(parseEfetchXml("").error().code == ErrorCode::DescriptorNotFound);
        CHECK(parseEfetchXml("<ERROR>Invalid uid</ERROR>").error().code ==
              ErrorCode::DescriptorNotFound);
    }

    SECTION("Malformed documents are DescriptorNotFound") {
        const std::string xml = R"(<RUN size="10"><Alternatives org="AWS" free_egress="worldwide"
            url="https://b.s3.amazonaws.com/k/obj"></RUN>)";
        CHECK(parseEfetchXml(xml).error().code == ErrorCode::DescriptorNotFound);
    }

    SECTION("Nested elements are found in document order") {
        const std::string xml = R"(<EXPERIMENT_PACKAGE_SET><EXPERIMENT_PACKAGE>
            <RUN_SET><RUN accession="SRR9" size="77"><SRAFiles>
              <SRAFile filename="other" size="1" md5="aa"/>
              <SRAFile filename="SRR9" size="50" md5="bb">
                <Alternatives org="GCP" free_egress="gs.US" url="gs://x/SRR9"/>
                <Alternatives org="AWS" free_egress="worldwide"
                              url="https://first.s3.amazonaws.com/sra/SRR9"/>
                <Alternatives org="AWS" free_egress="worldwide"
                              url="https://second.s3.amazonaws.com/sra/SRR9"/>
              </SRAFile></SRAFiles></RUN></RUN_SET></EXPERIMENT_PACKAGE>
            </EXPERIMENT_PACKAGE_SET>)";
        auto d = parseEfetchXml(xml);
        REQUIRE(d.ok());
        CHECK(d.value().location == "s3://first/sra/SRR9");
        CHECK(d.value().sizeBytes == 50);
        REQUIRE(d.value().expected.has_value());
        CHECK(d.value().expected->hex == "bb");
    }

    SECTION("Missing size is DescriptorNotFound") {
        const std::string xml = R"(<Alternatives org="AWS" free_egress="worldwide"
            url="https://b.s3.amazonaws.com/k/obj"/>)";
        CHECK(parseEfetchXml(xml).error().code == ErrorCode::DescriptorNotFound);
    }
}

TEST_CASE("Object locations", "[transfer][resolver][location]") {
    SECTION("s3 URI") {
        auto loc = parseObjectLocation("s3://bucket/dir/file.sra");
        REQUIRE(loc.has_value());
        CHECK(loc->bucket == "bucket");
        CHECK(loc->key == "dir/file.sra");
        CHECK(loc->fileName() == "file.sra");
        CHECK(loc->httpsUrl() == "https://bucket.s3.amazonaws.com/dir/file.sra");
    }

    SECTION("Virtual-host HTTPS URL, with and without region") {
        auto a = parseObjectLocation("https://bucket.s3.amazonaws.com/k/v");
        REQUIRE(a.has_value());
        CHECK(a->s3Uri() == "s3://bucket/k/v");
        auto b = parseObjectLocation("https://bucket.s3.us-east-1.amazonaws.com/k");
        REQUIRE(b.has_value());
        CHECK(b->bucket == "bucket");
    }

    SECTION("Rejected forms") {
        CHECK_FALSE(parseObjectLocation("s3://bucket").has_value());
        CHECK_FALSE(parseObjectLocation("s3://bucket/").has_value());
        CHECK_FALSE(parseObjectLocation("https://example.org/file").has_value());
        CHECK_FALSE(parseObjectLocation("ftp://bucket/key").has_value());
    }
}

TEST_CASE("ManifestResolver: Offline descriptors", "[transfer][resolver][manifest]") {
    auto dir = make_temp_dir();
    const auto manifest = dir / "manifest.json";

    SECTION("Known identifiers resolve with their checksum") {
        write_file(manifest, R"({
            "SRR1": {"location": "s3://b/sra/SRR1/SRR1", "size": 100, "md5": "abc"},
            "SRR2": {"location": "s3://b/sra/SRR2/SRR2", "size": 5, "sha256": "def"},
            "SRR3": {"location": "s3://b/sra/SRR3/SRR3", "size": 0}
        })");
        auto r = makeManifestResolver(manifest);
        auto a = r->resolve("SRR1", std::nullopt);
        REQUIRE(a.ok());
        CHECK(a.value().sizeBytes == 100);
        CHECK(a.value().expected->algo == HashAlgo::Md5);
        auto b = r->resolve("SRR2", std::nullopt);
        REQUIRE(b.ok());
        CHECK(b.value().expected->algo == HashAlgo::Sha256);
        auto c = r->resolve("SRR3", std::nullopt);
        REQUIRE(c.ok());
        CHECK_FALSE(c.value().expected.has_value());

        auto missing = r->resolve("SRR9", std::nullopt);
        REQUIRE_FALSE(missing.ok());
        CHECK(missing.error().code == ErrorCode::DescriptorNotFound);
    }

    SECTION("Malformed manifest is InvalidArgument") {
        write_file(manifest, R"({"SRR1": {"size": 100}})");
        auto r = makeManifestResolver(manifest);
        auto a = r->resolve("SRR1", std::nullopt);
        REQUIRE_FALSE(a.ok());
        CHECK(a.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Missing manifest is IoError") {
        auto r = makeManifestResolver(dir / "nope.json");
        CHECK(r->resolve("SRR1", std::nullopt).error().code == ErrorCode::IoError);
    }

    fs::remove_all(dir);
}

TEST_CASE("RetryingResolver: Transient lookups", "[transfer][resolver][retry]") {
    auto inner = std::make_unique<FakeResolver>();
    auto* fake = inner.get();
    fake->add("SRR1", ObjectDescriptor{"s3://b/k", 1, std::nullopt});

    SECTION("Transient errors are retried") {
        fake->failNext(Error{ErrorCode::ServerError, "502"});
        fake->failNext(Error{ErrorCode::Timeout, "slow"});
        auto r = makeRetryingResolver(std::move(inner), no_wait_policy(3));
        auto d = r->resolve("SRR1", std::string("key"));
        REQUIRE(d.ok());
        CHECK(fake->calls() == 3);
        CHECK(fake->lastCredential() == std::optional<std::string>{"key"});
    }

    SECTION("Attempts are bounded") {
        for (int i = 0; i < 5; ++i)
            fake->failNext(Error{ErrorCode::NetworkError, "down"});
        auto r = makeRetryingResolver(std::move(inner), no_wait_policy(3));
        auto d = r->resolve("SRR1", std::nullopt);
        REQUIRE_FALSE(d.ok());
        CHECK(d.error().code == ErrorCode::NetworkError);
        CHECK(fake->calls() == 3);
    }

    SECTION("Not found is never retried") {
        auto r = makeRetryingResolver(std::move(inner), no_wait_policy(3));
        auto d = r->resolve("SRR404", std::nullopt);
        REQUIRE_FALSE(d.ok());
        CHECK(d.error().code == ErrorCode::DescriptorNotFound);
        CHECK(fake->calls() == 1);
    }

    SECTION("Cancellation interrupts the backoff") {
        fake->failNext(Error{ErrorCode::ServerError, "503"});
        auto r = makeRetryingResolver(std::move(inner), RetryPolicy::forDescriptors(), nullptr,
                                      [] { return true; });
        auto d = r->resolve("SRR1", std::nullopt);
        REQUIRE_FALSE(d.ok());
        CHECK(d.error().code == ErrorCode::Interrupted);
        CHECK(fake->calls() == 1);
    }
}
