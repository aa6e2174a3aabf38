#include <catch2/catch_test_macros.hpp>

#include <bulkget/transfer/transfer.hpp>

#include <cstdint>
#include <set>
#include <vector>

using namespace bulkget::transfer;

namespace {

// Ranges must tile [0, S) in order, without gaps or overlap.
void require_partition(const std::vector<ChunkTask>& plan, std::uint64_t total,
                       std::uint64_t chunk) {
    std::uint64_t next = 0;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        const auto& t = plan[i];
        REQUIRE(t.index == i);
        REQUIRE(t.status == ChunkStatus::Pending);
        REQUIRE(t.range.start == next);
        REQUIRE(t.range.end >= t.range.start);
        REQUIRE(t.range.length() <= chunk);
        if (i + 1 < plan.size())
            REQUIRE(t.range.length() == chunk);
        next = t.range.end + 1;
    }
    REQUIRE(next == total);
}

} // namespace

TEST_CASE("ChunkPlanner: Partition of the object", "[transfer][planner]") {
    SECTION("100 MB in 20 MB chunks gives five equal ranges") {
        const std::uint64_t S = 100'000'000, C = 20'000'000;
        auto plan = planChunks(S, C);
        REQUIRE(plan.ok());
        REQUIRE(plan.value().size() == 5);
        CHECK(plan.value()[0].range == ByteRange{0, 19'999'999});
        CHECK(plan.value()[4].range == ByteRange{80'000'000, 99'999'999});
        require_partition(plan.value(), S, C);
    }

    SECTION("Last chunk is short when size is not a multiple") {
        auto plan = planChunks(45, 20);
        REQUIRE(plan.ok());
        REQUIRE(plan.value().size() == 3);
        CHECK(plan.value()[2].range == ByteRange{40, 44});
        CHECK(plan.value()[2].range.length() == 5);
        require_partition(plan.value(), 45, 20);
    }

    SECTION("Object smaller than one chunk") {
        auto plan = planChunks(7, 1024);
        REQUIRE(plan.ok());
        REQUIRE(plan.value().size() == 1);
        CHECK(plan.value()[0].range == ByteRange{0, 6});
    }

    SECTION("Chunk size of one byte") {
        auto plan = planChunks(4, 1);
        REQUIRE(plan.ok());
        REQUIRE(plan.value().size() == 4);
        require_partition(plan.value(), 4, 1);
    }

    SECTION("Assorted sizes tile exactly") {
        for (std::uint64_t S : {1ull, 2ull, 19ull, 20ull, 21ull, 399ull, 400ull, 401ull}) {
            for (std::uint64_t C : {1ull, 3ull, 20ull, 64ull}) {
                auto plan = planChunks(S, C);
                REQUIRE(plan.ok());
                CHECK(plan.value().size() == (S + C - 1) / C);
                require_partition(plan.value(), S, C);
            }
        }
    }

    SECTION("Plan is deterministic") {
        auto a = planChunks(12345, 100);
        auto b = planChunks(12345, 100);
        REQUIRE(a.ok());
        REQUIRE(b.ok());
        REQUIRE(a.value().size() == b.value().size());
        for (std::size_t i = 0; i < a.value().size(); ++i)
            CHECK(a.value()[i].range == b.value()[i].range);
    }
}

TEST_CASE("ChunkPlanner: Edge cases", "[transfer][planner][edge]") {
    SECTION("Empty object has an empty plan") {
        auto plan = planChunks(0, 20);
        REQUIRE(plan.ok());
        CHECK(plan.value().empty());
    }

    SECTION("Zero chunk size is rejected") {
        auto plan = planChunks(100, 0);
        REQUIRE_FALSE(plan.ok());
        CHECK(plan.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Very large object does not overflow the last range") {
        const std::uint64_t S = (1ull << 40) + 3;
        const std::uint64_t C = 1ull << 30;
        auto plan = planChunks(S, C);
        REQUIRE(plan.ok());
        REQUIRE(plan.value().size() == 1025);
        CHECK(plan.value().back().range == ByteRange{1ull << 40, S - 1});
    }
}

TEST_CASE("ChunkPlanner: Work set from recorded progress", "[transfer][planner][resume]") {
    auto planned = planChunks(100, 20);
    REQUIRE(planned.ok());
    auto plan = planned.value();

    auto pending = markCompleted(plan, {0, 2, 4});
    REQUIRE(pending.size() == 2);
    CHECK(pending[0].index == 1);
    CHECK(pending[1].index == 3);
    for (const auto& t : pending)
        CHECK(t.status == ChunkStatus::Pending);

    CHECK(plan[0].status == ChunkStatus::Done);
    CHECK(plan[1].status == ChunkStatus::Pending);
    CHECK(plan[2].status == ChunkStatus::Done);
    CHECK(plan[3].status == ChunkStatus::Pending);
    CHECK(plan[4].status == ChunkStatus::Done);

    SECTION("Nothing recorded leaves the whole plan pending") {
        auto fresh = planChunks(100, 20).value();
        CHECK(markCompleted(fresh, {}).size() == 5);
    }

    SECTION("Everything recorded leaves no work") {
        auto full = planChunks(100, 20).value();
        CHECK(markCompleted(full, {0, 1, 2, 3, 4}).empty());
    }
}
