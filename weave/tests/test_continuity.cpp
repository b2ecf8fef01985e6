// weave

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "weave/blocks.hh"
#include "weave/continuity.hh"
#include "weave/graph_compiler.hh"

#include "leak_alloc.hh"
#include "patch_runner.hh"

#include <cmath>

using namespace weave;

TEST_CASE("Mapping by id", "[continuity]")
{
    int32_t mapping[4] = {};

    SECTION("Identical lists")
    {
        uint64_t const ids[] = {10, 11, 12, 13};
        wvBuildMappingById(ids, 4, ids, 4, mapping);
        CHECK(mapping[0] == 0);
        CHECK(mapping[3] == 3);
        CHECK(wvCountMappedElements(mapping, 4) == 4);
    }

    SECTION("Shuffled and partial")
    {
        uint64_t const oldIds[] = {10, 11, 12};
        uint64_t const newIds[] = {12, 99, 10, 11};
        wvBuildMappingById(oldIds, 3, newIds, 4, mapping);
        CHECK(mapping[0] == 2);
        CHECK(mapping[1] == -1);
        CHECK(mapping[2] == 0);
        CHECK(mapping[3] == 1);
        CHECK(wvCountMappedElements(mapping, 4) == 3);
    }

    SECTION("Nothing before")
    {
        uint64_t const newIds[] = {1, 2};
        wvBuildMappingById(nullptr, 0, newIds, 2, mapping);
        CHECK(mapping[0] == -1);
        CHECK(mapping[1] == -1);
        CHECK(wvCountMappedElements(mapping, 2) == 0);
    }
}

TEST_CASE("Mapping by position", "[continuity]")
{
    test::LeakTestAllocator alloc;
    int32_t mapping[3] = {};

    SECTION("Nearest within radius")
    {
        float const oldPositions[] = {0.f, 0.f, 1.f, 0.f, 5.f, 5.f};
        float const newPositions[] = {1.1f, 0.f, 0.1f, 0.f, 9.f, 9.f};
        wvBuildMappingByPosition(alloc, oldPositions, 3, newPositions, 3, 2, 0.5f, mapping);
        CHECK(mapping[0] == 1);
        CHECK(mapping[1] == 0);
        CHECK(mapping[2] == -1);
    }

    SECTION("Earlier elements claim first")
    {
        float const oldPositions[] = {0.f, 1.f};
        float const newPositions[] = {0.9f, 0.2f, 0.95f};
        wvBuildMappingByPosition(alloc, oldPositions, 2, newPositions, 3, 1, 2.f, mapping);
        CHECK(mapping[0] == 1);
        CHECK(mapping[1] == 0);
        CHECK(mapping[2] == -1);
    }

    SECTION("Ties prefer the lower index")
    {
        float const oldPositions[] = {-1.f, 1.f};
        float const newPositions[] = {0.f};
        wvBuildMappingByPosition(alloc, oldPositions, 2, newPositions, 1, 1, 2.f, mapping);
        CHECK(mapping[0] == 0);
    }
}

TEST_CASE("Slew factor", "[continuity]")
{
    CHECK(wvSlewAlpha(0.f, 100.f) == 0.f);
    CHECK(wvSlewAlpha(-5.f, 100.f) == 0.f);
    CHECK(wvSlewAlpha(16.f, 0.f) == 1.f);
    CHECK(wvSlewAlpha(100.f, 100.f) == Catch::Approx(1.f - std::exp(-1.f)));
    CHECK(wvSlewAlpha(10.f, 100.f) < wvSlewAlpha(20.f, 100.f));
}

TEST_CASE("Smoothing through a count change", "[continuity]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    auto const describe = [&compiler](char const* policy) {
        compiler.beginNode(wvNodeId{1}, wvExternalInputBlockId);
        compiler.setParamText("name", "count");
        compiler.setParam("value", 4.f);
        compiler.beginNode(wvNodeId{2}, wvArrayBlockId);
        compiler.beginNode(wvNodeId{3}, wvElementIndexBlockId);
        compiler.beginNode(wvNodeId{4}, wvSmoothBlockId);
        compiler.setParamText("policy", policy);
        compiler.setParam("tau", 120.f);
        compiler.beginNode(wvNodeId{5}, wvProbeBlockId);
        compiler.setParamText("name", "out");

        compiler.addEdge(wvNodeId{1}, wvOutputPortIndex{0}, wvNodeId{2}, wvInputPortIndex{0});
        compiler.addEdge(wvNodeId{2}, wvOutputPortIndex{0}, wvNodeId{3}, wvInputPortIndex{0});
        compiler.addEdge(wvNodeId{3}, wvOutputPortIndex{1}, wvNodeId{4}, wvInputPortIndex{0});
        compiler.addEdge(wvNodeId{4}, wvOutputPortIndex{0}, wvNodeId{5}, wvInputPortIndex{0});
    };

    wvExternalValue const shrink{.nameHash = wvHashName("count"), .values = {2.f}};
    wvFrameInputs const shrinkInputs{.values = &shrink, .count = 1};

    // four elements spread over [0, 1], then two; the second element jumps from 1/3 to 1
    auto const runShrink = [&runner, &shrinkInputs]() {
        REQUIRE(runner.compileAndInstall());
        REQUIRE(runner.advance(0.0));
        REQUIRE(runner.outputCount("out") == 4);
        CHECK(runner.output("out", 1) == Catch::Approx(1.f / 3.f));

        REQUIRE(runner.advance(16.0, shrinkInputs));
        REQUIRE(runner.outputCount("out") == 2);
        CHECK(runner.output("out", 0) == 0.f);
    };

    SECTION("None follows the input")
    {
        describe("none");
        runShrink();
        CHECK(runner.output("out", 1) == 1.f);
    }

    SECTION("Preserve holds the offset")
    {
        describe("preserve");
        runShrink();
        CHECK(runner.output("out", 1) == Catch::Approx(1.f / 3.f));

        REQUIRE(runner.advance(32.0));
        CHECK(runner.output("out", 1) == Catch::Approx(1.f / 3.f));
    }

    SECTION("Slew chases the input")
    {
        describe("slew");
        runShrink();
        float const first = runner.output("out", 1);
        CHECK(first > 1.f / 3.f);
        CHECK(first < 1.f);

        REQUIRE(runner.advance(32.0));
        CHECK(runner.output("out", 1) > first);
        CHECK(runner.output("out", 1) < 1.f);
    }

    SECTION("Project starts from the old value and decays the offset")
    {
        describe("project");
        runShrink();
        CHECK(runner.output("out", 1) == Catch::Approx(1.f / 3.f));

        REQUIRE(runner.advance(32.0));
        CHECK(runner.output("out", 1) > 1.f / 3.f + 0.01f);
        CHECK(runner.output("out", 1) < 1.f);
    }

    SECTION("Growing adds new elements at their target")
    {
        describe("preserve");
        runShrink();

        wvExternalValue const grow{.nameHash = wvHashName("count"), .values = {3.f}};
        REQUIRE(runner.advance(32.0, {.values = &grow, .count = 1}));
        REQUIRE(runner.outputCount("out") == 3);
        CHECK(runner.output("out", 2) == 1.f);
    }

    SECTION("Unknown policies are rejected")
    {
        describe("wobble");
        CHECK_FALSE(runner.compile());
        CHECK(runner.hasError(wvCompileErrorCode::LoweringFailed));
    }
}
