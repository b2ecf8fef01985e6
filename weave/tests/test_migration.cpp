// weave

#include <catch2/catch_test_macros.hpp>

#include "weave/blocks.hh"
#include "weave/graph_compiler.hh"
#include "weave/program.hh"
#include "weave/runtime.hh"

#include "leak_alloc.hh"
#include "patch_runner.hh"
#include "program_internal.hh"

#include <cstring>
#include <vector>

using namespace weave;

namespace {
    constexpr wvOutputPortIndex out0{0};
    constexpr wvInputPortIndex in0{0};

    constexpr wvNodeId constNode{1};
    constexpr wvNodeId delayNode{2};
    constexpr wvNodeId probeNode{3};

    // Const -> UnitDelay -> Probe "out"
    void describeDelay(wvGraphCompiler& compiler, float value, wvNodeId delayId = delayNode)
    {
        compiler.reset();
        compiler.beginNode(constNode, wvConstBlockId);
        compiler.setParam("value", value);
        compiler.beginNode(delayId, wvUnitDelayBlockId);
        compiler.beginNode(probeNode, wvProbeBlockId);
        compiler.setParamText("name", "out");
        compiler.addEdge(constNode, out0, delayId, in0);
        compiler.addEdge(delayId, out0, probeNode, in0);
    }
} // namespace

TEST_CASE("Hot swap", "[migration]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    describeDelay(compiler, 7.f);
    REQUIRE(runner.compileAndInstall(1));
    REQUIRE(runner.advance(0.0));
    CHECK(runner.output("out") == 0.f);

    SECTION("State survives an edit")
    {
        constexpr wvNodeId addedDelay{9};
        constexpr wvNodeId addedProbe{10};

        describeDelay(compiler, 3.f);
        compiler.beginNode(addedDelay, wvUnitDelayBlockId);
        compiler.setParam("initial", 5.f);
        compiler.beginNode(addedProbe, wvProbeBlockId);
        compiler.setParamText("name", "added");
        compiler.addEdge(constNode, out0, addedDelay, in0);
        compiler.addEdge(addedDelay, out0, addedProbe, in0);
        REQUIRE(runner.compileAndInstall(2));

        wvMigrationReport const& report = runner.runtime().lastMigration();
        CHECK(report.migrated == 1);
        CHECK(report.initialized == 1);
        CHECK(report.discarded == 0);
        CHECK(runner.runtime().installedVersion() == 2);

        // the old delay still holds 7; the new one starts from its declared initial value
        REQUIRE(runner.advance(16.0));
        CHECK(runner.output("out") == 7.f);
        CHECK(runner.output("added") == 5.f);
        REQUIRE(runner.advance(32.0));
        CHECK(runner.output("out") == 3.f);
        CHECK(runner.output("added") == 3.f);
    }

    SECTION("Swapping in the same program keeps every value")
    {
        uint32_t beforeCount = 0;
        float const* const before = wvStateFloats(runner.runtime().state(), beforeCount);
        std::vector<float> const expected(before, before + beforeCount);

        describeDelay(compiler, 7.f);
        REQUIRE(runner.compileAndInstall(2));
        CHECK(runner.runtime().lastMigration().migrated == 1);

        uint32_t afterCount = 0;
        float const* const after = wvStateFloats(runner.runtime().state(), afterCount);
        CHECK(std::vector<float>(after, after + afterCount) == expected);
    }

    SECTION("States are addressed by stable id")
    {
        wvStableId const id = wvMakeStableId(delayNode, "delay");
        wvProgram const* const program = runner.runtime().program();
        REQUIRE(wvProgramStateCount(program) == 1);
        CHECK(wvProgramStateId(program, 0) == id);

        wvProgramState* const state = runner.runtime().state();
        CHECK(wvStateLaneCount(state, id) == 1);

        float value = 0.f;
        CHECK(wvReadState(state, id, 0, &value, 1) == 1);
        CHECK(value == 7.f);

        float const replacement = 11.f;
        CHECK(wvWriteState(state, id, 0, &replacement, 1));
        CHECK_FALSE(wvWriteState(state, wvMakeStableId(delayNode, "other"), 0, &replacement, 1));

        REQUIRE(runner.advance(16.0));
        CHECK(runner.output("out") == 11.f);
    }

    SECTION("Replaced nodes start fresh")
    {
        describeDelay(compiler, 7.f, wvNodeId{5});
        REQUIRE(runner.compileAndInstall(2));

        wvMigrationReport const& report = runner.runtime().lastMigration();
        CHECK(report.migrated == 0);
        CHECK(report.initialized == 1);
        CHECK(report.discarded == 1);

        REQUIRE(runner.advance(16.0));
        CHECK(runner.output("out") == 0.f);
    }

    SECTION("Frame counting continues")
    {
        describeDelay(compiler, 3.f);
        REQUIRE(runner.compileAndInstall(2));
        REQUIRE(runner.advance(16.0));
        CHECK(runner.frame().frameIndex() == 1);

        // time stays monotonic across the swap
        CHECK_FALSE(runner.advance(8.0));
        CHECK(runner.runtime().lastError() == wvRuntimeErrorCode::NonMonotonicTime);
    }

    SECTION("Duplicate state ids keep the running program")
    {
        constexpr wvNodeId secondDelay{4};

        describeDelay(compiler, 3.f);
        compiler.beginNode(secondDelay, wvUnitDelayBlockId);
        compiler.addEdge(constNode, out0, secondDelay, in0);
        REQUIRE(runner.compile(2));

        std::vector<uint8_t> const& blob = runner.blob();
        std::vector<uint64_t> words((blob.size() + 7) / 8);
        std::memcpy(words.data(), blob.data(), blob.size());
        wvProgramHeader& header = *reinterpret_cast<wvProgramHeader*>(words.data());

        REQUIRE(header.states.size() == 2);
        header.states.data()[1].stableId = header.states.data()[0].stableId;
        header.hash = wvHashProgram(&header);

        wvProgram* const running = runner.runtime().program();
        CHECK_FALSE(runner.installBytes(reinterpret_cast<uint8_t const*>(words.data()), static_cast<uint32_t>(blob.size()), 2));
        CHECK(runner.runtime().lastError() == wvRuntimeErrorCode::MigrationAmbiguity);
        CHECK(runner.runtime().lastMigration().ambiguousId == wvStableId{header.states.data()[0].stableId});
        CHECK(runner.runtime().program() == running);
        CHECK(runner.runtime().installedVersion() == 1);

        REQUIRE(runner.advance(16.0));
        CHECK(runner.output("out") == 7.f);
    }
}

TEST_CASE("Externals survive a swap", "[migration]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    auto const describe = [&compiler](char const* probeName) {
        compiler.reset();
        compiler.beginNode(wvNodeId{1}, wvExternalInputBlockId);
        compiler.setParamText("name", "x");
        compiler.beginNode(wvNodeId{2}, wvProbeBlockId);
        compiler.setParamText("name", probeName);
        compiler.addEdge(wvNodeId{1}, out0, wvNodeId{2}, in0);
    };

    describe("before");
    REQUIRE(runner.compileAndInstall(1));

    wvExternalValue const x{.nameHash = wvHashName("x"), .values = {4.f}};
    REQUIRE(runner.advance(0.0, {.values = &x, .count = 1}));
    CHECK(runner.output("before") == 4.f);

    describe("after");
    REQUIRE(runner.compileAndInstall(2));
    REQUIRE(runner.advance(16.0));
    CHECK(runner.output("after") == 4.f);
    CHECK(runner.outputCount("before") == 0);
}
