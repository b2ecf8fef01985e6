// weave

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "weave/blocks.hh"
#include "weave/fatal.hh"
#include "weave/graph_compiler.hh"
#include "weave/log.hh"
#include "weave/runtime.hh"

#include "leak_alloc.hh"
#include "patch_runner.hh"
#include "program_internal.hh"

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <cstring>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

using namespace weave;

namespace {
    constexpr wvOutputPortIndex out0{0};
    constexpr wvOutputPortIndex out1{1};
    constexpr wvInputPortIndex in0{0};
    constexpr wvInputPortIndex in1{1};

    struct FatalError
    {
        wvRuntimeErrorCode code = wvRuntimeErrorCode::None;
    };

    void throwingFatalHandler(wvRuntimeErrorCode code, char const*) { throw FatalError{code}; }

    wvFrameInputs inputsOf(wvExternalValue const& value) { return {.values = &value, .count = 1}; }

    // a host-side frame sink; the runtime only writes into its own buffers
    class HostFrame final : public wvFrameOutput
    {
    public:
        double timeMs() const noexcept override { return 0.0; }
        uint64_t frameIndex() const noexcept override { return 0; }
        uint32_t renderPassCount() const noexcept override { return 0; }
        wvRenderPassView renderPass(uint32_t) const noexcept override { return {}; }
        uint32_t outputCount() const noexcept override { return 0; }
        wvOutputView output(uint32_t) const noexcept override { return {}; }
        bool findOutput(char const*, wvOutputView&) const noexcept override { return false; }
    };

    static_assert(!std::is_default_constructible_v<HostFrame>);

    // ExternalInput "x" -> block -> Probe "out"
    void describeExternalInto(wvGraphCompiler& compiler, wvNodeTypeId typeId)
    {
        compiler.beginNode(wvNodeId{1}, wvExternalInputBlockId);
        compiler.setParamText("name", "x");
        compiler.beginNode(wvNodeId{2}, typeId);
        compiler.beginNode(wvNodeId{3}, wvProbeBlockId);
        compiler.setParamText("name", "out");
        compiler.addEdge(wvNodeId{1}, out0, wvNodeId{2}, in0);
        compiler.addEdge(wvNodeId{2}, out0, wvNodeId{3}, in0);
    }

    void describeCounter(wvGraphCompiler& compiler)
    {
        compiler.beginNode(wvNodeId{1}, wvAddBlockId);
        compiler.beginNode(wvNodeId{2}, wvConstBlockId);
        compiler.setParam("value", 1.f);
        compiler.beginNode(wvNodeId{3}, wvUnitDelayBlockId);
        compiler.beginNode(wvNodeId{4}, wvProbeBlockId);
        compiler.setParamText("name", "count");
        compiler.addEdge(wvNodeId{2}, out0, wvNodeId{1}, in0);
        compiler.addEdge(wvNodeId{3}, out0, wvNodeId{1}, in0);
        compiler.addEdge(wvNodeId{1}, out0, wvNodeId{3}, in0);
        compiler.addEdge(wvNodeId{3}, out0, wvNodeId{4}, in0);
    }
} // namespace

TEST_CASE("Signal state", "[runtime]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    SECTION("Unit delay")
    {
        describeExternalInto(compiler, wvUnitDelayBlockId);
        REQUIRE(runner.compileAndInstall());

        float const inputs[] = {5.f, 10.f, 15.f};
        float const expected[] = {0.f, 5.f, 10.f};
        for (uint32_t frame = 0; frame != 3; ++frame)
        {
            wvExternalValue const x{.nameHash = wvHashName("x"), .values = {inputs[frame]}};
            REQUIRE(runner.advance(frame * 16.0, inputsOf(x)));
            CHECK(runner.output("out") == expected[frame]);
        }
    }

    SECTION("Feedback counter")
    {
        describeCounter(compiler);
        REQUIRE(runner.compileAndInstall());

        for (uint32_t frame = 0; frame != 3; ++frame)
        {
            REQUIRE(runner.advance(frame * 16.0));
            CHECK(runner.output("count") == static_cast<float>(frame));
        }
    }

    SECTION("Accumulator")
    {
        compiler.beginNode(wvNodeId{1}, wvConstBlockId);
        compiler.setParam("value", 2.f);
        compiler.beginNode(wvNodeId{2}, wvAccumulatorBlockId);
        compiler.beginNode(wvNodeId{3}, wvProbeBlockId);
        compiler.setParamText("name", "total");
        compiler.addEdge(wvNodeId{1}, out0, wvNodeId{2}, in0);
        compiler.addEdge(wvNodeId{2}, out0, wvNodeId{3}, in0);
        REQUIRE(runner.compileAndInstall());

        float const expected[] = {0.f, 2.f, 4.f};
        for (uint32_t frame = 0; frame != 3; ++frame)
        {
            REQUIRE(runner.advance(frame * 16.0));
            CHECK(runner.output("total") == expected[frame]);
        }
    }

    SECTION("Lag")
    {
        compiler.beginNode(wvNodeId{1}, wvConstBlockId);
        compiler.setParam("value", 10.f);
        compiler.beginNode(wvNodeId{2}, wvLagBlockId);
        compiler.beginNode(wvNodeId{3}, wvProbeBlockId);
        compiler.setParamText("name", "lagged");
        compiler.addEdge(wvNodeId{1}, out0, wvNodeId{2}, in0);
        compiler.addEdge(wvNodeId{2}, out0, wvNodeId{3}, in0);
        REQUIRE(runner.compileAndInstall());

        // the first frame has no elapsed time; a full time constant later it has caught up
        REQUIRE(runner.advance(0.0));
        CHECK(runner.output("lagged") == 0.f);
        REQUIRE(runner.advance(100.0));
        CHECK(runner.output("lagged") == Catch::Approx(10.f));
    }

    SECTION("Edge detect")
    {
        describeExternalInto(compiler, wvEdgeDetectBlockId);
        REQUIRE(runner.compileAndInstall());

        float const inputs[] = {0.f, 1.f, 1.f, 0.f, 1.f};
        float const expected[] = {0.f, 1.f, 0.f, 0.f, 1.f};
        for (uint32_t frame = 0; frame != 5; ++frame)
        {
            wvExternalValue const x{.nameHash = wvHashName("x"), .values = {inputs[frame]}};
            REQUIRE(runner.advance(frame * 16.0, inputsOf(x)));
            CHECK(runner.output("out") == expected[frame]);
        }
    }

    SECTION("Pulse")
    {
        compiler.beginNode(wvNodeId{1}, wvPulseBlockId);
        compiler.setParam("period", 100.f);
        compiler.beginNode(wvNodeId{2}, wvProbeBlockId);
        compiler.setParamText("name", "pulse");
        compiler.addEdge(wvNodeId{1}, out0, wvNodeId{2}, in0);
        REQUIRE(runner.compileAndInstall());

        float const expected[] = {0.f, 0.f, 1.f, 0.f, 1.f};
        for (uint32_t frame = 0; frame != 5; ++frame)
        {
            REQUIRE(runner.advance(frame * 50.0));
            CHECK(runner.output("pulse") == expected[frame]);
        }
    }

    SECTION("Sample and hold")
    {
        describeExternalInto(compiler, wvSampleHoldBlockId);
        compiler.beginNode(wvNodeId{4}, wvPulseBlockId);
        compiler.setParam("period", 100.f);
        compiler.addEdge(wvNodeId{4}, out0, wvNodeId{2}, in1);
        REQUIRE(runner.compileAndInstall());

        double const times[] = {0.0, 100.0, 150.0};
        float const inputs[] = {5.f, 7.f, 9.f};
        float const expected[] = {0.f, 7.f, 7.f};
        for (uint32_t frame = 0; frame != 3; ++frame)
        {
            wvExternalValue const x{.nameHash = wvHashName("x"), .values = {inputs[frame]}};
            REQUIRE(runner.advance(times[frame], inputsOf(x)));
            CHECK(runner.output("out") == expected[frame]);
        }
    }
}

TEST_CASE("Time and inputs", "[runtime]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    SECTION("Time is relative to the first frame and steps are clamped")
    {
        compiler.beginNode(wvNodeId{1}, wvTimeBlockId);
        compiler.beginNode(wvNodeId{2}, wvProbeBlockId);
        compiler.setParamText("name", "ms");
        compiler.beginNode(wvNodeId{3}, wvProbeBlockId);
        compiler.setParamText("name", "dt");
        compiler.addEdge(wvNodeId{1}, out0, wvNodeId{2}, in0);
        compiler.addEdge(wvNodeId{1}, out1, wvNodeId{3}, in0);
        REQUIRE(runner.compileAndInstall());

        REQUIRE(runner.advance(1000.0));
        CHECK(runner.output("ms") == 0.f);
        CHECK(runner.output("dt") == 0.f);
        CHECK(runner.frame().frameIndex() == 0);

        REQUIRE(runner.advance(1100.0));
        CHECK(runner.output("ms") == 100.f);
        CHECK(runner.output("dt") == 100.f);

        REQUIRE(runner.advance(1600.0));
        CHECK(runner.output("ms") == 600.f);
        CHECK(runner.output("dt") == 250.f);
        CHECK(runner.frame().frameIndex() == 2);
    }

    SECTION("Time never runs backwards")
    {
        describeCounter(compiler);
        REQUIRE(runner.compileAndInstall());

        REQUIRE(runner.advance(100.0));
        CHECK_FALSE(runner.advance(50.0));
        CHECK(runner.runtime().lastError() == wvRuntimeErrorCode::NonMonotonicTime);
        CHECK_FALSE(runner.advance(-1.0));

        // rejected frames leave the state alone
        REQUIRE(runner.advance(150.0));
        CHECK(runner.output("count") == 1.f);
    }

    SECTION("Rejected frames are logged")
    {
        auto const sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
        wvSetLogger(std::make_shared<spdlog::logger>("weave", sink));

        describeCounter(compiler);
        REQUIRE(runner.compileAndInstall());
        REQUIRE(runner.advance(100.0));
        CHECK_FALSE(runner.advance(50.0));

        std::vector<std::string> const lines = sink->last_formatted();
        wvSetLogger(nullptr);

        REQUIRE_FALSE(lines.empty());
        CHECK(lines.back().find("rejected frame") != std::string::npos);
    }

    SECTION("Externals hold their last value")
    {
        compiler.beginNode(wvNodeId{1}, wvExternalInputBlockId);
        compiler.setParamText("name", "x");
        compiler.setParam("value", 2.f);
        compiler.beginNode(wvNodeId{2}, wvProbeBlockId);
        compiler.setParamText("name", "out");
        compiler.addEdge(wvNodeId{1}, out0, wvNodeId{2}, in0);
        REQUIRE(runner.compileAndInstall());

        REQUIRE(runner.advance(0.0));
        CHECK(runner.output("out") == 2.f);

        wvExternalValue const x{.nameHash = wvHashName("x"), .values = {3.f}};
        REQUIRE(runner.advance(16.0, inputsOf(x)));
        CHECK(runner.output("out") == 3.f);

        REQUIRE(runner.advance(32.0));
        CHECK(runner.output("out") == 3.f);

        // unknown channels are ignored
        wvExternalValue const other{.nameHash = wvHashName("y"), .values = {9.f}};
        REQUIRE(runner.advance(48.0, inputsOf(other)));
        CHECK(runner.output("out") == 3.f);
    }

    SECTION("Frames need a program")
    {
        CHECK_FALSE(runner.advance(0.0));
        CHECK(runner.runtime().lastError() == wvRuntimeErrorCode::NoProgram);
    }
}

TEST_CASE("Fields", "[runtime][fields]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    constexpr wvNodeId arrayNode{1};
    constexpr wvNodeId indexNode{2};
    constexpr wvNodeId blockNode{3};
    constexpr wvNodeId probeNode{4};

    compiler.beginNode(arrayNode, wvArrayBlockId);
    compiler.setParam("count", 4.f);
    compiler.beginNode(indexNode, wvElementIndexBlockId);
    compiler.addEdge(arrayNode, out0, indexNode, in0);
    compiler.beginNode(probeNode, wvProbeBlockId);
    compiler.setParamText("name", "out");

    SECTION("Per element expression")
    {
        compiler.beginNode(blockNode, wvExpressionBlockId);
        compiler.setParamText("expression", "a * 2");
        compiler.addEdge(indexNode, out1, blockNode, in0);
        compiler.addEdge(blockNode, out0, probeNode, in0);
        REQUIRE(runner.compileAndInstall());

        REQUIRE(runner.advance(0.0));
        REQUIRE(runner.outputCount("out") == 4);
        CHECK(runner.output("out", 0) == 0.f);
        CHECK(runner.output("out", 1) == Catch::Approx(2.f / 3.f));
        CHECK(runner.output("out", 2) == Catch::Approx(4.f / 3.f));
        CHECK(runner.output("out", 3) == Catch::Approx(2.f));
    }

    SECTION("Reduction")
    {
        compiler.beginNode(blockNode, wvFieldSumBlockId);
        compiler.addEdge(indexNode, out0, blockNode, in0);
        compiler.addEdge(blockNode, out0, probeNode, in0);
        REQUIRE(runner.compileAndInstall());

        REQUIRE(runner.advance(0.0));
        CHECK(runner.outputCount("out") == 1);
        CHECK(runner.output("out") == 6.f);
    }

    SECTION("Element count follows the count input")
    {
        compiler.beginNode(blockNode, wvFieldMaxBlockId);
        compiler.addEdge(indexNode, out0, blockNode, in0);
        compiler.addEdge(blockNode, out0, probeNode, in0);

        compiler.beginNode(wvNodeId{5}, wvExternalInputBlockId);
        compiler.setParamText("name", "count");
        compiler.setParam("value", 4.f);
        compiler.addEdge(wvNodeId{5}, out0, arrayNode, in0);
        REQUIRE(runner.compileAndInstall());

        REQUIRE(runner.advance(0.0));
        CHECK(runner.output("out") == 3.f);

        wvExternalValue const count{.nameHash = wvHashName("count"), .values = {10.f}};
        REQUIRE(runner.advance(16.0, inputsOf(count)));
        CHECK(runner.output("out") == 9.f);

        // reductions over no elements yield zero
        wvExternalValue const empty{.nameHash = wvHashName("count"), .values = {0.f}};
        REQUIRE(runner.advance(32.0, inputsOf(empty)));
        CHECK(runner.output("out") == 0.f);
    }
}

TEST_CASE("Rendering", "[runtime][render]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    compiler.beginNode(wvNodeId{1}, wvArrayBlockId);
    compiler.setParam("count", 100.f);
    compiler.beginNode(wvNodeId{2}, wvGridLayoutBlockId);
    compiler.beginNode(wvNodeId{3}, wvRenderInstancesBlockId);
    compiler.addEdge(wvNodeId{1}, out0, wvNodeId{2}, in0);
    compiler.addEdge(wvNodeId{2}, out0, wvNodeId{3}, in0);
    REQUIRE(runner.compileAndInstall());

    REQUIRE(runner.advance(0.0));
    REQUIRE(runner.frame().renderPassCount() == 1);

    wvRenderPassView const pass = runner.frame().renderPass(0);
    REQUIRE(pass.count == 100);
    CHECK(pass.positions[0] == Catch::Approx(0.05f));
    CHECK(pass.positions[1] == Catch::Approx(0.05f));
    CHECK(pass.positions[99 * 2] == Catch::Approx(0.95f));
    CHECK(pass.positions[99 * 2 + 1] == Catch::Approx(0.95f));

    // unconnected color and size fall back to their defaults
    CHECK(pass.colors[99 * 4 + 3] == 1.f);
    CHECK(pass.sizes[42] == Catch::Approx(0.01f));
}

TEST_CASE("Determinism", "[runtime]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner first(alloc);
    test::PatchRunner second(alloc);

    for (test::PatchRunner* runner : {&first, &second})
    {
        wvGraphCompiler& compiler = runner->compiler();
        compiler.beginNode(wvNodeId{1}, wvTimeBlockId);
        compiler.beginNode(wvNodeId{2}, wvSinBlockId);
        compiler.beginNode(wvNodeId{3}, wvLagBlockId);
        compiler.setParam("tau", 40.f);
        compiler.beginNode(wvNodeId{4}, wvProbeBlockId);
        compiler.setParamText("name", "out");
        compiler.addEdge(wvNodeId{1}, out0, wvNodeId{2}, in0);
        compiler.addEdge(wvNodeId{2}, out0, wvNodeId{3}, in0);
        compiler.addEdge(wvNodeId{3}, out0, wvNodeId{4}, in0);
        REQUIRE(runner->compileAndInstall());
    }

    CHECK(first.blob() == second.blob());

    double const times[] = {0.0, 16.0, 33.0, 50.0, 300.0, 301.0};
    for (double const time : times)
    {
        REQUIRE(first.advance(time));
        REQUIRE(second.advance(time));
        CHECK(first.output("out") == second.output("out"));
    }

    uint32_t firstCount = 0;
    uint32_t secondCount = 0;
    float const* const firstState = wvStateFloats(first.runtime().state(), firstCount);
    float const* const secondState = wvStateFloats(second.runtime().state(), secondCount);
    REQUIRE(firstCount == secondCount);
    REQUIRE(firstCount != 0);
    CHECK(std::memcmp(firstState, secondState, firstCount * sizeof(float)) == 0);
}

TEST_CASE("Program installation", "[runtime]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    describeCounter(compiler);

    SECTION("Stale programs are discarded")
    {
        REQUIRE(runner.compileAndInstall(2));
        std::vector<uint8_t> const blob = runner.blob();

        CHECK_FALSE(runner.installBytes(blob.data(), static_cast<uint32_t>(blob.size()), 1));
        CHECK(runner.runtime().lastError() == wvRuntimeErrorCode::StaleProgram);
        CHECK(runner.runtime().installedVersion() == 2);
    }

    SECTION("A newer edit makes a pending program stale")
    {
        REQUIRE(runner.compile(1));
        runner.runtime().noteGraphVersion(2);

        std::vector<uint8_t> const blob = runner.blob();
        CHECK_FALSE(runner.installBytes(blob.data(), static_cast<uint32_t>(blob.size()), 1));
        CHECK(runner.runtime().lastError() == wvRuntimeErrorCode::StaleProgram);
        CHECK(runner.runtime().program() == nullptr);
    }

    SECTION("Corrupt blocks are rejected")
    {
        REQUIRE(runner.compile());
        std::vector<uint8_t> blob = runner.blob();
        blob.back() ^= 0xff;

        CHECK(wvLoadProgram(alloc, blob.data(), static_cast<uint32_t>(blob.size())) == nullptr);
    }

    SECTION("State writes outside phase 2 are fatal")
    {
        REQUIRE(runner.compile());
        std::vector<uint8_t> const& blob = runner.blob();

        // aligned copy of the block so the header can be edited in place
        std::vector<uint64_t> words((blob.size() + 7) / 8);
        std::memcpy(words.data(), blob.data(), blob.size());
        wvProgramHeader& header = *reinterpret_cast<wvProgramHeader*>(words.data());

        REQUIRE(header.phase1.size() != 0);
        REQUIRE(header.phase2.size() != 0);
        header.phase1.data()[0] = header.phase2.data()[0];
        header.hash = wvHashProgram(&header);

        REQUIRE(runner.installBytes(reinterpret_cast<uint8_t const*>(words.data()), static_cast<uint32_t>(blob.size()), 1));

        wvFatalHandler const previous = wvSetFatalHandler(&throwingFatalHandler);
        CHECK_THROWS_AS(runner.advance(0.0), FatalError);
        wvSetFatalHandler(previous);
    }
}
