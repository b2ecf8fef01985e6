// weave

#include <weave/alloc.hh>
#include <weave/blocks.hh>
#include <weave/diagnostics.hh>
#include <weave/graph_compiler.hh>
#include <weave/program.hh>
#include <weave/runtime.hh>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>

using namespace weave;

namespace sample {
    constexpr wvNodeId timeNode{1};
    constexpr wvNodeId arrayNode{2};
    constexpr wvNodeId gridNode{3};
    constexpr wvNodeId indexNode{4};
    constexpr wvNodeId hueNode{5};
    constexpr wvNodeId colorNode{6};
    constexpr wvNodeId smoothNode{7};
    constexpr wvNodeId renderNode{8};
    constexpr wvNodeId counterNode{9};
    constexpr wvNodeId stepNode{10};
    constexpr wvNodeId delayNode{11};
    constexpr wvNodeId frameProbeNode{12};
    constexpr wvNodeId sumNode{13};
    constexpr wvNodeId sumProbeNode{14};

    constexpr wvOutputPortIndex out0{0};
    constexpr wvOutputPortIndex out1{1};
    constexpr wvInputPortIndex in0{0};
    constexpr wvInputPortIndex in1{1};

    constexpr double frameMs = 1000.0 / 60.0;

    /// Compiles a small patch, runs it headless, then hot swaps an edit into the running program.
    class App
    {
    public:
        App() : catalog_(alloc_) {}

        int run(int argc, char** argv);

    private:
        void describeGraph(uint32_t elementCount);
        bool compileAndInstall(uint64_t version);
        bool runFrames(uint32_t frames);
        void printFrame(wvFrameOutput const& frame) const;

        wvDefaultAllocator alloc_;
        wvStandardCatalog catalog_;
        std::unique_ptr<wvGraphCompiler, decltype(&wvDestroyGraphCompiler)> compiler_ = {nullptr, &wvDestroyGraphCompiler};
        std::unique_ptr<wvRuntime, decltype(&wvDestroyRuntime)> runtime_ = {nullptr, &wvDestroyRuntime};
        std::unique_ptr<wvFrameOutput, decltype(&wvDestroyFrameOutput)> frame_ = {nullptr, &wvDestroyFrameOutput};
        double timeMs_ = 0.0;
    };

    int App::run(int argc, char** argv)
    {
        uint32_t frames = 5;
        if (argc > 1)
            frames = static_cast<uint32_t>(std::strtoul(argv[1], nullptr, 10));

        compiler_.reset(wvCreateGraphCompiler(alloc_, catalog_));
        runtime_.reset(wvCreateRuntime(alloc_));
        frame_.reset(wvCreateFrameOutput(alloc_));

        describeGraph(100);
        if (!compileAndInstall(1) || !runFrames(frames))
            return 1;

        // same patch with fewer elements; the frame counter keeps counting
        spdlog::info("editing the array to 64 elements");
        describeGraph(64);
        if (!compileAndInstall(2) || !runFrames(frames))
            return 1;

        return 0;
    }

    void App::describeGraph(uint32_t elementCount)
    {
        wvGraphCompiler& compiler = *compiler_;
        compiler.reset();

        compiler.beginNode(timeNode, wvTimeBlockId);

        compiler.beginNode(arrayNode, wvArrayBlockId);
        compiler.setParam("count", static_cast<float>(elementCount));
        compiler.setParam("capacity", 256.f);

        compiler.beginNode(gridNode, wvGridLayoutBlockId);
        compiler.beginNode(indexNode, wvElementIndexBlockId);

        compiler.beginNode(hueNode, wvExpressionBlockId);
        compiler.setParamText("expression", "fract(a + t * 0.0002)");

        compiler.beginNode(colorNode, wvHsvColorBlockId);
        compiler.setParam("s", 0.8f);

        compiler.beginNode(smoothNode, wvSmoothBlockId);
        compiler.setParamText("policy", "slew");
        compiler.setParam("tau", 80.f);

        compiler.beginNode(renderNode, wvRenderInstancesBlockId);
        compiler.setParam("size", 0.02f);

        // counts frames through a feedback loop
        compiler.beginNode(counterNode, wvAddBlockId);
        compiler.beginNode(stepNode, wvConstBlockId);
        compiler.setParam("value", 1.f);
        compiler.beginNode(delayNode, wvUnitDelayBlockId);
        compiler.beginNode(frameProbeNode, wvProbeBlockId);
        compiler.setParamText("name", "frames");

        compiler.beginNode(sumNode, wvFieldSumBlockId);
        compiler.beginNode(sumProbeNode, wvProbeBlockId);
        compiler.setParamText("name", "hue_total");

        compiler.addEdge(arrayNode, out0, gridNode, in0);
        compiler.addEdge(arrayNode, out0, indexNode, in0);
        compiler.addEdge(indexNode, out1, hueNode, in0);
        compiler.addEdge(hueNode, out0, colorNode, in0);
        compiler.addEdge(gridNode, out0, smoothNode, in0);
        compiler.addEdge(smoothNode, out0, renderNode, in0);
        compiler.addEdge(colorNode, out0, renderNode, in1);

        compiler.addEdge(delayNode, out0, counterNode, in0);
        compiler.addEdge(stepNode, out0, counterNode, in0);
        compiler.addEdge(counterNode, out0, delayNode, in0);
        compiler.addEdge(delayNode, out0, frameProbeNode, in0);

        compiler.addEdge(hueNode, out0, sumNode, in0);
        compiler.addEdge(sumNode, out0, sumProbeNode, in0);
    }

    bool App::compileAndInstall(uint64_t version)
    {
        wvGraphCompiler& compiler = *compiler_;
        compiler.setGraphVersion(version);
        runtime_->noteGraphVersion(version);

        if (!compiler.compile() || !compiler.build())
        {
            for (uint32_t index = 0; index != compiler.getErrorCount(); ++index)
                spdlog::error("{}", wvDescribeError(compiler.getError(index)));
            return false;
        }

        wvProgram* const program = wvLoadProgram(alloc_, compiler.programBytes(), compiler.programSize());
        if (program == nullptr)
        {
            spdlog::error("program failed to load");
            return false;
        }

        bool const installed = runtime_->installProgram(program, version);
        wvReleaseProgram(program);
        if (!installed)
        {
            spdlog::error("install failed: {}", wvRuntimeErrorName(runtime_->lastError()));
            return false;
        }

        wvMigrationReport const& report = runtime_->lastMigration();
        spdlog::info("version {}: {} states migrated, {} initialized, {} discarded", version, report.migrated, report.initialized,
            report.discarded);
        return true;
    }

    bool App::runFrames(uint32_t frames)
    {
        for (uint32_t frame = 0; frame != frames; ++frame)
        {
            if (!runtime_->advanceFrame({}, timeMs_, *frame_))
            {
                spdlog::error("frame failed: {}", wvRuntimeErrorName(runtime_->lastError()));
                return false;
            }

            printFrame(*frame_);
            timeMs_ += frameMs;
        }
        return true;
    }

    void App::printFrame(wvFrameOutput const& frame) const
    {
        wvOutputView counter;
        wvOutputView hues;
        float const frames = frame.findOutput("frames", counter) ? counter.values[0] : 0.f;
        float const hueTotal = frame.findOutput("hue_total", hues) ? hues.values[0] : 0.f;

        spdlog::info("frame {} at {:.1f}ms: counter {}, hue total {:.3f}", frame.frameIndex(), frame.timeMs(), frames, hueTotal);

        for (uint32_t pass = 0; pass != frame.renderPassCount(); ++pass)
        {
            wvRenderPassView const view = frame.renderPass(pass);
            if (view.count == 0)
                continue;

            uint32_t const last = view.count - 1;
            spdlog::info("  pass {}: {} instances, first ({:.3f}, {:.3f}), last ({:.3f}, {:.3f})", pass, view.count, view.positions[0],
                view.positions[1], view.positions[last * 2], view.positions[last * 2 + 1]);
        }
    }
} // namespace sample

int main(int argc, char** argv)
{
    sample::App app;
    return app.run(argc, argv);
}
