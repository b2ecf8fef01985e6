// weave

#pragma once

#include "weave/alloc.hh"
#include "weave/blocks.hh"
#include "weave/diagnostics.hh"
#include "weave/graph_compiler.hh"
#include "weave/program.hh"
#include "weave/runtime.hh"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace weave::test {
    /// Compiles patches against the standard catalog and runs them in a runtime.
    class PatchRunner
    {
    public:
        explicit PatchRunner(wvAllocator& alloc, wvRuntimeOptions const& options = {})
            : alloc_(alloc), catalog_(alloc), compiler_(wvCreateGraphCompiler(alloc, catalog_)), runtime_(wvCreateRuntime(alloc, options)),
              frame_(wvCreateFrameOutput(alloc))
        {
        }

        ~PatchRunner()
        {
            wvDestroyFrameOutput(frame_);
            wvDestroyRuntime(runtime_);
            wvDestroyGraphCompiler(compiler_);
        }

        PatchRunner(PatchRunner const&) = delete;
        PatchRunner& operator=(PatchRunner const&) = delete;

        wvGraphCompiler& compiler() noexcept { return *compiler_; }
        wvStandardCatalog& catalog() noexcept { return catalog_; }
        wvRuntime& runtime() noexcept { return *runtime_; }
        wvFrameOutput const& frame() const noexcept { return *frame_; }

        // compiles the current graph and copies out the program block
        bool compile(uint64_t version = 1)
        {
            compiler_->setGraphVersion(version);
            if (!compiler_->compile() || !compiler_->build())
                return false;
            blob_.assign(compiler_->programBytes(), compiler_->programBytes() + compiler_->programSize());
            return true;
        }

        // loads the last compiled block and hands it to the runtime
        bool install(uint64_t version = 1)
        {
            runtime_->noteGraphVersion(version);
            return installBytes(blob_.data(), static_cast<uint32_t>(blob_.size()), version);
        }

        bool installBytes(uint8_t const* bytes, uint32_t size, uint64_t version)
        {
            wvProgram* const program = wvLoadProgram(alloc_, bytes, size);
            if (program == nullptr)
                return false;
            bool const installed = runtime_->installProgram(program, version);
            wvReleaseProgram(program);
            return installed;
        }

        bool compileAndInstall(uint64_t version = 1) { return compile(version) && install(version); }

        bool advance(double timeMs, wvFrameInputs const& inputs = {}) { return runtime_->advanceFrame(inputs, timeMs, *frame_); }

        // one lane and component of a named output, or NaN when absent
        float output(char const* name, uint32_t lane = 0, uint32_t component = 0) const
        {
            wvOutputView view;
            if (!frame_->findOutput(name, view) || lane >= view.count || component >= view.stride)
                return std::numeric_limits<float>::quiet_NaN();
            return view.values[lane * view.stride + component];
        }

        uint32_t outputCount(char const* name) const
        {
            wvOutputView view;
            return frame_->findOutput(name, view) ? view.count : 0;
        }

        std::vector<uint8_t> const& blob() const noexcept { return blob_; }

        bool hasError(wvCompileErrorCode code) const noexcept
        {
            for (uint32_t index = 0; index != compiler_->getErrorCount(); ++index)
                if (compiler_->getError(index).code == code)
                    return true;
            return false;
        }

        std::string errors() const
        {
            std::string text;
            for (uint32_t index = 0; index != compiler_->getErrorCount(); ++index)
            {
                text += wvDescribeError(compiler_->getError(index));
                text += '\n';
            }
            return text;
        }

    private:
        wvAllocator& alloc_;
        wvStandardCatalog catalog_;
        wvGraphCompiler* compiler_ = nullptr;
        wvRuntime* runtime_ = nullptr;
        wvFrameOutput* frame_ = nullptr;
        std::vector<uint8_t> blob_;
    };
} // namespace weave::test
