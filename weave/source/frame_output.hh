// weave

#pragma once

#include "weave/runtime.hh"

#include "array.hh"

#include <cstdint>

namespace weave {
    class wvFrameOutputBuffer final : public wvFrameOutput
    {
    public:
        explicit wvFrameOutputBuffer(wvAllocator& alloc) noexcept : allocator_(alloc), floats_(alloc), passes_(alloc), outputs_(alloc) {}

        wvAllocator& allocator() const noexcept { return allocator_; }

        // discards the previous frame
        void begin(double timeMs, uint64_t frameIndex) noexcept;

        void addRenderPass(uint32_t count, float const* positions, float const* colors, float const* sizes);
        void addOutput(uint64_t nameHash, uint32_t stride, uint32_t count, float const* values);

        double timeMs() const noexcept override { return timeMs_; }
        uint64_t frameIndex() const noexcept override { return frameIndex_; }

        uint32_t renderPassCount() const noexcept override { return passes_.size(); }
        wvRenderPassView renderPass(uint32_t index) const noexcept override;

        uint32_t outputCount() const noexcept override { return outputs_.size(); }
        wvOutputView output(uint32_t index) const noexcept override;
        bool findOutput(char const* name, wvOutputView& out_view) const noexcept override;

    private:
        struct Pass
        {
            uint32_t count = 0;
            uint32_t positions = 0;
            uint32_t colors = 0;
            uint32_t sizes = 0;
        };

        struct Output
        {
            uint64_t nameHash = 0;
            uint32_t stride = 0;
            uint32_t count = 0;
            uint32_t values = 0;
        };

        uint32_t append(float const* values, uint32_t count);

        wvAllocator& allocator_;
        wvArray<float> floats_;
        wvArray<Pass> passes_;
        wvArray<Output> outputs_;
        double timeMs_ = 0.0;
        uint64_t frameIndex_ = 0;
    };
} // namespace weave
