// weave

#include "weave/alloc.hh"
#include "weave/types.hh"

#include "frame_output.hh"

#include <cstring>
#include <new>

namespace weave {
    void wvFrameOutputBuffer::begin(double timeMs, uint64_t frameIndex) noexcept
    {
        floats_.clear();
        passes_.clear();
        outputs_.clear();
        timeMs_ = timeMs;
        frameIndex_ = frameIndex;
    }

    uint32_t wvFrameOutputBuffer::append(float const* values, uint32_t count)
    {
        uint32_t const start = floats_.size();
        floats_.resize(start + count);
        if (count != 0)
            std::memcpy(floats_.data() + start, values, count * sizeof(float));
        return start;
    }

    void wvFrameOutputBuffer::addRenderPass(uint32_t count, float const* positions, float const* colors, float const* sizes)
    {
        Pass pass{.count = count};
        pass.positions = append(positions, count * 2);
        pass.colors = append(colors, count * 4);
        pass.sizes = append(sizes, count);
        passes_.pushBack(pass);
    }

    void wvFrameOutputBuffer::addOutput(uint64_t nameHash, uint32_t stride, uint32_t count, float const* values)
    {
        outputs_.pushBack({.nameHash = nameHash, .stride = stride, .count = count, .values = append(values, stride * count)});
    }

    wvRenderPassView wvFrameOutputBuffer::renderPass(uint32_t index) const noexcept
    {
        WV_GUARD_OR(index < passes_.size(), wvRenderPassView{});

        Pass const& pass = passes_[index];
        return {
            .count = pass.count,
            .positions = floats_.data() + pass.positions,
            .colors = floats_.data() + pass.colors,
            .sizes = floats_.data() + pass.sizes,
        };
    }

    wvOutputView wvFrameOutputBuffer::output(uint32_t index) const noexcept
    {
        WV_GUARD_OR(index < outputs_.size(), wvOutputView{});

        Output const& output = outputs_[index];
        return {.nameHash = output.nameHash, .stride = output.stride, .count = output.count, .values = floats_.data() + output.values};
    }

    bool wvFrameOutputBuffer::findOutput(char const* name, wvOutputView& out_view) const noexcept
    {
        WV_GUARD_OR(name != nullptr, false);

        uint64_t const nameHash = wvHashName(name);
        for (uint32_t index = 0; index != outputs_.size(); ++index)
        {
            if (outputs_[index].nameHash == nameHash)
            {
                out_view = output(index);
                return true;
            }
        }
        return false;
    }

    wvFrameOutput* wvCreateFrameOutput(wvAllocator& alloc)
    {
        return new (alloc.allocate(sizeof(wvFrameOutputBuffer), alignof(wvFrameOutputBuffer))) wvFrameOutputBuffer(alloc);
    }

    void wvDestroyFrameOutput(wvFrameOutput* output)
    {
        if (output == nullptr)
            return;

        wvFrameOutputBuffer* const impl = static_cast<wvFrameOutputBuffer*>(output);
        wvAllocator& alloc = impl->allocator();

        impl->~wvFrameOutputBuffer();

        alloc.free(impl, sizeof(wvFrameOutputBuffer), alignof(wvFrameOutputBuffer));
    }
} // namespace weave
