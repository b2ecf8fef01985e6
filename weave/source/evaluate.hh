// weave

#pragma once

#include "state.hh"

#include <cstdint>

namespace weave {
    /// Evaluates expressions of one frame, memoized through the state's
    /// expression cache.
    ///
    /// The returned pointer addresses lanes * stride floats for fields and
    /// stride floats for signals; it stays valid until the frame ends.
    class wvFrameEvaluator
    {
    public:
        explicit wvFrameEvaluator(wvProgramState& state) noexcept;

        float const* evaluate(wvProgramExprIndex index);

        // current element count of an instance, clamped to its capacity
        uint32_t instanceCount(wvProgramInstanceIndex index);

        // lanes held by a value of the given instance this frame
        uint32_t lanes(wvProgramInstanceIndex index) { return index == wvInvalidIndex ? 1 : instanceCount(index); }

    private:
        float const* compute(wvProgramExprIndex index, wvProgramExpr const& expr);
        void kernel(wvProgramExpr const& expr, float* out_values);

        wvProgramState& state_;
        wvProgramHeader const& header_;
        uint64_t stamp_ = 0;
    };
} // namespace weave
