// weave

#pragma once

#include "weave/runtime.hh"

#include "array.hh"
#include "program_internal.hh"

#include <cstdint>

namespace weave {
    // continuity bookkeeping for one element of one target
    struct wvGauge
    {
        float delta[4] = {};
        float current[4] = {};
        double retiredAtMs = 0.0;
        uint8_t alive = 0;
        uint8_t retiring = 0;
    };

    /// Everything that persists between frames for one program.
    ///
    /// Scratch slots and the expression cache are only meaningful while
    /// their stamp matches the running frame; stamps are frameIndex + 1 so
    /// that zero-initialized stamps are never current.
    class wvProgramState final
    {
    public:
        wvProgramState(wvAllocator& alloc, wvProgram* program, wvRuntimeOptions const& options);
        ~wvProgramState();

        wvProgramState(wvProgramState const&) = delete;
        wvProgramState& operator=(wvProgramState const&) = delete;

        wvProgramHeader const& header() const noexcept { return *program->header; }

        // index of the state with the given id, or ~0u
        uint32_t findState(wvStableId stableId) const noexcept;
        uint32_t stateLanes(uint32_t stateIndex) const noexcept;

        // restores the initial value of lanes [first, last) of a state
        void resetLanes(uint32_t stateIndex, uint32_t first, uint32_t last) noexcept;

        wvAllocator& allocator;
        wvProgram* program = nullptr;
        wvRuntimeOptions options;

        wvArray<float> state;
        wvArray<uint32_t> committed; // lanes written by the last commit, per state

        wvArray<float> scratch;
        wvArray<uint64_t> slotStamps;
        wvArray<uint32_t> slotLanes;

        wvArray<float> cache;
        wvArray<uint64_t> cacheStamps;

        wvArray<uint32_t> instanceCounts;
        wvArray<uint64_t> instanceStamps;

        wvArray<float> externals; // 4 floats per channel

        wvArray<wvGauge> gauges;
        wvArray<int32_t> mapping;        // new lane to old lane, per gauge
        wvArray<uint32_t> targetCounts;  // element count at the previous frame, per target
        wvArray<uint8_t> targetRebase;   // discontinuity this frame, per target
        wvArray<uint8_t> targetStarted;  // has run at least once, per target
        wvArray<uint64_t> idScratch;

        double startMs = 0.0;
        double timeMs = 0.0;
        double deltaMs = 0.0;
        uint64_t frameIndex = 0;
        bool started = false;
        bool swapped = false;
    };

    // the stamp of the frame being executed
    inline uint64_t wvFrameStamp(wvProgramState const& state) noexcept { return state.frameIndex + 1; }

    /// Builds the new-to-old element mapping of a continuity target and
    /// decides whether this frame is a discontinuity.
    void wvRunContinuityMapping(wvProgramState& state, wvProgramContinuityIndex target, uint32_t count);

    /// Applies the target's policy to count elements of input into out_values.
    void wvRunContinuityApply(wvProgramState& state, wvProgramContinuityIndex target, float const* input, uint32_t count,
        float* out_values) noexcept;
} // namespace weave
