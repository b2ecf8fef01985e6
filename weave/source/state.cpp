// weave

#include "weave/alloc.hh"
#include "weave/program.hh"

#include "state.hh"

#include <cstring>

namespace weave {
    wvProgramState::wvProgramState(wvAllocator& alloc, wvProgram* loaded, wvRuntimeOptions const& runtimeOptions)
        : allocator(alloc),
          program(loaded),
          options(runtimeOptions),
          state(alloc),
          committed(alloc),
          scratch(alloc),
          slotStamps(alloc),
          slotLanes(alloc),
          cache(alloc),
          cacheStamps(alloc),
          instanceCounts(alloc),
          instanceStamps(alloc),
          externals(alloc),
          gauges(alloc),
          mapping(alloc),
          targetCounts(alloc),
          targetRebase(alloc),
          targetStarted(alloc),
          idScratch(alloc)
    {
        wvAcquireProgram(program);

        wvProgramHeader const& loadedHeader = header();

        state.resize(program->stateFloats, 0.f);
        committed.resize(loadedHeader.states.count, 0);
        for (uint32_t index = 0; index != loadedHeader.states.count; ++index)
            resetLanes(index, 0, stateLanes(index));

        scratch.resize(program->scratchFloats, 0.f);
        slotStamps.resize(loadedHeader.slots.count, 0);
        slotLanes.resize(loadedHeader.slots.count, 0);

        cache.resize(program->cacheFloats, 0.f);
        cacheStamps.resize(loadedHeader.exprs.count, 0);

        instanceCounts.resize(loadedHeader.instances.count, 0);
        instanceStamps.resize(loadedHeader.instances.count, 0);

        externals.resize(loadedHeader.externals.count * 4, 0.f);
        for (uint32_t index = 0; index != loadedHeader.externals.count; ++index)
        {
            wvProgramExternal const& external = loadedHeader.externals[wvProgramExternalIndex{index}];
            std::memcpy(externals.data() + index * 4, external.defaults, sizeof(external.defaults));
        }

        gauges.resize(program->gaugeCount);
        mapping.resize(program->gaugeCount, -1);
        targetCounts.resize(loadedHeader.continuity.count, 0);
        targetRebase.resize(loadedHeader.continuity.count, 0);
        targetStarted.resize(loadedHeader.continuity.count, 0);
    }

    wvProgramState::~wvProgramState() { wvReleaseProgram(program); }

    uint32_t wvProgramState::findState(wvStableId stableId) const noexcept
    {
        wvProgramHeader const& loadedHeader = header();
        for (uint32_t index = 0; index != loadedHeader.states.count; ++index)
            if (loadedHeader.states[wvProgramStateIndex{index}].stableId == stableId.value())
                return index;
        return ~uint32_t{0};
    }

    uint32_t wvProgramState::stateLanes(uint32_t stateIndex) const noexcept
    {
        wvProgramHeader const& loadedHeader = header();
        return wvProgramLanes(loadedHeader, loadedHeader.states[wvProgramStateIndex{stateIndex}].instance);
    }

    void wvProgramState::resetLanes(uint32_t stateIndex, uint32_t first, uint32_t last) noexcept
    {
        wvProgramHeader const& loadedHeader = header();
        wvProgramStateRecord const& record = loadedHeader.states[wvProgramStateIndex{stateIndex}];

        float const* const initial = loadedHeader.floats.data() + record.initialStart;
        float* const values = state.data() + program->stateOffsets[wvProgramStateIndex{stateIndex}];
        for (uint32_t lane = first; lane < last; ++lane)
            std::memcpy(values + lane * record.stride, initial, record.stride * sizeof(float));
    }

    wvProgramState* wvCreateProgramState(wvAllocator& alloc, wvProgram* program, wvRuntimeOptions const& options)
    {
        WV_GUARD_OR(program != nullptr, nullptr);
        return alloc.create<wvProgramState>(alloc, program, options);
    }

    void wvDestroyProgramState(wvProgramState* state)
    {
        if (state == nullptr)
            return;
        state->allocator.destroy(state);
    }

    wvProgram* wvStateProgram(wvProgramState const* state) noexcept
    {
        WV_GUARD_OR(state != nullptr, nullptr);
        return state->program;
    }

    uint32_t wvReadState(wvProgramState const* state, wvStableId stableId, uint32_t lane, float* out_values, uint32_t capacity) noexcept
    {
        WV_GUARD_OR(state != nullptr, 0);

        uint32_t const index = state->findState(stableId);
        if (index == ~uint32_t{0} || lane >= state->stateLanes(index))
            return 0;

        wvProgramStateRecord const& record = state->header().states[wvProgramStateIndex{index}];
        float const* const values = state->state.data() + state->program->stateOffsets[wvProgramStateIndex{index}] + lane * record.stride;

        uint32_t const count = capacity < record.stride ? capacity : record.stride;
        if (out_values != nullptr && count != 0)
            std::memcpy(out_values, values, count * sizeof(float));
        return record.stride;
    }

    bool wvWriteState(wvProgramState* state, wvStableId stableId, uint32_t lane, float const* values, uint32_t count) noexcept
    {
        WV_GUARD_OR(state != nullptr, false);
        WV_GUARD_OR(values != nullptr || count == 0, false);

        uint32_t const index = state->findState(stableId);
        if (index == ~uint32_t{0} || lane >= state->stateLanes(index))
            return false;

        wvProgramStateRecord const& record = state->header().states[wvProgramStateIndex{index}];
        if (count > record.stride)
            return false;

        float* const target = state->state.data() + state->program->stateOffsets[wvProgramStateIndex{index}] + lane * record.stride;
        if (count != 0)
            std::memcpy(target, values, count * sizeof(float));
        return true;
    }

    uint32_t wvStateLaneCount(wvProgramState const* state, wvStableId stableId) noexcept
    {
        WV_GUARD_OR(state != nullptr, 0);

        uint32_t const index = state->findState(stableId);
        if (index == ~uint32_t{0})
            return 0;
        if (state->header().states[wvProgramStateIndex{index}].instance == wvInvalidIndex)
            return 1;
        return state->committed[index];
    }

    float const* wvStateFloats(wvProgramState const* state, uint32_t& out_count) noexcept
    {
        out_count = 0;
        WV_GUARD_OR(state != nullptr, nullptr);

        out_count = state->state.size();
        return state->state.data();
    }
} // namespace weave
