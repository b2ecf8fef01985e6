// weave

#include "weave/log.hh"
#include "weave/runtime.hh"

#include "state.hh"

#include <spdlog/spdlog.h>

#include <cstring>

namespace weave {
    namespace {
        constexpr uint32_t invalid = ~uint32_t{0};

        // the first stable id that appears twice, if any
        bool findDuplicateState(wvProgramHeader const& header, uint64_t& out_id) noexcept
        {
            for (uint32_t first = 0; first != header.states.count; ++first)
            {
                uint64_t const id = header.states[wvProgramStateIndex{first}].stableId;
                for (uint32_t second = first + 1; second != header.states.count; ++second)
                {
                    if (header.states[wvProgramStateIndex{second}].stableId == id)
                    {
                        out_id = id;
                        return true;
                    }
                }
            }
            return false;
        }

        uint32_t findContinuity(wvProgramHeader const& header, uint64_t stableId) noexcept
        {
            for (uint32_t index = 0; index != header.continuity.count; ++index)
                if (header.continuity[wvProgramContinuityIndex{index}].stableId == stableId)
                    return index;
            return invalid;
        }

        void migrateState(wvProgramState const& oldState, uint32_t oldIndex, wvProgramState& newState, uint32_t newIndex) noexcept
        {
            wvProgramStateRecord const& from = oldState.header().states[wvProgramStateIndex{oldIndex}];
            wvProgramStateRecord const& to = newState.header().states[wvProgramStateIndex{newIndex}];

            float const* const source = oldState.state.data() + oldState.program->stateOffsets[wvProgramStateIndex{oldIndex}];
            float* const target = newState.state.data() + newState.program->stateOffsets[wvProgramStateIndex{newIndex}];

            uint32_t const components = from.stride < to.stride ? from.stride : to.stride;
            uint32_t const oldLanes = oldState.stateLanes(oldIndex);
            uint32_t const newLanes = newState.stateLanes(newIndex);
            uint32_t const lanes = oldLanes < newLanes ? oldLanes : newLanes;

            for (uint32_t lane = 0; lane != lanes; ++lane)
                std::memcpy(target + lane * to.stride, source + lane * from.stride, components * sizeof(float));

            uint32_t const committed = oldState.committed[oldIndex];
            newState.committed[newIndex] = committed < newLanes ? committed : newLanes;
        }

        void migrateContinuity(wvProgramState const& oldState, uint32_t oldIndex, wvProgramState& newState, uint32_t newIndex) noexcept
        {
            wvProgramContinuityIndex const from{oldIndex};
            wvProgramContinuityIndex const to{newIndex};

            uint32_t const oldLanes = wvProgramLanes(oldState.header(), oldState.header().continuity[from].instance);
            uint32_t const newLanes = wvProgramLanes(newState.header(), newState.header().continuity[to].instance);
            uint32_t const lanes = oldLanes < newLanes ? oldLanes : newLanes;

            wvGauge const* const source = oldState.gauges.data() + oldState.program->gaugeOffsets[from];
            wvGauge* const target = newState.gauges.data() + newState.program->gaugeOffsets[to];
            for (uint32_t lane = 0; lane != lanes; ++lane)
                target[lane] = source[lane];

            uint32_t const count = oldState.targetCounts[oldIndex];
            newState.targetCounts[newIndex] = count < newLanes ? count : newLanes;
            newState.targetStarted[newIndex] = oldState.targetStarted[oldIndex];
        }
    } // namespace

    bool wvMigrateState(wvProgramState const& oldState, wvProgramState& newState, wvMigrationReport& out_report)
    {
        out_report = wvMigrationReport{};

        wvProgramHeader const& oldHeader = oldState.header();
        wvProgramHeader const& newHeader = newState.header();

        // one id must name one state on both sides before anything is copied
        uint64_t duplicate = 0;
        if (findDuplicateState(oldHeader, duplicate) || findDuplicateState(newHeader, duplicate))
        {
            out_report.code = wvRuntimeErrorCode::MigrationAmbiguity;
            out_report.ambiguousId = wvStableId{duplicate};
            SPDLOG_LOGGER_WARN(wvLog(), "state migration refused: id {:016x} names more than one state", duplicate);
            return false;
        }

        for (uint32_t newIndex = 0; newIndex != newHeader.states.count; ++newIndex)
        {
            wvProgramStateRecord const& record = newHeader.states[wvProgramStateIndex{newIndex}];
            uint32_t const oldIndex = oldState.findState(wvStableId{record.stableId});
            if (oldIndex == invalid)
            {
                ++out_report.initialized;
                continue;
            }

            // scalar and per-element storage are not interchangeable
            bool const oldField = oldHeader.states[wvProgramStateIndex{oldIndex}].instance != wvInvalidIndex;
            bool const newField = record.instance != wvInvalidIndex;
            if (oldField != newField)
            {
                ++out_report.initialized;
                continue;
            }

            migrateState(oldState, oldIndex, newState, newIndex);
            ++out_report.migrated;
        }

        for (uint32_t oldIndex = 0; oldIndex != oldHeader.states.count; ++oldIndex)
        {
            wvProgramStateRecord const& record = oldHeader.states[wvProgramStateIndex{oldIndex}];
            if (newState.findState(wvStableId{record.stableId}) == invalid)
                ++out_report.discarded;
        }

        for (uint32_t newIndex = 0; newIndex != newHeader.continuity.count; ++newIndex)
        {
            uint32_t const oldIndex = findContinuity(oldHeader, newHeader.continuity[wvProgramContinuityIndex{newIndex}].stableId);
            if (oldIndex != invalid)
                migrateContinuity(oldState, oldIndex, newState, newIndex);
        }

        for (uint32_t newIndex = 0; newIndex != newHeader.externals.count; ++newIndex)
        {
            uint64_t const nameHash = newHeader.externals[wvProgramExternalIndex{newIndex}].nameHash;
            for (uint32_t oldIndex = 0; oldIndex != oldHeader.externals.count; ++oldIndex)
            {
                if (oldHeader.externals[wvProgramExternalIndex{oldIndex}].nameHash == nameHash)
                    std::memcpy(newState.externals.data() + newIndex * 4, oldState.externals.data() + oldIndex * 4, sizeof(float) * 4);
            }
        }

        newState.startMs = oldState.startMs;
        newState.timeMs = oldState.timeMs;
        newState.deltaMs = oldState.deltaMs;
        newState.frameIndex = oldState.frameIndex;
        newState.started = oldState.started;
        newState.swapped = true;

        SPDLOG_LOGGER_DEBUG(wvLog(), "migrated state: {} kept, {} initialized, {} discarded", out_report.migrated,
            out_report.initialized, out_report.discarded);
        return true;
    }
} // namespace weave
