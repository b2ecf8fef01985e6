// weave

#include "weave/continuity.hh"
#include "weave/alloc.hh"

#include "array.hh"
#include "state.hh"

#include <cmath>
#include <cstring>

namespace weave {
    void wvBuildMappingById(uint64_t const* oldIds, uint32_t oldCount, uint64_t const* newIds, uint32_t newCount,
        int32_t* out_newToOld) noexcept
    {
        if (oldCount == newCount && (newCount == 0 || std::memcmp(oldIds, newIds, newCount * sizeof(uint64_t)) == 0))
        {
            for (uint32_t index = 0; index != newCount; ++index)
                out_newToOld[index] = static_cast<int32_t>(index);
            return;
        }

        for (uint32_t index = 0; index != newCount; ++index)
        {
            out_newToOld[index] = -1;

            // most elements keep their position
            if (index < oldCount && oldIds[index] == newIds[index])
            {
                out_newToOld[index] = static_cast<int32_t>(index);
                continue;
            }

            for (uint32_t old = 0; old != oldCount; ++old)
            {
                if (oldIds[old] == newIds[index])
                {
                    out_newToOld[index] = static_cast<int32_t>(old);
                    break;
                }
            }
        }
    }

    void wvBuildMappingByPosition(wvAllocator& alloc, float const* oldPositions, uint32_t oldCount, float const* newPositions,
        uint32_t newCount, uint32_t stride, float radius, int32_t* out_newToOld)
    {
        wvArray<uint8_t> claimed(alloc);
        claimed.resize(oldCount, 0);

        float const limit = radius * radius;
        for (uint32_t index = 0; index != newCount; ++index)
        {
            float const* const position = newPositions + index * stride;

            int32_t best = -1;
            float bestDistance = limit;
            for (uint32_t old = 0; old != oldCount; ++old)
            {
                if (claimed[old] != 0)
                    continue;

                float distance = 0.f;
                for (uint32_t component = 0; component != stride; ++component)
                {
                    float const offset = oldPositions[old * stride + component] - position[component];
                    distance += offset * offset;
                }

                if (distance > limit)
                    continue;
                if (best < 0 || distance < bestDistance)
                {
                    best = static_cast<int32_t>(old);
                    bestDistance = distance;
                }
            }

            out_newToOld[index] = best;
            if (best >= 0)
                claimed[static_cast<uint32_t>(best)] = 1;
        }
    }

    uint32_t wvCountMappedElements(int32_t const* newToOld, uint32_t count) noexcept
    {
        uint32_t mapped = 0;
        for (uint32_t index = 0; index != count; ++index)
            if (newToOld[index] >= 0)
                ++mapped;
        return mapped;
    }

    float wvSlewAlpha(float dtMs, float tauMs) noexcept
    {
        if (!(dtMs > 0.f))
            return 0.f;
        if (!(tauMs > 0.f))
            return 1.f;
        return 1.f - std::exp(-dtMs / tauMs);
    }

    void wvRunContinuityMapping(wvProgramState& state, wvProgramContinuityIndex target, uint32_t count)
    {
        uint32_t const previous = state.targetCounts[target.value()];
        uint32_t const base = state.program->gaugeOffsets[target];

        // elements of an instance are identified by their position
        state.idScratch.resize(previous + count);
        uint64_t* const oldIds = state.idScratch.data();
        uint64_t* const newIds = oldIds + previous;
        for (uint32_t index = 0; index != previous; ++index)
            oldIds[index] = index;
        for (uint32_t index = 0; index != count; ++index)
            newIds[index] = index;

        wvBuildMappingById(oldIds, previous, newIds, count, state.mapping.data() + base);

        bool const started = state.targetStarted[target.value()] != 0;
        state.targetRebase[target.value()] = started && (previous != count || state.swapped) ? 1 : 0;
    }

    void wvRunContinuityApply(wvProgramState& state, wvProgramContinuityIndex target, float const* input, uint32_t count,
        float* out_values) noexcept
    {
        wvProgramContinuity const& record = state.header().continuity[target];
        uint32_t const base = state.program->gaugeOffsets[target];
        uint32_t const stride = record.stride;
        uint32_t const previous = state.targetCounts[target.value()];

        wvGauge* const gauges = state.gauges.data() + base;
        int32_t const* const mapping = state.mapping.data() + base;

        wvContinuityPolicy const policy = static_cast<wvContinuityPolicy>(record.policy);
        float const alpha = wvSlewAlpha(static_cast<float>(state.deltaMs), record.tauMs);
        float const decayMs = record.decayMs > 0.f ? record.decayMs : state.options.decayMs;
        bool const rebase = state.targetRebase[target.value()] != 0;

        for (uint32_t lane = 0; lane != count; ++lane)
        {
            wvGauge& gauge = gauges[lane];
            float const* const in = input + lane * stride;
            float* const out = out_values + lane * stride;

            bool const carried = mapping[lane] >= 0 && gauge.alive != 0;
            bool const revived = !carried && gauge.retiring != 0 && state.timeMs - gauge.retiredAtMs <= decayMs;
            bool const born = !carried && !revived;

            if (born)
            {
                for (uint32_t component = 0; component != stride; ++component)
                {
                    gauge.current[component] = in[component];
                    gauge.delta[component] = 0.f;
                }
            }
            else if (rebase || revived)
            {
                // hold what was shown last, relative to the new target
                for (uint32_t component = 0; component != stride; ++component)
                    gauge.delta[component] = gauge.current[component] - in[component];
            }

            gauge.alive = 1;
            gauge.retiring = 0;

            for (uint32_t component = 0; component != stride; ++component)
            {
                float value = in[component];
                switch (policy)
                {
                case wvContinuityPolicy::None: break;
                case wvContinuityPolicy::Preserve: value = in[component] + gauge.delta[component]; break;
                case wvContinuityPolicy::Slew:
                    if (!born)
                        value = gauge.current[component] + alpha * (in[component] - gauge.current[component]);
                    break;
                case wvContinuityPolicy::Project:
                    if (!born && !rebase && !revived)
                        gauge.delta[component] *= 1.f - alpha;
                    value = in[component] + gauge.delta[component];
                    break;
                }
                out[component] = value;
                gauge.current[component] = value;
            }
        }

        wvRetirement const retirement = static_cast<wvRetirement>(record.retirement);
        for (uint32_t lane = count; lane < previous; ++lane)
        {
            wvGauge& gauge = gauges[lane];
            if (gauge.alive == 0)
                continue;

            gauge.alive = 0;
            gauge.retiring = retirement == wvRetirement::Decay ? 1 : 0;
            gauge.retiredAtMs = state.timeMs;
        }

        state.targetCounts[target.value()] = count;
        state.targetStarted[target.value()] = 1;
    }
} // namespace weave
