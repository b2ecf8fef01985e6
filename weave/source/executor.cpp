// weave

#include "weave/fatal.hh"
#include "weave/log.hh"
#include "weave/runtime.hh"

#include "evaluate.hh"
#include "frame_output.hh"
#include "state.hh"

#include <spdlog/spdlog.h>

#include <cstring>

namespace weave {
    namespace {
        class FrameExecutor
        {
        public:
            FrameExecutor(wvProgramState& state, wvFrameOutputBuffer& output) noexcept
                : state_(state), header_(state.header()), output_(output), evaluator_(state), stamp_(wvFrameStamp(state))
            {
            }

            void runPhase1();
            void runPhase2();

        private:
            float* slot(wvProgramSlotIndex index) noexcept { return state_.scratch.data() + state_.program->slotOffsets[index]; }
            void store(wvProgramSlotIndex index, float const* values, uint32_t lanes);
            float const* written(wvProgramSlotIndex index, char const* message);

            wvProgramState& state_;
            wvProgramHeader const& header_;
            wvFrameOutputBuffer& output_;
            wvFrameEvaluator evaluator_;
            uint64_t stamp_ = 0;
        };

        void FrameExecutor::store(wvProgramSlotIndex index, float const* values, uint32_t lanes)
        {
            uint32_t const stride = header_.slots[index].stride;
            float* const target = slot(index);
            if (target != values && lanes != 0)
                std::memcpy(target, values, lanes * stride * sizeof(float));

            state_.slotLanes[index.value()] = lanes;
            state_.slotStamps[index.value()] = stamp_;
        }

        float const* FrameExecutor::written(wvProgramSlotIndex index, char const* message)
        {
            if (state_.slotStamps[index.value()] != stamp_)
                wvFatal(wvRuntimeErrorCode::PhaseViolation, message);
            return slot(index);
        }

        void FrameExecutor::runPhase1()
        {
            for (wvProgramStep const& step : header_.phase1)
            {
                switch (step.kind)
                {
                case wvStepKind::EvalSignal:
                case wvStepKind::EvalEvent:
                case wvStepKind::MaterializeField: {
                    float const* const values = evaluator_.evaluate(step.expr);
                    store(step.slot, values, evaluator_.lanes(header_.slots[step.slot].instance));
                    break;
                }
                case wvStepKind::WriteSlot: {
                    wvProgramOutput const& target = header_.outputs[step.target];
                    float const* const values = written(step.slot, "output read before its slot was written");
                    output_.addOutput(target.nameHash, header_.slots[step.slot].stride, state_.slotLanes[step.slot.value()], values);
                    break;
                }
                case wvStepKind::BuildContinuityMapping: {
                    wvProgramContinuityIndex const target{step.target};
                    wvProgramContinuity const& record = header_.continuity[target];
                    wvRunContinuityMapping(state_, target, evaluator_.instanceCount(record.instance));
                    break;
                }
                case wvStepKind::ApplyContinuity: {
                    wvProgramContinuityIndex const target{step.target};
                    wvProgramContinuity const& record = header_.continuity[target];
                    float const* const input = written(record.inputSlot, "continuity input read before it was written");
                    uint32_t const count = state_.slotLanes[record.inputSlot.value()];

                    wvRunContinuityApply(state_, target, input, count, slot(record.outputSlot));
                    store(record.outputSlot, slot(record.outputSlot), count);
                    break;
                }
                case wvStepKind::RenderEmit: {
                    wvProgramRender const& render = header_.renders[step.target];
                    float const* const positions = written(render.positionSlot, "render positions read before they were written");
                    float const* const colors = written(render.colorSlot, "render colors read before they were written");
                    float const* const sizes = written(render.sizeSlot, "render sizes read before they were written");
                    output_.addRenderPass(state_.slotLanes[render.positionSlot.value()], positions, colors, sizes);
                    break;
                }
                case wvStepKind::WriteStateScalar:
                case wvStepKind::WriteStateField:
                    SPDLOG_LOGGER_CRITICAL(wvLog(), "state write scheduled in phase 1");
                    wvFatal(wvRuntimeErrorCode::PhaseViolation, "state write scheduled in phase 1");
                }
            }
        }

        void FrameExecutor::runPhase2()
        {
            for (wvProgramStep const& step : header_.phase2)
            {
                if (!wvIsStateWrite(step.kind))
                {
                    SPDLOG_LOGGER_CRITICAL(wvLog(), "phase 2 holds a step that is not a state write");
                    wvFatal(wvRuntimeErrorCode::PhaseViolation, "phase 2 holds a step that is not a state write");
                }

                float const* const values = written(step.slot, "state written from a slot not produced this frame");

                uint32_t const index = step.target;
                wvProgramStateRecord const& record = header_.states[wvProgramStateIndex{index}];
                float* const target = state_.state.data() + state_.program->stateOffsets[wvProgramStateIndex{index}];

                if (step.kind == wvStepKind::WriteStateScalar)
                {
                    std::memcpy(target, values, record.stride * sizeof(float));
                    state_.committed[index] = 1;
                    continue;
                }

                // lanes past the live count fall back to the initial value
                uint32_t const lanes = state_.slotLanes[step.slot.value()];
                if (lanes != 0)
                    std::memcpy(target, values, lanes * record.stride * sizeof(float));
                if (state_.committed[index] > lanes)
                    state_.resetLanes(index, lanes, state_.committed[index]);
                state_.committed[index] = lanes;
            }
        }

        void sampleInputs(wvProgramState& state, wvFrameInputs const& inputs) noexcept
        {
            wvProgramHeader const& header = state.header();
            for (uint32_t index = 0; index != header.externals.count; ++index)
            {
                wvProgramExternal const& external = header.externals[wvProgramExternalIndex{index}];
                for (uint32_t input = 0; input != inputs.count; ++input)
                {
                    if (inputs.values[input].nameHash == external.nameHash)
                        std::memcpy(state.externals.data() + index * 4, inputs.values[input].values, sizeof(float) * 4);
                }
            }
        }
    } // namespace

    bool wvAdvanceFrame(wvProgram const* program, wvProgramState& state, wvFrameInputs const& inputs, double timeMs,
        wvFrameOutput& out_frame, wvRuntimeErrorCode* out_error)
    {
        auto const fail = [out_error](wvRuntimeErrorCode code) {
            if (out_error != nullptr)
                *out_error = code;
            return false;
        };

        if (program == nullptr)
            return fail(wvRuntimeErrorCode::NoProgram);
        if (program != state.program)
            return fail(wvRuntimeErrorCode::InvalidProgram);
        if (inputs.count != 0 && inputs.values == nullptr)
            return fail(wvRuntimeErrorCode::InvalidProgram);

        if (!(timeMs >= 0.0) || (state.started && timeMs < state.timeMs))
        {
            SPDLOG_LOGGER_WARN(wvLog(), "rejected frame at {}ms; the previous frame ran at {}ms", timeMs, state.timeMs);
            return fail(wvRuntimeErrorCode::NonMonotonicTime);
        }

        if (!state.started)
        {
            state.startMs = timeMs;
            state.deltaMs = 0.0;
        }
        else
        {
            double const delta = timeMs - state.timeMs;
            double const limit = state.options.maxFrameDeltaMs;
            state.deltaMs = delta < limit ? delta : limit;
        }
        state.timeMs = timeMs;

        sampleInputs(state, inputs);

        wvFrameOutputBuffer& output = static_cast<wvFrameOutputBuffer&>(out_frame);
        output.begin(timeMs, state.frameIndex);

        FrameExecutor executor(state, output);
        executor.runPhase1();
        executor.runPhase2();

        ++state.frameIndex;
        state.started = true;
        state.swapped = false;

        if (out_error != nullptr)
            *out_error = wvRuntimeErrorCode::None;
        return true;
    }
} // namespace weave
