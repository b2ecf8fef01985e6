// weave

#include "weave/blocks.hh"
#include "weave/lower.hh"

#include "blocks_internal.hh"

namespace weave {
    namespace {
        constexpr wvInputPortIndex in0{0};
        constexpr wvInputPortIndex in1{1};
        constexpr wvOutputPortIndex out0{0};

        // a state shaped like the node's first output: per element on fields
        wvStateId allocOutputState(wvLowerContext& context, char const* key, float const* initial)
        {
            return context.allocState(key, initial, wvOutputStride(context, out0), wvOutputInstance(context, out0));
        }

        bool lowerUnitDelay(wvLowerContext& context, void*)
        {
            float initial[wvMaxStride] = {};
            wvParamComponents(context, "initial", wvOutputStride(context, out0), initial);

            wvStateId const state = allocOutputState(context, "delay", initial);
            if (state == wvInvalidStateId)
                return false;

            context.setOutput(out0, context.readState(state));
            context.writeState(state, context.input(in0));
            return true;
        }

        // outputs the total before this frame's input; a raised reset restarts from zero
        bool lowerAccumulator(wvLowerContext& context, void*)
        {
            wvStateId const state = allocOutputState(context, "sum", nullptr);
            if (state == wvInvalidStateId)
                return false;

            wvExprId const previous = context.readState(state);
            wvExprId const sum = context.kernel(wvOpCode::Add, previous, context.input(in0));
            wvExprId const next = context.kernel(wvOpCode::Select, context.input(in1), context.constant(0.f), sum);

            context.setOutput(out0, previous);
            context.writeState(state, next);
            return next != wvInvalidExprId;
        }

        bool lowerLag(wvLowerContext& context, void*)
        {
            wvStateId const state = allocOutputState(context, "lag", nullptr);
            if (state == wvInvalidStateId)
                return false;

            wvExprId const tau = context.input(in1);
            wvExprId const step = context.kernel(wvOpCode::Clamp, context.kernel(wvOpCode::Div, context.deltaTime(), tau),
                context.constant(0.f), context.constant(1.f));
            // a non-positive time constant follows the input directly
            wvExprId const alpha =
                context.kernel(wvOpCode::Select, context.kernel(wvOpCode::Greater, tau, context.constant(0.f)), step, context.constant(1.f));

            wvExprId const value = context.kernel(wvOpCode::Mix, context.readState(state), context.input(in0), alpha);
            context.setOutput(out0, value);
            context.writeState(state, value);
            return value != wvInvalidExprId;
        }

        bool lowerSampleHold(wvLowerContext& context, void*)
        {
            wvStateId const state = allocOutputState(context, "held", nullptr);
            if (state == wvInvalidStateId)
                return false;

            wvExprId const value = context.kernel(wvOpCode::Select, context.input(in1), context.input(in0), context.readState(state));
            context.setOutput(out0, value);
            context.writeState(state, value);
            return value != wvInvalidExprId;
        }

        bool lowerEdgeDetect(wvLowerContext& context, void*)
        {
            wvExprId const fired = context.emitEvent("edge", context.input(in0));
            context.setOutput(out0, fired);
            return fired != wvInvalidExprId;
        }

        // fires on every frame that enters a new period
        bool lowerPulse(wvLowerContext& context, void*)
        {
            float const initial = 0.f;
            wvStateId const state = context.allocState("period", &initial, 1);
            if (state == wvInvalidStateId)
                return false;

            wvExprId const period = context.kernel(wvOpCode::Floor, context.kernel(wvOpCode::Div, context.time(), context.input(in0)));
            wvExprId const fired = context.kernel(wvOpCode::Not, context.kernel(wvOpCode::Equal, period, context.readState(state)));

            context.setOutput(out0, fired);
            context.writeState(state, period);
            return fired != wvInvalidExprId;
        }

        constexpr wvPortMeta genericIn[] = {
            {.name = "in", .type = wvGenericPort},
        };

        constexpr wvPortMeta genericOut[] = {
            {.name = "out", .type = wvGenericPort},
        };

        constexpr wvPortMeta eventOut[] = {
            {.name = "out", .type = wvEventPort},
        };

        constexpr wvPortMeta accumulatorInputs[] = {
            {.name = "in", .type = wvGenericPort},
            {.name = "reset", .type = wvEventPort},
        };

        constexpr wvPortMeta lagInputs[] = {
            {.name = "in", .type = wvGenericPort},
            {.name = "tau", .type = wvFloatSignalPort, .defaultValue = {100.f}},
        };

        constexpr wvPortMeta sampleHoldInputs[] = {
            {.name = "in", .type = wvGenericPort},
            {.name = "trigger", .type = wvEventPort},
        };

        constexpr wvPortMeta edgeDetectInputs[] = {
            {.name = "in", .type = wvFloatSignalPort},
        };

        constexpr wvPortMeta pulseInputs[] = {
            {.name = "period", .type = wvFloatSignalPort, .defaultValue = {1000.f}},
        };

        constexpr wvNodeCompileMeta stateBlocks[] = {
            {
                .typeId = wvUnitDelayBlockId,
                .name = "UnitDelay",
                .inputs = genericIn,
                .inputCount = wvTableCount(genericIn),
                .outputs = genericOut,
                .outputCount = wvTableCount(genericOut),
                .hasDefaultPayload = true,
                .stateful = true,
                .lower = lowerUnitDelay,
            },
            {
                .typeId = wvAccumulatorBlockId,
                .name = "Accumulator",
                .inputs = accumulatorInputs,
                .inputCount = wvTableCount(accumulatorInputs),
                .outputs = genericOut,
                .outputCount = wvTableCount(genericOut),
                .hasDefaultPayload = true,
                .stateful = true,
                .lower = lowerAccumulator,
            },
            {
                .typeId = wvLagBlockId,
                .name = "Lag",
                .inputs = lagInputs,
                .inputCount = wvTableCount(lagInputs),
                .outputs = genericOut,
                .outputCount = wvTableCount(genericOut),
                .hasDefaultPayload = true,
                .lower = lowerLag,
            },
            {
                .typeId = wvSampleHoldBlockId,
                .name = "SampleHold",
                .inputs = sampleHoldInputs,
                .inputCount = wvTableCount(sampleHoldInputs),
                .outputs = genericOut,
                .outputCount = wvTableCount(genericOut),
                .hasDefaultPayload = true,
                .lower = lowerSampleHold,
            },
            {
                .typeId = wvEdgeDetectBlockId,
                .name = "EdgeDetect",
                .inputs = edgeDetectInputs,
                .inputCount = wvTableCount(edgeDetectInputs),
                .outputs = eventOut,
                .outputCount = wvTableCount(eventOut),
                .lower = lowerEdgeDetect,
            },
            {
                .typeId = wvPulseBlockId,
                .name = "Pulse",
                .inputs = pulseInputs,
                .inputCount = wvTableCount(pulseInputs),
                .outputs = eventOut,
                .outputCount = wvTableCount(eventOut),
                .lower = lowerPulse,
            },
        };
    } // namespace

    wvBlockTable wvStateBlocks() noexcept { return {.blocks = stateBlocks, .count = wvTableCount(stateBlocks)}; }
} // namespace weave
