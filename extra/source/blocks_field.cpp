// weave

#include "weave/blocks.hh"
#include "weave/lower.hh"

#include "blocks_internal.hh"

namespace weave {
    namespace {
        constexpr wvInputPortIndex in0{0};
        constexpr wvInputPortIndex in1{1};
        constexpr wvInputPortIndex in2{2};
        constexpr wvInputPortIndex in3{3};
        constexpr wvInputPortIndex in4{4};
        constexpr wvOutputPortIndex out0{0};
        constexpr wvOutputPortIndex out1{1};

        constexpr float twoPi = 6.28318530718f;
        constexpr uint32_t defaultCapacity = 1024;

        // the instance a field block works over, taken from its first output
        wvInstanceId fieldInstance(wvLowerContext& context)
        {
            wvInstanceId const instance = wvOutputInstance(context, out0);
            if (instance == wvInvalidInstanceId)
                context.error("block needs a field input");
            return instance;
        }

        // element index over the largest index; a single element sits at 0
        wvExprId normalizedIndex(wvLowerContext& context, wvInstanceId instance)
        {
            wvExprId const last = context.kernel(wvOpCode::Max,
                context.kernel(wvOpCode::Sub, context.elementCount(instance), context.constant(1.f)), context.constant(1.f));
            return context.kernel(wvOpCode::Div, context.elementIndex(instance), last);
        }

        bool lowerArray(wvLowerContext& context, void*)
        {
            float const capacity = context.paramFloat("capacity", static_cast<float>(defaultCapacity));
            if (!(capacity >= 1.f) || capacity > static_cast<float>(wvMaxInstanceCount))
            {
                context.error("array capacity is out of range");
                return false;
            }

            wvInstanceId const instance = context.nodeInstance();
            if (!context.declareInstance(static_cast<uint32_t>(capacity), context.input(in0)))
                return false;

            context.setOutput(out0, context.elementIndex(instance));
            context.setOutput(out1, context.elementCount(instance));
            return true;
        }

        bool lowerElementIndex(wvLowerContext& context, void*)
        {
            wvInstanceId const instance = fieldInstance(context);
            if (instance == wvInvalidInstanceId)
                return false;

            context.setOutput(out0, context.elementIndex(instance));
            context.setOutput(out1, normalizedIndex(context, instance));
            return true;
        }

        // cells are filled row by row; positions are cell centers in the unit square
        bool lowerGridLayout(wvLowerContext& context, void*)
        {
            wvInstanceId const instance = fieldInstance(context);
            if (instance == wvInvalidInstanceId)
                return false;

            wvExprId const index = context.elementIndex(instance);
            wvExprId const rows = context.input(in1);
            wvExprId const cols = context.input(in2);
            wvExprId const half = context.constant(0.5f);

            wvExprId const column = context.kernel(wvOpCode::Mod, index, cols);
            wvExprId const row = context.kernel(wvOpCode::Floor, context.kernel(wvOpCode::Div, index, cols));
            wvExprId const x = context.kernel(wvOpCode::Div, context.kernel(wvOpCode::Add, column, half), cols);
            wvExprId const y = context.kernel(wvOpCode::Div, context.kernel(wvOpCode::Add, row, half), rows);

            wvExprId const position = context.kernel(wvOpCode::Pack, x, y);
            context.setOutput(out0, position);
            return position != wvInvalidExprId;
        }

        bool lowerCircleLayout(wvLowerContext& context, void*)
        {
            wvInstanceId const instance = fieldInstance(context);
            if (instance == wvInvalidInstanceId)
                return false;

            wvExprId const turn = context.kernel(wvOpCode::Add,
                context.kernel(wvOpCode::Div, context.elementIndex(instance), context.elementCount(instance)), context.input(in2));
            wvExprId const angle = context.kernel(wvOpCode::Mul, turn, context.constant(twoPi));

            wvExprId const direction = context.kernel(wvOpCode::Pack, context.kernel(wvOpCode::Cos, angle), context.kernel(wvOpCode::Sin, angle));
            wvExprId const position = context.kernel(wvOpCode::Add, context.kernel(wvOpCode::Mul, direction, context.input(in1)),
                context.constant(0.5f));

            context.setOutput(out0, position);
            return position != wvInvalidExprId;
        }

        bool lowerLineLayout(wvLowerContext& context, void*)
        {
            wvInstanceId const instance = fieldInstance(context);
            if (instance == wvInvalidInstanceId)
                return false;

            wvExprId const from = context.kernel(wvOpCode::Pack, context.input(in1), context.input(in2));
            wvExprId const to = context.kernel(wvOpCode::Pack, context.input(in3), context.input(in4));
            wvExprId const position = context.kernel(wvOpCode::Mix, from, to, normalizedIndex(context, instance));

            context.setOutput(out0, position);
            return position != wvInvalidExprId;
        }

        bool lowerHsvColor(wvLowerContext& context, void*)
        {
            wvExprId const color = context.kernel(wvOpCode::HsvToRgb, context.input(in0), context.input(in1), context.input(in2));
            context.setOutput(out0, color);
            return color != wvInvalidExprId;
        }

        bool lowerReduce(wvLowerContext& context, wvReduceOp op)
        {
            wvExprId const value = context.reduce(op, context.input(in0));
            context.setOutput(out0, value);
            return value != wvInvalidExprId;
        }

        bool lowerFieldSum(wvLowerContext& context, void*) { return lowerReduce(context, wvReduceOp::Sum); }
        bool lowerFieldMax(wvLowerContext& context, void*) { return lowerReduce(context, wvReduceOp::Max); }

        bool parsePolicy(wvName text, wvContinuityPolicy& out_policy) noexcept
        {
            switch (wvHashName(text.name, text.nameEnd))
            {
            case wvHashName("none"): out_policy = wvContinuityPolicy::None; return true;
            case wvHashName("preserve"): out_policy = wvContinuityPolicy::Preserve; return true;
            case wvHashName("slew"): out_policy = wvContinuityPolicy::Slew; return true;
            case wvHashName("project"): out_policy = wvContinuityPolicy::Project; return true;
            default: return false;
            }
        }

        bool parseRetirement(wvName text, wvRetirement& out_retirement) noexcept
        {
            switch (wvHashName(text.name, text.nameEnd))
            {
            case wvHashName("immediate"): out_retirement = wvRetirement::Immediate; return true;
            case wvHashName("decay"): out_retirement = wvRetirement::Decay; return true;
            default: return false;
            }
        }

        bool lowerSmooth(wvLowerContext& context, void*)
        {
            wvContinuitySpec spec;
            spec.tauMs = context.paramFloat("tau", spec.tauMs);
            spec.decayMs = context.paramFloat("decay", spec.decayMs);

            wvName text;
            if (wvParamText(context, "policy", text) && !parsePolicy(text, spec.policy))
            {
                context.error("unknown continuity policy");
                return false;
            }
            if (wvParamText(context, "retirement", text) && !parseRetirement(text, spec.retirement))
            {
                context.error("unknown retirement mode");
                return false;
            }

            wvExprId const value = context.applyContinuity(context.input(in0), spec);
            context.setOutput(out0, value);
            return value != wvInvalidExprId;
        }

        bool lowerRenderInstances(wvLowerContext& context, void*)
        {
            context.emitRender(context.input(in0), context.input(in1), context.input(in2));
            return true;
        }

        bool lowerProbe(wvLowerContext& context, void*)
        {
            wvName name;
            if (!wvParamText(context, "name", name))
            {
                context.error("probe has no output name");
                return false;
            }

            context.emitOutput(name, context.input(in0));
            return true;
        }

        constexpr wvPortType elementsPort{
            .payload = wvPayload::Float,
            .cardinalityMode = wvAxisMode::Fixed,
            .cardinality = wvCardinalityKind::Many,
        };

        constexpr wvPortType intFieldPort{
            .payload = wvPayload::Int,
            .cardinalityMode = wvAxisMode::Generic,
        };

        constexpr wvPortType positionPort{
            .payload = wvPayload::Vec2,
            .cardinalityMode = wvAxisMode::Generic,
        };

        constexpr wvPortType colorPort{
            .payload = wvPayload::Color,
            .cardinalityMode = wvAxisMode::Generic,
        };

        // accepts a field of any instance, or a signal
        constexpr wvPortType reduceInPort{
            .payloadMode = wvAxisMode::Generic,
            .cardinalityMode = wvAxisMode::Free,
        };

        constexpr wvPortType reduceOutPort{
            .payloadMode = wvAxisMode::Generic,
            .cardinalityMode = wvAxisMode::Fixed,
            .cardinality = wvCardinalityKind::One,
        };

        constexpr wvPortMeta arrayInputs[] = {
            {.name = "count", .type = wvIntSignalPort, .defaultValue = {16.f}},
        };

        constexpr wvPortMeta arrayOutputs[] = {
            {.name = "elements", .type = elementsPort},
            {.name = "count", .type = wvIntSignalPort},
        };

        constexpr wvPortMeta elementsIn[] = {
            {.name = "elements", .type = wvFloatPort},
        };

        constexpr wvPortMeta elementIndexOutputs[] = {
            {.name = "index", .type = intFieldPort},
            {.name = "normalized", .type = wvFloatPort},
        };

        constexpr wvPortMeta gridInputs[] = {
            {.name = "elements", .type = wvFloatPort},
            {.name = "rows", .type = wvIntSignalPort, .defaultValue = {10.f}},
            {.name = "cols", .type = wvIntSignalPort, .defaultValue = {10.f}},
        };

        constexpr wvPortMeta circleInputs[] = {
            {.name = "elements", .type = wvFloatPort},
            {.name = "radius", .type = wvFloatSignalPort, .defaultValue = {0.3f}},
            {.name = "phase", .type = wvFloatSignalPort},
        };

        constexpr wvPortMeta lineInputs[] = {
            {.name = "elements", .type = wvFloatPort},
            {.name = "x0", .type = wvFloatSignalPort, .defaultValue = {0.1f}},
            {.name = "y0", .type = wvFloatSignalPort, .defaultValue = {0.5f}},
            {.name = "x1", .type = wvFloatSignalPort, .defaultValue = {0.9f}},
            {.name = "y1", .type = wvFloatSignalPort, .defaultValue = {0.5f}},
        };

        constexpr wvPortMeta positionOut[] = {
            {.name = "position", .type = positionPort},
        };

        constexpr wvPortMeta hsvInputs[] = {
            {.name = "h", .type = wvFloatPort},
            {.name = "s", .type = wvFloatPort, .defaultValue = {1.f}},
            {.name = "v", .type = wvFloatPort, .defaultValue = {1.f}},
        };

        constexpr wvPortMeta colorOut[] = {
            {.name = "color", .type = colorPort},
        };

        constexpr wvPortMeta reduceInputs[] = {
            {.name = "in", .type = reduceInPort},
        };

        constexpr wvPortMeta reduceOutputs[] = {
            {.name = "out", .type = reduceOutPort},
        };

        constexpr wvPortMeta smoothInputs[] = {
            {.name = "in", .type = wvGenericPort},
        };

        constexpr wvPortMeta smoothOutputs[] = {
            {.name = "out", .type = wvGenericPort},
        };

        // sizes and colors may be signals shared by every instance
        constexpr wvPortMeta renderInputs[] = {
            {.name = "position", .type = {.payload = wvPayload::Vec2, .cardinalityMode = wvAxisMode::Free}},
            {.name = "color", .type = {.payload = wvPayload::Color, .cardinalityMode = wvAxisMode::Free}, .defaultValue = {1.f, 1.f, 1.f, 1.f}},
            {.name = "size", .type = {.payload = wvPayload::Float, .cardinalityMode = wvAxisMode::Free}, .defaultValue = {0.01f}},
        };

        constexpr wvPortMeta probeInputs[] = {
            {.name = "in", .type = wvAnyPort},
        };

        constexpr wvNodeCompileMeta fieldBlocks[] = {
            {
                .typeId = wvArrayBlockId,
                .name = "Array",
                .inputs = arrayInputs,
                .inputCount = wvTableCount(arrayInputs),
                .outputs = arrayOutputs,
                .outputCount = wvTableCount(arrayOutputs),
                .createsInstance = true,
                .lower = lowerArray,
            },
            {
                .typeId = wvElementIndexBlockId,
                .name = "ElementIndex",
                .inputs = elementsIn,
                .inputCount = wvTableCount(elementsIn),
                .outputs = elementIndexOutputs,
                .outputCount = wvTableCount(elementIndexOutputs),
                .lower = lowerElementIndex,
            },
            {
                .typeId = wvGridLayoutBlockId,
                .name = "GridLayout",
                .inputs = gridInputs,
                .inputCount = wvTableCount(gridInputs),
                .outputs = positionOut,
                .outputCount = wvTableCount(positionOut),
                .lower = lowerGridLayout,
            },
            {
                .typeId = wvCircleLayoutBlockId,
                .name = "CircleLayout",
                .inputs = circleInputs,
                .inputCount = wvTableCount(circleInputs),
                .outputs = positionOut,
                .outputCount = wvTableCount(positionOut),
                .lower = lowerCircleLayout,
            },
            {
                .typeId = wvLineLayoutBlockId,
                .name = "LineLayout",
                .inputs = lineInputs,
                .inputCount = wvTableCount(lineInputs),
                .outputs = positionOut,
                .outputCount = wvTableCount(positionOut),
                .lower = lowerLineLayout,
            },
            {
                .typeId = wvHsvColorBlockId,
                .name = "HsvColor",
                .inputs = hsvInputs,
                .inputCount = wvTableCount(hsvInputs),
                .outputs = colorOut,
                .outputCount = wvTableCount(colorOut),
                .lower = lowerHsvColor,
            },
            {
                .typeId = wvFieldSumBlockId,
                .name = "FieldSum",
                .inputs = reduceInputs,
                .inputCount = wvTableCount(reduceInputs),
                .outputs = reduceOutputs,
                .outputCount = wvTableCount(reduceOutputs),
                .hasDefaultPayload = true,
                .lower = lowerFieldSum,
            },
            {
                .typeId = wvFieldMaxBlockId,
                .name = "FieldMax",
                .inputs = reduceInputs,
                .inputCount = wvTableCount(reduceInputs),
                .outputs = reduceOutputs,
                .outputCount = wvTableCount(reduceOutputs),
                .hasDefaultPayload = true,
                .lower = lowerFieldMax,
            },
            {
                .typeId = wvSmoothBlockId,
                .name = "Smooth",
                .inputs = smoothInputs,
                .inputCount = wvTableCount(smoothInputs),
                .outputs = smoothOutputs,
                .outputCount = wvTableCount(smoothOutputs),
                .hasDefaultPayload = true,
                .lower = lowerSmooth,
            },
            {
                .typeId = wvRenderInstancesBlockId,
                .name = "RenderInstances",
                .inputs = renderInputs,
                .inputCount = wvTableCount(renderInputs),
                .lower = lowerRenderInstances,
            },
            {
                .typeId = wvProbeBlockId,
                .name = "Probe",
                .inputs = probeInputs,
                .inputCount = wvTableCount(probeInputs),
                .lower = lowerProbe,
            },
        };
    } // namespace

    wvBlockTable wvFieldBlocks() noexcept { return {.blocks = fieldBlocks, .count = wvTableCount(fieldBlocks)}; }
} // namespace weave
