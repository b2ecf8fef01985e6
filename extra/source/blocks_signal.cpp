// weave

#include "weave/blocks.hh"
#include "weave/lower.hh"

#include "blocks_internal.hh"

namespace weave {
    namespace {
        constexpr wvInputPortIndex in0{0};
        constexpr wvInputPortIndex in1{1};
        constexpr wvOutputPortIndex out0{0};
        constexpr wvOutputPortIndex out1{1};

        bool lowerConst(wvLowerContext& context, void*)
        {
            uint32_t const stride = wvOutputStride(context, out0);

            float values[wvMaxStride] = {};
            wvParamComponents(context, "value", stride, values);

            wvExprId const value = context.constant(values, stride);
            context.setOutput(out0, value);
            return value != wvInvalidExprId;
        }

        bool lowerTime(wvLowerContext& context, void*)
        {
            context.setOutput(out0, context.time());
            context.setOutput(out1, context.deltaTime());
            return true;
        }

        bool lowerExternalInput(wvLowerContext& context, void*)
        {
            wvName name;
            if (!wvParamText(context, "name", name))
            {
                context.error("external input has no channel name");
                return false;
            }

            uint32_t const stride = wvOutputStride(context, out0);
            float defaults[wvMaxStride] = {};
            wvParamComponents(context, "value", stride, defaults);

            wvExprId const value = context.external(name, defaults, stride);
            context.setOutput(out0, value);
            return value != wvInvalidExprId;
        }

        // folds every connection of the vararg input left to right
        bool lowerFold(wvLowerContext& context, wvOpCode op)
        {
            uint32_t const count = context.inputElementCount(in0);
            if (count == 0)
            {
                context.error(wvCompileErrorCode::VarargConnectionCount, "operator has no operands");
                return false;
            }

            wvExprId result = context.input(in0, 0);
            for (uint32_t element = 1; element != count; ++element)
                result = context.kernel(op, result, context.input(in0, element));

            context.setOutput(out0, result);
            return result != wvInvalidExprId;
        }

        bool lowerBinary(wvLowerContext& context, wvOpCode op)
        {
            wvExprId const result = context.kernel(op, context.input(in0), context.input(in1));
            context.setOutput(out0, result);
            return result != wvInvalidExprId;
        }

        bool lowerUnary(wvLowerContext& context, wvOpCode op)
        {
            wvExprId const result = context.kernel(op, context.input(in0));
            context.setOutput(out0, result);
            return result != wvInvalidExprId;
        }

        bool lowerAdd(wvLowerContext& context, void*) { return lowerFold(context, wvOpCode::Add); }
        bool lowerMultiply(wvLowerContext& context, void*) { return lowerFold(context, wvOpCode::Mul); }
        bool lowerSubtract(wvLowerContext& context, void*) { return lowerBinary(context, wvOpCode::Sub); }
        bool lowerDivide(wvLowerContext& context, void*) { return lowerBinary(context, wvOpCode::Div); }
        bool lowerModulo(wvLowerContext& context, void*) { return lowerBinary(context, wvOpCode::Mod); }
        bool lowerSin(wvLowerContext& context, void*) { return lowerUnary(context, wvOpCode::Sin); }
        bool lowerCos(wvLowerContext& context, void*) { return lowerUnary(context, wvOpCode::Cos); }

        constexpr wvPortMeta genericOut[] = {
            {.name = "out", .type = wvGenericPort},
        };

        constexpr wvPortMeta floatOut[] = {
            {.name = "out", .type = wvFloatPort},
        };

        constexpr wvPortMeta constOutputs[] = {
            {.name = "out", .type = {.payloadMode = wvAxisMode::Generic, .cardinalityMode = wvAxisMode::Fixed}},
        };

        constexpr wvPortMeta timeOutputs[] = {
            {.name = "ms", .type = wvFloatSignalPort},
            {.name = "dt", .type = wvFloatSignalPort},
        };

        constexpr wvPortMeta varargInputs[] = {
            {.name = "in", .type = wvGenericPort, .vararg = true, .minConnections = 1},
        };

        constexpr wvPortMeta subtractInputs[] = {
            {.name = "a", .type = wvGenericPort},
            {.name = "b", .type = wvGenericPort},
        };

        // dividing by the default leaves a unchanged
        constexpr wvPortMeta divideInputs[] = {
            {.name = "a", .type = wvGenericPort},
            {.name = "b", .type = wvGenericPort, .defaultValue = {1.f, 1.f, 1.f, 1.f}},
        };

        constexpr wvPortMeta unaryInputs[] = {
            {.name = "in", .type = wvFloatPort},
        };

        constexpr wvPortMeta expressionInputs[] = {
            {.name = "in", .type = wvFloatPort, .vararg = true, .maxConnections = 8},
        };

        constexpr wvNodeCompileMeta sourceBlocks[] = {
            {
                .typeId = wvConstBlockId,
                .name = "Const",
                .outputs = constOutputs,
                .outputCount = wvTableCount(constOutputs),
                .hasDefaultPayload = true,
                .lower = lowerConst,
            },
            {
                .typeId = wvTimeBlockId,
                .name = "Time",
                .outputs = timeOutputs,
                .outputCount = wvTableCount(timeOutputs),
                .lower = lowerTime,
            },
            {
                .typeId = wvExternalInputBlockId,
                .name = "ExternalInput",
                .outputs = constOutputs,
                .outputCount = wvTableCount(constOutputs),
                .hasDefaultPayload = true,
                .lower = lowerExternalInput,
            },
        };

        constexpr wvNodeCompileMeta mathBlocks[] = {
            {
                .typeId = wvAddBlockId,
                .name = "Add",
                .inputs = varargInputs,
                .inputCount = wvTableCount(varargInputs),
                .outputs = genericOut,
                .outputCount = wvTableCount(genericOut),
                .hasDefaultPayload = true,
                .lower = lowerAdd,
            },
            {
                .typeId = wvSubtractBlockId,
                .name = "Subtract",
                .inputs = subtractInputs,
                .inputCount = wvTableCount(subtractInputs),
                .outputs = genericOut,
                .outputCount = wvTableCount(genericOut),
                .hasDefaultPayload = true,
                .lower = lowerSubtract,
            },
            {
                .typeId = wvMultiplyBlockId,
                .name = "Multiply",
                .inputs = varargInputs,
                .inputCount = wvTableCount(varargInputs),
                .outputs = genericOut,
                .outputCount = wvTableCount(genericOut),
                .hasDefaultPayload = true,
                .lower = lowerMultiply,
            },
            {
                .typeId = wvDivideBlockId,
                .name = "Divide",
                .inputs = divideInputs,
                .inputCount = wvTableCount(divideInputs),
                .outputs = genericOut,
                .outputCount = wvTableCount(genericOut),
                .hasDefaultPayload = true,
                .lower = lowerDivide,
            },
            {
                .typeId = wvModuloBlockId,
                .name = "Modulo",
                .inputs = divideInputs,
                .inputCount = wvTableCount(divideInputs),
                .outputs = genericOut,
                .outputCount = wvTableCount(genericOut),
                .hasDefaultPayload = true,
                .lower = lowerModulo,
            },
            {
                .typeId = wvSinBlockId,
                .name = "Sin",
                .inputs = unaryInputs,
                .inputCount = wvTableCount(unaryInputs),
                .outputs = floatOut,
                .outputCount = wvTableCount(floatOut),
                .lower = lowerSin,
            },
            {
                .typeId = wvCosBlockId,
                .name = "Cos",
                .inputs = unaryInputs,
                .inputCount = wvTableCount(unaryInputs),
                .outputs = floatOut,
                .outputCount = wvTableCount(floatOut),
                .lower = lowerCos,
            },
            {
                .typeId = wvExpressionBlockId,
                .name = "Expression",
                .inputs = expressionInputs,
                .inputCount = wvTableCount(expressionInputs),
                .outputs = floatOut,
                .outputCount = wvTableCount(floatOut),
                .lower = wvLowerExpressionBlock,
            },
        };
    } // namespace

    wvBlockTable wvSourceBlocks() noexcept { return {.blocks = sourceBlocks, .count = wvTableCount(sourceBlocks)}; }
    wvBlockTable wvMathBlocks() noexcept { return {.blocks = mathBlocks, .count = wvTableCount(mathBlocks)}; }
} // namespace weave
