// weave

#include "weave/blocks.hh"
#include "weave/lower.hh"

#include "blocks_internal.hh"

namespace weave {
    namespace {
        constexpr wvInputPortIndex in0{0};
        constexpr wvOutputPortIndex out0{0};

        // ints and bools are stored as floats already
        bool lowerPassThrough(wvLowerContext& context, void*)
        {
            wvExprId const value = context.input(in0);
            context.setOutput(out0, value);
            return value != wvInvalidExprId;
        }

        bool lowerFloatToInt(wvLowerContext& context, void*)
        {
            wvExprId const value = context.kernel(wvOpCode::ToInt, context.input(in0));
            context.setOutput(out0, value);
            return value != wvInvalidExprId;
        }

        bool lowerBroadcast(wvLowerContext& context, void*)
        {
            wvInstanceId const instance = wvOutputInstance(context, out0);
            if (instance == wvInvalidInstanceId)
            {
                context.error("broadcast does not feed a field");
                return false;
            }

            wvExprId const value = context.broadcast(context.input(in0), instance);
            context.setOutput(out0, value);
            return value != wvInvalidExprId;
        }

        constexpr wvPortType passCardinality(wvPayload payload) noexcept
        {
            return {
                .payload = payload,
                .cardinalityMode = wvAxisMode::Generic,
                .temporalityMode = wvAxisMode::Generic,
            };
        }

        constexpr wvPortMeta intIn[] = {
            {.name = "in", .type = passCardinality(wvPayload::Int)},
        };

        constexpr wvPortMeta floatIn[] = {
            {.name = "in", .type = passCardinality(wvPayload::Float)},
        };

        constexpr wvPortMeta boolIn[] = {
            {.name = "in", .type = {.payload = wvPayload::Bool, .cardinalityMode = wvAxisMode::Generic, .temporalityMode = wvAxisMode::Free}},
        };

        constexpr wvPortMeta floatOut[] = {
            {.name = "out", .type = passCardinality(wvPayload::Float)},
        };

        // an event read as a level is continuous
        constexpr wvPortMeta continuousFloatOut[] = {
            {.name = "out", .type = {.payload = wvPayload::Float, .cardinalityMode = wvAxisMode::Generic}},
        };

        constexpr wvPortMeta intOut[] = {
            {.name = "out", .type = passCardinality(wvPayload::Int)},
        };

        constexpr wvPortMeta signalIn[] = {
            {.name = "in",
                .type = {.payloadMode = wvAxisMode::Generic,
                    .cardinalityMode = wvAxisMode::Fixed,
                    .cardinality = wvCardinalityKind::One,
                    .temporalityMode = wvAxisMode::Generic}},
        };

        constexpr wvPortMeta fieldOut[] = {
            {.name = "out", .type = {.payloadMode = wvAxisMode::Generic, .cardinalityMode = wvAxisMode::Free, .temporalityMode = wvAxisMode::Generic}},
        };

        constexpr wvNodeCompileMeta adapterBlocks[] = {
            {
                .typeId = wvIntToFloatBlockId,
                .name = "IntToFloat",
                .inputs = intIn,
                .inputCount = wvTableCount(intIn),
                .outputs = floatOut,
                .outputCount = wvTableCount(floatOut),
                .lower = lowerPassThrough,
            },
            {
                .typeId = wvBoolToFloatBlockId,
                .name = "BoolToFloat",
                .inputs = boolIn,
                .inputCount = wvTableCount(boolIn),
                .outputs = continuousFloatOut,
                .outputCount = wvTableCount(continuousFloatOut),
                .lower = lowerPassThrough,
            },
            {
                .typeId = wvFloatToIntBlockId,
                .name = "FloatToInt",
                .inputs = floatIn,
                .inputCount = wvTableCount(floatIn),
                .outputs = intOut,
                .outputCount = wvTableCount(intOut),
                .lower = lowerFloatToInt,
            },
            {
                .typeId = wvBroadcastBlockId,
                .name = "Broadcast",
                .inputs = signalIn,
                .inputCount = wvTableCount(signalIn),
                .outputs = fieldOut,
                .outputCount = wvTableCount(fieldOut),
                .hasDefaultPayload = true,
                .lower = lowerBroadcast,
            },
        };

        constexpr wvAdapterRule adapterRules[] = {
            {
                .name = "BoolToFloat",
                .from = {.matchPayload = true, .payload = wvPayload::Bool},
                .to = {.matchPayload = true, .payload = wvPayload::Float, .matchTemporality = true, .temporality = wvTemporality::Continuous},
                .adapterTypeId = wvBoolToFloatBlockId,
            },
            {
                .name = "Broadcast",
                .from = {.matchCardinality = true, .cardinality = wvCardinalityKind::One},
                .to = {.matchCardinality = true, .cardinality = wvCardinalityKind::Many},
                .adapterTypeId = wvBroadcastBlockId,
            },
            {
                .name = "FloatToInt",
                .from = {.matchPayload = true, .payload = wvPayload::Float},
                .to = {.matchPayload = true, .payload = wvPayload::Int},
                .adapterTypeId = wvFloatToIntBlockId,
            },
            {
                .name = "IntToFloat",
                .from = {.matchPayload = true, .payload = wvPayload::Int},
                .to = {.matchPayload = true, .payload = wvPayload::Float},
                .adapterTypeId = wvIntToFloatBlockId,
            },
        };
    } // namespace

    wvBlockTable wvAdapterBlocks() noexcept { return {.blocks = adapterBlocks, .count = wvTableCount(adapterBlocks)}; }

    wvAdapterRule const* wvStandardAdapterRules(uint32_t& out_count) noexcept
    {
        out_count = wvTableCount(adapterRules);
        return adapterRules;
    }
} // namespace weave
