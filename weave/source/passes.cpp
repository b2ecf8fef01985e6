// weave

#include "weave/lower.hh"

#include "passes.hh"
#include "utility.hh"

namespace weave {
    namespace {
        constexpr wvPortType genericType{
            .payloadMode = wvAxisMode::Generic,
            .cardinalityMode = wvAxisMode::Generic,
            .temporalityMode = wvAxisMode::Generic,
        };

        constexpr wvPortMeta defaultSourceOutputs[] = {
            {.name = "out", .type = genericType},
        };

        constexpr wvPortMeta wireStateInputs[] = {
            {.name = "in", .type = genericType},
        };

        constexpr wvPortMeta wireStateOutputs[] = {
            {.name = "out", .type = genericType},
        };

        bool lowerDefaultSource(wvLowerContext& context, void*)
        {
            wvCanonicalType const type = context.outputType(wvOutputPortIndex{0});
            uint32_t const stride = wvPayloadStride(type.payload);

            float values[wvMaxStride] = {};
            wvParamValue param;
            if (context.findParam("value", param))
            {
                // a single value fills every component
                for (uint32_t index = 0; index != stride; ++index)
                    values[index] = param.count == 1 ? param.values[0] : param.values[index];
            }

            wvExprId const value = context.constant(values, stride);
            context.setOutput(wvOutputPortIndex{0}, value);
            return value != wvInvalidExprId;
        }

        bool lowerWireState(wvLowerContext& context, void*)
        {
            wvCanonicalType const type = context.outputType(wvOutputPortIndex{0});
            uint32_t const stride = wvPayloadStride(type.payload);

            float initial[wvMaxStride] = {};
            wvParamValue param;
            if (context.findParam("initial", param))
                wvCopyFloats(initial, param.values, stride);

            wvInstanceId const perElement = wvIsField(type) ? type.extent.cardinality.value().instance : wvInvalidInstanceId;
            wvStateId const state = context.allocState("state", initial, stride, perElement);
            if (state == wvInvalidStateId)
                return false;

            context.setOutput(wvOutputPortIndex{0}, context.readState(state));
            context.writeState(state, context.input(wvInputPortIndex{0}));
            return true;
        }

        constexpr wvNodeCompileMeta defaultSourceMeta{
            .typeId = wvDefaultSourceTypeId,
            .name = wvDefaultSourceTypeName,
            .outputs = defaultSourceOutputs,
            .outputCount = wvCountOf(defaultSourceOutputs),
            .hasDefaultPayload = true,
            .defaultPayload = wvPayload::Float,
            .lower = lowerDefaultSource,
        };

        constexpr wvNodeCompileMeta wireStateMeta{
            .typeId = wvWireStateTypeId,
            .name = wvWireStateTypeName,
            .inputs = wireStateInputs,
            .inputCount = wvCountOf(wireStateInputs),
            .outputs = wireStateOutputs,
            .outputCount = wvCountOf(wireStateOutputs),
            .hasDefaultPayload = true,
            .defaultPayload = wvPayload::Float,
            .stateful = true,
            .lower = lowerWireState,
        };
    } // namespace

    bool wvLookupBuiltinNode(wvNodeTypeId typeId, wvNodeCompileMeta& out_meta) noexcept
    {
        if (typeId == wvDefaultSourceTypeId)
        {
            out_meta = defaultSourceMeta;
            return true;
        }
        if (typeId == wvWireStateTypeId)
        {
            out_meta = wireStateMeta;
            return true;
        }
        return false;
    }

    bool wvPassContext::lookupNode(wvNodeTypeId typeId, wvNodeCompileMeta& out_meta) const noexcept
    {
        if (wvLookupBuiltinNode(typeId, out_meta))
            return true;
        return host_.lookupNodeType(typeId, out_meta);
    }

    bool wvPassContext::lookupComposite(wvNodeTypeId typeId, wvCompositeMeta& out_meta) const noexcept
    {
        if (typeId == wvDefaultSourceTypeId || typeId == wvWireStateTypeId)
            return false;
        return host_.lookupComposite(typeId, out_meta);
    }

    bool wvPassContext::error(wvCompileError const& error)
    {
        errors_.pushBack(error);
        return false;
    }
} // namespace weave
