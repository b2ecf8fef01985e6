// weave

#pragma once

#include "weave/blocks.hh"
#include "weave/canonical_type.hh"
#include "weave/compile_types.hh"
#include "weave/lower.hh"

#include <cstdint>

namespace weave {
    template <typename T, uint32_t Count>
    constexpr uint32_t wvTableCount(T (&)[Count]) noexcept
    {
        return Count;
    }

    struct wvBlockTable
    {
        wvNodeCompileMeta const* blocks = nullptr;
        uint32_t count = 0;
    };

    wvBlockTable wvSourceBlocks() noexcept;
    wvBlockTable wvMathBlocks() noexcept;
    wvBlockTable wvStateBlocks() noexcept;
    wvBlockTable wvFieldBlocks() noexcept;
    wvBlockTable wvAdapterBlocks() noexcept;

    wvAdapterRule const* wvStandardAdapterRules(uint32_t& out_count) noexcept;

    // userData is the owning wvStandardCatalog
    bool wvLowerExpressionBlock(wvLowerContext& context, void* userData);

    // payload and cardinality follow the node's other generic ports
    inline constexpr wvPortType wvGenericPort{
        .payloadMode = wvAxisMode::Generic,
        .cardinalityMode = wvAxisMode::Generic,
    };

    inline constexpr wvPortType wvFloatPort{
        .payload = wvPayload::Float,
        .cardinalityMode = wvAxisMode::Generic,
    };

    inline constexpr wvPortType wvFloatSignalPort{
        .payload = wvPayload::Float,
        .cardinalityMode = wvAxisMode::Fixed,
        .cardinality = wvCardinalityKind::One,
    };

    inline constexpr wvPortType wvIntSignalPort{
        .payload = wvPayload::Int,
        .cardinalityMode = wvAxisMode::Fixed,
        .cardinality = wvCardinalityKind::One,
    };

    inline constexpr wvPortType wvEventPort{
        .payload = wvPayload::Bool,
        .cardinalityMode = wvAxisMode::Fixed,
        .cardinality = wvCardinalityKind::One,
        .temporality = wvTemporality::Discrete,
    };

    // accepts anything on every axis
    inline constexpr wvPortType wvAnyPort{
        .payloadMode = wvAxisMode::Free,
        .cardinalityMode = wvAxisMode::Free,
        .temporalityMode = wvAxisMode::Free,
    };

    // fills stride components from a parameter; a single value fills every component
    inline void wvParamComponents(wvLowerContext& context, char const* name, uint32_t stride, float* out_values) noexcept
    {
        wvParamValue param;
        if (!context.findParam(name, param) || param.count == 0)
            return;
        for (uint32_t index = 0; index != stride; ++index)
            out_values[index] = param.count == 1 ? param.values[0] : (index < param.count ? param.values[index] : 0.f);
    }

    inline bool wvParamText(wvLowerContext& context, char const* name, wvName& out_text) noexcept
    {
        wvParamValue param;
        if (!context.findParam(name, param) || param.text == nullptr || param.text == param.textEnd)
            return false;
        out_text = {.name = param.text, .nameEnd = param.textEnd};
        return true;
    }

    inline uint32_t wvOutputStride(wvLowerContext& context, wvOutputPortIndex port) noexcept
    {
        return wvPayloadStride(context.outputType(port).payload);
    }

    // the instance of a field output, or invalid for signals
    inline wvInstanceId wvOutputInstance(wvLowerContext& context, wvOutputPortIndex port) noexcept
    {
        wvCanonicalType const type = context.outputType(port);
        return wvIsField(type) ? type.extent.cardinality.value().instance : wvInvalidInstanceId;
    }
} // namespace weave
