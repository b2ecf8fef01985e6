// weave

#pragma once

#include "weave/compile_types.hh"
#include "weave/export.hh"
#include "weave/graph_compiler.hh"
#include "weave/types.hh"

#include <cstdint>
#include <vector>

namespace weave {
    class wvAllocator;

    constexpr wvNodeTypeId wvBlockTypeId(char const* name) noexcept { return wvNodeTypeId{wvHashName(name)}; }

    // sources; ports are listed in index order
    inline constexpr wvNodeTypeId wvConstBlockId = wvBlockTypeId("Const");                 // -> out; param value
    inline constexpr wvNodeTypeId wvTimeBlockId = wvBlockTypeId("Time");                   // -> ms, dt
    inline constexpr wvNodeTypeId wvExternalInputBlockId = wvBlockTypeId("ExternalInput"); // -> out; params name, value

    // math
    inline constexpr wvNodeTypeId wvAddBlockId = wvBlockTypeId("Add");           // in... -> out
    inline constexpr wvNodeTypeId wvSubtractBlockId = wvBlockTypeId("Subtract"); // a, b -> out
    inline constexpr wvNodeTypeId wvMultiplyBlockId = wvBlockTypeId("Multiply"); // in... -> out
    inline constexpr wvNodeTypeId wvDivideBlockId = wvBlockTypeId("Divide");     // a, b -> out
    inline constexpr wvNodeTypeId wvModuloBlockId = wvBlockTypeId("Modulo");     // a, b -> out
    inline constexpr wvNodeTypeId wvSinBlockId = wvBlockTypeId("Sin");           // in -> out
    inline constexpr wvNodeTypeId wvCosBlockId = wvBlockTypeId("Cos");           // in -> out
    inline constexpr wvNodeTypeId wvExpressionBlockId = wvBlockTypeId("Expression"); // in... -> out; param expression

    // state
    inline constexpr wvNodeTypeId wvUnitDelayBlockId = wvBlockTypeId("UnitDelay");     // in -> out; param initial
    inline constexpr wvNodeTypeId wvAccumulatorBlockId = wvBlockTypeId("Accumulator"); // in, reset -> out
    inline constexpr wvNodeTypeId wvLagBlockId = wvBlockTypeId("Lag");                 // in, tau -> out
    inline constexpr wvNodeTypeId wvSampleHoldBlockId = wvBlockTypeId("SampleHold");   // in, trigger -> out
    inline constexpr wvNodeTypeId wvEdgeDetectBlockId = wvBlockTypeId("EdgeDetect");   // in -> out
    inline constexpr wvNodeTypeId wvPulseBlockId = wvBlockTypeId("Pulse");             // period -> out

    // fields
    inline constexpr wvNodeTypeId wvArrayBlockId = wvBlockTypeId("Array"); // count -> elements, count; param capacity
    inline constexpr wvNodeTypeId wvElementIndexBlockId = wvBlockTypeId("ElementIndex");   // elements -> index, normalized
    inline constexpr wvNodeTypeId wvGridLayoutBlockId = wvBlockTypeId("GridLayout");       // elements, rows, cols -> position
    inline constexpr wvNodeTypeId wvCircleLayoutBlockId = wvBlockTypeId("CircleLayout");   // elements, radius, phase -> position
    inline constexpr wvNodeTypeId wvLineLayoutBlockId = wvBlockTypeId("LineLayout");       // elements, x0, y0, x1, y1 -> position
    inline constexpr wvNodeTypeId wvHsvColorBlockId = wvBlockTypeId("HsvColor");           // h, s, v -> color
    inline constexpr wvNodeTypeId wvFieldSumBlockId = wvBlockTypeId("FieldSum");           // in -> out
    inline constexpr wvNodeTypeId wvFieldMaxBlockId = wvBlockTypeId("FieldMax");           // in -> out
    inline constexpr wvNodeTypeId wvSmoothBlockId = wvBlockTypeId("Smooth"); // in -> out; params policy, tau, retirement, decay

    // sinks
    inline constexpr wvNodeTypeId wvRenderInstancesBlockId = wvBlockTypeId("RenderInstances"); // position, color, size
    inline constexpr wvNodeTypeId wvProbeBlockId = wvBlockTypeId("Probe");                     // in; param name

    // adapters, inserted by the compiler
    inline constexpr wvNodeTypeId wvIntToFloatBlockId = wvBlockTypeId("IntToFloat");
    inline constexpr wvNodeTypeId wvBoolToFloatBlockId = wvBlockTypeId("BoolToFloat");
    inline constexpr wvNodeTypeId wvFloatToIntBlockId = wvBlockTypeId("FloatToInt");
    inline constexpr wvNodeTypeId wvBroadcastBlockId = wvBlockTypeId("Broadcast");

    /// The standard blocks and adapter rules.
    ///
    /// Hosts may register further node types, composites and adapter rules;
    /// a registered node type shadows a standard block with the same id.
    class WV_EXTRA_API wvStandardCatalog final : public wvGraphCompilerHost
    {
    public:
        explicit wvStandardCatalog(wvAllocator& alloc);

        wvStandardCatalog(wvStandardCatalog const&) = delete;
        wvStandardCatalog& operator=(wvStandardCatalog const&) = delete;

        bool lookupNodeType(wvNodeTypeId typeId, wvNodeCompileMeta& out_nodeMeta) const noexcept override;
        bool lookupComposite(wvNodeTypeId typeId, wvCompositeMeta& out_compositeMeta) const noexcept override;

        uint32_t getAdapterCount() const noexcept override;
        bool getAdapter(uint32_t index, wvAdapterRule& out_rule) const noexcept override;

        // the referenced port, node and edge tables must outlive the catalog
        void registerNodeType(wvNodeCompileMeta const& meta);
        void registerComposite(wvCompositeMeta const& meta);
        void registerAdapter(wvAdapterRule const& rule);

        wvAllocator& allocator() const noexcept { return allocator_; }

    private:
        wvAllocator& allocator_;
        std::vector<wvNodeCompileMeta> nodeTypes_;
        std::vector<wvCompositeMeta> composites_;
        std::vector<wvAdapterRule> adapters_;
    };
} // namespace weave
