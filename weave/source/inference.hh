// weave

#pragma once

#include "weave/canonical_type.hh"
#include "weave/compile_types.hh"

#include "array.hh"
#include "graph.hh"
#include "solver.hh"

#include <cstdint>

namespace weave {
    class wvPassContext;

    // the instance owned by an instance-creating node
    constexpr wvInstanceId wvNodeInstanceId(wvNodeId nodeId) noexcept
    {
        return wvInstanceId{wvHashCombine(wvHashName("weave.instance"), nodeId.value())};
    }

    /// The port table of a graph and the type variables behind it.
    ///
    /// Each node contributes one entry per output and one per input; a vararg
    /// input contributes one entry per connected edge instead. Node
    /// constraints are encoded directly in the variables: fixed axes are
    /// bound, generic axes share the node's variable, free axes get their own.
    class wvTypeInference
    {
    public:
        wvTypeInference(wvPassContext& context, wvGraph const& graph) noexcept;

        void build();

        bool canUnifyEdge(uint32_t edgeIndex, wvAxisConflict* out_conflict = nullptr) const noexcept;
        bool unifyEdge(uint32_t edgeIndex, wvAxisConflict* out_conflict = nullptr) noexcept;

        // unifies every edge, applies the defaults and reports what is left
        bool solve();

        wvPortVars const& outputVars(uint32_t edgeIndex) const noexcept { return outputs_[edgeOutputs_[edgeIndex]].vars; }
        wvPortVars const& inputVars(uint32_t edgeIndex) const noexcept { return inputs_[edgeInputs_[edgeIndex]].vars; }

        bool inputType(uint32_t nodeIndex, wvInputPortIndex port, uint32_t element, wvCanonicalType& out_type) const noexcept;
        bool outputType(uint32_t nodeIndex, wvOutputPortIndex port, wvCanonicalType& out_type) const noexcept;

        bool hasMeta(uint32_t nodeIndex) const noexcept { return nodes_[nodeIndex].known; }
        wvNodeCompileMeta const& meta(uint32_t nodeIndex) const noexcept { return nodes_[nodeIndex].meta; }

        wvTypeSolver& solver() noexcept { return solver_; }
        wvTypeSolver const& solver() const noexcept { return solver_; }

    private:
        struct NodeEntry
        {
            wvNodeCompileMeta meta;
            bool known = false;
            wvPortVars generic;
            uint32_t firstInput = 0;
            uint32_t inputCount = 0;
            uint32_t firstOutput = 0;
            uint32_t outputCount = 0;
        };

        struct PortEntry
        {
            uint32_t nodeIndex = 0;
            uint8_t port = 0;
            uint32_t element = 0;
            wvPortVars vars;
        };

        wvPortVars makePortVars(wvPortType const& type, wvPortVars const& generic, wvNodeId nodeId);
        uint32_t findInput(uint32_t nodeIndex, wvInputPortIndex port, uint32_t element) const noexcept;

        wvPassContext& context_;
        wvGraph const& graph_;
        wvTypeSolver solver_;
        wvArray<NodeEntry> nodes_;
        wvArray<PortEntry> inputs_;
        wvArray<PortEntry> outputs_;
        wvArray<uint32_t> edgeInputs_;
        wvArray<uint32_t> edgeOutputs_;
    };
} // namespace weave
