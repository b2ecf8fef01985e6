// weave

#pragma once

#include "weave/compile_types.hh"

#include "array.hh"
#include "graph.hh"

#include <cstdint>

namespace weave {
    class wvPassContext;

    struct wvCycleAnalysis
    {
        explicit wvCycleAnalysis(wvAllocator& alloc) noexcept : order(alloc), cycles(alloc), cycleFirst(alloc), cycleNodes(alloc) {}

        void clear() noexcept
        {
            order.clear();
            cycles.clear();
            cycleFirst.clear();
            cycleNodes.clear();
        }

        // node indices, components with sources first
        wvArray<uint32_t> order;

        // cycle i owns cycleNodes[cycleFirst[i]] .. + cycles[i].nodeCount, ascending node index
        wvArray<wvCycleInfo> cycles;
        wvArray<uint32_t> cycleFirst;
        wvArray<uint32_t> cycleNodes;
    };

    /// Pass 5: strongly connected components of the node dependency graph.
    ///
    /// Every component with more than one node, or with a self loop, is
    /// recorded as a cycle. A second walk with the inputs of stateful nodes
    /// removed finds the loops that pass through no state; each is reported
    /// as IllegalCombinatorialCycle and marks its enclosing cycle illegal.
    /// Within a component the stateful nodes come first in the lowering order.
    void wvAnalyzeCycles(wvPassContext& context, wvGraph const& graph, wvCycleAnalysis& out_analysis);
} // namespace weave
