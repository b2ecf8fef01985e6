// weave

#pragma once

#include "weave/lower.hh"

#include "array.hh"
#include "cycles.hh"
#include "graph.hh"
#include "inference.hh"
#include "ir.hh"

namespace weave {
    class wvPassContext;

    /// Pass 6: runs every node's lowering function in dependency order.
    ///
    /// Inputs whose producer has not been lowered yet, which only happens
    /// inside legal feedback cycles, read a placeholder slot that the
    /// producer's output is evaluated into once it is lowered.
    bool wvLowerGraph(wvPassContext& context, wvGraph const& graph, wvTypeInference const& inference, wvCycleAnalysis const& cycles,
        wvIrBuilder& out_ir);

    /// Pass 7: orders the lowered steps into the two phase arrays.
    ///
    /// Phase 1 is a topological order over slot and continuity dependencies,
    /// taking the earliest created ready step first. Phase 2 keeps creation
    /// order.
    bool wvBuildSchedule(wvPassContext& context, wvIrBuilder const& ir, wvArray<wvProgramStep>& out_phase1,
        wvArray<wvProgramStep>& out_phase2);
} // namespace weave
