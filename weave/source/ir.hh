// weave

#pragma once

#include "weave/lower.hh"

#include "array.hh"
#include "program_internal.hh"

#include <cstdint>

namespace weave {
    // a step before scheduling, with the resources it touches
    struct wvIrStep
    {
        wvProgramStep step;
        bool phase2 = false;
    };

    /// The append-only arena lowering writes into.
    ///
    /// Expressions are hash-consed: building the same expression twice yields
    /// the same id, so identical graphs produce identical arenas. Records are
    /// never modified once added.
    class wvIrBuilder
    {
    public:
        explicit wvIrBuilder(wvAllocator& alloc) noexcept;

        void clear() noexcept;

        uint32_t addConstant(float const* values, uint32_t stride);
        uint32_t addExpr(wvProgramExpr const& expr, uint32_t const* args, uint32_t argCount);

        wvProgramExpr const& expr(uint32_t index) const noexcept { return exprs[wvProgramExprIndex{index}]; }
        uint32_t arg(uint32_t index, uint32_t arg) const noexcept { return args[exprs[wvProgramExprIndex{index}].firstArg + arg]; }

        // the instance table grows on first reference; declaration is tracked by lowering
        wvProgramInstanceIndex findOrAddInstance(wvInstanceId instanceId);
        uint32_t findExternal(uint64_t nameHash) const noexcept;
        uint32_t findState(wvStableId stableId) const noexcept;

        uint32_t addSlot(uint32_t stride, wvProgramInstanceIndex instance);
        void addStep(wvProgramStep const& step, bool phase2);

        wvArray<wvProgramExpr, wvProgramExprIndex> exprs;
        wvArray<uint32_t> args;
        wvArray<float> floats;
        wvArray<wvProgramExternal> externals;
        wvArray<wvProgramSlot> slots;
        wvArray<wvProgramStateRecord> states;
        wvArray<wvProgramInstance> instances;
        wvArray<wvProgramContinuity> continuity;
        wvArray<wvProgramRender> renders;
        wvArray<wvProgramOutput> outputs;
        wvArray<wvIrStep> steps;

    private:
        // constants carry their components instead of arguments
        uint32_t addExpr(wvProgramExpr const& expr, uint32_t const* args, uint32_t argCount, float const* constant);
        uint64_t hashExpr(wvProgramExpr const& expr, uint32_t const* args, float const* constant) const noexcept;
        bool equalExpr(uint32_t index, wvProgramExpr const& expr, uint32_t const* args, float const* constant) const noexcept;
        void rehash(uint32_t capacity);

        wvArray<uint32_t> table_;
        wvArray<uint64_t> hashes_;
    };
} // namespace weave
