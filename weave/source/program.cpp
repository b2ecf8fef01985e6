// weave

#include "weave/program.hh"
#include "weave/alloc.hh"
#include "weave/canonical_type.hh"
#include "weave/hash.hh"
#include "weave/log.hh"
#include "weave/ops.hh"

#include "program_internal.hh"
#include "utility.hh"

#include <spdlog/spdlog.h>

#include <cstring>
#include <new>

namespace weave {
    static bool isInRange(uint32_t offset, uint32_t count, uint32_t range) noexcept { return offset <= range && count <= range - offset; }

#define WV_VALIDATE(x) \
    if (!(x))          \
    {                  \
        WV_BREAK();    \
        return false;  \
    }

    static bool isValidStride(uint32_t stride) noexcept { return stride >= 1 && stride <= wvMaxStride; }

    template <typename IndexT, typename ArrayT>
    static bool isValidIndex(IndexT index, ArrayT const& array) noexcept
    {
        return index != wvInvalidIndex && index.value() < array.count;
    }

    template <typename IndexT, typename ArrayT>
    static bool isValidOrInvalid(IndexT index, ArrayT const& array) noexcept
    {
        return index == wvInvalidIndex || index.value() < array.count;
    }

    static bool validateExpr(wvProgramHeader const& header, uint32_t exprIndex) noexcept
    {
        wvProgramExpr const& expr = header.exprs[wvProgramExprIndex{exprIndex}];

        WV_VALIDATE(static_cast<uint32_t>(expr.kind) < wvExprKindCount);
        WV_VALIDATE(isValidStride(expr.stride));
        WV_VALIDATE(isValidOrInvalid(expr.instance, header.instances));
        WV_VALIDATE((expr.field != 0) == (expr.instance != wvInvalidIndex));

        if (expr.kind != wvExprKind::Constant)
        {
            WV_VALIDATE(isInRange(expr.firstArg, expr.argCount, header.args.count));

            // arguments always precede their users, which keeps the arena acyclic
            for (uint32_t arg = 0; arg != expr.argCount; ++arg)
                WV_VALIDATE(header.args[expr.firstArg + arg] < exprIndex);
        }

        switch (expr.kind)
        {
        case wvExprKind::Constant: WV_VALIDATE(isInRange(expr.firstArg, expr.stride, header.floats.count)); break;
        case wvExprKind::External: WV_VALIDATE(expr.immediate < header.externals.count); break;
        case wvExprKind::Kernel:
            WV_VALIDATE(expr.op < static_cast<uint8_t>(wvOpCode::Last));
            WV_VALIDATE(expr.argCount != 0 && expr.argCount <= wvMaxStride);
            break;
        case wvExprKind::Broadcast: WV_VALIDATE(expr.argCount == 1 && expr.field != 0); break;
        case wvExprKind::Reduce: WV_VALIDATE(expr.argCount == 1 && expr.op <= static_cast<uint8_t>(wvReduceOp::Mean)); break;
        case wvExprKind::ElementIndex:
        case wvExprKind::ElementId: WV_VALIDATE(expr.field != 0); break;
        case wvExprKind::ElementCount: WV_VALIDATE(expr.immediate < header.instances.count); break;
        case wvExprKind::SlotRead: WV_VALIDATE(expr.immediate < header.slots.count); break;
        case wvExprKind::StateRead: WV_VALIDATE(expr.immediate < header.states.count); break;
        case wvExprKind::Time:
        case wvExprKind::DeltaTime: break;
        }

        return true;
    }

    static bool validateStep(wvProgramHeader const& header, wvProgramStep const& step) noexcept
    {
        WV_VALIDATE(static_cast<uint32_t>(step.kind) < wvStepKindCount);

        switch (step.kind)
        {
        case wvStepKind::EvalSignal:
        case wvStepKind::MaterializeField:
        case wvStepKind::EvalEvent:
            WV_VALIDATE(isValidIndex(step.expr, header.exprs));
            WV_VALIDATE(isValidIndex(step.slot, header.slots));
            WV_VALIDATE(header.exprs[step.expr].stride == header.slots[step.slot].stride);
            WV_VALIDATE(header.exprs[step.expr].instance == header.slots[step.slot].instance);
            break;
        case wvStepKind::WriteSlot:
            WV_VALIDATE(isValidIndex(step.slot, header.slots));
            WV_VALIDATE(step.target < header.outputs.count);
            break;
        case wvStepKind::BuildContinuityMapping:
        case wvStepKind::ApplyContinuity: WV_VALIDATE(step.target < header.continuity.count); break;
        case wvStepKind::RenderEmit: WV_VALIDATE(step.target < header.renders.count); break;
        case wvStepKind::WriteStateScalar:
        case wvStepKind::WriteStateField:
            WV_VALIDATE(isValidIndex(step.slot, header.slots));
            WV_VALIDATE(step.target < header.states.count);
            WV_VALIDATE(header.slots[step.slot].instance == header.states[wvProgramStateIndex{step.target}].instance);
            break;
        }

        return true;
    }

    bool wvValidateProgram(uint8_t const* bytes, uint32_t size) noexcept
    {
        // ensure the byte range is valid and at least large enough for the header
        WV_VALIDATE(bytes != nullptr);
        WV_VALIDATE(size >= sizeof(wvProgramHeader));
        WV_VALIDATE(reinterpret_cast<uintptr_t>(bytes) % alignof(wvProgramHeader) == 0);

        wvProgramHeader const& header = *std::launder(reinterpret_cast<wvProgramHeader const*>(bytes));

        WV_VALIDATE(header.version == wvProgramVersion);
        WV_VALIDATE(header.size >= sizeof(wvProgramHeader));
        WV_VALIDATE(size >= header.size);
        WV_VALIDATE(wvHashProgram(&header) == header.hash);

        // ensure embedded arrays are enclosed in the block
        uintptr_t const block = reinterpret_cast<uintptr_t>(bytes);
        WV_VALIDATE(header.exprs.validate(block, header.size));
        WV_VALIDATE(header.args.validate(block, header.size));
        WV_VALIDATE(header.floats.validate(block, header.size));
        WV_VALIDATE(header.externals.validate(block, header.size));
        WV_VALIDATE(header.slots.validate(block, header.size));
        WV_VALIDATE(header.states.validate(block, header.size));
        WV_VALIDATE(header.instances.validate(block, header.size));
        WV_VALIDATE(header.continuity.validate(block, header.size));
        WV_VALIDATE(header.renders.validate(block, header.size));
        WV_VALIDATE(header.outputs.validate(block, header.size));
        WV_VALIDATE(header.phase1.validate(block, header.size));
        WV_VALIDATE(header.phase2.validate(block, header.size));

        // validate all cross-references indices and ranges
        for (wvProgramInstance const& instance : header.instances)
        {
            WV_VALIDATE(instance.maxCount != 0 && instance.maxCount <= wvMaxInstanceCount);
            WV_VALIDATE(isValidOrInvalid(instance.countExpr, header.exprs));
            if (instance.countExpr != wvInvalidIndex)
                WV_VALIDATE(header.exprs[instance.countExpr].field == 0);
        }

        for (uint32_t exprIndex = 0; exprIndex != header.exprs.count; ++exprIndex)
            WV_VALIDATE(validateExpr(header, exprIndex));

        for (wvProgramExternal const& external : header.externals)
            WV_VALIDATE(isValidStride(external.stride));

        for (wvProgramSlot const& slot : header.slots)
        {
            WV_VALIDATE(isValidStride(slot.stride));
            WV_VALIDATE(isValidOrInvalid(slot.instance, header.instances));
        }

        for (wvProgramStateRecord const& state : header.states)
        {
            WV_VALIDATE(isValidStride(state.stride));
            WV_VALIDATE(isValidOrInvalid(state.instance, header.instances));
            WV_VALIDATE(isInRange(state.initialStart, state.stride, header.floats.count));
        }

        for (wvProgramContinuity const& target : header.continuity)
        {
            WV_VALIDATE(isValidIndex(target.instance, header.instances));
            WV_VALIDATE(isValidStride(target.stride));
            WV_VALIDATE(target.policy <= 3 && target.retirement <= 1);
            WV_VALIDATE(isValidIndex(target.inputSlot, header.slots));
            WV_VALIDATE(isValidIndex(target.outputSlot, header.slots));
            WV_VALIDATE(header.slots[target.inputSlot].instance == target.instance);
            WV_VALIDATE(header.slots[target.outputSlot].instance == target.instance);
        }

        for (wvProgramRender const& render : header.renders)
        {
            WV_VALIDATE(isValidIndex(render.instance, header.instances));
            WV_VALIDATE(isValidIndex(render.positionSlot, header.slots));
            WV_VALIDATE(isValidIndex(render.colorSlot, header.slots));
            WV_VALIDATE(isValidIndex(render.sizeSlot, header.slots));
            WV_VALIDATE(header.slots[render.positionSlot].stride == 2);
            WV_VALIDATE(header.slots[render.colorSlot].stride == 4);
            WV_VALIDATE(header.slots[render.sizeSlot].stride == 1);
        }

        for (wvProgramOutput const& output : header.outputs)
            WV_VALIDATE(isValidIndex(output.slot, header.slots));

        // the phase a step belongs to is checked by the executor, not here
        for (wvProgramStep const& step : header.phase1)
            WV_VALIDATE(validateStep(header, step));
        for (wvProgramStep const& step : header.phase2)
            WV_VALIDATE(validateStep(header, step));

        return true;
    }

    uint64_t wvHashProgram(wvProgramHeader const* program) noexcept
    {
        if (program == nullptr)
            return 0;

        if (program->size < sizeof(wvProgramHeader))
            return 0;

        // hash a copy of the header with the hash field cleared, then chain the payload after it
        wvProgramHeader headerCopy = *program;
        headerCopy.hash = 0u;

        uint8_t const* const bytes = reinterpret_cast<uint8_t const*>(program);

        uint64_t hash = wvHashFnv1a64(reinterpret_cast<uint8_t const*>(&headerCopy), sizeof(headerCopy));
        hash = wvHashFnv1a64(bytes + sizeof(wvProgramHeader), program->size - sizeof(wvProgramHeader), hash);
        return hash;
    }

    wvProgram* wvLoadProgram(wvAllocator& alloc, uint8_t const* bytes, uint32_t size)
    {
        if (!wvValidateProgram(bytes, size))
        {
            SPDLOG_LOGGER_WARN(wvLog(), "rejected program block of {} bytes", size);
            return nullptr;
        }

        wvProgramHeader const& header = *reinterpret_cast<wvProgramHeader const*>(bytes);

        uint32_t programSize = sizeof(wvProgram);

        uint32_t const headerOffset = wvAlign(programSize, alignof(wvProgramHeader));
        programSize = headerOffset + header.size;

        uint32_t const slotOffsetsOffset = decltype(wvProgram::slotOffsets)::allocate(programSize, header.slots.count);
        uint32_t const stateOffsetsOffset = decltype(wvProgram::stateOffsets)::allocate(programSize, header.states.count);
        uint32_t const exprOffsetsOffset = decltype(wvProgram::exprOffsets)::allocate(programSize, header.exprs.count);
        uint32_t const gaugeOffsetsOffset = decltype(wvProgram::gaugeOffsets)::allocate(programSize, header.continuity.count);

        static_assert(alignof(wvProgramHeader) <= alignof(wvProgram));
        wvProgram* const program = new (alloc.allocate(programSize, alignof(wvProgram))) wvProgram(alloc, programSize);

        uintptr_t const base = reinterpret_cast<uintptr_t>(program);
        std::memcpy(reinterpret_cast<uint8_t*>(program) + headerOffset, bytes, header.size);

        program->header.assign(base, headerOffset);
        program->slotOffsets.assign(base, slotOffsetsOffset, header.slots.count);
        program->stateOffsets.assign(base, stateOffsetsOffset, header.states.count);
        program->exprOffsets.assign(base, exprOffsetsOffset, header.exprs.count);
        program->gaugeOffsets.assign(base, gaugeOffsetsOffset, header.continuity.count);

        wvProgramHeader const& loaded = *program->header;

        // lay out the per-state storage blocks
        for (wvProgramSlotIndex slotIndex{0}; slotIndex != loaded.slots.count; ++slotIndex)
        {
            wvProgramSlot const& slot = loaded.slots[slotIndex];
            program->slotOffsets[slotIndex] = program->scratchFloats;
            program->scratchFloats += slot.stride * wvProgramLanes(loaded, slot.instance);
        }

        for (wvProgramStateIndex stateIndex{0}; stateIndex != loaded.states.count; ++stateIndex)
        {
            wvProgramStateRecord const& state = loaded.states[stateIndex];
            program->stateOffsets[stateIndex] = program->stateFloats;
            program->stateFloats += state.stride * wvProgramLanes(loaded, state.instance);
        }

        for (wvProgramExprIndex exprIndex{0}; exprIndex != loaded.exprs.count; ++exprIndex)
        {
            wvProgramExpr const& expr = loaded.exprs[exprIndex];
            program->exprOffsets[exprIndex] = program->cacheFloats;
            program->cacheFloats += expr.stride * wvProgramLanes(loaded, expr.instance);
        }

        for (wvProgramContinuityIndex targetIndex{0}; targetIndex != loaded.continuity.count; ++targetIndex)
        {
            program->gaugeOffsets[targetIndex] = program->gaugeCount;
            program->gaugeCount += wvProgramLanes(loaded, loaded.continuity[targetIndex].instance);
        }

        SPDLOG_LOGGER_DEBUG(wvLog(), "loaded program: {} exprs, {} slots, {} states, {}+{} steps", loaded.exprs.count,
            loaded.slots.count, loaded.states.count, loaded.phase1.count, loaded.phase2.count);

        return program;
    }

    void wvAcquireProgram(wvProgram* program) noexcept
    {
        if (program != nullptr)
        {
            ++program->references;
        }
    }

    void wvReleaseProgram(wvProgram* program)
    {
        if (program != nullptr && --program->references == 0)
        {
            wvAllocator* const alloc = &program->allocator;
            uint32_t const size = program->programSize;

            program->~wvProgram();

            alloc->free(program, size, alignof(wvProgram));
        }
    }

    uint64_t wvProgramGraphVersion(wvProgram const* program) noexcept
    {
        WV_GUARD_OR(program != nullptr, 0);
        return program->header->graphVersion;
    }

    uint32_t wvProgramStateCount(wvProgram const* program) noexcept
    {
        WV_GUARD_OR(program != nullptr, 0);
        return program->header->states.count;
    }

    wvStableId wvProgramStateId(wvProgram const* program, uint32_t index) noexcept
    {
        WV_GUARD_OR(program != nullptr, wvInvalidStableId);
        WV_GUARD_OR(index < program->header->states.count, wvInvalidStableId);
        return wvStableId{program->header->states[wvProgramStateIndex{index}].stableId};
    }

    wvStableId wvMakeStableId(wvNodeId nodeId, char const* key, char const* keyEnd) noexcept
    {
        uint64_t const hash = wvHashCombine(wvFnvOffsetBasis, nodeId.value());
        return wvStableId{wvHashFnv1a64(key, keyEnd, hash)};
    }
} // namespace weave
