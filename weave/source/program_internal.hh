// weave

#pragma once

#include "weave/alloc.hh"
#include "weave/canonical_type.hh"
#include "weave/types.hh"

#include "index.hh"
#include "rel.hh"

#include <atomic>
#include <cstdint>

namespace weave {
    WV_DEFINE_INDEX(wvProgramExprIndex);
    WV_DEFINE_INDEX(wvProgramSlotIndex);
    WV_DEFINE_INDEX(wvProgramStateIndex);
    WV_DEFINE_INDEX(wvProgramInstanceIndex);
    WV_DEFINE_INDEX(wvProgramContinuityIndex);
    WV_DEFINE_INDEX(wvProgramExternalIndex);

    static constexpr uint32_t wvProgramVersion = 1;

    enum class wvExprKind : uint8_t
    {
        Constant,    // floats[firstArg .. firstArg + stride]
        Time,        // milliseconds since the first frame
        DeltaTime,   // milliseconds since the previous frame
        External,    // externals[immediate]
        Kernel,      // op applied to args
        Broadcast,   // args[0] repeated over instance
        ElementIndex,
        ElementCount,
        ElementId,
        Reduce,      // op is a wvReduceOp over the field args[0]
        SlotRead,    // slots[immediate]
        StateRead,   // states[immediate]
    };

    static constexpr uint32_t wvExprKindCount = 12;

    enum class wvStepKind : uint8_t
    {
        EvalSignal,             // expr -> slot
        WriteSlot,              // slot -> outputs[target]
        MaterializeField,       // expr -> slot, lane by lane
        BuildContinuityMapping, // continuity[target]
        ApplyContinuity,        // continuity[target]
        EvalEvent,              // expr -> slot, the rising edge of a predicate
        RenderEmit,             // renders[target]
        WriteStateScalar,       // slot -> states[target]
        WriteStateField,        // slot -> states[target]
    };

    static constexpr uint32_t wvStepKindCount = 9;

    constexpr bool wvIsStateWrite(wvStepKind kind) noexcept
    {
        return kind == wvStepKind::WriteStateScalar || kind == wvStepKind::WriteStateField;
    }

    // all blob records are padding-free so the hash covers every byte
    struct wvProgramExpr
    {
        wvExprKind kind = wvExprKind::Constant;
        uint8_t op = 0;
        uint8_t stride = 1;
        uint8_t field = 0;
        uint32_t immediate = 0;
        wvProgramInstanceIndex instance = wvInvalidIndex;
        uint32_t firstArg = 0;
        uint32_t argCount = 0;
    };

    struct wvProgramExternal
    {
        uint64_t nameHash = 0;
        float defaults[4] = {};
        uint32_t stride = 1;
        uint32_t reserved = 0;
    };

    struct wvProgramSlot
    {
        uint32_t stride = 1;
        wvProgramInstanceIndex instance = wvInvalidIndex; // invalid for signals
    };

    struct wvProgramStateRecord
    {
        uint64_t stableId = 0;
        uint32_t stride = 1;
        wvProgramInstanceIndex instance = wvInvalidIndex; // invalid for scalar state
        uint32_t initialStart = 0;                         // into floats
        uint32_t reserved = 0;
    };

    struct wvProgramInstance
    {
        uint64_t instanceId = 0;
        uint32_t maxCount = 0;
        wvProgramExprIndex countExpr = wvInvalidIndex; // invalid for a fixed count
    };

    struct wvProgramContinuity
    {
        uint64_t stableId = 0;
        wvProgramInstanceIndex instance = wvInvalidIndex;
        uint32_t stride = 1;
        uint8_t policy = 0;
        uint8_t retirement = 0;
        uint16_t reserved = 0;
        float tauMs = 0.f;
        float decayMs = 0.f;
        wvProgramSlotIndex inputSlot = wvInvalidIndex;
        wvProgramSlotIndex outputSlot = wvInvalidIndex;
        uint32_t reserved2 = 0;
    };

    struct wvProgramRender
    {
        wvProgramInstanceIndex instance = wvInvalidIndex;
        wvProgramSlotIndex positionSlot = wvInvalidIndex;
        wvProgramSlotIndex colorSlot = wvInvalidIndex;
        wvProgramSlotIndex sizeSlot = wvInvalidIndex;
    };

    struct wvProgramOutput
    {
        uint64_t nameHash = 0;
        wvProgramSlotIndex slot = wvInvalidIndex;
        uint32_t reserved = 0;
    };

    struct wvProgramStep
    {
        wvStepKind kind = wvStepKind::EvalSignal;
        uint8_t reserved[3] = {};
        wvProgramExprIndex expr = wvInvalidIndex;
        wvProgramSlotIndex slot = wvInvalidIndex;
        uint32_t target = ~uint32_t{0};
    };

    struct wvProgramHeader
    {
        uint32_t version = 0;
        uint32_t size = 0; // number of bytes, including header, payload, and all padding
        uint64_t hash = 0; // hash of header and all payload bytes, with the hash field as 0
        uint64_t graphVersion = 0;

        wvRelativeArray<wvProgramExpr, wvProgramExprIndex> exprs;
        wvRelativeArray<uint32_t> args;
        wvRelativeArray<float> floats;
        wvRelativeArray<wvProgramExternal, wvProgramExternalIndex> externals;
        wvRelativeArray<wvProgramSlot, wvProgramSlotIndex> slots;
        wvRelativeArray<wvProgramStateRecord, wvProgramStateIndex> states;
        wvRelativeArray<wvProgramInstance, wvProgramInstanceIndex> instances;
        wvRelativeArray<wvProgramContinuity, wvProgramContinuityIndex> continuity;
        wvRelativeArray<wvProgramRender> renders;
        wvRelativeArray<wvProgramOutput> outputs;
        wvRelativeArray<wvProgramStep> phase1;
        wvRelativeArray<wvProgramStep> phase2;
    };

    static_assert(sizeof(wvProgramExpr) == 20);
    static_assert(sizeof(wvProgramExternal) == 32);
    static_assert(sizeof(wvProgramStateRecord) == 24);
    static_assert(sizeof(wvProgramContinuity) == 40);
    static_assert(sizeof(wvProgramStep) == 16);
    static_assert(sizeof(wvProgramHeader) == 120);

    /// A loaded program: a copy of the validated block plus the storage layout
    /// derived from it. Shared by reference count between runtime states.
    struct wvProgram
    {
        wvProgram(wvAllocator& alloc, uint32_t size) noexcept : programSize(size), allocator(alloc) {}

        std::atomic<uint32_t> references = 1;
        wvRelativeObject<wvProgramHeader> header;

        // float offsets into the scratch, state and expression cache blocks
        wvRelativeArray<uint32_t, wvProgramSlotIndex> slotOffsets;
        wvRelativeArray<uint32_t, wvProgramStateIndex> stateOffsets;
        wvRelativeArray<uint32_t, wvProgramExprIndex> exprOffsets;
        wvRelativeArray<uint32_t, wvProgramContinuityIndex> gaugeOffsets;

        uint32_t programSize = 0;
        uint32_t scratchFloats = 0;
        uint32_t stateFloats = 0;
        uint32_t cacheFloats = 0;
        uint32_t gaugeCount = 0;
        wvAllocator& allocator;
    };

    // lanes an expression or slot can hold: 1 for signals, the instance capacity for fields
    inline uint32_t wvProgramLanes(wvProgramHeader const& header, wvProgramInstanceIndex instance) noexcept
    {
        return instance == wvInvalidIndex ? 1 : header.instances[instance].maxCount;
    }

    /// Validates that the provided range of bytes describes a valid program.
    bool wvValidateProgram(uint8_t const* bytes, uint32_t size) noexcept;

    /// Calculates the hash of a program. Correctness requires all padding bytes to be 0.
    uint64_t wvHashProgram(wvProgramHeader const* program) noexcept;
} // namespace weave
