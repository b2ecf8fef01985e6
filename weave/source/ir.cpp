// weave

#include "ir.hh"

#include "weave/hash.hh"

#include "bit.hh"

namespace weave {
    static constexpr uint32_t emptyEntry = 0;

    wvIrBuilder::wvIrBuilder(wvAllocator& alloc) noexcept
        : exprs(alloc), args(alloc), floats(alloc), externals(alloc), slots(alloc), states(alloc), instances(alloc), continuity(alloc),
          renders(alloc), outputs(alloc), steps(alloc), table_(alloc), hashes_(alloc)
    {
    }

    void wvIrBuilder::clear() noexcept
    {
        exprs.clear();
        args.clear();
        floats.clear();
        externals.clear();
        slots.clear();
        states.clear();
        instances.clear();
        continuity.clear();
        renders.clear();
        outputs.clear();
        steps.clear();
        table_.clear();
        hashes_.clear();
    }

    uint64_t wvIrBuilder::hashExpr(wvProgramExpr const& expr, uint32_t const* args, float const* constant) const noexcept
    {
        uint64_t hash = wvHashCombine(wvFnvOffsetBasis, static_cast<uint64_t>(expr.kind));
        hash = wvHashCombine(hash, expr.op);
        hash = wvHashCombine(hash, expr.stride);
        hash = wvHashCombine(hash, expr.field);
        hash = wvHashCombine(hash, expr.immediate);
        hash = wvHashCombine(hash, expr.instance.value());

        if (constant != nullptr)
        {
            for (uint32_t index = 0; index != expr.stride; ++index)
                hash = wvHashCombine(hash, wvBitCast<uint32_t>(constant[index]));
        }
        else
        {
            hash = wvHashCombine(hash, expr.argCount);
            for (uint32_t index = 0; index != expr.argCount; ++index)
                hash = wvHashCombine(hash, args[index]);
        }

        return hash;
    }

    bool wvIrBuilder::equalExpr(uint32_t index, wvProgramExpr const& expr, uint32_t const* args, float const* constant) const noexcept
    {
        wvProgramExpr const& existing = this->expr(index);
        if (existing.kind != expr.kind || existing.op != expr.op || existing.stride != expr.stride || existing.field != expr.field ||
            existing.immediate != expr.immediate || existing.instance != expr.instance)
            return false;

        if (constant != nullptr)
        {
            // bitwise, so 0 and -0 stay distinct
            for (uint32_t component = 0; component != expr.stride; ++component)
                if (wvBitCast<uint32_t>(floats[existing.firstArg + component]) != wvBitCast<uint32_t>(constant[component]))
                    return false;
            return true;
        }

        if (existing.argCount != expr.argCount)
            return false;
        for (uint32_t arg = 0; arg != expr.argCount; ++arg)
            if (this->args[existing.firstArg + arg] != args[arg])
                return false;
        return true;
    }

    void wvIrBuilder::rehash(uint32_t capacity)
    {
        table_.clear();
        table_.resize(capacity, emptyEntry);

        uint32_t const mask = capacity - 1;
        for (uint32_t index = 0; index != exprs.size(); ++index)
        {
            uint32_t bucket = static_cast<uint32_t>(hashes_[index]) & mask;
            while (table_[bucket] != emptyEntry)
                bucket = (bucket + 1) & mask;
            table_[bucket] = index + 1;
        }
    }

    uint32_t wvIrBuilder::addConstant(float const* values, uint32_t stride)
    {
        wvProgramExpr const expr{.kind = wvExprKind::Constant, .stride = static_cast<uint8_t>(stride)};
        return addExpr(expr, nullptr, 0, values);
    }

    uint32_t wvIrBuilder::addExpr(wvProgramExpr const& expr, uint32_t const* args, uint32_t argCount)
    {
        wvProgramExpr shaped = expr;
        shaped.argCount = argCount;
        return addExpr(shaped, args, argCount, nullptr);
    }

    uint32_t wvIrBuilder::addExpr(wvProgramExpr const& expr, uint32_t const* args, uint32_t argCount, float const* constant)
    {
        uint64_t const hash = hashExpr(expr, args, constant);

        if (table_.empty())
            rehash(64);

        uint32_t const mask = table_.size() - 1;
        uint32_t bucket = static_cast<uint32_t>(hash) & mask;
        while (table_[bucket] != emptyEntry)
        {
            uint32_t const existing = table_[bucket] - 1;
            if (hashes_[existing] == hash && equalExpr(existing, expr, args, constant))
                return existing;
            bucket = (bucket + 1) & mask;
        }

        uint32_t const index = exprs.size();

        wvProgramExpr stored = expr;
        if (constant != nullptr)
        {
            stored.firstArg = floats.size();
            stored.argCount = 0;
            for (uint32_t component = 0; component != expr.stride; ++component)
                floats.pushBack(constant[component]);
        }
        else
        {
            stored.firstArg = this->args.size();
            stored.argCount = argCount;
            for (uint32_t arg = 0; arg != argCount; ++arg)
                this->args.pushBack(args[arg]);
        }

        exprs.pushBack(stored);
        hashes_.pushBack(hash);
        table_[bucket] = index + 1;

        // keep the load factor under one half
        if (exprs.size() * 2 > table_.size())
            rehash(table_.size() * 2);

        return index;
    }

    wvProgramInstanceIndex wvIrBuilder::findOrAddInstance(wvInstanceId instanceId)
    {
        for (uint32_t index = 0; index != instances.size(); ++index)
            if (instances[index].instanceId == instanceId.value())
                return wvProgramInstanceIndex{index};

        instances.pushBack(wvProgramInstance{.instanceId = instanceId.value()});
        return wvProgramInstanceIndex{instances.size() - 1};
    }

    uint32_t wvIrBuilder::findExternal(uint64_t nameHash) const noexcept
    {
        for (uint32_t index = 0; index != externals.size(); ++index)
            if (externals[index].nameHash == nameHash)
                return index;
        return ~uint32_t{0};
    }

    uint32_t wvIrBuilder::findState(wvStableId stableId) const noexcept
    {
        for (uint32_t index = 0; index != states.size(); ++index)
            if (states[index].stableId == stableId.value())
                return index;
        return ~uint32_t{0};
    }

    uint32_t wvIrBuilder::addSlot(uint32_t stride, wvProgramInstanceIndex instance)
    {
        slots.pushBack(wvProgramSlot{.stride = stride, .instance = instance});
        return slots.size() - 1;
    }

    void wvIrBuilder::addStep(wvProgramStep const& step, bool phase2) { steps.pushBack(wvIrStep{.step = step, .phase2 = phase2}); }
} // namespace weave
