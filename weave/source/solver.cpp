// weave

#include "solver.hh"

namespace weave {
    void wvTypeSolver::clear() noexcept
    {
        payload_.clear();
        cardinality_.clear();
        temporality_.clear();
        binding_.clear();
        perspective_.clear();
        branch_.clear();
        defaultsApplied_ = false;
    }

    bool wvTypeSolver::canUnify(wvPortVars const& left, wvPortVars const& right, wvAxisConflict* out_conflict) const noexcept
    {
        auto conflict = [out_conflict](wvAxisName axis, auto&& fill) {
            if (out_conflict != nullptr)
            {
                out_conflict->axis = axis;
                fill(*out_conflict);
            }
            return false;
        };

        if (!payload_.canUnify(left.payload, right.payload))
            return conflict(wvAxisName::Payload, [&](wvAxisConflict& out) {
                out.left.payload = payload_.value(left.payload);
                out.right.payload = payload_.value(right.payload);
            });
        if (!cardinality_.canUnify(left.cardinality, right.cardinality))
            return conflict(wvAxisName::Cardinality, [&](wvAxisConflict& out) {
                out.left.cardinality = cardinality_.value(left.cardinality);
                out.right.cardinality = cardinality_.value(right.cardinality);
            });
        if (!temporality_.canUnify(left.temporality, right.temporality))
            return conflict(wvAxisName::Temporality, [&](wvAxisConflict& out) {
                out.left.temporality = temporality_.value(left.temporality);
                out.right.temporality = temporality_.value(right.temporality);
            });
        if (!binding_.canUnify(left.binding, right.binding))
            return conflict(wvAxisName::Binding, [&](wvAxisConflict& out) {
                out.left.binding = binding_.value(left.binding);
                out.right.binding = binding_.value(right.binding);
            });
        if (!perspective_.canUnify(left.perspective, right.perspective))
            return conflict(wvAxisName::Perspective, [&](wvAxisConflict& out) {
                out.left.perspective = perspective_.value(left.perspective);
                out.right.perspective = perspective_.value(right.perspective);
            });
        if (!branch_.canUnify(left.branch, right.branch))
            return conflict(wvAxisName::Branch, [&](wvAxisConflict& out) {
                out.left.branch = branch_.value(left.branch);
                out.right.branch = branch_.value(right.branch);
            });

        return true;
    }

    bool wvTypeSolver::unify(wvPortVars const& left, wvPortVars const& right, wvAxisConflict* out_conflict) noexcept
    {
        if (!canUnify(left, right, out_conflict))
            return false;

        bool const ok = payload_.unify(left.payload, right.payload) && cardinality_.unify(left.cardinality, right.cardinality) &&
                        temporality_.unify(left.temporality, right.temporality) && binding_.unify(left.binding, right.binding) &&
                        perspective_.unify(left.perspective, right.perspective) && branch_.unify(left.branch, right.branch);
        WV_ASSERT(ok);
        return ok;
    }

    template <typename ValueT>
    void wvTypeSolver::bindDefaults(wvAxisSolver<ValueT>& solver) noexcept
    {
        for (uint32_t index = 0; index != solver.size(); ++index)
        {
            wvTypeVarId const var{index};
            if (!solver.isBound(var))
                solver.bind(var, wvAxisDefault<ValueT>::value);
        }
    }

    void wvTypeSolver::applyDefaults() noexcept
    {
        WV_GUARD_VOID(!defaultsApplied_);

        bindDefaults(cardinality_);
        bindDefaults(temporality_);
        bindDefaults(binding_);
        bindDefaults(perspective_);
        bindDefaults(branch_);
        defaultsApplied_ = true;
    }

    wvCanonicalType wvTypeSolver::resolve(wvPortVars const& vars) const noexcept
    {
        wvCanonicalType type;
        type.payload = payload_.value(vars.payload);
        type.extent.cardinality = cardinality_.resolve(vars.cardinality);
        type.extent.temporality = temporality_.resolve(vars.temporality);
        type.extent.binding = binding_.resolve(vars.binding);
        type.extent.perspective = perspective_.resolve(vars.perspective);
        type.extent.branch = branch_.resolve(vars.branch);
        return type;
    }
} // namespace weave
