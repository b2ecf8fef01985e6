// weave

#include "weave/canonical_type.hh"

namespace weave {
    namespace {
        void setAxisValue(wvAxisValue& out_value, wvCardinality const& value) noexcept { out_value.cardinality = value; }
        void setAxisValue(wvAxisValue& out_value, wvTemporality value) noexcept { out_value.temporality = value; }
        void setAxisValue(wvAxisValue& out_value, wvBinding const& value) noexcept { out_value.binding = value; }
        void setAxisValue(wvAxisValue& out_value, wvPerspectiveId value) noexcept { out_value.perspective = value; }
        void setAxisValue(wvAxisValue& out_value, wvBranchId value) noexcept { out_value.branch = value; }

        template <typename ValueT>
        bool unifyInto(wvAxisName axis, wvAxis<ValueT> const& left, wvAxis<ValueT> const& right, wvAxis<ValueT>& out_result,
            wvAxisConflict* out_conflict) noexcept
        {
            if (wvUnifyAxis(left, right, out_result))
                return true;

            if (out_conflict != nullptr)
            {
                out_conflict->axis = axis;
                setAxisValue(out_conflict->left, left.value());
                setAxisValue(out_conflict->right, right.value());
            }
            return false;
        }
    } // namespace

    bool wvUnifyExtent(wvExtent const& left, wvExtent const& right, wvExtent& out_result, wvAxisConflict* out_conflict) noexcept
    {
        // unify into a scratch value so a failure leaves out_result untouched
        wvExtent result = left;

        if (!unifyInto(wvAxisName::Cardinality, left.cardinality, right.cardinality, result.cardinality, out_conflict))
            return false;
        if (!unifyInto(wvAxisName::Temporality, left.temporality, right.temporality, result.temporality, out_conflict))
            return false;
        if (!unifyInto(wvAxisName::Binding, left.binding, right.binding, result.binding, out_conflict))
            return false;
        if (!unifyInto(wvAxisName::Perspective, left.perspective, right.perspective, result.perspective, out_conflict))
            return false;
        if (!unifyInto(wvAxisName::Branch, left.branch, right.branch, result.branch, out_conflict))
            return false;

        out_result = result;
        return true;
    }

    bool wvUnifyType(wvCanonicalType const& left, wvCanonicalType const& right, wvCanonicalType& out_result,
        wvAxisConflict* out_conflict) noexcept
    {
        if (left.payload != right.payload)
        {
            if (out_conflict != nullptr)
            {
                out_conflict->axis = wvAxisName::Payload;
                out_conflict->left.payload = left.payload;
                out_conflict->right.payload = right.payload;
            }
            return false;
        }

        wvExtent extent;
        if (!wvUnifyExtent(left.extent, right.extent, extent, out_conflict))
            return false;

        out_result.payload = left.payload;
        out_result.extent = extent;
        return true;
    }

    bool wvIsFullyResolved(wvExtent const& extent) noexcept
    {
        return extent.cardinality.isResolved() && extent.temporality.isResolved() && extent.binding.isResolved() &&
               extent.perspective.isResolved() && extent.branch.isResolved();
    }
} // namespace weave
