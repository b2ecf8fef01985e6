// weave

#pragma once

#include "weave/export.hh"
#include "weave/key.hh"
#include "weave/types.hh"

#include <cstdint>

namespace weave {
    WV_DEFINE_KEY(wvTypeVarId, uint32_t);

    enum class wvPayload : uint8_t
    {
        Float,
        Int,
        Bool,
        Vec2,
        Vec3,
        Color,
        Shape,
        Token,
        CameraProjection,
    };

    static constexpr uint32_t wvPayloadCount = 9;
    static constexpr uint32_t wvMaxStride = 4;
    static constexpr uint32_t wvMaxInstanceCount = 1u << 20;

    /// Storage width in floats; depends on the payload kind only.
    constexpr uint32_t wvPayloadStride(wvPayload payload) noexcept
    {
        switch (payload)
        {
        case wvPayload::Vec2: return 2;
        case wvPayload::Vec3: return 3;
        case wvPayload::Color: return 4;
        case wvPayload::Float:
        case wvPayload::Int:
        case wvPayload::Bool:
        case wvPayload::Shape:
        case wvPayload::Token:
        case wvPayload::CameraProjection: return 1;
        }
        return 1;
    }

    enum class wvCardinalityKind : uint8_t
    {
        Zero,
        One,
        Many,
    };

    struct wvCardinality
    {
        wvCardinalityKind kind = wvCardinalityKind::One;
        wvInstanceId instance = wvInvalidInstanceId;

        static constexpr wvCardinality zero() noexcept { return {.kind = wvCardinalityKind::Zero}; }
        static constexpr wvCardinality one() noexcept { return {.kind = wvCardinalityKind::One}; }
        static constexpr wvCardinality many(wvInstanceId instance) noexcept
        {
            return {.kind = wvCardinalityKind::Many, .instance = instance};
        }

        constexpr bool operator==(wvCardinality const& rhs) const noexcept
        {
            return kind == rhs.kind && (kind != wvCardinalityKind::Many || instance == rhs.instance);
        }
    };

    enum class wvTemporality : uint8_t
    {
        Continuous,
        Discrete,
    };

    enum class wvBindingKind : uint8_t
    {
        Unbound,
        Weak,
        Strong,
        Identity,
    };

    struct wvBinding
    {
        wvBindingKind kind = wvBindingKind::Unbound;
        wvReferentId referent = wvInvalidReferentId;

        constexpr bool operator==(wvBinding const& rhs) const noexcept
        {
            return kind == rhs.kind && (kind == wvBindingKind::Unbound || referent == rhs.referent);
        }
    };

    // v0 defaults, applied once after solving
    template <typename ValueT>
    struct wvAxisDefault;

    template <>
    struct wvAxisDefault<wvCardinality>
    {
        static constexpr wvCardinality value = wvCardinality::one();
    };

    template <>
    struct wvAxisDefault<wvTemporality>
    {
        static constexpr wvTemporality value = wvTemporality::Continuous;
    };

    template <>
    struct wvAxisDefault<wvBinding>
    {
        static constexpr wvBinding value{};
    };

    template <>
    struct wvAxisDefault<wvPerspectiveId>
    {
        static constexpr wvPerspectiveId value{0};
    };

    template <>
    struct wvAxisDefault<wvBranchId>
    {
        static constexpr wvBranchId value{0};
    };

    // payloads have no v0 default; this is only the placeholder carried by variables
    template <>
    struct wvAxisDefault<wvPayload>
    {
        static constexpr wvPayload value = wvPayload::Float;
    };

    template <typename ValueT>
    class wvAxis
    {
    public:
        using value_type = ValueT;

        static constexpr wvAxis variable(wvTypeVarId var) noexcept { return wvAxis(false, var, wvAxisDefault<ValueT>::value); }
        static constexpr wvAxis resolved(ValueT const& value) noexcept { return wvAxis(true, wvTypeVarId{0}, value); }

        constexpr bool isVariable() const noexcept { return !resolved_; }
        constexpr bool isResolved() const noexcept { return resolved_; }

        // only meaningful for variables
        constexpr wvTypeVarId var() const noexcept { return var_; }

        // only meaningful for resolved axes
        constexpr ValueT const& value() const noexcept { return value_; }

        constexpr bool operator==(wvAxis const& rhs) const noexcept
        {
            if (resolved_ != rhs.resolved_)
                return false;
            return resolved_ ? value_ == rhs.value_ : var_ == rhs.var_;
        }

    private:
        constexpr wvAxis(bool resolved, wvTypeVarId var, ValueT const& value) noexcept : resolved_(resolved), var_(var), value_(value) {}

        bool resolved_ = false;
        wvTypeVarId var_;
        ValueT value_;
    };

    enum class wvAxisName : uint8_t
    {
        Payload,
        Cardinality,
        Temporality,
        Binding,
        Perspective,
        Branch,
    };

    // only the field named by the owning conflict's axis is meaningful
    struct wvAxisValue
    {
        wvPayload payload = wvPayload::Float;
        wvCardinality cardinality;
        wvTemporality temporality = wvTemporality::Continuous;
        wvBinding binding;
        wvPerspectiveId perspective{0};
        wvBranchId branch{0};
    };

    struct wvAxisConflict
    {
        wvAxisName axis = wvAxisName::Payload;
        wvAxisValue left;
        wvAxisValue right;
    };

    struct wvExtent
    {
        wvAxis<wvCardinality> cardinality = wvAxis<wvCardinality>::resolved(wvAxisDefault<wvCardinality>::value);
        wvAxis<wvTemporality> temporality = wvAxis<wvTemporality>::resolved(wvAxisDefault<wvTemporality>::value);
        wvAxis<wvBinding> binding = wvAxis<wvBinding>::resolved(wvAxisDefault<wvBinding>::value);
        wvAxis<wvPerspectiveId> perspective = wvAxis<wvPerspectiveId>::resolved(wvAxisDefault<wvPerspectiveId>::value);
        wvAxis<wvBranchId> branch = wvAxis<wvBranchId>::resolved(wvAxisDefault<wvBranchId>::value);

        constexpr bool operator==(wvExtent const&) const noexcept = default;
    };

    struct wvCanonicalType
    {
        wvPayload payload = wvPayload::Float;
        wvExtent extent;

        constexpr bool operator==(wvCanonicalType const&) const noexcept = default;
    };

    /// Unifies a single axis.
    ///
    /// Variable and variable yields the variable with the smaller id, variable
    /// and resolved yields the resolved side, equal resolved values yield that
    /// value, and differing resolved values fail.
    template <typename ValueT>
    constexpr bool wvUnifyAxis(wvAxis<ValueT> const& left, wvAxis<ValueT> const& right, wvAxis<ValueT>& out_result) noexcept
    {
        if (left.isVariable() && right.isVariable())
        {
            out_result = left.var() <= right.var() ? left : right;
            return true;
        }
        if (left.isVariable())
        {
            out_result = right;
            return true;
        }
        if (right.isVariable() || left.value() == right.value())
        {
            out_result = left;
            return true;
        }
        return false;
    }

    WV_API bool wvUnifyExtent(wvExtent const& left, wvExtent const& right, wvExtent& out_result,
        wvAxisConflict* out_conflict = nullptr) noexcept;
    WV_API bool wvUnifyType(wvCanonicalType const& left, wvCanonicalType const& right, wvCanonicalType& out_result,
        wvAxisConflict* out_conflict = nullptr) noexcept;

    WV_API [[nodiscard]] bool wvIsFullyResolved(wvExtent const& extent) noexcept;

    constexpr wvCanonicalType wvSignalType(wvPayload payload) noexcept { return {.payload = payload}; }

    constexpr wvCanonicalType wvFieldType(wvPayload payload, wvInstanceId instance) noexcept
    {
        wvCanonicalType type{.payload = payload};
        type.extent.cardinality = wvAxis<wvCardinality>::resolved(wvCardinality::many(instance));
        return type;
    }

    constexpr wvCanonicalType wvEventType(wvPayload payload) noexcept
    {
        wvCanonicalType type{.payload = payload};
        type.extent.temporality = wvAxis<wvTemporality>::resolved(wvTemporality::Discrete);
        return type;
    }

    constexpr bool wvIsField(wvCanonicalType const& type) noexcept
    {
        return type.extent.cardinality.isResolved() && type.extent.cardinality.value().kind == wvCardinalityKind::Many;
    }
} // namespace weave
