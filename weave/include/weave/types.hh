// weave

#pragma once

#include "weave/hash.hh"
#include "weave/key.hh"

#include <cstdint>

namespace weave {
    class wvLowerContext;

    // user-defined identifiers
    WV_DEFINE_KEY(wvNodeTypeId, uint64_t);
    WV_DEFINE_KEY(wvNodeId, uint64_t);

    // user-defined identifiers, unique only within a single node type
    WV_DEFINE_KEY(wvInputPortIndex, uint8_t);
    WV_DEFINE_KEY(wvOutputPortIndex, uint8_t);

    // system-defined identifiers that survive graph edits
    WV_DEFINE_KEY(wvInstanceId, uint64_t);
    WV_DEFINE_KEY(wvStableId, uint64_t);
    WV_DEFINE_KEY(wvReferentId, uint64_t);
    WV_DEFINE_KEY(wvPerspectiveId, uint32_t);
    WV_DEFINE_KEY(wvBranchId, uint32_t);

    // invalid ids
    static constexpr wvNodeTypeId wvInvalidNodeTypeId{~uint64_t{0}};
    static constexpr wvNodeId wvInvalidNodeId{~uint64_t{0}};
    static constexpr wvInstanceId wvInvalidInstanceId{~uint64_t{0}};
    static constexpr wvStableId wvInvalidStableId{~uint64_t{0}};
    static constexpr wvReferentId wvInvalidReferentId{~uint64_t{0}};
    static constexpr wvInputPortIndex wvInvalidInputPort{0xff};
    static constexpr wvOutputPortIndex wvInvalidOutputPort{0xff};

    enum class wvNodeRole : uint8_t
    {
        User,
        Derived,
    };

    enum class wvDerivedKind : uint8_t
    {
        None,
        DefaultSource,
        Adapter,
        CompositeExpansion,
        WireState,
    };

    enum class wvEdgeRole : uint8_t
    {
        User,
        Default,
        AutoInserted,
    };

    struct wvName
    {
        char const* name = nullptr;
        char const* nameEnd = nullptr;
    };

    struct wvParamValue
    {
        float values[4] = {};
        uint8_t count = 0;
        char const* text = nullptr;
        char const* textEnd = nullptr;
    };

    struct wvParam final
    {
        char const* name = nullptr;
        wvParamValue value;
    };

    struct wvEdgeOptions
    {
        wvEdgeRole role = wvEdgeRole::User;
        bool enabled = true;
        // splices a one-frame delay into the wire
        bool stateful = false;
        int32_t sortKey = 0;
    };

    using wvLowerFunction = bool (*)(wvLowerContext& context, void* userData);

    constexpr uint64_t wvHashName(char const* name, char const* nameEnd = nullptr) noexcept
    {
        return wvHashFnv1a64(name, nameEnd);
    }
} // namespace weave
