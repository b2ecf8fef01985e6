// weave

#pragma once

#include "weave/export.hh"

#include <cstdint>

namespace weave {
    class wvAllocator;

    enum class wvContinuityPolicy : uint8_t
    {
        None,
        Preserve, // holds the offset captured at a discontinuity forever
        Slew,     // chases the target with a first-order lag
        Project,  // captures the offset, then slews it away
    };

    enum class wvRetirement : uint8_t
    {
        Immediate,
        Decay,
    };

    struct wvContinuitySpec
    {
        wvContinuityPolicy policy = wvContinuityPolicy::Slew;
        float tauMs = 120.f;
        wvRetirement retirement = wvRetirement::Immediate;
        float decayMs = 0.f; // 0 uses the runtime default
    };

    /// Maps every new element to the old element with the same id, or -1.
    ///
    /// Equal id lists take an identity fast path.
    WV_API void wvBuildMappingById(uint64_t const* oldIds, uint32_t oldCount, uint64_t const* newIds, uint32_t newCount,
        int32_t* out_newToOld) noexcept;

    /// Maps every new element to the nearest unused old element within radius, or -1.
    ///
    /// New elements are visited in order and claim greedily; equal distances
    /// prefer the lower old index.
    WV_API void wvBuildMappingByPosition(wvAllocator& alloc, float const* oldPositions, uint32_t oldCount,
        float const* newPositions, uint32_t newCount, uint32_t stride, float radius, int32_t* out_newToOld);

    WV_API [[nodiscard]] uint32_t wvCountMappedElements(int32_t const* newToOld, uint32_t count) noexcept;

    /// Blend factor of a first-order lag over dt with time constant tau.
    WV_API [[nodiscard]] float wvSlewAlpha(float dtMs, float tauMs) noexcept;
} // namespace weave
