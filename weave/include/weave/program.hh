// weave

#pragma once

#include "weave/export.hh"
#include "weave/types.hh"

#include <cstdint>

namespace weave {
    class wvAllocator;
    struct wvProgram;

    /// Constructs a runtime executable program from a serialized block
    WV_API [[nodiscard]] wvProgram* wvLoadProgram(wvAllocator& alloc, uint8_t const* bytes, uint32_t size);
    WV_API void wvAcquireProgram(wvProgram* program) noexcept;
    WV_API void wvReleaseProgram(wvProgram* program);

    WV_API [[nodiscard]] uint64_t wvProgramGraphVersion(wvProgram const* program) noexcept;
    WV_API [[nodiscard]] uint32_t wvProgramStateCount(wvProgram const* program) noexcept;
    WV_API [[nodiscard]] wvStableId wvProgramStateId(wvProgram const* program, uint32_t index) noexcept;

    // the stable identity of a state allocated by a node under a local key
    WV_API [[nodiscard]] wvStableId wvMakeStableId(wvNodeId nodeId, char const* key, char const* keyEnd = nullptr) noexcept;
} // namespace weave
