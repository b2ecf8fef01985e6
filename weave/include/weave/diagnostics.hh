// weave

#pragma once

#include "weave/canonical_type.hh"
#include "weave/compile_types.hh"
#include "weave/export.hh"
#include "weave/runtime.hh"

#include <string>

namespace weave {
    WV_API [[nodiscard]] char const* wvPayloadName(wvPayload payload) noexcept;
    WV_API [[nodiscard]] char const* wvAxisNameString(wvAxisName axis) noexcept;
    WV_API [[nodiscard]] char const* wvCompileErrorName(wvCompileErrorCode code) noexcept;
    WV_API [[nodiscard]] char const* wvRuntimeErrorName(wvRuntimeErrorCode code) noexcept;

    WV_API [[nodiscard]] std::string wvDescribeType(wvCanonicalType const& type);
    WV_API [[nodiscard]] std::string wvDescribeError(wvCompileError const& error);
} // namespace weave
