// weave

#pragma once

#include "weave/export.hh"
#include "weave/runtime.hh"

namespace weave {
    // may throw or longjmp; returning normally ends in std::abort()
    using wvFatalHandler = void (*)(wvRuntimeErrorCode code, char const* message);

    // installs a handler and returns the previous one; nullptr restores the default
    WV_API wvFatalHandler wvSetFatalHandler(wvFatalHandler handler) noexcept;

    /// Reports a defect in a compiled program. Never returns.
    [[noreturn]] WV_API void wvFatal(wvRuntimeErrorCode code, char const* message);
} // namespace weave
