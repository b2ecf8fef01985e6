// weave

#include "weave/fatal.hh"
#include "weave/diagnostics.hh"
#include "weave/log.hh"

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace weave {
    static wvFatalHandler fatalHandler = nullptr;

    wvFatalHandler wvSetFatalHandler(wvFatalHandler handler) noexcept
    {
        wvFatalHandler const previous = fatalHandler;
        fatalHandler = handler;
        return previous;
    }

    void wvFatal(wvRuntimeErrorCode code, char const* message)
    {
        SPDLOG_LOGGER_CRITICAL(wvLog(), "{}: {}", wvRuntimeErrorName(code), message != nullptr ? message : "");
        wvLog()->flush();

        if (fatalHandler != nullptr)
            fatalHandler(code, message);

        std::abort();
    }
} // namespace weave
