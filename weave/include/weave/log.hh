// weave

#pragma once

#include "weave/export.hh"

#include <spdlog/logger.h>

#include <memory>

namespace weave {
    // the logger every weave component writes to, named "weave" unless replaced
    WV_API [[nodiscard]] std::shared_ptr<spdlog::logger> const& wvLog() noexcept;

    // replaces the logger; nullptr restores the default stderr logger
    WV_API void wvSetLogger(std::shared_ptr<spdlog::logger> logger);
} // namespace weave
