// weave

#include "weave/log.hh"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace weave {
    static std::shared_ptr<spdlog::logger> makeDefaultLogger()
    {
        auto logger = std::make_shared<spdlog::logger>("weave", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        logger->set_level(spdlog::level::info);
        return logger;
    }

    static std::shared_ptr<spdlog::logger>& currentLogger() noexcept
    {
        static std::shared_ptr<spdlog::logger> logger = makeDefaultLogger();
        return logger;
    }

    std::shared_ptr<spdlog::logger> const& wvLog() noexcept { return currentLogger(); }

    void wvSetLogger(std::shared_ptr<spdlog::logger> logger)
    {
        if (logger == nullptr)
            logger = makeDefaultLogger();
        currentLogger() = std::move(logger);
    }
} // namespace weave
